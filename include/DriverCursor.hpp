#pragma once

#include "Value.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sqlcursor {

// One entry of a driver's row descriptor
struct ColumnDescription {
    std::string name;
    int typeCode = 0;
};

using RawRow = std::vector<Value>;

/**
 * @brief Pull-based cursor over an executed statement.
 *
 * Implemented by each backend adapter. description() is std::nullopt for
 * statements that do not return rows. Failures are reported by throwing;
 * the result layer routes them through ErrorHandler.
 */
class DriverCursor {
public:
    virtual ~DriverCursor() = default;

    virtual std::optional<std::vector<ColumnDescription>> description() const = 0;

    // std::nullopt when exhausted
    virtual std::optional<RawRow> fetchOne() = 0;

    // Up to size rows; fewer only when exhausted
    virtual std::vector<RawRow> fetchMany(size_t size) = 0;

    virtual std::vector<RawRow> fetchAll() = 0;

    // Rows affected, -1 when unknown
    virtual int64_t rowCount() const = 0;

    virtual std::optional<int64_t> lastRowId() const = 0;

    // Default batch size for fetchMany without a size
    virtual size_t arraySize() const { return 1; }

    virtual void close() = 0;
};

}  // namespace sqlcursor
