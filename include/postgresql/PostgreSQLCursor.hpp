#pragma once

/**
 * @file PostgreSQLCursor.hpp
 * @brief DriverCursor over a materialized PGresult.
 */

#include "DriverCursor.hpp"
#include <libpq-fe.h>
#include <cstdint>
#include <optional>
#include <vector>

namespace sqlcursor {

// Built-in type Oids the cursor decodes (see pg_type.dat)
namespace pgoid {
constexpr Oid kBool = 16;
constexpr Oid kBytea = 17;
constexpr Oid kInt8 = 20;
constexpr Oid kInt2 = 21;
constexpr Oid kInt4 = 23;
constexpr Oid kText = 25;
constexpr Oid kOid = 26;
constexpr Oid kFloat4 = 700;
constexpr Oid kFloat8 = 701;
constexpr Oid kBpchar = 1042;
constexpr Oid kVarchar = 1043;
constexpr Oid kNumeric = 1700;
}  // namespace pgoid

/**
 * @class PostgreSQLCursor
 * @brief Cursor over a PGresult that already holds every row.
 *
 * PostgreSQL loads the entire result into memory at once, so fetches only
 * advance a row index. Values arrive in text format and are decoded by
 * column Oid: booleans, integers, floats and bytea become typed values,
 * everything else (numeric included) stays text. The description reports
 * the Oid as type code.
 */
class PostgreSQLCursor : public DriverCursor {
public:
    // Takes ownership of res
    explicit PostgreSQLCursor(PGresult* res);
    ~PostgreSQLCursor() override;

    PostgreSQLCursor(const PostgreSQLCursor&) = delete;
    PostgreSQLCursor& operator=(const PostgreSQLCursor&) = delete;

    std::optional<std::vector<ColumnDescription>> description() const override;

    std::optional<RawRow> fetchOne() override;
    std::vector<RawRow> fetchMany(size_t size) override;
    std::vector<RawRow> fetchAll() override;

    int64_t rowCount() const override { return m_rowCount; }
    std::optional<int64_t> lastRowId() const override { return m_lastRowId; }

    void close() override;

    // Decode one text-format value of the given type
    static Value decodeText(Oid type, const char* text, int length);

private:
    RawRow readRow(int row) const;
    bool exhausted() const;

    PGresult* m_res;
    std::optional<std::vector<ColumnDescription>> m_description;
    int m_currentRow = 0;
    int m_numRows = 0;
    int64_t m_rowCount = -1;
    std::optional<int64_t> m_lastRowId;
};

}  // namespace sqlcursor
