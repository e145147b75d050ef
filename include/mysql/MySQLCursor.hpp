#pragma once

/**
 * @file MySQLCursor.hpp
 * @brief Streaming DriverCursor over a mysql_use_result() result set.
 */

#include "DriverCursor.hpp"
#include <mysql/mysql.h>
#include <cstdint>
#include <optional>
#include <vector>

namespace sqlcursor {

/**
 * @class MySQLCursor
 * @brief Unbuffered cursor; each fetch pulls rows from the server.
 *
 * Values arrive as text and are decoded by field type: integer and
 * floating point fields become numbers, fields with the binary character
 * set become blobs, everything else (DECIMAL included) stays text. The
 * description reports enum_field_types as type code.
 *
 * A cursor for a statement without a result set carries only the affected
 * row count and insert id.
 */
class MySQLCursor : public DriverCursor {
public:
    // Row-returning statement; takes ownership of res
    MySQLCursor(MYSQL* conn, MYSQL_RES* res);

    // Statement without a result set
    MySQLCursor(int64_t affectedRows, std::optional<int64_t> insertId);

    ~MySQLCursor() override;

    MySQLCursor(const MySQLCursor&) = delete;
    MySQLCursor& operator=(const MySQLCursor&) = delete;

    std::optional<std::vector<ColumnDescription>> description() const override;

    std::optional<RawRow> fetchOne() override;
    std::vector<RawRow> fetchMany(size_t size) override;
    std::vector<RawRow> fetchAll() override;

    int64_t rowCount() const override { return m_rowCount; }
    std::optional<int64_t> lastRowId() const override { return m_lastRowId; }

    void close() override;

    static Value decodeText(enum_field_types type, bool binary, const char* text,
                            unsigned long length);

private:
    std::optional<RawRow> nextRow();

    MYSQL* m_conn = nullptr;
    MYSQL_RES* m_res = nullptr;
    std::optional<std::vector<ColumnDescription>> m_description;
    std::vector<bool> m_binary;
    int64_t m_rowCount = -1;
    std::optional<int64_t> m_lastRowId;
};

}  // namespace sqlcursor
