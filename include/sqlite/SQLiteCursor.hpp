#pragma once

/**
 * @file SQLiteCursor.hpp
 * @brief DriverCursor over an SQLite prepared statement.
 */

#include "DriverCursor.hpp"
#include <sqlite3.h>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sqlcursor {

/**
 * @class SQLiteCursor
 * @brief Step-based cursor owning a prepared statement.
 *
 * Unlike MySQL/PostgreSQL which separate query execution from result
 * retrieval, SQLite uses step() to both execute and fetch rows. The cursor
 * steps only when a row is requested. Statements without result columns
 * are stepped to completion on construction, capturing the changed row
 * count and last insert rowid.
 *
 * Type codes in the description are the declared column affinity:
 * SQLITE_INTEGER, SQLITE_FLOAT, SQLITE_TEXT, SQLITE_BLOB, or 0 for
 * expressions and NUMERIC columns.
 *
 * Not thread-safe. The owning connection must outlive the cursor.
 */
class SQLiteCursor : public DriverCursor {
public:
    // Takes ownership of stmt
    SQLiteCursor(sqlite3* db, sqlite3_stmt* stmt);
    ~SQLiteCursor() override;

    SQLiteCursor(const SQLiteCursor&) = delete;
    SQLiteCursor& operator=(const SQLiteCursor&) = delete;

    std::optional<std::vector<ColumnDescription>> description() const override;

    std::optional<RawRow> fetchOne() override;
    std::vector<RawRow> fetchMany(size_t size) override;
    std::vector<RawRow> fetchAll() override;

    int64_t rowCount() const override { return m_rowCount; }
    std::optional<int64_t> lastRowId() const override { return m_lastRowId; }

    void close() override;

    bool closed() const { return m_stmt == nullptr; }

    // Affinity code for a declared column type, following SQLite's rules
    static int affinityCode(const char* declType);

private:
    // Advance the statement; false when done
    bool step();
    RawRow readRow() const;
    Value readValue(int index) const;

    sqlite3* m_db;
    sqlite3_stmt* m_stmt;
    std::optional<std::vector<ColumnDescription>> m_description;
    bool m_done = false;
    int64_t m_rowCount = -1;
    std::optional<int64_t> m_lastRowId;
};

}  // namespace sqlcursor
