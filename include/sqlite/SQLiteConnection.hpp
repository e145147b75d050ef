#pragma once

/**
 * @file SQLiteConnection.hpp
 * @brief RAII wrapper for an SQLite database connection.
 *
 * SQLite is file based and serverless, so a connection is simply an open
 * database handle. Statements executed through it produce SQLiteCursor
 * objects that step the prepared statement on demand.
 */

#include "SQLiteCursor.hpp"
#include <sqlite3.h>
#include <cstdint>
#include <memory>
#include <string>

namespace sqlcursor {

/**
 * @class SQLiteConnection
 * @brief RAII wrapper for an SQLite database file connection.
 *
 * The handle is closed when the object is destroyed. Cursors created by
 * execute() borrow the handle and must be closed or destroyed first.
 *
 * Usage:
 * @code
 *   SQLiteConnection conn(":memory:");
 *   conn.executeScript("CREATE TABLE t (id INTEGER, name TEXT)");
 *   auto cursor = conn.execute("SELECT id, name FROM t");
 *   while (auto row = cursor->fetchOne()) {
 *       // Use row...
 *   }
 * @endcode
 */
class SQLiteConnection {
public:
    /**
     * @brief Open a connection to an SQLite database file.
     * @param dbPath Path to the database file, or ":memory:".
     * @throws DriverError when the database cannot be opened.
     *
     * Creates the database file if it doesn't exist.
     */
    explicit SQLiteConnection(const std::string& dbPath);

    ~SQLiteConnection();

    // Non-copyable
    SQLiteConnection(const SQLiteConnection&) = delete;
    SQLiteConnection& operator=(const SQLiteConnection&) = delete;

    // Movable
    SQLiteConnection(SQLiteConnection&& other) noexcept;
    SQLiteConnection& operator=(SQLiteConnection&& other) noexcept;

    sqlite3* get() const { return m_db; }

    bool isValid() const { return m_db != nullptr; }

    /**
     * @brief Prepare and start one SQL statement.
     * @return Cursor over the statement's rows; statements without result
     *         columns run to completion before this returns.
     * @throws DriverError on prepare or execution failure.
     */
    std::unique_ptr<SQLiteCursor> execute(const std::string& sql);

    /**
     * @brief Run one or more statements, discarding any rows.
     * @throws DriverError on failure.
     */
    void executeScript(const std::string& sql);

    const char* error() const;
    int errorCode() const;

    int64_t lastInsertRowId() const;
    int changes() const;

    const std::string& path() const { return m_path; }

private:
    sqlite3* m_db = nullptr;  ///< SQLite database handle
    std::string m_path;       ///< Path to database file
};

}  // namespace sqlcursor
