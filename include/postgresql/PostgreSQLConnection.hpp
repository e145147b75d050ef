#pragma once

/**
 * @file PostgreSQLConnection.hpp
 * @brief RAII wrapper for a PostgreSQL (libpq) connection.
 */

#include "Config.hpp"
#include "PostgreSQLCursor.hpp"
#include <libpq-fe.h>
#include <memory>
#include <string>

namespace sqlcursor {

/**
 * @class PostgreSQLConnection
 * @brief Owns a PGconn opened from a ConnectionConfig.
 *
 * Statements run through PQexec; the full result is transferred to the
 * client before execute() returns and handed to a PostgreSQLCursor.
 *
 * Usage:
 * @code
 *   PostgreSQLConnection conn(config.connection);
 *   auto cursor = conn.execute("SELECT id, name FROM employees");
 *   Result result(ExecutionContext::forText(dialect, std::move(cursor)));
 * @endcode
 */
class PostgreSQLConnection {
public:
    /**
     * @brief Connect using host, port, user, password and database.
     * @throws DriverError when the connection cannot be established.
     */
    explicit PostgreSQLConnection(const ConnectionConfig& config);
    ~PostgreSQLConnection();

    // Non-copyable
    PostgreSQLConnection(const PostgreSQLConnection&) = delete;
    PostgreSQLConnection& operator=(const PostgreSQLConnection&) = delete;

    // Movable
    PostgreSQLConnection(PostgreSQLConnection&& other) noexcept;
    PostgreSQLConnection& operator=(PostgreSQLConnection&& other) noexcept;

    PGconn* get() const { return m_conn; }

    bool isValid() const;

    /**
     * @brief Execute one statement.
     * @throws DriverError carrying the SQLSTATE on failure.
     */
    std::unique_ptr<PostgreSQLCursor> execute(const std::string& sql);

    const char* error() const;

    // libpq keyword/value connection string for a configuration
    static std::string connectionString(const ConnectionConfig& config);

private:
    PGconn* m_conn = nullptr;
};

}  // namespace sqlcursor
