#pragma once

/**
 * @file MySQLConnection.hpp
 * @brief RAII wrapper for a MySQL client connection.
 */

#include "Config.hpp"
#include "MySQLCursor.hpp"
#include <mysql/mysql.h>
#include <memory>
#include <string>

namespace sqlcursor {

/**
 * @class MySQLConnection
 * @brief Owns a MYSQL handle connected from a ConnectionConfig.
 *
 * Row-returning statements are read with mysql_use_result(), so rows
 * stream from the server as the cursor is fetched. The connection cannot
 * run another statement until that cursor is closed.
 */
class MySQLConnection {
public:
    /**
     * @brief Connect using host, port, user, password and database.
     * @throws DriverError with the client error number on failure.
     */
    explicit MySQLConnection(const ConnectionConfig& config);
    ~MySQLConnection();

    // Non-copyable
    MySQLConnection(const MySQLConnection&) = delete;
    MySQLConnection& operator=(const MySQLConnection&) = delete;

    // Movable
    MySQLConnection(MySQLConnection&& other) noexcept;
    MySQLConnection& operator=(MySQLConnection&& other) noexcept;

    MYSQL* get() const { return m_conn; }

    bool isValid() const { return m_conn != nullptr; }

    /**
     * @brief Execute one statement.
     * @throws DriverError with the server error number on failure.
     */
    std::unique_ptr<MySQLCursor> execute(const std::string& sql);

    const char* error() const;
    unsigned int errorCode() const;

private:
    [[noreturn]] void throwError(const std::string& context) const;

    MYSQL* m_conn = nullptr;
};

}  // namespace sqlcursor
