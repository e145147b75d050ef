#include "MySQLConnection.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>

namespace sqlcursor {

// ============================================================================
// Construction and Destruction
// ============================================================================

MySQLConnection::MySQLConnection(const ConnectionConfig& config) {
    m_conn = mysql_init(nullptr);
    if (!m_conn) {
        throw DriverError(Backend::MySQL, 0, "Failed to initialize MySQL connection");
    }

    const char* db = config.database.empty() ? nullptr : config.database.c_str();
    if (!mysql_real_connect(m_conn,
                            config.host.c_str(),
                            config.user.c_str(),
                            config.password.c_str(),
                            db,
                            config.port,
                            nullptr,
                            0)) {
        unsigned int err = mysql_errno(m_conn);
        std::string msg = mysql_error(m_conn);
        mysql_close(m_conn);
        m_conn = nullptr;
        spdlog::error("Failed to connect to MySQL at {}: {}", config.host, msg);
        throw DriverError(Backend::MySQL, static_cast<int>(err), msg);
    }
    spdlog::debug("Connected to MySQL server {}", mysql_get_server_info(m_conn));
}

MySQLConnection::~MySQLConnection() {
    if (m_conn) {
        mysql_close(m_conn);
    }
}

MySQLConnection::MySQLConnection(MySQLConnection&& other) noexcept
    : m_conn(other.m_conn) {
    other.m_conn = nullptr;
}

MySQLConnection& MySQLConnection::operator=(MySQLConnection&& other) noexcept {
    if (this != &other) {
        if (m_conn) {
            mysql_close(m_conn);
        }
        m_conn = other.m_conn;
        other.m_conn = nullptr;
    }
    return *this;
}

// ============================================================================
// Query Execution
// ============================================================================

std::unique_ptr<MySQLCursor> MySQLConnection::execute(const std::string& sql) {
    if (!m_conn) {
        throw DriverError(Backend::MySQL, 2006, "No connection");
    }
    spdlog::debug("MySQL execute: {}", sql);
    if (mysql_real_query(m_conn, sql.c_str(), sql.size()) != 0) {
        throwError("query");
    }

    MYSQL_RES* res = mysql_use_result(m_conn);
    if (res) {
        return std::make_unique<MySQLCursor>(m_conn, res);
    }
    if (mysql_field_count(m_conn) != 0) {
        // Statement should have returned rows
        throwError("use_result");
    }

    std::optional<int64_t> insertId;
    if (uint64_t id = mysql_insert_id(m_conn)) {
        insertId = static_cast<int64_t>(id);
    }
    return std::make_unique<MySQLCursor>(static_cast<int64_t>(mysql_affected_rows(m_conn)),
                                         insertId);
}

void MySQLConnection::throwError(const std::string& context) const {
    unsigned int err = mysql_errno(m_conn);
    std::string msg = mysql_error(m_conn);
    spdlog::debug("MySQL {} failed: {} ({})", context, msg, err);
    throw DriverError(Backend::MySQL, static_cast<int>(err), msg, mysql_sqlstate(m_conn));
}

const char* MySQLConnection::error() const {
    return m_conn ? mysql_error(m_conn) : "No connection";
}

unsigned int MySQLConnection::errorCode() const {
    return m_conn ? mysql_errno(m_conn) : 0;
}

}  // namespace sqlcursor
