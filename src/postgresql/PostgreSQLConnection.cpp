#include "PostgreSQLConnection.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <sstream>

namespace sqlcursor {

// ============================================================================
// Construction and Destruction
// ============================================================================

PostgreSQLConnection::PostgreSQLConnection(const ConnectionConfig& config) {
    m_conn = PQconnectdb(connectionString(config).c_str());
    if (!m_conn) {
        throw DriverError(Backend::PostgreSQL, CONNECTION_BAD, "out of memory", "08001");
    }
    if (PQstatus(m_conn) != CONNECTION_OK) {
        std::string message = PQerrorMessage(m_conn);
        PQfinish(m_conn);
        m_conn = nullptr;
        spdlog::error("Failed to connect to PostgreSQL at {}: {}", config.host, message);
        throw DriverError(Backend::PostgreSQL, CONNECTION_BAD, message, "08001");
    }
    spdlog::debug("Connected to PostgreSQL server {}", PQserverVersion(m_conn));
}

PostgreSQLConnection::~PostgreSQLConnection() {
    if (m_conn) {
        PQfinish(m_conn);
    }
}

PostgreSQLConnection::PostgreSQLConnection(PostgreSQLConnection&& other) noexcept
    : m_conn(other.m_conn) {
    other.m_conn = nullptr;
}

PostgreSQLConnection& PostgreSQLConnection::operator=(PostgreSQLConnection&& other) noexcept {
    if (this != &other) {
        if (m_conn) {
            PQfinish(m_conn);
        }
        m_conn = other.m_conn;
        other.m_conn = nullptr;
    }
    return *this;
}

std::string PostgreSQLConnection::connectionString(const ConnectionConfig& config) {
    std::ostringstream connInfo;

    connInfo << "host=" << config.host;
    if (config.port != 0) {
        connInfo << " port=" << config.port;
    }
    if (!config.user.empty()) {
        connInfo << " user=" << config.user;
    }
    if (!config.password.empty()) {
        connInfo << " password=" << config.password;
    }
    if (!config.database.empty()) {
        connInfo << " dbname=" << config.database;
    }

    // Application name for identification
    connInfo << " application_name=sqlcursor";

    return connInfo.str();
}

// ============================================================================
// Query Execution
// ============================================================================

bool PostgreSQLConnection::isValid() const {
    return m_conn != nullptr && PQstatus(m_conn) == CONNECTION_OK;
}

std::unique_ptr<PostgreSQLCursor> PostgreSQLConnection::execute(const std::string& sql) {
    if (!isValid()) {
        throw DriverError(Backend::PostgreSQL, CONNECTION_BAD, error(), "08003");
    }
    spdlog::debug("PostgreSQL execute: {}", sql);
    PGresult* res = PQexec(m_conn, sql.c_str());
    if (!res) {
        throw DriverError(Backend::PostgreSQL, PGRES_FATAL_ERROR, error());
    }

    ExecStatusType status = PQresultStatus(res);
    if (status != PGRES_TUPLES_OK && status != PGRES_COMMAND_OK) {
        const char* state = PQresultErrorField(res, PG_DIAG_SQLSTATE);
        std::string sqlState = state ? state : "";
        std::string message = PQresultErrorMessage(res);
        PQclear(res);
        throw DriverError(Backend::PostgreSQL, static_cast<int>(status), message, sqlState);
    }
    return std::make_unique<PostgreSQLCursor>(res);
}

const char* PostgreSQLConnection::error() const {
    if (!m_conn) return "No connection";
    return PQerrorMessage(m_conn);
}

}  // namespace sqlcursor
