/**
 * @file SQLiteConnection.cpp
 * @brief Implementation of RAII SQLite connection wrapper.
 */

#include "SQLiteConnection.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>

namespace sqlcursor {

// ============================================================================
// Construction and Destruction
// ============================================================================

SQLiteConnection::SQLiteConnection(const std::string& dbPath) : m_path(dbPath) {
    int rc = sqlite3_open_v2(dbPath.c_str(), &m_db,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string message = m_db ? sqlite3_errmsg(m_db) : "unknown error";
        spdlog::error("Failed to open SQLite database '{}': {}", dbPath, message);
        if (m_db) {
            sqlite3_close(m_db);
            m_db = nullptr;
        }
        throw DriverError(Backend::SQLite, rc, message);
    }
    spdlog::debug("Opened SQLite database '{}'", dbPath);
}

SQLiteConnection::~SQLiteConnection() {
    if (m_db) {
        // sqlite3_close_v2 defers the close until outstanding statements finish
        sqlite3_close_v2(m_db);
    }
}

// ============================================================================
// Move Operations
// ============================================================================

SQLiteConnection::SQLiteConnection(SQLiteConnection&& other) noexcept
    : m_db(other.m_db), m_path(std::move(other.m_path)) {
    other.m_db = nullptr;
}

SQLiteConnection& SQLiteConnection::operator=(SQLiteConnection&& other) noexcept {
    if (this != &other) {
        if (m_db) {
            sqlite3_close_v2(m_db);
        }
        m_db = other.m_db;
        m_path = std::move(other.m_path);
        other.m_db = nullptr;
    }
    return *this;
}

// ============================================================================
// Query Execution
// ============================================================================

std::unique_ptr<SQLiteCursor> SQLiteConnection::execute(const std::string& sql) {
    if (!m_db) {
        throw DriverError(Backend::SQLite, SQLITE_MISUSE, "no connection");
    }
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(m_db, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw DriverError(Backend::SQLite, rc, sqlite3_errmsg(m_db));
    }
    if (!stmt) {
        // Whitespace or comment only
        throw DriverError(Backend::SQLite, SQLITE_MISUSE, "empty statement");
    }
    spdlog::debug("SQLite execute: {}", sql);
    return std::make_unique<SQLiteCursor>(m_db, stmt);
}

void SQLiteConnection::executeScript(const std::string& sql) {
    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        std::string message = errMsg ? errMsg : "unknown";
        if (errMsg) sqlite3_free(errMsg);
        spdlog::error("SQLite exec failed: {}", message);
        throw DriverError(Backend::SQLite, rc, message);
    }
}

// ============================================================================
// Error and Status Information
// ============================================================================

const char* SQLiteConnection::error() const {
    return m_db ? sqlite3_errmsg(m_db) : "no connection";
}

int SQLiteConnection::errorCode() const {
    return m_db ? sqlite3_errcode(m_db) : SQLITE_ERROR;
}

int64_t SQLiteConnection::lastInsertRowId() const {
    return m_db ? sqlite3_last_insert_rowid(m_db) : 0;
}

int SQLiteConnection::changes() const {
    return m_db ? sqlite3_changes(m_db) : 0;
}

}  // namespace sqlcursor
