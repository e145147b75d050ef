/**
 * @file SQLiteCursor.cpp
 * @brief Step-based SQLite cursor.
 */

#include "SQLiteCursor.hpp"
#include "ErrorHandler.hpp"
#include <algorithm>
#include <cctype>
#include <spdlog/spdlog.h>

namespace sqlcursor {

// ============================================================================
// Construction and Destruction
// ============================================================================

SQLiteCursor::SQLiteCursor(sqlite3* db, sqlite3_stmt* stmt)
    : m_db(db), m_stmt(stmt) {
    const int count = sqlite3_column_count(m_stmt);
    if (count == 0) {
        // DML and DDL run now so the side-channel values are available
        try {
            step();
        } catch (const DriverError&) {
            close();
            throw;
        }
        m_rowCount = sqlite3_changes(m_db);
        m_lastRowId = sqlite3_last_insert_rowid(m_db);
        close();
        return;
    }

    std::vector<ColumnDescription> description;
    description.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        const char* name = sqlite3_column_name(m_stmt, i);
        description.push_back({name ? name : "", affinityCode(sqlite3_column_decltype(m_stmt, i))});
    }
    m_description = std::move(description);
}

SQLiteCursor::~SQLiteCursor() {
    close();
}

int SQLiteCursor::affinityCode(const char* declType) {
    if (!declType) {
        return 0;
    }
    std::string type(declType);
    std::transform(type.begin(), type.end(), type.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    auto has = [&type](const char* part) { return type.find(part) != std::string::npos; };

    if (has("INT")) return SQLITE_INTEGER;
    if (has("CHAR") || has("CLOB") || has("TEXT")) return SQLITE_TEXT;
    if (has("BLOB") || type.empty()) return SQLITE_BLOB;
    if (has("REAL") || has("FLOA") || has("DOUB")) return SQLITE_FLOAT;
    return 0;
}

// ============================================================================
// Row Iteration
// ============================================================================

bool SQLiteCursor::step() {
    if (!m_stmt || m_done) {
        return false;
    }
    int rc = sqlite3_step(m_stmt);
    if (rc == SQLITE_ROW) {
        return true;
    }
    m_done = true;
    if (rc != SQLITE_DONE) {
        throw DriverError(Backend::SQLite, sqlite3_errcode(m_db), sqlite3_errmsg(m_db));
    }
    return false;
}

Value SQLiteCursor::readValue(int index) const {
    switch (sqlite3_column_type(m_stmt, index)) {
        case SQLITE_INTEGER:
            return static_cast<int64_t>(sqlite3_column_int64(m_stmt, index));
        case SQLITE_FLOAT:
            return sqlite3_column_double(m_stmt, index);
        case SQLITE_TEXT: {
            const unsigned char* text = sqlite3_column_text(m_stmt, index);
            const int length = sqlite3_column_bytes(m_stmt, index);
            return std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(length));
        }
        case SQLITE_BLOB: {
            const auto* data = static_cast<const uint8_t*>(sqlite3_column_blob(m_stmt, index));
            const int length = sqlite3_column_bytes(m_stmt, index);
            return data ? Blob(data, data + length) : Blob{};
        }
        default:
            return std::monostate{};
    }
}

RawRow SQLiteCursor::readRow() const {
    const int count = sqlite3_column_count(m_stmt);
    RawRow row;
    row.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        row.push_back(readValue(i));
    }
    return row;
}

std::optional<std::vector<ColumnDescription>> SQLiteCursor::description() const {
    return m_description;
}

std::optional<RawRow> SQLiteCursor::fetchOne() {
    if (!step()) {
        return std::nullopt;
    }
    return readRow();
}

std::vector<RawRow> SQLiteCursor::fetchMany(size_t size) {
    std::vector<RawRow> rows;
    while (rows.size() < size && step()) {
        rows.push_back(readRow());
    }
    return rows;
}

std::vector<RawRow> SQLiteCursor::fetchAll() {
    std::vector<RawRow> rows;
    while (step()) {
        rows.push_back(readRow());
    }
    return rows;
}

// ============================================================================
// Statement Management
// ============================================================================

void SQLiteCursor::close() {
    if (m_stmt) {
        sqlite3_finalize(m_stmt);
        m_stmt = nullptr;
        m_done = true;
    }
}

}  // namespace sqlcursor
