#include "MySQLCursor.hpp"
#include "ErrorHandler.hpp"
#include <cstdlib>
#include <string>

namespace sqlcursor {

namespace {

// Character set number of binary strings
constexpr unsigned int kBinaryCharset = 63;

}  // namespace

// ============================================================================
// Construction and Destruction
// ============================================================================

MySQLCursor::MySQLCursor(MYSQL* conn, MYSQL_RES* res)
    : m_conn(conn), m_res(res) {
    const unsigned int numFields = mysql_num_fields(m_res);
    MYSQL_FIELD* fields = mysql_fetch_fields(m_res);

    std::vector<ColumnDescription> description;
    description.reserve(numFields);
    m_binary.reserve(numFields);
    for (unsigned int i = 0; i < numFields; ++i) {
        description.push_back({fields[i].name, static_cast<int>(fields[i].type)});
        m_binary.push_back(fields[i].charsetnr == kBinaryCharset);
    }
    m_description = std::move(description);
}

MySQLCursor::MySQLCursor(int64_t affectedRows, std::optional<int64_t> insertId)
    : m_rowCount(affectedRows), m_lastRowId(insertId) {
}

MySQLCursor::~MySQLCursor() {
    close();
}

// ============================================================================
// Value Decoding
// ============================================================================

Value MySQLCursor::decodeText(enum_field_types type, bool binary, const char* text,
                              unsigned long length) {
    switch (type) {
        case MYSQL_TYPE_TINY:
        case MYSQL_TYPE_SHORT:
        case MYSQL_TYPE_LONG:
        case MYSQL_TYPE_INT24:
        case MYSQL_TYPE_LONGLONG:
        case MYSQL_TYPE_YEAR:
            return static_cast<int64_t>(std::strtoll(text, nullptr, 10));
        case MYSQL_TYPE_FLOAT:
        case MYSQL_TYPE_DOUBLE:
            return std::strtod(text, nullptr);
        case MYSQL_TYPE_TINY_BLOB:
        case MYSQL_TYPE_MEDIUM_BLOB:
        case MYSQL_TYPE_LONG_BLOB:
        case MYSQL_TYPE_BLOB:
        case MYSQL_TYPE_STRING:
        case MYSQL_TYPE_VAR_STRING:
            if (binary) {
                const auto* bytes = reinterpret_cast<const uint8_t*>(text);
                return Blob(bytes, bytes + length);
            }
            return std::string(text, length);
        default:
            return std::string(text, length);
    }
}

// ============================================================================
// Row Access
// ============================================================================

std::optional<RawRow> MySQLCursor::nextRow() {
    if (!m_res) {
        return std::nullopt;
    }
    MYSQL_ROW row = mysql_fetch_row(m_res);
    if (!row) {
        // NULL marks either the end of the rows or a read error
        if (mysql_errno(m_conn) != 0) {
            throw DriverError(Backend::MySQL, static_cast<int>(mysql_errno(m_conn)),
                              mysql_error(m_conn), mysql_sqlstate(m_conn));
        }
        return std::nullopt;
    }

    const unsigned long* lengths = mysql_fetch_lengths(m_res);
    const auto& description = *m_description;
    RawRow values;
    values.reserve(description.size());
    for (size_t i = 0; i < description.size(); ++i) {
        if (!row[i]) {
            values.emplace_back(std::monostate{});
        } else {
            values.push_back(decodeText(static_cast<enum_field_types>(description[i].typeCode),
                                        m_binary[i], row[i], lengths[i]));
        }
    }
    return values;
}

std::optional<std::vector<ColumnDescription>> MySQLCursor::description() const {
    return m_description;
}

std::optional<RawRow> MySQLCursor::fetchOne() {
    return nextRow();
}

std::vector<RawRow> MySQLCursor::fetchMany(size_t size) {
    std::vector<RawRow> rows;
    while (rows.size() < size) {
        auto row = nextRow();
        if (!row) break;
        rows.push_back(std::move(*row));
    }
    return rows;
}

std::vector<RawRow> MySQLCursor::fetchAll() {
    std::vector<RawRow> rows;
    while (auto row = nextRow()) {
        rows.push_back(std::move(*row));
    }
    return rows;
}

void MySQLCursor::close() {
    if (m_res) {
        // Frees the result and discards rows the server has not sent yet
        mysql_free_result(m_res);
        m_res = nullptr;
    }
}

}  // namespace sqlcursor
