#include "PostgreSQLCursor.hpp"
#include "ErrorHandler.hpp"
#include <cstdlib>
#include <cstring>

namespace sqlcursor {

// ============================================================================
// Construction and Destruction
// ============================================================================

PostgreSQLCursor::PostgreSQLCursor(PGresult* res) : m_res(res) {
    if (PQresultStatus(m_res) == PGRES_TUPLES_OK) {
        const int numFields = PQnfields(m_res);
        std::vector<ColumnDescription> description;
        description.reserve(static_cast<size_t>(numFields));
        for (int col = 0; col < numFields; ++col) {
            description.push_back({PQfname(m_res, col), static_cast<int>(PQftype(m_res, col))});
        }
        m_description = std::move(description);
        m_numRows = PQntuples(m_res);
    }

    // Affected rows for DML, row count for SELECT and similar
    const char* affected = PQcmdTuples(m_res);
    if (affected && *affected) {
        m_rowCount = std::strtoll(affected, nullptr, 10);
    }
    Oid oid = PQoidValue(m_res);
    if (oid != InvalidOid) {
        m_lastRowId = static_cast<int64_t>(oid);
    }
}

PostgreSQLCursor::~PostgreSQLCursor() {
    close();
}

// ============================================================================
// Value Decoding
// ============================================================================

Value PostgreSQLCursor::decodeText(Oid type, const char* text, int length) {
    switch (type) {
        case pgoid::kBool:
            return text[0] == 't';
        case pgoid::kInt2:
        case pgoid::kInt4:
        case pgoid::kInt8:
        case pgoid::kOid:
            return static_cast<int64_t>(std::strtoll(text, nullptr, 10));
        case pgoid::kFloat4:
        case pgoid::kFloat8:
            return std::strtod(text, nullptr);
        case pgoid::kBytea: {
            size_t size = 0;
            unsigned char* bytes = PQunescapeBytea(reinterpret_cast<const unsigned char*>(text),
                                                   &size);
            if (!bytes) {
                throw DriverError(Backend::PostgreSQL, PGRES_FATAL_ERROR,
                                  "could not decode bytea value");
            }
            Blob blob(bytes, bytes + size);
            PQfreemem(bytes);
            return blob;
        }
        default:
            return std::string(text, static_cast<size_t>(length));
    }
}

RawRow PostgreSQLCursor::readRow(int row) const {
    const int numFields = PQnfields(m_res);
    RawRow values;
    values.reserve(static_cast<size_t>(numFields));
    for (int col = 0; col < numFields; ++col) {
        if (PQgetisnull(m_res, row, col)) {
            values.emplace_back(std::monostate{});
        } else {
            values.push_back(decodeText(PQftype(m_res, col), PQgetvalue(m_res, row, col),
                                        PQgetlength(m_res, row, col)));
        }
    }
    return values;
}

// ============================================================================
// Row Access
// ============================================================================

std::optional<std::vector<ColumnDescription>> PostgreSQLCursor::description() const {
    return m_description;
}

bool PostgreSQLCursor::exhausted() const {
    return !m_res || m_currentRow >= m_numRows;
}

std::optional<RawRow> PostgreSQLCursor::fetchOne() {
    if (exhausted()) {
        return std::nullopt;
    }
    return readRow(m_currentRow++);
}

std::vector<RawRow> PostgreSQLCursor::fetchMany(size_t size) {
    std::vector<RawRow> rows;
    while (rows.size() < size && !exhausted()) {
        rows.push_back(readRow(m_currentRow++));
    }
    return rows;
}

std::vector<RawRow> PostgreSQLCursor::fetchAll() {
    std::vector<RawRow> rows;
    while (!exhausted()) {
        rows.push_back(readRow(m_currentRow++));
    }
    return rows;
}

void PostgreSQLCursor::close() {
    if (m_res) {
        PQclear(m_res);
        m_res = nullptr;
    }
}

}  // namespace sqlcursor
