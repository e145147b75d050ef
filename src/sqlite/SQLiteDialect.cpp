#include "SQLiteDialect.hpp"
#include <sqlite3.h>

namespace sqlcursor {

std::optional<std::pair<std::string, std::string>>
SQLiteDialect::translateColname(const std::string& name) const {
    const auto dot = name.rfind('.');
    if (dot == std::string::npos) {
        return std::nullopt;
    }
    return std::make_pair(name.substr(dot + 1), name);
}

std::string SQLiteDialect::rawAffinity(int rawType) const {
    switch (rawType) {
        case SQLITE_INTEGER:
            return "integer";
        case SQLITE_FLOAT:
            return "float";
        case SQLITE_TEXT:
            return "string";
        case SQLITE_BLOB:
            return "binary";
        default:
            return "";
    }
}

}  // namespace sqlcursor
