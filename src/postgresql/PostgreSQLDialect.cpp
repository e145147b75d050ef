#include "PostgreSQLDialect.hpp"
#include "PostgreSQLCursor.hpp"

namespace sqlcursor {

std::string PostgreSQLDialect::rawAffinity(int rawType) const {
    switch (static_cast<Oid>(rawType)) {
        case pgoid::kBool:
            return "boolean";
        case pgoid::kInt2:
        case pgoid::kInt4:
        case pgoid::kInt8:
        case pgoid::kOid:
            return "integer";
        case pgoid::kFloat4:
        case pgoid::kFloat8:
            return "float";
        case pgoid::kText:
        case pgoid::kBpchar:
        case pgoid::kVarchar:
            return "string";
        case pgoid::kBytea:
            return "binary";
        default:
            // numeric, dates and everything else arrive as text to be converted
            return "";
    }
}

}  // namespace sqlcursor
