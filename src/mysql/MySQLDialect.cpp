#include "MySQLDialect.hpp"
#include <mysql/mysql.h>

namespace sqlcursor {

std::string MySQLDialect::rawAffinity(int rawType) const {
    switch (static_cast<enum_field_types>(rawType)) {
        case MYSQL_TYPE_TINY:
        case MYSQL_TYPE_SHORT:
        case MYSQL_TYPE_LONG:
        case MYSQL_TYPE_INT24:
        case MYSQL_TYPE_LONGLONG:
        case MYSQL_TYPE_YEAR:
            return "integer";
        case MYSQL_TYPE_FLOAT:
        case MYSQL_TYPE_DOUBLE:
            return "float";
        case MYSQL_TYPE_VARCHAR:
            return "string";
        default:
            // String and blob types share codes and need the charset to
            // tell them apart; their values are converted
            return "";
    }
}

}  // namespace sqlcursor
