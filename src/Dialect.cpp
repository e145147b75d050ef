#include "Dialect.hpp"
#include <algorithm>
#include <cctype>

namespace sqlcursor {

std::optional<std::pair<std::string, std::string>>
Dialect::translateColname(const std::string&) const {
    return std::nullopt;
}

std::string Dialect::normalizeName(const std::string& name) const {
    if (name.empty()) {
        return name;
    }
    // Case-insensitive backends report unquoted names upper-cased; only
    // those are folded, mixed-case names were quoted on purpose
    bool hasLower = std::any_of(name.begin(), name.end(),
                                [](unsigned char c) { return std::islower(c); });
    if (hasLower) {
        return name;
    }
    std::string result = name;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::string Dialect::rawAffinity(int) const {
    return "";
}

std::string Dialect::foldName(const std::string& name) const {
    if (caseSensitive()) {
        return name;
    }
    std::string result = name;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

}  // namespace sqlcursor
