#include "Value.hpp"
#include <iomanip>
#include <sstream>

namespace sqlcursor {

namespace {

std::string blobToHex(const Blob& blob) {
    std::ostringstream out;
    out << "\\x";
    for (auto byte : blob) {
        out << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
    }
    return out.str();
}

}  // namespace

std::string toString(const Value& value) {
    switch (value.index()) {
        case 0:
            return "NULL";
        case 1:
            return std::get<bool>(value) ? "true" : "false";
        case 2:
            return std::to_string(std::get<int64_t>(value));
        case 3: {
            std::ostringstream out;
            out << std::get<double>(value);
            return out.str();
        }
        case 4:
            return std::get<std::string>(value);
        case 5:
            return blobToHex(std::get<Blob>(value));
        default:
            return "";
    }
}

std::string toRepr(const Value& value) {
    if (const auto* text = std::get_if<std::string>(&value)) {
        std::string out = "'";
        for (char c : *text) {
            if (c == '\'') out += '\\';
            out += c;
        }
        out += "'";
        return out;
    }
    return toString(value);
}

json toJson(const Value& value) {
    switch (value.index()) {
        case 0:
            return nullptr;
        case 1:
            return std::get<bool>(value);
        case 2:
            return std::get<int64_t>(value);
        case 3:
            return std::get<double>(value);
        case 4:
            return std::get<std::string>(value);
        case 5:
            // JSON has no binary scalar; keep the bytes as an array
            return json(std::get<Blob>(value));
        default:
            return nullptr;
    }
}

Value fromJson(const json& value) {
    if (value.is_null()) return std::monostate{};
    if (value.is_boolean()) return value.get<bool>();
    if (value.is_number_integer()) return value.get<int64_t>();
    if (value.is_number_float()) return value.get<double>();
    if (value.is_string()) return value.get<std::string>();
    if (value.is_array()) return value.get<Blob>();
    return value.dump();
}

size_t hashValue(const Value& value) {
    size_t seed = value.index();
    switch (value.index()) {
        case 1:
            hashCombine(seed, std::hash<bool>{}(std::get<bool>(value)));
            break;
        case 2:
            hashCombine(seed, std::hash<int64_t>{}(std::get<int64_t>(value)));
            break;
        case 3:
            hashCombine(seed, std::hash<double>{}(std::get<double>(value)));
            break;
        case 4:
            hashCombine(seed, std::hash<std::string>{}(std::get<std::string>(value)));
            break;
        case 5:
            for (auto byte : std::get<Blob>(value)) {
                hashCombine(seed, byte);
            }
            break;
        default:
            break;
    }
    return seed;
}

}  // namespace sqlcursor
