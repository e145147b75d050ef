#pragma once

/**
 * @file Value.hpp
 * @brief Column value representation shared by drivers, decoders and rows.
 */

#include <cstdint>
#include <functional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace sqlcursor {

using json = nlohmann::json;

using Blob = std::vector<std::uint8_t>;

/**
 * @brief A single column value.
 *
 * std::monostate is SQL NULL. Alternatives are ordered the way std::variant
 * orders them, so NULL sorts before every non-NULL value.
 */
using Value = std::variant<std::monostate, bool, int64_t, double, std::string, Blob>;

/**
 * @brief Converts a raw driver value into its final form.
 *
 * An empty Decoder is the pass-through decoder: the raw value is kept as is.
 */
using Decoder = std::function<Value(const Value&)>;

inline bool isNull(const Value& value) { return std::holds_alternative<std::monostate>(value); }

// Text form used by CSV output and diagnostics; NULL renders as "NULL"
std::string toString(const Value& value);

// Display form used by Row::toString: strings single-quoted, NULL as "NULL"
std::string toRepr(const Value& value);

json toJson(const Value& value);
Value fromJson(const json& value);

size_t hashValue(const Value& value);

struct ValueHash {
    size_t operator()(const Value& value) const { return hashValue(value); }
};

// Combine into a running seed (boost::hash_combine recipe)
inline void hashCombine(size_t& seed, size_t value) {
    seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

}  // namespace sqlcursor
