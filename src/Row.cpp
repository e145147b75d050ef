#include "Row.hpp"
#include "ErrorHandler.hpp"
#include <algorithm>
#include <stdexcept>

namespace sqlcursor {

Row::Row(RowMetadataPtr parent, std::vector<Value> values)
    : m_parent(std::move(parent))
    , m_data(std::make_shared<const std::vector<Value>>(std::move(values))) {
}

Row Row::decode(RowMetadataPtr parent, const std::vector<Decoder>& processors, RawRow raw) {
    const size_t count = std::min(processors.size(), raw.size());
    for (size_t i = 0; i < count; ++i) {
        if (processors[i]) {
            raw[i] = processors[i](raw[i]);
        }
    }
    return Row(std::move(parent), std::move(raw));
}

const Value& Row::at(int64_t index) const {
    const auto count = static_cast<int64_t>(m_data->size());
    const int64_t position = index < 0 ? index + count : index;
    if (position < 0 || position >= count) {
        throw std::out_of_range("Row index " + std::to_string(index) + " out of range for " +
                                std::to_string(count) + " columns");
    }
    return (*m_data)[static_cast<size_t>(position)];
}

std::vector<Value> Row::slice(int64_t start, int64_t stop) const {
    const auto count = static_cast<int64_t>(m_data->size());
    auto clamp = [count](int64_t bound) {
        if (bound < 0) {
            bound += count;
        }
        return std::clamp<int64_t>(bound, 0, count);
    };
    const int64_t from = clamp(start);
    const int64_t to = clamp(stop);
    if (from >= to) {
        return {};
    }
    return std::vector<Value>(m_data->begin() + from, m_data->begin() + to);
}

const Value& Row::get(const LookupKey& key) const {
    if (const auto* index = std::get_if<int64_t>(&key)) {
        return at(*index);
    }
    if (!m_parent) {
        throw NoSuchColumnError(describeKey(key));
    }
    return (*m_data)[m_parent->indexFor(key)];
}

const Value& Row::attr(std::string_view name) const {
    try {
        return get(std::string(name));
    } catch (const NoSuchColumnError& e) {
        throw AttributeError(e.what());
    }
}

RowMapping Row::mapping() const {
    return RowMapping(*this);
}

std::vector<std::string> Row::fields() const {
    if (!m_parent) {
        return {};
    }
    return m_parent->keys();
}

size_t Row::hash() const {
    size_t seed = m_data->size();
    for (const auto& value : *m_data) {
        hashCombine(seed, hashValue(value));
    }
    return seed;
}

std::string Row::toString() const {
    std::string out = "(";
    for (size_t i = 0; i < m_data->size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += toRepr((*m_data)[i]);
    }
    if (m_data->size() == 1) {
        out += ",";
    }
    out += ")";
    return out;
}

// ============================================================================
// RowMapping
// ============================================================================

RowMapping::RowMapping(const Row& row)
    : m_parent(row.m_parent)
    , m_data(row.m_data) {
}

const Value& RowMapping::get(const LookupKey& key) const {
    if (std::holds_alternative<int64_t>(key) || !m_parent) {
        throw NoSuchColumnError(describeKey(key));
    }
    return (*m_data)[m_parent->indexFor(key)];
}

bool RowMapping::contains(const LookupKey& key) const {
    if (std::holds_alternative<int64_t>(key) || !m_parent) {
        return false;
    }
    return m_parent->contains(key);
}

std::vector<std::string> RowMapping::keys() const {
    if (!m_parent) {
        return {};
    }
    return m_parent->keys();
}

std::vector<Value> RowMapping::values() const {
    return *m_data;
}

std::vector<std::pair<std::string, Value>> RowMapping::items() const {
    std::vector<std::pair<std::string, Value>> result;
    const auto names = keys();
    const size_t count = std::min(names.size(), m_data->size());
    for (size_t i = 0; i < count; ++i) {
        result.emplace_back(names[i], (*m_data)[i]);
    }
    return result;
}

std::string RowMapping::toString() const {
    std::string out = "{";
    bool first = true;
    for (const auto& [key, value] : items()) {
        if (!first) {
            out += ", ";
        }
        first = false;
        out += "'" + key + "': " + toRepr(value);
    }
    out += "}";
    return out;
}

}  // namespace sqlcursor
