#pragma once

/**
 * @file Row.hpp
 * @brief Decoded result rows and their mapping view.
 */

#include "DriverCursor.hpp"
#include "RowMetadata.hpp"
#include "Value.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sqlcursor {

class RowMapping;

/**
 * @brief One decoded row.
 *
 * Values are decoded once, when the row is built. Positional access is the
 * default; keys go through the parent metadata, which the row shares with
 * the producing Result and keeps alive after that Result is gone.
 *
 * Equality, ordering and hashing consider the values only.
 */
class Row {
public:
    using const_iterator = std::vector<Value>::const_iterator;

    Row(RowMetadataPtr parent, std::vector<Value> values);

    // Apply decoders to a raw row; empty decoders pass values through
    static Row decode(RowMetadataPtr parent, const std::vector<Decoder>& processors,
                      RawRow raw);

    size_t size() const { return m_data->size(); }
    bool empty() const { return m_data->empty(); }

    // Unchecked positional access
    const Value& operator[](size_t index) const { return (*m_data)[index]; }

    // Checked positional access, negative positions count from the end;
    // throws std::out_of_range
    const Value& at(int64_t index) const;

    // Half-open slice [start, stop); negative bounds count from the end
    std::vector<Value> slice(int64_t start, int64_t stop) const;

    // Access by name, construct identity or position
    const Value& get(const LookupKey& key) const;

    // Attribute-style access by name; throws AttributeError when unknown
    const Value& attr(std::string_view name) const;

    RowMapping mapping() const;

    std::vector<std::string> fields() const;
    const std::vector<Value>& values() const { return *m_data; }
    const RowMetadataPtr& parent() const { return m_parent; }

    const_iterator begin() const { return m_data->begin(); }
    const_iterator end() const { return m_data->end(); }

    size_t hash() const;
    std::string toString() const;

    bool operator==(const Row& other) const { return *m_data == *other.m_data; }
    bool operator!=(const Row& other) const { return !(*this == other); }
    bool operator<(const Row& other) const { return *m_data < *other.m_data; }
    bool operator<=(const Row& other) const { return *m_data <= *other.m_data; }
    bool operator>(const Row& other) const { return *m_data > *other.m_data; }
    bool operator>=(const Row& other) const { return *m_data >= *other.m_data; }

    bool operator==(const std::vector<Value>& other) const { return *m_data == other; }
    bool operator!=(const std::vector<Value>& other) const { return *m_data != other; }

private:
    RowMetadataPtr m_parent;
    std::shared_ptr<const std::vector<Value>> m_data;

    friend class RowMapping;
};

struct RowHash {
    size_t operator()(const Row& row) const { return row.hash(); }
};

/**
 * @brief Read-only mapping view of a row keyed by names and constructs.
 *
 * Shares the row's decoded values. Bare integer keys are rejected.
 */
class RowMapping {
public:
    explicit RowMapping(const Row& row);

    const Value& operator[](const std::string& key) const { return get(key); }
    const Value& operator[](const ClauseElement& key) const { return get(&key); }

    // Throws NoSuchColumnError for integer keys and unknown keys
    const Value& get(const LookupKey& key) const;

    bool contains(const LookupKey& key) const;

    std::vector<std::string> keys() const;
    std::vector<Value> values() const;
    std::vector<std::pair<std::string, Value>> items() const;

    size_t size() const { return m_data->size(); }
    std::string toString() const;

    bool operator==(const RowMapping& other) const { return items() == other.items(); }
    bool operator!=(const RowMapping& other) const { return !(*this == other); }

private:
    RowMetadataPtr m_parent;
    std::shared_ptr<const std::vector<Value>> m_data;
};

}  // namespace sqlcursor
