#pragma once

/**
 * @file RowMetadata.hpp
 * @brief Mapping from lookup keys to positions and decoders of a result.
 */

#include "Dialect.hpp"
#include "DriverCursor.hpp"
#include "ResultColumns.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace sqlcursor {

// Anything a row can be indexed with: position, name or construct identity
using LookupKey = std::variant<int64_t, std::string, const ClauseElement*>;

std::string describeKey(const LookupKey& key);

/**
 * @brief Per-column record of the keymap.
 *
 * A record without an index is the ambiguity marker: the key it is stored
 * under matched more than one column.
 */
struct KeyRecord {
    std::optional<size_t> index;
    // Declared result column the raw column was matched to, if any
    std::optional<size_t> resultIndex;
    std::vector<ObjectKey> objects;
    std::string lookupKey;
    std::string renderedName;
    Decoder processor;
    std::optional<std::string> untranslated;

    bool ambiguous() const { return !index.has_value(); }
};

using KeyRecordPtr = std::shared_ptr<const KeyRecord>;

// How raw columns were matched to declared columns
enum class MatchStrategy {
    Positional,
    TextualPositional,
    ByName,
    None,
    Restored
};

const char* matchStrategyName(MatchStrategy strategy);

class RowMetadata : public std::enable_shared_from_this<RowMetadata> {
public:
    /**
     * @brief Build metadata for a driver descriptor.
     *
     * @param dialect      Name translation, case folding and decoder lookup
     * @param description  Raw columns as reported by the driver
     * @param declared     Columns the statement declared, or nullptr for
     *                     statements without compiled column information
     * @throws InvalidRequestError when positional textual columns name the
     *         same construct twice
     */
    static std::shared_ptr<const RowMetadata>
    resolve(const Dialect& dialect, const std::vector<ColumnDescription>& description,
            const ResultColumnStruct* declared);

    /**
     * @brief Metadata for an equivalent statement built from other objects.
     *
     * Keys of the statement the metadata was built for keep working; each
     * invoked column becomes a key of the record matched to the declared
     * column at the same position, so columns sharing a name stay apart.
     * Returns this metadata when nothing differs.
     */
    std::shared_ptr<const RowMetadata> adaptTo(const std::vector<ResultColumn>& compiledColumns,
                                               const ElementList& invokedColumns) const;

    /**
     * @brief Metadata restricted to a subset of columns, in the given order.
     * @throws NoSuchColumnError, AmbiguousColumnError
     */
    std::shared_ptr<const RowMetadata> reduce(const std::vector<LookupKey>& keys) const;

    // Index-only form: string and integer keys, no decoders, no objects
    json toJson() const;
    static std::shared_ptr<const RowMetadata> fromJson(const json& state);

    const std::vector<std::string>& keys() const { return m_keys; }
    const std::vector<KeyRecordPtr>& records() const { return m_records; }
    const std::vector<Decoder>& processors() const { return m_processors; }

    // Raw positions to pick before decoding, set on reduced metadata
    const std::optional<std::vector<size_t>>& tupleFilter() const { return m_tupleFilter; }

    MatchStrategy strategy() const { return m_strategy; }
    bool caseSensitive() const { return m_caseSensitive; }
    size_t size() const { return m_records.size(); }

    /**
     * @brief Position of a key.
     * @throws NoSuchColumnError when absent, AmbiguousColumnError when the
     *         key matched several columns
     */
    size_t indexFor(const LookupKey& key) const;

    // std::nullopt when absent; still throws for ambiguous keys
    std::optional<size_t> findIndex(const LookupKey& key) const;

    // True for any known key, ambiguous ones included
    bool contains(const LookupKey& key) const;

private:
    RowMetadata() = default;

    KeyRecordPtr lookup(const LookupKey& key) const;
    std::string fold(const std::string& name) const;
    void addPositions(const KeyRecordPtr& record);

    std::vector<KeyRecordPtr> m_records;
    std::unordered_map<LookupKey, KeyRecordPtr> m_keymap;
    std::vector<std::string> m_keys;
    std::vector<Decoder> m_processors;
    std::optional<std::vector<size_t>> m_tupleFilter;
    bool m_caseSensitive = true;
    MatchStrategy m_strategy = MatchStrategy::None;
};

using RowMetadataPtr = std::shared_ptr<const RowMetadata>;

}  // namespace sqlcursor
