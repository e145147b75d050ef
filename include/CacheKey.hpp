#pragma once

/**
 * @file CacheKey.hpp
 * @brief Structural cache keys for statement trees.
 */

#include "Elements.hpp"
#include "Value.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace sqlcursor {

/**
 * @brief Identity interning table used while walking one tree.
 *
 * Assigns a sequential id to each distinct object identity seen, so the
 * same object appearing twice yields the same id and two distinct but
 * equal-shaped trees yield the same numbering. Also carries the
 * "uncacheable" flag raised by elements without traversal metadata.
 */
class AnonMap {
public:
    // Id of the identity, assigning the next one on first sight
    std::string get(const void* identity);

    bool contains(const void* identity) const;

    void markUncacheable() { m_uncacheable = true; }
    bool uncacheable() const { return m_uncacheable; }

    size_t size() const { return m_ids.size(); }

private:
    std::unordered_map<const void*, std::string> m_ids;
    size_t m_next = 0;
    bool m_uncacheable = false;
};

// Literal pulled out of the tree while building its key
struct ExtractedParameter {
    std::string key;
    Value value;
    TypePtr type;
};

/**
 * @brief Hashable key of a statement tree plus its extracted literals.
 *
 * Equality and hash consider the structural key only, so statements
 * differing only in literal values share one key.
 */
class CacheKey {
public:
    CacheKey(json key, std::vector<ExtractedParameter> parameters);

    const json& key() const { return m_key; }
    const std::vector<ExtractedParameter>& parameters() const { return m_parameters; }

    size_t hash() const { return m_hash; }
    std::string toString() const { return m_key.dump(); }

    bool operator==(const CacheKey& other) const { return m_key == other.m_key; }
    bool operator!=(const CacheKey& other) const { return !(*this == other); }

private:
    json m_key;
    std::vector<ExtractedParameter> m_parameters;
    size_t m_hash;
};

struct CacheKeyHash {
    size_t operator()(const CacheKey& key) const { return key.hash(); }
};

class CacheKeyGenerator {
public:
    /**
     * @brief Generate the cache key of a tree.
     * @return std::nullopt when any element in the tree is uncacheable
     */
    static std::optional<CacheKey> generate(const ClauseElement& element);

    // Key of one element against a caller-owned anonymous map
    static json generateKey(const ClauseElement& element, AnonMap& anonMap,
                            std::vector<ExtractedParameter>& parameters);

private:
    // Returns null when the attribute contributes nothing to the key
    using VisitFn = json (*)(const ClauseElement& owner, const TraversalEntry& entry,
                             AnonMap& anonMap, std::vector<ExtractedParameter>& parameters);

    static const VisitFn* dispatchTable();

    static json visitElement(const ClauseElement&, const TraversalEntry&, AnonMap&,
                             std::vector<ExtractedParameter>&);
    static json visitElementList(const ClauseElement&, const TraversalEntry&, AnonMap&,
                                 std::vector<ExtractedParameter>&);
    static json visitElementTuples(const ClauseElement&, const TraversalEntry&, AnonMap&,
                                   std::vector<ExtractedParameter>&);
    static json visitInPlace(const ClauseElement&, const TraversalEntry&, AnonMap&,
                             std::vector<ExtractedParameter>&);
    static json visitOperator(const ClauseElement&, const TraversalEntry&, AnonMap&,
                              std::vector<ExtractedParameter>&);
    static json visitType(const ClauseElement&, const TraversalEntry&, AnonMap&,
                          std::vector<ExtractedParameter>&);
    static json visitAnonName(const ClauseElement&, const TraversalEntry&, AnonMap&,
                              std::vector<ExtractedParameter>&);
    static json visitUnorderedSet(const ClauseElement&, const TraversalEntry&, AnonMap&,
                                  std::vector<ExtractedParameter>&);
    static json visitBindValue(const ClauseElement&, const TraversalEntry&, AnonMap&,
                               std::vector<ExtractedParameter>&);
    static json visitUnknown(const ClauseElement&, const TraversalEntry&, AnonMap&,
                             std::vector<ExtractedParameter>&);
};

// Rendered form of a possibly anonymous name against an anonymous map
std::string renderAnonName(const AnonName& name, AnonMap& anonMap);

}  // namespace sqlcursor
