#pragma once

/**
 * @file Compare.hpp
 * @brief Structural equality of statement trees.
 *
 * Walks two trees side by side using the same traversal metadata as cache
 * key generation. Commutative binary operators and associative clause
 * lists compare unordered.
 */

#include "CacheKey.hpp"
#include "Elements.hpp"
#include <deque>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace sqlcursor {

struct CompareOptions {
    bool compareValues = true;  // bound literal values must be equal
    bool useProxies = false;    // columns compare equal when they share lineage
};

class TraversalComparator {
public:
    explicit TraversalComparator(CompareOptions options = {});
    virtual ~TraversalComparator() = default;

    bool compare(const ClauseElement& left, const ClauseElement& right);

protected:
    enum class Outcome {
        Failed,     // trees differ
        Skip,       // pair is equal, do not descend
        Continue    // walk attributes not listed in handled
    };

    struct NodeResult {
        Outcome outcome = Outcome::Continue;
        std::set<std::string> handled;
    };

    // Node-specific comparison run before the attribute walk
    virtual NodeResult compareNode(const ClauseElement& left, const ClauseElement& right);

    // Comparison in a fresh comparator of the same kind
    virtual bool compareInner(const ClauseElement& left, const ClauseElement& right);

    NodeResult compareClauseList(const ClauseList& left, const ClauseList& right);
    NodeResult compareBinary(const BinaryExpression& left, const BinaryExpression& right);

    CompareOptions m_options;

private:
    using AttrFn = bool (TraversalComparator::*)(const TraversalEntry& left,
                                                 const TraversalEntry& right);

    static const AttrFn* dispatchTable();

    bool compareElement(const TraversalEntry& left, const TraversalEntry& right);
    bool compareElementList(const TraversalEntry& left, const TraversalEntry& right);
    bool compareElementTuples(const TraversalEntry& left, const TraversalEntry& right);
    bool compareInPlace(const TraversalEntry& left, const TraversalEntry& right);
    bool compareType(const TraversalEntry& left, const TraversalEntry& right);
    bool compareAnonName(const TraversalEntry& left, const TraversalEntry& right);
    bool compareUnorderedSet(const TraversalEntry& left, const TraversalEntry& right);
    bool compareBindValue(const TraversalEntry& left, const TraversalEntry& right);
    bool compareUnknown(const TraversalEntry& left, const TraversalEntry& right);

    void push(const ClauseElement* left, const ClauseElement* right);

    std::deque<std::pair<const ClauseElement*, const ClauseElement*>> m_stack;
    std::set<std::pair<const ClauseElement*, const ClauseElement*>> m_seen;
    AnonMap m_leftAnon;
    AnonMap m_rightAnon;
};

// Columns, labels and tables compare by identity or shared lineage
class ColumnIdentityComparator : public TraversalComparator {
public:
    using TraversalComparator::TraversalComparator;

protected:
    NodeResult compareNode(const ClauseElement& left, const ClauseElement& right) override;
    bool compareInner(const ClauseElement& left, const ClauseElement& right) override;
};

// Picks the lineage-aware comparator when options.useProxies is set
bool compare(const ClauseElement& left, const ClauseElement& right,
             CompareOptions options = {});

}  // namespace sqlcursor
