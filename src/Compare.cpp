#include "Compare.hpp"
#include <spdlog/spdlog.h>

namespace sqlcursor {

TraversalComparator::TraversalComparator(CompareOptions options)
    : m_options(options) {
}

bool TraversalComparator::compare(const ClauseElement& left, const ClauseElement& right) {
    m_stack.clear();
    m_seen.clear();
    push(&left, &right);

    const AttrFn* table = dispatchTable();
    while (!m_stack.empty()) {
        auto [l, r] = m_stack.front();
        m_stack.pop_front();

        if (!m_seen.emplace(l, r).second) {
            continue;
        }
        if (!l && !r) {
            continue;
        }
        if (!l || !r) {
            return false;
        }
        if (l == r) {
            continue;
        }
        if (l->visitName() != r->visitName()) {
            return false;
        }

        NodeResult node = compareNode(*l, *r);
        if (node.outcome == Outcome::Failed) {
            return false;
        }
        if (node.outcome == Outcome::Skip) {
            continue;
        }

        const auto leftEntries = l->traverseInternals();
        const auto rightEntries = r->traverseInternals();
        if (leftEntries.size() != rightEntries.size()) {
            return false;
        }
        for (size_t i = 0; i < leftEntries.size(); ++i) {
            const auto& le = leftEntries[i];
            const auto& re = rightEntries[i];
            if (le.name != re.name || le.kind != re.kind) {
                return false;
            }
            if (node.handled.count(le.name)) {
                continue;
            }
            if (!(this->*table[static_cast<size_t>(le.kind)])(le, re)) {
                return false;
            }
        }
    }
    return true;
}

void TraversalComparator::push(const ClauseElement* left, const ClauseElement* right) {
    m_stack.emplace_back(left, right);
}

bool TraversalComparator::compareInner(const ClauseElement& left, const ClauseElement& right) {
    TraversalComparator inner(m_options);
    return inner.compare(left, right);
}

TraversalComparator::NodeResult
TraversalComparator::compareNode(const ClauseElement& left, const ClauseElement& right) {
    if (const auto* lb = dynamic_cast<const BinaryExpression*>(&left)) {
        return compareBinary(*lb, static_cast<const BinaryExpression&>(right));
    }
    if (const auto* lc = dynamic_cast<const ClauseList*>(&left)) {
        return compareClauseList(*lc, static_cast<const ClauseList&>(right));
    }
    return {};
}

TraversalComparator::NodeResult
TraversalComparator::compareBinary(const BinaryExpression& left, const BinaryExpression& right) {
    if (left.op() != right.op()) {
        return {Outcome::Failed, {}};
    }
    if (!operatorInfo(left.op()).commutative) {
        return {Outcome::Continue, {"operator"}};
    }
    bool matched = (compareInner(left.left(), right.left()) &&
                    compareInner(left.right(), right.right())) ||
                   (compareInner(left.left(), right.right()) &&
                    compareInner(left.right(), right.left()));
    if (!matched) {
        return {Outcome::Failed, {}};
    }
    return {Outcome::Continue, {"operator", "left", "right"}};
}

TraversalComparator::NodeResult
TraversalComparator::compareClauseList(const ClauseList& left, const ClauseList& right) {
    if (left.op() != right.op()) {
        return {Outcome::Failed, {}};
    }
    if (!operatorInfo(left.op()).associative) {
        return {Outcome::Continue, {"operator"}};
    }
    auto remaining = right.clauses();
    const auto clauses = left.clauses();
    if (clauses.size() != remaining.size()) {
        return {Outcome::Failed, {}};
    }
    for (const auto* clause : clauses) {
        bool found = false;
        for (auto it = remaining.begin(); it != remaining.end(); ++it) {
            if (compareInner(*clause, **it)) {
                remaining.erase(it);
                found = true;
                break;
            }
        }
        if (!found) {
            return {Outcome::Failed, {}};
        }
    }
    return {Outcome::Continue, {"operator", "clauses"}};
}

// ============================================================================
// Attribute comparison
// ============================================================================

const TraversalComparator::AttrFn* TraversalComparator::dispatchTable() {
    // Indexed by VisitKind
    static const AttrFn table[kVisitKindCount] = {
        &TraversalComparator::compareElement,        // ClauseElement
        &TraversalComparator::compareElementList,    // ClauseElementList
        &TraversalComparator::compareElementTuples,  // ClauseElementTuples
        &TraversalComparator::compareInPlace,        // PlainValue
        &TraversalComparator::compareInPlace,        // String
        &TraversalComparator::compareInPlace,        // Boolean
        &TraversalComparator::compareInPlace,        // Operator
        &TraversalComparator::compareType,           // Type
        &TraversalComparator::compareAnonName,       // AnonName
        &TraversalComparator::compareUnorderedSet,   // UnorderedSet
        &TraversalComparator::compareBindValue,      // BindValue
        &TraversalComparator::compareUnknown,        // UnknownStructure
    };
    return table;
}

bool TraversalComparator::compareElement(const TraversalEntry& left,
                                         const TraversalEntry& right) {
    const auto* l = std::get_if<const ClauseElement*>(&left.value);
    const auto* r = std::get_if<const ClauseElement*>(&right.value);
    push(l ? *l : nullptr, r ? *r : nullptr);
    return true;
}

bool TraversalComparator::compareElementList(const TraversalEntry& left,
                                             const TraversalEntry& right) {
    const auto& l = std::get<ElementList>(left.value);
    const auto& r = std::get<ElementList>(right.value);
    if (l.size() != r.size()) {
        return false;
    }
    for (size_t i = 0; i < l.size(); ++i) {
        push(l[i], r[i]);
    }
    return true;
}

bool TraversalComparator::compareElementTuples(const TraversalEntry& left,
                                               const TraversalEntry& right) {
    const auto& l = std::get<ElementTuples>(left.value);
    const auto& r = std::get<ElementTuples>(right.value);
    if (l.size() != r.size()) {
        return false;
    }
    for (size_t i = 0; i < l.size(); ++i) {
        if (l[i].size() != r[i].size()) {
            return false;
        }
        for (size_t j = 0; j < l[i].size(); ++j) {
            push(l[i][j], r[i][j]);
        }
    }
    return true;
}

bool TraversalComparator::compareInPlace(const TraversalEntry& left,
                                         const TraversalEntry& right) {
    return left.value == right.value;
}

bool TraversalComparator::compareType(const TraversalEntry& left, const TraversalEntry& right) {
    const auto& l = std::get<TypePtr>(left.value);
    const auto& r = std::get<TypePtr>(right.value);
    if (!l || !r) {
        return !l && !r;
    }
    return l->affinity() == r->affinity();
}

bool TraversalComparator::compareAnonName(const TraversalEntry& left,
                                          const TraversalEntry& right) {
    const auto& l = std::get<AnonName>(left.value);
    const auto& r = std::get<AnonName>(right.value);
    return renderAnonName(l, m_leftAnon) == renderAnonName(r, m_rightAnon);
}

bool TraversalComparator::compareUnorderedSet(const TraversalEntry& left,
                                              const TraversalEntry& right) {
    const auto& l = std::get<ElementList>(left.value);
    auto remaining = std::get<ElementList>(right.value);
    if (l.size() != remaining.size()) {
        return false;
    }
    for (const auto* element : l) {
        bool found = false;
        for (auto it = remaining.begin(); it != remaining.end(); ++it) {
            if (compareInner(*element, **it)) {
                remaining.erase(it);
                found = true;
                break;
            }
        }
        if (!found) {
            return false;
        }
    }
    return true;
}

bool TraversalComparator::compareBindValue(const TraversalEntry& left,
                                           const TraversalEntry& right) {
    if (!m_options.compareValues) {
        return true;
    }
    return left.value == right.value;
}

bool TraversalComparator::compareUnknown(const TraversalEntry& left, const TraversalEntry&) {
    spdlog::debug("Attribute '{}' has no traversal metadata; treating as unequal", left.name);
    return false;
}

// ============================================================================
// Lineage-aware comparison
// ============================================================================

TraversalComparator::NodeResult
ColumnIdentityComparator::compareNode(const ClauseElement& left, const ClauseElement& right) {
    const std::string visit = left.visitName();
    if (visit == "column" || visit == "label") {
        if (m_options.useProxies && left.sharesLineage(right)) {
            return {Outcome::Skip, {}};
        }
        return {&left == &right ? Outcome::Skip : Outcome::Failed, {}};
    }
    if (visit == "table") {
        return {&left == &right ? Outcome::Skip : Outcome::Failed, {}};
    }
    return TraversalComparator::compareNode(left, right);
}

bool ColumnIdentityComparator::compareInner(const ClauseElement& left,
                                            const ClauseElement& right) {
    ColumnIdentityComparator inner(m_options);
    return inner.compare(left, right);
}

bool compare(const ClauseElement& left, const ClauseElement& right, CompareOptions options) {
    if (options.useProxies) {
        ColumnIdentityComparator comparator(options);
        return comparator.compare(left, right);
    }
    TraversalComparator comparator(options);
    return comparator.compare(left, right);
}

}  // namespace sqlcursor
