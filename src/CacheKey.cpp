#include "CacheKey.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace sqlcursor {

std::string AnonMap::get(const void* identity) {
    auto it = m_ids.find(identity);
    if (it != m_ids.end()) {
        return it->second;
    }
    std::string id = std::to_string(m_next++);
    m_ids.emplace(identity, id);
    return id;
}

bool AnonMap::contains(const void* identity) const {
    return m_ids.find(identity) != m_ids.end();
}

std::string renderAnonName(const AnonName& name, AnonMap& anonMap) {
    if (!name.anonymous()) {
        return name.base;
    }
    return name.base + "_" + anonMap.get(name.owner);
}

CacheKey::CacheKey(json key, std::vector<ExtractedParameter> parameters)
    : m_key(std::move(key))
    , m_parameters(std::move(parameters))
    , m_hash(std::hash<json>{}(m_key)) {
}

// ============================================================================
// Generation
// ============================================================================

std::optional<CacheKey> CacheKeyGenerator::generate(const ClauseElement& element) {
    AnonMap anonMap;
    std::vector<ExtractedParameter> parameters;
    json key = generateKey(element, anonMap, parameters);
    if (anonMap.uncacheable()) {
        spdlog::debug("Statement '{}' is not cacheable", element.visitName());
        return std::nullopt;
    }
    return CacheKey(std::move(key), std::move(parameters));
}

json CacheKeyGenerator::generateKey(const ClauseElement& element, AnonMap& anonMap,
                                    std::vector<ExtractedParameter>& parameters) {
    // Already seen: a back-reference to the first occurrence is enough
    if (anonMap.contains(&element)) {
        return json::array({anonMap.get(&element), element.visitName()});
    }
    json key = json::array({anonMap.get(&element), element.visitName()});

    const VisitFn* table = dispatchTable();
    for (const auto& entry : element.traverseInternals()) {
        json sub = table[static_cast<size_t>(entry.kind)](element, entry, anonMap, parameters);
        if (sub.is_null()) {
            continue;
        }
        key.push_back(entry.name);
        key.push_back(std::move(sub));
    }
    return key;
}

const CacheKeyGenerator::VisitFn* CacheKeyGenerator::dispatchTable() {
    // Indexed by VisitKind
    static const VisitFn table[kVisitKindCount] = {
        &CacheKeyGenerator::visitElement,        // ClauseElement
        &CacheKeyGenerator::visitElementList,    // ClauseElementList
        &CacheKeyGenerator::visitElementTuples,  // ClauseElementTuples
        &CacheKeyGenerator::visitInPlace,        // PlainValue
        &CacheKeyGenerator::visitInPlace,        // String
        &CacheKeyGenerator::visitInPlace,        // Boolean
        &CacheKeyGenerator::visitOperator,       // Operator
        &CacheKeyGenerator::visitType,           // Type
        &CacheKeyGenerator::visitAnonName,       // AnonName
        &CacheKeyGenerator::visitUnorderedSet,   // UnorderedSet
        &CacheKeyGenerator::visitBindValue,      // BindValue
        &CacheKeyGenerator::visitUnknown,        // UnknownStructure
    };
    return table;
}

json CacheKeyGenerator::visitElement(const ClauseElement&, const TraversalEntry& entry,
                                     AnonMap& anonMap,
                                     std::vector<ExtractedParameter>& parameters) {
    const auto* element = std::get_if<const ClauseElement*>(&entry.value);
    if (!element || !*element) {
        return nullptr;
    }
    return generateKey(**element, anonMap, parameters);
}

json CacheKeyGenerator::visitElementList(const ClauseElement&, const TraversalEntry& entry,
                                         AnonMap& anonMap,
                                         std::vector<ExtractedParameter>& parameters) {
    const auto* elements = std::get_if<ElementList>(&entry.value);
    if (!elements || elements->empty()) {
        return nullptr;
    }
    json key = json::array();
    for (const auto* element : *elements) {
        key.push_back(generateKey(*element, anonMap, parameters));
    }
    return key;
}

json CacheKeyGenerator::visitElementTuples(const ClauseElement&, const TraversalEntry& entry,
                                           AnonMap& anonMap,
                                           std::vector<ExtractedParameter>& parameters) {
    const auto* tuples = std::get_if<ElementTuples>(&entry.value);
    if (!tuples || tuples->empty()) {
        return nullptr;
    }
    json key = json::array();
    for (const auto& tuple : *tuples) {
        json sub = json::array();
        for (const auto* element : tuple) {
            sub.push_back(element ? generateKey(*element, anonMap, parameters) : json(nullptr));
        }
        key.push_back(std::move(sub));
    }
    return key;
}

json CacheKeyGenerator::visitInPlace(const ClauseElement&, const TraversalEntry& entry,
                                     AnonMap&, std::vector<ExtractedParameter>&) {
    // Falsy values are left out of the key
    if (const auto* text = std::get_if<std::string>(&entry.value)) {
        return text->empty() ? json(nullptr) : json(*text);
    }
    if (const auto* flag = std::get_if<bool>(&entry.value)) {
        return *flag ? json(true) : json(nullptr);
    }
    if (const auto* value = std::get_if<Value>(&entry.value)) {
        return isNull(*value) ? json(nullptr) : toJson(*value);
    }
    return nullptr;
}

json CacheKeyGenerator::visitOperator(const ClauseElement&, const TraversalEntry& entry,
                                      AnonMap&, std::vector<ExtractedParameter>&) {
    const auto* op = std::get_if<Operator>(&entry.value);
    if (!op) {
        return nullptr;
    }
    return operatorInfo(*op).name;
}

json CacheKeyGenerator::visitType(const ClauseElement&, const TraversalEntry& entry,
                                  AnonMap&, std::vector<ExtractedParameter>&) {
    const auto* type = std::get_if<TypePtr>(&entry.value);
    if (!type || !*type) {
        return nullptr;
    }
    return (*type)->staticCacheKey();
}

json CacheKeyGenerator::visitAnonName(const ClauseElement&, const TraversalEntry& entry,
                                      AnonMap& anonMap, std::vector<ExtractedParameter>&) {
    const auto* name = std::get_if<AnonName>(&entry.value);
    if (!name) {
        return nullptr;
    }
    return renderAnonName(*name, anonMap);
}

json CacheKeyGenerator::visitUnorderedSet(const ClauseElement&, const TraversalEntry& entry,
                                          AnonMap& anonMap,
                                          std::vector<ExtractedParameter>& parameters) {
    const auto* elements = std::get_if<ElementList>(&entry.value);
    if (!elements || elements->empty()) {
        return nullptr;
    }
    // Order members by a provisional key so that ids are assigned the same
    // way whatever order the set was built in
    std::vector<std::pair<json, const ClauseElement*>> ordered;
    for (const auto* element : *elements) {
        AnonMap scratch = anonMap;
        std::vector<ExtractedParameter> unused;
        ordered.emplace_back(generateKey(*element, scratch, unused), element);
    }
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });

    json key = json::array();
    for (const auto& [provisional, element] : ordered) {
        key.push_back(generateKey(*element, anonMap, parameters));
    }
    return key;
}

json CacheKeyGenerator::visitBindValue(const ClauseElement& owner, const TraversalEntry& entry,
                                       AnonMap& anonMap,
                                       std::vector<ExtractedParameter>& parameters) {
    const auto* value = std::get_if<Value>(&entry.value);
    if (!value) {
        return nullptr;
    }
    std::string name = entry.name;
    if (const auto* bind = dynamic_cast<const BindParameter*>(&owner)) {
        name = renderAnonName(bind->key(), anonMap);
    }
    parameters.push_back(ExtractedParameter{name, *value, owner.type()});
    return nullptr;
}

json CacheKeyGenerator::visitUnknown(const ClauseElement& owner, const TraversalEntry&,
                                     AnonMap& anonMap, std::vector<ExtractedParameter>&) {
    spdlog::debug("Element '{}' has no traversal metadata", owner.visitName());
    anonMap.markUncacheable();
    return nullptr;
}

}  // namespace sqlcursor
