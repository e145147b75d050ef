#include "RowMetadata.hpp"
#include "ErrorHandler.hpp"
#include <algorithm>
#include <cctype>
#include <map>
#include <set>
#include <spdlog/spdlog.h>

namespace sqlcursor {

namespace {

// Raw column as reported by the driver, after translation and normalization
struct DescribedColumn {
    size_t index;
    std::string key;                        // display key
    std::string lookup;                     // key folded for lookups
    std::optional<std::string> untranslated;
    int typeCode;
};

struct MatchedColumn {
    std::vector<size_t> resultIndexes;
    std::string name;
    std::vector<ObjectKey> objects;
    TypePtr type;
};

std::string lower(const std::string& name) {
    std::string result = name;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::vector<DescribedColumn> describeColumns(const Dialect& dialect,
                                             const std::vector<ColumnDescription>& description) {
    std::vector<DescribedColumn> result;
    result.reserve(description.size());
    for (size_t idx = 0; idx < description.size(); ++idx) {
        DescribedColumn col{idx, description[idx].name, "", std::nullopt,
                            description[idx].typeCode};
        if (auto translated = dialect.translateColname(col.key)) {
            col.key = translated->first;
            col.untranslated = translated->second;
        }
        if (dialect.requiresNameNormalize()) {
            col.key = dialect.normalizeName(col.key);
        }
        col.lookup = dialect.foldName(col.key);
        result.push_back(std::move(col));
    }
    return result;
}

// Rendered name to declared column; columns rendering the same name merge
// their alternate keys
std::map<std::string, MatchedColumn> createMatchMap(const Dialect& dialect,
                                                    const ResultColumnStruct& declared) {
    std::map<std::string, MatchedColumn> matches;
    for (size_t idx = 0; idx < declared.columns.size(); ++idx) {
        const auto& col = declared.columns[idx];
        const std::string key = dialect.foldName(col.renderedName);
        auto it = matches.find(key);
        if (it != matches.end()) {
            auto& objects = it->second.objects;
            objects.insert(objects.end(), col.objects.begin(), col.objects.end());
            it->second.resultIndexes.push_back(idx);
        } else {
            matches.emplace(key, MatchedColumn{{idx}, col.name, col.objects, col.type});
        }
        if (declared.looseColumnNameMatching) {
            for (const auto& object : col.objects) {
                if (const auto* name = std::get_if<std::string>(&object)) {
                    matches.emplace(dialect.foldName(*name),
                                    MatchedColumn{{idx}, col.name, col.objects, col.type});
                }
            }
        }
    }
    return matches;
}

Decoder processorFor(const Dialect& dialect, const TypePtr& type, int typeCode) {
    if (!type) {
        return {};
    }
    return dialect.resultProcessor(*type, typeCode);
}

}  // namespace

const char* matchStrategyName(MatchStrategy strategy) {
    switch (strategy) {
        case MatchStrategy::Positional:
            return "positional";
        case MatchStrategy::TextualPositional:
            return "textual positional";
        case MatchStrategy::ByName:
            return "by name";
        case MatchStrategy::None:
            return "none";
        case MatchStrategy::Restored:
            return "restored";
    }
    return "unknown";
}

std::string describeKey(const LookupKey& key) {
    if (const auto* index = std::get_if<int64_t>(&key)) {
        return std::to_string(*index);
    }
    if (const auto* name = std::get_if<std::string>(&key)) {
        return *name;
    }
    const auto* element = std::get<const ClauseElement*>(key);
    if (const auto* col = dynamic_cast<const Column*>(element)) {
        if (const auto* table = dynamic_cast<const Table*>(col->table())) {
            return table->name() + "." + col->name();
        }
        return col->name();
    }
    if (const auto* lbl = dynamic_cast<const Label*>(element)) {
        return lbl->name().base;
    }
    return "<" + (element ? element->visitName() : std::string("null")) + ">";
}

// ============================================================================
// Resolution
// ============================================================================

std::shared_ptr<const RowMetadata>
RowMetadata::resolve(const Dialect& dialect, const std::vector<ColumnDescription>& description,
                     const ResultColumnStruct* declared) {
    std::shared_ptr<RowMetadata> md(new RowMetadata());
    md->m_caseSensitive = dialect.caseSensitive();

    const size_t numCtxCols = declared ? declared->columns.size() : 0;
    const bool colsAreOrdered = declared && declared->colsAreOrdered;
    const bool textualOrdered = declared && declared->textualOrdered;

    std::vector<std::shared_ptr<KeyRecord>> raw;
    raw.reserve(description.size());

    if (numCtxCols && colsAreOrdered && !textualOrdered && numCtxCols == description.size()) {
        // Declared columns line up one to one with the raw columns
        md->m_strategy = MatchStrategy::Positional;
        for (size_t idx = 0; idx < numCtxCols; ++idx) {
            const auto& col = declared->columns[idx];
            auto rec = std::make_shared<KeyRecord>();
            rec->index = idx;
            rec->resultIndex = idx;
            rec->objects = col.objects;
            rec->lookupKey = dialect.foldName(col.name);
            rec->renderedName = col.renderedName;
            rec->processor = processorFor(dialect, col.type, description[idx].typeCode);
            md->m_keys.push_back(col.name);
            raw.push_back(std::move(rec));
        }
    } else {
        const auto described = describeColumns(dialect, description);
        for (const auto& col : described) {
            md->m_keys.push_back(col.key);
        }

        if (textualOrdered) {
            md->m_strategy = MatchStrategy::TextualPositional;
            if (numCtxCols > description.size()) {
                spdlog::warn("Number of columns in textual SQL ({}) is smaller than number "
                             "of columns requested ({})",
                             description.size(), numCtxCols);
            }
            std::set<ObjectKey> seen;
            for (const auto& col : described) {
                auto rec = std::make_shared<KeyRecord>();
                rec->index = col.index;
                rec->lookupKey = col.lookup;
                rec->renderedName = col.lookup;
                rec->untranslated = col.untranslated;
                if (col.index < numCtxCols) {
                    const auto& declaredCol = declared->columns[col.index];
                    if (!declaredCol.objects.empty()) {
                        if (!seen.insert(declaredCol.objects.front()).second) {
                            throw InvalidRequestError(
                                "Duplicate column expression requested in textual SQL: " +
                                declaredCol.name);
                        }
                    }
                    rec->resultIndex = col.index;
                    rec->objects = declaredCol.objects;
                    rec->processor = processorFor(dialect, declaredCol.type, col.typeCode);
                }
                raw.push_back(std::move(rec));
            }
        } else if (numCtxCols) {
            md->m_strategy = MatchStrategy::ByName;
            const auto matches = createMatchMap(dialect, *declared);
            // Raw columns repeating a name take that name's declared
            // positions in order
            std::map<std::string, size_t> taken;
            for (const auto& col : described) {
                auto rec = std::make_shared<KeyRecord>();
                rec->index = col.index;
                rec->lookupKey = col.lookup;
                rec->renderedName = col.lookup;
                rec->untranslated = col.untranslated;
                auto it = matches.find(col.lookup);
                if (it != matches.end()) {
                    const auto& positions = it->second.resultIndexes;
                    const size_t nth = taken[col.lookup]++;
                    if (nth < positions.size()) {
                        rec->resultIndex = positions[nth];
                    }
                    rec->objects = it->second.objects;
                    rec->processor = processorFor(dialect, it->second.type, col.typeCode);
                }
                raw.push_back(std::move(rec));
            }
        } else {
            md->m_strategy = MatchStrategy::None;
            for (const auto& col : described) {
                auto rec = std::make_shared<KeyRecord>();
                rec->index = col.index;
                rec->lookupKey = col.lookup;
                rec->renderedName = col.lookup;
                rec->untranslated = col.untranslated;
                raw.push_back(std::move(rec));
            }
        }
    }

    auto foldKey = [&md](const ObjectKey& key) -> LookupKey {
        if (const auto* name = std::get_if<std::string>(&key)) {
            return md->fold(*name);
        }
        return std::get<const ClauseElement*>(key);
    };

    // Any key reachable from more than one position is a dupe, across the
    // whole column list
    std::unordered_map<LookupKey, size_t> indexByKey;
    std::set<LookupKey> dupes;
    for (const auto& rec : raw) {
        std::vector<LookupKey> candidates{rec->lookupKey, md->fold(rec->renderedName)};
        for (const auto& object : rec->objects) {
            candidates.push_back(foldKey(object));
        }
        for (const auto& key : candidates) {
            auto [it, inserted] = indexByKey.emplace(key, *rec->index);
            if (!inserted && it->second != *rec->index) {
                dupes.insert(key);
            }
        }
    }

    for (const auto& rec : raw) {
        md->m_records.push_back(rec);
        md->m_processors.push_back(rec->processor);
        for (const auto& object : rec->objects) {
            LookupKey key = foldKey(object);
            if (!dupes.count(key)) {
                md->m_keymap[key] = rec;
            }
        }
    }

    // Primary string names take precedence over alternate keys
    for (const auto& rec : raw) {
        if (!dupes.count(rec->lookupKey)) {
            md->m_keymap[rec->lookupKey] = rec;
        }
    }
    for (const auto& key : dupes) {
        auto marker = std::make_shared<KeyRecord>();
        if (const auto* name = std::get_if<std::string>(&key)) {
            marker->lookupKey = *name;
        }
        md->m_keymap[key] = marker;
    }

    if (!numCtxCols) {
        for (const auto& rec : raw) {
            if (rec->untranslated) {
                md->m_keymap[md->fold(*rec->untranslated)] = rec;
            }
        }
    }

    for (const auto& rec : raw) {
        md->addPositions(rec);
    }

    if (!dupes.empty()) {
        spdlog::debug("Result columns have {} ambiguous key(s)", dupes.size());
    }
    spdlog::debug("Resolved {} result columns ({} matching)", raw.size(),
                  matchStrategyName(md->m_strategy));
    return md;
}

void RowMetadata::addPositions(const KeyRecordPtr& record) {
    const auto count = static_cast<int64_t>(m_records.size());
    const auto index = static_cast<int64_t>(*record->index);
    m_keymap[LookupKey(index)] = record;
    m_keymap[LookupKey(index - count)] = record;
}

std::string RowMetadata::fold(const std::string& name) const {
    return m_caseSensitive ? name : lower(name);
}

// ============================================================================
// Adaptation and reduction
// ============================================================================

std::shared_ptr<const RowMetadata>
RowMetadata::adaptTo(const std::vector<ResultColumn>& compiledColumns,
                     const ElementList& invokedColumns) const {
    const size_t count = std::min(compiledColumns.size(), invokedColumns.size());
    bool same = compiledColumns.size() == invokedColumns.size();
    for (size_t i = 0; same && i < count; ++i) {
        const auto& objects = compiledColumns[i].objects;
        same = !objects.empty() && objects.front() == ObjectKey(invokedColumns[i]);
    }
    if (same) {
        return shared_from_this();
    }

    std::unordered_map<size_t, KeyRecordPtr> byResultIndex;
    for (const auto& rec : m_records) {
        if (rec->resultIndex) {
            byResultIndex.emplace(*rec->resultIndex, rec);
        }
    }

    std::shared_ptr<RowMetadata> md(new RowMetadata(*this));
    std::unordered_map<LookupKey, KeyRecordPtr> added;
    for (size_t i = 0; i < count; ++i) {
        auto it = byResultIndex.find(i);
        if (it == byResultIndex.end()) {
            continue;
        }
        const LookupKey invoked(invokedColumns[i]);
        auto [pos, inserted] = added.emplace(invoked, it->second);
        if (!inserted && pos->second != it->second) {
            // Same construct invoked at two positions
            pos->second = std::make_shared<KeyRecord>();
        }
    }
    for (const auto& [invoked, rec] : added) {
        md->m_keymap[invoked] = rec;
    }
    spdlog::debug("Adapted cached result metadata to {} invoked columns", count);
    return md;
}

std::shared_ptr<const RowMetadata> RowMetadata::reduce(const std::vector<LookupKey>& keys) const {
    std::vector<KeyRecordPtr> selected;
    selected.reserve(keys.size());
    for (const auto& key : keys) {
        auto rec = lookup(key);
        if (!rec) {
            throw NoSuchColumnError(describeKey(key));
        }
        if (rec->ambiguous()) {
            throw AmbiguousColumnError(describeKey(key));
        }
        selected.push_back(rec);
    }

    std::shared_ptr<RowMetadata> md(new RowMetadata());
    md->m_caseSensitive = m_caseSensitive;
    md->m_strategy = m_strategy;

    std::vector<size_t> filter;
    for (size_t i = 0; i < selected.size(); ++i) {
        const size_t oldIndex = *selected[i]->index;
        filter.push_back(m_tupleFilter ? (*m_tupleFilter)[oldIndex] : oldIndex);

        auto rec = std::make_shared<KeyRecord>(*selected[i]);
        rec->index = i;
        md->m_keys.push_back(m_keys[oldIndex]);
        md->m_processors.push_back(m_processors[oldIndex]);
        md->m_records.push_back(rec);
    }
    for (const auto& rec : md->m_records) {
        for (const auto& object : rec->objects) {
            if (const auto* name = std::get_if<std::string>(&object)) {
                md->m_keymap[fold(*name)] = rec;
            } else {
                md->m_keymap[std::get<const ClauseElement*>(object)] = rec;
            }
        }
    }
    for (const auto& rec : md->m_records) {
        md->m_keymap[rec->lookupKey] = rec;
        md->addPositions(rec);
    }
    md->m_tupleFilter = std::move(filter);
    return md;
}

// ============================================================================
// Serialization
// ============================================================================

json RowMetadata::toJson() const {
    json keymap = json::array();
    for (const auto& [key, rec] : m_keymap) {
        if (std::holds_alternative<const ClauseElement*>(key)) {
            continue;
        }
        json entry;
        if (const auto* name = std::get_if<std::string>(&key)) {
            entry["key"] = *name;
        } else {
            entry["key"] = std::get<int64_t>(key);
        }
        entry["index"] = rec->index ? json(*rec->index) : json(nullptr);
        keymap.push_back(std::move(entry));
    }

    json state;
    state["keys"] = m_keys;
    state["case_sensitive"] = m_caseSensitive;
    state["keymap"] = std::move(keymap);
    state["tuplefilter"] = m_tupleFilter ? json(*m_tupleFilter) : json(nullptr);
    return state;
}

std::shared_ptr<const RowMetadata> RowMetadata::fromJson(const json& state) {
    std::shared_ptr<RowMetadata> md(new RowMetadata());
    md->m_strategy = MatchStrategy::Restored;
    md->m_caseSensitive = state.at("case_sensitive").get<bool>();
    md->m_keys = state.at("keys").get<std::vector<std::string>>();

    for (size_t idx = 0; idx < md->m_keys.size(); ++idx) {
        auto rec = std::make_shared<KeyRecord>();
        rec->index = idx;
        rec->lookupKey = md->fold(md->m_keys[idx]);
        rec->renderedName = rec->lookupKey;
        md->m_records.push_back(rec);
    }
    md->m_processors.resize(md->m_keys.size());

    for (const auto& entry : state.at("keymap")) {
        const auto& key = entry.at("key");
        const auto& index = entry.at("index");
        KeyRecordPtr rec;
        if (index.is_null()) {
            auto marker = std::make_shared<KeyRecord>();
            if (key.is_string()) {
                marker->lookupKey = key.get<std::string>();
            }
            rec = marker;
        } else {
            const auto position = index.get<size_t>();
            if (position >= md->m_records.size()) {
                throw InvalidRequestError("Serialized result metadata refers to column " +
                                          std::to_string(position) + " of " +
                                          std::to_string(md->m_records.size()));
            }
            rec = md->m_records[position];
        }
        if (key.is_string()) {
            md->m_keymap[key.get<std::string>()] = rec;
        } else {
            md->m_keymap[key.get<int64_t>()] = rec;
        }
    }

    if (!state.at("tuplefilter").is_null()) {
        md->m_tupleFilter = state.at("tuplefilter").get<std::vector<size_t>>();
    }
    return md;
}

// ============================================================================
// Lookup
// ============================================================================

KeyRecordPtr RowMetadata::lookup(const LookupKey& key) const {
    auto it = m_keymap.end();
    if (const auto* name = std::get_if<std::string>(&key)) {
        it = m_keymap.find(LookupKey(fold(*name)));
    } else {
        it = m_keymap.find(key);
    }
    if (it == m_keymap.end()) {
        return nullptr;
    }
    return it->second;
}

size_t RowMetadata::indexFor(const LookupKey& key) const {
    auto index = findIndex(key);
    if (!index) {
        throw NoSuchColumnError(describeKey(key));
    }
    return *index;
}

std::optional<size_t> RowMetadata::findIndex(const LookupKey& key) const {
    auto rec = lookup(key);
    if (!rec) {
        return std::nullopt;
    }
    if (rec->ambiguous()) {
        throw AmbiguousColumnError(describeKey(key));
    }
    return rec->index;
}

bool RowMetadata::contains(const LookupKey& key) const {
    return lookup(key) != nullptr;
}

}  // namespace sqlcursor
