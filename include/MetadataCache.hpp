#pragma once

#include "CacheKey.hpp"
#include "Config.hpp"
#include "Elements.hpp"
#include "ResultColumns.hpp"
#include "RowMetadata.hpp"
#include <list>
#include <memory>
#include <shared_mutex>
#include <unordered_map>

namespace sqlcursor {

// What a statement shape compiles to, as far as results are concerned
struct CompiledCacheEntry {
    ElementPtr statement;               // statement the entry was built from
    ResultColumnStruct resultColumns;
    RowMetadataPtr metadata;
};

class MetadataCache {
public:
    struct Stats {
        uint64_t hits = 0;
        uint64_t misses = 0;
        size_t entryCount = 0;
        size_t maxEntries = 0;
        size_t evictions = 0;
    };

    explicit MetadataCache(const CacheConfig& config);
    ~MetadataCache() = default;

    // Non-copyable
    MetadataCache(const MetadataCache&) = delete;
    MetadataCache& operator=(const MetadataCache&) = delete;

    bool enabled() const { return m_config.enabled; }

    // Get cached entry
    std::shared_ptr<const CompiledCacheEntry> get(const CacheKey& key);

    // Store entry, evicting the least recently used one when full
    void put(const CacheKey& key, std::shared_ptr<const CompiledCacheEntry> entry);

    // Check if key exists
    bool contains(const CacheKey& key) const;

    // Remove specific key
    void remove(const CacheKey& key);

    // Clear all entries
    void clear();

    // Get statistics
    Stats getStats() const;

private:
    using LruList = std::list<CacheKey>;

    struct Slot {
        std::shared_ptr<const CompiledCacheEntry> entry;
        LruList::iterator position;
    };

    void evictLRU();
    void evictIfNeeded();

    CacheConfig m_config;

    std::unordered_map<CacheKey, Slot, CacheKeyHash> m_cache;
    LruList m_lruList;

    mutable std::shared_mutex m_mutex;

    Stats m_stats;
};

}  // namespace sqlcursor
