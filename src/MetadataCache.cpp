#include "MetadataCache.hpp"
#include <mutex>
#include <spdlog/spdlog.h>

namespace sqlcursor {

MetadataCache::MetadataCache(const CacheConfig& config)
    : m_config(config) {
    m_stats.maxEntries = config.max_entries;
}

std::shared_ptr<const CompiledCacheEntry> MetadataCache::get(const CacheKey& key) {
    if (!m_config.enabled) {
        return nullptr;
    }

    std::unique_lock<std::shared_mutex> lock(m_mutex);

    auto it = m_cache.find(key);
    if (it == m_cache.end()) {
        m_stats.misses++;
        spdlog::debug("Metadata cache miss");
        return nullptr;
    }

    // Update LRU
    m_lruList.splice(m_lruList.begin(), m_lruList, it->second.position);

    m_stats.hits++;
    spdlog::debug("Metadata cache hit ({} entries)", m_cache.size());

    return it->second.entry;
}

void MetadataCache::put(const CacheKey& key, std::shared_ptr<const CompiledCacheEntry> entry) {
    if (!m_config.enabled || m_config.max_entries == 0) {
        return;
    }

    std::unique_lock<std::shared_mutex> lock(m_mutex);

    // Check if key already exists
    auto existing = m_cache.find(key);
    if (existing != m_cache.end()) {
        existing->second.entry = std::move(entry);
        m_lruList.splice(m_lruList.begin(), m_lruList, existing->second.position);
        return;
    }

    // Evict if necessary
    evictIfNeeded();

    m_lruList.push_front(key);
    m_cache.emplace(key, Slot{std::move(entry), m_lruList.begin()});

    m_stats.entryCount = m_cache.size();

    spdlog::debug("Cached result metadata ({} of {} entries)", m_cache.size(),
                  m_config.max_entries);
}

bool MetadataCache::contains(const CacheKey& key) const {
    if (!m_config.enabled) {
        return false;
    }

    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_cache.find(key) != m_cache.end();
}

void MetadataCache::remove(const CacheKey& key) {
    std::unique_lock<std::shared_mutex> lock(m_mutex);

    auto it = m_cache.find(key);
    if (it != m_cache.end()) {
        m_lruList.erase(it->second.position);
        m_cache.erase(it);
        m_stats.entryCount = m_cache.size();
    }
}

void MetadataCache::clear() {
    std::unique_lock<std::shared_mutex> lock(m_mutex);

    m_cache.clear();
    m_lruList.clear();

    m_stats.entryCount = 0;

    spdlog::debug("Metadata cache cleared");
}

MetadataCache::Stats MetadataCache::getStats() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_stats;
}

void MetadataCache::evictLRU() {
    if (m_lruList.empty()) {
        return;
    }

    m_cache.erase(m_lruList.back());
    m_lruList.pop_back();

    m_stats.evictions++;
}

void MetadataCache::evictIfNeeded() {
    while (m_cache.size() >= m_config.max_entries && !m_lruList.empty()) {
        evictLRU();
    }
}

}  // namespace sqlcursor
