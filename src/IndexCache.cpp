#include "filedb/IndexCache.hpp"

namespace filedb {

IndexCache::IndexCache(size_t max_entries)
    : m_max_entries(max_entries)
{
}

std::optional<IndexRecord> IndexCache::get(uint64_t index) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_stats.total_gets++;

    auto it = m_cache.find(index);
    if (it == m_cache.end()) {
        m_stats.cache_misses++;
        return std::nullopt;
    }

    touchEntry(it->second);
    m_stats.cache_hits++;
    return it->second.record;
}

void IndexCache::put(uint64_t index, const IndexRecord& record) {
    if (m_max_entries == 0) return;

    std::lock_guard<std::mutex> lock(m_mutex);
    m_stats.total_puts++;

    auto it = m_cache.find(index);
    if (it != m_cache.end()) {
        it->second.record = record;
        touchEntry(it->second);
        return;
    }

    evictIfNeeded();

    m_lru_list.push_front(index);
    m_cache.emplace(index, CacheEntry{record, m_lru_list.begin()});
    m_stats.current_size = m_cache.size();
}

void IndexCache::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_cache.clear();
    m_lru_list.clear();
    m_stats.current_size = 0;
}

IndexCache::Stats IndexCache::getStats() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_stats;
}

void IndexCache::touchEntry(CacheEntry& entry) {
    // splice keeps the iterator valid
    m_lru_list.splice(m_lru_list.begin(), m_lru_list, entry.lru_iter);
}

void IndexCache::evictIfNeeded() {
    if (m_cache.size() < m_max_entries) return;

    uint64_t lru_index = m_lru_list.back();
    m_lru_list.pop_back();
    m_cache.erase(lru_index);

    m_stats.evictions++;
    m_stats.current_size = m_cache.size();
}

}
