#ifndef DIASPORA_FILEDB_INDEX_CACHE_HPP
#define DIASPORA_FILEDB_INDEX_CACHE_HPP

#include <filedb/OffsetCodec.hpp>
#include <unordered_map>
#include <list>
#include <mutex>
#include <optional>
#include <cstdint>

namespace filedb {

/**
 * LRU cache of decoded index records, keyed by entry index.
 * Index bytes are never rewritten once the writer has appended them,
 * so entries never need to be invalidated.
 * Thread-safe for concurrent access.
 */
class IndexCache {
public:
    /**
     * Constructor
     * @param max_entries Maximum number of records to cache (0 disables caching)
     */
    explicit IndexCache(size_t max_entries = 1024);

    /**
     * Get a record from cache
     * @param index Entry index to lookup
     * @return IndexRecord if found, std::nullopt if not in cache
     */
    std::optional<IndexRecord> get(uint64_t index);

    /**
     * Put a record into cache
     */
    void put(uint64_t index, const IndexRecord& record);

    void clear();

    size_t capacity() const { return m_max_entries; }

    struct Stats {
        size_t total_gets = 0;
        size_t cache_hits = 0;
        size_t cache_misses = 0;
        size_t total_puts = 0;
        size_t evictions = 0;
        size_t current_size = 0;

        double hit_rate() const {
            return total_gets > 0 ? static_cast<double>(cache_hits) / total_gets : 0.0;
        }
    };

    Stats getStats() const;

private:
    size_t m_max_entries;

    // Most recently used at front, least recently used at back
    using LRUList = std::list<uint64_t>;
    LRUList m_lru_list;

    struct CacheEntry {
        IndexRecord       record;
        LRUList::iterator lru_iter;
    };
    std::unordered_map<uint64_t, CacheEntry> m_cache;

    // Guards the list, the map and the statistics
    mutable std::mutex m_mutex;
    Stats m_stats;

    void touchEntry(CacheEntry& entry);

    // Caller must hold m_mutex
    void evictIfNeeded();
};

}

#endif
