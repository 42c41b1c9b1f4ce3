#ifndef DIASPORA_FILEDB_BUFFER_POOL_HPP
#define DIASPORA_FILEDB_BUFFER_POOL_HPP

#include <vector>
#include <memory>
#include <mutex>
#include <array>
#include <cstdint>

namespace filedb {

/**
 * Thread-safe pool of reusable scratch buffers.
 * Uses size classes to reduce fragmentation: 4KB, 64KB, 1MB, 16MB.
 * Buffers acquired from the pool must not outlive it.
 */
class BufferPool {
public:
    struct Buffer {
        std::vector<char> data;

        explicit Buffer(size_t cap) {
            data.reserve(cap);
        }
    };

    /**
     * Constructor
     * @param max_buffers_per_class Maximum number of buffers to keep per size class
     */
    explicit BufferPool(size_t max_buffers_per_class = 16);

    BufferPool(const BufferPool&) = delete;
    BufferPool& operator=(const BufferPool&) = delete;

    /**
     * Acquire a buffer whose data holds exactly `size` bytes.
     * The buffer goes back to the pool when the last reference is dropped.
     */
    std::shared_ptr<Buffer> acquire(size_t size);

    struct Stats {
        size_t total_acquires = 0;
        size_t total_releases = 0;
        size_t cache_hits = 0;
        size_t cache_misses = 0;
        std::array<size_t, 4> buffers_per_class = {0, 0, 0, 0};
    };

    Stats getStats() const;

private:
    static constexpr size_t SIZE_CLASSES[] = {
        4 * 1024,        // 4KB
        64 * 1024,       // 64KB
        1024 * 1024,     // 1MB
        16 * 1024 * 1024 // 16MB
    };
    static constexpr size_t NUM_SIZE_CLASSES = 4;

    size_t m_max_buffers_per_class;

    std::array<std::vector<std::unique_ptr<Buffer>>, NUM_SIZE_CLASSES> m_pools;
    std::array<std::mutex, NUM_SIZE_CLASSES> m_pool_mutexes;

    mutable std::mutex m_stats_mutex;
    Stats m_stats;

    /**
     * @return Index of size class, or NUM_SIZE_CLASSES if too large
     */
    size_t getSizeClass(size_t size) const;

    void release(size_t size_class_idx, std::unique_ptr<Buffer> buffer);
};

}

#endif
