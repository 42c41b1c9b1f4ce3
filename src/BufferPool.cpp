#include "filedb/BufferPool.hpp"

namespace filedb {

constexpr size_t BufferPool::SIZE_CLASSES[];

BufferPool::BufferPool(size_t max_buffers_per_class)
    : m_max_buffers_per_class(max_buffers_per_class)
{
}

size_t BufferPool::getSizeClass(size_t size) const {
    for (size_t i = 0; i < NUM_SIZE_CLASSES; ++i) {
        if (size <= SIZE_CLASSES[i]) {
            return i;
        }
    }
    return NUM_SIZE_CLASSES;
}

std::shared_ptr<BufferPool::Buffer> BufferPool::acquire(size_t size) {
    size_t size_class_idx = getSizeClass(size);

    {
        std::lock_guard<std::mutex> lock(m_stats_mutex);
        m_stats.total_acquires++;
    }

    // Too large for pooling, allocate directly
    if (size_class_idx >= NUM_SIZE_CLASSES) {
        {
            std::lock_guard<std::mutex> lock(m_stats_mutex);
            m_stats.cache_misses++;
        }
        auto buffer = std::make_shared<Buffer>(size);
        buffer->data.resize(size);
        return buffer;
    }

    std::unique_ptr<Buffer> buffer;
    {
        std::lock_guard<std::mutex> lock(m_pool_mutexes[size_class_idx]);
        auto& pool = m_pools[size_class_idx];
        if (!pool.empty()) {
            buffer = std::move(pool.back());
            pool.pop_back();
        }
    }

    {
        std::lock_guard<std::mutex> lock(m_stats_mutex);
        if (buffer) {
            m_stats.cache_hits++;
            m_stats.buffers_per_class[size_class_idx]--;
        } else {
            m_stats.cache_misses++;
        }
    }

    if (!buffer) {
        buffer = std::make_unique<Buffer>(SIZE_CLASSES[size_class_idx]);
    }
    buffer->data.resize(size);

    return std::shared_ptr<Buffer>(
        buffer.release(),
        [this, size_class_idx](Buffer* buf) {
            this->release(size_class_idx, std::unique_ptr<Buffer>(buf));
        }
    );
}

void BufferPool::release(size_t size_class_idx, std::unique_ptr<Buffer> buffer) {
    if (!buffer || size_class_idx >= NUM_SIZE_CLASSES) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_stats_mutex);
        m_stats.total_releases++;
    }

    std::lock_guard<std::mutex> lock(m_pool_mutexes[size_class_idx]);
    if (m_pools[size_class_idx].size() < m_max_buffers_per_class) {
        buffer->data.clear();
        m_pools[size_class_idx].push_back(std::move(buffer));

        std::lock_guard<std::mutex> stats_lock(m_stats_mutex);
        m_stats.buffers_per_class[size_class_idx]++;
    }
    // Otherwise the buffer is destroyed here
}

BufferPool::Stats BufferPool::getStats() const {
    std::lock_guard<std::mutex> lock(m_stats_mutex);
    return m_stats;
}

}
