#include "filedb/DataReader.hpp"
#include "filedb/IndexCache.hpp"
#include <spdlog/spdlog.h>
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include <cerrno>
#include <cstring>
#include <algorithm>
#include <limits>

namespace filedb {

DataReader::DataReader(std::string_view path, ReaderConfig config)
: m_path(path)
, m_config(std::move(config))
, m_index_fd(-1)
, m_data_fd(-1)
, m_num_entries(0)
, m_buffer_pool(std::make_unique<BufferPool>(m_config.buffer_pool_buffers))
, m_index_cache(std::make_unique<IndexCache>(m_config.index_cache_entries))
{
    openFiles();
    refreshEntryCount();
    spdlog::debug("[filedb] Opened store {} with {} entries", m_path, m_num_entries);
}

DataReader::~DataReader() {
    closeFiles();
}

DataReader::DataReader(DataReader&& other) noexcept
: m_path(std::move(other.m_path))
, m_config(other.m_config)
, m_index_fd(other.m_index_fd)
, m_data_fd(other.m_data_fd)
, m_num_entries(other.m_num_entries)
, m_buffer_pool(std::move(other.m_buffer_pool))
, m_index_cache(std::move(other.m_index_cache))
{
    other.m_index_fd = -1;
    other.m_data_fd = -1;
    other.m_num_entries = 0;
}

DataReader& DataReader::operator=(DataReader&& other) noexcept {
    if (this != &other) {
        closeFiles();

        m_path = std::move(other.m_path);
        m_config = other.m_config;
        m_index_fd = other.m_index_fd;
        m_data_fd = other.m_data_fd;
        m_num_entries = other.m_num_entries;
        m_buffer_pool = std::move(other.m_buffer_pool);
        m_index_cache = std::move(other.m_index_cache);

        other.m_index_fd = -1;
        other.m_data_fd = -1;
        other.m_num_entries = 0;
    }
    return *this;
}

void DataReader::openFiles() {
    std::string data_path = m_path + std::string{kDataFileSuffix};

    m_index_fd = ::open(m_path.c_str(), O_RDONLY | O_CLOEXEC);
    if (m_index_fd == -1) {
        throw OpenError{
            "Failed to open index file at " + m_path +
            ": " + std::string(strerror(errno))
        };
    }

    m_data_fd = ::open(data_path.c_str(), O_RDONLY | O_CLOEXEC);
    if (m_data_fd == -1) {
        int err = errno;
        ::close(m_index_fd);
        m_index_fd = -1;
        throw OpenError{
            "Failed to open data file at " + data_path +
            ": " + std::string(strerror(err))
        };
    }

    adviseAccessPattern(m_index_fd);
    adviseAccessPattern(m_data_fd);
}

void DataReader::adviseAccessPattern(int fd) {
    int advice = POSIX_FADV_NORMAL;
    switch (m_config.access_pattern) {
        case ReaderConfig::AccessPattern::RANDOM:     advice = POSIX_FADV_RANDOM; break;
        case ReaderConfig::AccessPattern::SEQUENTIAL: advice = POSIX_FADV_SEQUENTIAL; break;
        case ReaderConfig::AccessPattern::NORMAL:     return;
    }
    // posix_fadvise returns the error number instead of setting errno
    int err = posix_fadvise(fd, 0, 0, advice);
    if (err != 0) {
        spdlog::debug("[filedb] posix_fadvise failed on {}: {}", m_path, strerror(err));
    }
}

void DataReader::closeFiles() {
    if (m_index_fd != -1) {
        ::close(m_index_fd);
        m_index_fd = -1;
    }
    if (m_data_fd != -1) {
        ::close(m_data_fd);
        m_data_fd = -1;
    }
}

void DataReader::close() {
    closeFiles();
    spdlog::debug("[filedb] Closed store {}", m_path);
}

LengthRefresh DataReader::refreshEntryCount() {
    struct stat index_st;
    if (fstat(m_index_fd, &index_st) == -1) {
        spdlog::warn("[filedb] Failed to stat index file {}: {}; keeping entry count {}",
                     m_path, strerror(errno), m_num_entries);
        return LengthRefresh{m_num_entries, false};
    }
    m_num_entries = entryCountForSize(static_cast<uint64_t>(index_st.st_size));
    return LengthRefresh{m_num_entries, true};
}

bool DataReader::hasEntries(uint64_t count) {
    if (count <= m_num_entries) return true;
    if (!m_config.refresh_on_miss) return false;
    return count <= length();
}

void DataReader::checkOpen() const {
    if (!isOpen()) {
        throw ReadError{"Store " + m_path + " is closed"};
    }
}

void DataReader::checkDataSpan(uint64_t index, uint64_t begin, uint64_t end) {
    if (begin > end) {
        spdlog::error("[filedb] Entry {} of {} has location {} past its end {}",
                      index, m_path, begin, end);
        throw Corrupted{
            "File corrupted: entry " + std::to_string(index) + " of " + m_path +
            " starts at " + std::to_string(begin) + " but ends at " + std::to_string(end)
        };
    }
    struct stat data_st;
    if (fstat(m_data_fd, &data_st) == -1) {
        throw ReadError{
            "Failed to stat data file " + m_path + std::string{kDataFileSuffix} +
            ": " + std::string(strerror(errno))
        };
    }
    const uint64_t data_size = static_cast<uint64_t>(data_st.st_size);
    if (end > data_size) {
        spdlog::error("[filedb] Index of {} points beyond the end of its data file", m_path);
        throw Corrupted{
            "Corrupted data index: entry " + std::to_string(index) + " of " + m_path +
            " ends at " + std::to_string(end) + ", data file holds " +
            std::to_string(data_size) + " bytes"
        };
    }
}

void DataReader::readIndexBytes(char* buffer, size_t size, uint64_t offset) {
    ssize_t bytes_read = pread(m_index_fd, buffer, size, static_cast<off_t>(offset));
    if (bytes_read == -1) {
        throw ReadError{
            "Failed to read index file " + m_path + ": " + std::string(strerror(errno))
        };
    }
    if (bytes_read != static_cast<ssize_t>(size)) {
        throw ReadError{
            "Failed to read index file " + m_path + ": read " + std::to_string(bytes_read) +
            " bytes at offset " + std::to_string(offset) +
            ", expected " + std::to_string(size)
        };
    }
}

void DataReader::readDataBytes(char* buffer, size_t size, uint64_t offset) {
    ssize_t bytes_read = pread(m_data_fd, buffer, size, static_cast<off_t>(offset));
    if (bytes_read == -1) {
        throw ReadError{
            "Failed to read data file " + m_path + std::string{kDataFileSuffix} +
            ": " + std::string(strerror(errno))
        };
    }
    if (bytes_read != static_cast<ssize_t>(size)) {
        // The writer appends payload bytes before the index entry that covers them
        spdlog::error("[filedb] Index of {} points beyond the end of its data file", m_path);
        throw Corrupted{
            "Corrupted data index of " + m_path + ": span [" + std::to_string(offset) + ", " +
            std::to_string(offset + size) + ") points beyond end of file, read " +
            std::to_string(bytes_read) + " bytes"
        };
    }
}

IndexRecord DataReader::readIndexRecord(uint64_t index) {
    auto cached = m_index_cache->get(index);
    if (cached.has_value()) {
        return cached.value();
    }

    char buffer[kSingleBytes];
    readIndexBytes(buffer, sizeof(buffer), recordOffset(index));
    IndexRecord record = decodeSingle(buffer);

    m_index_cache->put(index, record);
    return record;
}

Entry DataReader::read(uint64_t index) {
    checkOpen();
    if (index == std::numeric_limits<uint64_t>::max() || !hasEntries(index + 1)) {
        throw OutOfBounds{
            "Index out of bounds: " + std::to_string(index) +
            ", num_entries: " + std::to_string(m_num_entries)
        };
    }

    IndexRecord record = readIndexRecord(index);
    checkDataSpan(index, record.location, record.next_location);

    Entry entry;
    entry.timestamp = record.timestamp;
    if (record.location == record.next_location) {
        return entry;  // Empty payload
    }

    entry.payload.resize(record.payloadSize());
    readDataBytes(entry.payload.data(), entry.payload.size(), record.location);
    return entry;
}

int64_t DataReader::readTimestamp(uint64_t index) {
    checkOpen();
    if (index == std::numeric_limits<uint64_t>::max() || !hasEntries(index + 1)) {
        throw OutOfBounds{
            "Index out of bounds: " + std::to_string(index) +
            ", num_entries: " + std::to_string(m_num_entries)
        };
    }

    char buffer[kValueBytes];
    readIndexBytes(buffer, sizeof(buffer), recordOffset(index) + kValueBytes);
    return decodeTimestamp(buffer);
}

Batch DataReader::readBatch(uint64_t start, uint64_t end) {
    checkOpen();
    if (end <= start) {
        throw InvalidRange{
            "Invalid batch range [" + std::to_string(start) + ", " +
            std::to_string(end) + "): end must be greater than start"
        };
    }
    if (!hasEntries(end)) {
        throw OutOfBounds{
            "Batch end out of bounds: " + std::to_string(end) +
            ", num_entries: " + std::to_string(m_num_entries)
        };
    }

    const size_t count = static_cast<size_t>(end - start);
    const size_t index_bytes = count * kRecordStride + kHeaderBytes;

    Batch batch;
    std::vector<uint64_t> locations;
    {
        // One read for the whole index span, decoded out of a pooled buffer
        auto scratch = m_buffer_pool->acquire(index_bytes);
        readIndexBytes(scratch->data.data(), index_bytes, recordOffset(start));
        decodeBatch(scratch->data.data(), count, locations, batch.timestamps);
    }

    // Checking every span also covers locations.front() <= locations.back()
    for (size_t i = 0; i < count; ++i) {
        if (locations[i] > locations[i + 1]) {
            spdlog::error("[filedb] Entry {} of {} has location {} past its end {}",
                          start + i, m_path, locations[i], locations[i + 1]);
            throw Corrupted{
                "File corrupted: entry " + std::to_string(start + i) + " of " + m_path +
                " starts at " + std::to_string(locations[i]) + " but ends at " +
                std::to_string(locations[i + 1])
            };
        }
    }
    checkDataSpan(end - 1, locations.front(), locations.back());

    const uint64_t first = locations.front();
    auto data = std::make_shared<std::vector<char>>(locations.back() - first);
    if (!data->empty()) {
        readDataBytes(data->data(), data->size(), first);
    }

    batch.payloads.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        batch.payloads.emplace_back(data->data() + (locations[i] - first),
                                    locations[i + 1] - locations[i]);
    }
    batch.data = std::move(data);

    return batch;
}

void DataReader::prefetch(uint64_t start, size_t count) {
    if (count == 0 || start >= m_num_entries) {
        return;
    }
    count = static_cast<size_t>(std::min<uint64_t>(count, m_num_entries - start));

    const size_t index_bytes = count * kRecordStride + kHeaderBytes;
    auto scratch = m_buffer_pool->acquire(index_bytes);
    ssize_t bytes_read = pread(m_index_fd, scratch->data.data(), index_bytes,
                               static_cast<off_t>(recordOffset(start)));
    if (bytes_read != static_cast<ssize_t>(index_bytes)) {
        spdlog::debug("[filedb] Prefetch of {} entries at {} in {} skipped", count, start, m_path);
        return;
    }

    std::vector<uint64_t> locations;
    std::vector<int64_t> timestamps;
    decodeBatch(scratch->data.data(), count, locations, timestamps);

    for (size_t i = 0; i < count; ++i) {
        if (locations[i] > locations[i + 1]) return;  // Left for read() to report
        m_index_cache->put(start + i, IndexRecord{locations[i], timestamps[i], locations[i + 1]});
    }

    const uint64_t span = locations[count] - locations[0];
    if (span == 0) return;
#ifdef __linux__
    if (readahead(m_data_fd, static_cast<off64_t>(locations[0]), span) == -1) {
        spdlog::debug("[filedb] readahead failed on {}: {}", m_path, strerror(errno));
    }
#else
    posix_fadvise(m_data_fd, static_cast<off_t>(locations[0]), static_cast<off_t>(span),
                  POSIX_FADV_WILLNEED);
#endif
}

}
