#ifndef DIASPORA_FILEDB_DATA_READER_HPP
#define DIASPORA_FILEDB_DATA_READER_HPP

#include <filedb/Config.hpp>
#include <filedb/BufferPool.hpp>
#include <filedb/OffsetCodec.hpp>
#include <filedb/Exception.hpp>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include <cstdint>

namespace filedb {

class IndexCache;

// Suffix appended to the store path to name the blob file
constexpr std::string_view kDataFileSuffix = ".data";

/**
 * One stored entry, as returned by DataReader::read.
 */
struct Entry {
    int64_t           timestamp = 0;
    std::vector<char> payload;
};

/**
 * A contiguous range of entries read with one index read and one blob read.
 * Each payload is a view into `data`, which the batch shares ownership of,
 * so copies of the batch keep the views valid.
 */
struct Batch {
    std::vector<int64_t>                     timestamps;
    std::vector<std::string_view>            payloads;
    std::shared_ptr<const std::vector<char>> data;

    size_t size() const { return timestamps.size(); }
    bool empty() const { return timestamps.empty(); }
};

/**
 * Half-open range of entry indices [begin, end), as passed to readBatch.
 */
struct TimeRange {
    uint64_t begin;
    uint64_t end;
};

/**
 * Outcome of re-statting the index file.
 * When the stat fails `refreshed` is false and `count` is the previous one.
 */
struct LengthRefresh {
    uint64_t count;
    bool     refreshed;
};

/**
 * Read-only view of a time-indexed store made of two files:
 * - <path>:      index file, (location, timestamp) pairs plus a trailing location
 * - <path>.data: blob file, payloads back-to-back
 *
 * All reads are positioned (pread), so a DataReader holds no file cursor and
 * several readers can share the same files with a concurrent appender.
 * A single DataReader is not meant to be used from several threads at once.
 */
class DataReader {
public:
    /**
     * Opens both files read-only and caches the entry count.
     * @param path Path of the index file; the blob file is path + ".data"
     * @param config Reader tuning
     * @throws OpenError if either file cannot be opened
     */
    explicit DataReader(std::string_view path, ReaderConfig config = ReaderConfig{});

    /**
     * Destructor closes both file descriptors
     */
    ~DataReader();

    DataReader(const DataReader&) = delete;
    DataReader& operator=(const DataReader&) = delete;

    DataReader(DataReader&&) noexcept;
    DataReader& operator=(DataReader&&) noexcept;

    /**
     * Release both file descriptors. Any read after close() fails with ReadError,
     * including reads the index cache could serve.
     */
    void close();

    bool isOpen() const { return m_index_fd != -1 && m_data_fd != -1; }

    const std::string& path() const { return m_path; }

    /**
     * Cached entry count. Never touches the disk.
     */
    uint64_t numEntries() const { return m_num_entries; }

    /**
     * Re-stat the index file and update the cached entry count.
     * A failed stat keeps the previous count.
     */
    LengthRefresh refreshEntryCount();

    /**
     * Current number of entries, refreshed from the index file size.
     */
    uint64_t length() { return refreshEntryCount().count; }

    /**
     * Read the timestamp and payload of one entry.
     * @throws OutOfBounds, Corrupted, ReadError
     */
    Entry read(uint64_t index);

    /**
     * Read only the timestamp of one entry (a single 8-byte read).
     * @throws OutOfBounds, ReadError
     */
    int64_t readTimestamp(uint64_t index);

    /**
     * Read entries [start, end).
     * @throws InvalidRange if end <= start, OutOfBounds, Corrupted, ReadError
     */
    Batch readBatch(uint64_t start, uint64_t end);

    /**
     * Index of the first entry whose timestamp is strictly greater than `timestamp`.
     * Timestamps must be non-decreasing for the result to be meaningful.
     * @throws NotInRange (carrying the store's length) if no such entry exists,
     *         OutOfBounds if the store is empty, ReadError
     */
    uint64_t findTime(int64_t timestamp);

    /**
     * [findTime(t1), findTime(t2)), i.e. the entries with t1 < ts <= t2.
     * @throws TimeRangeError wrapping the first failing lookup
     */
    TimeRange findTimeRange(int64_t t1, int64_t t2);

    /**
     * Load the index records of [start, start + count) into the index cache and
     * ask the kernel to read the matching blob span ahead.
     * Clamped to the cached entry count; failures are ignored.
     */
    void prefetch(uint64_t start, size_t count);

    const IndexCache& indexCache() const { return *m_index_cache; }

    const BufferPool& bufferPool() const { return *m_buffer_pool; }

private:
    std::string  m_path;
    ReaderConfig m_config;

    // File descriptors
    int m_index_fd;
    int m_data_fd;

    // Snapshot of the entry count, only updated by refreshEntryCount()
    uint64_t m_num_entries;

    std::unique_ptr<BufferPool> m_buffer_pool;
    std::unique_ptr<IndexCache> m_index_cache;

    void openFiles();

    void closeFiles();

    void adviseAccessPattern(int fd);

    /**
     * Whether the store holds at least `count` entries. Compares against the
     * cached count and, when refresh_on_miss is set, refreshes once on a miss.
     */
    bool hasEntries(uint64_t count);

    /**
     * Throw ReadError if close() was called
     */
    void checkOpen() const;

    /**
     * Throw Corrupted unless [begin, end) lies within the blob file.
     * Runs before any buffer is sized from index locations.
     */
    void checkDataSpan(uint64_t index, uint64_t begin, uint64_t end);

    /**
     * pread exactly `size` bytes of the index file
     */
    void readIndexBytes(char* buffer, size_t size, uint64_t offset);

    /**
     * pread exactly `size` bytes of the blob file; a short read means corruption
     */
    void readDataBytes(char* buffer, size_t size, uint64_t offset);

    /**
     * Read (loc_i, ts_i, loc_{i+1}), checking the cache first
     */
    IndexRecord readIndexRecord(uint64_t index);
};

}

#endif
