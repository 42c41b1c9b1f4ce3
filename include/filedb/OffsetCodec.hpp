#ifndef DIASPORA_FILEDB_OFFSET_CODEC_HPP
#define DIASPORA_FILEDB_OFFSET_CODEC_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace filedb {

/**
 * Layout of the index file, all values 64-bit little-endian:
 *
 *   loc_0, ts_0, loc_1, ts_1, ..., loc_{N-1}, ts_{N-1}, loc_N
 *
 * loc_i is where entry i's payload starts in the blob file, and the
 * unpaired trailing loc_N is where the next payload will start.
 * Entry i's payload is blob[loc_i, loc_{i+1}). File size is 16*N + 8.
 *
 * Nothing in this header validates what it decodes.
 */

constexpr size_t kValueBytes   = 8;
constexpr size_t kRecordStride = 2 * kValueBytes;              // (loc, ts)
constexpr size_t kHeaderBytes  = kValueBytes;                  // trailing loc
constexpr size_t kSingleBytes  = kRecordStride + kValueBytes;  // (loc, ts, next loc)

/**
 * One decoded entry of the index file.
 */
struct IndexRecord {
    uint64_t location;       // start of the payload in the blob file
    int64_t  timestamp;
    uint64_t next_location;  // end of the payload (start of the next one)

    uint64_t payloadSize() const { return next_location - location; }
};

inline uint64_t readUint64Le(const void* buffer) {
    const uint8_t* ptr = static_cast<const uint8_t*>(buffer);
    return static_cast<uint64_t>(ptr[0]) |
           (static_cast<uint64_t>(ptr[1]) << 8) |
           (static_cast<uint64_t>(ptr[2]) << 16) |
           (static_cast<uint64_t>(ptr[3]) << 24) |
           (static_cast<uint64_t>(ptr[4]) << 32) |
           (static_cast<uint64_t>(ptr[5]) << 40) |
           (static_cast<uint64_t>(ptr[6]) << 48) |
           (static_cast<uint64_t>(ptr[7]) << 56);
}

inline void writeUint64Le(void* buffer, uint64_t value) {
    uint8_t* ptr = static_cast<uint8_t*>(buffer);
    for (size_t i = 0; i < kValueBytes; ++i) {
        ptr[i] = static_cast<uint8_t>(value >> (8 * i));
    }
}

/**
 * Byte offset of entry `index` in the index file.
 */
inline uint64_t recordOffset(uint64_t index) {
    return index * kRecordStride;
}

/**
 * Number of complete entries described by an index file of `file_size` bytes.
 * A file shorter than the trailing location holds no entries.
 */
inline uint64_t entryCountForSize(uint64_t file_size) {
    if (file_size < kHeaderBytes) return 0;
    return (file_size - kHeaderBytes) / kRecordStride;
}

/**
 * Decode (loc_i, ts_i, loc_{i+1}) from the 24 bytes at offset 16*i.
 */
IndexRecord decodeSingle(const char* bytes);

/**
 * Decode the 8 bytes at offset 16*i + 8.
 */
int64_t decodeTimestamp(const char* bytes);

/**
 * Decode `count` interleaved (loc, ts) pairs followed by one trailing loc.
 * `bytes` must hold 16*count + 8 bytes. On return `locations` has
 * count + 1 values and `timestamps` has count values.
 */
void decodeBatch(const char* bytes, size_t count,
                 std::vector<uint64_t>& locations,
                 std::vector<int64_t>& timestamps);

/**
 * Initial content of an empty index file.
 */
std::array<char, kHeaderBytes> encodeHeader(uint64_t first_location);

/**
 * The 16 bytes appended to the index file for one new entry:
 * its timestamp, then the new trailing location.
 */
std::array<char, kRecordStride> encodeEntry(int64_t timestamp, uint64_t next_location);

}

#endif
