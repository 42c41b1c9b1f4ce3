#include "filedb/OffsetCodec.hpp"

namespace filedb {

IndexRecord decodeSingle(const char* bytes) {
    IndexRecord record;
    record.location      = readUint64Le(bytes);
    record.timestamp     = static_cast<int64_t>(readUint64Le(bytes + kValueBytes));
    record.next_location = readUint64Le(bytes + kRecordStride);
    return record;
}

int64_t decodeTimestamp(const char* bytes) {
    return static_cast<int64_t>(readUint64Le(bytes));
}

void decodeBatch(const char* bytes, size_t count,
                 std::vector<uint64_t>& locations,
                 std::vector<int64_t>& timestamps) {
    locations.resize(count + 1);
    timestamps.resize(count);

    const char* ptr = bytes;
    for (size_t i = 0; i < count; ++i) {
        locations[i]  = readUint64Le(ptr);
        timestamps[i] = static_cast<int64_t>(readUint64Le(ptr + kValueBytes));
        ptr += kRecordStride;
    }
    // Trailing location has no paired timestamp
    locations[count] = readUint64Le(ptr);
}

std::array<char, kHeaderBytes> encodeHeader(uint64_t first_location) {
    std::array<char, kHeaderBytes> out;
    writeUint64Le(out.data(), first_location);
    return out;
}

std::array<char, kRecordStride> encodeEntry(int64_t timestamp, uint64_t next_location) {
    std::array<char, kRecordStride> out;
    writeUint64Le(out.data(), static_cast<uint64_t>(timestamp));
    writeUint64Le(out.data() + kValueBytes, next_location);
    return out;
}

}
