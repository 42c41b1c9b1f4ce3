#include "filedb/DataReader.hpp"
#include "filedb/UpperBound.hpp"
#include <spdlog/spdlog.h>

namespace filedb {

uint64_t DataReader::findTime(int64_t timestamp) {
    // Throws OutOfBounds when the store is empty
    int64_t left_ts = readTimestamp(0);
    if (left_ts > timestamp) {
        return 0;
    }

    const uint64_t count = length();
    if (count == 0) {
        throw OutOfBounds{"Cannot search an empty store: " + m_path};
    }

    uint64_t left = 0;
    uint64_t right = count - 1;
    int64_t right_ts = readTimestamp(right);
    if (right_ts <= timestamp) {
        throw NotInRange{
            "Timestamp " + std::to_string(timestamp) + " is not within range: last entry has " +
            std::to_string(right_ts),
            count
        };
    }

    // Invariant: ts[left] <= timestamp < ts[right]
    return narrowUpperBound(left, right, timestamp,
                            [this](uint64_t index) { return readTimestamp(index); });
}

TimeRange DataReader::findTimeRange(int64_t t1, int64_t t2) {
    TimeRange range{0, 0};

    try {
        range.begin = findTime(t1);
    } catch (const NotInRange& e) {
        throw TimeRangeError{e.what(), e.index(), std::nullopt, std::current_exception()};
    } catch (const Exception& e) {
        throw TimeRangeError{e.what(), std::nullopt, std::nullopt, std::current_exception()};
    }

    try {
        range.end = findTime(t2);
    } catch (const NotInRange& e) {
        throw TimeRangeError{e.what(), range.begin, e.index(), std::current_exception()};
    } catch (const Exception& e) {
        throw TimeRangeError{e.what(), range.begin, std::nullopt, std::current_exception()};
    }

    spdlog::debug("[filedb] Time range ({}, {}] of {} maps to [{}, {})",
                  t1, t2, m_path, range.begin, range.end);
    return range;
}

}
