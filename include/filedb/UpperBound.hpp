#ifndef DIASPORA_FILEDB_UPPER_BOUND_HPP
#define DIASPORA_FILEDB_UPPER_BOUND_HPP

#include <cstdint>

namespace filedb {

/**
 * Narrow [left, right] down to adjacent indices, given
 * timestamp_at(left) <= timestamp < timestamp_at(right), and return right.
 * Each step reads one timestamp and keeps the bracket; on_step(left, right)
 * is called after every narrowing.
 */
template <typename TimestampAt, typename OnStep>
uint64_t narrowUpperBound(uint64_t left, uint64_t right, int64_t timestamp,
                          TimestampAt&& timestamp_at, OnStep&& on_step) {
    while (right - left > 1) {
        uint64_t mid = left + (right - left) / 2;
        if (timestamp_at(mid) <= timestamp) {
            left = mid;
        } else {
            right = mid;
        }
        on_step(left, right);
    }
    return right;
}

template <typename TimestampAt>
uint64_t narrowUpperBound(uint64_t left, uint64_t right, int64_t timestamp,
                          TimestampAt&& timestamp_at) {
    return narrowUpperBound(left, right, timestamp, timestamp_at,
                            [](uint64_t, uint64_t) {});
}

}

#endif
