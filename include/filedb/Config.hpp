#ifndef DIASPORA_FILEDB_CONFIG_HPP
#define DIASPORA_FILEDB_CONFIG_HPP

#include <diaspora/Metadata.hpp>
#include <nlohmann/json.hpp>
#include <cstddef>
#include <string>

namespace filedb {

struct ReaderConfig {
    enum class AccessPattern {
        NORMAL,      // No hint
        RANDOM,      // POSIX_FADV_RANDOM, suits point reads and binary search
        SEQUENTIAL   // POSIX_FADV_SEQUENTIAL, suits batch scans
    };

    size_t        index_cache_entries;  // 0 disables the index cache
    size_t        buffer_pool_buffers;  // Buffers kept per size class
    AccessPattern access_pattern;
    bool          refresh_on_miss;      // Re-stat the index file once on a bound miss

    // Default configuration
    ReaderConfig()
    : index_cache_entries(1024)
    , buffer_pool_buffers(16)
    , access_pattern(AccessPattern::RANDOM)
    , refresh_on_miss(true)
    {}

    // Parse configuration from Diaspora metadata JSON
    static ReaderConfig fromMetadata(const diaspora::Metadata& metadata);

    static ReaderConfig fromJson(const nlohmann::json& json);
};

}

#endif
