#include "filedb/Config.hpp"
#include "filedb/Exception.hpp"

namespace filedb {

ReaderConfig ReaderConfig::fromMetadata(const diaspora::Metadata& metadata) {
    return fromJson(metadata.json());
}

ReaderConfig ReaderConfig::fromJson(const nlohmann::json& json) {
    ReaderConfig config;

    if (!json.is_object()) {
        throw Exception{"ReaderConfig metadata should be a JSON object"};
    }

    try {
        if (json.contains("index_cache_entries")) {
            config.index_cache_entries = json["index_cache_entries"].get<size_t>();
        }

        if (json.contains("buffer_pool_buffers")) {
            config.buffer_pool_buffers = json["buffer_pool_buffers"].get<size_t>();
        }

        if (json.contains("refresh_on_miss")) {
            config.refresh_on_miss = json["refresh_on_miss"].get<bool>();
        }

        if (json.contains("access_pattern")) {
            std::string pattern = json["access_pattern"].get<std::string>();
            if (pattern == "normal") {
                config.access_pattern = AccessPattern::NORMAL;
            } else if (pattern == "random") {
                config.access_pattern = AccessPattern::RANDOM;
            } else if (pattern == "sequential") {
                config.access_pattern = AccessPattern::SEQUENTIAL;
            } else {
                throw Exception{
                    "Invalid access_pattern: " + pattern +
                    ". Valid values are: normal, random, sequential"
                };
            }
        }

    } catch (const nlohmann::json::exception& e) {
        throw Exception{
            "Invalid type in ReaderConfig metadata: " + std::string(e.what())
        };
    }

    return config;
}

}
