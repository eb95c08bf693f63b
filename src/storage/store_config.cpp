/**
 * @file store_config.cpp
 * @brief JSON loader for store configuration
 */

#include <initiative/storage/store_config.hpp>

#include <initiative/compat/format.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <fstream>
#include <string>

using json = nlohmann::json;

namespace initiative::storage {

namespace {

// 1 TiB; keeps the page cache pragma within range
constexpr std::uint64_t max_cache_size_mb = 1024 * 1024;

}  // namespace

auto load_store_config(std::string_view path) -> Result<store_config> {
    std::ifstream file{std::string(path)};
    if (!file.is_open()) {
        return store_error<store_config>(
            error_codes::config_file_not_found,
            initiative::compat::format("Failed to open configuration file: {}", path));
    }

    store_config config;

    try {
        json config_json;
        file >> config_json;

        if (!config_json.is_object()) {
            return store_error<store_config>(
                error_codes::config_parse_error,
                "Configuration root must be a JSON object");
        }

        if (config_json.contains("store")) {
            const auto& store = config_json["store"];
            if (!store.is_object()) {
                return store_error<store_config>(error_codes::config_parse_error,
                                                 "\"store\" must be a JSON object");
            }

            if (store.contains("wal_mode")) {
                config.wal_mode = store["wal_mode"].get<bool>();
            }

            if (store.contains("cache_size_mb")) {
                const auto& cache_size = store["cache_size_mb"];
                if (!cache_size.is_number_unsigned() ||
                    cache_size.get<std::uint64_t>() > max_cache_size_mb) {
                    return store_error<store_config>(
                        error_codes::config_parse_error,
                        initiative::compat::format(
                            "cache_size_mb must be an integer in 0..{}",
                            max_cache_size_mb));
                }
                config.cache_size_mb = cache_size.get<std::size_t>();
            }

            if (store.contains("busy_timeout_ms")) {
                config.busy_timeout_ms = store["busy_timeout_ms"].get<int>();
            }

            if (store.contains("target_version")) {
                config.target_version = store["target_version"].get<int>();
            }
        }
    } catch (const json::exception& ex) {
        return store_error<store_config>(
            error_codes::config_parse_error,
            initiative::compat::format("JSON parsing error: {}", ex.what()));
    }

    if (config.target_version < 0) {
        return store_error<store_config>(error_codes::config_parse_error,
                                         "target_version must not be negative");
    }

    return config;
}

}  // namespace initiative::storage
