/**
 * @file store_config.hpp
 * @brief Configuration for opening a journal store
 */

#pragma once

#include <initiative/core/result.hpp>

#include <cstddef>
#include <string_view>

namespace initiative::storage {

/**
 * @brief Configuration for a journal data store
 *
 * Allows customization of SQLite behavior and of the schema version the
 * store is migrated to on open.
 */
struct store_config {
    /// Enable WAL (Write-Ahead Logging) mode; ignored for in-memory stores
    bool wal_mode = true;

    /// Cache size in megabytes (default: 16 MB)
    std::size_t cache_size_mb = 16;

    /// Milliseconds to wait on a locked database before failing
    int busy_timeout_ms = 5000;

    /// Schema version to migrate to; 0 selects the latest version
    int target_version = 0;
};

/**
 * @brief Load a store configuration from a JSON file
 *
 * Reads the optional "store" object of the file:
 * @code
 * {
 *   "store": {
 *     "wal_mode": true,
 *     "cache_size_mb": 16,
 *     "busy_timeout_ms": 5000,
 *     "target_version": 7
 *   }
 * }
 * @endcode
 * Keys that are absent keep their defaults.
 *
 * @return The configuration, config_file_not_found when the file cannot be
 *         opened, or config_parse_error for malformed JSON or a value of
 *         the wrong type
 */
[[nodiscard]] auto load_store_config(std::string_view path) -> Result<store_config>;

}  // namespace initiative::storage
