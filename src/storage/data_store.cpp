/**
 * @file data_store.cpp
 * @brief Implementation of the journal data store facade
 */

#include <initiative/storage/data_store.hpp>

#include <initiative/compat/format.hpp>
#include <initiative/integration/logger_adapter.hpp>
#include <initiative/storage/journal_schema.hpp>

#include <sqlite3.h>

#include <utility>

namespace initiative::storage {

using integration::logger_adapter;

// ============================================================================
// Construction / Destruction
// ============================================================================

auto data_store::open(std::string_view db_path)
    -> Result<std::unique_ptr<data_store>> {
    return open(db_path, store_config{});
}

auto data_store::open(std::string_view db_path, const store_config& config)
    -> Result<std::unique_ptr<data_store>> {
    sqlite3* db = nullptr;

    auto rc = sqlite3_open(std::string(db_path).c_str(), &db);
    if (rc != SQLITE_OK) {
        std::string error_msg =
            db ? sqlite3_errmsg(db) : "Failed to allocate memory";
        if (db) {
            sqlite3_close(db);
        }
        logger_adapter::error("Failed to open journal store {}: {}", db_path,
                              error_msg);
        return store_error<std::unique_ptr<data_store>>(
            error_codes::database_open_error,
            initiative::compat::format("Failed to open database: {}", error_msg));
    }

    // Owns the handle from here on
    auto instance =
        std::unique_ptr<data_store>(new data_store(db, std::string(db_path)));

    auto pragma = [db](const std::string& sql) {
        return sqlite3_exec(db, sql.c_str(), nullptr, nullptr, nullptr);
    };

    if (pragma("PRAGMA foreign_keys = ON;") != SQLITE_OK) {
        return store_error<std::unique_ptr<data_store>>(
            error_codes::database_open_error, "Failed to enable foreign keys");
    }

    // WAL is not available for in-memory databases
    if (config.wal_mode && db_path != ":memory:") {
        if (pragma("PRAGMA journal_mode = WAL;") != SQLITE_OK) {
            return store_error<std::unique_ptr<data_store>>(
                error_codes::database_open_error, "Failed to enable WAL mode");
        }
    }

    // Negative value means KB
    if (pragma(initiative::compat::format("PRAGMA cache_size = -{};",
                                          config.cache_size_mb * 1024)) != SQLITE_OK) {
        return store_error<std::unique_ptr<data_store>>(
            error_codes::database_open_error, "Failed to set cache size");
    }

    if (sqlite3_busy_timeout(db, config.busy_timeout_ms) != SQLITE_OK) {
        return store_error<std::unique_ptr<data_store>>(
            error_codes::database_open_error, "Failed to set busy timeout");
    }

    auto target = config.target_version == 0
                      ? instance->migration_runner_.get_latest_version()
                      : config.target_version;

    auto migration_result =
        instance->migration_runner_.run_migrations_to(db, target);
    if (migration_result.is_err()) {
        logger_adapter::error("Journal store {} was not opened: {}", db_path,
                              migration_result.error().message);
        return store_error<std::unique_ptr<data_store>>(
            migration_result.error().code,
            initiative::compat::format("Migration failed: {}",
                                       migration_result.error().message));
    }

    logger_adapter::info("Opened journal store {} at schema version {}", db_path,
                         instance->current_version());

    return instance;
}

data_store::data_store(sqlite3* db, std::string path)
    : db_(db),
      path_(std::move(path)),
      migration_runner_(make_journal_schema()),
      things_(db),
      key_values_(db) {}

data_store::~data_store() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

// ============================================================================
// Thing Accessors
// ============================================================================

auto data_store::get_all_things() const -> std::vector<thing_record> {
    auto result = things_.find_all();
    if (result.is_err()) {
        logger_adapter::debug("get_all_things failed: {}", result.error().message);
        return {};
    }
    return std::move(result.value());
}

auto data_store::get_thing(std::string_view uuid) const
    -> std::optional<thing_record> {
    auto result = things_.find_by_uuid(uuid);
    if (result.is_err()) {
        logger_adapter::debug("get_thing({}) failed: {}", uuid,
                              result.error().message);
        return std::nullopt;
    }
    return std::move(result.value());
}

auto data_store::get_thing_by_name(std::string_view name) const
    -> std::optional<thing_record> {
    auto result = things_.find_by_name(name);
    if (result.is_err()) {
        logger_adapter::debug("get_thing_by_name({}) failed: {}", name,
                              result.error().message);
        return std::nullopt;
    }
    return std::move(result.value());
}

auto data_store::save_thing(const thing_record& record) -> bool {
    auto result = things_.save(record);
    if (result.is_err()) {
        logger_adapter::debug("save_thing({}) failed: {}", record.uuid,
                              result.error().message);
        return false;
    }
    return true;
}

auto data_store::delete_thing(std::string_view uuid) -> bool {
    auto result = things_.remove(uuid);
    if (result.is_err()) {
        logger_adapter::debug("delete_thing({}) failed: {}", uuid,
                              result.error().message);
        return false;
    }
    return true;
}

auto data_store::delete_thing_by_name(std::string_view name)
    -> std::optional<thing_record> {
    auto result = things_.remove_by_name(name);
    if (result.is_err()) {
        logger_adapter::debug("delete_thing_by_name({}) failed: {}", name,
                              result.error().message);
        return std::nullopt;
    }
    return std::move(result.value());
}

// ============================================================================
// Setting Accessors
// ============================================================================

auto data_store::get_value(std::string_view key) const
    -> std::optional<nlohmann::json> {
    auto result = key_values_.find(key);
    if (result.is_err()) {
        logger_adapter::debug("get_value({}) failed: {}", key,
                              result.error().message);
        return std::nullopt;
    }
    return std::move(result.value());
}

auto data_store::set_value(std::string_view key, const nlohmann::json& value)
    -> bool {
    auto result = key_values_.put(key, value);
    if (result.is_err()) {
        logger_adapter::debug("set_value({}) failed: {}", key,
                              result.error().message);
        return false;
    }
    return true;
}

auto data_store::delete_value(std::string_view key) -> bool {
    auto result = key_values_.remove(key);
    if (result.is_err()) {
        logger_adapter::debug("delete_value({}) failed: {}", key,
                              result.error().message);
        return false;
    }
    return true;
}

// ============================================================================
// Typed Access
// ============================================================================

auto data_store::current_version() const -> int {
    return migration_runner_.get_current_version(db_);
}

auto data_store::history() const -> std::vector<migration_record> {
    return migration_runner_.get_history(db_);
}

}  // namespace initiative::storage
