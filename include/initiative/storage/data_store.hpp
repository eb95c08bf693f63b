/**
 * @file data_store.hpp
 * @brief Journal data store facade
 *
 * This file provides the data_store class that opens a SQLite journal,
 * migrates it to the requested schema version and exposes the accessors
 * used by the application. Accessor errors are logged and flattened to
 * false or std::nullopt; the typed repositories stay reachable for callers
 * that need the error codes.
 */

#pragma once

#include <initiative/core/result.hpp>
#include <initiative/storage/key_value_repository.hpp>
#include <initiative/storage/migration_record.hpp>
#include <initiative/storage/migration_runner.hpp>
#include <initiative/storage/store_config.hpp>
#include <initiative/storage/thing_record.hpp>
#include <initiative/storage/thing_repository.hpp>

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Forward declaration of SQLite handle
struct sqlite3;

namespace initiative::storage {

/**
 * @brief Journal store over a migrated SQLite database
 *
 * Thread Safety: This class is NOT thread-safe. The store is opened once
 * and then used from a single logical writer.
 *
 * @example
 * @code
 * auto store = data_store::open("journal.db");
 * if (store.is_err()) {
 *     // migration or open failure, no handle
 * }
 * auto& db = *store.value();
 * db.set_value("time", "1:08:00:00");
 * for (const auto& thing : db.get_all_things()) {
 *     ...
 * }
 * @endcode
 */
class data_store {
public:
    /**
     * @brief Open a store with default configuration
     *
     * @param db_path Path to the database file, or ":memory:"
     */
    [[nodiscard]] static auto open(std::string_view db_path)
        -> Result<std::unique_ptr<data_store>>;

    /**
     * @brief Open a store and migrate it to the configured version
     *
     * A migration failure closes the connection and returns the error.
     *
     * @param db_path Path to the database file, or ":memory:"
     * @param config Connection settings and target schema version
     */
    [[nodiscard]] static auto open(std::string_view db_path,
                                   const store_config& config)
        -> Result<std::unique_ptr<data_store>>;

    /**
     * @brief Destructor - closes database connection
     */
    ~data_store();

    data_store(const data_store&) = delete;
    auto operator=(const data_store&) -> data_store& = delete;
    data_store(data_store&&) = delete;
    auto operator=(data_store&&) -> data_store& = delete;

    // ========================================================================
    // Thing Accessors
    // ========================================================================

    /**
     * @brief Every saved thing, or an empty list on a storage fault
     */
    [[nodiscard]] auto get_all_things() const -> std::vector<thing_record>;

    [[nodiscard]] auto get_thing(std::string_view uuid) const
        -> std::optional<thing_record>;

    /**
     * @brief Thing whose name matches ignoring ASCII case
     */
    [[nodiscard]] auto get_thing_by_name(std::string_view name) const
        -> std::optional<thing_record>;

    /**
     * @brief Insert or replace a thing
     *
     * @return false on a storage fault or when another thing already uses
     *         the name; the stored record is then unchanged
     */
    [[nodiscard]] auto save_thing(const thing_record& record) -> bool;

    /**
     * @brief Delete a thing; true also when it did not exist
     */
    [[nodiscard]] auto delete_thing(std::string_view uuid) -> bool;

    /**
     * @brief Delete the thing whose name matches ignoring ASCII case
     *
     * @return The deleted record, std::nullopt when no name matches or on a
     *         storage fault
     */
    [[nodiscard]] auto delete_thing_by_name(std::string_view name)
        -> std::optional<thing_record>;

    // ========================================================================
    // Setting Accessors
    // ========================================================================

    [[nodiscard]] auto get_value(std::string_view key) const
        -> std::optional<nlohmann::json>;

    [[nodiscard]] auto set_value(std::string_view key, const nlohmann::json& value)
        -> bool;

    [[nodiscard]] auto delete_value(std::string_view key) -> bool;

    // ========================================================================
    // Typed Access
    // ========================================================================

    [[nodiscard]] auto things() noexcept -> thing_repository& { return things_; }
    [[nodiscard]] auto things() const noexcept -> const thing_repository& {
        return things_;
    }

    [[nodiscard]] auto key_values() noexcept -> key_value_repository& {
        return key_values_;
    }
    [[nodiscard]] auto key_values() const noexcept -> const key_value_repository& {
        return key_values_;
    }

    /**
     * @brief Schema version persisted in the store
     */
    [[nodiscard]] auto current_version() const -> int;

    /**
     * @brief Schema versions applied to the store, ascending
     */
    [[nodiscard]] auto history() const -> std::vector<migration_record>;

    [[nodiscard]] auto path() const -> const std::string& { return path_; }

    /**
     * @brief Get the underlying SQLite handle
     *
     * The handle remains owned by the store.
     */
    [[nodiscard]] auto native_handle() const noexcept -> sqlite3* { return db_; }

private:
    data_store(sqlite3* db, std::string path);

    sqlite3* db_ = nullptr;
    std::string path_;
    migration_runner migration_runner_;
    thing_repository things_;
    key_value_repository key_values_;
};

}  // namespace initiative::storage
