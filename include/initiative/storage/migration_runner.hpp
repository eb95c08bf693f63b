/**
 * @file migration_runner.hpp
 * @brief Database schema migration runner
 *
 * This file provides the migration_runner class that brings a SQLite
 * store from its persisted schema version up to a target version of a
 * schema_registry, rewriting stored records on the way.
 */

#pragma once

#include <initiative/core/result.hpp>
#include <initiative/storage/migration_record.hpp>
#include <initiative/storage/schema_registry.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

// Forward declaration of SQLite handle
struct sqlite3;

namespace initiative::storage {

/**
 * @brief Applies schema versions to a SQLite database
 *
 * The migration_runner is responsible for:
 * - Tracking the persisted schema version via the schema_version table
 * - Creating a fresh store directly at the target version's layout
 * - Applying pending versions in ascending order, each in its own
 *   transaction together with its record transform
 * - Rolling back the failing version and stopping the chain on error
 *
 * Thread Safety: This class is NOT thread-safe. External synchronization
 * is required for concurrent access to the same database.
 *
 * @example
 * @code
 * sqlite3* db = ...;
 * migration_runner runner(make_journal_schema());
 *
 * if (runner.needs_migration(db)) {
 *     auto result = runner.run_migrations(db);
 *     if (result.is_err()) {
 *         // Store is left at its last committed version
 *     }
 * }
 * @endcode
 */
class migration_runner {
public:
    /**
     * @brief Construct a runner over a schema history
     *
     * @param registry Every schema version of the store, ascending
     */
    explicit migration_runner(schema_registry registry);

    ~migration_runner() = default;

    migration_runner(const migration_runner&) = delete;
    auto operator=(const migration_runner&) -> migration_runner& = delete;
    migration_runner(migration_runner&&) = default;
    auto operator=(migration_runner&&) -> migration_runner& = default;

    // ========================================================================
    // Migration Operations
    // ========================================================================

    /**
     * @brief Migrate to the latest registered version
     *
     * @param db The SQLite database handle
     * @return VoidResult Success or error information
     */
    [[nodiscard]] auto run_migrations(sqlite3* db) -> VoidResult;

    /**
     * @brief Migrate up to a specific version
     *
     * A store without a schema_version record is created directly with the
     * layout of the highest registered version not above @p target_version
     * and no transform runs. Otherwise every registered version v with
     * current < v <= target_version is applied in ascending order.
     *
     * @param db The SQLite database handle
     * @param target_version The version to migrate to
     * @return VoidResult Success, or the error of the first failing version
     *
     * @note A failing version is rolled back; versions committed before it
     *       stay committed.
     */
    [[nodiscard]] auto run_migrations_to(sqlite3* db, int target_version)
        -> VoidResult;

    // ========================================================================
    // Version Information
    // ========================================================================

    /**
     * @brief Get the persisted schema version
     *
     * Returns 0 if the store has never been migrated (schema_version table
     * doesn't exist or is empty).
     *
     * @param db The SQLite database handle
     * @return Current schema version number
     */
    [[nodiscard]] auto get_current_version(sqlite3* db) const -> int;

    /**
     * @brief Get the latest registered schema version
     */
    [[nodiscard]] auto get_latest_version() const noexcept -> int;

    /**
     * @brief Check if the store is behind the latest registered version
     */
    [[nodiscard]] auto needs_migration(sqlite3* db) const -> bool;

    /**
     * @brief Get the migration history
     *
     * @param db The SQLite database handle
     * @return Applied versions in ascending order, empty if none
     */
    [[nodiscard]] auto get_history(sqlite3* db) const
        -> std::vector<migration_record>;

    [[nodiscard]] auto registry() const noexcept -> const schema_registry& {
        return registry_;
    }

private:
    // ========================================================================
    // Internal Implementation
    // ========================================================================

    [[nodiscard]] auto ensure_schema_version_table(sqlite3* db) -> VoidResult;

    /**
     * @brief Create the store at a version's layout without transforms
     */
    [[nodiscard]] auto create_fresh(sqlite3* db, const schema_version& version)
        -> VoidResult;

    /**
     * @brief Apply one version inside a transaction
     *
     * @return Number of records changed by the version's transform
     */
    [[nodiscard]] auto apply_version(sqlite3* db, const schema_version& version)
        -> Result<std::size_t>;

    /**
     * @brief Create or alter a table and its indexes to match a definition
     */
    [[nodiscard]] auto apply_table_definition(sqlite3* db,
                                              const table_definition& table)
        -> VoidResult;

    /**
     * @brief Run a version's transform over every row of its target table
     *
     * @return Number of rows whose document changed
     */
    [[nodiscard]] auto transform_rows(sqlite3* db, const schema_version& version)
        -> Result<std::size_t>;

    [[nodiscard]] auto record_migration(sqlite3* db, int version,
                                        std::string_view description)
        -> VoidResult;

    [[nodiscard]] auto execute_sql(sqlite3* db, std::string_view sql)
        -> VoidResult;

    [[nodiscard]] auto table_columns(sqlite3* db, const std::string& table)
        -> Result<std::vector<std::string>>;

    [[nodiscard]] auto managed_indexes(sqlite3* db, const std::string& table)
        -> Result<std::vector<std::string>>;

    schema_registry registry_;
};

}  // namespace initiative::storage
