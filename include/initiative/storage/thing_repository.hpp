/**
 * @file thing_repository.hpp
 * @brief Repository for thing records
 *
 * This file provides the thing_repository class for CRUD operations on
 * the things table. Errors are reported with typed codes so callers can
 * tell a missing record from a storage fault or a constraint violation.
 */

#pragma once

#include <initiative/core/result.hpp>
#include <initiative/storage/thing_record.hpp>

#include <cstddef>
#include <string_view>
#include <vector>

// Forward declaration of SQLite handle
struct sqlite3;

namespace initiative::storage {

/**
 * @brief Repository for thing records
 *
 * Operates on a connection whose schema has already been migrated. The
 * repository does not own the connection.
 *
 * Thread Safety: This class is NOT thread-safe. External synchronization
 * is required for concurrent access.
 *
 * @example
 * @code
 * thing_repository repo(db);
 *
 * thing_record npc;
 * npc.uuid = "4f3c...";
 * npc.name = "Odo";
 * npc.type = "Npc";
 * npc.set_field("species", "halfling");
 * auto saved = repo.save(npc);
 *
 * auto found = repo.find_by_uuid("4f3c...");
 * if (found.is_err() &&
 *     found.error().code == error_codes::record_not_found) {
 *     // missing
 * }
 * @endcode
 */
class thing_repository {
public:
    /**
     * @brief Construct repository over a migrated connection
     *
     * @param db SQLite handle; must outlive the repository
     */
    explicit thing_repository(sqlite3* db) noexcept : db_(db) {}

    /**
     * @brief Find a thing by uuid
     *
     * @return The record, record_not_found when absent, or a query error
     */
    [[nodiscard]] auto find_by_uuid(std::string_view uuid) const
        -> Result<thing_record>;

    /**
     * @brief Find a thing by name, ignoring ASCII case
     *
     * When several names differ only in case, the oldest row wins.
     *
     * @return The record, record_not_found when absent, or a query error
     */
    [[nodiscard]] auto find_by_name(std::string_view name) const
        -> Result<thing_record>;

    /**
     * @brief Read every thing in storage order
     */
    [[nodiscard]] auto find_all() const -> Result<std::vector<thing_record>>;

    /**
     * @brief Insert or replace a thing by uuid
     *
     * @return invalid_record for an empty uuid, constraint_violation when
     *         another thing already uses the name, or a query error
     */
    [[nodiscard]] auto save(const thing_record& record) -> VoidResult;

    /**
     * @brief Delete a thing by uuid
     *
     * Deleting a uuid that does not exist succeeds.
     */
    [[nodiscard]] auto remove(std::string_view uuid) -> VoidResult;

    /**
     * @brief Delete the thing matched by find_by_name()
     *
     * @return The deleted record, or record_not_found when no name matches
     */
    [[nodiscard]] auto remove_by_name(std::string_view name) -> Result<thing_record>;

    [[nodiscard]] auto count() const -> Result<std::size_t>;

private:
    [[nodiscard]] auto find_one(const char* sql, std::string_view value) const
        -> Result<thing_record>;

    sqlite3* db_;
};

}  // namespace initiative::storage
