/**
 * @file key_value_repository.hpp
 * @brief Repository for application settings
 *
 * Settings are stored in the key_value table as one JSON document per key.
 */

#pragma once

#include <initiative/core/result.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

// Forward declaration of SQLite handle
struct sqlite3;

namespace initiative::storage {

/**
 * @brief Key to JSON value store over the key_value table
 *
 * The table exists from schema version 2 on. Against an older store every
 * operation fails with database_query_error.
 *
 * Thread Safety: This class is NOT thread-safe.
 */
class key_value_repository {
public:
    explicit key_value_repository(sqlite3* db) noexcept : db_(db) {}

    /**
     * @brief Read the value stored under a key
     *
     * @return The value, or record_not_found when the key is absent
     */
    [[nodiscard]] auto find(std::string_view key) const -> Result<nlohmann::json>;

    /**
     * @brief Insert or replace the value stored under a key
     */
    [[nodiscard]] auto put(std::string_view key, const nlohmann::json& value)
        -> VoidResult;

    /**
     * @brief Delete a key; deleting an absent key succeeds
     */
    [[nodiscard]] auto remove(std::string_view key) -> VoidResult;

    /**
     * @brief List every stored key in ascending order
     */
    [[nodiscard]] auto keys() const -> Result<std::vector<std::string>>;

private:
    sqlite3* db_;
};

}  // namespace initiative::storage
