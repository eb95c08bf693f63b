/**
 * @file thing_record.hpp
 * @brief Thing record data structure for journal storage
 *
 * This file provides the thing_record structure representing a saved
 * journal entry (NPC, place, ...). The indexed fields are typed; every
 * other field lives in an open JSON object so that schema transforms can
 * recognize legacy shapes without knowing about add-on fields.
 */

#pragma once

#include <initiative/core/result.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace initiative::storage {

/**
 * @brief Thing record from the database
 *
 * Maps to the things table: uuid, name and type are stored in their own
 * indexed columns, and the whole record is stored as a JSON document.
 */
struct thing_record {
    /// Unique identifier (primary key)
    std::string uuid;

    /// Display name, unique across things once the unique index exists
    std::optional<std::string> name;

    /// Category such as "Npc" or "Place" (secondary index)
    std::optional<std::string> type;

    /// Every other field: age, age_years, gender, species, subtype, ...
    nlohmann::json fields = nlohmann::json::object();

    /**
     * @brief Check if this record can be stored
     *
     * @return true if uuid is not empty and fields is a JSON object
     */
    [[nodiscard]] auto is_valid() const noexcept -> bool {
        return !uuid.empty() && fields.is_object();
    }

    /**
     * @brief Look up a free-form field
     *
     * @param key Field name
     * @return Pointer to the value, or nullptr when the field is absent
     */
    [[nodiscard]] auto field(std::string_view key) const -> const nlohmann::json*;

    [[nodiscard]] auto has_field(std::string_view key) const -> bool {
        return field(key) != nullptr;
    }

    /**
     * @brief Read a free-form field holding a string
     *
     * @return The string, or std::nullopt when absent or not a string
     */
    [[nodiscard]] auto string_field(std::string_view key) const
        -> std::optional<std::string>;

    void set_field(std::string_view key, nlohmann::json value);

    void erase_field(std::string_view key);

    friend auto operator==(const thing_record&, const thing_record&) -> bool = default;
};

/**
 * @brief Encode a record as the JSON document stored on disk
 *
 * The document contains the free-form fields plus "uuid", and "name" and
 * "type" when present.
 */
[[nodiscard]] auto to_document(const thing_record& record) -> nlohmann::json;

/**
 * @brief Decode a stored JSON document into a record
 *
 * @param document Parsed document; must be an object with a string "uuid"
 * @return The record, or invalid_record when the document is malformed
 */
[[nodiscard]] auto thing_from_document(const nlohmann::json& document)
    -> Result<thing_record>;

}  // namespace initiative::storage
