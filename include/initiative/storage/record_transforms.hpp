/**
 * @file record_transforms.hpp
 * @brief Per-version rewrites of stored thing records
 *
 * Each function takes a record in the shape persisted before its schema
 * version and returns it in the shape expected from that version on.
 * Values that are not a recognized legacy spelling are passed through,
 * so applying a transform to an already migrated record changes nothing.
 */

#pragma once

#include <initiative/storage/thing_record.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace initiative::storage::transforms {

/**
 * @brief Version 3: gender "Trans" becomes "NonBinaryThey"
 */
[[nodiscard]] auto rename_trans_gender(thing_record record) -> thing_record;

/**
 * @brief Version 4: split the legacy NPC age object
 *
 * For records of type "Npc" whose age is an object {type, value}, age
 * becomes the object's type and the new age_years field receives its
 * value. Members that are missing or empty are not copied.
 */
[[nodiscard]] auto split_npc_age(thing_record record) -> thing_record;

/**
 * @brief Version 6: things of type "Location" become "Place"
 *
 * A nested subtype {subtype: X} on such a record is flattened to X.
 */
[[nodiscard]] auto location_to_place(thing_record record) -> thing_record;

/**
 * @brief Version 7: enum spellings become lowercase, hyphenated words
 *
 * Rewrites age, ethnicity, gender, species and subtype when they hold a
 * string. Known CamelCase values map to their hyphenated form; anything
 * else is lowercased.
 */
[[nodiscard]] auto normalize_spellings(thing_record record) -> thing_record;

/**
 * @brief ASCII lowercase copy of @p value
 */
[[nodiscard]] auto to_lower_ascii(std::string_view value) -> std::string;

/**
 * @brief Truthiness of a stored value
 *
 * null, false, zero, NaN and the empty string are false; everything else,
 * including empty objects and arrays, is true.
 */
[[nodiscard]] auto is_truthy(const nlohmann::json& value) -> bool;

}  // namespace initiative::storage::transforms
