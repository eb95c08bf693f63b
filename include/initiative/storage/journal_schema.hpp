/**
 * @file journal_schema.hpp
 * @brief Schema history of the journal store
 */

#pragma once

#include <initiative/storage/schema_registry.hpp>

namespace initiative::storage {

/// Latest schema version of the journal store (increment when adding versions)
inline constexpr int journal_schema_latest_version = 7;

/// Table holding thing records
inline constexpr const char* things_table = "things";

/// Table holding key-value settings
inline constexpr const char* key_value_table = "key_value";

/**
 * @brief Build the registry of every journal schema version
 *
 * | Version | Change                                               |
 * |---------|------------------------------------------------------|
 * | 1       | things (uuid; name, type indexed)                    |
 * | 2       | key_value settings table                             |
 * | 3       | gender "Trans" renamed                               |
 * | 4       | NPC age object split into age and age_years          |
 * | 5       | thing names become unique                            |
 * | 6       | "Location" things become "Place"                     |
 * | 7       | enum spellings lowercased and hyphenated             |
 */
[[nodiscard]] auto make_journal_schema() -> schema_registry;

}  // namespace initiative::storage
