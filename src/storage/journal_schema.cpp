/**
 * @file journal_schema.cpp
 * @brief Declaration of the journal schema history
 */

#include <initiative/storage/journal_schema.hpp>

#include <initiative/storage/record_transforms.hpp>

#include <stdexcept>
#include <utility>

namespace initiative::storage {

namespace {

auto things_with_plain_names() -> table_definition {
    return {things_table, "uuid", {}, {"name", "type"}};
}

auto things_with_unique_names() -> table_definition {
    return {things_table, "uuid", {"name"}, {"type"}};
}

auto key_values() -> table_definition {
    return {key_value_table, "key", {}, {}};
}

void add(schema_registry& registry, schema_version version) {
    auto result = registry.register_version(std::move(version));
    if (result.is_err()) {
        // The declarations below are fixed at build time
        throw std::logic_error(result.error().message);
    }
}

}  // namespace

auto make_journal_schema() -> schema_registry {
    schema_registry registry;

    add(registry, {1, "Create things table", {things_with_plain_names()}});

    add(registry,
        {2, "Add key_value settings table",
         {things_with_plain_names(), key_values()}});

    add(registry,
        {3, "Rename gender Trans to NonBinaryThey",
         {things_with_plain_names(), key_values()},
         things_table,
         transforms::rename_trans_gender});

    add(registry,
        {4, "Split NPC age into age and age_years",
         {things_with_plain_names(), key_values()},
         things_table,
         transforms::split_npc_age});

    add(registry,
        {5, "Make thing names unique",
         {things_with_unique_names(), key_values()}});

    add(registry,
        {6, "Rename Location things to Place",
         {things_with_unique_names(), key_values()},
         things_table,
         transforms::location_to_place});

    add(registry,
        {7, "Normalize enum spellings",
         {things_with_unique_names(), key_values()},
         things_table,
         transforms::normalize_spellings});

    return registry;
}

}  // namespace initiative::storage
