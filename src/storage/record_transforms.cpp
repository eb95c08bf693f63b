/**
 * @file record_transforms.cpp
 * @brief Implementation of per-version record rewrites
 */

#include <initiative/storage/record_transforms.hpp>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <initializer_list>
#include <utility>

namespace initiative::storage::transforms {

namespace {

using spelling_map = std::initializer_list<std::pair<std::string_view, std::string_view>>;

/**
 * @brief Rewrite a string field through a spelling table
 *
 * Values found in @p known are replaced by their mapping, other strings
 * are lowercased. Absent, empty and non-string values are left alone.
 */
void normalize_field(thing_record& record, std::string_view key,
                     spelling_map known = {}) {
    auto value = record.string_field(key);
    if (!value.has_value() || value->empty()) {
        return;
    }

    for (const auto& [legacy, current] : known) {
        if (*value == legacy) {
            record.set_field(key, std::string(current));
            return;
        }
    }

    record.set_field(key, to_lower_ascii(*value));
}

}  // namespace

// ============================================================================
// Helpers
// ============================================================================

auto to_lower_ascii(std::string_view value) -> std::string {
    std::string result(value);
    // Bytes outside A-Z pass through, so UTF-8 sequences stay intact
    std::transform(result.begin(), result.end(), result.begin(), [](char c) {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
    });
    return result;
}

auto is_truthy(const nlohmann::json& value) -> bool {
    switch (value.type()) {
        case nlohmann::json::value_t::null:
        case nlohmann::json::value_t::discarded:
            return false;
        case nlohmann::json::value_t::boolean:
            return value.get<bool>();
        case nlohmann::json::value_t::number_integer:
            return value.get<std::int64_t>() != 0;
        case nlohmann::json::value_t::number_unsigned:
            return value.get<std::uint64_t>() != 0;
        case nlohmann::json::value_t::number_float: {
            auto number = value.get<double>();
            return number != 0.0 && !std::isnan(number);
        }
        case nlohmann::json::value_t::string:
            return !value.get_ref<const std::string&>().empty();
        default:
            return true;
    }
}

// ============================================================================
// Version Transforms
// ============================================================================

auto rename_trans_gender(thing_record record) -> thing_record {
    if (record.string_field("gender") == "Trans") {
        record.set_field("gender", "NonBinaryThey");
    }
    return record;
}

auto split_npc_age(thing_record record) -> thing_record {
    if (record.type != "Npc") {
        return record;
    }

    const auto* age = record.field("age");
    if (age == nullptr || !age->is_object()) {
        return record;
    }

    // Copy out before the age field is overwritten
    auto legacy = *age;

    auto value = legacy.find("value");
    if (value != legacy.end() && is_truthy(*value)) {
        record.set_field("age_years", *value);
    }

    auto category = legacy.find("type");
    if (category != legacy.end() && is_truthy(*category)) {
        record.set_field("age", *category);
    }

    return record;
}

auto location_to_place(thing_record record) -> thing_record {
    if (record.type != "Location") {
        return record;
    }

    record.type = "Place";

    const auto* subtype = record.field("subtype");
    if (subtype != nullptr && subtype->is_object()) {
        auto nested = subtype->find("subtype");
        if (nested != subtype->end() && is_truthy(*nested)) {
            auto flattened = *nested;
            record.set_field("subtype", std::move(flattened));
        }
    }

    return record;
}

auto normalize_spellings(thing_record record) -> thing_record {
    normalize_field(record, "age",
                    {{"YoungAdult", "young-adult"}, {"MiddleAged", "middle-aged"}});
    normalize_field(record, "ethnicity");
    normalize_field(record, "gender", {{"NonBinaryThey", "non-binary"}});
    normalize_field(record, "species",
                    {{"HalfElf", "half-elf"}, {"HalfOrc", "half-orc"}});
    normalize_field(record, "subtype");
    return record;
}

}  // namespace initiative::storage::transforms
