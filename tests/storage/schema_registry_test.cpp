/**
 * @file schema_registry_test.cpp
 * @brief Unit tests for schema_registry and the journal schema history
 */

#include <catch2/catch_test_macros.hpp>

#include <initiative/storage/journal_schema.hpp>
#include <initiative/storage/schema_registry.hpp>

#include <algorithm>

using namespace initiative::storage;
using initiative::error_codes::invalid_schema_version;

namespace {

auto make_version(int number) -> schema_version {
    schema_version version;
    version.version = number;
    version.description = "version " + std::to_string(number);
    version.tables.push_back(table_definition{"things", "uuid", {}, {"name"}});
    return version;
}

auto version_numbers(const std::vector<schema_version>& versions) -> std::vector<int> {
    std::vector<int> numbers;
    for (const auto& version : versions) {
        numbers.push_back(version.version);
    }
    return numbers;
}

}  // namespace

// ============================================================================
// Registration
// ============================================================================

TEST_CASE("schema_registry register_version", "[schema_registry][register]") {
    schema_registry registry;

    SECTION("empty registry") {
        CHECK(registry.empty());
        CHECK(registry.size() == 0);
        CHECK(registry.latest_version() == 0);
    }

    SECTION("ascending versions are accepted") {
        REQUIRE(registry.register_version(make_version(1)).is_ok());
        REQUIRE(registry.register_version(make_version(2)).is_ok());
        REQUIRE(registry.register_version(make_version(5)).is_ok());

        CHECK(registry.size() == 3);
        CHECK(registry.latest_version() == 5);
    }

    SECTION("version zero is rejected") {
        auto result = registry.register_version(make_version(0));
        REQUIRE(result.is_err());
        CHECK(result.error().code == invalid_schema_version);
        CHECK(registry.empty());
    }

    SECTION("duplicate version is rejected and registry is unchanged") {
        REQUIRE(registry.register_version(make_version(1)).is_ok());
        REQUIRE(registry.register_version(make_version(2)).is_ok());

        auto result = registry.register_version(make_version(2));
        REQUIRE(result.is_err());
        CHECK(result.error().code == invalid_schema_version);
        CHECK(registry.size() == 2);
    }

    SECTION("decreasing version is rejected") {
        REQUIRE(registry.register_version(make_version(3)).is_ok());

        auto result = registry.register_version(make_version(2));
        REQUIRE(result.is_err());
        CHECK(registry.latest_version() == 3);
    }

    SECTION("version without tables is rejected") {
        schema_version bare;
        bare.version = 1;

        auto result = registry.register_version(bare);
        REQUIRE(result.is_err());
        CHECK(result.error().code == invalid_schema_version);
    }
}

// ============================================================================
// Queries
// ============================================================================

TEST_CASE("schema_registry queries", "[schema_registry][query]") {
    schema_registry registry;
    REQUIRE(registry.register_version(make_version(1)).is_ok());
    REQUIRE(registry.register_version(make_version(2)).is_ok());
    REQUIRE(registry.register_version(make_version(4)).is_ok());
    REQUIRE(registry.register_version(make_version(7)).is_ok());

    SECTION("pending selects versions above persisted up to target") {
        CHECK(version_numbers(registry.pending(0, 7)) == std::vector<int>{1, 2, 4, 7});
        CHECK(version_numbers(registry.pending(1, 4)) == std::vector<int>{2, 4});
        CHECK(version_numbers(registry.pending(2, 6)) == std::vector<int>{4});
    }

    SECTION("pending is empty when persisted is at or past target") {
        CHECK(registry.pending(4, 4).empty());
        CHECK(registry.pending(7, 2).empty());
    }

    SECTION("find returns registered versions only") {
        REQUIRE(registry.find(4) != nullptr);
        CHECK(registry.find(4)->description == "version 4");
        CHECK(registry.find(3) == nullptr);
    }

    SECTION("latest_at_or_below skips gaps") {
        REQUIRE(registry.latest_at_or_below(6) != nullptr);
        CHECK(registry.latest_at_or_below(6)->version == 4);
        CHECK(registry.latest_at_or_below(7)->version == 7);
        CHECK(registry.latest_at_or_below(0) == nullptr);
    }
}

// ============================================================================
// Journal Schema
// ============================================================================

TEST_CASE("journal schema history", "[schema_registry][journal]") {
    auto registry = make_journal_schema();

    SECTION("versions 1 through 7 are registered") {
        CHECK(registry.latest_version() == journal_schema_latest_version);
        CHECK(version_numbers(registry.versions()) ==
              std::vector<int>{1, 2, 3, 4, 5, 6, 7});
    }

    SECTION("transforms exist at versions 3, 4, 6 and 7") {
        std::vector<int> with_transform;
        for (const auto& version : registry.versions()) {
            if (version.has_transform()) {
                with_transform.push_back(version.version);
            }
        }
        CHECK(with_transform == std::vector<int>{3, 4, 6, 7});
    }

    SECTION("key_value table appears at version 2") {
        auto has_key_value = [](const schema_version& version) {
            return std::any_of(version.tables.begin(), version.tables.end(),
                               [](const table_definition& table) {
                                   return table.name == key_value_table;
                               });
        };
        CHECK_FALSE(has_key_value(*registry.find(1)));
        CHECK(has_key_value(*registry.find(2)));
        CHECK(has_key_value(*registry.find(7)));
    }

    SECTION("names become unique at version 5") {
        auto things_of = [](const schema_version& version) -> const table_definition& {
            return *std::find_if(version.tables.begin(), version.tables.end(),
                                 [](const table_definition& table) {
                                     return table.name == things_table;
                                 });
        };

        const auto& v4 = things_of(*registry.find(4));
        CHECK(v4.unique_keys.empty());
        CHECK(v4.secondary_keys == std::vector<std::string>{"name", "type"});

        const auto& v5 = things_of(*registry.find(5));
        CHECK(v5.unique_keys == std::vector<std::string>{"name"});
        CHECK(v5.secondary_keys == std::vector<std::string>{"type"});
    }
}
