/**
 * @file migration_runner_test.cpp
 * @brief Unit tests for migration_runner class
 */

#include <catch2/catch_test_macros.hpp>

#include <initiative/storage/journal_schema.hpp>
#include <initiative/storage/migration_runner.hpp>
#include <initiative/storage/thing_repository.hpp>

#include <sqlite3.h>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

using namespace initiative::storage;
using json = nlohmann::json;

// ============================================================================
// Test Utilities
// ============================================================================

namespace {

/// RAII wrapper for SQLite database
class test_database {
public:
    test_database() {
        auto rc = sqlite3_open(":memory:", &db_);
        if (rc != SQLITE_OK) {
            throw std::runtime_error("Failed to open in-memory database");
        }
    }

    ~test_database() {
        if (db_ != nullptr) {
            sqlite3_close(db_);
        }
    }

    test_database(const test_database&) = delete;
    auto operator=(const test_database&) -> test_database& = delete;
    test_database(test_database&&) = delete;
    auto operator=(test_database&&) -> test_database& = delete;

    [[nodiscard]] auto get() const noexcept -> sqlite3* { return db_; }

    [[nodiscard]] auto table_exists(const char* table_name) const -> bool {
        return schema_object_exists("table", table_name);
    }

    [[nodiscard]] auto index_exists(const char* index_name) const -> bool {
        return schema_object_exists("index", index_name);
    }

    /// Text of a single column of one row, std::nullopt for NULL or no row
    [[nodiscard]] auto column_text(const char* sql) const -> std::optional<std::string> {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return std::nullopt;
        }
        std::optional<std::string> value;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            const auto* text =
                reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
            if (text != nullptr) {
                value = text;
            }
        }
        sqlite3_finalize(stmt);
        return value;
    }

    void exec(const char* sql) const {
        if (sqlite3_exec(db_, sql, nullptr, nullptr, nullptr) != SQLITE_OK) {
            throw std::runtime_error(sqlite3_errmsg(db_));
        }
    }

private:
    [[nodiscard]] auto schema_object_exists(const char* type, const char* name) const
        -> bool {
        const char* sql = "SELECT name FROM sqlite_master WHERE type=? AND name=?;";
        sqlite3_stmt* stmt = nullptr;
        auto rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            return false;
        }
        sqlite3_bind_text(stmt, 1, type, -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, name, -1, SQLITE_TRANSIENT);
        rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        return rc == SQLITE_ROW;
    }

    sqlite3* db_ = nullptr;
};

auto make_thing(const char* uuid, const char* name, const char* type) -> thing_record {
    thing_record record;
    record.uuid = uuid;
    record.name = name;
    record.type = type;
    return record;
}

/// Two-version history whose second version runs @p transform
auto make_two_version_registry(record_transform transform) -> schema_registry {
    schema_registry registry;
    schema_version first{1, "Create things", {{"things", "uuid", {}, {"name", "type"}}}};
    schema_version second{2, "Rewrite things",
                          {{"things", "uuid", {}, {"name", "type"}}},
                          "things",
                          std::move(transform)};
    if (registry.register_version(std::move(first)).is_err() ||
        registry.register_version(std::move(second)).is_err()) {
        throw std::logic_error("invalid test registry");
    }
    return registry;
}

}  // namespace

// ============================================================================
// Initial State
// ============================================================================

TEST_CASE("migration_runner initial state", "[migration][version]") {
    test_database db;
    migration_runner runner(make_journal_schema());

    SECTION("empty database has version 0") {
        CHECK(runner.get_current_version(db.get()) == 0);
    }

    SECTION("empty database needs migration") {
        CHECK(runner.needs_migration(db.get()));
    }

    SECTION("latest version is 7") {
        CHECK(runner.get_latest_version() == 7);
    }

    SECTION("empty database has no history") {
        CHECK(runner.get_history(db.get()).empty());
    }
}

// ============================================================================
// Fresh Stores
// ============================================================================

TEST_CASE("migration_runner creates fresh stores", "[migration][fresh]") {
    test_database db;
    migration_runner runner(make_journal_schema());

    SECTION("fresh store is created at the latest layout") {
        REQUIRE(runner.run_migrations(db.get()).is_ok());

        CHECK(runner.get_current_version(db.get()) == 7);
        CHECK_FALSE(runner.needs_migration(db.get()));

        CHECK(db.table_exists("things"));
        CHECK(db.table_exists("key_value"));
        CHECK(db.index_exists("uidx_things_name"));
        CHECK(db.index_exists("idx_things_type"));
        CHECK_FALSE(db.index_exists("idx_things_name"));
    }

    SECTION("only the target version is recorded") {
        REQUIRE(runner.run_migrations(db.get()).is_ok());

        auto history = runner.get_history(db.get());
        REQUIRE(history.size() == 1);
        CHECK(history[0].version == 7);
        CHECK(history[0].description == "Normalize enum spellings");
        CHECK_FALSE(history[0].applied_at.empty());
    }

    SECTION("second run is a no-op") {
        REQUIRE(runner.run_migrations(db.get()).is_ok());
        REQUIRE(runner.run_migrations(db.get()).is_ok());

        CHECK(runner.get_history(db.get()).size() == 1);
        CHECK(runner.get_current_version(db.get()) == 7);
    }

    SECTION("fresh store at an older target uses that layout") {
        REQUIRE(runner.run_migrations_to(db.get(), 2).is_ok());

        CHECK(runner.get_current_version(db.get()) == 2);
        CHECK(db.table_exists("key_value"));
        CHECK(db.index_exists("idx_things_name"));
        CHECK_FALSE(db.index_exists("uidx_things_name"));
    }

    SECTION("fresh version 1 store has no key_value table") {
        REQUIRE(runner.run_migrations_to(db.get(), 1).is_ok());

        CHECK(db.table_exists("things"));
        CHECK_FALSE(db.table_exists("key_value"));
    }
}

TEST_CASE("migration_runner rejects invalid targets", "[migration][error]") {
    test_database db;
    migration_runner runner(make_journal_schema());

    SECTION("target above latest") {
        auto result = runner.run_migrations_to(db.get(), 8);
        REQUIRE(result.is_err());
        CHECK(result.error().code == initiative::error_codes::database_migration_error);
        CHECK(runner.get_current_version(db.get()) == 0);
    }

    SECTION("target zero") {
        CHECK(runner.run_migrations_to(db.get(), 0).is_err());
    }

    SECTION("lower target than persisted is a no-op") {
        REQUIRE(runner.run_migrations(db.get()).is_ok());
        REQUIRE(runner.run_migrations_to(db.get(), 3).is_ok());
        CHECK(runner.get_current_version(db.get()) == 7);
    }

    SECTION("store newer than the registry") {
        REQUIRE(runner.run_migrations(db.get()).is_ok());

        migration_runner older(make_two_version_registry(
            [](thing_record record) { return record; }));
        auto result = older.run_migrations(db.get());
        REQUIRE(result.is_err());
        CHECK(result.error().code == initiative::error_codes::database_migration_error);
    }
}

// ============================================================================
// Upgrades With Transforms
// ============================================================================

TEST_CASE("migration_runner upgrades legacy records", "[migration][upgrade]") {
    test_database db;
    migration_runner runner(make_journal_schema());
    thing_repository things(db.get());

    SECTION("gender Trans is renamed at 3 and normalized at 7") {
        REQUIRE(runner.run_migrations_to(db.get(), 2).is_ok());

        auto npc = make_thing("u-1", "Vale", "Npc");
        npc.set_field("gender", "Trans");
        REQUIRE(things.save(npc).is_ok());

        REQUIRE(runner.run_migrations_to(db.get(), 3).is_ok());
        auto at_three = things.find_by_uuid("u-1");
        REQUIRE(at_three.is_ok());
        CHECK(at_three.value().string_field("gender") == "NonBinaryThey");

        REQUIRE(runner.run_migrations(db.get()).is_ok());
        auto at_seven = things.find_by_uuid("u-1");
        REQUIRE(at_seven.is_ok());
        CHECK(at_seven.value().string_field("gender") == "non-binary");
    }

    SECTION("each pending version is recorded") {
        REQUIRE(runner.run_migrations_to(db.get(), 2).is_ok());
        REQUIRE(runner.run_migrations(db.get()).is_ok());

        auto history = runner.get_history(db.get());
        REQUIRE(history.size() == 6);
        for (std::size_t i = 0; i < history.size(); ++i) {
            CHECK(history[i].version == static_cast<int>(i) + 2);
        }
    }

    SECTION("Npc age object is split") {
        REQUIRE(runner.run_migrations_to(db.get(), 3).is_ok());

        auto npc = make_thing("u-2", "Odo", "Npc");
        npc.set_field("age", json{{"type", "YoungAdult"}, {"value", 23}});
        REQUIRE(things.save(npc).is_ok());

        REQUIRE(runner.run_migrations_to(db.get(), 4).is_ok());
        auto at_four = things.find_by_uuid("u-2");
        REQUIRE(at_four.is_ok());
        CHECK(at_four.value().string_field("age") == "YoungAdult");
        REQUIRE(at_four.value().field("age_years") != nullptr);
        CHECK(*at_four.value().field("age_years") == 23);

        REQUIRE(runner.run_migrations(db.get()).is_ok());
        auto at_seven = things.find_by_uuid("u-2");
        REQUIRE(at_seven.is_ok());
        CHECK(at_seven.value().string_field("age") == "young-adult");
        CHECK(*at_seven.value().field("age_years") == 23);
    }

    SECTION("Location with nested subtype becomes Place") {
        REQUIRE(runner.run_migrations_to(db.get(), 5).is_ok());

        auto tavern = make_thing("u-3", "The Prancing Pony", "Location");
        tavern.set_field("subtype", json{{"subtype", "Tavern"}});
        REQUIRE(things.save(tavern).is_ok());

        REQUIRE(runner.run_migrations_to(db.get(), 6).is_ok());
        auto at_six = things.find_by_uuid("u-3");
        REQUIRE(at_six.is_ok());
        CHECK(at_six.value().type == "Place");
        CHECK(at_six.value().string_field("subtype") == "Tavern");
        CHECK(db.column_text("SELECT type FROM things WHERE uuid = 'u-3';") == "Place");

        REQUIRE(runner.run_migrations(db.get()).is_ok());
        auto at_seven = things.find_by_uuid("u-3");
        REQUIRE(at_seven.is_ok());
        CHECK(at_seven.value().string_field("subtype") == "tavern");
    }

    SECTION("unique name index replaces the plain one at 5") {
        REQUIRE(runner.run_migrations_to(db.get(), 4).is_ok());
        CHECK(db.index_exists("idx_things_name"));

        REQUIRE(runner.run_migrations_to(db.get(), 5).is_ok());
        CHECK_FALSE(db.index_exists("idx_things_name"));
        CHECK(db.index_exists("uidx_things_name"));
    }

    SECTION("records without legacy shapes are not rewritten") {
        REQUIRE(runner.run_migrations_to(db.get(), 2).is_ok());

        db.exec(R"(INSERT INTO things (uuid, name, type, data) VALUES
                   ('u-4', 'Plain', 'Npc', '{"uuid":"u-4","name":"Plain","type":"Npc","extra":[1,2]}');)");

        REQUIRE(runner.run_migrations(db.get()).is_ok());
        CHECK(db.column_text("SELECT data FROM things WHERE uuid = 'u-4';") ==
              R"({"uuid":"u-4","name":"Plain","type":"Npc","extra":[1,2]})");
    }
}

// ============================================================================
// Failures
// ============================================================================

TEST_CASE("migration_runner stops on a failing version", "[migration][failure]") {
    test_database db;

    SECTION("duplicate names abort the unique name step") {
        migration_runner runner(make_journal_schema());
        thing_repository things(db.get());

        REQUIRE(runner.run_migrations_to(db.get(), 4).is_ok());
        REQUIRE(things.save(make_thing("u-1", "Twin", "Npc")).is_ok());
        REQUIRE(things.save(make_thing("u-2", "Twin", "Npc")).is_ok());

        auto result = runner.run_migrations(db.get());
        REQUIRE(result.is_err());
        CHECK(result.error().code == initiative::error_codes::constraint_violation);

        CHECK(runner.get_current_version(db.get()) == 4);
        CHECK(db.index_exists("idx_things_name"));
        CHECK_FALSE(db.index_exists("uidx_things_name"));

        auto count = things.count();
        REQUIRE(count.is_ok());
        CHECK(count.value() == 2);

        SECTION("renaming the duplicate lets the upgrade finish") {
            REQUIRE(things.save(make_thing("u-2", "Twin II", "Npc")).is_ok());
            REQUIRE(runner.run_migrations(db.get()).is_ok());
            CHECK(runner.get_current_version(db.get()) == 7);
        }
    }

    SECTION("throwing transform rolls back its version") {
        migration_runner runner(make_two_version_registry([](thing_record) -> thing_record {
            throw std::runtime_error("cannot rewrite");
        }));
        thing_repository things(db.get());

        REQUIRE(runner.run_migrations_to(db.get(), 1).is_ok());
        auto original = make_thing("u-1", "Keep", "Npc");
        original.set_field("gender", "Trans");
        REQUIRE(things.save(original).is_ok());

        auto result = runner.run_migrations(db.get());
        REQUIRE(result.is_err());
        CHECK(result.error().code == initiative::error_codes::database_migration_error);

        CHECK(runner.get_current_version(db.get()) == 1);
        CHECK(runner.get_history(db.get()).size() == 1);

        auto stored = things.find_by_uuid("u-1");
        REQUIRE(stored.is_ok());
        CHECK(stored.value() == original);
    }

    SECTION("non-standard exception leaves no open transaction") {
        migration_runner failing(make_two_version_registry([](thing_record) -> thing_record {
            throw 42;
        }));
        thing_repository things(db.get());

        REQUIRE(failing.run_migrations_to(db.get(), 1).is_ok());
        REQUIRE(things.save(make_thing("u-1", "Keep", "Npc")).is_ok());

        CHECK_THROWS_AS(failing.run_migrations(db.get()), int);
        CHECK(sqlite3_get_autocommit(db.get()) != 0);
        CHECK(failing.get_current_version(db.get()) == 1);

        migration_runner passing(make_two_version_registry([](thing_record record) {
            record.set_field("checked", true);
            return record;
        }));
        REQUIRE(passing.run_migrations(db.get()).is_ok());
        CHECK(passing.get_current_version(db.get()) == 2);

        auto stored = things.find_by_uuid("u-1");
        REQUIRE(stored.is_ok());
        CHECK(stored.value().fields.value("checked", false));
    }

    SECTION("transform changing the uuid is rejected") {
        migration_runner runner(make_two_version_registry([](thing_record record) {
            record.uuid += "-copy";
            return record;
        }));
        thing_repository things(db.get());

        REQUIRE(runner.run_migrations_to(db.get(), 1).is_ok());
        REQUIRE(things.save(make_thing("u-1", "Keep", "Npc")).is_ok());

        auto result = runner.run_migrations(db.get());
        REQUIRE(result.is_err());
        CHECK(result.error().code == initiative::error_codes::invalid_record);
        CHECK(runner.get_current_version(db.get()) == 1);
    }

    SECTION("undecodable row fails the transform step") {
        migration_runner runner(make_journal_schema());

        REQUIRE(runner.run_migrations_to(db.get(), 2).is_ok());
        db.exec("INSERT INTO things (uuid, name, type, data) VALUES ('u-9', NULL, NULL, 'not json');");

        auto result = runner.run_migrations(db.get());
        REQUIRE(result.is_err());
        CHECK(result.error().code == initiative::error_codes::invalid_record);
        CHECK(runner.get_current_version(db.get()) == 2);
    }
}

// ============================================================================
// Layout Changes
// ============================================================================

TEST_CASE("migration_runner adds newly declared key columns", "[migration][layout]") {
    test_database db;

    schema_registry registry;
    REQUIRE(registry
                .register_version({1, "Names only", {{"things", "uuid", {}, {"name"}}}})
                .is_ok());
    REQUIRE(registry
                .register_version(
                    {2, "Index types", {{"things", "uuid", {}, {"name", "type"}}}})
                .is_ok());
    migration_runner runner(std::move(registry));

    REQUIRE(runner.run_migrations_to(db.get(), 1).is_ok());
    db.exec(R"(INSERT INTO things (uuid, name, data) VALUES
               ('u-1', 'Odo', '{"uuid":"u-1","name":"Odo","type":"Npc"}');)");

    REQUIRE(runner.run_migrations(db.get()).is_ok());

    CHECK(db.index_exists("idx_things_type"));
    CHECK(db.column_text("SELECT type FROM things WHERE uuid = 'u-1';") == "Npc");
}
