/**
 * @file key_value_repository_test.cpp
 * @brief Unit tests for key_value_repository
 */

#include <catch2/catch_test_macros.hpp>

#include <initiative/storage/journal_schema.hpp>
#include <initiative/storage/key_value_repository.hpp>
#include <initiative/storage/migration_runner.hpp>

#include <sqlite3.h>

#include <stdexcept>

using namespace initiative::storage;
using json = nlohmann::json;

namespace {

/// In-memory store migrated to a journal schema version
class migrated_database {
public:
    explicit migrated_database(int version = journal_schema_latest_version) {
        if (sqlite3_open(":memory:", &db_) != SQLITE_OK) {
            throw std::runtime_error("Failed to open in-memory database");
        }
        migration_runner runner(make_journal_schema());
        if (runner.run_migrations_to(db_, version).is_err()) {
            sqlite3_close(db_);
            throw std::runtime_error("Failed to migrate in-memory database");
        }
    }

    ~migrated_database() { sqlite3_close(db_); }

    migrated_database(const migrated_database&) = delete;
    auto operator=(const migrated_database&) -> migrated_database& = delete;

    [[nodiscard]] auto get() const noexcept -> sqlite3* { return db_; }

private:
    sqlite3* db_ = nullptr;
};

}  // namespace

TEST_CASE("key_value_repository put and find", "[key_value][crud]") {
    migrated_database db;
    key_value_repository repo(db.get());

    SECTION("stored value is returned unchanged") {
        REQUIRE(repo.put("time", "1:08:00:00").is_ok());

        auto value = repo.find("time");
        REQUIRE(value.is_ok());
        CHECK(value.value() == "1:08:00:00");
    }

    SECTION("structured values round-trip") {
        json tutorial = {{"step", 3}, {"done", false}, {"seen", {"intro", "roll"}}};
        REQUIRE(repo.put("tutorial", tutorial).is_ok());

        auto value = repo.find("tutorial");
        REQUIRE(value.is_ok());
        CHECK(value.value() == tutorial);
    }

    SECTION("put replaces an existing value") {
        REQUIRE(repo.put("time", "1:08:00:00").is_ok());
        REQUIRE(repo.put("time", "2:00:00:00").is_ok());

        CHECK(repo.find("time").value() == "2:00:00:00");

        auto keys = repo.keys();
        REQUIRE(keys.is_ok());
        CHECK(keys.value().size() == 1);
    }

    SECTION("missing key is record_not_found") {
        auto value = repo.find("absent");
        REQUIRE(value.is_err());
        CHECK(value.error().code == initiative::error_codes::record_not_found);
    }

    SECTION("null is a stored value, not a missing one") {
        REQUIRE(repo.put("cleared", nullptr).is_ok());

        auto value = repo.find("cleared");
        REQUIRE(value.is_ok());
        CHECK(value.value().is_null());
    }

    SECTION("keys are listed in order") {
        REQUIRE(repo.put("b", 2).is_ok());
        REQUIRE(repo.put("a", 1).is_ok());

        auto keys = repo.keys();
        REQUIRE(keys.is_ok());
        CHECK(keys.value() == std::vector<std::string>{"a", "b"});
    }
}

TEST_CASE("key_value_repository remove", "[key_value][remove]") {
    migrated_database db;
    key_value_repository repo(db.get());

    SECTION("removed key is gone") {
        REQUIRE(repo.put("time", "1:08:00:00").is_ok());
        REQUIRE(repo.remove("time").is_ok());
        CHECK(repo.find("time").is_err());
    }

    SECTION("removing a missing key succeeds") {
        CHECK(repo.remove("absent").is_ok());
    }
}

TEST_CASE("key_value_repository before the settings table exists",
          "[key_value][version]") {
    migrated_database db(1);
    key_value_repository repo(db.get());

    auto result = repo.put("time", "1:08:00:00");
    REQUIRE(result.is_err());
    CHECK(result.error().code == initiative::error_codes::database_query_error);

    CHECK(repo.find("time").is_err());
}
