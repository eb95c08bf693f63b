/**
 * @file journal_export_test.cpp
 * @brief Unit tests for the journal backup document
 */

#include <catch2/catch_test_macros.hpp>

#include <initiative/storage/data_store.hpp>
#include <initiative/storage/journal_export.hpp>

#include <string>

using namespace initiative::storage;
using json = nlohmann::json;

TEST_CASE("export_journal document", "[export]") {
    auto opened = data_store::open(":memory:");
    REQUIRE(opened.is_ok());
    auto& store = *opened.value();

    SECTION("empty store") {
        auto document = export_journal(store);

        CHECK(document["_"] == std::string(export_notice));
        CHECK(document["things"] == json::array());
        CHECK(document["keyValue"]["time"].is_null());
    }

    SECTION("every saved thing is exported") {
        thing_record odo;
        odo.uuid = "u-1";
        odo.name = "Odo";
        odo.type = "Npc";
        odo.set_field("species", "halfling");

        thing_record inn;
        inn.uuid = "u-2";
        inn.name = "The Green Dragon";
        inn.type = "Place";
        inn.set_field("subtype", "inn");

        REQUIRE(store.save_thing(odo));
        REQUIRE(store.save_thing(inn));

        auto document = export_journal(store);
        REQUIRE(document["things"].size() == 2);
        CHECK(document["things"][0] == to_document(odo));
        CHECK(document["things"][1] == to_document(inn));
    }

    SECTION("time setting is exported when it is a string") {
        REQUIRE(store.set_value("time", "2:13:00:00"));

        auto document = export_journal(store);
        CHECK(document["keyValue"]["time"] == "2:13:00:00");
    }

    SECTION("non-string time is exported as null") {
        REQUIRE(store.set_value("time", 42));

        auto document = export_journal(store);
        CHECK(document["keyValue"]["time"].is_null());
    }

    SECTION("other settings are not exported") {
        REQUIRE(store.set_value("tutorial", json{{"step", 2}}));

        auto document = export_journal(store);
        CHECK(document["keyValue"].size() == 1);
        CHECK(document["keyValue"].contains("time"));
    }
}
