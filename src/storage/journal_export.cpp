/**
 * @file journal_export.cpp
 * @brief Implementation of the journal backup document
 */

#include <initiative/storage/journal_export.hpp>

#include <initiative/integration/logger_adapter.hpp>
#include <initiative/storage/data_store.hpp>

#include <string>
#include <utility>

namespace initiative::storage {

auto export_journal(const data_store& store) -> nlohmann::json {
    auto things = nlohmann::json::array();
    for (const auto& thing : store.get_all_things()) {
        things.push_back(to_document(thing));
    }

    nlohmann::json time = nullptr;
    if (auto value = store.get_value("time"); value.has_value() && value->is_string()) {
        time = *value;
    }

    auto thing_count = things.size();

    nlohmann::json document;
    document["_"] = std::string(export_notice);
    document["things"] = std::move(things);
    document["keyValue"] = {{"time", std::move(time)}};

    integration::logger_adapter::log_journal_exported(store.path(), thing_count);

    return document;
}

}  // namespace initiative::storage
