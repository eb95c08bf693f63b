/**
 * @file key_value_repository.cpp
 * @brief Implementation of the settings repository
 */

#include <initiative/storage/key_value_repository.hpp>

#include <initiative/compat/format.hpp>

#include <sqlite3.h>

#include <utility>

namespace initiative::storage {

namespace {

auto prepare_error(sqlite3* db) -> std::string {
    return initiative::compat::format("Failed to prepare statement: {}",
                                      sqlite3_errmsg(db));
}

}  // namespace

auto key_value_repository::find(std::string_view key) const
    -> Result<nlohmann::json> {
    const char* sql = "SELECT data FROM key_value WHERE key = ?;";

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return store_error<nlohmann::json>(error_codes::database_query_error,
                                           prepare_error(db_));
    }

    sqlite3_bind_text(stmt, 1, key.data(), static_cast<int>(key.size()),
                      SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    if (rc == SQLITE_DONE) {
        sqlite3_finalize(stmt);
        return store_error<nlohmann::json>(
            error_codes::record_not_found,
            initiative::compat::format("No setting named '{}'", key));
    }
    if (rc != SQLITE_ROW) {
        auto message = initiative::compat::format("Failed to read setting: {}",
                                                  sqlite3_errmsg(db_));
        sqlite3_finalize(stmt);
        return store_error<nlohmann::json>(error_codes::database_query_error,
                                           message);
    }

    const auto* text =
        reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
    std::string document = text ? text : "";
    sqlite3_finalize(stmt);

    try {
        auto parsed = nlohmann::json::parse(document);
        if (!parsed.is_object() || !parsed.contains("value")) {
            return store_error<nlohmann::json>(
                error_codes::invalid_record,
                initiative::compat::format("Setting '{}' has no value", key));
        }
        nlohmann::json value = std::move(parsed["value"]);
        return value;
    } catch (const nlohmann::json::exception& e) {
        return store_error<nlohmann::json>(
            error_codes::invalid_record,
            initiative::compat::format("Setting '{}' holds invalid JSON: {}", key,
                                       e.what()));
    }
}

auto key_value_repository::put(std::string_view key, const nlohmann::json& value)
    -> VoidResult {
    const char* sql = R"(
        INSERT INTO key_value (key, data)
        VALUES (?, ?)
        ON CONFLICT(key) DO UPDATE SET data = excluded.data;
    )";

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return store_void_error(error_codes::database_query_error,
                                prepare_error(db_));
    }

    auto document = nlohmann::json{{"key", std::string(key)}, {"value", value}}.dump();

    sqlite3_bind_text(stmt, 1, key.data(), static_cast<int>(key.size()),
                      SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, document.c_str(),
                      static_cast<int>(document.size()), SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        auto code = (rc & 0xff) == SQLITE_CONSTRAINT
                        ? error_codes::constraint_violation
                        : error_codes::database_query_error;
        return store_void_error(
            code, initiative::compat::format("Failed to store setting '{}': {}",
                                             key, sqlite3_errmsg(db_)));
    }

    return ok();
}

auto key_value_repository::remove(std::string_view key) -> VoidResult {
    const char* sql = "DELETE FROM key_value WHERE key = ?;";

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return store_void_error(error_codes::database_query_error,
                                prepare_error(db_));
    }

    sqlite3_bind_text(stmt, 1, key.data(), static_cast<int>(key.size()),
                      SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return store_void_error(
            error_codes::database_query_error,
            initiative::compat::format("Failed to delete setting '{}': {}", key,
                                       sqlite3_errmsg(db_)));
    }

    return ok();
}

auto key_value_repository::keys() const -> Result<std::vector<std::string>> {
    const char* sql = "SELECT key FROM key_value ORDER BY key;";

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return store_error<std::vector<std::string>>(
            error_codes::database_query_error, prepare_error(db_));
    }

    std::vector<std::string> result;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        const auto* text =
            reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        result.emplace_back(text ? text : "");
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return store_error<std::vector<std::string>>(
            error_codes::database_query_error,
            initiative::compat::format("Failed to list settings: {}",
                                       sqlite3_errmsg(db_)));
    }

    return result;
}

}  // namespace initiative::storage
