/**
 * @file thing_repository.cpp
 * @brief Implementation of the thing record repository
 */

#include <initiative/storage/thing_repository.hpp>

#include <initiative/compat/format.hpp>

#include <nlohmann/json.hpp>
#include <sqlite3.h>

namespace initiative::storage {

namespace {

/**
 * @brief Decode the data column of a things row
 */
auto parse_thing_row(sqlite3_stmt* stmt, int col) -> Result<thing_record> {
    const auto* text =
        reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    if (text == nullptr) {
        return store_error<thing_record>(error_codes::invalid_record,
                                         "Thing row has no document");
    }

    try {
        return thing_from_document(nlohmann::json::parse(text));
    } catch (const nlohmann::json::exception& e) {
        return store_error<thing_record>(
            error_codes::invalid_record,
            initiative::compat::format("Thing row holds invalid JSON: {}", e.what()));
    }
}

/**
 * @brief Map a failed sqlite3_step result to a store error code
 */
auto step_error_code(int rc) -> int {
    return (rc & 0xff) == SQLITE_CONSTRAINT ? error_codes::constraint_violation
                                            : error_codes::database_query_error;
}

void bind_optional_text(sqlite3_stmt* stmt, int index,
                        const std::optional<std::string>& value) {
    if (value.has_value()) {
        sqlite3_bind_text(stmt, index, value->c_str(),
                          static_cast<int>(value->size()), SQLITE_TRANSIENT);
    } else {
        sqlite3_bind_null(stmt, index);
    }
}

}  // namespace

// ============================================================================
// Queries
// ============================================================================

auto thing_repository::find_by_uuid(std::string_view uuid) const
    -> Result<thing_record> {
    return find_one("SELECT data FROM things WHERE uuid = ?;", uuid);
}

auto thing_repository::find_by_name(std::string_view name) const
    -> Result<thing_record> {
    return find_one(
        "SELECT data FROM things WHERE name = ? COLLATE NOCASE ORDER BY rowid LIMIT 1;",
        name);
}

auto thing_repository::find_all() const -> Result<std::vector<thing_record>> {
    const char* sql = "SELECT data FROM things ORDER BY rowid;";

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return store_error<std::vector<thing_record>>(
            error_codes::database_query_error,
            initiative::compat::format("Failed to prepare query: {}",
                                       sqlite3_errmsg(db_)));
    }

    std::vector<thing_record> results;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        auto record = parse_thing_row(stmt, 0);
        if (record.is_err()) {
            sqlite3_finalize(stmt);
            return store_error<std::vector<thing_record>>(record.error().code,
                                                          record.error().message);
        }
        results.push_back(std::move(record.value()));
    }

    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return store_error<std::vector<thing_record>>(
            error_codes::database_query_error,
            initiative::compat::format("Failed to read things: {}",
                                       sqlite3_errmsg(db_)));
    }

    return results;
}

auto thing_repository::count() const -> Result<std::size_t> {
    const char* sql = "SELECT COUNT(*) FROM things;";

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return store_error<std::size_t>(
            error_codes::database_query_error,
            initiative::compat::format("Failed to prepare query: {}",
                                       sqlite3_errmsg(db_)));
    }

    std::size_t count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = static_cast<std::size_t>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);

    return count;
}

// ============================================================================
// Mutations
// ============================================================================

auto thing_repository::save(const thing_record& record) -> VoidResult {
    if (!record.is_valid()) {
        return store_void_error(error_codes::invalid_record,
                                "Thing uuid is required");
    }

    const char* sql = R"(
        INSERT INTO things (uuid, name, type, data)
        VALUES (?, ?, ?, ?)
        ON CONFLICT(uuid) DO UPDATE SET
            name = excluded.name,
            type = excluded.type,
            data = excluded.data;
    )";

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return store_void_error(
            error_codes::database_query_error,
            initiative::compat::format("Failed to prepare statement: {}",
                                       sqlite3_errmsg(db_)));
    }

    auto document = to_document(record).dump();

    sqlite3_bind_text(stmt, 1, record.uuid.c_str(),
                      static_cast<int>(record.uuid.size()), SQLITE_TRANSIENT);
    bind_optional_text(stmt, 2, record.name);
    bind_optional_text(stmt, 3, record.type);
    sqlite3_bind_text(stmt, 4, document.c_str(),
                      static_cast<int>(document.size()), SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return store_void_error(
            step_error_code(rc),
            initiative::compat::format("Failed to save thing {}: {}", record.uuid,
                                       sqlite3_errmsg(db_)));
    }

    return ok();
}

auto thing_repository::remove(std::string_view uuid) -> VoidResult {
    const char* sql = "DELETE FROM things WHERE uuid = ?;";

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return store_void_error(
            error_codes::database_query_error,
            initiative::compat::format("Failed to prepare delete: {}",
                                       sqlite3_errmsg(db_)));
    }

    sqlite3_bind_text(stmt, 1, uuid.data(), static_cast<int>(uuid.size()),
                      SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return store_void_error(
            step_error_code(rc),
            initiative::compat::format("Failed to delete thing: {}",
                                       sqlite3_errmsg(db_)));
    }

    return ok();
}

auto thing_repository::remove_by_name(std::string_view name)
    -> Result<thing_record> {
    auto found = find_by_name(name);
    if (found.is_err()) {
        return found;
    }

    auto removed = remove(found.value().uuid);
    if (removed.is_err()) {
        return store_error<thing_record>(removed.error().code,
                                         removed.error().message);
    }

    return found;
}

// ============================================================================
// Internal Helpers
// ============================================================================

auto thing_repository::find_one(const char* sql, std::string_view value) const
    -> Result<thing_record> {
    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return store_error<thing_record>(
            error_codes::database_query_error,
            initiative::compat::format("Failed to prepare query: {}",
                                       sqlite3_errmsg(db_)));
    }

    sqlite3_bind_text(stmt, 1, value.data(), static_cast<int>(value.size()),
                      SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    if (rc == SQLITE_DONE) {
        sqlite3_finalize(stmt);
        return store_error<thing_record>(
            error_codes::record_not_found,
            initiative::compat::format("No thing matches '{}'", value));
    }
    if (rc != SQLITE_ROW) {
        auto message = initiative::compat::format("Failed to read thing: {}",
                                                  sqlite3_errmsg(db_));
        sqlite3_finalize(stmt);
        return store_error<thing_record>(error_codes::database_query_error, message);
    }

    auto record = parse_thing_row(stmt, 0);
    sqlite3_finalize(stmt);

    return record;
}

}  // namespace initiative::storage
