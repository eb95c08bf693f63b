/**
 * @file migration_runner.cpp
 * @brief Implementation of database schema migration runner
 */

#include <initiative/storage/migration_runner.hpp>

#include <initiative/compat/format.hpp>
#include <initiative/integration/logger_adapter.hpp>

#include <nlohmann/json.hpp>
#include <sqlite3.h>

#include <algorithm>
#include <memory>
#include <string>
#include <utility>

namespace initiative::storage {

using initiative::integration::logger_adapter;

namespace {

using statement_ptr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

/**
 * @brief Prepare a statement owned by a unique_ptr
 */
auto prepare(sqlite3* db, const std::string& sql, int& rc) -> statement_ptr {
    sqlite3_stmt* stmt = nullptr;
    rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr);
    return statement_ptr(stmt, &sqlite3_finalize);
}

/**
 * @brief RAII transaction guard
 *
 * Rolls back on destruction unless commit() succeeded, so a transform that
 * throws never leaves the connection inside an open transaction.
 */
class scoped_transaction {
public:
    explicit scoped_transaction(sqlite3* db) noexcept : db_(db) {}

    ~scoped_transaction() { rollback(); }

    scoped_transaction(const scoped_transaction&) = delete;
    auto operator=(const scoped_transaction&) -> scoped_transaction& = delete;
    scoped_transaction(scoped_transaction&&) = delete;
    auto operator=(scoped_transaction&&) -> scoped_transaction& = delete;

    /**
     * @brief Start the transaction with BEGIN IMMEDIATE
     *
     * @return The SQLite error message, empty on success
     */
    [[nodiscard]] auto begin() -> std::string {
        auto error = exec("BEGIN IMMEDIATE;");
        active_ = error.empty();
        return error;
    }

    [[nodiscard]] auto commit() -> std::string {
        auto error = exec("COMMIT;");
        if (error.empty()) {
            active_ = false;
        }
        return error;
    }

    void rollback() noexcept {
        if (active_) {
            sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
            active_ = false;
        }
    }

private:
    auto exec(const char* sql) -> std::string {
        char* errmsg = nullptr;
        if (sqlite3_exec(db_, sql, nullptr, nullptr, &errmsg) == SQLITE_OK) {
            return {};
        }
        std::string error = errmsg ? errmsg : sqlite3_errmsg(db_);
        sqlite3_free(errmsg);
        return error;
    }

    sqlite3* db_;
    bool active_{false};
};

/**
 * @brief Quote an SQL identifier
 */
auto quote_identifier(const std::string& name) -> std::string {
    std::string quoted = "\"";
    for (char c : name) {
        if (c == '"') {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

/**
 * @brief Get text from statement column, returning empty string for NULL
 */
auto get_text(sqlite3_stmt* stmt, int col) -> std::string {
    const auto* text =
        reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? std::string(text) : std::string{};
}

/**
 * @brief Bind a document member to an indexed column
 *
 * Missing members and nulls bind NULL so that unique indexes ignore them.
 */
void bind_member(sqlite3_stmt* stmt, int index, const nlohmann::json& document,
                 const std::string& key) {
    auto it = document.find(key);
    if (it == document.end() || it->is_null()) {
        sqlite3_bind_null(stmt, index);
    } else if (it->is_string()) {
        const auto& text = it->get_ref<const std::string&>();
        sqlite3_bind_text(stmt, index, text.c_str(),
                          static_cast<int>(text.size()), SQLITE_TRANSIENT);
    } else if (it->is_boolean()) {
        sqlite3_bind_int(stmt, index, it->get<bool>() ? 1 : 0);
    } else if (it->is_number_integer()) {
        sqlite3_bind_int64(stmt, index, it->get<sqlite3_int64>());
    } else if (it->is_number_float()) {
        sqlite3_bind_double(stmt, index, it->get<double>());
    } else {
        auto text = it->dump();
        sqlite3_bind_text(stmt, index, text.c_str(),
                          static_cast<int>(text.size()), SQLITE_TRANSIENT);
    }
}

/**
 * @brief Name used for a database in log messages
 */
auto store_label(sqlite3* db) -> std::string {
    const char* filename = sqlite3_db_filename(db, "main");
    if (filename == nullptr || *filename == '\0') {
        return ":memory:";
    }
    return filename;
}

}  // namespace

// ============================================================================
// Construction
// ============================================================================

migration_runner::migration_runner(schema_registry registry)
    : registry_(std::move(registry)) {}

// ============================================================================
// Migration Operations
// ============================================================================

auto migration_runner::run_migrations(sqlite3* db) -> VoidResult {
    return run_migrations_to(db, registry_.latest_version());
}

auto migration_runner::run_migrations_to(sqlite3* db, int target_version)
    -> VoidResult {
    const auto latest = registry_.latest_version();

    if (target_version < 1 || target_version > latest) {
        return store_void_error(
            error_codes::database_migration_error,
            initiative::compat::format(
                "Target version {} is outside the registered range 1..{}",
                target_version, latest));
    }

    auto ensure_result = ensure_schema_version_table(db);
    if (ensure_result.is_err()) {
        return ensure_result;
    }

    auto current_version = get_current_version(db);

    if (current_version > latest) {
        return store_void_error(
            error_codes::database_migration_error,
            initiative::compat::format(
                "Store is at version {}, newer than the latest known version {}",
                current_version, latest));
    }

    // Nothing to do if already at or past target
    if (current_version >= target_version) {
        return ok();
    }

    // A new store starts at the target layout; there is nothing to transform
    if (current_version == 0) {
        const auto* initial = registry_.latest_at_or_below(target_version);
        if (initial == nullptr) {
            return store_void_error(
                error_codes::database_migration_error,
                initiative::compat::format(
                    "No schema version registered at or below {}",
                    target_version));
        }
        return create_fresh(db, *initial);
    }

    for (const auto& version : registry_.pending(current_version, target_version)) {
        auto applied = apply_version(db, version);
        if (applied.is_err()) {
            logger_adapter::log_migration_failed(store_label(db), version.version,
                                                 applied.error().message);
            return store_void_error(
                applied.error().code,
                initiative::compat::format("Schema version {} failed: {}",
                                           version.version,
                                           applied.error().message));
        }

        logger_adapter::log_migration_applied(store_label(db), version.version,
                                              version.description,
                                              applied.value());
    }

    return ok();
}

// ============================================================================
// Version Information
// ============================================================================

auto migration_runner::get_current_version(sqlite3* db) const -> int {
    // Check if schema_version table exists
    const char* check_sql =
        "SELECT name FROM sqlite_master WHERE type='table' AND name='schema_version';";

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db, check_sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return 0;
    }

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_ROW) {
        return 0;
    }

    const char* version_sql = "SELECT MAX(version) FROM schema_version;";
    rc = sqlite3_prepare_v2(db, version_sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return 0;
    }

    int version = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        // sqlite3_column_int returns 0 for NULL
        version = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);

    return version;
}

auto migration_runner::get_latest_version() const noexcept -> int {
    return registry_.latest_version();
}

auto migration_runner::needs_migration(sqlite3* db) const -> bool {
    return get_current_version(db) < registry_.latest_version();
}

// ============================================================================
// Migration History
// ============================================================================

auto migration_runner::get_history(sqlite3* db) const
    -> std::vector<migration_record> {
    std::vector<migration_record> history;

    const char* sql =
        "SELECT version, description, applied_at FROM schema_version ORDER BY version;";

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return history;
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        migration_record record;
        record.version = sqlite3_column_int(stmt, 0);
        record.description = get_text(stmt, 1);
        record.applied_at = get_text(stmt, 2);
        history.push_back(std::move(record));
    }

    sqlite3_finalize(stmt);
    return history;
}

// ============================================================================
// Internal Implementation
// ============================================================================

auto migration_runner::ensure_schema_version_table(sqlite3* db) -> VoidResult {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS schema_version (
            version     INTEGER PRIMARY KEY,
            description TEXT NOT NULL,
            applied_at  TEXT NOT NULL DEFAULT (datetime('now'))
        );
    )";

    return execute_sql(db, sql);
}

auto migration_runner::create_fresh(sqlite3* db, const schema_version& version)
    -> VoidResult {
    scoped_transaction tx(db);
    if (auto error = tx.begin(); !error.empty()) {
        return store_void_error(
            error_codes::database_transaction_error,
            initiative::compat::format("Failed to begin transaction: {}", error));
    }

    for (const auto& table : version.tables) {
        auto table_result = apply_table_definition(db, table);
        if (table_result.is_err()) {
            return table_result;
        }
    }

    auto record_result = record_migration(db, version.version, version.description);
    if (record_result.is_err()) {
        return record_result;
    }

    if (auto error = tx.commit(); !error.empty()) {
        return store_void_error(
            error_codes::database_transaction_error,
            initiative::compat::format("Failed to commit: {}", error));
    }

    logger_adapter::info("Created store {} at schema version {}",
                         store_label(db), version.version);
    return ok();
}

auto migration_runner::apply_version(sqlite3* db, const schema_version& version)
    -> Result<std::size_t> {
    scoped_transaction tx(db);
    if (auto error = tx.begin(); !error.empty()) {
        return store_error<std::size_t>(
            error_codes::database_transaction_error,
            initiative::compat::format("Failed to begin transaction: {}", error));
    }

    for (const auto& table : version.tables) {
        auto table_result = apply_table_definition(db, table);
        if (table_result.is_err()) {
            return store_error<std::size_t>(table_result.error().code,
                                            table_result.error().message);
        }
    }

    std::size_t rewritten = 0;
    if (version.has_transform()) {
        auto transform_result = transform_rows(db, version);
        if (transform_result.is_err()) {
            return transform_result;
        }
        rewritten = transform_result.value();
    }

    auto record_result = record_migration(db, version.version, version.description);
    if (record_result.is_err()) {
        return store_error<std::size_t>(record_result.error().code,
                                        record_result.error().message);
    }

    if (auto error = tx.commit(); !error.empty()) {
        auto code = (sqlite3_errcode(db) & 0xff) == SQLITE_CONSTRAINT
                        ? error_codes::constraint_violation
                        : error_codes::database_transaction_error;
        return store_error<std::size_t>(
            code, initiative::compat::format("Failed to commit: {}", error));
    }

    return rewritten;
}

auto migration_runner::apply_table_definition(sqlite3* db,
                                              const table_definition& table)
    -> VoidResult {
    const auto table_sql = quote_identifier(table.name);
    const auto columns = table.key_columns();

    std::string create_sql = initiative::compat::format(
        "CREATE TABLE IF NOT EXISTS {} ({} TEXT PRIMARY KEY NOT NULL",
        table_sql, quote_identifier(table.primary_key));
    for (std::size_t i = 1; i < columns.size(); ++i) {
        create_sql += ", " + quote_identifier(columns[i]) + " TEXT";
    }
    create_sql += initiative::compat::format(", {} TEXT NOT NULL);",
                                             quote_identifier(document_column));

    auto create_result = execute_sql(db, create_sql);
    if (create_result.is_err()) {
        return create_result;
    }

    // Key columns declared after the table was created
    auto existing_columns = table_columns(db, table.name);
    if (existing_columns.is_err()) {
        return store_void_error(existing_columns.error().code,
                                existing_columns.error().message);
    }

    for (std::size_t i = 1; i < columns.size(); ++i) {
        const auto& column = columns[i];
        const auto& known = existing_columns.value();
        if (std::find(known.begin(), known.end(), column) != known.end()) {
            continue;
        }

        auto alter_result = execute_sql(
            db, initiative::compat::format("ALTER TABLE {} ADD COLUMN {} TEXT;",
                                           table_sql, quote_identifier(column)));
        if (alter_result.is_err()) {
            return alter_result;
        }

        auto fill_result = execute_sql(
            db, initiative::compat::format(
                    "UPDATE {} SET {} = json_extract({}, '$.{}');", table_sql,
                    quote_identifier(column), quote_identifier(document_column),
                    column));
        if (fill_result.is_err()) {
            return fill_result;
        }
    }

    std::vector<std::string> declared;
    for (const auto& key : table.unique_keys) {
        declared.push_back(table.unique_index_name(key));
    }
    for (const auto& key : table.secondary_keys) {
        declared.push_back(table.secondary_index_name(key));
    }

    auto existing_indexes = managed_indexes(db, table.name);
    if (existing_indexes.is_err()) {
        return store_void_error(existing_indexes.error().code,
                                existing_indexes.error().message);
    }

    for (const auto& index : existing_indexes.value()) {
        if (std::find(declared.begin(), declared.end(), index) != declared.end()) {
            continue;
        }
        auto drop_result = execute_sql(
            db, initiative::compat::format("DROP INDEX IF EXISTS {};",
                                           quote_identifier(index)));
        if (drop_result.is_err()) {
            return drop_result;
        }
    }

    for (const auto& key : table.unique_keys) {
        auto index_result = execute_sql(
            db, initiative::compat::format(
                    "CREATE UNIQUE INDEX IF NOT EXISTS {} ON {}({});",
                    quote_identifier(table.unique_index_name(key)), table_sql,
                    quote_identifier(key)));
        if (index_result.is_err()) {
            return index_result;
        }
    }

    for (const auto& key : table.secondary_keys) {
        auto index_result = execute_sql(
            db, initiative::compat::format(
                    "CREATE INDEX IF NOT EXISTS {} ON {}({});",
                    quote_identifier(table.secondary_index_name(key)), table_sql,
                    quote_identifier(key)));
        if (index_result.is_err()) {
            return index_result;
        }
    }

    return ok();
}

auto migration_runner::transform_rows(sqlite3* db, const schema_version& version)
    -> Result<std::size_t> {
    auto table_it = std::find_if(
        version.tables.begin(), version.tables.end(),
        [&](const table_definition& t) { return t.name == version.transform_table; });
    if (table_it == version.tables.end()) {
        return store_error<std::size_t>(
            error_codes::unknown_table,
            initiative::compat::format(
                "Version {} transforms undeclared table '{}'", version.version,
                version.transform_table));
    }
    const auto& table = *table_it;

    // Read every row first; rows are rewritten afterwards
    std::vector<std::pair<std::string, std::string>> rows;
    {
        int rc = SQLITE_OK;
        auto select = prepare(
            db,
            initiative::compat::format("SELECT {}, {} FROM {};",
                                       quote_identifier(table.primary_key),
                                       quote_identifier(document_column),
                                       quote_identifier(table.name)),
            rc);
        if (rc != SQLITE_OK) {
            return store_error<std::size_t>(
                error_codes::database_query_error,
                initiative::compat::format("Failed to read {}: {}", table.name,
                                           sqlite3_errmsg(db)));
        }

        while ((rc = sqlite3_step(select.get())) == SQLITE_ROW) {
            rows.emplace_back(get_text(select.get(), 0), get_text(select.get(), 1));
        }
        if (rc != SQLITE_DONE) {
            return store_error<std::size_t>(
                error_codes::database_query_error,
                initiative::compat::format("Failed to read {}: {}", table.name,
                                           sqlite3_errmsg(db)));
        }
    }

    std::vector<std::string> key_columns = table.unique_keys;
    key_columns.insert(key_columns.end(), table.secondary_keys.begin(),
                       table.secondary_keys.end());

    std::string update_sql = "UPDATE " + quote_identifier(table.name) + " SET ";
    for (const auto& column : key_columns) {
        update_sql += quote_identifier(column) + " = ?, ";
    }
    update_sql += quote_identifier(document_column) + " = ? WHERE " +
                  quote_identifier(table.primary_key) + " = ?;";

    int rc = SQLITE_OK;
    auto update = prepare(db, update_sql, rc);
    if (rc != SQLITE_OK) {
        return store_error<std::size_t>(
            error_codes::database_query_error,
            initiative::compat::format("Failed to prepare update: {}",
                                       sqlite3_errmsg(db)));
    }

    std::size_t rewritten = 0;
    for (const auto& [pk, data] : rows) {
        nlohmann::json before;
        try {
            before = nlohmann::json::parse(data);
        } catch (const nlohmann::json::exception& e) {
            return store_error<std::size_t>(
                error_codes::invalid_record,
                initiative::compat::format("Row {} holds invalid JSON: {}", pk,
                                           e.what()));
        }

        auto decoded = thing_from_document(before);
        if (decoded.is_err()) {
            return store_error<std::size_t>(decoded.error().code,
                                            decoded.error().message);
        }

        nlohmann::json after;
        try {
            after = to_document(version.transform(std::move(decoded.value())));
        } catch (const std::exception& e) {
            return store_error<std::size_t>(
                error_codes::database_migration_error,
                initiative::compat::format("Transform failed on row {}: {}", pk,
                                           e.what()));
        }

        if (after.value("uuid", std::string{}) != pk) {
            return store_error<std::size_t>(
                error_codes::invalid_record,
                initiative::compat::format("Transform changed the uuid of row {}",
                                           pk));
        }

        if (after == before) {
            continue;
        }

        sqlite3_reset(update.get());
        sqlite3_clear_bindings(update.get());

        int index = 1;
        for (const auto& column : key_columns) {
            bind_member(update.get(), index++, after, column);
        }
        auto text = after.dump();
        sqlite3_bind_text(update.get(), index++, text.c_str(),
                          static_cast<int>(text.size()), SQLITE_TRANSIENT);
        sqlite3_bind_text(update.get(), index, pk.c_str(),
                          static_cast<int>(pk.size()), SQLITE_TRANSIENT);

        rc = sqlite3_step(update.get());
        if (rc != SQLITE_DONE) {
            auto code = (rc & 0xff) == SQLITE_CONSTRAINT
                            ? error_codes::constraint_violation
                            : error_codes::database_query_error;
            return store_error<std::size_t>(
                code, initiative::compat::format("Failed to rewrite row {}: {}",
                                                 pk, sqlite3_errmsg(db)));
        }

        ++rewritten;
    }

    return rewritten;
}

auto migration_runner::record_migration(sqlite3* db, int version,
                                        std::string_view description)
    -> VoidResult {
    const char* sql =
        "INSERT INTO schema_version (version, description) VALUES (?, ?);";

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return store_void_error(
            error_codes::database_query_error,
            initiative::compat::format("Failed to prepare statement: {}",
                                       sqlite3_errmsg(db)));
    }

    sqlite3_bind_int(stmt, 1, version);
    sqlite3_bind_text(stmt, 2, description.data(),
                      static_cast<int>(description.size()), SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return store_void_error(
            error_codes::database_query_error,
            initiative::compat::format("Failed to record migration: {}",
                                       sqlite3_errmsg(db)));
    }

    return ok();
}

auto migration_runner::execute_sql(sqlite3* db, std::string_view sql)
    -> VoidResult {
    char* errmsg = nullptr;
    auto rc = sqlite3_exec(db, std::string(sql).c_str(), nullptr, nullptr, &errmsg);

    if (rc != SQLITE_OK) {
        auto error_str = errmsg ? std::string(errmsg) : "Unknown error";
        sqlite3_free(errmsg);

        auto code = (rc & 0xff) == SQLITE_CONSTRAINT
                        ? error_codes::constraint_violation
                        : error_codes::database_transaction_error;
        return store_void_error(
            code, initiative::compat::format("SQL execution failed: {}", error_str));
    }

    return ok();
}

auto migration_runner::table_columns(sqlite3* db, const std::string& table)
    -> Result<std::vector<std::string>> {
    int rc = SQLITE_OK;
    auto stmt = prepare(
        db, initiative::compat::format("PRAGMA table_info({});", quote_identifier(table)),
        rc);
    if (rc != SQLITE_OK) {
        return store_error<std::vector<std::string>>(
            error_codes::database_query_error,
            initiative::compat::format("Failed to inspect {}: {}", table,
                                       sqlite3_errmsg(db)));
    }

    std::vector<std::string> columns;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        columns.push_back(get_text(stmt.get(), 1));
    }
    return columns;
}

auto migration_runner::managed_indexes(sqlite3* db, const std::string& table)
    -> Result<std::vector<std::string>> {
    const char* sql = R"(
        SELECT name FROM sqlite_master
        WHERE type = 'index' AND tbl_name = ?
          AND (name LIKE 'idx\_%' ESCAPE '\' OR name LIKE 'uidx\_%' ESCAPE '\');
    )";

    int rc = SQLITE_OK;
    auto stmt = prepare(db, sql, rc);
    if (rc != SQLITE_OK) {
        return store_error<std::vector<std::string>>(
            error_codes::database_query_error,
            initiative::compat::format("Failed to list indexes of {}: {}", table,
                                       sqlite3_errmsg(db)));
    }

    sqlite3_bind_text(stmt.get(), 1, table.c_str(),
                      static_cast<int>(table.size()), SQLITE_TRANSIENT);

    std::vector<std::string> indexes;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        indexes.push_back(get_text(stmt.get(), 0));
    }
    return indexes;
}

}  // namespace initiative::storage
