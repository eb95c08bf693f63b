/**
 * @file table_definition.hpp
 * @brief Declarative table layout used by schema versions
 */

#pragma once

#include <string>
#include <vector>

namespace initiative::storage {

/// Column holding the full JSON document of each row
inline constexpr const char* document_column = "data";

/**
 * @brief Declared layout of one table at one schema version
 *
 * The physical table has one TEXT column per declared key plus the
 * document column. Unique keys are backed by UNIQUE indexes named
 * uidx_<table>_<key>, secondary keys by indexes named idx_<table>_<key>.
 */
struct table_definition {
    /// Table name
    std::string name;

    /// Primary key column
    std::string primary_key;

    /// Columns whose values must be distinct across rows (NULLs excepted)
    std::vector<std::string> unique_keys;

    /// Columns with a non-unique lookup index
    std::vector<std::string> secondary_keys;

    /**
     * @brief All indexed columns, primary key first
     */
    [[nodiscard]] auto key_columns() const -> std::vector<std::string> {
        std::vector<std::string> columns;
        columns.reserve(1 + unique_keys.size() + secondary_keys.size());
        columns.push_back(primary_key);
        columns.insert(columns.end(), unique_keys.begin(), unique_keys.end());
        columns.insert(columns.end(), secondary_keys.begin(), secondary_keys.end());
        return columns;
    }

    [[nodiscard]] auto unique_index_name(const std::string& key) const -> std::string {
        return "uidx_" + name + "_" + key;
    }

    [[nodiscard]] auto secondary_index_name(const std::string& key) const -> std::string {
        return "idx_" + name + "_" + key;
    }
};

}  // namespace initiative::storage
