/**
 * @file journal_export.hpp
 * @brief JSON backup document of a journal store
 */

#pragma once

#include <nlohmann/json.hpp>

#include <string_view>

namespace initiative::storage {

class data_store;

/// Notice placed under the "_" key of every export document
inline constexpr std::string_view export_notice =
    "This document is exported from initiative. Please note that this format is "
    "currently undocumented and no guarantees of forward compatibility are "
    "provided, although a reasonable effort will be made to ensure that older "
    "backups can be safely imported.";

/**
 * @brief Build the backup document of a store
 *
 * @code
 * {
 *   "_": "<notice>",
 *   "things": [ { "uuid": "...", "name": "...", ... } ],
 *   "keyValue": { "time": "1:08:00:00" }
 * }
 * @endcode
 *
 * "time" is null unless the store holds a string under the "time" setting.
 * A store whose records cannot be read exports an empty "things" list.
 */
[[nodiscard]] auto export_journal(const data_store& store) -> nlohmann::json;

}  // namespace initiative::storage
