/**
 * @file thing_record.cpp
 * @brief Implementation of thing record encoding
 */

#include <initiative/storage/thing_record.hpp>

#include <initiative/compat/format.hpp>

namespace initiative::storage {

namespace {

constexpr const char* uuid_key = "uuid";
constexpr const char* name_key = "name";
constexpr const char* type_key = "type";

/**
 * @brief Read an optional string member of a document
 *
 * Absent and null members map to std::nullopt. Any other non-string value
 * is reported through @p malformed.
 */
auto optional_string(const nlohmann::json& document, const char* key,
                     bool& malformed) -> std::optional<std::string> {
    auto it = document.find(key);
    if (it == document.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        malformed = true;
        return std::nullopt;
    }
    return it->get<std::string>();
}

}  // namespace

// ============================================================================
// Field Access
// ============================================================================

auto thing_record::field(std::string_view key) const -> const nlohmann::json* {
    if (!fields.is_object()) {
        return nullptr;
    }
    auto it = fields.find(std::string(key));
    if (it == fields.end()) {
        return nullptr;
    }
    return &(*it);
}

auto thing_record::string_field(std::string_view key) const
    -> std::optional<std::string> {
    const auto* value = field(key);
    if (value == nullptr || !value->is_string()) {
        return std::nullopt;
    }
    return value->get<std::string>();
}

void thing_record::set_field(std::string_view key, nlohmann::json value) {
    if (!fields.is_object()) {
        fields = nlohmann::json::object();
    }
    fields[std::string(key)] = std::move(value);
}

void thing_record::erase_field(std::string_view key) {
    if (fields.is_object()) {
        fields.erase(std::string(key));
    }
}

// ============================================================================
// Document Encoding
// ============================================================================

auto to_document(const thing_record& record) -> nlohmann::json {
    nlohmann::json document =
        record.fields.is_object() ? record.fields : nlohmann::json::object();

    document[uuid_key] = record.uuid;

    if (record.name.has_value()) {
        document[name_key] = *record.name;
    } else {
        document.erase(name_key);
    }

    if (record.type.has_value()) {
        document[type_key] = *record.type;
    } else {
        document.erase(type_key);
    }

    return document;
}

auto thing_from_document(const nlohmann::json& document)
    -> Result<thing_record> {
    if (!document.is_object()) {
        return store_error<thing_record>(
            error_codes::invalid_record,
            initiative::compat::format("Thing document is not an object: {}",
                                       document.type_name()));
    }

    auto uuid_it = document.find(uuid_key);
    if (uuid_it == document.end() || !uuid_it->is_string() ||
        uuid_it->get<std::string>().empty()) {
        return store_error<thing_record>(error_codes::invalid_record,
                                         "Thing document has no uuid");
    }

    bool malformed = false;
    thing_record record;
    record.uuid = uuid_it->get<std::string>();
    record.name = optional_string(document, name_key, malformed);
    record.type = optional_string(document, type_key, malformed);

    if (malformed) {
        return store_error<thing_record>(
            error_codes::invalid_record,
            initiative::compat::format(
                "Thing {} has a non-string name or type", record.uuid));
    }

    record.fields = document;
    record.fields.erase(uuid_key);
    record.fields.erase(name_key);
    record.fields.erase(type_key);

    return record;
}

}  // namespace initiative::storage
