/**
 * @file schema_registry.cpp
 * @brief Implementation of the schema version registry
 */

#include <initiative/storage/schema_registry.hpp>

#include <initiative/compat/format.hpp>

#include <utility>

namespace initiative::storage {

auto schema_registry::register_version(schema_version version) -> VoidResult {
    if (version.version < 1) {
        return store_void_error(
            error_codes::invalid_schema_version,
            initiative::compat::format("Schema version must be positive, got {}",
                                       version.version));
    }

    if (!versions_.empty() && version.version <= versions_.back().version) {
        return store_void_error(
            error_codes::invalid_schema_version,
            initiative::compat::format(
                "Schema version {} must be greater than {}", version.version,
                versions_.back().version));
    }

    if (version.tables.empty()) {
        return store_void_error(
            error_codes::invalid_schema_version,
            initiative::compat::format("Schema version {} declares no tables",
                                       version.version));
    }

    versions_.push_back(std::move(version));
    return ok();
}

auto schema_registry::pending(int persisted_version, int target_version) const
    -> std::vector<schema_version> {
    std::vector<schema_version> result;
    for (const auto& entry : versions_) {
        if (entry.version > persisted_version && entry.version <= target_version) {
            result.push_back(entry);
        }
    }
    return result;
}

auto schema_registry::find(int version) const -> const schema_version* {
    for (const auto& entry : versions_) {
        if (entry.version == version) {
            return &entry;
        }
    }
    return nullptr;
}

auto schema_registry::latest_at_or_below(int target) const -> const schema_version* {
    const schema_version* found = nullptr;
    for (const auto& entry : versions_) {
        if (entry.version > target) {
            break;
        }
        found = &entry;
    }
    return found;
}

auto schema_registry::latest_version() const noexcept -> int {
    return versions_.empty() ? 0 : versions_.back().version;
}

}  // namespace initiative::storage
