/**
 * @file schema_registry.hpp
 * @brief Ordered declaration of every schema version of a store
 *
 * This file provides the schema_version declaration and the
 * schema_registry that keeps them in ascending order and selects the
 * versions pending between a persisted and a target version.
 */

#pragma once

#include <initiative/core/result.hpp>
#include <initiative/storage/table_definition.hpp>
#include <initiative/storage/thing_record.hpp>

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace initiative::storage {

/**
 * @brief Rewrites one record from its previous shape to the current one
 *
 * Must be total: any well-formed or legacy record yields a record, and
 * values it does not recognize are passed through.
 */
using record_transform = std::function<thing_record(thing_record)>;

/**
 * @brief One numbered schema version
 */
struct schema_version {
    /// Version number, strictly increasing across the registry
    int version{0};

    /// Human-readable summary recorded in the schema_version table
    std::string description;

    /// Complete table layout at this version
    std::vector<table_definition> tables;

    /// Table whose rows the transform rewrites
    std::string transform_table{"things"};

    /// Optional transform run once when upgrading past this version
    record_transform transform;

    [[nodiscard]] auto has_transform() const noexcept -> bool {
        return static_cast<bool>(transform);
    }
};

/**
 * @brief Ascending list of schema versions
 *
 * Pure declaration and filtering; nothing here touches a database.
 *
 * @example
 * @code
 * schema_registry registry;
 * (void)registry.register_version({1, "Initial", {things_v1}});
 * (void)registry.register_version({3, "Rename", {things_v1}, "things", fix});
 *
 * for (const auto& step : registry.pending(1, 3)) {
 *     // step.version == 3
 * }
 * @endcode
 */
class schema_registry {
public:
    schema_registry() = default;

    /**
     * @brief Append a schema version
     *
     * @param version Version to append; its number must be at least 1 and
     *        greater than every version already registered
     * @return invalid_schema_version error when the ordering is violated
     */
    [[nodiscard]] auto register_version(schema_version version) -> VoidResult;

    /**
     * @brief Versions to apply when moving from persisted to target
     *
     * @return Every version v with persisted < v <= target, ascending
     */
    [[nodiscard]] auto pending(int persisted_version, int target_version) const
        -> std::vector<schema_version>;

    /**
     * @brief Find a registered version by number
     *
     * @return Pointer into the registry, or nullptr when not registered
     */
    [[nodiscard]] auto find(int version) const -> const schema_version*;

    /**
     * @brief Highest registered version that does not exceed @p target
     *
     * @return Pointer into the registry, or nullptr when none qualifies
     */
    [[nodiscard]] auto latest_at_or_below(int target) const -> const schema_version*;

    /// Highest registered version, 0 when empty
    [[nodiscard]] auto latest_version() const noexcept -> int;

    [[nodiscard]] auto versions() const noexcept -> const std::vector<schema_version>& {
        return versions_;
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return versions_.size(); }

    [[nodiscard]] auto empty() const noexcept -> bool { return versions_.empty(); }

private:
    std::vector<schema_version> versions_;
};

}  // namespace initiative::storage
