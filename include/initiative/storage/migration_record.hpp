/**
 * @file migration_record.hpp
 * @brief Migration record structure for schema version tracking
 *
 * This file provides the migration_record structure that represents
 * an applied schema version step.
 */

#pragma once

#include <string>

namespace initiative::storage {

/**
 * @brief Represents a record of an applied schema version
 *
 * One row of the schema_version bookkeeping table. A store created fresh
 * at version N has a single record for N.
 */
struct migration_record {
    int version;              ///< Schema version number
    std::string description;  ///< Description of the schema version
    std::string applied_at;   ///< Timestamp when the version was committed
};

}  // namespace initiative::storage
