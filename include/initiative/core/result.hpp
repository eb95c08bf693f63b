/**
 * @file result.hpp
 * @brief Result<T> type aliases and helpers for the journal store
 *
 * This file provides standardized Result<T> types and error handling
 * utilities for the journal store, integrating with common_system's
 * Result pattern.
 *
 * @see common_system/include/kcenon/common/patterns/result.h
 */

#pragma once

#include <kcenon/common/patterns/result.h>
#include <kcenon/common/error/error_codes.h>

#include <string>

namespace initiative {

/**
 * @brief Result type alias for store operations
 * @tparam T The success value type
 */
template <typename T>
using Result = kcenon::common::Result<T>;

/**
 * @brief Result type for void operations
 */
using VoidResult = kcenon::common::VoidResult;

/**
 * @brief Error information type
 */
using error_info = kcenon::common::error_info;

/**
 * @namespace error_codes
 * @brief Store-specific error codes
 *
 * Error code range: -700 to -799
 * Provides access to both common error codes and store-specific codes.
 */
namespace error_codes {
    // Import common error codes
    using namespace kcenon::common::error::codes::common_errors;

    constexpr int store_base = -700;

    // Database errors (-700 to -719)
    constexpr int database_open_error = store_base - 0;
    constexpr int database_query_error = store_base - 1;
    constexpr int database_transaction_error = store_base - 2;
    constexpr int database_migration_error = store_base - 3;

    // Record errors (-720 to -739)
    constexpr int record_not_found = store_base - 20;
    constexpr int constraint_violation = store_base - 21;
    constexpr int invalid_record = store_base - 22;

    // Schema errors (-740 to -759)
    constexpr int invalid_schema_version = store_base - 40;
    constexpr int unknown_table = store_base - 41;

    // Configuration errors (-760 to -779)
    constexpr int config_file_not_found = store_base - 60;
    constexpr int config_parse_error = store_base - 61;
} // namespace error_codes

// Re-export common utility functions
using kcenon::common::ok;
using kcenon::common::make_error;

/**
 * @brief Create a store error result with module context
 * @tparam T The result value type
 * @param code Error code from initiative::error_codes
 * @param message Error message
 * @return Result<T> containing the error
 */
template <typename T>
inline Result<T> store_error(int code, const std::string& message) {
    return kcenon::common::make_error<T>(code, message, "storage");
}

/**
 * @brief Create a store void error result
 * @param code Error code from initiative::error_codes
 * @param message Error message
 * @return VoidResult containing the error
 */
inline VoidResult store_void_error(int code, const std::string& message) {
    return VoidResult(error_info{code, message, "storage"});
}

} // namespace initiative
