/**
 * @file result.hpp
 * @brief Result<T> type aliases and helpers for blobtier
 *
 * This file provides standardized Result<T> types and error handling
 * utilities for the tier migration orchestrator, integrating with
 * common_system's Result pattern.
 *
 * @see common_system/include/kcenon/common/patterns/result.h
 */

#pragma once

#include <kcenon/common/patterns/result.h>
#include <kcenon/common/error/error_codes.h>

#include <string>

namespace blobtier {

/**
 * @brief Result type alias for blobtier operations
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
 * @brief blobtier-specific error codes
 *
 * Error code range: -900 to -999
 */
namespace error_codes {
    // Import common error codes
    using namespace kcenon::common::error::codes::common_errors;

    constexpr int blobtier_base = -900;

    // Run-level errors (-900 to -919). These abort the whole run.
    constexpr int session_scope_error = blobtier_base - 0;
    constexpr int enumeration_error = blobtier_base - 1;
    constexpr int audit_write_error = blobtier_base - 2;
    constexpr int invalid_configuration = blobtier_base - 3;

    // Record-level errors (-920 to -939). Recovered locally.
    constexpr int malformed_record = blobtier_base - 20;
    constexpr int per_object_migration_error = blobtier_base - 21;

    // Provider errors (-940 to -959)
    constexpr int provider_http_error = blobtier_base - 40;
    constexpr int provider_auth_error = blobtier_base - 41;
    constexpr int provider_response_error = blobtier_base - 42;
    constexpr int object_not_found = blobtier_base - 43;
    constexpr int invalid_filter_expression = blobtier_base - 44;

    // Session collaborator errors (-960 to -969)
    constexpr int command_failed = blobtier_base - 60;
    constexpr int command_output_error = blobtier_base - 61;

    // Run journal errors (-970 to -979)
    constexpr int journal_open_error = blobtier_base - 70;
    constexpr int journal_write_error = blobtier_base - 71;
    constexpr int journal_query_error = blobtier_base - 72;
} // namespace error_codes

// Re-export common utility functions
using kcenon::common::ok;
using kcenon::common::make_error;
using kcenon::common::is_ok;
using kcenon::common::is_error;
using kcenon::common::get_value;
using kcenon::common::get_error;

/**
 * @brief Create a blobtier error result with module context
 * @tparam T The result value type
 * @param code Error code from blobtier::error_codes
 * @param message Error message
 * @param module Component that raised the error
 * @return Result<T> containing the error
 */
template <typename T>
inline Result<T> blobtier_error(int code, const std::string& message,
                                const std::string& module = "blobtier") {
    return kcenon::common::make_error<T>(code, message, module);
}

/**
 * @brief Create a blobtier void error result
 * @param code Error code from blobtier::error_codes
 * @param message Error message
 * @param module Component that raised the error
 * @return VoidResult containing the error
 */
inline VoidResult blobtier_void_error(int code, const std::string& message,
                                      const std::string& module = "blobtier") {
    return VoidResult(error_info{code, message, module});
}

} // namespace blobtier
