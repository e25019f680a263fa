/**
 * @file result.hpp
 * @brief Result<T> type aliases and error codes for the EHR toolkit
 *
 * Every recoverable failure in the toolkit (identifier parsing, audit
 * validation, commit preconditions, storage) is reported through
 * common_system's Result pattern using the codes declared here.
 *
 * @see common_system/include/kcenon/common/patterns/result.h
 */

#pragma once

#include <kcenon/common/patterns/result.h>
#include <kcenon/common/error/error_codes.h>

#include <string>

namespace ehr {

/**
 * @brief Result type alias for EHR operations
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
 * @brief EHR-specific error codes
 *
 * Error code range: -700 to -819
 */
namespace error_codes {
    using namespace kcenon::common::error::codes::common_errors;

    constexpr int ehr_base = -700;

    // Identification errors (-700 to -719)
    constexpr int invalid_uid_format = ehr_base - 0;
    constexpr int invalid_version_tree_id = ehr_base - 1;
    constexpr int invalid_object_version_id = ehr_base - 2;
    constexpr int empty_identifier = ehr_base - 3;
    constexpr int invalid_object_ref = ehr_base - 4;

    // Audit and terminology errors (-720 to -739)
    constexpr int empty_collection = ehr_base - 20;
    constexpr int invalid_change_type = ehr_base - 21;
    constexpr int invalid_lifecycle_state = ehr_base - 22;
    constexpr int invalid_attestation_reason = ehr_base - 23;
    constexpr int unknown_terminology = ehr_base - 24;

    // Change control errors (-740 to -759)
    constexpr int container_mismatch = ehr_base - 40;
    constexpr int precedence_violation = ehr_base - 41;
    constexpr int version_not_found = ehr_base - 42;
    constexpr int not_an_original_version = ehr_base - 43;
    constexpr int duplicate_version_id = ehr_base - 44;
    constexpr int invalid_revision_history = ehr_base - 45;

    // Serialization errors (-760 to -779)
    constexpr int decode_error = ehr_base - 60;
    constexpr int missing_field = ehr_base - 61;
    constexpr int unknown_type_tag = ehr_base - 62;

    // Storage errors (-780 to -799)
    constexpr int container_not_found = ehr_base - 80;
    constexpr int container_already_exists = ehr_base - 81;
    constexpr int contribution_inconsistent = ehr_base - 82;
    constexpr int object_not_found = ehr_base - 83;
    constexpr int database_error = ehr_base - 84;
    constexpr int database_open_error = ehr_base - 85;
    constexpr int container_locked = ehr_base - 86;

    // Configuration errors (-800 to -819)
    constexpr int config_base = -800;
    constexpr int config_file_not_found = config_base - 0;
    constexpr int config_parse_error = config_base - 1;
    constexpr int config_invalid_value = config_base - 2;
} // namespace error_codes

using kcenon::common::ok;
using kcenon::common::make_error;
using kcenon::common::is_ok;
using kcenon::common::is_error;

/**
 * @brief Create an EHR error result with module context
 * @tparam T The result value type
 * @param code Error code from ehr::error_codes
 * @param message Error message
 * @param details Optional additional details
 * @return Result<T> containing the error
 */
template <typename T>
inline Result<T> ehr_error(int code, const std::string& message,
                           const std::string& details = "") {
    if (details.empty()) {
        return kcenon::common::make_error<T>(code, message, "ehr");
    }
    return kcenon::common::make_error<T>(code, message, "ehr", details);
}

/**
 * @brief Create an EHR void error result
 * @param code Error code from ehr::error_codes
 * @param message Error message
 * @param details Optional additional details
 * @return VoidResult containing the error
 */
inline VoidResult ehr_void_error(int code, const std::string& message,
                                 const std::string& details = "") {
    if (details.empty()) {
        return VoidResult(error_info{code, message, "ehr"});
    }
    return VoidResult(error_info{code, message, "ehr", details});
}

} // namespace ehr

/**
 * @brief Return early if expression is an error
 */
#define EHR_RETURN_IF_ERROR(expr) COMMON_RETURN_IF_ERROR(expr)

/**
 * @brief Assign value or return error
 */
#define EHR_ASSIGN_OR_RETURN(decl, expr) COMMON_ASSIGN_OR_RETURN(decl, expr)

/**
 * @brief Return an EHR error if condition is true
 */
#define EHR_RETURN_ERROR_IF(condition, code, message) \
    COMMON_RETURN_ERROR_IF(condition, code, message, "ehr")
