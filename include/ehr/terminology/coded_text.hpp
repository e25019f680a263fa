/**
 * @file coded_text.hpp
 * @brief Coded values carried in audit and version metadata
 */

#pragma once

#include <string>
#include <variant>

namespace ehr::terminology {

/// Terminology identifier of the built-in openEHR vocabulary
inline constexpr const char* openehr_terminology_id = "openehr";

/**
 * @brief A code from a named terminology
 */
struct code_phrase {
    std::string terminology_id;
    std::string code_string;

    [[nodiscard]] auto operator==(const code_phrase& other) const -> bool = default;
};

/**
 * @brief Text whose meaning is fixed by a code
 */
struct coded_text {
    /// Human readable rubric, e.g. "creation"
    std::string value;
    code_phrase defining_code;

    [[nodiscard]] auto operator==(const coded_text& other) const -> bool = default;
};

/**
 * @brief Free text or coded text, as used for attestation reasons
 */
using text_or_coded = std::variant<std::string, coded_text>;

}  // namespace ehr::terminology
