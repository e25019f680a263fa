/**
 * @file openehr_codes.hpp
 * @brief Typed enumerations over the openEHR change-control code groups
 */

#pragma once

#include <ehr/terminology/coded_text.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace ehr::terminology {

/**
 * @brief Codes of the "audit change type" group
 */
enum class audit_change_type {
    creation = 249,
    amendment = 250,
    modification = 251,
    synthesis = 252,
    unknown = 253,
    deleted = 523,
    attestation = 666,
    restoration = 816,
    format_conversion = 817
};

/**
 * @brief Codes of the "version lifecycle state" group
 */
enum class version_lifecycle_state {
    complete = 532,
    incomplete = 553,
    deleted = 523,
    inactive = 800,
    abandoned = 801
};

/**
 * @brief Codes of the "attestation reason" group
 */
enum class attestation_reason {
    signature = 240,
    witnessed = 648
};

/**
 * @brief Rubric of an audit change type
 */
[[nodiscard]] inline auto to_string(audit_change_type type) -> std::string {
    switch (type) {
        case audit_change_type::creation:
            return "creation";
        case audit_change_type::amendment:
            return "amendment";
        case audit_change_type::modification:
            return "modification";
        case audit_change_type::synthesis:
            return "synthesis";
        case audit_change_type::deleted:
            return "deleted";
        case audit_change_type::attestation:
            return "attestation";
        case audit_change_type::restoration:
            return "restoration";
        case audit_change_type::format_conversion:
            return "format conversion";
        case audit_change_type::unknown:
        default:
            return "unknown";
    }
}

/**
 * @brief Rubric of a version lifecycle state
 */
[[nodiscard]] inline auto to_string(version_lifecycle_state state) -> std::string {
    switch (state) {
        case version_lifecycle_state::complete:
            return "complete";
        case version_lifecycle_state::incomplete:
            return "incomplete";
        case version_lifecycle_state::deleted:
            return "deleted";
        case version_lifecycle_state::inactive:
            return "inactive";
        case version_lifecycle_state::abandoned:
            return "abandoned";
        default:
            return "unknown";
    }
}

/**
 * @brief Rubric of an attestation reason
 */
[[nodiscard]] inline auto to_string(attestation_reason reason) -> std::string {
    switch (reason) {
        case attestation_reason::signature:
            return "signed";
        case attestation_reason::witnessed:
        default:
            return "witnessed";
    }
}

/**
 * @brief Build the openEHR coded text of an enumerated code
 * @tparam Code One of the enumerations above
 */
template <typename Code>
[[nodiscard]] auto to_coded_text(Code code) -> coded_text {
    return coded_text{to_string(code),
                      code_phrase{openehr_terminology_id,
                                  std::to_string(static_cast<int>(code))}};
}

/**
 * @brief Map a lifecycle coded text back to the enumeration
 * @return The state, or std::nullopt for foreign or unknown codes
 */
[[nodiscard]] inline auto parse_lifecycle_state(const coded_text& text)
    -> std::optional<version_lifecycle_state> {
    if (text.defining_code.terminology_id != openehr_terminology_id) {
        return std::nullopt;
    }
    const auto& code = text.defining_code.code_string;
    if (code == "532") return version_lifecycle_state::complete;
    if (code == "553") return version_lifecycle_state::incomplete;
    if (code == "523") return version_lifecycle_state::deleted;
    if (code == "800") return version_lifecycle_state::inactive;
    if (code == "801") return version_lifecycle_state::abandoned;
    return std::nullopt;
}

}  // namespace ehr::terminology
