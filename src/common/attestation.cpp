/**
 * @file attestation.cpp
 * @brief Attestation validation
 */

#include <ehr/common/attestation.hpp>

#include <ehr/compat/format.hpp>

namespace ehr::common {

auto attestation::create(audit_details audit,
                         terminology::text_or_coded reason,
                         bool is_pending,
                         const terminology::terminology_service& terminology,
                         std::optional<media_reference> attested_view,
                         std::optional<std::string> proof,
                         std::optional<std::vector<std::string>> items)
    -> Result<attestation> {
    if (items && items->empty()) {
        return ehr_error<attestation>(error_codes::empty_collection,
                                      "ATTESTATION items must not be empty when present");
    }

    if (const auto* coded = std::get_if<terminology::coded_text>(&reason)) {
        if (!terminology.verify_code_in_group(coded->defining_code,
                                              terminology::groups::attestation_reason)) {
            return ehr_error<attestation>(
                error_codes::invalid_attestation_reason,
                compat::format("Code {}::{} is not an attestation reason",
                               coded->defining_code.terminology_id,
                               coded->defining_code.code_string));
        }
    }

    return attestation{std::move(audit), std::move(reason), is_pending,
                       std::move(attested_view), std::move(proof), std::move(items)};
}

}  // namespace ehr::common
