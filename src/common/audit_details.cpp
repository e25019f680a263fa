/**
 * @file audit_details.cpp
 * @brief Audit details validation
 */

#include <ehr/common/audit_details.hpp>

#include <ehr/compat/format.hpp>

namespace ehr::common {

auto audit_details::create(std::string system_id,
                           core::timestamp time_committed,
                           terminology::coded_text change_type,
                           party_proxy committer,
                           const terminology::terminology_service& terminology,
                           std::optional<std::string> description)
    -> Result<audit_details> {
    if (system_id.empty()) {
        return ehr_error<audit_details>(error_codes::empty_identifier,
                                        "AUDIT_DETAILS system_id must not be empty");
    }

    if (!terminology.verify_code_in_group(change_type.defining_code,
                                          terminology::groups::audit_change_type)) {
        return ehr_error<audit_details>(
            error_codes::invalid_change_type,
            compat::format("Code {}::{} is not an audit change type",
                           change_type.defining_code.terminology_id,
                           change_type.defining_code.code_string));
    }

    return audit_details{std::move(system_id), time_committed, std::move(change_type),
                         std::move(committer), std::move(description)};
}

}  // namespace ehr::common
