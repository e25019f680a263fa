/**
 * @file party_proxy.cpp
 * @brief Party proxy construction
 */

#include <ehr/common/party_proxy.hpp>

namespace ehr::common {

auto party_proxy::self(std::optional<identification::object_ref> external_ref) -> party_proxy {
    return party_proxy{party_kind::self, std::nullopt, std::move(external_ref)};
}

auto party_proxy::identified(std::optional<std::string> name,
                             std::optional<identification::object_ref> external_ref)
    -> Result<party_proxy> {
    if (!name && !external_ref) {
        return ehr_error<party_proxy>(error_codes::empty_identifier,
                                      "PARTY_IDENTIFIED needs a name or an external reference");
    }
    if (name && name->empty()) {
        return ehr_error<party_proxy>(error_codes::empty_identifier,
                                      "PARTY_IDENTIFIED name must not be empty");
    }
    return party_proxy{party_kind::identified, std::move(name), std::move(external_ref)};
}

auto party_proxy::display_name() const -> std::string {
    if (name_) {
        return *name_;
    }
    if (external_ref_) {
        return external_ref_->id().value();
    }
    return "self";
}

}  // namespace ehr::common
