/**
 * @file json_codec.hpp
 * @brief JSON records for identifiers, audits and contributions
 *
 * Every record is a JSON object carrying a "_type" discriminator next to
 * its fields. Optional fields are omitted when absent, never written as
 * null. Decoding validates the record the same way the constructors do,
 * so a decoded value always satisfies the invariants of its type.
 */

#pragma once

#include <ehr/change_control/container_metadata.hpp>
#include <ehr/change_control/contribution.hpp>
#include <ehr/common/attestation.hpp>
#include <ehr/common/audit_details.hpp>
#include <ehr/common/party_proxy.hpp>
#include <ehr/common/revision_history.hpp>
#include <ehr/core/result.hpp>
#include <ehr/core/timestamp.hpp>
#include <ehr/identification/hier_object_id.hpp>
#include <ehr/identification/object_ref.hpp>
#include <ehr/identification/object_version_id.hpp>
#include <ehr/terminology/coded_text.hpp>
#include <ehr/terminology/terminology_service.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace ehr::serialization {

using json = nlohmann::json;

/**
 * @namespace type_tags
 * @brief Values of the "_type" discriminator
 */
namespace type_tags {
    inline constexpr std::string_view original_version = "ORIGINAL_VERSION";
    inline constexpr std::string_view imported_version = "IMPORTED_VERSION";
    inline constexpr std::string_view contribution = "CONTRIBUTION";
    inline constexpr std::string_view versioned_object = "VERSIONED_OBJECT";
    inline constexpr std::string_view revision_history = "REVISION_HISTORY";
    inline constexpr std::string_view revision_history_item = "REVISION_HISTORY_ITEM";
    inline constexpr std::string_view audit_details = "AUDIT_DETAILS";
    inline constexpr std::string_view attestation = "ATTESTATION";
    inline constexpr std::string_view object_ref = "OBJECT_REF";
    inline constexpr std::string_view party_ref = "PARTY_REF";
    inline constexpr std::string_view party_self = "PARTY_SELF";
    inline constexpr std::string_view party_identified = "PARTY_IDENTIFIED";
    inline constexpr std::string_view dv_text = "DV_TEXT";
    inline constexpr std::string_view dv_coded_text = "DV_CODED_TEXT";
    inline constexpr std::string_view code_phrase = "CODE_PHRASE";
    inline constexpr std::string_view terminology_id = "TERMINOLOGY_ID";
    inline constexpr std::string_view dv_date_time = "DV_DATE_TIME";
    inline constexpr std::string_view dv_multimedia = "DV_MULTIMEDIA";
    inline constexpr std::string_view dv_uri = "DV_URI";
    inline constexpr std::string_view dv_ehr_uri = "DV_EHR_URI";
}  // namespace type_tags

// =============================================================================
// Decoding helpers
// =============================================================================

namespace detail {

/**
 * @brief Check that a record is an object with the expected "_type"
 * @return decode_error for non-objects, missing_field when "_type" is
 *         absent, unknown_type_tag on a different tag
 */
[[nodiscard]] auto expect_type(const json& record, std::string_view tag) -> VoidResult;

/**
 * @brief Read the "_type" tag of a record
 */
[[nodiscard]] auto type_of(const json& record) -> Result<std::string>;

/**
 * @brief Look up a required member
 * @return Pointer to the member, or missing_field
 */
[[nodiscard]] auto field(const json& record, std::string_view key) -> Result<const json*>;

/**
 * @brief Read a required string member
 */
[[nodiscard]] auto string_field(const json& record, std::string_view key) -> Result<std::string>;

/**
 * @brief Read an optional string member
 * @return std::nullopt when absent, decode_error when not a string
 */
[[nodiscard]] auto optional_string_field(const json& record, std::string_view key)
    -> Result<std::optional<std::string>>;

/**
 * @brief Read a required boolean member
 */
[[nodiscard]] auto bool_field(const json& record, std::string_view key) -> Result<bool>;

}  // namespace detail

// =============================================================================
// Identification
// =============================================================================

[[nodiscard]] auto encode(const identification::hier_object_id& id) -> json;
[[nodiscard]] auto encode(const identification::object_version_id& id) -> json;
[[nodiscard]] auto encode(const identification::object_id& id) -> json;
[[nodiscard]] auto encode(const identification::object_ref& ref) -> json;

[[nodiscard]] auto decode_hier_object_id(const json& record)
    -> Result<identification::hier_object_id>;
[[nodiscard]] auto decode_object_version_id(const json& record)
    -> Result<identification::object_version_id>;
[[nodiscard]] auto decode_object_id(const json& record) -> Result<identification::object_id>;

/**
 * @brief Decode an OBJECT_REF or PARTY_REF record
 */
[[nodiscard]] auto decode_object_ref(const json& record) -> Result<identification::object_ref>;

// =============================================================================
// Terminology and data values
// =============================================================================

[[nodiscard]] auto encode(const terminology::code_phrase& code) -> json;
[[nodiscard]] auto encode(const terminology::coded_text& text) -> json;
[[nodiscard]] auto encode_text(const std::string& text) -> json;
[[nodiscard]] auto encode(const terminology::text_or_coded& text) -> json;
[[nodiscard]] auto encode_date_time(core::timestamp time) -> json;

[[nodiscard]] auto decode_code_phrase(const json& record) -> Result<terminology::code_phrase>;
[[nodiscard]] auto decode_coded_text(const json& record) -> Result<terminology::coded_text>;
[[nodiscard]] auto decode_text(const json& record) -> Result<std::string>;
[[nodiscard]] auto decode_text_or_coded(const json& record) -> Result<terminology::text_or_coded>;
[[nodiscard]] auto decode_date_time(const json& record) -> Result<core::timestamp>;

// =============================================================================
// Audit
// =============================================================================

[[nodiscard]] auto encode(const common::party_proxy& party) -> json;
[[nodiscard]] auto encode(const common::audit_details& audit) -> json;
[[nodiscard]] auto encode(const common::attestation& entry) -> json;
[[nodiscard]] auto encode(const common::audit_entry& entry) -> json;
[[nodiscard]] auto encode(const common::revision_history_item& item) -> json;
[[nodiscard]] auto encode(const common::revision_history& history) -> json;

[[nodiscard]] auto decode_party_proxy(const json& record) -> Result<common::party_proxy>;
[[nodiscard]] auto decode_audit_details(const json& record,
                                        const terminology::terminology_service& terminology)
    -> Result<common::audit_details>;
[[nodiscard]] auto decode_attestation(const json& record,
                                      const terminology::terminology_service& terminology)
    -> Result<common::attestation>;

/**
 * @brief Decode an AUDIT_DETAILS or ATTESTATION record
 */
[[nodiscard]] auto decode_audit_entry(const json& record,
                                      const terminology::terminology_service& terminology)
    -> Result<common::audit_entry>;
[[nodiscard]] auto decode_revision_history_item(const json& record,
                                                const terminology::terminology_service& terminology)
    -> Result<common::revision_history_item>;
[[nodiscard]] auto decode_revision_history(const json& record,
                                           const terminology::terminology_service& terminology)
    -> Result<common::revision_history>;

// =============================================================================
// Change control records
// =============================================================================

[[nodiscard]] auto encode(const change_control::contribution& contribution) -> json;
[[nodiscard]] auto encode(const change_control::container_metadata& metadata) -> json;

[[nodiscard]] auto decode_contribution(const json& record,
                                       const terminology::terminology_service& terminology)
    -> Result<change_control::contribution>;
[[nodiscard]] auto decode_container_metadata(const json& record)
    -> Result<change_control::container_metadata>;

}  // namespace ehr::serialization
