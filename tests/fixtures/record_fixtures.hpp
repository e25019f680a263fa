/**
 * @file record_fixtures.hpp
 * @brief Shared payload type and builders for the EHR unit tests
 */

#pragma once

#include <ehr/change_control/contribution.hpp>
#include <ehr/change_control/original_version.hpp>
#include <ehr/common/attestation.hpp>
#include <ehr/common/audit_details.hpp>
#include <ehr/common/party_proxy.hpp>
#include <ehr/core/timestamp.hpp>
#include <ehr/identification/hier_object_id.hpp>
#include <ehr/identification/object_ref.hpp>
#include <ehr/identification/object_version_id.hpp>
#include <ehr/terminology/openehr_codes.hpp>
#include <ehr/terminology/terminology_service.hpp>

#include <nlohmann/json.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace ehr::test {

/// Container uid used by the commit scenarios
inline constexpr std::string_view container_uid = "154b1047-23aa-4d4d-8713-df848fd4d60a";

/// Second container uid, for cross-container checks
inline constexpr std::string_view other_container_uid = "8849182c-82ad-4088-a07f-48ead4180515";

inline constexpr std::string_view system_id = "net.example.ehr";

// =============================================================================
// Payload
// =============================================================================

/**
 * @brief Minimal clinical note used as version payload
 */
struct clinical_note {
    std::string text;
    int priority{0};

    auto operator==(const clinical_note& other) const -> bool = default;
};

inline void to_json(nlohmann::json& j, const clinical_note& note) {
    j = nlohmann::json{{"text", note.text}, {"priority", note.priority}};
}

inline void from_json(const nlohmann::json& j, clinical_note& note) {
    j.at("text").get_to(note.text);
    j.at("priority").get_to(note.priority);
}

// =============================================================================
// Builders
// =============================================================================

/**
 * @brief Fixed, whole-second commit time, offset by a number of minutes
 */
inline auto commit_time(int minutes = 0) -> core::timestamp {
    return core::timestamp{std::chrono::seconds{1'700'000'000}} + std::chrono::minutes{minutes};
}

inline auto hier_id(std::string_view value) -> identification::hier_object_id {
    auto id = identification::hier_object_id::create(value);
    REQUIRE(id.is_ok());
    return id.value();
}

inline auto version_id(std::string_view value) -> identification::object_version_id {
    auto id = identification::object_version_id::create(value);
    REQUIRE(id.is_ok());
    return id.value();
}

/**
 * @brief "container::system::tree" for the default container
 */
inline auto scenario_version_id(std::string_view system, std::string_view tree)
    -> identification::object_version_id {
    return version_id(std::string(container_uid) + "::" + std::string(system) + "::" +
                      std::string(tree));
}

inline auto ehr_ref(std::string_view ehr_uid = "7d44b88c-4199-4bad-97dc-d78268e01398")
    -> identification::object_ref {
    return identification::object_ref::to_contribution(hier_id(ehr_uid));
}

inline auto clinician() -> common::party_proxy {
    auto party = common::party_proxy::identified(std::string("Dr. Lee"));
    REQUIRE(party.is_ok());
    return party.value();
}

inline auto make_audit(const terminology::terminology_service& terminology,
                       terminology::audit_change_type change_type =
                           terminology::audit_change_type::creation,
                       int minutes = 0) -> common::audit_details {
    auto audit = common::audit_details::create(std::string(system_id), commit_time(minutes),
                                               terminology::to_coded_text(change_type),
                                               clinician(), terminology);
    REQUIRE(audit.is_ok());
    return audit.value();
}

inline auto make_attestation(const terminology::terminology_service& terminology,
                             int minutes = 30) -> common::attestation {
    auto entry = common::attestation::create(
        make_audit(terminology, terminology::audit_change_type::attestation, minutes),
        terminology::to_coded_text(terminology::attestation_reason::signature), false,
        terminology);
    REQUIRE(entry.is_ok());
    return entry.value();
}

/**
 * @brief Original version in the given contribution, lifecycle complete
 */
inline auto make_original(const terminology::terminology_service& terminology,
                          const identification::hier_object_id& contribution_uid,
                          identification::object_version_id uid,
                          std::optional<identification::object_version_id> preceding,
                          clinical_note note,
                          int minutes = 0) -> change_control::original_version<clinical_note> {
    auto change_type = preceding ? terminology::audit_change_type::modification
                                 : terminology::audit_change_type::creation;
    auto created = change_control::original_version<clinical_note>::create(
        identification::object_ref::to_contribution(contribution_uid),
        make_audit(terminology, change_type, minutes), std::move(uid), std::move(preceding),
        terminology::to_coded_text(terminology::version_lifecycle_state::complete),
        std::move(note), terminology);
    REQUIRE(created.is_ok());
    return created.value();
}

/**
 * @brief Contribution listing exactly the given versions
 */
template <typename... Ids>
auto make_contribution(const terminology::terminology_service& terminology,
                       const identification::hier_object_id& uid,
                       const Ids&... version_ids) -> change_control::contribution {
    return change_control::contribution{
        uid, {identification::object_ref::to_version(version_ids)...}, make_audit(terminology)};
}

}  // namespace ehr::test
