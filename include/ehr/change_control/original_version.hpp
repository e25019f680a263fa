/**
 * @file original_version.hpp
 * @brief A version authored in the local system
 */

#pragma once

#include <ehr/common/attestation.hpp>
#include <ehr/common/audit_details.hpp>
#include <ehr/compat/format.hpp>
#include <ehr/core/result.hpp>
#include <ehr/identification/hier_object_id.hpp>
#include <ehr/identification/object_ref.hpp>
#include <ehr/identification/object_version_id.hpp>
#include <ehr/terminology/coded_text.hpp>
#include <ehr/terminology/terminology_service.hpp>

#include <optional>
#include <string>
#include <vector>

namespace ehr::change_control {

/**
 * @brief Immutable version of a record item, created in this system
 *
 * Only attestations may be appended after construction, and only through
 * the owning versioned_object.
 *
 * @tparam T Payload type, opaque to change control
 */
template <typename T>
class original_version {
public:
    using payload_type = T;

    /**
     * @brief Build a validated original version
     *
     * @param contribution Reference to the contribution the version belongs to
     * @param commit_audit Audit of the commit
     * @param uid Identifier of the new version
     * @param preceding_version_uid Version this one derives from, absent for the first
     * @param lifecycle_state Code of the "version lifecycle state" group
     * @param data Payload
     * @param terminology Terminology used to validate lifecycle_state
     * @param other_input_version_uids Merge sources, non-empty when present
     * @param attestations Attestations, non-empty when present
     * @param signature Optional signature over the canonical form
     * @return The version, or invalid_lifecycle_state / empty_collection
     */
    [[nodiscard]] static auto create(
        identification::object_ref contribution,
        common::audit_details commit_audit,
        identification::object_version_id uid,
        std::optional<identification::object_version_id> preceding_version_uid,
        terminology::coded_text lifecycle_state,
        T data,
        const terminology::terminology_service& terminology,
        std::optional<std::vector<identification::object_version_id>> other_input_version_uids =
            std::nullopt,
        std::optional<std::vector<common::attestation>> attestations = std::nullopt,
        std::optional<std::string> signature = std::nullopt) -> Result<original_version> {
        if (!terminology.verify_code_in_group(lifecycle_state.defining_code,
                                              terminology::groups::version_lifecycle_state)) {
            return ehr_error<original_version>(
                error_codes::invalid_lifecycle_state,
                compat::format("Code {}::{} is not a version lifecycle state",
                               lifecycle_state.defining_code.terminology_id,
                               lifecycle_state.defining_code.code_string));
        }
        if (other_input_version_uids && other_input_version_uids->empty()) {
            return ehr_error<original_version>(
                error_codes::empty_collection,
                "other_input_version_uids must not be empty when present");
        }
        if (attestations && attestations->empty()) {
            return ehr_error<original_version>(error_codes::empty_collection,
                                               "attestations must not be empty when present");
        }

        return original_version{std::move(contribution), std::move(commit_audit),
                                std::move(uid), std::move(preceding_version_uid),
                                std::move(lifecycle_state), std::move(data),
                                std::move(other_input_version_uids),
                                std::move(attestations), std::move(signature)};
    }

    [[nodiscard]] auto contribution() const noexcept -> const identification::object_ref& {
        return contribution_;
    }
    [[nodiscard]] auto signature() const noexcept -> const std::optional<std::string>& {
        return signature_;
    }
    [[nodiscard]] auto commit_audit() const noexcept -> const common::audit_details& {
        return commit_audit_;
    }
    [[nodiscard]] auto uid() const noexcept -> const identification::object_version_id& {
        return uid_;
    }
    [[nodiscard]] auto preceding_version_uid() const noexcept
        -> const std::optional<identification::object_version_id>& {
        return preceding_version_uid_;
    }
    [[nodiscard]] auto other_input_version_uids() const noexcept
        -> const std::optional<std::vector<identification::object_version_id>>& {
        return other_input_version_uids_;
    }
    [[nodiscard]] auto lifecycle_state() const noexcept -> const terminology::coded_text& {
        return lifecycle_state_;
    }
    [[nodiscard]] auto attestations() const noexcept
        -> const std::optional<std::vector<common::attestation>>& {
        return attestations_;
    }
    [[nodiscard]] auto data() const noexcept -> const T& { return data_; }

    /// Container the version belongs to
    [[nodiscard]] auto owner_id() const -> identification::hier_object_id {
        return uid_.container_id();
    }
    [[nodiscard]] auto is_branch() const noexcept -> bool { return uid_.is_branch(); }
    [[nodiscard]] auto is_merged() const noexcept -> bool {
        return other_input_version_uids_.has_value();
    }

    void append_attestation(common::attestation entry) {
        if (!attestations_) {
            attestations_.emplace();
        }
        attestations_->push_back(std::move(entry));
    }

private:
    original_version(identification::object_ref contribution,
                     common::audit_details commit_audit,
                     identification::object_version_id uid,
                     std::optional<identification::object_version_id> preceding_version_uid,
                     terminology::coded_text lifecycle_state,
                     T data,
                     std::optional<std::vector<identification::object_version_id>> other_inputs,
                     std::optional<std::vector<common::attestation>> attestations,
                     std::optional<std::string> signature)
        : contribution_(std::move(contribution)),
          signature_(std::move(signature)),
          commit_audit_(std::move(commit_audit)),
          uid_(std::move(uid)),
          preceding_version_uid_(std::move(preceding_version_uid)),
          other_input_version_uids_(std::move(other_inputs)),
          lifecycle_state_(std::move(lifecycle_state)),
          attestations_(std::move(attestations)),
          data_(std::move(data)) {}

    identification::object_ref contribution_;
    std::optional<std::string> signature_;
    common::audit_details commit_audit_;
    identification::object_version_id uid_;
    std::optional<identification::object_version_id> preceding_version_uid_;
    std::optional<std::vector<identification::object_version_id>> other_input_version_uids_;
    terminology::coded_text lifecycle_state_;
    std::optional<std::vector<common::attestation>> attestations_;
    T data_;
};

}  // namespace ehr::change_control
