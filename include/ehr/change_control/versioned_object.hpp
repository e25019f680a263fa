/**
 * @file versioned_object.hpp
 * @brief Append-only container of the versions of one record item
 *
 * A versioned_object records the full history of a logical item (a
 * composition, a folder, an EHR status) as immutable versions. Commits are
 * checked against the container before they are appended:
 *
 * - the version id must belong to the container (ContainerMismatch)
 * - the first version has no predecessor, every later version names one
 *   that is already committed here (PrecedenceViolation)
 * - a version id is committed at most once
 *
 * Versions live in an arena addressed by their commit position. The id
 * index, the timestamp index and the revision history all refer to that
 * position, so each payload is stored exactly once.
 *
 * Thread Safety: Not thread-safe. Commits against one container must be
 * serialized by the caller (see workflow::container_lock_manager).
 */

#pragma once

#include <ehr/change_control/container_metadata.hpp>
#include <ehr/change_control/version.hpp>
#include <ehr/common/attestation.hpp>
#include <ehr/common/audit_details.hpp>
#include <ehr/common/revision_history.hpp>
#include <ehr/compat/format.hpp>
#include <ehr/core/result.hpp>
#include <ehr/core/timestamp.hpp>
#include <ehr/identification/hier_object_id.hpp>
#include <ehr/identification/object_ref.hpp>
#include <ehr/identification/object_version_id.hpp>
#include <ehr/terminology/coded_text.hpp>
#include <ehr/terminology/terminology_service.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace ehr::change_control {

/**
 * @brief Version container for one record item
 *
 * @tparam T Payload type
 *
 * @example
 * @code
 * versioned_object<composition> container{uid, owner, now};
 * auto v1 = container.commit_original_version(
 *     contribution_ref, v1_id, std::nullopt, audit,
 *     to_coded_text(version_lifecycle_state::complete), payload, terms);
 * @endcode
 */
template <typename T>
class versioned_object {
public:
    /**
     * @brief Create an empty container
     * @param uid Container identifier
     * @param owner_id Object that owns the container, e.g. the EHR
     * @param time_created Creation time, supplied by the caller
     */
    versioned_object(identification::hier_object_id uid,
                     identification::object_ref owner_id,
                     core::timestamp time_created)
        : uid_(std::move(uid)),
          owner_id_(std::move(owner_id)),
          time_created_(time_created) {}

    /**
     * @brief Rebuild a container from persisted state
     *
     * @param history Revision history, one item per version, commit order
     * @param versions Versions in commit order
     * @return The container, or invalid_revision_history when history and
     *         versions disagree, or the commit precondition errors when the
     *         versions do not form a valid commit sequence
     */
    [[nodiscard]] static auto restore(identification::hier_object_id uid,
                                      identification::object_ref owner_id,
                                      core::timestamp time_created,
                                      common::revision_history history,
                                      std::vector<version<T>> versions)
        -> Result<versioned_object> {
        if (history.size() != versions.size()) {
            return ehr_error<versioned_object>(
                error_codes::invalid_revision_history,
                compat::format("Revision history has {} items for {} versions",
                               history.size(), versions.size()));
        }

        versioned_object container{std::move(uid), std::move(owner_id), time_created};
        for (std::size_t i = 0; i < versions.size(); ++i) {
            const auto& item = history.items()[i];
            if (!(item.version_id() == versions[i].uid())) {
                return ehr_error<versioned_object>(
                    error_codes::invalid_revision_history,
                    compat::format("Revision history item {} names {} but version is {}", i,
                                   item.version_id().value(), versions[i].uid().value()));
            }

            auto audits = check_history_audits(item, versions[i]);
            if (audits.is_err()) {
                return audits.error();
            }

            auto check = container.check_commit(versions[i].uid(),
                                                versions[i].preceding_version_uid());
            if (check.is_err()) {
                return check.error();
            }
            container.index(std::move(versions[i]));
        }
        container.history_ = std::move(history);
        return container;
    }

    [[nodiscard]] auto uid() const noexcept -> const identification::hier_object_id& { return uid_; }
    [[nodiscard]] auto owner_id() const noexcept -> const identification::object_ref& {
        return owner_id_;
    }
    [[nodiscard]] auto time_created() const noexcept -> core::timestamp { return time_created_; }

    [[nodiscard]] auto metadata() const -> container_metadata {
        return container_metadata{uid_, owner_id_, time_created_};
    }

    // ─────────────────────────────────────────────────────
    // Commits
    // ─────────────────────────────────────────────────────

    /**
     * @brief Commit a version authored in this system
     *
     * @param contribution Contribution the version belongs to
     * @param new_version_uid Identifier of the new version
     * @param preceding_version_uid Predecessor, absent only for the first version
     * @param audit Commit audit
     * @param lifecycle_state Code of the "version lifecycle state" group
     * @param data Payload
     * @param terminology Terminology used to validate lifecycle_state
     * @param signature Optional signature over the canonical form
     * @return The committed version, or container_mismatch,
     *         precedence_violation, duplicate_version_id,
     *         invalid_lifecycle_state
     */
    [[nodiscard]] auto commit_original_version(
        const identification::object_ref& contribution,
        identification::object_version_id new_version_uid,
        std::optional<identification::object_version_id> preceding_version_uid,
        common::audit_details audit,
        terminology::coded_text lifecycle_state,
        T data,
        const terminology::terminology_service& terminology,
        std::optional<std::string> signature = std::nullopt) -> Result<original_version<T>> {
        return commit_original(contribution, std::move(new_version_uid),
                               std::move(preceding_version_uid), std::move(audit),
                               std::move(lifecycle_state), std::move(data), terminology,
                               std::nullopt, std::move(signature));
    }

    /**
     * @brief Commit a version merging other versions into this line
     *
     * Identical to commit_original_version, plus merge sources that must be
     * non-empty. Merge sources may live in other containers and are not
     * checked here.
     */
    [[nodiscard]] auto commit_original_merged_version(
        const identification::object_ref& contribution,
        identification::object_version_id new_version_uid,
        std::optional<identification::object_version_id> preceding_version_uid,
        common::audit_details audit,
        terminology::coded_text lifecycle_state,
        T data,
        std::vector<identification::object_version_id> other_input_version_uids,
        const terminology::terminology_service& terminology,
        std::optional<std::string> signature = std::nullopt) -> Result<original_version<T>> {
        return commit_original(contribution, std::move(new_version_uid),
                               std::move(preceding_version_uid), std::move(audit),
                               std::move(lifecycle_state), std::move(data), terminology,
                               std::move(other_input_version_uids), std::move(signature));
    }

    /**
     * @brief Commit a version imported from another system
     *
     * Precedence is checked against the wrapped version's uid and
     * predecessor.
     *
     * @param contribution Contribution recording the import
     * @param audit Audit of the import
     * @param item Foreign original version
     * @param signature Optional signature of the import
     */
    [[nodiscard]] auto commit_imported_version(
        const identification::object_ref& contribution,
        common::audit_details audit,
        original_version<T> item,
        std::optional<std::string> signature = std::nullopt) -> Result<imported_version<T>> {
        auto check = check_commit(item.uid(), item.preceding_version_uid());
        if (check.is_err()) {
            return check.error();
        }

        imported_version<T> imported{contribution, audit, std::move(item), std::move(signature)};
        history_.add_item(common::revision_history_item{imported.uid(), std::move(audit)});
        index(version<T>{imported});
        return imported;
    }

    /**
     * @brief Attach an attestation to an original version
     * @return version_not_found or not_an_original_version on failure
     */
    [[nodiscard]] auto commit_attestation(common::attestation entry,
                                          const identification::object_version_id& target)
        -> VoidResult {
        auto it = id_index_.find(target);
        if (it == id_index_.end()) {
            return ehr_void_error(error_codes::version_not_found,
                                  compat::format("Version {} is not in {}", target.value(),
                                                 uid_.value()));
        }

        auto* original = versions_[it->second].as_original();
        if (original == nullptr) {
            return ehr_void_error(
                error_codes::not_an_original_version,
                compat::format("Version {} is imported and cannot be attested", target.value()));
        }

        original->append_attestation(entry);
        history_.item_at(it->second).append(std::move(entry));
        return ok();
    }

    // ─────────────────────────────────────────────────────
    // Queries
    // ─────────────────────────────────────────────────────

    [[nodiscard]] auto version_count() const noexcept -> std::size_t { return versions_.size(); }

    /// Version ids in commit order
    [[nodiscard]] auto all_version_ids() const -> std::vector<identification::object_version_id> {
        std::vector<identification::object_version_id> ids;
        ids.reserve(versions_.size());
        for (const auto& v : versions_) {
            ids.push_back(v.uid());
        }
        return ids;
    }

    /// Versions in commit order
    [[nodiscard]] auto all_versions() const -> const std::vector<version<T>>& { return versions_; }

    [[nodiscard]] auto has_version_id(const identification::object_version_id& id) const -> bool {
        return id_index_.count(id) > 0;
    }

    /// True if a version was committed at exactly this time
    [[nodiscard]] auto has_version_at_time(core::timestamp time) const -> bool {
        return time_index_.count(time) > 0;
    }

    [[nodiscard]] auto version_with_id(const identification::object_version_id& id) const
        -> Result<version<T>> {
        auto it = id_index_.find(id);
        if (it == id_index_.end()) {
            return ehr_error<version<T>>(
                error_codes::version_not_found,
                compat::format("Version {} is not in {}", id.value(), uid_.value()));
        }
        return versions_[it->second];
    }

    /**
     * @brief Version committed at exactly this time
     *
     * When several versions share a commit time the most recently committed
     * one is returned.
     */
    [[nodiscard]] auto version_at_time(core::timestamp time) const -> Result<version<T>> {
        auto it = time_index_.find(time);
        if (it == time_index_.end()) {
            return ehr_error<version<T>>(
                error_codes::version_not_found,
                compat::format("No version of {} committed at {}", uid_.value(),
                               core::to_iso8601(time)));
        }
        return versions_[it->second];
    }

    /**
     * @brief Check whether a committed version is an original version
     * @return version_not_found for unknown ids
     */
    [[nodiscard]] auto is_original_version(const identification::object_version_id& id) const
        -> Result<bool> {
        auto it = id_index_.find(id);
        if (it == id_index_.end()) {
            return ehr_error<bool>(error_codes::version_not_found,
                                   compat::format("Version {} is not in {}", id.value(),
                                                  uid_.value()));
        }
        return versions_[it->second].is_original();
    }

    [[nodiscard]] auto revision_history() const noexcept -> const common::revision_history& {
        return history_;
    }

    /// Most recently committed version, absent on an empty container
    [[nodiscard]] auto latest_version() const -> std::optional<version<T>> {
        if (versions_.empty()) {
            return std::nullopt;
        }
        return versions_.back();
    }

    /// Most recently committed version that is not on a branch
    [[nodiscard]] auto latest_trunk_version() const -> std::optional<version<T>> {
        for (auto it = versions_.rbegin(); it != versions_.rend(); ++it) {
            if (!it->is_branch()) {
                return *it;
            }
        }
        return std::nullopt;
    }

    /// Lifecycle state of the latest trunk version, absent on an empty container
    [[nodiscard]] auto trunk_lifecycle_state() const -> std::optional<terminology::coded_text> {
        auto trunk = latest_trunk_version();
        if (!trunk) {
            return std::nullopt;
        }
        return trunk->lifecycle_state();
    }

private:
    /**
     * @brief Verify that a history item carries the audits of its version
     *
     * The first entry must be the version's commit audit. Original versions
     * follow it with their attestations in order; imported versions have no
     * further entries.
     */
    [[nodiscard]] static auto check_history_audits(const common::revision_history_item& item,
                                                   const version<T>& v) -> VoidResult {
        const auto& audits = item.audits();
        const auto* commit = std::get_if<common::audit_details>(&audits.front());
        if (commit == nullptr || !(*commit == v.commit_audit())) {
            return ehr_void_error(
                error_codes::invalid_revision_history,
                compat::format("Revision history of {} does not start with its commit audit",
                               v.uid().value()));
        }

        std::size_t expected = 0;
        if (const auto* original = v.as_original(); original != nullptr) {
            expected = original->attestations() ? original->attestations()->size() : 0;
        }
        if (audits.size() != expected + 1) {
            return ehr_void_error(
                error_codes::invalid_revision_history,
                compat::format("Revision history of {} has {} attestations, version has {}",
                               v.uid().value(), audits.size() - 1, expected));
        }

        for (std::size_t k = 0; k < expected; ++k) {
            const auto* entry = std::get_if<common::attestation>(&audits[k + 1]);
            if (entry == nullptr || !(*entry == (*v.as_original()->attestations())[k])) {
                return ehr_void_error(
                    error_codes::invalid_revision_history,
                    compat::format("Revision history entry {} of {} does not match attestation {}",
                                   k + 1, v.uid().value(), k));
            }
        }
        return ok();
    }

    [[nodiscard]] auto commit_original(
        const identification::object_ref& contribution,
        identification::object_version_id new_version_uid,
        std::optional<identification::object_version_id> preceding_version_uid,
        common::audit_details audit,
        terminology::coded_text lifecycle_state,
        T data,
        const terminology::terminology_service& terminology,
        std::optional<std::vector<identification::object_version_id>> other_inputs,
        std::optional<std::string> signature) -> Result<original_version<T>> {
        auto check = check_commit(new_version_uid, preceding_version_uid);
        if (check.is_err()) {
            return check.error();
        }

        auto created = original_version<T>::create(
            contribution, audit, std::move(new_version_uid), std::move(preceding_version_uid),
            std::move(lifecycle_state), std::move(data), terminology, std::move(other_inputs),
            std::nullopt, std::move(signature));
        if (created.is_err()) {
            return created.error();
        }

        const auto& committed = created.value();
        history_.add_item(common::revision_history_item{committed.uid(), std::move(audit)});
        index(version<T>{committed});
        return committed;
    }

    [[nodiscard]] auto check_commit(
        const identification::object_version_id& new_version_uid,
        const std::optional<identification::object_version_id>& preceding_version_uid) const
        -> VoidResult {
        if (!(new_version_uid.object_id() == uid_.root())) {
            return ehr_void_error(
                error_codes::container_mismatch,
                compat::format("Version {} does not belong to {}", new_version_uid.value(),
                               uid_.value()));
        }

        if (versions_.empty()) {
            if (preceding_version_uid) {
                return ehr_void_error(
                    error_codes::precedence_violation,
                    compat::format("First version {} of {} must not name a preceding version",
                                   new_version_uid.value(), uid_.value()));
            }
        } else {
            if (!preceding_version_uid) {
                return ehr_void_error(
                    error_codes::precedence_violation,
                    compat::format("Version {} must name a preceding version in {}",
                                   new_version_uid.value(), uid_.value()));
            }
            if (!has_version_id(*preceding_version_uid)) {
                return ehr_void_error(
                    error_codes::precedence_violation,
                    compat::format("Preceding version {} is not in {}",
                                   preceding_version_uid->value(), uid_.value()));
            }
        }

        if (has_version_id(new_version_uid)) {
            return ehr_void_error(error_codes::duplicate_version_id,
                                  compat::format("Version {} is already committed",
                                                 new_version_uid.value()));
        }
        return ok();
    }

    void index(version<T> v) {
        auto handle = versions_.size();
        id_index_.emplace(v.uid(), handle);
        time_index_[v.commit_audit().time_committed()] = handle;
        versions_.push_back(std::move(v));
    }

    identification::hier_object_id uid_;
    identification::object_ref owner_id_;
    core::timestamp time_created_;

    std::vector<version<T>> versions_;
    std::unordered_map<identification::object_version_id, std::size_t> id_index_;
    std::map<core::timestamp, std::size_t> time_index_;
    common::revision_history history_;
};

}  // namespace ehr::change_control
