/**
 * @file versioned_store.hpp
 * @brief Typed record facade over a version store
 *
 * versioned_store<T> turns "create a record", "update it", "attest a
 * version" and "read it back" into the identifier arithmetic, audits,
 * contributions and store commits they require. Payloads of type T are
 * serialized with nlohmann/json's ADL to_json/from_json.
 */

#pragma once

#include <ehr/change_control/contribution.hpp>
#include <ehr/change_control/original_version.hpp>
#include <ehr/change_control/version.hpp>
#include <ehr/change_control/versioned_object.hpp>
#include <ehr/common/attestation.hpp>
#include <ehr/common/audit_details.hpp>
#include <ehr/common/party_proxy.hpp>
#include <ehr/compat/format.hpp>
#include <ehr/core/result.hpp>
#include <ehr/core/timestamp.hpp>
#include <ehr/di/ilogger.hpp>
#include <ehr/identification/hier_object_id.hpp>
#include <ehr/identification/object_ref.hpp>
#include <ehr/identification/object_version_id.hpp>
#include <ehr/identification/version_tree_id.hpp>
#include <ehr/integration/logger_adapter.hpp>
#include <ehr/storage/version_store_interface.hpp>
#include <ehr/terminology/openehr_codes.hpp>
#include <ehr/terminology/terminology_service.hpp>
#include <ehr/workflow/container_lock_manager.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ehr::workflow {

/**
 * @brief Outcome of versioned_store::create
 */
template <typename T>
struct create_result {
    identification::object_version_id version_id;
    change_control::contribution contribution;
    change_control::versioned_object<T> container;
};

/**
 * @brief Outcome of versioned_store::update
 */
struct commit_result {
    identification::object_version_id version_id;
    change_control::contribution contribution;
};

/**
 * @class versioned_store
 * @brief Create, update, attest and read versioned records of type T
 *
 * Each create or update writes one contribution holding one version.
 * Updates on the same container are serialized through the lock manager
 * so that the head read and the commit naming it cannot interleave.
 *
 * Thread Safety: thread-safe when the underlying store is.
 *
 * @example
 * @code
 * auto store = std::make_shared<storage::memory_version_store>();
 * versioned_store<person> records{store, terminology, "ehr.example.org"};
 *
 * auto created = records.create(alice, owner, committer);
 * auto updated = records.update(created.value().container.uid(), alice_v2, committer);
 * auto latest = records.read_latest(created.value().container.uid());
 * @endcode
 */
template <typename T>
class versioned_store {
public:
    using clock_function = std::function<core::timestamp()>;

    /**
     * @param store Persistence backend
     * @param terminology Terminology validating every code
     * @param system_id Identifier of this system, written into version ids
     *        and audits
     * @param clock Source of commit times, system_clock::now when empty
     * @param logger Logger, the null logger when null
     */
    versioned_store(std::shared_ptr<storage::version_store_interface> store,
                    std::shared_ptr<const terminology::terminology_service> terminology,
                    std::string system_id,
                    clock_function clock = nullptr,
                    std::shared_ptr<di::ILogger> logger = nullptr)
        : store_(std::move(store)),
          terminology_(std::move(terminology)),
          system_id_(std::move(system_id)),
          clock_(clock ? std::move(clock) : clock_function{[] {
              return std::chrono::system_clock::now();
          }}),
          logger_(logger ? std::move(logger) : di::null_logger()) {}

    [[nodiscard]] auto system_id() const noexcept -> const std::string& { return system_id_; }

    [[nodiscard]] auto locks() noexcept -> container_lock_manager& { return locks_; }

    // ─────────────────────────────────────────────────────
    // Commits
    // ─────────────────────────────────────────────────────

    /**
     * @brief Create a new record with its first version
     *
     * The version id is "container::system_id::1" and the audit change
     * type is creation.
     *
     * @param data Payload of the first version
     * @param owner_id Object owning the new container (e.g. the EHR)
     * @param committer Party committing
     * @param lifecycle Lifecycle state of the first version
     * @param description Optional audit description
     */
    [[nodiscard]] auto create(T data,
                              identification::object_ref owner_id,
                              common::party_proxy committer,
                              terminology::version_lifecycle_state lifecycle =
                                  terminology::version_lifecycle_state::complete,
                              std::optional<std::string> description = std::nullopt)
        -> Result<create_result<T>> {
        const auto committer_name = committer.display_name();

        auto container_id = store_->generate_container_id(committer.external_ref());
        if (container_id.is_err()) {
            return reject<create_result<T>>("new record", container_id.error(), committer_name);
        }

        auto tree_id = identification::version_tree_id::trunk(1);
        if (tree_id.is_err()) {
            return tree_id.error();
        }
        auto version_id = identification::object_version_id::compose(container_id.value(),
                                                                      system_id_, tree_id.value());
        if (version_id.is_err()) {
            return reject<create_result<T>>(container_id.value().value(), version_id.error(),
                                            committer_name);
        }

        const auto now = clock_();
        change_control::versioned_object<T> container{container_id.value(), owner_id, now};

        auto committed = commit_one(container, version_id.value(), std::nullopt,
                                    terminology::audit_change_type::creation, lifecycle,
                                    std::move(data), std::move(committer), std::move(description),
                                    now, owner_id);
        if (committed.is_err()) {
            return committed.error();
        }

        logger_->info_fmt("Created record {} as {}", container_id.value().value(),
                          version_id.value().value());
        return create_result<T>{version_id.value(), committed.value(), std::move(container)};
    }

    /**
     * @brief Commit a new trunk version of an existing record
     *
     * The new version's trunk number is one above the highest trunk number
     * in the container. Without an explicit predecessor, the most recent
     * version of the stored revision history is used.
     *
     * @return container_not_found, precedence_violation,
     *         invalid_change_type, invalid_lifecycle_state or a storage error
     */
    [[nodiscard]] auto update(const identification::hier_object_id& container_uid,
                              T data,
                              common::party_proxy committer,
                              terminology::version_lifecycle_state lifecycle =
                                  terminology::version_lifecycle_state::complete,
                              terminology::audit_change_type change_type =
                                  terminology::audit_change_type::modification,
                              std::optional<identification::object_version_id> preceding =
                                  std::nullopt,
                              std::optional<std::string> description = std::nullopt)
        -> Result<commit_result> {
        const auto committer_name = committer.display_name();
        auto hold = locks_.acquire(container_uid);

        auto record = store_->retrieve_container(container_uid, committer.external_ref());
        if (record.is_err()) {
            return reject<commit_result>(container_uid.value(), record.error(), committer_name);
        }
        const auto& history = record.value().history;

        if (!preceding) {
            auto head = history.most_recent_version();
            if (head.is_err()) {
                return reject<commit_result>(container_uid.value(), head.error(), committer_name);
            }
            preceding = head.value();
        }

        auto first_trunk = identification::version_tree_id::trunk(1);
        if (first_trunk.is_err()) {
            return first_trunk.error();
        }
        auto tree_id = first_trunk.value();
        for (const auto& item : history.items()) {
            const auto& existing = item.version_id().version_tree_id();
            if (existing.compare_trunk(tree_id) >= 0) {
                tree_id = existing.next_trunk();
            }
        }

        auto version_id =
            identification::object_version_id::compose(container_uid, system_id_, tree_id);
        if (version_id.is_err()) {
            return reject<commit_result>(container_uid.value(), version_id.error(),
                                         committer_name);
        }

        const auto& metadata = record.value().metadata;
        change_control::versioned_object<T> scratch{metadata.uid, metadata.owner_id,
                                                    metadata.time_created};
        auto committed = commit_one(scratch, version_id.value(), std::move(preceding), change_type,
                                    lifecycle, std::move(data), std::move(committer),
                                    std::move(description), clock_(), std::nullopt);
        if (committed.is_err()) {
            return committed.error();
        }

        logger_->info_fmt("Updated record {} to {}", container_uid.value(),
                          version_id.value().value());
        return commit_result{version_id.value(), committed.value()};
    }

    /**
     * @brief Append an attestation to a stored original version
     * @return version_not_found or not_an_original_version
     */
    [[nodiscard]] auto attest(const identification::object_version_id& version_id,
                              const common::attestation& entry) -> VoidResult {
        auto hold = locks_.acquire(version_id.container_id());

        auto result = store_->add_attestation(version_id, entry, entry.committer().external_ref());
        if (result.is_err()) {
            integration::logger_adapter::log_commit_rejected(
                version_id.value(), result.error().message, entry.committer().display_name());
            logger_->warn_fmt("Attestation of {} rejected: {}", version_id.value(),
                              result.error().message);
        }
        return result;
    }

    // ─────────────────────────────────────────────────────
    // Reads
    // ─────────────────────────────────────────────────────

    /**
     * @brief Rebuild the full container from the store
     * @return container_not_found, invalid_revision_history or a decode
     *         error
     */
    [[nodiscard]] auto load(const identification::hier_object_id& container_uid)
        -> Result<change_control::versioned_object<T>> {
        auto record = store_->retrieve_container(container_uid);
        if (record.is_err()) {
            return record.error();
        }

        auto stored = store_->retrieve_versions(container_uid);
        if (stored.is_err()) {
            return stored.error();
        }

        std::vector<change_control::version<T>> versions;
        versions.reserve(stored.value().size());
        for (const auto& entry : stored.value()) {
            auto decoded = storage::decode_stored_version<T>(entry, *terminology_);
            if (decoded.is_err()) {
                return decoded.error();
            }
            versions.push_back(decoded.value());
        }

        const auto& metadata = record.value().metadata;
        return change_control::versioned_object<T>::restore(
            metadata.uid, metadata.owner_id, metadata.time_created, record.value().history,
            std::move(versions));
    }

    /**
     * @brief Most recently committed version of a record
     * @return container_not_found or empty_collection
     */
    [[nodiscard]] auto read_latest(const identification::hier_object_id& container_uid)
        -> Result<change_control::version<T>> {
        auto record = store_->retrieve_container(container_uid);
        if (record.is_err()) {
            return record.error();
        }
        auto head = record.value().history.most_recent_version();
        if (head.is_err()) {
            return head.error();
        }
        return read_version(head.value());
    }

    /**
     * @return version_not_found or a decode error
     */
    [[nodiscard]] auto read_version(const identification::object_version_id& version_id)
        -> Result<change_control::version<T>> {
        auto stored = store_->retrieve_version(version_id);
        if (stored.is_err()) {
            return stored.error();
        }
        return storage::decode_stored_version<T>(stored.value(), *terminology_);
    }

private:
    template <typename R>
    [[nodiscard]] auto reject(const std::string& target,
                              const error_info& error,
                              const std::string& committer) -> Result<R> {
        integration::logger_adapter::log_commit_rejected(target, error.message, committer);
        logger_->warn_fmt("Commit to {} rejected: {}", target, error.message);
        return error;
    }

    /**
     * @brief Commit one original version as a contribution of its own
     *
     * The version is first committed to container, which checks it against
     * the in-memory state, then stored.
     */
    [[nodiscard]] auto commit_one(change_control::versioned_object<T>& container,
                                  const identification::object_version_id& version_id,
                                  std::optional<identification::object_version_id> preceding,
                                  terminology::audit_change_type change_type,
                                  terminology::version_lifecycle_state lifecycle,
                                  T data,
                                  common::party_proxy committer,
                                  std::optional<std::string> description,
                                  core::timestamp now,
                                  const std::optional<identification::object_ref>& owner_id)
        -> Result<change_control::contribution> {
        const auto committer_name = committer.display_name();
        const auto committer_ref = committer.external_ref();

        auto contribution_id = store_->generate_container_id(committer_ref);
        if (contribution_id.is_err()) {
            return reject<change_control::contribution>(version_id.value(),
                                                        contribution_id.error(), committer_name);
        }

        auto audit = common::audit_details::create(
            system_id_, now, terminology::to_coded_text(change_type), std::move(committer),
            *terminology_, std::move(description));
        if (audit.is_err()) {
            return reject<change_control::contribution>(version_id.value(), audit.error(),
                                                        committer_name);
        }

        change_control::contribution contribution{
            contribution_id.value(), {identification::object_ref::to_version(version_id)},
            audit.value()};

        auto version = original_version_for(container, contribution, version_id,
                                            std::move(preceding), lifecycle, std::move(data));
        if (version.is_err()) {
            return reject<change_control::contribution>(version_id.value(), version.error(),
                                                        committer_name);
        }

        std::vector<storage::stored_version> batch{
            storage::to_stored_version(change_control::version<T>{version.value()})};
        auto stored = store_->commit_contribution_set(contribution, batch, owner_id, committer_ref);
        if (stored.is_err()) {
            return reject<change_control::contribution>(version_id.value(), stored.error(),
                                                        committer_name);
        }
        return contribution;
    }

    [[nodiscard]] auto original_version_for(
        change_control::versioned_object<T>& container,
        const change_control::contribution& contribution,
        const identification::object_version_id& version_id,
        std::optional<identification::object_version_id> preceding,
        terminology::version_lifecycle_state lifecycle,
        T data) -> Result<change_control::original_version<T>> {
        // An empty scratch container cannot judge a predecessor it never saw;
        // the store checks precedence against the stored history instead.
        if (preceding && container.version_count() == 0) {
            return change_control::original_version<T>::create(
                contribution.ref(), contribution.audit, version_id, std::move(preceding),
                terminology::to_coded_text(lifecycle), std::move(data), *terminology_);
        }
        return container.commit_original_version(
            contribution.ref(), version_id, std::move(preceding), contribution.audit,
            terminology::to_coded_text(lifecycle), std::move(data), *terminology_);
    }

    std::shared_ptr<storage::version_store_interface> store_;
    std::shared_ptr<const terminology::terminology_service> terminology_;
    std::string system_id_;
    clock_function clock_;
    std::shared_ptr<di::ILogger> logger_;
    container_lock_manager locks_;
};

}  // namespace ehr::workflow
