/**
 * @file memory_version_store.cpp
 * @brief Implementation of the in-memory version store
 */

#include <ehr/storage/memory_version_store.hpp>

#include <ehr/compat/format.hpp>

#include <chrono>
#include <map>

namespace ehr::storage {

namespace {

constexpr const char* versioned_object_type = "VERSIONED_OBJECT";
constexpr const char* contribution_type = "CONTRIBUTION";

auto version_type(const stored_version& v) -> std::string {
    return std::string(v.is_original() ? serialization::type_tags::original_version
                                       : serialization::type_tags::imported_version);
}

}  // namespace

memory_version_store::memory_version_store(std::shared_ptr<di::ILogger> logger)
    : logger_(logger ? std::move(logger) : di::null_logger()) {
    logger_->info("Started in-memory version store, data is not persisted");
}

// =============================================================================
// Identifiers and containers
// =============================================================================

auto memory_version_store::generate_container_id(
    const std::optional<identification::object_ref>& generator)
    -> Result<identification::hier_object_id> {
    std::string value;
    {
        std::lock_guard lock(metadata_mutex_);
        do {
            value = generate_uuid();
        } while (metadata_.contains(value));

        metadata_.emplace(value, store_metadata{value, std::nullopt, false, {}});
    }
    record_action(value, store_action::generate_id, generator);

    logger_->debug_fmt("{}: generated", value);
    return identification::hier_object_id::create(value);
}

auto memory_version_store::create_container(const change_control::container_metadata& metadata,
                                            const common::revision_history& history,
                                            const std::optional<identification::object_ref>& creator)
    -> VoidResult {
    const auto& key = metadata.uid.value();
    {
        std::unique_lock lock(mutex_);
        if (containers_.contains(key)) {
            return ehr_void_error(error_codes::container_already_exists,
                                  compat::format("Versioned object {} already exists", key));
        }
        containers_.emplace(key, container_record{metadata, history});
    }
    record_action(key, store_action::create, creator, versioned_object_type);

    logger_->info_fmt("{}: created versioned object with {} revision(s)", key, history.size());
    return ok();
}

auto memory_version_store::retrieve_container(const identification::hier_object_id& uid,
                                              const std::optional<identification::object_ref>& reader)
    -> Result<container_record> {
    std::optional<container_record> found;
    {
        std::shared_lock lock(mutex_);
        auto it = containers_.find(uid.value());
        if (it != containers_.end()) {
            found = it->second;
        }
    }
    if (!found) {
        return ehr_error<container_record>(
            error_codes::container_not_found,
            compat::format("Versioned object {} not found", uid.value()));
    }
    record_action(uid.value(), store_action::read, reader);
    return std::move(*found);
}

// =============================================================================
// Contributions
// =============================================================================

auto memory_version_store::commit_contribution_set(
    const change_control::contribution& contribution,
    const std::vector<stored_version>& versions,
    const std::optional<identification::object_ref>& owner_id,
    const std::optional<identification::object_ref>& committer) -> VoidResult {
    auto consistent = validate_contribution_set(contribution, versions);
    if (consistent.is_err()) {
        return consistent;
    }

    std::vector<change_control::container_metadata> created;
    {
        std::unique_lock lock(mutex_);

        if (contributions_.contains(contribution.uid.value())) {
            return ehr_void_error(
                error_codes::contribution_inconsistent,
                compat::format("Contribution {} is already stored", contribution.uid.value()));
        }

        // Stage every touched container so a failure leaves the store as it was
        std::map<std::string, container_record> staged;
        for (const auto& v : versions) {
            auto container_id = v.owner_id();
            const auto& key = container_id.value();

            auto it = staged.find(key);
            if (it == staged.end()) {
                auto existing = containers_.find(key);
                if (existing != containers_.end()) {
                    it = staged.emplace(key, existing->second).first;
                } else if (owner_id) {
                    change_control::container_metadata metadata{
                        container_id, *owner_id, v.commit_audit.time_committed()};
                    created.push_back(metadata);
                    it = staged.emplace(key, container_record{std::move(metadata), {}}).first;
                } else {
                    return ehr_void_error(
                        error_codes::container_not_found,
                        compat::format("Versioned object {} does not exist and no owner was given",
                                       key));
                }
            }

            auto precedence = check_version_precedence(it->second.history, v);
            if (precedence.is_err()) {
                return precedence;
            }
            it->second.history.add_item(common::revision_history_item{v.uid, v.commit_audit});
        }

        for (auto& [key, record] : staged) {
            containers_.insert_or_assign(key, std::move(record));
        }
        for (const auto& v : versions) {
            versions_.emplace(v.uid.value(), v);
        }
        contributions_.emplace(contribution.uid.value(), contribution);
    }

    for (const auto& metadata : created) {
        record_action(metadata.uid.value(), store_action::create, committer,
                      versioned_object_type);
    }
    for (const auto& v : versions) {
        record_action(v.owner_id().value(), store_action::update, committer);
        record_action(v.uid.value(), store_action::create, committer, version_type(v));
    }
    record_action(contribution.uid.value(), store_action::create, committer, contribution_type);

    audit_contribution_set(contribution, versions, created);
    logger_->info_fmt("Committed contribution {} with {} version(s)", contribution.uid.value(),
                      versions.size());
    return ok();
}

auto memory_version_store::add_attestation(const identification::object_version_id& version_id,
                                           const common::attestation& entry,
                                           const std::optional<identification::object_ref>& attester)
    -> VoidResult {
    const auto container_key = version_id.container_id().value();
    {
        std::unique_lock lock(mutex_);

        auto version_it = versions_.find(version_id.value());
        auto container_it = containers_.find(container_key);
        if (version_it == versions_.end() || container_it == containers_.end()) {
            return ehr_void_error(error_codes::version_not_found,
                                  compat::format("Version {} not found", version_id.value()));
        }

        auto document = version_it->second.document;
        auto appended = append_attestation_to_document(document, entry);
        if (appended.is_err()) {
            return appended;
        }

        auto history = container_it->second.history;
        auto attested = history.append_attestation(version_id, entry);
        if (attested.is_err()) {
            return attested;
        }

        version_it->second.document = std::move(document);
        container_it->second.history = std::move(history);
    }

    record_action(version_id.value(), store_action::update_attestations, attester);
    record_action(container_key, store_action::update, attester);

    integration::logger_adapter::log_attestation_added(version_id.value(),
                                                       entry.committer().display_name());
    logger_->info_fmt("{}: added attestation", version_id.value());
    return ok();
}

// =============================================================================
// Retrieval
// =============================================================================

auto memory_version_store::retrieve_version(const identification::object_version_id& version_id,
                                            const std::optional<identification::object_ref>& reader)
    -> Result<stored_version> {
    std::optional<stored_version> found;
    {
        std::shared_lock lock(mutex_);
        auto it = versions_.find(version_id.value());
        if (it != versions_.end()) {
            found = it->second;
        }
    }
    if (!found) {
        return ehr_error<stored_version>(
            error_codes::version_not_found,
            compat::format("Version {} not found", version_id.value()));
    }
    record_action(version_id.value(), store_action::read, reader);
    return std::move(*found);
}

auto memory_version_store::retrieve_contribution(
    const identification::hier_object_id& uid,
    const std::optional<identification::object_ref>& reader)
    -> Result<change_control::contribution> {
    std::optional<change_control::contribution> found;
    {
        std::shared_lock lock(mutex_);
        auto it = contributions_.find(uid.value());
        if (it != contributions_.end()) {
            found = it->second;
        }
    }
    if (!found) {
        return ehr_error<change_control::contribution>(
            error_codes::object_not_found,
            compat::format("Contribution {} not found", uid.value()));
    }
    record_action(uid.value(), store_action::read, reader);
    return std::move(*found);
}

auto memory_version_store::retrieve_versions(const identification::hier_object_id& uid,
                                             const std::optional<identification::object_ref>& reader)
    -> Result<std::vector<stored_version>> {
    std::vector<stored_version> result;
    {
        std::shared_lock lock(mutex_);
        auto container_it = containers_.find(uid.value());
        if (container_it == containers_.end()) {
            return ehr_error<std::vector<stored_version>>(
                error_codes::container_not_found,
                compat::format("Versioned object {} not found", uid.value()));
        }

        const auto& items = container_it->second.history.items();
        result.reserve(items.size());
        for (const auto& item : items) {
            auto it = versions_.find(item.version_id().value());
            if (it == versions_.end()) {
                return ehr_error<std::vector<stored_version>>(
                    error_codes::version_not_found,
                    compat::format("Version {} is in the revision history of {} but not stored",
                                   item.version_id().value(), uid.value()));
            }
            result.push_back(it->second);
        }
    }

    record_action(uid.value(), store_action::read, reader);
    for (const auto& v : result) {
        record_action(v.uid.value(), store_action::read, reader);
    }
    return result;
}

auto memory_version_store::retrieve_metadata(std::string_view uid,
                                             const std::optional<identification::object_ref>& reader)
    -> Result<store_metadata> {
    std::lock_guard lock(metadata_mutex_);

    auto it = metadata_.find(std::string(uid));
    if (it == metadata_.end()) {
        return ehr_error<store_metadata>(error_codes::object_not_found,
                                         compat::format("No metadata for {}", uid));
    }
    it->second.action_history.push_back(
        store_action_item{store_action::read_metadata, std::chrono::system_clock::now(), reader});
    return it->second;
}

// =============================================================================
// Private Helpers
// =============================================================================

void memory_version_store::record_action(const std::string& uid,
                                         store_action action,
                                         const std::optional<identification::object_ref>& party,
                                         const std::optional<std::string>& object_type) {
    std::lock_guard lock(metadata_mutex_);

    auto [it, inserted] = metadata_.try_emplace(uid, store_metadata{uid, std::nullopt, false, {}});
    if (object_type) {
        it->second.object_type = object_type;
    }
    it->second.action_history.push_back(
        store_action_item{action, std::chrono::system_clock::now(), party});
}

}  // namespace ehr::storage
