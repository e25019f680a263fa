/**
 * @file version_store_interface.cpp
 * @brief Shared helpers of the version store implementations
 */

#include <ehr/storage/version_store_interface.hpp>

#include <ehr/compat/format.hpp>
#include <ehr/integration/logger_adapter.hpp>

#include <random>
#include <unordered_set>

namespace ehr::storage {

auto to_string(store_action action) -> std::string {
    switch (action) {
        case store_action::create: return "create";
        case store_action::read: return "read";
        case store_action::update: return "update";
        case store_action::remove: return "delete";
        case store_action::generate_id: return "generate_id";
        case store_action::read_metadata: return "read_metadata";
        case store_action::update_attestations: return "update_attestations";
        default: return "unknown";
    }
}

auto parse_store_action(std::string_view str) -> std::optional<store_action> {
    if (str == "create") return store_action::create;
    if (str == "read") return store_action::read;
    if (str == "update") return store_action::update;
    if (str == "delete") return store_action::remove;
    if (str == "generate_id") return store_action::generate_id;
    if (str == "read_metadata") return store_action::read_metadata;
    if (str == "update_attestations") return store_action::update_attestations;
    return std::nullopt;
}

// =============================================================================
// stored_version
// =============================================================================

auto stored_version::is_original() const -> bool {
    auto type_name = serialization::detail::type_of(document);
    return type_name.is_ok() && type_name.value() == serialization::type_tags::original_version;
}

auto stored_version_from_document(serialization::json document,
                                  const terminology::terminology_service& terminology)
    -> Result<stored_version> {
    namespace codec = serialization;

    auto type_name = codec::detail::type_of(document);
    if (type_name.is_err()) {
        return type_name.error();
    }

    const serialization::json* item = nullptr;
    if (type_name.value() == codec::type_tags::original_version) {
        item = &document;
    } else if (type_name.value() == codec::type_tags::imported_version) {
        auto item_field = codec::detail::field(document, "item");
        if (item_field.is_err()) {
            return item_field.error();
        }
        item = item_field.value();
    } else {
        return ehr_error<stored_version>(
            error_codes::unknown_type_tag,
            compat::format("Expected version record, found {}", type_name.value()));
    }

    auto uid_field = codec::detail::field(*item, "uid");
    if (uid_field.is_err()) {
        return uid_field.error();
    }
    auto uid = codec::decode_object_version_id(*uid_field.value());
    if (uid.is_err()) {
        return uid.error();
    }

    std::optional<identification::object_version_id> preceding;
    if (item->contains("preceding_version_uid")) {
        auto id = codec::decode_object_version_id(item->at("preceding_version_uid"));
        if (id.is_err()) {
            return id.error();
        }
        preceding = id.value();
    }

    auto contribution_field = codec::detail::field(document, "contribution");
    if (contribution_field.is_err()) {
        return contribution_field.error();
    }
    auto contribution = codec::decode_object_ref(*contribution_field.value());
    if (contribution.is_err()) {
        return contribution.error();
    }

    auto audit_field = codec::detail::field(document, "commit_audit");
    if (audit_field.is_err()) {
        return audit_field.error();
    }
    auto commit_audit = codec::decode_audit_details(*audit_field.value(), terminology);
    if (commit_audit.is_err()) {
        return commit_audit.error();
    }

    return stored_version{uid.value(), std::move(preceding), contribution.value(),
                          commit_audit.value(), std::move(document)};
}

// =============================================================================
// Shared validation
// =============================================================================

auto validate_contribution_set(const change_control::contribution& contribution,
                               const std::vector<stored_version>& versions) -> VoidResult {
    std::unordered_set<std::string> version_ids;
    for (const auto& v : versions) {
        version_ids.insert(v.uid.value());
        if (v.contribution.id().value() != contribution.uid.value()) {
            return ehr_void_error(
                error_codes::contribution_inconsistent,
                compat::format("Version {} does not reference contribution {}", v.uid.value(),
                               contribution.uid.value()));
        }
    }

    for (const auto& ref : contribution.versions) {
        if (!version_ids.contains(ref.id().value())) {
            return ehr_void_error(
                error_codes::contribution_inconsistent,
                compat::format("Contribution {} lists version {} which is not being committed",
                               contribution.uid.value(), ref.id().value()));
        }
    }
    return ok();
}

auto check_version_precedence(const common::revision_history& history,
                              const stored_version& version) -> VoidResult {
    if (history.find(version.uid) != nullptr) {
        return ehr_void_error(error_codes::duplicate_version_id,
                              compat::format("Version {} is already committed",
                                             version.uid.value()));
    }

    if (history.empty()) {
        if (version.preceding_version_uid) {
            return ehr_void_error(
                error_codes::precedence_violation,
                compat::format("First version {} must not name a preceding version",
                               version.uid.value()));
        }
        return ok();
    }

    if (!version.preceding_version_uid) {
        return ehr_void_error(error_codes::precedence_violation,
                              compat::format("Version {} must name a preceding version",
                                             version.uid.value()));
    }
    if (history.find(*version.preceding_version_uid) == nullptr) {
        return ehr_void_error(
            error_codes::precedence_violation,
            compat::format("Preceding version {} of {} is not in the container",
                           version.preceding_version_uid->value(), version.uid.value()));
    }
    return ok();
}

auto append_attestation_to_document(serialization::json& document,
                                    const common::attestation& entry) -> VoidResult {
    auto type_name = serialization::detail::type_of(document);
    if (type_name.is_err()) {
        return type_name.error();
    }
    if (type_name.value() != serialization::type_tags::original_version) {
        return ehr_void_error(error_codes::not_an_original_version,
                              compat::format("Cannot attest a {} record", type_name.value()));
    }

    auto& attestations = document["attestations"];
    if (attestations.is_null()) {
        attestations = serialization::json::array();
    }
    attestations.push_back(serialization::encode(entry));
    return ok();
}

void audit_contribution_set(const change_control::contribution& contribution,
                            const std::vector<stored_version>& versions,
                            const std::vector<change_control::container_metadata>& created) {
    using integration::logger_adapter;

    for (const auto& metadata : created) {
        logger_adapter::log_container_created(metadata.uid.value(),
                                              metadata.owner_id.id().value());
    }
    for (const auto& v : versions) {
        logger_adapter::log_version_committed(v.uid.value(), v.commit_audit.change_type().value,
                                              v.commit_audit.committer().display_name());
    }
    logger_adapter::log_contribution_committed(contribution.uid.value(), versions.size(),
                                               contribution.audit.committer().display_name());
}

auto generate_uuid() -> std::string {
    static thread_local std::mt19937 gen{std::random_device{}()};
    std::uniform_int_distribution<> dis(0, 15);
    static const char* hex = "0123456789abcdef";

    std::string uuid = "xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx";
    for (char& c : uuid) {
        if (c == 'x') {
            c = hex[dis(gen)];
        } else if (c == 'y') {
            c = hex[(dis(gen) & 0x3) | 0x8];
        }
    }
    return uuid;
}

}  // namespace ehr::storage
