/**
 * @file version_store_interface.hpp
 * @brief Abstract persistence interface for versioned objects
 *
 * This file defines version_store_interface, the persistence boundary of
 * the change-control engine. Stores are payload agnostic: versions cross
 * the boundary as stored_version records carrying their JSON document, and
 * the typed side converts with to_stored_version() and
 * decode_stored_version<T>().
 *
 * Every object a store keeps also has a store_metadata entry with the
 * trail of actions performed on it.
 */

#pragma once

#include <ehr/change_control/container_metadata.hpp>
#include <ehr/change_control/contribution.hpp>
#include <ehr/change_control/version.hpp>
#include <ehr/common/attestation.hpp>
#include <ehr/common/revision_history.hpp>
#include <ehr/core/result.hpp>
#include <ehr/core/timestamp.hpp>
#include <ehr/identification/hier_object_id.hpp>
#include <ehr/identification/object_ref.hpp>
#include <ehr/identification/object_version_id.hpp>
#include <ehr/serialization/version_codec.hpp>
#include <ehr/terminology/terminology_service.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ehr::storage {

// =============================================================================
// Store metadata
// =============================================================================

/**
 * @brief Kind of action recorded in the trail of a stored object
 */
enum class store_action {
    create,
    read,
    update,
    remove,
    generate_id,
    read_metadata,
    update_attestations
};

[[nodiscard]] auto to_string(store_action action) -> std::string;

[[nodiscard]] auto parse_store_action(std::string_view str) -> std::optional<store_action>;

/**
 * @brief One entry of the action trail
 */
struct store_action_item {
    store_action action{store_action::read};
    core::timestamp action_time;

    /// Party that performed the action, when the caller named one
    std::optional<identification::object_ref> party;
};

/**
 * @brief Metadata the store keeps for every identifier it has handed out
 *        or stored
 */
struct store_metadata {
    std::string uid;

    /// Record type ("VERSIONED_OBJECT", "CONTRIBUTION", "ORIGINAL_VERSION",
    /// "IMPORTED_VERSION"); absent for a generated but unused id
    std::optional<std::string> object_type;

    bool is_deleted{false};

    std::vector<store_action_item> action_history;
};

// =============================================================================
// Stored records
// =============================================================================

/**
 * @brief Container header together with its revision history
 */
struct container_record {
    change_control::container_metadata metadata;
    common::revision_history history;
};

/**
 * @brief A version as seen by the store
 *
 * The identifying fields are lifted out of the document so stores can check
 * precedence and batch consistency without knowing the payload type.
 */
struct stored_version {
    identification::object_version_id uid;
    std::optional<identification::object_version_id> preceding_version_uid;
    identification::object_ref contribution;
    common::audit_details commit_audit;

    /// ORIGINAL_VERSION or IMPORTED_VERSION record
    serialization::json document;

    [[nodiscard]] auto is_original() const -> bool;

    [[nodiscard]] auto owner_id() const -> identification::hier_object_id {
        return uid.container_id();
    }
};

/**
 * @brief Convert a typed version into its stored form
 */
template <typename T>
[[nodiscard]] auto to_stored_version(const change_control::version<T>& v) -> stored_version {
    return stored_version{v.uid(), v.preceding_version_uid(), v.contribution(),
                          v.commit_audit(), serialization::encode(v)};
}

/**
 * @brief Decode the typed version held by a stored record
 */
template <typename T>
[[nodiscard]] auto decode_stored_version(const stored_version& stored,
                                         const terminology::terminology_service& terminology)
    -> Result<change_control::version<T>> {
    return serialization::decode_version<T>(stored.document, terminology);
}

/**
 * @brief Rebuild a stored_version from its document alone
 * @return decode_error, missing_field or unknown_type_tag on a malformed
 *         document
 */
[[nodiscard]] auto stored_version_from_document(serialization::json document,
                                                const terminology::terminology_service& terminology)
    -> Result<stored_version>;

// =============================================================================
// Shared validation
// =============================================================================

/**
 * @brief Check that a batch of versions matches its contribution
 *
 * Every version must reference the contribution, and every version
 * reference listed in the contribution must name one of the versions.
 *
 * @return contribution_inconsistent on the first mismatch
 */
[[nodiscard]] auto validate_contribution_set(const change_control::contribution& contribution,
                                             const std::vector<stored_version>& versions)
    -> VoidResult;

/**
 * @brief Check a version against the revision history of its container
 *
 * The first version of a container names no predecessor; later ones name a
 * version already in the history. The version id itself must be new.
 *
 * @return precedence_violation or duplicate_version_id
 */
[[nodiscard]] auto check_version_precedence(const common::revision_history& history,
                                            const stored_version& version) -> VoidResult;

/**
 * @brief Append an attestation to an ORIGINAL_VERSION document
 * @return not_an_original_version for any other record type
 */
[[nodiscard]] auto append_attestation_to_document(serialization::json& document,
                                                  const common::attestation& entry)
    -> VoidResult;

/**
 * @brief Write the audit trail entries of a stored contribution set
 * @param created Containers the commit created
 */
void audit_contribution_set(const change_control::contribution& contribution,
                            const std::vector<stored_version>& versions,
                            const std::vector<change_control::container_metadata>& created);

/**
 * @brief Generate a random (version 4) UUID string
 */
[[nodiscard]] auto generate_uuid() -> std::string;

// =============================================================================
// Store interface
// =============================================================================

/**
 * @brief Abstract persistence interface for versioned objects
 *
 * Thread Safety:
 * - All methods must be thread-safe in concrete implementations
 * - commit_contribution_set() must be atomic: on failure nothing of the
 *   batch is visible
 *
 * The optional party arguments are recorded in the action trail only.
 *
 * @example
 * @code
 * memory_version_store store;
 * auto id = store.generate_container_id();
 *
 * std::vector<stored_version> batch{to_stored_version(first)};
 * auto result = store.commit_contribution_set(contribution, batch, owner);
 *
 * auto container = store.retrieve_container(id.value());
 * @endcode
 */
class version_store_interface {
public:
    virtual ~version_store_interface() = default;

    /**
     * @brief Hand out a container id unused within this store
     * @param generator Party requesting the id
     */
    [[nodiscard]] virtual auto generate_container_id(
        const std::optional<identification::object_ref>& generator = std::nullopt)
        -> Result<identification::hier_object_id> = 0;

    /**
     * @brief Store a container header and its revision history
     *
     * Versions named by the history are not stored by this call.
     *
     * @return container_already_exists when the id is taken
     */
    [[nodiscard]] virtual auto create_container(
        const change_control::container_metadata& metadata,
        const common::revision_history& history,
        const std::optional<identification::object_ref>& creator = std::nullopt) -> VoidResult = 0;

    /**
     * @brief Retrieve a container header and its revision history
     * @return container_not_found
     */
    [[nodiscard]] virtual auto retrieve_container(
        const identification::hier_object_id& uid,
        const std::optional<identification::object_ref>& reader = std::nullopt)
        -> Result<container_record> = 0;

    /**
     * @brief Atomically store a contribution and its versions
     *
     * Appends one revision history item per version. Containers that do
     * not exist yet are created when owner_id is given, with the commit
     * time of their first version as creation time.
     *
     * @return contribution_inconsistent, container_not_found,
     *         precedence_violation or duplicate_version_id
     */
    [[nodiscard]] virtual auto commit_contribution_set(
        const change_control::contribution& contribution,
        const std::vector<stored_version>& versions,
        const std::optional<identification::object_ref>& owner_id = std::nullopt,
        const std::optional<identification::object_ref>& committer = std::nullopt)
        -> VoidResult = 0;

    /**
     * @brief Append an attestation to a stored original version and to its
     *        revision history item
     * @return version_not_found or not_an_original_version
     */
    [[nodiscard]] virtual auto add_attestation(
        const identification::object_version_id& version_id,
        const common::attestation& entry,
        const std::optional<identification::object_ref>& attester = std::nullopt)
        -> VoidResult = 0;

    /**
     * @return version_not_found
     */
    [[nodiscard]] virtual auto retrieve_version(
        const identification::object_version_id& version_id,
        const std::optional<identification::object_ref>& reader = std::nullopt)
        -> Result<stored_version> = 0;

    /**
     * @return object_not_found
     */
    [[nodiscard]] virtual auto retrieve_contribution(
        const identification::hier_object_id& uid,
        const std::optional<identification::object_ref>& reader = std::nullopt)
        -> Result<change_control::contribution> = 0;

    /**
     * @brief All versions of a container in commit order
     * @return container_not_found
     */
    [[nodiscard]] virtual auto retrieve_versions(
        const identification::hier_object_id& uid,
        const std::optional<identification::object_ref>& reader = std::nullopt)
        -> Result<std::vector<stored_version>> = 0;

    /**
     * @brief Metadata and action trail of any stored identifier
     *
     * The returned trail includes the read_metadata action of this call.
     *
     * @return object_not_found
     */
    [[nodiscard]] virtual auto retrieve_metadata(
        std::string_view uid,
        const std::optional<identification::object_ref>& reader = std::nullopt)
        -> Result<store_metadata> = 0;

protected:
    version_store_interface() = default;
    version_store_interface(const version_store_interface&) = default;
    version_store_interface& operator=(const version_store_interface&) = default;
    version_store_interface(version_store_interface&&) = default;
    version_store_interface& operator=(version_store_interface&&) = default;
};

}  // namespace ehr::storage
