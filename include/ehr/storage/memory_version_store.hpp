/**
 * @file memory_version_store.hpp
 * @brief Non-persistent version store for exploration and tests
 */

#pragma once

#include <ehr/di/ilogger.hpp>
#include <ehr/storage/version_store_interface.hpp>

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace ehr::storage {

/**
 * @brief In-memory implementation of version_store_interface
 *
 * Data lives only as long as the store. Reads take a shared lock on the
 * data; the action trail has its own mutex since reads append to it.
 */
class memory_version_store final : public version_store_interface {
public:
    explicit memory_version_store(std::shared_ptr<di::ILogger> logger = nullptr);
    ~memory_version_store() override = default;

    memory_version_store(const memory_version_store&) = delete;
    auto operator=(const memory_version_store&) -> memory_version_store& = delete;

    [[nodiscard]] auto generate_container_id(
        const std::optional<identification::object_ref>& generator = std::nullopt)
        -> Result<identification::hier_object_id> override;

    [[nodiscard]] auto create_container(
        const change_control::container_metadata& metadata,
        const common::revision_history& history,
        const std::optional<identification::object_ref>& creator = std::nullopt)
        -> VoidResult override;

    [[nodiscard]] auto retrieve_container(
        const identification::hier_object_id& uid,
        const std::optional<identification::object_ref>& reader = std::nullopt)
        -> Result<container_record> override;

    [[nodiscard]] auto commit_contribution_set(
        const change_control::contribution& contribution,
        const std::vector<stored_version>& versions,
        const std::optional<identification::object_ref>& owner_id = std::nullopt,
        const std::optional<identification::object_ref>& committer = std::nullopt)
        -> VoidResult override;

    [[nodiscard]] auto add_attestation(
        const identification::object_version_id& version_id,
        const common::attestation& entry,
        const std::optional<identification::object_ref>& attester = std::nullopt)
        -> VoidResult override;

    [[nodiscard]] auto retrieve_version(
        const identification::object_version_id& version_id,
        const std::optional<identification::object_ref>& reader = std::nullopt)
        -> Result<stored_version> override;

    [[nodiscard]] auto retrieve_contribution(
        const identification::hier_object_id& uid,
        const std::optional<identification::object_ref>& reader = std::nullopt)
        -> Result<change_control::contribution> override;

    [[nodiscard]] auto retrieve_versions(
        const identification::hier_object_id& uid,
        const std::optional<identification::object_ref>& reader = std::nullopt)
        -> Result<std::vector<stored_version>> override;

    [[nodiscard]] auto retrieve_metadata(
        std::string_view uid,
        const std::optional<identification::object_ref>& reader = std::nullopt)
        -> Result<store_metadata> override;

private:
    void record_action(const std::string& uid,
                       store_action action,
                       const std::optional<identification::object_ref>& party,
                       const std::optional<std::string>& object_type = std::nullopt);

    std::shared_ptr<di::ILogger> logger_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, container_record> containers_;
    std::unordered_map<std::string, stored_version> versions_;
    std::unordered_map<std::string, change_control::contribution> contributions_;

    std::mutex metadata_mutex_;
    std::unordered_map<std::string, store_metadata> metadata_;
};

}  // namespace ehr::storage
