/**
 * @file sqlite_version_store.hpp
 * @brief SQLite document store for versioned objects
 *
 * Containers, versions and contributions are kept as JSON documents, one
 * row each, next to a metadata table and the action trail. Each contribution
 * set is written in a single transaction.
 */

#pragma once

#include <ehr/di/ilogger.hpp>
#include <ehr/storage/version_store_interface.hpp>
#include <ehr/terminology/terminology_service.hpp>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

// Forward declaration for SQLite3
struct sqlite3;

namespace ehr::storage {

/**
 * @brief SQLite implementation of version_store_interface
 *
 * Thread Safety: all methods serialize on one mutex around the connection.
 *
 * @example
 * @code
 * auto store = sqlite_version_store::open("records.db");
 * if (store.is_err()) {
 *     // handle database_open_error
 * }
 * auto id = store.value()->generate_container_id();
 * @endcode
 */
class sqlite_version_store final : public version_store_interface {
public:
    /**
     * @brief Open (or create) a store
     *
     * @param db_path Database file, or ":memory:"
     * @param terminology Terminology used to validate decoded audits,
     *        the built-in openEHR terminology when null
     * @param logger Logger, the null logger when null
     * @return The store, or database_open_error
     */
    [[nodiscard]] static auto open(
        std::string_view db_path,
        std::shared_ptr<const terminology::terminology_service> terminology = nullptr,
        std::shared_ptr<di::ILogger> logger = nullptr)
        -> Result<std::unique_ptr<sqlite_version_store>>;

    ~sqlite_version_store() override;

    sqlite_version_store(const sqlite_version_store&) = delete;
    auto operator=(const sqlite_version_store&) -> sqlite_version_store& = delete;

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

    [[nodiscard]] auto path() const -> std::string_view { return path_; }

private:
    sqlite_version_store(sqlite3* db,
                         std::string path,
                         std::shared_ptr<const terminology::terminology_service> terminology,
                         std::shared_ptr<di::ILogger> logger);

    [[nodiscard]] auto initialize_tables() -> VoidResult;

    // The *_locked helpers expect mutex_ to be held

    [[nodiscard]] auto execute_locked(const char* sql) -> VoidResult;

    [[nodiscard]] auto metadata_exists_locked(const std::string& uid) -> Result<bool>;

    [[nodiscard]] auto record_action_locked(const std::string& uid,
                                            store_action action,
                                            const std::optional<identification::object_ref>& party,
                                            const std::optional<std::string>& object_type = std::nullopt)
        -> VoidResult;

    [[nodiscard]] auto load_container_locked(const std::string& uid)
        -> Result<std::optional<container_record>>;

    [[nodiscard]] auto save_container_locked(const container_record& record) -> VoidResult;

    [[nodiscard]] auto load_version_locked(const std::string& uid)
        -> Result<std::optional<stored_version>>;

    [[nodiscard]] auto save_version_locked(const stored_version& version) -> VoidResult;

    [[nodiscard]] auto contribution_exists_locked(const std::string& uid) -> Result<bool>;

    [[nodiscard]] auto commit_locked(const change_control::contribution& contribution,
                                     const std::vector<stored_version>& versions,
                                     const std::optional<identification::object_ref>& owner_id,
                                     const std::optional<identification::object_ref>& committer,
                                     std::vector<change_control::container_metadata>& created)
        -> VoidResult;

    sqlite3* db_{nullptr};
    std::string path_;
    std::shared_ptr<const terminology::terminology_service> terminology_;
    std::shared_ptr<di::ILogger> logger_;
    std::mutex mutex_;
};

}  // namespace ehr::storage
