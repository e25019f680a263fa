/**
 * @file sqlite_version_store.cpp
 * @brief Implementation of the SQLite version store
 */

#include <ehr/storage/sqlite_version_store.hpp>

#include <ehr/compat/format.hpp>
#include <ehr/core/timestamp.hpp>
#include <ehr/serialization/json_codec.hpp>

#include <sqlite3.h>

#include <chrono>
#include <map>

namespace ehr::storage {

namespace codec = ehr::serialization;

// ============================================================================
// Helper Functions
// ============================================================================

namespace {

constexpr const char* versioned_object_type = "VERSIONED_OBJECT";
constexpr const char* contribution_type = "CONTRIBUTION";

/**
 * @brief Get text from statement column, returning empty string for NULL
 */
auto get_text(sqlite3_stmt* stmt, int col) -> std::string {
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? std::string(text) : std::string{};
}

auto is_null(sqlite3_stmt* stmt, int col) -> bool {
    return sqlite3_column_type(stmt, col) == SQLITE_NULL;
}

void bind_text(sqlite3_stmt* stmt, int index, const std::string& value) {
    sqlite3_bind_text(stmt, index, value.c_str(), static_cast<int>(value.size()),
                      SQLITE_TRANSIENT);
}

auto database_failure(sqlite3* db, std::string_view what) -> error_info {
    return error_info{error_codes::database_error,
                      compat::format("Failed to {}: {}", what, sqlite3_errmsg(db)), "ehr"};
}

auto parse_document(const std::string& text, std::string_view what) -> Result<codec::json> {
    auto document = codec::json::parse(text, nullptr, false);
    if (document.is_discarded()) {
        return ehr_error<codec::json>(error_codes::decode_error,
                                      compat::format("Stored {} is not valid JSON", what));
    }
    return document;
}

auto version_type(const stored_version& v) -> std::string {
    return std::string(v.is_original() ? codec::type_tags::original_version
                                       : codec::type_tags::imported_version);
}

}  // namespace

// ============================================================================
// Construction / Destruction
// ============================================================================

auto sqlite_version_store::open(std::string_view db_path,
                                std::shared_ptr<const terminology::terminology_service> terminology,
                                std::shared_ptr<di::ILogger> logger)
    -> Result<std::unique_ptr<sqlite_version_store>> {
    sqlite3* db = nullptr;

    auto rc = sqlite3_open(std::string(db_path).c_str(), &db);
    if (rc != SQLITE_OK) {
        std::string error_msg = db ? sqlite3_errmsg(db) : "Failed to allocate memory";
        if (db) {
            sqlite3_close(db);
        }
        return ehr_error<std::unique_ptr<sqlite_version_store>>(
            error_codes::database_open_error,
            compat::format("Failed to open database: {}", error_msg));
    }

    rc = sqlite3_exec(db, "PRAGMA foreign_keys = ON;", nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_close(db);
        return ehr_error<std::unique_ptr<sqlite_version_store>>(
            error_codes::database_open_error, "Failed to enable foreign keys");
    }

    if (!terminology) {
        terminology = std::make_shared<terminology::openehr_terminology>();
    }
    if (!logger) {
        logger = di::null_logger();
    }

    auto instance = std::unique_ptr<sqlite_version_store>(new sqlite_version_store(
        db, std::string(db_path), std::move(terminology), std::move(logger)));

    auto tables = instance->initialize_tables();
    if (tables.is_err()) {
        return ehr_error<std::unique_ptr<sqlite_version_store>>(
            error_codes::database_open_error,
            compat::format("Failed to initialize schema: {}", tables.error().message));
    }

    instance->logger_->info_fmt("Opened version store at {}", db_path);
    return instance;
}

sqlite_version_store::sqlite_version_store(
    sqlite3* db,
    std::string path,
    std::shared_ptr<const terminology::terminology_service> terminology,
    std::shared_ptr<di::ILogger> logger)
    : db_(db),
      path_(std::move(path)),
      terminology_(std::move(terminology)),
      logger_(std::move(logger)) {}

sqlite_version_store::~sqlite_version_store() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

auto sqlite_version_store::initialize_tables() -> VoidResult {
    std::lock_guard lock(mutex_);
    return execute_locked(R"(
        CREATE TABLE IF NOT EXISTS store_metadata (
            uid TEXT PRIMARY KEY,
            object_type TEXT,
            is_deleted INTEGER NOT NULL DEFAULT 0
        );
        CREATE TABLE IF NOT EXISTS store_actions (
            action_pk INTEGER PRIMARY KEY AUTOINCREMENT,
            uid TEXT NOT NULL REFERENCES store_metadata(uid),
            action TEXT NOT NULL,
            action_time TEXT NOT NULL,
            party TEXT
        );
        CREATE INDEX IF NOT EXISTS idx_store_actions_uid ON store_actions(uid);
        CREATE TABLE IF NOT EXISTS versioned_objects (
            uid TEXT PRIMARY KEY,
            metadata TEXT NOT NULL,
            revision_history TEXT NOT NULL
        );
        CREATE TABLE IF NOT EXISTS versions (
            uid TEXT PRIMARY KEY,
            container_uid TEXT NOT NULL REFERENCES versioned_objects(uid),
            document TEXT NOT NULL
        );
        CREATE INDEX IF NOT EXISTS idx_versions_container ON versions(container_uid);
        CREATE TABLE IF NOT EXISTS contributions (
            uid TEXT PRIMARY KEY,
            document TEXT NOT NULL
        );
    )");
}

// ============================================================================
// Identifiers and containers
// ============================================================================

auto sqlite_version_store::generate_container_id(
    const std::optional<identification::object_ref>& generator)
    -> Result<identification::hier_object_id> {
    std::lock_guard lock(mutex_);

    std::string value;
    while (true) {
        value = generate_uuid();
        auto exists = metadata_exists_locked(value);
        if (exists.is_err()) {
            return exists.error();
        }
        if (!exists.value()) {
            break;
        }
    }

    auto recorded = record_action_locked(value, store_action::generate_id, generator);
    if (recorded.is_err()) {
        return recorded.error();
    }

    logger_->debug_fmt("{}: generated", value);
    return identification::hier_object_id::create(value);
}

auto sqlite_version_store::create_container(const change_control::container_metadata& metadata,
                                            const common::revision_history& history,
                                            const std::optional<identification::object_ref>& creator)
    -> VoidResult {
    std::lock_guard lock(mutex_);
    const auto& key = metadata.uid.value();

    auto existing = load_container_locked(key);
    if (existing.is_err()) {
        return existing.error();
    }
    if (existing.value()) {
        return ehr_void_error(error_codes::container_already_exists,
                              compat::format("Versioned object {} already exists", key));
    }

    auto begin = execute_locked("BEGIN TRANSACTION;");
    if (begin.is_err()) {
        return begin;
    }

    auto saved = save_container_locked(container_record{metadata, history});
    if (saved.is_ok()) {
        saved = record_action_locked(key, store_action::create, creator, versioned_object_type);
    }
    if (saved.is_err()) {
        (void)execute_locked("ROLLBACK;");
        return saved;
    }

    auto commit = execute_locked("COMMIT;");
    if (commit.is_err()) {
        (void)execute_locked("ROLLBACK;");
        return commit;
    }

    logger_->info_fmt("{}: created versioned object with {} revision(s)", key, history.size());
    return ok();
}

auto sqlite_version_store::retrieve_container(const identification::hier_object_id& uid,
                                              const std::optional<identification::object_ref>& reader)
    -> Result<container_record> {
    std::lock_guard lock(mutex_);

    auto loaded = load_container_locked(uid.value());
    if (loaded.is_err()) {
        return loaded.error();
    }
    if (!loaded.value()) {
        return ehr_error<container_record>(
            error_codes::container_not_found,
            compat::format("Versioned object {} not found", uid.value()));
    }

    auto recorded = record_action_locked(uid.value(), store_action::read, reader);
    if (recorded.is_err()) {
        return recorded.error();
    }
    return std::move(*loaded.value());
}

// ============================================================================
// Contributions
// ============================================================================

auto sqlite_version_store::commit_contribution_set(
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
        std::lock_guard lock(mutex_);

        auto begin = execute_locked("BEGIN TRANSACTION;");
        if (begin.is_err()) {
            return begin;
        }

        auto written = commit_locked(contribution, versions, owner_id, committer, created);
        if (written.is_err()) {
            (void)execute_locked("ROLLBACK;");
            return written;
        }

        auto commit = execute_locked("COMMIT;");
        if (commit.is_err()) {
            (void)execute_locked("ROLLBACK;");
            return commit;
        }
    }

    audit_contribution_set(contribution, versions, created);
    logger_->info_fmt("Committed contribution {} with {} version(s)", contribution.uid.value(),
                      versions.size());
    return ok();
}

auto sqlite_version_store::commit_locked(
    const change_control::contribution& contribution,
    const std::vector<stored_version>& versions,
    const std::optional<identification::object_ref>& owner_id,
    const std::optional<identification::object_ref>& committer,
    std::vector<change_control::container_metadata>& created) -> VoidResult {
    auto duplicate = contribution_exists_locked(contribution.uid.value());
    if (duplicate.is_err()) {
        return duplicate.error();
    }
    if (duplicate.value()) {
        return ehr_void_error(
            error_codes::contribution_inconsistent,
            compat::format("Contribution {} is already stored", contribution.uid.value()));
    }

    std::map<std::string, container_record> staged;
    for (const auto& v : versions) {
        auto container_id = v.owner_id();
        const auto& key = container_id.value();

        auto it = staged.find(key);
        if (it == staged.end()) {
            auto existing = load_container_locked(key);
            if (existing.is_err()) {
                return existing.error();
            }
            if (existing.value()) {
                it = staged.emplace(key, std::move(*existing.value())).first;
            } else if (owner_id) {
                change_control::container_metadata metadata{container_id, *owner_id,
                                                            v.commit_audit.time_committed()};
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

    for (const auto& [key, record] : staged) {
        auto saved = save_container_locked(record);
        if (saved.is_err()) {
            return saved;
        }
    }
    for (const auto& metadata : created) {
        auto recorded = record_action_locked(metadata.uid.value(), store_action::create,
                                             committer, versioned_object_type);
        if (recorded.is_err()) {
            return recorded;
        }
    }

    for (const auto& v : versions) {
        auto saved = save_version_locked(v);
        if (saved.is_err()) {
            return saved;
        }
        auto recorded = record_action_locked(v.owner_id().value(), store_action::update, committer);
        if (recorded.is_ok()) {
            recorded = record_action_locked(v.uid.value(), store_action::create, committer,
                                            version_type(v));
        }
        if (recorded.is_err()) {
            return recorded;
        }
    }

    const char* sql = "INSERT INTO contributions (uid, document) VALUES (?, ?);";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return database_failure(db_, "prepare statement");
    }
    bind_text(stmt, 1, contribution.uid.value());
    bind_text(stmt, 2, codec::encode(contribution).dump());
    auto rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return database_failure(db_, "insert contribution");
    }

    return record_action_locked(contribution.uid.value(), store_action::create, committer,
                                contribution_type);
}

auto sqlite_version_store::add_attestation(const identification::object_version_id& version_id,
                                           const common::attestation& entry,
                                           const std::optional<identification::object_ref>& attester)
    -> VoidResult {
    const auto container_key = version_id.container_id().value();
    {
        std::lock_guard lock(mutex_);

        auto version = load_version_locked(version_id.value());
        if (version.is_err()) {
            return version.error();
        }
        auto container = load_container_locked(container_key);
        if (container.is_err()) {
            return container.error();
        }
        if (!version.value() || !container.value()) {
            return ehr_void_error(error_codes::version_not_found,
                                  compat::format("Version {} not found", version_id.value()));
        }

        auto& stored = *version.value();
        auto appended = append_attestation_to_document(stored.document, entry);
        if (appended.is_err()) {
            return appended;
        }

        auto& record = *container.value();
        auto attested = record.history.append_attestation(version_id, entry);
        if (attested.is_err()) {
            return attested;
        }

        auto begin = execute_locked("BEGIN TRANSACTION;");
        if (begin.is_err()) {
            return begin;
        }

        auto written = save_version_locked(stored);
        if (written.is_ok()) {
            written = save_container_locked(record);
        }
        if (written.is_ok()) {
            written = record_action_locked(version_id.value(), store_action::update_attestations,
                                           attester);
        }
        if (written.is_ok()) {
            written = record_action_locked(container_key, store_action::update, attester);
        }
        if (written.is_err()) {
            (void)execute_locked("ROLLBACK;");
            return written;
        }

        auto commit = execute_locked("COMMIT;");
        if (commit.is_err()) {
            (void)execute_locked("ROLLBACK;");
            return commit;
        }
    }

    integration::logger_adapter::log_attestation_added(version_id.value(),
                                                       entry.committer().display_name());
    logger_->info_fmt("{}: added attestation", version_id.value());
    return ok();
}

// ============================================================================
// Retrieval
// ============================================================================

auto sqlite_version_store::retrieve_version(const identification::object_version_id& version_id,
                                            const std::optional<identification::object_ref>& reader)
    -> Result<stored_version> {
    std::lock_guard lock(mutex_);

    auto loaded = load_version_locked(version_id.value());
    if (loaded.is_err()) {
        return loaded.error();
    }
    if (!loaded.value()) {
        return ehr_error<stored_version>(
            error_codes::version_not_found,
            compat::format("Version {} not found", version_id.value()));
    }

    auto recorded = record_action_locked(version_id.value(), store_action::read, reader);
    if (recorded.is_err()) {
        return recorded.error();
    }
    return std::move(*loaded.value());
}

auto sqlite_version_store::retrieve_contribution(
    const identification::hier_object_id& uid,
    const std::optional<identification::object_ref>& reader)
    -> Result<change_control::contribution> {
    std::lock_guard lock(mutex_);

    const char* sql = "SELECT document FROM contributions WHERE uid = ?;";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return database_failure(db_, "prepare statement");
    }
    bind_text(stmt, 1, uid.value());

    auto rc = sqlite3_step(stmt);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            return database_failure(db_, "read contribution");
        }
        return ehr_error<change_control::contribution>(
            error_codes::object_not_found,
            compat::format("Contribution {} not found", uid.value()));
    }
    auto text = get_text(stmt, 0);
    sqlite3_finalize(stmt);

    auto document = parse_document(text, "contribution");
    if (document.is_err()) {
        return document.error();
    }
    auto contribution = codec::decode_contribution(document.value(), *terminology_);
    if (contribution.is_err()) {
        return contribution.error();
    }

    auto recorded = record_action_locked(uid.value(), store_action::read, reader);
    if (recorded.is_err()) {
        return recorded.error();
    }
    return contribution;
}

auto sqlite_version_store::retrieve_versions(const identification::hier_object_id& uid,
                                             const std::optional<identification::object_ref>& reader)
    -> Result<std::vector<stored_version>> {
    std::lock_guard lock(mutex_);

    auto container = load_container_locked(uid.value());
    if (container.is_err()) {
        return container.error();
    }
    if (!container.value()) {
        return ehr_error<std::vector<stored_version>>(
            error_codes::container_not_found,
            compat::format("Versioned object {} not found", uid.value()));
    }

    std::vector<stored_version> result;
    for (const auto& item : container.value()->history.items()) {
        auto loaded = load_version_locked(item.version_id().value());
        if (loaded.is_err()) {
            return loaded.error();
        }
        if (!loaded.value()) {
            return ehr_error<std::vector<stored_version>>(
                error_codes::version_not_found,
                compat::format("Version {} is in the revision history of {} but not stored",
                               item.version_id().value(), uid.value()));
        }
        result.push_back(std::move(*loaded.value()));
    }

    auto recorded = record_action_locked(uid.value(), store_action::read, reader);
    if (recorded.is_err()) {
        return recorded.error();
    }
    for (const auto& v : result) {
        recorded = record_action_locked(v.uid.value(), store_action::read, reader);
        if (recorded.is_err()) {
            return recorded.error();
        }
    }
    return result;
}

auto sqlite_version_store::retrieve_metadata(std::string_view uid,
                                             const std::optional<identification::object_ref>& reader)
    -> Result<store_metadata> {
    std::lock_guard lock(mutex_);
    const std::string key(uid);

    store_metadata metadata;
    metadata.uid = key;

    const char* sql = "SELECT object_type, is_deleted FROM store_metadata WHERE uid = ?;";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return database_failure(db_, "prepare statement");
    }
    bind_text(stmt, 1, key);

    auto rc = sqlite3_step(stmt);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            return database_failure(db_, "read metadata");
        }
        return ehr_error<store_metadata>(error_codes::object_not_found,
                                         compat::format("No metadata for {}", key));
    }
    if (!is_null(stmt, 0)) {
        metadata.object_type = get_text(stmt, 0);
    }
    metadata.is_deleted = sqlite3_column_int(stmt, 1) != 0;
    sqlite3_finalize(stmt);

    auto recorded = record_action_locked(key, store_action::read_metadata, reader);
    if (recorded.is_err()) {
        return recorded.error();
    }

    const char* actions_sql = R"(
        SELECT action, action_time, party
        FROM store_actions
        WHERE uid = ?
        ORDER BY action_pk;
    )";
    if (sqlite3_prepare_v2(db_, actions_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return database_failure(db_, "prepare statement");
    }
    bind_text(stmt, 1, key);

    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        store_action_item item;

        auto action = parse_store_action(get_text(stmt, 0));
        auto action_time = core::parse_iso8601(get_text(stmt, 1));
        if (!action || !action_time) {
            sqlite3_finalize(stmt);
            return ehr_error<store_metadata>(
                error_codes::decode_error,
                compat::format("Malformed action trail entry for {}", key));
        }
        item.action = *action;
        item.action_time = *action_time;

        if (!is_null(stmt, 2)) {
            auto party_json = parse_document(get_text(stmt, 2), "party reference");
            if (party_json.is_err()) {
                sqlite3_finalize(stmt);
                return party_json.error();
            }
            auto party = codec::decode_object_ref(party_json.value());
            if (party.is_err()) {
                sqlite3_finalize(stmt);
                return party.error();
            }
            item.party = party.value();
        }
        metadata.action_history.push_back(std::move(item));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return database_failure(db_, "read action trail");
    }
    return metadata;
}

// ============================================================================
// Private Helpers
// ============================================================================

auto sqlite_version_store::execute_locked(const char* sql) -> VoidResult {
    char* err_msg = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err_msg) != SQLITE_OK) {
        std::string error = err_msg ? err_msg : "Unknown error";
        sqlite3_free(err_msg);
        return ehr_void_error(error_codes::database_error,
                              compat::format("SQL execution failed: {}", error));
    }
    return ok();
}

auto sqlite_version_store::metadata_exists_locked(const std::string& uid) -> Result<bool> {
    const char* sql = "SELECT 1 FROM store_metadata WHERE uid = ?;";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return database_failure(db_, "prepare statement");
    }
    bind_text(stmt, 1, uid);

    auto rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        return database_failure(db_, "read metadata");
    }
    return rc == SQLITE_ROW;
}

auto sqlite_version_store::record_action_locked(
    const std::string& uid,
    store_action action,
    const std::optional<identification::object_ref>& party,
    const std::optional<std::string>& object_type) -> VoidResult {
    const char* upsert_sql = R"(
        INSERT INTO store_metadata (uid, object_type, is_deleted)
        VALUES (?, ?, 0)
        ON CONFLICT(uid) DO UPDATE SET
            object_type = COALESCE(excluded.object_type, store_metadata.object_type);
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, upsert_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return database_failure(db_, "prepare statement");
    }
    bind_text(stmt, 1, uid);
    if (object_type) {
        bind_text(stmt, 2, *object_type);
    } else {
        sqlite3_bind_null(stmt, 2);
    }
    auto rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return database_failure(db_, "upsert metadata");
    }

    const char* action_sql =
        "INSERT INTO store_actions (uid, action, action_time, party) VALUES (?, ?, ?, ?);";
    if (sqlite3_prepare_v2(db_, action_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return database_failure(db_, "prepare statement");
    }
    bind_text(stmt, 1, uid);
    bind_text(stmt, 2, to_string(action));
    bind_text(stmt, 3, core::to_iso8601(std::chrono::system_clock::now()));
    if (party) {
        bind_text(stmt, 4, codec::encode(*party).dump());
    } else {
        sqlite3_bind_null(stmt, 4);
    }
    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return database_failure(db_, "insert action");
    }
    return ok();
}

auto sqlite_version_store::load_container_locked(const std::string& uid)
    -> Result<std::optional<container_record>> {
    const char* sql = "SELECT metadata, revision_history FROM versioned_objects WHERE uid = ?;";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return database_failure(db_, "prepare statement");
    }
    bind_text(stmt, 1, uid);

    auto rc = sqlite3_step(stmt);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            return database_failure(db_, "read versioned object");
        }
        return std::optional<container_record>{};
    }
    auto metadata_text = get_text(stmt, 0);
    auto history_text = get_text(stmt, 1);
    sqlite3_finalize(stmt);

    auto metadata_json = parse_document(metadata_text, "versioned object");
    if (metadata_json.is_err()) {
        return metadata_json.error();
    }
    auto metadata = codec::decode_container_metadata(metadata_json.value());
    if (metadata.is_err()) {
        return metadata.error();
    }

    auto history_json = parse_document(history_text, "revision history");
    if (history_json.is_err()) {
        return history_json.error();
    }
    auto history = codec::decode_revision_history(history_json.value(), *terminology_);
    if (history.is_err()) {
        return history.error();
    }

    return std::optional<container_record>{container_record{metadata.value(), history.value()}};
}

auto sqlite_version_store::save_container_locked(const container_record& record) -> VoidResult {
    const char* sql = R"(
        INSERT INTO versioned_objects (uid, metadata, revision_history)
        VALUES (?, ?, ?)
        ON CONFLICT(uid) DO UPDATE SET
            metadata = excluded.metadata,
            revision_history = excluded.revision_history;
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return database_failure(db_, "prepare statement");
    }
    bind_text(stmt, 1, record.metadata.uid.value());
    bind_text(stmt, 2, codec::encode(record.metadata).dump());
    bind_text(stmt, 3, codec::encode(record.history).dump());

    auto rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return database_failure(db_, "save versioned object");
    }
    return ok();
}

auto sqlite_version_store::load_version_locked(const std::string& uid)
    -> Result<std::optional<stored_version>> {
    const char* sql = "SELECT document FROM versions WHERE uid = ?;";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return database_failure(db_, "prepare statement");
    }
    bind_text(stmt, 1, uid);

    auto rc = sqlite3_step(stmt);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            return database_failure(db_, "read version");
        }
        return std::optional<stored_version>{};
    }
    auto text = get_text(stmt, 0);
    sqlite3_finalize(stmt);

    auto document = parse_document(text, "version");
    if (document.is_err()) {
        return document.error();
    }
    auto stored = stored_version_from_document(std::move(document.value()), *terminology_);
    if (stored.is_err()) {
        return stored.error();
    }
    return std::optional<stored_version>{std::move(stored.value())};
}

auto sqlite_version_store::save_version_locked(const stored_version& version) -> VoidResult {
    const char* sql = R"(
        INSERT INTO versions (uid, container_uid, document)
        VALUES (?, ?, ?)
        ON CONFLICT(uid) DO UPDATE SET document = excluded.document;
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return database_failure(db_, "prepare statement");
    }
    bind_text(stmt, 1, version.uid.value());
    bind_text(stmt, 2, version.owner_id().value());
    bind_text(stmt, 3, version.document.dump());

    auto rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return database_failure(db_, "save version");
    }
    return ok();
}

auto sqlite_version_store::contribution_exists_locked(const std::string& uid) -> Result<bool> {
    const char* sql = "SELECT 1 FROM contributions WHERE uid = ?;";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return database_failure(db_, "prepare statement");
    }
    bind_text(stmt, 1, uid);

    auto rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        return database_failure(db_, "read contribution");
    }
    return rc == SQLITE_ROW;
}

}  // namespace ehr::storage
