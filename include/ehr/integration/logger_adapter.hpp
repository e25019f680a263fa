/**
 * @file logger_adapter.hpp
 * @brief Adapter for record audit logging using logger_system
 *
 * This file provides the logger_adapter class for integrating logger_system
 * with change control. It supports standard application logging and a
 * separate append-only audit trail of commits, attestations and rejected
 * commits.
 */

#pragma once

#include <ehr/compat/format.hpp>

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <string>

namespace ehr::integration {

// ─────────────────────────────────────────────────────
// Levels
// ─────────────────────────────────────────────────────

/**
 * @enum log_level
 * @brief Log severity levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5,
    off = 6
};

/**
 * @brief Parse a level name ("trace" ... "off")
 * @return The level, or info for unknown names
 */
[[nodiscard]] auto parse_log_level(std::string_view name) -> log_level;

// ─────────────────────────────────────────────────────
// Configuration
// ─────────────────────────────────────────────────────

/**
 * @struct logger_config
 * @brief Configuration options for the logger adapter
 */
struct logger_config {
    /// Directory for log files
    std::filesystem::path log_directory{"logs"};

    /// Minimum log level to output
    log_level min_level{log_level::info};

    /// Enable console output
    bool enable_console{true};

    /// Enable file output
    bool enable_file{true};

    /// Enable the separate JSON audit trail
    bool enable_audit_log{true};

    /// Maximum log file size in megabytes before rotation
    std::size_t max_file_size_mb{100};

    /// Maximum number of rotated log files to keep
    std::size_t max_files{10};

    /// Use asynchronous logging
    bool async_mode{true};

    /// Buffer size for async logging
    std::size_t buffer_size{8192};
};

// ─────────────────────────────────────────────────────
// Logger Adapter Class
// ─────────────────────────────────────────────────────

/**
 * @class logger_adapter
 * @brief Process-wide logging and audit trail for the record store
 *
 * Thread Safety: All methods are thread-safe.
 *
 * @example
 * @code
 * logger_config config;
 * config.log_directory = "/var/log/ehr";
 * logger_adapter::initialize(config);
 *
 * logger_adapter::info("Store opened at {}", path);
 * logger_adapter::log_version_committed(version_id, "creation", "Dr. Smith");
 *
 * logger_adapter::shutdown();
 * @endcode
 */
class logger_adapter {
public:
    // ─────────────────────────────────────────────────────
    // Initialization
    // ─────────────────────────────────────────────────────

    /**
     * @brief Initialize the logger with configuration
     *
     * Must be called before any logging operations. Messages logged
     * before initialization are dropped.
     */
    static void initialize(const logger_config& config);

    /**
     * @brief Flush pending messages and release the writers
     */
    static void shutdown();

    [[nodiscard]] static auto is_initialized() noexcept -> bool;

    // ─────────────────────────────────────────────────────
    // Standard Logging
    // ─────────────────────────────────────────────────────

    template <typename... Args>
    static void trace(ehr::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::trace, ehr::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void debug(ehr::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::debug, ehr::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void info(ehr::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::info, ehr::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void warn(ehr::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::warn, ehr::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void error(ehr::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::error, ehr::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void fatal(ehr::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::fatal, ehr::compat::format(fmt, std::forward<Args>(args)...));
    }

    /**
     * @brief Log a message at the specified level
     */
    static void log(log_level level, const std::string& message);

    [[nodiscard]] static auto is_level_enabled(log_level level) noexcept -> bool;

    static void flush();

    // ─────────────────────────────────────────────────────
    // Record Audit Trail
    // ─────────────────────────────────────────────────────

    /**
     * @brief Record the creation of a versioned object
     * @param container_uid Identifier of the new container
     * @param owner_id Identifier of the owning object
     */
    static void log_container_created(const std::string& container_uid,
                                      const std::string& owner_id);

    /**
     * @brief Record a committed version
     * @param version_id Identifier of the committed version
     * @param change_type Rubric of the audit change type
     * @param committer Display name of the committer
     */
    static void log_version_committed(const std::string& version_id,
                                      const std::string& change_type,
                                      const std::string& committer);

    /**
     * @brief Record an attestation appended to a version
     */
    static void log_attestation_added(const std::string& version_id,
                                      const std::string& attester);

    /**
     * @brief Record a stored contribution
     * @param contribution_uid Identifier of the contribution
     * @param version_count Number of versions in the batch
     * @param committer Display name of the committer
     */
    static void log_contribution_committed(const std::string& contribution_uid,
                                           std::size_t version_count,
                                           const std::string& committer);

    /**
     * @brief Record a commit or attestation that was refused
     * @param target Identifier the operation was aimed at
     * @param reason Error message of the refusal
     * @param committer Display name of the caller, may be empty
     */
    static void log_commit_rejected(const std::string& target,
                                    const std::string& reason,
                                    const std::string& committer = "");

    // ─────────────────────────────────────────────────────
    // Configuration
    // ─────────────────────────────────────────────────────

    static void set_min_level(log_level level);

    [[nodiscard]] static auto get_min_level() noexcept -> log_level;

    [[nodiscard]] static auto get_config() -> const logger_config&;

private:
    static void write_audit_log(const std::string& event_type,
                                const std::string& outcome,
                                const std::map<std::string, std::string>& fields);

    class impl;
    static std::unique_ptr<impl> pimpl_;
};

}  // namespace ehr::integration
