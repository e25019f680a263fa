/**
 * @file logger_adapter.cpp
 * @brief Implementation of the record audit logging adapter
 */

#include <ehr/integration/logger_adapter.hpp>

#include <ehr/core/timestamp.hpp>

#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/interfaces/logger_types.h>
#include <kcenon/logger/writers/console_writer.h>
#include <kcenon/logger/writers/rotating_file_writer.h>

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <fstream>
#include <mutex>

namespace ehr::integration {

auto parse_log_level(std::string_view name) -> log_level {
    if (name == "trace") return log_level::trace;
    if (name == "debug") return log_level::debug;
    if (name == "info") return log_level::info;
    if (name == "warn") return log_level::warn;
    if (name == "error") return log_level::error;
    if (name == "fatal") return log_level::fatal;
    if (name == "off") return log_level::off;
    return log_level::info;
}

// =============================================================================
// Implementation Class
// =============================================================================

class logger_adapter::impl {
public:
    impl() = default;
    ~impl() { shutdown(); }

    void initialize(const logger_config& config) {
        std::lock_guard lock(mutex_);

        if (initialized_) {
            return;
        }

        config_ = config;
        min_level_.store(config.min_level);

        if (config.enable_file || config.enable_audit_log) {
            std::filesystem::create_directories(config.log_directory);
        }

        logger_ = std::make_unique<kcenon::logger::logger>(config.async_mode, config.buffer_size);
        logger_->set_min_level(convert_log_level(config.min_level));

        if (config.enable_console) {
            logger_->add_writer(std::make_unique<kcenon::logger::console_writer>());
        }

        if (config.enable_file) {
            auto log_path = config.log_directory / "ehr.log";
            auto writer = std::make_unique<kcenon::logger::rotating_file_writer>(
                log_path.string(), config.max_file_size_mb * 1024 * 1024, config.max_files);
            logger_->add_writer(std::move(writer));
        }

        logger_->start();

        if (config.enable_audit_log) {
            audit_log_path_ = config.log_directory / "audit.json";
        }

        initialized_ = true;
    }

    void shutdown() {
        std::lock_guard lock(mutex_);

        if (!initialized_) {
            return;
        }

        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }

        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const noexcept -> bool { return initialized_.load(); }

    void log(log_level level, const std::string& message) {
        if (!initialized_ || !logger_ || !is_level_enabled(level)) {
            return;
        }
        logger_->log(convert_log_level(level), message);
    }

    [[nodiscard]] auto is_level_enabled(log_level level) const noexcept -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void flush() {
        if (logger_) {
            logger_->flush();
        }
    }

    void set_min_level(log_level level) {
        min_level_.store(level);
        if (logger_) {
            logger_->set_min_level(convert_log_level(level));
        }
    }

    [[nodiscard]] auto get_min_level() const noexcept -> log_level { return min_level_.load(); }

    [[nodiscard]] auto get_config() const -> const logger_config& { return config_; }

    void write_audit_log(const std::string& event_type,
                         const std::string& outcome,
                         const std::map<std::string, std::string>& fields) {
        if (!initialized_ || !config_.enable_audit_log) {
            return;
        }

        std::lock_guard lock(audit_mutex_);

        std::ofstream file(audit_log_path_, std::ios::app);
        if (!file) {
            return;
        }

        nlohmann::json entry{
            {"timestamp", core::to_iso8601(std::chrono::system_clock::now())},
            {"event_type", event_type},
            {"outcome", outcome}};
        for (const auto& [key, value] : fields) {
            entry[key] = value;
        }

        file << entry.dump() << '\n';
        file.flush();
    }

private:
    [[nodiscard]] static auto convert_log_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace:
                return kcenon::logger::log_level::trace;
            case log_level::debug:
                return kcenon::logger::log_level::debug;
            case log_level::info:
                return kcenon::logger::log_level::info;
            case log_level::warn:
                return kcenon::logger::log_level::warn;
            case log_level::error:
                return kcenon::logger::log_level::error;
            case log_level::fatal:
                return kcenon::logger::log_level::fatal;
            case log_level::off:
            default:
                return kcenon::logger::log_level::off;
        }
    }

    mutable std::mutex mutex_;
    mutable std::mutex audit_mutex_;
    std::atomic<bool> initialized_{false};
    std::atomic<log_level> min_level_{log_level::info};
    logger_config config_;
    std::unique_ptr<kcenon::logger::logger> logger_;
    std::filesystem::path audit_log_path_;
};

// =============================================================================
// Static Member Initialization
// =============================================================================

std::unique_ptr<logger_adapter::impl> logger_adapter::pimpl_ =
    std::make_unique<logger_adapter::impl>();

// =============================================================================
// Initialization
// =============================================================================

void logger_adapter::initialize(const logger_config& config) { pimpl_->initialize(config); }

void logger_adapter::shutdown() { pimpl_->shutdown(); }

auto logger_adapter::is_initialized() noexcept -> bool { return pimpl_->is_initialized(); }

// =============================================================================
// Standard Logging
// =============================================================================

void logger_adapter::log(log_level level, const std::string& message) {
    pimpl_->log(level, message);
}

auto logger_adapter::is_level_enabled(log_level level) noexcept -> bool {
    return pimpl_->is_level_enabled(level);
}

void logger_adapter::flush() { pimpl_->flush(); }

// =============================================================================
// Record Audit Trail
// =============================================================================

void logger_adapter::log_container_created(const std::string& container_uid,
                                           const std::string& owner_id) {
    info("Versioned object created: {} owned by {}", container_uid, owner_id);

    write_audit_log("CONTAINER_CREATED", "success",
                    {{"container_uid", container_uid}, {"owner_id", owner_id}});
}

void logger_adapter::log_version_committed(const std::string& version_id,
                                           const std::string& change_type,
                                           const std::string& committer) {
    info("Version committed: {} ({}) by {}", version_id, change_type, committer);

    write_audit_log("VERSION_COMMITTED", "success",
                    {{"version_id", version_id},
                     {"change_type", change_type},
                     {"committer", committer}});
}

void logger_adapter::log_attestation_added(const std::string& version_id,
                                           const std::string& attester) {
    info("Attestation added: {} by {}", version_id, attester);

    write_audit_log("ATTESTATION_ADDED", "success",
                    {{"version_id", version_id}, {"attester", attester}});
}

void logger_adapter::log_contribution_committed(const std::string& contribution_uid,
                                                std::size_t version_count,
                                                const std::string& committer) {
    debug("Contribution committed: {} with {} version(s) by {}",
          contribution_uid, version_count, committer);

    write_audit_log("CONTRIBUTION_COMMITTED", "success",
                    {{"contribution_uid", contribution_uid},
                     {"version_count", std::to_string(version_count)},
                     {"committer", committer}});
}

void logger_adapter::log_commit_rejected(const std::string& target,
                                         const std::string& reason,
                                         const std::string& committer) {
    warn("Commit rejected for {}: {}", target, reason);

    std::map<std::string, std::string> fields = {{"target", target}, {"reason", reason}};
    if (!committer.empty()) {
        fields["committer"] = committer;
    }

    write_audit_log("COMMIT_REJECTED", "failure", fields);
}

// =============================================================================
// Configuration
// =============================================================================

void logger_adapter::set_min_level(log_level level) { pimpl_->set_min_level(level); }

auto logger_adapter::get_min_level() noexcept -> log_level { return pimpl_->get_min_level(); }

auto logger_adapter::get_config() -> const logger_config& { return pimpl_->get_config(); }

// =============================================================================
// Private Helpers
// =============================================================================

void logger_adapter::write_audit_log(const std::string& event_type,
                                     const std::string& outcome,
                                     const std::map<std::string, std::string>& fields) {
    pimpl_->write_audit_log(event_type, outcome, fields);
}

}  // namespace ehr::integration
