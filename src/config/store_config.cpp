/**
 * @file store_config.cpp
 * @brief Implementation of configuration loading
 */

#include <ehr/config/store_config.hpp>

#include <ehr/compat/format.hpp>
#include <ehr/identification/uid.hpp>
#include <ehr/storage/memory_version_store.hpp>
#include <ehr/storage/sqlite_version_store.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace ehr::config {

using json = nlohmann::json;

namespace {

auto get_env(const char* name) -> std::optional<std::string> {
    const char* value = std::getenv(name);
    if (value != nullptr && *value != '\0') {
        return std::string(value);
    }
    return std::nullopt;
}

auto apply_logging(const json& logging, integration::logger_config& logger) -> void {
    if (logging.contains("level")) {
        logger.min_level = integration::parse_log_level(logging.at("level").get<std::string>());
    }
    if (logging.contains("directory")) {
        logger.log_directory = logging.at("directory").get<std::string>();
    }
    logger.enable_console = logging.value("console", logger.enable_console);
    logger.enable_file = logging.value("file", logger.enable_file);
    logger.enable_audit_log = logging.value("audit", logger.enable_audit_log);
    logger.max_file_size_mb = logging.value("max_file_size_mb", logger.max_file_size_mb);
    logger.max_files = logging.value("max_files", logger.max_files);
    logger.async_mode = logging.value("async", logger.async_mode);
    logger.buffer_size = logging.value("buffer_size", logger.buffer_size);
}

}  // namespace

// =============================================================================
// store_backend
// =============================================================================

auto to_string(store_backend backend) -> std::string {
    switch (backend) {
        case store_backend::memory: return "memory";
        case store_backend::sqlite: return "sqlite";
    }
    return "memory";
}

auto parse_store_backend(std::string_view name) -> std::optional<store_backend> {
    if (name == "memory") return store_backend::memory;
    if (name == "sqlite") return store_backend::sqlite;
    return std::nullopt;
}

// =============================================================================
// store_config
// =============================================================================

auto store_config::validate() const -> VoidResult {
    if (system_id.empty()) {
        return ehr_void_error(error_codes::config_invalid_value, "system_id must not be empty");
    }
    auto parsed = identification::uid::create(system_id);
    if (parsed.is_err()) {
        return ehr_void_error(error_codes::config_invalid_value,
                              compat::format("system_id '{}' is not a valid UID", system_id),
                              parsed.error().message);
    }
    if (backend == store_backend::sqlite && database_path.empty()) {
        return ehr_void_error(error_codes::config_invalid_value,
                              "sqlite backend requires store.database_path");
    }
    return ok();
}

// =============================================================================
// Loading
// =============================================================================

auto parse_store_config(std::string_view text) -> Result<store_config> {
    store_config config;

    try {
        auto root = json::parse(text);
        if (!root.is_object()) {
            return ehr_error<store_config>(error_codes::config_parse_error,
                                           "Configuration root must be an object");
        }

        config.system_id = root.value("system_id", config.system_id);

        if (root.contains("store")) {
            const auto& store = root.at("store");
            if (store.contains("backend")) {
                auto name = store.at("backend").get<std::string>();
                auto backend = parse_store_backend(name);
                if (!backend) {
                    return ehr_error<store_config>(
                        error_codes::config_invalid_value,
                        compat::format("Unknown store backend '{}'", name));
                }
                config.backend = *backend;
            }
            config.database_path = store.value("database_path", config.database_path);
        }

        if (root.contains("logging")) {
            apply_logging(root.at("logging"), config.logger);
        }
    } catch (const json::exception& ex) {
        return ehr_error<store_config>(error_codes::config_parse_error,
                                       "JSON parsing error", ex.what());
    }

    return config;
}

auto load_store_config(const std::filesystem::path& path) -> Result<store_config> {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return ehr_error<store_config>(
            error_codes::config_file_not_found,
            compat::format("Configuration file does not exist: {}", path.string()));
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return ehr_error<store_config>(
            error_codes::config_file_not_found,
            compat::format("Failed to open configuration file: {}", path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_store_config(buffer.str());
}

auto apply_environment(store_config& config) -> VoidResult {
    if (auto value = get_env("EHR_SYSTEM_ID")) {
        config.system_id = *value;
    }
    if (auto value = get_env("EHR_STORE_BACKEND")) {
        auto backend = parse_store_backend(*value);
        if (!backend) {
            return ehr_void_error(error_codes::config_invalid_value,
                                  compat::format("Unknown EHR_STORE_BACKEND '{}'", *value));
        }
        config.backend = *backend;
    }
    if (auto value = get_env("EHR_DATABASE_PATH")) {
        config.database_path = *value;
    }
    if (auto value = get_env("EHR_LOG_LEVEL")) {
        config.logger.min_level = integration::parse_log_level(*value);
    }
    if (auto value = get_env("EHR_LOG_DIRECTORY")) {
        config.logger.log_directory = *value;
    }
    return ok();
}

// =============================================================================
// Store Factory
// =============================================================================

auto make_version_store(const store_config& config, std::shared_ptr<di::ILogger> logger)
    -> Result<std::shared_ptr<storage::version_store_interface>> {
    auto valid = config.validate();
    if (valid.is_err()) {
        return valid.error();
    }

    switch (config.backend) {
        case store_backend::memory:
            return std::shared_ptr<storage::version_store_interface>{
                std::make_shared<storage::memory_version_store>(std::move(logger))};

        case store_backend::sqlite: {
            auto opened = storage::sqlite_version_store::open(config.database_path, nullptr,
                                                              std::move(logger));
            if (opened.is_err()) {
                return opened.error();
            }
            return std::shared_ptr<storage::version_store_interface>{std::move(opened.value())};
        }
    }
    return ehr_error<std::shared_ptr<storage::version_store_interface>>(
        error_codes::config_invalid_value, "Unknown store backend");
}

}  // namespace ehr::config
