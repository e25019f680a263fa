/**
 * @file store_config.hpp
 * @brief Store and logging configuration loaded from JSON and environment
 *
 * @example
 * @code
 * auto config = load_store_config("ehr.json");
 * if (config.is_ok()) {
 *     apply_environment(config.value());
 *     auto store = make_version_store(config.value());
 * }
 * @endcode
 *
 * Recognized environment variables: EHR_SYSTEM_ID, EHR_STORE_BACKEND,
 * EHR_DATABASE_PATH, EHR_LOG_LEVEL, EHR_LOG_DIRECTORY.
 */

#pragma once

#include <ehr/core/result.hpp>
#include <ehr/di/ilogger.hpp>
#include <ehr/integration/logger_adapter.hpp>
#include <ehr/storage/version_store_interface.hpp>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace ehr::config {

/**
 * @brief Persistence backend selector
 */
enum class store_backend {
    memory,
    sqlite
};

[[nodiscard]] auto to_string(store_backend backend) -> std::string;

[[nodiscard]] auto parse_store_backend(std::string_view name) -> std::optional<store_backend>;

/**
 * @struct store_config
 * @brief Everything needed to stand up a version store
 */
struct store_config {
    /// Identifier of this system, written into every version id
    std::string system_id{"ehr.local"};

    store_backend backend{store_backend::memory};

    /// SQLite database file, required by the sqlite backend
    std::string database_path;

    integration::logger_config logger;

    /**
     * @brief Check the configuration for consistency
     * @return config_invalid_value on an empty or malformed system id, or
     *         on an sqlite backend without a database path
     */
    [[nodiscard]] auto validate() const -> VoidResult;
};

/**
 * @brief Load a configuration from a JSON file
 *
 * Missing keys keep their defaults. The file layout is
 * {"system_id": ..., "store": {"backend": ..., "database_path": ...},
 *  "logging": {"level": ..., "directory": ..., ...}}.
 *
 * @return config_file_not_found, config_parse_error or
 *         config_invalid_value
 */
[[nodiscard]] auto load_store_config(const std::filesystem::path& path) -> Result<store_config>;

/**
 * @brief Parse a configuration from JSON text
 */
[[nodiscard]] auto parse_store_config(std::string_view text) -> Result<store_config>;

/**
 * @brief Override fields from EHR_* environment variables
 * @return config_invalid_value for an unknown EHR_STORE_BACKEND
 */
[[nodiscard]] auto apply_environment(store_config& config) -> VoidResult;

/**
 * @brief Build the store selected by the configuration
 *
 * The configuration is validated first.
 */
[[nodiscard]] auto make_version_store(const store_config& config,
                                      std::shared_ptr<di::ILogger> logger = nullptr)
    -> Result<std::shared_ptr<storage::version_store_interface>>;

}  // namespace ehr::config
