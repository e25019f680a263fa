/**
 * @file logger_adapter_test.cpp
 * @brief Unit tests for logger_adapter
 */

#include "fixtures/record_fixtures.hpp"

#include <ehr/integration/logger_adapter.hpp>
#include <ehr/storage/memory_version_store.hpp>

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <vector>

using namespace ehr::integration;

// =============================================================================
// Test Helpers
// =============================================================================

namespace {

/**
 * @brief Create a temporary directory for test logs
 */
auto create_temp_log_directory() -> std::filesystem::path {
    auto temp_dir = std::filesystem::temp_directory_path() / "ehr_logger_test";
    std::filesystem::create_directories(temp_dir);
    return temp_dir;
}

void cleanup_temp_directory(const std::filesystem::path& path) {
    if (std::filesystem::exists(path)) {
        std::filesystem::remove_all(path);
    }
}

/**
 * @brief Read the audit trail as one JSON object per line
 */
auto read_audit_entries(const std::filesystem::path& dir) -> std::vector<nlohmann::json> {
    std::vector<nlohmann::json> entries;
    std::ifstream file(dir / "audit.json");
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty()) {
            entries.push_back(nlohmann::json::parse(line));
        }
    }
    return entries;
}

auto find_event(const std::vector<nlohmann::json>& entries, const std::string& event_type)
    -> const nlohmann::json* {
    for (const auto& entry : entries) {
        if (entry.value("event_type", "") == event_type) {
            return &entry;
        }
    }
    return nullptr;
}

auto audit_only_config(const std::filesystem::path& dir) -> logger_config {
    logger_config config;
    config.log_directory = dir;
    config.enable_console = false;
    config.enable_file = false;
    config.enable_audit_log = true;
    return config;
}

/**
 * @brief RAII wrapper for logger initialization/shutdown
 */
class logger_test_fixture {
public:
    explicit logger_test_fixture(const logger_config& config) : log_dir_(config.log_directory) {
        logger_adapter::initialize(config);
    }

    ~logger_test_fixture() {
        logger_adapter::shutdown();
        cleanup_temp_directory(log_dir_);
    }

    logger_test_fixture(const logger_test_fixture&) = delete;
    logger_test_fixture& operator=(const logger_test_fixture&) = delete;

private:
    std::filesystem::path log_dir_;
};

}  // namespace

// =============================================================================
// Initialization Tests
// =============================================================================

TEST_CASE("logger_adapter initialization and shutdown", "[logger_adapter][init]") {
    auto temp_dir = create_temp_log_directory();

    SECTION("Basic initialization") {
        logger_config config = audit_only_config(temp_dir);
        config.enable_file = true;

        logger_adapter::initialize(config);
        REQUIRE(logger_adapter::is_initialized());

        logger_adapter::shutdown();
        REQUIRE_FALSE(logger_adapter::is_initialized());
    }

    SECTION("Multiple initialization calls are safe") {
        logger_config config = audit_only_config(temp_dir);

        logger_adapter::initialize(config);
        logger_adapter::initialize(config);
        REQUIRE(logger_adapter::is_initialized());

        logger_adapter::shutdown();
    }

    SECTION("Logging before initialization is a no-op") {
        logger_adapter::shutdown();
        REQUIRE_FALSE(logger_adapter::is_initialized());

        logger_adapter::info("dropped {}", 1);
        logger_adapter::log_commit_rejected("target", "reason");
        CHECK_FALSE(std::filesystem::exists(temp_dir / "audit.json"));
    }

    cleanup_temp_directory(temp_dir);
}

// =============================================================================
// Standard Logging Tests
// =============================================================================

TEST_CASE("logger_adapter standard logging", "[logger_adapter][logging]") {
    auto temp_dir = create_temp_log_directory();
    logger_config config = audit_only_config(temp_dir);
    config.enable_file = true;
    config.enable_audit_log = false;
    config.min_level = log_level::trace;

    logger_test_fixture fixture(config);

    SECTION("Log at different levels") {
        logger_adapter::trace("Trace message: {}", 1);
        logger_adapter::debug("Debug message: {}", 2);
        logger_adapter::info("Info message: {}", 3);
        logger_adapter::warn("Warn message: {}", 4);
        logger_adapter::error("Error message: {}", 5);
        logger_adapter::flush();

        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    SECTION("Log level filtering") {
        logger_adapter::set_min_level(log_level::warn);
        REQUIRE(logger_adapter::get_min_level() == log_level::warn);

        REQUIRE_FALSE(logger_adapter::is_level_enabled(log_level::trace));
        REQUIRE_FALSE(logger_adapter::is_level_enabled(log_level::info));
        REQUIRE(logger_adapter::is_level_enabled(log_level::warn));
        REQUIRE(logger_adapter::is_level_enabled(log_level::fatal));
    }

    SECTION("Disabled audit trail writes nothing") {
        logger_adapter::log_container_created("container", "owner");
        CHECK_FALSE(std::filesystem::exists(temp_dir / "audit.json"));
    }
}

TEST_CASE("logger_adapter level names", "[logger_adapter][logging]") {
    CHECK(parse_log_level("debug") == log_level::debug);
    CHECK(parse_log_level("off") == log_level::off);
    CHECK(parse_log_level("verbose") == log_level::info);
}

// =============================================================================
// Record Audit Trail Tests
// =============================================================================

TEST_CASE("logger_adapter record audit events", "[logger_adapter][audit]") {
    auto temp_dir = create_temp_log_directory();
    logger_test_fixture fixture(audit_only_config(temp_dir));

    SECTION("Container created") {
        logger_adapter::log_container_created("154b1047-23aa-4d4d-8713-df848fd4d60a",
                                              "7d44b88c-4199-4bad-97dc-d78268e01398");

        auto entries = read_audit_entries(temp_dir);
        const auto* entry = find_event(entries, "CONTAINER_CREATED");
        REQUIRE(entry != nullptr);
        CHECK((*entry)["outcome"] == "success");
        CHECK((*entry)["container_uid"] == "154b1047-23aa-4d4d-8713-df848fd4d60a");
        CHECK((*entry)["owner_id"] == "7d44b88c-4199-4bad-97dc-d78268e01398");
    }

    SECTION("Contribution committed") {
        logger_adapter::log_contribution_committed("3e8e7f35-6b0a-4f3c-9a56-0a3d5c2f8e11", 3,
                                                   "Dr. Lee");

        auto entries = read_audit_entries(temp_dir);
        const auto* entry = find_event(entries, "CONTRIBUTION_COMMITTED");
        REQUIRE(entry != nullptr);
        CHECK((*entry)["version_count"] == "3");
        CHECK((*entry)["committer"] == "Dr. Lee");
    }

    SECTION("Commit rejected") {
        logger_adapter::log_commit_rejected("record", "Version 1 must name a preceding version",
                                            "Dr. Lee");
        logger_adapter::log_commit_rejected("record", "no committer");

        auto entries = read_audit_entries(temp_dir);
        REQUIRE(entries.size() == 2);
        CHECK(entries[0]["event_type"] == "COMMIT_REJECTED");
        CHECK(entries[0]["outcome"] == "failure");
        CHECK(entries[0]["committer"] == "Dr. Lee");
        CHECK_FALSE(entries[1].contains("committer"));
    }
}

TEST_CASE("logger_adapter audit log JSON format", "[logger_adapter][audit][json]") {
    auto temp_dir = create_temp_log_directory();
    logger_test_fixture fixture(audit_only_config(temp_dir));

    logger_adapter::log_attestation_added("154b1047-23aa-4d4d-8713-df848fd4d60a::net.example.ehr::1",
                                          "Dr. Lee");

    auto entries = read_audit_entries(temp_dir);
    REQUIRE(entries.size() == 1);
    const auto& entry = entries.front();
    CHECK(entry.contains("timestamp"));
    CHECK(entry["event_type"] == "ATTESTATION_ADDED");
    CHECK(entry["outcome"] == "success");

    auto timestamp = entry["timestamp"].get<std::string>();
    CHECK(timestamp.find('T') != std::string::npos);
    CHECK(timestamp.back() == 'Z');
    CHECK(ehr::core::parse_iso8601(timestamp).has_value());
}

TEST_CASE("logger_adapter records store commits", "[logger_adapter][audit][store]") {
    auto temp_dir = create_temp_log_directory();
    logger_test_fixture fixture(audit_only_config(temp_dir));

    ehr::terminology::openehr_terminology terminology;
    ehr::storage::memory_version_store store;

    auto contribution_id = ehr::test::hier_id("3e8e7f35-6b0a-4f3c-9a56-0a3d5c2f8e11");
    auto uid = ehr::test::scenario_version_id(ehr::test::system_id, "1");
    auto original = ehr::test::make_original(terminology, contribution_id, uid, std::nullopt,
                                             ehr::test::clinical_note{"admitted", 1});
    std::vector<ehr::storage::stored_version> batch{ehr::storage::to_stored_version(
        ehr::change_control::version<ehr::test::clinical_note>{original})};

    REQUIRE(store
                .commit_contribution_set(
                    ehr::test::make_contribution(terminology, contribution_id, uid), batch,
                    ehr::test::ehr_ref())
                .is_ok());

    auto entries = read_audit_entries(temp_dir);
    REQUIRE(find_event(entries, "CONTAINER_CREATED") != nullptr);
    REQUIRE(find_event(entries, "CONTRIBUTION_COMMITTED") != nullptr);

    const auto* committed = find_event(entries, "VERSION_COMMITTED");
    REQUIRE(committed != nullptr);
    CHECK((*committed)["version_id"] == uid.value());
    CHECK((*committed)["change_type"] == "creation");
    CHECK((*committed)["committer"] == "Dr. Lee");
}

// =============================================================================
// Configuration Tests
// =============================================================================

TEST_CASE("logger_adapter configuration", "[logger_adapter][config]") {
    auto temp_dir = create_temp_log_directory();

    logger_config config = audit_only_config(temp_dir);
    config.min_level = log_level::debug;
    config.max_file_size_mb = 50;
    config.max_files = 5;

    logger_test_fixture fixture(config);

    const auto& retrieved_config = logger_adapter::get_config();
    REQUIRE(retrieved_config.min_level == log_level::debug);
    REQUIRE(retrieved_config.enable_audit_log);
    REQUIRE(retrieved_config.max_file_size_mb == 50);
    REQUIRE(retrieved_config.max_files == 5);

    logger_adapter::set_min_level(log_level::error);
    REQUIRE(logger_adapter::get_min_level() == log_level::error);
}

// =============================================================================
// Thread Safety Tests
// =============================================================================

TEST_CASE("logger_adapter thread safety", "[logger_adapter][thread]") {
    auto temp_dir = create_temp_log_directory();
    logger_config config = audit_only_config(temp_dir);
    config.enable_file = true;
    config.async_mode = true;

    logger_test_fixture fixture(config);

    constexpr int kNumThreads = 4;
    constexpr int kMessagesPerThread = 100;

    std::vector<std::thread> threads;
    threads.reserve(kNumThreads);

    for (int t = 0; t < kNumThreads; ++t) {
        threads.emplace_back([t]() {
            for (int i = 0; i < kMessagesPerThread; ++i) {
                logger_adapter::info("Thread {} message {}", t, i);
                logger_adapter::log_version_committed("THREAD_" + std::to_string(t), "creation",
                                                      std::to_string(i));
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    logger_adapter::flush();

    // Every audit line must be a complete JSON object
    auto entries = read_audit_entries(temp_dir);
    CHECK(entries.size() == static_cast<std::size_t>(kNumThreads * kMessagesPerThread));
}
