/**
 * @file memory_version_store_test.cpp
 * @brief Unit tests for the in-memory version store
 */

#include "fixtures/store_fixtures.hpp"

#include <ehr/storage/memory_version_store.hpp>

#include <catch2/catch_test_macros.hpp>

#include <set>

using namespace ehr;
using namespace ehr::storage;

// ============================================================================
// Contribution Commits
// ============================================================================

TEST_CASE("memory_version_store: commit creates and extends a container",
          "[storage][memory]") {
    memory_version_store store;
    terminology::openehr_terminology terminology;

    test::check_commit_and_retrieve(store, terminology);
}

TEST_CASE("memory_version_store: unknown container needs an owner", "[storage][memory]") {
    memory_version_store store;
    terminology::openehr_terminology terminology;

    test::check_commit_needs_owner(store, terminology);
}

TEST_CASE("memory_version_store: rejected commits change nothing", "[storage][memory]") {
    memory_version_store store;
    terminology::openehr_terminology terminology;

    test::check_commit_rejections(store, terminology);
}

TEST_CASE("memory_version_store: batches spanning containers", "[storage][memory]") {
    memory_version_store store;
    terminology::openehr_terminology terminology;

    test::check_multi_container_batch(store, terminology);
}

// ============================================================================
// Attestation
// ============================================================================

TEST_CASE("memory_version_store: attest an original version", "[storage][memory]") {
    memory_version_store store;
    terminology::openehr_terminology terminology;

    test::check_attestation(store, terminology);
}

TEST_CASE("memory_version_store: imported versions are not attestable",
          "[storage][memory]") {
    memory_version_store store;
    terminology::openehr_terminology terminology;

    test::check_imported_attestation(store, terminology);
}

// ============================================================================
// Identifiers and Metadata
// ============================================================================

TEST_CASE("memory_version_store: metadata trail", "[storage][memory]") {
    memory_version_store store;
    terminology::openehr_terminology terminology;

    test::check_metadata_trail(store, terminology);
}

TEST_CASE("memory_version_store: generated ids are unique", "[storage][memory]") {
    memory_version_store store;

    std::set<std::string> ids;
    for (int i = 0; i < 50; ++i) {
        auto id = store.generate_container_id();
        REQUIRE(id.is_ok());
        ids.insert(id.value().value());
    }
    CHECK(ids.size() == 50);
}

TEST_CASE("memory_version_store: unknown identifiers", "[storage][memory]") {
    memory_version_store store;

    test::check_not_found(store);
}
