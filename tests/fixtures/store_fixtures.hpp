/**
 * @file store_fixtures.hpp
 * @brief Commit batches and behaviour checks shared by the store tests
 *
 * Both store implementations must behave identically; each check below is
 * run once per implementation from its own test file.
 */

#pragma once

#include "fixtures/record_fixtures.hpp"

#include <ehr/storage/version_store_interface.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <string>
#include <vector>

namespace ehr::test {

inline constexpr std::string_view first_contribution_uid = "3e8e7f35-6b0a-4f3c-9a56-0a3d5c2f8e11";
inline constexpr std::string_view second_contribution_uid = "b1c5e9d2-77f0-4c1e-8d3a-5f6e7a8b9c0d";

/**
 * @brief Contribution plus the stored form of its versions
 */
struct commit_batch {
    change_control::contribution contribution;
    std::vector<storage::stored_version> versions;
};

/**
 * @brief One-version contribution for the default container
 */
inline auto single_version_batch(const terminology::terminology_service& terminology,
                                 std::string_view contribution_uid,
                                 std::string_view tree,
                                 std::optional<std::string_view> preceding_tree,
                                 clinical_note note,
                                 int minutes = 0) -> commit_batch {
    auto contribution_id = hier_id(contribution_uid);
    auto uid = scenario_version_id(system_id, tree);

    std::optional<identification::object_version_id> preceding;
    if (preceding_tree) {
        preceding = scenario_version_id(system_id, *preceding_tree);
    }

    auto original = make_original(terminology, contribution_id, uid, std::move(preceding),
                                  std::move(note), minutes);
    return commit_batch{
        make_contribution(terminology, contribution_id, uid),
        {storage::to_stored_version(change_control::version<clinical_note>{original})}};
}

inline auto count_actions(const storage::store_metadata& metadata, storage::store_action action)
    -> std::size_t {
    return static_cast<std::size_t>(std::count_if(
        metadata.action_history.begin(), metadata.action_history.end(),
        [action](const auto& item) { return item.action == action; }));
}

// =============================================================================
// Shared behaviour checks
// =============================================================================

/**
 * @brief First commit creates the container, second one appends to it
 */
inline void check_commit_and_retrieve(storage::version_store_interface& store,
                                      const terminology::terminology_service& terminology) {
    auto first = single_version_batch(terminology, first_contribution_uid, "1", std::nullopt,
                                      clinical_note{"admitted", 1}, 0);
    REQUIRE(store.commit_contribution_set(first.contribution, first.versions, ehr_ref(),
                                          ehr_ref())
                .is_ok());

    auto second = single_version_batch(terminology, second_contribution_uid, "2",
                                       std::string_view{"1"}, clinical_note{"stable", 2}, 10);
    REQUIRE(store.commit_contribution_set(second.contribution, second.versions).is_ok());

    auto record = store.retrieve_container(hier_id(container_uid));
    REQUIRE(record.is_ok());
    CHECK(record.value().metadata.owner_id == ehr_ref());
    CHECK(record.value().metadata.time_created == commit_time(0));
    REQUIRE(record.value().history.size() == 2);
    CHECK(record.value().history.items()[0].version_id() ==
          scenario_version_id(system_id, "1"));
    CHECK(record.value().history.items()[1].version_id() ==
          scenario_version_id(system_id, "2"));

    auto versions = store.retrieve_versions(hier_id(container_uid));
    REQUIRE(versions.is_ok());
    REQUIRE(versions.value().size() == 2);
    CHECK(versions.value()[1].preceding_version_uid == scenario_version_id(system_id, "1"));

    auto decoded = storage::decode_stored_version<clinical_note>(versions.value()[1], terminology);
    REQUIRE(decoded.is_ok());
    CHECK(decoded.value().data() == clinical_note{"stable", 2});

    auto single = store.retrieve_version(scenario_version_id(system_id, "1"));
    REQUIRE(single.is_ok());
    CHECK(single.value().is_original());
    CHECK(single.value().owner_id() == hier_id(container_uid));

    auto contribution = store.retrieve_contribution(hier_id(second_contribution_uid));
    REQUIRE(contribution.is_ok());
    CHECK(contribution.value().versions == second.contribution.versions);
    CHECK(contribution.value().audit == second.contribution.audit);
}

/**
 * @brief Every rejected batch leaves the store unchanged
 */
inline void check_commit_rejections(storage::version_store_interface& store,
                                    const terminology::terminology_service& terminology) {
    auto first = single_version_batch(terminology, first_contribution_uid, "1", std::nullopt,
                                      clinical_note{"admitted", 1});

    REQUIRE(store.commit_contribution_set(first.contribution, first.versions, ehr_ref()).is_ok());

    SECTION("version not listed by the contribution") {
        auto batch = single_version_batch(terminology, second_contribution_uid, "2",
                                          std::string_view{"1"}, clinical_note{});
        batch.contribution.versions.clear();
        batch.contribution.versions.push_back(
            identification::object_ref::to_version(scenario_version_id(system_id, "5")));

        auto result = store.commit_contribution_set(batch.contribution, batch.versions);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::contribution_inconsistent);
    }

    SECTION("version referencing another contribution") {
        auto batch = single_version_batch(terminology, second_contribution_uid, "2",
                                          std::string_view{"1"}, clinical_note{});
        batch.contribution.uid = hier_id("0f0e0d0c-0b0a-4909-8807-060504030201");

        auto result = store.commit_contribution_set(batch.contribution, batch.versions);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::contribution_inconsistent);
    }

    SECTION("contribution id already stored") {
        auto batch = single_version_batch(terminology, first_contribution_uid, "2",
                                          std::string_view{"1"}, clinical_note{});
        auto result = store.commit_contribution_set(batch.contribution, batch.versions);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::contribution_inconsistent);
    }

    SECTION("missing predecessor") {
        auto batch = single_version_batch(terminology, second_contribution_uid, "2", std::nullopt,
                                          clinical_note{});
        auto result = store.commit_contribution_set(batch.contribution, batch.versions);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::precedence_violation);
    }

    SECTION("unknown predecessor") {
        auto batch = single_version_batch(terminology, second_contribution_uid, "2",
                                          std::string_view{"7"}, clinical_note{});
        auto result = store.commit_contribution_set(batch.contribution, batch.versions);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::precedence_violation);
    }

    SECTION("duplicate version") {
        auto batch = single_version_batch(terminology, second_contribution_uid, "1",
                                          std::string_view{"1"}, clinical_note{});
        auto result = store.commit_contribution_set(batch.contribution, batch.versions);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::duplicate_version_id);
    }

    auto record = store.retrieve_container(hier_id(container_uid));
    REQUIRE(record.is_ok());
    CHECK(record.value().history.size() == 1);
    CHECK(store.retrieve_contribution(hier_id(second_contribution_uid)).is_err());
}

/**
 * @brief Unknown containers are only created when an owner is given
 */
inline void check_commit_needs_owner(storage::version_store_interface& store,
                                     const terminology::terminology_service& terminology) {
    auto first = single_version_batch(terminology, first_contribution_uid, "1", std::nullopt,
                                      clinical_note{"admitted", 1});

    auto result = store.commit_contribution_set(first.contribution, first.versions);
    REQUIRE(result.is_err());
    CHECK(result.error().code == error_codes::container_not_found);
    CHECK(store.retrieve_container(hier_id(container_uid)).is_err());
    CHECK(store.retrieve_contribution(hier_id(first_contribution_uid)).is_err());
}

/**
 * @brief A batch spanning two containers is applied all or nothing
 */
inline void check_multi_container_batch(storage::version_store_interface& store,
                                        const terminology::terminology_service& terminology) {
    auto contribution_id = hier_id(first_contribution_uid);
    auto a1 = scenario_version_id(system_id, "1");
    auto b1 = version_id(std::string(other_container_uid) + "::" + std::string(system_id) + "::1");
    auto b2 = version_id(std::string(other_container_uid) + "::" + std::string(system_id) + "::2");

    auto va = make_original(terminology, contribution_id, a1, std::nullopt, clinical_note{"a", 1});
    auto vb1 = make_original(terminology, contribution_id, b1, std::nullopt, clinical_note{"b", 1});
    auto vb2 = make_original(terminology, contribution_id, b2, b1, clinical_note{"b", 2}, 1);

    SECTION("both containers are created") {
        auto contribution = make_contribution(terminology, contribution_id, a1, b1, b2);
        std::vector<storage::stored_version> batch{
            storage::to_stored_version(change_control::version<clinical_note>{va}),
            storage::to_stored_version(change_control::version<clinical_note>{vb1}),
            storage::to_stored_version(change_control::version<clinical_note>{vb2})};

        REQUIRE(store.commit_contribution_set(contribution, batch, ehr_ref()).is_ok());

        auto other = store.retrieve_versions(hier_id(other_container_uid));
        REQUIRE(other.is_ok());
        CHECK(other.value().size() == 2);
        CHECK(store.retrieve_versions(hier_id(container_uid)).value().size() == 1);
    }

    SECTION("a bad version rolls back the whole batch") {
        auto orphan = make_original(terminology, contribution_id,
                                    scenario_version_id(system_id, "2"),
                                    scenario_version_id(system_id, "9"), clinical_note{}, 2);
        auto contribution =
            make_contribution(terminology, contribution_id, b1, a1, orphan.uid());
        std::vector<storage::stored_version> batch{
            storage::to_stored_version(change_control::version<clinical_note>{vb1}),
            storage::to_stored_version(change_control::version<clinical_note>{va}),
            storage::to_stored_version(change_control::version<clinical_note>{orphan})};

        auto result = store.commit_contribution_set(contribution, batch, ehr_ref());
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::precedence_violation);

        CHECK(store.retrieve_container(hier_id(container_uid)).is_err());
        CHECK(store.retrieve_container(hier_id(other_container_uid)).is_err());
        CHECK(store.retrieve_version(b1).is_err());
        CHECK(store.retrieve_contribution(contribution_id).is_err());
    }
}

/**
 * @brief Attestations update both the version document and the history
 */
inline void check_attestation(storage::version_store_interface& store,
                              const terminology::terminology_service& terminology) {
    auto first = single_version_batch(terminology, first_contribution_uid, "1", std::nullopt,
                                      clinical_note{"admitted", 1});
    REQUIRE(store.commit_contribution_set(first.contribution, first.versions, ehr_ref()).is_ok());

    auto v1 = scenario_version_id(system_id, "1");
    REQUIRE(store.add_attestation(v1, make_attestation(terminology), ehr_ref()).is_ok());

    auto stored = store.retrieve_version(v1);
    REQUIRE(stored.is_ok());
    auto decoded = storage::decode_stored_version<clinical_note>(stored.value(), terminology);
    REQUIRE(decoded.is_ok());
    REQUIRE(decoded.value().as_original() != nullptr);
    REQUIRE(decoded.value().as_original()->attestations().has_value());
    CHECK(decoded.value().as_original()->attestations()->size() == 1);

    auto record = store.retrieve_container(hier_id(container_uid));
    REQUIRE(record.is_ok());
    CHECK(record.value().history.items()[0].audits().size() == 2);

    auto metadata = store.retrieve_metadata(v1.value());
    REQUIRE(metadata.is_ok());
    CHECK(count_actions(metadata.value(), storage::store_action::update_attestations) == 1);

    SECTION("unknown version") {
        auto result = store.add_attestation(scenario_version_id(system_id, "4"),
                                            make_attestation(terminology));
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::version_not_found);
    }
}

/**
 * @brief Imported versions are stored but cannot be attested
 */
inline void check_imported_attestation(storage::version_store_interface& store,
                                       const terminology::terminology_service& terminology) {
    auto contribution_id = hier_id(first_contribution_uid);
    auto v1 = scenario_version_id("org.example.ehr2", "1");

    auto foreign = make_original(terminology, hier_id(other_container_uid), v1, std::nullopt,
                                 clinical_note{"transferred", 1});
    change_control::imported_version<clinical_note> imported{
        identification::object_ref::to_contribution(contribution_id),
        make_audit(terminology, terminology::audit_change_type::format_conversion), foreign};

    auto contribution = make_contribution(terminology, contribution_id, v1);
    std::vector<storage::stored_version> batch{
        storage::to_stored_version(change_control::version<clinical_note>{imported})};
    REQUIRE(store.commit_contribution_set(contribution, batch, ehr_ref()).is_ok());

    auto stored = store.retrieve_version(v1);
    REQUIRE(stored.is_ok());
    CHECK_FALSE(stored.value().is_original());

    auto result = store.add_attestation(v1, make_attestation(terminology));
    REQUIRE(result.is_err());
    CHECK(result.error().code == error_codes::not_an_original_version);

    auto record = store.retrieve_container(hier_id(container_uid));
    REQUIRE(record.is_ok());
    CHECK(record.value().history.items()[0].audits().size() == 1);
}

/**
 * @brief Generated ids, explicit containers and the action trail
 */
inline void check_metadata_trail(storage::version_store_interface& store,
                                 const terminology::terminology_service& terminology) {
    auto generated = store.generate_container_id(ehr_ref());
    REQUIRE(generated.is_ok());
    CHECK(generated.value().root().kind() == identification::uid_kind::uuid);

    auto fresh = store.retrieve_metadata(generated.value().value());
    REQUIRE(fresh.is_ok());
    CHECK_FALSE(fresh.value().object_type.has_value());
    REQUIRE(fresh.value().action_history.size() == 2);
    CHECK(fresh.value().action_history[0].action == storage::store_action::generate_id);
    CHECK(fresh.value().action_history[0].party == ehr_ref());
    CHECK(fresh.value().action_history[1].action == storage::store_action::read_metadata);

    change_control::container_metadata metadata{generated.value(), ehr_ref(), commit_time()};
    REQUIRE(store.create_container(metadata, {}, ehr_ref()).is_ok());

    auto duplicate = store.create_container(metadata, {});
    REQUIRE(duplicate.is_err());
    CHECK(duplicate.error().code == error_codes::container_already_exists);

    auto record = store.retrieve_container(generated.value());
    REQUIRE(record.is_ok());
    CHECK(record.value().history.empty());
    CHECK(record.value().metadata.time_created == commit_time());

    auto trail = store.retrieve_metadata(generated.value().value());
    REQUIRE(trail.is_ok());
    CHECK(trail.value().object_type == "VERSIONED_OBJECT");
    CHECK_FALSE(trail.value().is_deleted);
    CHECK(count_actions(trail.value(), storage::store_action::create) == 1);
    CHECK(count_actions(trail.value(), storage::store_action::read) == 1);
    CHECK(count_actions(trail.value(), storage::store_action::read_metadata) == 2);

    auto first = single_version_batch(terminology, first_contribution_uid, "1", std::nullopt,
                                      clinical_note{"admitted", 1});
    REQUIRE(store.commit_contribution_set(first.contribution, first.versions, ehr_ref(),
                                          ehr_ref())
                .is_ok());

    auto contribution_trail = store.retrieve_metadata(first_contribution_uid);
    REQUIRE(contribution_trail.is_ok());
    CHECK(contribution_trail.value().object_type == "CONTRIBUTION");

    auto version_trail = store.retrieve_metadata(scenario_version_id(system_id, "1").value());
    REQUIRE(version_trail.is_ok());
    CHECK(version_trail.value().object_type == "ORIGINAL_VERSION");
    CHECK(version_trail.value().action_history.front().party == ehr_ref());

    auto missing = store.retrieve_metadata("no-such-object");
    REQUIRE(missing.is_err());
    CHECK(missing.error().code == error_codes::object_not_found);
}

/**
 * @brief Lookups of unknown identifiers
 */
inline void check_not_found(storage::version_store_interface& store) {
    auto container = store.retrieve_container(hier_id(container_uid));
    REQUIRE(container.is_err());
    CHECK(container.error().code == error_codes::container_not_found);

    auto versions = store.retrieve_versions(hier_id(container_uid));
    REQUIRE(versions.is_err());
    CHECK(versions.error().code == error_codes::container_not_found);

    auto version = store.retrieve_version(scenario_version_id(system_id, "1"));
    REQUIRE(version.is_err());
    CHECK(version.error().code == error_codes::version_not_found);

    auto contribution = store.retrieve_contribution(hier_id(first_contribution_uid));
    REQUIRE(contribution.is_err());
    CHECK(contribution.error().code == error_codes::object_not_found);
}

}  // namespace ehr::test
