/**
 * @file audit_details_test.cpp
 * @brief Unit tests for party_proxy, audit_details and attestation
 */

#include "fixtures/record_fixtures.hpp"

#include <ehr/common/attestation.hpp>
#include <ehr/common/audit_details.hpp>
#include <ehr/common/party_proxy.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace ehr;
using namespace ehr::common;

// ============================================================================
// party_proxy Tests
// ============================================================================

TEST_CASE("party_proxy self and identified", "[common][party_proxy]") {
    auto subject = party_proxy::self();
    CHECK(subject.kind() == party_kind::self);
    CHECK(subject.display_name() == "self");

    auto named = party_proxy::identified(std::string("Dr. Lee"));
    REQUIRE(named.is_ok());
    CHECK(named.value().kind() == party_kind::identified);
    CHECK(named.value().display_name() == "Dr. Lee");

    SECTION("external reference is the fallback display name") {
        auto referenced = party_proxy::identified(std::nullopt, test::ehr_ref());
        REQUIRE(referenced.is_ok());
        CHECK(referenced.value().display_name() == "7d44b88c-4199-4bad-97dc-d78268e01398");
    }

    SECTION("needs a name or a reference") {
        auto empty = party_proxy::identified(std::nullopt);
        REQUIRE(empty.is_err());
        CHECK(empty.error().code == error_codes::empty_identifier);

        CHECK(party_proxy::identified(std::string()).is_err());
    }
}

// ============================================================================
// audit_details Tests
// ============================================================================

TEST_CASE("audit_details validates its change type", "[common][audit_details]") {
    terminology::openehr_terminology terminology;

    auto audit = audit_details::create(
        "net.example.ehr", test::commit_time(),
        terminology::to_coded_text(terminology::audit_change_type::amendment), test::clinician(),
        terminology, std::string("corrected dosage"));
    REQUIRE(audit.is_ok());
    CHECK(audit.value().system_id() == "net.example.ehr");
    CHECK(audit.value().time_committed() == test::commit_time());
    CHECK(audit.value().change_type().value == "amendment");
    CHECK(audit.value().committer().display_name() == "Dr. Lee");
    CHECK(audit.value().description() == "corrected dosage");

    SECTION("lifecycle code is not a change type") {
        auto wrong = audit_details::create(
            "net.example.ehr", test::commit_time(),
            terminology::to_coded_text(terminology::version_lifecycle_state::complete),
            test::clinician(), terminology);
        REQUIRE(wrong.is_err());
        CHECK(wrong.error().code == error_codes::invalid_change_type);
    }

    SECTION("empty system id") {
        auto wrong = audit_details::create(
            "", test::commit_time(),
            terminology::to_coded_text(terminology::audit_change_type::creation),
            test::clinician(), terminology);
        REQUIRE(wrong.is_err());
        CHECK(wrong.error().code == error_codes::empty_identifier);
    }
}

// ============================================================================
// attestation Tests
// ============================================================================

TEST_CASE("attestation accepts coded and free-text reasons", "[common][attestation]") {
    terminology::openehr_terminology terminology;
    auto audit = test::make_audit(terminology, terminology::audit_change_type::attestation);

    auto coded = attestation::create(
        audit, terminology::to_coded_text(terminology::attestation_reason::witnessed), true,
        terminology, media_reference{"text/html", "ehr://view/1"}, std::string("proof"),
        std::vector<std::string>{"ehr://1.2.3/content[1]"});
    REQUIRE(coded.is_ok());
    CHECK(coded.value().is_pending());
    CHECK(coded.value().attested_view()->uri == "ehr://view/1");
    CHECK(coded.value().proof() == "proof");
    CHECK(coded.value().items()->size() == 1);
    CHECK(coded.value().committer().display_name() == "Dr. Lee");

    auto text = attestation::create(audit, std::string("reviewed on ward round"), false,
                                    terminology);
    REQUIRE(text.is_ok());
    CHECK(std::get<std::string>(text.value().reason()) == "reviewed on ward round");
}

TEST_CASE("attestation rejects invalid input", "[common][attestation]") {
    terminology::openehr_terminology terminology;
    auto audit = test::make_audit(terminology, terminology::audit_change_type::attestation);

    SECTION("reason outside the attestation reason group") {
        auto wrong = attestation::create(
            audit, terminology::to_coded_text(terminology::audit_change_type::creation), false,
            terminology);
        REQUIRE(wrong.is_err());
        CHECK(wrong.error().code == error_codes::invalid_attestation_reason);
    }

    SECTION("empty items") {
        auto wrong = attestation::create(audit, std::string("ok"), false, terminology,
                                         std::nullopt, std::nullopt,
                                         std::vector<std::string>{});
        REQUIRE(wrong.is_err());
        CHECK(wrong.error().code == error_codes::empty_collection);
    }
}
