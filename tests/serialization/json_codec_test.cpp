/**
 * @file json_codec_test.cpp
 * @brief Unit tests for the JSON record codec
 */

#include "fixtures/record_fixtures.hpp"

#include <ehr/serialization/json_codec.hpp>
#include <ehr/serialization/version_codec.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace ehr;
using namespace ehr::serialization;
using test::clinical_note;

namespace {

constexpr std::string_view contribution_uid = "3e8e7f35-6b0a-4f3c-9a56-0a3d5c2f8e11";

auto first_version(const terminology::terminology_service& terminology)
    -> change_control::original_version<clinical_note> {
    return test::make_original(terminology, test::hier_id(contribution_uid),
                               test::scenario_version_id(test::system_id, "1"), std::nullopt,
                               clinical_note{"admitted", 1});
}

}  // namespace

// ============================================================================
// Record Shape Tests
// ============================================================================

TEST_CASE("identifiers encode with type tags", "[serialization][json]") {
    auto id = test::scenario_version_id(test::system_id, "2");
    auto record = encode(id);
    CHECK(record["_type"] == "OBJECT_VERSION_ID");
    CHECK(record["value"] == id.value());

    auto ref = encode(identification::object_ref::to_version(id));
    CHECK(ref["_type"] == "OBJECT_REF");
    CHECK(ref["namespace"] == "local");
    CHECK(ref["type"] == "VERSION");
    CHECK(ref["id"]["_type"] == "OBJECT_VERSION_ID");

    auto decoded = decode_object_ref(ref);
    REQUIRE(decoded.is_ok());
    CHECK(decoded.value() == identification::object_ref::to_version(id));
}

TEST_CASE("coded text encodes its terminology", "[serialization][json]") {
    auto record = encode(terminology::to_coded_text(terminology::audit_change_type::creation));
    CHECK(record["_type"] == "DV_CODED_TEXT");
    CHECK(record["value"] == "creation");
    CHECK(record["defining_code"]["_type"] == "CODE_PHRASE");
    CHECK(record["defining_code"]["terminology_id"]["value"] == "openehr");
    CHECK(record["defining_code"]["code_string"] == "249");

    auto decoded = decode_text_or_coded(record);
    REQUIRE(decoded.is_ok());
    REQUIRE(std::holds_alternative<terminology::coded_text>(decoded.value()));

    auto text = decode_text_or_coded(encode_text("free text"));
    REQUIRE(text.is_ok());
    CHECK(std::get<std::string>(text.value()) == "free text");
}

TEST_CASE("date times use ISO 8601 UTC", "[serialization][json]") {
    auto time = test::commit_time() + std::chrono::milliseconds{250};
    auto record = encode_date_time(time);
    CHECK(record["value"] == "2023-11-14T22:13:20.25Z");

    auto decoded = decode_date_time(record);
    REQUIRE(decoded.is_ok());
    CHECK(decoded.value() == time);

    SECTION("local time is rejected") {
        json local{{"_type", "DV_DATE_TIME"}, {"value", "2023-11-14T22:13:20+01:00"}};
        auto result = decode_date_time(local);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::decode_error);
    }
}

TEST_CASE("party proxies keep their kind", "[serialization][json]") {
    auto self_record = encode(common::party_proxy::self(test::ehr_ref()));
    CHECK(self_record["_type"] == "PARTY_SELF");
    CHECK(self_record["external_ref"]["_type"] == "PARTY_REF");

    auto self_party = decode_party_proxy(self_record);
    REQUIRE(self_party.is_ok());
    CHECK(self_party.value().kind() == common::party_kind::self);
    CHECK(self_party.value().external_ref() == test::ehr_ref());

    auto named = decode_party_proxy(encode(test::clinician()));
    REQUIRE(named.is_ok());
    CHECK(named.value() == test::clinician());
}

// ============================================================================
// Audit Records
// ============================================================================

TEST_CASE("audit details and attestations survive encoding", "[serialization][json]") {
    terminology::openehr_terminology terminology;

    auto audit = test::make_audit(terminology, terminology::audit_change_type::amendment, 3);
    auto decoded_audit = decode_audit_details(encode(audit), terminology);
    REQUIRE(decoded_audit.is_ok());
    CHECK(decoded_audit.value() == audit);

    auto entry = test::make_attestation(terminology);
    auto record = encode(entry);
    CHECK(record["_type"] == "ATTESTATION");
    CHECK(record["is_pending"] == false);

    auto decoded_entry = decode_audit_entry(record, terminology);
    REQUIRE(decoded_entry.is_ok());
    REQUIRE(std::holds_alternative<common::attestation>(decoded_entry.value()));
    CHECK(std::get<common::attestation>(decoded_entry.value()) == entry);
}

TEST_CASE("decoding validates codes against the terminology", "[serialization][json]") {
    terminology::openehr_terminology terminology;

    auto record = encode(test::make_audit(terminology));
    record["change_type"]["defining_code"]["code_string"] = "532";

    auto decoded = decode_audit_details(record, terminology);
    REQUIRE(decoded.is_err());
    CHECK(decoded.error().code == error_codes::invalid_change_type);
}

TEST_CASE("revision history preserves item and audit order", "[serialization][json]") {
    terminology::openehr_terminology terminology;
    auto v1 = test::scenario_version_id(test::system_id, "1");
    auto v2 = test::scenario_version_id(test::system_id, "2");

    common::revision_history history;
    history.add_item(common::revision_history_item{v1, test::make_audit(terminology)});
    history.add_item(common::revision_history_item{
        v2, test::make_audit(terminology, terminology::audit_change_type::modification, 1)});
    REQUIRE(history.append_attestation(v1, test::make_attestation(terminology)).is_ok());

    auto decoded = decode_revision_history(encode(history), terminology);
    REQUIRE(decoded.is_ok());
    REQUIRE(decoded.value().size() == 2);
    CHECK(decoded.value().items()[0].version_id() == v1);
    CHECK(decoded.value().items()[0].audits().size() == 2);
    CHECK(decoded.value().items()[1].version_id() == v2);
}

// ============================================================================
// Versions and Contributions
// ============================================================================

TEST_CASE("original versions decode to equal values", "[serialization][version]") {
    terminology::openehr_terminology terminology;
    change_control::version<clinical_note> v{first_version(terminology)};

    auto record = encode(v);
    CHECK(record["_type"] == "ORIGINAL_VERSION");
    CHECK(record["data"]["text"] == "admitted");
    CHECK_FALSE(record.contains("preceding_version_uid"));

    auto decoded = decode_version<clinical_note>(record, terminology);
    REQUIRE(decoded.is_ok());
    CHECK(decoded.value().is_original());
    CHECK(decoded.value().uid() == v.uid());
    CHECK(decoded.value().data() == v.data());
    CHECK(decoded.value().commit_audit() == v.commit_audit());
    CHECK(decoded.value().lifecycle_state() == v.lifecycle_state());
}

TEST_CASE("imported versions nest their original", "[serialization][version]") {
    terminology::openehr_terminology terminology;
    change_control::imported_version<clinical_note> imported{
        identification::object_ref::to_contribution(test::hier_id(contribution_uid)),
        test::make_audit(terminology, terminology::audit_change_type::format_conversion),
        first_version(terminology)};
    change_control::version<clinical_note> v{imported};

    auto record = encode(v);
    CHECK(record["_type"] == "IMPORTED_VERSION");
    CHECK(record["item"]["_type"] == "ORIGINAL_VERSION");

    auto decoded = decode_version<clinical_note>(record, terminology);
    REQUIRE(decoded.is_ok());
    CHECK(decoded.value().is_imported());
    CHECK(decoded.value().uid() == v.uid());
}

TEST_CASE("canonical form is stable and excludes the signature", "[serialization][version]") {
    terminology::openehr_terminology terminology;
    change_control::version<clinical_note> unsigned_version{first_version(terminology)};

    auto signed_original = change_control::original_version<clinical_note>::create(
        identification::object_ref::to_contribution(test::hier_id(contribution_uid)),
        test::make_audit(terminology), test::scenario_version_id(test::system_id, "1"),
        std::nullopt, terminology::to_coded_text(terminology::version_lifecycle_state::complete),
        clinical_note{"admitted", 1}, terminology, std::nullopt, std::nullopt,
        std::string("c2lnbmF0dXJl"));
    REQUIRE(signed_original.is_ok());
    change_control::version<clinical_note> signed_version{signed_original.value()};

    CHECK(canonical_form(unsigned_version) == canonical_form(unsigned_version));
    CHECK(canonical_form(signed_version) == canonical_form(unsigned_version));
    CHECK(encode(signed_version)["signature"] == "c2lnbmF0dXJl");
    CHECK(canonical_form(unsigned_version).find('\n') == std::string::npos);
}

TEST_CASE("contributions and container metadata decode", "[serialization][json]") {
    terminology::openehr_terminology terminology;
    auto contribution = test::make_contribution(terminology, test::hier_id(contribution_uid),
                                                test::scenario_version_id(test::system_id, "1"));

    auto decoded = decode_contribution(encode(contribution), terminology);
    REQUIRE(decoded.is_ok());
    CHECK(decoded.value().uid == contribution.uid);
    CHECK(decoded.value().versions == contribution.versions);
    CHECK(decoded.value().audit == contribution.audit);

    change_control::container_metadata metadata{test::hier_id(test::container_uid),
                                                test::ehr_ref(), test::commit_time()};
    auto decoded_metadata = decode_container_metadata(encode(metadata));
    REQUIRE(decoded_metadata.is_ok());
    CHECK(decoded_metadata.value().uid == metadata.uid);
    CHECK(decoded_metadata.value().owner_id == metadata.owner_id);
    CHECK(decoded_metadata.value().time_created == metadata.time_created);
}

// ============================================================================
// Malformed Input
// ============================================================================

TEST_CASE("malformed records are reported", "[serialization][errors]") {
    terminology::openehr_terminology terminology;

    SECTION("not an object") {
        auto result = decode_version<clinical_note>(json::array(), terminology);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::decode_error);
    }

    SECTION("missing discriminator") {
        auto result = decode_version<clinical_note>(json{{"uid", "x"}}, terminology);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::missing_field);
    }

    SECTION("unknown discriminator") {
        auto result = decode_version<clinical_note>(json{{"_type", "COMPOSITION"}}, terminology);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::unknown_type_tag);
    }

    SECTION("missing field") {
        auto record = encode(change_control::version<clinical_note>{first_version(terminology)});
        record.erase("commit_audit");
        auto result = decode_version<clinical_note>(record, terminology);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::missing_field);
    }

    SECTION("payload of the wrong shape") {
        auto record = encode(change_control::version<clinical_note>{first_version(terminology)});
        record["data"] = json{{"text", 42}};
        auto result = decode_version<clinical_note>(record, terminology);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::decode_error);
    }
}
