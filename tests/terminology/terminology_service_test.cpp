/**
 * @file terminology_service_test.cpp
 * @brief Unit tests for the built-in openEHR terminology
 */

#include <ehr/terminology/openehr_codes.hpp>
#include <ehr/terminology/terminology_service.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>

using namespace ehr::terminology;

TEST_CASE("openehr_terminology registers the three code groups", "[terminology]") {
    openehr_terminology terminology;

    auto ids = terminology.group_ids();
    CHECK(ids.size() == 3);
    CHECK(std::find(ids.begin(), ids.end(), groups::audit_change_type) != ids.end());
    CHECK(std::find(ids.begin(), ids.end(), groups::attestation_reason) != ids.end());
    CHECK(std::find(ids.begin(), ids.end(), groups::version_lifecycle_state) != ids.end());
}

TEST_CASE("verify_code_in_group checks group membership", "[terminology]") {
    openehr_terminology terminology;

    const code_phrase creation{openehr_terminology_id, "249"};
    const code_phrase complete{openehr_terminology_id, "532"};
    const code_phrase deleted{openehr_terminology_id, "523"};

    CHECK(terminology.verify_code_in_group(creation, groups::audit_change_type));
    CHECK_FALSE(terminology.verify_code_in_group(creation, groups::version_lifecycle_state));

    CHECK(terminology.verify_code_in_group(complete, groups::version_lifecycle_state));
    CHECK_FALSE(terminology.verify_code_in_group(complete, groups::audit_change_type));

    SECTION("deleted belongs to both change type and lifecycle groups") {
        CHECK(terminology.verify_code_in_group(deleted, groups::audit_change_type));
        CHECK(terminology.verify_code_in_group(deleted, groups::version_lifecycle_state));
    }

    SECTION("foreign terminology is never a member") {
        CHECK_FALSE(terminology.verify_code_in_group(code_phrase{"SNOMED-CT", "249"},
                                                     groups::audit_change_type));
    }

    SECTION("unknown group") {
        CHECK_FALSE(terminology.verify_code_in_group(creation, "no such group"));
    }
}

TEST_CASE("rubric_for and make_coded_text", "[terminology]") {
    openehr_terminology terminology;

    CHECK(terminology.rubric_for(code_phrase{openehr_terminology_id, "240"}) == "signed");
    CHECK_FALSE(terminology.rubric_for(code_phrase{openehr_terminology_id, "999"}).has_value());

    auto text = terminology.make_coded_text("817");
    REQUIRE(text.has_value());
    CHECK(text->value == "format conversion");
    CHECK(text->defining_code.code_string == "817");

    CHECK_FALSE(terminology.make_coded_text("0").has_value());
}

TEST_CASE("register_group extends the terminology", "[terminology]") {
    openehr_terminology terminology;
    terminology.register_group("setting", {{"225", "home"}, {"229", "primary medical care"}});

    CHECK(terminology.verify_code_in_group(code_phrase{openehr_terminology_id, "225"}, "setting"));
    CHECK(terminology.rubric_for(code_phrase{openehr_terminology_id, "229"}) ==
          "primary medical care");
    CHECK(terminology.group_ids().size() == 4);
}

TEST_CASE("to_coded_text agrees with the terminology", "[terminology][codes]") {
    openehr_terminology terminology;

    for (auto type : {audit_change_type::creation, audit_change_type::amendment,
                      audit_change_type::modification, audit_change_type::synthesis,
                      audit_change_type::unknown, audit_change_type::deleted,
                      audit_change_type::attestation, audit_change_type::restoration,
                      audit_change_type::format_conversion}) {
        auto text = to_coded_text(type);
        INFO("code: " << text.defining_code.code_string);
        CHECK(terminology.verify_code_in_group(text.defining_code, groups::audit_change_type));
        CHECK(terminology.rubric_for(text.defining_code) == text.value);
    }

    for (auto state : {version_lifecycle_state::complete, version_lifecycle_state::incomplete,
                       version_lifecycle_state::deleted, version_lifecycle_state::inactive,
                       version_lifecycle_state::abandoned}) {
        auto text = to_coded_text(state);
        CHECK(terminology.verify_code_in_group(text.defining_code,
                                               groups::version_lifecycle_state));
        CHECK(parse_lifecycle_state(text) == state);
    }

    auto signature = to_coded_text(attestation_reason::signature);
    CHECK(terminology.verify_code_in_group(signature.defining_code, groups::attestation_reason));
}

TEST_CASE("parse_lifecycle_state rejects foreign codes", "[terminology][codes]") {
    CHECK_FALSE(parse_lifecycle_state(coded_text{"complete", {"local", "532"}}).has_value());
    CHECK_FALSE(parse_lifecycle_state(coded_text{"creation", {openehr_terminology_id, "249"}})
                    .has_value());
}
