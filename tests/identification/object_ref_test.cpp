/**
 * @file object_ref_test.cpp
 * @brief Unit tests for object_id and object_ref
 */

#include <ehr/identification/object_ref.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace ehr::identification;

TEST_CASE("object_id_type tags round-trip", "[identification][object_ref]") {
    for (auto type : {object_id_type::hier_object_id, object_id_type::object_version_id,
                      object_id_type::generic_id}) {
        auto parsed = parse_object_id_type(to_string(type));
        REQUIRE(parsed.has_value());
        CHECK(*parsed == type);
    }
    CHECK_FALSE(parse_object_id_type("PARTY_REF").has_value());
}

TEST_CASE("object_id validates by type", "[identification][object_ref]") {
    SECTION("hier object id") {
        auto id = object_id::create(object_id_type::hier_object_id, "1.2.3");
        REQUIRE(id.is_ok());
        CHECK(id.value().type() == object_id_type::hier_object_id);
        CHECK(object_id::create(object_id_type::hier_object_id, "1.2.3::x::1").is_err());
    }

    SECTION("object version id") {
        auto id = object_id::create(object_id_type::object_version_id, "1.2.3::net.example.ehr::1");
        REQUIRE(id.is_ok());
        CHECK(id.value().value() == "1.2.3::net.example.ehr::1");
        CHECK(object_id::create(object_id_type::object_version_id, "1.2.3").is_err());
    }

    SECTION("generic id keeps its scheme") {
        auto id = object_id::generic("12345", "ssn");
        REQUIRE(id.is_ok());
        CHECK(id.value().scheme() == "ssn");

        auto empty = object_id::generic("", "ssn");
        REQUIRE(empty.is_err());
        CHECK(empty.error().code == ehr::error_codes::empty_identifier);
    }
}

TEST_CASE("object_ref validates namespace and type", "[identification][object_ref]") {
    auto id = object_id::generic("12345", "local");
    REQUIRE(id.is_ok());

    auto ref = object_ref::create("demographic", "PERSON", id.value());
    REQUIRE(ref.is_ok());
    CHECK(ref.value().ref_namespace() == "demographic");
    CHECK(ref.value().type() == "PERSON");
    CHECK(ref.value().id().value() == "12345");

    SECTION("namespace grammar") {
        CHECK(object_ref::is_valid_namespace("ehr.example.org/records?x=1&y=2"));
        CHECK_FALSE(object_ref::is_valid_namespace(""));
        CHECK_FALSE(object_ref::is_valid_namespace("1local"));
        CHECK_FALSE(object_ref::is_valid_namespace("local space"));

        auto bad = object_ref::create("1local", "PERSON", id.value());
        REQUIRE(bad.is_err());
        CHECK(bad.error().code == ehr::error_codes::invalid_object_ref);
    }

    SECTION("type must not be empty") {
        CHECK(object_ref::create("local", "", id.value()).is_err());
    }
}

TEST_CASE("object_ref factories point into the local namespace", "[identification][object_ref]") {
    auto contribution = hier_object_id::create("1.2.3");
    auto version = object_version_id::create("1.2.3::net.example.ehr::1");
    REQUIRE(contribution.is_ok());
    REQUIRE(version.is_ok());

    auto to_contribution = object_ref::to_contribution(contribution.value());
    CHECK(to_contribution.ref_namespace() == "local");
    CHECK(to_contribution.type() == "CONTRIBUTION");
    CHECK(to_contribution.id().type() == object_id_type::hier_object_id);

    auto to_version = object_ref::to_version(version.value());
    CHECK(to_version.type() == "VERSION");
    CHECK(to_version.id().type() == object_id_type::object_version_id);
    CHECK(to_version.id().value() == "1.2.3::net.example.ehr::1");

    CHECK(to_version == object_ref::to_version(version.value()));
    CHECK_FALSE(to_version == to_contribution);
}
