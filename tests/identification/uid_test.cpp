/**
 * @file uid_test.cpp
 * @brief Unit tests for uid and hier_object_id
 */

#include <ehr/identification/hier_object_id.hpp>
#include <ehr/identification/uid.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace ehr::identification;

// ============================================================================
// Grammar Tests
// ============================================================================

TEST_CASE("uid recognises ISO OIDs", "[identification][uid]") {
    CHECK(uid::is_iso_oid("1.2.840.10008"));
    CHECK(uid::is_iso_oid("2"));
    CHECK(uid::is_iso_oid("1.0.3"));

    CHECK_FALSE(uid::is_iso_oid("3.1"));
    CHECK_FALSE(uid::is_iso_oid("1.02"));
    CHECK_FALSE(uid::is_iso_oid("1..2"));
    CHECK_FALSE(uid::is_iso_oid("1.2."));
    CHECK_FALSE(uid::is_iso_oid(""));
}

TEST_CASE("uid recognises UUIDs", "[identification][uid]") {
    CHECK(uid::is_uuid("154b1047-23aa-4d4d-8713-df848fd4d60a"));
    CHECK(uid::is_uuid("154B1047-23AA-4D4D-8713-DF848FD4D60A"));

    CHECK_FALSE(uid::is_uuid("154b1047-23aa-4d4d-8713-df848fd4d60"));
    CHECK_FALSE(uid::is_uuid("154b1047x23aa-4d4d-8713-df848fd4d60a"));
    CHECK_FALSE(uid::is_uuid("g54b1047-23aa-4d4d-8713-df848fd4d60a"));
}

TEST_CASE("uid recognises Internet IDs", "[identification][uid]") {
    CHECK(uid::is_internet_id("net.example.ehr"));
    CHECK(uid::is_internet_id("my-host.example.org"));
    CHECK(uid::is_internet_id("example.42"));

    SECTION("single label is not an Internet ID") {
        CHECK_FALSE(uid::is_internet_id("localhost"));
    }

    SECTION("labels other than the last must start with a letter") {
        CHECK_FALSE(uid::is_internet_id("1host.example"));
    }

    SECTION("hyphen rules") {
        CHECK_FALSE(uid::is_internet_id("-host.example"));
        CHECK_FALSE(uid::is_internet_id("host-.example"));
        CHECK_FALSE(uid::is_internet_id("ho--st.example"));
    }

    SECTION("empty labels") {
        CHECK_FALSE(uid::is_internet_id("host..example"));
        CHECK_FALSE(uid::is_internet_id("host.example."));
    }

    SECTION("label length limit") {
        std::string long_label(64, 'a');
        CHECK_FALSE(uid::is_internet_id(long_label + ".example"));
        CHECK(uid::is_internet_id(std::string(63, 'a') + ".example"));
    }
}

TEST_CASE("uid::create classifies in OID, UUID, Internet ID order", "[identification][uid]") {
    auto oid = uid::create("1.2.3");
    REQUIRE(oid.is_ok());
    CHECK(oid.value().kind() == uid_kind::iso_oid);
    CHECK(to_string(oid.value().kind()) == "ISO_OID");

    auto uuid = uid::create("154b1047-23aa-4d4d-8713-df848fd4d60a");
    REQUIRE(uuid.is_ok());
    CHECK(uuid.value().kind() == uid_kind::uuid);

    auto host = uid::create("net.example.ehr");
    REQUIRE(host.is_ok());
    CHECK(host.value().kind() == uid_kind::internet_id);
    CHECK(host.value().value() == "net.example.ehr");
}

TEST_CASE("uid::create rejects unrecognised values", "[identification][uid]") {
    auto result = uid::create("not a uid");
    REQUIRE(result.is_err());
    CHECK(result.error().code == ehr::error_codes::invalid_uid_format);

    CHECK(uid::create("").is_err());
}

// ============================================================================
// hier_object_id Tests
// ============================================================================

TEST_CASE("split_uid_based_id splits at the first separator", "[identification][hier_object_id]") {
    auto parts = split_uid_based_id("root::sys::1");
    CHECK(parts.root == "root");
    REQUIRE(parts.extension.has_value());
    CHECK(*parts.extension == "sys::1");

    auto bare = split_uid_based_id("root");
    CHECK(bare.root == "root");
    CHECK_FALSE(bare.extension.has_value());
}

TEST_CASE("hier_object_id accepts bare UIDs only", "[identification][hier_object_id]") {
    auto id = hier_object_id::create("154b1047-23aa-4d4d-8713-df848fd4d60a");
    REQUIRE(id.is_ok());
    CHECK(id.value().value() == "154b1047-23aa-4d4d-8713-df848fd4d60a");
    CHECK(id.value().root().kind() == uid_kind::uuid);

    SECTION("extension is rejected") {
        auto extended = hier_object_id::create("154b1047-23aa-4d4d-8713-df848fd4d60a::x");
        REQUIRE(extended.is_err());
        CHECK(extended.error().code == ehr::error_codes::invalid_uid_format);
    }

    SECTION("malformed root is rejected") {
        CHECK(hier_object_id::create("bad root").is_err());
    }
}

TEST_CASE("hier_object_id compares by value", "[identification][hier_object_id]") {
    auto a = hier_object_id::create("1.2.3");
    auto b = hier_object_id::create("1.2.3");
    auto c = hier_object_id::create("1.2.4");
    REQUIRE(a.is_ok());
    REQUIRE(b.is_ok());
    REQUIRE(c.is_ok());

    CHECK(a.value() == b.value());
    CHECK_FALSE(a.value() == c.value());
    CHECK(a.value() < c.value());
    CHECK(std::hash<hier_object_id>{}(a.value()) == std::hash<hier_object_id>{}(b.value()));
}
