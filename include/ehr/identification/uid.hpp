/**
 * @file uid.hpp
 * @brief Globally unique root identifiers (ISO OID, UUID, Internet ID)
 *
 * A UID is the root part of every UID-based identifier in the record
 * model. Three lexical grammars are accepted:
 *
 * - ISO OID: "1.2.840.10008", arcs without leading zeros, first arc 0-2
 * - UUID: "154b1047-23aa-4d4d-8713-df848fd4d60a" (8-4-4-4-12 hex digits)
 * - Internet ID: reverse domain name such as "net.example.ehr"
 *
 * Equality is exact string equality; no case folding is performed.
 */

#pragma once

#include <ehr/core/result.hpp>

#include <compare>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace ehr::identification {

/**
 * @brief Lexical grammar a UID was recognised by
 */
enum class uid_kind {
    iso_oid,
    uuid,
    internet_id
};

/**
 * @brief Convert uid_kind to its reference model type name
 */
[[nodiscard]] auto to_string(uid_kind kind) -> std::string;

/**
 * @brief Validated root identifier
 *
 * @example
 * @code
 * auto id = uid::create("154b1047-23aa-4d4d-8713-df848fd4d60a");
 * if (id.is_ok()) {
 *     assert(id.value().kind() == uid_kind::uuid);
 * }
 * @endcode
 */
class uid {
public:
    /**
     * @brief Validate and classify a UID string
     *
     * Grammars are tried in the order ISO OID, UUID, Internet ID.
     *
     * @param value Candidate UID
     * @return The UID, or invalid_uid_format when no grammar matches
     */
    [[nodiscard]] static auto create(std::string_view value) -> Result<uid>;

    /**
     * @brief Classify a string without constructing a UID
     * @return The matching grammar, or std::nullopt
     */
    [[nodiscard]] static auto classify(std::string_view value) noexcept
        -> std::optional<uid_kind>;

    [[nodiscard]] static auto is_iso_oid(std::string_view value) noexcept -> bool;
    [[nodiscard]] static auto is_uuid(std::string_view value) noexcept -> bool;
    [[nodiscard]] static auto is_internet_id(std::string_view value) noexcept -> bool;

    [[nodiscard]] auto value() const noexcept -> const std::string& { return value_; }
    [[nodiscard]] auto kind() const noexcept -> uid_kind { return kind_; }

    [[nodiscard]] auto operator==(const uid& other) const noexcept -> bool {
        return value_ == other.value_;
    }
    [[nodiscard]] auto operator<=>(const uid& other) const noexcept {
        return value_ <=> other.value_;
    }

private:
    uid(std::string value, uid_kind kind) : value_(std::move(value)), kind_(kind) {}

    std::string value_;
    uid_kind kind_;
};

}  // namespace ehr::identification

template <>
struct std::hash<ehr::identification::uid> {
    [[nodiscard]] auto operator()(const ehr::identification::uid& id) const noexcept
        -> std::size_t {
        return std::hash<std::string>{}(id.value());
    }
};
