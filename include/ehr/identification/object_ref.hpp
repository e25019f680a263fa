/**
 * @file object_ref.hpp
 * @brief References to objects held in other services or containers
 *
 * An object_ref names a target by namespace ("local", "ehr", "demographic"),
 * reference model type ("CONTRIBUTION", "VERSIONED_COMPOSITION", "PERSON")
 * and identifier. Contributions, version owners and external party
 * references are all carried this way.
 */

#pragma once

#include <ehr/core/result.hpp>
#include <ehr/identification/hier_object_id.hpp>
#include <ehr/identification/object_version_id.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace ehr::identification {

/**
 * @enum object_id_type
 * @brief Concrete identifier type carried by an object_ref
 */
enum class object_id_type {
    hier_object_id,
    object_version_id,
    generic_id
};

/**
 * @brief Convert object_id_type to its serialized type tag
 */
[[nodiscard]] auto to_string(object_id_type type) -> std::string;

/**
 * @brief Parse a serialized type tag
 * @return The identifier type, or std::nullopt if unknown
 */
[[nodiscard]] auto parse_object_id_type(std::string_view tag) -> std::optional<object_id_type>;

/**
 * @brief Identifier of any kind, tagged with its concrete type
 */
class object_id {
public:
    [[nodiscard]] static auto from(const hier_object_id& id) -> object_id;
    [[nodiscard]] static auto from(const object_version_id& id) -> object_id;

    /**
     * @brief Build an identifier in a non-UID scheme
     * @param value Identifier value, must be non-empty
     * @param scheme Issuing scheme (e.g. "local", "ssn")
     * @return The identifier, or empty_identifier when value is empty
     */
    [[nodiscard]] static auto generic(std::string_view value, std::string_view scheme)
        -> Result<object_id>;

    /**
     * @brief Rebuild an identifier from its serialized type and value
     */
    [[nodiscard]] static auto create(object_id_type type, std::string_view value,
                                     std::string_view scheme = {}) -> Result<object_id>;

    [[nodiscard]] auto type() const noexcept -> object_id_type { return type_; }
    [[nodiscard]] auto value() const noexcept -> const std::string& { return value_; }
    [[nodiscard]] auto scheme() const noexcept -> const std::string& { return scheme_; }

    [[nodiscard]] auto operator==(const object_id& other) const noexcept -> bool = default;

private:
    object_id(object_id_type type, std::string value, std::string scheme = {})
        : type_(type), value_(std::move(value)), scheme_(std::move(scheme)) {}

    object_id_type type_;
    std::string value_;
    std::string scheme_;
};

/**
 * @brief Reference to an object by namespace, type and identifier
 */
class object_ref {
public:
    /**
     * @brief Build a validated reference
     *
     * The namespace must match [a-zA-Z][a-zA-Z0-9_.:/&?=+-]* and the
     * type must be non-empty.
     *
     * @return The reference, or invalid_object_ref on malformed input
     */
    [[nodiscard]] static auto create(std::string_view ns, std::string_view type, object_id id)
        -> Result<object_ref>;

    /**
     * @brief Reference to a contribution held in the local system
     */
    [[nodiscard]] static auto to_contribution(const hier_object_id& id) -> object_ref;

    /**
     * @brief Reference to a version held in the local system
     */
    [[nodiscard]] static auto to_version(const object_version_id& id) -> object_ref;

    [[nodiscard]] static auto is_valid_namespace(std::string_view ns) noexcept -> bool;

    [[nodiscard]] auto ref_namespace() const noexcept -> const std::string& { return namespace_; }
    [[nodiscard]] auto type() const noexcept -> const std::string& { return type_; }
    [[nodiscard]] auto id() const noexcept -> const object_id& { return id_; }

    [[nodiscard]] auto operator==(const object_ref& other) const noexcept -> bool = default;

private:
    object_ref(std::string ns, std::string type, object_id id)
        : namespace_(std::move(ns)), type_(std::move(type)), id_(std::move(id)) {}

    std::string namespace_;
    std::string type_;
    object_id id_;
};

}  // namespace ehr::identification
