/**
 * @file hier_object_id.hpp
 * @brief UID-based identifiers and the container identifier HIER_OBJECT_ID
 *
 * A UID-based identifier has the lexical form "root[::extension]", where
 * root is a UID and extension is whatever follows the first "::".
 * A hier_object_id is the extension-free variant used to name version
 * containers and contributions.
 */

#pragma once

#include <ehr/core/result.hpp>
#include <ehr/identification/uid.hpp>

#include <compare>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace ehr::identification {

/// Separator between the root and the extension of a UID-based id
inline constexpr std::string_view extension_separator = "::";

/**
 * @brief Lexical parts of a UID-based identifier
 */
struct uid_based_parts {
    std::string_view root;
    std::optional<std::string_view> extension;
};

/**
 * @brief Split "root[::extension]" at the first "::"
 *
 * No validation is performed on either part.
 */
[[nodiscard]] auto split_uid_based_id(std::string_view value) noexcept -> uid_based_parts;

/**
 * @brief Hierarchical object identifier without extension
 *
 * Identifies a versioned object (container) or a contribution.
 *
 * @example
 * @code
 * auto id = hier_object_id::create("154b1047-23aa-4d4d-8713-df848fd4d60a");
 * REQUIRE(id.is_ok());
 * @endcode
 */
class hier_object_id {
public:
    /**
     * @brief Parse an extension-free UID-based identifier
     * @return The identifier, or invalid_uid_format when the value is not a
     *         UID or carries a "::" extension
     */
    [[nodiscard]] static auto create(std::string_view value) -> Result<hier_object_id>;

    /**
     * @brief Wrap an already validated UID
     */
    explicit hier_object_id(uid root) : root_(std::move(root)) {}

    [[nodiscard]] auto value() const noexcept -> const std::string& { return root_.value(); }
    [[nodiscard]] auto root() const noexcept -> const uid& { return root_; }

    [[nodiscard]] auto operator==(const hier_object_id& other) const noexcept -> bool {
        return root_ == other.root_;
    }
    [[nodiscard]] auto operator<=>(const hier_object_id& other) const noexcept {
        return root_ <=> other.root_;
    }

private:
    uid root_;
};

}  // namespace ehr::identification

template <>
struct std::hash<ehr::identification::hier_object_id> {
    [[nodiscard]] auto operator()(const ehr::identification::hier_object_id& id) const noexcept
        -> std::size_t {
        return std::hash<std::string>{}(id.value());
    }
};
