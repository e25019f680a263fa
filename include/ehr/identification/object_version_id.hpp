/**
 * @file object_version_id.hpp
 * @brief Globally unique version identifier "object_id::creating_system_id::version_tree_id"
 */

#pragma once

#include <ehr/core/result.hpp>
#include <ehr/identification/hier_object_id.hpp>
#include <ehr/identification/uid.hpp>
#include <ehr/identification/version_tree_id.hpp>

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

namespace ehr::identification {

/**
 * @brief Identifier of one version within one versioned object
 *
 * The root is the identifier of the owning container, the extension names
 * the system that created the version and its position in the version tree.
 *
 * @example
 * @code
 * auto id = object_version_id::create(
 *     "154b1047-23aa-4d4d-8713-df848fd4d60a::net.example.ehr::2");
 * REQUIRE(id.is_ok());
 * CHECK(id.value().version_tree_id().trunk_version() == 2);
 * @endcode
 */
class object_version_id {
public:
    /**
     * @brief Parse a full object version identifier
     * @return The identifier, or invalid_object_version_id when any part is
     *         malformed
     */
    [[nodiscard]] static auto create(std::string_view value) -> Result<object_version_id>;

    /**
     * @brief Compose an identifier from its parts
     * @param object_id Owning container
     * @param creating_system_id UID of the creating system
     * @param tree_id Position in the version tree
     */
    [[nodiscard]] static auto compose(const hier_object_id& object_id,
                                      std::string_view creating_system_id,
                                      const identification::version_tree_id& tree_id)
        -> Result<object_version_id>;

    [[nodiscard]] auto value() const noexcept -> const std::string& { return value_; }

    /// Root part, identical to the owning container's UID
    [[nodiscard]] auto object_id() const noexcept -> const uid& { return object_id_; }

    /// Root part as a container identifier
    [[nodiscard]] auto container_id() const -> hier_object_id { return hier_object_id{object_id_}; }

    [[nodiscard]] auto creating_system_id() const noexcept -> const uid& {
        return creating_system_id_;
    }

    [[nodiscard]] auto version_tree_id() const noexcept
        -> const identification::version_tree_id& {
        return version_tree_id_;
    }

    /// Extension part "creating_system_id::version_tree_id"
    [[nodiscard]] auto extension() const -> std::string;

    [[nodiscard]] auto is_branch() const noexcept -> bool { return version_tree_id_.is_branch(); }

    [[nodiscard]] auto operator==(const object_version_id& other) const noexcept -> bool {
        return value_ == other.value_;
    }

private:
    object_version_id(std::string value, uid object_id, uid creating_system_id,
                      identification::version_tree_id tree_id)
        : value_(std::move(value)),
          object_id_(std::move(object_id)),
          creating_system_id_(std::move(creating_system_id)),
          version_tree_id_(std::move(tree_id)) {}

    std::string value_;
    uid object_id_;
    uid creating_system_id_;
    identification::version_tree_id version_tree_id_;
};

}  // namespace ehr::identification

template <>
struct std::hash<ehr::identification::object_version_id> {
    [[nodiscard]] auto operator()(const ehr::identification::object_version_id& id) const noexcept
        -> std::size_t {
        return std::hash<std::string>{}(id.value());
    }
};
