/**
 * @file version_tree_id.hpp
 * @brief Version tree identifier "trunk[.branch_number.branch_version]"
 *
 * Each part is a positive decimal integer without leading zeros and of any
 * length. "3" is the third trunk version; "2.1.4" is the fourth version on
 * the first branch leaving trunk version 2.
 */

#pragma once

#include <ehr/core/result.hpp>

#include <compare>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace ehr::identification {

/**
 * @brief Position of a version within its version tree
 *
 * The parts are kept as text. The numeric projections are empty when a part
 * does not fit in 64 bits.
 */
class version_tree_id {
public:
    /**
     * @brief Parse a version tree identifier
     * @return The identifier, or invalid_version_tree_id on a malformed value
     */
    [[nodiscard]] static auto create(std::string_view value) -> Result<version_tree_id>;

    /**
     * @brief Build a trunk identifier from its number
     * @param trunk Trunk version, must be greater than zero
     */
    [[nodiscard]] static auto trunk(std::uint64_t trunk) -> Result<version_tree_id>;

    [[nodiscard]] auto value() const noexcept -> const std::string& { return value_; }

    [[nodiscard]] auto trunk_text() const noexcept -> std::string_view { return trunk_; }

    [[nodiscard]] auto branch_number_text() const noexcept -> std::optional<std::string_view> {
        if (!branch_number_) {
            return std::nullopt;
        }
        return std::string_view{*branch_number_};
    }

    [[nodiscard]] auto branch_version_text() const noexcept -> std::optional<std::string_view> {
        if (!branch_version_) {
            return std::nullopt;
        }
        return std::string_view{*branch_version_};
    }

    /// Trunk number, empty when it exceeds 64 bits
    [[nodiscard]] auto trunk_version() const noexcept -> std::optional<std::uint64_t>;

    /// Branch number, present only for branch versions that fit in 64 bits
    [[nodiscard]] auto branch_number() const noexcept -> std::optional<std::uint64_t>;

    /// Version within the branch, present only for branch versions that fit in 64 bits
    [[nodiscard]] auto branch_version() const noexcept -> std::optional<std::uint64_t>;

    [[nodiscard]] auto is_branch() const noexcept -> bool {
        return branch_number_.has_value();
    }

    [[nodiscard]] auto is_first() const noexcept -> bool {
        return trunk_ == "1" && !is_branch();
    }

    /**
     * @brief Numeric ordering of the trunk parts, branches ignored
     */
    [[nodiscard]] auto compare_trunk(const version_tree_id& other) const noexcept
        -> std::strong_ordering;

    /**
     * @brief Trunk identifier following this one's trunk number
     *
     * "7" and "7.1.2" both give "8".
     */
    [[nodiscard]] auto next_trunk() const -> version_tree_id;

    [[nodiscard]] auto operator==(const version_tree_id& other) const noexcept -> bool {
        return value_ == other.value_;
    }

private:
    version_tree_id(std::string value, std::string trunk,
                    std::optional<std::string> branch_number,
                    std::optional<std::string> branch_version)
        : value_(std::move(value)),
          trunk_(std::move(trunk)),
          branch_number_(std::move(branch_number)),
          branch_version_(std::move(branch_version)) {}

    std::string value_;
    std::string trunk_;
    std::optional<std::string> branch_number_;
    std::optional<std::string> branch_version_;
};

}  // namespace ehr::identification
