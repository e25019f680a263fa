/**
 * @file version_tree_id.cpp
 * @brief Version tree identifier parsing
 */

#include <ehr/identification/version_tree_id.hpp>

#include <ehr/compat/format.hpp>

#include <limits>
#include <vector>

namespace ehr::identification {

namespace {

/**
 * @brief Check [1-9][0-9]*
 */
auto is_positive_number(std::string_view text) noexcept -> bool {
    if (text.empty() || text.front() < '1' || text.front() > '9') {
        return false;
    }
    for (char c : text) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    return true;
}

/**
 * @brief Convert a validated part, empty when it exceeds 64 bits
 */
auto to_number(std::string_view text) noexcept -> std::optional<std::uint64_t> {
    std::uint64_t value = 0;
    constexpr auto max_value = std::numeric_limits<std::uint64_t>::max();
    for (char c : text) {
        auto digit = static_cast<std::uint64_t>(c - '0');
        if (value > (max_value - digit) / 10) {
            return std::nullopt;
        }
        value = value * 10 + digit;
    }
    return value;
}

auto invalid(std::string_view value) -> Result<version_tree_id> {
    return ehr_error<version_tree_id>(
        error_codes::invalid_version_tree_id,
        compat::format("Invalid VERSION_TREE_ID: '{}'", value));
}

}  // namespace

auto version_tree_id::create(std::string_view value) -> Result<version_tree_id> {
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (true) {
        auto dot = value.find('.', start);
        if (dot == std::string_view::npos) {
            parts.push_back(value.substr(start));
            break;
        }
        parts.push_back(value.substr(start, dot - start));
        start = dot + 1;
    }

    if (parts.size() != 1 && parts.size() != 3) {
        return invalid(value);
    }
    for (auto part : parts) {
        if (!is_positive_number(part)) {
            return invalid(value);
        }
    }

    if (parts.size() == 1) {
        return version_tree_id{std::string(value), std::string(parts[0]), std::nullopt,
                               std::nullopt};
    }
    return version_tree_id{std::string(value), std::string(parts[0]), std::string(parts[1]),
                           std::string(parts[2])};
}

auto version_tree_id::trunk(std::uint64_t trunk) -> Result<version_tree_id> {
    if (trunk == 0) {
        return invalid("0");
    }
    auto text = std::to_string(trunk);
    return version_tree_id{text, text, std::nullopt, std::nullopt};
}

auto version_tree_id::trunk_version() const noexcept -> std::optional<std::uint64_t> {
    return to_number(trunk_);
}

auto version_tree_id::branch_number() const noexcept -> std::optional<std::uint64_t> {
    if (!branch_number_) {
        return std::nullopt;
    }
    return to_number(*branch_number_);
}

auto version_tree_id::branch_version() const noexcept -> std::optional<std::uint64_t> {
    if (!branch_version_) {
        return std::nullopt;
    }
    return to_number(*branch_version_);
}

auto version_tree_id::compare_trunk(const version_tree_id& other) const noexcept
    -> std::strong_ordering {
    // No leading zeros, so a longer part is the larger number
    if (auto by_length = trunk_.size() <=> other.trunk_.size(); by_length != 0) {
        return by_length;
    }
    return trunk_.compare(other.trunk_) <=> 0;
}

auto version_tree_id::next_trunk() const -> version_tree_id {
    auto text = trunk_;
    auto pos = text.size();
    while (pos > 0 && text[pos - 1] == '9') {
        text[pos - 1] = '0';
        --pos;
    }
    if (pos == 0) {
        text.insert(text.begin(), '1');
    } else {
        ++text[pos - 1];
    }
    return version_tree_id{text, text, std::nullopt, std::nullopt};
}

}  // namespace ehr::identification
