/**
 * @file hier_object_id.cpp
 * @brief UID-based identifier parsing
 */

#include <ehr/identification/hier_object_id.hpp>

#include <ehr/compat/format.hpp>

namespace ehr::identification {

auto split_uid_based_id(std::string_view value) noexcept -> uid_based_parts {
    auto pos = value.find(extension_separator);
    if (pos == std::string_view::npos) {
        return {value, std::nullopt};
    }
    return {value.substr(0, pos), value.substr(pos + extension_separator.size())};
}

auto hier_object_id::create(std::string_view value) -> Result<hier_object_id> {
    auto parts = split_uid_based_id(value);
    if (parts.extension) {
        return ehr_error<hier_object_id>(
            error_codes::invalid_uid_format,
            compat::format("HIER_OBJECT_ID must not carry an extension: '{}'", value));
    }

    auto root = uid::create(parts.root);
    if (root.is_err()) {
        return root.error();
    }
    return hier_object_id{root.value()};
}

}  // namespace ehr::identification
