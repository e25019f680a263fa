/**
 * @file object_version_id.cpp
 * @brief Object version identifier parsing and composition
 */

#include <ehr/identification/object_version_id.hpp>

#include <ehr/compat/format.hpp>

namespace ehr::identification {

namespace {

auto invalid(std::string_view value, std::string_view reason) -> Result<object_version_id> {
    return ehr_error<object_version_id>(
        error_codes::invalid_object_version_id,
        compat::format("Invalid OBJECT_VERSION_ID '{}': {}", value, reason));
}

}  // namespace

auto object_version_id::create(std::string_view value) -> Result<object_version_id> {
    auto parts = split_uid_based_id(value);
    if (!parts.extension) {
        return invalid(value, "missing extension");
    }

    auto tail = split_uid_based_id(*parts.extension);
    if (!tail.extension) {
        return invalid(value, "extension must be creating_system_id::version_tree_id");
    }
    if (tail.extension->find(extension_separator) != std::string_view::npos) {
        return invalid(value, "too many '::' separators");
    }

    auto object_id = uid::create(parts.root);
    if (object_id.is_err()) {
        return invalid(value, "object id is not a valid UID");
    }

    auto system_id = uid::create(tail.root);
    if (system_id.is_err()) {
        return invalid(value, "creating system id is not a valid UID");
    }

    auto tree_id = version_tree_id::create(*tail.extension);
    if (tree_id.is_err()) {
        return invalid(value, "version tree id is malformed");
    }

    return object_version_id{std::string(value), object_id.value(), system_id.value(),
                             tree_id.value()};
}

auto object_version_id::compose(const hier_object_id& object_id,
                                std::string_view creating_system_id,
                                const identification::version_tree_id& tree_id)
    -> Result<object_version_id> {
    return create(compat::format("{}{}{}{}{}", object_id.value(), extension_separator,
                                 creating_system_id, extension_separator, tree_id.value()));
}

auto object_version_id::extension() const -> std::string {
    return compat::format("{}{}{}", creating_system_id_.value(), extension_separator,
                          version_tree_id_.value());
}

}  // namespace ehr::identification
