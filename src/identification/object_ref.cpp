/**
 * @file object_ref.cpp
 * @brief Object reference construction and validation
 */

#include <ehr/identification/object_ref.hpp>

#include <ehr/compat/format.hpp>

#include <cctype>

namespace ehr::identification {

namespace {

constexpr std::string_view local_namespace = "local";
constexpr std::string_view namespace_punctuation = "_.:/&?=+-";

}  // namespace

auto to_string(object_id_type type) -> std::string {
    switch (type) {
        case object_id_type::hier_object_id:
            return "HIER_OBJECT_ID";
        case object_id_type::object_version_id:
            return "OBJECT_VERSION_ID";
        case object_id_type::generic_id:
            return "GENERIC_ID";
        default:
            return "UNKNOWN";
    }
}

auto parse_object_id_type(std::string_view tag) -> std::optional<object_id_type> {
    if (tag == "HIER_OBJECT_ID") return object_id_type::hier_object_id;
    if (tag == "OBJECT_VERSION_ID") return object_id_type::object_version_id;
    if (tag == "GENERIC_ID") return object_id_type::generic_id;
    return std::nullopt;
}

// =============================================================================
// object_id
// =============================================================================

auto object_id::from(const hier_object_id& id) -> object_id {
    return object_id{object_id_type::hier_object_id, id.value()};
}

auto object_id::from(const object_version_id& id) -> object_id {
    return object_id{object_id_type::object_version_id, id.value()};
}

auto object_id::generic(std::string_view value, std::string_view scheme) -> Result<object_id> {
    if (value.empty()) {
        return ehr_error<object_id>(error_codes::empty_identifier,
                                    "GENERIC_ID value must not be empty");
    }
    return object_id{object_id_type::generic_id, std::string(value), std::string(scheme)};
}

auto object_id::create(object_id_type type, std::string_view value, std::string_view scheme)
    -> Result<object_id> {
    switch (type) {
        case object_id_type::hier_object_id: {
            auto id = hier_object_id::create(value);
            if (id.is_err()) {
                return id.error();
            }
            return from(id.value());
        }
        case object_id_type::object_version_id: {
            auto id = object_version_id::create(value);
            if (id.is_err()) {
                return id.error();
            }
            return from(id.value());
        }
        case object_id_type::generic_id:
        default:
            return generic(value, scheme);
    }
}

// =============================================================================
// object_ref
// =============================================================================

auto object_ref::is_valid_namespace(std::string_view ns) noexcept -> bool {
    if (ns.empty() || !std::isalpha(static_cast<unsigned char>(ns.front()))) {
        return false;
    }
    for (char c : ns) {
        if (!std::isalnum(static_cast<unsigned char>(c)) &&
            namespace_punctuation.find(c) == std::string_view::npos) {
            return false;
        }
    }
    return true;
}

auto object_ref::create(std::string_view ns, std::string_view type, object_id id)
    -> Result<object_ref> {
    if (!is_valid_namespace(ns)) {
        return ehr_error<object_ref>(error_codes::invalid_object_ref,
                                     compat::format("Invalid OBJECT_REF namespace: '{}'", ns));
    }
    if (type.empty()) {
        return ehr_error<object_ref>(error_codes::invalid_object_ref,
                                     "OBJECT_REF type must not be empty");
    }
    return object_ref{std::string(ns), std::string(type), std::move(id)};
}

auto object_ref::to_contribution(const hier_object_id& id) -> object_ref {
    return object_ref{std::string(local_namespace), "CONTRIBUTION", object_id::from(id)};
}

auto object_ref::to_version(const object_version_id& id) -> object_ref {
    return object_ref{std::string(local_namespace), "VERSION", object_id::from(id)};
}

}  // namespace ehr::identification
