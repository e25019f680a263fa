/**
 * @file uid.cpp
 * @brief UID grammar recognition
 */

#include <ehr/identification/uid.hpp>

#include <ehr/compat/format.hpp>

#include <cctype>

namespace ehr::identification {

namespace {

constexpr std::size_t max_internet_id_length = 253;
constexpr std::size_t max_domain_label_length = 63;

auto is_hex(char c) noexcept -> bool {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

auto is_digit(char c) noexcept -> bool {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

auto is_alnum(char c) noexcept -> bool {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

/**
 * @brief Check one label of a domain name: [A-Za-z0-9-]{1,63}, no edge '-'
 */
auto is_domain_label(std::string_view label) noexcept -> bool {
    if (label.empty() || label.size() > max_domain_label_length) {
        return false;
    }
    if (label.front() == '-' || label.back() == '-') {
        return false;
    }
    for (char c : label) {
        if (!is_alnum(c) && c != '-') {
            return false;
        }
    }
    return true;
}

}  // namespace

auto to_string(uid_kind kind) -> std::string {
    switch (kind) {
        case uid_kind::iso_oid:
            return "ISO_OID";
        case uid_kind::uuid:
            return "UUID";
        case uid_kind::internet_id:
            return "INTERNET_ID";
        default:
            return "UNKNOWN";
    }
}

auto uid::is_iso_oid(std::string_view value) noexcept -> bool {
    // ^[0-2](\.0|\.[1-9][0-9]*)*$
    if (value.empty() || value[0] < '0' || value[0] > '2') {
        return false;
    }

    std::size_t pos = 1;
    while (pos < value.size()) {
        if (value[pos] != '.' || pos + 1 >= value.size()) {
            return false;
        }
        ++pos;

        if (value[pos] == '0') {
            ++pos;
            continue;
        }
        if (!is_digit(value[pos])) {
            return false;
        }
        while (pos < value.size() && is_digit(value[pos])) {
            ++pos;
        }
    }
    return true;
}

auto uid::is_uuid(std::string_view value) noexcept -> bool {
    constexpr std::size_t group_lengths[] = {8, 4, 4, 4, 12};
    constexpr std::size_t uuid_length = 36;

    if (value.size() != uuid_length) {
        return false;
    }

    std::size_t pos = 0;
    for (std::size_t group = 0; group < 5; ++group) {
        if (group > 0) {
            if (value[pos] != '-') {
                return false;
            }
            ++pos;
        }
        for (std::size_t i = 0; i < group_lengths[group]; ++i, ++pos) {
            if (!is_hex(value[pos])) {
                return false;
            }
        }
    }
    return true;
}

auto uid::is_internet_id(std::string_view value) noexcept -> bool {
    if (value.empty() || value.size() > max_internet_id_length) {
        return false;
    }
    if (value.find("--") != std::string_view::npos) {
        return false;
    }

    std::size_t label_count = 0;
    std::size_t start = 0;
    while (true) {
        auto dot = value.find('.', start);
        auto label = value.substr(start, dot == std::string_view::npos
                                             ? std::string_view::npos
                                             : dot - start);
        if (!is_domain_label(label)) {
            return false;
        }
        ++label_count;

        if (dot == std::string_view::npos) {
            break;
        }
        // Every label but the last must start with a letter
        if (is_digit(label.front())) {
            return false;
        }
        start = dot + 1;
    }
    return label_count >= 2;
}

auto uid::classify(std::string_view value) noexcept -> std::optional<uid_kind> {
    if (is_iso_oid(value)) {
        return uid_kind::iso_oid;
    }
    if (is_uuid(value)) {
        return uid_kind::uuid;
    }
    if (is_internet_id(value)) {
        return uid_kind::internet_id;
    }
    return std::nullopt;
}

auto uid::create(std::string_view value) -> Result<uid> {
    auto kind = classify(value);
    if (!kind) {
        return ehr_error<uid>(
            error_codes::invalid_uid_format,
            compat::format("Not a valid ISO OID, UUID or Internet ID: '{}'", value));
    }
    return uid{std::string(value), *kind};
}

}  // namespace ehr::identification
