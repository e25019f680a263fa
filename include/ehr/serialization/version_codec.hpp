/**
 * @file version_codec.hpp
 * @brief JSON records and canonical form of versions
 *
 * The payload type T is written with nlohmann/json's ADL to_json and read
 * back with get<T>(), so T must provide to_json/from_json (or an
 * adl_serializer specialization).
 */

#pragma once

#include <ehr/change_control/imported_version.hpp>
#include <ehr/change_control/original_version.hpp>
#include <ehr/change_control/version.hpp>
#include <ehr/compat/format.hpp>
#include <ehr/serialization/json_codec.hpp>

#include <optional>
#include <string>
#include <vector>

namespace ehr::serialization {

namespace detail {

inline void write_version_fields(json& record,
                                 const identification::object_ref& contribution,
                                 const common::audit_details& commit_audit,
                                 const std::optional<std::string>& signature) {
    record["contribution"] = encode(contribution);
    record["commit_audit"] = encode(commit_audit);
    if (signature) {
        record["signature"] = *signature;
    }
}

}  // namespace detail

template <typename T>
[[nodiscard]] auto encode(const change_control::original_version<T>& v) -> json {
    json record{{"_type", std::string(type_tags::original_version)}};
    detail::write_version_fields(record, v.contribution(), v.commit_audit(), v.signature());
    record["uid"] = encode(v.uid());
    if (v.preceding_version_uid()) {
        record["preceding_version_uid"] = encode(*v.preceding_version_uid());
    }
    if (v.other_input_version_uids()) {
        auto inputs = json::array();
        for (const auto& id : *v.other_input_version_uids()) {
            inputs.push_back(encode(id));
        }
        record["other_input_version_uids"] = std::move(inputs);
    }
    record["lifecycle_state"] = encode(v.lifecycle_state());
    if (v.attestations()) {
        auto attestations = json::array();
        for (const auto& entry : *v.attestations()) {
            attestations.push_back(encode(entry));
        }
        record["attestations"] = std::move(attestations);
    }
    record["data"] = v.data();
    return record;
}

template <typename T>
[[nodiscard]] auto encode(const change_control::imported_version<T>& v) -> json {
    json record{{"_type", std::string(type_tags::imported_version)}};
    detail::write_version_fields(record, v.contribution(), v.commit_audit(), v.signature());
    record["item"] = encode(v.item());
    return record;
}

template <typename T>
[[nodiscard]] auto encode(const change_control::version<T>& v) -> json {
    return std::visit([](const auto& alternative) { return encode(alternative); }, v.value());
}

/**
 * @brief Byte-stable serialization of a version without its signature
 *
 * Keys are sorted and no whitespace is emitted, so equal versions always
 * produce identical bytes. This is the input of version signing.
 */
template <typename T>
[[nodiscard]] auto canonical_form(const change_control::version<T>& v) -> std::string {
    auto record = encode(v);
    record.erase("signature");
    return record.dump();
}

template <typename T>
[[nodiscard]] auto decode_original_version(const json& record,
                                           const terminology::terminology_service& terminology)
    -> Result<change_control::original_version<T>> {
    using result_type = change_control::original_version<T>;

    auto check = detail::expect_type(record, type_tags::original_version);
    if (check.is_err()) {
        return check.error();
    }

    auto contribution_field = detail::field(record, "contribution");
    if (contribution_field.is_err()) {
        return contribution_field.error();
    }
    auto contribution = decode_object_ref(*contribution_field.value());
    if (contribution.is_err()) {
        return contribution.error();
    }

    auto audit_field = detail::field(record, "commit_audit");
    if (audit_field.is_err()) {
        return audit_field.error();
    }
    auto commit_audit = decode_audit_details(*audit_field.value(), terminology);
    if (commit_audit.is_err()) {
        return commit_audit.error();
    }

    auto signature = detail::optional_string_field(record, "signature");
    if (signature.is_err()) {
        return signature.error();
    }

    auto uid_field = detail::field(record, "uid");
    if (uid_field.is_err()) {
        return uid_field.error();
    }
    auto uid = decode_object_version_id(*uid_field.value());
    if (uid.is_err()) {
        return uid.error();
    }

    std::optional<identification::object_version_id> preceding;
    if (record.contains("preceding_version_uid")) {
        auto id = decode_object_version_id(record.at("preceding_version_uid"));
        if (id.is_err()) {
            return id.error();
        }
        preceding = id.value();
    }

    std::optional<std::vector<identification::object_version_id>> other_inputs;
    if (record.contains("other_input_version_uids")) {
        const auto& list = record.at("other_input_version_uids");
        if (!list.is_array()) {
            return ehr_error<result_type>(error_codes::decode_error,
                                          "other_input_version_uids is not an array");
        }
        other_inputs.emplace();
        for (const auto& entry : list) {
            auto id = decode_object_version_id(entry);
            if (id.is_err()) {
                return id.error();
            }
            other_inputs->push_back(id.value());
        }
    }

    auto lifecycle_field = detail::field(record, "lifecycle_state");
    if (lifecycle_field.is_err()) {
        return lifecycle_field.error();
    }
    auto lifecycle_state = decode_coded_text(*lifecycle_field.value());
    if (lifecycle_state.is_err()) {
        return lifecycle_state.error();
    }

    std::optional<std::vector<common::attestation>> attestations;
    if (record.contains("attestations")) {
        const auto& list = record.at("attestations");
        if (!list.is_array()) {
            return ehr_error<result_type>(error_codes::decode_error,
                                          "attestations is not an array");
        }
        attestations.emplace();
        for (const auto& entry : list) {
            auto decoded = decode_attestation(entry, terminology);
            if (decoded.is_err()) {
                return decoded.error();
            }
            attestations->push_back(decoded.value());
        }
    }

    auto data_field = detail::field(record, "data");
    if (data_field.is_err()) {
        return data_field.error();
    }
    std::optional<T> data;
    try {
        data.emplace(data_field.value()->template get<T>());
    } catch (const json::exception& e) {
        return ehr_error<result_type>(error_codes::decode_error,
                                      compat::format("Cannot decode version data: {}", e.what()));
    }

    return result_type::create(contribution.value(), commit_audit.value(), uid.value(),
                               std::move(preceding), lifecycle_state.value(), std::move(*data),
                               terminology, std::move(other_inputs), std::move(attestations),
                               signature.value());
}

template <typename T>
[[nodiscard]] auto decode_imported_version(const json& record,
                                           const terminology::terminology_service& terminology)
    -> Result<change_control::imported_version<T>> {
    auto check = detail::expect_type(record, type_tags::imported_version);
    if (check.is_err()) {
        return check.error();
    }

    auto contribution_field = detail::field(record, "contribution");
    if (contribution_field.is_err()) {
        return contribution_field.error();
    }
    auto contribution = decode_object_ref(*contribution_field.value());
    if (contribution.is_err()) {
        return contribution.error();
    }

    auto audit_field = detail::field(record, "commit_audit");
    if (audit_field.is_err()) {
        return audit_field.error();
    }
    auto commit_audit = decode_audit_details(*audit_field.value(), terminology);
    if (commit_audit.is_err()) {
        return commit_audit.error();
    }

    auto signature = detail::optional_string_field(record, "signature");
    if (signature.is_err()) {
        return signature.error();
    }

    auto item_field = detail::field(record, "item");
    if (item_field.is_err()) {
        return item_field.error();
    }
    auto item = decode_original_version<T>(*item_field.value(), terminology);
    if (item.is_err()) {
        return item.error();
    }

    return change_control::imported_version<T>{contribution.value(), commit_audit.value(),
                                               item.value(), signature.value()};
}

/**
 * @brief Decode an ORIGINAL_VERSION or IMPORTED_VERSION record
 */
template <typename T>
[[nodiscard]] auto decode_version(const json& record,
                                  const terminology::terminology_service& terminology)
    -> Result<change_control::version<T>> {
    auto type_name = detail::type_of(record);
    if (type_name.is_err()) {
        return type_name.error();
    }

    if (type_name.value() == type_tags::original_version) {
        auto v = decode_original_version<T>(record, terminology);
        if (v.is_err()) {
            return v.error();
        }
        return change_control::version<T>{v.value()};
    }
    if (type_name.value() == type_tags::imported_version) {
        auto v = decode_imported_version<T>(record, terminology);
        if (v.is_err()) {
            return v.error();
        }
        return change_control::version<T>{v.value()};
    }
    return ehr_error<change_control::version<T>>(
        error_codes::unknown_type_tag,
        compat::format("Expected version record, found {}", type_name.value()));
}

}  // namespace ehr::serialization
