/**
 * @file json_codec.cpp
 * @brief JSON records for identifiers, audits and contributions
 */

#include <ehr/serialization/json_codec.hpp>

#include <ehr/compat/format.hpp>

#include <vector>

namespace ehr::serialization {

namespace {

constexpr const char* type_key = "_type";

auto tag(std::string_view value) -> std::string { return std::string(value); }

auto decode_failure(std::string_view what, std::string_view reason) -> error_info {
    return error_info{error_codes::decode_error,
                      compat::format("Cannot decode {}: {}", what, reason), "ehr"};
}

auto encode_party_ref(const identification::object_ref& ref) -> json {
    auto record = encode(ref);
    record[type_key] = tag(type_tags::party_ref);
    return record;
}

void write_audit_fields(json& record, const common::audit_details& audit) {
    record["system_id"] = audit.system_id();
    record["time_committed"] = encode_date_time(audit.time_committed());
    record["change_type"] = encode(audit.change_type());
    record["committer"] = encode(audit.committer());
    if (audit.description()) {
        record["description"] = encode_text(*audit.description());
    }
}

auto read_audit_fields(const json& record, const terminology::terminology_service& terminology)
    -> Result<common::audit_details> {
    auto system_id = detail::string_field(record, "system_id");
    if (system_id.is_err()) {
        return system_id.error();
    }

    auto time_field = detail::field(record, "time_committed");
    if (time_field.is_err()) {
        return time_field.error();
    }
    auto time_committed = decode_date_time(*time_field.value());
    if (time_committed.is_err()) {
        return time_committed.error();
    }

    auto change_field = detail::field(record, "change_type");
    if (change_field.is_err()) {
        return change_field.error();
    }
    auto change_type = decode_coded_text(*change_field.value());
    if (change_type.is_err()) {
        return change_type.error();
    }

    auto committer_field = detail::field(record, "committer");
    if (committer_field.is_err()) {
        return committer_field.error();
    }
    auto committer = decode_party_proxy(*committer_field.value());
    if (committer.is_err()) {
        return committer.error();
    }

    std::optional<std::string> description;
    if (record.contains("description")) {
        auto text = decode_text(record.at("description"));
        if (text.is_err()) {
            return text.error();
        }
        description = text.value();
    }

    return common::audit_details::create(system_id.value(), time_committed.value(),
                                         change_type.value(), committer.value(), terminology,
                                         std::move(description));
}

}  // namespace

// =============================================================================
// Decoding helpers
// =============================================================================

namespace detail {

auto type_of(const json& record) -> Result<std::string> {
    if (!record.is_object()) {
        return decode_failure("record", "not a JSON object");
    }
    auto it = record.find(type_key);
    if (it == record.end()) {
        return ehr_error<std::string>(error_codes::missing_field,
                                      "Record has no _type discriminator");
    }
    if (!it->is_string()) {
        return decode_failure("record", "_type is not a string");
    }
    return it->get<std::string>();
}

auto expect_type(const json& record, std::string_view expected) -> VoidResult {
    auto actual = type_of(record);
    if (actual.is_err()) {
        return actual.error();
    }
    if (actual.value() != expected) {
        return ehr_void_error(error_codes::unknown_type_tag,
                              compat::format("Expected {} record, found {}", expected,
                                             actual.value()));
    }
    return ok();
}

auto field(const json& record, std::string_view key) -> Result<const json*> {
    if (!record.is_object()) {
        return decode_failure(key, "enclosing value is not a JSON object");
    }
    auto it = record.find(std::string(key));
    if (it == record.end()) {
        return ehr_error<const json*>(error_codes::missing_field,
                                      compat::format("Missing field '{}'", key));
    }
    return &*it;
}

auto string_field(const json& record, std::string_view key) -> Result<std::string> {
    auto value = field(record, key);
    if (value.is_err()) {
        return value.error();
    }
    if (!value.value()->is_string()) {
        return decode_failure(key, "not a string");
    }
    return value.value()->get<std::string>();
}

auto optional_string_field(const json& record, std::string_view key)
    -> Result<std::optional<std::string>> {
    auto it = record.find(std::string(key));
    if (it == record.end()) {
        return std::optional<std::string>{};
    }
    if (!it->is_string()) {
        return decode_failure(key, "not a string");
    }
    return std::optional<std::string>{it->get<std::string>()};
}

auto bool_field(const json& record, std::string_view key) -> Result<bool> {
    auto value = field(record, key);
    if (value.is_err()) {
        return value.error();
    }
    if (!value.value()->is_boolean()) {
        return decode_failure(key, "not a boolean");
    }
    return value.value()->get<bool>();
}

}  // namespace detail

// =============================================================================
// Identification
// =============================================================================

auto encode(const identification::hier_object_id& id) -> json {
    return json{{type_key, "HIER_OBJECT_ID"}, {"value", id.value()}};
}

auto encode(const identification::object_version_id& id) -> json {
    return json{{type_key, "OBJECT_VERSION_ID"}, {"value", id.value()}};
}

auto encode(const identification::object_id& id) -> json {
    json record{{type_key, identification::to_string(id.type())}, {"value", id.value()}};
    if (id.type() == identification::object_id_type::generic_id) {
        record["scheme"] = id.scheme();
    }
    return record;
}

auto encode(const identification::object_ref& ref) -> json {
    return json{{type_key, tag(type_tags::object_ref)},
                {"namespace", ref.ref_namespace()},
                {"type", ref.type()},
                {"id", encode(ref.id())}};
}

auto decode_hier_object_id(const json& record) -> Result<identification::hier_object_id> {
    auto check = detail::expect_type(record, "HIER_OBJECT_ID");
    if (check.is_err()) {
        return check.error();
    }
    auto value = detail::string_field(record, "value");
    if (value.is_err()) {
        return value.error();
    }
    return identification::hier_object_id::create(value.value());
}

auto decode_object_version_id(const json& record) -> Result<identification::object_version_id> {
    auto check = detail::expect_type(record, "OBJECT_VERSION_ID");
    if (check.is_err()) {
        return check.error();
    }
    auto value = detail::string_field(record, "value");
    if (value.is_err()) {
        return value.error();
    }
    return identification::object_version_id::create(value.value());
}

auto decode_object_id(const json& record) -> Result<identification::object_id> {
    auto type_name = detail::type_of(record);
    if (type_name.is_err()) {
        return type_name.error();
    }
    auto type = identification::parse_object_id_type(type_name.value());
    if (!type) {
        return ehr_error<identification::object_id>(
            error_codes::unknown_type_tag,
            compat::format("Unknown identifier type {}", type_name.value()));
    }

    auto value = detail::string_field(record, "value");
    if (value.is_err()) {
        return value.error();
    }
    auto scheme = detail::optional_string_field(record, "scheme");
    if (scheme.is_err()) {
        return scheme.error();
    }
    return identification::object_id::create(*type, value.value(),
                                             scheme.value().value_or(""));
}

auto decode_object_ref(const json& record) -> Result<identification::object_ref> {
    auto type_name = detail::type_of(record);
    if (type_name.is_err()) {
        return type_name.error();
    }
    if (type_name.value() != type_tags::object_ref && type_name.value() != type_tags::party_ref) {
        return ehr_error<identification::object_ref>(
            error_codes::unknown_type_tag,
            compat::format("Expected OBJECT_REF record, found {}", type_name.value()));
    }

    auto ns = detail::string_field(record, "namespace");
    if (ns.is_err()) {
        return ns.error();
    }
    auto type = detail::string_field(record, "type");
    if (type.is_err()) {
        return type.error();
    }
    auto id_field = detail::field(record, "id");
    if (id_field.is_err()) {
        return id_field.error();
    }
    auto id = decode_object_id(*id_field.value());
    if (id.is_err()) {
        return id.error();
    }
    return identification::object_ref::create(ns.value(), type.value(), id.value());
}

// =============================================================================
// Terminology and data values
// =============================================================================

auto encode(const terminology::code_phrase& code) -> json {
    return json{{type_key, tag(type_tags::code_phrase)},
                {"terminology_id",
                 json{{type_key, tag(type_tags::terminology_id)}, {"value", code.terminology_id}}},
                {"code_string", code.code_string}};
}

auto encode(const terminology::coded_text& text) -> json {
    return json{{type_key, tag(type_tags::dv_coded_text)},
                {"value", text.value},
                {"defining_code", encode(text.defining_code)}};
}

auto encode_text(const std::string& text) -> json {
    return json{{type_key, tag(type_tags::dv_text)}, {"value", text}};
}

auto encode(const terminology::text_or_coded& text) -> json {
    if (const auto* coded = std::get_if<terminology::coded_text>(&text)) {
        return encode(*coded);
    }
    return encode_text(std::get<std::string>(text));
}

auto encode_date_time(core::timestamp time) -> json {
    return json{{type_key, tag(type_tags::dv_date_time)}, {"value", core::to_iso8601(time)}};
}

auto decode_code_phrase(const json& record) -> Result<terminology::code_phrase> {
    auto check = detail::expect_type(record, type_tags::code_phrase);
    if (check.is_err()) {
        return check.error();
    }
    auto terminology_field = detail::field(record, "terminology_id");
    if (terminology_field.is_err()) {
        return terminology_field.error();
    }
    auto terminology_id = detail::string_field(*terminology_field.value(), "value");
    if (terminology_id.is_err()) {
        return terminology_id.error();
    }
    auto code_string = detail::string_field(record, "code_string");
    if (code_string.is_err()) {
        return code_string.error();
    }
    return terminology::code_phrase{terminology_id.value(), code_string.value()};
}

auto decode_coded_text(const json& record) -> Result<terminology::coded_text> {
    auto check = detail::expect_type(record, type_tags::dv_coded_text);
    if (check.is_err()) {
        return check.error();
    }
    auto value = detail::string_field(record, "value");
    if (value.is_err()) {
        return value.error();
    }
    auto code_field = detail::field(record, "defining_code");
    if (code_field.is_err()) {
        return code_field.error();
    }
    auto code = decode_code_phrase(*code_field.value());
    if (code.is_err()) {
        return code.error();
    }
    return terminology::coded_text{value.value(), code.value()};
}

auto decode_text(const json& record) -> Result<std::string> {
    auto check = detail::expect_type(record, type_tags::dv_text);
    if (check.is_err()) {
        return check.error();
    }
    return detail::string_field(record, "value");
}

auto decode_text_or_coded(const json& record) -> Result<terminology::text_or_coded> {
    auto type_name = detail::type_of(record);
    if (type_name.is_err()) {
        return type_name.error();
    }
    if (type_name.value() == type_tags::dv_coded_text) {
        auto coded = decode_coded_text(record);
        if (coded.is_err()) {
            return coded.error();
        }
        return terminology::text_or_coded{coded.value()};
    }
    auto text = decode_text(record);
    if (text.is_err()) {
        return text.error();
    }
    return terminology::text_or_coded{text.value()};
}

auto decode_date_time(const json& record) -> Result<core::timestamp> {
    auto check = detail::expect_type(record, type_tags::dv_date_time);
    if (check.is_err()) {
        return check.error();
    }
    auto value = detail::string_field(record, "value");
    if (value.is_err()) {
        return value.error();
    }
    auto time = core::parse_iso8601(value.value());
    if (!time) {
        return decode_failure("DV_DATE_TIME", compat::format("'{}' is not ISO 8601 UTC",
                                                             value.value()));
    }
    return *time;
}

// =============================================================================
// Audit
// =============================================================================

auto encode(const common::party_proxy& party) -> json {
    json record;
    if (party.kind() == common::party_kind::self) {
        record[type_key] = tag(type_tags::party_self);
    } else {
        record[type_key] = tag(type_tags::party_identified);
        if (party.name()) {
            record["name"] = *party.name();
        }
    }
    if (party.external_ref()) {
        record["external_ref"] = encode_party_ref(*party.external_ref());
    }
    return record;
}

auto encode(const common::audit_details& audit) -> json {
    json record{{type_key, tag(type_tags::audit_details)}};
    write_audit_fields(record, audit);
    return record;
}

auto encode(const common::attestation& entry) -> json {
    json record{{type_key, tag(type_tags::attestation)}};
    write_audit_fields(record, entry);
    record["reason"] = encode(entry.reason());
    record["is_pending"] = entry.is_pending();
    if (entry.attested_view()) {
        record["attested_view"] = json{
            {type_key, tag(type_tags::dv_multimedia)},
            {"media_type", entry.attested_view()->media_type},
            {"uri", json{{type_key, tag(type_tags::dv_uri)}, {"value", entry.attested_view()->uri}}}};
    }
    if (entry.proof()) {
        record["proof"] = *entry.proof();
    }
    if (entry.items()) {
        auto items = json::array();
        for (const auto& item : *entry.items()) {
            items.push_back(json{{type_key, tag(type_tags::dv_ehr_uri)}, {"value", item}});
        }
        record["items"] = std::move(items);
    }
    return record;
}

auto encode(const common::audit_entry& entry) -> json {
    return std::visit([](const auto& e) { return encode(e); }, entry);
}

auto encode(const common::revision_history_item& item) -> json {
    auto audits = json::array();
    for (const auto& entry : item.audits()) {
        audits.push_back(encode(entry));
    }
    return json{{type_key, tag(type_tags::revision_history_item)},
                {"version_id", encode(item.version_id())},
                {"audits", std::move(audits)}};
}

auto encode(const common::revision_history& history) -> json {
    auto items = json::array();
    for (const auto& item : history.items()) {
        items.push_back(encode(item));
    }
    return json{{type_key, tag(type_tags::revision_history)}, {"items", std::move(items)}};
}

auto decode_party_proxy(const json& record) -> Result<common::party_proxy> {
    auto type_name = detail::type_of(record);
    if (type_name.is_err()) {
        return type_name.error();
    }

    std::optional<identification::object_ref> external_ref;
    if (record.contains("external_ref")) {
        auto ref = decode_object_ref(record.at("external_ref"));
        if (ref.is_err()) {
            return ref.error();
        }
        external_ref = ref.value();
    }

    if (type_name.value() == type_tags::party_self) {
        return common::party_proxy::self(std::move(external_ref));
    }
    if (type_name.value() == type_tags::party_identified) {
        auto name = detail::optional_string_field(record, "name");
        if (name.is_err()) {
            return name.error();
        }
        return common::party_proxy::identified(name.value(), std::move(external_ref));
    }
    return ehr_error<common::party_proxy>(
        error_codes::unknown_type_tag,
        compat::format("Expected party proxy record, found {}", type_name.value()));
}

auto decode_audit_details(const json& record,
                          const terminology::terminology_service& terminology)
    -> Result<common::audit_details> {
    auto check = detail::expect_type(record, type_tags::audit_details);
    if (check.is_err()) {
        return check.error();
    }
    return read_audit_fields(record, terminology);
}

auto decode_attestation(const json& record,
                        const terminology::terminology_service& terminology)
    -> Result<common::attestation> {
    auto check = detail::expect_type(record, type_tags::attestation);
    if (check.is_err()) {
        return check.error();
    }

    auto audit = read_audit_fields(record, terminology);
    if (audit.is_err()) {
        return audit.error();
    }

    auto reason_field = detail::field(record, "reason");
    if (reason_field.is_err()) {
        return reason_field.error();
    }
    auto reason = decode_text_or_coded(*reason_field.value());
    if (reason.is_err()) {
        return reason.error();
    }

    auto is_pending = detail::bool_field(record, "is_pending");
    if (is_pending.is_err()) {
        return is_pending.error();
    }

    std::optional<common::media_reference> attested_view;
    if (record.contains("attested_view")) {
        const auto& view = record.at("attested_view");
        auto media_type = detail::string_field(view, "media_type");
        if (media_type.is_err()) {
            return media_type.error();
        }
        auto uri_field = detail::field(view, "uri");
        if (uri_field.is_err()) {
            return uri_field.error();
        }
        auto uri = detail::string_field(*uri_field.value(), "value");
        if (uri.is_err()) {
            return uri.error();
        }
        attested_view = common::media_reference{media_type.value(), uri.value()};
    }

    auto proof = detail::optional_string_field(record, "proof");
    if (proof.is_err()) {
        return proof.error();
    }

    std::optional<std::vector<std::string>> items;
    if (record.contains("items")) {
        const auto& list = record.at("items");
        if (!list.is_array()) {
            return decode_failure("items", "not an array");
        }
        items.emplace();
        for (const auto& item : list) {
            auto value = detail::string_field(item, "value");
            if (value.is_err()) {
                return value.error();
            }
            items->push_back(value.value());
        }
    }

    return common::attestation::create(audit.value(), reason.value(), is_pending.value(),
                                       terminology, std::move(attested_view), proof.value(),
                                       std::move(items));
}

auto decode_audit_entry(const json& record,
                        const terminology::terminology_service& terminology)
    -> Result<common::audit_entry> {
    auto type_name = detail::type_of(record);
    if (type_name.is_err()) {
        return type_name.error();
    }
    if (type_name.value() == type_tags::attestation) {
        auto entry = decode_attestation(record, terminology);
        if (entry.is_err()) {
            return entry.error();
        }
        return common::audit_entry{entry.value()};
    }
    auto audit = decode_audit_details(record, terminology);
    if (audit.is_err()) {
        return audit.error();
    }
    return common::audit_entry{audit.value()};
}

auto decode_revision_history_item(const json& record,
                                  const terminology::terminology_service& terminology)
    -> Result<common::revision_history_item> {
    auto check = detail::expect_type(record, type_tags::revision_history_item);
    if (check.is_err()) {
        return check.error();
    }

    auto id_field = detail::field(record, "version_id");
    if (id_field.is_err()) {
        return id_field.error();
    }
    auto version_id = decode_object_version_id(*id_field.value());
    if (version_id.is_err()) {
        return version_id.error();
    }

    auto audits_field = detail::field(record, "audits");
    if (audits_field.is_err()) {
        return audits_field.error();
    }
    if (!audits_field.value()->is_array()) {
        return decode_failure("audits", "not an array");
    }

    std::vector<common::audit_entry> audits;
    for (const auto& entry : *audits_field.value()) {
        auto decoded = decode_audit_entry(entry, terminology);
        if (decoded.is_err()) {
            return decoded.error();
        }
        audits.push_back(decoded.value());
    }
    return common::revision_history_item::create(version_id.value(), std::move(audits));
}

auto decode_revision_history(const json& record,
                             const terminology::terminology_service& terminology)
    -> Result<common::revision_history> {
    auto check = detail::expect_type(record, type_tags::revision_history);
    if (check.is_err()) {
        return check.error();
    }
    auto items_field = detail::field(record, "items");
    if (items_field.is_err()) {
        return items_field.error();
    }
    if (!items_field.value()->is_array()) {
        return decode_failure("items", "not an array");
    }

    std::vector<common::revision_history_item> items;
    for (const auto& entry : *items_field.value()) {
        auto item = decode_revision_history_item(entry, terminology);
        if (item.is_err()) {
            return item.error();
        }
        items.push_back(item.value());
    }
    return common::revision_history{std::move(items)};
}

// =============================================================================
// Change control records
// =============================================================================

auto encode(const change_control::contribution& contribution) -> json {
    auto versions = json::array();
    for (const auto& ref : contribution.versions) {
        versions.push_back(encode(ref));
    }
    return json{{type_key, tag(type_tags::contribution)},
                {"uid", encode(contribution.uid)},
                {"versions", std::move(versions)},
                {"audit", encode(contribution.audit)}};
}

auto encode(const change_control::container_metadata& metadata) -> json {
    return json{{type_key, tag(type_tags::versioned_object)},
                {"uid", encode(metadata.uid)},
                {"owner_id", encode(metadata.owner_id)},
                {"time_created", encode_date_time(metadata.time_created)}};
}

auto decode_contribution(const json& record,
                         const terminology::terminology_service& terminology)
    -> Result<change_control::contribution> {
    auto check = detail::expect_type(record, type_tags::contribution);
    if (check.is_err()) {
        return check.error();
    }

    auto uid_field = detail::field(record, "uid");
    if (uid_field.is_err()) {
        return uid_field.error();
    }
    auto uid = decode_hier_object_id(*uid_field.value());
    if (uid.is_err()) {
        return uid.error();
    }

    auto versions_field = detail::field(record, "versions");
    if (versions_field.is_err()) {
        return versions_field.error();
    }
    if (!versions_field.value()->is_array()) {
        return decode_failure("versions", "not an array");
    }
    std::vector<identification::object_ref> versions;
    for (const auto& entry : *versions_field.value()) {
        auto ref = decode_object_ref(entry);
        if (ref.is_err()) {
            return ref.error();
        }
        versions.push_back(ref.value());
    }

    auto audit_field = detail::field(record, "audit");
    if (audit_field.is_err()) {
        return audit_field.error();
    }
    auto audit = decode_audit_details(*audit_field.value(), terminology);
    if (audit.is_err()) {
        return audit.error();
    }

    return change_control::contribution{uid.value(), std::move(versions), audit.value()};
}

auto decode_container_metadata(const json& record) -> Result<change_control::container_metadata> {
    auto check = detail::expect_type(record, type_tags::versioned_object);
    if (check.is_err()) {
        return check.error();
    }

    auto uid_field = detail::field(record, "uid");
    if (uid_field.is_err()) {
        return uid_field.error();
    }
    auto uid = decode_hier_object_id(*uid_field.value());
    if (uid.is_err()) {
        return uid.error();
    }

    auto owner_field = detail::field(record, "owner_id");
    if (owner_field.is_err()) {
        return owner_field.error();
    }
    auto owner = decode_object_ref(*owner_field.value());
    if (owner.is_err()) {
        return owner.error();
    }

    auto time_field = detail::field(record, "time_created");
    if (time_field.is_err()) {
        return time_field.error();
    }
    auto time_created = decode_date_time(*time_field.value());
    if (time_created.is_err()) {
        return time_created.error();
    }

    return change_control::container_metadata{uid.value(), owner.value(), time_created.value()};
}

}  // namespace ehr::serialization
