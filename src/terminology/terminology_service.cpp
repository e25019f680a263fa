/**
 * @file terminology_service.cpp
 * @brief Built-in openEHR terminology groups
 */

#include <ehr/terminology/terminology_service.hpp>

#include <mutex>

namespace ehr::terminology {

openehr_terminology::openehr_terminology() {
    register_group(groups::audit_change_type, {{"249", "creation"},
                                               {"250", "amendment"},
                                               {"251", "modification"},
                                               {"252", "synthesis"},
                                               {"523", "deleted"},
                                               {"666", "attestation"},
                                               {"816", "restoration"},
                                               {"817", "format conversion"},
                                               {"253", "unknown"}});

    register_group(groups::attestation_reason, {{"240", "signed"}, {"648", "witnessed"}});

    register_group(groups::version_lifecycle_state, {{"532", "complete"},
                                                     {"553", "incomplete"},
                                                     {"523", "deleted"},
                                                     {"800", "inactive"},
                                                     {"801", "abandoned"}});
}

auto openehr_terminology::verify_code_in_group(const code_phrase& code,
                                               std::string_view group_id) const -> bool {
    if (code.terminology_id != openehr_terminology_id) {
        return false;
    }

    std::shared_lock lock(mutex_);
    auto group = groups_.find(group_id);
    if (group == groups_.end()) {
        return false;
    }
    return group->second.count(code.code_string) > 0;
}

auto openehr_terminology::rubric_for(const code_phrase& code) const
    -> std::optional<std::string> {
    if (code.terminology_id != openehr_terminology_id) {
        return std::nullopt;
    }

    std::shared_lock lock(mutex_);
    auto it = rubrics_.find(code.code_string);
    if (it == rubrics_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void openehr_terminology::register_group(
    std::string_view group_id,
    const std::vector<std::pair<std::string, std::string>>& codes) {
    std::unique_lock lock(mutex_);
    auto& members = groups_[std::string(group_id)];
    for (const auto& [code, rubric] : codes) {
        members.insert(code);
        rubrics_[code] = rubric;
    }
}

auto openehr_terminology::make_coded_text(std::string_view code_string) const
    -> std::optional<coded_text> {
    code_phrase code{openehr_terminology_id, std::string(code_string)};
    auto rubric = rubric_for(code);
    if (!rubric) {
        return std::nullopt;
    }
    return coded_text{*rubric, std::move(code)};
}

auto openehr_terminology::group_ids() const -> std::vector<std::string> {
    std::shared_lock lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(groups_.size());
    for (const auto& [id, members] : groups_) {
        ids.push_back(id);
    }
    return ids;
}

}  // namespace ehr::terminology
