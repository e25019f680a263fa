/**
 * @file revision_history.cpp
 * @brief Revision history queries
 */

#include <ehr/common/revision_history.hpp>

#include <ehr/compat/format.hpp>

namespace ehr::common {

auto revision_history_item::create(identification::object_version_id version_id,
                                   std::vector<audit_entry> audits)
    -> Result<revision_history_item> {
    if (audits.empty()) {
        return ehr_error<revision_history_item>(
            error_codes::empty_collection,
            compat::format("REVISION_HISTORY_ITEM for {} has no audits", version_id.value()));
    }
    return revision_history_item{std::move(version_id), std::move(audits)};
}

auto revision_history::append_attestation(const identification::object_version_id& version_id,
                                          attestation entry) -> VoidResult {
    for (auto& item : items_) {
        if (item.version_id() == version_id) {
            item.append(std::move(entry));
            return ok();
        }
    }
    return ehr_void_error(error_codes::version_not_found,
                          compat::format("No revision history item for {}", version_id.value()));
}

auto revision_history::find(const identification::object_version_id& version_id) const
    -> const revision_history_item* {
    for (const auto& item : items_) {
        if (item.version_id() == version_id) {
            return &item;
        }
    }
    return nullptr;
}

auto revision_history::most_recent_version() const -> Result<identification::object_version_id> {
    if (items_.empty()) {
        return ehr_error<identification::object_version_id>(
            error_codes::empty_collection, "Revision history is empty");
    }
    return items_.back().version_id();
}

auto revision_history::most_recent_version_time_committed() const -> Result<core::timestamp> {
    if (items_.empty()) {
        return ehr_error<core::timestamp>(error_codes::empty_collection,
                                          "Revision history is empty");
    }
    return audit_of(items_.back().audits().back()).time_committed();
}

}  // namespace ehr::common
