/**
 * @file revision_history.hpp
 * @brief Audit trail of a versioned object, one item per committed version
 *
 * Items are kept in commit order, most recent last. Each item lists the
 * commit audit of its version followed by any attestations added later.
 */

#pragma once

#include <ehr/common/attestation.hpp>
#include <ehr/common/audit_details.hpp>
#include <ehr/core/result.hpp>
#include <ehr/core/timestamp.hpp>
#include <ehr/identification/object_version_id.hpp>

#include <cstddef>
#include <variant>
#include <vector>

namespace ehr::common {

/**
 * @brief One entry of a revision history item
 */
using audit_entry = std::variant<audit_details, attestation>;

/**
 * @brief View an entry through its audit details
 */
[[nodiscard]] inline auto audit_of(const audit_entry& entry) -> const audit_details& {
    return std::visit([](const auto& e) -> const audit_details& { return e; }, entry);
}

/**
 * @brief Audit entries of one version
 */
class revision_history_item {
public:
    /**
     * @brief Build an item from existing audit entries
     * @return The item, or empty_collection when audits is empty
     */
    [[nodiscard]] static auto create(identification::object_version_id version_id,
                                     std::vector<audit_entry> audits)
        -> Result<revision_history_item>;

    /**
     * @brief Item for a freshly committed version
     */
    revision_history_item(identification::object_version_id version_id, audit_details commit_audit)
        : version_id_(std::move(version_id)) {
        audits_.emplace_back(std::move(commit_audit));
    }

    [[nodiscard]] auto version_id() const noexcept -> const identification::object_version_id& {
        return version_id_;
    }
    [[nodiscard]] auto audits() const noexcept -> const std::vector<audit_entry>& { return audits_; }

    /// Audit of the commit itself
    [[nodiscard]] auto commit_audit() const -> const audit_details& { return audit_of(audits_.front()); }

    void append(attestation entry) { audits_.emplace_back(std::move(entry)); }

private:
    revision_history_item(identification::object_version_id version_id,
                          std::vector<audit_entry> audits)
        : version_id_(std::move(version_id)), audits_(std::move(audits)) {}

    identification::object_version_id version_id_;
    std::vector<audit_entry> audits_;
};

/**
 * @brief Ordered revision history of a versioned object
 */
class revision_history {
public:
    revision_history() = default;
    explicit revision_history(std::vector<revision_history_item> items)
        : items_(std::move(items)) {}

    [[nodiscard]] auto items() const noexcept -> const std::vector<revision_history_item>& {
        return items_;
    }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return items_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return items_.empty(); }

    void add_item(revision_history_item item) { items_.push_back(std::move(item)); }

    /**
     * @brief Append an attestation to the item of a version
     * @return version_not_found when no item has that version id
     */
    [[nodiscard]] auto append_attestation(const identification::object_version_id& version_id,
                                          attestation entry) -> VoidResult;

    /**
     * @brief Item at a position, as addressed by commit order
     */
    [[nodiscard]] auto item_at(std::size_t index) -> revision_history_item& { return items_.at(index); }

    /**
     * @brief Find the item of a version
     * @return Pointer to the item, or nullptr
     */
    [[nodiscard]] auto find(const identification::object_version_id& version_id) const
        -> const revision_history_item*;

    /**
     * @brief Version id of the most recent item
     * @return The id, or empty_collection on an empty history
     */
    [[nodiscard]] auto most_recent_version() const -> Result<identification::object_version_id>;

    /**
     * @brief Commit time of the last audit of the most recent item
     * @return The time, or empty_collection on an empty history
     */
    [[nodiscard]] auto most_recent_version_time_committed() const -> Result<core::timestamp>;

private:
    std::vector<revision_history_item> items_;
};

}  // namespace ehr::common
