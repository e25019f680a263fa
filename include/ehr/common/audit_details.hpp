/**
 * @file audit_details.hpp
 * @brief Audit record of a commit: who, when, where and what kind of change
 */

#pragma once

#include <ehr/common/party_proxy.hpp>
#include <ehr/core/result.hpp>
#include <ehr/core/timestamp.hpp>
#include <ehr/terminology/coded_text.hpp>
#include <ehr/terminology/terminology_service.hpp>

#include <optional>
#include <string>

namespace ehr::common {

/**
 * @brief Audit details of one commit
 *
 * The change type must be a code of the "audit change type" group.
 *
 * @example
 * @code
 * openehr_terminology terms;
 * auto audit = audit_details::create(
 *     "net.example.ehr", now, to_coded_text(audit_change_type::creation),
 *     party_proxy::self(), terms);
 * @endcode
 */
class audit_details {
public:
    /**
     * @brief Build validated audit details
     * @param system_id Identity of the system where the change was committed
     * @param time_committed Commit time, supplied by the caller
     * @param change_type Coded change type
     * @param committer Party that committed the change
     * @param terminology Terminology used to validate change_type
     * @param description Optional reason for the change
     * @return The audit, or empty_identifier / invalid_change_type
     */
    [[nodiscard]] static auto create(std::string system_id,
                                     core::timestamp time_committed,
                                     terminology::coded_text change_type,
                                     party_proxy committer,
                                     const terminology::terminology_service& terminology,
                                     std::optional<std::string> description = std::nullopt)
        -> Result<audit_details>;

    [[nodiscard]] auto system_id() const noexcept -> const std::string& { return system_id_; }
    [[nodiscard]] auto time_committed() const noexcept -> core::timestamp { return time_committed_; }
    [[nodiscard]] auto change_type() const noexcept -> const terminology::coded_text& {
        return change_type_;
    }
    [[nodiscard]] auto description() const noexcept -> const std::optional<std::string>& {
        return description_;
    }
    [[nodiscard]] auto committer() const noexcept -> const party_proxy& { return committer_; }

    [[nodiscard]] auto operator==(const audit_details& other) const -> bool = default;

protected:
    audit_details(std::string system_id, core::timestamp time_committed,
                  terminology::coded_text change_type, party_proxy committer,
                  std::optional<std::string> description)
        : system_id_(std::move(system_id)),
          time_committed_(time_committed),
          change_type_(std::move(change_type)),
          committer_(std::move(committer)),
          description_(std::move(description)) {}

private:
    std::string system_id_;
    core::timestamp time_committed_;
    terminology::coded_text change_type_;
    party_proxy committer_;
    std::optional<std::string> description_;
};

}  // namespace ehr::common
