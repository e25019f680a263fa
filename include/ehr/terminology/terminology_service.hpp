/**
 * @file terminology_service.hpp
 * @brief Terminology capability used to validate coded metadata
 *
 * Change types, lifecycle states and attestation reasons are coded
 * values that must belong to a named group of the openEHR terminology.
 * The capability is passed explicitly to every constructor that needs it.
 */

#pragma once

#include <ehr/terminology/coded_text.hpp>

#include <map>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace ehr::terminology {

/**
 * @namespace groups
 * @brief Group identifiers of the openEHR terminology used by change control
 */
namespace groups {
    inline constexpr std::string_view audit_change_type = "audit change type";
    inline constexpr std::string_view attestation_reason = "attestation reason";
    inline constexpr std::string_view version_lifecycle_state = "version lifecycle state";
}  // namespace groups

/**
 * @brief Abstract terminology capability
 *
 * Implementations must be safe to call concurrently.
 */
class terminology_service {
public:
    virtual ~terminology_service() = default;

    /**
     * @brief Check that a code belongs to a group
     * @param code Code to check
     * @param group_id Group identifier, e.g. groups::audit_change_type
     * @return true if the code is a member of the group
     */
    [[nodiscard]] virtual auto verify_code_in_group(const code_phrase& code,
                                                    std::string_view group_id) const
        -> bool = 0;

    /**
     * @brief Look up the rubric of a code
     * @return The rubric, or std::nullopt for unknown codes
     */
    [[nodiscard]] virtual auto rubric_for(const code_phrase& code) const
        -> std::optional<std::string> = 0;

protected:
    terminology_service() = default;
    terminology_service(const terminology_service&) = default;
    terminology_service& operator=(const terminology_service&) = default;
};

/**
 * @brief In-memory openEHR terminology
 *
 * Ships the groups needed by change control:
 * - "audit change type": 249 creation, 250 amendment, 251 modification,
 *   252 synthesis, 523 deleted, 666 attestation, 816 restoration,
 *   817 format conversion, 253 unknown
 * - "attestation reason": 240 signed, 648 witnessed
 * - "version lifecycle state": 532 complete, 553 incomplete,
 *   523 deleted, 800 inactive, 801 abandoned
 *
 * Further groups can be registered at runtime.
 *
 * Thread Safety: All methods are thread-safe.
 */
class openehr_terminology final : public terminology_service {
public:
    openehr_terminology();
    ~openehr_terminology() override = default;

    openehr_terminology(const openehr_terminology&) = delete;
    openehr_terminology& operator=(const openehr_terminology&) = delete;

    [[nodiscard]] auto verify_code_in_group(const code_phrase& code,
                                            std::string_view group_id) const
        -> bool override;

    [[nodiscard]] auto rubric_for(const code_phrase& code) const
        -> std::optional<std::string> override;

    /**
     * @brief Add codes to a group, creating the group if needed
     * @param group_id Group identifier
     * @param codes Pairs of code string and rubric
     */
    void register_group(std::string_view group_id,
                        const std::vector<std::pair<std::string, std::string>>& codes);

    /**
     * @brief Build a coded_text for an openEHR code
     * @return The coded text, or std::nullopt when the code is unknown
     */
    [[nodiscard]] auto make_coded_text(std::string_view code_string) const
        -> std::optional<coded_text>;

    [[nodiscard]] auto group_ids() const -> std::vector<std::string>;

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, std::set<std::string>, std::less<>> groups_;
    std::map<std::string, std::string, std::less<>> rubrics_;
};

}  // namespace ehr::terminology
