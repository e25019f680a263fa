/**
 * @file attestation.hpp
 * @brief Signed or witnessed confirmation appended to a committed version
 */

#pragma once

#include <ehr/common/audit_details.hpp>
#include <ehr/core/result.hpp>
#include <ehr/terminology/coded_text.hpp>
#include <ehr/terminology/terminology_service.hpp>

#include <optional>
#include <string>
#include <vector>

namespace ehr::common {

/**
 * @brief Reference to the rendering that was attested
 */
struct media_reference {
    std::string media_type;
    std::string uri;

    [[nodiscard]] auto operator==(const media_reference& other) const -> bool = default;
};

/**
 * @brief Audit details of an attestation
 *
 * An attestation is an audit entry recorded after the fact against an
 * original version. Its reason is free text or a code of the
 * "attestation reason" group. When items are given they name the parts
 * of the version (as EHR URIs) that were attested, and must not be empty.
 */
class attestation : public audit_details {
public:
    /**
     * @brief Build a validated attestation
     * @param audit Who attested, when and where
     * @param reason Free-text or coded reason
     * @param is_pending True while the attestation awaits signing
     * @param terminology Terminology used to validate a coded reason
     * @param attested_view Optional rendering that was seen
     * @param proof Optional signature proof
     * @param items Optional attested parts, non-empty when present
     * @return The attestation, or empty_collection /
     *         invalid_attestation_reason
     */
    [[nodiscard]] static auto create(audit_details audit,
                                     terminology::text_or_coded reason,
                                     bool is_pending,
                                     const terminology::terminology_service& terminology,
                                     std::optional<media_reference> attested_view = std::nullopt,
                                     std::optional<std::string> proof = std::nullopt,
                                     std::optional<std::vector<std::string>> items = std::nullopt)
        -> Result<attestation>;

    [[nodiscard]] auto reason() const noexcept -> const terminology::text_or_coded& { return reason_; }
    [[nodiscard]] auto is_pending() const noexcept -> bool { return is_pending_; }
    [[nodiscard]] auto attested_view() const noexcept -> const std::optional<media_reference>& {
        return attested_view_;
    }
    [[nodiscard]] auto proof() const noexcept -> const std::optional<std::string>& { return proof_; }
    [[nodiscard]] auto items() const noexcept -> const std::optional<std::vector<std::string>>& {
        return items_;
    }

    [[nodiscard]] auto operator==(const attestation& other) const -> bool = default;

private:
    attestation(audit_details audit, terminology::text_or_coded reason, bool is_pending,
                std::optional<media_reference> attested_view, std::optional<std::string> proof,
                std::optional<std::vector<std::string>> items)
        : audit_details(std::move(audit)),
          reason_(std::move(reason)),
          is_pending_(is_pending),
          attested_view_(std::move(attested_view)),
          proof_(std::move(proof)),
          items_(std::move(items)) {}

    terminology::text_or_coded reason_;
    bool is_pending_;
    std::optional<media_reference> attested_view_;
    std::optional<std::string> proof_;
    std::optional<std::vector<std::string>> items_;
};

}  // namespace ehr::common
