/**
 * @file party_proxy.hpp
 * @brief Reference to the party that committed or attested a change
 */

#pragma once

#include <ehr/core/result.hpp>
#include <ehr/identification/object_ref.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace ehr::common {

/**
 * @enum party_kind
 * @brief Concrete party proxy type
 */
enum class party_kind {
    self,        ///< The record subject (PARTY_SELF)
    identified   ///< A named or referenced party (PARTY_IDENTIFIED)
};

/**
 * @brief Committer or attester identity
 *
 * A self proxy may carry an external reference to the subject in a
 * demographic service. An identified proxy carries a name, an external
 * reference or both.
 */
class party_proxy {
public:
    /**
     * @brief The record subject
     */
    [[nodiscard]] static auto self(std::optional<identification::object_ref> external_ref = std::nullopt)
        -> party_proxy;

    /**
     * @brief A party known by name and/or external reference
     * @return The proxy, or empty_identifier when neither is supplied or
     *         when the supplied name is empty
     */
    [[nodiscard]] static auto identified(std::optional<std::string> name,
                                         std::optional<identification::object_ref> external_ref = std::nullopt)
        -> Result<party_proxy>;

    [[nodiscard]] auto kind() const noexcept -> party_kind { return kind_; }
    [[nodiscard]] auto name() const noexcept -> const std::optional<std::string>& { return name_; }
    [[nodiscard]] auto external_ref() const noexcept
        -> const std::optional<identification::object_ref>& {
        return external_ref_;
    }

    /// Name if present, else the external reference id, else "self"
    [[nodiscard]] auto display_name() const -> std::string;

    [[nodiscard]] auto operator==(const party_proxy& other) const -> bool = default;

private:
    party_proxy(party_kind kind, std::optional<std::string> name,
                std::optional<identification::object_ref> external_ref)
        : kind_(kind), name_(std::move(name)), external_ref_(std::move(external_ref)) {}

    party_kind kind_;
    std::optional<std::string> name_;
    std::optional<identification::object_ref> external_ref_;
};

}  // namespace ehr::common
