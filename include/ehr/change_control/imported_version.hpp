/**
 * @file imported_version.hpp
 * @brief A version copied in from another system
 */

#pragma once

#include <ehr/change_control/original_version.hpp>

#include <optional>
#include <string>

namespace ehr::change_control {

/**
 * @brief Wrapper recording the import of a foreign original version
 *
 * The contribution, commit audit and signature describe the import act.
 * Every other accessor reads the wrapped version.
 *
 * @tparam T Payload type
 */
template <typename T>
class imported_version {
public:
    imported_version(identification::object_ref contribution,
                     common::audit_details commit_audit,
                     original_version<T> item,
                     std::optional<std::string> signature = std::nullopt)
        : contribution_(std::move(contribution)),
          signature_(std::move(signature)),
          commit_audit_(std::move(commit_audit)),
          item_(std::move(item)) {}

    [[nodiscard]] auto contribution() const noexcept -> const identification::object_ref& {
        return contribution_;
    }
    [[nodiscard]] auto signature() const noexcept -> const std::optional<std::string>& {
        return signature_;
    }
    [[nodiscard]] auto commit_audit() const noexcept -> const common::audit_details& {
        return commit_audit_;
    }

    /// The imported original version
    [[nodiscard]] auto item() const noexcept -> const original_version<T>& { return item_; }

    [[nodiscard]] auto uid() const noexcept -> const identification::object_version_id& {
        return item_.uid();
    }
    [[nodiscard]] auto preceding_version_uid() const noexcept
        -> const std::optional<identification::object_version_id>& {
        return item_.preceding_version_uid();
    }
    [[nodiscard]] auto lifecycle_state() const noexcept -> const terminology::coded_text& {
        return item_.lifecycle_state();
    }
    [[nodiscard]] auto data() const noexcept -> const T& { return item_.data(); }
    [[nodiscard]] auto owner_id() const -> identification::hier_object_id {
        return item_.owner_id();
    }
    [[nodiscard]] auto is_branch() const noexcept -> bool { return item_.is_branch(); }

private:
    identification::object_ref contribution_;
    std::optional<std::string> signature_;
    common::audit_details commit_audit_;
    original_version<T> item_;
};

}  // namespace ehr::change_control
