/**
 * @file version.hpp
 * @brief Tagged union over original and imported versions
 */

#pragma once

#include <ehr/change_control/imported_version.hpp>
#include <ehr/change_control/original_version.hpp>

#include <optional>
#include <string>
#include <variant>

namespace ehr::change_control {

/**
 * @brief Any committed version of a record item
 *
 * Read accessors are shared by both kinds. Imported versions forward
 * everything but contribution, commit_audit and signature to the original
 * they wrap.
 *
 * @tparam T Payload type
 */
template <typename T>
class version {
public:
    using variant_type = std::variant<original_version<T>, imported_version<T>>;

    version(original_version<T> v) : value_(std::move(v)) {}
    version(imported_version<T> v) : value_(std::move(v)) {}

    [[nodiscard]] auto is_original() const noexcept -> bool {
        return std::holds_alternative<original_version<T>>(value_);
    }
    [[nodiscard]] auto is_imported() const noexcept -> bool { return !is_original(); }

    /// The original version, or nullptr for imported versions
    [[nodiscard]] auto as_original() const noexcept -> const original_version<T>* {
        return std::get_if<original_version<T>>(&value_);
    }
    [[nodiscard]] auto as_original() noexcept -> original_version<T>* {
        return std::get_if<original_version<T>>(&value_);
    }

    /// The imported version, or nullptr for original versions
    [[nodiscard]] auto as_imported() const noexcept -> const imported_version<T>* {
        return std::get_if<imported_version<T>>(&value_);
    }

    [[nodiscard]] auto value() const noexcept -> const variant_type& { return value_; }

    [[nodiscard]] auto contribution() const -> const identification::object_ref& {
        return std::visit([](const auto& v) -> const identification::object_ref& {
            return v.contribution();
        }, value_);
    }

    [[nodiscard]] auto signature() const -> const std::optional<std::string>& {
        return std::visit([](const auto& v) -> const std::optional<std::string>& {
            return v.signature();
        }, value_);
    }

    [[nodiscard]] auto commit_audit() const -> const common::audit_details& {
        return std::visit([](const auto& v) -> const common::audit_details& {
            return v.commit_audit();
        }, value_);
    }

    [[nodiscard]] auto uid() const -> const identification::object_version_id& {
        return std::visit([](const auto& v) -> const identification::object_version_id& {
            return v.uid();
        }, value_);
    }

    [[nodiscard]] auto preceding_version_uid() const
        -> const std::optional<identification::object_version_id>& {
        return std::visit(
            [](const auto& v) -> const std::optional<identification::object_version_id>& {
                return v.preceding_version_uid();
            },
            value_);
    }

    [[nodiscard]] auto lifecycle_state() const -> const terminology::coded_text& {
        return std::visit([](const auto& v) -> const terminology::coded_text& {
            return v.lifecycle_state();
        }, value_);
    }

    [[nodiscard]] auto data() const -> const T& {
        return std::visit([](const auto& v) -> const T& { return v.data(); }, value_);
    }

    [[nodiscard]] auto owner_id() const -> identification::hier_object_id {
        return std::visit([](const auto& v) { return v.owner_id(); }, value_);
    }

    [[nodiscard]] auto is_branch() const -> bool {
        return std::visit([](const auto& v) { return v.is_branch(); }, value_);
    }

private:
    variant_type value_;
};

}  // namespace ehr::change_control
