/**
 * @file contribution.hpp
 * @brief Record of the versions committed together in one batch
 */

#pragma once

#include <ehr/common/audit_details.hpp>
#include <ehr/identification/hier_object_id.hpp>
#include <ehr/identification/object_ref.hpp>

#include <vector>

namespace ehr::change_control {

/**
 * @brief Atomic batch of versions
 *
 * The contribution only carries data. Storage checks, before committing the
 * batch, that each version refers back to this contribution and that each
 * listed reference names one of the versions being committed.
 */
struct contribution {
    identification::hier_object_id uid;
    std::vector<identification::object_ref> versions;
    common::audit_details audit;

    /// Reference to this contribution, as stored in its versions
    [[nodiscard]] auto ref() const -> identification::object_ref {
        return identification::object_ref::to_contribution(uid);
    }
};

}  // namespace ehr::change_control
