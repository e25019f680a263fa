/**
 * @file container_metadata.hpp
 * @brief Identity of a versioned object without its versions
 */

#pragma once

#include <ehr/core/timestamp.hpp>
#include <ehr/identification/hier_object_id.hpp>
#include <ehr/identification/object_ref.hpp>

namespace ehr::change_control {

/**
 * @brief Header fields of a versioned object
 */
struct container_metadata {
    identification::hier_object_id uid;
    identification::object_ref owner_id;
    core::timestamp time_created;
};

}  // namespace ehr::change_control
