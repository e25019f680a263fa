/**
 * @file timestamp.hpp
 * @brief Commit timestamps and their ISO 8601 external form
 *
 * Timestamps are carried as system_clock time points and written as
 * extended UTC ISO 8601 (YYYY-MM-DDThh:mm:ss[.fffffffff]Z). The fraction
 * is emitted only when non-zero, with trailing zeros removed, so that a
 * formatted timestamp parses back to the identical time point.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace ehr::core {

/// Point in time at which a version or audit entry was committed
using timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Format a timestamp as extended UTC ISO 8601
 * @param tp Time point to format
 * @return e.g. "2024-03-01T10:15:30.25Z"
 */
[[nodiscard]] auto to_iso8601(timestamp tp) -> std::string;

/**
 * @brief Parse an extended UTC ISO 8601 string
 * @param text Input such as "2024-03-01T10:15:30Z"
 * @return The time point, or std::nullopt when the text is malformed or a
 *         field is out of range; second 60 is rejected
 */
[[nodiscard]] auto parse_iso8601(std::string_view text) -> std::optional<timestamp>;

}  // namespace ehr::core
