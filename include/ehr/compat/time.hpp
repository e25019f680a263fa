/**
 * @file time.hpp
 * @brief Thread-safe calendar conversions across POSIX and Windows
 *
 * POSIX uses gmtime_r(time_t*, tm*); Windows uses gmtime_s(tm*, time_t*).
 *
 * Usage:
 *   std::tm tm{};
 *   ehr::compat::gmtime_safe(&seconds, &tm);
 */

#pragma once

#include <ctime>

namespace ehr::compat {

/**
 * @brief Thread-safe UTC conversion
 * @param time Seconds since the epoch
 * @param result Output calendar structure
 * @return result on success, nullptr on failure
 */
inline std::tm* gmtime_safe(const std::time_t* time, std::tm* result) {
#if defined(_WIN32) || defined(_WIN64)
    return gmtime_s(result, time) == 0 ? result : nullptr;
#else
    return gmtime_r(time, result);
#endif
}

/**
 * @brief Thread-safe local time conversion
 * @param time Seconds since the epoch
 * @param result Output calendar structure
 * @return result on success, nullptr on failure
 */
inline std::tm* localtime_safe(const std::time_t* time, std::tm* result) {
#if defined(_WIN32) || defined(_WIN64)
    return localtime_s(result, time) == 0 ? result : nullptr;
#else
    return localtime_r(time, result);
#endif
}

}  // namespace ehr::compat
