/**
 * @file time.hpp
 * @brief Compatibility header for cross-platform time functions
 *
 * Key differences between POSIX and Windows:
 * - POSIX uses gmtime_r(time_t*, tm*), Windows uses gmtime_s(tm*, time_t*)
 * - POSIX uses timegm(tm*), Windows uses _mkgmtime(tm*)
 *
 * Usage:
 *   #include <blobtier/compat/time.hpp>
 *   std::tm tm{};
 *   blobtier::compat::gmtime_safe(&time_val, &tm);
 */

#pragma once

#include <ctime>

namespace blobtier::compat {

/**
 * @brief Cross-platform thread-safe local time conversion
 * @return Pointer to the tm structure (result) on success, nullptr on failure
 */
inline std::tm* localtime_safe(const std::time_t* time, std::tm* result) {
#if defined(_WIN32) || defined(_WIN64)
    return localtime_s(result, time) == 0 ? result : nullptr;
#else
    return localtime_r(time, result);
#endif
}

/**
 * @brief Cross-platform thread-safe UTC time conversion
 * @return Pointer to the tm structure (result) on success, nullptr on failure
 */
inline std::tm* gmtime_safe(const std::time_t* time, std::tm* result) {
#if defined(_WIN32) || defined(_WIN64)
    return gmtime_s(result, time) == 0 ? result : nullptr;
#else
    return gmtime_r(time, result);
#endif
}

/**
 * @brief Cross-platform inverse of gmtime (broken-down UTC to time_t)
 *
 * Unlike std::mktime, the fields of @p tm are interpreted as UTC and the
 * process time zone is ignored.
 *
 * @return Seconds since the epoch, or -1 if the value cannot be represented
 */
inline std::time_t timegm_safe(std::tm* tm) {
#if defined(_WIN32) || defined(_WIN64)
    return _mkgmtime(tm);
#else
    return timegm(tm);
#endif
}

}  // namespace blobtier::compat
