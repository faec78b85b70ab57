/**
 * @file time.hpp
 * @brief Cross-platform time helpers used for ledger timestamps
 *
 * POSIX uses gmtime_r(time_t*, tm*) while Windows uses gmtime_s(tm*, time_t*).
 */

#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace migrator::compat {

/**
 * @brief Cross-platform thread-safe UTC time conversion
 *
 * @param time Pointer to the time_t value to convert
 * @param result Pointer to the tm structure to store the result
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
 * @brief Format a time point in UTC with a strftime-style pattern
 *
 * @param tp Time point to format
 * @param pattern strftime pattern, "%Y-%m-%d %H:%M:%S" by default, which
 *        matches SQLite's CURRENT_TIMESTAMP representation
 * @return Formatted string, empty if the conversion failed
 */
inline std::string format_utc(std::chrono::system_clock::time_point tp,
                              const char* pattern = "%Y-%m-%d %H:%M:%S") {
    auto time_val = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_val{};
    if (gmtime_safe(&time_val, &tm_val) == nullptr) {
        return {};
    }
    std::ostringstream oss;
    oss << std::put_time(&tm_val, pattern);
    return oss.str();
}

}  // namespace migrator::compat
