/**
 * @file process.hpp
 * @brief Cross-platform process helpers used for lease owner tokens
 *
 * POSIX exposes getpid() in <unistd.h> while Windows uses _getpid() from
 * <process.h>.
 */

#pragma once

#if defined(_WIN32) || defined(_WIN64)
#include <process.h>
#else
#include <unistd.h>
#endif

namespace migrator::compat {

/**
 * @brief Get the identifier of the calling process
 */
inline long long current_pid() {
#if defined(_WIN32) || defined(_WIN64)
    return static_cast<long long>(_getpid());
#else
    return static_cast<long long>(getpid());
#endif
}

}  // namespace migrator::compat
