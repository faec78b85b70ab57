/**
 * @file format.hpp
 * @brief Compatibility header for std::format vs fmt::format
 *
 * Selects std::format when the standard library ships it and falls back to
 * the fmt library otherwise (GCC 12 and older libstdc++).
 *
 * Usage:
 *   #include <migrator/compat/format.hpp>
 *   auto s = migrator::compat::format("Applied {} migration(s)", count);
 */

#pragma once

#include <version>

// Detection strategy:
// 1. __cpp_lib_format feature test macro (libstdc++ 13+, libc++ 17+)
// 2. Apple Clang 15+ with libc++ (may not define __cpp_lib_format)
// 3. MSVC 19.29+ with C++20 mode
#if defined(__cpp_lib_format) && __cpp_lib_format >= 201907L
    #define MIGRATOR_HAS_STD_FORMAT 1
#elif defined(__APPLE__) && defined(__clang__) && __clang_major__ >= 15
    #define MIGRATOR_HAS_STD_FORMAT 1
#elif defined(_MSC_VER) && _MSC_VER >= 1929 && defined(_HAS_CXX20) && _HAS_CXX20
    #define MIGRATOR_HAS_STD_FORMAT 1
#else
    #define MIGRATOR_HAS_STD_FORMAT 0
#endif

#if MIGRATOR_HAS_STD_FORMAT
    #include <format>
    namespace migrator::compat {
        using std::format;
        template <typename... Args>
        using format_string = std::format_string<Args...>;
    }
#else
    #include <fmt/format.h>
    namespace migrator::compat {
        using fmt::format;
        template <typename... Args>
        using format_string = fmt::format_string<Args...>;
    }
#endif
