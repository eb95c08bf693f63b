/**
 * @file format.hpp
 * @brief Compatibility header for std::format vs fmt::format
 *
 * Detection is based on the __cpp_lib_format feature test macro.
 *
 * Usage:
 *   #include <initiative/compat/format.hpp>
 *   auto s = initiative::compat::format("Opened {} at version {}", path, v);
 */

#pragma once

#include <version>  // For feature test macros

// Detection strategy:
// 1. __cpp_lib_format feature test macro (libstdc++ and libc++)
// 2. Apple Clang 15+ with libc++ (may not define __cpp_lib_format)
// 3. MSVC 19.29+ with C++20 mode
#if defined(__cpp_lib_format) && __cpp_lib_format >= 201907L
    #define INITIATIVE_HAS_STD_FORMAT 1
#elif defined(__APPLE__) && defined(__clang__) && __clang_major__ >= 15
    #define INITIATIVE_HAS_STD_FORMAT 1
#elif defined(_MSC_VER) && _MSC_VER >= 1929 && defined(_HAS_CXX20) && _HAS_CXX20
    #define INITIATIVE_HAS_STD_FORMAT 1
#else
    #define INITIATIVE_HAS_STD_FORMAT 0
#endif

#if INITIATIVE_HAS_STD_FORMAT
    #include <format>
    namespace initiative::compat {
        using std::format;
        template <typename... Args>
        using format_string = std::format_string<Args...>;
    }
#else
    // Use fmt library as fallback
    #include <fmt/format.h>
    namespace initiative::compat {
        using fmt::format;
        template <typename... Args>
        using format_string = fmt::format_string<Args...>;
    }
#endif
