/**
 * @file format.hpp
 * @brief Selects std::format or fmt::format for message formatting
 *
 * Log messages and error strings across the toolkit are built through
 * ehr::compat::format so the library builds on standard libraries that
 * still lack <format> (libstdc++ before GCC 13).
 *
 * Usage:
 *   #include <ehr/compat/format.hpp>
 *   auto msg = ehr::compat::format("version {} committed", id.value());
 */

#pragma once

#include <version>

#if defined(__cpp_lib_format) && __cpp_lib_format >= 201907L
    #define EHR_HAS_STD_FORMAT 1
#elif defined(__APPLE__) && defined(__clang__) && __clang_major__ >= 15
    #define EHR_HAS_STD_FORMAT 1
#elif defined(_MSC_VER) && _MSC_VER >= 1929 && defined(_HAS_CXX20) && _HAS_CXX20
    #define EHR_HAS_STD_FORMAT 1
#else
    #define EHR_HAS_STD_FORMAT 0
#endif

#if EHR_HAS_STD_FORMAT
    #include <format>
    namespace ehr::compat {
        using std::format;
        template <typename... Args>
        using format_string = std::format_string<Args...>;
    }
#else
    #include <fmt/format.h>
    namespace ehr::compat {
        using fmt::format;
        template <typename... Args>
        using format_string = fmt::format_string<Args...>;
    }
#endif
