#pragma once

/**
 * @file require_cpp23.hpp
 * @brief Compile-time check for the C++23 library features apidrift relies on
 *
 * Included from common.hpp so that an insufficient toolchain fails with one
 * readable message instead of deep template errors.
 *
 * Required compiler versions:
 *   - GCC 14.0+
 *   - Clang 19.0+
 */

#include <version>

#if !defined(__cplusplus) || __cplusplus < 202'302L
    #error "apidrift requires C++23 or later (__cplusplus >= 202302L)."
#endif

// Result<T> / VoidResult
#if !defined(__cpp_lib_expected) || __cpp_lib_expected < 202'202L
    #error "apidrift requires std::expected (__cpp_lib_expected >= 202202L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// CLI output
#if !defined(__cpp_lib_print) || __cpp_lib_print < 202'207L
    #error "apidrift requires std::print/std::println (__cpp_lib_print >= 202207L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// Violation descriptions and text reports
#if !defined(__cpp_lib_format) || __cpp_lib_format < 202'110L
    #error "apidrift requires std::format (__cpp_lib_format >= 202110L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// Argument parsing and enum value lists
#if !defined(__cpp_lib_ranges_enumerate) || __cpp_lib_ranges_enumerate < 202'302L
    #error "apidrift requires std::views::enumerate (__cpp_lib_ranges_enumerate >= 202302L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif
