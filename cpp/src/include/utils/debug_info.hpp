/**
 * @file debug_info.hpp
 * @brief Debugging utilities: stack trace printing, panic handling for fatal errors,
 *        and debug messaging.
 *
 * Functions live in `h5share::debug`. Format strings are checked at compile time
 * through `fmt`, and `std::source_location` supplies the call site.
 */
#pragma once

#include <cstdio>
#include <cstdlib>
#include <fmt/format.h>
#include <source_location>
#include <string>
#include <string_view>

#include "h5share_utils_export.h"
#include "utils/format_tools.hpp"

namespace h5share::debug
{

/**
 * @brief Prints the current call stack to `stderr`.
 *
 * On POSIX systems this uses `backtrace` and `dladdr` with demangled symbol names.
 * On other platforms a single line noting the missing support is printed.
 */
H5SHARE_UTILS_EXPORT void print_stack_trace() noexcept;

/**
 * @brief Formats a source location as "file:line:function".
 */
inline std::string srcloc_to_str(std::source_location loc)
{
    return fmt::format("{}:{}:{}", h5share::format_tools::filename_only(loc.file_name()),
                       loc.line(), loc.function_name());
}

/**
 * @brief Halts program execution with a fatal error message and prints a stack trace.
 *
 * Intended for unrecoverable programming errors (e.g. a lifecycle module used before
 * it was started). Formatting failures are reported instead of the message; the
 * function always ends in `std::abort()`.
 *
 * @param loc The source location where `panic` was called.
 * @param fmt_str The `fmt`-style format string for the error message.
 * @param args The arguments to be formatted into `fmt_str`.
 */
template <typename... Args>
[[noreturn]] inline void panic(std::source_location loc, fmt::format_string<Args...> fmt_str,
                               Args &&...args) noexcept
{
    try
    {
        const auto body = fmt::format(fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "[PANIC] {} -- {}\n", srcloc_to_str(loc), body);
    }
    catch (const fmt::format_error &e)
    {
        fmt::print(stderr,
                   "[PANIC] {} -- FATAL FORMAT ERROR WHEN PANIC fmt_str['{}']\n"
                   "[PANIC]  Exception: '{}'\n",
                   srcloc_to_str(loc), fmt::string_view(fmt_str), e.what());
    }
    catch (...)
    {
        fmt::print(stderr, "[PANIC] {} -- FATAL UNKNOWN EXCEPTION DURING PANIC: fmt_str['{}']\n",
                   srcloc_to_str(loc), fmt::string_view(fmt_str));
    }
    std::fflush(stderr);
    print_stack_trace();
    std::abort();
}

/**
 * @brief Prints a debug message to `stderr` with compile-time format string checking.
 */
template <typename... Args>
inline void debug_msg(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    try
    {
        const auto body = fmt::format(fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "[DBG]  {}\n", body);
    }
    catch (const fmt::format_error &e)
    {
        fmt::print(stderr,
                   "[DBG]  FATAL FORMAT ERROR DURING DEBUG_MSG: fmt_str['{}']\n"
                   "[DBG]  Exception: '{}'\n",
                   fmt::string_view(fmt_str), e.what());
        std::fflush(stderr);
    }
    catch (...)
    {
        fmt::print(stderr, "[DBG]  FATAL EXCEPTION DURING DEBUG_MSG: fmt_str['{}']\n",
                   fmt::string_view(fmt_str));
        std::fflush(stderr);
    }
}

} // namespace h5share::debug

// ---------------- thin macros for convenience --------------

/**
 * @brief Calls `h5share::debug::panic` with the current source location.
 */
#ifndef H5SHARE_PANIC
#define H5SHARE_PANIC(fmt, ...)                                                                    \
    ::h5share::debug::panic(std::source_location::current(),                                       \
                            FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#endif

/**
 * @brief Prints a debug message; compiled away unless H5SHARE_ENABLE_DEBUG_MESSAGES is defined.
 */
#ifndef H5SHARE_DEBUG
#if defined(H5SHARE_ENABLE_DEBUG_MESSAGES)
#define H5SHARE_DEBUG(fmt, ...)                                                                    \
    ::h5share::debug::debug_msg(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#else
#define H5SHARE_DEBUG(fmt, ...)                                                                    \
    do                                                                                             \
    {                                                                                              \
    } while (0)
#endif
#endif
