/**
 * @file debug_info.hpp
 * @brief Stack-trace capture, panic handling for fatal errors, and debug messaging.
 *
 * The task engine records a formatted stack trace for every failed task body, so the
 * trace is also available as a string (`format_stack_trace`) rather than only printed.
 * Format strings are checked at compile time through `fmt::format_string`, and call
 * sites are reported with `std::source_location`.
 */
#pragma once

#include <cstdio>
#include <cstdlib>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "utils/format_tools.hpp"

/**
 * @brief Renders a source location as "file:line:function".
 */
inline std::string SRCLOC_TO_STR(std::source_location loc)
{
    return fmt::format("{}:{}:{}", asyncmodules::format_tools::filename_only(loc.file_name()),
                       loc.line(), loc.function_name());
}

namespace asyncmodules::debug
{

/**
 * @brief Captures the current call stack and renders it, one frame per line.
 *
 * On POSIX systems this uses `backtrace`, `dladdr` and `abi::__cxa_demangle`; on
 * Windows it uses `CaptureStackBackTrace` with DbgHelp symbol lookup. Frames are
 * formatted as "  #N  symbol+0xoff  (module)".
 *
 * @param skip_frames Number of innermost frames to omit (this function itself is
 *                    always omitted).
 * @return The rendered trace, or a one-line note if capture failed.
 */
ASYNCMODULES_EXPORT std::string format_stack_trace(int skip_frames = 0) noexcept;

/**
 * @brief Prints the current call stack to `stderr`.
 */
ASYNCMODULES_EXPORT void print_stack_trace() noexcept;

/**
 * @brief Halts program execution with a fatal error message and prints a stack trace.
 *
 * Intended for unrecoverable programming errors (for example configuring the logger
 * before it was started). Never returns: calls `std::abort()`.
 */
template <typename... Args>
[[noreturn]] inline void panic(std::source_location loc, fmt::format_string<Args...> fmt_str,
                               Args &&...args) noexcept
{
    try
    {
        const auto body = fmt::format(fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "[PANIC] {} -- {}\n", SRCLOC_TO_STR(loc), body);
    }
    catch (const fmt::format_error &e)
    {
        fmt::print(stderr,
                   "[PANIC] {} -- FATAL FORMAT ERROR WHEN PANIC fmt_str['{}']\n"
                   "[PANIC]  Exception: '{}'\n",
                   SRCLOC_TO_STR(loc), fmt::string_view(fmt_str), e.what());
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "[PANIC] {} -- EXCEPTION DURING PANIC: '{}'\n", SRCLOC_TO_STR(loc),
                   e.what());
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
    catch (const std::exception &e)
    {
        fmt::print(stderr,
                   "[DBG]  FORMAT ERROR DURING DEBUG_MSG: fmt_str['{}']\n"
                   "[DBG]  Exception: '{}'\n",
                   fmt::string_view(fmt_str), e.what());
        std::fflush(stderr);
    }
}

} // namespace asyncmodules::debug

#ifndef AMOD_LOC_HERE_STR
#define AMOD_LOC_HERE_STR (SRCLOC_TO_STR(std::source_location::current()))
#endif

/**
 * @brief Calls `asyncmodules::debug::panic` with the current source location.
 */
#ifndef AMOD_PANIC
#define AMOD_PANIC(fmt, ...)                                                                       \
    ::asyncmodules::debug::panic(std::source_location::current(),                                 \
                                 FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#endif

/**
 * @brief Debug message to stderr; compiled out unless ASYNCMODULES_ENABLE_DEBUG_MESSAGES.
 */
#ifndef AMOD_DEBUG
#if defined(ASYNCMODULES_ENABLE_DEBUG_MESSAGES)
#define AMOD_DEBUG(fmt, ...)                                                                       \
    ::asyncmodules::debug::debug_msg(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#else
#define AMOD_DEBUG(fmt, ...)                                                                       \
    do                                                                                             \
    {                                                                                              \
    } while (0)
#endif
#endif
