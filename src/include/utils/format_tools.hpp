// Tools for formatting strings
#pragma once
#include <chrono>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace asyncmodules::format_tools
{

/**
 * @brief Formats a system_clock time_point into a local-time string with microsecond precision.
 * @param timestamp The time_point to format.
 * @return A string in the format "YYYY-MM-DD HH:MM:SS.us".
 */
ASYNCMODULES_EXPORT std::string formatted_time(std::chrono::system_clock::time_point timestamp);

/**
 * @brief Strips leading and trailing whitespace (" \t\n\r\f\v").
 * @return A view into @p str; empty if @p str is all whitespace.
 */
ASYNCMODULES_EXPORT std::string_view trim_whitespace(std::string_view str) noexcept;

/**
 * @brief Splits @p text at the first occurrence of @p sep.
 *
 * Mirrors "head, sep, tail" partitioning: if @p sep is absent the whole input is
 * returned as the head and the tail is empty. Only the first separator splits, so
 * "a.b.c" yields {"a", "b.c"}.
 */
ASYNCMODULES_EXPORT std::pair<std::string_view, std::string_view>
partition_first(std::string_view text, char sep) noexcept;

/**
 * @brief Creates a `fmt::memory_buffer` from a compile-time format string and arguments.
 */
template <typename... Args>
fmt::memory_buffer make_buffer(fmt::format_string<Args...> fmt_str, Args &&...args)
{
    fmt::memory_buffer mb;
    mb.reserve(128);
    fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
    return mb;
}

/**
 * @brief Creates a `fmt::memory_buffer` from a runtime format string and arguments.
 */
template <typename... Args>
fmt::memory_buffer make_buffer_rt(fmt::string_view fmt_str, Args &&...args)
{
    fmt::memory_buffer mb;
    mb.reserve(128);
    fmt::format_to(std::back_inserter(mb), fmt::runtime(fmt_str), std::forward<Args>(args)...);
    return mb;
}

/**
 * @brief Extracts the filename from a full path at compile time.
 * @param file_path A string_view of the full path.
 * @return A string_view of just the filename portion of the path.
 */
constexpr std::string_view filename_only(std::string_view file_path) noexcept
{
    const auto last_slash = file_path.find_last_of('/');
    const auto last_backslash = file_path.find_last_of('\\');

    std::string_view::size_type last_separator_pos = last_slash;
    if (last_slash == std::string_view::npos)
    {
        last_separator_pos = last_backslash;
    }
    else if (last_backslash != std::string_view::npos && last_backslash > last_slash)
    {
        last_separator_pos = last_backslash;
    }

    if (last_separator_pos == std::string_view::npos)
    {
        return file_path;
    }
    return file_path.substr(last_separator_pos + 1);
}

} // namespace asyncmodules::format_tools
