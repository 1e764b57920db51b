// format_tools.cpp
#include "amod_base.hpp"

namespace asyncmodules::format_tools
{

// Local time with microsecond resolution. fmt prints whole seconds for a
// seconds-precision time_point, so the fraction is appended separately.
std::string formatted_time(std::chrono::system_clock::time_point timestamp)
{
    auto tp_us = std::chrono::time_point_cast<std::chrono::microseconds>(timestamp);
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp_us);
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(tp_us - secs).count();
    // normalize to 0..999999 even for negative timestamps
    int fractional_us = static_cast<int>(us % 1000000);
    if (fractional_us < 0)
        fractional_us += 1000000;
    auto sec_part = fmt::format("{:%Y-%m-%d %H:%M:%S}", fmt::localtime(std::chrono::system_clock::to_time_t(secs)));
    return fmt::format("{}.{:06d}", sec_part, fractional_us);
}

std::string_view trim_whitespace(std::string_view str) noexcept
{
    constexpr std::string_view whitespace = " \t\n\r\f\v";

    auto first = str.find_first_not_of(whitespace);
    if (first == std::string_view::npos)
    {
        return str.substr(0, 0);
    }
    auto last = str.find_last_not_of(whitespace);
    return str.substr(first, last - first + 1);
}

std::pair<std::string_view, std::string_view> partition_first(std::string_view text,
                                                              char sep) noexcept
{
    const auto pos = text.find(sep);
    if (pos == std::string_view::npos)
    {
        return {text, std::string_view{}};
    }
    return {text.substr(0, pos), text.substr(pos + 1)};
}

} // namespace asyncmodules::format_tools
