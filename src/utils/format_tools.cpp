// format_tools.cpp
#include "sth_base.hpp"

namespace statehub::format_tools
{

// Formatted local time with microsecond resolution. The fractional part is computed
// separately because fmt's chrono subsecond support differs between releases.
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

std::string formatted_duration(std::chrono::nanoseconds elapsed)
{
    const auto ns = elapsed.count();
    if (ns < 1000)
        return fmt::format("{}ns", ns);
    if (ns < 1000 * 1000)
        return fmt::format("{:.2f}us", static_cast<double>(ns) / 1e3);
    if (ns < 1000 * 1000 * 1000)
        return fmt::format("{:.2f}ms", static_cast<double>(ns) / 1e6);
    return fmt::format("{:.2f}s", static_cast<double>(ns) / 1e9);
}

} // namespace statehub::format_tools
