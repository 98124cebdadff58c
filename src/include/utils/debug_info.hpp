/**
 * @file debug_info.hpp
 * @brief Internal debug messaging for library code paths that cannot use the Logger
 *        (the Logger's own worker, sink switching, shutdown).
 *
 * Messages go straight to `stderr` and are compiled out unless
 * `STATEHUB_ENABLE_DEBUG_MESSAGES` is defined.
 */
#pragma once

#include <cstdio>
#include <source_location>
#include <string>
#include <utility>

#include <fmt/format.h>

#include "utils/format_tools.hpp"

namespace statehub::debug
{

/**
 * @brief Prints a debug message to `stderr` with compile-time format string checking.
 *
 * Formatting errors are reported in place of the message; this function never throws.
 */
template <typename... Args>
inline void debug_msg(std::source_location loc, fmt::format_string<Args...> fmt_str,
                      Args &&...args) noexcept
{
    try
    {
        const auto body = fmt::format(fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "[DBG]  {}:{} {}\n", format_tools::filename_only(loc.file_name()),
                   loc.line(), body);
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "[DBG]  FORMAT ERROR DURING DEBUG_MSG: %s\n", e.what());
        std::fflush(stderr);
    }
}

} // namespace statehub::debug

/**
 * @brief Macro for calling `statehub::debug::debug_msg` with automatic source location.
 */
#ifndef STH_DEBUG
#if defined(STATEHUB_ENABLE_DEBUG_MESSAGES)
#define STH_DEBUG(fmt, ...)                                                                        \
    ::statehub::debug::debug_msg(std::source_location::current(),                                  \
                                 FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#else
#define STH_DEBUG(fmt, ...)                                                                        \
    do                                                                                             \
    {                                                                                              \
    } while (0)
#endif
#endif
