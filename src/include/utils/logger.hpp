/*******************************************************************************
 * @file logger.hpp
 * @brief Asynchronous, thread-safe logging utility.
 *
 * **Command-Queue Pattern**
 * 1.  **Non-Blocking API**: `LOGGER_INFO(...)` and friends format the message on the
 *     calling thread and push a command onto a queue. Dispatch paths of a store pay only
 *     for the level check when a level is disabled.
 * 2.  **Worker Thread**: one background thread is the sole consumer of the queue. It
 *     performs all sink I/O and owns the active sink.
 * 3.  **Sinks**: `Sink` defines write/flush. `ConsoleSink` (stderr, the default) and
 *     `FileSink` (append mode) are provided.
 * 4.  **Bounded queue**: log messages above `max_queue_size` are dropped and counted;
 *     control commands (sink switch, flush) are never dropped below twice that limit. The
 *     next batch reports how many messages were lost.
 *
 * **Usage**
 * ```cpp
 * #include "utils/logger.hpp"
 * LOGGER_INFO("store created with {} middleware", count);
 *
 * Logger &logger = Logger::instance();
 * logger.set_logfile("/tmp/statehub.log");
 * logger.set_level(Logger::Level::L_DEBUG);
 * logger.flush();    // blocks until everything queued so far is written
 * logger.shutdown(); // drains the queue and stops the worker; idempotent
 * ```
 ******************************************************************************/

#pragma once

#include <cstddef>
#include <functional>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "statehub_utils_export.h"

// Default initial reserve for fmt::memory_buffer used by Logger::log_fmt.
#ifndef LOGGER_FMT_BUFFER_RESERVE
#define LOGGER_FMT_BUFFER_RESERVE (256u)
#endif

namespace statehub::utils
{

class STATEHUB_UTILS_EXPORT Logger
{
  public:
    enum class Level : int
    {
        L_TRACE = 0,
        L_DEBUG = 1,
        L_INFO = 2,
        L_WARNING = 3,
        L_ERROR = 4,
        L_SYSTEM = 5,
    };

    static Logger &instance();

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;

    ~Logger();

    // --- Sinks ---
    // Sink changes are commands executed in order by the worker thread. They block until
    // the worker has applied them and report success.

    /// Switch logging to the console (stderr).
    bool set_console();

    /**
     * @brief Switch logging to a file opened in append mode.
     * @return false if the file cannot be opened (the current sink stays active) or if the
     *         logger has been shut down.
     */
    bool set_logfile(const std::string &utf8_path);

    /**
     * @brief Drains the queue and stops the worker thread. Later calls are no-ops and later
     *        log calls are discarded.
     */
    void shutdown();

    /// Blocks until every message queued before this call has been written and flushed.
    void flush();

    // --- Configuration & Diagnostics ---
    void set_level(Level lvl);
    [[nodiscard]] Level level() const;

    /// Maximum number of queued log messages before new ones are dropped.
    void set_max_queue_size(size_t max_size);

    /// Number of messages dropped because the queue was full, since the last sink switch.
    [[nodiscard]] size_t dropped_message_count() const;

    /**
     * @brief Sets a callback invoked (from the worker thread) when a sink fails to write or
     *        cannot be created.
     */
    void set_write_error_callback(std::function<void(const std::string &)> cb);

    // --- Formatting API ---
    template <Level lvl, typename... Args>
    void log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept;

    template <typename... Args>
    void trace_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_TRACE>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void debug_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_DEBUG>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void info_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_INFO>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void warn_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_WARNING>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void error_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_ERROR>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void system_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_SYSTEM>(fmt_str, std::forward<Args>(args)...);
    }

    /// Runtime-level entry point, used where the level comes from configuration.
    template <typename... Args>
    void log_fmt_runtime(Level lvl, fmt::string_view fmt_str, Args &&...args) noexcept;

    [[nodiscard]] bool should_log(Level lvl) const noexcept;

  private:
    Logger();

    struct Impl;
    std::unique_ptr<Impl> pImpl;

    void enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept;
};

// --- Compile-Time Log Level ---
#ifndef LOGGER_COMPILE_LEVEL
#define LOGGER_COMPILE_LEVEL 0 // 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error
#endif

template <Logger::Level lvl, typename... Args>
void Logger::log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    if constexpr (static_cast<int>(lvl) >= LOGGER_COMPILE_LEVEL)
    {
        if (!should_log(lvl))
            return;

        fmt::memory_buffer mb;
        try
        {
            mb.reserve(LOGGER_FMT_BUFFER_RESERVE);
            fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
        }
        catch (const std::exception &ex)
        {
            mb.clear();
            fmt::format_to(std::back_inserter(mb), "[FORMAT ERROR] {}", ex.what());
        }
        enqueue_log(lvl, std::move(mb));
    }
}

template <typename... Args>
void Logger::log_fmt_runtime(Level lvl, fmt::string_view fmt_str, Args &&...args) noexcept
{
    if (!should_log(lvl))
        return;

    fmt::memory_buffer mb;
    try
    {
        mb.reserve(LOGGER_FMT_BUFFER_RESERVE);
        fmt::format_to(std::back_inserter(mb), fmt::runtime(fmt_str), std::forward<Args>(args)...);
    }
    catch (const std::exception &ex)
    {
        mb.clear();
        fmt::format_to(std::back_inserter(mb), "[FORMAT ERROR] {}", ex.what());
    }
    enqueue_log(lvl, std::move(mb));
}

} // namespace statehub::utils

// --- Macro Implementation ---
#define LOGGER_TRACE(fmt, ...)                                                                     \
    ::statehub::utils::Logger::instance().trace_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_DEBUG(fmt, ...)                                                                     \
    ::statehub::utils::Logger::instance().debug_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_INFO(fmt, ...)                                                                      \
    ::statehub::utils::Logger::instance().info_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_WARN(fmt, ...)                                                                      \
    ::statehub::utils::Logger::instance().warn_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_ERROR(fmt, ...)                                                                     \
    ::statehub::utils::Logger::instance().error_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_SYSTEM(fmt, ...)                                                                    \
    ::statehub::utils::Logger::instance().system_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
