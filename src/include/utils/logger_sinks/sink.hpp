#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include <fmt/format.h>

#include "statehub_utils_export.h"

namespace statehub::utils
{

// A single log message event, built on the calling thread and consumed by the worker.
struct LogMessage
{
    std::chrono::system_clock::time_point timestamp;
    uint64_t process_id;
    uint64_t thread_id;
    int level; // int rather than Logger::Level so sinks do not depend on logger.hpp
    fmt::memory_buffer body;
};

// Abstract interface for a log message destination. Only the logger's worker thread calls
// into a sink, so implementations need no locking of their own.
class STATEHUB_UTILS_EXPORT Sink
{
  public:
    virtual ~Sink() = default;
    virtual void write(const LogMessage &msg) = 0;
    virtual void flush() = 0;
    virtual std::string description() const = 0;

    static const char *level_to_string(int lvl) noexcept;
    static std::string format_logmsg(const LogMessage &msg);
};

} // namespace statehub::utils
