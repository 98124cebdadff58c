#pragma once
/**
 * @file sth_platform.hpp
 * @brief Layer 0: Platform detection and the few process/thread queries the logger needs.
 *
 * Prefer build-system macros (PLATFORM_WIN64, PLATFORM_LINUX, ...); fall back to compiler
 * predefined macros. Self-contained; can be included at any point.
 */
#include <cstddef>
#include <cstdint>
#include <string>

#include "statehub_utils_export.h"

#if defined(PLATFORM_WIN64) || (!defined(PLATFORM_LINUX) && !defined(PLATFORM_APPLE) && defined(_WIN64))
#define STATEHUB_PLATFORM_WIN64 1
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#elif defined(PLATFORM_APPLE) || (defined(__APPLE__) && defined(__MACH__))
#define STATEHUB_PLATFORM_APPLE 1
#elif defined(PLATFORM_LINUX) || defined(__linux__)
#define STATEHUB_PLATFORM_LINUX 1
#else
#define STATEHUB_PLATFORM_UNKNOWN 1
#endif

#if defined(STATEHUB_PLATFORM_APPLE) || defined(STATEHUB_PLATFORM_LINUX)
#define STATEHUB_IS_POSIX 1
#else
#define STATEHUB_IS_POSIX 0
#endif

namespace statehub::platform
{

/**
 * @brief Gets a platform-native thread ID, suitable for log lines.
 * @return `GetCurrentThreadId`, `pthread_threadid_np` or `gettid`, depending on the platform.
 */
STATEHUB_UTILS_EXPORT uint64_t get_native_thread_id() noexcept;

/**
 * @brief Gets the process ID (PID) for the current process.
 */
STATEHUB_UTILS_EXPORT uint64_t get_pid() noexcept;

} // namespace statehub::platform
