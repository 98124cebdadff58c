// platform.cpp
#include "sth_platform.hpp"

#include <functional>
#include <thread>

#if STATEHUB_IS_POSIX
#include <pthread.h>
#include <sys/syscall.h>
#include <unistd.h>
#endif

namespace statehub::platform
{

uint64_t get_native_thread_id() noexcept
{
#if defined(STATEHUB_PLATFORM_WIN64)
    return static_cast<uint64_t>(::GetCurrentThreadId());
#elif defined(STATEHUB_PLATFORM_APPLE)
    uint64_t tid;
    pthread_threadid_np(nullptr, &tid);
    return tid;
#elif defined(STATEHUB_PLATFORM_LINUX)
    return static_cast<uint64_t>(syscall(SYS_gettid));
#else
    // Fallback for other systems.
    return std::hash<std::thread::id>()(std::this_thread::get_id());
#endif
}

uint64_t get_pid() noexcept
{
#if defined(STATEHUB_PLATFORM_WIN64)
    return static_cast<uint64_t>(GetCurrentProcessId());
#elif STATEHUB_IS_POSIX
    return static_cast<uint64_t>(getpid());
#else
    return 0;
#endif
}

} // namespace statehub::platform
