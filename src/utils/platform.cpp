/**
 * @file platform.cpp
 * @brief OS-specific implementations of the asyncmodules::platform queries.
 *
 * Process/thread identification feeds the logger's record header; the executable
 * path is used by debug::format_stack_trace() and by the test harness to re-spawn
 * itself in worker mode.
 */
#include "amod_base.hpp"
#include "asyncmodules_version.h"

#include <chrono>
#include <filesystem>
#include <thread>
#include <vector>

#if defined(ASYNCMODULES_IS_POSIX)
#include <climits>
#include <sys/syscall.h>
#include <sys/types.h>
#include <unistd.h>
#endif

#if defined(ASYNCMODULES_PLATFORM_FREEBSD)
#include <sys/sysctl.h>
#endif

#if defined(ASYNCMODULES_PLATFORM_APPLE)
#include <mach-o/dyld.h> // _NSGetExecutablePath
#include <pthread.h>
#endif

namespace asyncmodules::platform
{

uint64_t get_pid() noexcept
{
#if defined(ASYNCMODULES_PLATFORM_WIN64)
    return static_cast<uint64_t>(GetCurrentProcessId());
#else
    return static_cast<uint64_t>(getpid());
#endif
}

uint64_t get_native_thread_id() noexcept
{
#if defined(ASYNCMODULES_PLATFORM_WIN64)
    return static_cast<uint64_t>(::GetCurrentThreadId());
#elif defined(ASYNCMODULES_PLATFORM_APPLE)
    uint64_t tid = 0;
    pthread_threadid_np(nullptr, &tid);
    return tid;
#elif defined(ASYNCMODULES_PLATFORM_LINUX)
    return static_cast<uint64_t>(syscall(SYS_gettid));
#else
    return std::hash<std::thread::id>()(std::this_thread::get_id());
#endif
}

std::string get_executable_name(bool include_path) noexcept
{
    try
    {
        std::string full_path;
#if defined(ASYNCMODULES_PLATFORM_WIN64)
        std::vector<char> buf(MAX_PATH);
        DWORD len = GetModuleFileNameA(nullptr, buf.data(), static_cast<DWORD>(buf.size()));
        if (len == 0)
            return "unknown";
        full_path.assign(buf.data(), len);
#elif defined(ASYNCMODULES_PLATFORM_LINUX)
        std::vector<char> buf(PATH_MAX);
        ssize_t count = readlink("/proc/self/exe", buf.data(), buf.size());
        if (count <= 0)
            return "unknown";
        full_path.assign(buf.data(), static_cast<size_t>(count));
#elif defined(ASYNCMODULES_PLATFORM_APPLE)
        uint32_t size = 0;
        _NSGetExecutablePath(nullptr, &size);
        std::vector<char> buf(size + 1);
        if (_NSGetExecutablePath(buf.data(), &size) != 0)
            return "unknown";
        full_path = buf.data();
#elif defined(ASYNCMODULES_PLATFORM_FREEBSD)
        int mib[4] = {CTL_KERN, KERN_PROC, KERN_PROC_PATHNAME, -1};
        size_t buffer_size = 0;
        if (sysctl(mib, 4, nullptr, &buffer_size, nullptr, 0) == -1)
            return "unknown";
        std::vector<char> buf(buffer_size);
        if (sysctl(mib, 4, buf.data(), &buffer_size, nullptr, 0) == -1)
            return "unknown";
        full_path.assign(buf.data(), buffer_size - 1);
#else
        (void)include_path;
        return "unknown";
#endif
        if (include_path)
            return full_path;
        return std::filesystem::path(full_path).filename().string();
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "Warning: get_executable_name failed: {}.\n", e.what());
    }
    return "unknown";
}

const char *get_version_string() noexcept
{
    return ASYNCMODULES_VERSION_STRING;
}

int get_version_major() noexcept
{
    return ASYNCMODULES_VERSION_MAJOR;
}

int get_version_minor() noexcept
{
    return ASYNCMODULES_VERSION_MINOR;
}

int get_version_patch() noexcept
{
    return ASYNCMODULES_VERSION_PATCH;
}

uint64_t monotonic_time_ns() noexcept
{
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
                                     std::chrono::steady_clock::now().time_since_epoch())
                                     .count());
}

uint64_t elapsed_time_ns(uint64_t start_ns) noexcept
{
    const uint64_t now = monotonic_time_ns();
    return now < start_ns ? 0 : now - start_ns;
}

} // namespace asyncmodules::platform
