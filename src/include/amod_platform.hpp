#pragma once
/**
 * @file amod_platform.hpp
 * @brief Layer 0: Platform detection and the small set of OS queries the runtime needs.
 *
 * Every other header builds on this one. It defines exactly one of
 * ASYNCMODULES_PLATFORM_{WIN64,APPLE,FREEBSD,LINUX,UNKNOWN} plus the convenience
 * booleans ASYNCMODULES_IS_WINDOWS / ASYNCMODULES_IS_POSIX.
 *
 * The build system passes PLATFORM_<NAME>; compiler predefined macros are the fallback.
 */
#include <cstddef>
#include <cstdint>
#include <string>

#if defined(PLATFORM_WIN64) || (!defined(PLATFORM_APPLE) && !defined(PLATFORM_FREEBSD) &&         \
                                !defined(PLATFORM_LINUX) && !defined(PLATFORM_UNKNOWN) &&          \
                                defined(_WIN64))
#define ASYNCMODULES_PLATFORM_WIN64 1
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#elif defined(PLATFORM_APPLE) || (!defined(PLATFORM_FREEBSD) && !defined(PLATFORM_LINUX) &&       \
                                  !defined(PLATFORM_UNKNOWN) && defined(__APPLE__) &&              \
                                  defined(__MACH__))
#define ASYNCMODULES_PLATFORM_APPLE 1
#elif defined(PLATFORM_FREEBSD) ||                                                                 \
    (!defined(PLATFORM_LINUX) && !defined(PLATFORM_UNKNOWN) && defined(__FreeBSD__))
#define ASYNCMODULES_PLATFORM_FREEBSD 1
#elif defined(PLATFORM_LINUX) || (!defined(PLATFORM_UNKNOWN) && defined(__linux__))
#define ASYNCMODULES_PLATFORM_LINUX 1
#else
#define ASYNCMODULES_PLATFORM_UNKNOWN 1
#endif

#if defined(ASYNCMODULES_PLATFORM_WIN64)
#define ASYNCMODULES_IS_WINDOWS 1
#elif defined(ASYNCMODULES_PLATFORM_APPLE) || defined(ASYNCMODULES_PLATFORM_FREEBSD) ||           \
    defined(ASYNCMODULES_PLATFORM_LINUX)
#define ASYNCMODULES_IS_POSIX 1
#endif

// --- Require C++20 or later --------------------------------------------------
// MSVC only reports the real standard in __cplusplus with /Zc:__cplusplus, so use _MSVC_LANG.
#if defined(_MSC_VER)
#if !defined(_MSVC_LANG) || (_MSVC_LANG < 202002L)
#error "asyncmodules requires C++20 or later. Please compile with /std:c++20 or newer (MSVC)."
#endif
#else
#if __cplusplus < 202002L
#error "asyncmodules requires C++20 or later. Please compile with -std=c++20 or newer."
#endif
#endif

#include "asyncmodules_export.h"

namespace asyncmodules::platform
{

/**
 * @brief Gets the native thread ID for the calling thread.
 * @return A 64-bit unsigned integer representing the thread ID (gettid on Linux).
 */
ASYNCMODULES_EXPORT uint64_t get_native_thread_id() noexcept;

/**
 * @brief Gets the process ID (PID) for the current process.
 */
ASYNCMODULES_EXPORT uint64_t get_pid() noexcept;

/**
 * @brief Gets the name of the current executable.
 * @param include_path If `true`, returns the full absolute path to the executable.
 *                     If `false` (default), returns only the filename.
 * @return The executable name, or "unknown" on failure.
 */
ASYNCMODULES_EXPORT std::string get_executable_name(bool include_path = false) noexcept;

/** @brief Full version string of the library, e.g. "0.3.0". */
ASYNCMODULES_EXPORT const char *get_version_string() noexcept;
ASYNCMODULES_EXPORT int get_version_major() noexcept;
ASYNCMODULES_EXPORT int get_version_minor() noexcept;
ASYNCMODULES_EXPORT int get_version_patch() noexcept;

/**
 * @brief Gets a monotonic timestamp in nanoseconds.
 * @note The absolute value is meaningless; use for computing time deltas only.
 */
ASYNCMODULES_EXPORT uint64_t monotonic_time_ns() noexcept;

/**
 * @brief Nanoseconds elapsed since a previous monotonic_time_ns() value.
 * @return 0 if start_ns lies in the future.
 */
ASYNCMODULES_EXPORT uint64_t elapsed_time_ns(uint64_t start_ns) noexcept;

} // namespace asyncmodules::platform
