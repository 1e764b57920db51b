#pragma once
/**
 * @file logger.hpp
 * @brief Process-wide asynchronous logger on fmt.
 *
 * `LOGGER_*` calls format on the calling thread and hand the record to a worker
 * thread, which owns the active sink (stderr by default, or a file). The scheduler
 * thread therefore never waits on terminal or disk I/O.
 *
 * Sink switches and flushes travel through the same queue as records, so they take
 * effect in order; the calls block until the worker has applied them.
 *
 * @code
 * int main()
 * {
 *     asyncmodules::utils::LoggerGuard logger_guard;
 *     LOGGER_INFO("Loaded {} modules", count);
 * }
 * @endcode
 * Records emitted before `start()` or after `shutdown()` are dropped. Configuration
 * calls before `start()` panic.
 */
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "asyncmodules_export.h"

// Default initial reserve for fmt::memory_buffer used by Logger::log_fmt.
#ifndef LOGGER_FMT_BUFFER_RESERVE
#define LOGGER_FMT_BUFFER_RESERVE (1024u)
#endif

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace asyncmodules::utils
{

class ASYNCMODULES_EXPORT Logger
{
  public:
    enum class Level : int
    {
        L_TRACE = 0,
        L_DEBUG = 1,
        L_INFO = 2,
        L_WARNING = 3,
        L_ERROR = 4,
        L_CRITICAL = 5,
        L_SYSTEM = 6,
    };

    static Logger &instance();

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;

    ~Logger();

    /**
     * @brief Parses "trace", "debug", "info", "warning"/"warn", "error", "critical".
     * @return std::nullopt for anything else (case-insensitive match).
     */
    static std::optional<Level> level_from_string(std::string_view name) noexcept;

    /** @brief Canonical lower-case name of a level. */
    static const char *level_to_string(Level lvl) noexcept;

    // --- Lifecycle ---

    /**
     * @brief Starts the worker thread. Idempotent while running.
     * @return false if the logger was already shut down (it cannot be restarted).
     */
    bool start();

    /**
     * @brief Drains the queue, writes a final SYSTEM line and joins the worker.
     * Safe to call more than once and before start().
     */
    void shutdown();

    /** @brief True between start() and shutdown(). */
    static bool is_running() noexcept;

    // --- Sinks / Configuration ---

    /**
     * @brief Appends every later record to @p utf8_path.
     * @return false if the file could not be opened; the error is logged to the
     *         previous sink, which stays active.
     */
    bool set_logfile(const std::string &utf8_path);

    /** @brief Blocks until every record emitted before the call has been written. */
    void flush();

    void set_level(Level lvl);
    Level level() const;

    // --- Formatting API (header-only templates) ---
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
    void critical_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_CRITICAL>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void system_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_SYSTEM>(fmt_str, std::forward<Args>(args)...);
    }

    bool should_log(Level lvl) const noexcept;

  private:
    Logger();
    void enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept;

    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

/**
 * @class LoggerGuard
 * @brief Starts the logger on construction; flushes and shuts it down on destruction.
 */
class ASYNCMODULES_EXPORT LoggerGuard
{
  public:
    LoggerGuard();
    ~LoggerGuard();

    LoggerGuard(const LoggerGuard &) = delete;
    LoggerGuard &operator=(const LoggerGuard &) = delete;
};

// --- Compile-Time Log Level ---
#ifndef LOGGER_COMPILE_LEVEL
#define LOGGER_COMPILE_LEVEL 0 // 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical
#endif

template <Logger::Level lvl, typename... Args>
void Logger::log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    if constexpr (static_cast<int>(lvl) >= LOGGER_COMPILE_LEVEL)
    {
        if (!should_log(lvl))
            return;

        try
        {
            fmt::memory_buffer mb;
            mb.reserve(LOGGER_FMT_BUFFER_RESERVE);
            fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
            enqueue_log(lvl, std::move(mb));
        }
        catch (const std::exception &ex)
        {
            fmt::memory_buffer err;
            fmt::format_to(std::back_inserter(err), "[FORMAT ERROR] {}", ex.what());
            enqueue_log(lvl, std::move(err));
        }
    }
}

} // namespace asyncmodules::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif

// --- Macro Implementation ---
#define LOGGER_TRACE(fmt, ...)                                                                     \
    ::asyncmodules::utils::Logger::instance().trace_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_DEBUG(fmt, ...)                                                                     \
    ::asyncmodules::utils::Logger::instance().debug_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_INFO(fmt, ...)                                                                      \
    ::asyncmodules::utils::Logger::instance().info_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_WARN(fmt, ...)                                                                      \
    ::asyncmodules::utils::Logger::instance().warn_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_ERROR(fmt, ...)                                                                     \
    ::asyncmodules::utils::Logger::instance().error_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_CRITICAL(fmt, ...)                                                                  \
    ::asyncmodules::utils::Logger::instance().critical_fmt(FMT_STRING(fmt) __VA_OPT__(, )         \
                                                                __VA_ARGS__)
#define LOGGER_SYSTEM(fmt, ...)                                                                    \
    ::asyncmodules::utils::Logger::instance().system_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
