/**
 * @file logger.cpp
 * @brief Logger worker and the entry queue feeding it.
 */
#include <algorithm>
#include <atomic>
#include <cctype>
#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <thread>
#include <variant>

#include "amod_service.hpp"

#include "utils/logger_sinks/console_sink.hpp"
#include "utils/logger_sinks/file_sink.hpp"
#include "utils/logger_sinks/sink.hpp"

namespace asyncmodules::utils
{

namespace
{

enum class Phase
{
    NotStarted,
    Running,
    Stopping,
    Stopped
};

std::atomic<Phase> g_phase{Phase::NotStarted};

/// False once the logger is stopping; panics before start().
bool accepts_configuration(const char *caller)
{
    const Phase phase = g_phase.load(std::memory_order_acquire);
    if (phase == Phase::NotStarted)
    {
        AMOD_PANIC("{} called before Logger::start()", caller);
    }
    return phase == Phase::Running;
}

LogMessage make_record(Logger::Level lvl, fmt::memory_buffer &&body)
{
    LogMessage record;
    record.timestamp = std::chrono::system_clock::now();
    record.process_id = platform::get_pid();
    record.thread_id = platform::get_native_thread_id();
    record.level = static_cast<int>(lvl);
    record.body = std::move(body);
    return record;
}

struct SinkSwitch
{
    std::unique_ptr<Sink> sink;
    std::promise<void> applied;
};

struct FlushRequest
{
    std::promise<void> written;
};

using Entry = std::variant<LogMessage, SinkSwitch, FlushRequest>;

} // namespace

struct Logger::Impl
{
    Impl() : sink(std::make_unique<ConsoleSink>()) {}
    ~Impl() { stop(); }

    /// False if the worker is no longer accepting entries.
    bool push(Entry entry);
    void run_worker();
    void apply(Entry &entry);
    void write_note(Logger::Level lvl, fmt::memory_buffer &&body);
    void stop();

    std::mutex mutex;
    std::condition_variable wakeup;
    std::deque<Entry> pending;
    bool closing{false};
    std::thread worker;

    // Worker thread only, once started.
    std::unique_ptr<Sink> sink;

    std::atomic<Logger::Level> level{Logger::Level::L_INFO};
};

bool Logger::Impl::push(Entry entry)
{
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (closing)
        {
            return false;
        }
        pending.push_back(std::move(entry));
    }
    wakeup.notify_one();
    return true;
}

void Logger::Impl::write_note(Logger::Level lvl, fmt::memory_buffer &&body)
{
    sink->write(make_record(lvl, std::move(body)));
}

void Logger::Impl::apply(Entry &entry)
{
    if (auto *record = std::get_if<LogMessage>(&entry))
    {
        if (record->level >= static_cast<int>(level.load(std::memory_order_relaxed)))
        {
            sink->write(*record);
        }
        return;
    }
    if (auto *change = std::get_if<SinkSwitch>(&entry))
    {
        const std::string previous = sink->description();
        write_note(Logger::Level::L_SYSTEM,
                   format_tools::make_buffer("Switching log sink to: {}", change->sink->description()));
        sink->flush();
        sink = std::move(change->sink);
        write_note(Logger::Level::L_SYSTEM,
                   format_tools::make_buffer("Log sink switched from: {}", previous));
        change->applied.set_value();
        return;
    }
    auto &request = std::get<FlushRequest>(entry);
    sink->flush();
    request.written.set_value();
}

void Logger::Impl::run_worker()
{
    std::deque<Entry> batch;
    for (;;)
    {
        bool last_batch = false;
        {
            std::unique_lock<std::mutex> lock(mutex);
            wakeup.wait(lock, [this] { return closing || !pending.empty(); });
            batch.swap(pending);
            last_batch = closing;
        }
        for (Entry &entry : batch)
        {
            try
            {
                apply(entry);
            }
            catch (const std::exception &e)
            {
                // The sink is the only reporting channel; fall back to stderr.
                fmt::print(stderr, "[LOGGER] sink [{}] failed: {}\n", sink->description(),
                           e.what());
            }
        }
        batch.clear();
        if (last_batch)
        {
            break;
        }
    }
    try
    {
        write_note(Logger::Level::L_SYSTEM, format_tools::make_buffer("Logger is shutting down."));
        sink->flush();
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "[LOGGER] final write failed: {}\n", e.what());
    }
}

void Logger::Impl::stop()
{
    {
        std::lock_guard<std::mutex> lock(mutex);
        closing = true;
    }
    wakeup.notify_one();
    if (worker.joinable())
    {
        worker.join();
    }
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger() : pImpl(std::make_unique<Impl>()) {}
Logger::~Logger() = default;

Logger &Logger::instance()
{
    static Logger instance;
    return instance;
}

std::optional<Logger::Level> Logger::level_from_string(std::string_view name) noexcept
{
    std::string key(format_tools::trim_whitespace(name));
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    static constexpr std::pair<const char *, Level> kNames[] = {
        {"trace", Level::L_TRACE},   {"debug", Level::L_DEBUG}, {"info", Level::L_INFO},
        {"warning", Level::L_WARNING}, {"warn", Level::L_WARNING}, {"error", Level::L_ERROR},
        {"critical", Level::L_CRITICAL}};
    for (const auto &[text, lvl] : kNames)
    {
        if (key == text)
        {
            return lvl;
        }
    }
    return std::nullopt;
}

const char *Logger::level_to_string(Level lvl) noexcept
{
    switch (lvl)
    {
    case Level::L_TRACE:
        return "trace";
    case Level::L_DEBUG:
        return "debug";
    case Level::L_INFO:
        return "info";
    case Level::L_WARNING:
        return "warning";
    case Level::L_ERROR:
        return "error";
    case Level::L_CRITICAL:
        return "critical";
    case Level::L_SYSTEM:
        return "system";
    }
    return "unknown";
}

bool Logger::start()
{
    Phase expected = Phase::NotStarted;
    if (!g_phase.compare_exchange_strong(expected, Phase::Running, std::memory_order_acq_rel))
    {
        return expected == Phase::Running;
    }
    pImpl->worker = std::thread([this] { pImpl->run_worker(); });
    return true;
}

void Logger::shutdown()
{
    Phase expected = Phase::Running;
    if (!g_phase.compare_exchange_strong(expected, Phase::Stopping, std::memory_order_acq_rel))
    {
        return;
    }
    pImpl->stop();
    g_phase.store(Phase::Stopped, std::memory_order_release);
}

bool Logger::is_running() noexcept
{
    return g_phase.load(std::memory_order_acquire) == Phase::Running;
}

bool Logger::set_logfile(const std::string &utf8_path)
{
    if (!accepts_configuration("Logger::set_logfile"))
    {
        return false;
    }
    std::unique_ptr<Sink> file;
    try
    {
        file = std::make_unique<FileSink>(utf8_path);
    }
    catch (const std::exception &e)
    {
        error_fmt("Log file not changed: {}", e.what());
        return false;
    }
    SinkSwitch change{std::move(file), {}};
    auto applied = change.applied.get_future();
    if (!pImpl->push(std::move(change)))
    {
        return false;
    }
    applied.get();
    return true;
}

void Logger::flush()
{
    if (!accepts_configuration("Logger::flush"))
    {
        return;
    }
    FlushRequest request;
    auto written = request.written.get_future();
    if (pImpl->push(std::move(request)))
    {
        written.get();
    }
}

void Logger::set_level(Level lvl)
{
    if (accepts_configuration("Logger::set_level"))
    {
        pImpl->level.store(lvl, std::memory_order_relaxed);
    }
}

Logger::Level Logger::level() const
{
    return pImpl->level.load(std::memory_order_relaxed);
}

bool Logger::should_log(Level lvl) const noexcept
{
    return is_running() &&
           static_cast<int>(lvl) >= static_cast<int>(pImpl->level.load(std::memory_order_relaxed));
}

void Logger::enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept
{
    if (!is_running())
    {
        return;
    }
    try
    {
        (void)pImpl->push(make_record(lvl, std::move(body)));
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "[LOGGER] record dropped: {}\n", e.what());
    }
}

// ============================================================================
// LoggerGuard
// ============================================================================

LoggerGuard::LoggerGuard()
{
    Logger::instance().start();
}

LoggerGuard::~LoggerGuard()
{
    if (Logger::is_running())
    {
        Logger::instance().flush();
    }
    Logger::instance().shutdown();
}

} // namespace asyncmodules::utils
