#pragma once
/**
 * @file task.hpp
 * @brief An asynchronous unit of work tracked by the TaskDispatcher.
 */
#include "asyncmodules_export.h"
#include "core/async.hpp"

#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace asyncmodules::core
{

class Task;
using TaskPtr = std::shared_ptr<Task>;

/**
 * @class Task
 * @brief A module method invocation in flight.
 *
 * State machine: Pending -> Running -> Finished | Failed, or Pending -> Cancelled.
 * A Task runs at most once. run() creates the body coroutine and runs it to its first
 * suspension point; the scheduler resumes it from there, so a Task stays Running
 * across any number of sleeps. An exception escaping the body is captured and never
 * propagates further. The recorded stack trace is that of the home thread where the
 * failure was caught, not of the throw site.
 *
 * Done callbacks fire exactly once, on the thread that completed or cancelled the
 * task. A callback added after completion fires immediately.
 */
class ASYNCMODULES_EXPORT Task : public std::enable_shared_from_this<Task>
{
  public:
    enum class State
    {
        Pending,
        Running,
        Finished,
        Failed,
        Cancelled
    };

    /// Creates the body coroutine; called once, when the task starts.
    using Body = std::function<Async<nlohmann::json>()>;
    using DoneCallback = std::function<void(const TaskPtr &)>;

    static TaskPtr create(std::string description, Body body);

    Task(const Task &) = delete;
    Task &operator=(const Task &) = delete;

    [[nodiscard]] uint64_t id() const noexcept { return id_; }
    [[nodiscard]] const std::string &description() const noexcept { return description_; }
    [[nodiscard]] State state() const noexcept { return state_; }
    [[nodiscard]] bool done() const noexcept;

    /**
     * @brief Starts the body if still Pending. No-op otherwise.
     *
     * Returns at the body's first suspension point; the task completes when the
     * body does.
     */
    void run();

    /**
     * @brief Marks a Pending task Cancelled and fires done callbacks.
     * @return false if the task had already started or finished.
     */
    bool cancel();

    void add_done_callback(DoneCallback cb);

    /**
     * @brief The body's return value.
     * @throws The captured exception if Failed; std::logic_error if not Finished.
     */
    [[nodiscard]] const nlohmann::json &result() const;

    [[nodiscard]] std::exception_ptr exception() const noexcept { return error_; }

    /** @brief `what()` of the captured exception, or "unknown exception". Empty if not Failed. */
    [[nodiscard]] const std::string &failure_message() const noexcept { return failure_message_; }

    /** @brief Stack trace of the home thread where the failure was caught. Empty if not Failed. */
    [[nodiscard]] const std::string &failure_trace() const noexcept { return failure_trace_; }

    static const char *state_to_string(State state) noexcept;

  private:
    Task(std::string description, Body body);
    void complete();
    void record_failure(std::exception_ptr error);
    void finish(State final_state);

    uint64_t id_;
    std::string description_;
    Body body_;
    Async<nlohmann::json> coroutine_;
    State state_{State::Pending};
    nlohmann::json result_;
    std::exception_ptr error_;
    std::string failure_message_;
    std::string failure_trace_;
    std::vector<DoneCallback> callbacks_;
};

} // namespace asyncmodules::core

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
