#pragma once
/**
 * @file scheduler.hpp
 * @brief Cooperative single-thread executor shared by every core component.
 *
 * The scheduler owns a *home thread*: the thread that constructed it. It never
 * changes. Jobs run only on that thread, one at a time, so module methods, broadcasts
 * and queue processing never race each other.
 *
 * Other threads hand work in through `submit()`, which places a job in a
 * mutex-protected inbox and returns a `std::future`. The home thread moves inbox
 * jobs to its ready queue whenever it pumps.
 *
 * Suspendable work is written as coroutines (`Async<T>`). A coroutine that awaits
 * `sleep()` is parked in a timer queue ordered by deadline and resumed by a job of
 * its own once the deadline passes, so any number of sleepers make progress
 * independently of each other.
 *
 * A *pump* (`run_until`, `sleep_for`, `run_sync`) runs ready jobs until a predicate
 * holds. Pumps are blocking calls for code outside any job: calling one from inside
 * a job throws `std::logic_error`, since the job would hold up every other job. Code
 * running inside a job co_awaits instead.
 */
#include "asyncmodules_export.h"
#include "core/async.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace asyncmodules::core
{

/// Thrown once the scheduler no longer accepts work, or stopped before a blocking call completed.
class SchedulerStopped : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

/// Delivered through a submit() future whose job was cancelled before it ran.
class TaskCancelled : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

namespace detail
{

/// Root coroutine that hands the outcome of @p work to @p promise.
template <typename T>
Async<void> fulfil(Async<T> work, std::shared_ptr<std::promise<T>> promise)
{
    try
    {
        if constexpr (std::is_void_v<T>)
        {
            co_await std::move(work);
            promise->set_value();
        }
        else
        {
            promise->set_value(co_await std::move(work));
        }
    }
    catch (...)
    {
        // Rethrown to the waiting caller by future::get().
        promise->set_exception(std::current_exception());
    }
}

} // namespace detail

class ASYNCMODULES_EXPORT Scheduler
{
  public:
    using Clock = std::chrono::steady_clock;

    /**
     * @struct Job
     * @brief A unit of work for the ready queue.
     *
     * `cancel` (optional) is invoked instead of `run` if the job is discarded at
     * shutdown, so waiters can be released.
     */
    struct Job
    {
        std::string description;
        std::function<void()> run;
        std::function<void()> cancel;
    };

    using PollHook = std::function<void()>;

    explicit Scheduler(std::chrono::milliseconds poll_interval = std::chrono::milliseconds(50));
    ~Scheduler();

    Scheduler(const Scheduler &) = delete;
    Scheduler &operator=(const Scheduler &) = delete;

    // --- Home thread ---

    [[nodiscard]] bool is_home_thread() const noexcept;
    [[nodiscard]] std::thread::id home_thread() const noexcept { return home_; }

    /** @brief True while a job (or a poll hook) is executing on the home thread. */
    [[nodiscard]] bool in_job() const noexcept { return job_depth_ != 0; }

    /**
     * @brief Appends a job to the ready queue. Home thread only.
     *
     * After `cancel_all()` the job is cancelled immediately instead.
     * @throws std::logic_error if called from another thread.
     */
    void post(Job job);

    /**
     * @brief Runs @p fn on the home thread and returns its outcome through a future.
     *
     * If @p fn returns an `Async<T>`, the coroutine is driven to completion on the home
     * thread and the future carries its `T`. Exceptions are stored in the future. If the
     * job is discarded by `cancel_all()` the future holds `TaskCancelled`.
     *
     * @throws std::logic_error if called from the home thread (it would wait on itself).
     * @throws SchedulerStopped if `cancel_all()` already closed the inbox.
     */
    template <typename Fn>
    auto submit(std::string description, Fn &&fn)
        -> std::future<async_value_t<std::invoke_result_t<std::decay_t<Fn> &>>>;

    // --- Coroutines (home thread) ---

    /**
     * @brief Suspends the awaiting coroutine for @p duration while other jobs run.
     *
     * Completes with false, without waiting, once a stop was requested or the
     * scheduler was closed; a sleeper still parked when `cancel_all()` runs is resumed
     * with false as well.
     */
    Async<bool> sleep(std::chrono::milliseconds duration);

    /**
     * @brief Starts @p work as a detached job owned by the scheduler.
     *
     * The coroutine starts from the ready queue. An exception escaping it is logged.
     * @p on_cancel runs if the job is cancelled before it started.
     */
    void spawn(std::string description, Async<void> work, std::function<void()> on_cancel = {});

    /**
     * @brief Starts @p work immediately and pumps until it completes.
     *
     * Blocking: not callable from inside a job.
     * @return The coroutine's value; its exception propagates.
     * @throws SchedulerStopped if a stop was requested before @p work completed.
     */
    template <typename T> T run_sync(std::string description, Async<T> work);

    /**
     * @brief Like run_sync() for `Async<void>`, reporting a stop instead of throwing.
     * @return false if a stop was requested before @p work completed.
     */
    bool run_to_completion(std::string description, Async<void> work);

    // --- Pumps (home thread, outside jobs) ---

    /**
     * @brief Moves inbox jobs and due timers to the ready queue and runs the poll hooks.
     * Does not run jobs.
     */
    void service();

    /**
     * @brief Runs ready jobs until @p pred holds.
     * @return true when @p pred held; false if a stop was requested first.
     * @throws std::logic_error if called from inside a job or off the home thread.
     */
    bool run_until(const std::function<bool()> &pred);

    /**
     * @brief Blocking cooperative sleep: runs ready jobs until @p duration has elapsed.
     * @return false if a stop was requested before the deadline.
     */
    bool sleep_for(std::chrono::milliseconds duration);

    /** @brief Runs at most one ready (or due) job. @return true if a job ran. */
    bool run_one();

    // --- Control ---

    /**
     * @brief Registers a hook called on every service() pass, on the home thread.
     * Hooks never run nested inside themselves.
     */
    void add_poll_hook(PollHook hook);

    /** @brief Makes every pump return false. Thread-safe. */
    void request_stop() noexcept;
    [[nodiscard]] bool stop_requested() const noexcept;

    /** @brief Wakes a waiting pump so it re-evaluates its predicate. Thread-safe. */
    void notify() noexcept;

    /**
     * @brief Closes the inbox and cancels every job that has not started.
     *
     * Parked sleepers are resumed with false so their coroutines can finish. Each
     * cancellation is logged as a warning. Home thread only.
     * @return Number of cancelled jobs.
     */
    size_t cancel_all();

    [[nodiscard]] size_t ready_count() const noexcept { return ready_.size(); }
    [[nodiscard]] size_t timer_count() const noexcept { return timers_.size(); }
    [[nodiscard]] size_t detached_count() const noexcept { return roots_.size(); }
    [[nodiscard]] bool closed() const noexcept;
    [[nodiscard]] std::chrono::milliseconds poll_interval() const noexcept { return poll_interval_; }

  private:
    class SleepAwaiter;
    class JobScope;

    struct Root
    {
        std::string description;
        Async<void> work;
    };

    template <typename T> std::future<T> start_root(std::string description, Async<T> work);
    void adopt(std::string description, Async<void> work, bool start_now,
               std::function<void()> on_cancel);
    void resume_root(uint64_t id);
    void collect_retired_roots();

    void check_blocking_allowed(const std::string &description) const;
    void enqueue_external(Job job);
    void add_timer(Clock::time_point deadline, Job job);
    void promote_due_timers();
    bool pump(const std::function<bool()> &pred, Clock::time_point deadline);
    void wait_for_work(Clock::time_point deadline);
    void cancel_job(Job &job);

    const std::chrono::milliseconds poll_interval_;
    const std::thread::id home_;
    std::deque<Job> ready_;
    std::multimap<Clock::time_point, Job> timers_;
    std::vector<PollHook> poll_hooks_;

    std::map<uint64_t, Root> roots_;
    std::vector<uint64_t> retired_;
    uint64_t next_root_id_{1};

    int job_depth_{0};
    std::string current_job_;

    mutable std::mutex inbox_mutex_;
    std::condition_variable inbox_cv_;
    std::deque<Job> inbox_;
    bool closed_{false};
    bool notified_{false};

    std::atomic<bool> stop_{false};
};

template <typename T>
std::future<T> Scheduler::start_root(std::string description, Async<T> work)
{
    auto promise = std::make_shared<std::promise<T>>();
    auto future = promise->get_future();
    adopt(std::move(description), detail::fulfil(std::move(work), std::move(promise)), true, {});
    return future;
}

template <typename T> T Scheduler::run_sync(std::string description, Async<T> work)
{
    check_blocking_allowed(description);
    std::future<T> future = start_root(description, std::move(work));
    if (!run_until([&future]
                   { return future.wait_for(std::chrono::seconds(0)) == std::future_status::ready; }))
    {
        throw SchedulerStopped("Scheduler stopped before [" + description + "] completed");
    }
    return future.get();
}

template <typename Fn>
auto Scheduler::submit(std::string description, Fn &&fn)
    -> std::future<async_value_t<std::invoke_result_t<std::decay_t<Fn> &>>>
{
    using R = std::invoke_result_t<std::decay_t<Fn> &>;
    using T = async_value_t<R>;
    if (is_home_thread())
    {
        throw std::logic_error("Scheduler::submit() called from the home thread for [" +
                               description + "]; call the operation directly");
    }

    auto promise = std::make_shared<std::promise<T>>();
    auto future = promise->get_future();

    Job job;
    job.description = description;
    job.run = [this, promise, description, fn = std::forward<Fn>(fn)]() mutable
    {
        if constexpr (is_async_v<R>)
        {
            Async<T> work;
            try
            {
                work = fn();
            }
            catch (...)
            {
                promise->set_exception(std::current_exception());
                return;
            }
            adopt(description, detail::fulfil(std::move(work), promise), true, {});
        }
        else
        {
            try
            {
                if constexpr (std::is_void_v<R>)
                {
                    fn();
                    promise->set_value();
                }
                else
                {
                    promise->set_value(fn());
                }
            }
            catch (...)
            {
                // Handed to the submitting thread through the future.
                promise->set_exception(std::current_exception());
            }
        }
    };
    job.cancel = [promise, description]()
    {
        promise->set_exception(
            std::make_exception_ptr(TaskCancelled("Cancelled before it ran: " + description)));
    };
    enqueue_external(std::move(job));
    return future;
}

} // namespace asyncmodules::core

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
