#pragma once
/**
 * @file task_dispatcher.hpp
 * @brief Starts, tracks and retires asynchronous tasks on the scheduler.
 *
 * Every task is in exactly one of two disjoint sets from the moment it is tracked:
 * *running* until its completion callback fires, then *finished* until
 * gather_finished_tasks() collects it. Both sets are touched only on the scheduler's
 * home thread.
 *
 * Admission control: spawn() compares the running count with a capacity (the number
 * of registered modules). Above twice the capacity it suspends on a doubling
 * schedule while the count stays above the capacity, and proceeds regardless once
 * the schedule is exhausted. Waiting is advisory; it never blocks forever, and other
 * tasks keep running while it waits.
 */
#include "asyncmodules_export.h"
#include "core/async.hpp"
#include "core/task.hpp"
#include "utils/backoff_strategy.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace asyncmodules::core
{

class Scheduler;
class FailureSink;

/** @brief Delay schedule for admission waits. */
struct AdmissionPolicy
{
    std::chrono::milliseconds initial_delay{1};
    std::chrono::milliseconds max_delay{1000};

    [[nodiscard]] utils::DoublingBackoff schedule() const noexcept
    {
        return utils::DoublingBackoff(initial_delay, max_delay);
    }

    /** @brief Upper bound of a single admission wait. */
    [[nodiscard]] std::chrono::milliseconds ceiling() const noexcept { return schedule().total(); }
};

/** @brief Outcome counts of one gather_finished_tasks() pass. */
struct GatherSummary
{
    size_t collected{0};
    size_t failed{0};
    size_t cancelled{0};
};

class ASYNCMODULES_EXPORT TaskDispatcher
{
  public:
    using CapacitySource = std::function<size_t()>;
    /// Suspends for the given delay; completes with false to abort the wait.
    using Sleeper = std::function<Async<bool>(std::chrono::milliseconds)>;
    using CompletionObserver = std::function<void(const TaskPtr &)>;

    explicit TaskDispatcher(Scheduler &scheduler, AdmissionPolicy policy = {});
    ~TaskDispatcher();

    TaskDispatcher(const TaskDispatcher &) = delete;
    TaskDispatcher &operator=(const TaskDispatcher &) = delete;

    void set_capacity_source(CapacitySource source);
    void set_failure_sink(std::shared_ptr<FailureSink> sink);
    /** @brief Called on the home thread after every task completion is recorded. */
    void set_completion_observer(CompletionObserver observer);
    /** @brief Replaces the scheduler sleep used by admission waits. */
    void set_sleeper(Sleeper sleeper);

    /**
     * @brief Waits for admission, then tracks and schedules a task.
     * Home thread only.
     */
    Async<TaskPtr> spawn(std::string description, Task::Body body);

    /** @brief Tracks and schedules a task without admission control. */
    TaskPtr track(std::string description, Task::Body body);

    /**
     * @brief Applies the admission policy against the current running count.
     * @return true if the wait ended by the ceiling or a free slot, false on stop.
     */
    Async<bool> wait_for_free_slot();

    /** @brief Collects every finished task and clears the finished set. */
    GatherSummary gather_finished_tasks();

    /**
     * @brief Pumps the scheduler until no task is running. Blocking; not for use inside jobs.
     * @return false if a stop was requested first.
     */
    bool wait_for_running_tasks();

    [[nodiscard]] size_t running_count() const noexcept { return running_.size(); }
    [[nodiscard]] size_t finished_count() const noexcept { return finished_.size(); }
    [[nodiscard]] bool is_running(const TaskPtr &task) const;
    [[nodiscard]] bool is_finished(const TaskPtr &task) const;

    [[nodiscard]] uint64_t total_tracked() const noexcept { return total_tracked_; }
    [[nodiscard]] uint64_t total_failed() const noexcept { return total_failed_; }
    [[nodiscard]] uint64_t total_gathered() const noexcept { return total_gathered_; }

    [[nodiscard]] const AdmissionPolicy &policy() const noexcept { return policy_; }

  private:
    void on_task_done(const TaskPtr &task);
    [[nodiscard]] size_t capacity() const;

    Scheduler &scheduler_;
    AdmissionPolicy policy_;
    CapacitySource capacity_source_;
    std::shared_ptr<FailureSink> failure_sink_;
    CompletionObserver observer_;
    Sleeper sleeper_;

    std::map<uint64_t, TaskPtr> running_;
    std::map<uint64_t, TaskPtr> finished_;

    uint64_t total_tracked_{0};
    uint64_t total_failed_{0};
    uint64_t total_gathered_{0};
};

} // namespace asyncmodules::core

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
