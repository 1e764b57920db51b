#pragma once
/**
 * @file event_loop.hpp
 * @brief FIFO queue of targets plus the loop that drains it on the scheduler.
 *
 * Items are processed by a detached scheduler coroutine ("drain") that `put()` starts
 * when none is pending. The drain empties the whole queue in FIFO order, so queued
 * items interleave with running tasks instead of waiting for them: a task that sleeps
 * lets the queue make progress. An item whose processing suspends (an admission
 * wait) holds back later items, never other tasks.
 *
 * `run()` pumps the scheduler and, each time the queue has drained, invokes the idle
 * callback from outside any job, so the callback may block on the scheduler. The loop
 * ends when the idle callback returns true or `stop()` is called. An exception
 * escaping the processor is logged and the drain moves on to the next item.
 * Once the idle callback has returned false, it is invoked again only after the next
 * drain or an explicit `wake()`.
 */
#include "asyncmodules_export.h"
#include "core/async.hpp"
#include "core/metadata.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <string>

#include <nlohmann/json.hpp>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace asyncmodules::core
{

class Scheduler;

struct QueueItem
{
    std::string target;
    Metadata metadata;
    nlohmann::json kwargs;
};

class ASYNCMODULES_EXPORT EventLoop
{
  public:
    using ItemProcessor = std::function<Async<void>(const QueueItem &)>;
    /// Returns true to end the loop.
    using IdleCallback = std::function<bool()>;

    EventLoop(Scheduler &scheduler, ItemProcessor processor, IdleCallback idle);

    EventLoop(const EventLoop &) = delete;
    EventLoop &operator=(const EventLoop &) = delete;

    /** @brief Appends an item and schedules a drain. Home thread only. */
    void put(std::string target, Metadata metadata, nlohmann::json kwargs);

    /**
     * @brief Runs until the idle callback reports completion or stop() is called.
     * @return true if the idle callback ended the loop.
     */
    bool run();

    /** @brief Makes the loop consult the idle callback again. */
    void wake();

    /** @brief Ends run() at the next opportunity. Pending items stay queued. */
    void stop();

    [[nodiscard]] bool empty() const noexcept { return queue_.empty(); }
    [[nodiscard]] size_t size() const noexcept { return queue_.size(); }
    [[nodiscard]] uint64_t processed() const noexcept { return processed_; }
    [[nodiscard]] bool is_running() const noexcept { return running_; }
    [[nodiscard]] bool stopped() const noexcept { return stop_.load(std::memory_order_acquire); }

  private:
    Async<void> drain();
    [[nodiscard]] bool idle_due() const noexcept;

    Scheduler &scheduler_;
    ItemProcessor processor_;
    IdleCallback idle_;

    std::deque<QueueItem> queue_;
    bool drain_scheduled_{false};
    bool idle_due_{true};
    bool running_{false};
    uint64_t processed_{0};
    std::atomic<bool> stop_{false};
};

} // namespace asyncmodules::core

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
