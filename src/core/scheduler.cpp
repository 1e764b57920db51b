#include "amod_core.hpp"

#include <algorithm>
#include <utility>

namespace asyncmodules::core
{

/// Marks the home thread as executing a job for the lifetime of the scope.
class Scheduler::JobScope
{
  public:
    JobScope(Scheduler &scheduler, const std::string &description)
        : scheduler_(scheduler), previous_(std::exchange(scheduler.current_job_, description))
    {
        ++scheduler_.job_depth_;
    }

    ~JobScope()
    {
        --scheduler_.job_depth_;
        scheduler_.current_job_ = std::move(previous_);
    }

    JobScope(const JobScope &) = delete;
    JobScope &operator=(const JobScope &) = delete;

  private:
    Scheduler &scheduler_;
    std::string previous_;
};

/// Parks the awaiting coroutine in the timer queue. Resumes with true once the deadline
/// passed, with false if the timer was cancelled or a stop was requested.
class Scheduler::SleepAwaiter
{
  public:
    SleepAwaiter(Scheduler &scheduler, Clock::time_point deadline)
        : scheduler_(scheduler), deadline_(deadline)
    {
    }

    bool await_ready() const noexcept
    {
        return scheduler_.stop_requested() || scheduler_.closed();
    }

    void await_suspend(std::coroutine_handle<> handle)
    {
        Job job;
        job.description = scheduler_.current_job_.empty() ? "sleep" : scheduler_.current_job_;
        job.run = [this, handle]
        {
            woken_ = true;
            handle.resume();
        };
        job.cancel = [handle] { handle.resume(); };
        scheduler_.add_timer(deadline_, std::move(job));
    }

    bool await_resume() const noexcept { return woken_ && !scheduler_.stop_requested(); }

  private:
    Scheduler &scheduler_;
    Clock::time_point deadline_;
    bool woken_{false};
};

Scheduler::Scheduler(std::chrono::milliseconds poll_interval)
    : poll_interval_(poll_interval.count() > 0 ? poll_interval : std::chrono::milliseconds(1)),
      home_(std::this_thread::get_id())
{
}

// Jobs and timers still queued are dropped without running or cancelling: their
// owners may already be gone. Detached coroutines are destroyed where they stand.
// Dropping a submit() job breaks its promise, which releases waiters.
Scheduler::~Scheduler() = default;

bool Scheduler::is_home_thread() const noexcept
{
    return home_ == std::this_thread::get_id();
}

void Scheduler::check_blocking_allowed(const std::string &description) const
{
    if (!is_home_thread())
    {
        throw std::logic_error(
            fmt::format("Scheduler: blocking wait for [{}] off the home thread", description));
    }
    if (in_job())
    {
        throw std::logic_error(fmt::format("Scheduler: blocking wait for [{}] inside job [{}]; "
                                           "co_await the operation instead",
                                           description, current_job_));
    }
}

void Scheduler::post(Job job)
{
    if (!is_home_thread())
    {
        throw std::logic_error("Scheduler::post() called off the home thread for [" +
                               job.description + "]");
    }
    if (closed())
    {
        cancel_job(job);
        return;
    }
    ready_.push_back(std::move(job));
}

void Scheduler::enqueue_external(Job job)
{
    {
        std::lock_guard<std::mutex> lock(inbox_mutex_);
        if (closed_)
        {
            throw SchedulerStopped("Scheduler no longer accepts work: " + job.description);
        }
        inbox_.push_back(std::move(job));
    }
    inbox_cv_.notify_all();
}

// ============================================================================
// Coroutines
// ============================================================================

void Scheduler::add_timer(Clock::time_point deadline, Job job)
{
    if (closed())
    {
        cancel_job(job);
        return;
    }
    // Equal deadlines keep insertion order.
    timers_.emplace(deadline, std::move(job));
}

void Scheduler::promote_due_timers()
{
    const auto now = Clock::now();
    while (!timers_.empty() && timers_.begin()->first <= now)
    {
        ready_.push_back(std::move(timers_.begin()->second));
        timers_.erase(timers_.begin());
    }
}

Async<bool> Scheduler::sleep(std::chrono::milliseconds duration)
{
    co_return co_await SleepAwaiter(*this, Clock::now() + duration);
}

void Scheduler::spawn(std::string description, Async<void> work, std::function<void()> on_cancel)
{
    adopt(std::move(description), std::move(work), false, std::move(on_cancel));
}

void Scheduler::adopt(std::string description, Async<void> work, bool start_now,
                      std::function<void()> on_cancel)
{
    const uint64_t id = next_root_id_++;
    Root &root = roots_[id];
    root.description = description;
    root.work = std::move(work);
    root.work.set_completion_hook([this, id] { retired_.push_back(id); });

    if (start_now)
    {
        {
            JobScope scope(*this, description);
            root.work.resume();
        }
        collect_retired_roots();
        return;
    }

    Job job;
    job.description = std::move(description);
    job.run = [this, id] { resume_root(id); };
    job.cancel = [this, id, on_cancel = std::move(on_cancel)]
    {
        roots_.erase(id);
        if (on_cancel)
        {
            on_cancel();
        }
    };
    post(std::move(job));
}

void Scheduler::resume_root(uint64_t id)
{
    auto it = roots_.find(id);
    if (it != roots_.end())
    {
        it->second.work.resume();
    }
}

void Scheduler::collect_retired_roots()
{
    for (uint64_t id : std::exchange(retired_, {}))
    {
        auto it = roots_.find(id);
        if (it == roots_.end())
        {
            continue;
        }
        if (auto error = it->second.work.exception())
        {
            try
            {
                std::rethrow_exception(error);
            }
            catch (const std::exception &e)
            {
                LOGGER_ERROR("Detached job [{}] failed: {}", it->second.description, e.what());
            }
            catch (...)
            {
                LOGGER_ERROR("Detached job [{}] failed with an unknown exception",
                             it->second.description);
            }
        }
        roots_.erase(it);
    }
}

bool Scheduler::run_to_completion(std::string description, Async<void> work)
{
    check_blocking_allowed(description);
    std::future<void> future = start_root(description, std::move(work));
    if (!run_until([&future]
                   { return future.wait_for(std::chrono::seconds(0)) == std::future_status::ready; }))
    {
        return false;
    }
    future.get();
    return true;
}

// ============================================================================
// Pumps
// ============================================================================

void Scheduler::service()
{
    {
        std::lock_guard<std::mutex> lock(inbox_mutex_);
        while (!inbox_.empty())
        {
            ready_.push_back(std::move(inbox_.front()));
            inbox_.pop_front();
        }
    }
    promote_due_timers();
    collect_retired_roots();

    if (basics::RecursionGuard::is_recursing(&poll_hooks_))
    {
        return;
    }
    basics::RecursionGuard guard(&poll_hooks_);
    JobScope scope(*this, "poll hook");
    // Index loop: a hook may register another hook.
    for (size_t i = 0; i < poll_hooks_.size(); ++i)
    {
        auto hook = poll_hooks_[i];
        hook();
    }
}

bool Scheduler::run_one()
{
    check_blocking_allowed("run_one");
    promote_due_timers();
    if (ready_.empty())
    {
        return false;
    }
    Job job = std::move(ready_.front());
    ready_.pop_front();
    {
        JobScope scope(*this, job.description);
        if (job.run)
        {
            job.run();
        }
    }
    collect_retired_roots();
    return true;
}

bool Scheduler::run_until(const std::function<bool()> &pred)
{
    return pump(pred, Clock::time_point::max());
}

bool Scheduler::sleep_for(std::chrono::milliseconds duration)
{
    const auto deadline = Clock::now() + duration;
    pump([deadline] { return Clock::now() >= deadline; }, deadline);
    return !stop_requested();
}

bool Scheduler::pump(const std::function<bool()> &pred, Clock::time_point deadline)
{
    check_blocking_allowed("pump");
    while (true)
    {
        if (pred())
        {
            return true;
        }
        if (stop_requested())
        {
            return false;
        }
        service();
        if (pred())
        {
            return true;
        }
        if (stop_requested())
        {
            return false;
        }
        if (run_one())
        {
            continue;
        }
        wait_for_work(deadline);
    }
}

void Scheduler::wait_for_work(Clock::time_point deadline)
{
    auto until = std::min(Clock::now() + poll_interval_, deadline);
    if (!timers_.empty())
    {
        until = std::min(until, timers_.begin()->first);
    }
    std::unique_lock<std::mutex> lock(inbox_mutex_);
    inbox_cv_.wait_until(lock, until,
                         [this] { return !inbox_.empty() || notified_ || stop_requested(); });
    notified_ = false;
}

// ============================================================================
// Control
// ============================================================================

void Scheduler::add_poll_hook(PollHook hook)
{
    poll_hooks_.push_back(std::move(hook));
}

void Scheduler::request_stop() noexcept
{
    stop_.store(true, std::memory_order_release);
    notify();
}

bool Scheduler::stop_requested() const noexcept
{
    return stop_.load(std::memory_order_acquire);
}

void Scheduler::notify() noexcept
{
    {
        std::lock_guard<std::mutex> lock(inbox_mutex_);
        notified_ = true;
    }
    inbox_cv_.notify_all();
}

bool Scheduler::closed() const noexcept
{
    std::lock_guard<std::mutex> lock(inbox_mutex_);
    return closed_;
}

void Scheduler::cancel_job(Job &job)
{
    LOGGER_WARN("Cancelling task [{}]", job.description);
    if (job.cancel)
    {
        JobScope scope(*this, job.description);
        job.cancel();
    }
}

size_t Scheduler::cancel_all()
{
    {
        std::lock_guard<std::mutex> lock(inbox_mutex_);
        closed_ = true;
        while (!inbox_.empty())
        {
            ready_.push_back(std::move(inbox_.front()));
            inbox_.pop_front();
        }
    }
    size_t cancelled = 0;
    // A cancel callback may resume a coroutine that posts follow-up work; post() and
    // add_timer() cancel such work directly now.
    while (!ready_.empty() || !timers_.empty())
    {
        Job job;
        if (!ready_.empty())
        {
            job = std::move(ready_.front());
            ready_.pop_front();
        }
        else
        {
            job = std::move(timers_.begin()->second);
            timers_.erase(timers_.begin());
        }
        cancel_job(job);
        ++cancelled;
    }
    collect_retired_roots();
    return cancelled;
}

} // namespace asyncmodules::core
