#include "amod_core.hpp"

namespace asyncmodules::core
{

EventLoop::EventLoop(Scheduler &scheduler, ItemProcessor processor, IdleCallback idle)
    : scheduler_(scheduler), processor_(std::move(processor)), idle_(std::move(idle))
{
}

void EventLoop::put(std::string target, Metadata metadata, nlohmann::json kwargs)
{
    queue_.push_back(QueueItem{std::move(target), std::move(metadata), std::move(kwargs)});
    if (drain_scheduled_)
    {
        return;
    }
    drain_scheduled_ = true;
    scheduler_.spawn("eventloop.drain", drain(), [this] { drain_scheduled_ = false; });
}

Async<void> EventLoop::drain()
{
    while (!queue_.empty() && !stopped())
    {
        QueueItem item = std::move(queue_.front());
        queue_.pop_front();
        ++processed_;
        try
        {
            co_await processor_(item);
        }
        catch (const std::exception &e)
        {
            LOGGER_ERROR("Processing of queue item [{}] failed: {}", item.target, e.what());
        }
        catch (...)
        {
            LOGGER_ERROR("Processing of queue item [{}] failed with an unknown exception",
                         item.target);
        }
    }
    drain_scheduled_ = false;
    idle_due_ = true;
}

bool EventLoop::idle_due() const noexcept
{
    return idle_due_ && queue_.empty() && !drain_scheduled_;
}

bool EventLoop::run()
{
    running_ = true;
    auto reset_running = basics::make_scope_guard([this] { running_ = false; });

    while (!stopped())
    {
        if (!scheduler_.run_until([this] { return stopped() || idle_due(); }))
        {
            return false;
        }
        if (stopped())
        {
            return false;
        }
        idle_due_ = false;
        if (idle_())
        {
            return true;
        }
    }
    return false;
}

void EventLoop::wake()
{
    idle_due_ = true;
    scheduler_.notify();
}

void EventLoop::stop()
{
    stop_.store(true, std::memory_order_release);
    scheduler_.notify();
}

} // namespace asyncmodules::core
