#include "amod_core.hpp"

namespace asyncmodules::core
{

TaskDispatcher::TaskDispatcher(Scheduler &scheduler, AdmissionPolicy policy)
    : scheduler_(scheduler), policy_(policy)
{
    sleeper_ = [this](std::chrono::milliseconds d) { return scheduler_.sleep(d); };
}

TaskDispatcher::~TaskDispatcher() = default;

void TaskDispatcher::set_capacity_source(CapacitySource source)
{
    capacity_source_ = std::move(source);
}

void TaskDispatcher::set_failure_sink(std::shared_ptr<FailureSink> sink)
{
    failure_sink_ = std::move(sink);
}

void TaskDispatcher::set_completion_observer(CompletionObserver observer)
{
    observer_ = std::move(observer);
}

void TaskDispatcher::set_sleeper(Sleeper sleeper)
{
    sleeper_ = std::move(sleeper);
}

size_t TaskDispatcher::capacity() const
{
    return capacity_source_ ? capacity_source_() : 0;
}

Async<bool> TaskDispatcher::wait_for_free_slot()
{
    if (running_.size() <= 2 * capacity())
    {
        co_return true;
    }
    LOGGER_INFO("Waiting for free slot before starting the next task");
    const auto schedule = policy_.schedule();
    for (int i = 0; running_.size() > capacity(); ++i)
    {
        const bool slept = co_await sleeper_(schedule.delay(i));
        if (!slept)
        {
            co_return false;
        }
        if (schedule.exhausted(i))
        {
            LOGGER_WARN("Starting the next task after a long wait; check reasons for long "
                        "running tasks");
            break;
        }
    }
    co_return true;
}

Async<TaskPtr> TaskDispatcher::spawn(std::string description, Task::Body body)
{
    // Proceeds after an aborted wait too; the scheduler cancels the start if it is closed.
    (void)co_await wait_for_free_slot();
    co_return track(std::move(description), std::move(body));
}

TaskPtr TaskDispatcher::track(std::string description, Task::Body body)
{
    auto task = Task::create(std::move(description), std::move(body));
    running_.emplace(task->id(), task);
    ++total_tracked_;
    task->add_done_callback([this](const TaskPtr &t) { on_task_done(t); });

    Scheduler::Job job;
    job.description = task->description();
    job.run = [task] { task->run(); };
    job.cancel = [task] { task->cancel(); };
    scheduler_.post(std::move(job));
    return task;
}

void TaskDispatcher::on_task_done(const TaskPtr &task)
{
    running_.erase(task->id());
    finished_.emplace(task->id(), task);

    if (task->state() == Task::State::Failed)
    {
        ++total_failed_;
        LOGGER_CRITICAL("Exception occurred in task [{}]: [{}]", task->description(),
                        task->failure_message());
        LOGGER_ERROR("Exception info:\n{}", task->failure_trace());
        if (failure_sink_)
        {
            (void)failure_sink_->append(*task);
        }
    }
    else if (task->state() == Task::State::Cancelled)
    {
        LOGGER_DEBUG("Task [{}] was cancelled before it started", task->description());
    }

    if (observer_)
    {
        observer_(task);
    }
}

GatherSummary TaskDispatcher::gather_finished_tasks()
{
    GatherSummary summary;
    for (const auto &[id, task] : finished_)
    {
        (void)id;
        ++summary.collected;
        if (task->state() == Task::State::Failed)
        {
            ++summary.failed;
        }
        else if (task->state() == Task::State::Cancelled)
        {
            ++summary.cancelled;
        }
    }
    finished_.clear();
    total_gathered_ += summary.collected;
    return summary;
}

bool TaskDispatcher::wait_for_running_tasks()
{
    return scheduler_.run_until([this] { return running_.empty(); });
}

bool TaskDispatcher::is_running(const TaskPtr &task) const
{
    return task && running_.count(task->id()) != 0;
}

bool TaskDispatcher::is_finished(const TaskPtr &task) const
{
    return task && finished_.count(task->id()) != 0;
}

} // namespace asyncmodules::core
