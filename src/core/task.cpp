#include "amod_core.hpp"

#include <atomic>
#include <stdexcept>

namespace asyncmodules::core
{

namespace
{
std::atomic<uint64_t> g_next_task_id{1};
} // namespace

TaskPtr Task::create(std::string description, Body body)
{
    return TaskPtr(new Task(std::move(description), std::move(body)));
}

Task::Task(std::string description, Body body)
    : id_(g_next_task_id.fetch_add(1, std::memory_order_relaxed)),
      description_(std::move(description)), body_(std::move(body))
{
}

bool Task::done() const noexcept
{
    return state_ == State::Finished || state_ == State::Failed || state_ == State::Cancelled;
}

void Task::run()
{
    if (state_ != State::Pending)
    {
        return;
    }
    state_ = State::Running;
    auto self = shared_from_this();
    try
    {
        coroutine_ = body_();
    }
    catch (...)
    {
        // A body that throws before producing its coroutine fails like one that throws inside it.
        record_failure(std::current_exception());
        body_ = nullptr;
        finish(State::Failed);
        return;
    }
    coroutine_.set_completion_hook([this] { complete(); });
    coroutine_.resume();
}

void Task::complete()
{
    State final_state = State::Finished;
    if (auto error = coroutine_.exception())
    {
        record_failure(error);
        final_state = State::Failed;
    }
    else
    {
        result_ = coroutine_.take_result();
    }
    // Release captured state (module pointers, kwargs) as soon as the body is done.
    body_ = nullptr;
    finish(final_state);
}

void Task::record_failure(std::exception_ptr error)
{
    error_ = error;
    try
    {
        std::rethrow_exception(error);
    }
    catch (const std::exception &e)
    {
        failure_message_ = e.what();
    }
    catch (...)
    {
        failure_message_ = "unknown exception";
    }
    failure_trace_ = debug::format_stack_trace();
}

bool Task::cancel()
{
    if (state_ != State::Pending)
    {
        return false;
    }
    body_ = nullptr;
    finish(State::Cancelled);
    return true;
}

void Task::finish(State final_state)
{
    state_ = final_state;
    auto self = shared_from_this();
    auto callbacks = std::move(callbacks_);
    callbacks_.clear();
    for (auto &cb : callbacks)
    {
        cb(self);
    }
}

void Task::add_done_callback(DoneCallback cb)
{
    if (done())
    {
        cb(shared_from_this());
        return;
    }
    callbacks_.push_back(std::move(cb));
}

const nlohmann::json &Task::result() const
{
    if (state_ == State::Failed)
    {
        std::rethrow_exception(error_);
    }
    if (state_ != State::Finished)
    {
        throw std::logic_error(
            fmt::format("Task [{}] has no result in state {}", description_, state_to_string(state_)));
    }
    return result_;
}

const char *Task::state_to_string(State state) noexcept
{
    switch (state)
    {
    case State::Pending:
        return "pending";
    case State::Running:
        return "running";
    case State::Finished:
        return "finished";
    case State::Failed:
        return "failed";
    case State::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

} // namespace asyncmodules::core
