#include "amod_core.hpp"

#include <algorithm>

namespace asyncmodules::core
{

const char *to_string(CallError err) noexcept
{
    switch (err)
    {
    case CallError::UnknownModule:
        return "unknown module";
    case CallError::ModuleNotReady:
        return "module not ready";
    case CallError::UnknownMethod:
        return "unknown method";
    }
    return "unknown error";
}

Module::Module(std::string name, FunctionReferences refs)
    : name_(std::move(name)), refs_(std::move(refs))
{
}

Module::~Module() = default;

bool Module::has_method(const std::string &method) const
{
    return methods_.find(method) != methods_.end();
}

std::vector<std::string> Module::method_names() const
{
    std::vector<std::string> names;
    names.reserve(methods_.size());
    for (const auto &[method, handler] : methods_)
    {
        (void)handler;
        names.push_back(method);
    }
    std::sort(names.begin(), names.end());
    return names;
}

Async<CallResult> Module::call_method(std::string method, Kwargs kwargs, bool log_unknown)
{
    auto it = methods_.find(method);
    if (it == methods_.end())
    {
        if (log_unknown)
        {
            LOGGER_ERROR("Unknown method [{}] of module [{}] was called", method, name_);
        }
        co_return CallResult::error(CallError::UnknownMethod);
    }
    // The copy keeps the handler alive while it is suspended, even if it is re-registered.
    Handler handler = it->second;
    nlohmann::json value = co_await handler(kwargs);
    co_return CallResult::ok(std::move(value));
}

Metadata Module::create_metadata() const
{
    return Metadata{this, name_};
}

void Module::trigger_event(const std::string &event, const Kwargs &kwargs)
{
    refs_.trigger_event(event, create_metadata(), kwargs);
}

void Module::enqueue_task(const std::string &target, const Kwargs &kwargs)
{
    refs_.enqueue_task(target, create_metadata(), kwargs);
}

Async<CallResult> Module::exec_task(const std::string &target, const Kwargs &kwargs)
{
    return refs_.exec_task(target, create_metadata(), kwargs);
}

Async<bool> Module::exec_task_async(const std::string &target, const Kwargs &kwargs)
{
    return refs_.exec_task_async(target, create_metadata(), kwargs);
}

Async<void> Module::broadcast_event(const std::string &event, bool asynchronous,
                                    const Kwargs &kwargs)
{
    return refs_.broadcast_event(event, create_metadata(), asynchronous, kwargs);
}

Async<bool> Module::sleep_for(std::chrono::milliseconds duration)
{
    return refs_.sleep_for(duration);
}

} // namespace asyncmodules::core
