/**
 * @file module_manager.cpp
 * @brief ModuleManager implementation.
 *
 * Every public operation has an `*_internal` counterpart in Impl that assumes the
 * home thread; the ones that may suspend are coroutines. `Impl::bridged()` either
 * runs it here (driving a coroutine with Scheduler::run_sync()) or marshals it
 * through Scheduler::submit() and waits.
 */
#include "amod_core.hpp"

#include <array>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

namespace asyncmodules::core
{

namespace
{
constexpr const char *kManagerSourceName = "modulemanager";
constexpr std::array<const char *, 3> kExitStages = {"deactivate", "initiate_shutdown",
                                                     "finalize_shutdown"};

Kwargs empty_kwargs()
{
    return Kwargs::object();
}

std::pair<std::string, std::string> split_target(const std::string &target)
{
    const auto [module_name, method] = format_tools::partition_first(target, '.');
    return {std::string(module_name), std::string(method)};
}

Async<nlohmann::json> invoke_method(ModulePtr module, std::string method, Kwargs kwargs,
                                    bool log_unknown)
{
    CallResult result = co_await module->call_method(method, kwargs, log_unknown);
    if (result.is_error())
    {
        co_return nlohmann::json();
    }
    co_return std::move(result).content();
}
} // namespace

struct ModuleManager::Impl
{
    Impl(ModuleManager *owner_in, ManagerConfig cfg);

    /// Runs @p fn here on the home thread, otherwise through Scheduler::submit().
    template <typename Fn> auto bridged(std::string description, Fn fn)
    {
        using R = std::invoke_result_t<Fn &>;
        if (scheduler.is_home_thread())
        {
            if constexpr (is_async_v<R>)
            {
                return scheduler.run_sync(std::move(description), fn());
            }
            else
            {
                return fn();
            }
        }
        return scheduler.submit(std::move(description), std::move(fn)).get();
    }

    Metadata create_metadata() const { return Metadata{owner, kManagerSourceName}; }

    utils::Result<ModulePtr, CallError> resolve_target(const std::string &module_name,
                                                       const std::string &target) const;

    Async<TaskPtr> call_method_async_internal(ModulePtr module, std::string method,
                                              Kwargs kwargs, bool log_unknown);
    Async<CallResult> exec_task_internal(std::string target, Metadata metadata, Kwargs kwargs);
    Async<bool> exec_task_async_internal(std::string target, Metadata metadata, Kwargs kwargs);
    Async<void> broadcast_event_internal(std::string event, Metadata metadata, bool asynchronous,
                                         Kwargs kwargs);
    void enqueue_task_internal(const std::string &target, const Metadata &metadata,
                               const Kwargs &kwargs);
    void trigger_event_internal(const std::string &target, const Metadata &metadata,
                                const Kwargs &kwargs);

    Async<void> process_item(QueueItem item);
    bool queue_empty();
    void poll_interrupts();
    void build_function_references();

    ModuleManager *owner;
    ManagerConfig config;
    Scheduler scheduler;
    TaskDispatcher dispatcher;
    ModuleRegistry registry;
    EventLoop event_loop;
    SignalAdapter signals;
    FunctionReferences refs;

    std::atomic<bool> exit{false};
    std::atomic<bool> forced{false};
    std::atomic<bool> running{false};
    bool started{false};
    int interrupts_seen{0};
};

ModuleManager::Impl::Impl(ModuleManager *owner_in, ManagerConfig cfg)
    : owner(owner_in), config(std::move(cfg)), scheduler(config.poll_interval),
      dispatcher(scheduler, config.admission),
      event_loop(
          scheduler, [this](const QueueItem &item) { return process_item(item); },
          [this] { return queue_empty(); })
{
    dispatcher.set_capacity_source([this] { return registry.size(); });
    if (config.exception_path)
    {
        dispatcher.set_failure_sink(std::make_shared<FailureSink>(*config.exception_path));
    }
    dispatcher.set_completion_observer(
        [this](const TaskPtr &)
        {
            if (exit.load(std::memory_order_acquire))
            {
                event_loop.wake();
            }
        });
    build_function_references();
}

void ModuleManager::Impl::build_function_references()
{
    ModuleManager *mgr = owner;
    refs.trigger_event = [mgr](const std::string &event, const Metadata &md, const Kwargs &kw)
    { mgr->trigger_event(event, md, kw); };
    refs.enqueue_task = [mgr](const std::string &target, const Metadata &md, const Kwargs &kw)
    { mgr->enqueue_task(target, md, kw); };
    refs.exec_task = [this](const std::string &target, const Metadata &md, const Kwargs &kw)
    { return exec_task_internal(target, md, kw); };
    refs.exec_task_async = [this](const std::string &target, const Metadata &md, const Kwargs &kw)
    { return exec_task_async_internal(target, md, kw); };
    refs.broadcast_event =
        [this](const std::string &event, const Metadata &md, bool asynchronous, const Kwargs &kw)
    { return broadcast_event_internal(event, md, asynchronous, kw); };
    refs.call_method_async = [this](const ModulePtr &module, const std::string &method,
                                    const Kwargs &kw, bool log_unknown)
    { return call_method_async_internal(module, method, kw, log_unknown); };
    refs.sleep_for = [this](std::chrono::milliseconds duration) { return scheduler.sleep(duration); };
}

// ============================================================================
// Internal operations (home thread)
// ============================================================================

utils::Result<ModulePtr, CallError>
ModuleManager::Impl::resolve_target(const std::string &module_name, const std::string &target) const
{
    ModulePtr module = registry.lookup(module_name);
    if (module == nullptr || !module->is_ready())
    {
        LOGGER_ERROR("Method module [{}] is in an inactive state or unknown module was tried to "
                     "be called",
                     target);
        return utils::Result<ModulePtr, CallError>::error(
            module == nullptr ? CallError::UnknownModule : CallError::ModuleNotReady);
    }
    return utils::Result<ModulePtr, CallError>::ok(std::move(module));
}

Async<TaskPtr> ModuleManager::Impl::call_method_async_internal(ModulePtr module,
                                                               std::string method, Kwargs kwargs,
                                                               bool log_unknown)
{
    if (!module)
    {
        throw std::invalid_argument("call_method_async: module must not be null");
    }
    LOGGER_DEBUG("Calling method asynchronously [{}.{}({})]", module->name(), method,
                 kwargs.dump());
    std::string description = module->name() + "." + method;
    Task::Body body = [module, method, kwargs, log_unknown]
    { return invoke_method(module, method, kwargs, log_unknown); };
    TaskPtr task = co_await dispatcher.spawn(std::move(description), std::move(body));
    co_return task;
}

Async<CallResult> ModuleManager::Impl::exec_task_internal(std::string target, Metadata metadata,
                                                          Kwargs kwargs)
{
    LOGGER_DEBUG("Executing task [{}({})] from [{}]", target, kwargs.dump(), metadata.source_name);
    const auto parts = split_target(target);
    auto resolved = resolve_target(parts.first, target);
    if (resolved.is_error())
    {
        co_return CallResult::error(resolved.error());
    }
    ModulePtr module = std::move(resolved).content();
    CallResult result = co_await module->call_method(parts.second, kwargs);
    co_return result;
}

Async<bool> ModuleManager::Impl::exec_task_async_internal(std::string target, Metadata metadata,
                                                          Kwargs kwargs)
{
    LOGGER_DEBUG("Executing task [{}({})] asynchronously from [{}]", target, kwargs.dump(),
                 metadata.source_name);
    const auto parts = split_target(target);
    auto resolved = resolve_target(parts.first, target);
    if (resolved.is_error())
    {
        co_return false;
    }
    ModulePtr module = std::move(resolved).content();
    (void)co_await call_method_async_internal(module, parts.second, kwargs, true);
    co_return true;
}

Async<void> ModuleManager::Impl::broadcast_event_internal(std::string event, Metadata metadata,
                                                          bool asynchronous, Kwargs kwargs)
{
    LOGGER_DEBUG("Broadcasting event [{}({})]", event, kwargs.dump());
    const std::vector<ModulePtr> modules = registry.snapshot();
    for (const ModulePtr &module : modules)
    {
        if (metadata.is_from(module.get()))
        {
            continue;
        }
        if (asynchronous)
        {
            (void)co_await call_method_async_internal(module, event, kwargs, false);
        }
        else
        {
            (void)co_await module->call_method(event, kwargs, false);
        }
    }

    if (event != "on_exit")
    {
        co_return;
    }
    if (exit.exchange(true, std::memory_order_acq_rel))
    {
        LOGGER_WARN("Exit is already in progress; shutdown stages are not run again");
        co_return;
    }
    LOGGER_INFO("Exit requested by [{}]; shutting down modules", metadata.source_name);
    event_loop.wake();
    for (const char *stage : kExitStages)
    {
        co_await broadcast_event_internal(stage, create_metadata(), false, empty_kwargs());
    }
}

void ModuleManager::Impl::enqueue_task_internal(const std::string &target,
                                                const Metadata &metadata, const Kwargs &kwargs)
{
    LOGGER_DEBUG("Enqueuing task [{}({})]", target, kwargs.dump());
    event_loop.put(target, metadata, kwargs);
}

void ModuleManager::Impl::trigger_event_internal(const std::string &target,
                                                 const Metadata &metadata, const Kwargs &kwargs)
{
    LOGGER_DEBUG("Triggering event target [{}({})]", target, kwargs.dump());
    event_loop.put(target, metadata, kwargs);
}

Async<void> ModuleManager::Impl::process_item(QueueItem item)
{
    if (item.target.find('.') != std::string::npos)
    {
        (void)co_await exec_task_async_internal(item.target, item.metadata, item.kwargs);
    }
    else
    {
        co_await broadcast_event_internal(item.target, item.metadata, true, item.kwargs);
    }
}

bool ModuleManager::Impl::queue_empty()
{
    const auto gathered = dispatcher.gather_finished_tasks();
    if (gathered.failed != 0)
    {
        LOGGER_DEBUG("Gathered {} finished tasks ({} failed)", gathered.collected, gathered.failed);
    }
    if (!scheduler.run_to_completion(
            "modulemanager.becoming_idle",
            broadcast_event_internal("becoming_idle", create_metadata(), true, empty_kwargs())))
    {
        return false;
    }
    if (!exit.load(std::memory_order_acquire))
    {
        return false;
    }
    if (!dispatcher.wait_for_running_tasks())
    {
        return false;
    }
    return dispatcher.running_count() == 0 && event_loop.empty();
}

void ModuleManager::Impl::poll_interrupts()
{
    const int fresh = signals.take_new_signals();
    if (fresh <= 0)
    {
        return;
    }
    const bool first = interrupts_seen == 0;
    interrupts_seen += fresh;
    if (first)
    {
        LOGGER_INFO("Interrupt received (signal {}). Exiting...", SignalAdapter::last_signal());
        (void)dispatcher.track("modulemanager.trigger_exit",
                               [this]
                               {
                                   trigger_event_internal("on_exit", create_metadata(),
                                                          empty_kwargs());
                                   return ready_async(nlohmann::json());
                               });
    }
    if (interrupts_seen >= 2 && !forced.exchange(true, std::memory_order_acq_rel))
    {
        LOGGER_WARN("Second interrupt received (signal {}). Forcing stop",
                    SignalAdapter::last_signal());
        event_loop.stop();
        scheduler.request_stop();
    }
}

// ============================================================================
// Public API
// ============================================================================

ModuleManager::ModuleManager(ManagerConfig config)
    : pImpl(std::make_unique<Impl>(this, std::move(config)))
{
}

ModuleManager::~ModuleManager() = default;

ModulePtr ModuleManager::register_module(const std::string &name, ModuleFactory factory)
{
    return pImpl->bridged("modulemanager.register_module",
                          [this, &name, &factory]
                          { return pImpl->registry.register_module(name, factory, pImpl->refs); });
}

bool ModuleManager::is_ready_module(const std::string &name)
{
    return pImpl->bridged("modulemanager.is_ready_module",
                          [this, &name] { return pImpl->registry.is_ready(name); });
}

CallResult ModuleManager::exec_task(const std::string &target, const Metadata &metadata,
                                    const Kwargs &kwargs)
{
    return pImpl->bridged(target, [this, target, metadata, kwargs]
                          { return pImpl->exec_task_internal(target, metadata, kwargs); });
}

bool ModuleManager::exec_task_async(const std::string &target, const Metadata &metadata,
                                    const Kwargs &kwargs)
{
    return pImpl->bridged(target, [this, target, metadata, kwargs]
                          { return pImpl->exec_task_async_internal(target, metadata, kwargs); });
}

void ModuleManager::broadcast_event(const std::string &event, const Metadata &metadata,
                                    bool asynchronous, const Kwargs &kwargs)
{
    pImpl->bridged("broadcast." + event,
                   [this, event, metadata, asynchronous, kwargs]
                   { return pImpl->broadcast_event_internal(event, metadata, asynchronous, kwargs); });
}

void ModuleManager::enqueue_task(const std::string &target, const Metadata &metadata,
                                 const Kwargs &kwargs)
{
    pImpl->bridged("enqueue." + target, [this, &target, &metadata, &kwargs]
                   { pImpl->enqueue_task_internal(target, metadata, kwargs); });
}

void ModuleManager::trigger_event(const std::string &event, const Metadata &metadata,
                                  const Kwargs &kwargs)
{
    const std::string target = "on_" + event;
    pImpl->bridged("trigger." + target, [this, &target, &metadata, &kwargs]
                   { pImpl->trigger_event_internal(target, metadata, kwargs); });
}

TaskPtr ModuleManager::call_method_async(const ModulePtr &module, const std::string &method,
                                         const Kwargs &kwargs, bool log_unknown)
{
    return pImpl->bridged("call_method_async." + method,
                          [this, module, method, kwargs, log_unknown] {
                              return pImpl->call_method_async_internal(module, method, kwargs,
                                                                       log_unknown);
                          });
}

const FunctionReferences &ModuleManager::function_references() const noexcept
{
    return pImpl->refs;
}

Metadata ModuleManager::create_metadata() const
{
    return pImpl->create_metadata();
}

void ModuleManager::run()
{
    auto &d = *pImpl;
    if (d.started)
    {
        throw std::logic_error("ModuleManager::run() may only be called once");
    }
    if (!d.scheduler.is_home_thread())
    {
        throw std::logic_error(
            "ModuleManager::run() must be called on the thread that constructed the manager");
    }
    d.started = true;
    d.running.store(true, std::memory_order_release);
    auto clear_running =
        basics::make_scope_guard([&d] { d.running.store(false, std::memory_order_release); });

    if (d.config.handle_signals)
    {
        d.signals.install();
    }
    auto restore_signals = basics::make_scope_guard([&d] { d.signals.uninstall(); });
    d.scheduler.add_poll_hook([&d] { d.poll_interrupts(); });

    // Runs first on the way out: nothing scheduled survives run().
    auto cancel_outstanding = basics::make_scope_guard(
        [&d]
        {
            const size_t cancelled = d.scheduler.cancel_all();
            if (cancelled != 0)
            {
                LOGGER_DEBUG("Cancelled {} outstanding scheduler jobs", cancelled);
            }
        });

    LOGGER_INFO("Module manager starting with {} modules", d.registry.size());
    const bool started_up =
        d.scheduler.run_to_completion(
            "modulemanager.startup",
            d.broadcast_event_internal("startup", d.create_metadata(), false, empty_kwargs())) &&
        d.scheduler.run_to_completion(
            "modulemanager.activate",
            d.broadcast_event_internal("activate", d.create_metadata(), false, empty_kwargs()));

    const bool completed = started_up && d.event_loop.run();

    d.dispatcher.gather_finished_tasks();
    LOGGER_INFO("Module manager stopped ({}); {} tasks tracked, {} failed",
                completed ? "all work finished" : "forced", d.dispatcher.total_tracked(),
                d.dispatcher.total_failed());
}

bool ModuleManager::is_running() const noexcept
{
    return pImpl->running.load(std::memory_order_acquire);
}

bool ModuleManager::exit_requested() const noexcept
{
    return pImpl->exit.load(std::memory_order_acquire);
}

bool ModuleManager::was_forced() const noexcept
{
    return pImpl->forced.load(std::memory_order_acquire);
}

Scheduler &ModuleManager::scheduler() noexcept
{
    return pImpl->scheduler;
}

TaskDispatcher &ModuleManager::dispatcher() noexcept
{
    return pImpl->dispatcher;
}

const ModuleRegistry &ModuleManager::registry() const noexcept
{
    return pImpl->registry;
}

EventLoop &ModuleManager::event_loop() noexcept
{
    return pImpl->event_loop;
}

const ManagerConfig &ModuleManager::config() const noexcept
{
    return pImpl->config;
}

} // namespace asyncmodules::core
