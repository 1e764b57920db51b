#pragma once
/**
 * @file module_manager.hpp
 * @brief ModuleManager: registration, dispatch, broadcasting and lifecycle of modules.
 *
 * ## Threading
 *
 * Everything the manager owns (registry, task sets, queue, exit flag) is touched
 * only on the scheduler's *home thread*: the thread that constructed the manager.
 * run() must be called on that thread too. Each public operation checks the calling
 * thread. On the home thread it runs directly; on any other thread it is submitted
 * to the scheduler and the caller blocks until it has run, receiving its result or
 * exception. A foreign call made before run() waits until run() starts pumping.
 * Once run() has returned, foreign calls throw SchedulerStopped.
 *
 * The blocking operations (exec_task, exec_task_async, broadcast_event,
 * call_method_async) are for code outside the manager's jobs. Module handlers run
 * inside jobs; they co_await the Module shorthands instead, and a blocking call from
 * a handler throws std::logic_error.
 *
 * ## Lifecycle
 *
 * @code
 *   ModuleManager manager(ManagerConfig::from_json(cfg));
 *   manager.register_module<Sensor>("sensor");
 *   manager.register_module<Logbook>("logbook");
 *   manager.run();   // startup, activate, serve, ... until on_exit completes
 * @endcode
 *
 * run() broadcasts `startup` then `activate` synchronously, then serves the event
 * queue. A broadcast of `on_exit` (usually `trigger_event("exit")`, or the first
 * SIGINT/SIGTERM) sets the exit flag and synchronously broadcasts `deactivate`,
 * `initiate_shutdown` and `finalize_shutdown`. run() returns once the queue is idle
 * and no task is running. A second signal forces the loop to stop; remaining
 * scheduled work is cancelled.
 */
#include "asyncmodules_export.h"
#include "core/manager_config.hpp"
#include "core/module.hpp"
#include "core/module_registry.hpp"

#include <memory>
#include <string>
#include <type_traits>

#include <nlohmann/json.hpp>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace asyncmodules::core
{

class Scheduler;
class TaskDispatcher;
class EventLoop;

class ASYNCMODULES_EXPORT ModuleManager
{
  public:
    explicit ModuleManager(ManagerConfig config = {});
    ~ModuleManager();

    ModuleManager(const ModuleManager &) = delete;
    ModuleManager &operator=(const ModuleManager &) = delete;

    // --- Registration ---

    /**
     * @brief Builds a module through @p factory and registers it as @p name.
     * Re-registering a name replaces the previous module in place.
     */
    ModulePtr register_module(const std::string &name, ModuleFactory factory);

    /** @brief Registers a `T(std::string name, FunctionReferences refs)`. */
    template <typename T>
    std::shared_ptr<T> register_module(const std::string &name)
    {
        static_assert(std::is_base_of_v<Module, T>, "T must derive from Module");
        ModulePtr module = register_module(
            name, [](const std::string &module_name, const FunctionReferences &refs) -> ModulePtr
            { return std::make_shared<T>(module_name, refs); });
        return std::static_pointer_cast<T>(module);
    }

    /** @brief false for unknown modules, otherwise the module's readiness. */
    [[nodiscard]] bool is_ready_module(const std::string &name);

    // --- Dispatch (safe from any thread) ---

    /**
     * @brief Calls `module.method` synchronously.
     * @return The method's result, or UnknownModule / ModuleNotReady / UnknownMethod.
     *         Exceptions thrown by the method propagate.
     */
    CallResult exec_task(const std::string &target, const Metadata &metadata,
                         const Kwargs &kwargs = Kwargs::object());

    /**
     * @brief Starts `module.method` as a tracked task.
     * @return false if the module is unknown or not ready.
     */
    bool exec_task_async(const std::string &target, const Metadata &metadata,
                         const Kwargs &kwargs = Kwargs::object());

    /**
     * @brief Delivers @p event to every module except the originator of @p metadata.
     *
     * Asynchronous delivery starts one task per module; synchronous delivery calls each
     * handler in registration order before returning. `on_exit` additionally runs the
     * shutdown stages.
     */
    void broadcast_event(const std::string &event, const Metadata &metadata,
                         bool asynchronous = true, const Kwargs &kwargs = Kwargs::object());

    /** @brief Queues @p target (`module.method` or an event name) for the event loop. */
    void enqueue_task(const std::string &target, const Metadata &metadata,
                      const Kwargs &kwargs = Kwargs::object());

    /** @brief Queues the event `on_<event>` for broadcast by the event loop. */
    void trigger_event(const std::string &event, const Metadata &metadata,
                       const Kwargs &kwargs = Kwargs::object());

    /** @brief Starts @p method of @p module as a tracked task, subject to admission control. */
    TaskPtr call_method_async(const ModulePtr &module, const std::string &method,
                              const Kwargs &kwargs = Kwargs::object(), bool log_unknown = true);

    /** @brief The references handed to every module factory. */
    [[nodiscard]] const FunctionReferences &function_references() const noexcept;

    /** @brief Provenance naming the manager ("modulemanager"). */
    [[nodiscard]] Metadata create_metadata() const;

    // --- Lifecycle ---

    /**
     * @brief Runs the module lifecycle on the home thread until exit.
     * @throws std::logic_error if called more than once, or from another thread.
     */
    void run();

    [[nodiscard]] bool is_running() const noexcept;
    [[nodiscard]] bool exit_requested() const noexcept;
    /** @brief True if run() ended because of a second interrupt. */
    [[nodiscard]] bool was_forced() const noexcept;

    // --- Collaborators (home thread) ---

    [[nodiscard]] Scheduler &scheduler() noexcept;
    [[nodiscard]] TaskDispatcher &dispatcher() noexcept;
    [[nodiscard]] const ModuleRegistry &registry() const noexcept;
    [[nodiscard]] EventLoop &event_loop() noexcept;
    [[nodiscard]] const ManagerConfig &config() const noexcept;

  private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace asyncmodules::core

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
