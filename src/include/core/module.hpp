#pragma once
/**
 * @file module.hpp
 * @brief Base class for modules hosted by the ModuleManager.
 *
 * A module exposes an explicit capability table: method and event names mapped to
 * handlers taking keyword arguments (a JSON object) and returning a JSON value.
 * Derived classes populate the table in their constructor. A handler is either a
 * plain callable or a coroutine returning `Async<...>`; only coroutine handlers may
 * suspend (sleep, or await a synchronous call on another module):
 *
 * @code
 * class Sensor : public Module
 * {
 *   public:
 *     Sensor(std::string name, FunctionReferences refs) : Module(std::move(name), std::move(refs))
 *     {
 *         register_method("read", [this](const Kwargs &) { return nlohmann::json(read()); });
 *         register_method("poll", [this](const Kwargs &kw) { return poll(kw.value("n", 1)); });
 *     }
 *
 *   private:
 *     Async<void> poll(int rounds)
 *     {
 *         for (int i = 0; i < rounds && co_await sleep_for(std::chrono::milliseconds(100)); ++i)
 *             co_await broadcast_event("on_sample", true, {{"value", read()}});
 *     }
 * };
 * @endcode
 *
 * Lifecycle stages (`startup`, `activate`, `deactivate`, `initiate_shutdown`,
 * `finalize_shutdown`) and `becoming_idle` are delivered as ordinary methods of those
 * names; a module that does not register them simply does not receive them.
 */
#include "asyncmodules_export.h"
#include "core/async.hpp"
#include "core/metadata.hpp"
#include "core/task.hpp"
#include "utils/result.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace asyncmodules::core
{

class Module;
using ModulePtr = std::shared_ptr<Module>;
using Kwargs = nlohmann::json;

/** @brief Expected failures of a synchronous method call. */
enum class CallError
{
    UnknownModule,
    ModuleNotReady,
    UnknownMethod
};

ASYNCMODULES_EXPORT const char *to_string(CallError err) noexcept;

using CallResult = utils::Result<nlohmann::json, CallError>;

/**
 * @struct FunctionReferences
 * @brief The manager operations a module may call, bound at registration.
 *
 * `trigger_event` and `enqueue_task` are safe to call from any thread; calls from
 * foreign threads are marshalled onto the scheduler thread and block until they
 * complete. The entries returning `Async` are awaited by handlers, which always run
 * on the scheduler thread.
 */
struct FunctionReferences
{
    std::function<void(const std::string &event, const Metadata &, const Kwargs &)> trigger_event;
    std::function<void(const std::string &target, const Metadata &, const Kwargs &)> enqueue_task;
    std::function<Async<CallResult>(const std::string &target, const Metadata &, const Kwargs &)>
        exec_task;
    std::function<Async<bool>(const std::string &target, const Metadata &, const Kwargs &)>
        exec_task_async;
    std::function<Async<void>(const std::string &event, const Metadata &, bool asynchronous,
                              const Kwargs &)>
        broadcast_event;
    std::function<Async<TaskPtr>(const ModulePtr &, const std::string &method, const Kwargs &,
                                 bool log_unknown)>
        call_method_async;
    /// Completes with false if the manager is being force-stopped.
    std::function<Async<bool>(std::chrono::milliseconds)> sleep_for;
};

namespace detail
{

inline Async<nlohmann::json> as_json(Async<void> work)
{
    co_await std::move(work);
    co_return nlohmann::json();
}

template <typename T> Async<nlohmann::json> as_json(Async<T> work)
{
    co_return nlohmann::json(co_await std::move(work));
}

} // namespace detail

class ASYNCMODULES_EXPORT Module : public std::enable_shared_from_this<Module>
{
  public:
    using Handler = std::function<Async<nlohmann::json>(const Kwargs &)>;

    Module(std::string name, FunctionReferences refs);
    virtual ~Module();

    Module(const Module &) = delete;
    Module &operator=(const Module &) = delete;

    [[nodiscard]] const std::string &name() const noexcept { return name_; }

    /** @brief Whether the module accepts direct method calls. */
    [[nodiscard]] virtual bool is_ready() const noexcept { return ready_; }

    /**
     * @brief Adds or replaces a handler.
     *
     * A callable returning void (or `Async<void>`) yields a null result. A plain
     * callable runs to completion when called; an `Async` one may suspend.
     */
    template <typename Fn>
    void register_method(const std::string &method, Fn &&fn)
    {
        using R = std::invoke_result_t<std::decay_t<Fn> &, const Kwargs &>;
        if constexpr (std::is_same_v<R, Async<nlohmann::json>>)
        {
            methods_[method] = [f = std::forward<Fn>(fn)](const Kwargs &kwargs) mutable
            { return f(kwargs); };
        }
        else if constexpr (is_async_v<R>)
        {
            methods_[method] = [f = std::forward<Fn>(fn)](const Kwargs &kwargs) mutable
            { return detail::as_json(f(kwargs)); };
        }
        else if constexpr (std::is_void_v<R>)
        {
            methods_[method] = [f = std::forward<Fn>(fn)](const Kwargs &kwargs) mutable
            {
                f(kwargs);
                return ready_async(nlohmann::json());
            };
        }
        else
        {
            methods_[method] = [f = std::forward<Fn>(fn)](const Kwargs &kwargs) mutable
            { return ready_async(nlohmann::json(f(kwargs))); };
        }
    }

    [[nodiscard]] bool has_method(const std::string &method) const;
    [[nodiscard]] std::vector<std::string> method_names() const;

    /**
     * @brief Invokes a registered handler.
     *
     * Unknown methods yield `CallError::UnknownMethod` (logged as an error when
     * @p log_unknown is true). Exceptions thrown by the handler propagate.
     */
    Async<CallResult> call_method(std::string method, Kwargs kwargs, bool log_unknown = true);

    /** @brief Fresh provenance naming this module. */
    [[nodiscard]] Metadata create_metadata() const;

  protected:
    void set_ready(bool ready) noexcept { ready_ = ready; }

    [[nodiscard]] const FunctionReferences &refs() const noexcept { return refs_; }

    // Shorthands for the bound manager operations, stamped with this module's metadata.
    void trigger_event(const std::string &event, const Kwargs &kwargs = Kwargs::object());
    void enqueue_task(const std::string &target, const Kwargs &kwargs = Kwargs::object());
    Async<CallResult> exec_task(const std::string &target, const Kwargs &kwargs = Kwargs::object());
    Async<bool> exec_task_async(const std::string &target, const Kwargs &kwargs = Kwargs::object());
    Async<void> broadcast_event(const std::string &event, bool asynchronous = true,
                                const Kwargs &kwargs = Kwargs::object());
    Async<bool> sleep_for(std::chrono::milliseconds duration);

  private:
    std::string name_;
    FunctionReferences refs_;
    bool ready_{true};
    std::unordered_map<std::string, Handler> methods_;
};

} // namespace asyncmodules::core

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
