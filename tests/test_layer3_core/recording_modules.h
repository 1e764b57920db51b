// tests/test_layer3_core/recording_modules.h
#pragma once
/**
 * @file recording_modules.h
 * @brief Test modules that record every call they receive.
 *
 * RecordingModule handles the lifecycle stages by default and appends
 * "<module>:<method>" to a shared EventJournal, so tests can check ordering across
 * modules. Extra handlers are attached with on(); they are recorded before they run.
 *
 * Handlers given to on() receive the module and the kwargs, and may return nothing,
 * a JSON-convertible value or an `Async` (a coroutine lambda), as with
 * Module::register_method.
 */
#include "amod_core.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace asyncmodules::tests::helper
{

/** Ordered log shared by several modules. Home thread only. */
class EventJournal
{
  public:
    void add(std::string entry) { entries_.push_back(std::move(entry)); }
    [[nodiscard]] const std::vector<std::string> &entries() const noexcept { return entries_; }

    [[nodiscard]] size_t count(const std::string &entry) const;

    /** Index of the first occurrence, or -1. */
    [[nodiscard]] long first_index(const std::string &entry) const;
    /** Index of the last occurrence, or -1. */
    [[nodiscard]] long last_index(const std::string &entry) const;

  private:
    std::vector<std::string> entries_;
};

using JournalPtr = std::shared_ptr<EventJournal>;

class RecordingModule : public core::Module
{
  public:
    struct Call
    {
        std::string method;
        core::Kwargs kwargs;
        std::thread::id thread;
    };

    RecordingModule(std::string name, core::FunctionReferences refs, JournalPtr journal = nullptr);

    /** Records calls to @p method (without a body). */
    void listen(const std::string &method);

    /** Records calls to @p method, then runs @p handler. */
    template <typename Fn> void on(const std::string &method, Fn handler)
    {
        register_method(method,
                        [this, method, handler = std::move(handler)](const core::Kwargs &kw) mutable
                        {
                            record(method, kw);
                            return handler(*this, kw);
                        });
    }

    [[nodiscard]] const std::vector<Call> &calls() const noexcept { return calls_; }
    [[nodiscard]] size_t count(const std::string &method) const;

    void set_ready_state(bool ready) noexcept { set_ready(ready); }

    // The bound manager operations, opened up for test bodies.
    using core::Module::broadcast_event;
    using core::Module::enqueue_task;
    using core::Module::exec_task;
    using core::Module::exec_task_async;
    using core::Module::sleep_for;
    using core::Module::trigger_event;

    /**
     * @brief Factory for ModuleManager::register_module.
     * @param setup Called on the new module, e.g. to attach handlers with on().
     */
    static core::ModuleFactory factory(JournalPtr journal,
                                       std::function<void(RecordingModule &)> setup = {});

  private:
    void record(const std::string &method, const core::Kwargs &kwargs);

    JournalPtr journal_;
    std::vector<Call> calls_;
};

/** Lifecycle stages broadcast by the manager, in order. */
const std::vector<std::string> &lifecycle_stages();

/** A config suitable for in-process managers: no signal handlers, short poll interval. */
core::ManagerConfig in_process_config();

/**
 * @brief Drives a coroutine that never suspends and returns its result.
 *
 * For calling handlers directly in tests, without a scheduler.
 * @throws std::logic_error if the coroutine suspended.
 */
template <typename T> T complete_inline(core::Async<T> work)
{
    work.resume();
    if (!work.done())
    {
        throw std::logic_error("complete_inline: coroutine suspended");
    }
    return work.take_result();
}

/**
 * @brief Owns a ModuleManager that lives on, and runs on, a thread of its own.
 *
 * The manager is constructed on that thread, so it becomes its home thread; @p setup
 * runs there before run(), e.g. to register modules. The constructor returns once
 * run() has started. The destructor triggers `exit` if the manager is still running
 * and joins.
 */
class ManagerThread
{
  public:
    using Setup = std::function<void(core::ModuleManager &)>;

    explicit ManagerThread(Setup setup = {}, core::ManagerConfig config = in_process_config());
    ~ManagerThread();

    ManagerThread(const ManagerThread &) = delete;
    ManagerThread &operator=(const ManagerThread &) = delete;

    /** Requests exit from the calling thread and joins. */
    void stop();
    void join();

    [[nodiscard]] std::thread::id id() const noexcept { return thread_id_; }
    [[nodiscard]] core::ModuleManager &manager() noexcept { return *manager_; }

  private:
    std::unique_ptr<core::ModuleManager> manager_;
    std::thread thread_;
    std::thread::id thread_id_;
};

} // namespace asyncmodules::tests::helper
