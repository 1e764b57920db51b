/**
 * @file demo_modules.cpp
 * @brief Demo modules of the runner catalogue.
 */
#include "demo_modules.hpp"

#include <stdexcept>

namespace asyncmodules::runner
{

namespace
{

int option_int(const nlohmann::json &options, const char *key, int fallback, const std::string &type)
{
    if (!options.contains(key))
        return fallback;
    const auto &v = options[key];
    if (!v.is_number_integer() || v.get<int>() < 0)
        throw std::runtime_error(fmt::format(
            "Runner config: option '{}' of a '{}' module must be a non-negative integer", key,
            type));
    return v.get<int>();
}

} // anonymous namespace

// ============================================================================
// TickerModule
// ============================================================================

TickerModule::TickerModule(std::string name, core::FunctionReferences refs,
                           const nlohmann::json &options)
    : Module(std::move(name), std::move(refs)),
      interval_(option_int(options, "interval_ms", 1000, "ticker")),
      exit_after_(option_int(options, "exit_after", 0, "ticker"))
{
    if (interval_.count() == 0)
        throw std::runtime_error("Runner config: option 'interval_ms' of a 'ticker' module must be > 0");

    register_method("activate", [this](const core::Kwargs &)
                    { return exec_task_async(this->name() + ".tick_loop"); });
    register_method("tick_loop", [this](const core::Kwargs &) { return tick_loop(); });
    register_method("deactivate", [this](const core::Kwargs &) { stopping_ = true; });
    register_method("ticks", [this](const core::Kwargs &) { return ticks_; });
}

core::Async<void> TickerModule::tick_loop()
{
    LOGGER_INFO("[{}] ticking every {} ms", name(), interval_.count());
    while (!stopping_)
    {
        if (!co_await sleep_for(interval_))
        {
            break;
        }
        if (stopping_)
        {
            break;
        }
        ++ticks_;
        const core::Kwargs tick_kwargs = {{"count", ticks_}, {"source", name()}};
        co_await broadcast_event("on_tick", true, tick_kwargs);
        if (exit_after_ > 0 && ticks_ >= exit_after_)
        {
            LOGGER_INFO("[{}] reached {} ticks; requesting exit", name(), ticks_);
            trigger_event("exit");
            break;
        }
    }
}

// ============================================================================
// JournalModule
// ============================================================================

JournalModule::JournalModule(std::string name, core::FunctionReferences refs,
                             const nlohmann::json &options)
    : Module(std::move(name), std::move(refs)),
      log_idle_(options.value("log_idle", false))
{
    for (const char *stage :
         {"startup", "activate", "deactivate", "initiate_shutdown", "finalize_shutdown", "on_exit",
          "on_tick"})
    {
        const std::string what = stage;
        register_method(what, [this, what](const core::Kwargs &kw) { record(what, kw); });
    }
    register_method("becoming_idle",
                    [this](const core::Kwargs &kw)
                    {
                        if (log_idle_)
                            record("becoming_idle", kw);
                    });
    register_method("entries", [this](const core::Kwargs &) { return nlohmann::json(entries_); });
}

void JournalModule::record(const std::string &what, const core::Kwargs &kwargs)
{
    entries_.push_back(what);
    if (kwargs.empty())
        LOGGER_INFO("[{}] {}", name(), what);
    else
        LOGGER_INFO("[{}] {} {}", name(), what, kwargs.dump());
}

// ============================================================================
// FaultyModule
// ============================================================================

FaultyModule::FaultyModule(std::string name, core::FunctionReferences refs,
                           const nlohmann::json &options)
    : Module(std::move(name), std::move(refs)),
      fail_every_(option_int(options, "fail_every", 0, "faulty"))
{
    register_method("fail",
                    [](const core::Kwargs &kw) -> nlohmann::json
                    {
                        throw std::runtime_error(
                            kw.value("message", std::string("failure requested")));
                    });
    register_method("on_tick",
                    [this](const core::Kwargs &kw)
                    {
                        const int count = kw.value("count", 0);
                        if (fail_every_ > 0 && count > 0 && count % fail_every_ == 0)
                            throw std::runtime_error(fmt::format("tick {} rejected", count));
                    });
}

// ============================================================================
// Catalogue
// ============================================================================

std::vector<std::string> demo_module_types()
{
    return {"ticker", "journal", "faulty"};
}

core::ModuleFactory make_module_factory(const ModuleSpec &spec)
{
    const nlohmann::json options = spec.options;
    if (spec.type == "ticker")
        return [options](const std::string &name, const core::FunctionReferences &refs)
        { return std::make_shared<TickerModule>(name, refs, options); };
    if (spec.type == "journal")
        return [options](const std::string &name, const core::FunctionReferences &refs)
        { return std::make_shared<JournalModule>(name, refs, options); };
    if (spec.type == "faulty")
        return [options](const std::string &name, const core::FunctionReferences &refs)
        { return std::make_shared<FaultyModule>(name, refs, options); };
    throw std::runtime_error("Runner config: unknown module type '" + spec.type + "' for module '" +
                             spec.name + "'");
}

void register_modules(core::ModuleManager &manager, const std::vector<ModuleSpec> &specs)
{
    for (const auto &spec : specs)
    {
        manager.register_module(spec.name, make_module_factory(spec));
    }
}

} // namespace asyncmodules::runner
