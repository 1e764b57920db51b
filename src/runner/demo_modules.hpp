#pragma once
/**
 * @file demo_modules.hpp
 * @brief Module catalogue of the asyncmodules-runner.
 *
 * | type      | behaviour                                                           |
 * |-----------|---------------------------------------------------------------------|
 * | `ticker`  | broadcasts `on_tick` every `interval_ms`; optional `exit_after` N   |
 * | `journal` | logs lifecycle stages and events; `entries` returns what it saw     |
 * | `faulty`  | `fail` throws; with `fail_every` N, every Nth tick throws           |
 */
#include "runner_config.hpp"

#include <string>
#include <vector>

namespace asyncmodules::runner
{

/**
 * @class TickerModule
 * @brief Starts a tick loop on `activate` that runs until `deactivate`.
 *
 * Options: `interval_ms` (default 1000), `exit_after` (0 = never).
 */
class TickerModule : public core::Module
{
  public:
    TickerModule(std::string name, core::FunctionReferences refs,
                 const nlohmann::json &options = nlohmann::json::object());

    [[nodiscard]] int ticks() const noexcept { return ticks_; }

  private:
    core::Async<void> tick_loop();

    std::chrono::milliseconds interval_;
    int exit_after_;
    int ticks_{0};
    bool stopping_{false};
};

/**
 * @class JournalModule
 * @brief Records every lifecycle stage and event it receives.
 */
class JournalModule : public core::Module
{
  public:
    JournalModule(std::string name, core::FunctionReferences refs,
                  const nlohmann::json &options = nlohmann::json::object());

    [[nodiscard]] const std::vector<std::string> &entries() const noexcept { return entries_; }

  private:
    void record(const std::string &what, const core::Kwargs &kwargs);

    std::vector<std::string> entries_;
    bool log_idle_;
};

/**
 * @class FaultyModule
 * @brief Throws on request so failure isolation can be observed.
 *
 * Options: `fail_every` (0 = never fail on ticks).
 */
class FaultyModule : public core::Module
{
  public:
    FaultyModule(std::string name, core::FunctionReferences refs,
                 const nlohmann::json &options = nlohmann::json::object());

  private:
    int fail_every_;
};

/** @brief Types known to make_module_factory(). */
std::vector<std::string> demo_module_types();

/**
 * @brief Factory building the module described by @p spec.
 * @throws std::runtime_error for an unknown type or invalid options.
 */
core::ModuleFactory make_module_factory(const ModuleSpec &spec);

/** @brief Registers every module of @p specs with @p manager, in order. */
void register_modules(core::ModuleManager &manager, const std::vector<ModuleSpec> &specs);

} // namespace asyncmodules::runner
