#pragma once
/**
 * @file signal_adapter.hpp
 * @brief SIGINT/SIGTERM handling reduced to an atomic counter.
 *
 * The installed handler is async-signal-safe: it only increments a process-wide
 * counter (and calls std::_Exit(1) on the third delivery). The ModuleManager polls
 * the counter from its scheduler thread and turns new deliveries into shutdown
 * steps. Only one adapter may be installed at a time.
 */
#include "asyncmodules_export.h"

#include <cstdint>

namespace asyncmodules::core
{

class ASYNCMODULES_EXPORT SignalAdapter
{
  public:
    /// Delivery count at which the handler terminates the process immediately.
    static constexpr int kHardExitCount = 3;

    SignalAdapter() = default;
    ~SignalAdapter();

    SignalAdapter(const SignalAdapter &) = delete;
    SignalAdapter &operator=(const SignalAdapter &) = delete;

    /**
     * @brief Installs the handlers and resets the counter.
     * @throws std::logic_error if another adapter is already installed.
     * @throws std::runtime_error if a handler could not be installed.
     */
    void install();

    /** @brief Restores the handlers that were active before install(). */
    void uninstall() noexcept;

    [[nodiscard]] bool installed() const noexcept { return installed_; }

    /** @brief Number of deliveries since the previous call. */
    [[nodiscard]] int take_new_signals() noexcept;

    /** @brief Total deliveries since install(). */
    [[nodiscard]] static int delivered_count() noexcept;

    /** @brief Number of the most recently delivered signal, 0 if none. */
    [[nodiscard]] static int last_signal() noexcept;

  private:
    bool installed_{false};
    int seen_{0};
    void (*previous_int_)(int){nullptr};
    void (*previous_term_)(int){nullptr};
};

} // namespace asyncmodules::core
