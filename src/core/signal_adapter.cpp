#include "amod_core.hpp"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <stdexcept>

namespace asyncmodules::core
{

namespace
{
std::atomic<int> g_signal_count{0};
std::atomic<int> g_last_signal{0};
std::atomic<bool> g_adapter_installed{false};

static_assert(std::atomic<int>::is_always_lock_free, "signal counter must be lock-free");

void signal_handler(int sig) noexcept
{
    g_last_signal.store(sig, std::memory_order_relaxed);
    if (g_signal_count.fetch_add(1, std::memory_order_acq_rel) + 1 >= SignalAdapter::kHardExitCount)
    {
        std::_Exit(1); // handler stuck in non-cooperative code
    }
}
} // namespace

SignalAdapter::~SignalAdapter()
{
    uninstall();
}

void SignalAdapter::install()
{
    if (installed_)
    {
        return;
    }
    bool expected = false;
    if (!g_adapter_installed.compare_exchange_strong(expected, true))
    {
        throw std::logic_error("A signal adapter is already installed in this process");
    }
    g_signal_count.store(0, std::memory_order_release);
    g_last_signal.store(0, std::memory_order_release);
    seen_ = 0;

    previous_int_ = std::signal(SIGINT, signal_handler);
    previous_term_ = std::signal(SIGTERM, signal_handler);
    if (previous_int_ == SIG_ERR || previous_term_ == SIG_ERR)
    {
        if (previous_int_ != SIG_ERR)
        {
            (void)std::signal(SIGINT, previous_int_);
        }
        if (previous_term_ != SIG_ERR)
        {
            (void)std::signal(SIGTERM, previous_term_);
        }
        g_adapter_installed.store(false, std::memory_order_release);
        throw std::runtime_error("Failed to install SIGINT/SIGTERM handlers");
    }
    installed_ = true;
    LOGGER_DEBUG("Signal handlers installed for SIGINT and SIGTERM");
}

void SignalAdapter::uninstall() noexcept
{
    if (!installed_)
    {
        return;
    }
    (void)std::signal(SIGINT, previous_int_ != nullptr ? previous_int_ : SIG_DFL);
    (void)std::signal(SIGTERM, previous_term_ != nullptr ? previous_term_ : SIG_DFL);
    installed_ = false;
    g_adapter_installed.store(false, std::memory_order_release);
}

int SignalAdapter::take_new_signals() noexcept
{
    const int total = g_signal_count.load(std::memory_order_acquire);
    const int fresh = total - seen_;
    seen_ = total;
    return fresh;
}

int SignalAdapter::delivered_count() noexcept
{
    return g_signal_count.load(std::memory_order_acquire);
}

int SignalAdapter::last_signal() noexcept
{
    return g_last_signal.load(std::memory_order_acquire);
}

} // namespace asyncmodules::core
