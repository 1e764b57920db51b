#pragma once
/**
 * @file scope_guard.hpp
 * @brief RAII guard that executes a callable on scope exit.
 *
 * Used for teardown paths that must run whether a loop exits normally, through a
 * forced stop, or by exception: restoring signal dispositions, cancelling pending
 * scheduler jobs, and clearing "running" flags.
 */
#include <concepts>
#include <cstdio>
#include <exception>
#include <functional>
#include <type_traits>
#include <utility>

#include <fmt/format.h>

namespace asyncmodules::basics
{

/**
 * @class ScopeGuard
 * @brief Executes a callable when the guard goes out of scope unless dismissed.
 *
 * Movable but not copyable. The callable should not throw: the destructor is
 * `noexcept` and reports a `std::exception` escaping the callable to stderr instead
 * of propagating it.
 *
 * @code
 *  auto restore = asyncmodules::basics::make_scope_guard([&] { adapter.uninstall(); });
 *  run_loop();
 * @endcode
 */
template <typename Callable>
requires std::invocable<Callable &>
class ScopeGuard
{
  public:
    static_assert(!std::is_reference_v<Callable>, "ScopeGuard cannot hold a reference to a callable.");

    [[nodiscard]] explicit operator bool() const noexcept { return m_active; }

    explicit ScopeGuard(Callable fn) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_func(std::move(fn))
    {
    }

    ScopeGuard(ScopeGuard &&other) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_func(std::move(other.m_func)), m_active(other.m_active)
    {
        other.dismiss();
    }

    ~ScopeGuard() noexcept { invoke(); }

    ScopeGuard(const ScopeGuard &) = delete;
    ScopeGuard &operator=(const ScopeGuard &) = delete;
    ScopeGuard &operator=(ScopeGuard &&) = delete;

    /** Deactivates the guard. */
    constexpr void dismiss() noexcept { m_active = false; }

    /**
     * @brief Runs the callable now (once) and dismisses the guard.
     */
    void invoke() noexcept
    {
        if (m_active)
        {
            m_active = false;
            try
            {
                std::invoke(m_func);
            }
            catch (const std::exception &e)
            {
                fmt::print(stderr, "[ScopeGuard] cleanup action threw: {}\n", e.what());
            }
        }
    }

    /**
     * @brief Runs the callable now and lets any exception propagate.
     */
    void invoke_and_rethrow()
    {
        if (m_active)
        {
            m_active = false;
            std::invoke(m_func);
        }
    }

  private:
    Callable m_func;
    bool m_active{true};
};

/**
 * @brief Creates a ScopeGuard holding a decayed copy of @p f.
 */
template <typename F> auto make_scope_guard(F &&f) -> ScopeGuard<std::decay_t<F>>
{
    return ScopeGuard<std::decay_t<F>>(std::forward<F>(f));
}

} // namespace asyncmodules::basics
