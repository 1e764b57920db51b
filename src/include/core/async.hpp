#pragma once
/**
 * @file async.hpp
 * @brief Async<T>: the lazily started coroutine type of every suspendable operation.
 *
 * An `Async<T>` does nothing until it is awaited or resumed. Awaiting it from another
 * coroutine starts it and transfers control back to the awaiter when it finishes,
 * delivering its value or rethrowing its exception:
 *
 * @code
 * Async<int> answer(Scheduler &s)
 * {
 *     co_await s.sleep(std::chrono::milliseconds(10));
 *     co_return 42;
 * }
 *
 * Async<void> report(Scheduler &s)
 * {
 *     const int value = co_await answer(s);
 *     LOGGER_INFO("answer is {}", value);
 * }
 * @endcode
 *
 * A coroutine that is not awaited by another one is a *root*; the Scheduler and Task
 * drive roots through resume() and learn about completion through the completion hook.
 *
 * Coroutine functions should take their parameters by value: the frame outlives the
 * caller's full expression, references into it do not.
 */
#include <coroutine>
#include <exception>
#include <functional>
#include <optional>
#include <type_traits>
#include <utility>

namespace asyncmodules::core
{

template <typename T = void> class Async;

namespace detail
{

struct AsyncPromiseBase
{
    struct FinalAwaiter
    {
        bool await_ready() const noexcept { return false; }

        template <typename Promise>
        std::coroutine_handle<> await_suspend(std::coroutine_handle<Promise> handle) noexcept
        {
            auto &promise = handle.promise();
            std::coroutine_handle<> next =
                promise.continuation ? promise.continuation : std::noop_coroutine();
            // The hook may destroy this frame; nothing below touches it.
            auto hook = std::move(promise.on_complete);
            if (hook)
            {
                hook();
            }
            return next;
        }

        void await_resume() const noexcept {}
    };

    std::suspend_always initial_suspend() const noexcept { return {}; }
    FinalAwaiter final_suspend() const noexcept { return {}; }
    void unhandled_exception() noexcept { error = std::current_exception(); }

    std::coroutine_handle<> continuation;
    std::exception_ptr error;
    std::function<void()> on_complete;
};

template <typename T> struct AsyncPromise : AsyncPromiseBase
{
    Async<T> get_return_object() noexcept;

    void return_value(T v) { value.emplace(std::move(v)); }

    T take()
    {
        if (error)
        {
            std::rethrow_exception(error);
        }
        return std::move(*value);
    }

    std::optional<T> value;
};

template <> struct AsyncPromise<void> : AsyncPromiseBase
{
    Async<void> get_return_object() noexcept;

    void return_void() noexcept {}

    void take()
    {
        if (error)
        {
            std::rethrow_exception(error);
        }
    }
};

} // namespace detail

template <typename T> class [[nodiscard]] Async
{
  public:
    using promise_type = detail::AsyncPromise<T>;
    using handle_type = std::coroutine_handle<promise_type>;
    using value_type = T;

    Async() noexcept = default;
    explicit Async(handle_type handle) noexcept : handle_(handle) {}

    Async(Async &&other) noexcept : handle_(std::exchange(other.handle_, {})) {}
    Async &operator=(Async &&other) noexcept
    {
        if (this != &other)
        {
            reset();
            handle_ = std::exchange(other.handle_, {});
        }
        return *this;
    }

    Async(const Async &) = delete;
    Async &operator=(const Async &) = delete;

    ~Async() { reset(); }

    // --- Awaiting from another coroutine ---

    bool await_ready() const noexcept { return handle_.done(); }

    std::coroutine_handle<> await_suspend(std::coroutine_handle<> awaiting) noexcept
    {
        handle_.promise().continuation = awaiting;
        return handle_;
    }

    T await_resume() { return handle_.promise().take(); }

    // --- Driving a root ---

    [[nodiscard]] bool valid() const noexcept { return static_cast<bool>(handle_); }
    [[nodiscard]] bool done() const noexcept { return !handle_ || handle_.done(); }

    /** @brief Runs the coroutine until its next suspension point. */
    void resume()
    {
        if (handle_ && !handle_.done())
        {
            handle_.resume();
        }
    }

    /**
     * @brief Called once, when the coroutine reaches its final suspension point.
     * The hook must not throw; it may destroy this Async.
     */
    void set_completion_hook(std::function<void()> hook)
    {
        handle_.promise().on_complete = std::move(hook);
    }

    /** @brief The exception that ended the coroutine, if any. */
    [[nodiscard]] std::exception_ptr exception() const noexcept
    {
        return handle_ ? handle_.promise().error : nullptr;
    }

    /** @brief The coroutine's value; rethrows its exception. Requires done(). */
    T take_result() { return handle_.promise().take(); }

  private:
    void reset() noexcept
    {
        if (handle_)
        {
            handle_.destroy();
            handle_ = {};
        }
    }

    handle_type handle_;
};

namespace detail
{

template <typename T> Async<T> AsyncPromise<T>::get_return_object() noexcept
{
    return Async<T>(std::coroutine_handle<AsyncPromise<T>>::from_promise(*this));
}

inline Async<void> AsyncPromise<void>::get_return_object() noexcept
{
    return Async<void>(std::coroutine_handle<AsyncPromise<void>>::from_promise(*this));
}

} // namespace detail

template <typename R> struct is_async : std::false_type
{
};
template <typename T> struct is_async<Async<T>> : std::true_type
{
};
template <typename R> inline constexpr bool is_async_v = is_async<R>::value;

/// `T` for `Async<T>`, otherwise @p R itself.
template <typename R> struct async_value
{
    using type = R;
};
template <typename T> struct async_value<Async<T>>
{
    using type = T;
};
template <typename R> using async_value_t = typename async_value<R>::type;

/** @brief An Async that completes with @p value as soon as it is started. */
template <typename T> Async<T> ready_async(T value)
{
    co_return std::move(value);
}

} // namespace asyncmodules::core
