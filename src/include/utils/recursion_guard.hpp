#pragma once

/*******************************************************************************
 * @file recursion_guard.hpp
 * @brief A thread-local, RAII-based guard to detect and bound re-entrant calls.
 *
 * The scheduler pumps jobs from inside jobs (a synchronous call that waits on the
 * home thread keeps the loop running), so re-entrancy is expected there. The guard
 * lets a pump ask how deeply it is nested on this thread and lets poll hooks refuse
 * to run inside themselves.
 *
 * Uses a fixed-capacity, thread-local buffer. No heap allocation. If the depth
 * exceeds the limit, the constructor panics (AMOD_PANIC).
 ******************************************************************************/
#include "utils/debug_info.hpp"

#include <algorithm>
#include <array>
#include <cstddef>

namespace asyncmodules::basics
{

#ifndef ASYNCMODULES_RECURSION_GUARD_MAX_DEPTH
#define ASYNCMODULES_RECURSION_GUARD_MAX_DEPTH 128
#endif

/** Maximum number of live guards per thread. */
constexpr size_t kMaxRecursionDepth = ASYNCMODULES_RECURSION_GUARD_MAX_DEPTH;

struct RecursionStack
{
    std::array<const void *, kMaxRecursionDepth> keys{};
    size_t size = 0;
};

inline RecursionStack &get_recursion_stack() noexcept
{
    static thread_local RecursionStack g_recursion_stack;
    return g_recursion_stack;
}

[[noreturn]] inline void recursion_guard_panic() noexcept
{
    AMOD_PANIC("RecursionGuard: max recursion depth ({}) exceeded.", kMaxRecursionDepth);
}

/**
 * @class RecursionGuard
 * @brief Pushes a key onto the thread-local stack for the lifetime of the guard.
 *
 * @warning The caller must ensure that the `key` pointer remains valid for the entire
 *          lifetime of the RecursionGuard instance.
 */
class RecursionGuard
{
  public:
    /**
     * @param key Identifier for the guarded scope. nullptr makes the guard inert.
     */
    explicit RecursionGuard(const void *key) noexcept : key_(key)
    {
        if (key_)
        {
            auto &st = get_recursion_stack();
            if (st.size >= kMaxRecursionDepth)
                recursion_guard_panic();
            st.keys[st.size++] = key_;
        }
    }

    /** Pops the key. Handles non-LIFO destruction by removing the last occurrence. */
    ~RecursionGuard() noexcept
    {
        if (key_ == nullptr)
        {
            return;
        }

        auto &st = get_recursion_stack();
        if (st.size > 0 && st.keys[st.size - 1] == key_)
        {
            --st.size;
        }
        else if (st.size > 0)
        {
            auto *beg = st.keys.data();
            auto *end = beg + st.size;
            auto rit = std::find(std::make_reverse_iterator(end), std::make_reverse_iterator(beg),
                                 key_);
            if (rit != std::make_reverse_iterator(beg))
            {
                auto *it = std::prev(rit.base());
                std::move(it + 1, end, it);
                --st.size;
            }
        }
    }

    RecursionGuard(const RecursionGuard &) = delete;
    RecursionGuard &operator=(const RecursionGuard &) = delete;
    RecursionGuard &operator=(RecursionGuard &&) = delete;

    RecursionGuard(RecursionGuard &&other) noexcept : key_(other.key_) { other.key_ = nullptr; }

    /**
     * @brief Whether @p key is on the current thread's stack.
     */
    [[nodiscard]] static bool is_recursing(const void *key) noexcept { return depth(key) > 0; }

    /**
     * @brief Number of live guards on this thread holding @p key.
     */
    [[nodiscard]] static size_t depth(const void *key) noexcept
    {
        if (key == nullptr)
            return 0;
        const auto &st = get_recursion_stack();
        const auto *beg = st.keys.data();
        return static_cast<size_t>(std::count(beg, beg + st.size, key));
    }

  private:
    const void *key_;
};

} // namespace asyncmodules::basics
