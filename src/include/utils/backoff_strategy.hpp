#pragma once
/**
 * @file backoff_strategy.hpp
 * @brief Bounded doubling delay schedule.
 *
 * The task dispatcher walks it for admission control, sleeping each delay
 * cooperatively on the scheduler.
 */
#include <chrono>
#include <cstdint>

namespace asyncmodules::utils
{

/**
 * @brief Doubling delay schedule with a cap: initial, 2*initial, 4*initial ... cap.
 *
 * The sequence ends with the first delay that reaches the cap; callers stop waiting
 * after that step (`exhausted`). With the defaults (1 ms, 1000 ms) the steps are
 * 1, 2, 4, ... 512, 1000 ms, so `total()` is 2023 ms.
 */
struct DoublingBackoff
{
    std::chrono::milliseconds initial{1};
    std::chrono::milliseconds cap{1000};

    DoublingBackoff() = default;
    DoublingBackoff(std::chrono::milliseconds initial_delay, std::chrono::milliseconds max_delay)
        : initial(initial_delay), cap(max_delay)
    {
    }

    /** @brief Delay for step @p iteration (0-based). */
    [[nodiscard]] std::chrono::milliseconds delay(int iteration) const noexcept
    {
        if (initial.count() <= 0)
        {
            return cap;
        }
        int64_t d = initial.count();
        for (int i = 0; i < iteration && d < cap.count(); ++i)
        {
            d *= 2;
        }
        return std::chrono::milliseconds(d < cap.count() ? d : cap.count());
    }

    /** @brief True if step @p iteration is the last one (its delay hit the cap). */
    [[nodiscard]] bool exhausted(int iteration) const noexcept { return delay(iteration) >= cap; }

    /** @brief Number of steps in the schedule, including the capped one. */
    [[nodiscard]] int steps() const noexcept
    {
        int n = 0;
        while (!exhausted(n))
        {
            ++n;
        }
        return n + 1;
    }

    /** @brief Sum of every delay in the schedule. */
    [[nodiscard]] std::chrono::milliseconds total() const noexcept
    {
        std::chrono::milliseconds sum{0};
        for (int i = 0, n = steps(); i < n; ++i)
        {
            sum += delay(i);
        }
        return sum;
    }
};

} // namespace asyncmodules::utils
