/**
 * @file result.hpp
 * @brief Generic Result<T, E> type for operations that fail in expected ways.
 *
 * Distinguishes a success value (T) from an expected failure (E, an enum). Method
 * dispatch uses it so that "unknown module" or "unknown method" are ordinary outcomes
 * rather than exceptions, while handler exceptions still propagate.
 */

#pragma once

#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace asyncmodules::utils
{

/**
 * @class Result
 * @brief Holds either a success value or an error enum plus optional detail code.
 *
 * @tparam T Success value type
 * @tparam E Error enum type
 *
 * Usage:
 * @code
 * auto result = manager.exec_task("sensor.read", md, {});
 * if (result.is_ok()) {
 *     auto value = result.content();
 * } else if (result.error() == CallError::UnknownMethod) {
 *     // handle
 * }
 * @endcode
 *
 * Result objects are not thread-safe; they are moved across threads through futures.
 */
template <typename T, typename E>
class Result
{
  public:
    using value_type = T;
    using error_type = E;

    static_assert(std::is_enum_v<E>, "Result error type must be an enum");

    /**
     * @brief Create a successful Result containing a value.
     */
    [[nodiscard]] static Result ok(T value)
    {
        Result result;
        result.m_data.template emplace<0>(std::move(value));
        return result;
    }

    /**
     * @brief Create a failed Result containing an error.
     * @param err The error enum value
     * @param code Optional detailed error code (default 0)
     */
    [[nodiscard]] static Result error(E err, int code = 0)
    {
        Result result;
        result.m_data.template emplace<1>(ErrorData{err, code});
        return result;
    }

    // Default constructible (starts in error state with default error)
    Result() : m_data(std::in_place_index<1>, ErrorData{E{}, 0}) {}

    // Movable but not copyable
    Result(Result &&) noexcept = default;
    Result &operator=(Result &&) noexcept = default;
    Result(const Result &) = delete;
    Result &operator=(const Result &) = delete;

    [[nodiscard]] bool is_ok() const noexcept { return m_data.index() == 0; }

    [[nodiscard]] bool is_error() const noexcept { return !is_ok(); }

    /**
     * @brief Get the success content.
     * @throws std::logic_error if Result is in error state
     */
    [[nodiscard]] T &content() &
    {
        if (!is_ok())
        {
            throw std::logic_error("Result::content() called on error state");
        }
        return std::get<0>(m_data);
    }

    [[nodiscard]] const T &content() const &
    {
        if (!is_ok())
        {
            throw std::logic_error("Result::content() called on error state");
        }
        return std::get<0>(m_data);
    }

    /**
     * @brief Move the success content out of Result.
     * @throws std::logic_error if Result is in error state
     */
    [[nodiscard]] T &&content() &&
    {
        if (!is_ok())
        {
            throw std::logic_error("Result::content() called on error state");
        }
        return std::get<0>(std::move(m_data));
    }

    /**
     * @brief Contained value if ok, @p default_value otherwise.
     */
    [[nodiscard]] T value_or(T default_value) const &
    {
        return is_ok() ? std::get<0>(m_data) : std::move(default_value);
    }

    /**
     * @brief Get the error enum value.
     * @throws std::logic_error if Result is in success state
     */
    [[nodiscard]] E error() const
    {
        if (is_ok())
        {
            throw std::logic_error("Result::error() called on success state");
        }
        return std::get<1>(m_data).error_enum;
    }

    /**
     * @brief Get the detailed error code (0 if not set).
     * @throws std::logic_error if Result is in success state
     */
    [[nodiscard]] int error_code() const
    {
        if (is_ok())
        {
            throw std::logic_error("Result::error_code() called on success state");
        }
        return std::get<1>(m_data).error_code;
    }

  private:
    struct ErrorData
    {
        E error_enum;
        int error_code;
    };

    // Index-based access so that a T constructible from ErrorData stays unambiguous.
    std::variant<T, ErrorData> m_data;
};

} // namespace asyncmodules::utils
