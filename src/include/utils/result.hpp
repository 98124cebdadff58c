/**
 * @file result.hpp
 * @brief Result<T, E> for operations that fail in expected ways (configuration loading).
 *
 * Design:
 * - Distinguishes between success (T) and expected failures (E plus a message)
 * - Forces explicit error handling at call sites
 * - No implicit conversions to bool
 * - [[nodiscard]] factories prevent ignoring errors
 *
 * Contract violations inside the store (bad actions, re-entrant calls) are not expected
 * failures; they throw `statehub::store::StoreError` instead.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace statehub::utils
{

/**
 * @class Result
 * @tparam T Success value type
 * @tparam E Error enum type
 *
 * @code
 * auto loaded = load_store_config("config/statehub.json");
 * if (loaded.is_error()) {
 *     LOGGER_WARN("config: {} ({})", to_string(loaded.error()), loaded.error_message());
 *     return;
 * }
 * apply_logging_config(loaded.content());
 * @endcode
 */
template <typename T, typename E>
class Result
{
  public:
    using value_type = T;
    using error_type = E;

    [[nodiscard]] static Result ok(T value)
    {
        Result result;
        result.m_data = std::move(value);
        return result;
    }

    /**
     * @param err The error enum value
     * @param message Human-readable detail (file path, offending key, parser message)
     */
    [[nodiscard]] static Result error(E err, std::string message = {})
    {
        Result result;
        result.m_data = ErrorData{err, std::move(message)};
        return result;
    }

    Result(Result &&) noexcept = default;
    Result &operator=(Result &&) noexcept = default;
    Result(const Result &) = delete;
    Result &operator=(const Result &) = delete;

    [[nodiscard]] bool is_ok() const noexcept { return std::holds_alternative<T>(m_data); }
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
        return std::get<T>(m_data);
    }

    [[nodiscard]] const T &content() const &
    {
        if (!is_ok())
        {
            throw std::logic_error("Result::content() called on error state");
        }
        return std::get<T>(m_data);
    }

    [[nodiscard]] T &&content() &&
    {
        if (!is_ok())
        {
            throw std::logic_error("Result::content() called on error state");
        }
        return std::get<T>(std::move(m_data));
    }

    [[nodiscard]] T value_or(T default_value) const &
    {
        return is_ok() ? std::get<T>(m_data) : std::move(default_value);
    }

    /**
     * @throws std::logic_error if Result is in success state
     */
    [[nodiscard]] E error() const
    {
        if (is_ok())
        {
            throw std::logic_error("Result::error() called on success state");
        }
        return std::get<ErrorData>(m_data).error_enum;
    }

    /**
     * @throws std::logic_error if Result is in success state
     */
    [[nodiscard]] const std::string &error_message() const
    {
        if (is_ok())
        {
            throw std::logic_error("Result::error_message() called on success state");
        }
        return std::get<ErrorData>(m_data).message;
    }

  private:
    Result() = default;

    struct ErrorData
    {
        E error_enum;
        std::string message;
    };

    std::variant<ErrorData, T> m_data;
};

} // namespace statehub::utils
