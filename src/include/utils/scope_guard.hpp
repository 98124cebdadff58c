#pragma once

#include <concepts>
#include <functional>
#include <type_traits>
#include <utility>

namespace statehub::basics
{

/**
 * @class ScopeGuard
 * @brief Runs a cleanup action when the enclosing scope is left, by normal flow or by an
 *        exception.
 *
 * This is the library's `finally`: the store engine uses it to reset its dispatching flag
 * whether or not the reducer throws, and the Logger worker uses it to clear each drained batch.
 *
 * The callable must be `noexcept` invocable. A cleanup action that can fail has nowhere to
 * report the failure during unwinding, so such callables are rejected at compile time rather
 * than having their exceptions swallowed.
 *
 * @code
 *  m_is_dispatching = true;
 *  auto reset = statehub::basics::make_scope_guard([this]() noexcept { m_is_dispatching = false; });
 *  m_state = m_reducer(m_state, action); // may throw; the flag is reset either way
 * @endcode
 *
 * Movable, not copyable. A moved-from or dismissed guard does nothing.
 * Not thread-safe.
 */
template <typename Callable>
requires std::is_nothrow_invocable_v<Callable &>
class ScopeGuard
{
  public:
    static_assert(!std::is_reference_v<Callable>, "ScopeGuard cannot hold a reference to a callable.");

    explicit ScopeGuard(Callable fn) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_func(std::move(fn))
    {
    }

    ScopeGuard(ScopeGuard &&other) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_func(std::move(other.m_func)), m_active(other.m_active)
    {
        other.dismiss();
    }

    ~ScopeGuard() noexcept
    {
        if (m_active)
        {
            std::invoke(m_func);
        }
    }

    ScopeGuard(const ScopeGuard &) = delete;
    ScopeGuard &operator=(const ScopeGuard &) = delete;
    ScopeGuard &operator=(ScopeGuard &&) = delete;

    /// @return `true` if the cleanup action is still pending.
    [[nodiscard]] explicit operator bool() const noexcept { return m_active; }

    /// Cancels the cleanup action.
    constexpr void dismiss() noexcept { m_active = false; }

    /// Runs the cleanup action now (at most once) and dismisses the guard.
    void invoke() noexcept
    {
        if (m_active)
        {
            m_active = false; // dismiss first so the destructor cannot run it again
            std::invoke(m_func);
        }
    }

  private:
    Callable m_func;
    bool m_active{true};
};

/**
 * @brief Preferred way to create a ScopeGuard; stores a decayed copy of `f`.
 *
 * References captured by `f` must outlive the guard.
 */
template <typename F> auto make_scope_guard(F &&f) -> ScopeGuard<std::decay_t<F>>
{
    return ScopeGuard<std::decay_t<F>>(std::forward<F>(f));
}

} // namespace statehub::basics
