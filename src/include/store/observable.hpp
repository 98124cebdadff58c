#pragma once

/**
 * @file observable.hpp
 * @brief Minimal observable view of a store for reactive consumers.
 *
 * Built only on the engine's public subscribe/get_state. An observer's `next` receives the
 * current state immediately on subscribe and again after every completed round.
 */

#include <memory>
#include <utility>

#include "store/store.hpp"

namespace statehub::store
{

template <typename State>
struct Observer
{
    std::function<void(const State &)> next;
};

/// Handle returned by Observable::subscribe; unsubscribe() is idempotent.
class Subscription
{
  public:
    explicit Subscription(Unsubscribe unsubscribe) : m_unsubscribe(std::move(unsubscribe)) {}

    void unsubscribe() const
    {
        if (m_unsubscribe)
        {
            m_unsubscribe();
        }
    }

  private:
    Unsubscribe m_unsubscribe;
};

template <typename State>
class Observable
{
  public:
    explicit Observable(std::shared_ptr<StoreEngine<State>> engine) : m_engine(std::move(engine)) {}

    /**
     * @brief Pushes the current state to `observer.next` now and after every round.
     *
     * An observer without `next` is registered but receives nothing. The registration holds
     * the engine weakly, so an observer never keeps a store alive by itself.
     */
    Subscription subscribe(Observer<State> observer) const
    {
        std::weak_ptr<StoreEngine<State>> weak_engine = m_engine;
        auto observe_state = [weak_engine, next = std::move(observer.next)]()
        {
            if (!next)
            {
                return;
            }
            if (auto engine = weak_engine.lock())
            {
                next(engine->get_state());
            }
        };
        observe_state();
        return Subscription(m_engine->subscribe(std::move(observe_state)));
    }

    /// Interop hook: an observable is its own observable.
    [[nodiscard]] const Observable &observable() const noexcept { return *this; }

  private:
    std::shared_ptr<StoreEngine<State>> m_engine;
};

template <typename State>
Observable<State> make_observable(const Store<State> &store)
{
    return Observable<State>(store.engine());
}

template <typename State>
Observable<State> Store<State>::observable() const
{
    return Observable<State>(m_engine);
}

} // namespace statehub::store
