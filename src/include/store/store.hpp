#pragma once

/**
 * @file store.hpp
 * @brief The store engine, the Store facade and create_store.
 *
 * A store holds one state value that changes only through `dispatch(action)`, which runs the
 * reducer `(state, action) -> state` and then notifies every subscribed listener.
 *
 * @code
 *  using namespace statehub::store;
 *  auto counter = [](const int &s, const Action &a) { return a.at("type") == "INC" ? s + 1 : s; };
 *  auto store = create_store<int>(counter, 0);
 *  auto unsubscribe = store.subscribe([&] { fmt::print("now {}\n", store.get_state()); });
 *  store.dispatch(make_action("INC")); // prints "now 1"
 *  unsubscribe();
 * @endcode
 *
 * Re-entrancy rules (violations throw StoreError{IllegalStateAccess}):
 *  - while the reducer runs, get_state/subscribe/unsubscribe/dispatch/replace_reducer are refused;
 *  - listeners run after the reducer has returned, so they may call all of the above.
 *
 * Listener snapshots: each round commits the pending listener list and iterates that
 * snapshot. Subscribing or unsubscribing from inside a listener only affects later rounds.
 *
 * Not thread-safe; one store is driven from one thread.
 */

#include <algorithm>
#include <concepts>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

#include "store/action.hpp"
#include "store/store_error.hpp"
#include "utils/logger.hpp"
#include "utils/scope_guard.hpp"

namespace statehub::store
{

template <typename State> using Reducer = std::function<State(const State &, const Action &)>;
using Listener = std::function<void()>;
using Unsubscribe = std::function<void()>;
using Dispatch = std::function<Action(const Action &)>;

template <typename State> class Store;
template <typename State> class Observable;

/// Builds a store from a reducer and an optional initial state.
template <typename State>
using StoreCreator = std::function<Store<State>(Reducer<State>, std::optional<State>)>;

/// Transforms a store creator into one that builds an augmented store.
template <typename State> using Enhancer = std::function<StoreCreator<State>(StoreCreator<State>)>;

/**
 * @class StoreEngine
 * @brief Owns the state, the reducer and the listener lists, and enforces the re-entrancy
 *        rules. Always owned by a std::shared_ptr; obtain one through create_store().
 */
template <typename State>
class StoreEngine : public std::enable_shared_from_this<StoreEngine<State>>
{
    struct PrivateTag
    {
        explicit PrivateTag() = default;
    };

  public:
    /// Builds an engine without running the bootstrap round (create_store does that).
    static std::shared_ptr<StoreEngine> create(Reducer<State> reducer, State initial_state)
    {
        return std::make_shared<StoreEngine>(PrivateTag{}, std::move(reducer), std::move(initial_state));
    }

    // Public only for make_shared; PrivateTag keeps it out of reach of other callers.
    StoreEngine(PrivateTag, Reducer<State> reducer, State initial_state)
        : m_reducer(std::move(reducer)), m_state(std::move(initial_state)),
          m_current_listeners(std::make_shared<ListenerList>()), m_next_listeners(m_current_listeners)
    {
    }

    StoreEngine(const StoreEngine &) = delete;
    StoreEngine &operator=(const StoreEngine &) = delete;

    /**
     * @brief Returns a copy of the current state.
     * @throws StoreError{IllegalStateAccess} while the reducer is running; a reducer already
     *         receives the state as its argument.
     */
    State get_state() const
    {
        if (m_is_dispatching)
        {
            throw StoreError(ErrorKind::IllegalStateAccess,
                             "get_state() may not be called while the reducer is executing; "
                             "the reducer already receives the state as an argument");
        }
        return m_state;
    }

    /**
     * @brief Registers `listener` for every round that starts after this call returns.
     * @return A capability that removes this registration; calling it again is a no-op.
     * @throws StoreError{InvalidArgument} if `listener` is empty.
     * @throws StoreError{IllegalStateAccess} while the reducer is running.
     */
    Unsubscribe subscribe(Listener listener)
    {
        if (!listener)
        {
            throw StoreError(ErrorKind::InvalidArgument, "Expected the listener to be a function");
        }
        if (m_is_dispatching)
        {
            throw StoreError(ErrorKind::IllegalStateAccess,
                             "subscribe() may not be called while the reducer is executing; "
                             "subscribe from outside and read get_state() in the listener");
        }

        const uint64_t id = m_next_listener_id++;
        ensure_can_mutate_next_listeners();
        m_next_listeners->push_back(ListenerEntry{id, std::move(listener)});

        std::weak_ptr<StoreEngine> weak_engine = this->weak_from_this();
        auto is_subscribed = std::make_shared<bool>(true);
        return [weak_engine, id, is_subscribed]()
        {
            if (!*is_subscribed)
            {
                return;
            }
            auto engine = weak_engine.lock();
            if (!engine)
            {
                *is_subscribed = false;
                return;
            }
            if (engine->m_is_dispatching)
            {
                throw StoreError(ErrorKind::IllegalStateAccess,
                                 "A listener may not be unsubscribed while the reducer is executing");
            }
            *is_subscribed = false;
            engine->remove_listener(id);
        };
    }

    /**
     * @brief Runs one round: reducer, then every listener of the committed snapshot.
     * @return `action`, unchanged.
     * @throws StoreError{InvalidAction} if `action` is not a JSON object or has no "type".
     * @throws StoreError{IllegalStateAccess} if called from inside the reducer.
     *
     * An exception from the reducer propagates after the dispatching flag has been reset; the
     * state is left unchanged and no listener runs. An exception from a listener propagates
     * and skips the remaining listeners of that round.
     */
    Action dispatch(const Action &action)
    {
        if (!is_plain_record(action))
        {
            LOGGER_DEBUG("dispatch rejected: action is a JSON {}, not an object", action.type_name());
            throw StoreError(ErrorKind::InvalidAction,
                             "Actions must be plain objects; use custom middleware for other shapes");
        }
        if (!action.contains(kActionTypeKey))
        {
            LOGGER_DEBUG("dispatch rejected: action without \"{}\": {}", kActionTypeKey, action.dump());
            throw StoreError(ErrorKind::InvalidAction,
                             "Actions may not have an undefined \"type\" property");
        }
        if (m_is_dispatching)
        {
            LOGGER_DEBUG("dispatch rejected: nested dispatch of '{}' from a reducer", action_type_name(action));
            throw StoreError(ErrorKind::IllegalStateAccess, "Reducers may not dispatch actions");
        }

        {
            m_is_dispatching = true;
            auto reset = basics::make_scope_guard([this]() noexcept { m_is_dispatching = false; });
            m_state = m_reducer(m_state, action);
        }

        // A listener may release the last facade; keep the engine alive for the whole round.
        auto self = this->shared_from_this();
        m_current_listeners = m_next_listeners;
        const std::shared_ptr<const ListenerList> listeners = m_current_listeners;
        for (const auto &entry : *listeners)
        {
            entry.callback();
        }

        return action;
    }

    /**
     * @brief Swaps the reducer and runs a bootstrap round with action_types::replace() so the
     *        new reducer can initialize any part of the state it introduces.
     * @throws StoreError{InvalidArgument} if `next_reducer` is empty.
     * @throws StoreError{IllegalStateAccess} if called from inside the reducer.
     */
    void replace_reducer(Reducer<State> next_reducer)
    {
        if (!next_reducer)
        {
            throw StoreError(ErrorKind::InvalidArgument, "Expected the next reducer to be a function");
        }
        if (m_is_dispatching)
        {
            throw StoreError(ErrorKind::IllegalStateAccess,
                             "replace_reducer() may not be called while the reducer is executing");
        }
        m_reducer = std::move(next_reducer);
        LOGGER_DEBUG("store: reducer replaced");
        dispatch(make_action(action_types::replace()));
    }

    [[nodiscard]] bool is_dispatching() const noexcept { return m_is_dispatching; }

    /// Number of registrations that the next round will notify.
    [[nodiscard]] size_t listener_count() const noexcept { return m_next_listeners->size(); }

  private:
    struct ListenerEntry
    {
        uint64_t id;
        Listener callback;
    };
    using ListenerList = std::vector<ListenerEntry>;

    // Copy-on-write: the pending list is copied only on the first mutation after a commit,
    // so the snapshot being iterated is never modified.
    void ensure_can_mutate_next_listeners()
    {
        if (m_next_listeners == m_current_listeners)
        {
            m_next_listeners = std::make_shared<ListenerList>(*m_current_listeners);
        }
    }

    void remove_listener(uint64_t id)
    {
        ensure_can_mutate_next_listeners();
        auto it = std::find_if(m_next_listeners->begin(), m_next_listeners->end(),
                               [id](const ListenerEntry &e) { return e.id == id; });
        if (it != m_next_listeners->end())
        {
            m_next_listeners->erase(it);
        }
    }

    Reducer<State> m_reducer;
    State m_state;
    std::shared_ptr<ListenerList> m_current_listeners;
    std::shared_ptr<ListenerList> m_next_listeners;
    uint64_t m_next_listener_id{1};
    bool m_is_dispatching{false};
};

/**
 * @class Store
 * @brief A copyable handle onto a StoreEngine together with the dispatch function in effect
 *        for this handle.
 *
 * Handles built by create_store dispatch straight into the engine; handles returned by an
 * enhancer such as apply_middleware carry an augmented dispatch over the same engine.
 *
 * A listener that captures a Store keeps the engine alive until it is unsubscribed.
 */
template <typename State>
class Store
{
  public:
    using state_type = State;

    explicit Store(std::shared_ptr<StoreEngine<State>> engine)
        : m_engine(std::move(engine)), m_dispatch(raw_dispatch_of(m_engine))
    {
    }

    Store(std::shared_ptr<StoreEngine<State>> engine, Dispatch dispatch)
        : m_engine(std::move(engine)), m_dispatch(std::move(dispatch))
    {
        if (!m_dispatch)
        {
            throw StoreError(ErrorKind::InvalidArgument, "Expected dispatch to be a function");
        }
    }

    Action dispatch(const Action &action) const { return m_dispatch(action); }

    State get_state() const { return m_engine->get_state(); }

    Unsubscribe subscribe(Listener listener) const { return m_engine->subscribe(std::move(listener)); }

    void replace_reducer(Reducer<State> next_reducer) const
    {
        m_engine->replace_reducer(std::move(next_reducer));
    }

    /// Observable view of this store; defined in store/observable.hpp.
    [[nodiscard]] Observable<State> observable() const;

    /// The dispatch callable of this handle, for composing into middleware chains.
    [[nodiscard]] const Dispatch &dispatcher() const noexcept { return m_dispatch; }

    /// A handle over the same engine whose dispatch is `dispatch`.
    [[nodiscard]] Store with_dispatch(Dispatch dispatch) const { return Store(m_engine, std::move(dispatch)); }

    [[nodiscard]] const std::shared_ptr<StoreEngine<State>> &engine() const noexcept { return m_engine; }

  private:
    static Dispatch raw_dispatch_of(const std::shared_ptr<StoreEngine<State>> &engine)
    {
        return [engine](const Action &action) { return engine->dispatch(action); };
    }

    std::shared_ptr<StoreEngine<State>> m_engine;
    Dispatch m_dispatch;
};

// ----------------------------------------------------------------------------
// create_store
// ----------------------------------------------------------------------------

/**
 * @brief Builds a store and runs the initial bootstrap round (action_types::init()).
 *
 * An absent initial state is `State{}`; the reducer sees it during the bootstrap round and
 * returns its initial state.
 *
 * @throws StoreError{InvalidArgument} if `reducer` is empty.
 */
template <typename State>
Store<State> create_store(Reducer<State> reducer, std::optional<State> preloaded_state = std::nullopt)
{
    if (!reducer)
    {
        throw StoreError(ErrorKind::InvalidArgument, "Expected the reducer to be a function");
    }
    auto engine = StoreEngine<State>::create(std::move(reducer), std::move(preloaded_state).value_or(State{}));
    engine->dispatch(make_action(action_types::init()));
    LOGGER_DEBUG("create_store: store created ({} listeners)", engine->listener_count());
    return Store<State>(std::move(engine));
}

/**
 * @brief Delegates construction to `enhancer(create_store)(reducer, preloaded_state)`.
 * @throws StoreError{InvalidArgument} if `enhancer` is empty.
 */
template <typename State>
Store<State> create_store(Reducer<State> reducer, std::optional<State> preloaded_state, Enhancer<State> enhancer)
{
    if (!enhancer)
    {
        throw StoreError(ErrorKind::InvalidArgument, "Expected the enhancer to be a function");
    }
    StoreCreator<State> base_creator = [](Reducer<State> r, std::optional<State> s)
    { return create_store<State>(std::move(r), std::move(s)); };
    StoreCreator<State> enhanced = enhancer(std::move(base_creator));
    if (!enhanced)
    {
        throw StoreError(ErrorKind::InvalidArgument, "The enhancer returned an empty store creator");
    }
    return enhanced(std::move(reducer), std::move(preloaded_state));
}

template <typename E, typename State>
concept EnhancerFor = std::is_invocable_r_v<StoreCreator<State>, E &, StoreCreator<State>>;

/// Enhancer in place of the initial state: the initial state is absent.
template <typename State, typename E>
requires EnhancerFor<E, State>
Store<State> create_store(Reducer<State> reducer, E &&enhancer)
{
    return create_store<State>(std::move(reducer), std::nullopt, Enhancer<State>(std::forward<E>(enhancer)));
}

/**
 * @brief Rejects several enhancers passed side by side.
 * @throws StoreError{InvalidArgument} always; combine them with compose() first.
 */
template <typename State, typename E1, typename E2, typename... Rest>
requires EnhancerFor<E1, State> && EnhancerFor<E2, State>
Store<State> create_store(Reducer<State>, E1 &&, E2 &&, Rest &&...)
{
    throw StoreError(ErrorKind::InvalidArgument,
                     "Several store enhancers were passed to create_store(); "
                     "compose them together into a single enhancer");
}

} // namespace statehub::store
