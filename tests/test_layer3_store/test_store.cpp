// tests/test_layer3_store/test_store.cpp
/**
 * @file test_store.cpp
 * @brief Unit tests for the store engine: create_store, dispatch, the re-entrancy rules and
 *        replace_reducer.
 *
 * Listener snapshot semantics live in test_subscription.cpp.
 */
#include "sth_store.hpp"
#include "gtest/gtest.h"

#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

using namespace statehub::store;

namespace
{

int counter(const int &state, const Action &action)
{
    const auto &type = action.at("type");
    if (type == "INCREMENT")
        return state + 1;
    if (type == "DECREMENT")
        return state - 1;
    if (type == "ADD")
        return state + action.at("payload").get<int>();
    return state;
}

/// Expects `fn` to throw StoreError of the given kind.
template <typename Fn> void expect_store_error(ErrorKind kind, Fn &&fn)
{
    try
    {
        fn();
        ADD_FAILURE() << "expected StoreError{" << to_string(kind) << "}";
    }
    catch (const StoreError &e)
    {
        EXPECT_EQ(e.kind(), kind) << "got " << to_string(e.kind()) << ": " << e.what();
    }
}

} // namespace

// ============================================================================
// Creation and the bootstrap round
// ============================================================================

TEST(StoreTest, CounterScenario)
{
    auto store = create_store<int>(counter, 0);
    EXPECT_EQ(store.get_state(), 0);

    store.dispatch(make_action("INCREMENT"));
    store.dispatch(make_action("INCREMENT"));
    store.dispatch(make_action("DECREMENT"));
    EXPECT_EQ(store.get_state(), 1);
}

TEST(StoreTest, InitialStateIsKept)
{
    auto store = create_store<int>(counter, 41);
    store.dispatch(make_action("INCREMENT"));
    EXPECT_EQ(store.get_state(), 42);
}

// The bootstrap round runs exactly once with the reserved INIT type.
TEST(StoreTest, BootstrapRoundUsesInitType)
{
    std::vector<std::string> seen;
    auto recording = [&seen](const int &state, const Action &action)
    {
        seen.push_back(action.at("type").get<std::string>());
        return state;
    };
    auto store = create_store<int>(recording, 3);
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], action_types::init());
    EXPECT_TRUE(action_types::is_reserved(make_action(seen[0])));
}

// Without an initial state the reducer receives State{} and supplies its own default.
TEST(StoreTest, AbsentInitialStateLetsReducerInitialize)
{
    Reducer<nlohmann::json> todos = [](const nlohmann::json &state, const Action &action)
    {
        nlohmann::json next = state.is_null() ? nlohmann::json{{"todos", nlohmann::json::array()}} : state;
        if (action.at("type") == "ADD_TODO")
            next["todos"].push_back(action.at("payload"));
        return next;
    };
    auto store = create_store<nlohmann::json>(todos);
    EXPECT_EQ(store.get_state(), (nlohmann::json{{"todos", nlohmann::json::array()}}));

    store.dispatch(make_action("ADD_TODO", "write tests"));
    EXPECT_EQ(store.get_state().at("todos").size(), 1u);
    EXPECT_EQ(store.get_state().at("todos")[0], "write tests");
}

// The final state equals the left fold of the reducer over the dispatched actions.
TEST(StoreTest, StateIsLeftFoldOfActions)
{
    const std::vector<Action> actions = {make_action("ADD", 5), make_action("INCREMENT"), make_action("UNKNOWN"),
                                         make_action("ADD", -2), make_action("DECREMENT")};
    auto store = create_store<int>(counter, 10);
    int expected = counter(10, make_action(action_types::init()));
    for (const auto &a : actions)
    {
        store.dispatch(a);
        expected = counter(expected, a);
    }
    EXPECT_EQ(store.get_state(), expected);
    EXPECT_EQ(expected, 13);
}

TEST(StoreTest, DispatchReturnsTheAction)
{
    auto store = create_store<int>(counter, 0);
    const Action action = make_action("ADD", 2);
    EXPECT_EQ(store.dispatch(action), action);
}

// The engine is only reachable through create(), which owns it from the start.
TEST(StoreTest, EngineIsOnlyBuiltThroughCreate)
{
    static_assert(!std::is_constructible_v<StoreEngine<int>, Reducer<int>, int>);
    static_assert(!std::is_copy_constructible_v<StoreEngine<int>>);

    auto engine = StoreEngine<int>::create(counter, 3);
    EXPECT_EQ(engine.use_count(), 1);
    EXPECT_EQ(engine->get_state(), 3);
    EXPECT_EQ(engine->shared_from_this(), engine);
}

TEST(StoreTest, GetStateReturnsACopy)
{
    auto store = create_store<nlohmann::json>(
        [](const nlohmann::json &state, const Action &) { return state; }, nlohmann::json{{"n", 1}});
    auto snapshot = store.get_state();
    snapshot["n"] = 99;
    EXPECT_EQ(store.get_state().at("n"), 1);
}

// ============================================================================
// Action validation
// ============================================================================

TEST(StoreTest, RejectsActionsThatAreNotPlainRecords)
{
    int calls = 0;
    auto store = create_store<int>(
        [&calls](const int &s, const Action &)
        {
            ++calls;
            return s;
        },
        0);
    ASSERT_EQ(calls, 1);

    for (const Action &bad : {Action::array({1, 2}), Action("INCREMENT"), Action(42), Action(nullptr)})
    {
        expect_store_error(ErrorKind::InvalidAction, [&] { store.dispatch(bad); });
    }
    EXPECT_EQ(calls, 1);
}

TEST(StoreTest, RejectsActionsWithoutType)
{
    auto store = create_store<int>(counter, 0);
    expect_store_error(ErrorKind::InvalidAction, [&] { store.dispatch(Action{{"kind", "INCREMENT"}}); });
    expect_store_error(ErrorKind::InvalidAction, [&] { store.dispatch(Action::object()); });
    EXPECT_EQ(store.get_state(), 0);
}

// Only the absence of "type" is rejected; a null type still reaches the reducer.
TEST(StoreTest, NullTypeIsAccepted)
{
    int calls = 0;
    auto store = create_store<int>(
        [&calls](const int &s, const Action &)
        {
            ++calls;
            return s;
        },
        0);
    store.dispatch(Action{{"type", nullptr}});
    EXPECT_EQ(calls, 2);
}

// ============================================================================
// Re-entrancy from inside the reducer
// ============================================================================

TEST(StoreTest, ReducerMayNotDispatch)
{
    std::optional<Store<int>> handle;
    auto reducer = [&handle](const int &state, const Action &action)
    {
        if (action.at("type") == "NESTED")
            handle->dispatch(make_action("INCREMENT"));
        return counter(state, action);
    };
    handle = create_store<int>(reducer, 0);

    expect_store_error(ErrorKind::IllegalStateAccess, [&] { handle->dispatch(make_action("NESTED")); });
    EXPECT_EQ(handle->get_state(), 0);

    // The store recovers: the dispatching flag was reset.
    handle->dispatch(make_action("INCREMENT"));
    EXPECT_EQ(handle->get_state(), 1);
}

TEST(StoreTest, ReducerMayNotReadOrSubscribe)
{
    std::optional<Store<int>> handle;
    Unsubscribe unsubscribe;
    std::vector<ErrorKind> errors;
    auto reducer = [&](const int &state, const Action &action)
    {
        if (action.at("type") != "PROBE")
            return state;
        const std::vector<std::function<void()>> probes = {
            [&] { (void)handle->get_state(); },
            [&] { (void)handle->subscribe([] {}); },
            [&] { unsubscribe(); },
            [&] { handle->replace_reducer(counter); },
        };
        for (const auto &probe : probes)
        {
            try
            {
                probe();
            }
            catch (const StoreError &e)
            {
                errors.push_back(e.kind());
            }
        }
        return state + 1;
    };
    handle = create_store<int>(reducer, 0);
    int notified = 0;
    unsubscribe = handle->subscribe([&] { ++notified; });

    handle->dispatch(make_action("PROBE"));
    EXPECT_EQ(errors, std::vector<ErrorKind>(4, ErrorKind::IllegalStateAccess));
    EXPECT_EQ(handle->get_state(), 1);
    EXPECT_EQ(notified, 1);

    // Outside the reducer the same calls succeed.
    unsubscribe();
    handle->dispatch(make_action("PROBE"));
    EXPECT_EQ(notified, 1);
}

// A throwing reducer leaves the state untouched, notifies nobody and resets the flag.
TEST(StoreTest, ReducerExceptionPropagatesAndResetsFlag)
{
    auto reducer = [](const int &state, const Action &action)
    {
        if (action.at("type") == "BOOM")
            throw std::runtime_error("reducer failed");
        return counter(state, action);
    };
    auto store = create_store<int>(reducer, 5);
    int notified = 0;
    auto unsubscribe = store.subscribe([&] { ++notified; });

    EXPECT_THROW(store.dispatch(make_action("BOOM")), std::runtime_error);
    EXPECT_FALSE(store.engine()->is_dispatching());
    EXPECT_EQ(store.get_state(), 5);
    EXPECT_EQ(notified, 0);

    store.dispatch(make_action("INCREMENT"));
    EXPECT_EQ(store.get_state(), 6);
    EXPECT_EQ(notified, 1);
    unsubscribe();
}

// ============================================================================
// replace_reducer
// ============================================================================

TEST(StoreTest, ReplaceReducerRunsReplaceRound)
{
    auto store = create_store<int>(counter, 1);
    std::vector<std::string> seen_by_next;
    int notified = 0;
    auto unsubscribe = store.subscribe([&] { ++notified; });

    store.replace_reducer(
        [&seen_by_next](const int &state, const Action &action)
        {
            seen_by_next.push_back(action.at("type").get<std::string>());
            return action.at("type") == "INCREMENT" ? state + 10 : state;
        });

    ASSERT_EQ(seen_by_next.size(), 1u);
    EXPECT_EQ(seen_by_next[0], action_types::replace());
    EXPECT_EQ(notified, 1);

    store.dispatch(make_action("INCREMENT"));
    EXPECT_EQ(store.get_state(), 11);
    unsubscribe();
}

TEST(StoreTest, ReplaceReducerRejectsEmptyReducer)
{
    auto store = create_store<int>(counter, 0);
    expect_store_error(ErrorKind::InvalidArgument, [&] { store.replace_reducer(Reducer<int>{}); });
    store.dispatch(make_action("INCREMENT"));
    EXPECT_EQ(store.get_state(), 1);
}

// ============================================================================
// create_store argument handling
// ============================================================================

TEST(CreateStoreTest, RejectsEmptyReducer)
{
    expect_store_error(ErrorKind::InvalidArgument, [] { (void)create_store<int>(Reducer<int>{}); });
    expect_store_error(ErrorKind::InvalidArgument, [] { (void)create_store<int>(Reducer<int>{}, 3); });
}

TEST(CreateStoreTest, RejectsEmptyEnhancer)
{
    expect_store_error(ErrorKind::InvalidArgument, [] { (void)create_store<int>(counter, 0, Enhancer<int>{}); });
    expect_store_error(ErrorKind::InvalidArgument, [] { (void)create_store<int>(counter, Enhancer<int>{}); });
}

TEST(CreateStoreTest, RejectsSeveralEnhancers)
{
    Enhancer<int> identity = [](StoreCreator<int> next) { return next; };
    expect_store_error(ErrorKind::InvalidArgument, [&] { (void)create_store<int>(counter, identity, identity); });
    expect_store_error(ErrorKind::InvalidArgument,
                       [&] { (void)create_store<int>(counter, identity, identity, identity); });
}

// The enhancer receives the base creator and the original arguments.
TEST(CreateStoreTest, EnhancerWrapsCreation)
{
    std::optional<int> seen_preloaded;
    Enhancer<int> spy = [&seen_preloaded](StoreCreator<int> next) -> StoreCreator<int>
    {
        return [&seen_preloaded, next](Reducer<int> reducer, std::optional<int> preloaded)
        {
            seen_preloaded = preloaded;
            Store<int> store = next(std::move(reducer), preloaded);
            return store.with_dispatch(
                [raw = store.dispatcher()](const Action &a)
                {
                    Action tagged = a;
                    tagged["enhanced"] = true;
                    return raw(tagged);
                });
        };
    };

    auto store = create_store<int>(counter, 7, spy);
    ASSERT_TRUE(seen_preloaded.has_value());
    EXPECT_EQ(*seen_preloaded, 7);
    EXPECT_EQ(store.dispatch(make_action("INCREMENT")).value("enhanced", false), true);
    EXPECT_EQ(store.get_state(), 8);
}

// An enhancer passed in the initial-state position means "no initial state".
TEST(CreateStoreTest, EnhancerInInitialStatePosition)
{
    std::optional<int> seen_preloaded = 123;
    Enhancer<int> spy = [&seen_preloaded](StoreCreator<int> next) -> StoreCreator<int>
    {
        return [&seen_preloaded, next](Reducer<int> reducer, std::optional<int> preloaded)
        {
            seen_preloaded = preloaded;
            return next(std::move(reducer), preloaded);
        };
    };

    auto store = create_store<int>(counter, spy);
    EXPECT_FALSE(seen_preloaded.has_value());
    EXPECT_EQ(store.get_state(), 0);
}

// Unsubscribing after the store is gone is harmless.
TEST(CreateStoreTest, UnsubscribeOutlivesStore)
{
    Unsubscribe unsubscribe;
    {
        auto store = create_store<int>(counter, 0);
        unsubscribe = store.subscribe([] {});
    }
    EXPECT_NO_THROW(unsubscribe());
    EXPECT_NO_THROW(unsubscribe());
}
