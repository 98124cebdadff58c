#pragma once

/**
 * @file apply_middleware.hpp
 * @brief Store enhancer that wraps dispatch in a chain of middleware.
 *
 * A middleware receives a MiddlewareAPI and returns an interceptor; an interceptor receives
 * the next dispatch in the chain and returns the dispatch it exposes upstream:
 *
 * @code
 *  Middleware<int> tracer = [](const MiddlewareAPI<int> &api) -> Interceptor {
 *      return [api](Dispatch next) -> Dispatch {
 *          return [api, next](const Action &a) {
 *              LOGGER_INFO("before {} state={}", action_type_name(a), api.get_state());
 *              return next(a);
 *          };
 *      };
 *  };
 *  auto store = create_store<int>(reducer, 0, apply_middleware<int>({tracer, other}));
 * @endcode
 *
 * With middleware [A, B], `store.dispatch(x)` runs A's wrapper, then B's, then the engine.
 * `api.dispatch` always re-enters the fully built chain from the top, even when called from a
 * middleware that was listed early. Calling it while middleware are still being constructed
 * throws StoreError{PrematureDispatch}.
 */

#include <memory>
#include <utility>
#include <vector>

#include "store/compose.hpp"
#include "store/store.hpp"

namespace statehub::store
{

template <typename State>
struct MiddlewareAPI
{
    std::function<State()> get_state;
    Dispatch dispatch;
};

using Interceptor = std::function<Dispatch(Dispatch)>;

template <typename State> using Middleware = std::function<Interceptor(const MiddlewareAPI<State> &)>;

/**
 * @brief Builds an enhancer that installs `middlewares` around the store's dispatch.
 * @throws StoreError{InvalidArgument} when the store is built if a middleware is empty or
 *         returns an empty interceptor.
 */
template <typename State>
Enhancer<State> apply_middleware(std::vector<Middleware<State>> middlewares)
{
    return [middlewares = std::move(middlewares)](StoreCreator<State> next_creator) -> StoreCreator<State>
    {
        return [middlewares, next_creator = std::move(next_creator)](Reducer<State> reducer,
                                                                      std::optional<State> preloaded_state)
        {
            Store<State> store = next_creator(std::move(reducer), std::move(preloaded_state));

            // The forwarding cell: a placeholder until the chain is composed. Middleware see
            // it only through a weak reference; the returned facade owns it.
            auto cell = std::make_shared<Dispatch>(
                [](const Action &) -> Action
                {
                    throw StoreError(ErrorKind::PrematureDispatch,
                                     "Dispatching while constructing your middleware is not allowed; "
                                     "other middleware would not be applied to this dispatch");
                });

            std::weak_ptr<Dispatch> weak_cell = cell;
            MiddlewareAPI<State> api{
                [store]() { return store.get_state(); },
                [weak_cell](const Action &action) -> Action
                {
                    auto target = weak_cell.lock();
                    if (!target)
                    {
                        throw StoreError(ErrorKind::IllegalStateAccess,
                                         "The store this middleware was applied to no longer exists");
                    }
                    return (*target)(action);
                }};

            std::vector<Interceptor> chain;
            chain.reserve(middlewares.size());
            for (const auto &middleware : middlewares)
            {
                if (!middleware)
                {
                    throw StoreError(ErrorKind::InvalidArgument, "Expected each middleware to be a function");
                }
                Interceptor interceptor = middleware(api);
                if (!interceptor)
                {
                    throw StoreError(ErrorKind::InvalidArgument,
                                     "A middleware returned an empty interceptor");
                }
                // Checked per stage: an empty dispatch would otherwise reach the next
                // interceptor as its `next`.
                chain.push_back(
                    [interceptor = std::move(interceptor)](Dispatch next) -> Dispatch
                    {
                        Dispatch wrapped = interceptor(std::move(next));
                        if (!wrapped)
                        {
                            throw StoreError(ErrorKind::InvalidArgument,
                                             "A middleware interceptor returned an empty dispatch");
                        }
                        return wrapped;
                    });
            }

            *cell = compose_chain<Dispatch>(std::move(chain))(store.dispatcher());
            LOGGER_DEBUG("apply_middleware: {} middleware installed", middlewares.size());

            // A listener may drop the last facade mid-round, destroying this lambda; the local
            // copy keeps the chain alive until the outermost interceptor returns.
            return store.with_dispatch(
                [cell](const Action &action)
                {
                    const auto chain = cell;
                    return (*chain)(action);
                });
        };
    };
}

} // namespace statehub::store
