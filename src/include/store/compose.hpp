#pragma once

/**
 * @file compose.hpp
 * @brief Right-to-left function composition.
 *
 * `compose(f, g, h)` is equivalent to `[](auto &&...args) { return f(g(h(args...))); }`.
 * Only the rightmost function may take several arguments; every other function receives the
 * single return value of its right neighbour. `compose()` is the identity and `compose(f)`
 * returns `f` itself.
 *
 * `compose_chain` is the runtime counterpart over a sequence of callables of one type, used
 * by apply_middleware where the number of interceptors is only known at run time.
 */

#include <functional>
#include <utility>
#include <vector>

namespace statehub::store
{

inline auto compose()
{
    return [](auto arg) { return arg; };
}

template <typename F> F compose(F f)
{
    return f;
}

template <typename F, typename G, typename... Rest> auto compose(F f, G g, Rest... rest)
{
    return [outer = std::move(f), inner = compose(std::move(g), std::move(rest)...)](auto &&...args)
    { return outer(inner(std::forward<decltype(args)>(args)...)); };
}

template <typename T>
std::function<T(T)> compose_chain(std::vector<std::function<T(T)>> funcs)
{
    if (funcs.empty())
    {
        return [](T arg) { return arg; };
    }
    if (funcs.size() == 1)
    {
        return std::move(funcs.front());
    }
    return [funcs = std::move(funcs)](T arg)
    {
        for (auto it = funcs.rbegin(); it != funcs.rend(); ++it)
        {
            arg = (*it)(std::move(arg));
        }
        return arg;
    };
}

} // namespace statehub::store
