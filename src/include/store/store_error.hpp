#pragma once

/**
 * @file store_error.hpp
 * @brief StoreError, the single exception type thrown by the store, create_store and the
 *        middleware chain. `kind()` tells the contract violations apart.
 */

#include <stdexcept>
#include <string>

#include "statehub_utils_export.h"

namespace statehub::store
{

/**
 * @brief Contract violations raised by the store, its middleware chain and create_store.
 */
enum class ErrorKind
{
    InvalidArgument,    ///< An empty callable where a function was required
    InvalidAction,      ///< Action is not a plain record, or has no "type"
    IllegalStateAccess, ///< Read/subscribe/unsubscribe/dispatch while the reducer is running
    PrematureDispatch   ///< Middleware dispatched before the chain was built
};

STATEHUB_UTILS_EXPORT const char *to_string(ErrorKind kind) noexcept;

class STATEHUB_UTILS_EXPORT StoreError : public std::runtime_error
{
  public:
    StoreError(ErrorKind kind, const std::string &message);

    [[nodiscard]] ErrorKind kind() const noexcept { return m_kind; }

  private:
    ErrorKind m_kind;
};

} // namespace statehub::store
