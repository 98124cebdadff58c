#pragma once
/**
 * @file sth_store.hpp
 * @brief Layer 3: the state container built on sth_service.
 *
 * Provides the action model, compose, the store engine and facade, apply_middleware, the
 * observable view and the action-logger middleware. Include this to build stores.
 */
#include "sth_service.hpp"

#include "store/store_error.hpp"
#include "store/action.hpp"
#include "store/compose.hpp"
#include "store/store.hpp"
#include "store/apply_middleware.hpp"
#include "store/observable.hpp"
#include "store/action_logger.hpp"
