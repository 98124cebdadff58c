#pragma once
/**
 * @file sth_service.hpp
 * @brief Layer 2: Service modules built on sth_base.
 *
 * Provides the asynchronous Logger (console and file sinks) and StoreConfig loading.
 * Include this when you need logging or configuration.
 */
#include "sth_base.hpp"

#include "utils/logger.hpp"
#include "utils/store_config.hpp"
