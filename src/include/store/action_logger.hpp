#pragma once

/**
 * @file action_logger.hpp
 * @brief Middleware that reports every dispatched action through the Logger.
 *
 * Typical setup, driven by a config file:
 * @code
 *  auto cfg = statehub::utils::load_store_config("statehub.json");
 *  auto store = create_store<AppState>(
 *      reducer, std::nullopt,
 *      apply_middleware<AppState>({make_action_logger<AppState>(cfg.content().action_log)}));
 * @endcode
 *
 * Bootstrap rounds go straight to the engine and are never seen by middleware.
 */

#include <algorithm>
#include <chrono>

#include "store/apply_middleware.hpp"
#include "utils/format_tools.hpp"
#include "utils/logger.hpp"
#include "utils/store_config.hpp"

namespace statehub::store
{

template <typename State>
Middleware<State> make_action_logger(utils::ActionLogOptions options = {})
{
    return [options = std::move(options)](const MiddlewareAPI<State> &) -> Interceptor
    {
        return [options](Dispatch next) -> Dispatch
        {
            if (!options.enabled)
            {
                return next;
            }
            return [options, next = std::move(next)](const Action &action) -> Action
            {
                const std::string type = action_type_name(action);
                const auto &ignored = options.ignored_types;
                if (std::find(ignored.begin(), ignored.end(), type) != ignored.end())
                {
                    return next(action);
                }

                auto &logger = utils::Logger::instance();
                if (options.log_payload)
                {
                    logger.log_fmt_runtime(options.level, "dispatch '{}': {}", type, action.dump());
                }
                else
                {
                    logger.log_fmt_runtime(options.level, "dispatch '{}'", type);
                }

                const auto start = std::chrono::steady_clock::now();
                try
                {
                    Action result = next(action);
                    logger.log_fmt_runtime(options.level, "dispatch '{}' done in {}", type,
                                           format_tools::formatted_duration(std::chrono::steady_clock::now() - start));
                    return result;
                }
                catch (const std::exception &e)
                {
                    LOGGER_ERROR("dispatch '{}' failed: {}", type, e.what());
                    throw;
                }
            };
        };
    };
}

} // namespace statehub::store
