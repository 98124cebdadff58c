#pragma once

/**
 * @file store_config.hpp
 * @brief StoreConfig: logging and action-log settings for applications built on statehub.
 *
 * ## Config loading (priority low -> high)
 *
 *  1. Built-in C++ defaults (the member initializers below)
 *  2. The JSON file passed to `load_store_config()`
 *  3. `STATEHUB_LOG_LEVEL` env var, overriding `logging.level`
 *
 * ## File format
 * @code
 *  {
 *    "logging":    { "level": "info", "file": "logs/app.log", "queue_size": 10000 },
 *    "action_log": { "enabled": true, "level": "debug", "log_payload": false,
 *                    "ignored_types": ["TICK"] }
 *  }
 * @endcode
 *
 * Unknown keys are ignored. Known keys with the wrong JSON type, or level names that are not
 * one of trace/debug/info/warn/error/system, make loading fail with ConfigError::InvalidValue.
 */

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "statehub_utils_export.h"
#include "utils/logger.hpp"
#include "utils/result.hpp"

namespace statehub::utils
{

enum class ConfigError
{
    FileNotFound, ///< Config file missing or unreadable
    ParseError,   ///< File is not valid JSON
    InvalidValue  ///< Valid JSON, but a known key has an unusable value
};

STATEHUB_UTILS_EXPORT const char *to_string(ConfigError err) noexcept;

/// Settings for the action-logging middleware (see store/action_logger.hpp).
struct ActionLogOptions
{
    bool enabled{true};
    Logger::Level level{Logger::Level::L_DEBUG};
    bool log_payload{false};
    std::vector<std::string> ignored_types;
};

struct StoreConfig
{
    Logger::Level log_level{Logger::Level::L_INFO};
    std::string log_file; ///< Empty keeps the current sink.
    size_t log_queue_size{10000};
    ActionLogOptions action_log;
};

/// Parses "trace", "debug", "info", "warn" (or "warning"), "error", "system"; case-sensitive.
STATEHUB_UTILS_EXPORT std::optional<Logger::Level> parse_level(std::string_view name) noexcept;

STATEHUB_UTILS_EXPORT const char *level_name(Logger::Level lvl) noexcept;

/// Builds a config from an already-parsed document, starting from the built-in defaults.
STATEHUB_UTILS_EXPORT Result<StoreConfig, ConfigError> store_config_from_json(const nlohmann::json &j);

/// Reads `path`, applies it over the defaults, then applies the environment overrides.
STATEHUB_UTILS_EXPORT Result<StoreConfig, ConfigError> load_store_config(const std::filesystem::path &path);

/**
 * @brief Applies `STATEHUB_LOG_LEVEL` to `cfg`. An unrecognized value is reported through the
 *        Logger and ignored.
 */
STATEHUB_UTILS_EXPORT void apply_env_overrides(StoreConfig &cfg);

/**
 * @brief Sets the Logger level and queue bound and, when `cfg.log_file` is non-empty, switches to a file sink.
 * @return false if the log file could not be opened.
 */
STATEHUB_UTILS_EXPORT bool apply_logging_config(const StoreConfig &cfg);

} // namespace statehub::utils
