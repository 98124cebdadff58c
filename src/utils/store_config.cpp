#include "sth_service.hpp"

#include <cstdlib>
#include <fstream>

namespace fs = std::filesystem;

namespace statehub::utils
{

namespace
{

using ConfigResult = Result<StoreConfig, ConfigError>;

// Reads an optional level-name member. Returns false (with `why` filled) on a bad value.
bool read_level(const nlohmann::json &section, const char *key, Logger::Level &out, std::string &why)
{
    if (!section.contains(key))
        return true;
    const auto &v = section.at(key);
    if (!v.is_string())
    {
        why = fmt::format("'{}' must be a string", key);
        return false;
    }
    auto lvl = parse_level(v.get_ref<const std::string &>());
    if (!lvl)
    {
        why = fmt::format("'{}' has unknown level '{}'", key, v.get_ref<const std::string &>());
        return false;
    }
    out = *lvl;
    return true;
}

bool read_bool(const nlohmann::json &section, const char *key, bool &out, std::string &why)
{
    if (!section.contains(key))
        return true;
    const auto &v = section.at(key);
    if (!v.is_boolean())
    {
        why = fmt::format("'{}' must be a boolean", key);
        return false;
    }
    out = v.get<bool>();
    return true;
}

} // anonymous namespace

const char *to_string(ConfigError err) noexcept
{
    switch (err)
    {
    case ConfigError::FileNotFound:
        return "FileNotFound";
    case ConfigError::ParseError:
        return "ParseError";
    case ConfigError::InvalidValue:
        return "InvalidValue";
    default:
        return "Unknown";
    }
}

std::optional<Logger::Level> parse_level(std::string_view name) noexcept
{
    if (name == "trace")
        return Logger::Level::L_TRACE;
    if (name == "debug")
        return Logger::Level::L_DEBUG;
    if (name == "info")
        return Logger::Level::L_INFO;
    if (name == "warn" || name == "warning")
        return Logger::Level::L_WARNING;
    if (name == "error")
        return Logger::Level::L_ERROR;
    if (name == "system")
        return Logger::Level::L_SYSTEM;
    return std::nullopt;
}

const char *level_name(Logger::Level lvl) noexcept
{
    switch (lvl)
    {
    case Logger::Level::L_TRACE:
        return "trace";
    case Logger::Level::L_DEBUG:
        return "debug";
    case Logger::Level::L_INFO:
        return "info";
    case Logger::Level::L_WARNING:
        return "warn";
    case Logger::Level::L_ERROR:
        return "error";
    case Logger::Level::L_SYSTEM:
        return "system";
    default:
        return "unknown";
    }
}

ConfigResult store_config_from_json(const nlohmann::json &j)
{
    StoreConfig cfg;
    std::string why;

    if (!j.is_object())
        return ConfigResult::error(ConfigError::InvalidValue, "top-level value must be an object");

    if (j.contains("logging"))
    {
        const auto &l = j.at("logging");
        if (!l.is_object())
            return ConfigResult::error(ConfigError::InvalidValue, "'logging' must be an object");
        if (!read_level(l, "level", cfg.log_level, why))
            return ConfigResult::error(ConfigError::InvalidValue, "logging: " + why);
        if (l.contains("file"))
        {
            if (!l.at("file").is_string())
                return ConfigResult::error(ConfigError::InvalidValue, "logging: 'file' must be a string");
            cfg.log_file = l.at("file").get<std::string>();
        }
        if (l.contains("queue_size"))
        {
            const auto &q = l.at("queue_size");
            if (!q.is_number_unsigned() || q.get<size_t>() == 0)
                return ConfigResult::error(ConfigError::InvalidValue,
                                           "logging: 'queue_size' must be a positive integer");
            cfg.log_queue_size = q.get<size_t>();
        }
    }

    if (j.contains("action_log"))
    {
        const auto &a = j.at("action_log");
        if (!a.is_object())
            return ConfigResult::error(ConfigError::InvalidValue, "'action_log' must be an object");
        if (!read_bool(a, "enabled", cfg.action_log.enabled, why) ||
            !read_bool(a, "log_payload", cfg.action_log.log_payload, why) ||
            !read_level(a, "level", cfg.action_log.level, why))
        {
            return ConfigResult::error(ConfigError::InvalidValue, "action_log: " + why);
        }
        if (a.contains("ignored_types"))
        {
            const auto &types = a.at("ignored_types");
            if (!types.is_array())
                return ConfigResult::error(ConfigError::InvalidValue,
                                           "action_log: 'ignored_types' must be an array");
            for (const auto &t : types)
            {
                if (!t.is_string())
                    return ConfigResult::error(ConfigError::InvalidValue,
                                               "action_log: 'ignored_types' entries must be strings");
                cfg.action_log.ignored_types.push_back(t.get<std::string>());
            }
        }
    }

    return ConfigResult::ok(std::move(cfg));
}

ConfigResult load_store_config(const fs::path &path)
{
    std::ifstream f(path);
    if (!f.is_open())
        return ConfigResult::error(ConfigError::FileNotFound, path.string());

    nlohmann::json j;
    try
    {
        f >> j;
    }
    catch (const nlohmann::json::parse_error &e)
    {
        return ConfigResult::error(ConfigError::ParseError, fmt::format("{}: {}", path.string(), e.what()));
    }

    auto result = store_config_from_json(j);
    if (result.is_ok())
    {
        LOGGER_INFO("StoreConfig: loaded '{}'", path.string());
        apply_env_overrides(result.content());
    }
    return result;
}

void apply_env_overrides(StoreConfig &cfg)
{
    if (const char *env = std::getenv("STATEHUB_LOG_LEVEL"))
    {
        if (auto lvl = parse_level(env))
        {
            cfg.log_level = *lvl;
        }
        else
        {
            LOGGER_WARN("StoreConfig: ignoring STATEHUB_LOG_LEVEL='{}' (unknown level)", env);
        }
    }
}

bool apply_logging_config(const StoreConfig &cfg)
{
    auto &logger = Logger::instance();
    logger.set_level(cfg.log_level);
    logger.set_max_queue_size(cfg.log_queue_size);
    if (cfg.log_file.empty())
        return true;
    if (!logger.set_logfile(cfg.log_file))
    {
        LOGGER_ERROR("StoreConfig: cannot open log file '{}'; keeping current sink", cfg.log_file);
        return false;
    }
    return true;
}

} // namespace statehub::utils
