#pragma once

/**
 * @file action.hpp
 * @brief The action model: actions are JSON objects identified by their "type" member.
 */

#include <string>

#include <nlohmann/json.hpp>

#include "statehub_utils_export.h"

namespace statehub::store
{

using Action = nlohmann::json;

/// Name of the discriminant member every action must carry.
inline constexpr const char *kActionTypeKey = "type";

/**
 * @brief True only for structural key/value records, i.e. JSON objects.
 *
 * Arrays, strings, numbers, booleans, binary values and null are rejected.
 */
[[nodiscard]] inline bool is_plain_record(const Action &value) noexcept
{
    return value.is_object();
}

/// True when `action` is a plain record carrying a "type" member (of any value).
[[nodiscard]] inline bool has_action_type(const Action &action) noexcept
{
    return action.is_object() && action.contains(kActionTypeKey);
}

/**
 * @brief Human-readable rendering of an action's type for log lines: the string itself for
 *        string types, the serialized value otherwise, "<none>" when absent.
 */
STATEHUB_UTILS_EXPORT std::string action_type_name(const Action &action);

/// Builds `{"type": type}`.
[[nodiscard]] inline Action make_action(std::string type)
{
    return Action{{kActionTypeKey, std::move(type)}};
}

/// Builds `{"type": type, "payload": payload}`.
[[nodiscard]] inline Action make_action(std::string type, nlohmann::json payload)
{
    return Action{{kActionTypeKey, std::move(type)}, {"payload", std::move(payload)}};
}

/**
 * @brief Reserved action types used by the store's bootstrap rounds.
 *
 * Both carry a random suffix chosen once per process ("@@statehub/INIT3.k.f.q.z"), so no
 * application-defined type can collide with them. Reducers must treat unknown types,
 * including these, by returning their current (or initial) state.
 */
namespace action_types
{
STATEHUB_UTILS_EXPORT const std::string &init();
STATEHUB_UTILS_EXPORT const std::string &replace();

/// True for either reserved type.
STATEHUB_UTILS_EXPORT bool is_reserved(const Action &action);
} // namespace action_types

} // namespace statehub::store
