/**
 * @file counter_example.cpp
 * @brief Example: a todo-list store with the action logger and a state observer.
 *
 * Usage: counter_example [config.json]
 *
 * With a config file (see config/statehub.json) the Logger level, log file and action-log
 * options come from it; otherwise the built-in defaults apply.
 */
#include "sth_store.hpp"

#include <iostream>

using namespace statehub::store;
using namespace statehub::utils;

// ─── Reducer ──────────────────────────────────────────────────────────────────

nlohmann::json todos_reducer(const nlohmann::json &state, const Action &action)
{
    nlohmann::json next = state.is_null() ? nlohmann::json{{"todos", nlohmann::json::array()}, {"done", 0}} : state;

    const auto &type = action.at("type");
    if (type == "ADD_TODO")
    {
        next["todos"].push_back(nlohmann::json{{"text", action.at("payload")}, {"done", false}});
    }
    else if (type == "COMPLETE_TODO")
    {
        const auto index = action.at("payload").get<size_t>();
        auto &todos = next["todos"];
        if (index < todos.size() && !todos[index]["done"].get<bool>())
        {
            todos[index]["done"] = true;
            next["done"] = next["done"].get<int>() + 1;
        }
    }
    return next;
}

// ─── Main ─────────────────────────────────────────────────────────────────────

int main(int argc, char **argv)
{
    StoreConfig config;
    if (argc > 1)
    {
        auto loaded = load_store_config(argv[1]);
        if (loaded.is_error())
        {
            std::cerr << "config: " << to_string(loaded.error()) << " (" << loaded.error_message() << ")\n";
            return 1;
        }
        config = std::move(loaded).content();
    }
    else
    {
        apply_env_overrides(config);
    }
    if (!apply_logging_config(config))
        return 1;

    try
    {
        auto store = create_store<nlohmann::json>(
            todos_reducer, std::nullopt,
            apply_middleware<nlohmann::json>({make_action_logger<nlohmann::json>(config.action_log)}));

        auto subscription = store.observable().subscribe(Observer<nlohmann::json>{
            [](const nlohmann::json &state)
            {
                std::cout << state.at("done").get<int>() << "/" << state.at("todos").size() << " done\n";
            }});

        store.dispatch(make_action("ADD_TODO", "read the docs"));
        store.dispatch(make_action("ADD_TODO", "write a reducer"));
        store.dispatch(make_action("COMPLETE_TODO", 0));

        subscription.unsubscribe();
        std::cout << store.get_state().dump(2) << "\n";
    }
    catch (const StoreError &e)
    {
        LOGGER_ERROR("store error {}: {}", to_string(e.kind()), e.what());
        Logger::instance().flush();
        return 1;
    }

    Logger::instance().flush();
    return 0;
}
