#include "commands.hpp"
#include "runtime.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <iomanip>
#include <sstream>

namespace pipeguard {

std::string cmd_status(Runtime& runtime) {
    auto stats = runtime.cache().get_stats();
    auto limits = runtime.limiter().get_stats();

    size_t open_breakers = 0;
    auto states = runtime.breakers().states();
    for (const auto& s : states) {
        if (s.is_open) open_breakers++;
    }

    std::ostringstream hit_rate;
    hit_rate << std::fixed << std::setprecision(1) << stats.hit_rate;

    return "Cache: " + std::to_string(stats.size) + "/" + std::to_string(stats.max_size)
        + " entries, hit rate " + hit_rate.str() + "%\n"
        + "Breakers: " + std::to_string(states.size()) + " tracked, "
        + std::to_string(open_breakers) + " open\n"
        + "Rate limit: " + std::to_string(limits.active_clients) + " active clients, "
        + std::to_string(limits.total_requests_last_window) + " requests in window\n"
        + "Tasks: " + std::to_string(runtime.tasks().task_count()) + "\n"
        + "Janitor: " + (runtime.janitor().running() ? "running" : "stopped")
        + " (" + std::to_string(runtime.janitor().sweeps()) + " sweeps)\n";
}

std::string cmd_cache(Runtime& runtime) {
    return cache_stats_to_json(runtime.cache().get_stats()).dump(2);
}

std::string cmd_breakers(Runtime& runtime) {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& state : runtime.breakers().states()) {
        out[state.name] = breaker_state_to_json(state);
    }
    return out.dump(2);
}

std::string cmd_limits(Runtime& runtime) {
    return rate_limiter_stats_to_json(runtime.limiter().get_stats()).dump(2);
}

std::string cmd_task(Runtime& runtime, const std::string& task_id) {
    auto task = runtime.tasks().get_task(task_id);
    if (!task) return "Task not found: " + task_id;
    return task_to_json(*task).dump(2);
}

std::string cmd_cache_clear(Runtime& runtime) {
    runtime.cache().clear();
    return "Cache cleared.";
}

std::string cmd_breaker_reset(Runtime& runtime, const std::string& name) {
    if (!runtime.breakers().reset(name)) return "No breaker named: " + name;
    return "Breaker reset: " + name;
}

std::string cmd_reset_client(Runtime& runtime, const std::string& client_id) {
    runtime.limiter().reset_client(client_id);
    return "Rate limit reset for: " + client_id;
}

std::string cmd_sweep(Runtime& runtime) {
    auto report = runtime.janitor().run_once();
    nlohmann::json j = {
        {"expired_entries", report.expired_entries},
        {"removed_tasks",   report.removed_tasks},
        {"idle_clients",    report.idle_clients}
    };
    return j.dump(2);
}

std::string handle_command(Runtime& runtime, const std::string& line) {
    auto input = trim(line);
    auto space = input.find(' ');
    std::string name = (space == std::string::npos) ? input : input.substr(0, space);
    std::string args = (space == std::string::npos) ? "" : trim(input.substr(space + 1));

    if (name == "/status") return cmd_status(runtime);
    if (name == "/cache") {
        if (args == "clear") return cmd_cache_clear(runtime);
        return cmd_cache(runtime);
    }
    if (name == "/breakers") return cmd_breakers(runtime);
    if (name == "/limits") return cmd_limits(runtime);
    if (name == "/sweep") return cmd_sweep(runtime);

    if (name == "/task" || name == "/reset" || name == "/breaker-reset") {
        if (args.empty()) return "Usage: " + name + " <id>";
        if (name == "/task") return cmd_task(runtime, args);
        if (name == "/reset") return cmd_reset_client(runtime, args);
        return cmd_breaker_reset(runtime, args);
    }

    return "Unknown command: " + input;
}

} // namespace pipeguard
