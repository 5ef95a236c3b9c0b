#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace pipeguard {

nlohmann::json Config::defaults_json() {
    return {
        {"cache", {
            {"max_size", 1000},
            {"default_ttl", 3600},
            {"plan_ttl", 3600},
            {"search_ttl", 7200},
            {"coalesce_misses", true}
        }},
        {"breaker", {
            {"failure_threshold", 5},
            {"recovery_timeout", 60}
        }},
        {"retry", {
            {"max_retries", 3},
            {"initial_delay", 2.0},
            {"max_delay", 10.0},
            {"backoff_base", 2.0}
        }},
        {"rate_limit", {
            {"requests_per_minute", 10},
            {"window_seconds", 60}
        }},
        {"tasks", {
            {"max_age_minutes", 60},
            {"cleanup_interval", 300},
            {"keepalive_seconds", 30}
        }}
    };
}

std::string config_path() {
    return expand_home("~/.pipeguard/config.json");
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static void read_uint(const nlohmann::json& obj, const char* key, uint32_t& out) {
    if (obj.contains(key) && obj[key].is_number_unsigned())
        out = obj[key].get<uint32_t>();
}

static void read_double(const nlohmann::json& obj, const char* key, double& out) {
    if (obj.contains(key) && obj[key].is_number())
        out = obj[key].get<double>();
}

static void env_uint(const char* name, uint32_t& out) {
    const char* v = std::getenv(name);
    if (!v) return;
    std::string text = trim(v);
    try {
        size_t used = 0;
        if (text.empty() || text[0] == '-') throw std::invalid_argument("not unsigned");
        unsigned long long parsed = std::stoull(text, &used);
        if (used != text.size()) throw std::invalid_argument("trailing characters");
        if (parsed > std::numeric_limits<uint32_t>::max()) throw std::out_of_range("too large");
        out = static_cast<uint32_t>(parsed);
    } catch (const std::exception&) {
        std::cerr << "[config] Ignoring invalid " << name << "=" << v << "\n";
    }
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;

    if (j.contains("cache") && j["cache"].is_object()) {
        auto& c = j["cache"];
        read_uint(c, "max_size", cfg.cache.max_size);
        read_uint(c, "default_ttl", cfg.cache.default_ttl);
        read_uint(c, "plan_ttl", cfg.cache.plan_ttl);
        read_uint(c, "search_ttl", cfg.cache.search_ttl);
        if (c.contains("coalesce_misses") && c["coalesce_misses"].is_boolean())
            cfg.cache.coalesce_misses = c["coalesce_misses"].get<bool>();
    }

    if (j.contains("breaker") && j["breaker"].is_object()) {
        auto& b = j["breaker"];
        read_uint(b, "failure_threshold", cfg.breaker.failure_threshold);
        read_uint(b, "recovery_timeout", cfg.breaker.recovery_timeout);
    }

    if (j.contains("retry") && j["retry"].is_object()) {
        auto& r = j["retry"];
        read_uint(r, "max_retries", cfg.retry.max_retries);
        read_double(r, "initial_delay", cfg.retry.initial_delay);
        read_double(r, "max_delay", cfg.retry.max_delay);
        read_double(r, "backoff_base", cfg.retry.backoff_base);
    }

    if (j.contains("rate_limit") && j["rate_limit"].is_object()) {
        auto& rl = j["rate_limit"];
        read_uint(rl, "requests_per_minute", cfg.rate_limit.requests_per_minute);
        read_uint(rl, "window_seconds", cfg.rate_limit.window_seconds);
    }

    if (j.contains("tasks") && j["tasks"].is_object()) {
        auto& t = j["tasks"];
        read_uint(t, "max_age_minutes", cfg.tasks.max_age_minutes);
        read_uint(t, "cleanup_interval", cfg.tasks.cleanup_interval);
        read_uint(t, "keepalive_seconds", cfg.tasks.keepalive_seconds);
    }

    return cfg;
}

Config Config::load() {
    std::string path = config_path();
    nlohmann::json j;

    std::ifstream file(path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                atomic_write_file(path, j.dump(4) + "\n");
                std::cerr << "[config] Migrated config with new defaults: " << path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed config, using defaults: " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << path << "\n";
        }
    }

    Config cfg = from_json(j);

    // Environment variables always override config file
    env_uint("PIPEGUARD_CACHE_MAX_SIZE", cfg.cache.max_size);
    env_uint("PIPEGUARD_MAX_RETRIES", cfg.retry.max_retries);
    env_uint("PIPEGUARD_RATE_LIMIT", cfg.rate_limit.requests_per_minute);

    return cfg;
}

} // namespace pipeguard
