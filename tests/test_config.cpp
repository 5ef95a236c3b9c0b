#include <catch2/catch.hpp>
#include "config.hpp"
#include <fstream>
#include <filesystem>
#include <sstream>
#include <cstdlib>
#include <unistd.h>
#include <nlohmann/json.hpp>

using namespace pipeguard;

// ── Default values ───────────────────────────────────────────────

TEST_CASE("Config: default values are sensible", "[config]") {
    Config cfg;
    REQUIRE(cfg.cache.max_size == 1000);
    REQUIRE(cfg.cache.default_ttl == 3600);
    REQUIRE(cfg.cache.plan_ttl == 3600);
    REQUIRE(cfg.cache.search_ttl == 7200);
    REQUIRE(cfg.cache.coalesce_misses);
    REQUIRE(cfg.breaker.failure_threshold == 5);
    REQUIRE(cfg.breaker.recovery_timeout == 60);
    REQUIRE(cfg.retry.max_retries == 3);
    REQUIRE(cfg.retry.initial_delay == 2.0);
    REQUIRE(cfg.retry.max_delay == 10.0);
    REQUIRE(cfg.rate_limit.requests_per_minute == 10);
    REQUIRE(cfg.rate_limit.window_seconds == 60);
    REQUIRE(cfg.tasks.max_age_minutes == 60);
}

TEST_CASE("Config::defaults_json: matches struct defaults", "[config]") {
    Config from_defaults = Config::from_json(Config::defaults_json());
    Config plain;
    REQUIRE(from_defaults.cache.max_size == plain.cache.max_size);
    REQUIRE(from_defaults.retry.backoff_base == plain.retry.backoff_base);
    REQUIRE(from_defaults.tasks.cleanup_interval == plain.tasks.cleanup_interval);
    REQUIRE(from_defaults.tasks.keepalive_seconds == plain.tasks.keepalive_seconds);
}

// ── from_json ────────────────────────────────────────────────────

TEST_CASE("Config::from_json: reads every section", "[config]") {
    auto j = nlohmann::json::parse(R"({
        "cache": {"max_size": 50, "default_ttl": 10, "coalesce_misses": false},
        "breaker": {"failure_threshold": 2, "recovery_timeout": 5},
        "retry": {"max_retries": 1, "initial_delay": 0.5, "max_delay": 4, "backoff_base": 3},
        "rate_limit": {"requests_per_minute": 100, "window_seconds": 30},
        "tasks": {"max_age_minutes": 5, "cleanup_interval": 20, "keepalive_seconds": 1}
    })");
    Config cfg = Config::from_json(j);
    REQUIRE(cfg.cache.max_size == 50);
    REQUIRE(cfg.cache.default_ttl == 10);
    REQUIRE_FALSE(cfg.cache.coalesce_misses);
    REQUIRE(cfg.breaker.failure_threshold == 2);
    REQUIRE(cfg.breaker.recovery_timeout == 5);
    REQUIRE(cfg.retry.max_retries == 1);
    REQUIRE(cfg.retry.initial_delay == 0.5);
    REQUIRE(cfg.retry.max_delay == 4.0);
    REQUIRE(cfg.retry.backoff_base == 3.0);
    REQUIRE(cfg.rate_limit.requests_per_minute == 100);
    REQUIRE(cfg.rate_limit.window_seconds == 30);
    REQUIRE(cfg.tasks.max_age_minutes == 5);
    REQUIRE(cfg.tasks.cleanup_interval == 20);
    REQUIRE(cfg.tasks.keepalive_seconds == 1);
}

TEST_CASE("Config::from_json: mistyped values keep defaults", "[config]") {
    auto j = nlohmann::json::parse(R"({
        "cache": {"max_size": "lots", "coalesce_misses": "no"},
        "breaker": {"failure_threshold": -3},
        "retry": "not an object"
    })");
    Config cfg = Config::from_json(j);
    REQUIRE(cfg.cache.max_size == 1000);
    REQUIRE(cfg.cache.coalesce_misses);
    REQUIRE(cfg.breaker.failure_threshold == 5);
    REQUIRE(cfg.retry.max_retries == 3);
}

// ── Config::load ────────────────────────────────────────────────

// Helper: create a temp directory
static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "pipeguard_cfg_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

// RAII guard: redirects HOME to a temp dir, clears env vars, restores on destruction
struct ConfigTestGuard {
    std::string dir;
    std::string old_home;

    ConfigTestGuard() {
        dir = make_temp_dir();
        old_home = std::getenv("HOME") ? std::getenv("HOME") : "";
        setenv("HOME", dir.c_str(), 1);
        unsetenv("PIPEGUARD_CACHE_MAX_SIZE");
        unsetenv("PIPEGUARD_MAX_RETRIES");
        unsetenv("PIPEGUARD_RATE_LIMIT");
    }

    ~ConfigTestGuard() {
        setenv("HOME", old_home.c_str(), 1);
        unsetenv("PIPEGUARD_CACHE_MAX_SIZE");
        unsetenv("PIPEGUARD_MAX_RETRIES");
        unsetenv("PIPEGUARD_RATE_LIMIT");
        std::filesystem::remove_all(dir);
    }

    ConfigTestGuard(const ConfigTestGuard&) = delete;
    ConfigTestGuard& operator=(const ConfigTestGuard&) = delete;

    std::string config_path() const { return dir + "/.pipeguard/config.json"; }

    void write_config(const std::string& content) {
        std::filesystem::create_directories(dir + "/.pipeguard");
        std::ofstream f(config_path());
        f << content;
    }

    nlohmann::json read_config() const {
        std::ifstream f(config_path());
        return nlohmann::json::parse(f);
    }
};

TEST_CASE("config_path: lives under HOME", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());
    REQUIRE(config_path() == g.config_path());
}

TEST_CASE("Config::load: missing file creates defaults", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    Config cfg = Config::load();
    REQUIRE(cfg.cache.max_size == 1000);
    REQUIRE(std::filesystem::exists(g.config_path()));
    REQUIRE(g.read_config() == Config::defaults_json());
}

TEST_CASE("Config::load: reads values from file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"cache": {"max_size": 25}, "breaker": {"failure_threshold": 3}})");
    Config cfg = Config::load();
    REQUIRE(cfg.cache.max_size == 25);
    REQUIRE(cfg.breaker.failure_threshold == 3);
    REQUIRE(cfg.rate_limit.requests_per_minute == 10);
}

TEST_CASE("Config::load: migrates file with missing defaults", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"cache": {"max_size": 25}})");
    Config::load();

    auto written = g.read_config();
    REQUIRE(written["cache"]["max_size"] == 25);
    REQUIRE(written["cache"]["default_ttl"] == 3600);
    REQUIRE(written.contains("retry"));
    REQUIRE(written["tasks"]["max_age_minutes"] == 60);
}

TEST_CASE("Config::load: malformed JSON falls back to defaults", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config("not valid json {{{");
    Config cfg = Config::load();
    REQUIRE(cfg.cache.max_size == 1000);
    REQUIRE(cfg.retry.max_retries == 3);
}

TEST_CASE("Config::load: env vars override file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"cache": {"max_size": 25}, "retry": {"max_retries": 1}})");
    setenv("PIPEGUARD_CACHE_MAX_SIZE", "500", 1);
    setenv("PIPEGUARD_MAX_RETRIES", "7", 1);
    setenv("PIPEGUARD_RATE_LIMIT", "42", 1);

    Config cfg = Config::load();
    REQUIRE(cfg.cache.max_size == 500);
    REQUIRE(cfg.retry.max_retries == 7);
    REQUIRE(cfg.rate_limit.requests_per_minute == 42);
}

TEST_CASE("Config::load: invalid env value is ignored", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    setenv("PIPEGUARD_RATE_LIMIT", "many", 1);
    Config cfg = Config::load();
    REQUIRE(cfg.rate_limit.requests_per_minute == 10);
}

TEST_CASE("Config::load: negative env value is ignored", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    setenv("PIPEGUARD_RATE_LIMIT", "-1", 1);
    setenv("PIPEGUARD_MAX_RETRIES", " -3", 1);
    Config cfg = Config::load();
    REQUIRE(cfg.rate_limit.requests_per_minute == 10);
    REQUIRE(cfg.retry.max_retries == 3);
}

TEST_CASE("Config::load: env value beyond 32 bits or with junk is ignored", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    setenv("PIPEGUARD_CACHE_MAX_SIZE", "4294967296", 1);
    setenv("PIPEGUARD_RATE_LIMIT", "12abc", 1);
    Config cfg = Config::load();
    REQUIRE(cfg.cache.max_size == 1000);
    REQUIRE(cfg.rate_limit.requests_per_minute == 10);
}

TEST_CASE("Config::load: largest 32-bit env value is accepted", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    setenv("PIPEGUARD_CACHE_MAX_SIZE", "4294967295", 1);
    Config cfg = Config::load();
    REQUIRE(cfg.cache.max_size == 4294967295u);
}
