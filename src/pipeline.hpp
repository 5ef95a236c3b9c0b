#pragma once
#include "admission/rate_limiter.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <thread>
#include <mutex>
#include <atomic>
#include <memory>
#include <cstdint>

namespace pipeguard {

class TTLCache;
class Resilience;
class TaskManager;

struct SearchItem {
    std::string query;
    std::string reason;
};

struct SearchPlan {
    std::vector<SearchItem> searches;
};

nlohmann::json search_plan_to_json(const SearchPlan& plan);
SearchPlan search_plan_from_json(const nlohmann::json& j);

// The three upstream stages (LLM agents, implemented elsewhere).
class ResearchAgents {
public:
    virtual ~ResearchAgents() = default;
    virtual SearchPlan plan(const std::string& query) = 0;
    virtual std::string search(const SearchItem& item) = 0;
    virtual std::string write(const std::string& query,
                              const std::vector<std::string>& results) = 0;
};

// Dependency names used for circuit breakers.
namespace dependencies {
    constexpr const char* Planner  = "planner";
    constexpr const char* Searcher = "searcher";
    constexpr const char* Writer   = "writer";
} // namespace dependencies

struct PipelineOptions {
    uint32_t plan_ttl = 3600;
    uint32_t search_ttl = 7200;
};

// plan -> search -> write for one task, with caching, resilience and
// progress reporting.
class ResearchPipeline {
public:
    ResearchPipeline(ResearchAgents& agents, TTLCache& cache, Resilience& resilience,
                     TaskManager& tasks, PipelineOptions options = {});

    // Returns the report. On failure the task is marked failed with the error
    // message and the exception is rethrown.
    std::string run(const std::string& task_id, const std::string& query);

private:
    SearchPlan plan_searches(const std::string& query);
    std::vector<std::string> perform_searches(const std::string& task_id, const SearchPlan& plan);
    std::string search(const SearchItem& item);
    std::string write_report(const std::string& query, const std::vector<std::string>& results);

    ResearchAgents& agents_;
    TTLCache& cache_;
    Resilience& resilience_;
    TaskManager& tasks_;
    PipelineOptions options_;
};

struct StartResult {
    bool accepted = false;
    std::string task_id;   // empty when rejected
    RateLimitInfo rate_limit;
};

// Admission control + background execution of research jobs.
class ResearchService {
public:
    ResearchService(ResearchPipeline& pipeline, RateLimiter& limiter, TaskManager& tasks);
    ~ResearchService();

    ResearchService(const ResearchService&) = delete;
    ResearchService& operator=(const ResearchService&) = delete;

    // Rejected requests create no task and carry the limiter's info.
    StartResult start(const std::string& client_id, const std::string& query);

    // Join every worker started so far.
    void wait_all();

    // Workers not yet joined, after reaping finished ones.
    size_t worker_count();

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    // Must be called with mutex_ already held.
    void reap_finished_locked();

    ResearchPipeline& pipeline_;
    RateLimiter& limiter_;
    TaskManager& tasks_;
    std::vector<Worker> workers_;
    std::mutex mutex_;
};

} // namespace pipeguard
