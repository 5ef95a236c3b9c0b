#include "pipeline.hpp"
#include "cache/cache_key.hpp"
#include "cache/ttl_cache.hpp"
#include "resilience/resilience.hpp"
#include "tasks/task_manager.hpp"
#include <iostream>

namespace pipeguard {

nlohmann::json search_plan_to_json(const SearchPlan& plan) {
    nlohmann::json searches = nlohmann::json::array();
    for (const auto& item : plan.searches) {
        searches.push_back({{"query", item.query}, {"reason", item.reason}});
    }
    return {{"searches", searches}};
}

SearchPlan search_plan_from_json(const nlohmann::json& j) {
    SearchPlan plan;
    if (!j.contains("searches") || !j["searches"].is_array()) return plan;
    for (const auto& item : j["searches"]) {
        plan.searches.push_back(SearchItem{
            item.value("query", std::string{}),
            item.value("reason", std::string{})
        });
    }
    return plan;
}

// ── ResearchPipeline ─────────────────────────────────────────────

ResearchPipeline::ResearchPipeline(ResearchAgents& agents, TTLCache& cache,
                                   Resilience& resilience, TaskManager& tasks,
                                   PipelineOptions options)
    : agents_(agents), cache_(cache), resilience_(resilience), tasks_(tasks),
      options_(options)
{}

std::string ResearchPipeline::run(const std::string& task_id, const std::string& query) {
    try {
        TaskUpdate planning;
        planning.status = TaskStatus::Planning;
        planning.current_step = "Planning searches...";
        planning.percent = 10;
        tasks_.update_task(task_id, planning);

        SearchPlan plan = plan_searches(query);

        TaskUpdate searching;
        searching.status = TaskStatus::Searching;
        searching.current_step = "Found " + std::to_string(plan.searches.size())
                               + " searches to perform";
        searching.percent = 30;
        tasks_.update_task(task_id, searching);

        auto results = perform_searches(task_id, plan);

        TaskUpdate writing;
        writing.status = TaskStatus::Writing;
        writing.current_step = "Writing report...";
        writing.percent = 70;
        tasks_.update_task(task_id, writing);

        std::string report = write_report(query, results);

        TaskUpdate completed;
        completed.status = TaskStatus::Completed;
        completed.current_step = "Research complete";
        completed.percent = 100;
        completed.result = report;
        tasks_.update_task(task_id, completed);
        return report;
    } catch (const BreakerOpenError& e) {
        TaskUpdate failed;
        failed.status = TaskStatus::Failed;
        failed.current_step = "Service temporarily unavailable";
        failed.error = e.what();
        tasks_.update_task(task_id, failed);
        throw;
    } catch (const std::exception& e) {
        TaskUpdate failed;
        failed.status = TaskStatus::Failed;
        failed.current_step = "Research failed";
        failed.error = e.what();
        tasks_.update_task(task_id, failed);
        throw;
    }
}

SearchPlan ResearchPipeline::plan_searches(const std::string& query) {
    auto value = cache_.get_or_compute(make_cache_key("plan", query), [&]() {
        std::cerr << "[pipeline] Planning searches...\n";
        SearchPlan plan = resilience_.with_resilience(dependencies::Planner,
            [&]() { return agents_.plan(query); });
        std::cerr << "[pipeline] Will perform " << plan.searches.size() << " searches\n";
        return search_plan_to_json(plan);
    }, options_.plan_ttl);
    return search_plan_from_json(value);
}

std::vector<std::string> ResearchPipeline::perform_searches(const std::string& task_id,
                                                            const SearchPlan& plan) {
    std::vector<std::string> results;
    size_t total = plan.searches.size();
    results.reserve(total);

    for (size_t idx = 0; idx < total; ++idx) {
        const auto& item = plan.searches[idx];

        TaskUpdate progress;
        progress.current_step = "Searching: " + item.query + " ("
                              + std::to_string(idx + 1) + "/" + std::to_string(total) + ")";
        progress.percent = 30 + static_cast<int>(idx * 35 / total); // 30-65% for searches
        tasks_.update_task(task_id, progress);

        results.push_back(search(item));
    }
    return results;
}

std::string ResearchPipeline::search(const SearchItem& item) {
    auto value = cache_.get_or_compute(make_cache_key("search", item.query), [&]() {
        std::cerr << "[pipeline] Searching for: " << item.query << "\n";
        std::string summary = resilience_.with_resilience(dependencies::Searcher,
            [&]() { return agents_.search(item); });
        return nlohmann::json(summary);
    }, options_.search_ttl);
    return value.get<std::string>();
}

std::string ResearchPipeline::write_report(const std::string& query,
                                           const std::vector<std::string>& results) {
    std::cerr << "[pipeline] Writing report...\n";
    return resilience_.with_resilience(dependencies::Writer,
        [&]() { return agents_.write(query, results); });
}

// ── ResearchService ──────────────────────────────────────────────

ResearchService::ResearchService(ResearchPipeline& pipeline, RateLimiter& limiter,
                                 TaskManager& tasks)
    : pipeline_(pipeline), limiter_(limiter), tasks_(tasks)
{}

ResearchService::~ResearchService() {
    wait_all();
}

StartResult ResearchService::start(const std::string& client_id, const std::string& query) {
    StartResult out;
    out.rate_limit = limiter_.check_rate_limit(client_id);
    if (!out.rate_limit.allowed) return out;

    Task task = tasks_.create_task();
    out.accepted = true;
    out.task_id = task.task_id;

    auto done = std::make_shared<std::atomic<bool>>(false);

    std::lock_guard<std::mutex> lock(mutex_);
    reap_finished_locked();
    std::thread worker([this, task_id = task.task_id, query, done]() {
        try {
            pipeline_.run(task_id, query);
        } catch (const std::exception& e) {
            // Already recorded on the task; nothing upstream to rethrow to.
            std::cerr << "[pipeline] Task " << task_id << " failed: " << e.what() << "\n";
        }
        done->store(true);
    });
    workers_.push_back(Worker{std::move(worker), done});
    return out;
}

void ResearchService::reap_finished_locked() {
    for (auto it = workers_.begin(); it != workers_.end(); ) {
        if (it->done->load()) {
            if (it->thread.joinable()) it->thread.join();
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

size_t ResearchService::worker_count() {
    std::lock_guard<std::mutex> lock(mutex_);
    reap_finished_locked();
    return workers_.size();
}

void ResearchService::wait_all() {
    std::vector<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        workers.swap(workers_);
    }
    for (auto& worker : workers) {
        if (worker.thread.joinable()) worker.thread.join();
    }
}

} // namespace pipeguard
