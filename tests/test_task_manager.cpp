#include <catch2/catch.hpp>
#include "tasks/task_manager.hpp"
#include "mock_clock.hpp"
#include <chrono>
#include <thread>

using namespace pipeguard;

namespace {

TaskUpdate step(TaskStatus status, const std::string& text, int percent) {
    TaskUpdate u;
    u.status = status;
    u.current_step = text;
    u.percent = percent;
    return u;
}

} // namespace

// ── Task vocabulary ──────────────────────────────────────────────

TEST_CASE("TaskStatus: wire names", "[tasks]") {
    REQUIRE(std::string(task_status_name(TaskStatus::Planning)) == "planning");
    REQUIRE(std::string(task_status_name(TaskStatus::Searching)) == "searching");
    REQUIRE(std::string(task_status_name(TaskStatus::Failed)) == "failed");
}

TEST_CASE("TaskStatus: only completed and failed are terminal", "[tasks]") {
    REQUIRE_FALSE(is_terminal(TaskStatus::Planning));
    REQUIRE_FALSE(is_terminal(TaskStatus::Searching));
    REQUIRE_FALSE(is_terminal(TaskStatus::Writing));
    REQUIRE(is_terminal(TaskStatus::Completed));
    REQUIRE(is_terminal(TaskStatus::Failed));
}

TEST_CASE("apply_update: only engaged fields change, percent is clamped", "[tasks]") {
    Task task;
    TaskUpdate u;
    u.percent = 150;
    apply_update(task, u);
    REQUIRE(task.percent == 100);
    REQUIRE(task.status == TaskStatus::Planning);
    REQUIRE(task.current_step == "Starting...");

    u.percent = -5;
    apply_update(task, u);
    REQUIRE(task.percent == 0);
}

TEST_CASE("task_to_json: null result and error until set", "[tasks]") {
    Task task;
    task.task_id = "t1";
    auto j = task_to_json(task);
    REQUIRE(j["task_id"] == "t1");
    REQUIRE(j["status"] == "planning");
    REQUIRE(j["result"].is_null());
    REQUIRE(j["error"].is_null());

    task.result = "report";
    REQUIRE(task_to_json(task)["result"] == "report");
}

// ── create / update / get ────────────────────────────────────────

TEST_CASE("TaskManager: create_task starts in planning", "[tasks]") {
    ManualClock clock;
    TaskManager tasks(clock);
    Task task = tasks.create_task("t1");
    REQUIRE(task.task_id == "t1");
    REQUIRE(task.status == TaskStatus::Planning);
    REQUIRE(task.current_step == "Starting...");
    REQUIRE(task.percent == 0);
    REQUIRE(task.created_at == clock.now());
    REQUIRE(tasks.get_task("t1").has_value());
}

TEST_CASE("TaskManager: generated ids are distinct", "[tasks]") {
    ManualClock clock;
    TaskManager tasks(clock);
    auto a = tasks.create_task();
    auto b = tasks.create_task();
    REQUIRE_FALSE(a.task_id.empty());
    REQUIRE(a.task_id != b.task_id);
    REQUIRE(tasks.task_count() == 2);
}

TEST_CASE("TaskManager: update unknown task is ignored", "[tasks]") {
    ManualClock clock;
    TaskManager tasks(clock);
    REQUIRE_FALSE(tasks.update_task("nope", step(TaskStatus::Writing, "x", 50)));
    REQUIRE_FALSE(tasks.get_task("nope").has_value());
}

TEST_CASE("TaskManager: update changes the stored task", "[tasks]") {
    ManualClock clock;
    TaskManager tasks(clock);
    tasks.create_task("t1");
    REQUIRE(tasks.update_task("t1", step(TaskStatus::Searching, "Searching", 30)));
    auto task = tasks.get_task("t1");
    REQUIRE(task->status == TaskStatus::Searching);
    REQUIRE(task->current_step == "Searching");
    REQUIRE(task->percent == 30);
}

// ── subscribe / fan-out ──────────────────────────────────────────

TEST_CASE("TaskManager: every subscriber receives every update in order", "[tasks]") {
    ManualClock clock;
    TaskManager tasks(clock);
    tasks.create_task("t1");
    auto a = tasks.subscribe("t1");
    auto b = tasks.subscribe("t1");
    REQUIRE(tasks.subscriber_count("t1") == 2);

    tasks.update_task("t1", step(TaskStatus::Planning, "plan", 10));
    tasks.update_task("t1", step(TaskStatus::Searching, "search", 30));

    for (const auto& q : {a, b}) {
        REQUIRE(q->size() == 2);
        REQUIRE(q->try_pop()->percent == 10);
        REQUIRE(q->try_pop()->percent == 30);
        REQUIRE_FALSE(q->try_pop().has_value());
    }
}

TEST_CASE("TaskManager: snapshots are independent copies", "[tasks]") {
    ManualClock clock;
    TaskManager tasks(clock);
    tasks.create_task("t1");
    auto q = tasks.subscribe("t1");
    tasks.update_task("t1", step(TaskStatus::Searching, "first", 30));
    tasks.update_task("t1", step(TaskStatus::Writing, "second", 70));

    auto first = q->try_pop();
    REQUIRE(first->current_step == "first");
    REQUIRE(first->status == TaskStatus::Searching);
}

TEST_CASE("TaskManager: subscribers attached before creation are kept", "[tasks]") {
    ManualClock clock;
    TaskManager tasks(clock);
    auto early = tasks.subscribe("t1");
    tasks.create_task("t1");
    REQUIRE(tasks.subscriber_count("t1") == 1);

    tasks.update_task("t1", step(TaskStatus::Searching, "s", 30));
    REQUIRE(early->size() == 1);
}

TEST_CASE("TaskManager: closed queue is dropped without affecting others", "[tasks]") {
    ManualClock clock;
    TaskManager tasks(clock);
    tasks.create_task("t1");
    auto broken = tasks.subscribe("t1");
    auto healthy = tasks.subscribe("t1");
    broken->close();

    REQUIRE(tasks.update_task("t1", step(TaskStatus::Writing, "w", 70)));
    REQUIRE(tasks.subscriber_count("t1") == 1);
    REQUIRE(healthy->try_pop()->percent == 70);
}

TEST_CASE("TaskManager: unsubscribe closes and detaches the queue", "[tasks]") {
    ManualClock clock;
    TaskManager tasks(clock);
    tasks.create_task("t1");
    auto q = tasks.subscribe("t1");

    REQUIRE(tasks.unsubscribe("t1", q));
    REQUIRE(q->closed());
    REQUIRE(tasks.subscriber_count("t1") == 0);
    REQUIRE_FALSE(tasks.unsubscribe("t1", q));

    tasks.update_task("t1", step(TaskStatus::Writing, "w", 70));
    REQUIRE(q->size() == 0);
}

TEST_CASE("TaskManager: waiting subscriber wakes on update", "[tasks]") {
    ManualClock clock;
    TaskManager tasks(clock);
    tasks.create_task("t1");
    auto q = tasks.subscribe("t1");

    std::thread producer([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        tasks.update_task("t1", step(TaskStatus::Completed, "done", 100));
    });
    auto snapshot = q->pop_for(std::chrono::seconds(5));
    producer.join();

    REQUIRE(snapshot.has_value());
    REQUIRE(snapshot->status == TaskStatus::Completed);
}

// ── cleanup ──────────────────────────────────────────────────────

TEST_CASE("TaskManager: cleanup removes only tasks strictly older than max age", "[tasks]") {
    ManualClock clock;
    TaskManager tasks(clock);
    tasks.create_task("old");
    auto q = tasks.subscribe("old");
    clock.advance(30 * 60);
    tasks.create_task("young");

    clock.advance(30 * 60); // "old" is exactly 60 minutes old
    REQUIRE(tasks.cleanup_old_tasks(60) == 0);

    clock.advance(1);
    REQUIRE(tasks.cleanup_old_tasks(60) == 1);
    REQUIRE_FALSE(tasks.get_task("old").has_value());
    REQUIRE(tasks.get_task("young").has_value());
    REQUIRE(q->closed());
    REQUIRE(tasks.subscriber_count("old") == 0);
}
