#include <atomic>
#include <cassert>
#include <iostream>
#include <string>

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "alarm_list.hpp"
#include "api_server.hpp"
#include "event_bus.hpp"
#include "journal_store.hpp"
#include "planner.hpp"
#include "session.hpp"
#include "sqlite.hpp"
#include "stats.hpp"
#include "task_list.hpp"
#include "test_util.hpp"

namespace {

// Everything the server needs, wired the way the daemon wires it but with a synchronous sink.
struct Fixture {
    TempDb tmp{"api"};
    SQLite db{tmp.Path()};
    JournalStore journal{db};
    TaskList tasks{db};
    AlarmList alarms{db};
    EventBus bus;
    AdaptivePlanner planner;
    PomodoroSession session{SessionConfig{}, planner, bus,
                            [this](const SessionRecord &r) { journal.Append(r); }};
    StatsEngine stats{journal};
    std::atomic<int> commands{0};
    ApiServer server{ApiServer::Parts{session, tasks, alarms, journal, stats, bus},
                     [this] { commands++; }};
};

nlohmann::json Body(const httplib::Result &res) {
    assert(res);
    return nlohmann::json::parse(res->body);
}

void TestSessionCommands(Fixture &f, httplib::Client &cli) {
    std::cout << "[Test] session commands map errors to status codes" << std::endl;

    auto res = cli.Get("/api/v1/version");
    assert(res && res->status == 200);
    assert(Body(res)["version"].is_string());

    res = cli.Post("/api/v1/session/pause", "", "application/json");
    assert(res && res->status == 409);
    assert(Body(res)["error"].is_string());

    res = cli.Post("/api/v1/session/start", R"({"phase": "nap"})", "application/json");
    assert(res && res->status == 400);
    res = cli.Post("/api/v1/session/start", "{not json", "application/json");
    assert(res && res->status == 400);
    res = cli.Post("/api/v1/session/start", R"({"task_id": 999})", "application/json");
    assert(res && res->status == 400);
    res = cli.Post("/api/v1/session/start", R"({"task_id": 1e300})", "application/json");
    assert(res && res->status == 400);
    assert(f.commands == 0);

    res = cli.Post("/api/v1/session/start", R"({"phase": "focus"})", "application/json");
    assert(res && res->status == 200);
    nlohmann::json snap = Body(res);
    assert(snap["state"] == "running");
    assert(snap["phase"] == "focus");
    assert(snap["remaining_seconds"] == 1500);
    assert(f.commands == 1);

    res = cli.Post("/api/v1/session/start", "", "application/json");
    assert(res && res->status == 409);

    res = cli.Post("/api/v1/session/pause", "", "application/json");
    assert(res && res->status == 200);
    assert(Body(res)["paused"] == true);

    res = cli.Post("/api/v1/session/note", R"({"note": "outline"})", "application/json");
    assert(res && res->status == 200);
    res = cli.Post("/api/v1/session/note", "{}", "application/json");
    assert(res && res->status == 400);

    res = cli.Post("/api/v1/session/resume", "", "application/json");
    assert(res && res->status == 200);
    f.session.Tick();
    f.session.Tick();

    res = cli.Post("/api/v1/session/reset", "", "application/json");
    assert(res && res->status == 200);
    assert(Body(res)["state"] == "idle");

    res = cli.Get("/api/v1/journal");
    assert(res && res->status == 200);
    const nlohmann::json journal = Body(res);
    assert(journal["records"].size() == 1);
    assert(journal["records"][0]["actual_seconds"] == 2);
    assert(journal["records"][0]["completed"] == false);
    assert(journal["records"][0]["note"] == "outline");
    assert(journal["records"][0]["pause_count"] == 1);
    std::cout << "[PASS]" << std::endl;
}

void TestTaskRoutes(Fixture &f, httplib::Client &cli) {
    std::cout << "[Test] task routes validate input and count pomodoros" << std::endl;

    auto res = cli.Post("/api/v1/tasks", R"({"title": "   "})", "application/json");
    assert(res && res->status == 400);
    res = cli.Post("/api/v1/tasks", R"({"title": "Essay", "estimated_pomodoros": "two"})",
                   "application/json");
    assert(res && res->status == 400);

    res = cli.Post("/api/v1/tasks", R"({"title": "Essay", "estimated_pomodoros": 2})",
                   "application/json");
    assert(res && res->status == 200);
    const int64_t id = Body(res)["id"];
    assert(id > 0);

    res = cli.Post("/api/v1/session/start",
                   nlohmann::json{{"phase", "focus"}, {"task_id", id}}.dump(), "application/json");
    assert(res && res->status == 200);
    assert(Body(res)["task_id"] == id);
    for (int i = 0; i < 1500; i++) {
        f.session.Tick();
    }
    // Auto started short break is still running
    f.session.Reset();

    res = cli.Get("/api/v1/tasks");
    assert(res && res->status == 200);
    nlohmann::json list = Body(res);
    assert(list.size() == 1);
    assert(list[0]["completed_pomodoros"] == 1);

    const std::string path = "/api/v1/tasks/" + std::to_string(id);
    res = cli.Put(path, R"({"done": true})", "application/json");
    assert(res && res->status == 200);
    assert(Body(res)["done"] == true);
    assert(Body(res)["title"] == "Essay");

    res = cli.Delete(path);
    assert(res && res->status == 200);
    res = cli.Delete(path);
    assert(res && res->status == 400);

    res = cli.Get("/api/v1/journal/export.csv");
    assert(res && res->status == 200);
    assert(res->get_header_value("Content-Type").find("text/csv") != std::string::npos);
    assert(res->body.find(",focus,task deleted,") != std::string::npos);
    std::cout << "[PASS]" << std::endl;
}

void TestAlarmRoutes(httplib::Client &cli) {
    std::cout << "[Test] alarm routes" << std::endl;
    auto res = cli.Post("/api/v1/alarms", R"({"time": "7:61"})", "application/json");
    assert(res && res->status == 400);

    res = cli.Post("/api/v1/alarms", R"({"time": "07:30", "label": "Stand up"})",
                   "application/json");
    assert(res && res->status == 200);
    const int64_t id = Body(res)["id"];
    assert(Body(res)["time"] == "07:30");

    const std::string path = "/api/v1/alarms/" + std::to_string(id);
    res = cli.Put(path, R"({"enabled": false})", "application/json");
    assert(res && res->status == 200);
    assert(Body(res)["enabled"] == false);
    assert(Body(res)["label"] == "Stand up");

    res = cli.Get("/api/v1/alarms");
    assert(res && Body(res).size() == 1);
    res = cli.Delete(path);
    assert(res && res->status == 200);
    res = cli.Put(path, R"({"enabled": true})", "application/json");
    assert(res && res->status == 400);
    std::cout << "[PASS]" << std::endl;
}

void TestEventsAndStats(Fixture &f, httplib::Client &cli) {
    std::cout << "[Test] events are numbered and stats are served" << std::endl;

    auto res = cli.Get("/api/v1/events?after=0");
    assert(res && res->status == 200);
    nlohmann::json body = Body(res);
    const uint64_t last = body["last_seq"];
    assert(last > 0);
    assert(!body["events"].empty());
    uint64_t prev = 0;
    bool sawCompleted = false;
    for (const auto &e : body["events"]) {
        const uint64_t seq = e["seq"];
        assert(seq > prev);
        prev = seq;
        sawCompleted = sawCompleted || e["type"] == "phase_completed";
    }
    assert(sawCompleted);

    res = cli.Get("/api/v1/events?after=" + std::to_string(last));
    assert(res && Body(res)["events"].empty());
    res = cli.Get("/api/v1/events?after=soon");
    assert(res && res->status == 400);

    f.session.Start();
    res = cli.Get("/api/v1/events?after=" + std::to_string(last));
    body = Body(res);
    assert(body["events"].size() == 1);
    assert(body["events"][0]["type"] == "state_changed");
    assert(body["events"][0]["session"]["state"] == "running");
    assert(body["events"][0]["countdown_started"] == true);
    f.session.Reset();

    res = cli.Get("/api/v1/stats");
    assert(res && res->status == 200);
    body = Body(res);
    assert(body["total_completed_focus"] == 1);
    assert(body["total_focus_minutes"] == 25);
    assert(body["heatmap"].size() == HEATMAP_DAYS);

    res = cli.Get("/api/v1/stats/streak");
    assert(res && Body(res)["current"] == 1);
    res = cli.Get("/api/v1/stats/heatmap");
    assert(res && Body(res).size() == HEATMAP_DAYS);
    std::cout << "[PASS]" << std::endl;
}

} // namespace

int main() {
    spdlog::set_level(spdlog::level::off);

    Fixture f;
    const bool started = f.server.Start("127.0.0.1", 0);
    assert(started);
    assert(f.server.Port() > 0);

    httplib::Client cli("127.0.0.1", f.server.Port());
    cli.set_connection_timeout(2, 0);
    cli.set_read_timeout(5, 0);

    TestSessionCommands(f, cli);
    TestTaskRoutes(f, cli);
    TestAlarmRoutes(cli);
    TestEventsAndStats(f, cli);

    f.server.Stop();
    std::cout << "[Test] api: all tests passed" << std::endl;
    return 0;
}
