#include "api_server.hpp"

#include <spdlog/spdlog.h>

#include "errors.hpp"
#include "json.hpp"

namespace {

void SetError(httplib::Response &res, int status, const std::string &message) {
    res.status = status;
    res.set_content(nlohmann::json{{"error", message}}.dump(), "application/json");
}

// Runs a handler and maps the error classes to HTTP status codes.
template <typename Fn>
void Respond(const httplib::Request &req, httplib::Response &res, Fn &&fn) {
    try {
        const nlohmann::json body = fn();
        res.status = 200;
        res.set_content(body.dump(), "application/json");
    } catch (const nlohmann::json::exception &e) {
        spdlog::warn("[SERVER] {} {}: invalid JSON: {}", req.method, req.path, e.what());
        SetError(res, 400, "invalid JSON body");
    } catch (const ValidationError &e) {
        spdlog::warn("[SERVER] {} {}: {}", req.method, req.path, e.what());
        SetError(res, 400, e.what());
    } catch (const StateError &e) {
        spdlog::warn("[SERVER] {} {}: {}", req.method, req.path, e.what());
        SetError(res, 409, e.what());
    } catch (const PersistenceError &e) {
        spdlog::error("[SERVER] {} {}: storage failure: {}", req.method, req.path, e.what());
        SetError(res, 503, e.what());
    } catch (const std::exception &e) {
        spdlog::error("[SERVER] {} {}: {}", req.method, req.path, e.what());
        SetError(res, 500, "internal server error");
    }
}

nlohmann::json ParseBody(const httplib::Request &req) {
    if (req.body.empty()) {
        return nlohmann::json::object();
    }
    nlohmann::json j = nlohmann::json::parse(req.body);
    if (!j.is_object()) {
        throw ValidationError("request body must be a JSON object");
    }
    return j;
}

int64_t PathId(const httplib::Request &req) {
    try {
        return std::stoll(req.matches[1].str());
    } catch (const std::out_of_range &) {
        throw ValidationError("id out of range");
    }
}

} // namespace

// ─────────────────────────────────────
nlohmann::json ToJson(const Event &event) {
    nlohmann::json j = {{"type", EventName(event)}};
    if (auto *e = std::get_if<PhaseCompletedEvent>(&event)) {
        j["record"] = ToJson(e->record);
    } else if (auto *e = std::get_if<AlarmFiredEvent>(&event)) {
        j["alarm_id"] = e->alarm_id;
        j["label"] = e->label;
        j["sound_ref"] = e->sound_ref;
        j["time"] = FormatTimeOfDay(e->time);
        j["fired_at"] = e->fired_at;
    } else if (auto *e = std::get_if<StateChangedEvent>(&event)) {
        j["session"] = ToJson(e->snapshot);
        j["countdown_started"] = e->countdown_started;
    } else if (auto *e = std::get_if<PersistenceWarningEvent>(&event)) {
        j["message"] = e->message;
        j["record"] = ToJson(e->record);
    }
    return j;
}

// ─────────────────────────────────────
ApiServer::ApiServer(Parts parts, std::function<void()> onSessionCommand)
    : m_Parts(parts), m_OnSessionCommand(std::move(onSessionCommand)) {
    m_Subscription = m_Parts.bus.Subscribe([this](const Event &e) { BufferEvent(e); });
    InitRoutes();
}

// ─────────────────────────────────────
ApiServer::~ApiServer() {
    Stop();
    m_Parts.bus.Unsubscribe(m_Subscription);
}

// ─────────────────────────────────────
bool ApiServer::Start(const std::string &host, unsigned port) {
    if (port == 0) {
        m_BoundPort = m_Server.bind_to_any_port(host);
    } else if (m_Server.bind_to_port(host, static_cast<int>(port))) {
        m_BoundPort = static_cast<int>(port);
    } else {
        m_BoundPort = -1;
    }

    if (m_BoundPort <= 0) {
        spdlog::error("[SERVER] Could not bind {}:{}", host, port);
        return false;
    }

    m_Thread = std::thread([this] { m_Server.listen_after_bind(); });
    spdlog::info("Serving on: http://{}:{}", host, m_BoundPort);
    return true;
}

// ─────────────────────────────────────
void ApiServer::Stop() {
    if (m_Thread.joinable()) {
        m_Server.stop();
        m_Thread.join();
        spdlog::info("[SERVER] stopped");
    }
}

// ─────────────────────────────────────
void ApiServer::BufferEvent(const Event &event) {
    nlohmann::json j = ToJson(event);
    std::lock_guard<std::mutex> lock(m_EventsMutex);
    const uint64_t seq = m_NextSeq++;
    j["seq"] = seq;
    m_Events.emplace_back(seq, std::move(j));
    while (m_Events.size() > EVENT_BUFFER_SIZE) {
        m_Events.pop_front();
    }
}

// ─────────────────────────────────────
nlohmann::json ApiServer::EventsAfter(uint64_t after) {
    std::lock_guard<std::mutex> lock(m_EventsMutex);
    nlohmann::json events = nlohmann::json::array();
    for (const auto &[seq, body] : m_Events) {
        if (seq > after) {
            events.push_back(body);
        }
    }
    return {{"events", events}, {"last_seq", m_NextSeq - 1}};
}

// ─────────────────────────────────────
void ApiServer::InitRoutes() {
    m_Server.set_keep_alive_max_count(1);
    m_Server.set_keep_alive_timeout(1);
    m_Server.set_payload_max_length(64 * 1024); // 64 KB
    m_Server.set_read_timeout(5, 0);
    m_Server.set_write_timeout(5, 0);

    InitSessionRoutes();
    InitStatsRoutes();
    InitTaskRoutes();
    InitAlarmRoutes();
    InitJournalRoutes();

    m_Server.Get("/api/v1/version", [](const httplib::Request &, httplib::Response &res) {
        nlohmann::json j = {{"version", POMOCLOCK_VERSION},
                            {"schema_version", POMOCLOCK_SCHEMA_VERSION}};
        res.status = 200;
        res.set_content(j.dump(), "application/json");
    });

    m_Server.Get("/api/v1/events", [this](const httplib::Request &req, httplib::Response &res) {
        Respond(req, res, [&] {
            uint64_t after = 0;
            if (req.has_param("after")) {
                try {
                    after = std::stoull(req.get_param_value("after"));
                } catch (const std::exception &) {
                    throw ValidationError("'after' must be a non-negative integer");
                }
            }
            return EventsAfter(after);
        });
    });
}

// ─────────────────────────────────────
void ApiServer::InitSessionRoutes() {
    PomodoroSession &session = m_Parts.session;

    m_Server.Get("/api/v1/session", [&](const httplib::Request &req, httplib::Response &res) {
        Respond(req, res, [&] { return ToJson(session.Snapshot()); });
    });

    // Each command answers with the snapshot after the transition
    auto command = [this, &session](const std::string &path,
                                    std::function<void(const nlohmann::json &)> apply) {
        m_Server.Post(path, [this, &session, apply](const httplib::Request &req,
                                                    httplib::Response &res) {
            Respond(req, res, [&] {
                apply(ParseBody(req));
                if (m_OnSessionCommand) {
                    m_OnSessionCommand();
                }
                return ToJson(session.Snapshot());
            });
        });
    };

    command("/api/v1/session/start", [this, &session](const nlohmann::json &body) {
        JsonParse parse;
        std::optional<Phase> phase;
        if (auto name = parse.OptString(body, "phase")) {
            phase = ParsePhase(*name);
            if (!phase) {
                throw ValidationError("unknown phase '" + *name + "'");
            }
        }
        auto taskId = parse.OptInt(body, "task_id");
        if (taskId && !m_Parts.tasks.Find(*taskId)) {
            throw ValidationError("unknown task id " + std::to_string(*taskId));
        }
        session.Start(phase, taskId);
    });
    command("/api/v1/session/pause", [&session](const nlohmann::json &) { session.Pause(); });
    command("/api/v1/session/resume", [&session](const nlohmann::json &) { session.Resume(); });
    command("/api/v1/session/skip", [&session](const nlohmann::json &) { session.Skip(); });
    command("/api/v1/session/reset", [&session](const nlohmann::json &) { session.Reset(); });
    command("/api/v1/session/note", [&session](const nlohmann::json &body) {
        JsonParse parse;
        auto note = parse.OptString(body, "note");
        if (!note) {
            throw ValidationError("'note' is required");
        }
        session.SetNote(*note);
    });
    command("/api/v1/session/task", [this, &session](const nlohmann::json &body) {
        JsonParse parse;
        auto taskId = parse.OptInt(body, "task_id");
        if (taskId && !m_Parts.tasks.Find(*taskId)) {
            throw ValidationError("unknown task id " + std::to_string(*taskId));
        }
        session.SetTask(taskId);
    });
}

// ─────────────────────────────────────
void ApiServer::InitStatsRoutes() {
    StatsEngine &stats = m_Parts.stats;

    m_Server.Get("/api/v1/stats", [&](const httplib::Request &req, httplib::Response &res) {
        Respond(req, res, [&] { return ToJson(stats.GetStats()); });
    });
    m_Server.Get("/api/v1/stats/heatmap",
                 [&](const httplib::Request &req, httplib::Response &res) {
                     Respond(req, res, [&] { return ToJson(stats.GetHeatmap()); });
                 });
    m_Server.Get("/api/v1/stats/streak", [&](const httplib::Request &req, httplib::Response &res) {
        Respond(req, res, [&] { return ToJson(stats.GetStreak()); });
    });
}

// ─────────────────────────────────────
void ApiServer::InitTaskRoutes() {
    TaskList &tasks = m_Parts.tasks;
    JournalStore &journal = m_Parts.journal;

    m_Server.Get("/api/v1/tasks", [&](const httplib::Request &req, httplib::Response &res) {
        Respond(req, res, [&] {
            const auto records = journal.LoadAll().records;
            nlohmann::json out = nlohmann::json::array();
            for (const auto &t : tasks.List()) {
                nlohmann::json j = ToJson(t);
                j["completed_pomodoros"] = CompletedPomodorosForTask(records, t.id);
                out.push_back(j);
            }
            return out;
        });
    });

    m_Server.Post("/api/v1/tasks", [&](const httplib::Request &req, httplib::Response &res) {
        Respond(req, res, [&] { return ToJson(tasks.Create(TaskFromJson(ParseBody(req)))); });
    });

    m_Server.Put(R"(/api/v1/tasks/(\d+))",
                 [&](const httplib::Request &req, httplib::Response &res) {
                     Respond(req, res, [&] {
                         const int64_t id = PathId(req);
                         auto existing = tasks.Find(id);
                         if (!existing) {
                             throw ValidationError("unknown task id " + std::to_string(id));
                         }
                         Task updated = TaskFromJson(ParseBody(req), *existing);
                         updated.id = id;
                         return ToJson(tasks.Update(updated));
                     });
                 });

    m_Server.Delete(R"(/api/v1/tasks/(\d+))",
                    [&](const httplib::Request &req, httplib::Response &res) {
                        Respond(req, res, [&] {
                            const int64_t id = PathId(req);
                            tasks.Remove(id);
                            return nlohmann::json{{"status", "ok"}, {"id", id}};
                        });
                    });
}

// ─────────────────────────────────────
void ApiServer::InitAlarmRoutes() {
    AlarmList &alarms = m_Parts.alarms;

    m_Server.Get("/api/v1/alarms", [&](const httplib::Request &req, httplib::Response &res) {
        Respond(req, res, [&] {
            nlohmann::json out = nlohmann::json::array();
            for (const auto &a : alarms.List()) {
                out.push_back(ToJson(a));
            }
            return out;
        });
    });

    m_Server.Post("/api/v1/alarms", [&](const httplib::Request &req, httplib::Response &res) {
        Respond(req, res, [&] { return ToJson(alarms.Create(AlarmFromJson(ParseBody(req)))); });
    });

    m_Server.Put(R"(/api/v1/alarms/(\d+))",
                 [&](const httplib::Request &req, httplib::Response &res) {
                     Respond(req, res, [&] {
                         const int64_t id = PathId(req);
                         auto existing = alarms.Find(id);
                         if (!existing) {
                             throw ValidationError("unknown alarm id " + std::to_string(id));
                         }
                         Alarm updated = AlarmFromJson(ParseBody(req), *existing);
                         updated.id = id;
                         return ToJson(alarms.Update(updated));
                     });
                 });

    m_Server.Delete(R"(/api/v1/alarms/(\d+))",
                    [&](const httplib::Request &req, httplib::Response &res) {
                        Respond(req, res, [&] {
                            const int64_t id = PathId(req);
                            alarms.Remove(id);
                            return nlohmann::json{{"status", "ok"}, {"id", id}};
                        });
                    });
}

// ─────────────────────────────────────
void ApiServer::InitJournalRoutes() {
    JournalStore &journal = m_Parts.journal;
    TaskList &tasks = m_Parts.tasks;

    m_Server.Get("/api/v1/journal", [&](const httplib::Request &req, httplib::Response &res) {
        Respond(req, res, [&] { return journal.ExportJson(); });
    });

    m_Server.Get("/api/v1/journal/export.csv",
                 [&](const httplib::Request &req, httplib::Response &res) {
                     try {
                         const std::string csv = journal.ExportCsv(
                             [&](int64_t id) { return tasks.DisplayTitle(id); });
                         res.status = 200;
                         res.set_header("Content-Disposition",
                                        "attachment; filename=\"pomoclock_log.csv\"");
                         res.set_content(csv, "text/csv");
                     } catch (const PersistenceError &e) {
                         spdlog::error("[SERVER] {} {}: {}", req.method, req.path, e.what());
                         SetError(res, 503, e.what());
                     }
                 });
}
