#include "pomoclock.hpp"

#include <algorithm>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "errors.hpp"

// ─────────────────────────────────────
PomoClock::PomoClock(const Config &config) : m_Config(config) {
    if (m_Config.log_level == LOG_DEBUG) {
        spdlog::set_level(spdlog::level::debug);
    } else if (m_Config.log_level == LOG_INFO) {
        spdlog::set_level(spdlog::level::info);
    } else if (m_Config.log_level == LOG_OFF) {
        spdlog::set_level(spdlog::level::off);
    }

    std::filesystem::path dbpath = m_Config.db_path.empty() ? DefaultDBPath() : m_Config.db_path;
    std::error_code ec;
    std::filesystem::create_directories(dbpath.parent_path(), ec);
    if (ec) {
        throw PersistenceError("cannot create " + dbpath.parent_path().string() + ": " +
                               ec.message());
    }
    spdlog::info("DataBase path: {}", dbpath.string());

    // SQlite
    m_SQLite = std::make_unique<SQLite>(dbpath.string());
    m_Journal = std::make_unique<JournalStore>(*m_SQLite);
    m_Tasks = std::make_unique<TaskList>(*m_SQLite);
    m_Alarms = std::make_unique<AlarmList>(*m_SQLite);
    spdlog::info("SQLite database initialized (schema {})", m_SQLite->SchemaVersion());

    // Planner and session, seeded with the last K journal records
    m_Planner = std::make_unique<AdaptivePlanner>(m_Config.planner);
    JournalStore *journal = m_Journal.get();
    m_Writer = std::make_unique<JournalWriter>(
        [journal](const SessionRecord &r) { return journal->Append(r); }, m_Bus);
    auto seed = m_Journal->LoadRecent(static_cast<size_t>(m_Config.planner.history_size));
    JournalWriter *writer = m_Writer.get();
    m_Session = std::make_unique<PomodoroSession>(
        m_Config.session, *m_Planner, m_Bus,
        [writer](const SessionRecord &r) { writer->Submit(r); }, std::move(seed));
    m_Stats = std::make_unique<StatsEngine>(*m_Journal);

    // A countdown that (re)starts is aligned to a fresh second; other changes keep the phase
    m_StateSubscription = m_Bus.Subscribe([this](const Event &e) {
        if (const auto *changed = std::get_if<StateChangedEvent>(&e)) {
            if (changed->countdown_started) {
                m_Reanchor.store(true);
            }
            WakeScheduler();
        }
    });

    m_AlarmMonitor = std::make_unique<AlarmMonitor>(
        m_Config.alarm_precision, std::chrono::milliseconds(m_Config.alarm_poll_interval_ms));

    m_Server = std::make_unique<ApiServer>(
        ApiServer::Parts{*m_Session, *m_Tasks, *m_Alarms, *m_Journal, *m_Stats, m_Bus},
        [this]() { WakeScheduler(); });
}

// ─────────────────────────────────────
PomoClock::~PomoClock() {
    m_Server.reset();
    if (m_AlarmMonitor) {
        m_AlarmMonitor->Stop();
    }
    m_Bus.Unsubscribe(m_StateSubscription);
    FinishActivePhase();
    spdlog::info("pomoclock stopped");
}

// ─────────────────────────────────────
void PomoClock::FinishActivePhase() {
    if (!m_Session) {
        return;
    }
    const SessionSnapshot s = m_Session->Snapshot();
    if (s.state != SESSION_RUNNING && s.state != SESSION_PAUSED) {
        return;
    }
    // Journal the interrupted phase as incomplete
    try {
        m_Session->Reset();
        spdlog::info("Shutdown interrupted {} with {}s left", PhaseName(*s.phase),
                     s.remaining_seconds);
    } catch (const StateError &e) {
        spdlog::warn("Shutdown: {}", e.what());
    }
}

// ─────────────────────────────────────
void PomoClock::Run() {
    if (!m_Server->Start("127.0.0.1", m_Config.port)) {
        throw std::runtime_error("cannot listen on port " + std::to_string(m_Config.port));
    }

    m_AlarmMonitor->Start([this]() { return m_Alarms->Enabled(); },
                          [this](const Alarm &a, const WallClock &wc) { OnAlarmFired(a, wc); });

    RunMainLoop();
}

// ─────────────────────────────────────
void PomoClock::RequestShutdown() {
    spdlog::info("Shutdown requested");
    m_ShutdownRequested.store(true);
    WakeScheduler();
}

// ─────────────────────────────────────
void PomoClock::OnAlarmFired(const Alarm &alarm, const WallClock &) {
    const auto now = std::chrono::system_clock::now();
    AlarmFiredEvent e;
    e.alarm_id = alarm.id;
    e.label = alarm.label;
    e.sound_ref = alarm.sound_ref;
    e.time = alarm.time;
    e.fired_at = std::chrono::duration<double>(now.time_since_epoch()).count();
    m_Bus.Publish(e);

    if (!alarm.repeat) {
        try {
            m_Alarms->SetEnabled(alarm.id, false);
            spdlog::info("One-shot alarm {} disabled", alarm.id);
        } catch (const std::exception &e) {
            spdlog::error("Could not disable one-shot alarm {}: {}", alarm.id, e.what());
        }
    }
}

// ─────────────────────────────────────
void PomoClock::WaitUntilNextDeadline(bool running) {
    if (m_Reanchor.load()) {
        return;
    }
    const auto now = std::chrono::steady_clock::now();
    auto deadline = now + std::chrono::hours(24);

    if (running) {
        deadline = std::min(m_NextSecond, now + std::chrono::milliseconds(m_Config.tick_interval_ms));
    }

    const auto seq = m_WakeupSeq.load(std::memory_order_relaxed);
    std::unique_lock<std::mutex> lk(m_SchedulerMutex);
    m_SchedulerCv.wait_until(lk, deadline, [&] {
        if (m_ShutdownRequested.load()) {
            return true;
        }
        return m_WakeupSeq.load(std::memory_order_relaxed) != seq;
    });
}

// ─────────────────────────────────────
void PomoClock::RunMainLoop() {
    spdlog::info("pomoclock running");
    while (!m_ShutdownRequested.load()) {
        const auto now = std::chrono::steady_clock::now();

        if (m_Reanchor.exchange(false)) {
            m_NextSecond = now + std::chrono::seconds(1);
        }

        bool running = m_Session->Snapshot().state == SESSION_RUNNING;
        // Catch up whole seconds missed while the thread was late
        while (running && now >= m_NextSecond && !m_Reanchor.load()) {
            m_Session->Tick();
            m_NextSecond += std::chrono::seconds(1);
            running = m_Session->Snapshot().state == SESSION_RUNNING;
        }

        WaitUntilNextDeadline(running);
    }
}

// ─────────────────────────────────────
void PomoClock::WakeScheduler() {
    {
        std::lock_guard<std::mutex> lk(m_SchedulerMutex);
        m_WakeupSeq.fetch_add(1, std::memory_order_relaxed);
    }
    m_SchedulerCv.notify_one();
}
