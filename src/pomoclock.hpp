#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>

#include "alarm_list.hpp"
#include "alarm_monitor.hpp"
#include "api_server.hpp"
#include "config.hpp"
#include "event_bus.hpp"
#include "journal_store.hpp"
#include "journal_writer.hpp"
#include "planner.hpp"
#include "session.hpp"
#include "sqlite.hpp"
#include "stats.hpp"
#include "task_list.hpp"

// Owns every component and drives the session countdown. Alarms run on their own thread.
class PomoClock {
  public:
    explicit PomoClock(const Config &config);
    ~PomoClock();

    // Starts the HTTP server and the alarm monitor, then runs the tick loop until
    // RequestShutdown().
    void Run();
    void RequestShutdown();

    PomodoroSession &Session() {
        return *m_Session;
    }
    AlarmList &Alarms() {
        return *m_Alarms;
    }
    EventBus &Bus() {
        return m_Bus;
    }

  private:
    void RunMainLoop();
    void WaitUntilNextDeadline(bool running);
    void WakeScheduler();
    void OnAlarmFired(const Alarm &alarm, const WallClock &when);
    void FinishActivePhase();

  private:
    const Config m_Config;

    // Scheduler: wait-until-next-deadline with reliable wakeups
    std::mutex m_SchedulerMutex;
    std::condition_variable m_SchedulerCv;
    std::atomic<std::uint64_t> m_WakeupSeq{0};
    std::atomic<bool> m_ShutdownRequested{false};
    std::atomic<bool> m_Reanchor{true};
    std::chrono::steady_clock::time_point m_NextSecond{};

    // Parts, destroyed bottom-up
    std::unique_ptr<SQLite> m_SQLite;
    std::unique_ptr<JournalStore> m_Journal;
    std::unique_ptr<TaskList> m_Tasks;
    std::unique_ptr<AlarmList> m_Alarms;
    EventBus m_Bus;
    std::unique_ptr<AdaptivePlanner> m_Planner;
    std::unique_ptr<JournalWriter> m_Writer;
    std::unique_ptr<PomodoroSession> m_Session;
    std::unique_ptr<StatsEngine> m_Stats;
    std::unique_ptr<AlarmMonitor> m_AlarmMonitor;
    std::unique_ptr<ApiServer> m_Server;
    int m_StateSubscription = 0;
};
