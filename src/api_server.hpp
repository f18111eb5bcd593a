#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "alarm_list.hpp"
#include "event_bus.hpp"
#include "journal_store.hpp"
#include "session.hpp"
#include "stats.hpp"
#include "task_list.hpp"

#define EVENT_BUFFER_SIZE 512

nlohmann::json ToJson(const Event &event);

// Local HTTP/JSON surface for the UI, tray and notification collaborators.
class ApiServer {
  public:
    struct Parts {
        PomodoroSession &session;
        TaskList &tasks;
        AlarmList &alarms;
        JournalStore &journal;
        StatsEngine &stats;
        EventBus &bus;
    };

    // `onSessionCommand` runs after every accepted session command (the daemon wakes its
    // tick loop there).
    ApiServer(Parts parts, std::function<void()> onSessionCommand = nullptr);
    ~ApiServer();

    ApiServer(const ApiServer &) = delete;
    ApiServer &operator=(const ApiServer &) = delete;

    // Port 0 binds any free port. Returns false when the port cannot be bound.
    bool Start(const std::string &host, unsigned port);
    void Stop();
    int Port() const {
        return m_BoundPort;
    }

    // Events buffered for pollers, oldest first, with sequence numbers greater than `after`.
    nlohmann::json EventsAfter(uint64_t after);

  private:
    void InitRoutes();
    void InitSessionRoutes();
    void InitStatsRoutes();
    void InitTaskRoutes();
    void InitAlarmRoutes();
    void InitJournalRoutes();
    void BufferEvent(const Event &event);

  private:
    Parts m_Parts;
    std::function<void()> m_OnSessionCommand;
    int m_Subscription = 0;

    std::mutex m_EventsMutex;
    std::deque<std::pair<uint64_t, nlohmann::json>> m_Events;
    uint64_t m_NextSeq = 1;

    httplib::Server m_Server;
    std::thread m_Thread;
    int m_BoundPort = 0;
};
