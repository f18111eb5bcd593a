#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "common.hpp"
#include "event_bus.hpp"
#include "planner.hpp"

struct SessionConfig {
    bool auto_start_next = true;
    int cycles_before_long_break = 4;
    int history_size = 10; // records kept in memory for the planner
};

// Pomodoro state machine: Idle -> Running <-> Paused -> (Completed) -> Running | Idle.
// Every command and every tick runs under one mutex, so a command always lands on a tick
// boundary. Records and events are emitted after the mutex is released, in transition
// order. Sinks and subscribers must not issue session commands.
class PomodoroSession {
  public:
    // Receives each finished phase; must not block (the daemon passes JournalWriter::Submit).
    using RecordSink = std::function<void(const SessionRecord &)>;

    PomodoroSession(SessionConfig config, const AdaptivePlanner &planner, EventBus &bus,
                    RecordSink sink, std::vector<SessionRecord> seedHistory = {});

    // Throw StateError when the transition is not allowed; nothing is applied then.
    void Start(std::optional<Phase> phase = std::nullopt,
               std::optional<int64_t> taskId = std::nullopt);
    void Pause();
    void Resume();
    void Skip();
    void Reset();
    void SetNote(const std::string &note);
    void SetTask(std::optional<int64_t> taskId);

    // One second of countdown. No-op unless running.
    void Tick();

    SessionSnapshot Snapshot() const;
    std::vector<SessionRecord> History() const;

    static void Validate(const SessionConfig &config);

  private:
    SessionSnapshot SnapshotLocked() const;
    void StartLocked(Phase phase, std::vector<Event> &events);
    SessionRecord FinishLocked(bool completed);
    void AdvanceCycleLocked(Phase finished);
    void Emit(uint64_t seq, std::vector<Event> &events, std::vector<SessionRecord> &records);

  private:
    const SessionConfig m_Config;
    const AdaptivePlanner &m_Planner;
    EventBus &m_Bus;
    RecordSink m_Sink;

    mutable std::mutex m_Mutex;
    SessionState m_State{SESSION_IDLE};
    Phase m_Phase{FOCUS};
    Phase m_NextPhase{FOCUS};
    int m_Planned{0};
    int m_Remaining{0};
    int m_FocusInCycle{0};
    int m_PauseCount{0};
    Timestamp m_StartedAt;
    std::optional<int64_t> m_TaskId;
    std::optional<std::string> m_Note;
    std::deque<SessionRecord> m_History;
    uint64_t m_TransitionSeq{0};

    std::mutex m_EmitMutex;
    std::condition_variable m_EmitCv;
    uint64_t m_EmittedSeq{0};
};
