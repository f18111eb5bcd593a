#include "session.hpp"

#include <spdlog/spdlog.h>

#include "errors.hpp"

// ─────────────────────────────────────
PomodoroSession::PomodoroSession(SessionConfig config, const AdaptivePlanner &planner,
                                 EventBus &bus, RecordSink sink,
                                 std::vector<SessionRecord> seedHistory)
    : m_Config(config), m_Planner(planner), m_Bus(bus), m_Sink(std::move(sink)) {
    Validate(m_Config);

    const size_t keep = static_cast<size_t>(m_Config.history_size);
    const size_t first = seedHistory.size() > keep ? seedHistory.size() - keep : 0;
    m_History.assign(seedHistory.begin() + first, seedHistory.end());
    spdlog::debug("Session: seeded planner history with {} records", m_History.size());
}

// ─────────────────────────────────────
void PomodoroSession::Validate(const SessionConfig &config) {
    if (config.cycles_before_long_break < 1) {
        throw ValidationError("cycles_before_long_break must be at least 1");
    }
    if (config.history_size < 1) {
        throw ValidationError("session history size must be at least 1");
    }
}

// ─────────────────────────────────────
SessionSnapshot PomodoroSession::SnapshotLocked() const {
    SessionSnapshot s;
    s.state = m_State;
    if (m_State != SESSION_IDLE) {
        s.phase = m_Phase;
        s.remaining_seconds = m_Remaining;
        s.planned_seconds = m_Planned;
    }
    s.next_phase = m_NextPhase;
    s.focus_in_cycle = m_FocusInCycle;
    s.cycles_before_long_break = m_Config.cycles_before_long_break;
    s.task_id = m_TaskId;
    return s;
}

// ─────────────────────────────────────
SessionSnapshot PomodoroSession::Snapshot() const {
    std::lock_guard<std::mutex> lock(m_Mutex);
    return SnapshotLocked();
}

// ─────────────────────────────────────
std::vector<SessionRecord> PomodoroSession::History() const {
    std::lock_guard<std::mutex> lock(m_Mutex);
    return {m_History.begin(), m_History.end()};
}

// ─────────────────────────────────────
void PomodoroSession::StartLocked(Phase phase, std::vector<Event> &events) {
    const std::vector<SessionRecord> history(m_History.begin(), m_History.end());
    m_Phase = phase;
    m_Planned = m_Planner.Plan(phase, history);
    m_Remaining = m_Planned;
    m_PauseCount = 0;
    m_Note.reset();
    m_StartedAt = NowTimestamp();
    m_State = SESSION_RUNNING;

    spdlog::info("Session: {} started, {}s", PhaseName(phase), m_Planned);
    events.push_back(StateChangedEvent{SnapshotLocked(), true});
}

// ─────────────────────────────────────
SessionRecord PomodoroSession::FinishLocked(bool completed) {
    SessionRecord r;
    r.phase = m_Phase;
    r.planned_seconds = m_Planned;
    r.actual_seconds = completed ? m_Planned : m_Planned - m_Remaining;
    r.completed = completed;
    if (m_Phase == FOCUS) {
        r.task_id = m_TaskId;
    }
    r.timestamp = m_StartedAt;
    r.note = m_Note;
    r.pause_count = m_PauseCount;

    m_History.push_back(r);
    while (m_History.size() > static_cast<size_t>(m_Config.history_size)) {
        m_History.pop_front();
    }
    return r;
}

// ─────────────────────────────────────
void PomodoroSession::AdvanceCycleLocked(Phase finished) {
    if (finished == FOCUS) {
        m_FocusInCycle++;
        m_NextPhase =
            m_FocusInCycle >= m_Config.cycles_before_long_break ? LONG_BREAK : SHORT_BREAK;
        return;
    }
    if (finished == LONG_BREAK) {
        m_FocusInCycle = 0;
    }
    m_NextPhase = FOCUS;
}

// ─────────────────────────────────────
void PomodoroSession::Emit(uint64_t seq, std::vector<Event> &events,
                           std::vector<SessionRecord> &records) {
    // Transitions publish in the order they were applied, whichever thread applied them
    std::unique_lock<std::mutex> lock(m_EmitMutex);
    m_EmitCv.wait(lock, [&] { return m_EmittedSeq + 1 == seq; });

    try {
        for (const auto &r : records) {
            if (m_Sink) {
                m_Sink(r);
            }
        }
        for (const auto &e : events) {
            m_Bus.Publish(e);
        }
    } catch (...) {
        m_EmittedSeq = seq;
        m_EmitCv.notify_all();
        throw;
    }
    m_EmittedSeq = seq;
    m_EmitCv.notify_all();
}

// ─────────────────────────────────────
void PomodoroSession::Start(std::optional<Phase> phase, std::optional<int64_t> taskId) {
    std::vector<Event> events;
    std::vector<SessionRecord> records;
    uint64_t seq = 0;
    {
        std::lock_guard<std::mutex> lock(m_Mutex);
        if (m_State != SESSION_IDLE) {
            throw StateError(fmt::format("cannot start: session is {}", SessionStateName(m_State)));
        }
        if (taskId) {
            m_TaskId = taskId;
        }
        StartLocked(phase.value_or(m_NextPhase), events);
        seq = ++m_TransitionSeq;
    }
    Emit(seq, events, records);
}

// ─────────────────────────────────────
void PomodoroSession::Pause() {
    std::vector<Event> events;
    std::vector<SessionRecord> records;
    uint64_t seq = 0;
    {
        std::lock_guard<std::mutex> lock(m_Mutex);
        if (m_State != SESSION_RUNNING) {
            throw StateError(fmt::format("cannot pause: session is {}", SessionStateName(m_State)));
        }
        m_State = SESSION_PAUSED;
        m_PauseCount++;
        spdlog::info("Session: {} paused, {}s left", PhaseName(m_Phase), m_Remaining);
        events.push_back(StateChangedEvent{SnapshotLocked()});
        seq = ++m_TransitionSeq;
    }
    Emit(seq, events, records);
}

// ─────────────────────────────────────
void PomodoroSession::Resume() {
    std::vector<Event> events;
    std::vector<SessionRecord> records;
    uint64_t seq = 0;
    {
        std::lock_guard<std::mutex> lock(m_Mutex);
        if (m_State != SESSION_PAUSED) {
            throw StateError(
                fmt::format("cannot resume: session is {}", SessionStateName(m_State)));
        }
        m_State = SESSION_RUNNING;
        spdlog::info("Session: {} resumed", PhaseName(m_Phase));
        events.push_back(StateChangedEvent{SnapshotLocked(), true});
        seq = ++m_TransitionSeq;
    }
    Emit(seq, events, records);
}

// ─────────────────────────────────────
void PomodoroSession::Skip() {
    std::vector<Event> events;
    std::vector<SessionRecord> records;
    uint64_t seq = 0;
    {
        std::lock_guard<std::mutex> lock(m_Mutex);
        if (m_State != SESSION_RUNNING && m_State != SESSION_PAUSED) {
            throw StateError(fmt::format("cannot skip: session is {}", SessionStateName(m_State)));
        }
        records.push_back(FinishLocked(false));
        AdvanceCycleLocked(m_Phase);
        m_State = SESSION_IDLE;
        spdlog::info("Session: {} skipped after {}s, next is {}", PhaseName(m_Phase),
                     records.back().actual_seconds, PhaseName(m_NextPhase));
        events.push_back(StateChangedEvent{SnapshotLocked()});
        seq = ++m_TransitionSeq;
    }
    Emit(seq, events, records);
}

// ─────────────────────────────────────
void PomodoroSession::Reset() {
    std::vector<Event> events;
    std::vector<SessionRecord> records;
    uint64_t seq = 0;
    {
        std::lock_guard<std::mutex> lock(m_Mutex);
        if (m_State != SESSION_RUNNING && m_State != SESSION_PAUSED) {
            throw StateError(fmt::format("cannot reset: session is {}", SessionStateName(m_State)));
        }
        records.push_back(FinishLocked(false));
        m_NextPhase = m_Phase;
        m_State = SESSION_IDLE;
        spdlog::info("Session: {} reset after {}s", PhaseName(m_Phase),
                     records.back().actual_seconds);
        events.push_back(StateChangedEvent{SnapshotLocked()});
        seq = ++m_TransitionSeq;
    }
    Emit(seq, events, records);
}

// ─────────────────────────────────────
void PomodoroSession::SetNote(const std::string &note) {
    std::lock_guard<std::mutex> lock(m_Mutex);
    if (m_State == SESSION_IDLE) {
        throw StateError("cannot attach a note: no active phase");
    }
    if (note.empty()) {
        m_Note.reset();
    } else {
        m_Note = note;
    }
}

// ─────────────────────────────────────
void PomodoroSession::SetTask(std::optional<int64_t> taskId) {
    std::vector<Event> events;
    std::vector<SessionRecord> records;
    uint64_t seq = 0;
    {
        std::lock_guard<std::mutex> lock(m_Mutex);
        if (m_State == SESSION_IDLE) {
            throw StateError("cannot set a task: no active phase");
        }
        m_TaskId = taskId;
        events.push_back(StateChangedEvent{SnapshotLocked()});
        seq = ++m_TransitionSeq;
    }
    Emit(seq, events, records);
}

// ─────────────────────────────────────
void PomodoroSession::Tick() {
    std::vector<Event> events;
    std::vector<SessionRecord> records;
    uint64_t seq = 0;
    {
        std::lock_guard<std::mutex> lock(m_Mutex);
        if (m_State != SESSION_RUNNING) {
            return;
        }
        if (m_Remaining > 0) {
            m_Remaining--;
        }
        if (m_Remaining > 0) {
            return;
        }

        const Phase finished = m_Phase;
        m_State = SESSION_COMPLETED;
        const SessionRecord record = FinishLocked(true);
        records.push_back(record);
        spdlog::info("Session: {} completed ({}s)", PhaseName(finished), record.actual_seconds);
        events.push_back(PhaseCompletedEvent{record});

        AdvanceCycleLocked(finished);
        if (m_Config.auto_start_next) {
            StartLocked(m_NextPhase, events);
        } else {
            m_State = SESSION_IDLE;
            events.push_back(StateChangedEvent{SnapshotLocked()});
        }
        seq = ++m_TransitionSeq;
    }
    Emit(seq, events, records);
}
