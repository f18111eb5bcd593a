#include <atomic>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

#include "errors.hpp"
#include "event_bus.hpp"
#include "journal_store.hpp"
#include "journal_writer.hpp"
#include "planner.hpp"
#include "session.hpp"
#include "sqlite.hpp"
#include "test_util.hpp"

namespace {

struct Recorder {
    std::vector<SessionRecord> records;
    PomodoroSession::RecordSink Sink() {
        return [this](const SessionRecord &r) { records.push_back(r); };
    }
};

template <typename Fn>
bool ThrowsStateError(Fn &&fn) {
    try {
        fn();
    } catch (const StateError &) {
        return true;
    }
    return false;
}

void TestFocusExpiryAutoStartsShortBreak() {
    std::cout << "[Test] focus countdown expiry writes one completed record" << std::endl;
    EventBus bus;
    AdaptivePlanner planner;
    Recorder rec;
    std::vector<std::string> events;
    bus.Subscribe([&](const Event &e) { events.push_back(EventName(e)); });

    PomodoroSession session(SessionConfig{}, planner, bus, rec.Sink());
    session.Start();
    assert(session.Snapshot().planned_seconds == 1500);

    events.clear();
    for (int i = 0; i < 1500; i++) {
        session.Tick();
    }

    assert(rec.records.size() == 1);
    const SessionRecord &r = rec.records[0];
    assert(r.phase == FOCUS);
    assert(r.completed);
    assert(r.planned_seconds == 1500);
    assert(r.actual_seconds == 1500);

    const SessionSnapshot s = session.Snapshot();
    assert(s.state == SESSION_RUNNING);
    assert(s.phase && *s.phase == SHORT_BREAK);
    assert(s.focus_in_cycle == 1);

    assert(events.size() == 2);
    assert(events[0] == "phase_completed");
    assert(events[1] == "state_changed");
    std::cout << "[PASS]" << std::endl;
}

void TestResetAfterTenTicks() {
    std::cout << "[Test] reset after ten ticks records ten seconds and goes idle" << std::endl;
    EventBus bus;
    AdaptivePlanner planner;
    Recorder rec;
    PomodoroSession session(SessionConfig{}, planner, bus, rec.Sink());

    session.Start();
    for (int i = 0; i < 10; i++) {
        session.Tick();
    }
    session.Reset();

    assert(rec.records.size() == 1);
    assert(rec.records[0].phase == FOCUS);
    assert(!rec.records[0].completed);
    assert(rec.records[0].actual_seconds == 10);

    const SessionSnapshot s = session.Snapshot();
    assert(s.state == SESSION_IDLE);
    assert(!s.phase);
    // Reset keeps the cycle position
    assert(s.next_phase == FOCUS);
    assert(s.focus_in_cycle == 0);
    std::cout << "[PASS]" << std::endl;
}

void TestIllegalTransitionsRejected() {
    std::cout << "[Test] illegal transitions throw StateError and change nothing" << std::endl;
    EventBus bus;
    AdaptivePlanner planner;
    Recorder rec;
    PomodoroSession session(SessionConfig{}, planner, bus, rec.Sink());

    assert(ThrowsStateError([&] { session.Resume(); }));
    assert(ThrowsStateError([&] { session.Pause(); }));
    assert(ThrowsStateError([&] { session.Skip(); }));
    assert(ThrowsStateError([&] { session.Reset(); }));
    assert(ThrowsStateError([&] { session.SetNote("x"); }));
    assert(ThrowsStateError([&] { session.SetTask(1); }));
    assert(session.Snapshot().state == SESSION_IDLE);

    session.Start();
    session.Tick();
    assert(ThrowsStateError([&] { session.Start(); }));
    assert(ThrowsStateError([&] { session.Resume(); }));
    const SessionSnapshot s = session.Snapshot();
    assert(s.state == SESSION_RUNNING);
    assert(s.remaining_seconds == 1499);

    session.Pause();
    assert(ThrowsStateError([&] { session.Pause(); }));
    assert(rec.records.empty());
    std::cout << "[PASS]" << std::endl;
}

void TestPauseFreezesCountdown() {
    std::cout << "[Test] pause freezes the countdown and is counted" << std::endl;
    EventBus bus;
    AdaptivePlanner planner;
    Recorder rec;
    PomodoroSession session(SessionConfig{}, planner, bus, rec.Sink());

    session.Start(SHORT_BREAK);
    for (int i = 0; i < 5; i++) {
        session.Tick();
    }
    session.Pause();
    for (int i = 0; i < 100; i++) {
        session.Tick();
    }
    assert(session.Snapshot().remaining_seconds == 295);
    session.Resume();
    session.Tick();
    session.Pause();
    session.Resume();
    session.Skip();

    assert(rec.records.size() == 1);
    assert(rec.records[0].phase == SHORT_BREAK);
    assert(rec.records[0].actual_seconds == 6);
    assert(rec.records[0].pause_count == 2);
    std::cout << "[PASS]" << std::endl;
}

void TestCycleSequencing() {
    std::cout << "[Test] long break after every Nth focus" << std::endl;
    EventBus bus;
    PlannerConfig pc;
    pc.enabled = false;
    AdaptivePlanner planner(pc);
    Recorder rec;
    SessionConfig cfg;
    cfg.auto_start_next = false;
    cfg.cycles_before_long_break = 2;
    PomodoroSession session(cfg, planner, bus, rec.Sink());

    std::vector<Phase> seen;
    for (int i = 0; i < 5; i++) {
        session.Start();
        seen.push_back(*session.Snapshot().phase);
        session.Skip();
    }
    assert((seen == std::vector<Phase>{FOCUS, SHORT_BREAK, FOCUS, LONG_BREAK, FOCUS}));
    assert(session.Snapshot().focus_in_cycle == 1);

    // Completion without auto start goes idle with the break queued
    session.Start(SHORT_BREAK);
    for (int i = 0; i < 300; i++) {
        session.Tick();
    }
    SessionSnapshot s = session.Snapshot();
    assert(s.state == SESSION_IDLE);
    assert(s.next_phase == FOCUS);

    // Reset repeats the same phase
    session.Start();
    session.Reset();
    assert(session.Snapshot().next_phase == FOCUS);
    assert(session.Snapshot().focus_in_cycle == 1);
    std::cout << "[PASS]" << std::endl;
}

void TestNoteAndTaskAttached() {
    std::cout << "[Test] note and task are written with the focus record" << std::endl;
    EventBus bus;
    AdaptivePlanner planner;
    Recorder rec;
    SessionConfig cfg;
    cfg.auto_start_next = false;
    PomodoroSession session(cfg, planner, bus, rec.Sink());

    session.Start(FOCUS, 42);
    session.SetNote("wrote the parser");
    for (int i = 0; i < 1500; i++) {
        session.Tick();
    }
    assert(rec.records.size() == 1);
    assert(rec.records[0].task_id && *rec.records[0].task_id == 42);
    assert(rec.records[0].note && *rec.records[0].note == "wrote the parser");

    // Breaks carry no task; the selection survives for the next focus
    session.Start();
    session.Skip();
    assert(!rec.records[1].task_id);
    assert(!rec.records[1].note);
    assert(session.Snapshot().task_id && *session.Snapshot().task_id == 42);
    std::cout << "[PASS]" << std::endl;
}

void TestSeededHistoryDrivesPlanner() {
    std::cout << "[Test] seeded history drives the first planned duration" << std::endl;
    EventBus bus;
    AdaptivePlanner planner;
    Recorder rec;
    std::vector<SessionRecord> seed;
    for (int i = 0; i < 12; i++) {
        seed.push_back(MakeRecord(FOCUS, false, 1500, 60));
    }
    PomodoroSession session(SessionConfig{}, planner, bus, rec.Sink(), seed);
    assert(session.History().size() == 10);
    session.Start();
    assert(session.Snapshot().planned_seconds == 900);
    std::cout << "[PASS]" << std::endl;
}

void TestPersistenceFailureDoesNotRollBack() {
    std::cout << "[Test] journal failure warns, keeps the transition and retries" << std::endl;
    TempDb tmp("session");
    SQLite db(tmp.Path());
    JournalStore journal(db);
    EventBus bus;
    JournalWriter writer([&](const SessionRecord &r) { return journal.Append(r); }, bus,
                         std::chrono::milliseconds(50));
    AdaptivePlanner planner;

    std::mutex mutex;
    int warnings = 0;
    bus.Subscribe([&](const Event &e) {
        if (std::holds_alternative<PersistenceWarningEvent>(e)) {
            std::lock_guard<std::mutex> lock(mutex);
            warnings++;
        }
    });

    {
        auto lock = db.Lock();
        db.Exec("CREATE TRIGGER fail_insert BEFORE INSERT ON session_log "
                "BEGIN SELECT RAISE(ABORT, 'disk full'); END");
    }

    PomodoroSession session(SessionConfig{}, planner, bus,
                            [&](const SessionRecord &r) { writer.Submit(r); });
    session.Start();
    for (int i = 0; i < 5; i++) {
        session.Tick();
    }
    session.Reset();

    assert(session.Snapshot().state == SESSION_IDLE);
    assert(session.History().size() == 1);
    assert(!writer.Flush(std::chrono::milliseconds(300)));
    assert(writer.Pending() == 1);
    {
        std::lock_guard<std::mutex> lock(mutex);
        assert(warnings >= 1);
    }
    assert(journal.LoadAll().records.empty());

    {
        auto lock = db.Lock();
        db.Exec("DROP TRIGGER fail_insert");
    }
    assert(writer.Flush(std::chrono::seconds(5)));
    assert(writer.Pending() == 0);
    const auto load = journal.LoadAll();
    assert(load.records.size() == 1);
    assert(load.records[0].actual_seconds == 5);
    std::cout << "[PASS]" << std::endl;
}

void TestConcurrentTransitionsPublishInOrder() {
    std::cout << "[Test] transitions from two threads publish in the order they were applied"
              << std::endl;
    EventBus bus;
    AdaptivePlanner planner;

    std::mutex statesMutex;
    std::vector<SessionState> states;
    bus.Subscribe([&](const Event &e) {
        if (const auto *changed = std::get_if<StateChangedEvent>(&e)) {
            std::lock_guard<std::mutex> lock(statesMutex);
            states.push_back(changed->snapshot.state);
        }
    });

    // Holds the ticking thread inside the sink of the completed focus record
    std::mutex gateMutex;
    std::condition_variable gateCv;
    bool release = false;
    std::atomic<bool> sinkEntered{false};
    PomodoroSession session(SessionConfig{}, planner, bus, [&](const SessionRecord &r) {
        if (!r.completed) {
            return;
        }
        sinkEntered.store(true);
        std::unique_lock<std::mutex> lock(gateMutex);
        gateCv.wait(lock, [&] { return release; });
    });

    session.Start();
    for (int i = 0; i < 1499; i++) {
        session.Tick();
    }
    std::thread ticker([&] { session.Tick(); });
    while (!sinkEntered.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    std::thread skipper([&] { session.Skip(); });
    while (session.Snapshot().state != SESSION_IDLE) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    {
        std::lock_guard<std::mutex> lock(statesMutex);
        assert(states.size() == 1);
    }

    {
        std::lock_guard<std::mutex> lock(gateMutex);
        release = true;
    }
    gateCv.notify_all();
    ticker.join();
    skipper.join();

    std::lock_guard<std::mutex> lock(statesMutex);
    assert(states.size() == 3);
    assert(states[0] == SESSION_RUNNING);
    assert(states[1] == SESSION_RUNNING);
    assert(states.back() == SESSION_IDLE);
    assert(session.Snapshot().state == SESSION_IDLE);
    std::cout << "[PASS]" << std::endl;
}

void TestCountdownStartFlag() {
    std::cout << "[Test] only starts and resumes mark a fresh countdown" << std::endl;
    EventBus bus;
    AdaptivePlanner planner;
    Recorder rec;
    std::vector<bool> flags;
    bus.Subscribe([&](const Event &e) {
        if (const auto *changed = std::get_if<StateChangedEvent>(&e)) {
            flags.push_back(changed->countdown_started);
        }
    });

    PomodoroSession session(SessionConfig{}, planner, bus, rec.Sink());
    session.Start();
    session.SetTask(7);
    session.Pause();
    session.Resume();
    for (int i = 0; i < 1500; i++) {
        session.Tick();
    }
    session.Reset();

    // start, task, pause, resume, auto started break, reset
    const std::vector<bool> expected = {true, false, false, true, true, false};
    assert(flags == expected);
    std::cout << "[PASS]" << std::endl;
}

void TestWriterRetriesUnexpectedFailure() {
    std::cout << "[Test] an unexpected append failure is retried, not lost" << std::endl;
    EventBus bus;
    std::mutex mutex;
    int attempts = 0;
    std::vector<SessionRecord> stored;
    JournalWriter writer(
        [&](const SessionRecord &r) -> int64_t {
            std::lock_guard<std::mutex> lock(mutex);
            attempts++;
            if (attempts == 1) {
                throw std::runtime_error("bad_alloc in driver");
            }
            stored.push_back(r);
            return static_cast<int64_t>(stored.size());
        },
        bus, std::chrono::milliseconds(20));

    writer.Submit(MakeRecord(FOCUS, true, 1500, 1500));
    assert(writer.Flush(std::chrono::seconds(5)));
    std::lock_guard<std::mutex> lock(mutex);
    assert(attempts == 2);
    assert(stored.size() == 1);
    assert(stored[0].actual_seconds == 1500);
    std::cout << "[PASS]" << std::endl;
}

} // namespace

int main() {
    spdlog::set_level(spdlog::level::warn);

    TestFocusExpiryAutoStartsShortBreak();
    TestResetAfterTenTicks();
    TestIllegalTransitionsRejected();
    TestPauseFreezesCountdown();
    TestCycleSequencing();
    TestNoteAndTaskAttached();
    TestSeededHistoryDrivesPlanner();
    TestPersistenceFailureDoesNotRollBack();
    TestConcurrentTransitionsPublishInOrder();
    TestCountdownStartFlag();
    TestWriterRetriesUnexpectedFailure();

    std::cout << "[Test] session: all tests passed" << std::endl;
    return 0;
}
