#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

enum Phase { FOCUS = 0, SHORT_BREAK = 1, LONG_BREAK = 2 };

enum SessionState { SESSION_IDLE = 0, SESSION_RUNNING = 1, SESSION_PAUSED = 2, SESSION_COMPLETED = 3 };

enum AlarmPrecision { PRECISION_MINUTE = 1, PRECISION_SECOND = 2 };

enum LogLevel { LOG_DEBUG, LOG_INFO, LOG_OFF };

// Start of a phase: wall clock for display and calendars, steady clock for ordering.
struct Timestamp {
    double wall = 0.0;
    double monotonic = 0.0;

    bool operator==(const Timestamp &) const = default;
};

struct SessionRecord {
    int64_t id = 0; // assigned by the journal on append
    Phase phase = FOCUS;
    int planned_seconds = 0;
    int actual_seconds = 0;
    bool completed = false;
    std::optional<int64_t> task_id;
    Timestamp timestamp;
    std::optional<std::string> note;
    int pause_count = 0;

    bool operator==(const SessionRecord &) const = default;
};

struct Task {
    int64_t id = 0;
    std::string title;
    int estimated_pomodoros = 1;
    bool done = false;

    bool operator==(const Task &) const = default;
};

struct TimeOfDay {
    int hour = 0;
    int minute = 0;
    std::optional<int> second;

    bool operator==(const TimeOfDay &) const = default;
};

struct Alarm {
    int64_t id = 0;
    TimeOfDay time;
    std::string sound_ref;
    std::string label;
    bool enabled = true;
    bool repeat = true;

    bool operator==(const Alarm &) const = default;
};

struct SessionSnapshot {
    SessionState state = SESSION_IDLE;
    std::optional<Phase> phase; // empty while idle
    int remaining_seconds = 0;
    int planned_seconds = 0;
    Phase next_phase = FOCUS;
    int focus_in_cycle = 0;
    int cycles_before_long_break = 4;
    std::optional<int64_t> task_id;
};

const char *PhaseName(Phase phase);
std::optional<Phase> ParsePhase(const std::string &name);
const char *SessionStateName(SessionState state);
bool IsBreak(Phase phase);

Timestamp NowTimestamp();

// Wall clock seconds since the epoch as local time in the machine's zone.
std::chrono::local_seconds ToLocalTime(double wallSeconds);
std::chrono::local_seconds ToLocalTime(std::chrono::system_clock::time_point tp);
std::string FormatTimeOfDay(const TimeOfDay &time);
