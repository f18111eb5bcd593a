#include "common.hpp"

#include <chrono>

#include <spdlog/fmt/fmt.h>

// ─────────────────────────────────────
const char *PhaseName(Phase phase) {
    switch (phase) {
    case FOCUS:
        return "focus";
    case SHORT_BREAK:
        return "short_break";
    case LONG_BREAK:
        return "long_break";
    }
    return "focus";
}

// ─────────────────────────────────────
std::optional<Phase> ParsePhase(const std::string &name) {
    if (name == "focus") {
        return FOCUS;
    }
    if (name == "short_break") {
        return SHORT_BREAK;
    }
    if (name == "long_break") {
        return LONG_BREAK;
    }
    return std::nullopt;
}

// ─────────────────────────────────────
const char *SessionStateName(SessionState state) {
    switch (state) {
    case SESSION_IDLE:
        return "idle";
    case SESSION_RUNNING:
        return "running";
    case SESSION_PAUSED:
        return "paused";
    case SESSION_COMPLETED:
        return "completed";
    }
    return "idle";
}

// ─────────────────────────────────────
bool IsBreak(Phase phase) {
    return phase == SHORT_BREAK || phase == LONG_BREAK;
}

// ─────────────────────────────────────
Timestamp NowTimestamp() {
    using namespace std::chrono;
    Timestamp ts;
    ts.wall = duration<double>(system_clock::now().time_since_epoch()).count();
    ts.monotonic = duration<double>(steady_clock::now().time_since_epoch()).count();
    return ts;
}

// ─────────────────────────────────────
std::chrono::local_seconds ToLocalTime(std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;

    const auto *tz = current_zone();
    const zoned_time zt{tz, floor<seconds>(tp)};
    return zt.get_local_time();
}

// ─────────────────────────────────────
std::chrono::local_seconds ToLocalTime(double wallSeconds) {
    using namespace std::chrono;
    const auto since = duration_cast<system_clock::duration>(duration<double>(wallSeconds));
    return ToLocalTime(system_clock::time_point{since});
}

// ─────────────────────────────────────
std::string FormatTimeOfDay(const TimeOfDay &time) {
    if (time.second) {
        return fmt::format("{:02}:{:02}:{:02}", time.hour, time.minute, *time.second);
    }
    return fmt::format("{:02}:{:02}", time.hour, time.minute);
}
