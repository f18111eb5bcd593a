#include "stats.hpp"

#include <algorithm>
#include <set>

#include <spdlog/spdlog.h>

namespace {

bool IsQualifying(const SessionRecord &r) {
    return r.phase == FOCUS && r.completed;
}

} // namespace

// ─────────────────────────────────────
std::chrono::sys_days LocalDay(double wallSeconds) {
    using namespace std::chrono;
    const auto localDay = floor<days>(ToLocalTime(wallSeconds));
    return sys_days{localDay.time_since_epoch()};
}

// ─────────────────────────────────────
std::chrono::sys_days Today() {
    using namespace std::chrono;
    const auto localDay = floor<days>(ToLocalTime(system_clock::now()));
    return sys_days{localDay.time_since_epoch()};
}

// ─────────────────────────────────────
std::string FormatDay(std::chrono::sys_days day) {
    const std::chrono::year_month_day ymd{day};
    return fmt::format("{:04}-{:02}-{:02}", static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()));
}

// ─────────────────────────────────────
StreakInfo ComputeStreak(const std::vector<SessionRecord> &records, std::chrono::sys_days today) {
    std::set<std::chrono::sys_days> days;
    for (const auto &r : records) {
        if (IsQualifying(r)) {
            days.insert(LocalDay(r.timestamp.wall));
        }
    }

    StreakInfo info;
    if (days.empty()) {
        return info;
    }

    int run = 0;
    std::optional<std::chrono::sys_days> prev;
    for (const auto &d : days) {
        if (prev && d - *prev == std::chrono::days(1)) {
            run++;
        } else {
            run = 1;
        }
        info.longest = std::max(info.longest, run);
        prev = d;
    }

    // The trailing run is still alive while its last day is today or yesterday
    info.last_day = *prev;
    const auto gap = today - *prev;
    if (gap <= std::chrono::days(1)) {
        info.current = run;
    }
    return info;
}

// ─────────────────────────────────────
std::vector<HeatmapDay> ComputeHeatmap(const std::vector<SessionRecord> &records,
                                       std::chrono::sys_days today) {
    std::vector<HeatmapDay> heatmap(HEATMAP_DAYS);
    const auto first = today - std::chrono::days(HEATMAP_DAYS - 1);
    for (int i = 0; i < HEATMAP_DAYS; i++) {
        heatmap[i].day = first + std::chrono::days(i);
    }

    std::vector<int> seconds(HEATMAP_DAYS, 0);
    for (const auto &r : records) {
        if (!IsQualifying(r)) {
            continue;
        }
        const auto d = LocalDay(r.timestamp.wall);
        if (d < first || d > today) {
            continue;
        }
        const auto idx = (d - first).count();
        heatmap[idx].sessions++;
        seconds[idx] += r.actual_seconds;
    }

    for (int i = 0; i < HEATMAP_DAYS; i++) {
        heatmap[i].focus_minutes = seconds[i] / 60;
    }
    return heatmap;
}

// ─────────────────────────────────────
Stats ComputeStats(const std::vector<SessionRecord> &records, std::chrono::sys_days today) {
    Stats stats;
    int64_t focusSeconds = 0;
    for (const auto &r : records) {
        if (IsQualifying(r)) {
            stats.total_completed_focus++;
            focusSeconds += r.actual_seconds;
        }
    }
    stats.total_focus_minutes = static_cast<int>(focusSeconds / 60);
    stats.streak = ComputeStreak(records, today);
    stats.heatmap = ComputeHeatmap(records, today);
    return stats;
}

// ─────────────────────────────────────
int CompletedPomodorosForTask(const std::vector<SessionRecord> &records, int64_t taskId) {
    return static_cast<int>(std::count_if(records.begin(), records.end(), [&](const auto &r) {
        return IsQualifying(r) && r.task_id && *r.task_id == taskId;
    }));
}

// ─────────────────────────────────────
nlohmann::json ToJson(const StreakInfo &streak) {
    nlohmann::json j = {{"current", streak.current}, {"longest", streak.longest}};
    j["last_day"] = streak.last_day ? nlohmann::json(FormatDay(*streak.last_day)) : nullptr;
    return j;
}

// ─────────────────────────────────────
nlohmann::json ToJson(const std::vector<HeatmapDay> &heatmap) {
    nlohmann::json days = nlohmann::json::array();
    for (const auto &d : heatmap) {
        days.push_back({
            {"date", FormatDay(d.day)},
            {"sessions", d.sessions},
            {"focus_minutes", d.focus_minutes},
        });
    }
    return days;
}

// ─────────────────────────────────────
nlohmann::json ToJson(const Stats &stats) {
    return {
        {"total_completed_focus", stats.total_completed_focus},
        {"total_focus_minutes", stats.total_focus_minutes},
        {"streak", ToJson(stats.streak)},
        {"heatmap", ToJson(stats.heatmap)},
        {"skipped_records", stats.skipped_records},
    };
}

// ─────────────────────────────────────
StatsEngine::StatsEngine(JournalStore &journal) : m_Journal(journal) {}

// ─────────────────────────────────────
Stats StatsEngine::GetStats() {
    const JournalLoad load = m_Journal.LoadAll();
    Stats stats = ComputeStats(load.records, Today());
    stats.skipped_records = load.skipped;
    spdlog::debug("Stats: {} records, focus={}, streak={}", load.records.size(),
                  stats.total_completed_focus, stats.streak.current);
    return stats;
}

// ─────────────────────────────────────
std::vector<HeatmapDay> StatsEngine::GetHeatmap() {
    return ComputeHeatmap(m_Journal.LoadAll().records, Today());
}

// ─────────────────────────────────────
StreakInfo StatsEngine::GetStreak() {
    return ComputeStreak(m_Journal.LoadAll().records, Today());
}

// ─────────────────────────────────────
int StatsEngine::CompletedPomodoros(int64_t taskId) {
    return CompletedPomodorosForTask(m_Journal.LoadAll().records, taskId);
}
