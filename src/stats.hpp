#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common.hpp"
#include "journal_store.hpp"

#define HEATMAP_DAYS 7

struct HeatmapDay {
    std::chrono::sys_days day;
    int sessions = 0;      // completed Focus sessions
    int focus_minutes = 0; // floor of the summed actual seconds / 60
};

struct StreakInfo {
    int current = 0;
    int longest = 0;
    std::optional<std::chrono::sys_days> last_day;
};

struct Stats {
    int total_completed_focus = 0;
    int total_focus_minutes = 0;
    StreakInfo streak;
    std::vector<HeatmapDay> heatmap;
    int skipped_records = 0;
};

// Local calendar day of an epoch timestamp.
std::chrono::sys_days LocalDay(double wallSeconds);
std::chrono::sys_days Today();
std::string FormatDay(std::chrono::sys_days day);

StreakInfo ComputeStreak(const std::vector<SessionRecord> &records, std::chrono::sys_days today);
std::vector<HeatmapDay> ComputeHeatmap(const std::vector<SessionRecord> &records,
                                       std::chrono::sys_days today);
Stats ComputeStats(const std::vector<SessionRecord> &records, std::chrono::sys_days today);
int CompletedPomodorosForTask(const std::vector<SessionRecord> &records, int64_t taskId);

nlohmann::json ToJson(const StreakInfo &streak);
nlohmann::json ToJson(const std::vector<HeatmapDay> &heatmap);
nlohmann::json ToJson(const Stats &stats);

// Reads the journal on every query; nothing is cached.
class StatsEngine {
  public:
    explicit StatsEngine(JournalStore &journal);

    Stats GetStats();
    std::vector<HeatmapDay> GetHeatmap();
    StreakInfo GetStreak();
    int CompletedPomodoros(int64_t taskId);

  private:
    JournalStore &m_Journal;
};
