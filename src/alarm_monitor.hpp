#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

#include "common.hpp"

// Local calendar date and time of day.
struct WallClock {
    std::chrono::sys_days day;
    int hour = 0;
    int minute = 0;
    int second = 0;
};

WallClock ToLocalWallClock(std::chrono::system_clock::time_point tp);

class AlarmMonitor {
  public:
    using AlarmProvider = std::function<std::vector<Alarm>()>;
    using FireCallback = std::function<void(const Alarm &, const WallClock &)>;

    explicit AlarmMonitor(AlarmPrecision precision = PRECISION_SECOND,
                          std::chrono::milliseconds pollInterval = std::chrono::seconds(1));
    ~AlarmMonitor();

    AlarmMonitor(const AlarmMonitor &) = delete;
    AlarmMonitor &operator=(const AlarmMonitor &) = delete;

    // Returns the ids of the alarms that fire at `now`. An alarm fires at most once per
    // matching window, however often this is called within it.
    std::vector<int64_t> CheckAndFire(const WallClock &now, const std::vector<Alarm> &alarms);

    void Start(AlarmProvider provider, FireCallback callback);
    void Stop();
    bool Running() const {
        return m_Running.load();
    }

  private:
    bool Matches(const Alarm &alarm, const WallClock &now) const;
    int64_t WindowKey(const WallClock &now) const;
    void Loop();

  private:
    const AlarmPrecision m_Precision;
    const std::chrono::milliseconds m_PollInterval;

    std::mutex m_FiredMutex;
    std::map<int64_t, int64_t> m_LastFiredWindow; // alarm id -> window key

    AlarmProvider m_Provider;
    FireCallback m_Callback;

    std::thread m_Thread;
    std::mutex m_ThreadMutex;
    std::condition_variable m_Cv;
    std::atomic<bool> m_Running{false};
    std::atomic<bool> m_StopRequested{false};
};
