#include "alarm_monitor.hpp"

#include <algorithm>
#include <set>

#include <spdlog/spdlog.h>

#include "errors.hpp"

// ─────────────────────────────────────
WallClock ToLocalWallClock(std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;

    const auto local = ToLocalTime(tp);
    const auto localDay = floor<days>(local);
    const hh_mm_ss hms{local - localDay};

    WallClock wc;
    wc.day = sys_days{localDay.time_since_epoch()};
    wc.hour = static_cast<int>(hms.hours().count());
    wc.minute = static_cast<int>(hms.minutes().count());
    wc.second = static_cast<int>(hms.seconds().count());
    return wc;
}

// ─────────────────────────────────────
AlarmMonitor::AlarmMonitor(AlarmPrecision precision, std::chrono::milliseconds pollInterval)
    : m_Precision(precision), m_PollInterval(pollInterval) {
    if (m_PollInterval.count() <= 0) {
        throw ValidationError("alarm poll interval must be positive");
    }
}

// ─────────────────────────────────────
AlarmMonitor::~AlarmMonitor() {
    Stop();
}

// ─────────────────────────────────────
bool AlarmMonitor::Matches(const Alarm &alarm, const WallClock &now) const {
    if (alarm.time.hour != now.hour || alarm.time.minute != now.minute) {
        return false;
    }
    if (m_Precision == PRECISION_MINUTE) {
        return true;
    }
    return alarm.time.second.value_or(0) == now.second;
}

// ─────────────────────────────────────
int64_t AlarmMonitor::WindowKey(const WallClock &now) const {
    const int64_t days = now.day.time_since_epoch().count();
    const int second = m_Precision == PRECISION_MINUTE ? 0 : now.second;
    return days * 86400 + now.hour * 3600 + now.minute * 60 + second;
}

// ─────────────────────────────────────
std::vector<int64_t> AlarmMonitor::CheckAndFire(const WallClock &now,
                                                const std::vector<Alarm> &alarms) {
    std::lock_guard<std::mutex> lock(m_FiredMutex);

    const int64_t window = WindowKey(now);
    std::vector<int64_t> fired;
    std::set<int64_t> known;

    for (const auto &alarm : alarms) {
        known.insert(alarm.id);
        if (!alarm.enabled || !Matches(alarm, now)) {
            continue;
        }

        auto it = m_LastFiredWindow.find(alarm.id);
        if (it != m_LastFiredWindow.end() && it->second == window) {
            continue;
        }
        m_LastFiredWindow[alarm.id] = window;
        fired.push_back(alarm.id);
    }

    // Forget alarms that no longer exist
    for (auto it = m_LastFiredWindow.begin(); it != m_LastFiredWindow.end();) {
        if (known.count(it->first) == 0) {
            it = m_LastFiredWindow.erase(it);
        } else {
            ++it;
        }
    }

    return fired;
}

// ─────────────────────────────────────
void AlarmMonitor::Start(AlarmProvider provider, FireCallback callback) {
    if (m_Running.exchange(true)) {
        spdlog::warn("AlarmMonitor already running");
        return;
    }
    m_Provider = std::move(provider);
    m_Callback = std::move(callback);
    m_StopRequested.store(false);
    m_Thread = std::thread([this] { Loop(); });
    spdlog::info("Alarm monitor started (precision={}, poll={}ms)",
                 m_Precision == PRECISION_MINUTE ? "minute" : "second", m_PollInterval.count());
}

// ─────────────────────────────────────
void AlarmMonitor::Stop() {
    {
        std::lock_guard<std::mutex> lock(m_ThreadMutex);
        m_StopRequested.store(true);
    }
    m_Cv.notify_all();
    if (m_Thread.joinable()) {
        m_Thread.join();
        spdlog::info("Alarm monitor stopped");
    }
    m_Running.store(false);
}

// ─────────────────────────────────────
void AlarmMonitor::Loop() {
    using namespace std::chrono;

    while (!m_StopRequested.load()) {
        const auto now = system_clock::now();

        std::vector<Alarm> alarms;
        bool haveAlarms = true;
        try {
            alarms = m_Provider();
        } catch (const std::exception &e) {
            spdlog::error("AlarmMonitor: could not read alarms: {}", e.what());
            haveAlarms = false;
        }

        const WallClock wc = ToLocalWallClock(now);
        const auto fired = haveAlarms ? CheckAndFire(wc, alarms) : std::vector<int64_t>{};
        for (int64_t id : fired) {
            auto it = std::find_if(alarms.begin(), alarms.end(),
                                   [id](const Alarm &a) { return a.id == id; });
            spdlog::info("Alarm fired: id={}, time={}, label='{}'", id,
                         FormatTimeOfDay(it->time), it->label);
            try {
                m_Callback(*it, wc);
            } catch (const std::exception &e) {
                spdlog::error("AlarmMonitor: fire callback failed: {}", e.what());
            }
        }

        // Next poll on an interval boundary so every second is observed once
        const auto step = duration_cast<system_clock::duration>(m_PollInterval);
        const auto since = now.time_since_epoch();
        const auto next = system_clock::time_point((since / step + 1) * step);

        std::unique_lock<std::mutex> lk(m_ThreadMutex);
        m_Cv.wait_until(lk, next, [&] { return m_StopRequested.load(); });
    }
}
