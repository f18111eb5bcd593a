#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

#include "alarm_list.hpp"
#include "alarm_monitor.hpp"
#include "errors.hpp"

using namespace std::chrono;

namespace {

const sys_days kDay = sys_days{year{2024} / June / 3};

WallClock At(sys_days day, int h, int m, int s) {
    WallClock wc;
    wc.day = day;
    wc.hour = h;
    wc.minute = m;
    wc.second = s;
    return wc;
}

Alarm MakeAlarm(int64_t id, int h, int m, std::optional<int> s = std::nullopt) {
    Alarm a;
    a.id = id;
    a.time.hour = h;
    a.time.minute = m;
    a.time.second = s;
    return a;
}

void TestFiresOncePerWindow() {
    std::cout << "[Test] 07:30 alarm fires exactly once per day" << std::endl;
    AlarmMonitor monitor(PRECISION_SECOND);
    const std::vector<Alarm> alarms = {MakeAlarm(1, 7, 30)};

    assert(monitor.CheckAndFire(At(kDay, 7, 29, 59), alarms).empty());
    assert(monitor.CheckAndFire(At(kDay, 7, 30, 0), alarms) == std::vector<int64_t>{1});
    assert(monitor.CheckAndFire(At(kDay, 7, 30, 0), alarms).empty());
    assert(monitor.CheckAndFire(At(kDay, 7, 30, 1), alarms).empty());

    // Next day it fires again
    assert(monitor.CheckAndFire(At(kDay + days(1), 7, 30, 0), alarms) ==
           std::vector<int64_t>{1});
    std::cout << "[PASS]" << std::endl;
}

void TestMinutePrecision() {
    std::cout << "[Test] minute precision fires once anywhere in the minute" << std::endl;
    AlarmMonitor monitor(PRECISION_MINUTE);
    const std::vector<Alarm> alarms = {MakeAlarm(1, 7, 30), MakeAlarm(2, 7, 30, 45)};

    auto fired = monitor.CheckAndFire(At(kDay, 7, 30, 20), alarms);
    assert((fired == std::vector<int64_t>{1, 2}));
    assert(monitor.CheckAndFire(At(kDay, 7, 30, 45), alarms).empty());
    assert(monitor.CheckAndFire(At(kDay, 7, 30, 59), alarms).empty());
    assert(monitor.CheckAndFire(At(kDay, 7, 31, 0), alarms).empty());
    std::cout << "[PASS]" << std::endl;
}

void TestSecondPrecision() {
    std::cout << "[Test] second precision honours the alarm's seconds" << std::endl;
    AlarmMonitor monitor(PRECISION_SECOND);
    const std::vector<Alarm> alarms = {MakeAlarm(3, 22, 5, 15)};
    assert(monitor.CheckAndFire(At(kDay, 22, 5, 0), alarms).empty());
    assert(monitor.CheckAndFire(At(kDay, 22, 5, 15), alarms) == std::vector<int64_t>{3});
    std::cout << "[PASS]" << std::endl;
}

void TestDisabledAndSoundless() {
    std::cout << "[Test] disabled alarms never fire; missing sounds do not matter" << std::endl;
    AlarmMonitor monitor(PRECISION_SECOND);
    Alarm off = MakeAlarm(1, 6, 0);
    off.enabled = false;
    Alarm missingSound = MakeAlarm(2, 6, 0);
    missingSound.sound_ref = "/nonexistent/bell.wav";

    const auto fired = monitor.CheckAndFire(At(kDay, 6, 0, 0), {off, missingSound});
    assert(fired == std::vector<int64_t>{2});
    std::cout << "[PASS]" << std::endl;
}

void TestLocalWallClock() {
    std::cout << "[Test] wall clock readings are in the machine's zone" << std::endl;
    const local_seconds noon{local_days{year{2024} / June / 3} + hours(12) + minutes(34) +
                             seconds(56)};
    const auto tp = current_zone()->to_sys(noon, choose::earliest);
    const WallClock wc = ToLocalWallClock(tp);
    assert(wc.day == kDay);
    assert(wc.hour == 12 && wc.minute == 34 && wc.second == 56);
    std::cout << "[PASS]" << std::endl;
}

void TestParseTimeOfDay() {
    std::cout << "[Test] time of day parsing" << std::endl;
    TimeOfDay t = ParseTimeOfDay("07:30");
    assert(t.hour == 7 && t.minute == 30 && !t.second);
    t = ParseTimeOfDay("23:59:58");
    assert(t.hour == 23 && t.minute == 59 && t.second && *t.second == 58);
    t = ParseTimeOfDay("7:05");
    assert(t.hour == 7 && t.minute == 5);
    assert(FormatTimeOfDay(ParseTimeOfDay("7:05")) == "07:05");
    assert(FormatTimeOfDay(ParseTimeOfDay("07:05:09")) == "07:05:09");

    for (const char *bad : {"24:00", "07:60", "07:30:60", "abc", "07", "", "07:30:15:00",
                            "-1:30", " 7:30", "7:5a", "123:00"}) {
        bool threw = false;
        try {
            ParseTimeOfDay(bad);
        } catch (const ValidationError &) {
            threw = true;
        }
        assert(threw);
    }
    std::cout << "[PASS]" << std::endl;
}

void TestBackgroundThread() {
    std::cout << "[Test] monitor thread fires independently and stops cleanly" << std::endl;
    AlarmMonitor monitor(PRECISION_MINUTE, milliseconds(50));

    const WallClock now = ToLocalWallClock(system_clock::now());
    const WallClock next = ToLocalWallClock(system_clock::now() + minutes(1));
    const std::vector<Alarm> alarms = {MakeAlarm(1, now.hour, now.minute),
                                       MakeAlarm(2, next.hour, next.minute)};

    std::atomic<int> fired{0};
    monitor.Start([&]() { return alarms; },
                  [&](const Alarm &, const WallClock &) { fired.fetch_add(1); });
    assert(monitor.Running());

    const auto deadline = steady_clock::now() + seconds(3);
    while (fired.load() == 0 && steady_clock::now() < deadline) {
        std::this_thread::sleep_for(milliseconds(20));
    }
    monitor.Stop();
    assert(!monitor.Running());
    assert(fired.load() >= 1);
    std::cout << "[PASS]" << std::endl;
}

} // namespace

int main() {
    spdlog::set_level(spdlog::level::warn);

    TestFiresOncePerWindow();
    TestMinutePrecision();
    TestSecondPrecision();
    TestDisabledAndSoundless();
    TestLocalWallClock();
    TestParseTimeOfDay();
    TestBackgroundThread();

    std::cout << "[Test] alarm monitor: all tests passed" << std::endl;
    return 0;
}
