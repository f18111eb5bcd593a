#include "alarm_list.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iterator>
#include <mutex>

#include <spdlog/spdlog.h>

namespace {

int ParseClockField(const std::string &field, int max, const std::string &text) {
    if (field.empty() || field.size() > 2 ||
        !std::all_of(field.begin(), field.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        throw ValidationError("time must be HH:MM or HH:MM:SS, got '" + text + "'");
    }
    const int value = std::stoi(field);
    if (value > max) {
        throw ValidationError("time field out of range in '" + text + "'");
    }
    return value;
}

} // namespace

// ─────────────────────────────────────
TimeOfDay ParseTimeOfDay(const std::string &text) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        const size_t colon = text.find(':', start);
        parts.push_back(text.substr(start, colon - start));
        if (colon == std::string::npos) {
            break;
        }
        start = colon + 1;
    }

    if (parts.size() != 2 && parts.size() != 3) {
        throw ValidationError("time must be HH:MM or HH:MM:SS, got '" + text + "'");
    }

    TimeOfDay t;
    t.hour = ParseClockField(parts[0], 23, text);
    t.minute = ParseClockField(parts[1], 59, text);
    if (parts.size() == 3) {
        t.second = ParseClockField(parts[2], 59, text);
    }
    return t;
}

// ─────────────────────────────────────
AlarmList::AlarmList(SQLite &db) : m_Db(db) {
    Load();
}

// ─────────────────────────────────────
void AlarmList::Load() {
    std::unique_lock<std::shared_mutex> write(m_Mutex);
    auto lock = m_Db.Lock();

    sqlite3_stmt *stmt = nullptr;
    const char *sql = "SELECT id, hour, minute, second, sound_ref, label, enabled, repeat "
                      "FROM alarms ORDER BY id";
    int rc = sqlite3_prepare_v2(m_Db.Handle(), sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        m_Db.Fail("prepare failed in AlarmList::Load", rc);
    }

    std::vector<Alarm> alarms;
    int skipped = 0;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        Alarm a;
        a.id = sqlite3_column_int64(stmt, 0);
        a.time.hour = sqlite3_column_int(stmt, 1);
        a.time.minute = sqlite3_column_int(stmt, 2);
        if (sqlite3_column_type(stmt, 3) != SQLITE_NULL) {
            a.time.second = sqlite3_column_int(stmt, 3);
        }
        const char *sound = reinterpret_cast<const char *>(sqlite3_column_text(stmt, 4));
        const char *label = reinterpret_cast<const char *>(sqlite3_column_text(stmt, 5));
        a.sound_ref = sound ? sound : "";
        a.label = label ? label : "";
        a.enabled = sqlite3_column_int(stmt, 6) != 0;
        a.repeat = sqlite3_column_int(stmt, 7) != 0;

        try {
            Validate(a);
        } catch (const ValidationError &e) {
            spdlog::warn("AlarmList: skipping alarm id={}: {}", a.id, e.what());
            skipped++;
            continue;
        }
        alarms.push_back(std::move(a));
    }
    sqlite3_finalize(stmt);

    if (skipped > 0) {
        spdlog::warn("AlarmList: skipped {} malformed alarm rows", skipped);
    }
    spdlog::debug("AlarmList: loaded {} alarms", alarms.size());
    m_Alarms = std::move(alarms);
}

// ─────────────────────────────────────
void AlarmList::Validate(const Alarm &alarm) {
    const TimeOfDay &t = alarm.time;
    if (t.hour < 0 || t.hour > 23) {
        throw ValidationError("alarm hour must be between 0 and 23");
    }
    if (t.minute < 0 || t.minute > 59) {
        throw ValidationError("alarm minute must be between 0 and 59");
    }
    if (t.second && (*t.second < 0 || *t.second > 59)) {
        throw ValidationError("alarm second must be between 0 and 59");
    }
    if (alarm.label.size() > 256) {
        throw ValidationError("alarm label is too long");
    }
}

// ─────────────────────────────────────
std::vector<Alarm> AlarmList::List() const {
    std::shared_lock<std::shared_mutex> read(m_Mutex);
    return m_Alarms;
}

// ─────────────────────────────────────
std::vector<Alarm> AlarmList::Enabled() const {
    std::shared_lock<std::shared_mutex> read(m_Mutex);
    std::vector<Alarm> out;
    std::copy_if(m_Alarms.begin(), m_Alarms.end(), std::back_inserter(out),
                 [](const Alarm &a) { return a.enabled; });
    return out;
}

// ─────────────────────────────────────
std::optional<Alarm> AlarmList::Find(int64_t id) const {
    std::shared_lock<std::shared_mutex> read(m_Mutex);
    auto it = std::find_if(m_Alarms.begin(), m_Alarms.end(),
                           [id](const Alarm &a) { return a.id == id; });
    if (it == m_Alarms.end()) {
        return std::nullopt;
    }
    return *it;
}

// ─────────────────────────────────────
void AlarmList::Write(const Alarm &alarm, bool insert) {
    auto lock = m_Db.Lock();

    const char *sql =
        insert ? "INSERT INTO alarms (hour, minute, second, sound_ref, label, enabled, repeat, "
                 "updated_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?)"
               : "UPDATE alarms SET hour = ?, minute = ?, second = ?, sound_ref = ?, label = ?, "
                 "enabled = ?, repeat = ?, updated_at = ? WHERE id = ?";

    sqlite3_stmt *stmt = nullptr;
    int rc = sqlite3_prepare_v2(m_Db.Handle(), sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        m_Db.Fail("prepare failed in AlarmList::Write", rc);
    }

    sqlite3_bind_int(stmt, 1, alarm.time.hour);
    sqlite3_bind_int(stmt, 2, alarm.time.minute);
    if (alarm.time.second) {
        sqlite3_bind_int(stmt, 3, *alarm.time.second);
    } else {
        sqlite3_bind_null(stmt, 3);
    }
    sqlite3_bind_text(stmt, 4, alarm.sound_ref.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 5, alarm.label.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 6, alarm.enabled ? 1 : 0);
    sqlite3_bind_int(stmt, 7, alarm.repeat ? 1 : 0);
    sqlite3_bind_double(stmt, 8, static_cast<double>(std::time(nullptr)));
    if (!insert) {
        sqlite3_bind_int64(stmt, 9, alarm.id);
    }

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        m_Db.Fail(insert ? "insert into alarms failed" : "update of alarms failed", rc);
    }
}

// ─────────────────────────────────────
Alarm AlarmList::Create(Alarm alarm) {
    Validate(alarm);

    std::unique_lock<std::shared_mutex> write(m_Mutex);
    Write(alarm, true);
    alarm.id = m_Db.LastInsertId();
    m_Alarms.push_back(alarm);

    spdlog::info("Alarm created: id={}, time={}, enabled={}, repeat={}", alarm.id,
                 FormatTimeOfDay(alarm.time), alarm.enabled, alarm.repeat);
    return alarm;
}

// ─────────────────────────────────────
Alarm AlarmList::Update(const Alarm &alarm) {
    Validate(alarm);

    std::unique_lock<std::shared_mutex> write(m_Mutex);
    auto it = std::find_if(m_Alarms.begin(), m_Alarms.end(),
                           [&](const Alarm &a) { return a.id == alarm.id; });
    if (it == m_Alarms.end()) {
        throw ValidationError("unknown alarm id " + std::to_string(alarm.id));
    }

    Write(alarm, false);
    *it = alarm;
    spdlog::info("Alarm updated: id={}, time={}, enabled={}", alarm.id,
                 FormatTimeOfDay(alarm.time), alarm.enabled);
    return alarm;
}

// ─────────────────────────────────────
void AlarmList::SetEnabled(int64_t id, bool enabled) {
    std::unique_lock<std::shared_mutex> write(m_Mutex);
    auto it = std::find_if(m_Alarms.begin(), m_Alarms.end(),
                           [id](const Alarm &a) { return a.id == id; });
    if (it == m_Alarms.end()) {
        throw ValidationError("unknown alarm id " + std::to_string(id));
    }

    Alarm alarm = *it;
    alarm.enabled = enabled;
    Write(alarm, false);
    *it = alarm;
    spdlog::info("Alarm {}: id={}", enabled ? "enabled" : "disabled", id);
}

// ─────────────────────────────────────
void AlarmList::Remove(int64_t id) {
    std::unique_lock<std::shared_mutex> write(m_Mutex);
    auto it = std::find_if(m_Alarms.begin(), m_Alarms.end(),
                           [id](const Alarm &a) { return a.id == id; });
    if (it == m_Alarms.end()) {
        throw ValidationError("unknown alarm id " + std::to_string(id));
    }

    auto lock = m_Db.Lock();
    sqlite3_stmt *stmt = nullptr;
    int rc = sqlite3_prepare_v2(m_Db.Handle(), "DELETE FROM alarms WHERE id = ?", -1, &stmt,
                                nullptr);
    if (rc != SQLITE_OK) {
        m_Db.Fail("prepare failed in AlarmList::Remove", rc);
    }
    sqlite3_bind_int64(stmt, 1, id);
    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        m_Db.Fail("delete from alarms failed", rc);
    }

    m_Alarms.erase(it);
    spdlog::info("Alarm removed: id={}", id);
}
