#pragma once

#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "common.hpp"
#include "sqlite.hpp"

// Accepts "HH:MM" and "HH:MM:SS" (24 hour clock). Throws ValidationError.
TimeOfDay ParseTimeOfDay(const std::string &text);

class AlarmList {
  public:
    explicit AlarmList(SQLite &db);

    std::vector<Alarm> List() const;
    std::vector<Alarm> Enabled() const;
    std::optional<Alarm> Find(int64_t id) const;

    Alarm Create(Alarm alarm);
    Alarm Update(const Alarm &alarm);
    void SetEnabled(int64_t id, bool enabled);
    void Remove(int64_t id);

    static void Validate(const Alarm &alarm);

  private:
    void Load();
    void Write(const Alarm &alarm, bool insert);

  private:
    SQLite &m_Db;
    mutable std::shared_mutex m_Mutex;
    std::vector<Alarm> m_Alarms;
};
