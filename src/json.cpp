#include "json.hpp"

#include <cmath>

#include "alarm_list.hpp"
#include "errors.hpp"

// ─────────────────────────────────────
std::optional<int64_t> JsonParse::OptInt(const nlohmann::json &j, const std::string &key) {
    if (!j.is_object() || !j.contains(key) || j.at(key).is_null()) {
        return std::nullopt;
    }
    const auto &v = j.at(key);
    if (v.is_number_integer()) {
        return v.get<int64_t>();
    }
    if (v.is_number_float()) {
        const double d = v.get<double>();
        if (std::floor(d) == d) {
            // 2^63 is exactly representable; anything at or past it does not fit
            if (d < -9223372036854775808.0 || d >= 9223372036854775808.0) {
                throw ValidationError("'" + key + "' is out of range");
            }
            return static_cast<int64_t>(d);
        }
    }
    throw ValidationError("'" + key + "' must be an integer");
}

// ─────────────────────────────────────
std::optional<double> JsonParse::OptDouble(const nlohmann::json &j, const std::string &key) {
    if (!j.is_object() || !j.contains(key) || j.at(key).is_null()) {
        return std::nullopt;
    }
    if (!j.at(key).is_number()) {
        throw ValidationError("'" + key + "' must be a number");
    }
    return j.at(key).get<double>();
}

// ─────────────────────────────────────
std::optional<bool> JsonParse::OptBool(const nlohmann::json &j, const std::string &key) {
    if (!j.is_object() || !j.contains(key) || j.at(key).is_null()) {
        return std::nullopt;
    }
    if (!j.at(key).is_boolean()) {
        throw ValidationError("'" + key + "' must be a boolean");
    }
    return j.at(key).get<bool>();
}

// ─────────────────────────────────────
std::optional<std::string> JsonParse::OptString(const nlohmann::json &j, const std::string &key) {
    if (!j.is_object() || !j.contains(key) || j.at(key).is_null()) {
        return std::nullopt;
    }
    if (!j.at(key).is_string()) {
        throw ValidationError("'" + key + "' must be a string");
    }
    return j.at(key).get<std::string>();
}

// ─────────────────────────────────────
nlohmann::json ToJson(const SessionRecord &record) {
    nlohmann::json j = {
        {"id", record.id},
        {"phase", PhaseName(record.phase)},
        {"planned_seconds", record.planned_seconds},
        {"actual_seconds", record.actual_seconds},
        {"completed", record.completed},
        {"started_at", record.timestamp.wall},
        {"started_mono", record.timestamp.monotonic},
        {"pause_count", record.pause_count},
    };
    j["task_id"] = record.task_id ? nlohmann::json(*record.task_id) : nlohmann::json(nullptr);
    j["note"] = record.note ? nlohmann::json(*record.note) : nlohmann::json(nullptr);
    return j;
}

// ─────────────────────────────────────
nlohmann::json ToJson(const Task &task) {
    return {
        {"id", task.id},
        {"title", task.title},
        {"estimated_pomodoros", task.estimated_pomodoros},
        {"done", task.done},
    };
}

// ─────────────────────────────────────
nlohmann::json ToJson(const Alarm &alarm) {
    nlohmann::json j = {
        {"id", alarm.id},
        {"time", FormatTimeOfDay(alarm.time)},
        {"hour", alarm.time.hour},
        {"minute", alarm.time.minute},
        {"sound_ref", alarm.sound_ref},
        {"label", alarm.label},
        {"enabled", alarm.enabled},
        {"repeat", alarm.repeat},
    };
    j["second"] = alarm.time.second ? nlohmann::json(*alarm.time.second) : nlohmann::json(nullptr);
    return j;
}

// ─────────────────────────────────────
nlohmann::json ToJson(const SessionSnapshot &snapshot) {
    nlohmann::json j = {
        {"state", SessionStateName(snapshot.state)},
        {"running", snapshot.state == SESSION_RUNNING},
        {"paused", snapshot.state == SESSION_PAUSED},
        {"remaining_seconds", snapshot.remaining_seconds},
        {"planned_seconds", snapshot.planned_seconds},
        {"next_phase", PhaseName(snapshot.next_phase)},
        {"focus_in_cycle", snapshot.focus_in_cycle},
        {"cycles_before_long_break", snapshot.cycles_before_long_break},
    };
    j["phase"] = snapshot.phase ? nlohmann::json(PhaseName(*snapshot.phase)) : nlohmann::json(nullptr);
    j["task_id"] = snapshot.task_id ? nlohmann::json(*snapshot.task_id) : nlohmann::json(nullptr);
    return j;
}

// ─────────────────────────────────────
Task TaskFromJson(const nlohmann::json &j, Task base) {
    if (!j.is_object()) {
        throw ValidationError("task must be a JSON object");
    }

    JsonParse parse;
    if (auto title = parse.OptString(j, "title")) {
        base.title = *title;
    }
    if (auto estimate = parse.OptInt(j, "estimated_pomodoros")) {
        if (*estimate < 1 || *estimate > 1000) {
            throw ValidationError("estimated_pomodoros must be between 1 and 1000");
        }
        base.estimated_pomodoros = static_cast<int>(*estimate);
    }
    if (auto done = parse.OptBool(j, "done")) {
        base.done = *done;
    }
    return base;
}

// ─────────────────────────────────────
Alarm AlarmFromJson(const nlohmann::json &j, Alarm base) {
    if (!j.is_object()) {
        throw ValidationError("alarm must be a JSON object");
    }

    JsonParse parse;
    if (auto time = parse.OptString(j, "time")) {
        base.time = ParseTimeOfDay(*time);
    } else {
        auto narrow = [](int64_t v, const char *key) {
            if (v < 0 || v > 59) {
                throw ValidationError(std::string(key) + " out of range");
            }
            return static_cast<int>(v);
        };
        if (auto hour = parse.OptInt(j, "hour")) {
            base.time.hour = narrow(*hour, "hour");
        }
        if (auto minute = parse.OptInt(j, "minute")) {
            base.time.minute = narrow(*minute, "minute");
        }
        if (j.contains("second")) {
            auto second = parse.OptInt(j, "second");
            base.time.second = second ? std::optional<int>(narrow(*second, "second")) : std::nullopt;
        }
    }
    if (auto sound = parse.OptString(j, "sound_ref")) {
        base.sound_ref = *sound;
    }
    if (auto label = parse.OptString(j, "label")) {
        base.label = *label;
    }
    if (auto enabled = parse.OptBool(j, "enabled")) {
        base.enabled = *enabled;
    }
    if (auto repeat = parse.OptBool(j, "repeat")) {
        base.repeat = *repeat;
    }
    return base;
}
