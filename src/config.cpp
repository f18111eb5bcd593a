#include "config.hpp"

#include <cstdint>
#include <cstdlib>
#include <fstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "errors.hpp"
#include "json.hpp"

namespace {

std::filesystem::path XdgDir(const char *var, const std::filesystem::path &homeFallback) {
    const char *dir = std::getenv(var);
    if (dir && *dir) {
        return dir;
    }
    const char *home = std::getenv("HOME");
    if (!home || !*home) {
        throw ValidationError(fmt::format("neither {} nor HOME is set", var));
    }
    return std::filesystem::path(home) / homeFallback;
}

int RequireInt(JsonParse &p, const nlohmann::json &j, const std::string &key, int fallback) {
    const auto v = p.OptInt(j, key);
    if (!v) {
        return fallback;
    }
    if (*v < INT32_MIN || *v > INT32_MAX) {
        throw ValidationError("config key '" + key + "' is out of range");
    }
    return static_cast<int>(*v);
}

void ReadBounds(JsonParse &p, const nlohmann::json &planner, const std::string &name,
                PhaseBounds &bounds, int *shorten) {
    if (!planner.contains(name)) {
        return;
    }
    const auto &b = planner.at(name);
    if (!b.is_object()) {
        throw ValidationError("config key 'planner." + name + "' must be an object");
    }
    bounds.default_seconds = RequireInt(p, b, "default", bounds.default_seconds);
    bounds.min_seconds = RequireInt(p, b, "min", bounds.min_seconds);
    bounds.max_seconds = RequireInt(p, b, "max", bounds.max_seconds);
    bounds.step_seconds = RequireInt(p, b, "step", bounds.step_seconds);
    if (shorten) {
        *shorten = RequireInt(p, b, "shorten", *shorten);
    }
}

} // namespace

// ─────────────────────────────────────
std::filesystem::path DefaultConfigPath() {
    return XdgDir("XDG_CONFIG_HOME", ".config") / "pomoclock" / "config.json";
}

// ─────────────────────────────────────
std::filesystem::path DefaultDBPath() {
    return XdgDir("XDG_DATA_HOME", std::filesystem::path(".local") / "share") / "pomoclock" /
           "data.sqlite";
}

// ─────────────────────────────────────
LogLevel ParseLogLevel(const std::string &name) {
    if (name == "debug") {
        return LOG_DEBUG;
    }
    if (name == "info") {
        return LOG_INFO;
    }
    if (name == "off") {
        return LOG_OFF;
    }
    throw ValidationError("log_level must be one of debug, info, off");
}

// ─────────────────────────────────────
Config ConfigFromJson(const nlohmann::json &j) {
    if (!j.is_object()) {
        throw ValidationError("config root must be a JSON object");
    }

    JsonParse p;
    Config c;

    const int port = RequireInt(p, j, "port", static_cast<int>(c.port));
    if (port < 1 || port > 65535) {
        throw ValidationError("config key 'port' must be between 1 and 65535");
    }
    c.port = static_cast<unsigned>(port);

    if (auto level = p.OptString(j, "log_level")) {
        c.log_level = ParseLogLevel(*level);
    }
    if (auto db = p.OptString(j, "db_path")) {
        c.db_path = *db;
    }

    c.session.auto_start_next = p.OptBool(j, "auto_start_next").value_or(true);
    c.session.cycles_before_long_break =
        RequireInt(p, j, "cycles_before_long_break", c.session.cycles_before_long_break);
    c.tick_interval_ms = RequireInt(p, j, "tick_interval_ms", c.tick_interval_ms);
    c.alarm_poll_interval_ms = RequireInt(p, j, "alarm_poll_interval_ms", c.alarm_poll_interval_ms);

    if (auto precision = p.OptString(j, "alarm_precision")) {
        if (*precision == "minute") {
            c.alarm_precision = PRECISION_MINUTE;
        } else if (*precision == "second") {
            c.alarm_precision = PRECISION_SECOND;
        } else {
            throw ValidationError("alarm_precision must be 'minute' or 'second'");
        }
    }

    if (j.contains("planner")) {
        const auto &pl = j.at("planner");
        if (!pl.is_object()) {
            throw ValidationError("config key 'planner' must be an object");
        }
        c.planner.enabled = p.OptBool(pl, "enabled").value_or(c.planner.enabled);
        c.planner.history_size = RequireInt(p, pl, "history_size", c.planner.history_size);
        c.planner.high_threshold =
            p.OptDouble(pl, "high_threshold").value_or(c.planner.high_threshold);
        c.planner.low_threshold = p.OptDouble(pl, "low_threshold").value_or(c.planner.low_threshold);
        ReadBounds(p, pl, "focus", c.planner.focus, &c.planner.focus_shorten_seconds);
        ReadBounds(p, pl, "short_break", c.planner.short_break, nullptr);
        ReadBounds(p, pl, "long_break", c.planner.long_break, nullptr);
    }
    c.session.history_size = c.planner.history_size;

    ValidateConfig(c);
    return c;
}

// ─────────────────────────────────────
void ValidateConfig(const Config &config) {
    if (config.tick_interval_ms <= 0 || config.tick_interval_ms > 1000) {
        throw ValidationError("tick_interval_ms must be between 1 and 1000");
    }
    if (config.alarm_poll_interval_ms <= 0 || config.alarm_poll_interval_ms > 1000) {
        throw ValidationError("alarm_poll_interval_ms must be between 1 and 1000");
    }
    PomodoroSession::Validate(config.session);
    AdaptivePlanner::Validate(config.planner);
}

// ─────────────────────────────────────
Config LoadConfig(const std::filesystem::path &path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        spdlog::info("No config file at {}, using defaults", path.string());
        return Config{};
    }

    std::ifstream file(path);
    if (!file) {
        throw ValidationError("cannot read config file " + path.string());
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error &e) {
        throw ValidationError("config file " + path.string() + " is not valid JSON: " + e.what());
    }

    Config c = ConfigFromJson(j);
    spdlog::info("Loaded config from {}", path.string());
    return c;
}
