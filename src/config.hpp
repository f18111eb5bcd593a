#pragma once

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "common.hpp"
#include "planner.hpp"
#include "session.hpp"

#define POMOCLOCK_DEFAULT_PORT 7878

struct Config {
    unsigned port = POMOCLOCK_DEFAULT_PORT;
    LogLevel log_level = LOG_INFO;
    std::filesystem::path db_path; // empty: DefaultDBPath()

    SessionConfig session;
    PlannerConfig planner;

    int tick_interval_ms = 1000;
    int alarm_poll_interval_ms = 1000;
    AlarmPrecision alarm_precision = PRECISION_SECOND;
};

std::filesystem::path DefaultConfigPath();
std::filesystem::path DefaultDBPath();

// Missing file gives the defaults. Throws ValidationError for unreadable or malformed
// files and for values out of range.
Config LoadConfig(const std::filesystem::path &path);
Config ConfigFromJson(const nlohmann::json &j);
void ValidateConfig(const Config &config);

LogLevel ParseLogLevel(const std::string &name);
