#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "common.hpp"

class JsonParse {
  public:
    // Strict getters for user input: missing key gives nullopt, wrong type throws ValidationError.
    std::optional<int64_t> OptInt(const nlohmann::json &j, const std::string &key);
    std::optional<double> OptDouble(const nlohmann::json &j, const std::string &key);
    std::optional<bool> OptBool(const nlohmann::json &j, const std::string &key);
    std::optional<std::string> OptString(const nlohmann::json &j, const std::string &key);
};

nlohmann::json ToJson(const SessionRecord &record);
nlohmann::json ToJson(const Task &task);
nlohmann::json ToJson(const Alarm &alarm);
nlohmann::json ToJson(const SessionSnapshot &snapshot);

// Parse user supplied entities. Fields absent from the body keep the values of `base`.
Task TaskFromJson(const nlohmann::json &j, Task base = {});
Alarm AlarmFromJson(const nlohmann::json &j, Alarm base = {});
