#pragma once

#include <stdexcept>
#include <string>

// Malformed task, alarm or configuration input. Nothing has been applied.
class ValidationError : public std::runtime_error {
  public:
    explicit ValidationError(const std::string &msg) : std::runtime_error(msg) {}
};

// Storage unreadable, unwritable or corrupt. Code is the SQLite result code, 0 if none.
class PersistenceError : public std::runtime_error {
  public:
    explicit PersistenceError(const std::string &msg, int code = 0)
        : std::runtime_error(msg), m_Code(code) {}

    int Code() const {
        return m_Code;
    }

  private:
    int m_Code;
};

// Command not allowed in the current session state. Nothing has been applied.
class StateError : public std::runtime_error {
  public:
    explicit StateError(const std::string &msg) : std::runtime_error(msg) {}
};
