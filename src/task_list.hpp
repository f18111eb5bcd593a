#pragma once

#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "common.hpp"
#include "sqlite.hpp"

#define DELETED_TASK_TITLE "task deleted"

class TaskList {
  public:
    explicit TaskList(SQLite &db);

    std::vector<Task> List() const;
    std::optional<Task> Find(int64_t id) const;

    // Title for display; a reference to a removed task resolves to DELETED_TASK_TITLE.
    std::string DisplayTitle(std::optional<int64_t> id) const;

    Task Create(Task task);
    Task Update(Task task);
    void Remove(int64_t id);

    // Trims the title in place. Throws ValidationError.
    static void Validate(Task &task);

  private:
    void Load();

  private:
    SQLite &m_Db;
    mutable std::shared_mutex m_Mutex;
    std::vector<Task> m_Tasks;
};
