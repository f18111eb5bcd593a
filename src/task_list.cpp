#include "task_list.hpp"

#include <algorithm>
#include <ctime>
#include <mutex>

#include <spdlog/spdlog.h>

namespace {

std::string Trim(const std::string &s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

} // namespace

// ─────────────────────────────────────
TaskList::TaskList(SQLite &db) : m_Db(db) {
    Load();
}

// ─────────────────────────────────────
void TaskList::Load() {
    std::unique_lock<std::shared_mutex> write(m_Mutex);
    auto lock = m_Db.Lock();

    sqlite3_stmt *stmt = nullptr;
    const char *sql = "SELECT id, title, estimated_pomodoros, done FROM tasks ORDER BY id";
    int rc = sqlite3_prepare_v2(m_Db.Handle(), sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        m_Db.Fail("prepare failed in TaskList::Load", rc);
    }

    std::vector<Task> tasks;
    int skipped = 0;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        Task t;
        t.id = sqlite3_column_int64(stmt, 0);
        const char *title = reinterpret_cast<const char *>(sqlite3_column_text(stmt, 1));
        t.title = title ? title : "";
        t.estimated_pomodoros = sqlite3_column_int(stmt, 2);
        t.done = sqlite3_column_int(stmt, 3) != 0;
        if (t.title.empty() || t.estimated_pomodoros < 1) {
            skipped++;
            continue;
        }
        tasks.push_back(std::move(t));
    }
    sqlite3_finalize(stmt);

    if (skipped > 0) {
        spdlog::warn("TaskList: skipped {} malformed task rows", skipped);
    }
    spdlog::debug("TaskList: loaded {} tasks", tasks.size());
    m_Tasks = std::move(tasks);
}

// ─────────────────────────────────────
void TaskList::Validate(Task &task) {
    task.title = Trim(task.title);
    if (task.title.empty()) {
        throw ValidationError("task title must not be empty");
    }
    if (task.title.size() > 512) {
        throw ValidationError("task title is too long");
    }
    if (task.estimated_pomodoros < 1) {
        throw ValidationError("estimated pomodoros must be a positive integer");
    }
}

// ─────────────────────────────────────
std::vector<Task> TaskList::List() const {
    std::shared_lock<std::shared_mutex> read(m_Mutex);
    return m_Tasks;
}

// ─────────────────────────────────────
std::optional<Task> TaskList::Find(int64_t id) const {
    std::shared_lock<std::shared_mutex> read(m_Mutex);
    auto it = std::find_if(m_Tasks.begin(), m_Tasks.end(),
                           [id](const Task &t) { return t.id == id; });
    if (it == m_Tasks.end()) {
        return std::nullopt;
    }
    return *it;
}

// ─────────────────────────────────────
std::string TaskList::DisplayTitle(std::optional<int64_t> id) const {
    if (!id) {
        return "";
    }
    auto task = Find(*id);
    return task ? task->title : DELETED_TASK_TITLE;
}

// ─────────────────────────────────────
Task TaskList::Create(Task task) {
    Validate(task);

    std::unique_lock<std::shared_mutex> write(m_Mutex);
    auto lock = m_Db.Lock();

    sqlite3_stmt *stmt = nullptr;
    const char *sql =
        "INSERT INTO tasks (title, estimated_pomodoros, done, updated_at) VALUES (?, ?, ?, ?)";
    int rc = sqlite3_prepare_v2(m_Db.Handle(), sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        m_Db.Fail("prepare failed in TaskList::Create", rc);
    }

    sqlite3_bind_text(stmt, 1, task.title.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 2, task.estimated_pomodoros);
    sqlite3_bind_int(stmt, 3, task.done ? 1 : 0);
    sqlite3_bind_double(stmt, 4, static_cast<double>(std::time(nullptr)));

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        m_Db.Fail("insert into tasks failed", rc);
    }

    task.id = m_Db.LastInsertId();
    m_Tasks.push_back(task);
    spdlog::info("Task created: id={}, title='{}', estimate={}", task.id, task.title,
                 task.estimated_pomodoros);
    return task;
}

// ─────────────────────────────────────
Task TaskList::Update(Task task) {
    Validate(task);

    std::unique_lock<std::shared_mutex> write(m_Mutex);
    auto it = std::find_if(m_Tasks.begin(), m_Tasks.end(),
                           [&](const Task &t) { return t.id == task.id; });
    if (it == m_Tasks.end()) {
        throw ValidationError("unknown task id " + std::to_string(task.id));
    }

    auto lock = m_Db.Lock();
    sqlite3_stmt *stmt = nullptr;
    const char *sql =
        "UPDATE tasks SET title = ?, estimated_pomodoros = ?, done = ?, updated_at = ? "
        "WHERE id = ?";
    int rc = sqlite3_prepare_v2(m_Db.Handle(), sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        m_Db.Fail("prepare failed in TaskList::Update", rc);
    }

    sqlite3_bind_text(stmt, 1, task.title.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 2, task.estimated_pomodoros);
    sqlite3_bind_int(stmt, 3, task.done ? 1 : 0);
    sqlite3_bind_double(stmt, 4, static_cast<double>(std::time(nullptr)));
    sqlite3_bind_int64(stmt, 5, task.id);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        m_Db.Fail("update of tasks failed", rc);
    }

    *it = task;
    spdlog::info("Task updated: id={}, title='{}', done={}", task.id, task.title, task.done);
    return task;
}

// ─────────────────────────────────────
void TaskList::Remove(int64_t id) {
    std::unique_lock<std::shared_mutex> write(m_Mutex);
    auto it = std::find_if(m_Tasks.begin(), m_Tasks.end(),
                           [id](const Task &t) { return t.id == id; });
    if (it == m_Tasks.end()) {
        throw ValidationError("unknown task id " + std::to_string(id));
    }

    auto lock = m_Db.Lock();
    sqlite3_stmt *stmt = nullptr;
    int rc = sqlite3_prepare_v2(m_Db.Handle(), "DELETE FROM tasks WHERE id = ?", -1, &stmt,
                                nullptr);
    if (rc != SQLITE_OK) {
        m_Db.Fail("prepare failed in TaskList::Remove", rc);
    }
    sqlite3_bind_int64(stmt, 1, id);
    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        m_Db.Fail("delete from tasks failed", rc);
    }

    // Journal rows keep the id; they now resolve to DELETED_TASK_TITLE.
    m_Tasks.erase(it);
    spdlog::info("Task removed: id={}", id);
}
