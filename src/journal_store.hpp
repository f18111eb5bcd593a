#pragma once

#include <functional>
#include <shared_mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common.hpp"
#include "sqlite.hpp"

struct JournalLoad {
    std::vector<SessionRecord> records; // ascending by start time
    int skipped = 0;                    // malformed rows left out
};

// Append-only journal of finished phases. The only owner of SessionRecords; everything
// else reads copies.
class JournalStore {
  public:
    explicit JournalStore(SQLite &db);

    // Returns the new row id. Throws ValidationError for an inconsistent record and
    // PersistenceError when the row cannot be written.
    int64_t Append(const SessionRecord &record);

    JournalLoad LoadAll();
    std::vector<SessionRecord> LoadRecent(size_t count);

    std::string ExportCsv(const std::function<std::string(int64_t)> &taskTitle);
    nlohmann::json ExportJson();

    static void Validate(const SessionRecord &record);

  private:
    JournalLoad Query(const char *sql, int64_t limit);

  private:
    SQLite &m_Db;
    mutable std::shared_mutex m_Mutex;
};
