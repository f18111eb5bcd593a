#pragma once

#include <sqlite3.h>

#include <array>
#include <mutex>
#include <string>

#include "errors.hpp"

// Bumped when a table gains columns. Readers ignore columns they do not know.
#define POMOCLOCK_SCHEMA_VERSION 1

class SQLite {
  public:
    SQLite(const std::string &db_path);
    ~SQLite();

    SQLite(const SQLite &) = delete;
    SQLite &operator=(const SQLite &) = delete;

    // Every statement sequence runs under this lock; one connection is shared by all threads.
    std::unique_lock<std::mutex> Lock();
    sqlite3 *Handle() {
        return m_Db;
    }

    void Exec(const std::string &sql);
    int64_t LastInsertId();
    int SchemaVersion() const {
        return m_SchemaVersion;
    }
    const std::string &Path() const {
        return m_DbPath;
    }

    // Throws PersistenceError carrying sqlite3_errmsg. Call with the lock held.
    [[noreturn]] void Fail(const std::string &what, int rc);

  private:
    void Init();
    void MigrateSchemaVersion();
    void ExecIgnoringErrors(const std::string &sql);

  private:
    sqlite3 *m_Db;
    std::string m_DbPath;
    std::mutex m_Mutex;
    int m_SchemaVersion = 0;

    // Small deterministic lookaside buffer to reduce heap churn.
    static constexpr int kLookasideSlotSize = 128;
    static constexpr int kLookasideSlotCount = 256; // 32 KiB
    std::array<unsigned char, kLookasideSlotSize * kLookasideSlotCount> m_Lookaside{};
};
