#include "sqlite.hpp"

#include <spdlog/spdlog.h>

// ─────────────────────────────────────
SQLite::SQLite(const std::string &db_path) : m_Db(nullptr), m_DbPath(db_path) {
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    const int rc = sqlite3_open_v2(m_DbPath.c_str(), &m_Db, flags, nullptr);
    if (rc != SQLITE_OK) {
        const std::string msg = m_Db ? sqlite3_errmsg(m_Db) : sqlite3_errstr(rc);
        spdlog::error("unable to open database {}: {}", m_DbPath, msg);
        if (m_Db) {
            sqlite3_close(m_Db);
            m_Db = nullptr;
        }
        throw PersistenceError("unable to open database " + m_DbPath + ": " + msg, rc);
    }

    spdlog::debug("SQLite database opened: {}", m_DbPath);

    sqlite3_db_config(m_Db, SQLITE_DBCONFIG_LOOKASIDE, m_Lookaside.data(), kLookasideSlotSize,
                      kLookasideSlotCount);

    sqlite3_busy_timeout(m_Db, 2000);
    ExecIgnoringErrors("PRAGMA journal_mode=WAL");
    ExecIgnoringErrors("PRAGMA synchronous=NORMAL");
    ExecIgnoringErrors("PRAGMA temp_store=FILE");
    ExecIgnoringErrors("PRAGMA cache_size = -1000;");

    try {
        Init();
        MigrateSchemaVersion();
    } catch (...) {
        sqlite3_close(m_Db);
        m_Db = nullptr;
        throw;
    }
}

// ─────────────────────────────────────
SQLite::~SQLite() {
    if (m_Db) {
        sqlite3_close(m_Db);
        m_Db = nullptr;
    }
}

// ─────────────────────────────────────
std::unique_lock<std::mutex> SQLite::Lock() {
    return std::unique_lock<std::mutex>(m_Mutex);
}

// ─────────────────────────────────────
void SQLite::Init() {
    spdlog::debug("Initializing SQLite database tables");

    // Journal of finished phases. Rows are only ever inserted.
    Exec("CREATE TABLE IF NOT EXISTS session_log ("
         "id INTEGER PRIMARY KEY AUTOINCREMENT,"
         "phase TEXT NOT NULL,"
         "planned_seconds INTEGER NOT NULL,"
         "actual_seconds INTEGER NOT NULL,"
         "completed INTEGER NOT NULL,"
         "task_id INTEGER,"
         "started_at REAL NOT NULL,"
         "started_mono REAL NOT NULL,"
         "note TEXT,"
         "pause_count INTEGER NOT NULL DEFAULT 0"
         ")");

    Exec("CREATE INDEX IF NOT EXISTS session_log_started_at ON session_log(started_at)");

    Exec("CREATE TRIGGER IF NOT EXISTS session_log_no_update BEFORE UPDATE ON session_log "
         "BEGIN SELECT RAISE(ABORT, 'session_log is append-only'); END");
    Exec("CREATE TRIGGER IF NOT EXISTS session_log_no_delete BEFORE DELETE ON session_log "
         "BEGIN SELECT RAISE(ABORT, 'session_log is append-only'); END");

    Exec("CREATE TABLE IF NOT EXISTS tasks ("
         "id INTEGER PRIMARY KEY AUTOINCREMENT,"
         "title TEXT NOT NULL,"
         "estimated_pomodoros INTEGER NOT NULL,"
         "done INTEGER NOT NULL DEFAULT 0,"
         "updated_at REAL NOT NULL"
         ")");

    Exec("CREATE TABLE IF NOT EXISTS alarms ("
         "id INTEGER PRIMARY KEY AUTOINCREMENT,"
         "hour INTEGER NOT NULL,"
         "minute INTEGER NOT NULL,"
         "second INTEGER,"
         "sound_ref TEXT NOT NULL DEFAULT '',"
         "label TEXT NOT NULL DEFAULT '',"
         "enabled INTEGER NOT NULL DEFAULT 1,"
         "repeat INTEGER NOT NULL DEFAULT 1,"
         "updated_at REAL NOT NULL"
         ")");

    spdlog::debug("SQLite database tables initialized");
}

// ─────────────────────────────────────
void SQLite::MigrateSchemaVersion() {
    sqlite3_stmt *stmt = nullptr;
    int rc = sqlite3_prepare_v2(m_Db, "PRAGMA user_version", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        Fail("read schema version", rc);
    }

    int version = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        version = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);

    if (version > POMOCLOCK_SCHEMA_VERSION) {
        spdlog::warn("Database schema version {} is newer than {}; unknown columns are ignored",
                     version, POMOCLOCK_SCHEMA_VERSION);
        m_SchemaVersion = version;
        return;
    }

    if (version < POMOCLOCK_SCHEMA_VERSION) {
        Exec("PRAGMA user_version = " + std::to_string(POMOCLOCK_SCHEMA_VERSION));
        spdlog::info("Database schema version set to {} (was {})", POMOCLOCK_SCHEMA_VERSION,
                     version);
    }
    m_SchemaVersion = POMOCLOCK_SCHEMA_VERSION;
}

// ─────────────────────────────────────
void SQLite::Exec(const std::string &sql) {
    char *err = nullptr;
    const int rc = sqlite3_exec(m_Db, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        const std::string msg = err ? err : sqlite3_errstr(rc);
        sqlite3_free(err);
        spdlog::error("SQL failed ({}): {}", msg, sql);
        throw PersistenceError(msg, rc);
    }
}

// ─────────────────────────────────────
void SQLite::ExecIgnoringErrors(const std::string &sql) {
    char *err = nullptr;
    if (sqlite3_exec(m_Db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        spdlog::debug("SQL ignored error ({}): {}", err ? err : "unknown", sql);
        sqlite3_free(err);
    }
}

// ─────────────────────────────────────
int64_t SQLite::LastInsertId() {
    return static_cast<int64_t>(sqlite3_last_insert_rowid(m_Db));
}

// ─────────────────────────────────────
void SQLite::Fail(const std::string &what, int rc) {
    const std::string msg = what + ": " + sqlite3_errmsg(m_Db);
    spdlog::error("db {}", msg);
    throw PersistenceError(msg, rc);
}
