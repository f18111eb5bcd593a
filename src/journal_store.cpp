#include "journal_store.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>

#include <spdlog/spdlog.h>

#include "json.hpp"

namespace {

constexpr const char *kSelectSql = R"(
    SELECT id, phase, planned_seconds, actual_seconds, completed, task_id,
           started_at, started_mono, note, pause_count
    FROM (
        SELECT * FROM session_log
        ORDER BY started_at DESC, id DESC
        LIMIT ?
    )
    ORDER BY started_at ASC, id ASC
)";

bool IsNumeric(sqlite3_stmt *stmt, int col) {
    const int type = sqlite3_column_type(stmt, col);
    return type == SQLITE_INTEGER || type == SQLITE_FLOAT;
}

// Malformed rows (hand edits, partial writes, newer writers) are rejected, not repaired.
bool ReadRow(sqlite3_stmt *stmt, SessionRecord &out) {
    if (sqlite3_column_type(stmt, 0) != SQLITE_INTEGER ||
        sqlite3_column_type(stmt, 1) != SQLITE_TEXT ||
        sqlite3_column_type(stmt, 2) != SQLITE_INTEGER ||
        sqlite3_column_type(stmt, 3) != SQLITE_INTEGER ||
        sqlite3_column_type(stmt, 4) != SQLITE_INTEGER || !IsNumeric(stmt, 6) ||
        !IsNumeric(stmt, 7)) {
        return false;
    }

    const char *phaseTxt = reinterpret_cast<const char *>(sqlite3_column_text(stmt, 1));
    auto phase = ParsePhase(phaseTxt ? phaseTxt : "");
    if (!phase) {
        return false;
    }

    const int64_t planned = sqlite3_column_int64(stmt, 2);
    const int64_t actual = sqlite3_column_int64(stmt, 3);
    const int64_t completed = sqlite3_column_int64(stmt, 4);
    if (planned <= 0 || planned > INT32_MAX || actual < 0 || actual > planned ||
        (completed != 0 && completed != 1)) {
        return false;
    }

    SessionRecord r;
    r.id = sqlite3_column_int64(stmt, 0);
    r.phase = *phase;
    r.planned_seconds = static_cast<int>(planned);
    r.actual_seconds = static_cast<int>(actual);
    r.completed = completed == 1;

    const int taskType = sqlite3_column_type(stmt, 5);
    if (taskType == SQLITE_INTEGER) {
        r.task_id = sqlite3_column_int64(stmt, 5);
    } else if (taskType != SQLITE_NULL) {
        return false;
    }

    r.timestamp.wall = sqlite3_column_double(stmt, 6);
    r.timestamp.monotonic = sqlite3_column_double(stmt, 7);

    const int noteType = sqlite3_column_type(stmt, 8);
    if (noteType == SQLITE_TEXT) {
        const char *note = reinterpret_cast<const char *>(sqlite3_column_text(stmt, 8));
        r.note = std::string(note ? note : "");
    } else if (noteType != SQLITE_NULL) {
        return false;
    }

    const int pauseType = sqlite3_column_type(stmt, 9);
    if (pauseType == SQLITE_INTEGER) {
        r.pause_count = sqlite3_column_int(stmt, 9);
        if (r.pause_count < 0) {
            return false;
        }
    } else if (pauseType != SQLITE_NULL) {
        return false;
    }

    out = std::move(r);
    return true;
}

std::string CsvField(const std::string &value) {
    if (value.find_first_of(",\"\n\r") == std::string::npos) {
        return value;
    }
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

} // namespace

// ─────────────────────────────────────
JournalStore::JournalStore(SQLite &db) : m_Db(db) {}

// ─────────────────────────────────────
void JournalStore::Validate(const SessionRecord &record) {
    if (record.planned_seconds <= 0) {
        throw ValidationError("planned duration must be positive");
    }
    if (record.actual_seconds < 0 || record.actual_seconds > record.planned_seconds) {
        throw ValidationError("actual duration must be between 0 and the planned duration");
    }
    if (record.pause_count < 0) {
        throw ValidationError("pause count must not be negative");
    }
}

// ─────────────────────────────────────
int64_t JournalStore::Append(const SessionRecord &record) {
    Validate(record);

    std::unique_lock<std::shared_mutex> write(m_Mutex);
    auto lock = m_Db.Lock();

    const char *sql = R"(
        INSERT INTO session_log
        (phase, planned_seconds, actual_seconds, completed, task_id,
         started_at, started_mono, note, pause_count)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)
    )";

    sqlite3 *db = m_Db.Handle();
    sqlite3_stmt *stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        m_Db.Fail("prepare failed in JournalStore::Append", rc);
    }

    sqlite3_bind_text(stmt, 1, PhaseName(record.phase), -1, SQLITE_STATIC);
    sqlite3_bind_int(stmt, 2, record.planned_seconds);
    sqlite3_bind_int(stmt, 3, record.actual_seconds);
    sqlite3_bind_int(stmt, 4, record.completed ? 1 : 0);
    if (record.task_id) {
        sqlite3_bind_int64(stmt, 5, *record.task_id);
    } else {
        sqlite3_bind_null(stmt, 5);
    }
    sqlite3_bind_double(stmt, 6, record.timestamp.wall);
    sqlite3_bind_double(stmt, 7, record.timestamp.monotonic);
    if (record.note) {
        sqlite3_bind_text(stmt, 8, record.note->c_str(), -1, SQLITE_TRANSIENT);
    } else {
        sqlite3_bind_null(stmt, 8);
    }
    sqlite3_bind_int(stmt, 9, record.pause_count);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        m_Db.Fail("append to session_log failed", rc);
    }

    const int64_t id = m_Db.LastInsertId();
    spdlog::debug("Journal append: id={}, phase={}, planned={}, actual={}, completed={}", id,
                  PhaseName(record.phase), record.planned_seconds, record.actual_seconds,
                  record.completed);
    return id;
}

// ─────────────────────────────────────
JournalLoad JournalStore::LoadAll() {
    return Query(kSelectSql, -1);
}

// ─────────────────────────────────────
std::vector<SessionRecord> JournalStore::LoadRecent(size_t count) {
    if (count == 0) {
        return {};
    }
    return Query(kSelectSql, static_cast<int64_t>(count)).records;
}

// ─────────────────────────────────────
JournalLoad JournalStore::Query(const char *sql, int64_t limit) {
    std::shared_lock<std::shared_mutex> read(m_Mutex);
    auto lock = m_Db.Lock();

    sqlite3 *db = m_Db.Handle();
    sqlite3_stmt *stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        m_Db.Fail("prepare failed in JournalStore::Query", rc);
    }
    sqlite3_bind_int64(stmt, 1, limit);

    JournalLoad load;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        SessionRecord record;
        if (ReadRow(stmt, record)) {
            load.records.push_back(std::move(record));
        } else {
            load.skipped++;
            spdlog::warn("Journal: skipping malformed session_log row id={}",
                         sqlite3_column_int64(stmt, 0));
        }
    }

    if (rc != SQLITE_DONE) {
        // Keep what was read before the damaged page.
        load.skipped++;
        spdlog::error("Journal: read stopped early ({}); salvaged {} records",
                      sqlite3_errmsg(db), load.records.size());
    }
    sqlite3_finalize(stmt);

    if (load.skipped > 0) {
        spdlog::warn("Journal: loaded {} records, skipped {} malformed entries",
                     load.records.size(), load.skipped);
    }
    return load;
}

// ─────────────────────────────────────
std::string JournalStore::ExportCsv(const std::function<std::string(int64_t)> &taskTitle) {
    const JournalLoad load = LoadAll();

    std::string out = "date,start_time,duration_min,type,task,notes,completed\n";
    for (const auto &r : load.records) {
        const auto local = ToLocalTime(r.timestamp.wall);
        const auto localDay = std::chrono::floor<std::chrono::days>(local);
        const std::chrono::year_month_day ymd{localDay};
        const std::chrono::hh_mm_ss hms{local - localDay};
        const std::string date =
            fmt::format("{:04}-{:02}-{:02}", static_cast<int>(ymd.year()),
                        static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()));
        const std::string time = fmt::format("{:02}:{:02}:{:02}", hms.hours().count(),
                                             hms.minutes().count(), hms.seconds().count());

        const std::string task = (r.task_id && taskTitle) ? taskTitle(*r.task_id) : "";
        out += fmt::format("{},{},{:.1f},{},{},{},{}\n", date, time, r.actual_seconds / 60.0,
                           PhaseName(r.phase), CsvField(task), CsvField(r.note.value_or("")),
                           r.completed ? "true" : "false");
    }
    return out;
}

// ─────────────────────────────────────
nlohmann::json JournalStore::ExportJson() {
    const JournalLoad load = LoadAll();

    nlohmann::json records = nlohmann::json::array();
    for (const auto &r : load.records) {
        records.push_back(ToJson(r));
    }
    return {
        {"schema_version", m_Db.SchemaVersion()},
        {"records", records},
        {"skipped", load.skipped},
    };
}
