#include "gamesentry/database.h"
#include <sqlite3.h>
#include <stdexcept>

namespace gamesentry {

namespace {

std::string column_text(sqlite3_stmt* stmt, int col) {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? text : "";
}

std::optional<Seconds> column_seconds(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
    return Seconds(sqlite3_column_int64(stmt, col));
}

std::optional<Timestamp> column_time(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
    return from_unix_seconds(sqlite3_column_int64(stmt, col));
}

void bind_seconds(sqlite3_stmt* stmt, int idx, const std::optional<Seconds>& value) {
    if (value) {
        sqlite3_bind_int64(stmt, idx, value->count());
    } else {
        sqlite3_bind_null(stmt, idx);
    }
}

void bind_time(sqlite3_stmt* stmt, int idx, const std::optional<Timestamp>& value) {
    if (value) {
        sqlite3_bind_int64(stmt, idx, to_unix_seconds(*value));
    } else {
        sqlite3_bind_null(stmt, idx);
    }
}

// Expects: id, child_id, start_time, stop_time, checkpoint_time
SessionLog read_session_log(sqlite3_stmt* stmt) {
    SessionLog log;
    log.id = sqlite3_column_int64(stmt, 0);
    log.child_id = column_text(stmt, 1);
    log.start = from_unix_seconds(sqlite3_column_int64(stmt, 2));
    log.stop = column_time(stmt, 3);
    log.checkpoint = column_time(stmt, 4);
    return log;
}

std::optional<AllowedWindow> column_window(sqlite3_stmt* stmt, int start_col, int end_col) {
    auto start = parse_time_of_day(column_text(stmt, start_col));
    auto end = parse_time_of_day(column_text(stmt, end_col));
    if (!start || !end) return std::nullopt;
    return AllowedWindow{*start, *end};
}

void bind_window(sqlite3_stmt* stmt, int idx, const std::optional<AllowedWindow>& window) {
    if (window) {
        std::string start = format_time_of_day(window->start);
        std::string end = format_time_of_day(window->end);
        sqlite3_bind_text(stmt, idx, start.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, idx + 1, end.c_str(), -1, SQLITE_TRANSIENT);
    } else {
        sqlite3_bind_null(stmt, idx);
        sqlite3_bind_null(stmt, idx + 1);
    }
}

// Expects CHILD_COLUMNS
ChildProfile read_child(sqlite3_stmt* stmt) {
    ChildProfile child;
    child.id = column_text(stmt, 0);
    child.display_name = column_text(stmt, 1);
    child.avatar_url = column_text(stmt, 2);
    child.limits.daily_allowance = column_seconds(stmt, 3);
    child.limits.max_continuous_play = column_seconds(stmt, 4);
    child.limits.mandatory_break = column_seconds(stmt, 5);
    child.limits.allowed_window = column_window(stmt, 6, 7);
    child.limits.enforce_break = sqlite3_column_int(stmt, 8) != 0;
    child.limits.lunch_window = column_window(stmt, 9, 10);
    return child;
}

constexpr const char* CHILD_COLUMNS =
    "id, display_name, avatar_url, daily_allowance_seconds, max_continuous_seconds, "
    "mandatory_break_seconds, window_start, window_end, enforce_break, lunch_start, lunch_end";

constexpr const char* SESSION_COLUMNS = "id, child_id, start_time, stop_time, checkpoint_time";

} // namespace

Database::Database(const std::string& db_path) : db_path_(db_path) {
    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string error = sqlite3_errmsg(db_);
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open database: " + error);
    }

    execute("PRAGMA journal_mode=WAL");
    execute("PRAGMA synchronous=NORMAL");
    execute("PRAGMA temp_store=MEMORY");
}

Database::~Database() {
    close();
}

void Database::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool Database::execute(const std::string& sql) {
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        last_error_ = error_msg ? error_msg : "Unknown error";
        sqlite3_free(error_msg);
        return false;
    }
    return true;
}

std::string Database::get_last_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

bool Database::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);

    const char* schema = R"(
        CREATE TABLE IF NOT EXISTS children (
            id TEXT PRIMARY KEY,
            display_name TEXT NOT NULL DEFAULT '',
            avatar_url TEXT,
            daily_allowance_seconds INTEGER,
            max_continuous_seconds INTEGER,
            mandatory_break_seconds INTEGER,
            window_start TEXT,
            window_end TEXT,
            enforce_break INTEGER NOT NULL DEFAULT 1,
            lunch_start TEXT,
            lunch_end TEXT,
            updated_at TEXT DEFAULT (datetime('now'))
        );

        CREATE TABLE IF NOT EXISTS session_logs (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            child_id TEXT NOT NULL,
            start_time INTEGER NOT NULL,
            stop_time INTEGER,
            checkpoint_time INTEGER,
            day TEXT NOT NULL,
            manual INTEGER NOT NULL DEFAULT 0
        );

        CREATE INDEX IF NOT EXISTS idx_logs_child_day ON session_logs(child_id, day);
        CREATE INDEX IF NOT EXISTS idx_logs_open ON session_logs(stop_time);

        CREATE TABLE IF NOT EXISTS settings (
            key TEXT PRIMARY KEY,
            value TEXT NOT NULL
        );
    )";

    if (!execute(schema)) return false;

    // Databases created before the lunch routine lack its columns
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "PRAGMA table_info(children)", -1, &stmt, nullptr) != SQLITE_OK) {
        last_error_ = sqlite3_errmsg(db_);
        return false;
    }
    bool has_lunch = false;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        if (column_text(stmt, 1) == "lunch_start") has_lunch = true;
    }
    sqlite3_finalize(stmt);

    if (!has_lunch) {
        return execute("ALTER TABLE children ADD COLUMN lunch_start TEXT;"
                       "ALTER TABLE children ADD COLUMN lunch_end TEXT;");
    }
    return true;
}

bool Database::upsert_child(const ChildProfile& child) {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_stmt* stmt = nullptr;
    const char* sql = R"(
        INSERT INTO children (id, display_name, avatar_url, daily_allowance_seconds,
                              max_continuous_seconds, mandatory_break_seconds,
                              window_start, window_end, enforce_break,
                              lunch_start, lunch_end)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(id) DO UPDATE SET
            display_name = excluded.display_name,
            avatar_url = excluded.avatar_url,
            daily_allowance_seconds = excluded.daily_allowance_seconds,
            max_continuous_seconds = excluded.max_continuous_seconds,
            mandatory_break_seconds = excluded.mandatory_break_seconds,
            window_start = excluded.window_start,
            window_end = excluded.window_end,
            enforce_break = excluded.enforce_break,
            lunch_start = excluded.lunch_start,
            lunch_end = excluded.lunch_end,
            updated_at = datetime('now')
    )";

    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        last_error_ = sqlite3_errmsg(db_);
        return false;
    }

    const LimitConfig& limits = child.limits;
    sqlite3_bind_text(stmt, 1, child.id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, child.display_name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, child.avatar_url.c_str(), -1, SQLITE_TRANSIENT);
    bind_seconds(stmt, 4, limits.daily_allowance);
    bind_seconds(stmt, 5, limits.max_continuous_play);
    bind_seconds(stmt, 6, limits.mandatory_break);
    bind_window(stmt, 7, limits.allowed_window);
    sqlite3_bind_int(stmt, 9, limits.enforce_break ? 1 : 0);
    bind_window(stmt, 10, limits.lunch_window);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        last_error_ = sqlite3_errmsg(db_);
        return false;
    }
    return true;
}

std::optional<ChildProfile> Database::get_child(const std::string& child_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_stmt* stmt = nullptr;
    std::string sql = std::string("SELECT ") + CHILD_COLUMNS + " FROM children WHERE id = ?";

    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        last_error_ = sqlite3_errmsg(db_);
        return std::nullopt;
    }

    sqlite3_bind_text(stmt, 1, child_id.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(stmt) != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        return std::nullopt;
    }

    ChildProfile child = read_child(stmt);
    sqlite3_finalize(stmt);
    return child;
}

std::vector<ChildProfile> Database::list_children() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<ChildProfile> result;
    sqlite3_stmt* stmt = nullptr;
    std::string sql = std::string("SELECT ") + CHILD_COLUMNS +
                      " FROM children ORDER BY display_name COLLATE NOCASE, id";

    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        last_error_ = sqlite3_errmsg(db_);
        return result;
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        result.push_back(read_child(stmt));
    }

    sqlite3_finalize(stmt);
    return result;
}

LimitConfig Database::get_limit_config(const std::string& child_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_stmt* stmt = nullptr;
    std::string sql = std::string("SELECT ") + CHILD_COLUMNS + " FROM children WHERE id = ?";

    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        last_error_ = sqlite3_errmsg(db_);
        throw std::runtime_error("Failed to read limits: " + last_error_);
    }

    sqlite3_bind_text(stmt, 1, child_id.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);

    LimitConfig config;
    if (rc == SQLITE_ROW) {
        config = read_child(stmt).limits;
    } else if (rc != SQLITE_DONE) {
        last_error_ = sqlite3_errmsg(db_);
        sqlite3_finalize(stmt);
        throw std::runtime_error("Failed to read limits: " + last_error_);
    }

    sqlite3_finalize(stmt);
    return config;
}

std::optional<int64_t> Database::append_session_log(const SessionLog& entry) {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_stmt* stmt = nullptr;
    const char* sql = R"(
        INSERT INTO session_logs (child_id, start_time, stop_time, checkpoint_time, day)
        VALUES (?, ?, ?, ?, ?)
    )";

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        last_error_ = sqlite3_errmsg(db_);
        return std::nullopt;
    }

    std::string day = local_date(entry.start).to_string();
    sqlite3_bind_text(stmt, 1, entry.child_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, to_unix_seconds(entry.start));
    bind_time(stmt, 3, entry.stop);
    bind_time(stmt, 4, entry.checkpoint);
    sqlite3_bind_text(stmt, 5, day.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        last_error_ = sqlite3_errmsg(db_);
        return std::nullopt;
    }
    return sqlite3_last_insert_rowid(db_);
}

bool Database::update_session_log(int64_t id, const SessionLogUpdate& fields) {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_stmt* stmt = nullptr;
    const char* sql = R"(
        UPDATE session_logs SET
            start_time = COALESCE(?, start_time),
            stop_time = COALESCE(?, stop_time),
            day = COALESCE(?, day)
        WHERE id = ?
    )";

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        last_error_ = sqlite3_errmsg(db_);
        return false;
    }

    bind_time(stmt, 1, fields.start);
    bind_time(stmt, 2, fields.stop);
    if (fields.start) {
        std::string day = local_date(*fields.start).to_string();
        sqlite3_bind_text(stmt, 3, day.c_str(), -1, SQLITE_TRANSIENT);
    } else {
        sqlite3_bind_null(stmt, 3);
    }
    sqlite3_bind_int64(stmt, 4, id);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        last_error_ = sqlite3_errmsg(db_);
        return false;
    }
    if (sqlite3_changes(db_) == 0) {
        last_error_ = "No session log with id " + std::to_string(id);
        return false;
    }
    return true;
}

bool Database::delete_session_log(int64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_stmt* stmt = nullptr;
    const char* sql = "DELETE FROM session_logs WHERE id = ? AND stop_time IS NOT NULL";

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        last_error_ = sqlite3_errmsg(db_);
        return false;
    }

    sqlite3_bind_int64(stmt, 1, id);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        last_error_ = sqlite3_errmsg(db_);
        return false;
    }
    if (sqlite3_changes(db_) == 0) {
        last_error_ = "No closed session log with id " + std::to_string(id);
        return false;
    }
    return true;
}

Seconds Database::get_todays_accumulated(const std::string& child_id, const LocalDate& date) {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_stmt* stmt = nullptr;
    const char* sql = R"(
        SELECT COALESCE(SUM(stop_time - start_time), 0) FROM session_logs
        WHERE child_id = ? AND day = ? AND stop_time IS NOT NULL
              AND stop_time >= start_time
    )";

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        last_error_ = sqlite3_errmsg(db_);
        throw std::runtime_error("Failed to sum session logs: " + last_error_);
    }

    std::string day = date.to_string();
    sqlite3_bind_text(stmt, 1, child_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, day.c_str(), -1, SQLITE_TRANSIENT);

    int64_t total = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        total = sqlite3_column_int64(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return Seconds(total);
}

bool Database::checkpoint_session_log(int64_t id, Timestamp at) {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_stmt* stmt = nullptr;
    const char* sql = "UPDATE session_logs SET checkpoint_time = ? WHERE id = ? AND stop_time IS NULL";

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        last_error_ = sqlite3_errmsg(db_);
        return false;
    }

    sqlite3_bind_int64(stmt, 1, to_unix_seconds(at));
    sqlite3_bind_int64(stmt, 2, id);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        last_error_ = sqlite3_errmsg(db_);
        return false;
    }
    return true;
}

std::optional<int64_t> Database::change_marker() {
    std::lock_guard<std::mutex> lock(mutex_);

    // Only commits from other connections move data_version
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "PRAGMA data_version", -1, &stmt, nullptr) != SQLITE_OK) {
        last_error_ = sqlite3_errmsg(db_);
        return std::nullopt;
    }

    std::optional<int64_t> version;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        version = sqlite3_column_int64(stmt, 0);
    } else {
        last_error_ = sqlite3_errmsg(db_);
    }
    sqlite3_finalize(stmt);
    return version;
}

std::optional<SessionLog> Database::get_session_log(int64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_stmt* stmt = nullptr;
    std::string sql = std::string("SELECT ") + SESSION_COLUMNS + " FROM session_logs WHERE id = ?";

    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        last_error_ = sqlite3_errmsg(db_);
        return std::nullopt;
    }

    sqlite3_bind_int64(stmt, 1, id);
    if (sqlite3_step(stmt) != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        return std::nullopt;
    }

    SessionLog log = read_session_log(stmt);
    sqlite3_finalize(stmt);
    return log;
}

std::vector<SessionLog> Database::get_session_logs(const std::string& child_id, int limit) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<SessionLog> result;
    sqlite3_stmt* stmt = nullptr;
    std::string sql = std::string("SELECT ") + SESSION_COLUMNS +
                      " FROM session_logs WHERE child_id = ? ORDER BY start_time DESC, id DESC LIMIT ?";

    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        last_error_ = sqlite3_errmsg(db_);
        return result;
    }

    sqlite3_bind_text(stmt, 1, child_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 2, limit);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        result.push_back(read_session_log(stmt));
    }

    sqlite3_finalize(stmt);
    return result;
}

std::vector<SessionLog> Database::get_session_logs_for_day(const std::string& child_id,
                                                           const LocalDate& date) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<SessionLog> result;
    sqlite3_stmt* stmt = nullptr;
    std::string sql = std::string("SELECT ") + SESSION_COLUMNS +
                      " FROM session_logs WHERE child_id = ? AND day = ? ORDER BY start_time, id";

    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        last_error_ = sqlite3_errmsg(db_);
        return result;
    }

    std::string day = date.to_string();
    sqlite3_bind_text(stmt, 1, child_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, day.c_str(), -1, SQLITE_TRANSIENT);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        result.push_back(read_session_log(stmt));
    }

    sqlite3_finalize(stmt);
    return result;
}

// Caller holds mutex_
bool Database::has_overlap(const std::string& child_id, Timestamp start, Timestamp stop,
                           int64_t exclude_id) {
    sqlite3_stmt* stmt = nullptr;
    const char* sql = R"(
        SELECT start_time, stop_time FROM session_logs
        WHERE child_id = ? AND id != ? AND stop_time IS NOT NULL
              AND start_time < ? AND stop_time > ?
        LIMIT 1
    )";

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        last_error_ = sqlite3_errmsg(db_);
        return true;
    }

    sqlite3_bind_text(stmt, 1, child_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, exclude_id);
    sqlite3_bind_int64(stmt, 3, to_unix_seconds(stop));
    sqlite3_bind_int64(stmt, 4, to_unix_seconds(start));

    bool overlap = false;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        overlap = true;
        last_error_ = "The new time range overlaps with another session (from " +
                      format_timestamp(from_unix_seconds(sqlite3_column_int64(stmt, 0))) + " to " +
                      format_timestamp(from_unix_seconds(sqlite3_column_int64(stmt, 1))) + ")";
    }
    sqlite3_finalize(stmt);
    return overlap;
}

std::optional<int64_t> Database::add_manual_entry(const std::string& child_id,
                                                  Timestamp start, Timestamp stop) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (stop < start) {
        last_error_ = "Start time cannot be after stop time";
        return std::nullopt;
    }
    if (has_overlap(child_id, start, stop, 0)) {
        return std::nullopt;
    }

    sqlite3_stmt* stmt = nullptr;
    const char* sql = R"(
        INSERT INTO session_logs (child_id, start_time, stop_time, day, manual)
        VALUES (?, ?, ?, ?, 1)
    )";

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        last_error_ = sqlite3_errmsg(db_);
        return std::nullopt;
    }

    std::string day = local_date(start).to_string();
    sqlite3_bind_text(stmt, 1, child_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, to_unix_seconds(start));
    sqlite3_bind_int64(stmt, 3, to_unix_seconds(stop));
    sqlite3_bind_text(stmt, 4, day.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        last_error_ = sqlite3_errmsg(db_);
        return std::nullopt;
    }
    return sqlite3_last_insert_rowid(db_);
}

bool Database::edit_session_log(int64_t id, Timestamp start, Timestamp stop) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (stop < start) {
        last_error_ = "Start time cannot be after stop time";
        return false;
    }

    sqlite3_stmt* stmt = nullptr;
    const char* find_sql = "SELECT child_id, stop_time FROM session_logs WHERE id = ?";
    if (sqlite3_prepare_v2(db_, find_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        last_error_ = sqlite3_errmsg(db_);
        return false;
    }

    sqlite3_bind_int64(stmt, 1, id);
    if (sqlite3_step(stmt) != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        last_error_ = "No session log with id " + std::to_string(id);
        return false;
    }
    std::string child_id = column_text(stmt, 0);
    bool running = sqlite3_column_type(stmt, 1) == SQLITE_NULL;
    sqlite3_finalize(stmt);

    if (running) {
        last_error_ = "Cannot edit a session that is still running";
        return false;
    }
    if (has_overlap(child_id, start, stop, id)) {
        return false;
    }

    const char* sql = R"(
        UPDATE session_logs SET start_time = ?, stop_time = ?, day = ?, manual = 1
        WHERE id = ?
    )";
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        last_error_ = sqlite3_errmsg(db_);
        return false;
    }

    std::string day = local_date(start).to_string();
    sqlite3_bind_int64(stmt, 1, to_unix_seconds(start));
    sqlite3_bind_int64(stmt, 2, to_unix_seconds(stop));
    sqlite3_bind_text(stmt, 3, day.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 4, id);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        last_error_ = sqlite3_errmsg(db_);
        return false;
    }
    return true;
}

int Database::delete_all_session_logs(const std::string& child_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_stmt* stmt = nullptr;
    const char* sql = "DELETE FROM session_logs WHERE child_id = ? AND stop_time IS NOT NULL";

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        last_error_ = sqlite3_errmsg(db_);
        return -1;
    }

    sqlite3_bind_text(stmt, 1, child_id.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        last_error_ = sqlite3_errmsg(db_);
        return -1;
    }
    return sqlite3_changes(db_);
}

int Database::close_interrupted_sessions() {
    std::lock_guard<std::mutex> lock(mutex_);

    const char* sql = R"(
        UPDATE session_logs SET stop_time = COALESCE(checkpoint_time, start_time)
        WHERE stop_time IS NULL
    )";

    if (!execute(sql)) {
        return -1;
    }
    return sqlite3_changes(db_);
}

std::optional<std::string> Database::get_setting(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_stmt* stmt = nullptr;
    const char* sql = "SELECT value FROM settings WHERE key = ?";

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        last_error_ = sqlite3_errmsg(db_);
        return std::nullopt;
    }

    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    std::optional<std::string> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = column_text(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return result;
}

bool Database::set_setting(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_stmt* stmt = nullptr;
    const char* sql = R"(
        INSERT INTO settings (key, value) VALUES (?, ?)
        ON CONFLICT(key) DO UPDATE SET value = excluded.value
    )";

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        last_error_ = sqlite3_errmsg(db_);
        return false;
    }

    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, value.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        last_error_ = sqlite3_errmsg(db_);
        return false;
    }
    return true;
}

std::vector<std::pair<std::string, std::string>> Database::get_all_settings() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::pair<std::string, std::string>> result;
    sqlite3_stmt* stmt = nullptr;
    const char* sql = "SELECT key, value FROM settings ORDER BY key";

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        last_error_ = sqlite3_errmsg(db_);
        return result;
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        result.emplace_back(column_text(stmt, 0), column_text(stmt, 1));
    }
    sqlite3_finalize(stmt);
    return result;
}

} // namespace gamesentry
