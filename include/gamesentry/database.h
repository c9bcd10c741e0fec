/*
 * database.h - SQLite store for child profiles, session logs and settings
 * Copyright © 2026 Kirn Gill II <segin2005@gmail.com>
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <mutex>
#include <utility>
#include "gamesentry/common.h"
#include "gamesentry/profile_store.h"

struct sqlite3;
struct sqlite3_stmt;

namespace gamesentry {

class Database : public ProfileStore {
public:
    explicit Database(const std::string& db_path);
    ~Database() override;

    // Non-copyable
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    // Initialize schema
    bool initialize();

    // Child profiles
    bool upsert_child(const ChildProfile& child);
    std::optional<ChildProfile> get_child(const std::string& child_id);
    std::vector<ChildProfile> list_children();   // Ordered by display name

    // ProfileStore. Read failures throw std::runtime_error.
    LimitConfig get_limit_config(const std::string& child_id) override;
    std::optional<int64_t> append_session_log(const SessionLog& entry) override;
    bool update_session_log(int64_t id, const SessionLogUpdate& fields) override;
    bool delete_session_log(int64_t id) override;   // Refuses running sessions
    Seconds get_todays_accumulated(const std::string& child_id, const LocalDate& date) override;
    bool checkpoint_session_log(int64_t id, Timestamp at) override;
    std::optional<int64_t> change_marker() override;   // PRAGMA data_version

    // Session log queries
    std::optional<SessionLog> get_session_log(int64_t id);
    std::vector<SessionLog> get_session_logs(const std::string& child_id, int limit = 500);  // Newest first
    std::vector<SessionLog> get_session_logs_for_day(const std::string& child_id, const LocalDate& date);

    // Parent corrections. Reject stop < start and overlaps with other closed logs.
    std::optional<int64_t> add_manual_entry(const std::string& child_id, Timestamp start, Timestamp stop);
    bool edit_session_log(int64_t id, Timestamp start, Timestamp stop);
    int delete_all_session_logs(const std::string& child_id);   // Returns rows removed, -1 on error

    // Crash recovery: close logs left running at their last checkpoint
    int close_interrupted_sessions();

    // Key/value settings
    std::optional<std::string> get_setting(const std::string& key);
    bool set_setting(const std::string& key, const std::string& value);
    std::vector<std::pair<std::string, std::string>> get_all_settings();

    std::string get_last_error() const;

private:
    bool execute(const std::string& sql);
    bool has_overlap(const std::string& child_id, Timestamp start, Timestamp stop,
                     int64_t exclude_id);
    void close();

    sqlite3* db_ = nullptr;
    std::string db_path_;
    std::string last_error_;
    mutable std::mutex mutex_;
};

} // namespace gamesentry
