#include "gamesentry/database.h"
#include "gamesentry/enforcer.h"
#include "test_support.h"
#include <sqlite3.h>
#include <unistd.h>
#include <iostream>
#include <cassert>
#include <cstdio>
#include <string>

using namespace gamesentry;

namespace {

Timestamp at(int day, int hour, int minute) {
    return make_local_time(2026, 3, day, hour, minute, 0);
}

SessionLog closed_log(const std::string& child, Timestamp start, Timestamp stop) {
    SessionLog log;
    log.child_id = child;
    log.start = start;
    log.stop = stop;
    return log;
}

std::string temp_db_path(const std::string& tag) {
    return "/tmp/gamesentry_" + tag + "_" + std::to_string(getpid()) + ".db";
}

void remove_db_files(const std::string& path) {
    std::remove(path.c_str());
    std::remove((path + "-wal").c_str());
    std::remove((path + "-shm").c_str());
}

} // namespace

void test_child_profiles() {
    Database db(":memory:");
    assert(db.initialize());

    ChildProfile zoe;
    zoe.id = "zoe";
    zoe.display_name = "Zoe";
    zoe.limits.daily_allowance = Seconds(3600);
    zoe.limits.max_continuous_play = Seconds(1800);
    zoe.limits.mandatory_break = Seconds(600);
    zoe.limits.allowed_window = AllowedWindow{TimeOfDay{15, 0, 0}, TimeOfDay{18, 30, 0}};
    assert(db.upsert_child(zoe));

    ChildProfile adam;
    adam.id = "adam";
    adam.display_name = "adam";
    adam.limits.enforce_break = false;
    assert(db.upsert_child(adam));

    auto loaded = db.get_child("zoe");
    assert(loaded);
    assert(loaded->display_name == "Zoe");
    assert(loaded->limits.daily_allowance == Seconds(3600));
    assert(loaded->limits.mandatory_break == Seconds(600));
    assert(loaded->limits.allowed_window);
    assert(loaded->limits.allowed_window->end.hour == 18);
    assert(loaded->limits.allowed_window->end.minute == 30);
    assert(loaded->limits.enforce_break);

    // Absent limits stay absent, not zero
    LimitConfig config = db.get_limit_config("adam");
    assert(!config.daily_allowance);
    assert(!config.max_continuous_play);
    assert(!config.allowed_window);
    assert(!config.enforce_break);

    // Unknown child has no limits
    LimitConfig none = db.get_limit_config("nobody");
    assert(!none.daily_allowance);
    assert(!db.get_child("nobody"));

    auto children = db.list_children();
    assert(children.size() == 2);
    assert(children[0].id == "adam");
    assert(children[1].id == "zoe");

    // Update in place
    zoe.limits.daily_allowance.reset();
    assert(db.upsert_child(zoe));
    assert(!db.get_limit_config("zoe").daily_allowance);
    assert(db.list_children().size() == 2);

    std::cout << "test_child_profiles passed!" << std::endl;
}

void test_session_log_lifecycle() {
    Database db(":memory:");
    assert(db.initialize());

    SessionLog running;
    running.child_id = "kid";
    running.start = at(2, 10, 0);
    auto id = db.append_session_log(running);
    assert(id);

    auto loaded = db.get_session_log(*id);
    assert(loaded && loaded->is_open());

    // Running sessions do not count and cannot be deleted
    assert(db.get_todays_accumulated("kid", local_date(at(2, 0, 0))) == Seconds(0));
    assert(!db.delete_session_log(*id));

    assert(db.checkpoint_session_log(*id, at(2, 10, 5)));
    SessionLogUpdate update;
    update.stop = at(2, 10, 45);
    assert(db.update_session_log(*id, update));
    assert(db.get_todays_accumulated("kid", local_date(at(2, 0, 0))) == Seconds(45 * 60));

    // Unknown id
    assert(!db.update_session_log(9999, update));

    assert(db.append_session_log(closed_log("kid", at(2, 16, 0), at(2, 16, 15))));
    assert(db.append_session_log(closed_log("kid", at(1, 16, 0), at(1, 17, 0))));
    assert(db.append_session_log(closed_log("other", at(2, 16, 0), at(2, 18, 0))));

    assert(db.get_todays_accumulated("kid", local_date(at(2, 0, 0))) == Seconds(60 * 60));
    assert(db.get_todays_accumulated("kid", local_date(at(1, 0, 0))) == Seconds(60 * 60));

    auto logs = db.get_session_logs("kid");
    assert(logs.size() == 3);
    assert(logs[0].start == at(2, 16, 0));  // Newest first
    assert(logs[2].start == at(1, 16, 0));
    assert(db.get_session_logs("kid", 1).size() == 1);

    auto day_logs = db.get_session_logs_for_day("kid", local_date(at(2, 0, 0)));
    assert(day_logs.size() == 2);
    assert(day_logs[0].start == at(2, 10, 0));

    assert(db.delete_session_log(*id));
    assert(!db.get_session_log(*id));
    assert(db.get_todays_accumulated("kid", local_date(at(2, 0, 0))) == Seconds(15 * 60));

    std::cout << "test_session_log_lifecycle passed!" << std::endl;
}

void test_manual_entries() {
    Database db(":memory:");
    assert(db.initialize());

    auto first = db.add_manual_entry("kid", at(5, 9, 0), at(5, 9, 30));
    assert(first);

    // Stop before start
    assert(!db.add_manual_entry("kid", at(5, 12, 0), at(5, 11, 0)));
    assert(db.get_last_error() == "Start time cannot be after stop time");

    // Overlap
    assert(!db.add_manual_entry("kid", at(5, 9, 15), at(5, 10, 0)));
    assert(db.get_last_error().find("overlaps with another session") != std::string::npos);

    // Touching ranges are fine, as are other children
    assert(db.add_manual_entry("kid", at(5, 9, 30), at(5, 10, 0)));
    assert(db.add_manual_entry("sibling", at(5, 9, 0), at(5, 10, 0)));

    assert(db.edit_session_log(*first, at(5, 8, 0), at(5, 8, 45)));
    auto edited = db.get_session_log(*first);
    assert(edited && edited->start == at(5, 8, 0));
    assert(db.get_todays_accumulated("kid", local_date(at(5, 0, 0))) == Seconds(75 * 60));

    // Editing a log onto its neighbour
    assert(!db.edit_session_log(*first, at(5, 8, 0), at(5, 9, 45)));
    assert(!db.edit_session_log(*first, at(5, 9, 0), at(5, 8, 0)));

    // Moving a log to another day moves its total
    assert(db.edit_session_log(*first, at(4, 20, 0), at(4, 20, 45)));
    assert(db.get_todays_accumulated("kid", local_date(at(4, 0, 0))) == Seconds(45 * 60));
    assert(db.get_todays_accumulated("kid", local_date(at(5, 0, 0))) == Seconds(30 * 60));

    // Running sessions cannot be edited
    SessionLog running;
    running.child_id = "kid";
    running.start = at(5, 15, 0);
    auto open_id = db.append_session_log(running);
    assert(open_id);
    assert(!db.edit_session_log(*open_id, at(5, 14, 0), at(5, 14, 30)));

    assert(db.delete_all_session_logs("kid") == 2);
    assert(db.get_session_logs("kid").size() == 1);
    assert(db.get_session_logs("sibling").size() == 1);

    std::cout << "test_manual_entries passed!" << std::endl;
}

void test_close_interrupted_sessions() {
    Database db(":memory:");
    assert(db.initialize());

    SessionLog with_checkpoint;
    with_checkpoint.child_id = "kid";
    with_checkpoint.start = at(7, 10, 0);
    auto a = db.append_session_log(with_checkpoint);
    assert(a);
    assert(db.checkpoint_session_log(*a, at(7, 10, 20)));

    SessionLog bare;
    bare.child_id = "kid";
    bare.start = at(7, 11, 0);
    auto b = db.append_session_log(bare);
    assert(b);

    assert(db.close_interrupted_sessions() == 2);
    assert(db.close_interrupted_sessions() == 0);

    auto first = db.get_session_log(*a);
    assert(first && first->stop && *first->stop == at(7, 10, 20));
    auto second = db.get_session_log(*b);
    assert(second && second->stop && *second->stop == at(7, 11, 0));
    assert(db.get_todays_accumulated("kid", local_date(at(7, 0, 0))) == Seconds(20 * 60));

    std::cout << "test_close_interrupted_sessions passed!" << std::endl;
}

void test_settings_table() {
    Database db(":memory:");
    assert(db.initialize());

    assert(!db.get_setting("smtp_url"));
    assert(db.set_setting("smtp_url", "smtp://mail.example.org:587"));
    assert(db.set_setting("smtp_url", "smtps://mail.example.org:465"));
    assert(db.set_setting("email_enabled", "1"));

    assert(*db.get_setting("smtp_url") == "smtps://mail.example.org:465");
    auto all = db.get_all_settings();
    assert(all.size() == 2);
    assert(all[0].first == "email_enabled");

    std::cout << "test_settings_table passed!" << std::endl;
}

void test_enforcer_over_database() {
    Database db(":memory:");
    assert(db.initialize());

    ChildProfile kid;
    kid.id = "kid";
    kid.display_name = "Kid";
    kid.limits.daily_allowance = Seconds(3600);
    assert(db.upsert_child(kid));
    assert(db.add_manual_entry("kid", at(9, 8, 0), at(9, 8, 40)));

    testing::ManualClock clock(at(9, 10, 0));
    testing::RecordingNotifier notifier;
    SessionEnforcer enforcer(db, notifier, clock);

    assert(enforcer.snapshot("kid").accumulated == Seconds(40 * 60));
    assert(enforcer.start("kid").success);
    clock.advance_minutes(20);
    auto events = enforcer.evaluate();
    assert(testing::has_event(events, EventType::DAILY_LIMIT_REACHED));

    LocalDate today = local_date(clock.now());
    assert(db.get_todays_accumulated("kid", today) == Seconds(3600));
    assert(enforcer.recompute_accumulated("kid", today) == Seconds(3600));

    auto logs = db.get_session_logs_for_day("kid", today);
    assert(logs.size() == 2);
    assert(!logs[1].is_open());

    std::cout << "test_enforcer_over_database passed!" << std::endl;
}

void test_lunch_window_columns() {
    std::string path = temp_db_path("lunch");
    remove_db_files(path);

    // A children table from before the lunch routine existed
    sqlite3* raw = nullptr;
    assert(sqlite3_open(path.c_str(), &raw) == SQLITE_OK);
    const char* old_schema = R"(
        CREATE TABLE children (
            id TEXT PRIMARY KEY,
            display_name TEXT NOT NULL DEFAULT '',
            avatar_url TEXT,
            daily_allowance_seconds INTEGER,
            max_continuous_seconds INTEGER,
            mandatory_break_seconds INTEGER,
            window_start TEXT,
            window_end TEXT,
            enforce_break INTEGER NOT NULL DEFAULT 1,
            updated_at TEXT DEFAULT (datetime('now'))
        );
        INSERT INTO children (id, display_name, daily_allowance_seconds) VALUES ('old', 'Old', 600);
    )";
    assert(sqlite3_exec(raw, old_schema, nullptr, nullptr, nullptr) == SQLITE_OK);
    sqlite3_close(raw);

    {
        Database db(path);
        assert(db.initialize());

        LimitConfig old_limits = db.get_limit_config("old");
        assert(old_limits.daily_allowance == Seconds(600));
        assert(!old_limits.lunch_window);

        ChildProfile kid;
        kid.id = "kid";
        kid.display_name = "Kid";
        kid.limits.lunch_window = AllowedWindow{TimeOfDay{12, 0, 0}, TimeOfDay{13, 15, 0}};
        assert(db.upsert_child(kid));

        LimitConfig loaded = db.get_limit_config("kid");
        assert(loaded.lunch_window);
        assert(loaded.lunch_window->start.hour == 12);
        assert(loaded.lunch_window->end.hour == 13);
        assert(loaded.lunch_window->end.minute == 15);
        assert(!loaded.allowed_window);

        kid.limits.lunch_window.reset();
        assert(db.upsert_child(kid));
        assert(!db.get_child("kid")->limits.lunch_window);
    }

    // Second open must not try to add the columns again
    {
        Database db(path);
        assert(db.initialize());
        assert(db.list_children().size() == 2);
    }

    remove_db_files(path);
    std::cout << "test_lunch_window_columns passed!" << std::endl;
}

void test_engine_sees_other_connection() {
    std::string path = temp_db_path("shared");
    remove_db_files(path);
    {
        Database engine_db(path);
        assert(engine_db.initialize());

        ChildProfile kid;
        kid.id = "kid";
        kid.display_name = "Kid";
        kid.limits.daily_allowance = Seconds(3600);
        assert(engine_db.upsert_child(kid));
        assert(engine_db.change_marker());

        testing::ManualClock clock(at(9, 10, 0));
        testing::RecordingNotifier notifier;
        SessionEnforcer enforcer(engine_db, notifier, clock);

        assert(enforcer.start("kid").success);
        clock.advance_minutes(60);
        enforcer.evaluate();
        assert(enforcer.snapshot("kid").phase == EnforcementPhase::LOCKED);

        // The engine's own writes do not count as outside changes
        auto own = engine_db.change_marker();
        enforcer.evaluate();
        assert(engine_db.change_marker() == own);

        // A parent deletes the session from another process
        Database parent_db(path);
        assert(parent_db.initialize());
        LocalDate today = local_date(clock.now());
        auto logs = parent_db.get_session_logs_for_day("kid", today);
        assert(logs.size() == 1);
        assert(parent_db.delete_session_log(logs[0].id));
        assert(engine_db.change_marker() != own);

        enforcer.evaluate();
        auto snap = enforcer.snapshot("kid");
        assert(snap.phase == EnforcementPhase::IDLE);
        assert(snap.accumulated == Seconds(0));
        assert(enforcer.start("kid").success);
        assert(enforcer.stop("kid").success);
    }
    remove_db_files(path);

    std::cout << "test_engine_sees_other_connection passed!" << std::endl;
}

int main() {
    try {
        test_child_profiles();
        test_session_log_lifecycle();
        test_manual_entries();
        test_close_interrupted_sessions();
        test_settings_table();
        test_enforcer_over_database();
        test_lunch_window_columns();
        test_engine_sees_other_connection();
        std::cout << "All tests passed!" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
