#include "gamesentry/enforcer.h"
#include "test_support.h"
#include <iostream>
#include <cassert>
#include <chrono>
#include <string>
#include <vector>

using namespace gamesentry;
using namespace gamesentry::testing;

namespace {

Timestamp june(int day, int hour, int minute) {
    return make_local_time(2026, 6, day, hour, minute, 0);
}

struct Harness {
    explicit Harness(Timestamp start) : clock(start), enforcer(store, notifier, clock) {
        EnforcerCallbacks callbacks;
        callbacks.on_log_message = [this](const std::string& m) { logs.push_back(m); };
        callbacks.on_error = [this](const std::string& e) { errors.push_back(e); };
        enforcer.set_callbacks(callbacks);
    }

    MemoryProfileStore store;
    RecordingNotifier notifier;
    ManualClock clock;
    SessionEnforcer enforcer;
    std::vector<std::string> logs;
    std::vector<std::string> errors;
};

bool contains(const std::vector<std::string>& lines, const std::string& needle) {
    for (const auto& line : lines) {
        if (line.find(needle) != std::string::npos) return true;
    }
    return false;
}

} // namespace

void test_break_and_daily_limit_scenario() {
    Harness h(june(10, 10, 0));
    h.store.limits["kid"] = make_limits(60, 30, 10);

    auto r = h.enforcer.start("kid");
    assert(r.success);
    assert(r.events.size() == 1);
    assert(r.events[0].type == EventType::SESSION_STARTED);
    assert(h.enforcer.snapshot("kid").phase == EnforcementPhase::ACTIVE);

    h.clock.advance_minutes(29);
    assert(h.enforcer.evaluate().empty());

    // T0+30: continuous cap reached
    h.clock.advance_minutes(1);
    auto events = h.enforcer.evaluate();
    assert(events.size() == 2);
    assert(events[0].type == EventType::SESSION_STOPPED);
    assert(events[0].reason == StopReason::CONTINUOUS_PLAY_LIMIT);
    assert(events[0].session_duration == Seconds(1800));
    assert(events[1].type == EventType::BREAK_STARTED);
    assert(events[1].limit == Seconds(600));
    assert(h.enforcer.snapshot("kid").phase == EnforcementPhase::ON_BREAK);

    auto closed = h.store.closed_logs("kid");
    assert(closed.size() == 1);
    assert(closed[0].duration(h.clock.now()) == Seconds(1800));

    // Same instant again: nothing new
    assert(h.enforcer.evaluate().empty());

    auto refused = h.enforcer.start("kid");
    assert(!refused.success);
    assert(refused.error == EnforcementError::ALREADY_ACTIVE);

    // T0+40: break over
    h.clock.advance_minutes(10);
    events = h.enforcer.evaluate();
    assert(events.size() == 1);
    assert(events[0].type == EventType::BREAK_ENDED);
    assert(h.enforcer.snapshot("kid").phase == EnforcementPhase::IDLE);

    r = h.enforcer.start("kid");
    assert(r.success);

    // T0+70: both limits hit on the same tick, the daily allowance wins
    h.clock.advance_minutes(30);
    events = h.enforcer.evaluate();
    assert(events.size() == 2);
    assert(events[0].type == EventType::SESSION_STOPPED);
    assert(events[0].reason == StopReason::DAILY_LIMIT);
    assert(events[1].type == EventType::DAILY_LIMIT_REACHED);
    assert(events[1].limit == Seconds(3600));
    assert(!has_event(events, EventType::BREAK_STARTED));

    auto snap = h.enforcer.snapshot("kid");
    assert(snap.phase == EnforcementPhase::LOCKED);
    assert(snap.accumulated == Seconds(3600));
    assert(snap.remaining && *snap.remaining == Seconds(0));

    closed = h.store.closed_logs("kid");
    assert(closed.size() == 2);
    assert(closed[1].duration(h.clock.now()) == Seconds(1800));

    refused = h.enforcer.start("kid");
    assert(refused.error == EnforcementError::DAILY_LIMIT_REACHED);
    assert(h.errors.empty());

    std::cout << "test_break_and_daily_limit_scenario passed!" << std::endl;
}

void test_one_break_regardless_of_tick_rate() {
    for (int step : {1, 7, 60, 300}) {
        Harness h(june(10, 9, 0));
        h.store.limits["kid"] = make_limits(120, 30, 15);
        assert(h.enforcer.start("kid").success);

        for (int t = 0; t < 40 * 60; t += step) {
            h.clock.advance(Seconds(step));
            h.enforcer.evaluate();
            h.enforcer.evaluate();
        }
        assert(h.notifier.count(EventType::BREAK_STARTED) == 1);
        assert(h.notifier.count(EventType::SESSION_STOPPED) == 1);
    }

    std::cout << "test_one_break_regardless_of_tick_rate passed!" << std::endl;
}

void test_allowed_window() {
    Harness h(june(10, 14, 59));
    LimitConfig limits;
    limits.allowed_window = AllowedWindow{TimeOfDay{15, 0, 0}, TimeOfDay{18, 0, 0}};
    h.store.limits["kid"] = limits;

    auto r = h.enforcer.start("kid");
    assert(!r.success);
    assert(r.error == EnforcementError::OUTSIDE_ALLOWED_HOURS);
    assert(r.events.empty());
    assert(h.enforcer.snapshot("kid").phase == EnforcementPhase::IDLE);
    assert(h.store.logs.empty());

    h.clock.advance_minutes(1);
    r = h.enforcer.start("kid");
    assert(r.success);
    assert(h.enforcer.stop("kid").success);

    // End is exclusive
    Harness late(june(10, 18, 0));
    late.store.limits["kid"] = limits;
    assert(late.enforcer.start("kid").error == EnforcementError::OUTSIDE_ALLOWED_HOURS);

    std::cout << "test_allowed_window passed!" << std::endl;
}

void test_overnight_window() {
    LimitConfig limits;
    limits.allowed_window = AllowedWindow{TimeOfDay{22, 0, 0}, TimeOfDay{6, 0, 0}};

    Harness night(june(10, 23, 0));
    night.store.limits["kid"] = limits;
    assert(night.enforcer.start("kid").success);

    Harness noon(june(10, 12, 0));
    noon.store.limits["kid"] = limits;
    assert(noon.enforcer.start("kid").error == EnforcementError::OUTSIDE_ALLOWED_HOURS);

    std::cout << "test_overnight_window passed!" << std::endl;
}

void test_no_window_never_outside_hours() {
    Harness h(june(10, 0, 0));
    h.store.limits["kid"] = make_limits(-1, -1, -1);

    for (int hour = 0; hour < 24; ++hour) {
        auto r = h.enforcer.start("kid");
        assert(r.success);
        assert(r.error != EnforcementError::OUTSIDE_ALLOWED_HOURS);
        h.clock.advance_minutes(10);
        assert(h.enforcer.stop("kid").success);
        h.clock.advance_minutes(50);
    }

    std::cout << "test_no_window_never_outside_hours passed!" << std::endl;
}

void test_rollover_out_of_locked_while_running() {
    Harness h(june(10, 23, 0));
    h.store.limits["kid"] = make_limits(30, -1, -1);

    assert(h.enforcer.start("kid").success);
    h.clock.advance_minutes(30);
    h.enforcer.evaluate();
    assert(h.enforcer.snapshot("kid").phase == EnforcementPhase::LOCKED);

    // Still locked before midnight
    h.clock.advance_minutes(29);
    assert(h.enforcer.evaluate().empty());
    assert(h.enforcer.start("kid").error == EnforcementError::DAILY_LIMIT_REACHED);

    h.clock.advance_minutes(2);
    auto events = h.enforcer.evaluate();
    assert(events.size() == 1);
    assert(events[0].type == EventType::DAY_RESET);

    auto snap = h.enforcer.snapshot("kid");
    assert(snap.phase == EnforcementPhase::IDLE);
    assert(snap.accumulated == Seconds(0));
    assert(h.enforcer.evaluate().empty());
    assert(h.enforcer.start("kid").success);

    std::cout << "test_rollover_out_of_locked_while_running passed!" << std::endl;
}

void test_rollover_for_fresh_engine() {
    ManualClock clock(june(11, 9, 0));
    MemoryProfileStore store;
    RecordingNotifier notifier;
    store.limits["kid"] = make_limits(60, -1, -1);

    // Yesterday used up the whole allowance
    SessionLog log;
    log.child_id = "kid";
    log.start = june(10, 16, 0);
    log.stop = june(10, 17, 0);
    assert(store.append_session_log(log));

    SessionEnforcer enforcer(store, notifier, clock);
    auto snap = enforcer.snapshot("kid");
    assert(snap.phase == EnforcementPhase::IDLE);
    assert(snap.accumulated == Seconds(0));
    assert(enforcer.start("kid").success);

    // Today's allowance already spent before the engine came up
    MemoryProfileStore spent;
    spent.limits["kid"] = make_limits(60, -1, -1);
    log.start = june(11, 7, 0);
    log.stop = june(11, 8, 0);
    assert(spent.append_session_log(log));
    SessionEnforcer restarted(spent, notifier, clock);
    assert(restarted.snapshot("kid").phase == EnforcementPhase::LOCKED);
    assert(restarted.start("kid").error == EnforcementError::DAILY_LIMIT_REACHED);

    std::cout << "test_rollover_for_fresh_engine passed!" << std::endl;
}

void test_session_split_at_midnight() {
    Harness h(june(10, 23, 50));
    h.store.limits["kid"] = make_limits(-1, -1, -1);

    assert(h.enforcer.start("kid").success);
    h.clock.advance_minutes(20);
    auto events = h.enforcer.evaluate();
    assert(has_event(events, EventType::DAY_RESET));
    assert(!has_event(events, EventType::SESSION_STOPPED));

    auto closed = h.store.closed_logs("kid");
    assert(closed.size() == 1);
    assert(closed[0].start == june(10, 23, 50));
    assert(*closed[0].stop == june(11, 0, 0));

    auto open = h.store.open_logs();
    assert(open.size() == 1);
    assert(open[0].start == june(11, 0, 0));

    auto snap = h.enforcer.snapshot("kid");
    assert(snap.phase == EnforcementPhase::ACTIVE);
    assert(snap.accumulated == Seconds(600));
    assert(snap.session_elapsed == Seconds(1200));

    auto r = h.enforcer.stop("kid");
    assert(r.success);
    assert(r.events.size() == 1);
    assert(r.events[0].session_duration == Seconds(1200));
    assert(r.events[0].accumulated == Seconds(600));
    assert(h.store.get_todays_accumulated("kid", local_date(june(11, 0, 0))) == Seconds(600));

    std::cout << "test_session_split_at_midnight passed!" << std::endl;
}

void test_split_after_fractional_start() {
    Timestamp start = june(10, 23, 50) + std::chrono::milliseconds(700);
    Harness h(start);
    h.store.limits["kid"] = make_limits(180, -1, -1);
    LocalDate today = local_date(june(11, 0, 0));

    assert(h.enforcer.start("kid").success);
    h.clock.advance_minutes(20);
    assert(has_event(h.enforcer.evaluate(), EventType::DAY_RESET));

    // The new log belongs to the new day, not to the last second of the old one
    auto open = h.store.open_logs();
    assert(open.size() == 1);
    assert(open[0].start == june(11, 0, 0));
    assert(local_date(open[0].start) == today);
    auto closed = h.store.closed_logs("kid");
    assert(closed.size() == 1);
    assert(closed[0].start == start);
    assert(*closed[0].stop == june(11, 0, 0));

    h.clock.advance_minutes(20);
    h.enforcer.evaluate();
    assert(h.enforcer.stop("kid").success);

    Seconds stored = h.store.get_todays_accumulated("kid", today);
    assert(stored == Seconds(1800));
    assert(h.enforcer.snapshot("kid").accumulated == stored);
    assert(h.enforcer.recompute_accumulated("kid", today) == stored);
    assert(h.enforcer.snapshot("kid").accumulated == stored);

    std::cout << "test_split_after_fractional_start passed!" << std::endl;
}

void test_warning_fires_once() {
    Harness h(june(10, 10, 0));
    h.store.limits["kid"] = make_limits(20, -1, -1);

    assert(h.enforcer.start("kid").success);
    std::vector<EnforcementEvent> warnings;
    for (int minute = 1; minute <= 19; ++minute) {
        h.clock.advance_minutes(1);
        for (const auto& e : h.enforcer.evaluate()) {
            if (e.type == EventType::WARNING_THRESHOLD) warnings.push_back(e);
        }
    }
    assert(warnings.size() == 1);
    assert(warnings[0].remaining == Seconds(300));

    h.clock.advance_minutes(1);
    auto events = h.enforcer.evaluate();
    assert(has_event(events, EventType::DAILY_LIMIT_REACHED));
    assert(h.notifier.count(EventType::WARNING_THRESHOLD) == 1);

    std::cout << "test_warning_fires_once passed!" << std::endl;
}

void test_recompute_matches_closed_logs() {
    Harness h(june(10, 10, 0));
    h.store.limits["kid"] = make_limits(60, -1, -1);
    LocalDate today = local_date(h.clock.now());

    assert(h.enforcer.start("kid").success);
    h.clock.advance_minutes(20);
    assert(h.enforcer.stop("kid").success);

    // Parent adds a correction that bypasses the engine
    SessionLog manual;
    manual.child_id = "kid";
    manual.start = june(10, 8, 0);
    manual.stop = june(10, 8, 10);
    auto manual_id = h.store.append_session_log(manual);
    assert(manual_id);

    Seconds total = h.enforcer.recompute_accumulated("kid", today);
    assert(total == Seconds(1800));
    assert(total == h.store.get_todays_accumulated("kid", today));
    assert(h.enforcer.snapshot("kid").accumulated == Seconds(1800));
    assert(h.enforcer.snapshot("kid").phase == EnforcementPhase::IDLE);

    // Recompute while a session runs leaves it running
    assert(h.enforcer.start("kid").success);
    assert(h.store.delete_session_log(*manual_id));
    total = h.enforcer.recompute_accumulated("kid", today);
    assert(total == Seconds(1200));
    assert(h.enforcer.snapshot("kid").phase == EnforcementPhase::ACTIVE);

    std::cout << "test_recompute_matches_closed_logs passed!" << std::endl;
}

void test_recompute_rearms_warning() {
    Harness h(june(10, 10, 0));
    h.store.limits["kid"] = make_limits(30, -1, -1);
    LocalDate today = local_date(h.clock.now());

    assert(h.enforcer.start("kid").success);
    h.clock.advance_minutes(26);
    h.enforcer.evaluate();
    assert(h.notifier.count(EventType::WARNING_THRESHOLD) == 1);
    assert(h.enforcer.stop("kid").success);

    // Parent removes the session, the warning can fire again later
    for (const auto& log : h.store.closed_logs("kid")) {
        assert(h.store.delete_session_log(log.id));
    }
    assert(h.enforcer.recompute_accumulated("kid", today) == Seconds(0));

    assert(h.enforcer.start("kid").success);
    h.clock.advance_minutes(26);
    h.enforcer.evaluate();
    assert(h.notifier.count(EventType::WARNING_THRESHOLD) == 2);

    std::cout << "test_recompute_rearms_warning passed!" << std::endl;
}

void test_recompute_rolls_day_first() {
    Harness h(june(10, 10, 0));
    h.store.limits["kid"] = make_limits(60, -1, -1);

    assert(h.enforcer.start("kid").success);
    h.clock.advance_minutes(60);
    h.enforcer.evaluate();
    assert(h.enforcer.snapshot("kid").phase == EnforcementPhase::LOCKED);

    // No tick has run since midnight
    h.clock.advance_minutes(23 * 60);
    LocalDate today = local_date(h.clock.now());
    assert(h.enforcer.recompute_accumulated("kid", today) == Seconds(0));

    auto snap = h.enforcer.snapshot("kid");
    assert(snap.phase == EnforcementPhase::IDLE);
    assert(snap.accumulated == Seconds(0));
    assert(h.notifier.count(EventType::DAY_RESET) == 1);
    assert(h.enforcer.start("kid").success);

    std::cout << "test_recompute_rolls_day_first passed!" << std::endl;
}

void test_external_corrections_picked_up() {
    Harness h(june(10, 10, 0));
    h.store.limits["kid"] = make_limits(60, -1, -1);
    h.store.marker = 1;

    assert(h.enforcer.start("kid").success);
    h.clock.advance_minutes(60);
    h.enforcer.evaluate();
    assert(h.enforcer.snapshot("kid").phase == EnforcementPhase::LOCKED);

    // Another process deletes the session; nothing changes until the marker moves
    for (const auto& log : h.store.closed_logs("kid")) {
        assert(h.store.delete_session_log(log.id));
    }
    h.enforcer.evaluate();
    assert(h.enforcer.snapshot("kid").phase == EnforcementPhase::LOCKED);

    h.store.marker = 2;
    h.enforcer.evaluate();
    auto snap = h.enforcer.snapshot("kid");
    assert(snap.phase == EnforcementPhase::IDLE);
    assert(snap.accumulated == Seconds(0));
    assert(contains(h.logs, "picked up stored corrections"));

    // A correction that adds time is enforced on the running session
    assert(h.enforcer.start("kid").success);
    SessionLog manual;
    manual.child_id = "kid";
    manual.start = june(10, 8, 0);
    manual.stop = june(10, 8, 50);
    assert(h.store.append_session_log(manual));
    h.store.marker = 3;

    h.clock.advance_minutes(9);
    auto events = h.enforcer.evaluate();
    assert(has_event(events, EventType::WARNING_THRESHOLD));
    assert(h.enforcer.snapshot("kid").accumulated == Seconds(3540));

    h.clock.advance_minutes(1);
    events = h.enforcer.evaluate();
    assert(has_event(events, EventType::DAILY_LIMIT_REACHED));
    assert(h.enforcer.snapshot("kid").phase == EnforcementPhase::LOCKED);
    assert(h.store.get_todays_accumulated("kid", local_date(h.clock.now())) == Seconds(3600));

    std::cout << "test_external_corrections_picked_up passed!" << std::endl;
}

void test_lunch_routine() {
    Harness h(june(10, 11, 0));
    LimitConfig limits;
    limits.lunch_window = AllowedWindow{TimeOfDay{12, 0, 0}, TimeOfDay{13, 0, 0}};
    h.store.limits["kid"] = limits;

    // Outside lunch hours nothing is asked
    assert(h.enforcer.routine_step("kid") == RoutineStep::NONE);
    assert(h.enforcer.start("kid").success);
    assert(h.enforcer.routine_step("kid") == RoutineStep::NONE);
    assert(h.enforcer.stop("kid").success);

    h.clock.advance_minutes(70);
    assert(h.enforcer.routine_step("kid") == RoutineStep::ASK_LUNCH);

    // Unanswered
    size_t delivered = h.notifier.events().size();
    auto r = h.enforcer.start("kid");
    assert(!r.success);
    assert(r.error == EnforcementError::ROUTINE_INCOMPLETE);
    assert(r.events.empty());
    assert(h.notifier.events().size() == delivered);
    assert(h.enforcer.snapshot("kid").phase == EnforcementPhase::IDLE);

    // Not eaten yet: may play
    RoutineAnswers answers;
    answers.had_lunch = false;
    assert(h.enforcer.start("kid", answers).success);
    assert(h.enforcer.stop("kid").success);
    assert(h.enforcer.routine_step("kid") == RoutineStep::ASK_LUNCH);

    // Eaten but teeth not brushed
    answers.had_lunch = true;
    answers.brushed_teeth = false;
    r = h.enforcer.start("kid", answers);
    assert(!r.success);
    assert(r.error == EnforcementError::ROUTINE_INCOMPLETE);
    assert(r.message.find("brush") != std::string::npos);
    assert(h.enforcer.routine_step("kid") == RoutineStep::ASK_TEETH);

    answers.had_lunch = false;
    answers.brushed_teeth = true;
    assert(h.enforcer.start("kid", answers).success);
    assert(h.enforcer.stop("kid").success);

    // Window end is exclusive
    h.clock.advance_minutes(50);
    assert(h.clock.now() == june(10, 13, 0));
    assert(h.enforcer.routine_step("kid") == RoutineStep::NONE);

    // Lunch confirmation lasts one day
    h.clock.advance_minutes(23 * 60 + 10);
    assert(h.enforcer.routine_step("kid") == RoutineStep::ASK_LUNCH);

    std::cout << "test_lunch_routine passed!" << std::endl;
}

void test_stop_when_not_active() {
    Harness h(june(10, 10, 0));
    h.store.limits["kid"] = make_limits(10, -1, -1);

    auto r = h.enforcer.stop("kid");
    assert(!r.success);
    assert(r.error == EnforcementError::NOT_ACTIVE);
    assert(r.events.empty());

    assert(h.enforcer.start("kid").success);
    h.clock.advance_minutes(10);
    h.enforcer.evaluate();
    assert(h.enforcer.snapshot("kid").phase == EnforcementPhase::LOCKED);

    size_t delivered = h.notifier.events().size();
    r = h.enforcer.stop("kid");
    assert(!r.success);
    assert(r.error == EnforcementError::NOT_ACTIVE);
    assert(r.events.empty());
    assert(h.notifier.events().size() == delivered);

    std::cout << "test_stop_when_not_active passed!" << std::endl;
}

void test_zero_break_ends_on_same_tick() {
    Harness h(june(10, 10, 0));
    h.store.limits["kid"] = make_limits(-1, 30, -1);

    assert(h.enforcer.start("kid").success);
    h.clock.advance_minutes(30);
    auto events = h.enforcer.evaluate();
    assert(events.size() == 3);
    assert(events[0].type == EventType::SESSION_STOPPED);
    assert(events[1].type == EventType::BREAK_STARTED);
    assert(events[2].type == EventType::BREAK_ENDED);
    assert(h.enforcer.snapshot("kid").phase == EnforcementPhase::IDLE);
    assert(h.enforcer.start("kid").success);

    std::cout << "test_zero_break_ends_on_same_tick passed!" << std::endl;
}

void test_break_not_enforced() {
    Harness h(june(10, 10, 0));
    LimitConfig limits = make_limits(-1, 30, 10);
    limits.enforce_break = false;
    h.store.limits["kid"] = limits;

    assert(h.enforcer.start("kid").success);
    h.clock.advance_minutes(45);
    assert(h.enforcer.evaluate().empty());
    assert(h.enforcer.snapshot("kid").phase == EnforcementPhase::ACTIVE);

    std::cout << "test_break_not_enforced passed!" << std::endl;
}

void test_invalid_limits_are_permissive() {
    Harness h(june(10, 10, 0));
    LimitConfig limits;
    limits.daily_allowance = Seconds(-60);
    limits.max_continuous_play = Seconds(-1);
    limits.allowed_window = AllowedWindow{TimeOfDay{15, 0, 0}, TimeOfDay{15, 0, 0}};
    limits.lunch_window = AllowedWindow{TimeOfDay{12, 0, 0}, TimeOfDay{12, 0, 0}};
    h.store.limits["kid"] = limits;

    assert(h.enforcer.start("kid").success);
    h.clock.advance_minutes(300);
    assert(h.enforcer.evaluate().empty());
    assert(contains(h.logs, "Ignoring invalid limits"));

    std::string warning;
    LimitConfig clean = sanitize_limits(limits, &warning);
    assert(!clean.daily_allowance);
    assert(!clean.max_continuous_play);
    assert(!clean.allowed_window);
    assert(!clean.lunch_window);
    assert(warning.find("lunch_window") != std::string::npos);

    std::cout << "test_invalid_limits_are_permissive passed!" << std::endl;
}

void test_contradictory_limits() {
    // Continuous cap above the daily allowance
    Harness h(june(10, 10, 0));
    h.store.limits["kid"] = make_limits(60, 90, 10);

    assert(h.enforcer.start("kid").success);
    h.clock.advance_minutes(60);
    auto events = h.enforcer.evaluate();
    assert(has_event(events, EventType::DAILY_LIMIT_REACHED));
    assert(!has_event(events, EventType::BREAK_STARTED));

    // Zero allowance
    Harness zero(june(10, 10, 0));
    zero.store.limits["kid"] = make_limits(0, 30, 10);
    assert(zero.enforcer.start("kid").error == EnforcementError::DAILY_LIMIT_REACHED);

    std::cout << "test_contradictory_limits passed!" << std::endl;
}

void test_store_failures_do_not_block() {
    Harness h(june(10, 10, 0));
    h.store.limits["kid"] = make_limits(60, -1, -1);
    h.store.fail_writes = true;

    assert(h.enforcer.start("kid").success);
    assert(!h.errors.empty());
    h.clock.advance_minutes(10);
    assert(h.enforcer.stop("kid").success);
    assert(h.enforcer.snapshot("kid").accumulated == Seconds(600));

    h.store.fail_writes = false;
    assert(h.enforcer.start("kid").success);
    h.clock.advance_minutes(5);
    assert(h.enforcer.stop("kid").success);
    assert(h.store.closed_logs("kid").size() == 1);
    assert(h.enforcer.snapshot("kid").accumulated == Seconds(900));

    // Reads failing before the child is known
    Harness offline(june(10, 10, 0));
    offline.store.throw_reads = true;
    assert(offline.enforcer.start("kid").success);
    assert(contains(offline.errors, "store offline"));
    offline.clock.advance_minutes(1);
    offline.enforcer.evaluate();
    assert(offline.enforcer.snapshot("kid").phase == EnforcementPhase::ACTIVE);

    std::cout << "test_store_failures_do_not_block passed!" << std::endl;
}

void test_notifier_failure_is_reported() {
    Harness h(june(10, 10, 0));
    h.notifier.set_fail(true);

    auto r = h.enforcer.start("kid");
    assert(r.success);
    assert(contains(h.errors, "notifier offline"));
    assert(h.enforcer.snapshot("kid").phase == EnforcementPhase::ACTIVE);

    std::cout << "test_notifier_failure_is_reported passed!" << std::endl;
}

void test_checkpoints_while_active() {
    Harness h(june(10, 10, 0));

    assert(h.enforcer.start("kid").success);
    h.clock.advance(Seconds(30));
    h.enforcer.evaluate();
    assert(h.store.checkpoints.empty());

    h.clock.advance(Seconds(30));
    h.enforcer.evaluate();
    h.enforcer.evaluate();
    assert(h.store.checkpoints.size() == 1);
    assert(h.store.checkpoints[0].second == june(10, 10, 1));

    std::cout << "test_checkpoints_while_active passed!" << std::endl;
}

void test_wall_clock_jump_does_not_count_as_play() {
    Harness h(june(10, 10, 0));
    h.store.limits["kid"] = make_limits(60, 30, 10);

    assert(h.enforcer.start("kid").success);
    h.clock.jump_wall(Seconds(2 * 3600));
    assert(h.enforcer.evaluate().empty());

    auto snap = h.enforcer.snapshot("kid");
    assert(snap.phase == EnforcementPhase::ACTIVE);
    assert(snap.session_elapsed == Seconds(0));

    std::cout << "test_wall_clock_jump_does_not_count_as_play passed!" << std::endl;
}

void test_children_are_independent() {
    Harness h(june(10, 10, 0));
    h.store.limits["alice"] = make_limits(30, -1, -1);
    h.store.limits["bob"] = make_limits(120, -1, -1);

    assert(h.enforcer.start("alice").success);
    assert(h.enforcer.start("bob").success);
    h.clock.advance_minutes(30);
    h.enforcer.evaluate();

    assert(h.enforcer.snapshot("alice").phase == EnforcementPhase::LOCKED);
    assert(h.enforcer.snapshot("bob").phase == EnforcementPhase::ACTIVE);
    assert(h.enforcer.tracked_children().size() == 2);

    auto events = h.enforcer.stop_all(StopReason::PARENT_REQUEST);
    assert(events.size() == 1);
    assert(events[0].child_id == "bob");
    assert(events[0].reason == StopReason::PARENT_REQUEST);

    std::cout << "test_children_are_independent passed!" << std::endl;
}

int main() {
    try {
        test_break_and_daily_limit_scenario();
        test_one_break_regardless_of_tick_rate();
        test_allowed_window();
        test_overnight_window();
        test_no_window_never_outside_hours();
        test_rollover_out_of_locked_while_running();
        test_rollover_for_fresh_engine();
        test_session_split_at_midnight();
        test_split_after_fractional_start();
        test_warning_fires_once();
        test_recompute_matches_closed_logs();
        test_recompute_rearms_warning();
        test_recompute_rolls_day_first();
        test_external_corrections_picked_up();
        test_lunch_routine();
        test_stop_when_not_active();
        test_zero_break_ends_on_same_tick();
        test_break_not_enforced();
        test_invalid_limits_are_permissive();
        test_contradictory_limits();
        test_store_failures_do_not_block();
        test_notifier_failure_is_reported();
        test_checkpoints_while_active();
        test_wall_clock_jump_does_not_count_as_play();
        test_children_are_independent();
        std::cout << "All tests passed!" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
