/*
 * enforcer.h - Session timer and limit enforcement engine
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "gamesentry/common.h"
#include "gamesentry/clock.h"
#include "gamesentry/notifier.h"
#include "gamesentry/profile_store.h"

namespace gamesentry {

// Diagnostics from the engine; core code never prints
struct EnforcerCallbacks {
    std::function<void(const std::string& message)> on_log_message;
    std::function<void(const std::string& error)> on_error;
};

struct EnforcerOptions {
    Seconds warning_threshold{DEFAULT_WARNING_THRESHOLD_MINUTES * 60};  // 0 disables the warning
    Seconds checkpoint_interval{CHECKPOINT_INTERVAL_SECONDS};
};

// Owns the per-child session state. All entry points are thread safe and
// never throw; events are handed to the notifier after the state lock is released.
class SessionEnforcer {
public:
    SessionEnforcer(ProfileStore& store, Notifier& notifier, const Clock& clock,
                    EnforcerOptions options = EnforcerOptions());

    // Non-copyable
    SessionEnforcer(const SessionEnforcer&) = delete;
    SessionEnforcer& operator=(const SessionEnforcer&) = delete;

    CommandResult start(const std::string& child_id);
    // Start after the front end asked the questions routine_step() named
    CommandResult start(const std::string& child_id, const RoutineAnswers& answers);
    CommandResult stop(const std::string& child_id, StopReason reason = StopReason::CHILD_REQUEST);

    // Lunch routine questions a start() right now would need answered
    RoutineStep routine_step(const std::string& child_id);

    // Tick driver entry point. Repeated calls at the same instant yield no new events.
    // Also picks up corrections other processes wrote to the store.
    std::vector<EnforcementEvent> evaluate();
    std::vector<EnforcementEvent> evaluate(Timestamp now);

    // Re-sums closed logs after a parent correction. Returns the closed total for that day.
    Seconds recompute_accumulated(const std::string& child_id, const LocalDate& date);

    EnforcementSnapshot snapshot(const std::string& child_id);
    std::vector<std::string> tracked_children() const;

    // Ends every running session, e.g. on shutdown
    std::vector<EnforcementEvent> stop_all(StopReason reason);

    void set_callbacks(const EnforcerCallbacks& callbacks);
    void set_warning_threshold(Seconds threshold);

private:
    struct ChildState {
        EnforcementPhase phase = EnforcementPhase::IDLE;
        LimitConfig limits;
        std::string config_warning;     // Last sanitizer complaint, logged once

        LocalDate day;
        Seconds accumulated{0};         // Closed play on `day`
        Seconds block_played{0};        // Closed play since the last break
        bool warning_fired = false;

        // Running session
        std::optional<int64_t> open_log_id;
        Timestamp session_start_wall;
        Timestamp segment_start_wall;   // Equals session start unless split at midnight
        MonoTime segment_start_mono;
        Seconds session_carry{0};       // Segments of this session closed at midnight
        MonoTime last_checkpoint_mono;

        // Break
        MonoTime break_start_mono;
        Seconds break_length{0};

        std::optional<LocalDate> lunch_confirmed;
        std::optional<int64_t> seen_marker;     // Store change marker last synced with
    };

    // Collected under the lock, delivered after it is released
    struct Outbox {
        std::vector<EnforcementEvent> events;
        std::vector<std::string> logs;
        std::vector<std::string> errors;
    };

    ChildState& state_for(const std::string& child_id, Timestamp now, Outbox& out);
    void refresh_limits(const std::string& child_id, ChildState& state, Outbox& out);
    Seconds load_accumulated(const std::string& child_id, const LocalDate& date,
                             Seconds fallback, Outbox& out);

    void roll_day(const std::string& child_id, ChildState& state, Timestamp now,
                  MonoTime mono, Outbox& out);
    void tick(const std::string& child_id, ChildState& state, Timestamp now,
              MonoTime mono, const std::optional<int64_t>& marker, Outbox& out);
    void apply_accumulated(const std::string& child_id, ChildState& state, Seconds total,
                           MonoTime mono, Outbox& out);
    std::optional<int64_t> read_change_marker(Outbox& out);

    CommandResult start_session(const std::string& child_id,
                                const std::optional<RoutineAnswers>& answers);
    RoutineStep routine_step_for(const ChildState& state, Timestamp now) const;
    bool routine_allows_start(ChildState& state, Timestamp now,
                              const std::optional<RoutineAnswers>& answers,
                              std::string& reason) const;
    void open_log(const std::string& child_id, ChildState& state, Timestamp start, Outbox& out);
    void close_log(const std::string& child_id, ChildState& state, Timestamp stop, Outbox& out);
    void close_session(const std::string& child_id, ChildState& state, StopReason reason,
                       Timestamp now, MonoTime mono, Outbox& out);
    void end_break_if_due(const std::string& child_id, ChildState& state, Timestamp now,
                          MonoTime mono, Outbox& out);

    EnforcementEvent make_event(EventType type, const std::string& child_id, Timestamp at,
                                const ChildState& state) const;
    void dispatch(const Outbox& out);

    ProfileStore& store_;
    Notifier& notifier_;
    const Clock& clock_;
    EnforcerOptions options_;

    std::map<std::string, ChildState> children_;
    mutable std::mutex mutex_;

    EnforcerCallbacks callbacks_;
    mutable std::mutex callback_mutex_;
};

// Drops negative durations and empty windows; returns a description of what was dropped
LimitConfig sanitize_limits(const LimitConfig& raw, std::string* warning = nullptr);

} // namespace gamesentry
