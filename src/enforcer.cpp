/*
 * src/enforcer.cpp - Session timer and limit enforcement engine
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#include "gamesentry/enforcer.h"
#include <exception>

namespace gamesentry {

namespace {

Seconds elapsed_between(MonoTime since, MonoTime now) {
    auto d = std::chrono::duration_cast<Seconds>(now - since);
    return d.count() < 0 ? Seconds(0) : d;
}

bool valid_time(const TimeOfDay& t) {
    return t.hour >= 0 && t.hour < 24 && t.minute >= 0 && t.minute < 60 &&
           t.second >= 0 && t.second < 60;
}

} // namespace

LimitConfig sanitize_limits(const LimitConfig& raw, std::string* warning) {
    LimitConfig clean = raw;
    std::string dropped;

    auto drop_negative = [&dropped](std::optional<Seconds>& value, const char* name) {
        if (value && value->count() < 0) {
            if (!dropped.empty()) dropped += ", ";
            dropped += std::string(name) + "=" + std::to_string(value->count()) + "s";
            value.reset();
        }
    };

    drop_negative(clean.daily_allowance, "daily_allowance");
    drop_negative(clean.max_continuous_play, "max_continuous_play");
    drop_negative(clean.mandatory_break, "mandatory_break");

    if (clean.allowed_window) {
        const AllowedWindow& w = *clean.allowed_window;
        if (!valid_time(w.start) || !valid_time(w.end) || w.is_empty()) {
            if (!dropped.empty()) dropped += ", ";
            dropped += "allowed_window=" + format_window(w);
            clean.allowed_window.reset();
        }
    }

    if (clean.lunch_window) {
        const AllowedWindow& w = *clean.lunch_window;
        if (!valid_time(w.start) || !valid_time(w.end) || w.is_empty()) {
            if (!dropped.empty()) dropped += ", ";
            dropped += "lunch_window=" + format_window(w);
            clean.lunch_window.reset();
        }
    }

    if (warning) {
        *warning = dropped.empty() ? "" : "Ignoring invalid limits (" + dropped + ")";
    }
    return clean;
}

SessionEnforcer::SessionEnforcer(ProfileStore& store, Notifier& notifier, const Clock& clock,
                                 EnforcerOptions options)
    : store_(store), notifier_(notifier), clock_(clock), options_(options) {}

void SessionEnforcer::set_callbacks(const EnforcerCallbacks& callbacks) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callbacks_ = callbacks;
}

void SessionEnforcer::set_warning_threshold(Seconds threshold) {
    std::lock_guard<std::mutex> lock(mutex_);
    options_.warning_threshold = threshold.count() < 0 ? Seconds(0) : threshold;
}

std::vector<std::string> SessionEnforcer::tracked_children() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    for (const auto& entry : children_) {
        ids.push_back(entry.first);
    }
    return ids;
}

// Collaborator access

void SessionEnforcer::refresh_limits(const std::string& child_id, ChildState& state, Outbox& out) {
    LimitConfig raw;
    try {
        raw = store_.get_limit_config(child_id);
    } catch (const std::exception& e) {
        out.errors.push_back("Failed to load limits for " + child_id + ", keeping previous: " + e.what());
        return;
    }

    std::string warning;
    state.limits = sanitize_limits(raw, &warning);
    if (warning != state.config_warning) {
        if (!warning.empty()) {
            out.logs.push_back(child_id + ": " + warning);
        }
        state.config_warning = warning;
    }
}

Seconds SessionEnforcer::load_accumulated(const std::string& child_id, const LocalDate& date,
                                          Seconds fallback, Outbox& out) {
    try {
        Seconds total = store_.get_todays_accumulated(child_id, date);
        return total.count() < 0 ? Seconds(0) : total;
    } catch (const std::exception& e) {
        out.errors.push_back("Failed to read play time for " + child_id + " on " +
                             date.to_string() + ": " + e.what());
        return fallback;
    }
}

std::optional<int64_t> SessionEnforcer::read_change_marker(Outbox& out) {
    try {
        return store_.change_marker();
    } catch (const std::exception& e) {
        out.errors.push_back(std::string("Failed to read store change marker: ") + e.what());
        return std::nullopt;
    }
}

void SessionEnforcer::open_log(const std::string& child_id, ChildState& state, Timestamp start,
                               Outbox& out) {
    SessionLog entry;
    entry.child_id = child_id;
    entry.start = start;
    entry.checkpoint = start;

    state.open_log_id.reset();
    try {
        state.open_log_id = store_.append_session_log(entry);
        if (!state.open_log_id) {
            out.errors.push_back("Failed to record session start for " + child_id);
        }
    } catch (const std::exception& e) {
        out.errors.push_back("Failed to record session start for " + child_id + ": " + e.what());
    }
}

void SessionEnforcer::close_log(const std::string& child_id, ChildState& state, Timestamp stop,
                                Outbox& out) {
    try {
        if (state.open_log_id) {
            SessionLogUpdate update;
            update.stop = stop;
            if (!store_.update_session_log(*state.open_log_id, update)) {
                out.errors.push_back("Failed to close session log #" +
                                     std::to_string(*state.open_log_id) + " for " + child_id);
            }
        } else {
            // The start was never stored; record the finished segment instead
            SessionLog entry;
            entry.child_id = child_id;
            entry.start = state.segment_start_wall;
            entry.stop = stop;
            if (!store_.append_session_log(entry)) {
                out.errors.push_back("Failed to record finished session for " + child_id);
            }
        }
    } catch (const std::exception& e) {
        out.errors.push_back("Failed to record session stop for " + child_id + ": " + e.what());
    }
    state.open_log_id.reset();
}

// State

SessionEnforcer::ChildState& SessionEnforcer::state_for(const std::string& child_id, Timestamp now,
                                                        Outbox& out) {
    auto it = children_.find(child_id);
    if (it != children_.end()) {
        return it->second;
    }

    ChildState state;
    state.day = local_date(now);
    state.seen_marker = read_change_marker(out);
    refresh_limits(child_id, state, out);
    state.accumulated = load_accumulated(child_id, state.day, Seconds(0), out);

    const auto& daily = state.limits.daily_allowance;
    if (daily) {
        if (state.accumulated >= *daily) {
            state.phase = EnforcementPhase::LOCKED;
        }
        state.warning_fired = *daily - state.accumulated <= options_.warning_threshold;
    }

    out.logs.push_back("Tracking " + child_id + ": " + format_duration(state.accumulated) +
                       " played on " + state.day.to_string() +
                       (state.phase == EnforcementPhase::LOCKED ? " (locked)" : ""));
    return children_.emplace(child_id, std::move(state)).first->second;
}

EnforcementEvent SessionEnforcer::make_event(EventType type, const std::string& child_id,
                                             Timestamp at, const ChildState& state) const {
    EnforcementEvent event;
    event.type = type;
    event.child_id = child_id;
    event.at = at;
    event.accumulated = state.accumulated;
    return event;
}

void SessionEnforcer::close_session(const std::string& child_id, ChildState& state,
                                    StopReason reason, Timestamp now, MonoTime mono, Outbox& out) {
    Seconds segment = elapsed_between(state.segment_start_mono, mono);
    close_log(child_id, state, state.segment_start_wall + segment, out);

    state.accumulated += segment;
    state.block_played += segment;
    Seconds session_total = state.session_carry + segment;
    state.session_carry = Seconds(0);
    state.phase = EnforcementPhase::IDLE;

    EnforcementEvent event = make_event(EventType::SESSION_STOPPED, child_id, now, state);
    event.reason = reason;
    event.session_duration = session_total;
    out.events.push_back(event);
    out.logs.push_back(child_id + " session stopped (" + reason_to_string(reason) + ") after " +
                       format_duration(session_total));
}

void SessionEnforcer::end_break_if_due(const std::string& child_id, ChildState& state,
                                       Timestamp now, MonoTime mono, Outbox& out) {
    if (state.phase != EnforcementPhase::ON_BREAK) return;
    if (elapsed_between(state.break_start_mono, mono) < state.break_length) return;

    state.phase = EnforcementPhase::IDLE;
    state.block_played = Seconds(0);
    out.events.push_back(make_event(EventType::BREAK_ENDED, child_id, now, state));
    out.logs.push_back(child_id + " break over");
}

// A session running across midnight is split so each log belongs to one day
void SessionEnforcer::roll_day(const std::string& child_id, ChildState& state, Timestamp now,
                               MonoTime mono, Outbox& out) {
    LocalDate today = local_date(now);
    if (!(state.day < today)) return;

    if (state.phase == EnforcementPhase::ACTIVE) {
        // Split exactly at midnight so the new log starts on the new day,
        // whatever fraction of a second the session started at
        Timestamp split = start_of_day(today);
        auto before_midnight =
            std::chrono::duration_cast<MonoTime::duration>(split - state.segment_start_wall);
        auto segment = mono - state.segment_start_mono;
        if (before_midnight.count() < 0) before_midnight = MonoTime::duration::zero();
        if (before_midnight > segment) before_midnight = segment;   // Wall clock jumped ahead

        close_log(child_id, state, split, out);
        Seconds credited = std::chrono::duration_cast<Seconds>(before_midnight);
        state.session_carry += credited;
        state.block_played += credited;
        state.segment_start_wall = split;
        state.segment_start_mono += before_midnight;
        open_log(child_id, state, split, out);
        out.logs.push_back(child_id + " session split at " + format_timestamp(split));
    } else {
        if (state.phase == EnforcementPhase::LOCKED) {
            state.phase = EnforcementPhase::IDLE;
        }
        state.block_played = Seconds(0);
    }

    state.day = today;
    state.accumulated = load_accumulated(child_id, today, Seconds(0), out);
    state.warning_fired = false;

    out.events.push_back(make_event(EventType::DAY_RESET, child_id, now, state));
    out.logs.push_back(child_id + " counters reset for " + today.to_string());
}

void SessionEnforcer::apply_accumulated(const std::string& child_id, ChildState& state,
                                        Seconds total, MonoTime mono, Outbox& out) {
    state.accumulated = total;

    Seconds live = total;
    if (state.phase == EnforcementPhase::ACTIVE) {
        live += elapsed_between(state.segment_start_mono, mono);
    }
    const auto& daily = state.limits.daily_allowance;
    if (state.phase == EnforcementPhase::LOCKED && (!daily || total < *daily)) {
        state.phase = EnforcementPhase::IDLE;
        out.logs.push_back(child_id + " unlocked, " + format_duration(total) + " played today");
    }
    if (daily && *daily - live > options_.warning_threshold) {
        state.warning_fired = false;
    }
}

void SessionEnforcer::tick(const std::string& child_id, ChildState& state, Timestamp now,
                           MonoTime mono, const std::optional<int64_t>& marker, Outbox& out) {
    roll_day(child_id, state, now, mono, out);
    refresh_limits(child_id, state, out);

    // Another process edited logs or limits
    if (marker && state.seen_marker != marker) {
        if (state.seen_marker) {
            Seconds total = load_accumulated(child_id, state.day, state.accumulated, out);
            if (total != state.accumulated) {
                out.logs.push_back(child_id + ": picked up stored corrections, " +
                                   format_duration(total) + " played on " + state.day.to_string());
            }
            apply_accumulated(child_id, state, total, mono, out);
        }
        state.seen_marker = marker;
    }

    if (state.phase == EnforcementPhase::ON_BREAK) {
        end_break_if_due(child_id, state, now, mono, out);
        return;
    }
    if (state.phase != EnforcementPhase::ACTIVE) {
        return;
    }

    const LimitConfig& limits = state.limits;
    Seconds segment = elapsed_between(state.segment_start_mono, mono);
    Seconds total = state.accumulated + segment;
    Seconds block = state.block_played + segment;

    // Daily allowance wins over the continuous-play cap on the same tick
    if (limits.daily_allowance && total >= *limits.daily_allowance) {
        close_session(child_id, state, StopReason::DAILY_LIMIT, now, mono, out);
        state.phase = EnforcementPhase::LOCKED;

        EnforcementEvent event = make_event(EventType::DAILY_LIMIT_REACHED, child_id, now, state);
        event.limit = *limits.daily_allowance;
        out.events.push_back(event);
        out.logs.push_back(child_id + " locked for the rest of the day");
        return;
    }

    if (limits.enforce_break && limits.max_continuous_play && block >= *limits.max_continuous_play) {
        close_session(child_id, state, StopReason::CONTINUOUS_PLAY_LIMIT, now, mono, out);
        state.phase = EnforcementPhase::ON_BREAK;
        state.break_start_mono = mono;
        state.break_length = limits.mandatory_break.value_or(Seconds(0));

        EnforcementEvent event = make_event(EventType::BREAK_STARTED, child_id, now, state);
        event.limit = state.break_length;
        out.events.push_back(event);
        out.logs.push_back(child_id + " on break for " + format_duration(state.break_length));

        end_break_if_due(child_id, state, now, mono, out);
        return;
    }

    if (limits.daily_allowance && !state.warning_fired && options_.warning_threshold.count() > 0) {
        Seconds remaining = *limits.daily_allowance - total;
        if (remaining <= options_.warning_threshold) {
            state.warning_fired = true;
            EnforcementEvent event = make_event(EventType::WARNING_THRESHOLD, child_id, now, state);
            event.remaining = remaining;
            event.limit = *limits.daily_allowance;
            out.events.push_back(event);
        }
    }

    if (state.open_log_id &&
        elapsed_between(state.last_checkpoint_mono, mono) >= options_.checkpoint_interval) {
        state.last_checkpoint_mono = mono;
        try {
            if (!store_.checkpoint_session_log(*state.open_log_id, state.segment_start_wall + segment)) {
                out.errors.push_back("Failed to checkpoint session log #" +
                                     std::to_string(*state.open_log_id));
            }
        } catch (const std::exception& e) {
            out.errors.push_back("Failed to checkpoint session log #" +
                                 std::to_string(*state.open_log_id) + ": " + e.what());
        }
    }
}

// Commands

CommandResult SessionEnforcer::start(const std::string& child_id) {
    return start_session(child_id, std::nullopt);
}

CommandResult SessionEnforcer::start(const std::string& child_id, const RoutineAnswers& answers) {
    return start_session(child_id, answers);
}

RoutineStep SessionEnforcer::routine_step_for(const ChildState& state, Timestamp now) const {
    const auto& lunch = state.limits.lunch_window;
    if (!lunch || !lunch->contains(local_time_of_day(now))) {
        return RoutineStep::NONE;
    }
    if (state.lunch_confirmed && *state.lunch_confirmed == local_date(now)) {
        return RoutineStep::ASK_TEETH;
    }
    return RoutineStep::ASK_LUNCH;
}

// A child who has not eaten yet may play; one who has must brush first
bool SessionEnforcer::routine_allows_start(ChildState& state, Timestamp now,
                                           const std::optional<RoutineAnswers>& answers,
                                           std::string& reason) const {
    RoutineStep step = routine_step_for(state, now);
    if (step == RoutineStep::NONE) return true;

    if (!answers) {
        reason = "It's lunch time: answer the lunch and teeth questions first";
        return false;
    }
    if (step == RoutineStep::ASK_LUNCH) {
        if (!answers->had_lunch) return true;
        state.lunch_confirmed = local_date(now);
    }
    if (!answers->brushed_teeth) {
        reason = "Please brush your teeth before playing";
        return false;
    }
    return true;
}

RoutineStep SessionEnforcer::routine_step(const std::string& child_id) {
    Outbox out;
    RoutineStep step = RoutineStep::NONE;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Timestamp now = clock_.now();
        MonoTime mono = clock_.monotonic_now();

        ChildState& state = state_for(child_id, now, out);
        roll_day(child_id, state, now, mono, out);
        refresh_limits(child_id, state, out);
        end_break_if_due(child_id, state, now, mono, out);
        if (state.phase == EnforcementPhase::IDLE) {
            step = routine_step_for(state, now);
        }
    }
    dispatch(out);
    return step;
}

CommandResult SessionEnforcer::start_session(const std::string& child_id,
                                             const std::optional<RoutineAnswers>& answers) {
    CommandResult result;
    Outbox out;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        Timestamp now = clock_.now();
        MonoTime mono = clock_.monotonic_now();

        ChildState& state = state_for(child_id, now, out);
        roll_day(child_id, state, now, mono, out);
        refresh_limits(child_id, state, out);
        end_break_if_due(child_id, state, now, mono, out);

        const LimitConfig& limits = state.limits;
        if (state.phase == EnforcementPhase::ACTIVE) {
            result.error = EnforcementError::ALREADY_ACTIVE;
            result.message = "A session is already running for " + child_id;
        } else if (state.phase == EnforcementPhase::ON_BREAK) {
            Seconds left = state.break_length - elapsed_between(state.break_start_mono, mono);
            result.error = EnforcementError::ALREADY_ACTIVE;
            result.message = child_id + " is on a break for another " + format_time_remaining(left);
        } else if (state.phase == EnforcementPhase::LOCKED) {
            result.error = EnforcementError::DAILY_LIMIT_REACHED;
            result.message = child_id + " has reached the daily limit";
        } else if (limits.allowed_window && !limits.allowed_window->contains(local_time_of_day(now))) {
            result.error = EnforcementError::OUTSIDE_ALLOWED_HOURS;
            result.message = "Play is only allowed between " +
                             format_time_of_day(limits.allowed_window->start) + " and " +
                             format_time_of_day(limits.allowed_window->end);
        } else if (limits.daily_allowance && state.accumulated >= *limits.daily_allowance) {
            result.error = EnforcementError::DAILY_LIMIT_REACHED;
            result.message = child_id + " has no play time left today";
        } else if (!routine_allows_start(state, now, answers, result.message)) {
            result.error = EnforcementError::ROUTINE_INCOMPLETE;
        } else {
            state.phase = EnforcementPhase::ACTIVE;
            state.session_start_wall = now;
            state.segment_start_wall = now;
            state.segment_start_mono = mono;
            state.last_checkpoint_mono = mono;
            state.session_carry = Seconds(0);
            open_log(child_id, state, now, out);

            out.events.push_back(make_event(EventType::SESSION_STARTED, child_id, now, state));
            out.logs.push_back(child_id + " session started");
            result.success = true;
            result.message = "Session started";
        }

        if (!result.success) {
            out.logs.push_back("Start refused (" + std::string(error_to_string(result.error)) +
                               "): " + result.message);
        }
    }

    result.events = out.events;
    dispatch(out);
    return result;
}

CommandResult SessionEnforcer::stop(const std::string& child_id, StopReason reason) {
    CommandResult result;
    Outbox out;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        Timestamp now = clock_.now();
        MonoTime mono = clock_.monotonic_now();

        ChildState& state = state_for(child_id, now, out);
        if (state.phase != EnforcementPhase::ACTIVE) {
            result.error = EnforcementError::NOT_ACTIVE;
            result.message = "No session running for " + child_id + " (" +
                             phase_to_string(state.phase) + ")";
        } else {
            roll_day(child_id, state, now, mono, out);
            close_session(child_id, state, reason, now, mono, out);
            result.success = true;
            result.message = "Session stopped";
        }
    }

    result.events = out.events;
    dispatch(out);
    return result;
}

std::vector<EnforcementEvent> SessionEnforcer::stop_all(StopReason reason) {
    Outbox out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Timestamp now = clock_.now();
        MonoTime mono = clock_.monotonic_now();
        for (auto& entry : children_) {
            if (entry.second.phase != EnforcementPhase::ACTIVE) continue;
            roll_day(entry.first, entry.second, now, mono, out);
            close_session(entry.first, entry.second, reason, now, mono, out);
        }
    }
    dispatch(out);
    return out.events;
}

std::vector<EnforcementEvent> SessionEnforcer::evaluate() {
    return evaluate(clock_.now());
}

std::vector<EnforcementEvent> SessionEnforcer::evaluate(Timestamp now) {
    Outbox out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        MonoTime mono = clock_.monotonic_now();
        std::optional<int64_t> marker;
        if (!children_.empty()) {
            marker = read_change_marker(out);
        }
        for (auto& entry : children_) {
            tick(entry.first, entry.second, now, mono, marker, out);
        }
    }
    dispatch(out);
    return out.events;
}

Seconds SessionEnforcer::recompute_accumulated(const std::string& child_id, const LocalDate& date) {
    Outbox out;
    Seconds result{0};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Timestamp now = clock_.now();
        MonoTime mono = clock_.monotonic_now();
        ChildState& state = state_for(child_id, now, out);
        roll_day(child_id, state, now, mono, out);

        if (date != state.day) {
            // Another day's total has no bearing on the live counters
            result = load_accumulated(child_id, date, Seconds(0), out);
        } else {
            result = load_accumulated(child_id, date, state.accumulated, out);
            apply_accumulated(child_id, state, result, mono, out);
            out.logs.push_back("Recomputed " + child_id + ": " + format_duration(result) +
                               " played on " + date.to_string());
        }
    }
    dispatch(out);
    return result;
}

EnforcementSnapshot SessionEnforcer::snapshot(const std::string& child_id) {
    Outbox out;
    EnforcementSnapshot snap;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ChildState& state = state_for(child_id, clock_.now(), out);

        Seconds segment{0};
        if (state.phase == EnforcementPhase::ACTIVE) {
            segment = clock_.monotonic_elapsed(state.segment_start_mono);
            snap.session_elapsed = state.session_carry + segment;
            snap.session_start = state.session_start_wall;
        }
        if (state.phase == EnforcementPhase::ON_BREAK) {
            Seconds left = state.break_length - clock_.monotonic_elapsed(state.break_start_mono);
            snap.break_remaining = left.count() < 0 ? Seconds(0) : left;
        }

        snap.child_id = child_id;
        snap.phase = state.phase;
        snap.block_elapsed = state.block_played + segment;
        snap.accumulated = state.accumulated + segment;
        snap.daily_allowance = state.limits.daily_allowance;
        if (snap.daily_allowance) {
            Seconds left = *snap.daily_allowance - snap.accumulated;
            snap.remaining = left.count() < 0 ? Seconds(0) : left;
        }
    }
    dispatch(out);
    return snap;
}

void SessionEnforcer::dispatch(const Outbox& out) {
    EnforcerCallbacks callbacks;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callbacks = callbacks_;
    }

    if (callbacks.on_log_message) {
        for (const auto& message : out.logs) {
            callbacks.on_log_message(message);
        }
    }
    if (callbacks.on_error) {
        for (const auto& error : out.errors) {
            callbacks.on_error(error);
        }
    }

    for (const auto& event : out.events) {
        try {
            notifier_.deliver(event, event.child_id);
        } catch (const std::exception& e) {
            if (callbacks.on_error) {
                callbacks.on_error(std::string("Notifier rejected ") + event_to_string(event.type) +
                                   ": " + e.what());
            }
        }
    }
}

} // namespace gamesentry
