#pragma once

#include "gamesentry/time_utils.h"
#include <string>
#include <cstdint>
#include <chrono>
#include <optional>
#include <vector>

namespace gamesentry {

// Per-child limits. An absent value means "no limit", which is not the same as zero.
struct LimitConfig {
    std::optional<Seconds> daily_allowance;
    std::optional<Seconds> max_continuous_play;
    std::optional<Seconds> mandatory_break;
    std::optional<AllowedWindow> allowed_window;
    bool enforce_break = true;  // When false the continuous-play cap is not enforced
    std::optional<AllowedWindow> lunch_window;  // Lunch and teeth routine gates start() inside it
};

struct ChildProfile {
    std::string id;
    std::string display_name;
    std::string avatar_url;     // Opaque, never fetched
    LimitConfig limits;
};

// Session log row
struct SessionLog {
    int64_t id = 0;
    std::string child_id;
    Timestamp start;
    std::optional<Timestamp> stop;          // Absent while the session is running
    std::optional<Timestamp> checkpoint;    // Last time a running session was seen alive

    bool is_open() const { return !stop.has_value(); }

    Seconds duration(Timestamp now) const {
        Timestamp end = stop ? *stop : now;
        auto d = std::chrono::duration_cast<Seconds>(end - start);
        return d.count() < 0 ? Seconds(0) : d;
    }
};

// Fields to change on an existing log; unset fields are left alone
struct SessionLogUpdate {
    std::optional<Timestamp> start;
    std::optional<Timestamp> stop;
};

enum class EnforcementPhase {
    IDLE,
    ACTIVE,
    ON_BREAK,
    LOCKED
};

enum class EnforcementError {
    NONE,
    OUTSIDE_ALLOWED_HOURS,
    DAILY_LIMIT_REACHED,
    ALREADY_ACTIVE,
    NOT_ACTIVE,
    ROUTINE_INCOMPLETE
};

// Questions a front end asks before starting a session inside the lunch window
enum class RoutineStep {
    NONE,           // Nothing to ask
    ASK_LUNCH,      // "Had lunch?", then "Brushed teeth?" when the answer is yes
    ASK_TEETH       // Lunch already confirmed today
};

struct RoutineAnswers {
    bool had_lunch = false;
    bool brushed_teeth = false;
};

enum class StopReason {
    CHILD_REQUEST,
    PARENT_REQUEST,
    CONTINUOUS_PLAY_LIMIT,
    DAILY_LIMIT
};

enum class EventType {
    SESSION_STARTED,
    SESSION_STOPPED,
    BREAK_STARTED,
    BREAK_ENDED,
    WARNING_THRESHOLD,
    DAILY_LIMIT_REACHED,
    DAY_RESET
};

struct EnforcementEvent {
    EventType type = EventType::SESSION_STARTED;
    std::string child_id;
    Timestamp at;
    StopReason reason = StopReason::CHILD_REQUEST;  // SESSION_STOPPED only
    Seconds session_duration{0};    // SESSION_STOPPED
    Seconds remaining{0};           // WARNING_THRESHOLD
    Seconds accumulated{0};         // Play counted today after the event
    Seconds limit{0};               // Break length for BREAK_STARTED, allowance for DAILY_LIMIT_REACHED
};

// Outcome of start()/stop()
struct CommandResult {
    bool success = false;
    EnforcementError error = EnforcementError::NONE;
    std::string message;
    std::vector<EnforcementEvent> events;
};

// Read-only view of one child's state for front ends
struct EnforcementSnapshot {
    std::string child_id;
    EnforcementPhase phase = EnforcementPhase::IDLE;
    Seconds session_elapsed{0};             // Running session, including parts before midnight
    Seconds block_elapsed{0};               // Play since the last break ended
    Seconds accumulated{0};                 // Today, including the running session
    std::optional<Seconds> daily_allowance;
    std::optional<Seconds> remaining;       // Absent when there is no daily allowance
    Seconds break_remaining{0};
    std::optional<Timestamp> session_start;
};

// Constants
constexpr int DEFAULT_WARNING_THRESHOLD_MINUTES = 5;
constexpr int CHECKPOINT_INTERVAL_SECONDS = 60;
constexpr int DEFAULT_TICK_INTERVAL_MS = 1000;
constexpr int MAX_TICK_INTERVAL_MS = 60000;
constexpr int MAX_LIMIT_MINUTES = 24 * 60;
constexpr int STATUS_INTERVAL_SECONDS = 5;
constexpr const char* DEFAULT_SMTP_URL = "smtp://smtp.gmail.com:587";
constexpr const char* EMAIL_SUBJECT_PREFIX = "Game Sentry - ";
constexpr const char* DEFAULT_DB_PATH = "gamesentry.db";
constexpr const char* INSTANCE_LOCK_NAME = "gamesentry";

inline const char* phase_to_string(EnforcementPhase phase) {
    switch (phase) {
        case EnforcementPhase::IDLE: return "IDLE";
        case EnforcementPhase::ACTIVE: return "ACTIVE";
        case EnforcementPhase::ON_BREAK: return "ON_BREAK";
        case EnforcementPhase::LOCKED: return "LOCKED";
        default: return "UNKNOWN";
    }
}

inline const char* error_to_string(EnforcementError error) {
    switch (error) {
        case EnforcementError::NONE: return "NONE";
        case EnforcementError::OUTSIDE_ALLOWED_HOURS: return "OUTSIDE_ALLOWED_HOURS";
        case EnforcementError::DAILY_LIMIT_REACHED: return "DAILY_LIMIT_REACHED";
        case EnforcementError::ALREADY_ACTIVE: return "ALREADY_ACTIVE";
        case EnforcementError::ROUTINE_INCOMPLETE: return "ROUTINE_INCOMPLETE";
        case EnforcementError::NOT_ACTIVE: return "NOT_ACTIVE";
        default: return "UNKNOWN";
    }
}

inline const char* reason_to_string(StopReason reason) {
    switch (reason) {
        case StopReason::CHILD_REQUEST: return "CHILD_REQUEST";
        case StopReason::PARENT_REQUEST: return "PARENT_REQUEST";
        case StopReason::CONTINUOUS_PLAY_LIMIT: return "CONTINUOUS_PLAY_LIMIT";
        case StopReason::DAILY_LIMIT: return "DAILY_LIMIT";
        default: return "UNKNOWN";
    }
}

inline const char* event_to_string(EventType type) {
    switch (type) {
        case EventType::SESSION_STARTED: return "SESSION_STARTED";
        case EventType::SESSION_STOPPED: return "SESSION_STOPPED";
        case EventType::BREAK_STARTED: return "BREAK_STARTED";
        case EventType::BREAK_ENDED: return "BREAK_ENDED";
        case EventType::WARNING_THRESHOLD: return "WARNING_THRESHOLD";
        case EventType::DAILY_LIMIT_REACHED: return "DAILY_LIMIT_REACHED";
        case EventType::DAY_RESET: return "DAY_RESET";
        default: return "UNKNOWN";
    }
}

} // namespace gamesentry
