/*
 * time_utils.h - Local calendar helpers and duration formatting
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace gamesentry {

using Timestamp = std::chrono::system_clock::time_point;
using MonoTime = std::chrono::steady_clock::time_point;
using Seconds = std::chrono::seconds;

// Calendar day in local time
struct LocalDate {
    int year = 0;
    int month = 0;   // 1-12
    int day = 0;     // 1-31

    bool operator==(const LocalDate& other) const {
        return year == other.year && month == other.month && day == other.day;
    }
    bool operator!=(const LocalDate& other) const { return !(*this == other); }
    bool operator<(const LocalDate& other) const {
        if (year != other.year) return year < other.year;
        if (month != other.month) return month < other.month;
        return day < other.day;
    }

    // YYYY-MM-DD
    std::string to_string() const;
};

struct TimeOfDay {
    int hour = 0;
    int minute = 0;
    int second = 0;

    int seconds_since_midnight() const { return hour * 3600 + minute * 60 + second; }
    bool operator==(const TimeOfDay& other) const {
        return seconds_since_midnight() == other.seconds_since_midnight();
    }
};

// Time-of-day interval, inclusive start and exclusive end.
// A window whose start is later than its end wraps past midnight (22:00-06:00).
struct AllowedWindow {
    TimeOfDay start;
    TimeOfDay end;

    bool contains(const TimeOfDay& t) const;
    bool is_empty() const { return start == end; }
};

// Wall-clock to local calendar
LocalDate local_date(Timestamp tp);
TimeOfDay local_time_of_day(Timestamp tp);
Timestamp start_of_day(const LocalDate& date);
Timestamp make_local_time(int year, int month, int day, int hour, int minute, int second = 0);

bool is_within_window(const AllowedWindow& window, Timestamp tp);

// "YYYY-MM-DD HH:MM:SS" in local time
std::string format_timestamp(Timestamp tp);
// Accepts "YYYY-MM-DD HH:MM:SS" and "YYYY-MM-DD HH:MM"
std::optional<Timestamp> parse_timestamp(const std::string& text);
std::optional<LocalDate> parse_date(const std::string& text);

// "HH:MM"
std::string format_time_of_day(const TimeOfDay& t);
std::optional<TimeOfDay> parse_time_of_day(const std::string& text);
// "HH:MM-HH:MM"
std::optional<AllowedWindow> parse_window(const std::string& text);
std::string format_window(const AllowedWindow& window);

// HH:MM:SS, hours are not wrapped at 24
std::string format_duration(Seconds duration);

// "No time left", "42m 05s" or "2h 03m 09s"
std::string format_time_remaining(Seconds remaining);

// Colour band for the time left today: over an hour, over half an hour, the rest
enum class TimeBand {
    PLENTY,
    LOW,
    CRITICAL
};

TimeBand time_band(Seconds remaining);

// Unix seconds, used by the persistence layer
int64_t to_unix_seconds(Timestamp tp);
Timestamp from_unix_seconds(int64_t seconds);

} // namespace gamesentry
