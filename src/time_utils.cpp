/*
 * src/time_utils.cpp - Local calendar helpers and duration formatting
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#include "gamesentry/time_utils.h"
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace gamesentry {

namespace {

std::tm to_local_tm(Timestamp tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_buf{};
    localtime_r(&t, &tm_buf);
    return tm_buf;
}

// Reads at most two digits starting at pos
bool parse_number(const std::string& text, size_t& pos, int& out) {
    size_t start = pos;
    int value = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])) && pos - start < 2) {
        value = value * 10 + (text[pos] - '0');
        ++pos;
    }
    if (pos == start) return false;
    out = value;
    return true;
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    size_t end = s.find_last_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    return s.substr(start, end - start + 1);
}

} // namespace

std::string LocalDate::to_string() const {
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << year << "-"
        << std::setw(2) << month << "-" << std::setw(2) << day;
    return oss.str();
}

bool AllowedWindow::contains(const TimeOfDay& t) const {
    int now = t.seconds_since_midnight();
    int from = start.seconds_since_midnight();
    int to = end.seconds_since_midnight();

    if (from == to) return false;
    if (from < to) {
        return now >= from && now < to;
    }
    // Overnight
    return now >= from || now < to;
}

LocalDate local_date(Timestamp tp) {
    std::tm tm_buf = to_local_tm(tp);
    return LocalDate{tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday};
}

TimeOfDay local_time_of_day(Timestamp tp) {
    std::tm tm_buf = to_local_tm(tp);
    return TimeOfDay{tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec};
}

Timestamp make_local_time(int year, int month, int day, int hour, int minute, int second) {
    std::tm tm_buf{};
    tm_buf.tm_year = year - 1900;
    tm_buf.tm_mon = month - 1;
    tm_buf.tm_mday = day;
    tm_buf.tm_hour = hour;
    tm_buf.tm_min = minute;
    tm_buf.tm_sec = second;
    tm_buf.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&tm_buf));
}

Timestamp start_of_day(const LocalDate& date) {
    return make_local_time(date.year, date.month, date.day, 0, 0, 0);
}

bool is_within_window(const AllowedWindow& window, Timestamp tp) {
    return window.contains(local_time_of_day(tp));
}

std::string format_timestamp(Timestamp tp) {
    std::tm tm_buf = to_local_tm(tp);
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

std::optional<Timestamp> parse_timestamp(const std::string& text) {
    const std::string value = trim(text);
    for (const char* format : {"%Y-%m-%d %H:%M:%S", "%Y-%m-%d %H:%M"}) {
        std::tm tm_buf{};
        std::istringstream in(value);
        in >> std::get_time(&tm_buf, format);
        if (in.fail()) continue;
        if (in.peek() != std::char_traits<char>::eof()) continue;
        return make_local_time(tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
                               tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec);
    }
    return std::nullopt;
}

std::optional<LocalDate> parse_date(const std::string& text) {
    std::tm tm_buf{};
    std::istringstream in(trim(text));
    in >> std::get_time(&tm_buf, "%Y-%m-%d");
    if (in.fail() || in.peek() != std::char_traits<char>::eof()) {
        return std::nullopt;
    }
    return LocalDate{tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday};
}

std::string format_time_of_day(const TimeOfDay& t) {
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(2) << t.hour << ":" << std::setw(2) << t.minute;
    return oss.str();
}

std::optional<TimeOfDay> parse_time_of_day(const std::string& text) {
    const std::string value = trim(text);
    size_t pos = 0;
    int hour = 0;
    int minute = 0;

    if (!parse_number(value, pos, hour)) return std::nullopt;
    if (pos >= value.size() || value[pos] != ':') return std::nullopt;
    ++pos;
    if (!parse_number(value, pos, minute)) return std::nullopt;
    if (pos != value.size()) return std::nullopt;
    if (hour > 23 || minute > 59) return std::nullopt;

    return TimeOfDay{hour, minute, 0};
}

std::optional<AllowedWindow> parse_window(const std::string& text) {
    size_t dash = text.find('-');
    if (dash == std::string::npos) return std::nullopt;

    auto start = parse_time_of_day(text.substr(0, dash));
    auto end = parse_time_of_day(text.substr(dash + 1));
    if (!start || !end) return std::nullopt;

    return AllowedWindow{*start, *end};
}

std::string format_window(const AllowedWindow& window) {
    return format_time_of_day(window.start) + "-" + format_time_of_day(window.end);
}

std::string format_duration(Seconds duration) {
    int64_t total = duration.count();
    if (total < 0) total = 0;
    int64_t h = total / 3600;
    int64_t m = (total % 3600) / 60;
    int64_t s = total % 60;

    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(2) << h << ":"
        << std::setw(2) << m << ":" << std::setw(2) << s;
    return oss.str();
}

std::string format_time_remaining(Seconds remaining) {
    int64_t seconds = remaining.count();
    if (seconds <= 0) {
        return "No time left";
    }

    std::ostringstream oss;
    oss << std::setfill('0');
    if (seconds < 3600) {
        oss << seconds / 60 << "m " << std::setw(2) << seconds % 60 << "s";
    } else {
        int64_t rem = seconds % 3600;
        oss << seconds / 3600 << "h " << std::setw(2) << rem / 60 << "m "
            << std::setw(2) << rem % 60 << "s";
    }
    return oss.str();
}

TimeBand time_band(Seconds remaining) {
    if (remaining > Seconds(3600)) return TimeBand::PLENTY;
    if (remaining > Seconds(1800)) return TimeBand::LOW;
    return TimeBand::CRITICAL;
}

int64_t to_unix_seconds(Timestamp tp) {
    return std::chrono::duration_cast<Seconds>(tp.time_since_epoch()).count();
}

Timestamp from_unix_seconds(int64_t seconds) {
    return Timestamp(Seconds(seconds));
}

} // namespace gamesentry
