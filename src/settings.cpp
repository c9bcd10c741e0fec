/*
 * src/settings.cpp - Application settings persisted in the settings table
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#include "gamesentry/settings.h"
#include "gamesentry/database.h"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace gamesentry {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    size_t end = s.find_last_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    return s.substr(start, end - start + 1);
}

bool parse_bool(const std::string& text, bool& out) {
    std::string value = trim(text);
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (value == "1" || value == "true" || value == "yes" || value == "on") {
        out = true;
        return true;
    }
    if (value == "0" || value == "false" || value == "no" || value == "off") {
        out = false;
        return true;
    }
    return false;
}

bool parse_int(const std::string& text, int min_value, int max_value, int& out) {
    try {
        size_t used = 0;
        int value = std::stoi(trim(text), &used);
        if (used != trim(text).size() || value < min_value || value > max_value) return false;
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace

std::vector<std::string> split_list(const std::string& text, char separator) {
    std::vector<std::string> items;
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find(separator, start);
        if (end == std::string::npos) end = text.size();
        std::string item = trim(text.substr(start, end - start));
        if (!item.empty()) {
            items.push_back(item);
        }
        start = end + 1;
    }
    return items;
}

std::string join_list(const std::vector<std::string>& items, const std::string& separator) {
    std::string result;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) result += separator;
        result += items[i];
    }
    return result;
}

bool AppSettings::apply(const std::string& key, const std::string& value, std::string* error) {
    auto fail = [&](const std::string& message) {
        if (error) *error = message;
        return false;
    };

    if (key == "email_enabled") {
        if (!parse_bool(value, email.enabled)) return fail("email_enabled expects true or false");
    } else if (key == "smtp_url") {
        std::string url = trim(value);
        if (url.rfind("smtp://", 0) != 0 && url.rfind("smtps://", 0) != 0) {
            return fail("smtp_url must start with smtp:// or smtps://");
        }
        email.smtp_url = url;
    } else if (key == "email_address") {
        email.address = trim(value);
    } else if (key == "email_password") {
        email.password = value;
    } else if (key == "email_recipients") {
        email.recipients = split_list(value);
    } else if (key == "sound_notifications") {
        if (!parse_bool(value, sound_notifications)) return fail("sound_notifications expects true or false");
    } else if (key == "warning_threshold_minutes") {
        if (!parse_int(value, 0, MAX_LIMIT_MINUTES, warning_threshold_minutes)) {
            return fail("warning_threshold_minutes expects an integer from 0 to " +
                        std::to_string(MAX_LIMIT_MINUTES));
        }
    } else if (key == "tick_interval_ms") {
        if (!parse_int(value, 100, MAX_TICK_INTERVAL_MS, tick_interval_ms)) {
            return fail("tick_interval_ms expects an integer from 100 to " +
                        std::to_string(MAX_TICK_INTERVAL_MS));
        }
    } else {
        return fail("Unknown setting: " + key);
    }
    return true;
}

Seconds AppSettings::warning_threshold() const {
    return std::chrono::duration_cast<Seconds>(std::chrono::minutes(warning_threshold_minutes));
}

std::vector<std::pair<std::string, std::string>> AppSettings::to_pairs() const {
    return {
        {"email_enabled", email.enabled ? "true" : "false"},
        {"smtp_url", email.smtp_url},
        {"email_address", email.address},
        {"email_password", email.password},
        {"email_recipients", join_list(email.recipients)},
        {"sound_notifications", sound_notifications ? "true" : "false"},
        {"warning_threshold_minutes", std::to_string(warning_threshold_minutes)},
        {"tick_interval_ms", std::to_string(tick_interval_ms)},
    };
}

AppSettings AppSettings::load(Database& db, std::vector<std::string>* warnings) {
    AppSettings settings;
    for (const auto& entry : db.get_all_settings()) {
        std::string error;
        if (!settings.apply(entry.first, entry.second, &error) && warnings) {
            warnings->push_back(error);
        }
    }
    return settings;
}

bool AppSettings::save(Database& db) const {
    for (const auto& entry : to_pairs()) {
        if (!db.set_setting(entry.first, entry.second)) {
            return false;
        }
    }
    return true;
}

} // namespace gamesentry
