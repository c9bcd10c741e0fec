/*
 * settings.h - Application settings persisted in the settings table
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#pragma once

#include <string>
#include <vector>
#include <utility>
#include "gamesentry/common.h"

namespace gamesentry {

class Database;

struct EmailSettings {
    bool enabled = false;
    std::string smtp_url = DEFAULT_SMTP_URL;
    std::string address;        // Sender and SMTP login
    std::string password;       // App password
    std::vector<std::string> recipients;

    // Mail is only attempted when every field needed to send is present
    bool is_complete() const {
        return enabled && !address.empty() && !password.empty() && !recipients.empty();
    }
};

struct AppSettings {
    EmailSettings email;
    bool sound_notifications = true;
    int warning_threshold_minutes = DEFAULT_WARNING_THRESHOLD_MINUTES;
    int tick_interval_ms = DEFAULT_TICK_INTERVAL_MS;

    // Values that fail to parse keep their defaults and are reported in warnings
    static AppSettings load(Database& db, std::vector<std::string>* warnings = nullptr);
    bool save(Database& db) const;

    // Sets one key from its string form. Returns false on unknown key or bad value.
    bool apply(const std::string& key, const std::string& value, std::string* error = nullptr);

    Seconds warning_threshold() const;

    std::vector<std::pair<std::string, std::string>> to_pairs() const;
};

std::vector<std::string> split_list(const std::string& text, char separator = ',');
std::string join_list(const std::vector<std::string>& items, const std::string& separator = ",");

} // namespace gamesentry
