/*
 * src/notifier.cpp - Event texts and asynchronous fan-out
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#include "gamesentry/notifier.h"
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace gamesentry {

namespace {

std::string html_escape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            default: out += c;
        }
    }
    return out;
}

std::string html_card(const std::string& header_color, const std::string& header_text_color,
                      const std::string& heading,
                      const std::vector<std::pair<std::string, std::string>>& rows) {
    std::ostringstream html;
    html << "<!DOCTYPE html>\n<html>\n<head>\n<style>\n"
         << "body { font-family: Arial, sans-serif; margin: 20px; }\n"
         << ".header { background-color: " << header_color << "; color: " << header_text_color
         << "; padding: 15px; border-radius: 5px; }\n"
         << ".content { background-color: #f8f9fa; padding: 20px; border-radius: 5px; margin-top: 10px; }\n"
         << ".footer { margin-top: 20px; font-size: 12px; color: #6c757d; }\n"
         << "</style>\n</head>\n<body>\n"
         << "<div class=\"header\"><h2>Game Sentry Alert</h2></div>\n"
         << "<div class=\"content\">\n<h3>" << html_escape(heading) << "</h3>\n";
    for (const auto& row : rows) {
        html << "<p><strong>" << html_escape(row.first) << ":</strong> "
             << html_escape(row.second) << "</p>\n";
    }
    html << "</div>\n<div class=\"footer\"><p>This is an automated notification from Game Sentry.</p></div>\n"
         << "</body>\n</html>\n";
    return html.str();
}

std::string text_card(const std::string& heading,
                      const std::vector<std::pair<std::string, std::string>>& rows) {
    std::ostringstream text;
    text << "Game Sentry Alert\n\n" << heading << "\n\n";
    for (const auto& row : rows) {
        text << row.first << ": " << row.second << "\n";
    }
    text << "\nThis is an automated notification from Game Sentry.";
    return text.str();
}

int64_t minutes(Seconds s) {
    return s.count() / 60;
}

} // namespace

NotificationMessage describe_event(const EnforcementEvent& event, const std::string& display_name) {
    NotificationMessage msg;
    const std::string& name = display_name.empty() ? event.child_id : display_name;
    const std::string when = format_timestamp(event.at);
    std::vector<std::pair<std::string, std::string>> rows;
    std::string heading;
    std::string color = "#28a745";
    std::string text_color = "white";

    switch (event.type) {
        case EventType::SESSION_STARTED:
            msg.title = "Session Started";
            msg.body = "User: " + name;
            msg.sound = "start";
            msg.email_subject = "Gaming Session Started";
            heading = name + " has started a new gaming session.";
            rows = {{"Time", when}};
            break;

        case EventType::SESSION_STOPPED:
            msg.title = "Session Stopped";
            msg.body = "User: " + name + "\nDuration: " + format_duration(event.session_duration);
            msg.sound = "stop";
            msg.email_subject = "Gaming Session Stopped";
            heading = name + " has stopped their gaming session.";
            rows = {{"Duration", format_duration(event.session_duration)}, {"Time", when}};
            color = "#ffc107";
            text_color = "#212529";
            break;

        case EventType::BREAK_STARTED:
            msg.title = "Play Time Limit Reached!";
            msg.body = name + " has reached their play time limit.\nBreak time started: " +
                       std::to_string(minutes(event.limit)) + " minutes";
            msg.sound = "warning";
            msg.email_subject = "Play Time Limit Reached";
            heading = name + " has reached their continuous play limit and must take a break.";
            rows = {{"Break Duration", std::to_string(minutes(event.limit)) + " minutes"},
                    {"Played Today", std::to_string(minutes(event.accumulated)) + " minutes"},
                    {"Time", when}};
            color = "#fd7e14";
            break;

        case EventType::BREAK_ENDED:
            msg.title = "Break Time Ended!";
            msg.body = name + " can now start gaming again.\nPlay time limit has been reset.";
            msg.email_subject = "Break Time Ended";
            heading = name + " can now start gaming again.";
            rows = {{"Time", when}};
            color = "#17a2b8";
            break;

        case EventType::WARNING_THRESHOLD: {
            int64_t left = (event.remaining.count() + 59) / 60;
            msg.title = "Play Time Almost Up";
            msg.body = name + ": " + std::to_string(left) + (left == 1 ? " minute" : " minutes") +
                       " of play time left";
            msg.sound = "warning";
            break;
        }

        case EventType::DAILY_LIMIT_REACHED:
            msg.title = "Daily Limit Reached!";
            msg.body = name + " has reached their daily limit of " +
                       std::to_string(minutes(event.limit)) + " minutes.\nCurrent usage: " +
                       std::to_string(minutes(event.accumulated)) + " minutes";
            msg.sound = "over";
            msg.email_subject = "Daily Gaming Limit Reached";
            heading = name + " has reached their daily gaming limit!";
            rows = {{"Daily Limit", std::to_string(minutes(event.limit)) + " minutes"},
                    {"Current Usage", std::to_string(minutes(event.accumulated)) + " minutes"},
                    {"Time", when}};
            color = "#dc3545";
            break;

        case EventType::DAY_RESET:
            msg.title = "New Day";
            msg.body = name + "'s daily play time has been reset.";
            break;
    }

    if (!msg.email_subject.empty()) {
        msg.email_text = text_card(heading, rows);
        msg.email_html = html_card(color, text_color, heading, rows);
    }
    return msg;
}

NotificationDispatcher::NotificationDispatcher(size_t num_threads) : pool_(num_threads) {
    pool_.set_error_handler([this](std::exception_ptr error) {
        try {
            std::rethrow_exception(error);
        } catch (const std::exception& e) {
            report_error(std::string("Notification task failed: ") + e.what());
        } catch (...) {
            report_error("Notification task failed with a non-standard exception");
        }
    });
}

NotificationDispatcher::~NotificationDispatcher() {
    shutdown();
}

void NotificationDispatcher::add_sink(std::shared_ptr<Notifier> sink) {
    if (!sink) return;
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void NotificationDispatcher::set_error_callback(ErrorCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    error_callback_ = std::move(callback);
}

size_t NotificationDispatcher::sink_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sinks_.size();
}

void NotificationDispatcher::report_error(const std::string& message) {
    ErrorCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = error_callback_;
    }
    if (callback) {
        callback(message);
    } else {
        std::cerr << "[Notify] " << message << std::endl;
    }
}

void NotificationDispatcher::deliver(const EnforcementEvent& event, const std::string& child_id) {
    std::vector<std::shared_ptr<Notifier>> sinks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sinks = sinks_;
    }
    if (sinks.empty()) return;

    bool queued = pool_.submit_detached([this, sinks, event, child_id]() {
        for (const auto& sink : sinks) {
            try {
                sink->deliver(event, child_id);
            } catch (const std::exception& e) {
                report_error(std::string("Notifier failed for ") + event_to_string(event.type) +
                             ": " + e.what());
            }
        }
    });

    if (!queued) {
        report_error(std::string("Dropped ") + event_to_string(event.type) +
                     " notification after shutdown");
    }
}

void NotificationDispatcher::flush() {
    pool_.wait_all();
}

void NotificationDispatcher::shutdown() {
    pool_.shutdown();
}

} // namespace gamesentry
