/*
 * notifier.h - Event sinks and asynchronous fan-out
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#pragma once

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <functional>
#include "gamesentry/common.h"
#include "gamesentry/thread_pool.h"

namespace gamesentry {

// Receives enforcement events. Fire and forget: delivery failures are the
// sink's problem and never reach the enforcer.
class Notifier {
public:
    virtual ~Notifier() = default;
    virtual void deliver(const EnforcementEvent& event, const std::string& child_id) = 0;
};

// Adapts a function to the Notifier interface, used by the GUI front ends
class CallbackNotifier : public Notifier {
public:
    using Handler = std::function<void(const EnforcementEvent&, const std::string&)>;

    explicit CallbackNotifier(Handler handler) : handler_(std::move(handler)) {}

    void deliver(const EnforcementEvent& event, const std::string& child_id) override {
        if (handler_) handler_(event, child_id);
    }

private:
    Handler handler_;
};

// Human readable rendering of an event
struct NotificationMessage {
    std::string title;          // Tray balloon title
    std::string body;           // Plain text, may contain newlines
    std::string email_subject;  // Without the "Game Sentry - " prefix; empty = not mailed
    std::string email_text;
    std::string email_html;
    std::string sound;          // Cue name: start, stop, warning, over, or empty
};

NotificationMessage describe_event(const EnforcementEvent& event, const std::string& display_name);

// Fans events out to every registered sink on a worker thread
class NotificationDispatcher : public Notifier {
public:
    using ErrorCallback = std::function<void(const std::string&)>;

    explicit NotificationDispatcher(size_t num_threads = 1);
    ~NotificationDispatcher() override;

    void add_sink(std::shared_ptr<Notifier> sink);
    void set_error_callback(ErrorCallback callback);

    void deliver(const EnforcementEvent& event, const std::string& child_id) override;

    // Waits until every queued delivery has run
    void flush();
    void shutdown();

    size_t sink_count() const;

private:
    void report_error(const std::string& message);

    ThreadPool pool_;
    std::vector<std::shared_ptr<Notifier>> sinks_;
    mutable std::mutex mutex_;
    ErrorCallback error_callback_;
};

} // namespace gamesentry
