/*
 * main_window.h - GTK main window for Game Sentry
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#pragma once

#include <gtk/gtk.h>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "gamesentry/clock.h"
#include "gamesentry/database.h"
#include "gamesentry/enforcer.h"
#include "gamesentry/notifier.h"
#include "gamesentry/settings.h"
#include "gamesentry/gui/usage_view.h"

namespace gamesentry {

class MainWindow {
public:
    MainWindow(GtkApplication* app, Database& db);
    ~MainWindow();

    // Non-copyable
    MainWindow(const MainWindow&) = delete;
    MainWindow& operator=(const MainWindow&) = delete;

    GtkWidget* get_window() const { return window_; }

    void start_session();
    void stop_session();

    // Ends any running session and drains pending notifications
    void shutdown();

private:
    // UI setup
    void setup_ui();
    void setup_header_bar();
    void setup_child_selector();
    void setup_session_view();
    void setup_log_view();
    void setup_controls();
    void setup_engine();

    // UI update methods (called from main thread)
    void refresh_status();
    void append_log(const std::string& message);
    void show_event(const EnforcementEvent& event, const std::string& child_id);
    std::string current_child_id() const;
    std::string display_name(const std::string& child_id);

    // Thread-safe queueing from engine and notifier threads
    void queue_log(const std::string& message);

    // Static callback wrappers for GTK
    static void on_start_clicked(GtkButton* button, gpointer user_data);
    static void on_stop_clicked(GtkButton* button, gpointer user_data);
    static void on_child_changed(GtkDropDown* dropdown, GParamSpec* pspec, gpointer user_data);
    static gboolean on_close_request(GtkWindow* window, gpointer user_data);
    static gboolean on_tick(gpointer user_data);
    static gboolean on_log_update(gpointer user_data);
    static gboolean on_event_update(gpointer user_data);

    // GTK widgets
    GtkWidget* window_ = nullptr;
    GtkWidget* main_box_ = nullptr;
    GtkWidget* header_bar_ = nullptr;

    // Child selector
    GtkWidget* child_dropdown_ = nullptr;
    GtkStringList* child_list_ = nullptr;
    std::vector<std::string> child_ids_;

    // Session display
    GtkWidget* state_label_ = nullptr;
    GtkWidget* timer_label_ = nullptr;
    GtkWidget* status_label_ = nullptr;
    std::unique_ptr<UsageView> usage_view_;

    // Log view
    GtkWidget* log_scroll_ = nullptr;
    GtkWidget* log_text_view_ = nullptr;
    GtkTextBuffer* log_buffer_ = nullptr;

    // Lunch routine answers
    GtkWidget* routine_box_ = nullptr;
    GtkWidget* lunch_check_ = nullptr;
    GtkWidget* teeth_check_ = nullptr;

    // Control buttons
    GtkWidget* controls_box_ = nullptr;
    GtkWidget* start_button_ = nullptr;
    GtkWidget* stop_button_ = nullptr;

    // Engine
    Database& db_;
    AppSettings settings_;
    SystemClock clock_;
    std::unique_ptr<NotificationDispatcher> dispatcher_;
    std::unique_ptr<SessionEnforcer> enforcer_;
    guint tick_source_ = 0;
    bool shut_down_ = false;

    // Thread-safe update queue
    std::mutex log_mutex_;
    std::vector<std::string> pending_logs_;
    std::mutex event_mutex_;
    std::vector<std::pair<EnforcementEvent, std::string>> pending_events_;
};

// Takes the instance lock, opens the database and runs the GTK application
int run_gui(int argc, char** argv);

} // namespace gamesentry
