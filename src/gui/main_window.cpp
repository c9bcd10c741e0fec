/*
 * src/gui/main_window.cpp - Implementation of the GTK main window
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#include "gamesentry/gui/main_window.h"
#include "gamesentry/email_notifier.h"
#include "gamesentry/instance_lock.h"
#include "gamesentry/time_utils.h"
#include <sstream>
#include <iomanip>
#include <iostream>
#include <ctime>

namespace gamesentry {

namespace {

const char* BAND_CSS =
    ".time-left { font-size: 16pt; font-weight: bold; }\n"
    ".band-plenty { color: #28a745; }\n"
    ".band-low { color: #ffc107; }\n"
    ".band-critical { color: #dc3545; }\n"
    ".session-timer { font-family: monospace; font-size: 20pt; font-weight: bold; }\n";

} // namespace

MainWindow::MainWindow(GtkApplication* app, Database& db) : db_(db) {
    window_ = gtk_application_window_new(app);
    gtk_window_set_title(GTK_WINDOW(window_), "Game Sentry");
    gtk_window_set_default_size(GTK_WINDOW(window_), 640, 560);
    g_signal_connect(window_, "close-request", G_CALLBACK(on_close_request), this);

    setup_ui();
    setup_engine();
    refresh_status();
}

MainWindow::~MainWindow() {
    shutdown();
}

void MainWindow::setup_ui() {
    GtkCssProvider* provider = gtk_css_provider_new();
    gtk_css_provider_load_from_data(provider, BAND_CSS, -1);
    gtk_style_context_add_provider_for_display(gdk_display_get_default(),
                                               GTK_STYLE_PROVIDER(provider),
                                               GTK_STYLE_PROVIDER_PRIORITY_APPLICATION);
    g_object_unref(provider);

    main_box_ = gtk_box_new(GTK_ORIENTATION_VERTICAL, 12);
    gtk_widget_set_margin_start(main_box_, 12);
    gtk_widget_set_margin_end(main_box_, 12);
    gtk_widget_set_margin_top(main_box_, 12);
    gtk_widget_set_margin_bottom(main_box_, 12);

    setup_header_bar();
    setup_child_selector();
    setup_session_view();
    setup_controls();
    setup_log_view();

    gtk_window_set_child(GTK_WINDOW(window_), main_box_);
}

void MainWindow::setup_header_bar() {
    header_bar_ = gtk_header_bar_new();
    gtk_window_set_titlebar(GTK_WINDOW(window_), header_bar_);
}

void MainWindow::setup_child_selector() {
    GtkWidget* selector_box = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 12);

    GtkWidget* child_label = gtk_label_new("Child:");
    gtk_box_append(GTK_BOX(selector_box), child_label);

    child_list_ = gtk_string_list_new(nullptr);
    for (const auto& child : db_.list_children()) {
        const std::string& name = child.display_name.empty() ? child.id : child.display_name;
        gtk_string_list_append(child_list_, name.c_str());
        child_ids_.push_back(child.id);
    }

    child_dropdown_ = gtk_drop_down_new(G_LIST_MODEL(child_list_), nullptr);
    if (!child_ids_.empty()) {
        gtk_drop_down_set_selected(GTK_DROP_DOWN(child_dropdown_), 0);
    }
    g_signal_connect(child_dropdown_, "notify::selected",
                    G_CALLBACK(on_child_changed), this);
    gtk_box_append(GTK_BOX(selector_box), child_dropdown_);

    gtk_box_append(GTK_BOX(main_box_), selector_box);
}

void MainWindow::setup_session_view() {
    GtkWidget* session_frame = gtk_frame_new("Session");
    GtkWidget* session_box = gtk_box_new(GTK_ORIENTATION_VERTICAL, 4);
    gtk_widget_set_margin_start(session_box, 8);
    gtk_widget_set_margin_end(session_box, 8);
    gtk_widget_set_margin_top(session_box, 8);
    gtk_widget_set_margin_bottom(session_box, 8);

    state_label_ = gtk_label_new("Idle");
    gtk_label_set_xalign(GTK_LABEL(state_label_), 0);
    gtk_box_append(GTK_BOX(session_box), state_label_);

    timer_label_ = gtk_label_new("00:00:00");
    gtk_widget_add_css_class(timer_label_, "session-timer");
    gtk_box_append(GTK_BOX(session_box), timer_label_);

    gtk_frame_set_child(GTK_FRAME(session_frame), session_box);
    gtk_box_append(GTK_BOX(main_box_), session_frame);

    usage_view_ = std::make_unique<UsageView>();
    gtk_box_append(GTK_BOX(main_box_), usage_view_->get_widget());

    // Last notification
    status_label_ = gtk_label_new("");
    gtk_label_set_xalign(GTK_LABEL(status_label_), 0);
    gtk_label_set_wrap(GTK_LABEL(status_label_), TRUE);
    gtk_box_append(GTK_BOX(main_box_), status_label_);
}

void MainWindow::setup_log_view() {
    GtkWidget* log_frame = gtk_frame_new("Log");

    log_scroll_ = gtk_scrolled_window_new();
    gtk_scrolled_window_set_policy(GTK_SCROLLED_WINDOW(log_scroll_),
                                   GTK_POLICY_AUTOMATIC, GTK_POLICY_AUTOMATIC);
    gtk_widget_set_vexpand(log_scroll_, TRUE);
    gtk_scrolled_window_set_min_content_height(GTK_SCROLLED_WINDOW(log_scroll_), 150);

    log_text_view_ = gtk_text_view_new();
    gtk_text_view_set_editable(GTK_TEXT_VIEW(log_text_view_), FALSE);
    gtk_text_view_set_cursor_visible(GTK_TEXT_VIEW(log_text_view_), FALSE);
    gtk_text_view_set_monospace(GTK_TEXT_VIEW(log_text_view_), TRUE);
    gtk_text_view_set_wrap_mode(GTK_TEXT_VIEW(log_text_view_), GTK_WRAP_WORD_CHAR);

    log_buffer_ = gtk_text_view_get_buffer(GTK_TEXT_VIEW(log_text_view_));

    gtk_scrolled_window_set_child(GTK_SCROLLED_WINDOW(log_scroll_), log_text_view_);
    gtk_frame_set_child(GTK_FRAME(log_frame), log_scroll_);

    gtk_box_append(GTK_BOX(main_box_), log_frame);
}

void MainWindow::setup_controls() {
    // Lunch routine answers, shown only during the child's lunch hours
    routine_box_ = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 12);
    gtk_widget_set_halign(routine_box_, GTK_ALIGN_CENTER);
    lunch_check_ = gtk_check_button_new_with_label("I had lunch");
    gtk_box_append(GTK_BOX(routine_box_), lunch_check_);
    teeth_check_ = gtk_check_button_new_with_label("I brushed my teeth");
    gtk_box_append(GTK_BOX(routine_box_), teeth_check_);
    gtk_widget_set_visible(routine_box_, FALSE);
    gtk_box_append(GTK_BOX(main_box_), routine_box_);

    controls_box_ = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 12);
    gtk_widget_set_halign(controls_box_, GTK_ALIGN_CENTER);

    start_button_ = gtk_button_new_with_label("Start");
    gtk_widget_add_css_class(start_button_, "suggested-action");
    g_signal_connect(start_button_, "clicked", G_CALLBACK(on_start_clicked), this);
    gtk_box_append(GTK_BOX(controls_box_), start_button_);

    stop_button_ = gtk_button_new_with_label("Stop");
    gtk_widget_add_css_class(stop_button_, "destructive-action");
    gtk_widget_set_sensitive(stop_button_, FALSE);
    g_signal_connect(stop_button_, "clicked", G_CALLBACK(on_stop_clicked), this);
    gtk_box_append(GTK_BOX(controls_box_), stop_button_);

    gtk_box_append(GTK_BOX(main_box_), controls_box_);
}

void MainWindow::setup_engine() {
    std::vector<std::string> warnings;
    settings_ = AppSettings::load(db_, &warnings);
    for (const auto& warning : warnings) {
        append_log("Ignoring stored setting: " + warning);
    }

    int recovered = db_.close_interrupted_sessions();
    if (recovered > 0) {
        append_log("Closed " + std::to_string(recovered) + " session(s) interrupted by a crash");
    } else if (recovered < 0) {
        append_log("ERROR: Failed to close interrupted sessions: " + db_.get_last_error());
    }

    auto lookup = [this](const std::string& id) { return display_name(id); };

    dispatcher_ = std::make_unique<NotificationDispatcher>();
    dispatcher_->set_error_callback([this](const std::string& error) {
        queue_log("ERROR: " + error);
    });
    dispatcher_->add_sink(std::make_shared<CallbackNotifier>(
        [this](const EnforcementEvent& event, const std::string& child_id) {
            {
                std::lock_guard<std::mutex> lock(event_mutex_);
                pending_events_.emplace_back(event, child_id);
            }
            g_idle_add(on_event_update, this);
        }));
    if (settings_.email.is_complete()) {
        dispatcher_->add_sink(std::make_shared<EmailNotifier>(settings_.email, lookup));
        append_log("Email notifications to " + join_list(settings_.email.recipients, ", "));
    }

    EnforcerOptions options;
    options.warning_threshold = settings_.warning_threshold();
    enforcer_ = std::make_unique<SessionEnforcer>(db_, *dispatcher_, clock_, options);

    EnforcerCallbacks callbacks;
    callbacks.on_log_message = [this](const std::string& message) {
        queue_log(message);
    };
    callbacks.on_error = [this](const std::string& error) {
        queue_log("ERROR: " + error);
    };
    enforcer_->set_callbacks(callbacks);

    if (child_ids_.empty()) {
        gtk_widget_set_sensitive(start_button_, FALSE);
        append_log("No children configured. Add one with: gamesentry-cli --child ID set-limits");
    }

    int interval_ms = settings_.tick_interval_ms;
    if (interval_ms % 1000 == 0) {
        tick_source_ = g_timeout_add_seconds(static_cast<guint>(interval_ms / 1000), on_tick, this);
    } else {
        tick_source_ = g_timeout_add(static_cast<guint>(interval_ms), on_tick, this);
    }
}

void MainWindow::start_session() {
    std::string child_id = current_child_id();
    if (child_id.empty() || !enforcer_) return;

    CommandResult result;
    RoutineStep step = enforcer_->routine_step(child_id);
    if (step == RoutineStep::NONE) {
        result = enforcer_->start(child_id);
    } else {
        RoutineAnswers answers;
        answers.had_lunch = step == RoutineStep::ASK_LUNCH &&
                            gtk_check_button_get_active(GTK_CHECK_BUTTON(lunch_check_));
        answers.brushed_teeth = gtk_check_button_get_active(GTK_CHECK_BUTTON(teeth_check_));
        result = enforcer_->start(child_id, answers);
    }

    if (!result.success) {
        append_log(result.message);
        gtk_label_set_text(GTK_LABEL(status_label_), result.message.c_str());
    } else {
        gtk_check_button_set_active(GTK_CHECK_BUTTON(lunch_check_), FALSE);
        gtk_check_button_set_active(GTK_CHECK_BUTTON(teeth_check_), FALSE);
    }
    refresh_status();
}

void MainWindow::stop_session() {
    std::string child_id = current_child_id();
    if (child_id.empty() || !enforcer_) return;

    CommandResult result = enforcer_->stop(child_id, StopReason::CHILD_REQUEST);
    if (!result.success) {
        append_log(result.message);
    }
    refresh_status();
}

void MainWindow::shutdown() {
    if (shut_down_) return;
    shut_down_ = true;

    if (tick_source_ != 0) {
        g_source_remove(tick_source_);
        tick_source_ = 0;
    }
    if (enforcer_) {
        enforcer_->stop_all(StopReason::CHILD_REQUEST);
    }
    if (dispatcher_) {
        dispatcher_->flush();
        dispatcher_->shutdown();
    }
}

void MainWindow::refresh_status() {
    std::string child_id = current_child_id();
    if (child_id.empty() || !enforcer_) {
        usage_view_->reset();
        return;
    }

    EnforcementSnapshot snap = enforcer_->snapshot(child_id);

    std::string state;
    switch (snap.phase) {
        case EnforcementPhase::IDLE:
            state = "Idle";
            break;
        case EnforcementPhase::ACTIVE:
            state = "Playing";
            break;
        case EnforcementPhase::ON_BREAK:
            state = "On break (" + format_time_remaining(snap.break_remaining) + " left)";
            break;
        case EnforcementPhase::LOCKED:
            state = "Daily limit reached";
            break;
    }
    gtk_label_set_text(GTK_LABEL(state_label_), state.c_str());
    gtk_label_set_text(GTK_LABEL(timer_label_), format_duration(snap.session_elapsed).c_str());
    usage_view_->update(snap);

    bool active = snap.phase == EnforcementPhase::ACTIVE;
    gtk_widget_set_sensitive(start_button_, !active);
    gtk_widget_set_sensitive(stop_button_, active);

    RoutineStep step = active ? RoutineStep::NONE : enforcer_->routine_step(child_id);
    gtk_widget_set_visible(routine_box_, step != RoutineStep::NONE);
    gtk_widget_set_visible(lunch_check_, step == RoutineStep::ASK_LUNCH);
}

void MainWindow::append_log(const std::string& message) {
    // Get timestamp
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf;
    localtime_r(&time_t, &tm_buf);

    std::ostringstream log_line;
    log_line << "[" << std::put_time(&tm_buf, "%H:%M:%S") << "] " << message << "\n";

    GtkTextIter end;
    gtk_text_buffer_get_end_iter(log_buffer_, &end);
    gtk_text_buffer_insert(log_buffer_, &end, log_line.str().c_str(), -1);

    // Scroll to bottom
    gtk_text_buffer_get_end_iter(log_buffer_, &end);
    gtk_text_view_scroll_to_iter(GTK_TEXT_VIEW(log_text_view_), &end, 0.0, FALSE, 0.0, 0.0);
}

void MainWindow::show_event(const EnforcementEvent& event, const std::string& child_id) {
    NotificationMessage msg = describe_event(event, display_name(child_id));

    std::string line = msg.title + ": " + msg.body;
    for (auto& c : line) {
        if (c == '\n') c = ' ';
    }
    append_log(line);
    gtk_label_set_text(GTK_LABEL(status_label_), line.c_str());

    GtkApplication* app = gtk_window_get_application(GTK_WINDOW(window_));
    if (app) {
        GNotification* notification = g_notification_new(msg.title.c_str());
        g_notification_set_body(notification, msg.body.c_str());
        g_application_send_notification(G_APPLICATION(app), nullptr, notification);
        g_object_unref(notification);
    }

    if (settings_.sound_notifications && !msg.sound.empty()) {
        gtk_widget_error_bell(window_);
    }
}

std::string MainWindow::current_child_id() const {
    if (!child_dropdown_) return "";
    guint selected = gtk_drop_down_get_selected(GTK_DROP_DOWN(child_dropdown_));
    if (selected == GTK_INVALID_LIST_POSITION || selected >= child_ids_.size()) return "";
    return child_ids_[selected];
}

std::string MainWindow::display_name(const std::string& child_id) {
    auto child = db_.get_child(child_id);
    return child && !child->display_name.empty() ? child->display_name : child_id;
}

void MainWindow::queue_log(const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    pending_logs_.push_back(message);
    g_idle_add(on_log_update, this);
}

// Static callbacks
void MainWindow::on_start_clicked(GtkButton* /*button*/, gpointer user_data) {
    auto* self = static_cast<MainWindow*>(user_data);
    self->start_session();
}

void MainWindow::on_stop_clicked(GtkButton* /*button*/, gpointer user_data) {
    auto* self = static_cast<MainWindow*>(user_data);
    self->stop_session();
}

void MainWindow::on_child_changed(GtkDropDown* /*dropdown*/, GParamSpec* /*pspec*/, gpointer user_data) {
    auto* self = static_cast<MainWindow*>(user_data);
    self->refresh_status();
}

gboolean MainWindow::on_close_request(GtkWindow* /*window*/, gpointer user_data) {
    auto* self = static_cast<MainWindow*>(user_data);
    self->shutdown();
    return FALSE;
}

gboolean MainWindow::on_tick(gpointer user_data) {
    auto* self = static_cast<MainWindow*>(user_data);
    self->enforcer_->evaluate();
    self->refresh_status();
    return G_SOURCE_CONTINUE;
}

gboolean MainWindow::on_log_update(gpointer user_data) {
    auto* self = static_cast<MainWindow*>(user_data);
    std::vector<std::string> logs;
    {
        std::lock_guard<std::mutex> lock(self->log_mutex_);
        logs = std::move(self->pending_logs_);
        self->pending_logs_.clear();
    }
    // Widgets may already be gone once the window has closed
    if (self->shut_down_) return G_SOURCE_REMOVE;
    for (const auto& log : logs) {
        self->append_log(log);
    }
    return G_SOURCE_REMOVE;
}

gboolean MainWindow::on_event_update(gpointer user_data) {
    auto* self = static_cast<MainWindow*>(user_data);
    std::vector<std::pair<EnforcementEvent, std::string>> events;
    {
        std::lock_guard<std::mutex> lock(self->event_mutex_);
        events = std::move(self->pending_events_);
        self->pending_events_.clear();
    }
    if (self->shut_down_) return G_SOURCE_REMOVE;
    for (const auto& entry : events) {
        self->show_event(entry.first, entry.second);
    }
    self->refresh_status();
    return G_SOURCE_REMOVE;
}

// Application entry point
namespace {

struct GuiContext {
    Database* db = nullptr;
    std::unique_ptr<MainWindow> window;
};

void on_activate(GtkApplication* app, gpointer user_data) {
    auto* context = static_cast<GuiContext*>(user_data);
    if (!context->window) {
        context->window = std::make_unique<MainWindow>(app, *context->db);
    }
    gtk_window_present(GTK_WINDOW(context->window->get_window()));
}

} // namespace

int run_gui(int argc, char** argv) {
    InstanceLock lock(INSTANCE_LOCK_NAME);
    if (!lock.try_acquire()) {
        std::cerr << "[!] " << lock.last_error() << std::endl;
        return 1;
    }

    std::unique_ptr<Database> db;
    try {
        db = std::make_unique<Database>(DEFAULT_DB_PATH);
    } catch (const std::exception& e) {
        std::cerr << "[!] " << e.what() << std::endl;
        return 1;
    }
    if (!db->initialize()) {
        std::cerr << "[!] Failed to initialize database: " << db->get_last_error() << std::endl;
        return 1;
    }

    GuiContext context;
    context.db = db.get();

    GtkApplication* app = gtk_application_new("org.gamesentry.app", G_APPLICATION_DEFAULT_FLAGS);
    g_signal_connect(app, "activate", G_CALLBACK(on_activate), &context);

    int status = g_application_run(G_APPLICATION(app), argc, argv);
    if (context.window) {
        context.window->shutdown();
        context.window.reset();
    }
    g_object_unref(app);

    return status;
}

} // namespace gamesentry
