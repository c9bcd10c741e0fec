/*
 * src/main_cli.cpp - Main entry point for the CLI application
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#include <iostream>
#include <string>
#include <vector>
#include <memory>
#include <csignal>
#include <atomic>
#include <thread>
#include <chrono>
#include <iomanip>
#include <mutex>
#include <optional>
#include <functional>
#include <getopt.h>

#include "gamesentry/common.h"
#include "gamesentry/clock.h"
#include "gamesentry/database.h"
#include "gamesentry/email_notifier.h"
#include "gamesentry/enforcer.h"
#include "gamesentry/instance_lock.h"
#include "gamesentry/notifier.h"
#include "gamesentry/settings.h"

using namespace gamesentry;

static std::atomic<bool> g_interrupted{false};
static std::mutex g_console_mutex;

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_interrupted = true;
    }
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [OPTIONS] COMMAND [ARGS]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  run                          Start a session and enforce limits until stopped\n";
    std::cout << "  status                       Show today's play time and limits\n";
    std::cout << "  logs [DATE]                  List session logs, optionally for one day\n";
    std::cout << "  add-entry START STOP         Add a finished session\n";
    std::cout << "  edit-entry ID START STOP     Change the times of a finished session\n";
    std::cout << "  delete-entry ID              Delete a finished session\n";
    std::cout << "  clear-entries                Delete every finished session of the child\n";
    std::cout << "  set-limits                   Create or update the child's limits\n";
    std::cout << "  config [KEY VALUE]           Show or change application settings\n";
    std::cout << "\nOptions:\n";
    std::cout << "  -D, --db FILE         Database file (default: " << DEFAULT_DB_PATH << ")\n";
    std::cout << "  -c, --child ID        Child to act on (default: the only child)\n";
    std::cout << "  -v, --verbose         Print engine diagnostics\n";
    std::cout << "  -h, --help            Show this help message\n";
    std::cout << "\nset-limits options (minutes, or 'none' to remove a limit):\n";
    std::cout << "      --name NAME       Display name\n";
    std::cout << "      --daily MIN       Daily allowance\n";
    std::cout << "      --continuous MIN  Maximum continuous play before a break\n";
    std::cout << "      --break MIN       Mandatory break length\n";
    std::cout << "      --window HH:MM-HH:MM  Allowed hours\n";
    std::cout << "      --lunch HH:MM-HH:MM   Lunch hours: ask about lunch and teeth before play\n";
    std::cout << "\nTimes are 'YYYY-MM-DD HH:MM[:SS]'. STOP may be given as HH:MM on START's day;\n";
    std::cout << "a STOP earlier than START then means the next morning.\n";
    std::cout << "\nExamples:\n";
    std::cout << "  " << program << " --child maya set-limits --daily 60 --continuous 30 --break 10\n";
    std::cout << "  " << program << " --child maya run\n";
    std::cout << "  " << program << " --child maya add-entry \"2026-03-02 16:00\" 16:45\n";
    std::cout << "  " << program << " config email_recipients parent@example.org\n";
}

namespace {

// Prints events as they are delivered by the dispatcher
class ConsoleNotifier : public Notifier {
public:
    using NameLookup = std::function<std::string(const std::string&)>;

    explicit ConsoleNotifier(NameLookup lookup) : lookup_(std::move(lookup)) {}

    void deliver(const EnforcementEvent& event, const std::string& child_id) override {
        NotificationMessage msg = describe_event(event, lookup_(child_id));
        std::string body = msg.body;
        for (auto& c : body) {
            if (c == '\n') c = ' ';
        }
        std::lock_guard<std::mutex> lock(g_console_mutex);
        std::cout << "\n[+] " << msg.title << ": " << body << std::endl;
    }

private:
    NameLookup lookup_;
};

struct CliOptions {
    std::string db_path = DEFAULT_DB_PATH;
    std::string child_id;
    bool verbose = false;

    std::optional<std::string> name;
    std::optional<std::string> daily;
    std::optional<std::string> continuous;
    std::optional<std::string> mandatory_break;
    std::optional<std::string> window;
    std::optional<std::string> lunch;
};

void print_error(const std::string& message) {
    std::lock_guard<std::mutex> lock(g_console_mutex);
    std::cerr << "[!] " << message << "\n";
}

// Minutes, or "none" to clear. Returns false on bad input.
bool parse_limit(const std::string& text, std::optional<Seconds>& out) {
    if (text == "none" || text == "off") {
        out.reset();
        return true;
    }
    try {
        size_t used = 0;
        int minutes = std::stoi(text, &used);
        if (used != text.size() || minutes < 0 || minutes > MAX_LIMIT_MINUTES) return false;
        out = std::chrono::duration_cast<Seconds>(std::chrono::minutes(minutes));
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

std::string describe_limit(const std::optional<Seconds>& value) {
    if (!value) return "none";
    return std::to_string(value->count() / 60) + " min";
}

// STOP accepts a full timestamp or HH:MM on the start's day
std::optional<Timestamp> parse_stop(const std::string& text, Timestamp start) {
    if (auto full = parse_timestamp(text)) {
        return full;
    }
    auto tod = parse_time_of_day(text);
    if (!tod) return std::nullopt;

    LocalDate day = local_date(start);
    Timestamp stop = make_local_time(day.year, day.month, day.day, tod->hour, tod->minute);
    if (stop < start) {
        stop = make_local_time(day.year, day.month, day.day + 1, tod->hour, tod->minute);
    }
    return stop;
}

bool resolve_child(Database& db, CliOptions& options) {
    if (!options.child_id.empty()) return true;

    auto children = db.list_children();
    if (children.size() == 1) {
        options.child_id = children[0].id;
        return true;
    }
    print_error(children.empty() ? "No children configured; use --child ID set-limits"
                                 : "Several children configured; choose one with --child");
    return false;
}

std::string display_name(Database& db, const std::string& child_id) {
    auto child = db.get_child(child_id);
    return child && !child->display_name.empty() ? child->display_name : child_id;
}

EnforcerCallbacks make_callbacks(bool verbose) {
    EnforcerCallbacks callbacks;
    if (verbose) {
        callbacks.on_log_message = [](const std::string& message) {
            std::lock_guard<std::mutex> lock(g_console_mutex);
            std::cout << "[*] " << message << "\n";
        };
    }
    callbacks.on_error = [](const std::string& error) {
        print_error("Error: " + error);
    };
    return callbacks;
}

void print_snapshot(const EnforcementSnapshot& snap, const std::string& name) {
    std::cout << "Child:        " << name << " (" << snap.child_id << ")\n";
    std::cout << "State:        " << phase_to_string(snap.phase) << "\n";
    std::cout << "Played today: " << format_duration(snap.accumulated) << "\n";
    if (snap.remaining) {
        std::cout << "Time left:    " << format_time_remaining(*snap.remaining) << "\n";
    } else {
        std::cout << "Time left:    unlimited\n";
    }
}

std::string describe_window(const std::optional<AllowedWindow>& window, const char* absent) {
    return window ? format_window(*window) : absent;
}

// A running engine notices the commit on its next tick and re-reads this total
void report_day_total(Database& db, const std::string& child_id, const LocalDate& day) {
    try {
        Seconds total = db.get_todays_accumulated(child_id, day);
        std::cout << "[+] Play time on " << day.to_string() << ": " << format_duration(total) << "\n";
    } catch (const std::exception& e) {
        print_error(e.what());
    }
}

bool ask_yes_no(const std::string& question) {
    std::string answer;
    while (true) {
        std::cout << question << " [y/n] " << std::flush;
        if (!std::getline(std::cin, answer)) return false;
        if (answer == "y" || answer == "Y" || answer == "yes") return true;
        if (answer == "n" || answer == "N" || answer == "no") return false;
    }
}

RoutineAnswers ask_routine(RoutineStep step) {
    RoutineAnswers answers;
    if (step == RoutineStep::ASK_LUNCH) {
        answers.had_lunch = ask_yes_no("Have you had lunch yet?");
        if (!answers.had_lunch) return answers;
    }
    answers.brushed_teeth = ask_yes_no("Have you brushed your teeth?");
    return answers;
}

int cmd_run(Database& db, CliOptions& options, const AppSettings& settings) {
    InstanceLock lock(INSTANCE_LOCK_NAME);
    if (!lock.try_acquire()) {
        print_error(lock.last_error());
        return 1;
    }

    int recovered = db.close_interrupted_sessions();
    if (recovered > 0) {
        std::cout << "[+] Closed " << recovered << " session(s) interrupted by a crash\n";
    } else if (recovered < 0) {
        print_error("Failed to close interrupted sessions: " + db.get_last_error());
    }

    if (!resolve_child(db, options)) return 1;
    const std::string child_id = options.child_id;
    auto lookup = [&db](const std::string& id) { return display_name(db, id); };

    NotificationDispatcher dispatcher;
    dispatcher.set_error_callback([](const std::string& error) { print_error(error); });
    dispatcher.add_sink(std::make_shared<ConsoleNotifier>(lookup));
    if (settings.email.is_complete()) {
        dispatcher.add_sink(std::make_shared<EmailNotifier>(settings.email, lookup));
        std::cout << "Email notifications to: " << join_list(settings.email.recipients, ", ") << "\n";
    }

    SystemClock clock;
    EnforcerOptions enforcer_options;
    enforcer_options.warning_threshold = settings.warning_threshold();
    SessionEnforcer enforcer(db, dispatcher, clock, enforcer_options);
    enforcer.set_callbacks(make_callbacks(options.verbose));

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::cout << "=== Game Sentry ===\n";
    print_snapshot(enforcer.snapshot(child_id), lookup(child_id));
    std::cout << "\n";

    RoutineStep step = enforcer.routine_step(child_id);
    CommandResult started = step == RoutineStep::NONE ? enforcer.start(child_id)
                                                      : enforcer.start(child_id, ask_routine(step));
    if (!started.success) {
        print_error(std::string(error_to_string(started.error)) + ": " + started.message);
        dispatcher.flush();
        return 1;
    }

    auto tick = std::chrono::milliseconds(settings.tick_interval_ms);
    auto last_tick = std::chrono::steady_clock::now();
    auto last_print = last_tick;

    while (!g_interrupted) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        auto now = std::chrono::steady_clock::now();
        if (now - last_tick >= tick) {
            enforcer.evaluate();
            last_tick = now;
        }

        EnforcementSnapshot snap = enforcer.snapshot(child_id);
        if (snap.phase == EnforcementPhase::IDLE || snap.phase == EnforcementPhase::LOCKED) {
            break;
        }

        if (std::chrono::duration_cast<std::chrono::seconds>(now - last_print).count() >= STATUS_INTERVAL_SECONDS) {
            std::lock_guard<std::mutex> lock(g_console_mutex);
            if (snap.phase == EnforcementPhase::ON_BREAK) {
                std::cout << "\r[Break] " << format_time_remaining(snap.break_remaining) << " left";
            } else {
                std::cout << "\r[Session] " << format_duration(snap.session_elapsed)
                          << " | Today: " << format_duration(snap.accumulated);
                if (snap.remaining) {
                    std::cout << " | Left: " << format_time_remaining(*snap.remaining);
                }
            }
            std::cout << "          " << std::flush;
            last_print = now;
        }
    }

    if (g_interrupted) {
        std::cout << "\n[!] Interrupt received, stopping session...\n";
        enforcer.stop(child_id, StopReason::CHILD_REQUEST);
    }

    dispatcher.flush();

    EnforcementSnapshot final_snap = enforcer.snapshot(child_id);
    std::cout << "\n=== Summary ===\n";
    print_snapshot(final_snap, lookup(child_id));
    return 0;
}

int cmd_status(Database& db, CliOptions& options) {
    if (!resolve_child(db, options)) return 1;

    auto child = db.get_child(options.child_id);
    LimitConfig limits = child ? child->limits : LimitConfig();

    NotificationDispatcher silent;
    SystemClock clock;
    SessionEnforcer enforcer(db, silent, clock);
    enforcer.set_callbacks(make_callbacks(options.verbose));

    print_snapshot(enforcer.snapshot(options.child_id), display_name(db, options.child_id));
    std::cout << "Daily limit:  " << describe_limit(limits.daily_allowance) << "\n";
    std::cout << "Continuous:   " << describe_limit(limits.max_continuous_play) << "\n";
    std::cout << "Break:        " << describe_limit(limits.mandatory_break)
              << (limits.enforce_break ? "" : " (not enforced)") << "\n";
    std::cout << "Hours:        " << describe_window(limits.allowed_window, "any") << "\n";
    std::cout << "Lunch:        " << describe_window(limits.lunch_window, "none") << "\n";

    for (const auto& log : db.get_session_logs_for_day(options.child_id, local_date(clock.now()))) {
        if (log.is_open()) {
            std::cout << "Running:      since " << format_timestamp(log.start) << " (log #" << log.id << ")\n";
        }
    }
    return 0;
}

int cmd_logs(Database& db, CliOptions& options, const std::vector<std::string>& args) {
    if (!resolve_child(db, options)) return 1;

    std::vector<SessionLog> logs;
    if (!args.empty()) {
        auto day = parse_date(args[0]);
        if (!day) {
            print_error("Invalid date '" + args[0] + "', expected YYYY-MM-DD");
            return 1;
        }
        logs = db.get_session_logs_for_day(options.child_id, *day);
    } else {
        logs = db.get_session_logs(options.child_id, 50);
    }

    if (logs.empty()) {
        std::cout << "No sessions recorded\n";
        return 0;
    }

    Timestamp now = std::chrono::system_clock::now();
    std::cout << std::left << std::setw(8) << "ID" << std::setw(22) << "Start"
              << std::setw(22) << "Stop" << "Duration\n";
    for (const auto& log : logs) {
        std::cout << std::left << std::setw(8) << log.id
                  << std::setw(22) << format_timestamp(log.start)
                  << std::setw(22) << (log.stop ? format_timestamp(*log.stop) : "running")
                  << format_duration(log.duration(now)) << "\n";
    }
    return 0;
}

int cmd_add_entry(Database& db, CliOptions& options,
                  const std::vector<std::string>& args) {
    if (args.size() != 2) {
        print_error("add-entry expects START and STOP");
        return 1;
    }
    if (!resolve_child(db, options)) return 1;

    auto start = parse_timestamp(args[0]);
    if (!start) {
        print_error("Invalid start time '" + args[0] + "'");
        return 1;
    }
    auto stop = parse_stop(args[1], *start);
    if (!stop) {
        print_error("Invalid stop time '" + args[1] + "'");
        return 1;
    }

    auto id = db.add_manual_entry(options.child_id, *start, *stop);
    if (!id) {
        print_error(db.get_last_error());
        return 1;
    }

    std::cout << "[+] Added session #" << *id << " (" << format_duration(
        std::chrono::duration_cast<Seconds>(*stop - *start)) << ")\n";
    report_day_total(db, options.child_id, local_date(*start));
    return 0;
}

int cmd_edit_entry(Database& db, const std::vector<std::string>& args) {
    if (args.size() != 3) {
        print_error("edit-entry expects ID, START and STOP");
        return 1;
    }

    int64_t id = 0;
    try {
        id = std::stoll(args[0]);
    } catch (const std::exception&) {
        print_error("Invalid session id '" + args[0] + "'");
        return 1;
    }

    auto existing = db.get_session_log(id);
    if (!existing) {
        print_error("No session log with id " + args[0]);
        return 1;
    }
    auto start = parse_timestamp(args[1]);
    if (!start) {
        print_error("Invalid start time '" + args[1] + "'");
        return 1;
    }
    auto stop = parse_stop(args[2], *start);
    if (!stop) {
        print_error("Invalid stop time '" + args[2] + "'");
        return 1;
    }

    if (!db.edit_session_log(id, *start, *stop)) {
        print_error(db.get_last_error());
        return 1;
    }

    std::cout << "[+] Updated session #" << id << "\n";
    LocalDate old_day = local_date(existing->start);
    LocalDate new_day = local_date(*start);
    report_day_total(db, existing->child_id, new_day);
    if (old_day != new_day) {
        report_day_total(db, existing->child_id, old_day);
    }
    return 0;
}

int cmd_delete_entry(Database& db, const std::vector<std::string>& args) {
    if (args.size() != 1) {
        print_error("delete-entry expects ID");
        return 1;
    }

    int64_t id = 0;
    try {
        id = std::stoll(args[0]);
    } catch (const std::exception&) {
        print_error("Invalid session id '" + args[0] + "'");
        return 1;
    }

    auto existing = db.get_session_log(id);
    if (!existing) {
        print_error("No session log with id " + args[0]);
        return 1;
    }
    if (!db.delete_session_log(id)) {
        print_error(existing->is_open() ? "Cannot delete a session that is still running"
                                        : db.get_last_error());
        return 1;
    }

    std::cout << "[+] Deleted session #" << id << "\n";
    report_day_total(db, existing->child_id, local_date(existing->start));
    return 0;
}

int cmd_clear_entries(Database& db, CliOptions& options) {
    if (!resolve_child(db, options)) return 1;

    int removed = db.delete_all_session_logs(options.child_id);
    if (removed < 0) {
        print_error(db.get_last_error());
        return 1;
    }

    std::cout << "[+] Deleted " << removed << " session(s)\n";
    report_day_total(db, options.child_id, local_date(std::chrono::system_clock::now()));
    return 0;
}

int cmd_set_limits(Database& db, const CliOptions& options) {
    if (options.child_id.empty()) {
        print_error("set-limits needs --child");
        return 1;
    }

    ChildProfile child;
    if (auto existing = db.get_child(options.child_id)) {
        child = *existing;
    } else {
        child.id = options.child_id;
        child.display_name = options.child_id;
    }

    if (options.name) child.display_name = *options.name;

    struct LimitArg {
        const std::optional<std::string>& text;
        std::optional<Seconds>& target;
        const char* option;
    };
    LimitArg limit_args[] = {
        {options.daily, child.limits.daily_allowance, "--daily"},
        {options.continuous, child.limits.max_continuous_play, "--continuous"},
        {options.mandatory_break, child.limits.mandatory_break, "--break"},
    };
    for (auto& arg : limit_args) {
        if (arg.text && !parse_limit(*arg.text, arg.target)) {
            print_error(std::string(arg.option) + " expects minutes or 'none'");
            return 1;
        }
    }

    struct WindowArg {
        const std::optional<std::string>& text;
        std::optional<AllowedWindow>& target;
        const char* option;
    };
    WindowArg window_args[] = {
        {options.window, child.limits.allowed_window, "--window"},
        {options.lunch, child.limits.lunch_window, "--lunch"},
    };
    for (auto& arg : window_args) {
        if (!arg.text) continue;
        if (*arg.text == "none" || *arg.text == "any") {
            arg.target.reset();
            continue;
        }
        auto window = parse_window(*arg.text);
        if (!window || window->is_empty()) {
            print_error(std::string(arg.option) + " expects HH:MM-HH:MM with different times");
            return 1;
        }
        arg.target = window;
    }

    if (!db.upsert_child(child)) {
        print_error("Failed to save limits: " + db.get_last_error());
        return 1;
    }

    std::cout << "[+] Saved limits for " << child.display_name << ": daily "
              << describe_limit(child.limits.daily_allowance) << ", continuous "
              << describe_limit(child.limits.max_continuous_play) << ", break "
              << describe_limit(child.limits.mandatory_break) << ", hours "
              << describe_window(child.limits.allowed_window, "any") << ", lunch "
              << describe_window(child.limits.lunch_window, "none") << "\n";
    return 0;
}

int cmd_config(Database& db, AppSettings& settings, const std::vector<std::string>& args) {
    if (args.empty()) {
        for (const auto& entry : settings.to_pairs()) {
            bool secret = entry.first == "email_password" && !entry.second.empty();
            std::cout << std::left << std::setw(28) << entry.first
                      << (secret ? "********" : entry.second) << "\n";
        }
        return 0;
    }
    if (args.size() != 2) {
        print_error("config expects KEY VALUE");
        return 1;
    }

    std::string error;
    if (!settings.apply(args[0], args[1], &error)) {
        print_error(error);
        return 1;
    }
    if (!settings.save(db)) {
        print_error("Failed to save settings: " + db.get_last_error());
        return 1;
    }
    std::cout << "[+] " << args[0] << " updated\n";
    return 0;
}

enum LongOnly {
    OPT_NAME = 256,
    OPT_DAILY,
    OPT_CONTINUOUS,
    OPT_BREAK,
    OPT_WINDOW,
    OPT_LUNCH
};

} // namespace

int main(int argc, char** argv) {
    CliOptions options;

    static struct option long_options[] = {
        {"db", required_argument, nullptr, 'D'},
        {"child", required_argument, nullptr, 'c'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {"name", required_argument, nullptr, OPT_NAME},
        {"daily", required_argument, nullptr, OPT_DAILY},
        {"continuous", required_argument, nullptr, OPT_CONTINUOUS},
        {"break", required_argument, nullptr, OPT_BREAK},
        {"window", required_argument, nullptr, OPT_WINDOW},
        {"lunch", required_argument, nullptr, OPT_LUNCH},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    while ((opt = getopt_long(argc, argv, "D:c:vh", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'D':
                options.db_path = optarg;
                break;
            case 'c':
                options.child_id = optarg;
                break;
            case 'v':
                options.verbose = true;
                break;
            case OPT_NAME:
                options.name = optarg;
                break;
            case OPT_DAILY:
                options.daily = optarg;
                break;
            case OPT_CONTINUOUS:
                options.continuous = optarg;
                break;
            case OPT_BREAK:
                options.mandatory_break = optarg;
                break;
            case OPT_WINDOW:
                options.window = optarg;
                break;
            case OPT_LUNCH:
                options.lunch = optarg;
                break;
            case 'h':
                print_usage(argv[0]);
                return 0;
            default:
                print_usage(argv[0]);
                return 1;
        }
    }

    if (optind >= argc) {
        print_usage(argv[0]);
        return 1;
    }
    std::string command = argv[optind];
    std::vector<std::string> args(argv + optind + 1, argv + argc);

    std::unique_ptr<Database> db;
    try {
        db = std::make_unique<Database>(options.db_path);
    } catch (const std::exception& e) {
        print_error(e.what());
        return 1;
    }
    if (!db->initialize()) {
        print_error("Failed to initialize database: " + db->get_last_error());
        return 1;
    }

    std::vector<std::string> warnings;
    AppSettings settings = AppSettings::load(*db, &warnings);
    for (const auto& warning : warnings) {
        print_error("Ignoring stored setting: " + warning);
    }

    if (command == "run") {
        return cmd_run(*db, options, settings);
    }
    if (command == "status") {
        return cmd_status(*db, options);
    }
    if (command == "logs") {
        return cmd_logs(*db, options, args);
    }
    if (command == "set-limits") {
        return cmd_set_limits(*db, options);
    }
    if (command == "config") {
        return cmd_config(*db, settings, args);
    }

    // Corrections only touch closed logs
    if (command == "add-entry") {
        return cmd_add_entry(*db, options, args);
    }
    if (command == "edit-entry") {
        return cmd_edit_entry(*db, args);
    }
    if (command == "delete-entry") {
        return cmd_delete_entry(*db, args);
    }
    if (command == "clear-entries") {
        return cmd_clear_entries(*db, options);
    }

    print_error("Unknown command '" + command + "'");
    print_usage(argv[0]);
    return 1;
}
