#include "gamesentry/notifier.h"
#include "gamesentry/email_notifier.h"
#include "gamesentry/mailer.h"
#include "gamesentry/settings.h"
#include "gamesentry/database.h"
#include "gamesentry/instance_lock.h"
#include "test_support.h"
#include <iostream>
#include <cassert>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <unistd.h>

using namespace gamesentry;

namespace {

EnforcementEvent make_event(EventType type) {
    EnforcementEvent event;
    event.type = type;
    event.child_id = "kid";
    event.at = make_local_time(2026, 2, 14, 16, 30);
    return event;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

class ThrowingNotifier : public Notifier {
public:
    void deliver(const EnforcementEvent&, const std::string&) override {
        throw std::runtime_error("smtp down");
    }
};

class CountingNotifier : public Notifier {
public:
    void deliver(const EnforcementEvent&, const std::string&) override { ++count; }
    std::atomic<int> count{0};
};

EmailSettings complete_email() {
    EmailSettings email;
    email.enabled = true;
    email.address = "parent@example.org";
    email.password = "app-password";
    email.recipients = {"parent@example.org", "other@example.org"};
    return email;
}

} // namespace

void test_describe_event() {
    EnforcementEvent stopped = make_event(EventType::SESSION_STOPPED);
    stopped.session_duration = Seconds(1830);
    auto msg = describe_event(stopped, "Maya");
    assert(msg.title == "Session Stopped");
    assert(msg.body == "User: Maya\nDuration: 00:30:30");
    assert(msg.sound == "stop");
    assert(msg.email_subject == "Gaming Session Stopped");
    assert(contains(msg.email_text, "Game Sentry Alert"));
    assert(contains(msg.email_html, "00:30:30"));

    EnforcementEvent limit = make_event(EventType::DAILY_LIMIT_REACHED);
    limit.limit = Seconds(3600);
    limit.accumulated = Seconds(3630);
    msg = describe_event(limit, "");
    assert(msg.title == "Daily Limit Reached!");
    assert(msg.body == "kid has reached their daily limit of 60 minutes.\nCurrent usage: 60 minutes");
    assert(msg.sound == "over");

    EnforcementEvent brk = make_event(EventType::BREAK_STARTED);
    brk.limit = Seconds(600);
    msg = describe_event(brk, "Maya");
    assert(contains(msg.body, "Break time started: 10 minutes"));
    assert(msg.sound == "warning");

    EnforcementEvent warning = make_event(EventType::WARNING_THRESHOLD);
    warning.remaining = Seconds(61);
    msg = describe_event(warning, "Maya");
    assert(msg.body == "Maya: 2 minutes of play time left");
    assert(msg.email_subject.empty());
    warning.remaining = Seconds(60);
    assert(describe_event(warning, "Maya").body == "Maya: 1 minute of play time left");

    msg = describe_event(make_event(EventType::DAY_RESET), "Maya");
    assert(msg.email_subject.empty());
    assert(msg.sound.empty());

    // Names are escaped in mail markup
    msg = describe_event(make_event(EventType::SESSION_STARTED), "<b>Tom</b>");
    assert(contains(msg.email_html, "&lt;b&gt;Tom&lt;/b&gt;"));
    assert(!contains(msg.email_html, "<b>Tom"));

    std::cout << "test_describe_event passed!" << std::endl;
}

void test_mail_payload() {
    MailMessage mail;
    mail.from = "parent@example.org";
    mail.to = {"a@example.org", "b@example.org"};
    mail.subject = "Game Sentry - Break Time Ended";
    mail.text_body = "line one\nline two";

    std::string plain = Mailer::build_payload(mail, "Sat, 14 Feb 2026 16:30:00 +0000", "b1");
    assert(contains(plain, "To: a@example.org, b@example.org\r\n"));
    assert(contains(plain, "Subject: Game Sentry - Break Time Ended\r\n"));
    assert(contains(plain, "Content-Type: text/plain; charset=utf-8\r\n"));
    assert(contains(plain, "line one\r\nline two"));
    assert(!contains(plain, "multipart"));

    mail.html_body = "<p>hi</p>";
    std::string multi = Mailer::build_payload(mail, "Sat, 14 Feb 2026 16:30:00 +0000", "b1");
    assert(contains(multi, "multipart/alternative; boundary=\"b1\""));
    assert(contains(multi, "Content-Type: text/html; charset=utf-8\r\n\r\n<p>hi</p>"));
    assert(contains(multi, "--b1--\r\n"));

    std::cout << "test_mail_payload passed!" << std::endl;
}

void test_email_notifier_compose() {
    EmailNotifier notifier(complete_email(), [](const std::string& id) {
        return id == "kid" ? std::string("Maya") : id;
    });

    auto mail = notifier.compose(make_event(EventType::SESSION_STARTED), "kid");
    assert(mail);
    assert(mail->subject == "Game Sentry - Gaming Session Started");
    assert(mail->from == "parent@example.org");
    assert(mail->to.size() == 2);
    assert(contains(mail->text_body, "Maya has started a new gaming session."));
    assert(!mail->html_body.empty());

    // Events without a mail template are skipped
    assert(!notifier.compose(make_event(EventType::WARNING_THRESHOLD), "kid"));

    // Incomplete settings send nothing and never touch the network
    EmailSettings partial = complete_email();
    partial.password.clear();
    EmailNotifier disabled(partial, nullptr);
    assert(!disabled.compose(make_event(EventType::SESSION_STARTED), "kid"));
    disabled.deliver(make_event(EventType::SESSION_STARTED), "kid");

    std::cout << "test_email_notifier_compose passed!" << std::endl;
}

void test_dispatcher_isolates_sinks() {
    NotificationDispatcher dispatcher(1);
    auto counting = std::make_shared<CountingNotifier>();
    std::atomic<int> callback_count{0};
    dispatcher.add_sink(std::make_shared<ThrowingNotifier>());
    dispatcher.add_sink(counting);
    dispatcher.add_sink(std::make_shared<CallbackNotifier>(
        [&callback_count](const EnforcementEvent&, const std::string& child_id) {
            if (child_id == "kid") ++callback_count;
        }));
    dispatcher.add_sink(nullptr);
    assert(dispatcher.sink_count() == 3);

    std::mutex mutex;
    std::vector<std::string> errors;
    dispatcher.set_error_callback([&](const std::string& error) {
        std::lock_guard<std::mutex> lock(mutex);
        errors.push_back(error);
    });

    dispatcher.deliver(make_event(EventType::SESSION_STARTED), "kid");
    dispatcher.deliver(make_event(EventType::SESSION_STOPPED), "kid");
    dispatcher.flush();

    assert(counting->count == 2);
    assert(callback_count == 2);
    {
        std::lock_guard<std::mutex> lock(mutex);
        assert(errors.size() == 2);
        assert(contains(errors[0], "smtp down"));
        assert(contains(errors[0], "SESSION_STARTED"));
    }

    dispatcher.shutdown();
    dispatcher.deliver(make_event(EventType::DAY_RESET), "kid");
    {
        std::lock_guard<std::mutex> lock(mutex);
        assert(errors.size() == 3);
        assert(contains(errors[2], "Dropped DAY_RESET"));
    }
    assert(counting->count == 2);

    std::cout << "test_dispatcher_isolates_sinks passed!" << std::endl;
}

void test_app_settings() {
    AppSettings settings;
    std::string error;

    assert(settings.apply("email_enabled", "Yes", &error));
    assert(settings.email.enabled);
    assert(settings.apply("email_recipients", " a@example.org, ,b@example.org ", &error));
    assert(settings.email.recipients.size() == 2);
    assert(settings.email.recipients[1] == "b@example.org");
    assert(settings.apply("warning_threshold_minutes", "0", &error));
    assert(settings.warning_threshold_minutes == 0);

    assert(!settings.apply("smtp_url", "http://mail.example.org", &error));
    assert(contains(error, "smtp://"));
    assert(!settings.apply("tick_interval_ms", "50", &error));
    assert(settings.tick_interval_ms == DEFAULT_TICK_INTERVAL_MS);
    assert(!settings.apply("warning_threshold_minutes", "5m", &error));
    assert(!settings.apply("warning_threshold_minutes", "40000000", &error));
    assert(settings.warning_threshold_minutes == 0);
    assert(!settings.apply("tick_interval_ms", "2000000000", &error));
    assert(settings.tick_interval_ms == DEFAULT_TICK_INTERVAL_MS);
    assert(settings.apply("warning_threshold_minutes", std::to_string(MAX_LIMIT_MINUTES), &error));
    assert(settings.warning_threshold() == Seconds(MAX_LIMIT_MINUTES * 60));
    assert(settings.apply("warning_threshold_minutes", "0", &error));
    assert(!settings.apply("colour", "blue", &error));
    assert(error == "Unknown setting: colour");

    Database db(":memory:");
    assert(db.initialize());
    assert(settings.apply("email_address", "parent@example.org"));
    assert(settings.save(db));

    // A bad stored value keeps its default and is reported
    assert(db.set_setting("tick_interval_ms", "fast"));
    std::vector<std::string> warnings;
    AppSettings loaded = AppSettings::load(db, &warnings);
    assert(warnings.size() == 1);
    assert(loaded.email.enabled);
    assert(loaded.email.address == "parent@example.org");
    assert(join_list(loaded.email.recipients) == "a@example.org,b@example.org");
    assert(loaded.warning_threshold_minutes == 0);
    assert(loaded.tick_interval_ms == DEFAULT_TICK_INTERVAL_MS);

    std::cout << "test_app_settings passed!" << std::endl;
}

void test_instance_lock() {
    std::string name = "gamesentry-test-" + std::to_string(::getpid());
    InstanceLock first(name);
    InstanceLock second(name);

    assert(first.try_acquire());
    assert(first.is_held());
    assert(!second.try_acquire());
    assert(second.last_error() == "Another instance is already running");

    first.release();
    assert(!first.is_held());
    assert(second.try_acquire());
    second.release();
    ::unlink(InstanceLock::lock_path(name).c_str());

    std::cout << "test_instance_lock passed!" << std::endl;
}

int main() {
    try {
        test_describe_event();
        test_mail_payload();
        test_email_notifier_compose();
        test_dispatcher_isolates_sinks();
        test_app_settings();
        test_instance_lock();
        std::cout << "All tests passed!" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
