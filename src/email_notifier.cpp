/*
 * src/email_notifier.cpp - Mails session events to the configured parents
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#include "gamesentry/email_notifier.h"
#include <stdexcept>

namespace gamesentry {

EmailNotifier::EmailNotifier(EmailSettings settings, NameLookup lookup)
    : settings_(std::move(settings)), lookup_(std::move(lookup)) {}

std::optional<MailMessage> EmailNotifier::compose(const EnforcementEvent& event,
                                                  const std::string& child_id) const {
    if (!settings_.is_complete()) {
        return std::nullopt;
    }

    std::string name = lookup_ ? lookup_(child_id) : child_id;
    NotificationMessage text = describe_event(event, name);
    if (text.email_subject.empty()) {
        return std::nullopt;
    }

    MailMessage mail;
    mail.from = settings_.address;
    mail.to = settings_.recipients;
    mail.subject = std::string(EMAIL_SUBJECT_PREFIX) + text.email_subject;
    mail.text_body = text.email_text;
    mail.html_body = text.email_html;
    return mail;
}

void EmailNotifier::deliver(const EnforcementEvent& event, const std::string& child_id) {
    auto mail = compose(event, child_id);
    if (!mail) return;

    std::lock_guard<std::mutex> lock(mutex_);
    // Created on first use so a disabled mailer never touches libcurl
    if (!mailer_) {
        mailer_ = std::make_unique<Mailer>();
    }

    MailResult result = mailer_->send(settings_, *mail);
    if (!result.success) {
        throw std::runtime_error("Email \"" + mail->subject + "\" failed: " + result.error_message);
    }
}

} // namespace gamesentry
