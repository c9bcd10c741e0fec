/*
 * email_notifier.h - Mails session events to the configured parents
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "gamesentry/notifier.h"
#include "gamesentry/mailer.h"
#include "gamesentry/settings.h"

namespace gamesentry {

class EmailNotifier : public Notifier {
public:
    // Maps a child id to the name shown in mail
    using NameLookup = std::function<std::string(const std::string&)>;

    EmailNotifier(EmailSettings settings, NameLookup lookup);

    // Throws std::runtime_error when the SMTP transfer fails
    void deliver(const EnforcementEvent& event, const std::string& child_id) override;

    // Message that would be sent for the event, or nullopt when it is not mailed
    std::optional<MailMessage> compose(const EnforcementEvent& event, const std::string& child_id) const;

private:
    EmailSettings settings_;
    NameLookup lookup_;
    std::unique_ptr<Mailer> mailer_;
    std::mutex mutex_;
};

} // namespace gamesentry
