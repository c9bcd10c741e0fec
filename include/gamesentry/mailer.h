/*
 * mailer.h - SMTP delivery of notification mail through libcurl
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#pragma once

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include "gamesentry/settings.h"

typedef void CURL;

namespace gamesentry {

struct MailMessage {
    std::string from;
    std::vector<std::string> to;
    std::string subject;
    std::string text_body;
    std::string html_body;      // Optional alternative part
};

struct MailResult {
    bool success = false;
    int curl_code = 0;
    std::string error_message;
};

class Mailer {
public:
    Mailer();
    ~Mailer();

    // Non-copyable
    Mailer(const Mailer&) = delete;
    Mailer& operator=(const Mailer&) = delete;

    // Sends through settings.smtp_url, upgrading to TLS and logging in with address/password
    MailResult send(const EmailSettings& settings, const MailMessage& message,
                    int timeout_seconds = 30);

    // RFC 5322 message text with a multipart/alternative body when html_body is set
    static std::string build_payload(const MailMessage& message, const std::string& date,
                                     const std::string& boundary);

private:
    CURL* curl_ = nullptr;
    std::mutex mutex_;
};

// RAII wrapper for CURL global init
class CurlGlobalInit {
public:
    CurlGlobalInit();
    ~CurlGlobalInit();
    static CurlGlobalInit& instance();
private:
    static std::once_flag init_flag_;
    static std::unique_ptr<CurlGlobalInit> instance_;
};

} // namespace gamesentry
