/*
 * src/mailer.cpp - SMTP delivery of notification mail through libcurl
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#include "gamesentry/mailer.h"
#include <curl/curl.h>
#include <chrono>
#include <cstring>
#include <ctime>
#include <random>
#include <sstream>
#include <stdexcept>

namespace gamesentry {

std::once_flag CurlGlobalInit::init_flag_;
std::unique_ptr<CurlGlobalInit> CurlGlobalInit::instance_;

CurlGlobalInit::CurlGlobalInit() {
    curl_global_init(CURL_GLOBAL_ALL);
}

CurlGlobalInit::~CurlGlobalInit() {
    curl_global_cleanup();
}

CurlGlobalInit& CurlGlobalInit::instance() {
    std::call_once(init_flag_, []() {
        instance_ = std::unique_ptr<CurlGlobalInit>(new CurlGlobalInit());
    });
    return *instance_;
}

namespace {

struct UploadState {
    const std::string* payload;
    size_t offset;
};

size_t read_callback(char* buffer, size_t size, size_t nitems, void* userp) {
    auto* state = static_cast<UploadState*>(userp);
    size_t room = size * nitems;
    size_t left = state->payload->size() - state->offset;
    size_t n = left < room ? left : room;
    if (n > 0) {
        std::memcpy(buffer, state->payload->data() + state->offset, n);
        state->offset += n;
    }
    return n;
}

std::string rfc2822_date() {
    std::time_t t = std::time(nullptr);
    std::tm tm_buf{};
    localtime_r(&t, &tm_buf);
    char out[64];
    std::strftime(out, sizeof(out), "%a, %d %b %Y %H:%M:%S %z", &tm_buf);
    return out;
}

std::string make_boundary() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::ostringstream oss;
    oss << "gamesentry-" << std::hex << gen();
    return oss.str();
}

// Body lines must end in CRLF
std::string to_crlf(const std::string& text) {
    std::string out;
    out.reserve(text.size() + text.size() / 40);
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\n' && (i == 0 || text[i - 1] != '\r')) {
            out += "\r\n";
        } else {
            out += text[i];
        }
    }
    return out;
}

} // namespace

std::string Mailer::build_payload(const MailMessage& message, const std::string& date,
                                  const std::string& boundary) {
    std::ostringstream out;
    out << "Date: " << date << "\r\n";
    out << "From: " << message.from << "\r\n";
    out << "To: ";
    for (size_t i = 0; i < message.to.size(); ++i) {
        if (i > 0) out << ", ";
        out << message.to[i];
    }
    out << "\r\n";
    out << "Subject: " << message.subject << "\r\n";
    out << "MIME-Version: 1.0\r\n";

    if (message.html_body.empty()) {
        out << "Content-Type: text/plain; charset=utf-8\r\n";
        out << "\r\n";
        out << to_crlf(message.text_body) << "\r\n";
        return out.str();
    }

    out << "Content-Type: multipart/alternative; boundary=\"" << boundary << "\"\r\n";
    out << "\r\n";
    out << "--" << boundary << "\r\n";
    out << "Content-Type: text/plain; charset=utf-8\r\n\r\n";
    out << to_crlf(message.text_body) << "\r\n";
    out << "--" << boundary << "\r\n";
    out << "Content-Type: text/html; charset=utf-8\r\n\r\n";
    out << to_crlf(message.html_body) << "\r\n";
    out << "--" << boundary << "--\r\n";
    return out.str();
}

Mailer::Mailer() {
    CurlGlobalInit::instance();
    curl_ = curl_easy_init();
    if (!curl_) {
        throw std::runtime_error("Failed to initialize CURL handle");
    }
}

Mailer::~Mailer() {
    if (curl_) {
        curl_easy_cleanup(static_cast<CURL*>(curl_));
        curl_ = nullptr;
    }
}

MailResult Mailer::send(const EmailSettings& settings, const MailMessage& message,
                        int timeout_seconds) {
    std::lock_guard<std::mutex> lock(mutex_);

    MailResult result;
    if (message.to.empty()) {
        result.error_message = "No recipients";
        return result;
    }

    CURL* curl = static_cast<CURL*>(curl_);
    curl_easy_reset(curl);

    std::string payload = build_payload(message, rfc2822_date(), make_boundary());
    UploadState upload{&payload, 0};
    std::string from = "<" + message.from + ">";

    struct curl_slist* recipients = nullptr;
    for (const auto& rcpt : message.to) {
        recipients = curl_slist_append(recipients, ("<" + rcpt + ">").c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, settings.smtp_url.c_str());
    curl_easy_setopt(curl, CURLOPT_USERNAME, settings.address.c_str());
    curl_easy_setopt(curl, CURLOPT_PASSWORD, settings.password.c_str());
    curl_easy_setopt(curl, CURLOPT_USE_SSL, static_cast<long>(CURLUSESSL_ALL));
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl, CURLOPT_MAIL_FROM, from.c_str());
    curl_easy_setopt(curl, CURLOPT_MAIL_RCPT, recipients);
    curl_easy_setopt(curl, CURLOPT_READFUNCTION, read_callback);
    curl_easy_setopt(curl, CURLOPT_READDATA, &upload);
    curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeout_seconds));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);
    curl_slist_free_all(recipients);

    result.curl_code = static_cast<int>(res);
    if (res != CURLE_OK) {
        result.error_message = curl_easy_strerror(res);
        return result;
    }

    result.success = true;
    return result;
}

} // namespace gamesentry
