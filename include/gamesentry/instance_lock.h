/*
 * instance_lock.h - Named advisory lock that keeps a second instance from running
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#pragma once

#include <string>

namespace gamesentry {

class InstanceLock {
public:
    // Lock file lives in $XDG_RUNTIME_DIR, falling back to /tmp
    explicit InstanceLock(const std::string& name = "gamesentry");
    ~InstanceLock();

    InstanceLock(const InstanceLock&) = delete;
    InstanceLock& operator=(const InstanceLock&) = delete;

    // Non-blocking. False when another process holds the lock or the file cannot be opened.
    bool try_acquire();
    void release();

    bool is_held() const { return fd_ >= 0; }
    const std::string& path() const { return path_; }
    const std::string& last_error() const { return last_error_; }

    static std::string lock_path(const std::string& name);

private:
    std::string path_;
    std::string last_error_;
    int fd_ = -1;
};

} // namespace gamesentry
