/*
 * src/instance_lock.cpp - Named advisory lock that keeps a second instance from running
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#include "gamesentry/instance_lock.h"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace gamesentry {

std::string InstanceLock::lock_path(const std::string& name) {
    const char* runtime_dir = std::getenv("XDG_RUNTIME_DIR");
    std::string dir = (runtime_dir && *runtime_dir) ? runtime_dir : "/tmp";
    return dir + "/" + name + ".lock";
}

InstanceLock::InstanceLock(const std::string& name) : path_(lock_path(name)) {}

InstanceLock::~InstanceLock() {
    release();
}

bool InstanceLock::try_acquire() {
    if (fd_ >= 0) return true;

    int fd = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
    if (fd < 0) {
        last_error_ = "Cannot open " + path_ + ": " + std::strerror(errno);
        return false;
    }

    if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
        if (errno == EWOULDBLOCK) {
            last_error_ = "Another instance is already running";
        } else {
            last_error_ = "Cannot lock " + path_ + ": " + std::strerror(errno);
        }
        ::close(fd);
        return false;
    }

    // Record the owner for whoever inspects the file
    std::string pid = std::to_string(::getpid()) + "\n";
    if (::ftruncate(fd, 0) != 0 || ::write(fd, pid.data(), pid.size()) < 0) {
        last_error_ = "Cannot write pid to " + path_ + ": " + std::strerror(errno);
    }

    fd_ = fd;
    return true;
}

void InstanceLock::release() {
    if (fd_ < 0) return;
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
    fd_ = -1;
}

} // namespace gamesentry
