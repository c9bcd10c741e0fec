/*
 * src/clock.cpp - System clock
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#include "gamesentry/clock.h"

namespace gamesentry {

Timestamp SystemClock::now() const {
    return std::chrono::system_clock::now();
}

MonoTime SystemClock::monotonic_now() const {
    return std::chrono::steady_clock::now();
}

} // namespace gamesentry
