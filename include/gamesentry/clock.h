/*
 * clock.h - Wall and monotonic time source
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#pragma once

#include "gamesentry/time_utils.h"

namespace gamesentry {

// Wall time drives allowed hours and day boundaries; monotonic time drives
// continuous-play and break measurement so clock adjustments cannot shorten them.
class Clock {
public:
    virtual ~Clock() = default;

    virtual Timestamp now() const = 0;
    virtual MonoTime monotonic_now() const = 0;

    virtual Seconds monotonic_elapsed(MonoTime since) const {
        auto elapsed = std::chrono::duration_cast<Seconds>(monotonic_now() - since);
        return elapsed.count() < 0 ? Seconds(0) : elapsed;
    }
};

class SystemClock : public Clock {
public:
    Timestamp now() const override;
    MonoTime monotonic_now() const override;
};

} // namespace gamesentry
