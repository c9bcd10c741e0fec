/*
 * profile_store.h - Persistence contract used by the session enforcer
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#pragma once

#include <string>
#include <optional>
#include "gamesentry/common.h"

namespace gamesentry {

// Implementations may fail by returning false/nullopt or by throwing
// std::exception; the enforcer tolerates both.
class ProfileStore {
public:
    virtual ~ProfileStore() = default;

    // Unknown children get a default (unlimited) config
    virtual LimitConfig get_limit_config(const std::string& child_id) = 0;

    // Returns the new log id
    virtual std::optional<int64_t> append_session_log(const SessionLog& entry) = 0;
    virtual bool update_session_log(int64_t id, const SessionLogUpdate& fields) = 0;
    virtual bool delete_session_log(int64_t id) = 0;

    // Sum of closed logs of that child whose start falls on the given local day
    virtual Seconds get_todays_accumulated(const std::string& child_id, const LocalDate& date) = 0;

    // Records that a running session was still alive at the given time
    virtual bool checkpoint_session_log(int64_t id, Timestamp at) {
        (void)id;
        (void)at;
        return true;
    }

    // Moves whenever another writer changed the stored data. nullopt when the
    // backend cannot tell, in which case only recompute_accumulated() resyncs.
    virtual std::optional<int64_t> change_marker() { return std::nullopt; }
};

} // namespace gamesentry
