/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <algorithm>
#include <cstdint>

namespace rostore {

// Digest collisions seen by one task. Owned by the caller, who reads it
// once the task is done and aggregates across tasks.
struct collision_stats {
    // Groups that carried more than one record.
    uint64_t collisions = 0;
    // Largest of those groups; zero while there were none.
    uint64_t max_group_size = 0;

    void record_group(uint64_t group_size) noexcept {
        if (group_size <= 1) {
            return;
        }
        ++collisions;
        max_group_size = std::max(max_group_size, group_size);
    }
};

} // namespace rostore
