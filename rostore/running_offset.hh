/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <cstdint>
#include <limits>

#include <fmt/format.h>

#include "rostore/exceptions.hh"

namespace rostore {

// Position in a data file as stored in index entries. Positions are read
// back as signed 32-bit integers, so the file may not grow past INT32_MAX.
class running_offset {
    uint32_t _value;
public:
    static constexpr uint64_t max_value = std::numeric_limits<int32_t>::max();

    explicit running_offset(uint32_t initial = 0) noexcept
        : _value(initial)
    {}

    uint32_t value() const noexcept {
        return _value;
    }

    bool can_advance(uint64_t n) const noexcept {
        return _value <= max_value && n <= max_value - _value;
    }

    // Leaves the offset unchanged if it would overflow.
    void advance(uint64_t n) {
        if (!can_advance(n)) {
            throw chunk_offset_overflow_exception(fmt::format("Offset {} cannot advance by {} bytes past {}", _value, n, max_value));
        }
        _value += uint32_t(n);
    }
};

} // namespace rostore
