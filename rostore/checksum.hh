/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <iterator>
#include <memory>
#include <string_view>

#include "rostore/types.hh"

namespace rostore {

enum class checksum_type {
    adler32,
    crc32,
    md5,
    none,
};

// Names accepted in the "checksum.type" option, indexed by checksum_type.
static constexpr std::string_view checksum_type_names[] = {
    "adler32",
    "crc32",
    "md5",
    "none",
};
static_assert(std::size(checksum_type_names) == int(checksum_type::none) + 1);
static_assert(checksum_type_names[int(checksum_type::adler32)] == "adler32");
static_assert(checksum_type_names[int(checksum_type::crc32)] == "crc32");
static_assert(checksum_type_names[int(checksum_type::md5)] == "md5");
static_assert(checksum_type_names[int(checksum_type::none)] == "none");

// Case-insensitive. Throws exceptions::configuration_exception for unknown names.
checksum_type checksum_type_from_name(std::string_view name);
std::string_view checksum_type_to_name(checksum_type t);

/**
 * Streaming digest over a byte stream.
 *
 * Instances are single-use: after digest() the state is unspecified and
 * the accumulator must not be updated again.
 */
class checksum {
public:
    virtual ~checksum() {}

    virtual void update(const_bytes data) = 0;

    /**
     * Returns the raw digest bytes. The 32-bit algorithms (adler32, crc32)
     * produce their value in big-endian order.
     */
    virtual bytes digest() = 0;

    virtual checksum_type type() const = 0;

    std::string_view name() const {
        return checksum_type_to_name(type());
    }

    // Returns nullptr for checksum_type::none.
    static std::unique_ptr<checksum> create(checksum_type);
};

} // namespace rostore
