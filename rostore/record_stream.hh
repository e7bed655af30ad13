/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <optional>

#include <seastar/core/iostream.hh>

#include "rostore/chunk_writer.hh"
#include "seastarx.hh"

namespace rostore {

/**
 * Reads the output of the sort stage as a sequence of key groups.
 *
 * Stream format, integers big-endian:
 *
 *   { [digest: digest_size bytes][record_len:uint32][record] }*
 *
 * Consecutive entries with equal digests form one group. Ordering is not
 * checked here; chunk_writer rejects out of order digests.
 *
 * Must run in a seastar::thread.
 */
class record_stream_reader {
    input_stream<char> _in;
    size_t _digest_size;
    std::optional<key_group> _pending;
    bool _eof = false;
public:
    record_stream_reader(input_stream<char>&& in, size_t digest_size) noexcept
        : _in(std::move(in))
        , _digest_size(digest_size)
    {}

    // Returns std::nullopt at the end of the stream.
    std::optional<key_group> next_group();

    void close();
private:
    // A group holding a single record, or std::nullopt at the end of the stream.
    std::optional<key_group> read_entry();
    bytes read_exactly(size_t n, const char* what);
};

} // namespace rostore
