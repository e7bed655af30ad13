/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <seastar/core/future.hh>
#include <seastar/core/iostream.hh>
#include <seastar/core/sstring.hh>

#include "seastarx.hh"

namespace rostore {

/**
 * The durable namespace chunk files are built in and published to.
 *
 * All failures surface as storage_io_exception, with the underlying error
 * nested.
 */
class file_store {
public:
    virtual ~file_store() = default;

    // Creates (or truncates) a file for sequential writing.
    virtual future<output_stream<char>> create(sstring path) = 0;

    // Atomically replaces `to` with `from`. Concurrent renames onto the same
    // target are allowed; the last one wins.
    virtual future<> rename(sstring from, sstring to) = 0;

    // Creates the directory and any missing parents. Succeeds if it already
    // exists, including when another task creates it concurrently.
    virtual future<> make_directory(sstring path) = 0;
};

class local_file_store final : public file_store {
    size_t _buffer_size;
public:
    static constexpr size_t default_buffer_size = 128 * 1024;

    explicit local_file_store(size_t buffer_size = default_buffer_size) noexcept
        : _buffer_size(buffer_size)
    {}

    future<output_stream<char>> create(sstring path) override;
    future<> rename(sstring from, sstring to) override;
    future<> make_directory(sstring path) override;
};

} // namespace rostore
