/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <seastar/core/iostream.hh>
#include <seastar/core/sstring.hh>

#include "rostore/types.hh"
#include "seastarx.hh"

namespace rostore {

class checksum;

// Synchronous wrapper over an output_stream. Must be used from a seastar::thread.
class file_writer {
    output_stream<char> _out;
    sstring _filename;
    uint64_t _offset = 0;
    bool _closed = false;
public:
    file_writer(output_stream<char>&& out, sstring filename) noexcept
        : _out(std::move(out))
        , _filename(std::move(filename))
    {}

    file_writer(const file_writer&) = delete;
    file_writer& operator=(const file_writer&) = delete;
    // Closes the stream if the owner did not; errors are logged, not thrown.
    virtual ~file_writer();

    virtual void write(const char* buf, size_t n);
    void write(const_bytes b) {
        write(reinterpret_cast<const char*>(b.data()), b.size());
    }
    // Flushes and closes. The first failure is rethrown after both were attempted.
    void close();

    uint64_t offset() const noexcept {
        return _offset;
    }
    const sstring& get_filename() const noexcept {
        return _filename;
    }
    bool is_closed() const noexcept {
        return _closed;
    }
};

// Feeds every byte written to the file into a checksum accumulator.
class checksummed_file_writer : public file_writer {
    checksum& _checksum;
public:
    checksummed_file_writer(output_stream<char>&& out, sstring filename, checksum& c) noexcept
        : file_writer(std::move(out), std::move(filename))
        , _checksum(c)
    {}

    void write(const char* buf, size_t n) override;
    using file_writer::write;
};

} // namespace rostore
