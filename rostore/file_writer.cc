/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <fmt/format.h>

#include "rostore/file_writer.hh"
#include "rostore/checksum.hh"
#include "rostore/exceptions.hh"
#include "utils/log.hh"

static logging::logger fwlogger("file_writer");

namespace rostore {

file_writer::~file_writer() {
    if (_closed) {
        return;
    }
    try {
        // close() should be called by the owner; this is an error path.
        close();
    } catch (...) {
        fwlogger.error("Failed to close {}: {}", _filename, std::current_exception());
    }
}

void file_writer::write(const char* buf, size_t n) {
    try {
        _out.write(buf, n).get();
    } catch (...) {
        std::throw_with_nested(storage_io_exception(fmt::format("Failed to write {} bytes to {} at offset {}", n, _filename, _offset)));
    }
    _offset += n;
}

void file_writer::close() {
    if (_closed) {
        return;
    }
    std::exception_ptr ex;
    try {
        _out.flush().get();
    } catch (...) {
        ex = std::current_exception();
    }
    try {
        _out.close().get();
    } catch (...) {
        if (!ex) {
            ex = std::current_exception();
        }
    }
    _closed = true;
    if (ex) {
        try {
            std::rethrow_exception(ex);
        } catch (...) {
            std::throw_with_nested(storage_io_exception(fmt::format("Failed to close {}", _filename)));
        }
    }
}

void checksummed_file_writer::write(const char* buf, size_t n) {
    file_writer::write(buf, n);
    _checksum.update(const_bytes(reinterpret_cast<const std::byte*>(buf), n));
}

} // namespace rostore
