/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <exception>
#include <string>

namespace rostore {

// Base of every error that aborts a chunk building task.
class chunk_build_exception : public std::exception {
    std::string _msg;
public:
    explicit chunk_build_exception(std::string msg) noexcept
        : _msg(std::move(msg))
    {}
    const char* what() const noexcept override {
        return _msg.c_str();
    }
};

// More than one record under a digest while original keys are discarded.
class duplicate_key_exception : public chunk_build_exception {
public:
    using chunk_build_exception::chunk_build_exception;
};

// Too many records under one digest for the 16-bit group count.
class collision_overflow_exception : public chunk_build_exception {
public:
    using chunk_build_exception::chunk_build_exception;
};

// The data file would grow past what a 32-bit signed position can address.
class chunk_offset_overflow_exception : public chunk_build_exception {
public:
    using chunk_build_exception::chunk_build_exception;
};

class inconsistent_metadata_exception : public chunk_build_exception {
public:
    using chunk_build_exception::chunk_build_exception;
};

class checksum_unavailable_exception : public chunk_build_exception {
public:
    using chunk_build_exception::chunk_build_exception;
};

// Wraps (as a nested exception) the underlying I/O error.
class storage_io_exception : public chunk_build_exception {
public:
    using chunk_build_exception::chunk_build_exception;
};

class malformed_record_exception : public chunk_build_exception {
public:
    using chunk_build_exception::chunk_build_exception;
};

class unsorted_input_exception : public chunk_build_exception {
public:
    using chunk_build_exception::chunk_build_exception;
};

class group_too_large_exception : public chunk_build_exception {
public:
    using chunk_build_exception::chunk_build_exception;
};

} // namespace rostore
