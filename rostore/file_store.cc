/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <filesystem>

#include <fmt/format.h>
#include <seastar/core/coroutine.hh>
#include <seastar/core/fstream.hh>
#include <seastar/core/seastar.hh>

#include "rostore/file_store.hh"
#include "rostore/exceptions.hh"
#include "utils/log.hh"

static logging::logger fslogger("file_store");

namespace rostore {

future<output_stream<char>> local_file_store::create(sstring path) {
    try {
        auto f = co_await open_file_dma(path, open_flags::wo | open_flags::create | open_flags::truncate);
        file_output_stream_options options;
        options.buffer_size = _buffer_size;
        options.write_behind = 4;
        fslogger.trace("Created {}", path);
        co_return co_await make_file_output_stream(std::move(f), options);
    } catch (...) {
        std::throw_with_nested(storage_io_exception(fmt::format("Failed to create {}", path)));
    }
}

future<> local_file_store::rename(sstring from, sstring to) {
    try {
        co_await rename_file(from, to);
        // Make the new directory entry durable before reporting success.
        auto dir = std::filesystem::path(std::string(to)).parent_path();
        co_await sync_directory(dir.empty() ? "." : dir.native());
    } catch (...) {
        std::throw_with_nested(storage_io_exception(fmt::format("Failed to rename {} to {}", from, to)));
    }
}

future<> local_file_store::make_directory(sstring path) {
    try {
        co_await recursive_touch_directory(path);
    } catch (...) {
        std::throw_with_nested(storage_io_exception(fmt::format("Failed to create directory {}", path)));
    }
}

} // namespace rostore
