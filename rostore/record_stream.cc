/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <algorithm>
#include <utility>

#include <fmt/format.h>

#include <seastar/core/byteorder.hh>

#include "rostore/record_stream.hh"
#include "rostore/exceptions.hh"

namespace rostore {

bytes record_stream_reader::read_exactly(size_t n, const char* what) {
    auto buf = _in.read_exactly(n).get();
    if (buf.size() != n) {
        throw malformed_record_exception(fmt::format("Truncated input: expected {} bytes of {}, got {}", n, what, buf.size()));
    }
    auto b = std::as_bytes(std::span(buf.get(), buf.size()));
    return bytes(b.begin(), b.end());
}

std::optional<key_group> record_stream_reader::read_entry() {
    if (_eof) {
        return std::nullopt;
    }
    auto digest_buf = _in.read_exactly(_digest_size).get();
    if (digest_buf.empty()) {
        _eof = true;
        return std::nullopt;
    }
    if (digest_buf.size() != _digest_size) {
        throw malformed_record_exception(fmt::format("Truncated input: expected a {} byte digest, got {} bytes", _digest_size, digest_buf.size()));
    }
    auto digest = std::as_bytes(std::span(digest_buf.get(), digest_buf.size()));
    auto len_buf = read_exactly(sizeof(uint32_t), "record length");
    auto len = seastar::read_be<uint32_t>(reinterpret_cast<const char*>(len_buf.data()));

    key_group entry;
    entry.digest.assign(digest.begin(), digest.end());
    entry.records.push_back(read_exactly(len, "record"));
    return entry;
}

std::optional<key_group> record_stream_reader::next_group() {
    std::optional<key_group> group = std::exchange(_pending, std::nullopt);
    if (!group) {
        group = read_entry();
        if (!group) {
            return std::nullopt;
        }
    }
    while (auto next = read_entry()) {
        if (!std::ranges::equal(next->digest, group->digest)) {
            _pending = std::move(next);
            break;
        }
        group->records.push_back(std::move(next->records.front()));
    }
    return group;
}

void record_stream_reader::close() {
    _in.close().get();
}

} // namespace rostore
