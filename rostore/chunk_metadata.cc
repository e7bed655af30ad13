/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <cstdlib>

#include <seastar/core/byteorder.hh>
#include <seastar/core/print.hh>

#include "rostore/chunk_metadata.hh"
#include "rostore/exceptions.hh"
#include "utils/log.hh"

static logging::logger mdlogger("chunk_metadata");

namespace rostore {

template <typename T>
static T read_be_at(const_bytes b, size_t pos) {
    return seastar::read_be<T>(reinterpret_cast<const char*>(b.data()) + pos);
}

value_record value_record::parse(const_bytes raw, bool save_keys) {
    const size_t header_size = 2 * sizeof(uint32_t) + (save_keys ? sizeof(uint8_t) : 0);
    if (raw.size() < header_size) {
        throw malformed_record_exception(fmt::format("Record of {} bytes is shorter than its {} byte header", raw.size(), header_size));
    }
    value_record rec;
    rec.node_id = read_be_at<uint32_t>(raw, 0);
    rec.partition_id = read_be_at<uint32_t>(raw, sizeof(uint32_t));
    if (save_keys) {
        rec.replica_type = uint8_t(raw[2 * sizeof(uint32_t)]);
    }
    rec.payload = raw.subspan(header_size);

    if (save_keys) {
        constexpr size_t tuple_header = 2 * sizeof(uint32_t);
        if (rec.payload.size() < tuple_header) {
            throw malformed_record_exception(fmt::format("Key/value tuple of {} bytes is shorter than its header", rec.payload.size()));
        }
        uint64_t key_len = read_be_at<uint32_t>(rec.payload, 0);
        uint64_t value_len = read_be_at<uint32_t>(rec.payload, sizeof(uint32_t));
        if (tuple_header + key_len + value_len != rec.payload.size()) {
            throw malformed_record_exception(fmt::format("Key/value tuple declares key_len={} value_len={} but carries {} bytes",
                    key_len, value_len, rec.payload.size() - tuple_header));
        }
    }
    return rec;
}

uint32_t chunk_for_digest(const_bytes digest, uint32_t num_chunks) {
    if (digest.size() < sizeof(int32_t)) {
        throw malformed_record_exception(fmt::format("Digest of {} bytes is too short to pick a chunk", digest.size()));
    }
    int64_t v = read_be_at<int32_t>(digest, 0);
    return uint32_t(std::abs(v % int64_t(num_chunks)));
}

sstring chunk_file_prefix(const chunk_metadata& md, bool save_keys) {
    if (save_keys) {
        return seastar::format("{}_{}_{}", md.partition_id, int(md.replica_type.value_or(0)), md.chunk_id);
    }
    return seastar::format("{}_{}", md.partition_id, md.chunk_id);
}

const chunk_metadata& metadata_resolver::resolve(const value_record& rec, const_bytes digest) {
    if (!_metadata) {
        _metadata.emplace(chunk_metadata{
            .node_id = rec.node_id,
            .partition_id = rec.partition_id,
            .chunk_id = chunk_for_digest(digest, _num_chunks),
            .replica_type = _save_keys ? rec.replica_type : std::nullopt,
        });
        mdlogger.debug("Resolved {}, replica type {}", *_metadata,
                _metadata->replica_type ? fmt::to_string(int(*_metadata->replica_type)) : "n/a");
        return *_metadata;
    }
    if (_validate) {
        bool mismatch = rec.node_id != _metadata->node_id
                || rec.partition_id != _metadata->partition_id
                || (_save_keys && rec.replica_type != _metadata->replica_type);
        if (mismatch) {
            throw inconsistent_metadata_exception(fmt::format("Record for node {}, partition {} delivered to task building {}",
                    rec.node_id, rec.partition_id, *_metadata));
        }
    }
    return *_metadata;
}

} // namespace rostore
