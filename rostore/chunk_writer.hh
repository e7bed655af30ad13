/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <limits>
#include <memory>
#include <optional>
#include <vector>

#include "rostore/builder_config.hh"
#include "rostore/checksum.hh"
#include "rostore/chunk_metadata.hh"
#include "rostore/chunk_publisher.hh"
#include "rostore/collision_stats.hh"
#include "rostore/file_writer.hh"
#include "rostore/running_offset.hh"
#include "rostore/types.hh"

namespace rostore {

class file_store;

// All records sharing one digest, as delivered by the sort stage.
struct key_group {
    bytes digest;
    std::vector<bytes> records;
};

/**
 * Builds the index and data files of one chunk from a digest-ordered
 * stream of key groups.
 *
 * Index file: per group, [digest][position:uint32], position being the
 * offset of the group's entry in the data file.
 *
 * Data file: per group,
 *   with saved keys:    [count:uint16] count x [key_len:uint32 value_len:uint32 key value]
 *   without saved keys: [value_len:uint32 value]
 *
 * All integers are big-endian. The files are written under task-local
 * names and published by consume_end_of_stream().
 *
 * Must run in a seastar::thread. A group that fails to be consumed fails
 * the whole chunk: later consume() and consume_end_of_stream() calls throw
 * and nothing is published. The temporary files are left for the caller
 * to reap.
 */
class chunk_writer {
    builder_config _cfg;
    file_store& _store;
    collision_stats& _stats;
    metadata_resolver _metadata;
    std::unique_ptr<checksum> _index_checksum;
    std::unique_ptr<checksum> _data_checksum;
    std::unique_ptr<file_writer> _index_writer;
    std::unique_ptr<file_writer> _data_writer;
    running_offset _position;
    // Payload of the group being assembled.
    bytes _group_buf;
    std::optional<bytes> _last_digest;
    uint64_t _groups = 0;
    bool _finished = false;
    bool _failed = false;
public:
    // The group count is stored in 16 bits.
    static constexpr uint64_t max_group_size = std::numeric_limits<uint16_t>::max();

    // `start` is the position recorded for the first data entry. Anything
    // but zero is only useful to tests of the position limit.
    chunk_writer(builder_config cfg, file_store& store, collision_stats& stats, running_offset start = running_offset());

    void consume(const key_group& group);

    // Closes the files and publishes them. Returns std::nullopt if no
    // record was consumed. Throws std::logic_error, publishing nothing,
    // if a group was rejected.
    std::optional<published_chunk> consume_end_of_stream();

    uint32_t data_offset() const noexcept {
        return _position.value();
    }
    uint64_t groups_written() const noexcept {
        return _groups;
    }
    const std::optional<chunk_metadata>& metadata() const noexcept {
        return _metadata.get();
    }
private:
    std::unique_ptr<file_writer> make_writer(const sstring& path, checksum* c);
    void check_digest(const_bytes digest) const;
    void do_consume(const key_group& group);
    uint64_t assemble_group(const key_group& group);
    void append_to_group(const_bytes b);
    sstring describe_chunk() const;
};

} // namespace rostore
