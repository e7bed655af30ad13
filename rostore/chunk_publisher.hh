/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <memory>
#include <optional>

#include <seastar/core/sstring.hh>

#include "rostore/checksum.hh"
#include "rostore/chunk_metadata.hh"
#include "seastarx.hh"

namespace rostore {

class file_store;

// A finished, closed pair of task-local files waiting to be published.
struct sealed_chunk {
    // Disengaged when the task saw no records.
    std::optional<chunk_metadata> metadata;
    bool save_keys = false;
    checksum_type checksum_kind = checksum_type::none;
    std::unique_ptr<checksum> index_checksum;
    std::unique_ptr<checksum> data_checksum;
    sstring temp_index_path;
    sstring temp_data_path;
    // Checksums are staged here and renamed into place like the data.
    sstring temp_index_checksum_path;
    sstring temp_data_checksum_path;
};

struct published_chunk {
    chunk_metadata metadata;
    sstring node_dir;
    sstring index_path;
    sstring data_path;
    std::optional<sstring> index_checksum_path;
    std::optional<sstring> data_checksum_path;
};

/**
 * Installs a sealed chunk under
 * "{output_dir}/node-{node}/{prefix}.index|.data" (and ".checksum"
 * siblings) by renaming the task-local files.
 *
 * Rename is the only publication step: speculative attempts of the same
 * chunk publish to the same names and the last rename wins. A task that
 * fails never makes anything visible under the final names.
 *
 * Must run in a seastar::thread.
 */
class chunk_publisher {
    file_store& _store;
    sstring _output_dir;
public:
    chunk_publisher(file_store& store, sstring output_dir) noexcept
        : _store(store)
        , _output_dir(std::move(output_dir))
    {}

    // Returns std::nullopt, and touches nothing, for an empty partition.
    std::optional<published_chunk> publish(sealed_chunk&& chunk);

    sstring node_dir(uint32_t node_id) const;
private:
    void stage_checksum(const sstring& temp_path, checksum& c);
    void move(const sstring& from, const sstring& to);
};

} // namespace rostore
