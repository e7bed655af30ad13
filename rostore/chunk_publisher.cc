/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <seastar/core/print.hh>

#include "rostore/chunk_publisher.hh"
#include "rostore/exceptions.hh"
#include "rostore/file_store.hh"
#include "rostore/file_writer.hh"
#include "utils/log.hh"

static logging::logger cplogger("chunk_publisher");

namespace rostore {

sstring chunk_publisher::node_dir(uint32_t node_id) const {
    return seastar::format("{}/node-{}", _output_dir, node_id);
}

std::optional<published_chunk> chunk_publisher::publish(sealed_chunk&& chunk) {
    if (!chunk.metadata) {
        cplogger.info("No records were read for {}, nothing to publish", chunk.temp_index_path);
        return std::nullopt;
    }
    const auto& md = *chunk.metadata;
    if (chunk.save_keys && !md.replica_type) {
        throw inconsistent_metadata_exception(fmt::format("Could not read the replica type for {}", md));
    }

    published_chunk result{
        .metadata = md,
        .node_dir = node_dir(md.node_id),
    };
    auto prefix = chunk_file_prefix(md, chunk.save_keys);
    result.index_path = seastar::format("{}/{}.index", result.node_dir, prefix);
    result.data_path = seastar::format("{}/{}.data", result.node_dir, prefix);

    _store.make_directory(result.node_dir).get();

    if (chunk.checksum_kind != checksum_type::none) {
        if (!chunk.index_checksum || !chunk.data_checksum) {
            throw checksum_unavailable_exception(fmt::format("Missing {} checksum accumulator for {}",
                    checksum_type_to_name(chunk.checksum_kind), md));
        }
        stage_checksum(chunk.temp_index_checksum_path, *chunk.index_checksum);
        stage_checksum(chunk.temp_data_checksum_path, *chunk.data_checksum);
        result.index_checksum_path = result.index_path + ".checksum";
        result.data_checksum_path = result.data_path + ".checksum";
        move(chunk.temp_index_checksum_path, *result.index_checksum_path);
        move(chunk.temp_data_checksum_path, *result.data_checksum_path);
    }

    move(chunk.temp_index_path, result.index_path);
    move(chunk.temp_data_path, result.data_path);
    return result;
}

void chunk_publisher::stage_checksum(const sstring& temp_path, checksum& c) {
    auto digest = c.digest();
    cplogger.debug("Staging {} checksum {} in {}", c.name(), to_hex(digest), temp_path);
    file_writer w(_store.create(temp_path).get(), temp_path);
    w.write(digest);
    w.close();
}

void chunk_publisher::move(const sstring& from, const sstring& to) {
    cplogger.info("Moving {} to {}", from, to);
    _store.rename(from, to).get();
}

} // namespace rostore
