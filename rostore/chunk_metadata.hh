/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <cstdint>
#include <optional>

#include <fmt/format.h>
#include <seastar/core/sstring.hh>

#include "rostore/types.hh"
#include "seastarx.hh"

namespace rostore {

/**
 * One value emitted by the mapping stage, as it arrives at the builder:
 *
 *   node_id:uint32 partition_id:uint32 [replica_type:uint8] payload
 *
 * All integers are big-endian. replica_type is present only when original
 * keys are kept; the payload is then exactly one
 * (key_len:uint32, value_len:uint32, key, value) tuple. Otherwise the
 * payload is the raw value.
 */
struct value_record {
    uint32_t node_id;
    uint32_t partition_id;
    std::optional<uint8_t> replica_type;
    const_bytes payload;

    // The returned payload points into `raw`.
    static value_record parse(const_bytes raw, bool save_keys);
};

struct chunk_metadata {
    uint32_t node_id;
    uint32_t partition_id;
    uint32_t chunk_id;
    std::optional<uint8_t> replica_type;

    bool operator==(const chunk_metadata&) const = default;
};

// Chunk a digest belongs to: its first four bytes, read as a signed
// big-endian integer, modulo the chunk count, made non-negative.
uint32_t chunk_for_digest(const_bytes digest, uint32_t num_chunks);

// "{partition}_{replica}_{chunk}" with saved keys, "{partition}_{chunk}" otherwise.
sstring chunk_file_prefix(const chunk_metadata& md, bool save_keys);

/**
 * Freezes the chunk identity from the first record of a task.
 *
 * Later records are trusted to belong to the same node and partition;
 * with `validate` set, a record that disagrees is rejected with
 * inconsistent_metadata_exception instead.
 */
class metadata_resolver {
    bool _save_keys;
    uint32_t _num_chunks;
    bool _validate;
    std::optional<chunk_metadata> _metadata;
public:
    metadata_resolver(bool save_keys, uint32_t num_chunks, bool validate = false) noexcept
        : _save_keys(save_keys)
        , _num_chunks(num_chunks)
        , _validate(validate)
    {}

    const chunk_metadata& resolve(const value_record& rec, const_bytes digest);

    // Disengaged until the first record was resolved.
    const std::optional<chunk_metadata>& get() const noexcept {
        return _metadata;
    }
};

} // namespace rostore

template <>
struct fmt::formatter<rostore::chunk_metadata> : fmt::formatter<std::string_view> {
    auto format(const rostore::chunk_metadata& md, fmt::format_context& ctx) const -> decltype(ctx.out()) {
        return fmt::format_to(ctx.out(), "node {}, partition {}, chunk {}", md.node_id, md.partition_id, md.chunk_id);
    }
};
