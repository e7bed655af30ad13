/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <cstdint>
#include <limits>
#include <map>

#include <seastar/core/sstring.hh>

#include "rostore/checksum.hh"
#include "seastarx.hh"

namespace rostore {

/**
 * Per-task options of a chunk build, parsed from a string option map.
 * Unknown options and malformed values are rejected with
 * exceptions::configuration_exception.
 */
class builder_config {
public:
    static const sstring SAVE_KEYS;
    static const sstring CHECKSUM_TYPE;
    static const sstring NUM_CHUNKS;
    static const sstring FINAL_OUTPUT_DIR;
    static const sstring TASK_OUTPUT_DIR;
    static const sstring TASK_ID;
    static const sstring STORE_NAME;
    static const sstring MAX_GROUP_BYTES;
    static const sstring VALIDATE_METADATA;

    // Digest width when original keys are discarded (a full MD5) or kept (its first half).
    static constexpr size_t DIGEST_SIZE_WITHOUT_KEYS = 16;
    static constexpr size_t DIGEST_SIZE_WITH_KEYS = 8;
    static constexpr uint64_t DEFAULT_MAX_GROUP_BYTES = std::numeric_limits<int32_t>::max();
private:
    std::map<sstring, sstring> _raw_options;
    bool _save_keys = false;
    checksum_type _checksum_type = checksum_type::none;
    uint32_t _num_chunks = 0;
    sstring _final_output_dir;
    sstring _task_output_dir;
    sstring _task_id;
    sstring _store_name;
    uint64_t _max_group_bytes = DEFAULT_MAX_GROUP_BYTES;
    bool _validate_metadata = false;
public:
    explicit builder_config(const std::map<sstring, sstring>& options);

    bool save_keys() const { return _save_keys; }
    checksum_type get_checksum_type() const { return _checksum_type; }
    uint32_t num_chunks() const { return _num_chunks; }
    const sstring& final_output_dir() const { return _final_output_dir; }
    const sstring& task_output_dir() const { return _task_output_dir; }
    const sstring& task_id() const { return _task_id; }
    const sstring& store_name() const { return _store_name; }
    uint64_t max_group_bytes() const { return _max_group_bytes; }
    bool validate_metadata() const { return _validate_metadata; }

    size_t digest_size() const {
        return _save_keys ? DIGEST_SIZE_WITH_KEYS : DIGEST_SIZE_WITHOUT_KEYS;
    }

    // "{task.output.dir}/{store.name}.{task.id}{suffix}"
    sstring temp_path(std::string_view suffix) const;
    sstring temp_index_path() const { return temp_path(".index"); }
    sstring temp_data_path() const { return temp_path(".data"); }

    const std::map<sstring, sstring>& get_options() const {
        return _raw_options;
    }
};

} // namespace rostore
