/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <set>
#include <stdexcept>
#include <string>

#include <fmt/format.h>
#include <seastar/core/print.hh>

#include "rostore/builder_config.hh"
#include "exceptions/exceptions.hh"

namespace rostore {

const sstring builder_config::SAVE_KEYS = "save_keys";
const sstring builder_config::CHECKSUM_TYPE = "checksum.type";
const sstring builder_config::NUM_CHUNKS = "num_chunks";
const sstring builder_config::FINAL_OUTPUT_DIR = "final.output.dir";
const sstring builder_config::TASK_OUTPUT_DIR = "task.output.dir";
const sstring builder_config::TASK_ID = "task.id";
const sstring builder_config::STORE_NAME = "store.name";
const sstring builder_config::MAX_GROUP_BYTES = "max_group_bytes";
const sstring builder_config::VALIDATE_METADATA = "validate_metadata";

static bool parse_bool(const sstring& name, const sstring& v) {
    if (v == "true" || v == "1") {
        return true;
    }
    if (v == "false" || v == "0") {
        return false;
    }
    throw exceptions::configuration_exception(fmt::format("Invalid boolean value {} for {}", v, name));
}

static uint64_t parse_unsigned(const sstring& name, const sstring& v, uint64_t min, uint64_t max) {
    uint64_t result;
    size_t consumed = 0;
    try {
        if (v.empty() || v[0] == '-') {
            throw std::invalid_argument("not an unsigned integer");
        }
        result = std::stoull(std::string(v), &consumed);
    } catch (const std::exception&) {
        throw exceptions::configuration_exception(fmt::format("Invalid integer value {} for {}", v, name));
    }
    if (consumed != v.size()) {
        throw exceptions::configuration_exception(fmt::format("Invalid integer value {} for {}", v, name));
    }
    if (result < min || result > max) {
        throw exceptions::configuration_exception(fmt::format("{} must be between {} and {}, got {}", name, min, max, result));
    }
    return result;
}

builder_config::builder_config(const std::map<sstring, sstring>& options)
    : _raw_options(options)
{
    std::set<sstring> used_options;
    auto get_option = [&options, &used_options] (const sstring& x) -> const sstring* {
        used_options.insert(x);
        if (auto it = options.find(x); it != options.end()) {
            return &it->second;
        }
        return nullptr;
    };
    auto get_required = [&get_option] (const sstring& x) -> const sstring& {
        auto v = get_option(x);
        if (!v || v->empty()) {
            throw exceptions::configuration_exception(fmt::format("Missing required option '{}'.", x));
        }
        return *v;
    };

    if (auto v = get_option(SAVE_KEYS)) {
        _save_keys = parse_bool(SAVE_KEYS, *v);
    }
    if (auto v = get_option(CHECKSUM_TYPE)) {
        _checksum_type = checksum_type_from_name(*v);
    }
    _num_chunks = parse_unsigned(NUM_CHUNKS, get_required(NUM_CHUNKS), 1, std::numeric_limits<int32_t>::max());
    _final_output_dir = get_required(FINAL_OUTPUT_DIR);
    _task_output_dir = get_required(TASK_OUTPUT_DIR);
    _task_id = get_required(TASK_ID);
    _store_name = get_required(STORE_NAME);
    if (auto v = get_option(MAX_GROUP_BYTES)) {
        _max_group_bytes = parse_unsigned(MAX_GROUP_BYTES, *v, 1, DEFAULT_MAX_GROUP_BYTES);
    }
    if (auto v = get_option(VALIDATE_METADATA)) {
        _validate_metadata = parse_bool(VALIDATE_METADATA, *v);
    }

    for (const auto& o : options) {
        if (!used_options.contains(o.first)) {
            throw exceptions::configuration_exception(fmt::format("Unknown chunk builder option '{}'.", o.first));
        }
    }
}

sstring builder_config::temp_path(std::string_view suffix) const {
    return seastar::format("{}/{}.{}{}", _task_output_dir, _store_name, _task_id, suffix);
}

} // namespace rostore
