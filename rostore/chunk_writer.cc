/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <algorithm>
#include <array>
#include <compare>
#include <limits>
#include <stdexcept>

#include <seastar/core/byteorder.hh>
#include <seastar/core/print.hh>

#include "rostore/chunk_writer.hh"
#include "rostore/exceptions.hh"
#include "rostore/file_store.hh"
#include "utils/log.hh"

static logging::logger cwlogger("chunk_writer");

namespace rostore {

chunk_writer::chunk_writer(builder_config cfg, file_store& store, collision_stats& stats, running_offset start)
    : _cfg(std::move(cfg))
    , _store(store)
    , _stats(stats)
    , _metadata(_cfg.save_keys(), _cfg.num_chunks(), _cfg.validate_metadata())
    , _index_checksum(checksum::create(_cfg.get_checksum_type()))
    , _data_checksum(checksum::create(_cfg.get_checksum_type()))
    , _position(start)
{
    _store.make_directory(_cfg.task_output_dir()).get();
    _index_writer = make_writer(_cfg.temp_index_path(), _index_checksum.get());
    _data_writer = make_writer(_cfg.temp_data_path(), _data_checksum.get());
    cwlogger.info("Opening {} and {} for writing.", _index_writer->get_filename(), _data_writer->get_filename());
}

std::unique_ptr<file_writer> chunk_writer::make_writer(const sstring& path, checksum* c) {
    auto out = _store.create(path).get();
    if (c) {
        return std::make_unique<checksummed_file_writer>(std::move(out), path, *c);
    }
    return std::make_unique<file_writer>(std::move(out), path);
}

sstring chunk_writer::describe_chunk() const {
    if (auto& md = _metadata.get()) {
        return seastar::format("{}", *md);
    }
    return seastar::format("unresolved chunk of task {}", _cfg.task_id());
}

void chunk_writer::check_digest(const_bytes digest) const {
    if (digest.size() != _cfg.digest_size()) {
        throw malformed_record_exception(fmt::format("Expected a {} byte digest, got {} bytes ({}) in {}",
                _cfg.digest_size(), digest.size(), to_hex(digest), describe_chunk()));
    }
    if (!_last_digest) {
        return;
    }
    auto cmp = std::lexicographical_compare_three_way(digest.begin(), digest.end(), _last_digest->begin(), _last_digest->end());
    if (cmp > 0) {
        return;
    }
    if (cmp == 0 && !_cfg.save_keys()) {
        throw duplicate_key_exception(fmt::format("Duplicate keys detected for digest {} in {}", to_hex(digest), describe_chunk()));
    }
    throw unsorted_input_exception(fmt::format("Digest {} delivered after {} in {}",
            to_hex(digest), to_hex(*_last_digest), describe_chunk()));
}

void chunk_writer::append_to_group(const_bytes b) {
    if (b.size() > _cfg.max_group_bytes() - _group_buf.size()) {
        throw group_too_large_exception(fmt::format("Records under one digest exceed {} bytes in {}", _cfg.max_group_bytes(), describe_chunk()));
    }
    _group_buf.insert(_group_buf.end(), b.begin(), b.end());
}

// Fills _group_buf with the group's data entry, minus the count prefix.
uint64_t chunk_writer::assemble_group(const key_group& group) {
    _group_buf.clear();
    uint64_t group_size = 0;
    for (const auto& raw : group.records) {
        auto rec = value_record::parse(raw, _cfg.save_keys());
        _metadata.resolve(rec, group.digest);
        ++group_size;

        // Without the original keys the values under one digest cannot be
        // told apart at read time, whether they are true duplicates or an
        // MD5 collision.
        if (!_cfg.save_keys() && group_size > 1) {
            throw duplicate_key_exception(fmt::format("Duplicate keys detected for digest {} in {}", to_hex(group.digest), describe_chunk()));
        }
        if (group_size > max_group_size) {
            throw collision_overflow_exception(fmt::format("Found too many collisions: digest {} in {} has more than {} records",
                    to_hex(group.digest), describe_chunk(), max_group_size));
        }

        if (_cfg.save_keys()) {
            // Already a (key_len, value_len, key, value) tuple.
            append_to_group(rec.payload);
        } else {
            if (rec.payload.size() > std::numeric_limits<uint32_t>::max()) {
                throw group_too_large_exception(fmt::format("Value of {} bytes in {} is too large", rec.payload.size(), describe_chunk()));
            }
            std::array<char, sizeof(uint32_t)> len;
            seastar::write_be<uint32_t>(len.data(), uint32_t(rec.payload.size()));
            append_to_group(std::as_bytes(std::span(len)));
            append_to_group(rec.payload);
        }
    }
    if (group_size == 0) {
        throw malformed_record_exception(fmt::format("Empty group for digest {} in {}", to_hex(group.digest), describe_chunk()));
    }
    return group_size;
}

void chunk_writer::consume(const key_group& group) {
    if (_finished) {
        throw std::logic_error("chunk_writer::consume() called after consume_end_of_stream()");
    }
    if (_failed) {
        throw std::logic_error(fmt::format("chunk_writer::consume() called after a group of {} was rejected", describe_chunk()));
    }
    try {
        do_consume(group);
    } catch (...) {
        _failed = true;
        throw;
    }
}

void chunk_writer::do_consume(const key_group& group) {
    check_digest(group.digest);
    auto group_size = assemble_group(group);

    uint64_t entry_size = (_cfg.save_keys() ? sizeof(uint16_t) : 0) + _group_buf.size();
    if (!_position.can_advance(entry_size)) {
        throw chunk_offset_overflow_exception(fmt::format("Chunk overflow: data file of {} is at {} bytes and cannot take a {} byte entry without exceeding {} bytes",
                describe_chunk(), _position.value(), entry_size, running_offset::max_value));
    }
    auto position = _position.value();
    _position.advance(entry_size);

    _index_writer->write(group.digest);
    std::array<char, sizeof(uint32_t)> pos_buf;
    seastar::write_be<uint32_t>(pos_buf.data(), position);
    _index_writer->write(pos_buf.data(), pos_buf.size());

    if (_cfg.save_keys()) {
        std::array<char, sizeof(uint16_t)> count_buf;
        seastar::write_be<uint16_t>(count_buf.data(), uint16_t(group_size));
        _data_writer->write(count_buf.data(), count_buf.size());
    }
    _data_writer->write(_group_buf);

    if (group_size > 1) {
        _stats.record_group(group_size);
        cwlogger.debug("{} records under digest {} in {}", group_size, to_hex(group.digest), describe_chunk());
    }
    _last_digest = group.digest;
    ++_groups;
}

std::optional<published_chunk> chunk_writer::consume_end_of_stream() {
    if (_finished) {
        throw std::logic_error("chunk_writer::consume_end_of_stream() called twice");
    }
    _finished = true;
    if (_failed) {
        throw std::logic_error(fmt::format("Refusing to publish {} after a rejected group", describe_chunk()));
    }
    _index_writer->close();
    _data_writer->close();
    cwlogger.debug("Closed {} ({} groups) and {} ({} bytes)", _index_writer->get_filename(), _groups,
            _data_writer->get_filename(), _data_writer->offset());

    sealed_chunk sealed{
        .metadata = _metadata.get(),
        .save_keys = _cfg.save_keys(),
        .checksum_kind = _cfg.get_checksum_type(),
        .index_checksum = std::move(_index_checksum),
        .data_checksum = std::move(_data_checksum),
        .temp_index_path = _cfg.temp_index_path(),
        .temp_data_path = _cfg.temp_data_path(),
        .temp_index_checksum_path = _cfg.temp_path(".index.checksum"),
        .temp_data_checksum_path = _cfg.temp_path(".data.checksum"),
    };
    return chunk_publisher(_store, _cfg.final_output_dir()).publish(std::move(sealed));
}

} // namespace rostore
