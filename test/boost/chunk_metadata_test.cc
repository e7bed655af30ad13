/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#define BOOST_TEST_MODULE chunk_metadata
#include <boost/test/unit_test.hpp>

#include <algorithm>

#include "rostore/chunk_metadata.hh"
#include "rostore/collision_stats.hh"
#include "rostore/exceptions.hh"
#include "rostore/running_offset.hh"
#include "test/lib/chunk_test_utils.hh"

using namespace rostore;

BOOST_AUTO_TEST_CASE(test_parse_record_without_keys) {
    auto raw = tests::make_record(3, 17, std::nullopt, tests::to_bytes("value"));
    auto rec = value_record::parse(raw, false);
    BOOST_CHECK_EQUAL(rec.node_id, 3);
    BOOST_CHECK_EQUAL(rec.partition_id, 17);
    BOOST_CHECK(!rec.replica_type);
    BOOST_CHECK_EQUAL(bytes_as_string(rec.payload), "value");

    // An empty value is legal.
    auto empty = value_record::parse(tests::make_record(1, 2, std::nullopt, {}), false);
    BOOST_CHECK(empty.payload.empty());
}

BOOST_AUTO_TEST_CASE(test_parse_record_with_keys) {
    auto tuple = tests::make_tuple("key", "value");
    auto raw = tests::make_record(0x01020304, 9, 2, tuple);
    auto rec = value_record::parse(raw, true);
    BOOST_CHECK_EQUAL(rec.node_id, 0x01020304);
    BOOST_CHECK_EQUAL(rec.partition_id, 9);
    BOOST_REQUIRE(rec.replica_type);
    BOOST_CHECK_EQUAL(int(*rec.replica_type), 2);
    BOOST_CHECK(std::ranges::equal(rec.payload, tuple));
}

BOOST_AUTO_TEST_CASE(test_parse_malformed_records) {
    // Shorter than node and partition ids.
    BOOST_CHECK_THROW(value_record::parse(tests::to_bytes("1234567"), false), malformed_record_exception);
    // Missing replica type.
    BOOST_CHECK_THROW(value_record::parse(tests::make_record(1, 2, std::nullopt, {}), true), malformed_record_exception);
    // Tuple header truncated.
    BOOST_CHECK_THROW(value_record::parse(tests::make_record(1, 2, 0, tests::to_bytes("abc")), true), malformed_record_exception);
    // Tuple lengths disagree with the payload.
    auto tuple = tests::make_tuple("key", "value");
    tuple.pop_back();
    BOOST_CHECK_THROW(value_record::parse(tests::make_record(1, 2, 0, tuple), true), malformed_record_exception);
    tuple = tests::make_tuple("key", "value");
    tuple.push_back(std::byte(0));
    BOOST_CHECK_THROW(value_record::parse(tests::make_record(1, 2, 0, tuple), true), malformed_record_exception);
}

BOOST_AUTO_TEST_CASE(test_chunk_for_digest) {
    BOOST_CHECK_EQUAL(chunk_for_digest(tests::make_digest(16, 7, 0), 5), 2);
    BOOST_CHECK_EQUAL(chunk_for_digest(tests::make_digest(8, 7, 0), 1), 0);
    BOOST_CHECK_EQUAL(chunk_for_digest(tests::make_digest(16, 12, 99), 4), 0);
    // Negative heads map to non-negative chunks.
    BOOST_CHECK_EQUAL(chunk_for_digest(tests::make_digest(16, 0xffffffff, 0), 5), 1);
    BOOST_CHECK_EQUAL(chunk_for_digest(tests::make_digest(16, 0x80000000, 0), 7), 2);
    BOOST_CHECK_THROW(chunk_for_digest(tests::to_bytes("abc"), 5), malformed_record_exception);
}

BOOST_AUTO_TEST_CASE(test_chunk_file_prefix) {
    chunk_metadata md{.node_id = 1, .partition_id = 12, .chunk_id = 3, .replica_type = 1};
    BOOST_CHECK_EQUAL(chunk_file_prefix(md, true), "12_1_3");
    BOOST_CHECK_EQUAL(chunk_file_prefix(md, false), "12_3");
}

BOOST_AUTO_TEST_CASE(test_resolver_freezes_first_record) {
    metadata_resolver resolver(true, 4, false);
    BOOST_CHECK(!resolver.get());

    auto first = tests::make_record(5, 6, 1, tests::make_tuple("a", "b"));
    auto second = tests::make_record(8, 9, 0, tests::make_tuple("c", "d"));
    auto digest = tests::make_digest(8, 3, 1);
    auto other_digest = tests::make_digest(8, 2, 1);

    auto md = resolver.resolve(value_record::parse(first, true), digest);
    chunk_metadata expected{.node_id = 5, .partition_id = 6, .chunk_id = 3, .replica_type = 1};
    BOOST_CHECK(md == expected);

    // Later records, and other digests, do not change the frozen values.
    BOOST_CHECK(resolver.resolve(value_record::parse(second, true), other_digest) == expected);
    BOOST_REQUIRE(resolver.get());
    BOOST_CHECK(*resolver.get() == expected);
}

BOOST_AUTO_TEST_CASE(test_resolver_without_keys_has_no_replica) {
    metadata_resolver resolver(false, 4);
    auto raw = tests::make_record(5, 6, std::nullopt, tests::to_bytes("v"));
    auto md = resolver.resolve(value_record::parse(raw, false), tests::make_digest(16, 1, 1));
    BOOST_CHECK(!md.replica_type);
    BOOST_CHECK_EQUAL(md.chunk_id, 1);
}

BOOST_AUTO_TEST_CASE(test_resolver_validation) {
    metadata_resolver resolver(true, 4, true);
    auto digest = tests::make_digest(8, 0, 1);
    auto tuple = tests::make_tuple("k", "v");
    resolver.resolve(value_record::parse(tests::make_record(1, 2, 0, tuple), true), digest);
    // Same node, partition and replica type: accepted.
    resolver.resolve(value_record::parse(tests::make_record(1, 2, 0, tuple), true), digest);
    BOOST_CHECK_THROW(resolver.resolve(value_record::parse(tests::make_record(2, 2, 0, tuple), true), digest), inconsistent_metadata_exception);
    BOOST_CHECK_THROW(resolver.resolve(value_record::parse(tests::make_record(1, 3, 0, tuple), true), digest), inconsistent_metadata_exception);
    BOOST_CHECK_THROW(resolver.resolve(value_record::parse(tests::make_record(1, 2, 1, tuple), true), digest), inconsistent_metadata_exception);
}

BOOST_AUTO_TEST_CASE(test_running_offset_boundary) {
    running_offset offset(running_offset::max_value - 1);
    offset.advance(1);
    BOOST_CHECK_EQUAL(offset.value(), running_offset::max_value);
    BOOST_CHECK(offset.can_advance(0));
    BOOST_CHECK(!offset.can_advance(1));
    BOOST_CHECK_THROW(offset.advance(1), chunk_offset_overflow_exception);
    // A failed advance leaves the offset untouched.
    BOOST_CHECK_EQUAL(offset.value(), running_offset::max_value);

    running_offset fresh;
    BOOST_CHECK(fresh.can_advance(running_offset::max_value));
    BOOST_CHECK(!fresh.can_advance(running_offset::max_value + 1));
    BOOST_CHECK_THROW(fresh.advance(uint64_t(1) << 32), chunk_offset_overflow_exception);
    BOOST_CHECK_EQUAL(fresh.value(), 0);
}

BOOST_AUTO_TEST_CASE(test_collision_stats) {
    collision_stats stats;
    stats.record_group(1);
    BOOST_CHECK_EQUAL(stats.collisions, 0);
    BOOST_CHECK_EQUAL(stats.max_group_size, 0);
    stats.record_group(3);
    stats.record_group(2);
    BOOST_CHECK_EQUAL(stats.collisions, 2);
    BOOST_CHECK_EQUAL(stats.max_group_size, 3);
}
