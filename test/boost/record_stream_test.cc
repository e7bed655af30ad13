/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <array>
#include <filesystem>

#include <fmt/format.h>

#include <seastar/core/byteorder.hh>
#include <seastar/core/fstream.hh>
#include <seastar/core/seastar.hh>
#include <seastar/testing/thread_test_case.hh>
#include <seastar/util/tmp_file.hh>

#include "rostore/exceptions.hh"
#include "rostore/file_store.hh"
#include "rostore/file_writer.hh"
#include "rostore/record_stream.hh"
#include "test/lib/chunk_test_utils.hh"

using namespace rostore;

namespace {

void append_entry(bytes& out, const bytes& digest, const bytes& record) {
    out.insert(out.end(), digest.begin(), digest.end());
    std::array<char, sizeof(uint32_t)> len;
    seastar::write_be<uint32_t>(len.data(), record.size());
    auto b = std::as_bytes(std::span(len));
    out.insert(out.end(), b.begin(), b.end());
    out.insert(out.end(), record.begin(), record.end());
}

record_stream_reader open_stream(const std::filesystem::path& dir, const bytes& contents, size_t digest_size) {
    local_file_store store;
    sstring path = (dir / "input").native().c_str();
    file_writer w(store.create(path).get(), path);
    w.write(contents);
    w.close();
    auto f = open_file_dma(path, open_flags::ro).get();
    return record_stream_reader(make_file_input_stream(std::move(f)), digest_size);
}

} // anonymous namespace

SEASTAR_THREAD_TEST_CASE(test_groups_equal_digests) {
    tmp_dir::do_with_thread([] (tmp_dir& tmp) {
        auto d1 = tests::make_digest(8, 0, 1);
        auto d2 = tests::make_digest(8, 0, 2);
        auto d3 = tests::make_digest(8, 0, 3);
        auto r = [] (std::string_view v) {
            return tests::make_record(1, 2, 0, tests::make_tuple("k", v));
        };
        bytes input;
        append_entry(input, d1, r("a"));
        append_entry(input, d2, r("b"));
        append_entry(input, d2, r("c"));
        append_entry(input, d2, r("d"));
        append_entry(input, d3, r(""));

        auto reader = open_stream(tmp.get_path(), input, 8);
        auto g1 = reader.next_group();
        BOOST_REQUIRE(g1);
        BOOST_CHECK(g1->digest == d1);
        BOOST_REQUIRE_EQUAL(g1->records.size(), 1);
        BOOST_CHECK(g1->records[0] == r("a"));

        auto g2 = reader.next_group();
        BOOST_REQUIRE(g2);
        BOOST_CHECK(g2->digest == d2);
        BOOST_REQUIRE_EQUAL(g2->records.size(), 3);
        BOOST_CHECK(g2->records[0] == r("b"));
        BOOST_CHECK(g2->records[2] == r("d"));

        auto g3 = reader.next_group();
        BOOST_REQUIRE(g3);
        BOOST_CHECK(g3->digest == d3);
        BOOST_CHECK_EQUAL(g3->records.size(), 1);

        BOOST_CHECK(!reader.next_group());
        BOOST_CHECK(!reader.next_group());
        reader.close();
    }).get();
}

SEASTAR_THREAD_TEST_CASE(test_empty_stream) {
    tmp_dir::do_with_thread([] (tmp_dir& tmp) {
        auto reader = open_stream(tmp.get_path(), {}, 16);
        BOOST_CHECK(!reader.next_group());
        reader.close();
    }).get();
}

SEASTAR_THREAD_TEST_CASE(test_truncated_stream) {
    tmp_dir::do_with_thread([] (tmp_dir& tmp) {
        auto digest = tests::make_digest(16, 0, 1);
        auto record = tests::make_record(1, 2, std::nullopt, tests::to_bytes("value"));
        bytes full;
        append_entry(full, digest, record);

        for (size_t cut : {size_t(3), size_t(16 + 2), full.size() - 1}) {
            bytes input(full.begin(), full.begin() + cut);
            auto dir = tmp.get_path() / fmt::format("cut-{}", cut);
            std::filesystem::create_directory(dir);
            auto reader = open_stream(dir, input, 16);
            BOOST_CHECK_THROW(reader.next_group(), malformed_record_exception);
            reader.close();
        }
    }).get();
}
