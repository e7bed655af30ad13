/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <map>

#include <boost/program_options.hpp>
#include <seastar/core/app-template.hh>
#include <seastar/core/fstream.hh>
#include <seastar/core/seastar.hh>
#include <seastar/core/thread.hh>
#include <seastar/util/defer.hh>

#include "rostore/builder_config.hh"
#include "rostore/chunk_writer.hh"
#include "rostore/exceptions.hh"
#include "rostore/file_store.hh"
#include "rostore/record_stream.hh"
#include "exceptions/exceptions.hh"
#include "utils/log.hh"

namespace bpo = boost::program_options;

static logging::logger blogger("rostore_build");

static std::map<sstring, sstring> builder_options(const bpo::variables_map& vm) {
    std::map<sstring, sstring> options{
        {rostore::builder_config::SAVE_KEYS, vm["save-keys"].as<bool>() ? "true" : "false"},
        {rostore::builder_config::CHECKSUM_TYPE, vm["checksum-type"].as<std::string>().c_str()},
        {rostore::builder_config::NUM_CHUNKS, std::to_string(vm["num-chunks"].as<uint32_t>()).c_str()},
        {rostore::builder_config::FINAL_OUTPUT_DIR, vm["output-dir"].as<std::string>().c_str()},
        {rostore::builder_config::TASK_OUTPUT_DIR, vm["task-output-dir"].as<std::string>().c_str()},
        {rostore::builder_config::TASK_ID, vm["task-id"].as<std::string>().c_str()},
        {rostore::builder_config::STORE_NAME, vm["store-name"].as<std::string>().c_str()},
        {rostore::builder_config::VALIDATE_METADATA, vm["validate-metadata"].as<bool>() ? "true" : "false"},
    };
    if (vm.contains("max-group-bytes")) {
        options.emplace(rostore::builder_config::MAX_GROUP_BYTES, std::to_string(vm["max-group-bytes"].as<uint64_t>()).c_str());
    }
    return options;
}

static int build(const bpo::variables_map& vm) {
    rostore::builder_config cfg(builder_options(vm));
    rostore::local_file_store store;
    rostore::collision_stats stats;

    auto input_path = vm["input"].as<std::string>();
    auto input = open_file_dma(input_path, open_flags::ro).get();
    rostore::record_stream_reader reader(make_file_input_stream(std::move(input)), cfg.digest_size());
    auto close_reader = defer([&reader] () noexcept {
        try {
            reader.close();
        } catch (...) {
            blogger.warn("Failed to close the input stream: {}", std::current_exception());
        }
    });

    rostore::chunk_writer writer(cfg, store, stats);
    while (auto group = reader.next_group()) {
        writer.consume(*group);
    }
    auto published = writer.consume_end_of_stream();

    if (published) {
        fmt::print("{}: {} groups, {} data bytes -> {}, {}\n", published->metadata, writer.groups_written(),
                writer.data_offset(), published->index_path, published->data_path);
    } else {
        fmt::print("No records in {}, nothing published\n", input_path);
    }
    fmt::print("collisions: {}, max records per digest: {}\n", stats.collisions, stats.max_group_size);
    return 0;
}

int main(int ac, char** av) {
    app_template::config app_cfg;
    app_cfg.name = "rostore_build";
    app_cfg.description = "Builds one read-only store chunk (index and data files) from a digest-sorted record stream.";
    app_template app(std::move(app_cfg));
    app.add_options()
        ("input", bpo::value<std::string>()->required(), "digest-sorted record stream")
        ("output-dir", bpo::value<std::string>()->required(), "final output directory shared by all tasks")
        ("task-output-dir", bpo::value<std::string>()->required(), "task-local directory for temporary files")
        ("task-id", bpo::value<std::string>()->default_value("0"), "unique id of this task attempt")
        ("store-name", bpo::value<std::string>()->required(), "store name, used in temporary file names")
        ("num-chunks", bpo::value<uint32_t>()->required(), "number of chunks per partition")
        ("save-keys", bpo::bool_switch()->default_value(false), "records carry original keys")
        ("checksum-type", bpo::value<std::string>()->default_value("none"), "none, adler32, crc32 or md5")
        ("max-group-bytes", bpo::value<uint64_t>(), "limit on the payload buffered for one digest")
        ("validate-metadata", bpo::bool_switch()->default_value(false), "reject records of another node or partition")
        ;

    return app.run(ac, av, [&app] {
        return seastar::async([&app] {
            try {
                return build(app.configuration());
            } catch (const exceptions::configuration_exception& e) {
                blogger.error("Invalid configuration: {}", e.what());
            } catch (const rostore::chunk_build_exception&) {
                blogger.error("Chunk build failed: {}", std::current_exception());
            }
            return 1;
        });
    });
}
