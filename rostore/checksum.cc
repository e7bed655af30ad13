/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <zlib.h>
#include <gnutls/gnutls.h>
#include <gnutls/crypto.h>

#include <algorithm>
#include <cctype>
#include <limits>
#include <stdexcept>

#include <fmt/format.h>
#include <seastar/core/byteorder.hh>

#include "rostore/checksum.hh"
#include "exceptions/exceptions.hh"

namespace rostore {

namespace {

struct adler32_utils {
    static uint32_t init_checksum() {
        return adler32(0, Z_NULL, 0);
    }
    static uint32_t checksum(uint32_t prev, const Bytef* input, uInt len) {
        return adler32(prev, input, len);
    }
};

struct crc32_utils {
    static uint32_t init_checksum() {
        return crc32(0, Z_NULL, 0);
    }
    static uint32_t checksum(uint32_t prev, const Bytef* input, uInt len) {
        return crc32(prev, input, len);
    }
};

template <typename ChecksumUtils, checksum_type Type>
class zlib_checksum final : public checksum {
    uint32_t _value = ChecksumUtils::init_checksum();
public:
    void update(const_bytes data) override {
        // zlib takes a 32-bit length.
        constexpr size_t max_step = std::numeric_limits<uInt>::max();
        while (!data.empty()) {
            auto step = std::min(data.size(), max_step);
            _value = ChecksumUtils::checksum(_value, reinterpret_cast<const Bytef*>(data.data()), uInt(step));
            data = data.subspan(step);
        }
    }
    bytes digest() override {
        bytes out(sizeof(uint32_t));
        seastar::write_be<uint32_t>(reinterpret_cast<char*>(out.data()), _value);
        return out;
    }
    checksum_type type() const override {
        return Type;
    }
};

using adler32_checksum = zlib_checksum<adler32_utils, checksum_type::adler32>;
using crc32_checksum = zlib_checksum<crc32_utils, checksum_type::crc32>;

class md5_checksum final : public checksum {
    gnutls_hash_hd_t _hd;
public:
    md5_checksum() {
        if (int ret = gnutls_hash_init(&_hd, GNUTLS_DIG_MD5); ret < 0) {
            throw std::runtime_error(fmt::format("Unable to initialize MD5 digest: {}", gnutls_strerror(ret)));
        }
    }
    md5_checksum(const md5_checksum&) = delete;
    md5_checksum& operator=(const md5_checksum&) = delete;
    ~md5_checksum() {
        gnutls_hash_deinit(_hd, nullptr);
    }
    void update(const_bytes data) override {
        if (data.empty()) {
            return;
        }
        if (int ret = gnutls_hash(_hd, data.data(), data.size()); ret < 0) {
            throw std::runtime_error(fmt::format("MD5 digest update failed: {}", gnutls_strerror(ret)));
        }
    }
    bytes digest() override {
        bytes out(gnutls_hash_get_len(GNUTLS_DIG_MD5));
        gnutls_hash_output(_hd, out.data());
        return out;
    }
    checksum_type type() const override {
        return checksum_type::md5;
    }
};

} // anonymous namespace

checksum_type checksum_type_from_name(std::string_view name) {
    std::string lowered(name);
    std::ranges::transform(lowered, lowered.begin(), [] (unsigned char c) { return std::tolower(c); });
    for (int i = 0; i <= static_cast<int>(checksum_type::none); ++i) {
        if (lowered == checksum_type_names[i]) {
            return static_cast<checksum_type>(i);
        }
    }
    throw exceptions::configuration_exception(fmt::format("Unknown checksum type: {}", name));
}

std::string_view checksum_type_to_name(checksum_type t) {
    return checksum_type_names[static_cast<int>(t)];
}

std::unique_ptr<checksum> checksum::create(checksum_type t) {
    switch (t) {
    case checksum_type::adler32:
        return std::make_unique<adler32_checksum>();
    case checksum_type::crc32:
        return std::make_unique<crc32_checksum>();
    case checksum_type::md5:
        return std::make_unique<md5_checksum>();
    case checksum_type::none:
        return nullptr;
    }
    throw std::invalid_argument(fmt::format("Invalid checksum type {}", static_cast<int>(t)));
}

} // namespace rostore
