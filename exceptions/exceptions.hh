/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <exception>
#include <string>

namespace exceptions {

// Thrown for invalid or missing builder options.
class configuration_exception : public std::exception {
    std::string _msg;
public:
    explicit configuration_exception(std::string msg) noexcept
        : _msg(std::move(msg))
    {}
    const char* what() const noexcept override {
        return _msg.c_str();
    }
};

} // namespace exceptions
