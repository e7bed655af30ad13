/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

namespace seastar {

template <typename CharType>
class output_stream;

class file;

}

using namespace seastar;
