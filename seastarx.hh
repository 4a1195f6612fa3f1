/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <fmt/ostream.h>
#include <filesystem>
#include <seastar/util/log.hh>

namespace seastar {

template <typename T>
class shared_ptr;

template <typename T>
class lw_shared_ptr;

template <typename T, typename... A>
shared_ptr<T> make_shared(A&&... a);

}

using namespace seastar;
using seastar::shared_ptr;
using seastar::make_shared;

template <> struct fmt::formatter<std::filesystem::path> : fmt::ostream_formatter {};
