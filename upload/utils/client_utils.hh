/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once
#if __has_include(<rapidxml.h>)
#include <rapidxml.h>
#else
#include <rapidxml/rapidxml.hpp>
#endif
#include <optional>
#include <seastar/core/sstring.hh>

namespace upload::utils {

struct store_error {
    seastar::sstring code;
    seastar::sstring message;
};

// Decodes an S3 <Error><Code/><Message/></Error> document, nullopt when the
// body is not one.
std::optional<store_error> parse_store_error(seastar::sstring body);

} // namespace upload::utils
