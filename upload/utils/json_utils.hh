/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once
#include <json/json.h>
#include <string_view>
#include <seastar/core/sstring.hh>

namespace upload::utils {

// Throws std::invalid_argument when raw is not a JSON document.
Json::Value parse_json(std::string_view raw);
seastar::sstring to_json_string(const Json::Value& value);

// Required string member, std::invalid_argument when absent or not a string.
seastar::sstring get_string(const Json::Value& object, const char* name);

} // namespace upload::utils
