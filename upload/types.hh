/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <fmt/core.h>
#include <seastar/core/future.hh>
#include <seastar/core/sstring.hh>
#include <seastar/util/noncopyable_function.hh>

#include "seastarx.hh"

namespace upload {

struct object_location {
    sstring bucket;
    sstring key;
};

// [off, off + len) of the source file
struct byte_range {
    uint64_t off;
    uint64_t len;
};

struct progress_event {
    uint64_t bytes_loaded;
    uint64_t bytes_total;
};

using progress_handler = noncopyable_function<void(const progress_event&)>;

struct source_file {
    std::filesystem::path path;
    uint64_t size = 0;
    // milliseconds since the epoch
    int64_t last_modified = 0;
    sstring name;
    sstring content_type;
};

static constexpr auto default_content_type = "application/octet-stream";

// Stats the file and fills size, modification time and name. An empty
// content type falls back to application/octet-stream.
future<source_file> make_source_file(std::filesystem::path path, sstring content_type = {});

struct multipart_state {
    sstring upload_id;
    uint64_t part_size = 0;
    // part number -> committed ETag, ordered by part number
    std::map<unsigned, sstring> parts;
};

sstring make_resume_key(const object_location& location, uint64_t size, int64_t last_modified);

} // namespace upload

template <>
struct fmt::formatter<upload::object_location> : fmt::formatter<std::string_view> {
    auto format(const upload::object_location& loc, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(), "{}/{}", loc.bucket, loc.key);
    }
};
