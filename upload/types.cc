/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "types.hh"

#include <chrono>
#include <seastar/core/coroutine.hh>
#include <seastar/core/seastar.hh>

namespace upload {

future<source_file> make_source_file(std::filesystem::path path, sstring content_type) {
    auto st = co_await file_stat(path.native());
    if (st.type != directory_entry_type::regular) {
        throw std::invalid_argument(fmt::format("{} is not a regular file", path.native()));
    }
    source_file f;
    f.size = st.size;
    f.last_modified = std::chrono::duration_cast<std::chrono::milliseconds>(st.time_modified.time_since_epoch()).count();
    f.name = path.filename().native();
    f.content_type = content_type.empty() ? sstring(default_content_type) : std::move(content_type);
    f.path = std::move(path);
    co_return f;
}

sstring make_resume_key(const object_location& location, uint64_t size, int64_t last_modified) {
    return seastar::format("{}|{}|{}|{}", location.bucket, location.key, size, last_modified);
}

} // namespace upload
