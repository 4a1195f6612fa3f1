/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <filesystem>
#include <optional>
#include <unordered_map>
#include <json/json.h>
#include <seastar/core/future.hh>
#include <seastar/core/semaphore.hh>
#include <seastar/core/sstring.hh>

#include "upload/types.hh"

namespace upload {

struct resume_record {
    object_location location;
    uint64_t size = 0;
    int64_t last_modified = 0;
    sstring name;
    multipart_state state;

    // Whether the record was written for this very file and destination and
    // its parts fit the part size it claims.
    bool matches(const object_location& location, const source_file& file) const noexcept;

    Json::Value to_json() const;
    // std::invalid_argument on a malformed record
    static resume_record from_json(const Json::Value& value);
};

// Persisted map of resume key -> resume_record backed by one JSON file.
// Every mutation rewrites the file through a temporary and a rename, so a
// crash leaves either the previous or the new snapshot behind.
class resume_store {
    std::filesystem::path _path;
    std::unordered_map<sstring, resume_record> _records;
    semaphore _flush_sem{1};

    future<> flush();

public:
    explicit resume_store(std::filesystem::path path);

    // Reads the file. A missing or unparsable file yields an empty store,
    // individual malformed records are dropped.
    future<> load();

    std::optional<resume_record> find(const sstring& key) const;
    future<> upsert(const sstring& key, resume_record record);
    future<> remove(const sstring& key);

    size_t size() const noexcept { return _records.size(); }
    const std::filesystem::path& path() const noexcept { return _path; }
};

} // namespace upload
