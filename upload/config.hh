/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <seastar/core/future.hh>
#include <seastar/core/units.hh>

#include "seastarx.hh"

namespace YAML {
class Node;
}

namespace upload {

// Part sizing and parallelism of one transfer.
struct transfer_config {
    uint64_t multipart_threshold = 70 * MB;
    uint64_t min_part_size = 8 * MB;
    uint64_t max_part_size = 64 * MB;
    unsigned target_part_count = 6;
    unsigned max_concurrency = 6;
    // extra attempts for a failed part within one run of the task
    unsigned part_retries = 2;
    unsigned retry_scale_ms = 25;

    // throws std::invalid_argument
    void validate() const;
};

struct engine_config {
    std::string signing_endpoint;
    std::string auth_endpoint;
    std::string auth_api_key;
    std::string access_token;
    std::string refresh_token;
    std::filesystem::path resume_store = "upload-resume.json";
    unsigned max_connections = 8;
    transfer_config transfer;

    static engine_config decode(const YAML::Node& node);
};

future<engine_config> load_engine_config(std::filesystem::path path);

} // namespace upload
