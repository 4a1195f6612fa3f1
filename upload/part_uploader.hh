/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <seastar/core/abort_source.hh>
#include <seastar/core/file.hh>
#include <seastar/core/fstream.hh>
#include <seastar/core/units.hh>

#include "upload/retry_strategy.hh"
#include "upload/retryable_http_client.hh"
#include "upload/types.hh"

namespace upload {

// Sends byte ranges of local files to pre-signed object store URLs.
// Connections are pooled per scheme://host:port.
class part_uploader {
    unsigned _max_connections;
    default_retry_strategy _no_retries{0};
    std::unordered_map<std::string, std::unique_ptr<retryable_http_client>> _clients;

    // each time, we read up to transmit size from disk.
    //
    // connected_socket::output() uses 8 KiB for its buffer_size, and
    // file_input_stream_options.buffer_size is also 8 KiB, taking the
    // read-ahead into consideration, for maximizing the throughput,
    // we use 64K buffer size.
    static constexpr size_t _transmit_size = 64 * KB;

    static file_input_stream_options input_stream_options();

    retryable_http_client& find_or_create_client(const utils::http::url_info& url);

public:
    explicit part_uploader(unsigned max_connections = 6);

    // One PUT of exactly range.len bytes read from f at range.off. Resolves
    // to the ETag the store returned. on_progress sees the cumulative number
    // of bytes handed to the connection.
    future<sstring> put_bytes(const sstring& url,
                              file f,
                              byte_range range,
                              const sstring& content_type,
                              progress_handler& on_progress,
                              seastar::abort_source* as = nullptr);

    future<> close();
};

} // namespace upload
