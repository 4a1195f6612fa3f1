/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <memory>
#include <seastar/core/abort_source.hh>
#include <seastar/http/client.hh>
#include <seastar/http/request.hh>
#include <seastar/util/noncopyable_function.hh>

#include "upload/retry_strategy.hh"
#include "seastarx.hh"

namespace upload {

// http client that re-sends failed requests as long as the retry strategy
// allows. Non-2xx answers are turned into http_status_error before the
// reply handler sees them.
class retryable_http_client {
public:
    // Builds a fresh request for every attempt, so authorization and bodies
    // are regenerated on retries.
    using request_builder = noncopyable_function<future<http::request>()>;

    retryable_http_client(std::unique_ptr<http::experimental::connection_factory>&& factory,
                          unsigned max_conn,
                          http::experimental::client::retry_requests should_retry,
                          const retry_strategy& retry_strategy);

    future<> make_request(request_builder builder, http::experimental::client::reply_handler handle, seastar::abort_source* as = nullptr);
    future<> make_request(request_builder builder,
                          http::experimental::client::reply_handler handle,
                          const retry_strategy& retry_strategy,
                          seastar::abort_source* as = nullptr);
    future<> close();

    http::experimental::client& get_http_client() { return http; }

private:
    future<> do_retryable_request(request_builder& builder,
                                  http::experimental::client::reply_handler& handler,
                                  const retry_strategy& retry_strategy,
                                  seastar::abort_source* as);

    http::experimental::client http;
    const retry_strategy& _retry_strategy;
};

} // namespace upload
