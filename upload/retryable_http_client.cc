/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "retryable_http_client.hh"

#include <seastar/core/coroutine.hh>
#include <seastar/core/sleep.hh>
#include <seastar/coroutine/exception.hh>
#include <seastar/util/short_streams.hh>

#include "upload/errors.hh"
#include "utils/log.hh"

namespace upload {

static logging::logger hlog("http");

retryable_http_client::retryable_http_client(std::unique_ptr<http::experimental::connection_factory>&& factory,
                                             unsigned max_conn,
                                             http::experimental::client::retry_requests should_retry,
                                             const retry_strategy& retry_strategy)
    : http(std::move(factory), max_conn, should_retry), _retry_strategy(retry_strategy) {
}

future<> retryable_http_client::do_retryable_request(request_builder& builder,
                                                     http::experimental::client::reply_handler& handler,
                                                     const retry_strategy& retry_strategy,
                                                     seastar::abort_source* as) {
    // the http client does not check abort status on entry, and if we're
    // already aborted when we get here we will not be interrupted, because
    // no registration will be done. So check it here.
    if (as && as->abort_requested()) {
        co_await coroutine::return_exception_ptr(as->abort_requested_exception_ptr());
    }
    unsigned retries = 0;
    while (true) {
        std::exception_ptr e;
        try {
            auto req = co_await builder();
            hlog.trace("{} {} (attempt {})", req._method, req._url, retries + 1);
            auto attempt_handler = [&handler](const http::reply& rep, input_stream<char>&& in) {
                return handler(rep, std::move(in));
            };
            co_await (as ? http.make_request(std::move(req), std::move(attempt_handler), *as, std::nullopt)
                         : http.make_request(std::move(req), std::move(attempt_handler), std::nullopt));
            co_return;
        } catch (...) {
            e = std::current_exception();
        }

        if (as && as->abort_requested()) {
            co_await coroutine::return_exception_ptr(as->abort_requested_exception_ptr());
        }
        if (!co_await retry_strategy.should_retry(e, retries)) {
            co_await coroutine::return_exception_ptr(std::move(e));
        }
        auto delay = retry_strategy.delay_before_retry(e, retries);
        hlog.debug("Retrying request after {}ms: {}", delay.count(), e);
        if (as) {
            co_await seastar::sleep_abortable(delay, *as);
        } else {
            co_await seastar::sleep(delay);
        }
        ++retries;
    }
}

future<> retryable_http_client::make_request(request_builder builder, http::experimental::client::reply_handler handle, seastar::abort_source* as) {
    co_await make_request(std::move(builder), std::move(handle), _retry_strategy, as);
}

future<> retryable_http_client::make_request(request_builder builder,
                                             http::experimental::client::reply_handler handle,
                                             const retry_strategy& retry_strategy,
                                             seastar::abort_source* as) {
    http::experimental::client::reply_handler checked = [handler = std::move(handle)](const http::reply& rep, input_stream<char>&& in) mutable -> future<> {
        auto payload = std::move(in);
        auto status_class = http::reply::classify_status(rep._status);

        if (status_class != http::reply::status_class::informational && status_class != http::reply::status_class::success) {
            auto body = co_await util::read_entire_stream_contiguous(payload);
            co_await coroutine::return_exception(http_status_error(unsigned(rep._status), std::move(body)));
        }
        co_await handler(rep, std::move(payload));
    };
    co_await do_retryable_request(builder, checked, retry_strategy, as);
}

future<> retryable_http_client::close() {
    return http.close();
}

} // namespace upload
