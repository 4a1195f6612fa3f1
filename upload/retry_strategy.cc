/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "retry_strategy.hh"

#include <seastar/core/coroutine.hh>
#include <seastar/http/reply.hh>

#include "upload/errors.hh"
#include "utils/log.hh"

using namespace std::chrono_literals;

namespace upload {

static logging::logger rslog("retry_strategy");

default_retry_strategy::default_retry_strategy(unsigned max_retries, unsigned scale_factor)
    : _max_retries(max_retries)
    , _scale_factor(scale_factor) {
}

seastar::future<bool> default_retry_strategy::should_retry(std::exception_ptr error, unsigned attempted_retries) const {
    if (attempted_retries >= _max_retries) {
        return seastar::make_ready_future<bool>(false);
    }
    return seastar::make_ready_future<bool>(is_retryable(std::move(error)) == retryable::yes);
}

std::chrono::milliseconds default_retry_strategy::delay_before_retry(std::exception_ptr, unsigned attempted_retries) const {
    if (attempted_retries == 0) {
        return 0ms;
    }

    return std::chrono::milliseconds((1UL << attempted_retries) * _scale_factor);
}

refresh_on_unauthorized_strategy::refresh_on_unauthorized_strategy(refresh_func refresh)
    : _refresh(std::move(refresh)) {
}

static bool is_unauthorized(std::exception_ptr error) {
    try {
        std::rethrow_exception(std::move(error));
    } catch (const http_status_error& e) {
        return e.status() == unsigned(seastar::http::reply::status_type::unauthorized);
    } catch (...) {
        return false;
    }
}

seastar::future<bool> refresh_on_unauthorized_strategy::should_retry(std::exception_ptr error, unsigned attempted_retries) const {
    if (attempted_retries >= get_max_retries() || !is_unauthorized(std::move(error))) {
        co_return false;
    }
    std::exception_ptr refresh_ex;
    try {
        co_await _refresh();
    } catch (...) {
        refresh_ex = std::current_exception();
    }
    if (refresh_ex) {
        rslog.warn("Credentials refresh after 401 failed, giving up: {}", refresh_ex);
        co_return false;
    }
    co_return true;
}

} // namespace upload
