/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "http_client_error_processing.hh"

#include <cerrno>
#include <system_error>

namespace utils::http {

retryable from_http_code(seastar::http::reply::status_type http_code) {
    using status_type = seastar::http::reply::status_type;
    switch (http_code) {
    case status_type::request_timeout:
    case status_type::too_many_requests:
        return retryable::yes;
    default:
        return retryable(seastar::http::reply::classify_status(http_code) == seastar::http::reply::status_class::server_error);
    }
}

retryable from_system_error(const std::system_error& system_error) {
    if (system_error.code().category() != std::system_category()) {
        return retryable::no;
    }
    switch (system_error.code().value()) {
    case ECONNRESET:
    case ECONNREFUSED:
    case ECONNABORTED:
    case EPIPE:
    case ETIMEDOUT:
    case EHOSTUNREACH:
    case ENETUNREACH:
    case ENETDOWN:
    case EAGAIN:
        return retryable::yes;
    default:
        return retryable::no;
    }
}

} // namespace utils::http
