/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "errors.hh"

#include <seastar/core/timed_out_error.hh>
#include <seastar/http/reply.hh>
#include <seastar/util/log.hh>

#include "upload/utils/client_utils.hh"

namespace upload {

namespace http = seastar::http;
using status_type = http::reply::status_type;

http_status_error::http_status_error(unsigned status, seastar::sstring body)
    : upload_error(fmt::format("unexpected http status {}", status))
    , _status(status)
    , _body(std::move(body)) {
}

signing_failed::signing_failed(unsigned status, const std::string& message)
    : upload_error(message)
    , _status(status) {
}

retryable signing_failed::is_retryable() const noexcept {
    if (_status == 0) {
        return retryable::yes;
    }
    return utils::http::from_http_code(status_type(_status));
}

transfer_failed::transfer_failed(unsigned status, const std::string& message, retryable r)
    : upload_error(message)
    , _status(status)
    , _retryable(r) {
}

missing_etag::missing_etag()
    : transfer_failed(200, "object store accepted the upload without returning an ETag", retryable::yes) {
}

const char* upload_canceled::what() const noexcept {
    return _reason == cancel_reason::pause ? "upload paused" : "upload canceled";
}

transfer_failed make_transfer_failed(std::exception_ptr ex) {
    using utils::http::make_handler;
    return utils::http::dispatch_exception<transfer_failed>(
        std::move(ex),
        [](std::exception_ptr eptr, std::string&& original_message) {
            auto message = original_message.empty() ? fmt::format("{}", eptr) : std::move(original_message);
            return transfer_failed(0, fmt::format("object store request failed: {}", message), retryable::no);
        },
        make_handler<transfer_failed>([](const transfer_failed& e) {
            return e;
        }),
        make_handler<http_status_error>([](const http_status_error& e) {
            auto message = fmt::format("object store answered {}", e.status());
            if (auto store_error = utils::parse_store_error(e.body())) {
                message = fmt::format("{}: {} ({})", message, store_error->code, store_error->message);
            }
            return transfer_failed(e.status(), message, utils::http::from_http_code(status_type(e.status())));
        }),
        make_handler<std::system_error>([](const std::system_error& e) {
            return transfer_failed(0, fmt::format("object store unreachable: {}", e.what()), utils::http::from_system_error(e));
        }),
        make_handler<seastar::timed_out_error>([](const seastar::timed_out_error& e) {
            return transfer_failed(0, fmt::format("object store request timed out: {}", e.what()), retryable::yes);
        }));
}

retryable is_retryable(std::exception_ptr ex) {
    using utils::http::make_handler;
    return utils::http::dispatch_exception<retryable>(
        std::move(ex),
        [](std::exception_ptr, std::string&&) {
            return retryable::no;
        },
        make_handler<seastar::abort_requested_exception>([](const seastar::abort_requested_exception&) {
            return retryable::no;
        }),
        make_handler<signing_failed>([](const signing_failed& e) {
            return e.is_retryable();
        }),
        make_handler<transfer_failed>([](const transfer_failed& e) {
            return e.is_retryable();
        }),
        make_handler<http_status_error>([](const http_status_error& e) {
            return utils::http::from_http_code(status_type(e.status()));
        }),
        make_handler<std::system_error>([](const std::system_error& e) {
            return utils::http::from_system_error(e);
        }));
}

std::optional<cancel_reason> cancellation_of(std::exception_ptr ex) noexcept {
    try {
        std::rethrow_exception(std::move(ex));
    } catch (const upload_canceled& e) {
        return e.reason();
    } catch (...) {
        return std::nullopt;
    }
}

} // namespace upload
