/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <fmt/core.h>
#include <seastar/core/abort_source.hh>
#include <seastar/core/sstring.hh>

#include "utils/http_client_error_processing.hh"

namespace upload {

using utils::http::retryable;

class upload_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Non-2xx answer received by the retrying http client, with the raw body
// so that the caller can decode the service specific error document.
class http_status_error : public upload_error {
    unsigned _status;
    seastar::sstring _body;

public:
    http_status_error(unsigned status, seastar::sstring body);
    unsigned status() const noexcept { return _status; }
    const seastar::sstring& body() const noexcept { return _body; }
};

// The signing service refused or could not be reached (status 0).
class signing_failed : public upload_error {
    unsigned _status;

public:
    signing_failed(unsigned status, const std::string& message);
    unsigned status() const noexcept { return _status; }
    retryable is_retryable() const noexcept;
};

class transfer_failed : public upload_error {
    unsigned _status;
    retryable _retryable;

public:
    transfer_failed(unsigned status, const std::string& message, retryable r);
    unsigned status() const noexcept { return _status; }
    retryable is_retryable() const noexcept { return _retryable; }
};

// 2xx from the object store without an ETag header
class missing_etag : public transfer_failed {
public:
    missing_etag();
};

enum class cancel_reason {
    pause,
    cancel,
};

// Thrown into in-flight calls when the owner pauses or cancels a transfer.
class upload_canceled : public seastar::abort_requested_exception {
    cancel_reason _reason;

public:
    explicit upload_canceled(cancel_reason reason) noexcept : _reason(reason) {}
    cancel_reason reason() const noexcept { return _reason; }
    const char* what() const noexcept override;
};

// Converts whatever an object store PUT failed with into transfer_failed,
// classifying transport errors by errno and http errors by status.
transfer_failed make_transfer_failed(std::exception_ptr ex);

retryable is_retryable(std::exception_ptr ex);

// Cancellation reason carried by ex, if it is an upload_canceled.
std::optional<cancel_reason> cancellation_of(std::exception_ptr ex) noexcept;

} // namespace upload

template <>
struct fmt::formatter<upload::cancel_reason> : fmt::formatter<string_view> {
    auto format(upload::cancel_reason r, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(), "{}", r == upload::cancel_reason::pause ? "pause" : "cancel");
    }
};
