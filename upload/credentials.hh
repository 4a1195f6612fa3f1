/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <memory>
#include <string>
#include <seastar/core/abort_source.hh>
#include <seastar/core/future.hh>
#include <seastar/core/sstring.hh>

#include "upload/retry_strategy.hh"
#include "upload/retryable_http_client.hh"
#include "utils/http.hh"
#include "seastarx.hh"

namespace upload {

struct bearer_credentials {
    sstring access_token;
    sstring refresh_token;

    explicit operator bool() const noexcept { return !access_token.empty(); }
};

// Obtains a new credential pair in exchange for a refresh credential.
class token_refresher {
public:
    virtual ~token_refresher() = default;
    virtual future<bearer_credentials> refresh(const sstring& refresh_token, seastar::abort_source* as) = 0;
    virtual future<> close() { return make_ready_future<>(); }
};

// POST <auth_url>/auth/v1/token?grant_type=refresh_token with an apikey
// header and {"refresh_token": ...}, answered by {access_token, refresh_token}.
class http_token_refresher : public token_refresher {
    utils::http::url_info _url;
    std::string _api_key;
    default_retry_strategy _retry_strategy;
    retryable_http_client _http;

public:
    http_token_refresher(std::string auth_url, std::string api_key);
    future<bearer_credentials> refresh(const sstring& refresh_token, seastar::abort_source* as) override;
    future<> close() override;
};

// UPLOAD_ACCESS_TOKEN / UPLOAD_REFRESH_TOKEN
bearer_credentials environment_credentials();

} // namespace upload
