/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <map>
#include <memory>
#include <string>
#include <json/json.h>
#include <seastar/core/abort_source.hh>
#include <seastar/core/semaphore.hh>
#include <seastar/core/shared_ptr.hh>
#include <seastar/core/sstring.hh>

#include "upload/credentials.hh"
#include "upload/retryable_http_client.hh"
#include "upload/types.hh"
#include "utils/http.hh"

namespace upload {

// Talks to the service that hands out pre-signed object store URLs and
// drives the multipart transaction on the store. Every call carries the
// bearer token, and a 401 triggers one credentials refresh and one retry.
class signing_client {
    utils::http::url_info _endpoint;
    bearer_credentials _credentials;
    std::unique_ptr<token_refresher> _refresher;
    semaphore _creds_sem;
    // bumped on every successful refresh, lets concurrent 401s share one refresh
    uint64_t _creds_generation = 0;
    default_retry_strategy _no_retries{0};
    retryable_http_client _http;

    struct private_tag {};

    void authorize(http::request& req) const;
    future<> refresh_credentials(uint64_t observed_generation, seastar::abort_source* as);
    future<Json::Value> call(std::string_view api, Json::Value body, seastar::abort_source* as);

public:
    signing_client(utils::http::url_info endpoint, bearer_credentials creds, std::unique_ptr<token_refresher> refresher, unsigned max_conn, private_tag);

    static shared_ptr<signing_client> make(std::string endpoint,
                                           bearer_credentials creds,
                                           std::unique_ptr<token_refresher> refresher = {},
                                           unsigned max_conn = 4);

    future<sstring> sign_single_upload(const object_location& location, const sstring& content_type, seastar::abort_source* as = nullptr);
    future<sstring> create_multipart(const object_location& location, const sstring& content_type, seastar::abort_source* as = nullptr);
    future<sstring> sign_part(const object_location& location, const sstring& upload_id, unsigned part_number, seastar::abort_source* as = nullptr);
    // parts must be the dense set 1..M, they are sent in ascending order
    future<> complete_multipart(const object_location& location,
                                const sstring& upload_id,
                                const std::map<unsigned, sstring>& parts,
                                seastar::abort_source* as = nullptr);
    future<> abort_multipart(const object_location& location, const sstring& upload_id, seastar::abort_source* as = nullptr);

    const bearer_credentials& credentials() const noexcept { return _credentials; }

    future<> close();
};

} // namespace upload
