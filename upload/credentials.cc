/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "credentials.hh"

#include <cstdlib>
#include <seastar/core/coroutine.hh>
#include <seastar/util/short_streams.hh>

#include "upload/errors.hh"
#include "upload/utils/json_utils.hh"
#include "utils/log.hh"

namespace upload {

static logging::logger credlog("credentials");

http_token_refresher::http_token_refresher(std::string auth_url, std::string api_key)
    : _url(utils::http::parse_simple_url(auth_url))
    , _api_key(std::move(api_key))
    , _retry_strategy(2)
    , _http(std::make_unique<utils::http::dns_connection_factory>(_url, credlog), 1, http::experimental::client::retry_requests::yes, _retry_strategy) {
}

future<bearer_credentials> http_token_refresher::refresh(const sstring& refresh_token, seastar::abort_source* as) {
    Json::Value body(Json::objectValue);
    body["refresh_token"] = std::string(refresh_token);
    auto payload = utils::to_json_string(body);
    auto path = _url.sub_path("/auth/v1/token?grant_type=refresh_token");

    sstring response;
    try {
        co_await _http.make_request(
            [this, &payload, &path] {
                auto req = http::request::make("POST", _url.authority(), path);
                req._headers["apikey"] = _api_key;
                req.write_body("json", payload);
                return make_ready_future<http::request>(std::move(req));
            },
            [&response](const http::reply&, input_stream<char>&& in) -> future<> {
                auto input = std::move(in);
                response = co_await util::read_entire_stream_contiguous(input);
            },
            as);
    } catch (const http_status_error& e) {
        throw signing_failed(e.status(), fmt::format("token refresh rejected with status {}", e.status()));
    }

    bearer_credentials creds;
    try {
        auto root = utils::parse_json(response);
        creds.access_token = utils::get_string(root, "access_token");
        creds.refresh_token = root["refresh_token"].isString() ? sstring(root["refresh_token"].asString()) : refresh_token;
    } catch (const std::invalid_argument& e) {
        throw signing_failed(200, fmt::format("malformed token refresh response: {}", e.what()));
    }
    credlog.debug("Obtained a new access token");
    co_return creds;
}

future<> http_token_refresher::close() {
    return _http.close();
}

bearer_credentials environment_credentials() {
    bearer_credentials creds;
    if (auto v = std::getenv("UPLOAD_ACCESS_TOKEN")) {
        creds.access_token = v;
    }
    if (auto v = std::getenv("UPLOAD_REFRESH_TOKEN")) {
        creds.refresh_token = v;
    }
    return creds;
}

} // namespace upload
