/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "signing_client.hh"

#include <seastar/core/coroutine.hh>
#include <seastar/coroutine/exception.hh>
#include <seastar/util/short_streams.hh>

#include "upload/errors.hh"
#include "upload/utils/json_utils.hh"
#include "utils/log.hh"

namespace upload {

static logging::logger sclog("signing_client");

static constexpr auto files_path = "/api/files";
static constexpr auto multipart_path = "/api/multipart";

// Error bodies look like {"error": "<message>"}.
static std::string service_error_message(const http_status_error& e) {
    try {
        auto root = utils::parse_json(e.body());
        if (root.isObject() && root["error"].isString()) {
            return fmt::format("signing service answered {}: {}", e.status(), root["error"].asString());
        }
    } catch (const std::invalid_argument&) {
        // not a JSON error document, report the status alone
    }
    return fmt::format("signing service answered {}", e.status());
}

static signing_failed make_signing_failed(std::exception_ptr ex) {
    using utils::http::make_handler;
    return utils::http::dispatch_exception<signing_failed>(
        std::move(ex),
        [](std::exception_ptr eptr, std::string&& original_message) {
            auto message = original_message.empty() ? fmt::format("{}", eptr) : std::move(original_message);
            return signing_failed(0, fmt::format("signing service unreachable: {}", message));
        },
        make_handler<signing_failed>([](const signing_failed& e) {
            return e;
        }),
        make_handler<http_status_error>([](const http_status_error& e) {
            return signing_failed(e.status(), service_error_message(e));
        }));
}

static Json::Value location_json(const object_location& location) {
    Json::Value v(Json::objectValue);
    v["bucket"] = std::string(location.bucket);
    v["key"] = std::string(location.key);
    return v;
}

signing_client::signing_client(utils::http::url_info endpoint, bearer_credentials creds, std::unique_ptr<token_refresher> refresher, unsigned max_conn, private_tag)
    : _endpoint(std::move(endpoint))
    , _credentials(std::move(creds))
    , _refresher(std::move(refresher))
    , _creds_sem(1)
    , _http(std::make_unique<utils::http::dns_connection_factory>(_endpoint, sclog), max_conn, http::experimental::client::retry_requests::yes, _no_retries) {
}

shared_ptr<signing_client> signing_client::make(std::string endpoint, bearer_credentials creds, std::unique_ptr<token_refresher> refresher, unsigned max_conn) {
    return seastar::make_shared<signing_client>(utils::http::parse_simple_url(endpoint), std::move(creds), std::move(refresher), max_conn, private_tag{});
}

void signing_client::authorize(http::request& req) const {
    if (_credentials) {
        req._headers["Authorization"] = seastar::format("Bearer {}", _credentials.access_token);
    }
}

future<> signing_client::refresh_credentials(uint64_t observed_generation, seastar::abort_source* as) {
    auto units = co_await get_units(_creds_sem, 1);
    if (_creds_generation != observed_generation) {
        sclog.debug("Credentials already refreshed by a concurrent request");
        co_return;
    }
    if (!_refresher || _credentials.refresh_token.empty()) {
        throw signing_failed(401, "no refresh credential available");
    }
    sclog.info("Refreshing access token after 401");
    _credentials = co_await _refresher->refresh(_credentials.refresh_token, as);
    ++_creds_generation;
}

future<Json::Value> signing_client::call(std::string_view api, Json::Value body, seastar::abort_source* as) {
    auto path = _endpoint.sub_path(api);
    auto payload = utils::to_json_string(body);
    uint64_t generation = _creds_generation;
    refresh_on_unauthorized_strategy strategy([this, &generation, as] {
        return refresh_credentials(generation, as);
    });

    sstring response;
    std::exception_ptr ex;
    try {
        co_await _http.make_request(
            [this, &path, &payload, &generation] {
                auto req = http::request::make("POST", _endpoint.authority(), path);
                req.write_body("json", payload);
                generation = _creds_generation;
                authorize(req);
                return make_ready_future<http::request>(std::move(req));
            },
            [&response](const http::reply&, input_stream<char>&& in) -> future<> {
                auto input = std::move(in);
                response = co_await util::read_entire_stream_contiguous(input);
            },
            strategy,
            as);
    } catch (...) {
        ex = std::current_exception();
    }
    if (ex) {
        if (as && as->abort_requested()) {
            co_await coroutine::return_exception_ptr(as->abort_requested_exception_ptr());
        }
        auto err = make_signing_failed(std::move(ex));
        sclog.debug("POST {} failed: {}", path, err.what());
        co_await coroutine::return_exception(std::move(err));
    }
    sclog.trace("POST {} -> {}", path, response);
    try {
        co_return utils::parse_json(response);
    } catch (const std::invalid_argument& e) {
        throw signing_failed(200, fmt::format("malformed signing service response: {}", e.what()));
    }
}

static sstring required_field(const Json::Value& root, const char* name) {
    try {
        return utils::get_string(root, name);
    } catch (const std::invalid_argument& e) {
        throw signing_failed(200, fmt::format("signing service response: {}", e.what()));
    }
}

future<sstring> signing_client::sign_single_upload(const object_location& location, const sstring& content_type, seastar::abort_source* as) {
    auto body = location_json(location);
    body["contentType"] = std::string(content_type);
    auto root = co_await call(files_path, std::move(body), as);
    co_return required_field(root, "url");
}

future<sstring> signing_client::create_multipart(const object_location& location, const sstring& content_type, seastar::abort_source* as) {
    auto body = location_json(location);
    body["action"] = "create";
    body["contentType"] = std::string(content_type);
    auto root = co_await call(multipart_path, std::move(body), as);
    auto upload_id = required_field(root, "uploadId");
    sclog.debug("Created multipart upload {} for {}", upload_id, location);
    co_return upload_id;
}

future<sstring> signing_client::sign_part(const object_location& location, const sstring& upload_id, unsigned part_number, seastar::abort_source* as) {
    auto body = location_json(location);
    body["action"] = "signPart";
    body["uploadId"] = std::string(upload_id);
    body["partNumber"] = part_number;
    auto root = co_await call(multipart_path, std::move(body), as);
    co_return required_field(root, "url");
}

future<> signing_client::complete_multipart(const object_location& location,
                                            const sstring& upload_id,
                                            const std::map<unsigned, sstring>& parts,
                                            seastar::abort_source* as) {
    auto body = location_json(location);
    body["action"] = "complete";
    body["uploadId"] = std::string(upload_id);
    Json::Value list(Json::arrayValue);
    for (auto& [nr, etag] : parts) {
        Json::Value part(Json::objectValue);
        part["partNumber"] = nr;
        part["etag"] = std::string(etag);
        list.append(std::move(part));
    }
    body["parts"] = std::move(list);
    co_await call(multipart_path, std::move(body), as);
    sclog.debug("Completed multipart upload {} of {} with {} parts", upload_id, location, parts.size());
}

future<> signing_client::abort_multipart(const object_location& location, const sstring& upload_id, seastar::abort_source* as) {
    auto body = location_json(location);
    body["action"] = "abort";
    body["uploadId"] = std::string(upload_id);
    co_await call(multipart_path, std::move(body), as);
    sclog.debug("Aborted multipart upload {} of {}", upload_id, location);
}

future<> signing_client::close() {
    if (_refresher) {
        co_await _refresher->close();
    }
    co_await _http.close();
}

} // namespace upload
