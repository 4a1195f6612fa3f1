/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <seastar/core/future.hh>
#include <seastar/core/sstring.hh>
#include <seastar/http/httpd.hh>
#include <seastar/http/reply.hh>

#include "seastarx.hh"

// In-process stand-in for the signing service, its token endpoint and the
// object store the signed URLs point at, all served from one address:
//
//   POST /api/files, POST /api/multipart      bearer authenticated JSON
//   POST /auth/v1/token?grant_type=refresh_token
//   PUT  /store/<bucket>/<key>[?uploadId=&partNumber=]
class mock_storage_server {
public:
    static constexpr auto initial_access_token = "token-1";
    static constexpr auto initial_refresh_token = "refresh-1";
    static constexpr auto api_key = "anon-key";

    struct stats {
        unsigned single_puts = 0;
        // part numbers of multipart PUTs, in arrival order
        std::vector<unsigned> part_puts;
        unsigned creates = 0;
        unsigned signed_parts = 0;
        unsigned completes = 0;
        // part numbers of the last complete request, in request order
        std::vector<unsigned> completed_parts;
        unsigned aborts = 0;
        unsigned refreshes = 0;
        unsigned unauthorized = 0;
        // requests whose Host header was not address:port
        unsigned wrong_host = 0;
    };

private:
    class request_handler;

    struct pending_upload {
        sstring bucket;
        sstring key;
        // part number -> (etag, content)
        std::map<unsigned, std::pair<sstring, sstring>> parts;
    };

    std::string _address;
    uint16_t _port;
    sstring _prefix;
    std::unique_ptr<httpd::handler_base> _handler;
    httpd::http_server_control _http_server;
    bool _started = false;

    sstring _access_token = initial_access_token;
    sstring _refresh_token = initial_refresh_token;
    unsigned _next_upload_id = 1;
    unsigned _next_etag = 1;
    std::map<sstring, pending_upload> _uploads;
    std::map<sstring, sstring> _objects;
    stats _stats;

    // failure injection
    std::optional<std::pair<unsigned, http::reply::status_type>> _fail_parts_from;
    unsigned _fail_next_puts = 0;
    http::reply::status_type _fail_next_status = http::reply::status_type::service_unavailable;
    bool _omit_etag = false;
    bool _fail_abort = false;
    std::optional<unsigned> _held_part;
    bool _held_fired = false;
    std::optional<promise<>> _held_arrived;
    std::optional<promise<>> _held_release;

    future<std::unique_ptr<http::reply>> handle(const sstring& path, std::unique_ptr<http::request> req, std::unique_ptr<http::reply> rep);
    future<std::unique_ptr<http::reply>> handle_put(const sstring& path, std::unique_ptr<http::request> req, std::unique_ptr<http::reply> rep);
    std::unique_ptr<http::reply> handle_token(const http::request& req, std::unique_ptr<http::reply> rep);
    std::unique_ptr<http::reply> handle_files(const http::request& req, std::unique_ptr<http::reply> rep);
    std::unique_ptr<http::reply> handle_multipart(const http::request& req, std::unique_ptr<http::reply> rep);
    sstring object_url(const sstring& bucket, const sstring& key) const;

public:
    // The signing and token endpoints are served below prefix ("" or
    // "/segment"), objects always below /store.
    mock_storage_server(std::string address, uint16_t port, sstring prefix = "");
    ~mock_storage_server();

    future<> start();
    future<> stop();

    sstring base_url() const;
    // base_url() followed by the service prefix
    sstring service_url() const;
    uint16_t port() const noexcept { return _port; }

    // Makes the current access token stale, the next bearer call gets a 401
    // and a refresh hands out a new one.
    void expire_access_token();
    const sstring& access_token() const noexcept { return _access_token; }
    void fail_parts_from(unsigned part_number, http::reply::status_type status);
    // the next count part PUTs fail with status, later ones succeed
    void fail_next_puts(unsigned count, http::reply::status_type status);
    void omit_etag(bool omit) noexcept { _omit_etag = omit; }
    void fail_abort(bool fail) noexcept { _fail_abort = fail; }
    void clear_failures();

    // The PUT of part_number blocks after its body was received, the
    // returned future resolves at that moment. release_held_part() lets it
    // answer.
    future<> hold_part(unsigned part_number);
    void release_held_part();

    const stats& get_stats() const noexcept { return _stats; }
    void reset_stats() { _stats = {}; }
    size_t pending_uploads() const noexcept { return _uploads.size(); }
    std::optional<sstring> object(const sstring& bucket, const sstring& key) const;
};

// 127.0.0.1 with a random port above the ephemeral range start
uint16_t random_test_port();
