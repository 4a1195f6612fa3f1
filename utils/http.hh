/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <seastar/core/lowres_clock.hh>
#include <seastar/core/semaphore.hh>
#include <seastar/core/shared_ptr.hh>
#include <seastar/http/client.hh>
#include <seastar/net/inet_address.hh>
#include <seastar/net/tls.hh>

#include "seastarx.hh"
#include "utils/log.hh"

namespace utils::http {

// Shared per shard, loaded on first use.
future<shared_ptr<tls::certificate_credentials>> system_trust_credentials();

struct url_info {
    std::string scheme;
    std::string host;
    // path and query string, kept verbatim so pre-signed signatures stay valid
    std::string path;
    uint16_t port;

    bool is_https() const;
    // value of the Host header: host, with :port unless it is the scheme's
    // default, IPv6 literals in brackets
    std::string authority() const;
    // path (without the query) followed by suffix, no doubled slash
    std::string sub_path(std::string_view suffix) const;
    // "scheme://host:port", identifies a connection pool
    std::string endpoint() const;
};

// scheme://host[:port][/path][?query], numeric IPv6 hosts in brackets.
// Throws std::invalid_argument.
url_info parse_simple_url(std::string_view uri);

// Connects to every address host resolves to in turn. Resolution is cached
// for the shortest TTL of the answer, TLS uses the system trust store unless
// credentials are given.
class dns_connection_factory : public seastar::http::experimental::connection_factory {
    std::string _host;
    uint16_t _port;
    bool _use_https;
    logging::logger& _logger;
    shared_ptr<tls::certificate_credentials> _creds;
    bool _creds_ready = false;
    semaphore _resolve_sem{1};
    std::vector<net::inet_address> _addrs;
    size_t _next_addr = 0;
    lowres_clock::time_point _valid_until;

    bool resolved() const noexcept;
    future<> resolve();
    future<net::inet_address> next_address();
    future<shared_ptr<tls::certificate_credentials>> credentials();

public:
    dns_connection_factory(const url_info& url, logging::logger& logger, shared_ptr<tls::certificate_credentials> creds = {});

    future<connected_socket> make(abort_source*) override;
};

} // namespace utils::http
