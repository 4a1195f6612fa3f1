/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "http.hh"

#include <algorithm>
#include <charconv>
#include <strings.h>
#include <boost/regex.hpp>
#include <seastar/core/coroutine.hh>
#include <seastar/net/dns.hh>

namespace utils::http {

future<shared_ptr<tls::certificate_credentials>> system_trust_credentials() {
    static thread_local shared_ptr<tls::certificate_credentials> trust;
    if (!trust) {
        auto creds = make_shared<tls::certificate_credentials>();
        co_await creds->set_system_trust();
        // concurrent first callers may both load it, the last one wins
        trust = std::move(creds);
    }
    co_return trust;
}

dns_connection_factory::dns_connection_factory(const url_info& url, logging::logger& logger, shared_ptr<tls::certificate_credentials> creds)
    : _host(url.host)
    , _port(url.port)
    , _use_https(url.is_https())
    , _logger(logger)
    , _creds(std::move(creds)) {
}

bool dns_connection_factory::resolved() const noexcept {
    return !_addrs.empty() && lowres_clock::now() < _valid_until;
}

future<> dns_connection_factory::resolve() {
    auto answer = co_await net::dns::get_host_by_name(_host, net::inet_address::family::INET);
    if (answer.addr_entries.empty()) {
        throw std::runtime_error(fmt::format("{} did not resolve to any address", _host));
    }
    std::vector<net::inet_address> addrs;
    auto ttl = answer.addr_entries.front().ttl;
    for (const auto& entry : answer.addr_entries) {
        addrs.push_back(entry.addr);
        ttl = std::min(ttl, entry.ttl);
    }
    _addrs = std::move(addrs);
    // zero TTL answers are good for this connection only (RFC 1035 3.2.1)
    _valid_until = lowres_clock::now() + ttl;
    _logger.debug("{} resolved to {} address(es) for {}s", _host, _addrs.size(), ttl.count());
}

future<net::inet_address> dns_connection_factory::next_address() {
    if (!resolved()) [[unlikely]] {
        auto units = co_await get_units(_resolve_sem, 1);
        if (!resolved()) {
            co_await resolve();
        }
    }
    co_return _addrs[_next_addr++ % _addrs.size()];
}

future<shared_ptr<tls::certificate_credentials>> dns_connection_factory::credentials() {
    if (!_creds_ready) [[unlikely]] {
        if (!_use_https) {
            _creds = {};
        } else if (!_creds) {
            _creds = co_await system_trust_credentials();
        }
        _creds_ready = true;
    }
    co_return _creds;
}

future<connected_socket> dns_connection_factory::make(abort_source*) {
    auto addr = socket_address(co_await next_address(), _port);
    auto creds = co_await credentials();
    _logger.trace("Connecting to {} ({}, tls={})", _host, addr, bool(creds));
    if (creds) {
        co_return co_await tls::connect(creds, addr, tls::tls_options{.server_name = _host});
    }
    co_return co_await seastar::connect(addr, {}, transport::TCP);
}

static bool is_https_scheme(std::string_view scheme) {
    return scheme.size() == 5 && strncasecmp(scheme.data(), "https", 5) == 0;
}

url_info parse_simple_url(std::string_view uri) {
    static const boost::regex url_re(R"(^([A-Za-z][A-Za-z0-9+.-]*)://(\[[^\]]+\]|[^/:?#]+)(?::(\d{1,5}))?([/?].*)?$)");

    std::string input(uri);
    boost::smatch m;
    if (!boost::regex_match(input, m, url_re)) {
        throw std::invalid_argument(fmt::format("Could not parse URL {}", uri));
    }

    url_info info;
    info.scheme = m[1].str();
    info.host = m[2].str();
    if (info.host.front() == '[') {
        info.host = info.host.substr(1, info.host.size() - 2);
    }
    info.path = m[4].matched ? m[4].str() : "/";
    if (info.path.front() != '/') {
        info.path.insert(0, "/");
    }
    if (m[3].matched) {
        auto digits = m[3].str();
        unsigned port = 0;
        auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), port);
        if (ec != std::errc{} || port == 0 || port > 65535) {
            throw std::invalid_argument(fmt::format("Bad port in URL {}", uri));
        }
        info.port = uint16_t(port);
    } else {
        info.port = is_https_scheme(info.scheme) ? 443 : 80;
    }
    return info;
}

bool url_info::is_https() const {
    return is_https_scheme(scheme);
}

std::string url_info::sub_path(std::string_view suffix) const {
    auto base = std::string_view(path).substr(0, path.find('?'));
    while (!base.empty() && base.back() == '/') {
        base.remove_suffix(1);
    }
    return fmt::format("{}{}", base, suffix);
}

std::string url_info::authority() const {
    auto name = host.find(':') == std::string::npos ? host : fmt::format("[{}]", host);
    if (port == (is_https() ? 443 : 80)) {
        return name;
    }
    return fmt::format("{}:{}", name, port);
}

std::string url_info::endpoint() const {
    return fmt::format("{}://{}:{}", is_https() ? "https" : "http", host, port);
}

} // namespace utils::http
