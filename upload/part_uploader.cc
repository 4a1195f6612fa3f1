/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "part_uploader.hh"

#include <seastar/core/coroutine.hh>
#include <seastar/coroutine/exception.hh>
#include <seastar/coroutine/parallel_for_each.hh>
#include <seastar/util/short_streams.hh>

#include "upload/errors.hh"
#include "utils/http.hh"
#include "utils/log.hh"

namespace upload {

static logging::logger pulog("part_uploader");

part_uploader::part_uploader(unsigned max_connections)
    : _max_connections(max_connections) {
}

file_input_stream_options part_uploader::input_stream_options() {
    // optimized for throughput
    return {
        .buffer_size = 128 * KB,
        .read_ahead = 4,
    };
}

retryable_http_client& part_uploader::find_or_create_client(const utils::http::url_info& url) {
    auto ep = url.endpoint();
    auto it = _clients.find(ep);
    if (it == _clients.end()) [[unlikely]] {
        auto factory = std::make_unique<utils::http::dns_connection_factory>(url, pulog);
        // a PUT body is produced by a one-shot writer, never let the client re-send it
        auto client = std::make_unique<retryable_http_client>(std::move(factory), _max_connections, http::experimental::client::retry_requests::no, _no_retries);
        it = _clients.emplace(ep, std::move(client)).first;
        pulog.debug("Created http client for {}", ep);
    }
    return *it->second;
}

future<sstring> part_uploader::put_bytes(const sstring& url,
                                         file f,
                                         byte_range range,
                                         const sstring& content_type,
                                         progress_handler& on_progress,
                                         seastar::abort_source* as) {
    auto target = utils::http::parse_simple_url(url);
    auto& client = find_or_create_client(target);
    sstring etag;
    std::exception_ptr ex;

    try {
        co_await client.make_request(
            [&] {
                auto req = http::request::make("PUT", target.authority(), target.path);
                req.write_body("bin", range.len, [&f, &on_progress, range] (output_stream<char>&& out_) -> future<> {
                    auto out = std::move(out_);
                    auto in = make_file_input_stream(f, range.off, range.len, input_stream_options());
                    uint64_t sent = 0;
                    std::exception_ptr write_ex;
                    try {
                        while (sent < range.len) {
                            auto buf = co_await in.read_up_to(std::min<uint64_t>(_transmit_size, range.len - sent));
                            if (buf.empty()) {
                                throw transfer_failed(0, fmt::format("source file ended after {} of {} bytes at offset {}", sent, range.len, range.off), retryable::no);
                            }
                            sent += buf.size();
                            co_await out.write(buf.get(), buf.size());
                            on_progress(progress_event{sent, range.len});
                        }
                        co_await out.flush();
                    } catch (...) {
                        write_ex = std::current_exception();
                    }
                    co_await out.close();
                    co_await in.close();
                    if (write_ex) {
                        co_await coroutine::return_exception_ptr(std::move(write_ex));
                    }
                });
                // write_body maps "bin" to a generic mime type, the object keeps the caller's
                req._headers["Content-Type"] = content_type;
                return make_ready_future<http::request>(std::move(req));
            },
            [&etag](const http::reply& rep, input_stream<char>&& in_) -> future<> {
                auto in = std::move(in_);
                etag = rep.get_header("ETag");
                co_await util::skip_entire_stream(in);
            },
            as);
    } catch (...) {
        ex = std::current_exception();
    }

    if (ex) {
        if (as && as->abort_requested()) {
            co_await coroutine::return_exception_ptr(as->abort_requested_exception_ptr());
        }
        auto err = make_transfer_failed(std::move(ex));
        pulog.debug("PUT of [{}, +{}) to {} failed: {}", range.off, range.len, target.endpoint(), err.what());
        co_await coroutine::return_exception(std::move(err));
    }
    if (etag.empty()) {
        co_await coroutine::return_exception(missing_etag());
    }
    pulog.trace("PUT of [{}, +{}) stored as {}", range.off, range.len, etag);
    co_return etag;
}

future<> part_uploader::close() {
    co_await coroutine::parallel_for_each(_clients, [] (auto& it) -> future<> {
        co_await it.second->close();
    });
    _clients.clear();
}

} // namespace upload
