/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "engine.hh"

#include <seastar/core/coroutine.hh>

#include "utils/log.hh"

namespace upload {

static logging::logger englog("upload_engine");

static std::unique_ptr<token_refresher> make_refresher(const engine_config& cfg) {
    if (cfg.auth_endpoint.empty()) {
        return nullptr;
    }
    return std::make_unique<http_token_refresher>(cfg.auth_endpoint, cfg.auth_api_key);
}

upload_engine::upload_engine(engine_config cfg)
    : _cfg(std::move(cfg))
    , _signer(signing_client::make(_cfg.signing_endpoint,
                                   bearer_credentials{.access_token = _cfg.access_token, .refresh_token = _cfg.refresh_token},
                                   make_refresher(_cfg),
                                   _cfg.max_connections))
    , _uploader(_cfg.max_connections)
    , _store(_cfg.resume_store)
    , _selector(_cfg.transfer)
    , _services{*_signer, _uploader, _store, _selector}
    , _queue(_services) {
}

future<> upload_engine::start() {
    co_await _store.load();
    _queue.start();
    englog.info("Upload engine started, signing endpoint {}, {} resumable upload(s) on record", _cfg.signing_endpoint, _store.size());
}

future<> upload_engine::stop() {
    co_await _queue.stop();
    co_await _uploader.close();
    co_await _signer->close();
}

} // namespace upload
