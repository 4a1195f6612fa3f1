/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <seastar/core/future.hh>
#include <seastar/core/shared_ptr.hh>

#include "upload/config.hh"
#include "upload/part_uploader.hh"
#include "upload/resume_store.hh"
#include "upload/signing_client.hh"
#include "upload/transfer_strategy.hh"
#include "upload/upload_queue.hh"

namespace upload {

// Owns the collaborators built from an engine_config and the queue that
// uses them.
class upload_engine {
    engine_config _cfg;
    shared_ptr<signing_client> _signer;
    part_uploader _uploader;
    resume_store _store;
    transfer_strategy_selector _selector;
    upload_services _services;
    upload_queue _queue;

public:
    explicit upload_engine(engine_config cfg);

    // Loads the resume store and starts the queue driver.
    future<> start();
    future<> stop();

    upload_queue& queue() noexcept { return _queue; }
    resume_store& store() noexcept { return _store; }
    const engine_config& config() const noexcept { return _cfg; }
};

} // namespace upload
