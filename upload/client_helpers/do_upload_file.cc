/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "do_upload_file.hh"

#include <seastar/core/coroutine.hh>
#include <seastar/core/seastar.hh>
#include <seastar/coroutine/exception.hh>

#include "utils/log.hh"

namespace upload {

static logging::logger uflog("upload_file");

do_upload_file::do_upload_file(upload_services& svc,
                               object_location location,
                               const source_file& file,
                               std::optional<multipart_state>& state,
                               progress_handler& progress,
                               seastar::abort_source* as)
    : _svc(svc)
    , _location(std::move(location))
    , _file(file)
    , _state(state)
    , _progress(progress)
    , _as(as) {
}

future<> do_upload_file::put_object() {
    auto url = co_await _svc.signer.sign_single_upload(_location, _file.content_type, _as);
    auto f = co_await open_file_dma(_file.path.native(), open_flags::ro);
    std::exception_ptr ex;
    try {
        co_await _svc.uploader.put_bytes(url, f, byte_range{0, _file.size}, _file.content_type, _progress, _as);
    } catch (...) {
        ex = std::current_exception();
    }
    co_await f.close();
    if (ex) {
        co_await coroutine::return_exception_ptr(std::move(ex));
    }
    uflog.info("Uploaded {} ({} bytes in a single request)", _location, _file.size);
}

future<> do_upload_file::upload() {
    auto strategy = _svc.selector.choose(_file.size);
    uflog.debug("{}: {} bytes, {} upload", _location, _file.size, strategy);
    if (strategy == transfer_strategy::single) {
        co_await put_object();
        co_return;
    }
    multipart_upload mpu(_svc, _location, _file, _state, _progress, _as);
    co_await mpu.upload();
}

} // namespace upload
