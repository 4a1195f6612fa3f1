/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "multipart_upload.hh"

#include <ranges>
#include <seastar/core/coroutine.hh>
#include <seastar/core/seastar.hh>
#include <seastar/core/sleep.hh>
#include <seastar/coroutine/exception.hh>
#include <seastar/coroutine/parallel_for_each.hh>

#include "upload/errors.hh"
#include "upload/retry_strategy.hh"
#include "utils/log.hh"

namespace upload {

static logging::logger mplog("multipart_upload");

future<> abort_multipart_upload(upload_services& svc, const object_location& location, const sstring& resume_key, const sstring& upload_id) noexcept {
    std::exception_ptr ex;
    if (!upload_id.empty()) {
        try {
            co_await svc.signer.abort_multipart(location, upload_id, nullptr);
        } catch (...) {
            ex = std::current_exception();
        }
        if (ex) {
            mplog.warn("Failed to abort multipart upload {} of {}, leaving it to the store's lifecycle rules: {}", upload_id, location, ex);
        }
    }
    try {
        co_await svc.store.remove(resume_key);
    } catch (...) {
        ex = std::current_exception();
        mplog.warn("Failed to remove resume record {}: {}", resume_key, ex);
    }
}

multipart_upload::multipart_upload(upload_services& svc,
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

void multipart_upload::set_phase(upload_phase phase) {
    mplog.debug("{}: {} -> {}", _location, _phase, phase);
    _phase = phase;
}

void multipart_upload::report_progress() {
    uint64_t loaded = _committed_bytes;
    for (auto& [nr, sent] : _inflight) {
        loaded += sent;
    }
    _progress(progress_event{std::min(loaded, _file.size), _file.size});
}

future<> multipart_upload::persist() {
    resume_record rec;
    rec.location = _location;
    rec.size = _file.size;
    rec.last_modified = _file.last_modified;
    rec.name = _file.name;
    rec.state = *_state;
    co_await _svc.store.upsert(_resume_key, std::move(rec));
}

future<> multipart_upload::init() {
    set_phase(upload_phase::initializing);
    _resume_key = make_resume_key(_location, _file.size, _file.last_modified);

    if (!_state) {
        if (auto rec = _svc.store.find(_resume_key)) {
            if (rec->matches(_location, _file)) {
                mplog.info("Resuming multipart upload {} of {} with {} committed part(s)", rec->state.upload_id, _location, rec->state.parts.size());
                _state = std::move(rec->state);
            } else {
                mplog.warn("Discarding stale resume record {}", _resume_key);
                co_await _svc.store.remove(_resume_key);
            }
        }
    }

    if (!_state) {
        auto part_size = _svc.selector.part_size(_file.size);
        auto nr_parts = transfer_strategy_selector::part_count(_file.size, part_size);
        if (nr_parts > aws_maximum_parts_in_piece) {
            throw transfer_failed(0, fmt::format("{} needs {} parts of {} bytes, above the limit of {}", _file.name, nr_parts, part_size, aws_maximum_parts_in_piece), retryable::no);
        }
        auto upload_id = co_await _svc.signer.create_multipart(_location, _file.content_type, _as);
        _state = multipart_state{.upload_id = std::move(upload_id), .part_size = part_size, .parts = {}};
        co_await persist();
    }

    _nr_parts = transfer_strategy_selector::part_count(_file.size, _state->part_size);
    if (_nr_parts > aws_maximum_parts_in_piece) {
        throw transfer_failed(0, fmt::format("{} needs {} parts, above the limit of {}", _file.name, _nr_parts, aws_maximum_parts_in_piece), retryable::no);
    }
    _committed_bytes = 0;
    for (auto& [nr, etag] : _state->parts) {
        _committed_bytes += transfer_strategy_selector::part_range(_file.size, _state->part_size, nr).len;
    }
}

future<sstring> multipart_upload::upload_part(file& f, unsigned part_number) {
    auto range = transfer_strategy_selector::part_range(_file.size, _state->part_size, part_number);
    auto url = co_await _svc.signer.sign_part(_location, _state->upload_id, part_number, &_workers_as);
    progress_handler on_part_progress = [this, part_number](const progress_event& ev) {
        _inflight[part_number] = ev.bytes_loaded;
        report_progress();
    };
    co_return co_await _svc.uploader.put_bytes(url, f, range, _file.content_type, on_part_progress, &_workers_as);
}

future<sstring> multipart_upload::upload_part_with_retries(file& f, unsigned part_number) {
    default_retry_strategy retry_strategy(_svc.selector.config().part_retries, _svc.selector.config().retry_scale_ms);
    unsigned retries = 0;
    while (true) {
        std::exception_ptr ex;
        try {
            co_return co_await upload_part(f, part_number);
        } catch (...) {
            ex = std::current_exception();
        }
        _inflight.erase(part_number);
        if (_workers_as.abort_requested() || !co_await retry_strategy.should_retry(ex, retries)) {
            co_await coroutine::return_exception_ptr(std::move(ex));
        }
        mplog.warn("{}: part {} failed, retrying: {}", _location, part_number, ex);
        co_await seastar::sleep_abortable(retry_strategy.delay_before_retry(ex, retries), _workers_as);
        ++retries;
    }
}

// The acknowledged part counts as done once it is in memory. A failing
// persist fails the run without sending the part again, the next flush
// carries it.
future<> multipart_upload::commit_part(unsigned part_number, sstring etag) {
    _inflight.erase(part_number);
    _state->parts.insert_or_assign(part_number, std::move(etag));
    _committed_bytes += transfer_strategy_selector::part_range(_file.size, _state->part_size, part_number).len;
    report_progress();
    co_await persist();
    mplog.trace("{}: part {}/{} committed", _location, part_number, _nr_parts);
}

future<> multipart_upload::worker(file& f) {
    while (!_workers_as.abort_requested()) {
        auto part_number = _next_part++;
        if (part_number > _nr_parts) {
            break;
        }
        if (_state->parts.contains(part_number)) {
            continue;
        }
        std::exception_ptr ex;
        try {
            auto etag = co_await upload_part_with_retries(f, part_number);
            co_await commit_part(part_number, std::move(etag));
        } catch (...) {
            ex = std::current_exception();
        }
        if (ex) {
            if (!_error && !_workers_as.abort_requested()) {
                mplog.info("{}: part {} failed, stopping the upload: {}", _location, part_number, ex);
                _error = ex;
                _workers_as.request_abort_ex(ex);
            }
            break;
        }
    }
}

future<> multipart_upload::run_workers(file& f) {
    _next_part = 1;
    _error = {};
    seastar::optimized_optional<seastar::abort_source::subscription> sub;
    if (_as) {
        if (_as->abort_requested()) {
            co_await coroutine::return_exception_ptr(_as->abort_requested_exception_ptr());
        }
        sub = _as->subscribe([this](const std::optional<std::exception_ptr>& ex) noexcept {
            if (!_workers_as.abort_requested()) {
                _workers_as.request_abort_ex(ex.value_or(std::make_exception_ptr(seastar::abort_requested_exception())));
            }
        });
    }
    auto nr_workers = std::min(_svc.selector.config().max_concurrency, _nr_parts);
    mplog.debug("{}: uploading {} part(s) of {} bytes, {} already committed, {} worker(s)",
                _location, _nr_parts, _state->part_size, _state->parts.size(), nr_workers);
    co_await coroutine::parallel_for_each(std::views::iota(0u, nr_workers), [this, &f](unsigned) {
        return worker(f);
    });
    if (_as && _as->abort_requested()) {
        co_await coroutine::return_exception_ptr(_as->abort_requested_exception_ptr());
    }
    if (_error) {
        co_await coroutine::return_exception_ptr(_error);
    }
}

future<> multipart_upload::do_upload() {
    co_await init();

    set_phase(upload_phase::transferring);
    auto f = co_await open_file_dma(_file.path.native(), open_flags::ro);
    std::exception_ptr ex;
    try {
        co_await run_workers(f);
    } catch (...) {
        ex = std::current_exception();
    }
    co_await f.close();
    if (ex) {
        co_await coroutine::return_exception_ptr(std::move(ex));
    }

    if (_state->parts.size() != _nr_parts) {
        throw transfer_failed(0, fmt::format("{} of {} parts committed after all workers finished", _state->parts.size(), _nr_parts), retryable::no);
    }

    set_phase(upload_phase::completing);
    co_await _svc.signer.complete_multipart(_location, _state->upload_id, _state->parts, _as);
    co_await _svc.store.remove(_resume_key);
    _state.reset();
    set_phase(upload_phase::done);
    mplog.info("Uploaded {} ({} bytes in {} parts)", _location, _file.size, _nr_parts);
}

future<> multipart_upload::upload() {
    std::exception_ptr ex;
    try {
        co_await do_upload();
    } catch (...) {
        ex = std::current_exception();
    }
    if (!ex) {
        co_return;
    }

    auto reason = cancellation_of(ex);
    if (reason == cancel_reason::cancel) {
        set_phase(upload_phase::aborted);
        if (_state) {
            co_await abort_multipart_upload(_svc, _location, _resume_key.empty() ? make_resume_key(_location, _file.size, _file.last_modified) : _resume_key, _state->upload_id);
            _state.reset();
        }
    } else if (reason || (_as && _as->abort_requested())) {
        set_phase(upload_phase::paused);
    } else {
        set_phase(upload_phase::failed);
    }
    co_await coroutine::return_exception_ptr(std::move(ex));
}

} // namespace upload

auto fmt::formatter<upload::upload_phase>::format(upload::upload_phase p, fmt::format_context& ctx) const -> decltype(ctx.out()) {
    std::string_view name;
    switch (p) {
    case upload::upload_phase::uninitialized:
        name = "uninitialized";
        break;
    case upload::upload_phase::initializing:
        name = "initializing";
        break;
    case upload::upload_phase::transferring:
        name = "transferring";
        break;
    case upload::upload_phase::completing:
        name = "completing";
        break;
    case upload::upload_phase::done:
        name = "done";
        break;
    case upload::upload_phase::paused:
        name = "paused";
        break;
    case upload::upload_phase::aborted:
        name = "aborted";
        break;
    case upload::upload_phase::failed:
        name = "failed";
        break;
    }
    return fmt::format_to(ctx.out(), "{}", name);
}
