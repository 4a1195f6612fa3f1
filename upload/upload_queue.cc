/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "upload_queue.hh"

#include <algorithm>
#include <boost/uuid/random_generator.hpp>
#include <seastar/core/coroutine.hh>
#include <seastar/core/on_internal_error.hh>

#include "upload/client_helpers/do_upload_file.hh"
#include "upload/errors.hh"
#include "utils/log.hh"

namespace upload {

static logging::logger uqlog("upload_queue");

static sstring exception_message(std::exception_ptr ex) {
    try {
        std::rethrow_exception(std::move(ex));
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return seastar::format("{}", std::current_exception());
    }
}

upload_queue::upload_queue(upload_services& svc)
    : _svc(svc) {
}

upload_queue::~upload_queue() {
    if (_driver) {
        on_internal_error_noexcept(uqlog, "upload_queue destroyed without stop()");
    }
}

void upload_queue::start() {
    if (_driver) {
        return;
    }
    _stopping = false;
    _driver = run();
}

future<> upload_queue::stop() {
    _stopping = true;
    if (_active) {
        uqlog.debug("Stopping, pausing task {}", _active->task->id);
        _active->task->status = task_status::paused;
        _active->as.request_abort_ex(upload_canceled(cancel_reason::pause));
        notify(*_active->task);
    }
    _runnable.broadcast();
    if (_driver) {
        co_await std::exchange(_driver, std::nullopt).value();
    }
    _idle.broadcast();
    co_await _background.close();
}

lw_shared_ptr<upload_task> upload_queue::find_task(const task_id& id) const noexcept {
    auto it = std::ranges::find_if(_tasks, [&id](const auto& t) { return t->id == id; });
    return it == _tasks.end() ? nullptr : *it;
}

lw_shared_ptr<upload_task> upload_queue::next_runnable() const noexcept {
    if (_paused) {
        return nullptr;
    }
    auto it = std::ranges::find_if(_tasks, [](const auto& t) { return t->status == task_status::queued; });
    return it == _tasks.end() ? nullptr : *it;
}

bool upload_queue::has_runnable() const noexcept {
    return bool(next_runnable());
}

bool upload_queue::idle() const noexcept {
    return !_active && (_stopping || !has_runnable());
}

void upload_queue::notify(const upload_task& t) {
    _on_task_changed(t);
    _idle.broadcast();
}

task_signal_connection_type upload_queue::on_task_changed(task_signal_callback_type cb) {
    return _on_task_changed.connect(std::move(cb));
}

std::vector<task_id> upload_queue::enqueue(std::vector<upload_request> requests) {
    static thread_local boost::uuids::random_generator gen;
    std::vector<task_id> ids;
    ids.reserve(requests.size());
    for (auto& r : requests) {
        auto t = make_lw_shared<upload_task>();
        t->id = gen();
        t->resume_key = make_resume_key(r.location, r.file.size, r.file.last_modified);
        t->location = std::move(r.location);
        t->file = std::move(r.file);
        t->sampled_at = upload_task::clock_type::now();
        uqlog.debug("Enqueued {} as task {} ({} bytes)", t->location, t->id, t->file.size);
        ids.push_back(t->id);
        _tasks.push_back(t);
        notify(*t);
    }
    _runnable.signal();
    return ids;
}

bool upload_queue::pause(const task_id& id) {
    auto t = find_task(id);
    if (!t || (t->status != task_status::queued && t->status != task_status::uploading)) {
        return false;
    }
    auto was_uploading = t->status == task_status::uploading;
    t->status = task_status::paused;
    t->speed = 0;
    if (was_uploading && _active && _active->task == t) {
        _active->as.request_abort_ex(upload_canceled(cancel_reason::pause));
    }
    uqlog.debug("Task {} paused", id);
    notify(*t);
    return true;
}

bool upload_queue::resume(const task_id& id) {
    auto t = find_task(id);
    if (!t || (t->status != task_status::paused && t->status != task_status::error)) {
        return false;
    }
    t->status = task_status::queued;
    t->error.reset();
    uqlog.debug("Task {} queued again", id);
    notify(*t);
    _runnable.signal();
    return true;
}

bool upload_queue::cancel(const task_id& id) {
    auto t = find_task(id);
    if (!t || t->terminal()) {
        return false;
    }
    auto was_uploading = t->status == task_status::uploading;
    t->status = task_status::canceled;
    t->speed = 0;
    if (_active && _active->task == t) {
        // an active transfer cleans up once it unwinds, see transfer()
        if (was_uploading) {
            _active->as.request_abort_ex(upload_canceled(cancel_reason::cancel));
        }
    } else {
        discard_remote_state(*t);
    }
    uqlog.info("Task {} canceled", id);
    notify(*t);
    return true;
}

void upload_queue::pause_all() {
    _paused = true;
    uqlog.debug("Queue paused");
    _idle.broadcast();
}

void upload_queue::resume_all() {
    _paused = false;
    uqlog.debug("Queue resumed");
    _runnable.signal();
}

size_t upload_queue::clear_completed() {
    auto removed = std::erase_if(_tasks, [](const auto& t) {
        return t->status == task_status::done || t->status == task_status::canceled || t->status == task_status::error;
    });
    uqlog.debug("Cleared {} finished task(s)", removed);
    return removed;
}

std::optional<upload_task> upload_queue::find(const task_id& id) const {
    auto t = find_task(id);
    if (!t) {
        return std::nullopt;
    }
    return *t;
}

std::vector<upload_task> upload_queue::tasks() const {
    std::vector<upload_task> ret;
    ret.reserve(_tasks.size());
    for (auto& t : _tasks) {
        ret.push_back(*t);
    }
    return ret;
}

future<> upload_queue::drain() {
    co_await _idle.wait([this] { return idle(); });
}

void upload_queue::on_progress(upload_task& t, const progress_event& ev) {
    if (t.status != task_status::uploading) {
        return;
    }
    auto now = upload_task::clock_type::now();
    t.loaded = ev.bytes_loaded;
    auto elapsed = now - t.sampled_at;
    if (elapsed >= min_sample_interval) {
        auto seconds = std::chrono::duration<double>(elapsed).count();
        auto delta = t.loaded > t.sampled_bytes ? t.loaded - t.sampled_bytes : 0;
        auto rate = delta / seconds;
        t.speed = t.speed == 0 ? rate : speed_smoothing * rate + (1 - speed_smoothing) * t.speed;
        t.sampled_at = now;
        t.sampled_bytes = t.loaded;
    }
    notify(t);
}

future<> upload_queue::abort_in_background(object_location location, sstring resume_key, sstring upload_id, gate::holder holder) {
    co_await abort_multipart_upload(_svc, location, resume_key, upload_id);
}

void upload_queue::discard_remote_state(upload_task& t) {
    sstring upload_id;
    if (t.multipart) {
        upload_id = t.multipart->upload_id;
    } else if (auto rec = _svc.store.find(t.resume_key)) {
        upload_id = rec->state.upload_id;
    }
    t.multipart.reset();
    if (upload_id.empty()) {
        return;
    }
    auto holder = _background.try_hold();
    if (!holder) {
        uqlog.warn("Queue is stopping, multipart upload {} of {} is left behind", upload_id, t.location);
        return;
    }
    uqlog.debug("Aborting multipart upload {} of canceled task {}", upload_id, t.id);
    // abort_multipart_upload never fails
    std::ignore = abort_in_background(t.location, t.resume_key, std::move(upload_id), std::move(*holder));
}

future<> upload_queue::transfer(lw_shared_ptr<upload_task> task) {
    auto active = make_lw_shared<active_transfer>(task);
    _active = active;
    task->status = task_status::uploading;
    task->speed = 0;
    task->sampled_at = upload_task::clock_type::now();
    task->sampled_bytes = task->loaded;
    uqlog.debug("Task {} uploading {}", task->id, task->location);
    notify(*task);

    progress_handler on_progress = [this, t = task.get()](const progress_event& ev) {
        this->on_progress(*t, ev);
    };
    std::exception_ptr ex;
    try {
        do_upload_file upload(_svc, task->location, task->file, task->multipart, on_progress, &active->as);
        co_await upload.upload();
    } catch (...) {
        ex = std::current_exception();
    }
    _active = nullptr;

    if (!ex) {
        task->status = task_status::done;
        task->loaded = task->file.size;
        task->speed = 0;
        task->multipart.reset();
        uqlog.info("Task {} done: {} ({} bytes)", task->id, task->location, task->file.size);
    } else if (task->status == task_status::canceled) {
        // paused and then canceled before the transfer unwound
        discard_remote_state(*task);
    } else if (task->status == task_status::uploading) {
        task->status = task_status::error;
        task->speed = 0;
        task->error = exception_message(ex);
        uqlog.warn("Task {} failed: {}", task->id, *task->error);
    } else {
        uqlog.debug("Task {} stopped: {}", task->id, task->status);
    }
    notify(*task);
}

future<> upload_queue::run() {
    while (!_stopping) {
        co_await _runnable.wait([this] { return _stopping || has_runnable(); });
        if (_stopping) {
            break;
        }
        if (auto task = next_runnable()) {
            co_await transfer(std::move(task));
        }
    }
    uqlog.debug("Driver stopped");
}

} // namespace upload

auto fmt::formatter<upload::task_status>::format(upload::task_status s, fmt::format_context& ctx) const -> decltype(ctx.out()) {
    std::string_view name;
    switch (s) {
    case upload::task_status::queued:
        name = "queued";
        break;
    case upload::task_status::uploading:
        name = "uploading";
        break;
    case upload::task_status::paused:
        name = "paused";
        break;
    case upload::task_status::done:
        name = "done";
        break;
    case upload::task_status::error:
        name = "error";
        break;
    case upload::task_status::canceled:
        name = "canceled";
        break;
    }
    return fmt::format_to(ctx.out(), "{}", name);
}
