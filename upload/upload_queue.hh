/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <chrono>
#include <optional>
#include <vector>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <fmt/core.h>
#include <fmt/ostream.h>
#include <seastar/core/abort_source.hh>
#include <seastar/core/condition-variable.hh>
#include <seastar/core/gate.hh>
#include <seastar/core/shared_ptr.hh>

#include "upload/client_helpers/multipart_upload.hh"
#include "upload/task_subscription.hh"
#include "upload/types.hh"

namespace upload {

using task_id = boost::uuids::uuid;

enum class task_status {
    queued,
    uploading,
    paused,
    done,
    error,
    canceled,
};

struct upload_request {
    object_location location;
    source_file file;
};

struct upload_task {
    using clock_type = std::chrono::steady_clock;

    task_id id;
    object_location location;
    source_file file;
    sstring resume_key;
    task_status status = task_status::queued;
    // bytes transferred so far
    uint64_t loaded = 0;
    // bytes per second, exponentially smoothed
    double speed = 0;
    std::optional<sstring> error;
    std::optional<multipart_state> multipart;

    // last throughput sample
    clock_type::time_point sampled_at;
    uint64_t sampled_bytes = 0;

    bool terminal() const noexcept { return status == task_status::done || status == task_status::canceled; }
};

// FIFO of file uploads, transferred one at a time by a driver fiber.
//
// pause(), resume() and cancel() take effect immediately on the visible
// status, an in-flight transfer observes them at its next suspension point.
// Progress reported after a task left the uploading state is ignored.
class upload_queue {
    struct active_transfer {
        lw_shared_ptr<upload_task> task;
        seastar::abort_source as;

        explicit active_transfer(lw_shared_ptr<upload_task> t) : task(std::move(t)) {}
    };

    upload_services& _svc;
    std::vector<lw_shared_ptr<upload_task>> _tasks;
    bool _paused = false;
    bool _stopping = false;
    // wakes the driver when a task becomes runnable or on stop
    condition_variable _runnable;
    // wakes drain() waiters
    condition_variable _idle;
    std::optional<future<>> _driver;
    lw_shared_ptr<active_transfer> _active;
    gate _background;
    task_signal_type _on_task_changed;

    static constexpr std::chrono::milliseconds min_sample_interval{250};
    static constexpr double speed_smoothing = 0.3;

    lw_shared_ptr<upload_task> find_task(const task_id& id) const noexcept;
    lw_shared_ptr<upload_task> next_runnable() const noexcept;
    bool has_runnable() const noexcept;
    bool idle() const noexcept;
    void notify(const upload_task& t);
    void on_progress(upload_task& t, const progress_event& ev);
    future<> run();
    future<> transfer(lw_shared_ptr<upload_task> task);
    void discard_remote_state(upload_task& t);
    future<> abort_in_background(object_location location, sstring resume_key, sstring upload_id, gate::holder holder);

public:
    explicit upload_queue(upload_services& svc);
    upload_queue(const upload_queue&) = delete;
    ~upload_queue();

    // Starts the driver fiber.
    void start();
    // Pauses the active transfer, waits for the driver and for background
    // aborts of canceled uploads.
    future<> stop();

    std::vector<task_id> enqueue(std::vector<upload_request> requests);

    // Each returns false when id is unknown or the task's status does not
    // allow the transition.
    bool pause(const task_id& id);
    bool resume(const task_id& id);
    bool cancel(const task_id& id);

    void pause_all();
    void resume_all();
    bool paused() const noexcept { return _paused; }

    // Drops done, canceled and error tasks, returns how many were dropped.
    size_t clear_completed();

    std::optional<upload_task> find(const task_id& id) const;
    std::vector<upload_task> tasks() const;

    // Resolves once no task is uploading and none can be started.
    future<> drain();

    task_signal_connection_type on_task_changed(task_signal_callback_type cb);
};

} // namespace upload

template <> struct fmt::formatter<boost::uuids::uuid> : fmt::ostream_formatter {};

template <>
struct fmt::formatter<upload::task_status> : fmt::formatter<string_view> {
    auto format(upload::task_status s, fmt::format_context& ctx) const -> decltype(ctx.out());
};
