/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <map>
#include <optional>
#include <fmt/core.h>
#include <seastar/core/abort_source.hh>
#include <seastar/core/file.hh>
#include <seastar/core/future.hh>

#include "upload/part_uploader.hh"
#include "upload/resume_store.hh"
#include "upload/signing_client.hh"
#include "upload/transfer_strategy.hh"
#include "upload/types.hh"

namespace upload {

// Collaborators shared by every transfer of an engine.
struct upload_services {
    signing_client& signer;
    part_uploader& uploader;
    resume_store& store;
    const transfer_strategy_selector& selector;
};

enum class upload_phase {
    uninitialized,
    initializing,
    transferring,
    completing,
    done,
    paused,
    aborted,
    failed,
};

// Best effort abort of a remote multipart upload followed by removal of its
// resume record. Abort failures are logged and dropped, the record goes
// away regardless.
future<> abort_multipart_upload(upload_services& svc, const object_location& location, const sstring& resume_key, const sstring& upload_id) noexcept;

// Drives one file through a multipart upload: create or resume, upload the
// missing parts with a bounded set of workers, persist every committed part
// and complete. state is the owner's in-memory copy of the upload, kept up
// to date after each part so that a paused or failed run can be resumed.
class multipart_upload {
    upload_services& _svc;
    object_location _location;
    const source_file& _file;
    std::optional<multipart_state>& _state;
    progress_handler& _progress;
    seastar::abort_source* _as;

    upload_phase _phase = upload_phase::uninitialized;
    sstring _resume_key;
    unsigned _nr_parts = 0;
    unsigned _next_part = 1;
    uint64_t _committed_bytes = 0;
    // part number -> bytes sent so far of parts in flight
    std::map<unsigned, uint64_t> _inflight;
    // cancels the workers of this run, on owner abort or on first failure
    seastar::abort_source _workers_as;
    std::exception_ptr _error;

    future<> do_upload();
    future<> init();
    future<> run_workers(file& f);
    future<> worker(file& f);
    future<sstring> upload_part_with_retries(file& f, unsigned part_number);
    future<sstring> upload_part(file& f, unsigned part_number);
    future<> commit_part(unsigned part_number, sstring etag);
    future<> persist();
    void report_progress();
    void set_phase(upload_phase phase);

public:
    multipart_upload(upload_services& svc,
                     object_location location,
                     const source_file& file,
                     std::optional<multipart_state>& state,
                     progress_handler& progress,
                     seastar::abort_source* as);

    // Resolves when the object is complete. On pause or cancel it fails
    // with the owner's abort exception, on error with the first failure.
    future<> upload();

    upload_phase phase() const noexcept { return _phase; }
};

} // namespace upload

template <>
struct fmt::formatter<upload::upload_phase> : fmt::formatter<string_view> {
    auto format(upload::upload_phase p, fmt::format_context& ctx) const -> decltype(ctx.out());
};
