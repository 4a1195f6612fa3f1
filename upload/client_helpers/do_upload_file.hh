/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <optional>
#include <seastar/core/abort_source.hh>
#include <seastar/core/future.hh>

#include "upload/client_helpers/multipart_upload.hh"

namespace upload {

// Uploads one local file, with a single pre-signed PUT below the multipart
// threshold and with a (possibly resumed) multipart upload above it. The
// data read from disk is sent to the wire right away, without accumulating
// it first.
class do_upload_file {
    upload_services& _svc;
    object_location _location;
    const source_file& _file;
    std::optional<multipart_state>& _state;
    progress_handler& _progress;
    seastar::abort_source* _as;

    future<> put_object();

public:
    do_upload_file(upload_services& svc,
                   object_location location,
                   const source_file& file,
                   std::optional<multipart_state>& state,
                   progress_handler& progress,
                   seastar::abort_source* as);

    future<> upload();
};

} // namespace upload
