/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <functional>
#include <set>
#include <system_error>
#include <seastar/core/seastar.hh>
#include <seastar/core/sleep.hh>
#include <seastar/core/units.hh>
#include <seastar/testing/thread_test_case.hh>

#include "test/lib/log.hh"
#include "test/lib/mock_storage_server.hh"
#include "test/lib/tmpdir.hh"
#include "test/lib/upload_test_env.hh"
#include "upload/client_helpers/do_upload_file.hh"
#include "upload/client_helpers/multipart_upload.hh"
#include "upload/errors.hh"

using namespace upload;
using namespace std::chrono_literals;
using status_type = http::reply::status_type;

namespace {

// Collaborators of a multipart upload wired to a mock server. reopen()
// drops everything held in memory, as a process restart would.
struct transfer_env {
    tmpdir tmp;
    mock_storage_server server;
    engine_config cfg;
    shared_ptr<signing_client> signer;
    part_uploader uploader;
    std::unique_ptr<resume_store> store;
    std::unique_ptr<transfer_strategy_selector> selector;
    std::unique_ptr<upload_services> svc;
    object_location location{"media", "big.bin"};
    std::vector<progress_event> progress;
    progress_handler on_progress = [this](const progress_event& ev) {
        progress.push_back(ev);
    };

    explicit transfer_env(std::function<void(transfer_config&)> tweak = {})
        : server("127.0.0.1", random_test_port()) {
        server.start().get();
        cfg = make_test_config(server, tmp.path() / "resume.json");
        if (tweak) {
            tweak(cfg.transfer);
        }
        signer = signing_client::make(cfg.signing_endpoint, bearer_credentials{.access_token = cfg.access_token, .refresh_token = cfg.refresh_token});
        reopen();
    }

    ~transfer_env() {
        uploader.close().get();
        signer->close().get();
        server.stop().get();
    }

    void reopen() {
        store = std::make_unique<resume_store>(cfg.resume_store);
        store->load().get();
        selector = std::make_unique<transfer_strategy_selector>(cfg.transfer);
        svc = std::make_unique<upload_services>(upload_services{*signer, uploader, *store, *selector});
    }

    source_file make_file(size_t size, sstring* content = nullptr) {
        auto path = tmp.path() / "big.bin";
        auto data = write_test_file(path, size);
        if (content) {
            *content = std::move(data);
        }
        return make_source_file(path).get();
    }

    sstring resume_key(const source_file& f) const {
        return make_resume_key(location, f.size, f.last_modified);
    }

    // record as found in the file, not in the store's memory
    std::optional<resume_record> record_on_disk(const source_file& f) const {
        resume_store disk(cfg.resume_store);
        disk.load().get();
        return disk.find(resume_key(f));
    }

    void require_progress_within(const source_file& f) const {
        for (auto& ev : progress) {
            BOOST_REQUIRE_LE(ev.bytes_loaded, f.size);
            BOOST_REQUIRE_EQUAL(ev.bytes_total, f.size);
        }
    }
};

std::set<unsigned> part_numbers(const multipart_state& state) {
    std::set<unsigned> ret;
    for (auto& [nr, etag] : state.parts) {
        ret.insert(nr);
    }
    return ret;
}

std::set<unsigned> all_parts(unsigned count) {
    std::set<unsigned> ret;
    for (unsigned nr = 1; nr <= count; ++nr) {
        ret.insert(nr);
    }
    return ret;
}

// Resumes from whatever state holds and checks that only the parts missing
// from it are sent.
void require_resume_sends_only_missing_parts(transfer_env& env, const source_file& f, const sstring& content,
        std::optional<multipart_state>& state, unsigned nr_parts) {
    auto committed = part_numbers(*state);
    env.server.clear_failures();
    env.server.reset_stats();
    multipart_upload again(*env.svc, env.location, f, state, env.on_progress, nullptr);
    again.upload().get();

    auto& stats = env.server.get_stats();
    std::set<unsigned> sent(stats.part_puts.begin(), stats.part_puts.end());
    BOOST_REQUIRE_EQUAL(stats.part_puts.size(), sent.size());
    for (auto nr : sent) {
        BOOST_REQUIRE(!committed.contains(nr));
    }
    BOOST_REQUIRE_EQUAL(sent.size() + committed.size(), nr_parts);
    BOOST_REQUIRE_EQUAL(stats.creates, 0u);
    std::set<unsigned> completed(stats.completed_parts.begin(), stats.completed_parts.end());
    BOOST_REQUIRE(completed == all_parts(nr_parts));
    BOOST_REQUIRE_EQUAL(*env.server.object("media", "big.bin"), content);
    BOOST_REQUIRE(!state);
    env.require_progress_within(f);
}

}

SEASTAR_THREAD_TEST_CASE(test_put_bytes_sends_exact_range) {
    transfer_env env;
    sstring content;
    auto f = env.make_file(3 * MB, &content);
    auto url = env.signer->sign_single_upload(env.location, f.content_type).get();
    auto fd = open_file_dma(f.path.native(), open_flags::ro).get();
    auto etag = env.uploader.put_bytes(url, fd, byte_range{1 * MB, 100 * KB}, f.content_type, env.on_progress).get();
    fd.close().get();

    BOOST_REQUIRE(!etag.empty());
    BOOST_REQUIRE_EQUAL(*env.server.object("media", "big.bin"), content.substr(1 * MB, 100 * KB));
    BOOST_REQUIRE(!env.progress.empty());
    BOOST_REQUIRE_EQUAL(env.progress.back().bytes_loaded, 100 * KB);
    BOOST_REQUIRE_EQUAL(env.progress.back().bytes_total, 100 * KB);
}

SEASTAR_THREAD_TEST_CASE(test_put_bytes_without_etag) {
    transfer_env env;
    auto f = env.make_file(64 * KB);
    env.server.omit_etag(true);
    auto url = env.signer->sign_single_upload(env.location, f.content_type).get();
    auto fd = open_file_dma(f.path.native(), open_flags::ro).get();
    BOOST_REQUIRE_THROW(env.uploader.put_bytes(url, fd, byte_range{0, f.size}, f.content_type, env.on_progress).get(), missing_etag);
    fd.close().get();
}

SEASTAR_THREAD_TEST_CASE(test_put_bytes_reports_store_error) {
    transfer_env env;
    auto f = env.make_file(64 * KB);
    auto upload_id = env.signer->create_multipart(env.location, f.content_type).get();
    auto url = env.signer->sign_part(env.location, upload_id, 1).get();
    env.server.fail_parts_from(1, status_type::forbidden);
    auto fd = open_file_dma(f.path.native(), open_flags::ro).get();
    try {
        env.uploader.put_bytes(url, fd, byte_range{0, f.size}, f.content_type, env.on_progress).get();
        BOOST_FAIL("expected transfer_failed");
    } catch (const transfer_failed& e) {
        BOOST_REQUIRE_EQUAL(e.status(), 403u);
        BOOST_REQUIRE(e.is_retryable() == retryable::no);
        BOOST_REQUIRE(std::string_view(e.what()).find("InternalError") != std::string_view::npos);
    }
    fd.close().get();
}

SEASTAR_THREAD_TEST_CASE(test_put_bytes_aborted_before_start) {
    transfer_env env;
    auto f = env.make_file(64 * KB);
    auto url = env.signer->sign_single_upload(env.location, f.content_type).get();
    abort_source as;
    as.request_abort_ex(upload_canceled(cancel_reason::pause));
    auto fd = open_file_dma(f.path.native(), open_flags::ro).get();
    BOOST_REQUIRE_THROW(env.uploader.put_bytes(url, fd, byte_range{0, f.size}, f.content_type, env.on_progress, &as).get(), upload_canceled);
    fd.close().get();
    BOOST_REQUIRE_EQUAL(env.server.get_stats().single_puts, 0u);
}

SEASTAR_THREAD_TEST_CASE(test_multipart_upload_completes) {
    transfer_env env([](transfer_config& t) { t.max_concurrency = 3; });
    sstring content;
    auto f = env.make_file(5 * MB + MB / 2, &content);
    std::optional<multipart_state> state;
    multipart_upload mpu(*env.svc, env.location, f, state, env.on_progress, nullptr);
    mpu.upload().get();

    auto& stats = env.server.get_stats();
    BOOST_REQUIRE(mpu.phase() == upload_phase::done);
    BOOST_REQUIRE_EQUAL(stats.creates, 1u);
    BOOST_REQUIRE_EQUAL(stats.part_puts.size(), 6u);
    BOOST_REQUIRE(stats.completed_parts == std::vector<unsigned>({1, 2, 3, 4, 5, 6}));
    BOOST_REQUIRE_EQUAL(*env.server.object("media", "big.bin"), content);
    BOOST_REQUIRE(!state);
    BOOST_REQUIRE(!env.store->find(env.resume_key(f)));
    BOOST_REQUIRE_EQUAL(stats.wrong_host, 0u);
    BOOST_REQUIRE_EQUAL(env.progress.back().bytes_loaded, f.size);
    env.require_progress_within(f);
}

SEASTAR_THREAD_TEST_CASE(test_concurrent_parts_failure_keeps_only_acknowledged_parts) {
    transfer_env env([](transfer_config& t) { t.max_concurrency = 3; });
    sstring content;
    auto f = env.make_file(6 * MB, &content);
    // part 3 stays unanswered, part 4 can only start once 1 or 2 is committed
    auto arrived = env.server.hold_part(3);
    env.server.fail_parts_from(4, status_type::forbidden);
    std::optional<multipart_state> state;
    {
        multipart_upload mpu(*env.svc, env.location, f, state, env.on_progress, nullptr);
        auto done = mpu.upload();
        arrived.get();
        BOOST_REQUIRE_THROW(done.get(), transfer_failed);
        BOOST_REQUIRE(mpu.phase() == upload_phase::failed);
    }
    env.server.release_held_part();
    seastar::sleep(50ms).get();

    BOOST_REQUIRE(state);
    auto committed = part_numbers(*state);
    BOOST_REQUIRE(!committed.empty());
    for (auto nr : committed) {
        BOOST_REQUIRE(nr == 1 || nr == 2);
    }
    auto rec = env.record_on_disk(f);
    BOOST_REQUIRE(rec);
    BOOST_REQUIRE(part_numbers(rec->state) == committed);
    env.require_progress_within(f);

    require_resume_sends_only_missing_parts(env, f, content, state, 6);
}

SEASTAR_THREAD_TEST_CASE(test_pause_with_parts_in_flight) {
    transfer_env env([](transfer_config& t) { t.max_concurrency = 3; });
    sstring content;
    auto f = env.make_file(6 * MB, &content);
    auto arrived = env.server.hold_part(2);
    abort_source as;
    std::optional<multipart_state> state;
    {
        multipart_upload mpu(*env.svc, env.location, f, state, env.on_progress, &as);
        auto done = mpu.upload();
        arrived.get();
        as.request_abort_ex(upload_canceled(cancel_reason::pause));
        BOOST_REQUIRE_THROW(done.get(), upload_canceled);
        BOOST_REQUIRE(mpu.phase() == upload_phase::paused);
    }
    env.server.release_held_part();
    seastar::sleep(50ms).get();

    BOOST_REQUIRE(state);
    auto committed = part_numbers(*state);
    BOOST_REQUIRE(!committed.contains(2));
    auto rec = env.record_on_disk(f);
    BOOST_REQUIRE(rec);
    BOOST_REQUIRE(part_numbers(rec->state) == committed);
    BOOST_REQUIRE_EQUAL(env.server.get_stats().aborts, 0u);
    env.require_progress_within(f);

    require_resume_sends_only_missing_parts(env, f, content, state, 6);
}

SEASTAR_THREAD_TEST_CASE(test_failed_persist_does_not_send_the_part_again) {
    transfer_env env([](transfer_config& t) { t.part_retries = 2; });
    sstring content;
    auto f = env.make_file(3 * MB, &content);
    auto arrived = env.server.hold_part(2);
    std::optional<multipart_state> state;
    auto tmp_path = env.cfg.resume_store;
    tmp_path += ".tmp";
    {
        multipart_upload mpu(*env.svc, env.location, f, state, env.on_progress, nullptr);
        auto done = mpu.upload();
        arrived.get();
        // a directory in the way of the store's temporary file fails the next flush
        touch_directory(tmp_path.native()).get();
        env.server.release_held_part();
        BOOST_REQUIRE_THROW(done.get(), std::system_error);
        BOOST_REQUIRE(mpu.phase() == upload_phase::failed);
    }
    BOOST_REQUIRE(env.server.get_stats().part_puts == std::vector<unsigned>({1, 2}));
    BOOST_REQUIRE(state);
    BOOST_REQUIRE(part_numbers(*state) == std::set<unsigned>({1, 2}));
    auto rec = env.record_on_disk(f);
    BOOST_REQUIRE(rec);
    BOOST_REQUIRE(part_numbers(rec->state) == std::set<unsigned>({1}));
    BOOST_REQUIRE_EQUAL(env.progress.back().bytes_loaded, 2 * MB);
    env.require_progress_within(f);

    remove_file(tmp_path.native()).get();
    require_resume_sends_only_missing_parts(env, f, content, state, 3);
    BOOST_REQUIRE(env.server.get_stats().part_puts == std::vector<unsigned>({3}));
}

SEASTAR_THREAD_TEST_CASE(test_dispatch_by_size) {
    transfer_env env;
    std::optional<multipart_state> state;
    auto small = env.make_file(1 * MB);
    do_upload_file(*env.svc, env.location, small, state, env.on_progress, nullptr).upload().get();
    BOOST_REQUIRE_EQUAL(env.server.get_stats().single_puts, 1u);
    BOOST_REQUIRE_EQUAL(env.server.get_stats().creates, 0u);

    auto large = env.make_file(2 * MB);
    do_upload_file(*env.svc, env.location, large, state, env.on_progress, nullptr).upload().get();
    BOOST_REQUIRE_EQUAL(env.server.get_stats().single_puts, 1u);
    BOOST_REQUIRE_EQUAL(env.server.get_stats().creates, 1u);
    BOOST_REQUIRE_EQUAL(env.server.get_stats().part_puts.size(), 2u);
}

SEASTAR_THREAD_TEST_CASE(test_resume_after_restart_uploads_only_missing_parts) {
    transfer_env env;
    sstring content;
    auto f = env.make_file(8 * MB, &content);

    env.server.fail_parts_from(5, status_type::forbidden);
    {
        std::optional<multipart_state> state;
        multipart_upload mpu(*env.svc, env.location, f, state, env.on_progress, nullptr);
        BOOST_REQUIRE_THROW(mpu.upload().get(), transfer_failed);
        BOOST_REQUIRE(mpu.phase() == upload_phase::failed);
        BOOST_REQUIRE(state);
        BOOST_REQUIRE_EQUAL(state->parts.size(), 4u);
    }
    auto rec = env.store->find(env.resume_key(f));
    BOOST_REQUIRE(rec);
    BOOST_REQUIRE_EQUAL(rec->state.parts.size(), 4u);
    BOOST_REQUIRE_EQUAL(rec->state.parts.rbegin()->first, 4u);

    // a new process: nothing in memory, the record comes from disk
    env.server.clear_failures();
    env.server.reset_stats();
    env.reopen();
    std::optional<multipart_state> state;
    multipart_upload mpu(*env.svc, env.location, f, state, env.on_progress, nullptr);
    mpu.upload().get();

    auto& stats = env.server.get_stats();
    BOOST_REQUIRE_EQUAL(stats.creates, 0u);
    BOOST_REQUIRE(stats.part_puts == std::vector<unsigned>({5, 6, 7, 8}));
    BOOST_REQUIRE(stats.completed_parts == std::vector<unsigned>({1, 2, 3, 4, 5, 6, 7, 8}));
    BOOST_REQUIRE_EQUAL(*env.server.object("media", "big.bin"), content);
    BOOST_REQUIRE(!env.store->find(env.resume_key(f)));
}

SEASTAR_THREAD_TEST_CASE(test_stale_record_is_discarded) {
    transfer_env env;
    auto f = env.make_file(3 * MB);
    auto key = env.resume_key(f);
    resume_record stale;
    stale.location = env.location;
    stale.size = f.size + 1;
    stale.last_modified = f.last_modified;
    stale.state = multipart_state{.upload_id = "upload-from-elsewhere", .part_size = 1 * MB, .parts = {{1, "x"}}};
    env.store->upsert(key, stale).get();

    std::optional<multipart_state> state;
    multipart_upload mpu(*env.svc, env.location, f, state, env.on_progress, nullptr);
    mpu.upload().get();
    BOOST_REQUIRE_EQUAL(env.server.get_stats().creates, 1u);
    BOOST_REQUIRE(env.server.get_stats().part_puts == std::vector<unsigned>({1, 2, 3}));
    BOOST_REQUIRE(!env.store->find(key));
}

SEASTAR_THREAD_TEST_CASE(test_transient_part_failures_are_retried) {
    transfer_env env([](transfer_config& t) { t.part_retries = 2; });
    sstring content;
    auto f = env.make_file(3 * MB, &content);
    env.server.fail_next_puts(2, status_type::service_unavailable);
    std::optional<multipart_state> state;
    multipart_upload mpu(*env.svc, env.location, f, state, env.on_progress, nullptr);
    mpu.upload().get();
    BOOST_REQUIRE(env.server.get_stats().part_puts == std::vector<unsigned>({1, 1, 1, 2, 3}));
    BOOST_REQUIRE_EQUAL(*env.server.object("media", "big.bin"), content);
}

SEASTAR_THREAD_TEST_CASE(test_missing_etag_fails_the_upload) {
    transfer_env env([](transfer_config& t) { t.part_retries = 1; });
    auto f = env.make_file(3 * MB);
    env.server.omit_etag(true);
    std::optional<multipart_state> state;
    multipart_upload mpu(*env.svc, env.location, f, state, env.on_progress, nullptr);
    BOOST_REQUIRE_THROW(mpu.upload().get(), missing_etag);
    BOOST_REQUIRE(mpu.phase() == upload_phase::failed);
    BOOST_REQUIRE(env.server.get_stats().part_puts == std::vector<unsigned>({1, 1}));
    BOOST_REQUIRE(state);
    BOOST_REQUIRE(state->parts.empty());
    auto rec = env.store->find(env.resume_key(f));
    BOOST_REQUIRE(rec);
    BOOST_REQUIRE_EQUAL(rec->state.upload_id, state->upload_id);
}

SEASTAR_THREAD_TEST_CASE(test_cancel_aborts_remote_upload) {
    transfer_env env;
    auto f = env.make_file(4 * MB);
    auto arrived = env.server.hold_part(2);
    abort_source as;
    std::optional<multipart_state> state;
    multipart_upload mpu(*env.svc, env.location, f, state, env.on_progress, &as);
    auto done = mpu.upload();
    arrived.get();
    as.request_abort_ex(upload_canceled(cancel_reason::cancel));
    BOOST_REQUIRE_THROW(done.get(), upload_canceled);

    BOOST_REQUIRE(mpu.phase() == upload_phase::aborted);
    BOOST_REQUIRE_EQUAL(env.server.get_stats().aborts, 1u);
    BOOST_REQUIRE_EQUAL(env.server.pending_uploads(), 0u);
    BOOST_REQUIRE(!state);
    BOOST_REQUIRE(!env.store->find(env.resume_key(f)));

    env.server.release_held_part();
    seastar::sleep(50ms).get();
    BOOST_REQUIRE(env.server.get_stats().part_puts == std::vector<unsigned>({1, 2}));
    BOOST_REQUIRE_EQUAL(env.server.get_stats().completes, 0u);
}

SEASTAR_THREAD_TEST_CASE(test_cancel_removes_record_when_abort_fails) {
    transfer_env env;
    auto f = env.make_file(4 * MB);
    env.server.fail_abort(true);
    auto arrived = env.server.hold_part(1);
    abort_source as;
    std::optional<multipart_state> state;
    multipart_upload mpu(*env.svc, env.location, f, state, env.on_progress, &as);
    auto done = mpu.upload();
    arrived.get();
    as.request_abort_ex(upload_canceled(cancel_reason::cancel));
    BOOST_REQUIRE_THROW(done.get(), upload_canceled);
    BOOST_REQUIRE_EQUAL(env.server.get_stats().aborts, 1u);
    BOOST_REQUIRE(!env.store->find(env.resume_key(f)));
    env.server.release_held_part();
}

SEASTAR_THREAD_TEST_CASE(test_pause_keeps_committed_parts) {
    transfer_env env;
    auto f = env.make_file(4 * MB);
    auto arrived = env.server.hold_part(3);
    abort_source as;
    std::optional<multipart_state> state;
    multipart_upload mpu(*env.svc, env.location, f, state, env.on_progress, &as);
    auto done = mpu.upload();
    arrived.get();
    as.request_abort_ex(upload_canceled(cancel_reason::pause));
    BOOST_REQUIRE_THROW(done.get(), upload_canceled);

    BOOST_REQUIRE(mpu.phase() == upload_phase::paused);
    BOOST_REQUIRE_EQUAL(env.server.get_stats().aborts, 0u);
    BOOST_REQUIRE(state);
    BOOST_REQUIRE_EQUAL(state->parts.size(), 2u);
    auto rec = env.store->find(env.resume_key(f));
    BOOST_REQUIRE(rec);
    BOOST_REQUIRE_EQUAL(rec->state.parts.size(), 2u);
    BOOST_REQUIRE(!rec->state.parts.contains(3));
    env.server.release_held_part();

    // the in-memory state is picked up by the next run
    env.server.reset_stats();
    multipart_upload again(*env.svc, env.location, f, state, env.on_progress, nullptr);
    again.upload().get();
    BOOST_REQUIRE(env.server.get_stats().part_puts == std::vector<unsigned>({3, 4}));
    BOOST_REQUIRE_EQUAL(env.server.get_stats().creates, 0u);
}

SEASTAR_THREAD_TEST_CASE(test_too_many_parts_are_rejected) {
    transfer_env env;
    source_file huge{.path = env.tmp.path() / "does-not-exist", .size = 10001 * MB, .last_modified = 1, .name = "huge", .content_type = "application/octet-stream"};
    std::optional<multipart_state> state;
    multipart_upload mpu(*env.svc, env.location, huge, state, env.on_progress, nullptr);
    try {
        mpu.upload().get();
        BOOST_FAIL("expected transfer_failed");
    } catch (const transfer_failed& e) {
        BOOST_REQUIRE(e.is_retryable() == retryable::no);
    }
    BOOST_REQUIRE_EQUAL(env.server.get_stats().creates, 0u);
    BOOST_REQUIRE(!state);
}
