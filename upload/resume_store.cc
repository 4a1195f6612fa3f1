/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "resume_store.hh"

#include <charconv>
#include <stdexcept>
#include <seastar/core/coroutine.hh>
#include <seastar/core/file.hh>
#include <seastar/core/fstream.hh>
#include <seastar/core/seastar.hh>
#include <seastar/coroutine/exception.hh>
#include <seastar/util/short_streams.hh>

#include "upload/transfer_strategy.hh"
#include "upload/utils/json_utils.hh"
#include "utils/log.hh"

namespace upload {

static logging::logger rslog("resume_store");

bool resume_record::matches(const object_location& loc, const source_file& file) const noexcept {
    if (location.bucket != loc.bucket || location.key != loc.key || size != file.size || last_modified != file.last_modified) {
        return false;
    }
    if (state.upload_id.empty() || state.part_size == 0) {
        return false;
    }
    auto nr_parts = transfer_strategy_selector::part_count(size, state.part_size);
    for (auto& [nr, etag] : state.parts) {
        if (nr < 1 || nr > nr_parts || etag.empty()) {
            return false;
        }
    }
    return true;
}

Json::Value resume_record::to_json() const {
    Json::Value v(Json::objectValue);
    v["uploadId"] = std::string(state.upload_id);
    v["partSize"] = Json::UInt64(state.part_size);
    Json::Value parts(Json::objectValue);
    for (auto& [nr, etag] : state.parts) {
        parts[std::to_string(nr)] = std::string(etag);
    }
    v["parts"] = std::move(parts);
    v["size"] = Json::UInt64(size);
    v["lastModified"] = Json::Int64(last_modified);
    v["bucket"] = std::string(location.bucket);
    v["key"] = std::string(location.key);
    v["name"] = std::string(name);
    return v;
}

resume_record resume_record::from_json(const Json::Value& v) {
    if (!v.isObject()) {
        throw std::invalid_argument("record is not an object");
    }
    if (!v["partSize"].isUInt64() || !v["size"].isUInt64() || !v["lastModified"].isInt64()) {
        throw std::invalid_argument("record sizes are missing or not numbers");
    }
    resume_record r;
    r.location.bucket = utils::get_string(v, "bucket");
    r.location.key = utils::get_string(v, "key");
    r.state.upload_id = utils::get_string(v, "uploadId");
    r.state.part_size = v["partSize"].asUInt64();
    r.size = v["size"].asUInt64();
    r.last_modified = v["lastModified"].asInt64();
    if (v["name"].isString()) {
        r.name = v["name"].asString();
    }
    auto& parts = v["parts"];
    if (!parts.isNull() && !parts.isObject()) {
        throw std::invalid_argument("parts is not an object");
    }
    for (auto& name : parts.getMemberNames()) {
        unsigned nr = 0;
        auto [ptr, ec] = std::from_chars(name.data(), name.data() + name.size(), nr);
        if (ec != std::errc() || ptr != name.data() + name.size() || !parts[name].isString()) {
            throw std::invalid_argument(fmt::format("invalid part entry '{}'", name));
        }
        r.state.parts.emplace(nr, parts[name].asString());
    }
    return r;
}

resume_store::resume_store(std::filesystem::path path)
    : _path(std::move(path)) {
}

future<> resume_store::load() {
    _records.clear();
    if (!co_await file_exists(_path.native())) {
        rslog.debug("No resume store at {}", _path);
        co_return;
    }
    auto f = co_await open_file_dma(_path.native(), open_flags::ro);
    auto in = make_file_input_stream(std::move(f));
    std::exception_ptr ex;
    sstring content;
    try {
        content = co_await util::read_entire_stream_contiguous(in);
    } catch (...) {
        ex = std::current_exception();
    }
    co_await in.close();
    if (ex) {
        co_await coroutine::return_exception_ptr(std::move(ex));
    }

    Json::Value root;
    try {
        root = utils::parse_json(content);
    } catch (const std::invalid_argument& e) {
        rslog.warn("Ignoring unreadable resume store {}: {}", _path, e.what());
        co_return;
    }
    if (!root.isObject()) {
        rslog.warn("Ignoring resume store {}: not a JSON object", _path);
        co_return;
    }
    for (auto& key : root.getMemberNames()) {
        try {
            _records.emplace(key, resume_record::from_json(root[key]));
        } catch (const std::invalid_argument& e) {
            rslog.warn("Dropping malformed resume record {}: {}", key, e.what());
        }
    }
    rslog.debug("Loaded {} resume record(s) from {}", _records.size(), _path);
}

std::optional<resume_record> resume_store::find(const sstring& key) const {
    auto it = _records.find(key);
    if (it == _records.end()) {
        return std::nullopt;
    }
    return it->second;
}

future<> resume_store::upsert(const sstring& key, resume_record record) {
    _records.insert_or_assign(key, std::move(record));
    co_await flush();
}

future<> resume_store::remove(const sstring& key) {
    if (_records.erase(key)) {
        co_await flush();
    }
}

future<> resume_store::flush() {
    auto units = co_await get_units(_flush_sem, 1);
    // snapshot after the semaphore is taken so that the last writer wins
    Json::Value root(Json::objectValue);
    for (auto& [key, record] : _records) {
        root[std::string(key)] = record.to_json();
    }
    auto content = utils::to_json_string(root);

    auto tmp = _path;
    tmp += ".tmp";
    auto f = co_await open_file_dma(tmp.native(), open_flags::wo | open_flags::create | open_flags::truncate);
    auto out = co_await make_file_output_stream(std::move(f));
    std::exception_ptr ex;
    try {
        co_await out.write(content.data(), content.size());
        co_await out.flush();
    } catch (...) {
        ex = std::current_exception();
    }
    co_await out.close();
    if (ex) {
        co_await coroutine::return_exception_ptr(std::move(ex));
    }
    co_await rename_file(tmp.native(), _path.native());
    auto dir = _path.has_parent_path() ? _path.parent_path() : std::filesystem::path(".");
    co_await sync_directory(dir.native());
    rslog.trace("Flushed {} record(s) to {}", _records.size(), _path);
}

} // namespace upload
