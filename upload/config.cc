/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "config.hh"

#include <stdexcept>
#include <fmt/core.h>
#include <yaml-cpp/yaml.h>
#include <seastar/core/coroutine.hh>
#include <seastar/core/file.hh>
#include <seastar/core/fstream.hh>
#include <seastar/core/seastar.hh>
#include <seastar/coroutine/exception.hh>
#include <seastar/util/short_streams.hh>

#include "upload/credentials.hh"
#include "utils/log.hh"

using namespace std::string_literals;

namespace upload {

static logging::logger cfglog("upload_config");

// "Each part must be at least 5 MB in size, except the last part."
// https://docs.aws.amazon.com/AmazonS3/latest/API/API_UploadPart.html
static constexpr uint64_t aws_minimum_part_size = 5 * MB;

void transfer_config::validate() const {
    if (multipart_threshold == 0) {
        throw std::invalid_argument("multipart_threshold must be positive");
    }
    if (min_part_size == 0 || min_part_size > max_part_size) {
        throw std::invalid_argument(fmt::format("invalid part size range [{}, {}]", min_part_size, max_part_size));
    }
    if (target_part_count == 0) {
        throw std::invalid_argument("target_part_count must be positive");
    }
    if (max_concurrency == 0) {
        throw std::invalid_argument("max_concurrency must be positive");
    }
    if (min_part_size < aws_minimum_part_size) {
        cfglog.warn("min_part_size {} is below the S3 minimum of {} bytes, stores may reject all but the last part", min_part_size, aws_minimum_part_size);
    }
}

engine_config engine_config::decode(const YAML::Node& node) {
    if (!node.IsMap()) {
        throw std::invalid_argument("upload configuration must be a map");
    }
    auto get_opt = [](auto& node, const std::string& key, auto def) {
        auto tmp = node[key];
        return tmp ? tmp.template as<std::decay_t<decltype(def)>>() : def;
    };

    engine_config cfg;
    auto endpoint = node["signing_endpoint"];
    if (!endpoint) {
        throw std::invalid_argument("signing_endpoint is required");
    }
    try {
        cfg.signing_endpoint = endpoint.as<std::string>();
        cfg.auth_endpoint = get_opt(node, "auth_endpoint", ""s);
        cfg.auth_api_key = get_opt(node, "auth_api_key", ""s);
        auto env = environment_credentials();
        cfg.access_token = get_opt(node, "access_token", std::string(env.access_token));
        cfg.refresh_token = get_opt(node, "refresh_token", std::string(env.refresh_token));
        cfg.resume_store = get_opt(node, "resume_store", cfg.resume_store.native());
        cfg.max_connections = get_opt(node, "max_connections", cfg.max_connections);

        auto& t = cfg.transfer;
        t.multipart_threshold = get_opt(node, "multipart_threshold", t.multipart_threshold);
        t.min_part_size = get_opt(node, "min_part_size", t.min_part_size);
        t.max_part_size = get_opt(node, "max_part_size", t.max_part_size);
        t.target_part_count = get_opt(node, "target_part_count", t.target_part_count);
        t.max_concurrency = get_opt(node, "max_concurrency", t.max_concurrency);
        t.part_retries = get_opt(node, "part_retries", t.part_retries);
        t.retry_scale_ms = get_opt(node, "retry_scale_ms", t.retry_scale_ms);
    } catch (const YAML::Exception& e) {
        throw std::invalid_argument(fmt::format("Could not decode upload configuration: {}", e.what()));
    }
    if (cfg.max_connections == 0) {
        throw std::invalid_argument("max_connections must be positive");
    }
    cfg.transfer.validate();
    return cfg;
}

future<engine_config> load_engine_config(std::filesystem::path path) {
    auto f = co_await open_file_dma(path.native(), open_flags::ro);
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
    cfglog.debug("Loading upload configuration from {}", path);
    YAML::Node node;
    try {
        node = YAML::Load(std::string(content));
    } catch (const YAML::Exception& e) {
        throw std::invalid_argument(fmt::format("{}: {}", path.native(), e.what()));
    }
    co_return engine_config::decode(node);
}

} // namespace upload
