/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "client_utils.hh"

#include <memory>

#include "utils/log.hh"

namespace upload::utils {

static logging::logger xmllog("store_xml");

std::optional<store_error> parse_store_error(seastar::sstring body) {
    if (body.empty()) {
        return std::nullopt;
    }
    auto doc = std::make_unique<rapidxml::xml_document<>>();
    try {
        doc->parse<0>(body.data());
    } catch (const rapidxml::parse_error& e) {
        xmllog.debug("cannot parse object store error body: {}", e.what());
        return std::nullopt;
    }
    auto error_node = doc->first_node("Error");
    if (!error_node) {
        return std::nullopt;
    }
    store_error ret;
    if (auto code = error_node->first_node("Code")) {
        ret.code = code->value();
    }
    if (auto message = error_node->first_node("Message")) {
        ret.message = message->value();
    }
    return ret;
}

} // namespace upload::utils
