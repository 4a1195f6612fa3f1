/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "json_utils.hh"

#include <memory>
#include <stdexcept>
#include <fmt/core.h>

namespace upload::utils {

Json::Value parse_json(std::string_view raw) {
    Json::Value root;
    Json::CharReaderBuilder rbuilder;
    std::unique_ptr<Json::CharReader> reader(rbuilder.newCharReader());
    std::string errs;
    if (!reader->parse(raw.data(), raw.data() + raw.size(), &root, &errs)) {
        throw std::invalid_argument(fmt::format("Failed to parse JSON: {}", errs));
    }
    return root;
}

seastar::sstring to_json_string(const Json::Value& value) {
    Json::StreamWriterBuilder wbuilder;
    wbuilder.settings_["indentation"] = "";
    auto str = Json::writeString(wbuilder, value);
    return seastar::sstring(str);
}

seastar::sstring get_string(const Json::Value& object, const char* name) {
    if (!object.isObject() || !object[name].isString()) {
        throw std::invalid_argument(fmt::format("'{}' is missing or not a string", name));
    }
    return seastar::sstring(object[name].asString());
}

} // namespace upload::utils
