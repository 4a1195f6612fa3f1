/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <cstdint>
#include <fmt/core.h>

#include "upload/config.hh"
#include "upload/types.hh"

namespace upload {

// "Part numbers can be any number from 1 to 10,000, inclusive."
// https://docs.aws.amazon.com/AmazonS3/latest/API/API_UploadPart.html
static constexpr unsigned aws_maximum_parts_in_piece = 10'000;

enum class transfer_strategy {
    single,
    multipart,
};

class transfer_strategy_selector {
    transfer_config _cfg;

public:
    explicit transfer_strategy_selector(transfer_config cfg);

    transfer_strategy choose(uint64_t size) const noexcept;

    // ceil(size / target_part_count) clamped into [min, max] and rounded
    // up to a whole MiB
    uint64_t part_size(uint64_t size) const noexcept;

    const transfer_config& config() const noexcept { return _cfg; }

    static unsigned part_count(uint64_t size, uint64_t part_size) noexcept;
    // byte range of the 1-based part_number
    static byte_range part_range(uint64_t size, uint64_t part_size, unsigned part_number) noexcept;
};

} // namespace upload

template <>
struct fmt::formatter<upload::transfer_strategy> : fmt::formatter<string_view> {
    auto format(upload::transfer_strategy s, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(), "{}", s == upload::transfer_strategy::single ? "single" : "multipart");
    }
};
