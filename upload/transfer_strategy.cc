/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "transfer_strategy.hh"

#include <algorithm>

namespace upload {

static uint64_t div_ceil(uint64_t a, uint64_t b) {
    return (a + b - 1) / b;
}

transfer_strategy_selector::transfer_strategy_selector(transfer_config cfg)
    : _cfg(std::move(cfg)) {
    _cfg.validate();
}

transfer_strategy transfer_strategy_selector::choose(uint64_t size) const noexcept {
    return size >= _cfg.multipart_threshold ? transfer_strategy::multipart : transfer_strategy::single;
}

uint64_t transfer_strategy_selector::part_size(uint64_t size) const noexcept {
    auto ps = std::clamp(div_ceil(size, _cfg.target_part_count), _cfg.min_part_size, _cfg.max_part_size);
    return div_ceil(ps, MB) * MB;
}

unsigned transfer_strategy_selector::part_count(uint64_t size, uint64_t part_size) noexcept {
    return div_ceil(size, part_size);
}

byte_range transfer_strategy_selector::part_range(uint64_t size, uint64_t part_size, unsigned part_number) noexcept {
    uint64_t off = uint64_t(part_number - 1) * part_size;
    uint64_t end = std::min(size, off + part_size);
    return byte_range{off, end - off};
}

} // namespace upload
