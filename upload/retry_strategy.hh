/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once
#include <chrono>
#include <exception>
#include <seastar/core/future.hh>
#include <seastar/util/noncopyable_function.hh>

namespace upload {

class retry_strategy {
public:
    virtual ~retry_strategy() = default;
    // Resolves to true if the failed request can be sent again given the error and the number of retries already made.
    [[nodiscard]] virtual seastar::future<bool> should_retry(std::exception_ptr error, unsigned attempted_retries) const = 0;

    // Time to wait before the next attempt based on the error and attempted_retries count.
    [[nodiscard]] virtual std::chrono::milliseconds delay_before_retry(std::exception_ptr error, unsigned attempted_retries) const = 0;

    [[nodiscard]] virtual unsigned get_max_retries() const noexcept = 0;
};

// Exponential backoff for errors classified as retryable.
class default_retry_strategy : public retry_strategy {
    unsigned _max_retries;
    unsigned _scale_factor;

public:
    explicit default_retry_strategy(unsigned max_retries = 10, unsigned scale_factor = 25);

    [[nodiscard]] seastar::future<bool> should_retry(std::exception_ptr error, unsigned attempted_retries) const override;

    [[nodiscard]] std::chrono::milliseconds delay_before_retry(std::exception_ptr error, unsigned attempted_retries) const override;

    [[nodiscard]] unsigned get_max_retries() const noexcept override { return _max_retries; }
};

// Retries exactly once, after a 401, provided the credentials refresh
// succeeds. Any other failure, or a failed refresh, is final.
class refresh_on_unauthorized_strategy : public retry_strategy {
public:
    using refresh_func = seastar::noncopyable_function<seastar::future<>()>;

private:
    refresh_func _refresh;

public:
    explicit refresh_on_unauthorized_strategy(refresh_func refresh);

    [[nodiscard]] seastar::future<bool> should_retry(std::exception_ptr error, unsigned attempted_retries) const override;

    [[nodiscard]] std::chrono::milliseconds delay_before_retry(std::exception_ptr, unsigned) const override { return std::chrono::milliseconds(0); }

    [[nodiscard]] unsigned get_max_retries() const noexcept override { return 1; }
};

} // namespace upload
