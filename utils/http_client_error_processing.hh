/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once
#include <exception>
#include <optional>
#include <string>
#include <system_error>
#include <type_traits>
#include <seastar/http/reply.hh>
#include <seastar/util/bool_class.hh>

namespace utils::http {

using retryable = seastar::bool_class<struct is_retryable>;

// 5xx, 408 and 429 are worth another attempt, anything else is final
retryable from_http_code(seastar::http::reply::status_type http_code);

// connection level failures (reset, refused, timed out, unreachable)
retryable from_system_error(const std::system_error& system_error);

// Handles exceptions of type Exc (and derived) with func.
template <typename Exc, typename F>
struct typed_handler {
    static_assert(std::is_base_of_v<std::exception, Exc>, "typed_handler can only handle std::exception types");
    using return_type = std::invoke_result_t<F, const Exc&>;

    F func;
    [[nodiscard]] bool matches(const std::exception& e) const noexcept { return dynamic_cast<const Exc*>(&e) != nullptr; }
    return_type handle(const std::exception& e) const { return func(static_cast<const Exc&>(e)); }
};

template <typename Exc, typename F>
auto make_handler(F&& f) {
    return typed_handler<Exc, std::decay_t<F>>{std::forward<F>(f)};
}

// Rethrows eptr and hands it to the first handler whose exception type
// matches, walking std::nested_exception chains from the outside in. When
// nothing matches, default_handler gets the innermost exception_ptr and the
// message of the outermost one. The result type need not be default
// constructible, so handlers may return exception objects to be thrown.
template <typename R, typename DefaultHandler, typename... Handlers>
R dispatch_exception(std::exception_ptr eptr, DefaultHandler default_handler, Handlers&&... handlers) {
    static_assert(std::is_same_v<R, std::invoke_result_t<DefaultHandler, std::exception_ptr, std::string&&>>,
                  "Default handler must return the same type R");
    static_assert((std::is_same_v<R, typename std::decay_t<Handlers>::return_type> && ...),
                  "All handlers must return the same type R");

    std::string original_message;

    while (eptr) {
        try {
            std::rethrow_exception(eptr);
        } catch (const std::exception& e) {
            if (original_message.empty()) {
                original_message = e.what();
            }

            std::optional<R> result;
            ((!result && handlers.matches(e) ? (void)result.emplace(handlers.handle(e)) : (void)0), ...);
            if (result) {
                return std::move(*result);
            }

            try {
                std::rethrow_if_nested(e);
            } catch (...) {
                eptr = std::current_exception();
                continue;
            }
            return default_handler(eptr, std::move(original_message));
        } catch (...) {
            return default_handler(eptr, std::move(original_message));
        }
    }
    return default_handler(eptr, std::move(original_message));
}

} // namespace utils::http
