/*

result.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Error handling types using std::expected (C++23).
Library code never throws across its API, all errors are returned via result<T>.

*/

#pragma once

#include <cstdint>
#include <expected>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace mailpurge
{

/// Error categories for mailpurge operations
enum class errc : std::uint16_t
{
    ok = 0,

    // Validation, raised before any remote call
    invalid_argument,
    invalid_range,
    conflicting_filter,
    missing_credentials,

    // Authorization
    auth_failed,
    permission_denied,
    quota_exceeded,

    // Remote API
    throttled,
    not_found,
    http_status,
    invalid_response,
    job_failed,

    // Network
    net_resolve_failed,
    net_connect_failed,
    net_io_failed,
    net_timeout,
    net_eof,
    net_connection_reset,
    net_connection_refused,
    net_cancelled,
    tls_handshake_failed,
    tls_verify_failed,

    // Local
    io_error,
    internal_error
};

[[nodiscard]] constexpr std::string_view to_string(errc code) noexcept
{
    switch (code)
    {
        case errc::ok: return "ok";
        case errc::invalid_argument: return "invalid_argument";
        case errc::invalid_range: return "invalid_range";
        case errc::conflicting_filter: return "conflicting_filter";
        case errc::missing_credentials: return "missing_credentials";
        case errc::auth_failed: return "auth_failed";
        case errc::permission_denied: return "permission_denied";
        case errc::quota_exceeded: return "quota_exceeded";
        case errc::throttled: return "throttled";
        case errc::not_found: return "not_found";
        case errc::http_status: return "http_status";
        case errc::invalid_response: return "invalid_response";
        case errc::job_failed: return "job_failed";
        case errc::net_resolve_failed: return "net_resolve_failed";
        case errc::net_connect_failed: return "net_connect_failed";
        case errc::net_io_failed: return "net_io_failed";
        case errc::net_timeout: return "net_timeout";
        case errc::net_eof: return "net_eof";
        case errc::net_connection_reset: return "net_connection_reset";
        case errc::net_connection_refused: return "net_connection_refused";
        case errc::net_cancelled: return "net_cancelled";
        case errc::tls_handshake_failed: return "tls_handshake_failed";
        case errc::tls_verify_failed: return "tls_verify_failed";
        case errc::io_error: return "io_error";
        case errc::internal_error: return "internal_error";
    }
    return "unknown";
}

/// Bad filter combinations, malformed arguments and missing credentials.
[[nodiscard]] constexpr bool is_validation_error(errc code) noexcept
{
    return code == errc::invalid_argument
        || code == errc::invalid_range
        || code == errc::conflicting_filter
        || code == errc::missing_credentials;
}

/// Token or permission failures that end the run for a backend.
[[nodiscard]] constexpr bool is_auth_error(errc code) noexcept
{
    return code == errc::auth_failed;
}

/// Failures that no retry can fix for the same request.
[[nodiscard]] constexpr bool is_quota_or_permission_error(errc code) noexcept
{
    return code == errc::permission_denied || code == errc::quota_exceeded;
}

[[nodiscard]] constexpr bool is_network_error(errc code) noexcept
{
    return code >= errc::net_resolve_failed && code <= errc::tls_verify_failed;
}

struct error_info
{
    errc code = errc::ok;
    std::string message;
    std::string detail;
    std::error_code sys;
    std::source_location where;

    /// Single line rendering for logs: "code: message (detail)".
    [[nodiscard]] std::string to_string() const
    {
        std::string out(mailpurge::to_string(code));
        if (!message.empty())
        {
            out += ": ";
            out += message;
        }
        if (sys)
        {
            out += " [";
            out += sys.message();
            out += "]";
        }
        return out;
    }
};

[[nodiscard]] inline error_info make_error(errc code, std::string message, std::string detail = {},
    std::error_code sys = {}, std::source_location where = std::source_location::current())
{
    return error_info{code, std::move(message), std::move(detail), sys, where};
}

template<typename T>
using result = std::expected<T, error_info>;

using result_void = result<void>;

namespace detail
{

[[nodiscard]] inline std::unexpected<error_info> make_unexpected(error_info err)
{
    return std::unexpected<error_info>(std::move(err));
}

} // namespace detail

template<typename T>
[[nodiscard]] constexpr result<std::decay_t<T>> ok(T&& value)
{
    return result<std::decay_t<T>>(std::forward<T>(value));
}

[[nodiscard]] inline result_void ok()
{
    return result_void{};
}

template<typename T = void>
[[nodiscard]] inline result<T> fail(error_info err)
{
    return detail::make_unexpected(std::move(err));
}

template<typename T = void>
[[nodiscard]] inline result<T> fail(errc code, std::string message, std::string detail = {},
    std::error_code sys = {}, std::source_location where = std::source_location::current())
{
    return detail::make_unexpected(make_error(code, std::move(message), std::move(detail), sys, where));
}

inline result_void fail_void(errc code, std::string message, std::string detail = {},
    std::source_location where = std::source_location::current())
{
    return fail<void>(code, std::move(message), std::move(detail), {}, where);
}

} // namespace mailpurge
