/*

error_mapping.hpp
-----------------

Centralized mapping from Asio/Beast error codes and HTTP status codes to mailpurge::errc.

*/

#pragma once

#include <string_view>
#include <system_error>

#include <boost/beast/core/error.hpp>
#include <boost/beast/http/error.hpp>

#include <mailpurge/detail/asio_decl.hpp>
#include <mailpurge/detail/error_detail.hpp>
#include <mailpurge/detail/redact.hpp>
#include <mailpurge/detail/result.hpp>

namespace mailpurge::net
{

enum class io_stage
{
    resolve,
    connect,
    handshake,
    write,
    read
};

[[nodiscard]] constexpr std::string_view stage_name(io_stage stage) noexcept
{
    switch (stage)
    {
        case io_stage::resolve: return "resolve";
        case io_stage::connect: return "connect";
        case io_stage::handshake: return "handshake";
        case io_stage::write: return "write";
        case io_stage::read: return "read";
    }
    return "unknown";
}

[[nodiscard]] inline errc map_net_error(io_stage stage, mailpurge::asio::error_code ec, bool timeout_triggered) noexcept
{
    if (timeout_triggered || ec == boost::beast::error::timeout || ec == mailpurge::asio::error::timed_out)
        return errc::net_timeout;
    if (ec == mailpurge::asio::error::operation_aborted)
        return errc::net_cancelled;
    if (ec == mailpurge::asio::error::eof || ec == boost::beast::http::error::end_of_stream)
        return errc::net_eof;
    if (ec == mailpurge::asio::error::connection_refused)
        return errc::net_connection_refused;
    if (ec == mailpurge::asio::error::connection_reset ||
        ec == mailpurge::asio::error::broken_pipe)
        return errc::net_connection_reset;
    if (ec == mailpurge::asio::error::host_not_found ||
        ec == mailpurge::asio::error::host_not_found_try_again)
        return errc::net_resolve_failed;

    switch (stage)
    {
        case io_stage::resolve: return errc::net_resolve_failed;
        case io_stage::connect: return errc::net_connect_failed;
        case io_stage::handshake: return errc::tls_handshake_failed;
        case io_stage::write: return errc::net_io_failed;
        case io_stage::read: return errc::net_io_failed;
    }
    return errc::net_io_failed;
}

[[nodiscard]] inline detail::error_detail make_net_detail(
    std::string_view host,
    std::string_view service,
    io_stage stage,
    std::string_view op)
{
    detail::error_detail info;
    info.add("proto", "https");
    info.add("host", host);
    info.add("service", service);
    info.add("stage", stage_name(stage));
    info.add("op", op);
    return info;
}

/// Status codes the remote service uses to signal rate limiting.
[[nodiscard]] constexpr bool is_throttle_status(unsigned int status) noexcept
{
    return status == 429 || status == 503;
}

[[nodiscard]] constexpr bool is_success_status(unsigned int status) noexcept
{
    return status >= 200 && status < 300;
}

/// Exchange reports exhausted mailbox or tenant quota inside the error body.
[[nodiscard]] inline bool mentions_quota(std::string_view body) noexcept
{
    return detail::find_ci(body, "QuotaExceeded") != std::string_view::npos
        || detail::find_ci(body, "MailboxStoreQuota") != std::string_view::npos
        || detail::find_ci(body, "quota exceeded") != std::string_view::npos;
}

[[nodiscard]] inline errc map_http_status(unsigned int status, std::string_view body) noexcept
{
    if (is_success_status(status))
        return errc::ok;
    // The status decides for rate limiting, whatever the body says.
    if (is_throttle_status(status))
        return errc::throttled;
    if (mentions_quota(body))
        return errc::quota_exceeded;
    if (status == 401)
        return errc::auth_failed;
    if (status == 403)
        return errc::permission_denied;
    if (status == 404)
        return errc::not_found;
    return errc::http_status;
}

[[nodiscard]] inline detail::error_detail make_http_detail(
    std::string_view method,
    std::string_view target,
    unsigned int status,
    std::string_view body)
{
    detail::error_detail info;
    info.add("proto", "https");
    info.add("method", method);
    info.add("target", detail::redact_line(target));
    info.add("status", static_cast<std::uint64_t>(status));
    info.add_body("body", body);
    return info;
}

} // namespace mailpurge::net
