/*

bearer_retry.hpp
----------------

Send a request with a bearer token, refreshing the token once when the server answers 401.

*/

#pragma once

#include <string>
#include <utility>

#include <mailpurge/detail/asio_decl.hpp>
#include <mailpurge/detail/log.hpp>
#include <mailpurge/detail/result.hpp>
#include <mailpurge/net/http.hpp>
#include <mailpurge/oauth2/token_source.hpp>

namespace mailpurge::oauth2
{

inline void attach_bearer(net::http_request& request, const std::string& access_token)
{
    net::set_header(request.headers, "Authorization", "Bearer " + access_token);
}

inline mailpurge::asio::awaitable<result<net::http_response>> send_with_bearer(
    token_source& source, net::http_transport& transport, net::http_request request)
{
    auto token_res = source.get_access_token();
    if (!token_res)
        co_return fail<net::http_response>(std::move(token_res).error());

    attach_bearer(request, *token_res);
    auto first = co_await transport.send(request);
    if (!first || first->status != 401)
        co_return first;

    MAILPURGE_WARN("Access token rejected (401); refreshing and retrying once.");
    auto refresh_res = source.refresh_access_token();
    if (!refresh_res)
        co_return fail<net::http_response>(std::move(refresh_res).error());

    attach_bearer(request, *refresh_res);
    co_return co_await transport.send(std::move(request));
}

} // namespace mailpurge::oauth2
