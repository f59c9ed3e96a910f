/*

http.hpp
--------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Request/response types and the transport seam shared by the remote backends.

*/

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <mailpurge/detail/asio_decl.hpp>
#include <mailpurge/detail/redact.hpp>
#include <mailpurge/detail/result.hpp>

namespace mailpurge::net
{

enum class http_verb
{
    get,
    post,
    del
};

[[nodiscard]] constexpr std::string_view to_string(http_verb verb) noexcept
{
    switch (verb)
    {
        case http_verb::get: return "GET";
        case http_verb::post: return "POST";
        case http_verb::del: return "DELETE";
    }
    return "GET";
}

using header_list = std::vector<std::pair<std::string, std::string>>;

[[nodiscard]] inline std::optional<std::string> find_header(const header_list& headers, std::string_view name)
{
    for (const auto& [key, value] : headers)
    {
        if (detail::iequals_ascii(key, name))
            return value;
    }
    return std::nullopt;
}

/// Replaces an existing header of the same name.
inline void set_header(header_list& headers, std::string name, std::string value)
{
    for (auto& [key, current] : headers)
    {
        if (detail::iequals_ascii(key, name))
        {
            current = std::move(value);
            return;
        }
    }
    headers.emplace_back(std::move(name), std::move(value));
}

struct http_request
{
    http_verb verb = http_verb::get;
    /// Origin-relative target, e.g. "/v1.0/users/a%40b.com/mailFolders".
    std::string target;
    std::string body;
    header_list headers;

    [[nodiscard]] std::optional<std::string> header(std::string_view name) const
    {
        return find_header(headers, name);
    }
};

struct http_response
{
    unsigned int status = 0;
    std::string body;
    header_list headers;

    [[nodiscard]] bool ok() const noexcept
    {
        return status >= 200 && status < 300;
    }

    [[nodiscard]] std::optional<std::string> header(std::string_view name) const
    {
        return find_header(headers, name);
    }
};

/**
Sends one request and returns the response, whatever its status.

Only transport failures (resolve, connect, TLS, I/O) are reported as errors; non-2xx
responses are returned for the caller to interpret.
**/
class http_transport
{
public:
    virtual ~http_transport() = default;

    virtual mailpurge::asio::awaitable<result<http_response>> send(http_request request) = 0;
};

} // namespace mailpurge::net
