/*

url.hpp
-------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <string>
#include <string_view>

namespace mailpurge::net
{

inline constexpr char PERCENT_HEX_FLAG = '%';

/**
Percent encoding as described in RFC 3986 section 2.1.

Unreserved characters are kept, everything else becomes %XX with upper case hex digits.

@param txt        Text to encode.
@param keep_extra Additional characters to leave untouched, e.g. "@" inside a path segment.
@return           Encoded text.
**/
[[nodiscard]] inline std::string percent_encode(std::string_view txt, std::string_view keep_extra = {})
{
    static constexpr char HEX_DIGITS[] = "0123456789ABCDEF";

    std::string enc_text;
    enc_text.reserve(txt.size() * 3);
    for (char ch : txt)
    {
        const auto uch = static_cast<unsigned char>(ch);
        const bool unreserved = (uch >= 'A' && uch <= 'Z')
            || (uch >= 'a' && uch <= 'z')
            || (uch >= '0' && uch <= '9')
            || ch == '-' || ch == '.' || ch == '_' || ch == '~';
        if (unreserved || keep_extra.find(ch) != std::string_view::npos)
        {
            enc_text += ch;
        }
        else
        {
            enc_text += PERCENT_HEX_FLAG;
            enc_text += HEX_DIGITS[uch >> 4];
            enc_text += HEX_DIGITS[uch & 0x0F];
        }
    }
    return enc_text;
}

/// Encoding for a single path segment such as a mailbox address or message id.
[[nodiscard]] inline std::string encode_path_segment(std::string_view segment)
{
    return percent_encode(segment, "@");
}

/// Encoding for a query parameter value; OData keeps '$', ':' and ',' readable.
[[nodiscard]] inline std::string encode_query_value(std::string_view value)
{
    return percent_encode(value, ":,$");
}

/**
Turn an absolute link returned by the server into an origin-relative target.

Links on another host are rejected by returning an empty string.
**/
[[nodiscard]] inline std::string relative_target(std::string_view link, std::string_view host)
{
    constexpr std::string_view scheme = "https://";
    if (link.substr(0, 1) == "/")
        return std::string(link);
    if (link.substr(0, scheme.size()) != scheme)
        return {};
    link.remove_prefix(scheme.size());
    const auto slash = link.find('/');
    if (slash == std::string_view::npos)
        return {};
    if (link.substr(0, slash) != host)
        return {};
    return std::string(link.substr(slash));
}

} // namespace mailpurge::net
