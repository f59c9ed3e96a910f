#pragma once

#include <cctype>
#include <string>
#include <string_view>

namespace mailpurge::detail
{

[[nodiscard]] inline bool iequals_ascii(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size())
        return false;
    for (std::size_t i = 0; i < a.size(); ++i)
    {
        char ca = a[i];
        char cb = b[i];
        if (ca >= 'a' && ca <= 'z')
            ca = static_cast<char>(ca - ('a' - 'A'));
        if (cb >= 'a' && cb <= 'z')
            cb = static_cast<char>(cb - ('a' - 'A'));
        if (ca != cb)
            return false;
    }
    return true;
}

[[nodiscard]] inline bool starts_with_ci(std::string_view text, std::string_view prefix) noexcept
{
    if (text.size() < prefix.size())
        return false;
    return iequals_ascii(text.substr(0, prefix.size()), prefix);
}

[[nodiscard]] inline std::size_t find_ci(std::string_view text, std::string_view needle) noexcept
{
    if (needle.empty() || text.size() < needle.size())
        return std::string_view::npos;
    for (std::size_t i = 0; i + needle.size() <= text.size(); ++i)
    {
        if (iequals_ascii(text.substr(i, needle.size()), needle))
            return i;
    }
    return std::string_view::npos;
}

[[nodiscard]] inline bool is_token_char(unsigned char ch) noexcept
{
    return std::isalnum(ch) != 0
        || ch == '-' || ch == '_' || ch == '.' || ch == '~'
        || ch == '+' || ch == '/' || ch == '=' || ch == '%';
}

/// Replace the credential run starting at `pos` with "<redacted>".
inline void redact_run(std::string& text, std::size_t pos)
{
    std::size_t end = pos;
    while (end < text.size() && is_token_char(static_cast<unsigned char>(text[end])))
        ++end;
    if (end > pos)
        text.replace(pos, end - pos, "<redacted>");
}

/**
Hide bearer tokens in a header or payload line.

Handles "Authorization: Bearer <token>", JSON "access_token": "<token>" members and
access_token=<token> query parameters. Other text is returned unchanged.
**/
[[nodiscard]] inline std::string redact_line(std::string_view line)
{
    std::string result(line);

    constexpr std::string_view bearer = "bearer ";
    std::size_t pos = find_ci(result, bearer);
    while (pos != std::string::npos)
    {
        std::size_t start = pos + bearer.size();
        while (start < result.size() && result[start] == ' ')
            ++start;
        redact_run(result, start);
        const std::size_t next = find_ci(std::string_view(result).substr(start), bearer);
        pos = next == std::string_view::npos ? std::string::npos : start + next;
    }

    constexpr std::string_view json_key = "\"access_token\"";
    pos = find_ci(result, json_key);
    if (pos != std::string::npos)
    {
        std::size_t start = pos + json_key.size();
        while (start < result.size() && (result[start] == ' ' || result[start] == ':'))
            ++start;
        if (start < result.size() && result[start] == '"')
            redact_run(result, start + 1);
    }

    constexpr std::string_view query_key = "access_token=";
    pos = find_ci(result, query_key);
    if (pos != std::string::npos)
        redact_run(result, pos + query_key.size());

    return result;
}

} // namespace mailpurge::detail
