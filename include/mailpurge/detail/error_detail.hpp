/*

error_detail.hpp
----------------

Header-only helper to build structured error_info::detail strings.

Each entry is formatted as key=value\n to ease parsing and redaction.

*/

#pragma once

#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

#include <mailpurge/detail/redact.hpp>

namespace mailpurge::detail
{

class error_detail
{
public:
    error_detail() = default;

    error_detail& add(std::string_view key, std::string_view value)
    {
        append_key(key);
        out_.append(value.data(), value.size());
        out_.push_back('\n');
        return *this;
    }

    error_detail& add(std::string_view key, std::uint64_t v)
    {
        append_key(key);
        append_int(v);
        out_.push_back('\n');
        return *this;
    }

    error_detail& add_ec(std::string_view key, std::error_code ec)
    {
        append_key(key);
        append_int(static_cast<std::uint64_t>(ec.value()));
        const std::string msg = ec.message();
        if (!msg.empty())
        {
            out_.push_back(' ');
            out_.append(msg);
        }
        out_.push_back('\n');
        return *this;
    }

    /// Response bodies are truncated and scrubbed of tokens.
    error_detail& add_body(std::string_view key, std::string_view body)
    {
        constexpr std::size_t max_body = 512;
        std::string_view shown = body.substr(0, max_body);
        std::string clean = redact_line(shown);
        for (char& ch : clean)
        {
            if (ch == '\n' || ch == '\r')
                ch = ' ';
        }
        return add(key, clean);
    }

    [[nodiscard]] std::string str() const
    {
        return out_;
    }

private:
    std::string out_;

    void append_key(std::string_view key)
    {
        out_.append(key.data(), key.size());
        out_.push_back('=');
    }

    void append_int(std::uint64_t v)
    {
        char buffer[32]{};
        const auto res = std::to_chars(std::begin(buffer), std::end(buffer), v);
        if (res.ec == std::errc{})
            out_.append(buffer, static_cast<std::size_t>(res.ptr - buffer));
        else
            out_.append("0");
    }
};

} // namespace mailpurge::detail
