/*

confirmation.hpp
----------------

Operator confirmation before destructive actions.

Tokens are compared exactly and case-sensitively; anything else declines.

*/

#pragma once

#include <iostream>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <mailpurge/detail/log.hpp>

namespace mailpurge
{

enum class confirmation_token
{
    yes,     ///< batch deletion through the mail API
    remove,  ///< retention settings removal
    del      ///< irreversible purge of a bulk search
};

[[nodiscard]] constexpr std::string_view to_string(confirmation_token token) noexcept
{
    switch (token)
    {
        case confirmation_token::yes: return "YES";
        case confirmation_token::remove: return "REMOVE";
        case confirmation_token::del: return "DELETE";
    }
    return "";
}

/// Exact, case-sensitive match; only a trailing line ending is dropped.
[[nodiscard]] inline std::optional<confirmation_token> parse_confirmation_token(std::string_view input) noexcept
{
    while (!input.empty() && (input.back() == '\r' || input.back() == '\n'))
        input.remove_suffix(1);

    for (auto token : {confirmation_token::yes, confirmation_token::remove, confirmation_token::del})
    {
        if (input == to_string(token))
            return token;
    }
    return std::nullopt;
}

class confirmation_gate
{
public:
    virtual ~confirmation_gate() = default;

    /// Show `message` and block until the operator answers.
    virtual std::string prompt(std::string_view message) = 0;

    /// True only when the answer is exactly the required token.
    bool confirm(std::string_view message, confirmation_token required)
    {
        const std::string required_text(to_string(required));
        MAILPURGE_INFO("Confirmation requested (" + required_text + "): " + std::string(message));
        const std::string answer = prompt(message);
        const auto token = parse_confirmation_token(answer);
        if (token && *token == required)
        {
            MAILPURGE_INFO("Operator confirmed with " + required_text + ".");
            return true;
        }
        MAILPURGE_WARN("Operator declined (expected " + required_text + ").");
        return false;
    }
};

/// Reads the answer from a line of text input, normally the terminal.
class console_confirmation_gate : public confirmation_gate
{
public:
    console_confirmation_gate(std::istream& in = std::cin, std::ostream& out = std::cout)
        : in_(in), out_(out)
    {
    }

    std::string prompt(std::string_view message) override
    {
        out_ << '\n' << message << "\n> " << std::flush;
        std::string line;
        if (!std::getline(in_, line))
            return {};
        return line;
    }

private:
    std::istream& in_;
    std::ostream& out_;
};

} // namespace mailpurge
