/*

size_parser.hpp
---------------

Parsing of human readable size strings reported by mailbox and search statistics.

Patterns are tried in a fixed order:
  1. parenthesized bytes   "1.2 GB (1,288,490,189 bytes)"
  2. bare bytes            "1,288,490,189 bytes"
  3. unit suffixed         "1.5 GB", "512 KB", "0 B"
  4. plain digits          "1288490189"

Anything else is reported as unparseable, never as zero.

*/

#pragma once

#include <charconv>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <variant>

#include <mailpurge/detail/redact.hpp>

namespace mailpurge
{

struct byte_count
{
    std::uint64_t bytes = 0;
};

struct unparseable
{
    std::string text;
};

using parsed_size = std::variant<byte_count, unparseable>;

namespace detail
{

[[nodiscard]] inline std::string_view trim_ascii(std::string_view text) noexcept
{
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t'))
        text.remove_prefix(1);
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t' || text.back() == '\r' || text.back() == '\n'))
        text.remove_suffix(1);
    return text;
}

/// Digits with optional thousands separators, e.g. "1,288,490,189".
[[nodiscard]] inline std::optional<std::uint64_t> parse_grouped_digits(std::string_view text)
{
    std::string digits;
    digits.reserve(text.size());
    for (char ch : text)
    {
        if (ch >= '0' && ch <= '9')
            digits.push_back(ch);
        else if (ch != ',')
            return std::nullopt;
    }
    if (digits.empty())
        return std::nullopt;

    std::uint64_t value = 0;
    const auto res = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (res.ec != std::errc{} || res.ptr != digits.data() + digits.size())
        return std::nullopt;
    return value;
}

[[nodiscard]] inline std::optional<std::uint64_t> unit_multiplier(std::string_view unit)
{
    if (iequals_ascii(unit, "B") || iequals_ascii(unit, "bytes"))
        return 1ULL;
    if (iequals_ascii(unit, "KB"))
        return 1024ULL;
    if (iequals_ascii(unit, "MB"))
        return 1024ULL * 1024;
    if (iequals_ascii(unit, "GB"))
        return 1024ULL * 1024 * 1024;
    if (iequals_ascii(unit, "TB"))
        return 1024ULL * 1024 * 1024 * 1024;
    return std::nullopt;
}

[[nodiscard]] inline std::optional<std::uint64_t> parse_parenthesized_bytes(std::string_view text)
{
    const auto open = text.rfind('(');
    const auto close = text.rfind(')');
    if (open == std::string_view::npos || close == std::string_view::npos || close < open)
        return std::nullopt;
    std::string_view inner = trim_ascii(text.substr(open + 1, close - open - 1));
    constexpr std::string_view suffix = "bytes";
    if (inner.size() <= suffix.size() || !iequals_ascii(inner.substr(inner.size() - suffix.size()), suffix))
        return std::nullopt;
    inner.remove_suffix(suffix.size());
    return parse_grouped_digits(trim_ascii(inner));
}

[[nodiscard]] inline std::optional<std::uint64_t> parse_bare_bytes(std::string_view text)
{
    constexpr std::string_view suffix = "bytes";
    if (text.size() <= suffix.size() || !iequals_ascii(text.substr(text.size() - suffix.size()), suffix))
        return std::nullopt;
    text.remove_suffix(suffix.size());
    return parse_grouped_digits(trim_ascii(text));
}

[[nodiscard]] inline std::optional<std::uint64_t> parse_unit_suffixed(std::string_view text)
{
    std::size_t split = 0;
    while (split < text.size() && ((text[split] >= '0' && text[split] <= '9') || text[split] == '.'))
        ++split;
    if (split == 0 || split == text.size())
        return std::nullopt;

    const std::string_view number = text.substr(0, split);
    const auto multiplier = unit_multiplier(trim_ascii(text.substr(split)));
    if (!multiplier)
        return std::nullopt;

    double value = 0.0;
    const auto res = std::from_chars(number.data(), number.data() + number.size(), value);
    if (res.ec != std::errc{} || res.ptr != number.data() + number.size())
        return std::nullopt;
    return static_cast<std::uint64_t>(std::llround(value * static_cast<double>(*multiplier)));
}

[[nodiscard]] inline std::optional<std::uint64_t> parse_plain_digits(std::string_view text)
{
    if (text.find(',') != std::string_view::npos)
        return std::nullopt;
    return parse_grouped_digits(text);
}

} // namespace detail

[[nodiscard]] inline parsed_size parse_size(std::string_view text)
{
    const std::string_view trimmed = detail::trim_ascii(text);
    if (trimmed.empty())
        return unparseable{std::string(text)};

    if (auto bytes = detail::parse_parenthesized_bytes(trimmed))
        return byte_count{*bytes};
    if (auto bytes = detail::parse_bare_bytes(trimmed))
        return byte_count{*bytes};
    if (auto bytes = detail::parse_unit_suffixed(trimmed))
        return byte_count{*bytes};
    if (auto bytes = detail::parse_plain_digits(trimmed))
        return byte_count{*bytes};
    return unparseable{std::string(text)};
}

[[nodiscard]] inline std::optional<std::uint64_t> bytes_of(const parsed_size& size) noexcept
{
    if (const auto* count = std::get_if<byte_count>(&size))
        return count->bytes;
    return std::nullopt;
}

/// "1.50 GB"
[[nodiscard]] inline std::string format_size(std::uint64_t bytes)
{
    static constexpr const char* UNITS[] = {"B", "KB", "MB", "GB", "TB"};
    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < std::size(UNITS))
    {
        value /= 1024.0;
        ++unit;
    }

    std::ostringstream out;
    if (unit == 0)
        out << bytes << ' ' << UNITS[0];
    else
        out << std::fixed << std::setprecision(2) << value << ' ' << UNITS[unit];
    return out.str();
}

} // namespace mailpurge
