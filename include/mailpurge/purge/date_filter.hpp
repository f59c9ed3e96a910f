/*

date_filter.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Deletion scope: everything received before a cutoff, or an inclusive date range.

*/

#pragma once

#include <charconv>
#include <chrono>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include <mailpurge/detail/result.hpp>

namespace mailpurge
{

/// Second resolution keeps every accepted calendar date representable.
using sys_time = std::chrono::sys_seconds;

/// Longest span a range filter may cover.
inline constexpr std::chrono::days max_range_span{365};

/// Largest accepted age, one hundred years.
inline constexpr int max_age_days = 36500;

inline constexpr int min_filter_year = 1900;
inline constexpr int max_filter_year = 9999;

namespace detail
{

[[nodiscard]] inline bool parse_fixed_int(std::string_view text, int& out) noexcept
{
    if (text.empty())
        return false;
    for (char ch : text)
    {
        if (ch < '0' || ch > '9')
            return false;
    }
    const auto res = std::from_chars(text.data(), text.data() + text.size(), out);
    return res.ec == std::errc{} && res.ptr == text.data() + text.size();
}

} // namespace detail

/**
Parse "YYYY-MM-DD" or "YYYY-MM-DDTHH:MM:SS[Z]" as UTC.

@return invalid_argument when the text is not a valid calendar date or time.
**/
[[nodiscard]] inline result<sys_time> parse_date(std::string_view text)
{
    auto bad = [&]()
    {
        return fail<sys_time>(errc::invalid_argument,
            "Invalid date '" + std::string(text) + "'; expected YYYY-MM-DD.");
    };

    if (text.size() < 10 || text[4] != '-' || text[7] != '-')
        return bad();

    int y = 0;
    int m = 0;
    int d = 0;
    if (!detail::parse_fixed_int(text.substr(0, 4), y) ||
        !detail::parse_fixed_int(text.substr(5, 2), m) ||
        !detail::parse_fixed_int(text.substr(8, 2), d))
        return bad();

    const std::chrono::year_month_day ymd{std::chrono::year{y},
        std::chrono::month{static_cast<unsigned>(m)}, std::chrono::day{static_cast<unsigned>(d)}};
    if (!ymd.ok())
        return bad();
    if (y < min_filter_year || y > max_filter_year)
        return fail<sys_time>(errc::invalid_argument,
            "Date '" + std::string(text) + "' is outside the supported years "
            + std::to_string(min_filter_year) + " to " + std::to_string(max_filter_year) + ".");

    sys_time tp = std::chrono::sys_days{ymd};
    std::string_view rest = text.substr(10);
    if (rest.empty())
        return tp;

    if (rest.back() == 'Z')
        rest.remove_suffix(1);
    if (rest.size() != 9 || (rest[0] != 'T' && rest[0] != ' ') || rest[3] != ':' || rest[6] != ':')
        return bad();

    int hh = 0;
    int mm = 0;
    int ss = 0;
    if (!detail::parse_fixed_int(rest.substr(1, 2), hh) ||
        !detail::parse_fixed_int(rest.substr(4, 2), mm) ||
        !detail::parse_fixed_int(rest.substr(7, 2), ss) ||
        hh > 23 || mm > 59 || ss > 59)
        return bad();

    tp += std::chrono::hours{hh} + std::chrono::minutes{mm} + std::chrono::seconds{ss};
    return tp;
}

/// "2023-01-01"
[[nodiscard]] inline std::string format_date(sys_time tp)
{
    const std::chrono::year_month_day ymd{std::chrono::floor<std::chrono::days>(tp)};
    std::ostringstream out;
    out << std::setfill('0')
        << std::setw(4) << static_cast<int>(ymd.year()) << '-'
        << std::setw(2) << static_cast<unsigned>(ymd.month()) << '-'
        << std::setw(2) << static_cast<unsigned>(ymd.day());
    return out.str();
}

/// "2023-01-01T00:00:00Z", the form OData date comparisons expect.
[[nodiscard]] inline std::string format_iso8601(sys_time tp)
{
    const auto day_start = std::chrono::floor<std::chrono::days>(tp);
    const auto secs = std::chrono::duration_cast<std::chrono::seconds>(tp - day_start).count();
    std::ostringstream out;
    out << format_date(tp) << 'T' << std::setfill('0')
        << std::setw(2) << secs / 3600 << ':'
        << std::setw(2) << (secs / 60) % 60 << ':'
        << std::setw(2) << secs % 60 << 'Z';
    return out.str();
}

struct cutoff_before
{
    sys_time cutoff;
};

/// Inclusive on both ends.
struct date_range
{
    sys_time start;
    sys_time end;
};

/// Raw filter parameters as supplied on the command line.
struct filter_request
{
    std::optional<int> older_than_days;
    std::optional<std::string> before;
    std::optional<std::string> start_date;
    std::optional<std::string> end_date;
};

class date_filter
{
public:
    using mode_type = std::variant<cutoff_before, date_range>;

    [[nodiscard]] static result<date_filter> older_than(int days, std::chrono::system_clock::time_point now)
    {
        if (days < 1 || days > max_age_days)
            return fail<date_filter>(errc::invalid_argument,
                "Age must be from 1 to " + std::to_string(max_age_days) + " days, got " + std::to_string(days) + ".");
        return date_filter(cutoff_before{std::chrono::floor<std::chrono::seconds>(now) - std::chrono::days{days}});
    }

    [[nodiscard]] static result<date_filter> before(sys_time cutoff)
    {
        return date_filter(cutoff_before{cutoff});
    }

    [[nodiscard]] static result<date_filter> between(sys_time start, sys_time end)
    {
        auto valid = validate_range(start, end);
        if (!valid)
            return fail<date_filter>(std::move(valid).error());
        return date_filter(date_range{start, end});
    }

    /**
    Build a filter from command line parameters.

    A date-only end bound covers that whole day. Fails with conflicting_filter when range and
    cutoff parameters are mixed, invalid_range for a half-open, reversed or over-long range.
    **/
    [[nodiscard]] static result<date_filter> from_request(const filter_request& request,
        std::chrono::system_clock::time_point now)
    {
        const bool has_range = request.start_date.has_value() || request.end_date.has_value();
        const bool has_cutoff = request.older_than_days.has_value() || request.before.has_value();

        if (has_range && has_cutoff)
            return fail<date_filter>(errc::conflicting_filter,
                "A start/end date range cannot be combined with an age or cutoff filter.");
        if (request.older_than_days && request.before)
            return fail<date_filter>(errc::conflicting_filter,
                "Give either an age in days or a cutoff date, not both.");

        if (has_range)
        {
            if (!request.start_date || !request.end_date)
                return fail<date_filter>(errc::invalid_range,
                    "A date range needs both a start date and an end date.");

            auto start = parse_date(*request.start_date);
            if (!start)
                return fail<date_filter>(std::move(start).error());
            auto end = parse_date(*request.end_date);
            if (!end)
                return fail<date_filter>(std::move(end).error());

            auto valid = validate_range(*start, *end);
            if (!valid)
                return fail<date_filter>(std::move(valid).error());

            sys_time end_bound = *end;
            if (request.end_date->size() == 10)
                end_bound += std::chrono::days{1} - std::chrono::seconds{1};
            return date_filter(date_range{*start, end_bound});
        }

        if (request.older_than_days)
            return older_than(*request.older_than_days, now);

        if (request.before)
        {
            auto cutoff = parse_date(*request.before);
            if (!cutoff)
                return fail<date_filter>(std::move(cutoff).error());
            return before(*cutoff);
        }

        return fail<date_filter>(errc::invalid_argument,
            "No filter given; use --older-than-days, --before or --start-date/--end-date.");
    }

    [[nodiscard]] bool is_range() const noexcept
    {
        return std::holds_alternative<date_range>(mode_);
    }

    [[nodiscard]] const cutoff_before* cutoff() const noexcept
    {
        return std::get_if<cutoff_before>(&mode_);
    }

    [[nodiscard]] const date_range* range() const noexcept
    {
        return std::get_if<date_range>(&mode_);
    }

    [[nodiscard]] const mode_type& mode() const noexcept
    {
        return mode_;
    }

    [[nodiscard]] std::string describe() const
    {
        if (const auto* c = cutoff())
            return "received before " + format_iso8601(c->cutoff);
        const auto* r = range();
        return "received between " + format_iso8601(r->start) + " and " + format_iso8601(r->end);
    }

private:
    explicit date_filter(mode_type mode)
        : mode_(std::move(mode))
    {
    }

    [[nodiscard]] static result_void validate_range(sys_time start, sys_time end)
    {
        if (start > end)
            return fail<void>(errc::invalid_range,
                "Start date " + format_date(start) + " is after end date " + format_date(end) + ".");
        if (end - start > max_range_span)
            return fail<void>(errc::invalid_range,
                "Date range " + format_date(start) + " to " + format_date(end) + " exceeds 365 days.");
        return ok();
    }

    mode_type mode_;
};

} // namespace mailpurge
