/*

query.hpp
---------

Filter expressions and job names for the two remote APIs.

*/

#pragma once

#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <variant>

#include <mailpurge/detail/log.hpp>
#include <mailpurge/purge/date_filter.hpp>

namespace mailpurge::backend
{

template<class... Ts>
struct overloaded : Ts...
{
    using Ts::operator()...;
};

template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

/// OData `$filter` on receivedDateTime: "lt cutoff", or "ge start and le end".
[[nodiscard]] inline std::string mail_filter_expression(const date_filter& filter)
{
    return std::visit(overloaded{
        [](const cutoff_before& c)
        {
            return "receivedDateTime lt " + format_iso8601(c.cutoff);
        },
        [](const date_range& r)
        {
            return "receivedDateTime ge " + format_iso8601(r.start)
                + " and receivedDateTime le " + format_iso8601(r.end);
        }}, filter.mode());
}

/// KQL content query for a bulk search, limited to mail items.
[[nodiscard]] inline std::string search_query(const date_filter& filter)
{
    return std::visit(overloaded{
        [](const cutoff_before& c)
        {
            return "kind:email AND received<" + format_date(c.cutoff);
        },
        [](const date_range& r)
        {
            return "kind:email AND received>=" + format_date(r.start)
                + " AND received<=" + format_date(r.end);
        }}, filter.mode());
}

/// "MailPurge_<mailbox>_<YYYYMMDD_HHMMSS>", unique per mailbox and run.
[[nodiscard]] inline std::string search_job_name(std::string_view mailbox,
    std::chrono::system_clock::time_point now)
{
    std::string safe(mailbox);
    for (char& ch : safe)
    {
        if (!std::isalnum(static_cast<unsigned char>(ch)))
            ch = '_';
    }
    const std::tm tm = log::local_time(now);
    std::ostringstream out;
    out << "MailPurge_" << safe << '_' << std::put_time(&tm, "%Y%m%d_%H%M%S");
    return out.str();
}

} // namespace mailpurge::backend
