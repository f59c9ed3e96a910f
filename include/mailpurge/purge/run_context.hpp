/*

run_context.hpp
---------------

State of one invocation, created once in main and passed to every component.

*/

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <mailpurge/detail/result.hpp>
#include <mailpurge/oauth2/token_source.hpp>
#include <mailpurge/purge/types.hpp>

namespace mailpurge
{

enum class target_status
{
    nothing_to_delete,
    checked,
    dry_run,
    declined,
    completed,
    incomplete,
    failed
};

[[nodiscard]] constexpr std::string_view to_string(target_status status) noexcept
{
    switch (status)
    {
        case target_status::nothing_to_delete: return "nothing to delete";
        case target_status::checked: return "checked";
        case target_status::dry_run: return "dry run";
        case target_status::declined: return "declined";
        case target_status::completed: return "completed";
        case target_status::incomplete: return "incomplete";
        case target_status::failed: return "failed";
    }
    return "unknown";
}

/// Outcome of processing one folder (mail API) or one mailbox (bulk search).
struct target_report
{
    std::string target;
    target_status status = target_status::failed;
    std::uint64_t match_count = 0;
    deletion_tally tally;
    /// Bulk search only: items handed to the purge action, not confirmed deleted.
    std::uint64_t accepted_for_purge = 0;
    std::optional<error_info> error;

    /// True when the requested action did not fully happen for reasons other than a decline.
    [[nodiscard]] bool has_problem() const noexcept
    {
        return status == target_status::failed
            || status == target_status::incomplete
            || tally.failed > 0;
    }
};

struct run_totals
{
    std::uint64_t matched = 0;
    std::uint64_t deleted = 0;
    std::uint64_t failed = 0;
    std::uint64_t accepted_for_purge = 0;
    std::size_t targets = 0;
    std::size_t problems = 0;
};

class run_context
{
public:
    run_context(run_mode mode, backend_kind backend, oauth2::token_source& tokens,
        std::chrono::system_clock::time_point started = std::chrono::system_clock::now())
        : mode_(mode), backend_(backend), tokens_(tokens), started_(started)
    {
    }

    run_context(const run_context&) = delete;
    run_context& operator=(const run_context&) = delete;

    [[nodiscard]] run_mode mode() const noexcept { return mode_; }
    [[nodiscard]] backend_kind backend() const noexcept { return backend_; }
    [[nodiscard]] oauth2::token_source& tokens() noexcept { return tokens_; }
    [[nodiscard]] std::chrono::system_clock::time_point started() const noexcept { return started_; }
    [[nodiscard]] const run_totals& totals() const noexcept { return totals_; }
    [[nodiscard]] const std::vector<target_report>& reports() const noexcept { return reports_; }

    void record(const target_report& report)
    {
        totals_.matched += report.match_count;
        totals_.deleted += report.tally.deleted;
        totals_.failed += report.tally.failed;
        totals_.accepted_for_purge += report.accepted_for_purge;
        ++totals_.targets;
        if (report.has_problem())
            ++totals_.problems;
        reports_.push_back(report);
    }

    /// Non-zero when any target did not complete; a declined confirmation is not an error.
    [[nodiscard]] int exit_code() const noexcept
    {
        return totals_.problems == 0 ? 0 : 1;
    }

    [[nodiscard]] std::chrono::seconds elapsed(
        std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const
    {
        return std::chrono::duration_cast<std::chrono::seconds>(now - started_);
    }

private:
    run_mode mode_;
    backend_kind backend_;
    oauth2::token_source& tokens_;
    std::chrono::system_clock::time_point started_;
    run_totals totals_;
    std::vector<target_report> reports_;
};

} // namespace mailpurge
