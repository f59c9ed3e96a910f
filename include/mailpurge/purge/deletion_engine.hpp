/*

deletion_engine.hpp
-------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Count, confirm and delete the messages matching a date filter, one target at a time.

*/

#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <mailpurge/backend/bulk_search_backend.hpp>
#include <mailpurge/backend/mail_backend.hpp>
#include <mailpurge/detail/asio_decl.hpp>
#include <mailpurge/detail/log.hpp>
#include <mailpurge/detail/redact.hpp>
#include <mailpurge/detail/result.hpp>
#include <mailpurge/detail/retry_policy.hpp>
#include <mailpurge/purge/confirmation.hpp>
#include <mailpurge/purge/date_filter.hpp>
#include <mailpurge/purge/engine_config.hpp>
#include <mailpurge/purge/run_context.hpp>
#include <mailpurge/purge/size_parser.hpp>
#include <mailpurge/purge/types.hpp>

namespace mailpurge
{

enum class engine_state
{
    idle,
    counting,
    awaiting_confirmation,
    reporting,
    deleting,
    done
};

[[nodiscard]] constexpr std::string_view to_string(engine_state state) noexcept
{
    switch (state)
    {
        case engine_state::idle: return "idle";
        case engine_state::counting: return "counting";
        case engine_state::awaiting_confirmation: return "awaiting confirmation";
        case engine_state::reporting: return "reporting";
        case engine_state::deleting: return "deleting";
        case engine_state::done: return "done";
    }
    return "unknown";
}

/// The backend chosen for the run; exactly one is injected into the engine.
using backend_ref = std::variant<
    std::reference_wrapper<backend::mail_backend>,
    std::reference_wrapper<backend::bulk_search_backend>>;

/// What to purge: a mailbox and, for the mail API, optional folder names (empty = every folder).
struct purge_request
{
    std::string mailbox;
    std::vector<std::string> folders;
};

class deletion_engine
{
public:
    deletion_engine(run_context& context, confirmation_gate& gate,
        engine_config config = engine_config::defaults(), detail::wait_fn wait = detail::steady_wait())
        : context_(context), gate_(gate), config_(std::move(config)), wait_(std::move(wait))
    {
    }

    deletion_engine(const deletion_engine&) = delete;
    deletion_engine& operator=(const deletion_engine&) = delete;

    [[nodiscard]] engine_state state() const noexcept
    {
        return state_;
    }

    [[nodiscard]] const engine_config& config() const noexcept
    {
        return config_;
    }

    /**
    Process every target of the request with the selected backend and record one report per
    target in the run context.

    Targets are independent: a failed target is recorded and the next one runs. Only an
    authorization failure stops the run, and it is returned as the error.
    **/
    mailpurge::asio::awaitable<result_void> run(backend_ref selected, const purge_request& request,
        const date_filter& filter)
    {
        MAILPURGE_INFO("Purging " + request.mailbox + " (" + filter.describe() + "), mode "
            + std::string(to_string(context_.mode())) + ", backend " + std::string(to_string(context_.backend())));

        if (auto* bulk = std::get_if<std::reference_wrapper<backend::bulk_search_backend>>(&selected))
        {
            const target_report report = co_await purge_mailbox(bulk->get(), request.mailbox, filter);
            context_.record(report);
            if (report.error && is_auth_error(report.error->code))
                co_return fail<void>(*report.error);
            co_return ok();
        }

        auto& mail = std::get<std::reference_wrapper<backend::mail_backend>>(selected).get();
        auto targets = co_await resolve_targets(mail, request);
        if (!targets)
        {
            MAILPURGE_ERROR("Cannot enumerate folders of " + request.mailbox + ": " + targets.error().to_string());
            target_report report;
            report.target = request.mailbox;
            report.status = target_status::failed;
            report.error = targets.error();
            context_.record(report);
            if (is_auth_error(targets.error().code))
                co_return fail<void>(std::move(targets).error());
            co_return ok();
        }

        for (const auto& target : *targets)
        {
            if (!target)
            {
                context_.record(*target.error_report);
                continue;
            }
            const target_report report = co_await purge_folder(mail, *target.target, filter);
            context_.record(report);
            if (report.error && is_auth_error(report.error->code))
                co_return fail<void>(*report.error);
        }
        co_return ok();
    }

    /// Count, confirm and batch-delete the matching messages of one folder.
    mailpurge::asio::awaitable<target_report> purge_folder(backend::mail_backend& mail, const mail_target& target,
        const date_filter& filter)
    {
        target_report report;
        report.target = target.label();

        transition(engine_state::counting);
        auto count = co_await mail.count_matching(target, filter);
        if (!count)
        {
            MAILPURGE_ERROR("Counting messages in " + report.target + " failed: " + count.error().to_string());
            report.status = target_status::failed;
            report.error = std::move(count).error();
            transition(engine_state::done);
            co_return report;
        }
        report.match_count = *count;
        MAILPURGE_INFO(std::to_string(report.match_count) + " messages in " + report.target + " "
            + filter.describe() + ".");

        if (!co_await decide(report, "permanently delete " + std::to_string(report.match_count)
            + " messages from " + report.target + " (" + filter.describe() + ")", confirmation_token::yes))
        {
            co_return report;
        }

        transition(engine_state::deleting);
        co_await delete_matching(mail, target, filter, report);
        transition(engine_state::done);

        // Items that fail for good stay on the server and come back on the next page.
        std::string summary = "Deleted " + std::to_string(report.tally.deleted) + " of "
            + std::to_string(report.match_count) + " messages from " + report.target + " ("
            + std::to_string(report.tally.failed) + " failed";
        if (report.tally.failed != 0)
            summary += "; a message that keeps failing is counted once per attempt";
        summary += ").";
        if (report.status == target_status::completed && report.tally.failed == 0)
            MAILPURGE_SUCCESS(summary);
        else
            MAILPURGE_WARN(summary);
        co_return report;
    }

    /**
    Search one mailbox, wait for the search and submit a purge of what it found.

    The search is discarded before returning, whatever happened after its creation.
    **/
    mailpurge::asio::awaitable<target_report> purge_mailbox(backend::bulk_search_backend& bulk,
        const std::string& mailbox, const date_filter& filter)
    {
        target_report report;
        report.target = mailbox;

        transition(engine_state::counting);
        auto created = co_await bulk.create_and_run(mailbox, filter);
        if (!created)
        {
            MAILPURGE_ERROR("Creating the search for " + mailbox + " failed: " + created.error().to_string());
            report.status = target_status::failed;
            report.error = std::move(created).error();
            transition(engine_state::done);
            co_return report;
        }

        bulk_search_job job = std::move(*created);
        std::exception_ptr failure;
        try
        {
            co_await drive_search(bulk, job, filter, report);
        }
        catch (const std::exception& exc)
        {
            MAILPURGE_ERROR("Search " + job.name + " aborted: " + exc.what());
            failure = std::current_exception();
        }

        auto discarded = co_await bulk.discard(job);
        if (discarded)
            MAILPURGE_INFO("Search " + job.name + " removed.");
        else
            MAILPURGE_ERROR("Could not remove search " + job.name + ": " + discarded.error().to_string());

        transition(engine_state::done);
        if (failure)
            std::rethrow_exception(failure);
        co_return report;
    }

    /**
    Delete one batch, resubmitting only the throttled items up to the retry policy's attempt
    limit. Authorization failures are returned as errors; every other failure is counted.
    `throttled_total` receives the number of throttled answers over all attempts.
    **/
    mailpurge::asio::awaitable<result<deletion_tally>> delete_with_retry(backend::mail_backend& mail,
        const std::string& mailbox, const message_batch& batch, std::size_t& throttled_total)
    {
        throttled_total = 0;
        deletion_tally tally;
        message_batch pending = batch;
        for (unsigned int attempt = 1;; ++attempt)
        {
            auto outcome = co_await mail.delete_batch(mailbox, pending);
            if (!outcome)
            {
                if (is_auth_error(outcome.error().code))
                    co_return fail<deletion_tally>(std::move(outcome).error());
                MAILPURGE_ERROR("Delete batch of " + std::to_string(pending.size()) + " failed: "
                    + outcome.error().to_string());
                tally.failed += pending.size();
                co_return tally;
            }

            tally.deleted += outcome->succeeded;
            if (outcome->forbidden)
            {
                MAILPURGE_ERROR("Delete batch rejected for permission or quota reasons; "
                    + std::to_string(outcome->failed) + " items not deleted.");
                MAILPURGE_WARN("If the mailbox is over quota or the mail API refuses deletes, rerun with "
                    "--backend bulk-search.");
                tally.failed += outcome->failed;
                co_return tally;
            }

            const std::size_t throttled = outcome->throttled ? outcome->throttled_ids.size() : 0;
            throttled_total += throttled;
            tally.failed += outcome->failed > throttled ? outcome->failed - throttled : 0;
            if (throttled == 0)
                co_return tally;

            if (!config_.throttle_retry.can_retry(attempt))
            {
                MAILPURGE_ERROR("Still throttled after " + std::to_string(attempt) + " attempts; "
                    + std::to_string(throttled) + " items not deleted.");
                tally.failed += throttled;
                co_return tally;
            }

            const auto delay = config_.throttle_retry.delay_for(attempt);
            MAILPURGE_WARN("Throttled on " + std::to_string(throttled) + " items, retrying in "
                + std::to_string(delay.count() / 1000) + "s (attempt " + std::to_string(attempt + 1) + " of "
                + std::to_string(config_.throttle_retry.max_attempts) + ").");
            co_await wait_(delay);
            pending = std::move(outcome->throttled_ids);
        }
    }

private:
    struct resolved_target
    {
        std::optional<mail_target> target;
        std::optional<target_report> error_report;

        explicit operator bool() const noexcept
        {
            return target.has_value();
        }
    };

    void transition(engine_state next)
    {
        if (state_ == next)
            return;
        MAILPURGE_DEBUG("Engine " + std::string(to_string(state_)) + " -> " + std::string(to_string(next)));
        state_ = next;
    }

    /**
    Apply the run mode to a counted target. Returns true only when deletion may proceed;
    otherwise the report carries the final status.
    **/
    mailpurge::asio::awaitable<bool> decide(target_report& report, const std::string& action,
        confirmation_token required)
    {
        if (report.match_count == 0)
        {
            MAILPURGE_SUCCESS("Nothing to delete in " + report.target + ".");
            report.status = target_status::nothing_to_delete;
            transition(engine_state::done);
            co_return false;
        }

        switch (context_.mode())
        {
            case run_mode::check_only:
                MAILPURGE_INFO("Check only: " + std::to_string(report.match_count) + " items in "
                    + report.target + " match.");
                report.status = target_status::checked;
                transition(engine_state::done);
                co_return false;

            case run_mode::dry_run:
                transition(engine_state::reporting);
                MAILPURGE_INFO("[DRY RUN] Would " + action + ".");
                report.status = target_status::dry_run;
                transition(engine_state::done);
                co_return false;

            case run_mode::execute:
                break;
        }

        transition(engine_state::awaiting_confirmation);
        const std::string token(to_string(required));
        if (!gate_.confirm("About to " + action + ". This cannot be undone.\nType " + token + " to continue:", required))
        {
            MAILPURGE_WARN("Skipped " + report.target + ": confirmation declined.");
            report.status = target_status::declined;
            transition(engine_state::done);
            co_return false;
        }
        co_return true;
    }

    /**
    Re-fetch the first page of matches until the count is processed, the server has nothing
    left or the page ceiling is hit. The filter is re-evaluated server side after every page,
    so deleted items drop out of the next one.
    **/
    mailpurge::asio::awaitable<void> delete_matching(backend::mail_backend& mail, const mail_target& target,
        const date_filter& filter, target_report& report)
    {
        const std::size_t ceiling = config_.page_ceiling(report.match_count);
        std::size_t pages = 0;
        report.status = target_status::completed;

        while (report.tally.processed() < report.match_count)
        {
            if (pages >= ceiling)
            {
                MAILPURGE_WARN("Stopped " + report.target + " after " + std::to_string(pages)
                    + " pages; the server keeps returning matches.");
                report.status = target_status::incomplete;
                co_return;
            }

            auto page = co_await mail.fetch_id_page(target, filter, config_.page_size);
            ++pages;
            if (!page)
            {
                MAILPURGE_ERROR("Fetching messages from " + report.target + " failed: " + page.error().to_string());
                report.status = is_auth_error(page.error().code) ? target_status::failed : target_status::incomplete;
                report.error = std::move(page).error();
                co_return;
            }
            if (page->empty())
            {
                MAILPURGE_INFO("No more matching messages in " + report.target + ".");
                co_return;
            }
            MAILPURGE_INFO("Page " + std::to_string(pages) + " of " + report.target + ": "
                + std::to_string(page->size()) + " matching messages fetched.");

            for (const auto& batch : partition_batches(*page, config_.batch_size))
            {
                std::size_t throttled = 0;
                auto tally = co_await delete_with_retry(mail, target.mailbox, batch, throttled);
                if (!tally)
                {
                    MAILPURGE_ERROR("Deleting from " + report.target + " stopped: " + tally.error().to_string());
                    report.status = target_status::failed;
                    report.error = std::move(tally).error();
                    co_return;
                }
                report.tally += *tally;
                MAILPURGE_INFO("Batch of " + std::to_string(batch.size()) + " in " + report.target + ": "
                    + std::to_string(tally->deleted) + " deleted, " + std::to_string(tally->failed) + " failed, "
                    + std::to_string(throttled) + " throttled.");
                co_await wait_(config_.inter_batch_delay);
            }

            const auto percent = std::min<std::uint64_t>(100, report.tally.processed() * 100 / report.match_count);
            MAILPURGE_INFO("Progress " + report.target + ": " + std::to_string(report.tally.processed()) + "/"
                + std::to_string(report.match_count) + " (" + std::to_string(percent) + "%)");
        }
    }

    mailpurge::asio::awaitable<void> drive_search(backend::bulk_search_backend& bulk, bulk_search_job& job,
        const date_filter& filter, target_report& report)
    {
        MAILPURGE_INFO("Waiting for search " + job.name + " (up to " + std::to_string(config_.max_search_wait.count())
            + " minutes).");
        auto polled = co_await backend::poll_until_done(bulk, job, config_.poll_interval, config_.max_search_wait, wait_);
        if (!polled)
        {
            MAILPURGE_ERROR("Search " + job.name + " could not be polled: " + polled.error().to_string());
            report.status = target_status::failed;
            report.error = std::move(polled).error();
            co_return;
        }
        job = std::move(*polled);
        report.match_count = job.item_count;

        if (job.status == job_status::failed)
        {
            MAILPURGE_ERROR("Search " + job.name + " failed on the server.");
            report.status = target_status::failed;
            report.error = make_error(errc::job_failed, "Search " + job.name + " failed on the server.");
            co_return;
        }
        if (job.status != job_status::completed)
        {
            MAILPURGE_WARN("Search " + job.name + " did not complete in time; rerun with --extended-wait.");
            report.status = target_status::incomplete;
            co_return;
        }

        MAILPURGE_INFO(std::to_string(job.item_count) + " items (" + format_size(job.total_size_bytes) + ") in "
            + job.mailbox + " " + filter.describe() + ".");

        if (!co_await decide(report, "PERMANENTLY purge " + std::to_string(job.item_count) + " items ("
            + format_size(job.total_size_bytes) + ") from " + job.mailbox, confirmation_token::del))
        {
            co_return;
        }

        transition(engine_state::deleting);
        auto accepted = co_await bulk.purge(job);
        if (!accepted)
        {
            MAILPURGE_ERROR("Purge of search " + job.name + " failed: " + accepted.error().to_string());
            report.status = target_status::failed;
            report.error = std::move(accepted).error();
            co_return;
        }
        report.accepted_for_purge = *accepted;
        report.status = target_status::completed;
        MAILPURGE_SUCCESS(std::to_string(*accepted) + " items from " + job.mailbox
            + " accepted for purge; removal on the server can take up to 48 hours.");
    }

    mailpurge::asio::awaitable<result<std::vector<resolved_target>>> resolve_targets(backend::mail_backend& mail,
        const purge_request& request)
    {
        bool need_listing = request.folders.empty() || context_.mode() == run_mode::check_only;
        for (const auto& name : request.folders)
        {
            if (!backend::is_well_known_folder(name))
                need_listing = true;
        }

        std::vector<folder_info> folders;
        if (need_listing)
        {
            auto listed = co_await mail.list_folders(request.mailbox);
            if (!listed)
                co_return fail<std::vector<resolved_target>>(std::move(listed).error());
            folders = std::move(*listed);
            for (const auto& folder : folders)
            {
                MAILPURGE_INFO("Folder " + folder.display_name + ": " + std::to_string(folder.total_items) + " items"
                    + (folder.size_bytes ? ", " + format_size(*folder.size_bytes) : std::string{}));
            }
        }

        std::vector<resolved_target> targets;
        if (request.folders.empty())
        {
            for (const auto& folder : folders)
                targets.push_back({mail_target{request.mailbox, folder.id, folder.display_name}, std::nullopt});
            co_return targets;
        }

        for (const auto& name : request.folders)
        {
            if (backend::is_well_known_folder(name))
            {
                std::string id = name;
                for (char& ch : id)
                    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
                targets.push_back({mail_target{request.mailbox, std::move(id), name}, std::nullopt});
                continue;
            }

            const auto match = std::find_if(folders.begin(), folders.end(),
                [&name](const folder_info& folder) { return detail::iequals_ascii(folder.display_name, name); });
            if (match != folders.end())
            {
                targets.push_back({mail_target{request.mailbox, match->id, match->display_name}, std::nullopt});
                continue;
            }

            MAILPURGE_ERROR("Folder \"" + name + "\" not found in " + request.mailbox + ".");
            target_report missing;
            missing.target = request.mailbox + "/" + name;
            missing.status = target_status::failed;
            missing.error = make_error(errc::not_found, "Folder \"" + name + "\" not found.");
            targets.push_back({std::nullopt, std::move(missing)});
        }
        co_return targets;
    }

    run_context& context_;
    confirmation_gate& gate_;
    engine_config config_;
    detail::wait_fn wait_;
    engine_state state_ = engine_state::idle;
};

} // namespace mailpurge
