/*

bulk_search_backend.hpp
-----------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>

#include <mailpurge/detail/asio_decl.hpp>
#include <mailpurge/detail/log.hpp>
#include <mailpurge/detail/result.hpp>
#include <mailpurge/detail/retry_policy.hpp>
#include <mailpurge/purge/date_filter.hpp>
#include <mailpurge/purge/size_parser.hpp>
#include <mailpurge/purge/types.hpp>

namespace mailpurge::backend
{

/**
Asynchronous search-then-purge API.

A job returned by create_and_run() exists on the server until discard() succeeds; callers
must discard it on every path, including after a purge was submitted.
**/
class bulk_search_backend
{
public:
    virtual ~bulk_search_backend() = default;

    /// Create the search for one mailbox and start it.
    virtual mailpurge::asio::awaitable<result<bulk_search_job>> create_and_run(
        const std::string& mailbox, const date_filter& filter) = 0;

    /// Current status, item count and size of the search.
    virtual mailpurge::asio::awaitable<result<bulk_search_job>> refresh_status(const bulk_search_job& job) = 0;

    /// Submit the irreversible hard delete of everything the search found; returns the items accepted.
    virtual mailpurge::asio::awaitable<result<std::uint64_t>> purge(const bulk_search_job& job) = 0;

    virtual mailpurge::asio::awaitable<result_void> discard(const bulk_search_job& job) = 0;
};

[[nodiscard]] constexpr bool is_finished(job_status status) noexcept
{
    return status == job_status::completed || status == job_status::failed;
}

/**
Poll the job every `interval` until it completes, fails or `max_wait` has been spent waiting.

A timeout is not an error: the job comes back in its last observed status. Status calls that
fail on the network or with an HTTP error are logged and polled again; authorization
failures end the wait with an error.
**/
inline mailpurge::asio::awaitable<result<bulk_search_job>> poll_until_done(bulk_search_backend& backend,
    bulk_search_job job, std::chrono::seconds interval, std::chrono::minutes max_wait, detail::wait_fn wait)
{
    std::chrono::seconds waited{0};
    for (;;)
    {
        auto refreshed = co_await backend.refresh_status(job);
        if (refreshed)
        {
            job = std::move(*refreshed);
            MAILPURGE_INFO("Search " + job.name + ": " + std::string(to_string(job.status)) + ", "
                + std::to_string(job.item_count) + " items, " + format_size(job.total_size_bytes));
        }
        else if (is_auth_error(refreshed.error().code))
        {
            co_return fail<bulk_search_job>(std::move(refreshed).error());
        }
        else
        {
            MAILPURGE_WARN("Status check for search " + job.name + " failed: " + refreshed.error().to_string());
        }

        if (is_finished(job.status))
            co_return job;

        if (waited >= max_wait)
        {
            MAILPURGE_WARN("Search " + job.name + " still " + std::string(to_string(job.status)) + " after "
                + std::to_string(max_wait.count()) + " minutes; giving up the wait.");
            co_return job;
        }

        co_await wait(std::chrono::duration_cast<std::chrono::milliseconds>(interval));
        waited += interval;
    }
}

} // namespace mailpurge::backend
