/*

purge/engine_config.hpp
-----------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

#include <mailpurge/detail/retry_policy.hpp>
#include <mailpurge/purge/types.hpp>

namespace mailpurge
{

/**
 * Pacing and limits of the deletion engine.
 */
struct engine_config
{
    /// Base page size; id pages are fetched at min(4 * page_size, 200)
    std::size_t page_size = 50;

    /// Ids per multi-operation delete request (never more than 20)
    std::size_t batch_size = max_batch_size;

    /// Backoff for throttled batches
    detail::retry_policy throttle_retry = detail::retry_policy::throttling();

    /// Pause after every delete batch
    std::chrono::milliseconds inter_batch_delay{200};

    /// Interval between bulk search status polls
    std::chrono::seconds poll_interval{30};

    /// Give up waiting for a bulk search after this long
    std::chrono::minutes max_search_wait{10};

    /// Upper bound on id pages per target (0 = derive from the match count)
    std::size_t max_pages = 0;

    // ==================== Factory Methods ====================

    static engine_config defaults()
    {
        return engine_config{};
    }

    /// Large mailboxes whose searches take longer than the default wait
    static engine_config extended_wait()
    {
        engine_config cfg;
        cfg.max_search_wait = std::chrono::minutes{120};
        return cfg;
    }

    [[nodiscard]] std::size_t fetch_size() const noexcept
    {
        return fetch_page_size(page_size);
    }

    /// Pages the delete loop may fetch before it stops trusting the server's shrinking result set.
    [[nodiscard]] std::size_t page_ceiling(std::uint64_t match_count) const noexcept
    {
        if (max_pages != 0)
            return max_pages;
        const std::uint64_t fetch = fetch_size();
        const std::uint64_t pages = (match_count + fetch - 1) / fetch;
        return static_cast<std::size_t>(pages * 2 + 2);
    }
};

} // namespace mailpurge
