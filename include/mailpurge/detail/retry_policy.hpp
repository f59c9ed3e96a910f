/*

retry_policy.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <chrono>
#include <functional>
#include <random>

#include <mailpurge/detail/asio_decl.hpp>

namespace mailpurge::detail
{

/**
 * Retry policy for throttled remote calls.
 * Controls how many attempts a request gets and how long to back off between them.
 */
struct retry_policy
{
    /// Total attempts including the first one
    unsigned int max_attempts = 3;

    /// Delay unit; the wait after the n-th failed attempt is base_delay * multiplier^n
    std::chrono::milliseconds base_delay{2000};

    /// Upper bound for a single wait
    std::chrono::milliseconds max_delay{std::chrono::minutes{5}};

    double backoff_multiplier = 2.0;

    /// Random jitter around the computed delay (0.0 to 1.0, e.g., 0.25 = +-25%)
    double jitter_factor = 0.0;

    /// Rate-limit backoff used for batch deletes: 3 attempts, waits of 4s then 8s.
    static retry_policy throttling()
    {
        return retry_policy{};
    }

    /// Single attempt, never waits
    static retry_policy none()
    {
        retry_policy policy;
        policy.max_attempts = 1;
        return policy;
    }

    static retry_policy exponential_backoff(
        unsigned int attempts,
        std::chrono::milliseconds base,
        double multiplier = 2.0,
        double jitter = 0.0)
    {
        retry_policy policy;
        policy.max_attempts = attempts;
        policy.base_delay = base;
        policy.backoff_multiplier = multiplier;
        policy.jitter_factor = jitter;
        return policy;
    }

    [[nodiscard]] bool can_retry(unsigned int failed_attempts) const noexcept
    {
        return failed_attempts < max_attempts;
    }

    /// Delay to wait after `failed_attempts` attempts (1-based) have been throttled.
    [[nodiscard]] std::chrono::milliseconds delay_for(unsigned int failed_attempts) const
    {
        double delay_ms = static_cast<double>(base_delay.count());
        for (unsigned int i = 0; i < failed_attempts; ++i)
        {
            delay_ms *= backoff_multiplier;
            if (delay_ms > static_cast<double>(max_delay.count()))
            {
                delay_ms = static_cast<double>(max_delay.count());
                break;
            }
        }

        if (jitter_factor > 0.0)
        {
            thread_local std::mt19937 rng(std::random_device{}());
            std::uniform_real_distribution<double> dist(1.0 - jitter_factor, 1.0 + jitter_factor);
            delay_ms *= dist(rng);
        }

        auto result = std::chrono::milliseconds(static_cast<long long>(delay_ms));
        if (result > max_delay)
            result = max_delay;
        return result;
    }
};


/// Blocking pause used between remote calls. Injectable so tests can record waits.
using wait_fn = std::function<mailpurge::asio::awaitable<void>(std::chrono::milliseconds)>;

/// Waits on a steady_timer bound to the calling coroutine's executor.
[[nodiscard]] inline wait_fn steady_wait()
{
    return [](std::chrono::milliseconds delay) -> mailpurge::asio::awaitable<void>
    {
        auto executor = co_await mailpurge::asio::this_coro::executor;
        mailpurge::asio::steady_timer timer(executor);
        timer.expires_after(delay);
        mailpurge::asio::error_code ec;
        co_await timer.async_wait(mailpurge::asio::redirect_error(mailpurge::asio::use_awaitable, ec));
    };
}

} // namespace mailpurge::detail
