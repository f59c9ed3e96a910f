/*

test_retry_policy.cpp
---------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE retry_policy_test

#include <boost/test/unit_test.hpp>

#include <chrono>

#include <mailpurge/detail/retry_policy.hpp>


using mailpurge::detail::retry_policy;
using std::chrono::milliseconds;


BOOST_AUTO_TEST_CASE(throttling_backs_off_exponentially)
{
    const auto policy = retry_policy::throttling();
    BOOST_TEST(policy.max_attempts == 3u);
    BOOST_TEST(policy.delay_for(1).count() == 4000);
    BOOST_TEST(policy.delay_for(2).count() == 8000);
}

BOOST_AUTO_TEST_CASE(attempts_are_bounded)
{
    const auto policy = retry_policy::throttling();
    BOOST_TEST(policy.can_retry(1));
    BOOST_TEST(policy.can_retry(2));
    BOOST_TEST(!policy.can_retry(3));

    const auto once = retry_policy::none();
    BOOST_TEST(!once.can_retry(1));
}

BOOST_AUTO_TEST_CASE(delay_is_capped)
{
    auto policy = retry_policy::exponential_backoff(10, milliseconds{1000});
    policy.max_delay = milliseconds{5000};
    BOOST_TEST(policy.delay_for(2).count() == 4000);
    BOOST_TEST(policy.delay_for(3).count() == 5000);
    BOOST_TEST(policy.delay_for(9).count() == 5000);
}

BOOST_AUTO_TEST_CASE(jitter_stays_within_bounds)
{
    const auto policy = retry_policy::exponential_backoff(3, milliseconds{1000}, 2.0, 0.25);
    for (int i = 0; i < 50; ++i)
    {
        const auto delay = policy.delay_for(1).count();
        BOOST_TEST(delay >= 1500);
        BOOST_TEST(delay <= 2500);
    }
}
