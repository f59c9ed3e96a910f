/*

test_bearer_retry.cpp
---------------------

Verify bearer token retry on 401 with token refresh and no network I/O.

*/

#define BOOST_TEST_MODULE bearer_retry_test

#include <boost/test/unit_test.hpp>

#include <chrono>
#include <string>

#include <mailpurge/oauth2/bearer_retry.hpp>
#include <mailpurge/oauth2/token_source.hpp>
#include "test_support.hpp"


using mailpurge::test::fake_transport;
using mailpurge::test::make_response;
using mailpurge::test::run_task;


namespace
{

mailpurge::oauth2::token_source refreshing_source(int& refresh_calls)
{
    const auto now = std::chrono::system_clock::now();
    mailpurge::oauth2::token initial{"access1", "refresh", now + std::chrono::hours{1}};
    return mailpurge::oauth2::token_source(initial,
        [&refresh_calls](const mailpurge::oauth2::token& current) -> mailpurge::result<mailpurge::oauth2::token>
        {
            ++refresh_calls;
            mailpurge::oauth2::token refreshed{
                "access2",
                current.refresh_token,
                std::chrono::system_clock::now() + std::chrono::hours{1}};
            return mailpurge::ok(refreshed);
        });
}

mailpurge::net::http_request get_me()
{
    mailpurge::net::http_request req;
    req.target = "/v1.0/me";
    return req;
}

} // namespace


BOOST_AUTO_TEST_CASE(bearer_retry_on_unauthorized)
{
    int refresh_calls = 0;
    auto source = refreshing_source(refresh_calls);
    fake_transport transport([](const mailpurge::net::http_request& req)
        -> mailpurge::result<mailpurge::net::http_response>
        {
            if (req.header("Authorization") == "Bearer access1")
                return make_response(401, R"({"error":{"code":"InvalidAuthenticationToken"}})");
            return make_response(200, "{}");
        });

    auto res = run_task(mailpurge::oauth2::send_with_bearer(source, transport, get_me()));

    BOOST_TEST(res.has_value());
    BOOST_TEST(res->status == 200u);
    BOOST_TEST(refresh_calls == 1);
    BOOST_TEST(transport.requests.size() == 2u);
    BOOST_TEST(transport.requests[0].header("Authorization").value_or("") == "Bearer access1");
    BOOST_TEST(transport.requests[1].header("Authorization").value_or("") == "Bearer access2");
}

BOOST_AUTO_TEST_CASE(bearer_retry_not_called_on_success)
{
    int refresh_calls = 0;
    auto source = refreshing_source(refresh_calls);
    fake_transport transport([](const mailpurge::net::http_request&)
        -> mailpurge::result<mailpurge::net::http_response>
        {
            return make_response(200, "{}");
        });

    auto res = run_task(mailpurge::oauth2::send_with_bearer(source, transport, get_me()));

    BOOST_TEST(res.has_value());
    BOOST_TEST(refresh_calls == 0);
    BOOST_TEST(transport.requests.size() == 1u);
}

BOOST_AUTO_TEST_CASE(bearer_retry_skips_transport_errors)
{
    int refresh_calls = 0;
    auto source = refreshing_source(refresh_calls);
    fake_transport transport([](const mailpurge::net::http_request&)
        -> mailpurge::result<mailpurge::net::http_response>
        {
            return mailpurge::fail<mailpurge::net::http_response>(mailpurge::errc::net_eof, "net error");
        });

    auto res = run_task(mailpurge::oauth2::send_with_bearer(source, transport, get_me()));

    BOOST_TEST(!res.has_value());
    BOOST_TEST(mailpurge::to_string(res.error().code) == "net_eof");
    BOOST_TEST(refresh_calls == 0);
    BOOST_TEST(transport.requests.size() == 1u);
}

BOOST_AUTO_TEST_CASE(fixed_token_rejected_fails_with_auth_error)
{
    auto source = mailpurge::test::test_tokens("stale");
    fake_transport transport([](const mailpurge::net::http_request&)
        -> mailpurge::result<mailpurge::net::http_response>
        {
            return make_response(401);
        });

    auto res = run_task(mailpurge::oauth2::send_with_bearer(source, transport, get_me()));

    BOOST_TEST(!res.has_value());
    BOOST_TEST((res.error().code == mailpurge::errc::auth_failed));
    BOOST_TEST(transport.requests.size() == 1u);
}
