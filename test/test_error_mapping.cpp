/*

test_error_mapping.cpp
----------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE error_mapping_test

#include <boost/test/unit_test.hpp>

#include <mailpurge/net/error_mapping.hpp>


BOOST_AUTO_TEST_CASE(net_error_mapping)
{
    BOOST_TEST((mailpurge::net::map_net_error(
        mailpurge::net::io_stage::read,
        mailpurge::asio::error::operation_aborted,
        true) == mailpurge::errc::net_timeout));

    BOOST_TEST((mailpurge::net::map_net_error(
        mailpurge::net::io_stage::read,
        mailpurge::asio::error::operation_aborted,
        false) == mailpurge::errc::net_cancelled));

    BOOST_TEST((mailpurge::net::map_net_error(
        mailpurge::net::io_stage::read,
        mailpurge::asio::error::eof,
        false) == mailpurge::errc::net_eof));

    BOOST_TEST((mailpurge::net::map_net_error(
        mailpurge::net::io_stage::connect,
        mailpurge::asio::error::connection_refused,
        false) == mailpurge::errc::net_connection_refused));

    BOOST_TEST((mailpurge::net::map_net_error(
        mailpurge::net::io_stage::resolve,
        mailpurge::asio::error::host_not_found,
        false) == mailpurge::errc::net_resolve_failed));

    BOOST_TEST((mailpurge::net::map_net_error(
        mailpurge::net::io_stage::handshake,
        mailpurge::asio::error::access_denied,
        false) == mailpurge::errc::tls_handshake_failed));
}

BOOST_AUTO_TEST_CASE(http_status_mapping)
{
    using mailpurge::errc;
    using mailpurge::net::map_http_status;

    BOOST_TEST((map_http_status(204, "") == errc::ok));
    BOOST_TEST((map_http_status(401, "") == errc::auth_failed));
    BOOST_TEST((map_http_status(403, R"({"error":{"code":"ErrorAccessDenied"}})") == errc::permission_denied));
    BOOST_TEST((map_http_status(429, "") == errc::throttled));
    BOOST_TEST((map_http_status(503, "") == errc::throttled));
    BOOST_TEST((map_http_status(404, "") == errc::not_found));
    BOOST_TEST((map_http_status(500, "") == errc::http_status));
}

BOOST_AUTO_TEST_CASE(quota_wins_over_status)
{
    using mailpurge::errc;
    using mailpurge::net::map_http_status;

    BOOST_TEST((map_http_status(403, R"({"error":{"code":"ErrorQuotaExceeded"}})") == errc::quota_exceeded));
    BOOST_TEST((map_http_status(507, "MailboxStoreQuota reached") == errc::quota_exceeded));
    BOOST_TEST(!mailpurge::net::mentions_quota("ErrorItemNotFound"));
}

BOOST_AUTO_TEST_CASE(throttle_status_wins_over_quota_wording)
{
    using mailpurge::errc;
    using mailpurge::net::map_http_status;

    BOOST_TEST((map_http_status(429,
        R"({"error":{"code":"ApplicationThrottled","message":"Mailbox quota exceeded"}})") == errc::throttled));
    BOOST_TEST((map_http_status(503, R"({"error":{"code":"ErrorQuotaExceeded"}})") == errc::throttled));
}

BOOST_AUTO_TEST_CASE(http_detail_fields)
{
    const auto detail = mailpurge::net::make_http_detail("GET", "/v1.0/me?access_token=abc", 500, "boom\n");
    BOOST_TEST(detail.str() ==
        "proto=https\nmethod=GET\ntarget=/v1.0/me?access_token=<redacted>\nstatus=500\nbody=boom \n");
}
