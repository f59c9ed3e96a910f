/*

test_redact.cpp
---------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE redact_test

#include <boost/test/unit_test.hpp>
#include <mailpurge/detail/redact.hpp>


BOOST_AUTO_TEST_CASE(redact_bearer_header)
{
    BOOST_TEST(mailpurge::detail::redact_line("Authorization: Bearer eyJ0eXAi.abc-def_1") ==
        "Authorization: Bearer <redacted>");
    BOOST_TEST(mailpurge::detail::redact_line("authorization: bearer   xyz") == "authorization: bearer   <redacted>");
}

BOOST_AUTO_TEST_CASE(redact_json_access_token)
{
    BOOST_TEST(mailpurge::detail::redact_line(R"({"access_token": "s3cr3t", "expires_in": 3599})") ==
        R"({"access_token": "<redacted>", "expires_in": 3599})");
}

BOOST_AUTO_TEST_CASE(redact_query_access_token)
{
    BOOST_TEST(mailpurge::detail::redact_line("/v1.0/me?access_token=abc123&$top=5") ==
        "/v1.0/me?access_token=<redacted>&$top=5");
}

BOOST_AUTO_TEST_CASE(redact_leaves_plain_text)
{
    BOOST_TEST(mailpurge::detail::redact_line("GET /v1.0/users/a@b.com/messages") ==
        "GET /v1.0/users/a@b.com/messages");
}
