/*

test_size_parser.cpp
--------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE size_parser_test

#include <boost/test/unit_test.hpp>

#include <variant>

#include <mailpurge/purge/size_parser.hpp>


using mailpurge::bytes_of;
using mailpurge::format_size;
using mailpurge::parse_size;


BOOST_AUTO_TEST_CASE(parenthesized_bytes_win_over_the_rounded_unit)
{
    BOOST_TEST(bytes_of(parse_size("1.2 GB (1,288,490,189 bytes)")).value_or(0) == 1288490189u);
    BOOST_TEST(bytes_of(parse_size("512 KB (524,288 bytes)")).value_or(0) == 524288u);
}

BOOST_AUTO_TEST_CASE(bare_bytes)
{
    BOOST_TEST(bytes_of(parse_size("1,024 bytes")).value_or(0) == 1024u);
    BOOST_TEST(bytes_of(parse_size("0 bytes")).value_or(1) == 0u);
}

BOOST_AUTO_TEST_CASE(unit_suffixed_values_are_binary_multiples)
{
    BOOST_TEST(bytes_of(parse_size("1.5 GB")).value_or(0) == 1610612736u);
    BOOST_TEST(bytes_of(parse_size("2 KB")).value_or(0) == 2048u);
    BOOST_TEST(bytes_of(parse_size("3MB")).value_or(0) == 3145728u);
    BOOST_TEST(bytes_of(parse_size("1 TB")).value_or(0) == 1099511627776u);
    BOOST_TEST(bytes_of(parse_size("17 B")).value_or(0) == 17u);
}

BOOST_AUTO_TEST_CASE(plain_digits)
{
    BOOST_TEST(bytes_of(parse_size("123456")).value_or(0) == 123456u);
    BOOST_TEST(bytes_of(parse_size("  42  ")).value_or(0) == 42u);
}

BOOST_AUTO_TEST_CASE(unrecognized_text_is_unparseable_not_zero)
{
    for (const char* text : {"", "lots", "1.5 XB", "GB", "(bytes)", "12,34,5"})
    {
        const auto size = parse_size(text);
        BOOST_TEST(std::holds_alternative<mailpurge::unparseable>(size));
        BOOST_TEST(!bytes_of(size).has_value());
    }
}

BOOST_AUTO_TEST_CASE(format_size_picks_the_largest_unit)
{
    BOOST_TEST(format_size(0) == "0 B");
    BOOST_TEST(format_size(1023) == "1023 B");
    BOOST_TEST(format_size(1536) == "1.50 KB");
    BOOST_TEST(format_size(1610612736) == "1.50 GB");
}
