/*

asio_decl.hpp
-------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Centralized Boost.Asio / Boost.Beast declarations for mailpurge.
This header simplifies async notation throughout the library.

*/

#pragma once

#include <boost/asio/version.hpp>
#if BOOST_ASIO_VERSION < 101800 // Boost.Asio 1.18.0
#error "Boost.Asio version 1.18.0 or higher is required (Boost 1.74+)"
#endif

#include <boost/asio.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/ssl.hpp>

#if defined(BOOST_ASIO_HAS_CO_AWAIT)
#include <boost/asio/redirect_error.hpp>

namespace mailpurge::asio
{
    // Core types
    using boost::asio::awaitable;
    using boost::asio::co_spawn;
    using boost::asio::detached;
    using boost::asio::use_awaitable;
    using boost::asio::io_context;
    using boost::asio::any_io_executor;
    using boost::asio::steady_timer;
    using boost::asio::redirect_error;

    namespace this_coro = boost::asio::this_coro;

    namespace ip = boost::asio::ip;
    using tcp = boost::asio::ip::tcp;

    namespace ssl = boost::asio::ssl;
    namespace error = boost::asio::error;

    using error_code = boost::system::error_code;
    using system_error = boost::system::system_error;

} // namespace mailpurge::asio

#else
#error "mailpurge requires coroutine support (C++20) and Boost.Asio 1.18+"
#endif

namespace mailpurge
{
    using namespace std::literals::chrono_literals;
    using std::chrono::steady_clock;
}
