/*

asio_decl.hpp
-------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Centralized Boost.Asio declarations for courier.
Sessions use coroutines with redirect_error so that network failures are
returned as values instead of exceptions.

*/

#pragma once

#include <chrono>

#include <boost/asio.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/ssl.hpp>

#if !defined(BOOST_ASIO_HAS_CO_AWAIT)
#error "courier requires coroutine support (C++20) in Boost.Asio"
#endif

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>

namespace courier::asio
{
    // Core types
    using boost::asio::awaitable;
    using boost::asio::buffer;
    using boost::asio::co_spawn;
    using boost::asio::use_awaitable;
    using boost::asio::use_future;
    using boost::asio::io_context;
    using boost::asio::thread_pool;
    using boost::asio::any_io_executor;
    using boost::asio::steady_timer;
    using boost::asio::redirect_error;

    namespace this_coro = boost::asio::this_coro;

    // IP networking
    namespace ip = boost::asio::ip;
    using tcp = boost::asio::ip::tcp;

    // Async operations
    using boost::asio::async_write;
    using boost::asio::async_connect;

    namespace ssl = boost::asio::ssl;
    namespace error = boost::asio::error;

    using error_code = boost::system::error_code;

} // namespace courier::asio

namespace courier
{
    using std::chrono::steady_clock;

    // Names used unqualified by the session code
    using asio::awaitable;
    using asio::any_io_executor;
    using asio::tcp;
    namespace ssl = asio::ssl;
    namespace ip = asio::ip;
}
