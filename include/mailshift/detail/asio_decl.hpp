/*

asio_decl.hpp
-------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Boost.Asio names used across mailshift, gathered in one namespace.

*/

#pragma once

#include <chrono>

#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl.hpp>

#if !defined(BOOST_ASIO_HAS_CO_AWAIT)
#error "mailshift requires coroutine support (C++20) in Boost.Asio"
#endif

namespace mailshift::asio
{
    // Core types
    using boost::asio::awaitable;
    using boost::asio::buffer;
    using boost::asio::co_spawn;
    using boost::asio::detached;
    using boost::asio::use_awaitable;
    using boost::asio::io_context;
    using boost::asio::any_io_executor;
    using boost::asio::steady_timer;
    using boost::asio::redirect_error;

    // IP networking
    using tcp = boost::asio::ip::tcp;

    // Async operations
    using boost::asio::async_write;
    using boost::asio::async_read;
    using boost::asio::async_read_until;
    using boost::asio::async_connect;
    using boost::asio::dynamic_buffer;
    using boost::asio::transfer_exactly;

    namespace ssl = boost::asio::ssl;
    namespace error = boost::asio::error;
    namespace this_coro = boost::asio::this_coro;

    using error_code = boost::system::error_code;

} // namespace mailshift::asio

// Common chrono literals
namespace mailshift
{
    using namespace std::literals::chrono_literals;
    using std::chrono::steady_clock;
}
