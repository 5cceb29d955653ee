/*

timer.hpp
---------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <chrono>
#include <mailshift/detail/asio_decl.hpp>

namespace mailshift::detail
{

/// Suspends the calling coroutine for `delay` on its own executor; non-positive delays return at once.
inline mailshift::asio::awaitable<void> sleep_for(std::chrono::steady_clock::duration delay)
{
    if (delay <= std::chrono::steady_clock::duration::zero())
        co_return;

    mailshift::asio::steady_timer timer(co_await mailshift::asio::this_coro::executor);
    timer.expires_after(delay);
    mailshift::asio::error_code ec;
    co_await timer.async_wait(mailshift::asio::redirect_error(mailshift::asio::use_awaitable, ec));
}

} // namespace mailshift::detail
