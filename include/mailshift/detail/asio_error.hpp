/*

asio_error.hpp
--------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Translation of socket and TLS failures into mailshift::error.

*/

#pragma once

#include <string>
#include <string_view>
#include <mailshift/detail/asio_decl.hpp>
#include <mailshift/detail/result.hpp>

namespace mailshift
{

namespace detail
{

/// Peer or network went away mid-session: the session is replaced and the operation retried.
[[nodiscard]] inline bool is_dropped_connection(const asio::error_code& ec) noexcept
{
    return ec == asio::error::eof
        || ec == asio::error::connection_reset
        || ec == asio::error::connection_aborted
        || ec == asio::error::broken_pipe
        || ec == asio::error::not_connected
        || ec == asio::error::shut_down
        || ec == asio::error::network_down
        || ec == asio::error::network_reset
        || ec == asio::ssl::error::stream_truncated;
}

[[nodiscard]] inline error_code classify_asio(const asio::error_code& ec) noexcept
{
    if (is_dropped_connection(ec))
        return error_code::connection_closed;
    if (ec == asio::error::timed_out)
        return error_code::connection_timeout;
    if (ec == asio::error::operation_aborted)
        return error_code::cancelled;
    if (ec == asio::error::connection_refused || ec == asio::error::host_unreachable
        || ec == asio::error::network_unreachable)
        return error_code::connection_failed;
    if (ec == asio::error::host_not_found || ec == asio::error::host_not_found_try_again
        || ec == asio::error::no_data)
        return error_code::dns_resolution_failed;
    if (ec.category() == asio::error::get_ssl_category())
        return error_code::tls_handshake_failed;
    return error_code::socket_error;
}

} // namespace detail

/// Error for a failed socket step; `stage` ("connect", "read", ...) prefixes the system message.
[[nodiscard]] inline error error_from_asio(const asio::error_code& ec, std::string_view stage = {})
{
    if (!ec)
        return error{};

    std::string message(stage);
    if (!message.empty())
        message += ": ";
    message += ec.message();
    return error(detail::classify_asio(ec), std::move(message));
}

} // namespace mailshift
