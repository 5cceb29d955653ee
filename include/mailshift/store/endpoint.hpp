/*

endpoint.hpp
------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <mailshift/net/tls_options.hpp>

namespace mailshift::store
{

/// Where and how to reach one mail account.
struct endpoint_config
{
    std::string host;
    std::string username;
    std::string password;
    std::optional<unsigned short> port;
    bool secure = true;
    bool starttls = false;
    bool verify = true;
    std::string ca_file;
    std::optional<std::chrono::seconds> timeout;

    [[nodiscard]] mailshift::net::tls_mode tls_mode() const noexcept
    {
        if (!secure)
            return mailshift::net::tls_mode::none;
        return starttls ? mailshift::net::tls_mode::starttls : mailshift::net::tls_mode::implicit;
    }

    /// Configured port, or 993 for implicit TLS and 143 otherwise.
    [[nodiscard]] unsigned short effective_port() const noexcept
    {
        if (port.has_value())
            return *port;
        return tls_mode() == mailshift::net::tls_mode::implicit ? 993 : 143;
    }

    /// `user@host:port` for log lines.
    [[nodiscard]] std::string describe() const
    {
        return username + "@" + host + ":" + std::to_string(effective_port());
    }
};

} // namespace mailshift::store
