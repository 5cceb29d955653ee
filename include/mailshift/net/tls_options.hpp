/*

tls_options.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <mailshift/detail/asio_decl.hpp>
#include <mailshift/detail/result.hpp>

namespace mailshift::net
{

/// How a connection gets encrypted: never, after `STARTTLS`, or from the first byte.
enum class tls_mode
{
    none,
    starttls,
    implicit
};

[[nodiscard]] constexpr std::string_view to_string(tls_mode mode) noexcept
{
    switch (mode)
    {
        case tls_mode::none: return "plain";
        case tls_mode::starttls: return "starttls";
        case tls_mode::implicit: return "tls";
    }
    return "unknown";
}

inline std::ostream& operator<<(std::ostream& os, tls_mode mode)
{
    return os << to_string(mode);
}

enum class verify_mode
{
    none,
    peer
};

/// Per-endpoint TLS policy.
struct tls_options
{
    /// `peer` checks the chain and the host name against the certificate.
    verify_mode verify = verify_mode::peer;
    /// Extra trust anchor (PEM) on top of the system store; empty for none.
    std::string ca_file;
    std::optional<int> min_tls_version = TLS1_2_VERSION;
};

namespace detail
{

inline std::string openssl_error_message()
{
    const unsigned long err = ERR_get_error();
    if (err == 0)
        return {};
    char buffer[256];
    ERR_error_string_n(err, buffer, sizeof(buffer));
    return std::string(buffer);
}

} // namespace detail

/**
Client context carrying the trust store and protocol floor of one endpoint.

@param options Verification and trust settings.
@return        The context, or `tls_handshake_failed` when the CA file or the version floor is refused.
**/
[[nodiscard]] inline result<std::unique_ptr<mailshift::asio::ssl::context>> make_tls_context(const tls_options& options)
{
    auto ctx = std::make_unique<mailshift::asio::ssl::context>(mailshift::asio::ssl::context::tls_client);

    mailshift::asio::error_code ec;
    ctx->set_default_verify_paths(ec);
    if (ec)
        return fail<std::unique_ptr<mailshift::asio::ssl::context>>(error_code::tls_handshake_failed,
            "TLS trust store configuration failed.", ec.message());
    if (!options.ca_file.empty())
    {
        ctx->load_verify_file(options.ca_file, ec);
        if (ec)
            return fail<std::unique_ptr<mailshift::asio::ssl::context>>(error_code::tls_handshake_failed,
                "Cannot load CA file " + options.ca_file + ".", ec.message());
    }

    if (options.min_tls_version.has_value()
        && SSL_CTX_set_min_proto_version(ctx->native_handle(), *options.min_tls_version) != 1)
    {
        return fail<std::unique_ptr<mailshift::asio::ssl::context>>(error_code::tls_handshake_failed,
            "TLS min version configuration failed.", detail::openssl_error_message());
    }
    return ok(std::move(ctx));
}

} // namespace mailshift::net
