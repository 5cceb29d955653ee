#pragma once

#include <variant>
#include <string>
#include <utility>
#include <type_traits>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <openssl/ssl.h>
#include <mailshift/detail/asio_decl.hpp>
#include <mailshift/detail/result.hpp>
#include <mailshift/net/tls_options.hpp>

namespace mailshift
{
namespace net
{

using mailshift::asio::any_io_executor;
using mailshift::asio::awaitable;
using mailshift::asio::tcp;
namespace ssl = mailshift::asio::ssl;

/**
Plain TCP socket that can switch to TLS in place, so the dialog above it keeps one stream type for
implicit TLS, STARTTLS and plaintext endpoints.
**/
class upgradable_stream
{
public:
    using ssl_stream = ssl::stream<tcp::socket>;
    using executor_type = any_io_executor;
    using lowest_layer_type = std::remove_reference_t<decltype(std::declval<ssl_stream&>().lowest_layer())>;

    explicit upgradable_stream(tcp::socket socket)
        : stream_(std::move(socket))
    {
    }

    explicit upgradable_stream(executor_type executor)
        : stream_(tcp::socket(executor))
    {
    }

    executor_type get_executor()
    {
        return std::visit([](auto& stream) -> executor_type
        {
            return executor_type(stream.get_executor());
        }, stream_);
    }

    lowest_layer_type& lowest_layer()
    {
        return std::visit([](auto& stream) -> lowest_layer_type&
        {
            return stream.lowest_layer();
        }, stream_);
    }

    bool is_tls() const noexcept
    {
        return std::holds_alternative<ssl_stream>(stream_);
    }

    template<typename MutableBufferSequence, typename CompletionToken>
    auto async_read_some(const MutableBufferSequence& buffers, CompletionToken&& token)
    {
        return std::visit([&](auto& stream) -> decltype(auto)
        {
            return stream.async_read_some(buffers, std::forward<CompletionToken>(token));
        }, stream_);
    }

    template<typename ConstBufferSequence, typename CompletionToken>
    auto async_write_some(const ConstBufferSequence& buffers, CompletionToken&& token)
    {
        return std::visit([&](auto& stream) -> decltype(auto)
        {
            return stream.async_write_some(buffers, std::forward<CompletionToken>(token));
        }, stream_);
    }

    /// Closes the socket without a TLS close_notify; used for teardown of dead or finished sessions.
    void close() noexcept
    {
        mailshift::asio::error_code ignored;
        lowest_layer().shutdown(tcp::socket::shutdown_both, ignored);
        lowest_layer().close(ignored);
    }

    /**
    Wrapping the connected socket in TLS and running the client handshake.

    @param context Configured by make_tls_context().
    @param sni     Host name sent as SNI and, when verifying, matched against the certificate.
    @param verify  Whether the peer certificate is checked.
    **/
    awaitable<result_void> start_tls(ssl::context& context, const std::string& sni, verify_mode verify)
    {
        if (is_tls())
            co_return ok();

        auto socket = std::move(std::get<tcp::socket>(stream_));
        auto& tls_stream = stream_.template emplace<ssl_stream>(std::move(socket), context);
        if (!sni.empty())
            SSL_set_tlsext_host_name(tls_stream.native_handle(), sni.c_str());

        if (verify == verify_mode::peer)
        {
            if (sni.empty())
                co_return fail(error_code::tls_handshake_failed, "TLS hostname verification requires a host name.");
            tls_stream.set_verify_mode(ssl::verify_peer);
            tls_stream.set_verify_callback(ssl::host_name_verification(sni));
        }
        else
        {
            tls_stream.set_verify_mode(ssl::verify_none);
        }

        mailshift::asio::error_code ec;
        co_await tls_stream.async_handshake(ssl::stream_base::client,
            mailshift::asio::redirect_error(mailshift::asio::use_awaitable, ec));
        if (ec)
            co_return fail(error_code::tls_handshake_failed, "TLS handshake with " + sni + " failed.", ec.message());
        co_return ok();
    }

private:
    std::variant<tcp::socket, ssl_stream> stream_;
};

} // namespace net
} // namespace mailshift
