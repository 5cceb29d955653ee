/*

dialog.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <algorithm>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <mailshift/detail/asio_decl.hpp>
#include <mailshift/detail/asio_error.hpp>
#include <mailshift/detail/log.hpp>
#include <mailshift/detail/redact.hpp>
#include <mailshift/detail/result.hpp>

namespace mailshift
{
namespace net
{

/// Default maximum line length for line oriented protocols.
inline constexpr std::size_t DEFAULT_MAX_LINE_LENGTH = 8192;

/// Absolute maximum line length to prevent excessive memory allocation (64 MB)
inline constexpr std::size_t MAX_ALLOWED_LINE_LENGTH = 64 * 1024 * 1024;

/**
Dealing with network in a line oriented fashion.
Wraps a Boost.Asio stream (socket, ssl stream, etc.); every operation is a coroutine returning a result.
**/
template<typename Stream>
class dialog
{
public:
    using duration = std::chrono::steady_clock::duration;

    dialog(Stream stream,
        std::size_t max_line_length = DEFAULT_MAX_LINE_LENGTH,
        std::optional<duration> timeout = std::nullopt)
        : stream_(std::move(stream)),
          max_line_length_(std::min(max_line_length, MAX_ALLOWED_LINE_LENGTH)),
          timeout_(timeout)
    {
    }

    void set_trace(mailshift::log::logger* logger, std::string protocol)
    {
        logger_ = logger;
        trace_protocol_ = std::move(protocol);
    }

    /**
    Sending a line to network.

    @param line  Line to send (CRLF added if missing).
    **/
    asio::awaitable<result_void> write_line_r(std::string_view line)
    {
        std::string payload = normalize_line(line);
        trace_line(mailshift::log::direction::send, payload);
        co_return co_await write_payload(payload, "write");
    }

    /**
    Writing raw bytes to network.

    @param data Bytes to write as they are.
    **/
    asio::awaitable<result_void> write_raw_r(std::string_view data)
    {
        co_return co_await write_payload(data, "write literal");
    }

    /**
    Receiving a line from network, without the trailing CRLF.
    **/
    asio::awaitable<result<std::string>> read_line_r()
    {
        auto pos = read_buffer_.find('\n');
        if (pos == std::string::npos)
        {
            watchdog guard(stream_, timeout_);
            asio::error_code ec;
            co_await asio::async_read_until(stream_, asio::dynamic_buffer(read_buffer_, max_line_length_ + 2), '\n',
                asio::redirect_error(asio::use_awaitable, ec));
            ec = guard.adjust(ec);
            if (ec == asio::error::not_found)
                co_return fail<std::string>(error_code::parse_error, "Line exceeds the maximum length.");
            if (ec)
                co_return fail<std::string>(error_from_asio(ec, "read"));
            pos = read_buffer_.find('\n');
            if (pos == std::string::npos)
                co_return fail<std::string>(error_code::parse_error, "Line terminator missing.");
        }

        std::size_t line_length = (pos > 0 && read_buffer_[pos - 1] == '\r') ? pos - 1 : pos;
        if (line_length > max_line_length_)
            co_return fail<std::string>(error_code::parse_error, "Line exceeds the maximum length.");
        std::string line = read_buffer_.substr(0, line_length);
        read_buffer_.erase(0, pos + 1);
        trace_line(mailshift::log::direction::receive, line);
        co_return ok(std::move(line));
    }

    /**
    Receiving exactly N bytes from network.

    @param n     Number of bytes to read.
    **/
    asio::awaitable<result<std::string>> read_exactly_r(std::size_t n)
    {
        if (read_buffer_.size() < n)
        {
            const std::size_t remaining = n - read_buffer_.size();
            watchdog guard(stream_, timeout_);
            asio::error_code ec;
            co_await asio::async_read(stream_, asio::dynamic_buffer(read_buffer_), asio::transfer_exactly(remaining),
                asio::redirect_error(asio::use_awaitable, ec));
            ec = guard.adjust(ec);
            if (ec)
                co_return fail<std::string>(error_from_asio(ec, "read literal"));
            if (read_buffer_.size() < n)
                co_return fail<std::string>(error_code::connection_closed, "Literal truncated by peer.");
        }

        std::string out(read_buffer_.data(), n);
        read_buffer_.erase(0, n);
        if (logger_ != nullptr && logger_->is_trace_enabled())
            logger_->trace_protocol(trace_protocol_, mailshift::log::direction::receive,
                "{" + std::to_string(n) + " literal bytes}");
        co_return ok(std::move(out));
    }

    [[nodiscard]] Stream& stream() noexcept { return stream_; }
    [[nodiscard]] const Stream& stream() const noexcept { return stream_; }

    [[nodiscard]] std::size_t max_line_length() const noexcept { return max_line_length_; }
    [[nodiscard]] std::optional<duration> timeout() const noexcept { return timeout_; }

protected:
    /// Cancels the pending socket operation when the configured timeout expires.
    class watchdog
    {
    public:
        watchdog(Stream& stream, std::optional<duration> timeout)
            : timer_(stream.get_executor()),
              timed_out_(std::make_shared<bool>(false))
        {
            if (!timeout.has_value())
                return;
            timer_.expires_after(*timeout);
            timer_.async_wait([&stream, flag = timed_out_](asio::error_code ec)
            {
                if (ec)
                    return;
                *flag = true;
                asio::error_code ignore_ec;
                stream.lowest_layer().cancel(ignore_ec);
            });
        }

        [[nodiscard]] asio::error_code adjust(asio::error_code ec) const
        {
            if (*timed_out_ && ec == asio::error::operation_aborted)
                return asio::error::timed_out;
            return ec;
        }

    private:
        asio::steady_timer timer_;
        std::shared_ptr<bool> timed_out_;
    };

    asio::awaitable<result_void> write_payload(std::string_view payload, std::string_view stage)
    {
        watchdog guard(stream_, timeout_);
        asio::error_code ec;
        co_await asio::async_write(stream_, asio::buffer(payload.data(), payload.size()),
            asio::redirect_error(asio::use_awaitable, ec));
        ec = guard.adjust(ec);
        if (ec)
            co_return fail(error_from_asio(ec, stage));
        co_return ok();
    }

    static std::string normalize_line(std::string_view line)
    {
        if (line.size() >= 2 && line.substr(line.size() - 2) == "\r\n")
            return std::string(line);
        if (!line.empty() && line.back() == '\n')
        {
            std::string out(line.substr(0, line.size() - 1));
            out += "\r\n";
            return out;
        }
        std::string out(line);
        out += "\r\n";
        return out;
    }

    void trace_line(mailshift::log::direction dir, std::string_view data) const
    {
        if (logger_ == nullptr || !logger_->is_trace_enabled())
            return;
        if (dir == mailshift::log::direction::send)
        {
            logger_->trace_protocol(trace_protocol_, dir, mailshift::detail::redact_line(data));
            return;
        }
        logger_->trace_protocol(trace_protocol_, dir, data);
    }

    Stream stream_;
    std::string read_buffer_;
    std::size_t max_line_length_;
    std::optional<duration> timeout_;

    mailshift::log::logger* logger_{nullptr};
    std::string trace_protocol_{"NET"};
};

} // namespace net
} // namespace mailshift
