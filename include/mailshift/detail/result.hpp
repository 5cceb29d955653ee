/*

result.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Error handling types using std::expected (C++23).
No exceptions leave mailshift components - all errors are returned via result<T>.

*/

#pragma once

#include <cstdint>
#include <expected>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace mailshift
{

/// Error categories for mailshift operations
enum class error_code : std::uint16_t
{
    success = 0,

    // Network errors (100-199)
    connection_failed = 100,
    connection_closed = 101,
    connection_timeout = 102,
    dns_resolution_failed = 103,
    tls_handshake_failed = 104,
    socket_error = 106,

    // Protocol errors (200-299)
    invalid_response = 200,
    unexpected_response = 201,
    server_bye = 202,
    parse_error = 203,
    invalid_state = 204,
    authentication_failed = 206,

    // IMAP specific (300-399)
    imap_no_response = 300,
    imap_bad_response = 301,

    // Ledger errors (400-499)
    ledger_open_failed = 400,
    ledger_query_failed = 401,
    ledger_write_failed = 402,

    // Configuration errors (500-599)
    config_missing_file = 500,
    config_parse_error = 501,
    config_invalid_value = 502,

    // Input validation (700-799)
    invalid_argument = 700,
    invalid_mailbox = 701,

    // Internal errors (900-999)
    internal_error = 900,
    cancelled = 902,
};

/// Convert error code to string
[[nodiscard]] constexpr std::string_view error_code_to_string(error_code ec) noexcept
{
    switch (ec)
    {
        case error_code::success: return "Success";
        case error_code::connection_failed: return "Connection failed";
        case error_code::connection_closed: return "Connection closed";
        case error_code::connection_timeout: return "Connection timeout";
        case error_code::dns_resolution_failed: return "DNS resolution failed";
        case error_code::tls_handshake_failed: return "TLS handshake failed";
        case error_code::socket_error: return "Socket error";
        case error_code::invalid_response: return "Invalid response";
        case error_code::unexpected_response: return "Unexpected response";
        case error_code::server_bye: return "Server closed the session";
        case error_code::parse_error: return "Parse error";
        case error_code::invalid_state: return "Invalid state";
        case error_code::authentication_failed: return "Authentication failed";
        case error_code::imap_no_response: return "IMAP NO response";
        case error_code::imap_bad_response: return "IMAP BAD response";
        case error_code::ledger_open_failed: return "Ledger open failed";
        case error_code::ledger_query_failed: return "Ledger query failed";
        case error_code::ledger_write_failed: return "Ledger write failed";
        case error_code::config_missing_file: return "Configuration file missing";
        case error_code::config_parse_error: return "Configuration parse error";
        case error_code::config_invalid_value: return "Invalid configuration value";
        case error_code::invalid_argument: return "Invalid argument";
        case error_code::invalid_mailbox: return "Invalid mailbox";
        case error_code::internal_error: return "Internal error";
        case error_code::cancelled: return "Operation cancelled";
    }
    return "Unknown error";
}

inline std::ostream& operator<<(std::ostream& os, error_code ec)
{
    return os << error_code_to_string(ec) << " (" << static_cast<int>(ec) << ")";
}

/// Rich error type with code, message, and optional server response
class error
{
public:
    error() noexcept : code_(error_code::success) {}

    explicit error(error_code code)
        : code_(code), message_(error_code_to_string(code)) {}

    error(error_code code, std::string message)
        : code_(code), message_(std::move(message)) {}

    error(error_code code, std::string message, std::string server_response)
        : code_(code), message_(std::move(message)), server_response_(std::move(server_response)) {}

    [[nodiscard]] error_code code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] const std::string& server_response() const noexcept { return server_response_; }

    [[nodiscard]] bool is_success() const noexcept { return code_ == error_code::success; }
    [[nodiscard]] explicit operator bool() const noexcept { return !is_success(); }

    /// Format error for display
    [[nodiscard]] std::string to_string() const
    {
        std::string out = "[";
        out += std::to_string(static_cast<int>(code_));
        out += "] ";
        out += message_;
        if (!server_response_.empty())
        {
            out += ": ";
            out += server_response_;
        }
        return out;
    }

    /// Check if this is a specific error
    [[nodiscard]] bool is(error_code ec) const noexcept { return code_ == ec; }

    /// Check if this is a network error
    [[nodiscard]] bool is_network_error() const noexcept
    {
        auto c = static_cast<std::uint16_t>(code_);
        return c >= 100 && c < 200;
    }

    /// Check if this is a protocol error
    [[nodiscard]] bool is_protocol_error() const noexcept
    {
        auto c = static_cast<std::uint16_t>(code_);
        return c >= 200 && c < 400;
    }

    /// The connection itself is gone or out of sync; the session must be replaced.
    /// Tagged NO/BAD answers are application errors and do not qualify.
    [[nodiscard]] bool is_session_abort() const noexcept
    {
        if (is_network_error())
            return code_ != error_code::dns_resolution_failed;
        return code_ == error_code::server_bye
            || code_ == error_code::invalid_response
            || code_ == error_code::unexpected_response
            || code_ == error_code::parse_error;
    }

private:
    error_code code_;
    std::string message_;
    std::string server_response_;
};

/// Result type alias using std::expected
template<typename T>
using result = std::expected<T, error>;

/// Void result for operations that don't return a value
using result_void = std::expected<void, error>;

/// Helper to create successful result
template<typename T>
[[nodiscard]] constexpr result<std::decay_t<T>> ok(T&& value)
{
    return result<std::decay_t<T>>(std::forward<T>(value));
}

/// Helper to create void success
[[nodiscard]] inline result_void ok()
{
    return result_void{};
}

/// Helper to create error result
template<typename T = void>
[[nodiscard]] std::expected<T, error> fail(error err)
{
    return std::unexpected(std::move(err));
}

template<typename T = void>
[[nodiscard]] std::expected<T, error> fail(error_code code)
{
    return std::unexpected(error(code));
}

template<typename T = void>
[[nodiscard]] std::expected<T, error> fail(error_code code, std::string message)
{
    return std::unexpected(error(code, std::move(message)));
}

template<typename T = void>
[[nodiscard]] std::expected<T, error> fail(error_code code, std::string message, std::string server_response)
{
    return std::unexpected(error(code, std::move(message), std::move(server_response)));
}

// ==================== Propagation Helpers ====================

/// Assign the value of a result or return its error from the enclosing function.
#define MAILSHIFT_TRY_ASSIGN(lhs, expr) \
    do { \
        auto _mailshift_res = (expr); \
        if (!_mailshift_res) [[unlikely]] \
            return std::unexpected(std::move(_mailshift_res).error()); \
        lhs = std::move(*_mailshift_res); \
    } while (false)

#define MAILSHIFT_TRY_VOID(expr) \
    do { \
        auto _mailshift_res = (expr); \
        if (!_mailshift_res) [[unlikely]] \
            return std::unexpected(std::move(_mailshift_res).error()); \
    } while (false)

/// Coroutine flavours; usage: MAILSHIFT_CO_TRY_ASSIGN(resp, co_await command(cmd));
#define MAILSHIFT_CO_TRY_ASSIGN(lhs, expr) \
    do { \
        auto _mailshift_res = (expr); \
        if (!_mailshift_res) [[unlikely]] \
            co_return std::unexpected(std::move(_mailshift_res).error()); \
        lhs = std::move(*_mailshift_res); \
    } while (false)

#define MAILSHIFT_CO_TRY_VOID(expr) \
    do { \
        auto _mailshift_res = (expr); \
        if (!_mailshift_res) [[unlikely]] \
            co_return std::unexpected(std::move(_mailshift_res).error()); \
    } while (false)

} // namespace mailshift
