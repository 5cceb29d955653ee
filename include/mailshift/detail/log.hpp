/*

log.hpp
-------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Lightweight, header-only logging infrastructure for mailshift.
A logger is an explicit context object: it is created once by the program and
handed by reference to every component that logs.

*/

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <functional>
#include <iostream>
#include <mutex>
#include <optional>
#include <source_location>
#include <sstream>
#include <string>
#include <string_view>

namespace mailshift::log
{

/// Log severity levels
enum class level : std::uint8_t
{
    trace = 0,   ///< Protocol-level tracing (very verbose)
    debug = 1,   ///< Debug information
    info = 2,    ///< Informational messages
    warn = 3,    ///< Warnings (non-fatal issues)
    error = 4,   ///< Errors (operation failures)
    fatal = 5,   ///< Fatal errors (unrecoverable)
    off = 6      ///< Logging disabled
};

/// Direction for protocol tracing
enum class direction : std::uint8_t
{
    send,     ///< Data sent to server
    receive   ///< Data received from server
};

/// Log entry structure passed to callbacks
struct entry
{
    level lvl;
    std::chrono::system_clock::time_point timestamp;
    std::string message;
    std::source_location location;

    // Optional protocol trace info
    struct trace_info_t
    {
        direction dir;
        std::string protocol;  // "IMAP"
        std::string data;      // Raw protocol data
    };
    std::optional<trace_info_t> trace_info;
};

/// Log callback signature
using callback_t = std::function<void(const entry&)>;

/// Convert level to string
[[nodiscard]] constexpr std::string_view level_to_string(level lvl) noexcept
{
    switch (lvl)
    {
        case level::trace: return "TRACE";
        case level::debug: return "DEBUG";
        case level::info:  return "INFO";
        case level::warn:  return "WARNING";
        case level::error: return "ERROR";
        case level::fatal: return "FATAL";
        case level::off:   return "OFF";
    }
    return "UNKNOWN";
}

/// Logging context, thread-safe.
class logger
{
public:
    explicit logger(level min_level = level::info) noexcept
        : min_level_(static_cast<std::uint8_t>(min_level))
    {
    }

    logger(const logger&) = delete;
    logger& operator=(const logger&) = delete;

    /// Set minimum log level
    void set_level(level lvl) noexcept
    {
        min_level_.store(static_cast<std::uint8_t>(lvl), std::memory_order_relaxed);
    }

    /// Get current minimum log level
    [[nodiscard]] level get_level() const noexcept
    {
        return static_cast<level>(min_level_.load(std::memory_order_relaxed));
    }

    /// Check if level is enabled
    [[nodiscard]] bool is_enabled(level lvl) const noexcept
    {
        return lvl != level::off && static_cast<std::uint8_t>(lvl) >= min_level_.load(std::memory_order_relaxed);
    }

    /// Set custom log callback (replaces default stderr output)
    void set_callback(callback_t cb)
    {
        std::lock_guard lock(mutex_);
        callback_ = std::move(cb);
    }

    /// Clear custom callback (restore default stderr output)
    void clear_callback()
    {
        std::lock_guard lock(mutex_);
        callback_ = nullptr;
    }

    /// Enable/disable protocol tracing
    void set_trace_enabled(bool enabled) noexcept
    {
        trace_enabled_.store(enabled, std::memory_order_relaxed);
    }

    [[nodiscard]] bool is_trace_enabled() const noexcept
    {
        return trace_enabled_.load(std::memory_order_relaxed);
    }

    /// Log a message
    void log(level lvl, std::string_view message,
             std::source_location loc = std::source_location::current())
    {
        if (!is_enabled(lvl))
            return;

        entry e{
            .lvl = lvl,
            .timestamp = std::chrono::system_clock::now(),
            .message = std::string(message),
            .location = loc,
            .trace_info = std::nullopt
        };

        dispatch(e);
    }

    /// Log protocol trace
    void trace_protocol(std::string_view protocol, direction dir, std::string_view data,
                       std::source_location loc = std::source_location::current())
    {
        if (!is_trace_enabled())
            return;

        entry e{
            .lvl = level::trace,
            .timestamp = std::chrono::system_clock::now(),
            .message = {},
            .location = loc,
            .trace_info = entry::trace_info_t{
                .dir = dir,
                .protocol = std::string(protocol),
                .data = std::string(data)
            }
        };

        dispatch(e);
    }

private:
    void dispatch(const entry& e)
    {
        std::lock_guard lock(mutex_);
        if (callback_)
        {
            callback_(e);
        }
        else
        {
            default_output(e);
        }
    }

    static void default_output(const entry& e)
    {
        auto time = std::chrono::system_clock::to_time_t(e.timestamp);
        std::tm tm_buf{};
        localtime_r(&time, &tm_buf);
        char stamp[32]{};
        std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm_buf);

        if (e.trace_info)
        {
            // Protocol trace format
            const char* dir_str = (e.trace_info->dir == direction::send) ? ">>>" : "<<<";
            std::cerr << stamp << ' ' << e.trace_info->protocol << ' ' << dir_str << ' '
                      << sanitize_trace(e.trace_info->data) << '\n';
        }
        else
        {
            std::cerr << stamp << " [" << level_to_string(e.lvl) << "] " << e.message << '\n';
        }
    }

    /// Sanitize trace data (truncate long data, hide control characters)
    [[nodiscard]] static std::string sanitize_trace(std::string_view data)
    {
        std::string result(data);

        constexpr std::size_t max_len = 500;
        if (result.size() > max_len)
        {
            result.resize(max_len);
            result += "... [truncated]";
        }

        for (auto& c : result)
        {
            if (static_cast<unsigned char>(c) < 32 && c != '\r' && c != '\n')
                c = '.';
        }

        while (!result.empty() && (result.back() == '\r' || result.back() == '\n'))
            result.pop_back();

        return result;
    }

    std::atomic<std::uint8_t> min_level_;
    std::atomic<bool> trace_enabled_{false};
    std::mutex mutex_;
    callback_t callback_;
};

// Stream-style logging macros; the message expression is only evaluated when the level is enabled.
#define MAILSHIFT_LOG(lg, lvl, expr) \
    do { \
        if ((lg).is_enabled(lvl)) \
        { \
            std::ostringstream _mailshift_log_os; \
            _mailshift_log_os << expr; \
            (lg).log(lvl, _mailshift_log_os.str(), std::source_location::current()); \
        } \
    } while (false)

#define MAILSHIFT_TRACE(lg, expr)  MAILSHIFT_LOG(lg, ::mailshift::log::level::trace, expr)
#define MAILSHIFT_DEBUG(lg, expr)  MAILSHIFT_LOG(lg, ::mailshift::log::level::debug, expr)
#define MAILSHIFT_INFO(lg, expr)   MAILSHIFT_LOG(lg, ::mailshift::log::level::info, expr)
#define MAILSHIFT_WARN(lg, expr)   MAILSHIFT_LOG(lg, ::mailshift::log::level::warn, expr)
#define MAILSHIFT_ERROR(lg, expr)  MAILSHIFT_LOG(lg, ::mailshift::log::level::error, expr)
#define MAILSHIFT_FATAL(lg, expr)  MAILSHIFT_LOG(lg, ::mailshift::log::level::fatal, expr)

} // namespace mailshift::log
