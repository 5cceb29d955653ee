/*

retry_policy.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>
#include <utility>
#include <mailshift/detail/asio_decl.hpp>
#include <mailshift/detail/log.hpp>
#include <mailshift/detail/result.hpp>
#include <mailshift/detail/timer.hpp>

namespace mailshift::migrate
{

namespace detail
{

template<class>
struct awaitable_value;

template<class T, class Executor>
struct awaitable_value<mailshift::asio::awaitable<T, Executor>>
{
    using type = T;
};

/// `T` of the `awaitable<T>` returned by calling F without arguments.
template<class F>
using operation_result_t = typename awaitable_value<std::remove_cvref_t<std::invoke_result_t<F&>>>::type;

} // namespace detail

/**
 * Bounded retry with linear backoff.
 * Only failures for which `error::is_session_abort()` holds are retried.
 */
struct retry_policy
{
    /// Total number of attempts, the first one included (0 behaves as 1)
    unsigned int max_attempts = 3;

    /// Delay unit; attempt k failing waits `base_delay * k` before attempt k+1
    std::chrono::milliseconds base_delay{0};

    static retry_policy linear(unsigned int attempts, std::chrono::milliseconds base)
    {
        retry_policy policy;
        policy.max_attempts = attempts;
        policy.base_delay = base;
        return policy;
    }

    /// Mailbox search: 5 attempts, 5 s base delay
    static retry_policy search()
    {
        return linear(5, std::chrono::seconds{5});
    }

    /// Fetch and append: the session is rebuilt between attempts instead of waiting
    static retry_policy reconnecting(unsigned int attempts = 3)
    {
        return linear(attempts, std::chrono::milliseconds{0});
    }

    [[nodiscard]] unsigned int attempts() const noexcept
    {
        return max_attempts == 0 ? 1 : max_attempts;
    }

    /// Delay after the failed attempt number `attempt` (1-based)
    [[nodiscard]] std::chrono::milliseconds delay_after(unsigned int attempt) const
    {
        return base_delay * attempt;
    }
};

/**
 * Runs `operation` until it succeeds, fails with an application error, or the attempts run out.
 *
 * After a session abort that leaves attempts, waits the policy delay and then runs `recover` before
 * the next attempt.
 *
 * @param policy    Attempt budget and backoff.
 * @param logger    Receives one warning per failed attempt.
 * @param label     Operation name for the log.
 * @param operation Callable returning `awaitable<result<T>>`.
 * @param recover   Callable returning `awaitable<result_void>`; its failure ends the retries at once.
 * @return          The first success, the last failure, or the recovery failure.
 */
template<typename OperationFn, typename RecoverFn>
auto with_backoff_recovery(const retry_policy& policy, mailshift::log::logger& logger, std::string_view label,
    OperationFn operation, RecoverFn recover)
    -> mailshift::asio::awaitable<detail::operation_result_t<OperationFn>>
{
    using result_type = detail::operation_result_t<OperationFn>;

    const unsigned int attempts = policy.attempts();
    for (unsigned int attempt = 1; ; ++attempt)
    {
        auto res = co_await operation();
        if (res || !res.error().is_session_abort())
            co_return std::move(res);
        if (attempt >= attempts)
        {
            MAILSHIFT_ERROR(logger, label << " failed after " << attempts << " attempts: " << res.error().to_string());
            co_return std::move(res);
        }

        const auto delay = policy.delay_after(attempt);
        MAILSHIFT_WARN(logger, label << " failed (attempt " << attempt << "/" << attempts << "): "
            << res.error().to_string() << "; reconnecting in " << delay.count() << " ms");
        co_await mailshift::detail::sleep_for(delay);
        auto recovered = co_await recover();
        if (!recovered)
        {
            MAILSHIFT_ERROR(logger, label << ": reconnect failed: " << recovered.error().to_string());
            co_return result_type(std::unexpected(std::move(recovered).error()));
        }
    }
}

/**
 * Reconnecting variant: after every failed attempt, the last one included, `recover` rebuilds the
 * session so that the caller continues on a live one.
 *
 * @param policy    Attempt budget; its delay is not used.
 * @param logger    Receives one warning per failed attempt.
 * @param label     Operation name for the log.
 * @param operation Callable returning `awaitable<result<T>>`.
 * @param recover   Callable returning `awaitable<result_void>`; its failure ends the retries at once.
 * @return          The first success, the last failure, or the recovery failure.
 */
template<typename OperationFn, typename RecoverFn>
auto with_recovery(const retry_policy& policy, mailshift::log::logger& logger, std::string_view label,
    OperationFn operation, RecoverFn recover)
    -> mailshift::asio::awaitable<detail::operation_result_t<OperationFn>>
{
    using result_type = detail::operation_result_t<OperationFn>;

    const unsigned int attempts = policy.attempts();
    for (unsigned int attempt = 1; ; ++attempt)
    {
        auto res = co_await operation();
        if (res || !res.error().is_session_abort())
            co_return std::move(res);

        MAILSHIFT_WARN(logger, label << " failed (attempt " << attempt << "/" << attempts << "): "
            << res.error().to_string() << "; reconnecting");
        auto recovered = co_await recover();
        if (!recovered)
        {
            MAILSHIFT_ERROR(logger, label << ": reconnect failed: " << recovered.error().to_string());
            co_return result_type(std::unexpected(std::move(recovered).error()));
        }
        if (attempt >= attempts)
        {
            MAILSHIFT_ERROR(logger, label << " failed after " << attempts << " attempts");
            co_return std::move(res);
        }
    }
}

} // namespace mailshift::migrate
