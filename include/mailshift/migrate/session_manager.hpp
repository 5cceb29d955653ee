/*

session_manager.hpp
-------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <mailshift/detail/asio_decl.hpp>
#include <mailshift/detail/log.hpp>
#include <mailshift/detail/result.hpp>
#include <mailshift/detail/timer.hpp>
#include <mailshift/store/endpoint.hpp>
#include <mailshift/store/session.hpp>

namespace mailshift::migrate
{

using mailshift::asio::awaitable;
using session_ptr = std::unique_ptr<mailshift::store::session>;

/**
Opens, replaces and closes sessions to one endpoint at a time.

A session handed to reopen() or close() is consumed; callers keep only the returned one.
**/
class session_manager
{
public:
    /// Pause between dropping a dead session and opening its replacement.
    static constexpr std::chrono::milliseconds DEFAULT_COOLDOWN{3000};

    session_manager(mailshift::store::connector& connector, mailshift::log::logger& logger,
        std::chrono::milliseconds cooldown = DEFAULT_COOLDOWN)
        : connector_(connector), logger_(logger), cooldown_(cooldown)
    {
    }

    /// Authenticated session; connection and login failures are returned, never retried here.
    awaitable<result<session_ptr>> open(const mailshift::store::endpoint_config& config)
    {
        auto opened = co_await connector_.open(config);
        if (!opened)
        {
            MAILSHIFT_ERROR(logger_, "Cannot connect to " << config.describe() << ": " << opened.error().to_string());
            co_return std::move(opened);
        }
        MAILSHIFT_DEBUG(logger_, "Connected to " << config.describe());
        co_return std::move(opened);
    }

    /**
    Replacing a session: best-effort logout of the stale one, cooldown, then open().

    @param stale  Session to drop; may be null.
    @param config Endpoint to reconnect to.
    **/
    awaitable<result<session_ptr>> reopen(session_ptr stale, const mailshift::store::endpoint_config& config)
    {
        MAILSHIFT_INFO(logger_, "Reconnecting to " << config.describe());
        co_await close(std::move(stale));
        co_await mailshift::detail::sleep_for(cooldown_);
        co_return co_await open(config);
    }

    /// Best-effort logout; false when it did not complete cleanly. The session is gone either way.
    awaitable<bool> close(session_ptr session)
    {
        if (!session)
            co_return true;
        auto res = co_await session->logout();
        if (!res)
        {
            MAILSHIFT_DEBUG(logger_, "Logout failed: " << res.error().to_string());
            co_return false;
        }
        co_return true;
    }

    awaitable<result<std::vector<std::string>>> list_mailboxes(mailshift::store::session& session)
    {
        auto names = co_await session.list_mailboxes();
        if (!names)
            MAILSHIFT_ERROR(logger_, "Cannot list mailboxes: " << names.error().to_string());
        co_return std::move(names);
    }

    /**
    Selecting a mailbox, creating it first when the select fails.

    @return False when neither the select nor the creation and second select succeed.
    **/
    awaitable<bool> ensure_mailbox_selected(mailshift::store::session& session, std::string_view mailbox)
    {
        auto selected = co_await session.select(mailbox);
        if (selected)
            co_return true;
        MAILSHIFT_DEBUG(logger_, "Select " << mailbox << " failed: " << selected.error().to_string() << "; creating it");

        auto created = co_await session.create(mailbox);
        if (!created)
        {
            MAILSHIFT_WARN(logger_, "Cannot create mailbox " << mailbox << ": " << created.error().to_string());
            co_return false;
        }
        auto reselected = co_await session.select(mailbox);
        if (!reselected)
        {
            MAILSHIFT_WARN(logger_, "Cannot select mailbox " << mailbox << ": " << reselected.error().to_string());
            co_return false;
        }
        MAILSHIFT_INFO(logger_, "Created mailbox " << mailbox);
        co_return true;
    }

    /**
    Creating a mailbox unless it exists.

    A tagged refusal is taken as "already exists". False only when the session failed.
    **/
    awaitable<bool> ensure_mailbox_exists(mailshift::store::session& session, std::string_view mailbox)
    {
        auto created = co_await session.create(mailbox);
        if (created)
        {
            MAILSHIFT_INFO(logger_, "Created mailbox " << mailbox);
            co_return true;
        }
        if (!created.error().is_session_abort())
        {
            MAILSHIFT_DEBUG(logger_, "Create " << mailbox << " refused, assuming it exists: "
                << created.error().to_string());
            co_return true;
        }
        MAILSHIFT_WARN(logger_, "Cannot create mailbox " << mailbox << ": " << created.error().to_string());
        co_return false;
    }

    [[nodiscard]] std::chrono::milliseconds cooldown() const noexcept
    {
        return cooldown_;
    }

private:
    mailshift::store::connector& connector_;
    mailshift::log::logger& logger_;
    std::chrono::milliseconds cooldown_;
};

} // namespace mailshift::migrate
