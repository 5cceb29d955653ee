/*

imap_session.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <map>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <mailshift/detail/asio_decl.hpp>
#include <mailshift/detail/command.hpp>
#include <mailshift/detail/log.hpp>
#include <mailshift/detail/result.hpp>
#include <mailshift/imap/client.hpp>
#include <mailshift/imap/utf7.hpp>
#include <mailshift/store/endpoint.hpp>
#include <mailshift/store/session.hpp>

namespace mailshift::store
{

namespace ssl = mailshift::asio::ssl;

/// Data items requested per message; BODY.PEEK leaves `\Seen` untouched at the source.
inline constexpr std::string_view IMAP_FETCH_ITEMS = "(UID FLAGS INTERNALDATE BODY.PEEK[])";

/// Session over an IMAP connection.
class imap_session : public session
{
public:
    imap_session(std::unique_ptr<ssl::context> tls_context, std::unique_ptr<mailshift::imap::client> client,
        mailshift::log::logger& logger)
        : tls_context_(std::move(tls_context)), client_(std::move(client)), logger_(logger)
    {
    }

    ~imap_session() override
    {
        client_->close();
    }

    awaitable<result<std::vector<std::string>>> list_mailboxes() override
    {
        std::vector<mailshift::imap::mailbox_folder> folders;
        MAILSHIFT_CO_TRY_ASSIGN(folders, co_await client_->list("", "*"));
        std::vector<std::string> names;
        names.reserve(folders.size());
        for (auto& folder : folders)
        {
            if (!folder.selectable())
            {
                MAILSHIFT_DEBUG(logger_, "Skipping non-selectable mailbox " << folder.name);
                continue;
            }
            names.push_back(std::move(folder.name));
        }
        co_return ok(std::move(names));
    }

    awaitable<result_void> select(std::string_view mailbox) override
    {
        MAILSHIFT_CO_TRY_VOID(co_await client_->select(mailbox));
        co_return ok();
    }

    awaitable<result_void> create(std::string_view mailbox) override
    {
        MAILSHIFT_CO_TRY_VOID(co_await client_->create(mailbox));
        co_return ok();
    }

    awaitable<result<std::vector<message_key>>> search_all() override
    {
        std::vector<std::uint32_t> uids;
        MAILSHIFT_CO_TRY_ASSIGN(uids, co_await client_->uid_search("ALL"));
        std::vector<message_key> keys;
        keys.reserve(uids.size());
        for (std::uint32_t uid : uids)
            keys.push_back(std::to_string(uid));
        co_return ok(std::move(keys));
    }

    awaitable<result<std::map<message_key, fetched_message>>> fetch(const std::vector<message_key>& keys) override
    {
        std::map<message_key, fetched_message> messages;
        if (keys.empty())
            co_return ok(std::move(messages));
        std::string set;
        MAILSHIFT_CO_TRY_ASSIGN(set, mailshift::detail::uid_set(keys));

        std::vector<mailshift::imap::fetch_item> items;
        MAILSHIFT_CO_TRY_ASSIGN(items, co_await client_->uid_fetch(set, IMAP_FETCH_ITEMS));

        const std::set<std::string_view> wanted(keys.begin(), keys.end());
        for (auto& item : items)
        {
            // Unsolicited FETCH responses (flag updates of other messages) carry no UID or body.
            if (!item.uid.has_value() || !item.body.has_value())
                continue;
            message_key key = std::to_string(*item.uid);
            if (wanted.count(key) == 0)
                continue;
            fetched_message& msg = messages[key];
            msg.raw = std::move(*item.body);
            msg.flags = std::move(item.flags);
            msg.internal_date = item.internal_date.value_or(std::string{});
        }
        co_return ok(std::move(messages));
    }

    awaitable<result_void> append(std::string_view mailbox, const fetched_message& message) override
    {
        MAILSHIFT_CO_TRY_VOID(co_await client_->append(mailbox, message.raw, message.flags, message.internal_date));
        co_return ok();
    }

    awaitable<result_void> move(const std::vector<message_key>& keys, std::string_view target) override
    {
        if (keys.empty())
            co_return ok();
        std::string set;
        MAILSHIFT_CO_TRY_ASSIGN(set, mailshift::detail::uid_set(keys));
        co_return co_await client_->uid_move(set, target);
    }

    awaitable<result_void> logout() override
    {
        MAILSHIFT_CO_TRY_VOID(co_await client_->logout());
        co_return ok();
    }

private:
    std::unique_ptr<ssl::context> tls_context_;
    std::unique_ptr<mailshift::imap::client> client_;
    mailshift::log::logger& logger_;
};

/// Opens IMAP sessions on one executor.
class imap_connector : public connector
{
public:
    imap_connector(mailshift::asio::any_io_executor executor, mailshift::log::logger& logger)
        : executor_(std::move(executor)), logger_(logger)
    {
    }

    /**
    Connecting, authenticating and reading the capabilities.

    @param config Endpoint to reach.
    @return       A ready session, or the connection or authentication failure.
    **/
    awaitable<result<std::unique_ptr<session>>> open(const endpoint_config& config) override
    {
        mailshift::imap::options opts;
        if (config.timeout.has_value() && config.timeout->count() > 0)
            opts.timeout = std::chrono::duration_cast<std::chrono::steady_clock::duration>(*config.timeout);
        opts.tls.verify = config.verify ? mailshift::net::verify_mode::peer : mailshift::net::verify_mode::none;
        opts.tls.ca_file = config.ca_file;

        std::unique_ptr<ssl::context> tls_context;
        if (config.tls_mode() != mailshift::net::tls_mode::none)
            MAILSHIFT_CO_TRY_ASSIGN(tls_context, mailshift::net::make_tls_context(opts.tls));
        auto client = std::make_unique<mailshift::imap::client>(executor_, std::move(opts), &logger_);

        MAILSHIFT_DEBUG(logger_, "Connecting to " << config.describe() << " (" << config.tls_mode() << ")");
        MAILSHIFT_CO_TRY_VOID(co_await client->connect(config.host, config.effective_port(), config.tls_mode(),
            tls_context.get()));
        MAILSHIFT_CO_TRY_VOID(co_await client->login(config.username, config.password));
        MAILSHIFT_CO_TRY_VOID(co_await client->capability());
        MAILSHIFT_DEBUG(logger_, "Logged in to " << config.describe()
            << (client->has_capability("MOVE") ? " (MOVE)" : " (COPY/STORE)"));

        std::unique_ptr<session> opened = std::make_unique<imap_session>(std::move(tls_context), std::move(client), logger_);
        co_return ok(std::move(opened));
    }

private:
    mailshift::asio::any_io_executor executor_;
    mailshift::log::logger& logger_;
};

} // namespace mailshift::store
