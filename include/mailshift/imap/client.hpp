/*

imap/client.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <mailshift/detail/asio_decl.hpp>
#include <mailshift/detail/asio_error.hpp>
#include <mailshift/detail/command.hpp>
#include <mailshift/detail/log.hpp>
#include <mailshift/detail/redact.hpp>
#include <mailshift/detail/result.hpp>
#include <mailshift/imap/types.hpp>
#include <mailshift/net/dialog.hpp>
#include <mailshift/net/tls_options.hpp>
#include <mailshift/net/upgradable_stream.hpp>

namespace mailshift::imap
{

using mailshift::asio::any_io_executor;
using mailshift::asio::awaitable;
using mailshift::asio::tcp;
using mailshift::result;
using mailshift::result_void;
namespace ssl = mailshift::asio::ssl;

/**
IMAP4rev1 client on Boost.Asio coroutines.

One command is in flight at a time; the client is driven by a single coroutine.
Mailbox arguments are UTF-8 and are sent in modified UTF-7.
**/
class client
{
public:
    using executor_type = any_io_executor;
    using dialog_type = mailshift::net::dialog<mailshift::net::upgradable_stream>;

    explicit client(executor_type executor, options opts = {}, mailshift::log::logger* logger = nullptr)
        : executor_(std::move(executor)), options_(std::move(opts)), logger_(logger)
    {
    }

    client(const client&) = delete;
    client& operator=(const client&) = delete;

    /**
    Connecting to the server and reading the greeting.

    @param host    Server name.
    @param port    Server port.
    @param mode    Plain, implicit TLS or STARTTLS.
    @param tls_ctx Context used when TLS is negotiated; required unless `mode` is `none`.
    @return        The greeting.
    **/
    awaitable<result<response>> connect(const std::string& host, unsigned short port,
        mailshift::net::tls_mode mode, ssl::context* tls_ctx)
    {
        if (dialog_.has_value())
            co_return fail<response>(error_code::invalid_state, "Connection is already established.");
        MAILSHIFT_CO_TRY_VOID(mailshift::detail::ensure_single_line(host, "host"));
        if (mode != mailshift::net::tls_mode::none && tls_ctx == nullptr)
            co_return fail<response>(error_code::invalid_state, "TLS context is required.");
        remote_host_ = host;

        mailshift::asio::error_code ec;
        tcp::resolver resolver(executor_);
        auto endpoints = co_await resolver.async_resolve(host, std::to_string(port),
            mailshift::asio::redirect_error(mailshift::asio::use_awaitable, ec));
        if (ec)
            co_return fail<response>(error_from_asio(ec, "resolve"));

        mailshift::net::upgradable_stream stream(executor_);
        co_await mailshift::asio::async_connect(stream.lowest_layer(), endpoints,
            mailshift::asio::redirect_error(mailshift::asio::use_awaitable, ec));
        if (ec)
            co_return fail<response>(error_from_asio(ec, "connect"));

        if (mode == mailshift::net::tls_mode::implicit)
            MAILSHIFT_CO_TRY_VOID(co_await stream.start_tls(*tls_ctx, host, options_.tls.verify));

        dialog_.emplace(std::move(stream), options_.max_line_length, options_.timeout);
        dialog_->set_trace(logger_, "IMAP");
        tag_counter_ = 0;
        capabilities_.clear();

        response greeting;
        MAILSHIFT_CO_TRY_ASSIGN(greeting, co_await read_greeting());

        if (mode == mailshift::net::tls_mode::starttls)
            MAILSHIFT_CO_TRY_VOID(co_await start_tls(*tls_ctx));

        co_return ok(std::move(greeting));
    }

    /// Authenticating with `LOGIN`; a rejection is reported as `authentication_failed`.
    awaitable<result<response>> login(std::string_view username, std::string_view password)
    {
        std::string user;
        MAILSHIFT_CO_TRY_ASSIGN(user, to_astring(username));
        std::string pass;
        MAILSHIFT_CO_TRY_ASSIGN(pass, to_astring(password));
        std::string cmd;
        mailshift::detail::append_sv(cmd, "LOGIN");
        mailshift::detail::append_space(cmd);
        mailshift::detail::append_sv(cmd, user);
        mailshift::detail::append_space(cmd);
        mailshift::detail::append_sv(cmd, pass);

        auto resp = co_await command(cmd);
        if (!resp && (resp.error().is(error_code::imap_no_response) || resp.error().is(error_code::imap_bad_response)))
            co_return fail<response>(error_code::authentication_failed, "Login rejected.", resp.error().server_response());
        co_return std::move(resp);
    }

    /// Refreshing the capability set; see has_capability().
    awaitable<result<response>> capability()
    {
        response resp;
        MAILSHIFT_CO_TRY_ASSIGN(resp, co_await command("CAPABILITY"));
        capabilities_.clear();
        for (const auto& data : resp.untagged)
            remember_capabilities(data.text);
        co_return ok(std::move(resp));
    }

    [[nodiscard]] bool has_capability(std::string_view name) const
    {
        return std::any_of(capabilities_.begin(), capabilities_.end(),
            [name](const std::string& cap) { return mailshift::detail::iequals_ascii(cap, name); });
    }

    awaitable<result<std::vector<mailbox_folder>>> list(std::string_view reference = "", std::string_view pattern = "*")
    {
        std::string ref_q;
        MAILSHIFT_CO_TRY_ASSIGN(ref_q, to_mailbox(reference));
        std::string pattern_q;
        MAILSHIFT_CO_TRY_ASSIGN(pattern_q, to_mailbox(pattern));
        std::string cmd = "LIST ";
        mailshift::detail::append_sv(cmd, ref_q);
        mailshift::detail::append_space(cmd);
        mailshift::detail::append_sv(cmd, pattern_q);

        response resp;
        MAILSHIFT_CO_TRY_ASSIGN(resp, co_await command(cmd));
        std::vector<mailbox_folder> folders;
        for (const auto& data : resp.untagged)
        {
            auto folder = parse_list_line(data);
            if (folder.has_value())
                folders.push_back(std::move(*folder));
        }
        co_return ok(std::move(folders));
    }

    awaitable<result<response>> select(std::string_view mailbox)
    {
        co_return co_await mailbox_command("SELECT", mailbox);
    }

    awaitable<result<response>> create(std::string_view mailbox)
    {
        co_return co_await mailbox_command("CREATE", mailbox);
    }

    awaitable<result<std::vector<std::uint32_t>>> uid_search(std::string_view criteria)
    {
        std::string cmd = "UID SEARCH ";
        mailshift::detail::append_sv(cmd, criteria);
        response resp;
        MAILSHIFT_CO_TRY_ASSIGN(resp, co_await command(cmd));
        std::vector<std::uint32_t> uids;
        for (const auto& data : resp.untagged)
        {
            auto ids = parse_search_ids(data.text);
            uids.insert(uids.end(), ids.begin(), ids.end());
        }
        co_return ok(std::move(uids));
    }

    /**
    Fetching data items of a UID set.

    @param uid_set Comma separated UIDs.
    @param items   Data items, e.g. `(UID FLAGS INTERNALDATE BODY.PEEK[])`.
    @return        Every FETCH response of the command, unsolicited ones included.
    **/
    awaitable<result<std::vector<fetch_item>>> uid_fetch(std::string_view uid_set, std::string_view items)
    {
        std::string cmd = "UID FETCH ";
        mailshift::detail::append_sv(cmd, uid_set);
        mailshift::detail::append_space(cmd);
        mailshift::detail::append_sv(cmd, items);
        response resp;
        MAILSHIFT_CO_TRY_ASSIGN(resp, co_await command(cmd));
        std::vector<fetch_item> fetched;
        for (const auto& data : resp.untagged)
        {
            std::optional<fetch_item> item;
            MAILSHIFT_CO_TRY_ASSIGN(item, parse_fetch(data));
            if (item.has_value())
                fetched.push_back(std::move(*item));
        }
        co_return ok(std::move(fetched));
    }

    /**
    Appending a message to a mailbox.

    @param mailbox   UTF-8 mailbox name.
    @param data      Raw message.
    @param flags     Flags of the message.
    @param date_time INTERNALDATE to keep, empty for the server's time.
    **/
    awaitable<result<response>> append(std::string_view mailbox, std::string_view data,
        const std::vector<std::string>& flags, std::string_view date_time)
    {
        const bool use_literal_plus = has_capability("LITERAL+");
        std::string cmd;
        MAILSHIFT_CO_TRY_ASSIGN(cmd, build_append_command(mailbox, data.size(), flags, date_time, use_literal_plus));

        dialog_type* dlg = nullptr;
        MAILSHIFT_CO_TRY_ASSIGN(dlg, dialog_ptr());
        const std::string tag = next_tag();
        MAILSHIFT_CO_TRY_VOID(co_await dlg->write_line_r(tag + " " + cmd));

        response resp;
        resp.tag = tag;
        if (!use_literal_plus)
        {
            // Untagged data may arrive before the continuation request.
            for (;;)
            {
                std::string line;
                MAILSHIFT_CO_TRY_ASSIGN(line, co_await dlg->read_line_r());
                if (!line.empty() && line.front() == '+')
                    break;
                if (is_tagged_line(line, tag))
                {
                    apply_tagged_status(resp, line);
                    co_return finalize_response(std::move(resp), "APPEND");
                }
                MAILSHIFT_CO_TRY_VOID(co_await collect_untagged(*dlg, resp, std::move(line)));
            }
        }

        trace_literal("APPEND", data.size());
        MAILSHIFT_CO_TRY_VOID(co_await dlg->write_raw_r(data));
        MAILSHIFT_CO_TRY_VOID(co_await dlg->write_line_r(""));
        MAILSHIFT_CO_TRY_VOID(co_await read_response_until_tag(*dlg, resp));
        co_return finalize_response(std::move(resp), "APPEND");
    }

    /**
    Moving a UID set to another mailbox of the selected one.

    Uses `UID MOVE` when advertised, otherwise copies and flags the originals `\Deleted`. With UIDPLUS
    the originals are then removed by `UID EXPUNGE`; without it they stay in place, flagged.
    **/
    awaitable<result_void> uid_move(std::string_view uid_set, std::string_view mailbox)
    {
        std::string mailbox_q;
        MAILSHIFT_CO_TRY_ASSIGN(mailbox_q, to_mailbox(mailbox));

        if (has_capability("MOVE"))
        {
            std::string cmd = "UID MOVE ";
            mailshift::detail::append_sv(cmd, uid_set);
            mailshift::detail::append_space(cmd);
            mailshift::detail::append_sv(cmd, mailbox_q);
            MAILSHIFT_CO_TRY_VOID(co_await command(cmd));
            co_return ok();
        }

        std::string copy_cmd = "UID COPY ";
        mailshift::detail::append_sv(copy_cmd, uid_set);
        mailshift::detail::append_space(copy_cmd);
        mailshift::detail::append_sv(copy_cmd, mailbox_q);
        MAILSHIFT_CO_TRY_VOID(co_await command(copy_cmd));

        std::string store_cmd = "UID STORE ";
        mailshift::detail::append_sv(store_cmd, uid_set);
        mailshift::detail::append_sv(store_cmd, " +FLAGS.SILENT (\\Deleted)");
        MAILSHIFT_CO_TRY_VOID(co_await command(store_cmd));

        // Never a plain EXPUNGE: it removes every \Deleted message of the mailbox.
        if (has_capability("UIDPLUS"))
        {
            std::string expunge_cmd = "UID EXPUNGE ";
            mailshift::detail::append_sv(expunge_cmd, uid_set);
            MAILSHIFT_CO_TRY_VOID(co_await command(expunge_cmd));
        }
        co_return ok();
    }

    awaitable<result<response>> logout()
    {
        auto resp = co_await command("LOGOUT");
        close();
        co_return std::move(resp);
    }

    /// Drops the connection without a protocol exchange.
    void close() noexcept
    {
        if (!dialog_.has_value())
            return;
        dialog_->stream().close();
        dialog_.reset();
    }

    [[nodiscard]] bool is_connected() const noexcept
    {
        return dialog_.has_value();
    }

    /// Sending a command and collecting its response; tagged `NO` and `BAD` are errors.
    awaitable<result<response>> command(std::string_view cmd)
    {
        MAILSHIFT_CO_TRY_VOID(mailshift::detail::ensure_single_line(cmd, "command"));
        dialog_type* dlg = nullptr;
        MAILSHIFT_CO_TRY_ASSIGN(dlg, dialog_ptr());

        response resp;
        resp.tag = next_tag();
        std::string line = resp.tag;
        mailshift::detail::append_space(line);
        mailshift::detail::append_sv(line, cmd);
        MAILSHIFT_CO_TRY_VOID(co_await dlg->write_line_r(line));
        MAILSHIFT_CO_TRY_VOID(co_await read_response_until_tag(*dlg, resp));
        co_return finalize_response(std::move(resp), cmd);
    }

private:
    result<dialog_type*> dialog_ptr()
    {
        if (!dialog_.has_value())
            return fail<dialog_type*>(error_code::invalid_state, "Connection is not established.");
        return ok(&*dialog_);
    }

    std::string next_tag()
    {
        std::string tag = "A";
        mailshift::detail::append_uint(tag, ++tag_counter_);
        return tag;
    }

    awaitable<result<response>> mailbox_command(std::string_view verb, std::string_view mailbox)
    {
        std::string mailbox_q;
        MAILSHIFT_CO_TRY_ASSIGN(mailbox_q, to_mailbox(mailbox));
        std::string cmd(verb);
        mailshift::detail::append_space(cmd);
        mailshift::detail::append_sv(cmd, mailbox_q);
        co_return co_await command(cmd);
    }

    awaitable<result<response>> read_greeting()
    {
        dialog_type* dlg = nullptr;
        MAILSHIFT_CO_TRY_ASSIGN(dlg, dialog_ptr());
        std::string line;
        MAILSHIFT_CO_TRY_ASSIGN(line, co_await dlg->read_line_r());

        response resp;
        auto [star, rest] = detail::split_token(line);
        auto [word, text] = detail::split_token(rest);
        resp.st = star == "*" ? detail::parse_status_word(word) : status::unknown;
        resp.text.assign(text.begin(), text.end());
        if (resp.st == status::bye)
            co_return fail<response>(error_code::server_bye, "Server refused the connection.", line);
        if (resp.st != status::ok && resp.st != status::preauth)
            co_return fail<response>(error_code::invalid_response, "Unexpected greeting.", line);
        remember_capabilities(line);
        co_return ok(std::move(resp));
    }

    awaitable<result_void> start_tls(ssl::context& context)
    {
        MAILSHIFT_CO_TRY_VOID(co_await command("STARTTLS"));

        dialog_type* dlg = nullptr;
        MAILSHIFT_CO_TRY_ASSIGN(dlg, dialog_ptr());
        mailshift::net::upgradable_stream stream = std::move(dlg->stream());
        dialog_.reset();

        MAILSHIFT_CO_TRY_VOID(co_await stream.start_tls(context, remote_host_, options_.tls.verify));
        dialog_.emplace(std::move(stream), options_.max_line_length, options_.timeout);
        dialog_->set_trace(logger_, "IMAP");
        capabilities_.clear();
        co_return ok();
    }

    /// Reads an untagged response whose first line is `first`, with the literals it announces.
    awaitable<result_void> collect_untagged(dialog_type& dlg, response& resp, std::string first)
    {
        untagged_data data;
        data.text = std::move(first);
        while (auto size = detail::trailing_literal_size(data.text))
        {
            std::string literal;
            MAILSHIFT_CO_TRY_ASSIGN(literal, co_await dlg.read_exactly_r(*size));
            data.literals.push_back(std::move(literal));
            std::string next;
            MAILSHIFT_CO_TRY_ASSIGN(next, co_await dlg.read_line_r());
            data.text += next;
        }
        resp.untagged.push_back(std::move(data));
        co_return ok();
    }

    awaitable<result_void> read_response_until_tag(dialog_type& dlg, response& resp)
    {
        for (;;)
        {
            std::string line;
            MAILSHIFT_CO_TRY_ASSIGN(line, co_await dlg.read_line_r());
            if (is_tagged_line(line, resp.tag))
            {
                apply_tagged_status(resp, line);
                co_return ok();
            }
            if (!line.empty() && line.front() == '+')
            {
                resp.continuation.push_back(std::move(line));
                continue;
            }
            if (line.empty() || line.front() != '*')
                co_return fail(error_code::unexpected_response, "Unexpected line from server.", line.substr(0, 200));
            MAILSHIFT_CO_TRY_VOID(co_await collect_untagged(dlg, resp, std::move(line)));
        }
    }

    static bool is_tagged_line(std::string_view line, std::string_view tag)
    {
        return line.size() > tag.size() && line.substr(0, tag.size()) == tag && line[tag.size()] == ' ';
    }

    static void apply_tagged_status(response& resp, std::string_view line)
    {
        auto [word, text] = detail::split_token(line.substr(resp.tag.size()));
        resp.st = detail::parse_status_word(word);
        resp.text.assign(text.begin(), text.end());
    }

    result<response> finalize_response(response&& resp, std::string_view cmd)
    {
        std::string verb(mailshift::detail::redact_line(cmd));
        if (verb.size() > 64)
            verb.resize(64);
        for (const auto& data : resp.untagged)
            remember_capabilities(data.text);
        if (resp.st == status::ok)
        {
            remember_capabilities(resp.text);
            return ok(std::move(resp));
        }
        if (resp.st == status::no)
            return fail<response>(error_code::imap_no_response, "IMAP tagged NO to " + verb + ".", resp.text);
        if (resp.st == status::bad)
            return fail<response>(error_code::imap_bad_response, "IMAP tagged BAD to " + verb + ".", resp.text);
        return fail<response>(error_code::parse_error, "IMAP unparseable tagged response to " + verb + ".", resp.text);
    }

    void remember_capabilities(std::string_view line)
    {
        auto caps = parse_capabilities(line);
        if (caps.has_value())
            capabilities_ = std::move(*caps);
    }

    void trace_literal(std::string_view label, std::size_t bytes) const
    {
        if (logger_ == nullptr || !logger_->is_trace_enabled())
            return;
        std::string line(label);
        mailshift::detail::append_sv(line, " literal bytes=");
        mailshift::detail::append_uint(line, static_cast<std::uint64_t>(bytes));
        logger_->trace_protocol("IMAP", mailshift::log::direction::send, line);
    }

    executor_type executor_;
    options options_;
    mailshift::log::logger* logger_;
    std::optional<dialog_type> dialog_;
    std::string remote_host_;
    std::uint64_t tag_counter_ = 0;
    std::vector<std::string> capabilities_;
};

} // namespace mailshift::imap
