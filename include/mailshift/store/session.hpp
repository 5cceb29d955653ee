/*

session.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include <mailshift/detail/asio_decl.hpp>
#include <mailshift/detail/result.hpp>
#include <mailshift/store/endpoint.hpp>

namespace mailshift::store
{

using mailshift::asio::awaitable;

/// Identifier of a message within a mailbox (an IMAP UID in decimal).
using message_key = std::string;

/// What a fetch returns for one message.
struct fetched_message
{
    std::string raw;
    std::vector<std::string> flags;
    std::string internal_date;
};

/**
One authenticated connection to a mail account with at most one selected mailbox.

Every failure that means the connection itself is gone is reported with an error for which
`error::is_session_abort()` holds; after such a failure the session must not be used again.
**/
class session
{
public:
    virtual ~session() = default;

    /// Mailbox names in the order the endpoint reports them.
    virtual awaitable<result<std::vector<std::string>>> list_mailboxes() = 0;

    virtual awaitable<result_void> select(std::string_view mailbox) = 0;

    virtual awaitable<result_void> create(std::string_view mailbox) = 0;

    /// Keys of every message of the selected mailbox, in endpoint order.
    virtual awaitable<result<std::vector<message_key>>> search_all() = 0;

    /// Messages of the selected mailbox; keys that no longer exist are absent from the map.
    virtual awaitable<result<std::map<message_key, fetched_message>>> fetch(const std::vector<message_key>& keys) = 0;

    /// Appends with the given flags and receipt time.
    virtual awaitable<result_void> append(std::string_view mailbox, const fetched_message& message) = 0;

    /// Moves messages of the selected mailbox into `target`.
    virtual awaitable<result_void> move(const std::vector<message_key>& keys, std::string_view target) = 0;

    virtual awaitable<result_void> logout() = 0;
};

/// Opens authenticated sessions.
class connector
{
public:
    virtual ~connector() = default;

    virtual awaitable<result<std::unique_ptr<session>>> open(const endpoint_config& config) = 0;
};

} // namespace mailshift::store
