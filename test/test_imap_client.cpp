/*

test_imap_client.cpp
--------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

IMAP client against a scripted loopback server.

*/


#define BOOST_TEST_MODULE imap_client_test

#include <cstddef>
#include <exception>
#include <istream>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>
#include <boost/asio.hpp>
#include <boost/test/unit_test.hpp>
#include <mailshift/imap/client.hpp>
#include <mailshift/net/tls_options.hpp>


using mailshift::error_code;
using mailshift::imap::client;
using mailshift::net::tls_mode;

BOOST_TEST_DONT_PRINT_LOG_VALUE(mailshift::imap::status)

namespace asio = boost::asio;
using tcp = asio::ip::tcp;


namespace
{

std::string read_line(tcp::socket& sock, asio::streambuf& buf)
{
    asio::read_until(sock, buf, "\r\n");
    std::istream is(&buf);
    std::string line;
    std::getline(is, line);
    if (!line.empty() && line.back() == '\r')
        line.pop_back();
    return line;
}

std::string read_literal(tcp::socket& sock, asio::streambuf& buf, std::size_t size)
{
    if (buf.size() < size)
        asio::read(sock, buf, asio::transfer_exactly(size - buf.size()));
    const auto begin = asio::buffers_begin(buf.data());
    std::string data(begin, begin + static_cast<std::ptrdiff_t>(size));
    buf.consume(size);
    return data;
}

void send(tcp::socket& sock, std::string_view text)
{
    asio::write(sock, asio::buffer(text.data(), text.size()));
}

std::size_t parse_literal_size(const std::string& cmd_line)
{
    const auto l = cmd_line.rfind('{');
    const auto r = cmd_line.rfind('}');
    if (l == std::string::npos || r == std::string::npos || r < l)
        return 0;
    std::string num = cmd_line.substr(l + 1, r - l - 1);
    if (!num.empty() && num.back() == '+')
        num.pop_back();
    return static_cast<std::size_t>(std::stoul(num));
}

/// One-connection server on an ephemeral port; the script runs on its own thread.
struct loopback_server
{
    asio::io_context server_ctx;
    tcp::acceptor acc{server_ctx, tcp::endpoint(tcp::v4(), 0)};
    std::thread server_thread;
    std::string server_error;

    unsigned short port() const
    {
        return acc.local_endpoint().port();
    }

    template<typename Script>
    void serve(std::string greeting, Script script)
    {
        server_thread = std::thread([this, greeting = std::move(greeting), script]() mutable
        {
            try
            {
                tcp::socket sock(server_ctx);
                acc.accept(sock);
                asio::streambuf buf;
                send(sock, greeting);
                script(sock, buf);
            }
            catch (const std::exception& exc)
            {
                server_error = exc.what();
            }
        });
    }

    template<typename Body>
    void run_client(Body body)
    {
        asio::io_context client_ctx;
        auto fut = asio::co_spawn(client_ctx, std::move(body), asio::use_future);
        client_ctx.run();

        server_ctx.stop();
        if (server_thread.joinable())
            server_thread.join();
        fut.get();
    }
};

/// Answers every command with OK until LOGOUT, recording the command lines.
void serve_until_logout(tcp::socket& sock, asio::streambuf& buf, std::vector<std::string>& lines)
{
    for (;;)
    {
        const std::string line = read_line(sock, buf);
        lines.push_back(line);
        const std::string tag = line.substr(0, line.find(' '));
        if (line.find(" LOGOUT") != std::string::npos)
        {
            send(sock, "* BYE logging out\r\n" + tag + " OK LOGOUT completed\r\n");
            return;
        }
        send(sock, tag + " OK done\r\n");
    }
}

std::vector<std::string> move_and_logout(const std::string& greeting)
{
    loopback_server server;
    std::vector<std::string> lines;
    server.serve(greeting, [&lines](tcp::socket& sock, asio::streambuf& buf)
    {
        serve_until_logout(sock, buf, lines);
    });

    const unsigned short port = server.port();
    server.run_client([port]() -> asio::awaitable<void>
    {
        auto executor = co_await asio::this_coro::executor;
        client cli(executor);
        auto greeting_res = co_await cli.connect("127.0.0.1", port, tls_mode::none, nullptr);
        BOOST_REQUIRE(greeting_res);
        auto moved = co_await cli.uid_move("7", "Archive");
        BOOST_REQUIRE(moved);
        auto bye = co_await cli.logout();
        BOOST_REQUIRE(bye);
    });
    BOOST_TEST(server.server_error.empty());
    return lines;
}

} // namespace


BOOST_AUTO_TEST_CASE(append_waits_for_continuation)
{
    const std::string message = "Subject: hi\r\n\r\nhello\r\nworld\r\n";
    loopback_server server;
    std::string command_line;
    std::string received;
    std::string trailer = "unset";
    server.serve("* OK [CAPABILITY IMAP4rev1] ready\r\n", [&](tcp::socket& sock, asio::streambuf& buf)
    {
        command_line = read_line(sock, buf);
        const std::size_t size = parse_literal_size(command_line);
        send(sock, "+ go ahead\r\n");
        received = read_literal(sock, buf, size);
        trailer = read_line(sock, buf);
        send(sock, "A1 OK [APPENDUID 1 9] APPEND completed\r\n");
    });

    const unsigned short port = server.port();
    server.run_client([port, message]() -> asio::awaitable<void>
    {
        auto executor = co_await asio::this_coro::executor;
        client cli(executor);
        auto greeting = co_await cli.connect("127.0.0.1", port, tls_mode::none, nullptr);
        BOOST_REQUIRE(greeting);
        BOOST_TEST(!cli.has_capability("LITERAL+"));

        const std::vector<std::string> flags{"\\Seen", "\\Recent"};
        auto resp = co_await cli.append("INBOX", message, flags, "17-Jul-1996 02:44:25 -0700");
        BOOST_REQUIRE(resp);
        BOOST_TEST(resp->st == mailshift::imap::status::ok);
    });

    BOOST_TEST(server.server_error.empty());
    BOOST_TEST(command_line == "A1 APPEND \"INBOX\" (\\Seen) \"17-Jul-1996 02:44:25 -0700\" {"
        + std::to_string(message.size()) + "}");
    BOOST_TEST(received == message);
    BOOST_TEST(trailer.empty());
}

BOOST_AUTO_TEST_CASE(append_literal_plus_sends_at_once)
{
    const std::string message = "Subject: plus\r\n\r\nbody\r\n";
    loopback_server server;
    std::string command_line;
    std::string received;
    server.serve("* OK [CAPABILITY IMAP4rev1 LITERAL+] ready\r\n", [&](tcp::socket& sock, asio::streambuf& buf)
    {
        command_line = read_line(sock, buf);
        received = read_literal(sock, buf, parse_literal_size(command_line));
        read_line(sock, buf);
        send(sock, "A1 OK APPEND completed\r\n");
    });

    const unsigned short port = server.port();
    server.run_client([port, message]() -> asio::awaitable<void>
    {
        auto executor = co_await asio::this_coro::executor;
        client cli(executor);
        auto greeting = co_await cli.connect("127.0.0.1", port, tls_mode::none, nullptr);
        BOOST_REQUIRE(greeting);

        auto resp = co_await cli.append("Archive", message, {}, "");
        BOOST_REQUIRE(resp);
    });

    BOOST_TEST(server.server_error.empty());
    BOOST_TEST(command_line == "A1 APPEND \"Archive\" {" + std::to_string(message.size()) + "+}");
    BOOST_TEST(received == message);
}

BOOST_AUTO_TEST_CASE(append_refused_before_continuation)
{
    loopback_server server;
    std::vector<std::string> lines;
    server.serve("* OK [CAPABILITY IMAP4rev1] ready\r\n", [&](tcp::socket& sock, asio::streambuf& buf)
    {
        lines.push_back(read_line(sock, buf));
        send(sock, "* 3 EXISTS\r\nA1 NO [TRYCREATE] no such mailbox\r\n");
        lines.push_back(read_line(sock, buf));
        send(sock, "A2 OK done\r\n");
    });

    const unsigned short port = server.port();
    server.run_client([port]() -> asio::awaitable<void>
    {
        auto executor = co_await asio::this_coro::executor;
        client cli(executor);
        auto greeting = co_await cli.connect("127.0.0.1", port, tls_mode::none, nullptr);
        BOOST_REQUIRE(greeting);

        auto resp = co_await cli.append("Missing", "x\r\n", {}, "");
        BOOST_REQUIRE(!resp);
        BOOST_TEST(resp.error().code() == error_code::imap_no_response);
        BOOST_TEST(resp.error().server_response().find("TRYCREATE") != std::string::npos);

        // The connection stays usable: no literal was sent.
        auto noop = co_await cli.command("NOOP");
        BOOST_TEST(noop.has_value());
    });

    BOOST_TEST(server.server_error.empty());
    BOOST_REQUIRE(lines.size() == 2u);
    BOOST_TEST(lines[1] == "A2 NOOP");
}

BOOST_AUTO_TEST_CASE(uid_move_with_move_capability)
{
    const auto lines = move_and_logout("* OK [CAPABILITY IMAP4rev1 MOVE] ready\r\n");
    const std::vector<std::string> expected{"A1 UID MOVE 7 \"Archive\"", "A2 LOGOUT"};
    BOOST_TEST(lines == expected, boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(uid_move_with_uidplus_expunges_the_set)
{
    const auto lines = move_and_logout("* OK [CAPABILITY IMAP4rev1 UIDPLUS] ready\r\n");
    const std::vector<std::string> expected{
        "A1 UID COPY 7 \"Archive\"",
        "A2 UID STORE 7 +FLAGS.SILENT (\\Deleted)",
        "A3 UID EXPUNGE 7",
        "A4 LOGOUT"};
    BOOST_TEST(lines == expected, boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(uid_move_without_uidplus_never_expunges)
{
    const auto lines = move_and_logout("* OK [CAPABILITY IMAP4rev1] ready\r\n");
    const std::vector<std::string> expected{
        "A1 UID COPY 7 \"Archive\"",
        "A2 UID STORE 7 +FLAGS.SILENT (\\Deleted)",
        "A3 LOGOUT"};
    BOOST_TEST(lines == expected, boost::test_tools::per_element());
    for (const auto& line : lines)
        BOOST_TEST(line.find("EXPUNGE") == std::string::npos);
}

BOOST_AUTO_TEST_CASE(login_rejection_is_authentication_failure)
{
    loopback_server server;
    std::string login_line;
    server.serve("* OK [CAPABILITY IMAP4rev1] ready\r\n", [&](tcp::socket& sock, asio::streambuf& buf)
    {
        login_line = read_line(sock, buf);
        send(sock, "A1 NO [AUTHENTICATIONFAILED] Invalid credentials\r\n");
    });

    const unsigned short port = server.port();
    server.run_client([port]() -> asio::awaitable<void>
    {
        auto executor = co_await asio::this_coro::executor;
        client cli(executor);
        auto greeting = co_await cli.connect("127.0.0.1", port, tls_mode::none, nullptr);
        BOOST_REQUIRE(greeting);

        auto resp = co_await cli.login("user@example.com", "s3cret");
        BOOST_REQUIRE(!resp);
        BOOST_TEST(resp.error().code() == error_code::authentication_failed);
        BOOST_TEST(!resp.error().is_session_abort());
        BOOST_TEST(resp.error().message().find("s3cret") == std::string::npos);
    });

    BOOST_TEST(server.server_error.empty());
    BOOST_TEST(login_line == "A1 LOGIN \"user@example.com\" \"s3cret\"");
}

BOOST_AUTO_TEST_CASE(bye_greeting_is_server_bye)
{
    loopback_server server;
    server.serve("* BYE Too many connections\r\n", [](tcp::socket&, asio::streambuf&) {});

    const unsigned short port = server.port();
    server.run_client([port]() -> asio::awaitable<void>
    {
        auto executor = co_await asio::this_coro::executor;
        client cli(executor);
        auto greeting = co_await cli.connect("127.0.0.1", port, tls_mode::none, nullptr);
        BOOST_REQUIRE(!greeting);
        BOOST_TEST(greeting.error().code() == error_code::server_bye);
        BOOST_TEST(greeting.error().is_session_abort());
    });

    BOOST_TEST(server.server_error.empty());
}

BOOST_AUTO_TEST_CASE(uid_fetch_reads_literal_body)
{
    const std::string body = "Subject: fetched\r\n\r\nline one\r\nline two\r\n";
    loopback_server server;
    std::string fetch_line;
    server.serve("* OK [CAPABILITY IMAP4rev1] ready\r\n", [&](tcp::socket& sock, asio::streambuf& buf)
    {
        fetch_line = read_line(sock, buf);
        send(sock, "* 3 FETCH (UID 7 FLAGS (\\Seen \\Flagged) INTERNALDATE \"17-Jul-1996 02:44:25 -0700\" BODY[] {"
            + std::to_string(body.size()) + "}\r\n" + body + ")\r\n"
            + "* 4 FETCH (FLAGS (\\Seen))\r\n"
            + "A1 OK FETCH completed\r\n");
    });

    const unsigned short port = server.port();
    server.run_client([port, body]() -> asio::awaitable<void>
    {
        auto executor = co_await asio::this_coro::executor;
        client cli(executor);
        auto greeting = co_await cli.connect("127.0.0.1", port, tls_mode::none, nullptr);
        BOOST_REQUIRE(greeting);

        auto items = co_await cli.uid_fetch("7", "(UID FLAGS INTERNALDATE BODY.PEEK[])");
        BOOST_REQUIRE(items);
        BOOST_REQUIRE(items->size() == 2u);

        const auto& item = items->front();
        BOOST_TEST(item.seq == 3u);
        BOOST_REQUIRE(item.uid.has_value());
        BOOST_TEST(*item.uid == 7u);
        const std::vector<std::string> flags{"\\Seen", "\\Flagged"};
        BOOST_TEST(item.flags == flags, boost::test_tools::per_element());
        BOOST_REQUIRE(item.internal_date.has_value());
        BOOST_TEST(*item.internal_date == "17-Jul-1996 02:44:25 -0700");
        BOOST_REQUIRE(item.body.has_value());
        BOOST_TEST(*item.body == body);

        BOOST_TEST(!items->back().uid.has_value());
    });

    BOOST_TEST(server.server_error.empty());
    BOOST_TEST(fetch_line == "A1 UID FETCH 7 (UID FLAGS INTERNALDATE BODY.PEEK[])");
}
