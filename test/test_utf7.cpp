/*

test_utf7.cpp
-------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE utf7_test

#include <boost/test/unit_test.hpp>
#include <mailshift/imap/utf7.hpp>


BOOST_AUTO_TEST_CASE(utf7_ascii_passthrough)
{
    auto encoded = mailshift::imap::encode_mailbox_name("Sent/2024");
    BOOST_REQUIRE(encoded);
    BOOST_TEST(*encoded == "Sent/2024");
}

BOOST_AUTO_TEST_CASE(utf7_ampersand)
{
    auto encoded = mailshift::imap::encode_mailbox_name("R&D");
    BOOST_REQUIRE(encoded);
    BOOST_TEST(*encoded == "R&-D");

    auto decoded = mailshift::imap::decode_mailbox_name("R&-D");
    BOOST_REQUIRE(decoded);
    BOOST_TEST(*decoded == "R&D");
}

BOOST_AUTO_TEST_CASE(utf7_non_ascii)
{
    auto encoded = mailshift::imap::encode_mailbox_name("Entw\xC3\xBCrfe");
    BOOST_REQUIRE(encoded);
    BOOST_TEST(*encoded == "Entw&APw-rfe");

    auto decoded = mailshift::imap::decode_mailbox_name("&ZeVnLIqe-");
    BOOST_REQUIRE(decoded);
    BOOST_TEST(*decoded == "\xE6\x97\xA5\xE6\x9C\xAC\xE8\xAA\x9E");
}

BOOST_AUTO_TEST_CASE(utf7_rejects_invalid_input)
{
    auto bad_utf8 = mailshift::imap::encode_mailbox_name("\xC3");
    BOOST_REQUIRE(!bad_utf8);
    BOOST_TEST(bad_utf8.error().code() == mailshift::error_code::invalid_mailbox);

    BOOST_TEST(!mailshift::imap::decode_mailbox_name("&ZeVn").has_value());
    BOOST_TEST(!mailshift::imap::decode_mailbox_name("&!!-").has_value());
}
