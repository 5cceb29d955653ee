/*

test_redact.cpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE redact_test

#include <boost/test/unit_test.hpp>
#include <mailshift/detail/redact.hpp>


BOOST_AUTO_TEST_CASE(redact_tagged_login)
{
    BOOST_TEST(mailshift::detail::redact_line("A1 LOGIN \"user\" \"secret\"\r\n") == "A1 LOGIN \"user\" <redacted>\r\n");
}

BOOST_AUTO_TEST_CASE(redact_untagged_login)
{
    BOOST_TEST(mailshift::detail::redact_line("login user pass") == "login user <redacted>");
}

BOOST_AUTO_TEST_CASE(redact_quoted_user_with_spaces)
{
    BOOST_TEST(mailshift::detail::redact_line("A2 LOGIN \"john doe\" \"pa ss\"\r\n")
        == "A2 LOGIN \"john doe\" <redacted>\r\n");
    BOOST_TEST(mailshift::detail::redact_line(R"(A2 LOGIN "a\"b c" "x y")") == R"(A2 LOGIN "a\"b c" <redacted>)");
}

BOOST_AUTO_TEST_CASE(redact_unterminated_user)
{
    BOOST_TEST(mailshift::detail::redact_line("A2 LOGIN \"broken secret") == "A2 LOGIN <redacted>");
}

BOOST_AUTO_TEST_CASE(redact_leaves_other_commands)
{
    BOOST_TEST(mailshift::detail::redact_line("A3 SELECT \"INBOX\"") == "A3 SELECT \"INBOX\"");
    BOOST_TEST(mailshift::detail::redact_line("A4 LOGIN") == "A4 LOGIN");
    BOOST_TEST(mailshift::detail::redact_line("A4 LOGIN user") == "A4 LOGIN user");
    BOOST_TEST(mailshift::detail::redact_line("A5 SEARCH TEXT LOGIN secret") == "A5 SEARCH TEXT LOGIN secret");
}
