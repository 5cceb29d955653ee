/*

utf7.hpp
--------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <mailshift/detail/result.hpp>

namespace mailshift::imap
{

namespace utf7_detail
{

inline int base64_value(char ch) noexcept
{
    if (ch >= 'A' && ch <= 'Z')
        return ch - 'A';
    if (ch >= 'a' && ch <= 'z')
        return ch - 'a' + 26;
    if (ch >= '0' && ch <= '9')
        return ch - '0' + 52;
    if (ch == '+')
        return 62;
    if (ch == ',')
        return 63;
    return -1;
}

/// Unpacks the base64 run of a shifted sequence into big-endian UTF-16 units.
inline bool unpack_units(std::string_view run, std::vector<std::uint16_t>& units)
{
    std::uint32_t acc = 0;
    int bits = 0;
    for (char ch : run)
    {
        const int value = base64_value(ch);
        if (value < 0)
            return false;
        acc = (acc << 6) | static_cast<std::uint32_t>(value);
        bits += 6;
        if (bits >= 16)
        {
            bits -= 16;
            units.push_back(static_cast<std::uint16_t>((acc >> bits) & 0xFFFF));
        }
    }
    // Leftover bits are padding and must be zero.
    return bits < 6 && (acc & ((1u << bits) - 1)) == 0;
}

inline void append_utf8(std::uint32_t cp, std::string& out)
{
    if (cp <= 0x7F)
    {
        out.push_back(static_cast<char>(cp));
    }
    else if (cp <= 0x7FF)
    {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else if (cp <= 0xFFFF)
    {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else
    {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

} // namespace utf7_detail

/**
Decodes a mailbox name from IMAP modified UTF-7 (RFC 3501 section 5.1.3) into UTF-8.

@param name Mailbox name as it travels on the wire.
@return     UTF-8 name, or `invalid_mailbox` when the name is not valid modified UTF-7.
**/
[[nodiscard]] inline result<std::string> decode_mailbox_name(std::string_view name)
{
    std::string out;
    out.reserve(name.size());

    std::size_t i = 0;
    while (i < name.size())
    {
        const char ch = name[i];
        if (static_cast<unsigned char>(ch) & 0x80)
            return fail<std::string>(error_code::invalid_mailbox, "Invalid modified UTF-7.");
        if (ch != '&')
        {
            out.push_back(ch);
            ++i;
            continue;
        }

        const auto end = name.find('-', i + 1);
        if (end == std::string_view::npos)
            return fail<std::string>(error_code::invalid_mailbox, "Unterminated modified UTF-7 sequence.");
        if (end == i + 1)
        {
            out.push_back('&');
            i = end + 1;
            continue;
        }

        std::vector<std::uint16_t> units;
        if (!utf7_detail::unpack_units(name.substr(i + 1, end - i - 1), units))
            return fail<std::string>(error_code::invalid_mailbox, "Invalid modified UTF-7.");

        for (std::size_t j = 0; j < units.size(); ++j)
        {
            const std::uint16_t unit = units[j];
            if (unit >= 0xD800 && unit <= 0xDBFF)
            {
                if (j + 1 >= units.size() || units[j + 1] < 0xDC00 || units[j + 1] > 0xDFFF)
                    return fail<std::string>(error_code::invalid_mailbox, "Unpaired UTF-16 surrogate.");
                const std::uint32_t cp = 0x10000 + ((static_cast<std::uint32_t>(unit - 0xD800) << 10) | (units[j + 1] - 0xDC00u));
                utf7_detail::append_utf8(cp, out);
                ++j;
            }
            else if (unit >= 0xDC00 && unit <= 0xDFFF)
            {
                return fail<std::string>(error_code::invalid_mailbox, "Unpaired UTF-16 surrogate.");
            }
            else
            {
                utf7_detail::append_utf8(unit, out);
            }
        }
        i = end + 1;
    }
    return ok(std::move(out));
}

/**
Encodes a UTF-8 mailbox name into IMAP modified UTF-7.

@param name UTF-8 mailbox name.
@return     Wire form, or `invalid_mailbox` when the name is not valid UTF-8.
**/
[[nodiscard]] inline result<std::string> encode_mailbox_name(std::string_view name)
{
    static constexpr char alphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+,";

    std::string out;
    out.reserve(name.size());
    std::vector<std::uint16_t> pending;

    auto flush = [&]()
    {
        if (pending.empty())
            return;
        out.push_back('&');
        std::uint32_t acc = 0;
        int bits = 0;
        for (std::uint16_t unit : pending)
        {
            acc = (acc << 16) | unit;
            bits += 16;
            while (bits >= 6)
            {
                bits -= 6;
                out.push_back(alphabet[(acc >> bits) & 0x3F]);
            }
        }
        if (bits > 0)
            out.push_back(alphabet[(acc << (6 - bits)) & 0x3F]);
        out.push_back('-');
        pending.clear();
    };

    std::size_t i = 0;
    while (i < name.size())
    {
        const auto b0 = static_cast<unsigned char>(name[i]);
        std::uint32_t cp = 0;
        std::size_t len = 0;
        if (b0 < 0x80)
        {
            cp = b0;
            len = 1;
        }
        else if ((b0 >> 5) == 0x6)
        {
            cp = b0 & 0x1F;
            len = 2;
        }
        else if ((b0 >> 4) == 0xE)
        {
            cp = b0 & 0x0F;
            len = 3;
        }
        else if ((b0 >> 3) == 0x1E)
        {
            cp = b0 & 0x07;
            len = 4;
        }
        else
        {
            return fail<std::string>(error_code::invalid_mailbox, "Invalid UTF-8 in mailbox name.");
        }
        if (i + len > name.size())
            return fail<std::string>(error_code::invalid_mailbox, "Truncated UTF-8 in mailbox name.");
        for (std::size_t k = 1; k < len; ++k)
        {
            const auto bk = static_cast<unsigned char>(name[i + k]);
            if ((bk & 0xC0) != 0x80)
                return fail<std::string>(error_code::invalid_mailbox, "Invalid UTF-8 in mailbox name.");
            cp = (cp << 6) | (bk & 0x3F);
        }
        static constexpr std::uint32_t min_for_length[] = {0, 0, 0x80, 0x800, 0x10000};
        if (cp < min_for_length[len] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
            return fail<std::string>(error_code::invalid_mailbox, "Invalid UTF-8 in mailbox name.");
        i += len;

        if (cp >= 0x20 && cp <= 0x7E)
        {
            flush();
            if (cp == '&')
                out += "&-";
            else
                out.push_back(static_cast<char>(cp));
            continue;
        }
        if (cp > 0xFFFF)
        {
            const std::uint32_t v = cp - 0x10000;
            pending.push_back(static_cast<std::uint16_t>(0xD800 + (v >> 10)));
            pending.push_back(static_cast<std::uint16_t>(0xDC00 + (v & 0x3FF)));
        }
        else
        {
            pending.push_back(static_cast<std::uint16_t>(cp));
        }
    }
    flush();
    return ok(std::move(out));
}

} // namespace mailshift::imap
