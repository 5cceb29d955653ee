/*

command.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Pieces of IMAP command lines: appending without temporaries, rejecting line breaks, UID sets.

*/


#pragma once

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>
#include <mailshift/detail/result.hpp>

namespace mailshift::detail
{

inline void append_sv(std::string& out, std::string_view sv)
{
    out.append(sv.data(), sv.size());
}

inline void append_char(std::string& out, char ch)
{
    out.push_back(ch);
}

inline void append_space(std::string& out)
{
    out.push_back(' ');
}

inline void append_uint(std::string& out, std::uint64_t value)
{
    char buffer[20];
    const auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
    if (ec == std::errc())
        out.append(buffer, end);
}

/// Rejects values that would end the command line early or smuggle a second command.
[[nodiscard]] inline result_void ensure_single_line(std::string_view value, const char* field_name)
{
    if (value.find_first_of(std::string_view("\r\n\0", 3)) == std::string_view::npos)
        return ok();
    std::string message = "Invalid ";
    message += field_name != nullptr ? field_name : "value";
    message += ": CR, LF or NUL not allowed.";
    return fail(error_code::invalid_argument, std::move(message));
}

/**
UID set for `UID FETCH` and `UID MOVE`: sorted, duplicates dropped, runs collapsed to `a:b`.

@param keys Decimal UIDs.
@return     Set text such as `3:5,9`, or `invalid_argument` for an empty list or a key that is not
            the canonical decimal form of a non-zero 32-bit number.
**/
template<typename Range>
[[nodiscard]] result<std::string> uid_set(const Range& keys)
{
    std::vector<std::uint32_t> uids;
    for (const auto& key : keys)
    {
        const std::string_view text(key);
        std::uint32_t uid = 0;
        const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), uid);
        if (text.empty() || text.front() == '0' || ec != std::errc() || end != text.data() + text.size() || uid == 0)
            return fail<std::string>(error_code::invalid_argument, "Invalid UID: " + std::string(text) + ".");
        uids.push_back(uid);
    }
    if (uids.empty())
        return fail<std::string>(error_code::invalid_argument, "Empty UID set.");

    std::sort(uids.begin(), uids.end());
    uids.erase(std::unique(uids.begin(), uids.end()), uids.end());

    std::string out;
    for (std::size_t i = 0; i < uids.size(); )
    {
        std::size_t j = i;
        while (j + 1 < uids.size() && uids[j + 1] == uids[j] + 1)
            ++j;
        if (!out.empty())
            append_char(out, ',');
        append_uint(out, uids[i]);
        if (j > i)
        {
            append_char(out, ':');
            append_uint(out, uids[j]);
        }
        i = j + 1;
    }
    return ok(std::move(out));
}

} // namespace mailshift::detail
