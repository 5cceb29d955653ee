/*

message_id.hpp
--------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <mailshift/detail/redact.hpp>

namespace mailshift::migrate
{

namespace detail
{
    inline std::string_view trim_ws(std::string_view text)
    {
        while (!text.empty() && (text.front() == ' ' || text.front() == '\t'))
            text.remove_prefix(1);
        while (!text.empty() && (text.back() == ' ' || text.back() == '\t' || text.back() == '\r'))
            text.remove_suffix(1);
        return text;
    }
} // namespace detail

/**
Value of the Message-ID header of a raw message, folded lines joined.

Only the header section is looked at. Empty when the header is absent or blank; never fails.
**/
[[nodiscard]] inline std::optional<std::string> extract_message_id(std::string_view raw)
{
    std::optional<std::string> value;
    bool in_message_id = false;

    std::size_t pos = 0;
    while (pos < raw.size())
    {
        auto eol = raw.find('\n', pos);
        if (eol == std::string_view::npos)
            eol = raw.size();
        std::string_view line = raw.substr(pos, eol - pos);
        pos = eol + 1;
        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);

        if (line.empty())
            break;

        if (line.front() == ' ' || line.front() == '\t')
        {
            if (in_message_id)
            {
                std::string_view folded = detail::trim_ws(line);
                if (!folded.empty())
                {
                    if (!value->empty())
                        value->push_back(' ');
                    value->append(folded.data(), folded.size());
                }
            }
            continue;
        }

        if (in_message_id)
            break;

        const auto colon = line.find(':');
        if (colon == std::string_view::npos)
            continue;
        if (mailshift::detail::iequals_ascii(detail::trim_ws(line.substr(0, colon)), "Message-ID"))
        {
            value = std::string(detail::trim_ws(line.substr(colon + 1)));
            in_message_id = true;
        }
    }

    if (!value.has_value() || value->empty())
        return std::nullopt;
    return value;
}

} // namespace mailshift::migrate
