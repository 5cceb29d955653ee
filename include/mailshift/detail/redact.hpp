#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace mailshift::detail
{

[[nodiscard]] inline bool iequals_ascii(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size())
        return false;
    for (std::size_t i = 0; i < a.size(); ++i)
    {
        char ca = a[i];
        char cb = b[i];
        if (ca >= 'a' && ca <= 'z')
            ca = static_cast<char>(ca - ('a' - 'A'));
        if (cb >= 'a' && cb <= 'z')
            cb = static_cast<char>(cb - ('a' - 'A'));
        if (ca != cb)
            return false;
    }
    return true;
}

namespace redact
{

inline std::size_t skip_spaces(std::string_view line, std::size_t pos) noexcept
{
    while (pos < line.size() && line[pos] == ' ')
        ++pos;
    return pos;
}

inline std::size_t atom_end(std::string_view line, std::size_t pos) noexcept
{
    while (pos < line.size() && line[pos] != ' ')
        ++pos;
    return pos;
}

/// End of the quoted string, literal marker or atom starting at `pos`; npos when unterminated.
inline std::size_t astring_end(std::string_view line, std::size_t pos) noexcept
{
    if (line[pos] == '{')
    {
        const auto close = line.find('}', pos);
        return close == std::string_view::npos ? close : close + 1;
    }
    if (line[pos] != '"')
        return atom_end(line, pos);
    for (std::size_t i = pos + 1; i < line.size(); ++i)
    {
        if (line[i] == '\\')
            ++i;
        else if (line[i] == '"')
            return i + 1;
    }
    return std::string_view::npos;
}

} // namespace redact

/**
Hides the password of a `LOGIN user password` command, tagged or not.

The user name is kept for the trace. Quoted names may contain spaces and escaped quotes; everything
after the name up to the line ending is replaced. Other lines come back unchanged.
**/
[[nodiscard]] inline std::string redact_line(std::string_view line)
{
    std::string_view trimmed = line;
    while (!trimmed.empty() && (trimmed.back() == '\r' || trimmed.back() == '\n'))
        trimmed.remove_suffix(1);
    const std::string_view suffix = line.substr(trimmed.size());

    std::size_t pos = redact::skip_spaces(trimmed, 0);
    std::size_t end = redact::atom_end(trimmed, pos);
    if (!iequals_ascii(trimmed.substr(pos, end - pos), "LOGIN"))
    {
        pos = redact::skip_spaces(trimmed, end);
        end = redact::atom_end(trimmed, pos);
        if (!iequals_ascii(trimmed.substr(pos, end - pos), "LOGIN"))
            return std::string(line);
    }

    pos = redact::skip_spaces(trimmed, end);
    if (pos >= trimmed.size())
        return std::string(line);
    end = redact::astring_end(trimmed, pos);
    if (end == std::string_view::npos)
        return std::string(trimmed.substr(0, pos)) + "<redacted>" + std::string(suffix);
    pos = redact::skip_spaces(trimmed, end);
    if (pos >= trimmed.size())
        return std::string(line);

    std::string out(trimmed.substr(0, pos));
    out += "<redacted>";
    out.append(suffix.data(), suffix.size());
    return out;
}

} // namespace mailshift::detail
