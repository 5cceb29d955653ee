/*

types.hpp
---------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <chrono>
#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>
#include <mailshift/detail/command.hpp>
#include <mailshift/detail/redact.hpp>
#include <mailshift/detail/result.hpp>
#include <mailshift/imap/utf7.hpp>
#include <mailshift/net/tls_options.hpp>

namespace mailshift::imap
{

enum class status
{
    ok,
    no,
    bad,
    preauth,
    bye,
    unknown
};

struct credentials
{
    std::string username;
    std::string password;
};

/// Quoted string form of an astring argument.
[[nodiscard]] inline result<std::string> to_astring(std::string_view text)
{
    MAILSHIFT_TRY_VOID(mailshift::detail::ensure_single_line(text, "astring"));
    std::string out;
    out.reserve(text.size() + 2);
    out.push_back('"');
    for (char ch : text)
    {
        if (ch == '"' || ch == '\\')
            out.push_back('\\');
        out.push_back(ch);
    }
    out.push_back('"');
    return ok(std::move(out));
}

/// Mailbox argument: UTF-8 name encoded to modified UTF-7 and quoted.
[[nodiscard]] inline result<std::string> to_mailbox(std::string_view utf8_mailbox)
{
    std::string encoded;
    MAILSHIFT_TRY_ASSIGN(encoded, encode_mailbox_name(utf8_mailbox));
    return to_astring(encoded);
}

struct mailbox_folder
{
    std::string name;
    std::optional<char> delimiter;
    std::vector<std::string> attributes;

    [[nodiscard]] bool selectable() const noexcept
    {
        for (const auto& attr : attributes)
        {
            if (mailshift::detail::iequals_ascii(attr, "\\Noselect") || mailshift::detail::iequals_ascii(attr, "\\NonExistent"))
                return false;
        }
        return true;
    }
};

/// One untagged response; literals that were embedded in it are kept aside and
/// their `{n}` markers stay in `text`.
struct untagged_data
{
    std::string text;
    std::vector<std::string> literals;
};

struct response
{
    std::string tag;
    status st = status::unknown;
    std::string text;
    std::vector<untagged_data> untagged;
    std::vector<std::string> continuation;
};

/// Data items of one `* n FETCH (...)` response.
struct fetch_item
{
    std::uint32_t seq = 0;
    std::optional<std::uint32_t> uid;
    std::vector<std::string> flags;
    std::optional<std::string> internal_date;
    std::optional<std::string> body;
};

/// Maximum line length accepted from the server; UID SEARCH of large mailboxes yields long lines.
inline constexpr std::size_t DEFAULT_MAX_LINE_LENGTH = 16 * 1024 * 1024;

struct options
{
    std::size_t max_line_length = DEFAULT_MAX_LINE_LENGTH;
    std::optional<std::chrono::steady_clock::duration> timeout = std::nullopt;
    mailshift::net::tls_options tls;
};

namespace detail
{
    [[nodiscard]] inline std::string_view ltrim(std::string_view text)
    {
        while (!text.empty() && text.front() == ' ')
            text.remove_prefix(1);
        return text;
    }

    [[nodiscard]] inline std::pair<std::string_view, std::string_view> split_token(std::string_view text)
    {
        text = ltrim(text);
        auto pos = text.find(' ');
        if (pos == std::string_view::npos)
            return {text, std::string_view{}};
        return {text.substr(0, pos), ltrim(text.substr(pos + 1))};
    }

    [[nodiscard]] inline bool parse_uint32(std::string_view token, std::uint32_t& out)
    {
        if (token.empty())
            return false;
        std::uint32_t value = 0;
        auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
        if (ec != std::errc{} || ptr != token.data() + token.size())
            return false;
        out = value;
        return true;
    }

    [[nodiscard]] inline status parse_status_word(std::string_view word)
    {
        using mailshift::detail::iequals_ascii;
        if (iequals_ascii(word, "OK"))
            return status::ok;
        if (iequals_ascii(word, "NO"))
            return status::no;
        if (iequals_ascii(word, "BAD"))
            return status::bad;
        if (iequals_ascii(word, "PREAUTH"))
            return status::preauth;
        if (iequals_ascii(word, "BYE"))
            return status::bye;
        return status::unknown;
    }

    /// Size of the literal announced at the end of a line, `{n}` or `{n+}`.
    [[nodiscard]] inline std::optional<std::size_t> trailing_literal_size(std::string_view line)
    {
        if (line.empty() || line.back() != '}')
            return std::nullopt;
        const auto open = line.rfind('{');
        if (open == std::string_view::npos)
            return std::nullopt;
        std::string_view digits = line.substr(open + 1, line.size() - open - 2);
        if (!digits.empty() && digits.back() == '+')
            digits.remove_suffix(1);
        std::size_t size = 0;
        auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), size);
        if (digits.empty() || ec != std::errc{} || ptr != digits.data() + digits.size())
            return std::nullopt;
        return size;
    }

    /**
    Reads the parenthesized, quoted and literal values of an untagged response.
    A literal is seen as its `{n}` marker in the text and is taken from the literal queue.
    **/
    class item_reader
    {
    public:
        item_reader(std::string_view text, const std::vector<std::string>& literals)
            : text_(text), literals_(literals)
        {
        }

        void skip_spaces()
        {
            while (pos_ < text_.size() && text_[pos_] == ' ')
                ++pos_;
        }

        [[nodiscard]] bool at_end() const noexcept { return pos_ >= text_.size(); }

        bool consume(char ch)
        {
            if (pos_ < text_.size() && text_[pos_] == ch)
            {
                ++pos_;
                return true;
            }
            return false;
        }

        /// Data item name, bracketed sections included (`BODY[HEADER.FIELDS (X)]`).
        [[nodiscard]] std::string_view read_name()
        {
            const std::size_t start = pos_;
            int depth = 0;
            while (pos_ < text_.size())
            {
                const char ch = text_[pos_];
                if (ch == '[')
                    ++depth;
                else if (ch == ']')
                    --depth;
                else if (depth == 0 && (ch == ' ' || ch == '(' || ch == ')'))
                    break;
                ++pos_;
            }
            return text_.substr(start, pos_ - start);
        }

        [[nodiscard]] std::string_view read_atom()
        {
            const std::size_t start = pos_;
            while (pos_ < text_.size() && text_[pos_] != ' ' && text_[pos_] != '(' && text_[pos_] != ')')
                ++pos_;
            return text_.substr(start, pos_ - start);
        }

        /// Quoted string, literal or NIL.
        bool read_nstring(std::optional<std::string>& out)
        {
            skip_spaces();
            if (at_end())
                return false;
            const char ch = text_[pos_];
            if (ch == '"')
                return read_quoted(out);
            if (ch == '{' || ch == '~')
                return read_literal(out);
            const std::string_view atom = read_atom();
            if (!mailshift::detail::iequals_ascii(atom, "NIL"))
                return false;
            out.reset();
            return true;
        }

        /// Quoted string, literal or atom.
        bool read_astring(std::string& out)
        {
            skip_spaces();
            if (at_end())
                return false;
            const char ch = text_[pos_];
            if (ch == '"' || ch == '{')
            {
                std::optional<std::string> value;
                if (!(ch == '"' ? read_quoted(value) : read_literal(value)))
                    return false;
                out = std::move(*value);
                return true;
            }
            const std::string_view atom = read_atom();
            if (atom.empty())
                return false;
            out.assign(atom.data(), atom.size());
            return true;
        }

        /// Flat parenthesized list of atoms or strings.
        bool read_list(std::vector<std::string>& out)
        {
            skip_spaces();
            if (!consume('('))
                return false;
            for (;;)
            {
                skip_spaces();
                if (consume(')'))
                    return true;
                if (at_end())
                    return false;
                std::string value;
                if (!read_astring(value))
                    return false;
                out.push_back(std::move(value));
            }
        }

        /// Skips any value, nested lists included.
        bool skip_value()
        {
            skip_spaces();
            if (at_end())
                return false;
            const char ch = text_[pos_];
            if (ch == '(')
            {
                ++pos_;
                for (;;)
                {
                    skip_spaces();
                    if (consume(')'))
                        return true;
                    if (at_end() || !skip_value())
                        return false;
                }
            }
            if (ch == '"' || ch == '{' || ch == '~')
            {
                std::optional<std::string> ignored;
                return read_nstring(ignored);
            }
            return !read_atom().empty();
        }

    private:
        bool read_quoted(std::optional<std::string>& out)
        {
            ++pos_;
            std::string value;
            while (pos_ < text_.size())
            {
                char ch = text_[pos_++];
                if (ch == '"')
                {
                    out = std::move(value);
                    return true;
                }
                if (ch == '\\')
                {
                    if (pos_ >= text_.size())
                        return false;
                    ch = text_[pos_++];
                }
                value.push_back(ch);
            }
            return false;
        }

        bool read_literal(std::optional<std::string>& out)
        {
            consume('~');
            if (!consume('{'))
                return false;
            const auto close = text_.find('}', pos_);
            if (close == std::string_view::npos)
                return false;
            std::size_t announced = 0;
            std::string_view digits = text_.substr(pos_, close - pos_);
            if (!digits.empty() && digits.back() == '+')
                digits.remove_suffix(1);
            auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), announced);
            if (digits.empty() || ec != std::errc{} || ptr != digits.data() + digits.size())
                return false;
            pos_ = close + 1;
            if (next_literal_ >= literals_.size() || literals_[next_literal_].size() != announced)
                return false;
            out = literals_[next_literal_++];
            return true;
        }

        std::string_view text_;
        const std::vector<std::string>& literals_;
        std::size_t pos_ = 0;
        std::size_t next_literal_ = 0;
    };
} // namespace detail

/// Parses `* LIST (attrs) delim name`; the name is decoded from modified UTF-7.
[[nodiscard]] inline std::optional<mailbox_folder> parse_list_line(const untagged_data& data)
{
    auto [star, rest] = detail::split_token(data.text);
    if (star != "*")
        return std::nullopt;
    auto [keyword, rest2] = detail::split_token(rest);
    if (!mailshift::detail::iequals_ascii(keyword, "LIST"))
        return std::nullopt;

    detail::item_reader reader(rest2, data.literals);
    mailbox_folder folder;
    if (!reader.read_list(folder.attributes))
        return std::nullopt;
    std::optional<std::string> delimiter;
    if (!reader.read_nstring(delimiter))
        return std::nullopt;
    if (delimiter.has_value() && !delimiter->empty())
        folder.delimiter = delimiter->front();
    std::string wire_name;
    if (!reader.read_astring(wire_name))
        return std::nullopt;

    auto decoded = decode_mailbox_name(wire_name);
    folder.name = decoded ? std::move(*decoded) : std::move(wire_name);
    return folder;
}

[[nodiscard]] inline std::vector<std::uint32_t> parse_search_ids(std::string_view line)
{
    std::vector<std::uint32_t> ids;
    auto [star, rest] = detail::split_token(line);
    if (star != "*")
        return ids;
    auto [keyword, rest2] = detail::split_token(rest);
    if (!mailshift::detail::iequals_ascii(keyword, "SEARCH"))
        return ids;
    while (!rest2.empty())
    {
        auto [id_token, remaining] = detail::split_token(rest2);
        std::uint32_t value = 0;
        if (!detail::parse_uint32(id_token, value))
            break;
        ids.push_back(value);
        rest2 = remaining;
    }
    return ids;
}

/// Capability names from `* CAPABILITY ...` or a `[CAPABILITY ...]` response code.
[[nodiscard]] inline std::optional<std::vector<std::string>> parse_capabilities(std::string_view line)
{
    std::string_view list;
    auto [first, rest] = detail::split_token(line);
    auto [second, rest2] = detail::split_token(rest);
    if (first == "*" && mailshift::detail::iequals_ascii(second, "CAPABILITY"))
    {
        list = rest2;
    }
    else
    {
        const auto open = line.find('[');
        if (open == std::string_view::npos)
            return std::nullopt;
        const auto close = line.find(']', open);
        if (close == std::string_view::npos)
            return std::nullopt;
        auto [code, code_rest] = detail::split_token(line.substr(open + 1, close - open - 1));
        if (!mailshift::detail::iequals_ascii(code, "CAPABILITY"))
            return std::nullopt;
        list = code_rest;
    }

    std::vector<std::string> caps;
    while (!list.empty())
    {
        auto [cap, remaining] = detail::split_token(list);
        if (!cap.empty())
            caps.emplace_back(cap);
        list = remaining;
    }
    return caps;
}

/**
Parses a `* n FETCH (...)` response.

@return Empty optional when the line is not a FETCH response; `parse_error` when it is one but is malformed.
**/
[[nodiscard]] inline result<std::optional<fetch_item>> parse_fetch(const untagged_data& data)
{
    using mailshift::detail::iequals_ascii;

    auto [star, rest] = detail::split_token(data.text);
    if (star != "*")
        return ok(std::optional<fetch_item>{});
    auto [seq_token, rest2] = detail::split_token(rest);
    auto [keyword, items] = detail::split_token(rest2);
    std::uint32_t seq = 0;
    if (!detail::parse_uint32(seq_token, seq) || !iequals_ascii(keyword, "FETCH"))
        return ok(std::optional<fetch_item>{});

    auto malformed = [&data]()
    {
        return fail<std::optional<fetch_item>>(error_code::parse_error, "Malformed FETCH response.",
            data.text.substr(0, 200));
    };

    fetch_item item;
    item.seq = seq;
    detail::item_reader reader(items, data.literals);
    if (!reader.consume('('))
        return malformed();
    for (;;)
    {
        reader.skip_spaces();
        if (reader.consume(')'))
            break;
        if (reader.at_end())
            return malformed();

        const std::string_view name = reader.read_name();
        if (name.empty())
            return malformed();
        reader.skip_spaces();

        if (iequals_ascii(name, "UID"))
        {
            std::uint32_t uid = 0;
            if (!detail::parse_uint32(reader.read_atom(), uid))
                return malformed();
            item.uid = uid;
        }
        else if (iequals_ascii(name, "FLAGS"))
        {
            if (!reader.read_list(item.flags))
                return malformed();
        }
        else if (iequals_ascii(name, "INTERNALDATE"))
        {
            if (!reader.read_nstring(item.internal_date))
                return malformed();
        }
        else if (iequals_ascii(name, "RFC822") || iequals_ascii(name, "BODY[]"))
        {
            if (!reader.read_nstring(item.body))
                return malformed();
        }
        else if (!reader.skip_value())
        {
            return malformed();
        }
    }
    return ok(std::optional<fetch_item>(std::move(item)));
}

/// Parenthesized flag list for APPEND; `\Recent` is dropped since servers refuse to set it.
[[nodiscard]] inline std::string format_flag_list(const std::vector<std::string>& flags)
{
    std::string out;
    mailshift::detail::append_char(out, '(');
    bool first = true;
    for (const auto& flag : flags)
    {
        if (flag.empty() || mailshift::detail::iequals_ascii(flag, "\\Recent"))
            continue;
        if (flag.find_first_of(" ()\"{\r\n") != std::string::npos || flag.find('\0') != std::string::npos)
            continue;
        if (!first)
            mailshift::detail::append_space(out);
        mailshift::detail::append_sv(out, flag);
        first = false;
    }
    mailshift::detail::append_char(out, ')');
    return out;
}

/**
Builds `APPEND mailbox (flags) "date" {size}`.

@param mailbox      UTF-8 mailbox name.
@param size         Size of the message literal.
@param flags        Flags to set; `\Recent` is dropped.
@param date_time    INTERNALDATE as received from the source, empty for none.
@param literal_plus Use a non-synchronizing literal.
**/
[[nodiscard]] inline result<std::string> build_append_command(std::string_view mailbox, std::size_t size,
    const std::vector<std::string>& flags, std::string_view date_time, bool literal_plus)
{
    std::string mailbox_q;
    MAILSHIFT_TRY_ASSIGN(mailbox_q, to_mailbox(mailbox));

    std::string cmd;
    mailshift::detail::append_sv(cmd, "APPEND");
    mailshift::detail::append_space(cmd);
    mailshift::detail::append_sv(cmd, mailbox_q);
    const std::string flag_list = format_flag_list(flags);
    if (flag_list != "()")
    {
        mailshift::detail::append_space(cmd);
        mailshift::detail::append_sv(cmd, flag_list);
    }
    if (!date_time.empty())
    {
        std::string dt;
        MAILSHIFT_TRY_ASSIGN(dt, to_astring(date_time));
        mailshift::detail::append_space(cmd);
        mailshift::detail::append_sv(cmd, dt);
    }
    mailshift::detail::append_space(cmd);
    mailshift::detail::append_char(cmd, '{');
    mailshift::detail::append_uint(cmd, static_cast<std::uint64_t>(size));
    if (literal_plus)
        mailshift::detail::append_char(cmd, '+');
    mailshift::detail::append_char(cmd, '}');
    return ok(std::move(cmd));
}

} // namespace mailshift::imap
