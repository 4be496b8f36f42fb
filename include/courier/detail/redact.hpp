/*

redact.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include <courier/detail/ascii.hpp>

namespace courier::detail
{

inline constexpr std::string_view REDACTED = "<redacted>";

namespace redact_impl
{
    /// Offset of the first non blank character at or after `pos`.
    [[nodiscard]] inline std::size_t skip_blanks(std::string_view text, std::size_t pos) noexcept
    {
        while (pos < text.size() && text[pos] == ' ')
            ++pos;
        return pos;
    }

    /// Offset just past the word or IMAP quoted string starting at `pos`.
    [[nodiscard]] inline std::size_t skip_word(std::string_view text, std::size_t pos) noexcept
    {
        if (pos < text.size() && text[pos] == '"')
        {
            for (++pos; pos < text.size(); ++pos)
            {
                if (text[pos] == '\\')
                    ++pos;
                else if (text[pos] == '"')
                    return pos + 1;
            }
            return text.size();
        }
        while (pos < text.size() && text[pos] != ' ')
            ++pos;
        return pos;
    }

    /// SASL responses sent on their own line, e.g. the AUTH LOGIN user name and password.
    [[nodiscard]] inline bool is_sasl_blob(std::string_view text) noexcept
    {
        if (text.empty())
            return false;
        bool marker = false;
        for (const unsigned char ch : text)
        {
            if (ch == '=' || ch == '+' || ch == '/' || (ch >= '0' && ch <= '9'))
                marker = true;
            else if (!((ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z')))
                return false;
        }
        return marker || text.size() >= 12;
    }
}

/**
Hiding credentials in a protocol line before it reaches a trace or an error detail.

The secret is everything after `PASS`, after the mechanism of `AUTH`, after the user name of an IMAP `LOGIN`,
or a whole bare SASL response. A trailing line break is preserved, other lines are returned unchanged.
**/
[[nodiscard]] inline std::string redact_line(std::string_view line)
{
    using namespace redact_impl;

    std::string_view body = line;
    while (!body.empty() && (body.back() == '\r' || body.back() == '\n'))
        body.remove_suffix(1);
    const std::string_view line_break = line.substr(body.size());

    std::size_t secret = std::string_view::npos;
    const std::size_t first = skip_blanks(body, 0);
    const std::size_t first_end = skip_word(body, first);
    const std::string_view verb = body.substr(first, first_end - first);

    if (iequals_ascii(verb, "PASS"))
        secret = skip_blanks(body, first_end);
    else if (iequals_ascii(verb, "AUTH"))
        secret = skip_blanks(body, skip_word(body, skip_blanks(body, first_end)));
    else if (first_end < body.size())
    {
        // Tagged IMAP command, `<tag> LOGIN <user> <password>`
        const std::size_t second = skip_blanks(body, first_end);
        const std::size_t second_end = skip_word(body, second);
        if (iequals_ascii(body.substr(second, second_end - second), "LOGIN"))
            secret = skip_blanks(body, skip_word(body, skip_blanks(body, second_end)));
    }
    else if (is_sasl_blob(verb))
        secret = first;

    if (secret == std::string_view::npos || secret >= body.size())
        return std::string(line);

    std::string out(body.substr(0, secret));
    out += REDACTED;
    out += line_break;
    return out;
}

} // namespace courier::detail
