/*

ascii.hpp
---------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <string>
#include <string_view>

namespace courier::detail
{

[[nodiscard]] constexpr char lower_ascii(char ch) noexcept
{
    return (ch >= 'A' && ch <= 'Z') ? static_cast<char>(ch - 'A' + 'a') : ch;
}

[[nodiscard]] constexpr char upper_ascii(char ch) noexcept
{
    return (ch >= 'a' && ch <= 'z') ? static_cast<char>(ch - 'a' + 'A') : ch;
}

[[nodiscard]] constexpr bool is_ascii_digit(char ch) noexcept
{
    return ch >= '0' && ch <= '9';
}

/// Blanks of header and protocol text: space, tab, CR, LF, vertical tab and form feed.
[[nodiscard]] constexpr bool is_ascii_blank(char ch) noexcept
{
    return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n' || ch == '\v' || ch == '\f';
}

/// Case insensitive comparison of keywords such as header names, charsets and protocol verbs.
[[nodiscard]] constexpr bool iequals_ascii(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size())
        return false;
    for (std::size_t i = 0; i < a.size(); ++i)
        if (lower_ascii(a[i]) != lower_ascii(b[i]))
            return false;
    return true;
}

[[nodiscard]] constexpr bool starts_with_ci(std::string_view text, std::string_view prefix) noexcept
{
    return text.size() >= prefix.size() && iequals_ascii(text.substr(0, prefix.size()), prefix);
}

[[nodiscard]] inline std::string to_lower_copy(std::string_view text)
{
    std::string out(text);
    for (char& ch : out)
        ch = lower_ascii(ch);
    return out;
}

[[nodiscard]] inline std::string to_upper_copy(std::string_view text)
{
    std::string out(text);
    for (char& ch : out)
        ch = upper_ascii(ch);
    return out;
}

[[nodiscard]] constexpr std::string_view trim_view(std::string_view text) noexcept
{
    while (!text.empty() && is_ascii_blank(text.front()))
        text.remove_prefix(1);
    while (!text.empty() && is_ascii_blank(text.back()))
        text.remove_suffix(1);
    return text;
}

[[nodiscard]] inline std::string trim_copy(std::string_view text)
{
    return std::string(trim_view(text));
}

/**
Text that can go out as 7bit: no byte above 127 and no control character other than tab and line breaks.
**/
[[nodiscard]] constexpr bool is_7bit_text(std::string_view text) noexcept
{
    for (const char ch : text)
    {
        const auto byte = static_cast<unsigned char>(ch);
        if (byte > 127 || (byte < 32 && ch != '\t' && ch != '\r' && ch != '\n'))
            return false;
    }
    return true;
}

} // namespace courier::detail
