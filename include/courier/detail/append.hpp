/*

append.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Building protocol lines and headers in place.

*/

#pragma once

#include <array>
#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>

namespace courier::detail
{

inline void append_sv(std::string& out, std::string_view text)
{
    out.append(text);
}

inline void append_char(std::string& out, char ch)
{
    out += ch;
}

inline void append_space(std::string& out)
{
    out += ' ';
}

inline void append_crlf(std::string& out)
{
    out += "\r\n";
}

/// Decimal digits of `value`, as used for message numbers and literal sizes.
inline void append_uint(std::string& out, std::uint64_t value)
{
    std::array<char, 20> digits{};
    const auto res = std::to_chars(digits.data(), digits.data() + digits.size(), value);
    out.append(digits.data(), res.ptr);
}

/// Values separated by `separator`, e.g. the address list of a To header.
template<typename Range>
[[nodiscard]] std::string join(const Range& values, std::string_view separator)
{
    std::string out;
    bool first = true;
    for (const auto& value : values)
    {
        if (!first)
            out.append(separator);
        out.append(value);
        first = false;
    }
    return out;
}

} // namespace courier::detail
