/*

sanitize.hpp
------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <string>
#include <string_view>

#include <courier/detail/error_detail.hpp>
#include <courier/detail/result.hpp>

namespace courier::detail
{

/// Offset of the first CR, LF or NUL of `value`, `npos` when there is none.
[[nodiscard]] inline std::size_t find_line_break_or_nul(std::string_view value) noexcept
{
    return value.find_first_of(std::string_view("\r\n\0", 3));
}

/**
Refusing a value that would end a protocol line or a header early, which lets a caller inject commands or headers.

@param value Value to check.
@param field Name reported in the error.
@param code  Code of the error, a header by default.
**/
inline result_void ensure_no_crlf_or_nul(std::string_view value, std::string_view field,
    errc code = errc::config_invalid_header)
{
    const std::size_t pos = find_line_break_or_nul(value);
    if (pos == std::string_view::npos)
        return ok();

    error_detail info;
    info.add("field", field).add_int("offset", pos);
    std::string message = "Invalid ";
    message += field.empty() ? std::string_view("value") : field;
    message += ": CR, LF and NUL are not allowed.";
    return fail_void(code, std::move(message), info);
}

} // namespace courier::detail
