/*

pop3/error_mapping.hpp
----------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <string>
#include <string_view>

#include <courier/detail/error_detail.hpp>
#include <courier/detail/result.hpp>
#include <courier/pop3/types.hpp>

namespace courier::pop3
{

[[nodiscard]] inline detail::error_detail make_pop3_detail(std::string_view host, std::string_view command,
    std::string_view response_line = {})
{
    detail::error_detail detail;
    detail.add("proto", "pop3");
    detail.add("host", host);
    detail.add_redacted("command", command);
    if (!response_line.empty())
        detail.add("response.line", response_line);
    return detail;
}

/**
Splitting a status line. Anything but `+OK` or `-ERR` is a `pop3_parse_error`.
**/
[[nodiscard]] inline result<status_line> parse_status(std::string_view line, std::string_view host,
    std::string_view command)
{
    const auto space = line.find(' ');
    const std::string_view word = line.substr(0, space);
    const std::string_view rest = space == std::string_view::npos ? std::string_view{} : line.substr(space + 1);
    if (word != OK_RESPONSE && word != ERR_RESPONSE)
        return fail<status_line>(errc::pop3_parse_error, "Unknown POP3 status.",
            make_pop3_detail(host, command, line));
    return ok(status_line{word == OK_RESPONSE, std::string(rest)});
}

} // namespace courier::pop3
