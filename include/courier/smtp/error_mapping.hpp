/*

smtp/error_mapping.hpp
----------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <courier/detail/ascii.hpp>
#include <courier/detail/error_detail.hpp>
#include <courier/detail/result.hpp>
#include <courier/smtp/types.hpp>

namespace courier::smtp
{

/// Command whose reply is being judged.
enum class command_kind
{
    greeting,
    ehlo,
    helo,
    starttls,
    auth,
    mail_from,
    rcpt_to,
    data_cmd,
    data_body,
    quit
};

[[nodiscard]] constexpr std::string_view command_name(command_kind kind) noexcept
{
    switch (kind)
    {
        case command_kind::greeting: return "greeting";
        case command_kind::ehlo: return "ehlo";
        case command_kind::helo: return "helo";
        case command_kind::starttls: return "starttls";
        case command_kind::auth: return "auth";
        case command_kind::mail_from: return "mail_from";
        case command_kind::rcpt_to: return "rcpt_to";
        case command_kind::data_cmd: return "data_cmd";
        case command_kind::data_body: return "data_body";
        case command_kind::quit: return "quit";
    }
    return "unknown";
}

/**
Error code for an unexpected reply to the given command. 421 always means the server is going away.
**/
[[nodiscard]] constexpr errc map_smtp_reply(command_kind kind, int status) noexcept
{
    const bool negative = status >= 400 && status < 600;
    if (status == 421)
        return errc::smtp_service_not_available;

    switch (kind)
    {
        case command_kind::greeting:
            if (negative)
                return errc::smtp_service_not_available;
            break;
        case command_kind::auth:
            return errc::smtp_auth_failed;
        case command_kind::mail_from:
            if (negative)
                return errc::smtp_mail_from_rejected;
            break;
        case command_kind::rcpt_to:
            if (negative)
                return errc::smtp_rejected_recipient;
            break;
        case command_kind::data_cmd:
        case command_kind::data_body:
            return errc::smtp_data_rejected;
        default:
            break;
    }

    if (status >= 400 && status < 500)
        return errc::smtp_temporary_failure;
    if (status >= 500 && status < 600)
        return errc::smtp_permanent_failure;
    return errc::smtp_bad_reply;
}

/**
RFC 3463 enhanced status code (`5.1.1`) at the start of a reply line, empty when the server sends none.
**/
[[nodiscard]] inline std::string enhanced_status(const reply& rep)
{
    for (const auto& line : rep.lines)
    {
        const auto space = line.find(' ');
        const std::string_view token = std::string_view(line).substr(0, space);
        if (token.size() < 5 || token[0] < '2' || token[0] > '5' || token[1] != '.')
            continue;
        const auto dot = token.find('.', 2);
        if (dot == std::string_view::npos || dot == 2 || dot + 1 == token.size())
            continue;
        bool digits = true;
        for (std::size_t i = 2; i < token.size(); ++i)
            if (i != dot && !detail::is_ascii_digit(token[i]))
                digits = false;
        if (digits)
            return std::string(token);
    }
    return {};
}

[[nodiscard]] inline detail::error_detail make_smtp_detail(std::string_view host, std::string_view service,
    command_kind kind, std::string_view command_line, const reply& rep)
{
    detail::error_detail detail;
    detail.add("proto", "smtp");
    detail.add("host", host);
    detail.add("service", service);
    detail.add("command", command_name(kind));
    if (!command_line.empty())
        detail.add_redacted("command.line", command_line);
    detail.add_int("reply.code", static_cast<std::uint64_t>(rep.status));
    detail.add_lines("reply.line", rep.lines);
    const std::string enhanced = enhanced_status(rep);
    if (!enhanced.empty())
        detail.add("enhanced", enhanced);
    return detail;
}

} // namespace courier::smtp
