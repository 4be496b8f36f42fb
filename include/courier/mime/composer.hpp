/*

composer.hpp
------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <boost/algorithm/string.hpp>
#include <openssl/rand.h>

#include <courier/codec/codec.hpp>
#include <courier/codec/q_codec.hpp>
#include <courier/codec/quoted_printable.hpp>
#include <courier/detail/append.hpp>
#include <courier/detail/ascii.hpp>
#include <courier/detail/result.hpp>
#include <courier/detail/sanitize.hpp>
#include <courier/service/messages.hpp>


namespace courier::mime
{


namespace detail_compose
{
    /**
    Random hex token for boundaries and message ids.
    **/
    [[nodiscard]] inline std::string random_token(std::size_t bytes = 12)
    {
        std::vector<unsigned char> buffer(bytes);
        if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1)
        {
            // Clock bytes when the RNG is unavailable, only uniqueness matters.
            auto ticks = static_cast<std::uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count());
            for (auto& byte : buffer)
            {
                byte = static_cast<unsigned char>(ticks & 0xFF);
                ticks = (ticks >> 8) | (ticks << 56);
            }
        }
        std::string out;
        out.reserve(bytes * 2);
        for (unsigned char byte : buffer)
        {
            out += codec::HEX_DIGITS[byte >> 4];
            out += codec::HEX_DIGITS[byte & 0x0F];
        }
        return out;
    }

    inline void append_two_digits(std::string& out, unsigned value)
    {
        detail::append_char(out, static_cast<char>('0' + value / 10 % 10));
        detail::append_char(out, static_cast<char>('0' + value % 10));
    }

    /**
    RFC 5322 date in UTC, e.g. `Mon, 02 Mar 2026 09:05:07 +0000`.
    **/
    [[nodiscard]] inline std::string format_date(std::chrono::system_clock::time_point when)
    {
        static constexpr std::array<std::string_view, 7> DAYS{"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
        static constexpr std::array<std::string_view, 12> MONTHS{"Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul",
            "Aug", "Sep", "Oct", "Nov", "Dec"};

        const auto day_point = std::chrono::floor<std::chrono::days>(when);
        const std::chrono::year_month_day date{day_point};
        const std::chrono::weekday weekday{day_point};
        const std::chrono::hh_mm_ss time_of_day{std::chrono::floor<std::chrono::seconds>(when - day_point)};

        std::string out;
        detail::append_sv(out, DAYS[weekday.c_encoding()]);
        detail::append_sv(out, ", ");
        append_two_digits(out, static_cast<unsigned>(date.day()));
        detail::append_space(out);
        detail::append_sv(out, MONTHS[static_cast<unsigned>(date.month()) - 1]);
        detail::append_space(out);
        detail::append_uint(out, static_cast<std::uint64_t>(static_cast<int>(date.year())));
        detail::append_space(out);
        append_two_digits(out, static_cast<unsigned>(time_of_day.hours().count()));
        detail::append_char(out, ':');
        append_two_digits(out, static_cast<unsigned>(time_of_day.minutes().count()));
        detail::append_char(out, ':');
        append_two_digits(out, static_cast<unsigned>(time_of_day.seconds().count()));
        detail::append_sv(out, " +0000");
        return out;
    }

    /**
    Header text, as base64 encoded words when it is not plain ASCII. Words are folded onto continuation lines.
    **/
    [[nodiscard]] inline std::string encode_text(std::string_view text)
    {
        if (detail::is_7bit_text(text))
            return std::string(text);
        q_codec qc(static_cast<std::string::size_type>(codec::line_len_policy_t::RECOMMENDED),
            static_cast<std::string::size_type>(codec::line_len_policy_t::RECOMMENDED));
        return detail::join(qc.encode(text, codec::CHARSET_UTF8, q_codec::method_t::BASE64), "\r\n ");
    }

    /**
    Address in `Name <local@domain>` or bare form. Only a non-ASCII display name gets encoded.
    **/
    [[nodiscard]] inline std::string encode_address(std::string_view address)
    {
        address = detail::trim_view(address);
        const auto angle = address.rfind('<');
        if (angle == std::string_view::npos || detail::is_7bit_text(address))
            return std::string(address);

        std::string_view name = detail::trim_view(address.substr(0, angle));
        if (name.size() >= 2 && name.front() == '"' && name.back() == '"')
            name = name.substr(1, name.size() - 2);
        std::string out = encode_text(name);
        if (!out.empty())
            out += ' ';
        out.append(address.substr(angle));
        return out;
    }

    inline void append_header(std::string& out, std::string_view name, std::string_view value)
    {
        detail::append_sv(out, name);
        detail::append_sv(out, ": ");
        detail::append_sv(out, value);
        detail::append_crlf(out);
    }

    [[nodiscard]] inline std::string encode_address_list(const std::vector<std::string>& addresses)
    {
        std::vector<std::string> encoded;
        encoded.reserve(addresses.size());
        for (const auto& address : addresses)
            encoded.push_back(encode_address(address));
        return detail::join(encoded, ", ");
    }

    /**
    Text part headers and body, quoted printable when the text is not 7 bit clean or has overlong lines.
    **/
    inline void append_text_part(std::string& out, std::string_view subtype, std::string_view text)
    {
        bool needs_qp = !detail::is_7bit_text(text);
        std::size_t line_len = 0;
        for (char ch : text)
        {
            line_len = ch == '\n' ? 0 : line_len + 1;
            if (line_len > static_cast<std::size_t>(codec::line_len_policy_t::MANDATORY))
                needs_qp = true;
        }

        std::string content_type = "text/";
        content_type += subtype;
        content_type += "; charset=utf-8";
        append_header(out, "Content-Type", content_type);
        append_header(out, "Content-Transfer-Encoding", needs_qp ? "quoted-printable" : "7bit");
        detail::append_crlf(out);

        std::vector<std::string> lines;
        if (needs_qp)
        {
            quoted_printable qp(static_cast<std::string::size_type>(codec::line_len_policy_t::RECOMMENDED) - 2,
                static_cast<std::string::size_type>(codec::line_len_policy_t::RECOMMENDED) - 2);
            lines = qp.encode(text);
        }
        else
        {
            boost::algorithm::split(lines, text, boost::algorithm::is_any_of("\n"));
            for (auto& line : lines)
                if (!line.empty() && line.back() == '\r')
                    line.pop_back();
        }
        for (const auto& line : lines)
        {
            detail::append_sv(out, line);
            detail::append_crlf(out);
        }
    }
}


/**
Bare mailbox of an address for the SMTP envelope: `Name <a@b>` gives `a@b`.
**/
[[nodiscard]] inline std::string envelope_address(std::string_view address)
{
    address = detail::trim_view(address);
    const auto open = address.rfind('<');
    const auto close = address.rfind('>');
    if (open != std::string_view::npos && close != std::string_view::npos && close > open)
        return std::string(detail::trim_view(address.substr(open + 1, close - open - 1)));
    return std::string(address);
}


/**
Envelope recipients of a message: to, then cc, then bcc.
**/
[[nodiscard]] inline std::vector<std::string> envelope_recipients(const outbound_message& msg)
{
    std::vector<std::string> recipients;
    recipients.reserve(msg.to.size() + msg.cc.size() + msg.bcc.size());
    for (const auto* list : {&msg.to, &msg.cc, &msg.bcc})
        for (const auto& address : *list)
            recipients.push_back(envelope_address(address));
    return recipients;
}


/**
Rendering a message as RFC 5322 text with CRLF line endings, ready for the SMTP DATA phase.

@param msg  Message to render.
@param from Resolved sender.
@return     Message text, or a configuration error when a header would be malformed or a required field is missing.
**/
[[nodiscard]] inline result<std::string> compose(const outbound_message& msg, std::string_view from)
{
    if (detail::trim_view(from).empty())
        return fail<std::string>(errc::config_missing_sender, "No sender address could be resolved.");
    if (msg.to.empty())
        return fail<std::string>(errc::config_missing_recipient, "At least one To recipient is required.");
    if (msg.body.empty() && (!msg.html.has_value() || msg.html->empty()))
        return fail<std::string>(errc::config_invalid_value, "Message has neither a plain nor an HTML body.");

    COURIER_TRY(detail::ensure_no_crlf_or_nul(from, "From"));
    COURIER_TRY(detail::ensure_no_crlf_or_nul(msg.subject, "Subject"));
    if (msg.reply_to.has_value())
        COURIER_TRY(detail::ensure_no_crlf_or_nul(*msg.reply_to, "Reply-To"));
    for (const auto& [list, name] : {std::pair{&msg.to, "To"}, std::pair{&msg.cc, "Cc"}, std::pair{&msg.bcc, "Bcc"}})
    {
        for (const auto& address : *list)
        {
            COURIER_TRY(detail::ensure_no_crlf_or_nul(address, name));
            if (envelope_address(address).empty())
                return fail<std::string>(errc::config_invalid_header, std::string("Empty address in ") + name + ".");
        }
    }

    std::string out;
    detail_compose::append_header(out, "Date", detail_compose::format_date(std::chrono::system_clock::now()));
    detail_compose::append_header(out, "From", detail_compose::encode_address(from));
    detail_compose::append_header(out, "To", detail_compose::encode_address_list(msg.to));
    if (!msg.cc.empty())
        detail_compose::append_header(out, "Cc", detail_compose::encode_address_list(msg.cc));
    if (msg.reply_to.has_value() && !msg.reply_to->empty())
        detail_compose::append_header(out, "Reply-To", detail_compose::encode_address(*msg.reply_to));
    detail_compose::append_header(out, "Subject", detail_compose::encode_text(msg.subject));

    const std::string sender = envelope_address(from);
    const auto at = sender.rfind('@');
    const std::string domain = at == std::string::npos || at + 1 == sender.size() ? "localhost" : sender.substr(at + 1);
    detail_compose::append_header(out, "Message-ID", "<" + detail_compose::random_token() + "@" + domain + ">");
    detail_compose::append_header(out, "MIME-Version", "1.0");

    if (!msg.html.has_value() || msg.html->empty())
    {
        detail_compose::append_text_part(out, "plain", msg.body);
        return ok(std::move(out));
    }

    const std::string boundary = "=_courier_" + detail_compose::random_token();
    detail_compose::append_header(out, "Content-Type", "multipart/alternative; boundary=\"" + boundary + "\"");
    detail::append_crlf(out);
    detail::append_sv(out, "This is a multi-part message in MIME format.\r\n");
    for (const auto& [subtype, text] : {std::pair<std::string_view, std::string_view>{"plain", msg.body},
        std::pair<std::string_view, std::string_view>{"html", *msg.html}})
    {
        detail::append_crlf(out);
        detail::append_sv(out, "--" + boundary);
        detail::append_crlf(out);
        detail_compose::append_text_part(out, subtype, text);
    }
    detail::append_crlf(out);
    detail::append_sv(out, "--" + boundary + "--");
    detail::append_crlf(out);
    return ok(std::move(out));
}


} // namespace courier::mime
