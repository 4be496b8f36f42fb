/*

messages.hpp
------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <courier/mime/body.hpp>
#include <courier/mime/part.hpp>

namespace courier
{

/**
Message to submit. At least one of `body` and `html` must carry text.
**/
struct outbound_message
{
    std::string subject;
    std::string body;
    std::optional<std::string> html;

    /// Overrides the configured default sender.
    std::optional<std::string> from;
    std::vector<std::string> to;
    std::vector<std::string> cc;
    /// Envelope only, never written into the headers.
    std::vector<std::string> bcc;
    std::optional<std::string> reply_to;
};

/**
Fetched message with decoded display headers and the untouched bytes.
**/
struct inbound_message
{
    std::string subject;
    std::string from;
    std::string to;
    std::string date;
    std::string plain_text;
    std::optional<std::string> html_text;
    std::string raw;
};

/**
Parse `raw` and decode its display headers and text bodies. Never fails.
**/
[[nodiscard]] inline inbound_message make_inbound_message(std::string raw)
{
    const auto message = mime::part::parse(raw);
    auto body = mime::extract_body(message);

    inbound_message result;
    result.subject = mime::decode_header_value(message.header("Subject"));
    result.from = mime::decode_header_value(message.header("From"));
    result.to = mime::decode_header_value(message.header("To"));
    result.date = mime::decode_header_value(message.header("Date"));
    result.plain_text = std::move(body.plain_text);
    result.html_text = std::move(body.html_text);
    result.raw = std::move(raw);
    return result;
}

} // namespace courier
