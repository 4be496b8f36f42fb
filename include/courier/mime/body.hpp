/*

body.hpp
--------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <boost/algorithm/string.hpp>
#include <courier/codec/codec.hpp>
#include <courier/codec/q_codec.hpp>
#include <courier/mime/part.hpp>


namespace courier::mime
{


/**
Text content of a message.
**/
struct body_text
{
    std::string plain_text;
    std::optional<std::string> html_text;
};


/**
Decoding the RFC 2047 encoded words of a header value into a display string.

Segments may mix charsets and encodings. Malformed words stay literal and undecodable bytes are dropped, so
the call never fails. Plain ASCII comes back unchanged.
**/
[[nodiscard]] inline std::string decode_header_value(std::string_view raw)
{
    if (raw.empty())
        return {};
    q_codec qc(static_cast<std::string::size_type>(codec::line_len_policy_t::NONE),
        static_cast<std::string::size_type>(codec::line_len_policy_t::NONE));
    return qc.check_decode(raw);
}


[[nodiscard]] inline std::string decode_header_value(const char* raw)
{
    return decode_header_value(std::string_view(raw));
}


[[nodiscard]] inline std::string decode_header_value(const std::optional<std::string>& raw)
{
    return raw.has_value() ? decode_header_value(std::string_view(*raw)) : std::string();
}


namespace detail_body
{
    inline void collect(const part& node, std::vector<std::string>& plain, std::optional<std::string>& html)
    {
        if (node.is_attachment())
            return;
        if (node.is_multipart())
        {
            for (const auto& child : node.parts())
                collect(child, plain, html);
            return;
        }
        if (node.media_type() == "text/plain")
            plain.push_back(node.text());
        else if (node.media_type() == "text/html")
            html = node.text();
    }
}


/**
Extracting the plain text and HTML bodies of a parsed message.

For a multipart message the parts are walked depth first, attachment parts (and everything below them) are
skipped, the `text/plain` leaves are joined with a line feed and the last `text/html` leaf wins. A single part
message is taken as plain text whatever its type.
**/
[[nodiscard]] inline body_text extract_body(const part& message)
{
    body_text result;
    if (!message.is_multipart())
    {
        result.plain_text = boost::algorithm::trim_copy(message.text());
        return result;
    }

    std::vector<std::string> plain;
    detail_body::collect(message, plain, result.html_text);
    result.plain_text = boost::algorithm::trim_copy(boost::algorithm::join(plain, "\n"));
    return result;
}


[[nodiscard]] inline body_text extract_body(std::string_view raw_message)
{
    return extract_body(part::parse(raw_message));
}


} // namespace courier::mime
