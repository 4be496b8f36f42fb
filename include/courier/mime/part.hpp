/*

part.hpp
--------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <boost/algorithm/string.hpp>
#include <courier/codec/base64.hpp>
#include <courier/codec/charset.hpp>
#include <courier/codec/codec.hpp>
#include <courier/codec/quoted_printable.hpp>
#include <courier/detail/ascii.hpp>


namespace courier::mime
{


struct header_field
{
    std::string name;
    std::string value;
};


/**
One node of a parsed message: its headers and either a body or child parts.

Parsing is lenient and never fails. Input without a header block becomes a single text part, a multipart
without a usable boundary is kept as a single part and a missing closing delimiter ends the last child at
the end of input.
**/
class part
{
public:

    /**
    Nesting deeper than this is kept as an opaque leaf.
    **/
    static constexpr unsigned MAX_DEPTH = 32;

    static part parse(std::string_view raw)
    {
        return parse(raw, 0);
    }

    [[nodiscard]] const std::vector<header_field>& headers() const noexcept
    {
        return headers_;
    }

    /**
    First header with the given name (case insensitive), unfolded and trimmed.
    **/
    [[nodiscard]] std::optional<std::string> header(std::string_view name) const
    {
        for (const auto& field : headers_)
            if (detail::iequals_ascii(field.name, name))
                return field.value;
        return std::nullopt;
    }

    /**
    Lower case `type/subtype`, `text/plain` when the Content-Type header is missing or unusable.
    **/
    [[nodiscard]] const std::string& media_type() const noexcept
    {
        return media_type_;
    }

    /**
    Content-Type parameter by lower case name, empty when absent.
    **/
    [[nodiscard]] std::string param(std::string_view name) const
    {
        for (const auto& [key, value] : params_)
            if (key == name)
                return value;
        return {};
    }

    [[nodiscard]] std::string charset() const
    {
        return param("charset");
    }

    /**
    Lower case Content-Transfer-Encoding, `7bit` when absent.
    **/
    [[nodiscard]] const std::string& transfer_encoding() const noexcept
    {
        return transfer_encoding_;
    }

    [[nodiscard]] bool is_attachment() const
    {
        const auto disposition = header("Content-Disposition");
        return disposition.has_value() && detail::starts_with_ci(detail::trim_view(*disposition), "attachment");
    }

    [[nodiscard]] bool is_multipart() const noexcept
    {
        return !parts_.empty();
    }

    [[nodiscard]] const std::vector<part>& parts() const noexcept
    {
        return parts_;
    }

    /**
    Body exactly as it appears in the message.
    **/
    [[nodiscard]] const std::string& raw_body() const noexcept
    {
        return body_;
    }

    /**
    Body with its transfer encoding undone. Broken Base64 degrades to the raw body.
    **/
    [[nodiscard]] std::string decoded_body() const
    {
        if (transfer_encoding_ == "base64")
        {
            try
            {
                base64 b64(static_cast<std::string::size_type>(codec::line_len_policy_t::NONE),
                    static_cast<std::string::size_type>(codec::line_len_policy_t::NONE));
                return b64.decode(body_);
            }
            catch (const codec_error&)
            {
                return body_;
            }
        }
        if (transfer_encoding_ == "quoted-printable")
        {
            quoted_printable qp(static_cast<std::string::size_type>(codec::line_len_policy_t::NONE),
                static_cast<std::string::size_type>(codec::line_len_policy_t::NONE));
            return qp.decode(body_);
        }
        return body_;
    }

    /**
    Decoded body converted from its declared charset to UTF-8.
    **/
    [[nodiscard]] std::string text() const
    {
        return courier::charset::to_utf8(decoded_body(), charset());
    }

private:

    static part parse(std::string_view raw, unsigned depth)
    {
        part result;
        const std::size_t body_pos = result.parse_headers(raw);
        result.body_ = std::string(raw.substr(body_pos));
        result.parse_content_type();

        if (auto cte = result.header("Content-Transfer-Encoding"))
            result.transfer_encoding_ = detail::to_lower_copy(detail::trim_view(*cte));

        const std::string boundary = result.param("boundary");
        if (depth < MAX_DEPTH && boost::algorithm::starts_with(result.media_type_, "multipart/") && !boundary.empty())
            result.split_parts(boundary, depth);
        return result;
    }

    /**
    Reading the header block, returns the offset of the body.
    **/
    std::size_t parse_headers(std::string_view raw)
    {
        std::size_t pos = 0;
        while (pos < raw.size())
        {
            std::size_t eol = raw.find('\n', pos);
            const std::size_t next = eol == std::string_view::npos ? raw.size() : eol + 1;
            std::string_view line = raw.substr(pos, (eol == std::string_view::npos ? raw.size() : eol) - pos);
            if (!line.empty() && line.back() == '\r')
                line.remove_suffix(1);

            if (line.empty())
                return next;

            if ((line.front() == ' ' || line.front() == '\t') && !headers_.empty())
            {
                auto& value = headers_.back().value;
                const auto folded = detail::trim_view(line);
                if (!folded.empty())
                {
                    if (!value.empty())
                        value += ' ';
                    value.append(folded);
                }
                pos = next;
                continue;
            }

            const auto colon = line.find(':');
            if (colon == std::string_view::npos || colon == 0 || line.substr(0, colon).find(' ') != std::string_view::npos)
                return pos;

            headers_.push_back(header_field{std::string(detail::trim_view(line.substr(0, colon))),
                std::string(detail::trim_view(line.substr(colon + 1)))});
            pos = next;
        }
        return raw.size();
    }

    void parse_content_type()
    {
        const auto value = header("Content-Type");
        if (!value.has_value())
            return;

        const auto fields = split_params(*value);
        if (fields.empty())
            return;
        std::string type = detail::to_lower_copy(detail::trim_view(fields.front()));
        if (type.find('/') != std::string::npos)
            media_type_ = std::move(type);

        for (std::size_t i = 1; i < fields.size(); ++i)
        {
            const auto eq = fields[i].find('=');
            if (eq == std::string::npos)
                continue;
            std::string key = detail::to_lower_copy(detail::trim_view(std::string_view(fields[i]).substr(0, eq)));
            std::string val = unquote(detail::trim_view(std::string_view(fields[i]).substr(eq + 1)));
            params_.emplace_back(std::move(key), std::move(val));
        }
    }

    /**
    Splitting a header value on semicolons that are not inside a quoted string.
    **/
    static std::vector<std::string> split_params(std::string_view value)
    {
        std::vector<std::string> fields(1);
        bool quoted = false;
        for (std::size_t i = 0; i < value.size(); ++i)
        {
            const char ch = value[i];
            if (ch == '"')
                quoted = !quoted;
            else if (ch == '\\' && quoted && i + 1 < value.size())
            {
                fields.back() += ch;
                fields.back() += value[++i];
                continue;
            }
            if (ch == ';' && !quoted)
            {
                fields.emplace_back();
                continue;
            }
            fields.back() += ch;
        }
        return fields;
    }

    static std::string unquote(std::string_view value)
    {
        if (value.size() < 2 || value.front() != '"' || value.back() != '"')
            return std::string(value);
        std::string out;
        for (std::size_t i = 1; i + 1 < value.size(); ++i)
        {
            if (value[i] == '\\' && i + 2 < value.size())
                ++i;
            out += value[i];
        }
        return out;
    }

    /**
    Cutting the body at the boundary delimiter lines. The line break before a delimiter belongs to it.
    **/
    void split_parts(const std::string& boundary, unsigned depth)
    {
        const std::string delimiter = "--" + boundary;
        std::string_view body(body_);
        std::vector<std::string_view> chunks;
        std::optional<std::size_t> chunk_start;
        std::size_t pos = 0;

        while (pos < body.size())
        {
            const std::size_t eol = body.find('\n', pos);
            const std::size_t line_end = eol == std::string_view::npos ? body.size() : eol;
            const std::size_t next = eol == std::string_view::npos ? body.size() : eol + 1;
            std::string_view line = body.substr(pos, line_end - pos);
            while (!line.empty() && (line.back() == '\r' || line.back() == ' ' || line.back() == '\t'))
                line.remove_suffix(1);

            if (boost::algorithm::starts_with(line, delimiter))
            {
                const std::string_view rest = line.substr(delimiter.size());
                const bool closing = rest == "--";
                if (rest.empty() || closing)
                {
                    if (chunk_start.has_value())
                        chunks.push_back(trim_delimiter_break(body.substr(*chunk_start, pos - *chunk_start)));
                    chunk_start.reset();
                    if (closing)
                        break;
                    chunk_start = next;
                }
            }
            pos = next;
        }
        if (chunk_start.has_value() && *chunk_start <= body.size())
            chunks.push_back(body.substr(*chunk_start));

        for (auto chunk : chunks)
            parts_.push_back(parse(chunk, depth + 1));
    }

    static std::string_view trim_delimiter_break(std::string_view chunk)
    {
        if (!chunk.empty() && chunk.back() == '\n')
            chunk.remove_suffix(1);
        if (!chunk.empty() && chunk.back() == '\r')
            chunk.remove_suffix(1);
        return chunk;
    }

    std::vector<header_field> headers_;
    std::vector<std::pair<std::string, std::string>> params_;
    std::string media_type_{"text/plain"};
    std::string transfer_encoding_{"7bit"};
    std::string body_;
    std::vector<part> parts_;
};


} // namespace courier::mime
