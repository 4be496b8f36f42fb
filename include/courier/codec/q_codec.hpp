/*

q_codec.hpp
-----------

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
#include <courier/codec/base64.hpp>
#include <courier/codec/charset.hpp>
#include <courier/codec/codec.hpp>
#include <courier/codec/quoted_printable.hpp>


namespace courier
{


/**
Q codec, handles RFC 2047 encoded words (`=?charset?B|Q?text?=`) in header values.
**/
class q_codec : public codec
{
public:

    enum class method_t {BASE64, QUOTED_PRINTABLE};

    /**
    One decoded encoded word.
    **/
    struct word_t
    {
        std::string text;
        std::string charset;
        method_t method;
    };

    /**
    Setting the encoder line policies.

    @param line1_policy First line policy to set.
    @param lines_policy Other lines policy than the first one to set.
    **/
    q_codec(std::string::size_type line1_policy, std::string::size_type lines_policy)
        : codec(line1_policy, lines_policy)
    {
    }

    /**
    Encoding a text into encoded words, one per line policy chunk.

    @param text    UTF-8 text to encode.
    @param charset Charset label written into each word.
    @param method  Base64 or Quoted Printable.
    @return        Encoded words, to be joined by folding whitespace.
    **/
    [[nodiscard]] std::vector<std::string> encode(std::string_view text, const std::string& charset, method_t method) const
    {
        const std::string prefix = "=?" + boost::to_upper_copy(charset) + "?" +
            (method == method_t::BASE64 ? BASE64_CODEC_STR : QP_CODEC_STR) + "?";
        const std::string::size_type overhead = prefix.size() + 2;
        const std::string::size_type line1 = line1_policy_ > overhead + 4 ? line1_policy_ - overhead : 4;
        const std::string::size_type lines = lines_policy_ > overhead + 4 ? lines_policy_ - overhead : 4;

        std::vector<std::string> chunks;
        if (method == method_t::BASE64)
        {
            // Split on code point boundaries so that each word decodes on its own.
            std::string::size_type policy = line1;
            std::string::size_type start = 0;
            while (start < text.size())
            {
                const std::string::size_type max_bytes = policy / 4 * 3;
                std::string::size_type end = std::min(text.size(), start + max_bytes);
                while (end < text.size() && end > start + 1 && (static_cast<unsigned char>(text[end]) & 0xC0) == 0x80)
                    --end;
                chunks.push_back(base64::encode_line(text.substr(start, end - start)));
                start = end;
                policy = lines;
            }
        }
        else
        {
            quoted_printable qp(line1, lines);
            qp.q_codec_mode(true);
            chunks = qp.encode(text);
        }

        std::vector<std::string> enc_text;
        for (const auto& chunk : chunks)
            enc_text.push_back(prefix + chunk + "?=");
        return enc_text;
    }

    /**
    Decoding a single encoded word without its `=?` and `?=` delimiters.

    @param text        Word content, `charset?method?text`.
    @return            Decoded bytes in the declared charset.
    @throw codec_error Missing separator, empty charset or bad encoding method.
    @throw codec_error Bad Base64 or Quoted Printable text.
    **/
    [[nodiscard]] word_t decode(std::string_view text) const
    {
        const auto method_pos = text.find(QUESTION_MARK_CHAR);
        if (method_pos == std::string_view::npos)
            throw codec_error("Missing Q codec separator for codec type.");
        std::string charset(text.substr(0, method_pos));
        if (charset.empty())
            throw codec_error("Missing Q codec charset.");
        const auto content_pos = text.find(QUESTION_MARK_CHAR, method_pos + 1);
        if (content_pos == std::string_view::npos)
            throw codec_error("Missing last Q codec separator.");
        const std::string_view method = text.substr(method_pos + 1, content_pos - method_pos - 1);
        const std::string_view content = text.substr(content_pos + 1);

        if (boost::iequals(method, BASE64_CODEC_STR))
        {
            base64 b64(static_cast<std::string::size_type>(line_len_policy_t::NONE),
                static_cast<std::string::size_type>(line_len_policy_t::NONE));
            return word_t{b64.decode(content), std::move(charset), method_t::BASE64};
        }
        if (boost::iequals(method, QP_CODEC_STR))
        {
            quoted_printable qp(static_cast<std::string::size_type>(line_len_policy_t::NONE),
                static_cast<std::string::size_type>(line_len_policy_t::NONE));
            qp.q_codec_mode(true);
            return word_t{qp.decode(content), std::move(charset), method_t::QUOTED_PRINTABLE};
        }
        throw codec_error("Bad encoding method.");
    }

    /**
    Decoding every encoded word of a header value into UTF-8 and keeping the text around them.

    Whitespace between two adjacent encoded words is dropped. A malformed word is kept as literal text, the
    text outside of words is sanitized as UTF-8.

    @param text Header value.
    @return     Decoded UTF-8 text.
    **/
    [[nodiscard]] std::string check_decode(std::string_view text) const
    {
        std::string dec_text;
        bool after_word = false;
        std::string::size_type pos = 0;

        while (pos < text.size())
        {
            const auto start = text.find("=?", pos);
            if (start == std::string_view::npos)
            {
                dec_text += charset::sanitize_utf8(text.substr(pos));
                break;
            }

            const std::string_view gap = text.substr(pos, start - pos);
            std::optional<std::string> decoded;
            const auto word_end = find_word(text, start);
            if (word_end.has_value())
            {
                try
                {
                    auto word = decode(text.substr(start + 2, *word_end - start - 2));
                    decoded = charset::to_utf8(word.text, word.charset);
                }
                catch (const codec_error&)
                {
                    decoded.reset();
                }
            }

            if (!(decoded.has_value() && after_word && is_linear_whitespace(gap)))
                dec_text += charset::sanitize_utf8(gap);

            if (decoded.has_value())
            {
                dec_text += *decoded;
                after_word = true;
                pos = *word_end + 2;
            }
            else
            {
                dec_text += "=?";
                after_word = false;
                pos = start + 2;
            }
        }
        return dec_text;
    }

private:

    /**
    String representation of Base64 method.
    **/
    inline static const std::string BASE64_CODEC_STR{"B"};

    /**
    String representation of Quoted Printable method.
    **/
    inline static const std::string QP_CODEC_STR{"Q"};

    /**
    Finding the position of the closing `?=` of the word starting at `start`, the word holds three question marks
    besides its delimiters.
    **/
    static std::optional<std::string::size_type> find_word(std::string_view text, std::string::size_type start)
    {
        const auto charset_end = text.find(QUESTION_MARK_CHAR, start + 2);
        if (charset_end == std::string_view::npos)
            return std::nullopt;
        const auto method_end = text.find(QUESTION_MARK_CHAR, charset_end + 1);
        if (method_end == std::string_view::npos)
            return std::nullopt;
        const auto end = text.find("?=", method_end + 1);
        if (end == std::string_view::npos)
            return std::nullopt;
        // Encoded words never contain whitespace.
        const auto inner = text.substr(start, end - start);
        if (inner.find_first_of(" \t\r\n") != std::string_view::npos)
            return std::nullopt;
        return end;
    }

    static bool is_linear_whitespace(std::string_view text)
    {
        return text.find_first_not_of(" \t\r\n") == std::string_view::npos;
    }
};


} // namespace courier
