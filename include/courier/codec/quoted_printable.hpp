/*

quoted_printable.hpp
--------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <courier/codec/codec.hpp>


namespace courier
{


/**
Quoted Printable codec.

In Q codec mode (RFC 2047 encoded words) the underscore stands for a space, there are no soft line breaks and a
malformed escape is an error. In body mode a malformed escape is kept as literal text.
**/
class quoted_printable : public codec
{
public:

    /**
    Setting the encoder line policies.

    @param line1_policy First line policy to set.
    @param lines_policy Other lines policy than the first one to set.
    **/
    quoted_printable(std::string::size_type line1_policy, std::string::size_type lines_policy)
        : codec(line1_policy, lines_policy), q_codec_mode_(false)
    {
    }

    /**
    Encoding a body into quoted printable lines by applying the line policy.

    Line breaks of the input (CRLF or bare LF) become hard breaks, long lines get soft breaks.

    @param text String to encode.
    @return     Encoded lines, without line terminators.
    **/
    [[nodiscard]] std::vector<std::string> encode(std::string_view text) const
    {
        std::vector<std::string> enc_text;
        std::string line;
        std::string::size_type policy = line1_policy_;

        auto soft_break = [&enc_text, &line, &policy, this]()
        {
            if (!q_codec_mode_)
                line += EQUAL_CHAR;
            enc_text.push_back(line);
            line.clear();
            policy = lines_policy_;
        };

        auto append_token = [&](std::string_view token)
        {
            // One position is reserved for the soft break marker.
            if (line.size() + token.size() + 1 > policy && !line.empty())
                soft_break();
            line.append(token);
        };

        for (std::string::size_type i = 0; i < text.size(); ++i)
        {
            const char ch = text[i];
            if (ch == CR_CHAR && i + 1 < text.size() && text[i + 1] == LF_CHAR)
                continue;
            if (ch == LF_CHAR)
            {
                enc_text.push_back(line);
                line.clear();
                policy = lines_policy_;
                continue;
            }

            const bool at_line_end = i + 1 == text.size() || text[i + 1] == LF_CHAR ||
                (text[i + 1] == CR_CHAR && i + 2 < text.size() && text[i + 2] == LF_CHAR);
            if (q_codec_mode_ && ch == SPACE_CHAR)
                append_token(std::string(1, UNDERSCORE_CHAR));
            else if (is_literal(ch) || (!q_codec_mode_ && (ch == SPACE_CHAR || ch == '\t') && !at_line_end))
                append_token(std::string_view(&ch, 1));
            else
                append_token(escape(ch));
        }
        if (!line.empty())
            enc_text.push_back(line);

        return enc_text;
    }

    /**
    Decoding quoted printable text. Soft line breaks are removed, hard line breaks are kept as they are.

    @param text        Encoded text.
    @return            Decoded bytes.
    @throw codec_error Bad escape sequence, only in Q codec mode.
    **/
    [[nodiscard]] std::string decode(std::string_view text) const
    {
        std::string dec_text;
        dec_text.reserve(text.size());
        for (std::string::size_type i = 0; i < text.size(); ++i)
        {
            const char ch = text[i];
            if (ch == EQUAL_CHAR)
            {
                if (!q_codec_mode_)
                {
                    // Soft break, transport padding before the line end is tolerated.
                    std::string::size_type j = i + 1;
                    while (j < text.size() && (text[j] == SPACE_CHAR || text[j] == '\t'))
                        ++j;
                    if (j < text.size() && text[j] == LF_CHAR)
                    {
                        i = j;
                        continue;
                    }
                    if (j + 1 < text.size() && text[j] == CR_CHAR && text[j + 1] == LF_CHAR)
                    {
                        i = j + 1;
                        continue;
                    }
                    if (j == text.size())
                        break;
                }

                const int high = i + 2 < text.size() ? hex_value(text[i + 1]) : -1;
                const int low = i + 2 < text.size() ? hex_value(text[i + 2]) : -1;
                if (high >= 0 && low >= 0)
                {
                    dec_text += static_cast<char>((high << 4) | low);
                    i += 2;
                    continue;
                }
                if (q_codec_mode_)
                    throw codec_error("Bad hexadecimal digit.");
                dec_text += ch;
            }
            else if (q_codec_mode_ && ch == UNDERSCORE_CHAR)
                dec_text += SPACE_CHAR;
            else
                dec_text += ch;
        }
        return dec_text;
    }

    /**
    Setting Q codec mode.

    @param mode True to set, false to unset.
    **/
    void q_codec_mode(bool mode)
    {
        q_codec_mode_ = mode;
    }

private:

    [[nodiscard]] bool is_literal(char ch) const
    {
        if (ch <= SPACE_CHAR || ch > TILDE_CHAR || ch == EQUAL_CHAR)
            return false;
        if (q_codec_mode_)
            return ch != QUESTION_MARK_CHAR && ch != UNDERSCORE_CHAR;
        return true;
    }

    static std::string escape(char ch)
    {
        const auto byte = static_cast<unsigned char>(ch);
        std::string out(1, EQUAL_CHAR);
        out += HEX_DIGITS[(byte >> 4) & 0x0F];
        out += HEX_DIGITS[byte & 0x0F];
        return out;
    }

    /**
    Flag for the Q codec mode.
    **/
    bool q_codec_mode_;
};


} // namespace courier
