/*

base64.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>
#include <courier/codec/codec.hpp>


namespace courier
{


/**
Base64 codec.
**/
class base64 : public codec
{
public:

    /**
    Base64 character set.
    **/
    inline static const std::string CHARSET{"ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/"};

    /**
    Setting the encoder line policies.

    Base64 encodes three characters into four, so the policies are rounded down to a multiple of four. Mail
    clients do not merge encoded lines properly otherwise.

    @param line1_policy First line policy to set.
    @param lines_policy Other lines policy than the first one to set.
    **/
    base64(std::string::size_type line1_policy, std::string::size_type lines_policy)
        : codec(line1_policy, lines_policy)
    {
        line1_policy_ -= line1_policy_ % SEXTETS_NO;
        lines_policy_ -= lines_policy_ % SEXTETS_NO;
    }

    /**
    Encoding a string into Base64 lines by applying the line policy.

    @param text String to encode.
    @return     Encoded lines, without line terminators.
    **/
    [[nodiscard]] std::vector<std::string> encode(std::string_view text) const
    {
        std::vector<std::string> enc_text;
        std::string line;
        std::string::size_type policy = line1_policy_;

        auto flush_line = [&enc_text, &line, &policy, this]()
        {
            enc_text.push_back(line);
            line.clear();
            policy = lines_policy_;
        };

        std::string::size_type pos = 0;
        while (pos < text.size())
        {
            const std::size_t chunk = std::min<std::size_t>(OCTETS_NO, text.size() - pos);
            unsigned char octets[OCTETS_NO] = {0, 0, 0};
            for (std::size_t i = 0; i < chunk; ++i)
                octets[i] = static_cast<unsigned char>(text[pos + i]);
            pos += chunk;

            const unsigned char sextets[SEXTETS_NO] = {
                static_cast<unsigned char>((octets[0] & 0xfc) >> 2),
                static_cast<unsigned char>(((octets[0] & 0x03) << 4) + ((octets[1] & 0xf0) >> 4)),
                static_cast<unsigned char>(((octets[1] & 0x0f) << 2) + ((octets[2] & 0xc0) >> 6)),
                static_cast<unsigned char>(octets[2] & 0x3f)};

            if (line.size() + SEXTETS_NO > policy && !line.empty())
                flush_line();
            for (std::size_t i = 0; i < SEXTETS_NO; ++i)
                line += i <= chunk ? CHARSET[sextets[i]] : EQUAL_CHAR;
        }

        if (!line.empty())
            enc_text.push_back(line);
        return enc_text;
    }

    /**
    Encoding into a single unbroken line, as used by SASL and encoded words.
    **/
    [[nodiscard]] static std::string encode_line(std::string_view text)
    {
        base64 b64(static_cast<std::string::size_type>(line_len_policy_t::NONE),
            static_cast<std::string::size_type>(line_len_policy_t::NONE));
        std::string out;
        for (const auto& line : b64.encode(text))
            out += line;
        return out;
    }

    /**
    Decoding Base64 text. Whitespace and line breaks are skipped, decoding stops at the first padding character.

    @param text        Base64 encoded text.
    @return            Decoded bytes.
    @throw codec_error Bad character.
    **/
    [[nodiscard]] std::string decode(std::string_view text) const
    {
        std::string dec_text;
        unsigned char sextets[SEXTETS_NO];
        int count_4_chars = 0;

        for (char ch : text)
        {
            if (ch == EQUAL_CHAR)
                break;
            if (std::isspace(static_cast<unsigned char>(ch)))
                continue;
            if (!is_allowed(ch))
                throw codec_error("Bad character `" + std::string(1, ch) + "`.");

            sextets[count_4_chars++] = static_cast<unsigned char>(CHARSET.find(ch));
            if (count_4_chars == SEXTETS_NO)
            {
                append_octets(sextets, OCTETS_NO, dec_text);
                count_4_chars = 0;
            }
        }

        if (count_4_chars == 1)
            throw codec_error("Truncated base64 quantum.");
        if (count_4_chars > 1)
        {
            for (int i = count_4_chars; i < SEXTETS_NO; i++)
                sextets[i] = 0;
            append_octets(sextets, static_cast<std::size_t>(count_4_chars - 1), dec_text);
        }

        return dec_text;
    }

private:

    static void append_octets(const unsigned char* sextets, std::size_t count, std::string& out)
    {
        const char octets[OCTETS_NO] = {
            static_cast<char>((sextets[0] << 2) + ((sextets[1] & 0x30) >> 4)),
            static_cast<char>(((sextets[1] & 0xf) << 4) + ((sextets[2] & 0x3c) >> 2)),
            static_cast<char>(((sextets[2] & 0x3) << 6) + sextets[3])};
        out.append(octets, count);
    }

    /**
    Checking if the given character is in the base64 character set.
    **/
    static bool is_allowed(char ch)
    {
        return CHARSET.find(ch) != std::string::npos;
    }

    /**
    Number of six bit chunks.
    **/
    static constexpr unsigned short SEXTETS_NO = 4;

    /**
    Number of eight bit characters.
    **/
    static constexpr unsigned short OCTETS_NO = SEXTETS_NO - 1;
};


} // namespace courier
