/*

codec.hpp
---------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <climits>
#include <stdexcept>
#include <string>


namespace courier
{


/**
Error raised while decoding malformed text. It never leaves the library: the header and body decoders catch it and
keep the input as literal text.
**/
class codec_error : public std::runtime_error
{
public:

    explicit codec_error(const std::string& msg) : std::runtime_error(msg)
    {
    }
};


/**
Base of the transfer codecs, holding the line length limits they wrap their output at.
**/
class codec
{
public:

    /**
    Line length policy.
    **/
    enum class line_len_policy_t : std::string::size_type {RECOMMENDED = 78, MANDATORY = 998, NONE = UINT_MAX};

    inline static const std::string CHARSET_UTF8{"UTF-8"};

    inline static const std::string HEX_DIGITS{"0123456789ABCDEF"};

    /**
    Value of a hexadecimal digit of either case, -1 for any other character.
    **/
    static constexpr int hex_value(char ch) noexcept
    {
        if (ch >= '0' && ch <= '9')
            return ch - '0';
        if (ch >= 'A' && ch <= 'F')
            return ch - 'A' + 10;
        if (ch >= 'a' && ch <= 'f')
            return ch - 'a' + 10;
        return -1;
    }

    /**
    @param line1_policy Length limit of the first encoded line, which may follow a header name.
    @param lines_policy Length limit of the other lines.
    **/
    codec(std::string::size_type line1_policy, std::string::size_type lines_policy)
        : line1_policy_(line1_policy), lines_policy_(lines_policy)
    {
    }

    codec(const codec&) = delete;

    codec(codec&&) = delete;

    virtual ~codec() = default;

    void operator=(const codec&) = delete;

    void operator=(codec&&) = delete;

protected:

    static constexpr char CR_CHAR = '\r';
    static constexpr char LF_CHAR = '\n';
    static constexpr char EQUAL_CHAR = '=';
    static constexpr char SPACE_CHAR = ' ';
    static constexpr char QUESTION_MARK_CHAR = '?';
    static constexpr char UNDERSCORE_CHAR = '_';
    static constexpr char TILDE_CHAR = '~';

    std::string::size_type line1_policy_;

    std::string::size_type lines_policy_;
};


} // namespace courier
