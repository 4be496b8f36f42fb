/*

charset.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <boost/algorithm/string.hpp>
#include <boost/locale/encoding.hpp>

#include <courier/detail/log.hpp>


namespace courier::charset
{


/**
Keeping the well formed UTF-8 sequences of `bytes` and dropping everything else.

Overlong forms, surrogates and code points above U+10FFFF count as malformed.
**/
[[nodiscard]] inline std::string sanitize_utf8(std::string_view bytes)
{
    std::string out;
    out.reserve(bytes.size());
    std::size_t i = 0;
    while (i < bytes.size())
    {
        const auto lead = static_cast<unsigned char>(bytes[i]);
        if (lead < 0x80)
        {
            out += static_cast<char>(lead);
            ++i;
            continue;
        }

        std::size_t len = 0;
        std::uint32_t cp = 0;
        std::uint32_t min_cp = 0;
        if ((lead & 0xE0) == 0xC0)
        {
            len = 2;
            cp = lead & 0x1F;
            min_cp = 0x80;
        }
        else if ((lead & 0xF0) == 0xE0)
        {
            len = 3;
            cp = lead & 0x0F;
            min_cp = 0x800;
        }
        else if ((lead & 0xF8) == 0xF0)
        {
            len = 4;
            cp = lead & 0x07;
            min_cp = 0x10000;
        }
        else
        {
            ++i;
            continue;
        }

        std::size_t k = 1;
        for (; k < len && i + k < bytes.size(); ++k)
        {
            const auto cont = static_cast<unsigned char>(bytes[i + k]);
            if ((cont & 0xC0) != 0x80)
                break;
            cp = (cp << 6) | (cont & 0x3F);
        }
        if (k < len)
        {
            // Drop the broken prefix and resynchronize on the byte that interrupted it.
            i += k;
            continue;
        }
        if (cp >= min_cp && cp <= 0x10FFFF && (cp < 0xD800 || cp > 0xDFFF))
            out.append(bytes.data() + i, len);
        i += len;
    }
    return out;
}


/**
Converting text in the given charset to UTF-8.

Any charset known to Boost.Locale is converted, bytes without a mapping are skipped. UTF-8, US-ASCII, an empty
label and a label the converter does not know are read as permissive UTF-8. RFC 2231 language suffixes
(`utf-8*en`) are ignored.

@param bytes   Text to convert.
@param charset Charset label, case insensitive.
@return        UTF-8 text.
**/
[[nodiscard]] inline std::string to_utf8(std::string_view bytes, std::string_view charset)
{
    std::string label(charset.substr(0, charset.find('*')));
    boost::algorithm::trim(label);
    boost::algorithm::to_lower(label);
    if (label.empty() || label == "utf-8" || label == "utf8" || label == "us-ascii" || label == "ascii")
        return sanitize_utf8(bytes);

    try
    {
        return boost::locale::conv::to_utf<char>(bytes.data(), bytes.data() + bytes.size(), label,
            boost::locale::conv::skip);
    }
    catch (const boost::locale::conv::invalid_charset_error&)
    {
        COURIER_DEBUG("Unknown charset " + label + ", text read as UTF-8");
        return sanitize_utf8(bytes);
    }
}


} // namespace courier::charset
