/*

test_codec.cpp
--------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE codec_test

#include <string>
#include <boost/test/unit_test.hpp>
#include <courier/codec/base64.hpp>
#include <courier/codec/charset.hpp>
#include <courier/codec/q_codec.hpp>
#include <courier/codec/quoted_printable.hpp>


using courier::base64;
using courier::codec;
using courier::codec_error;
using courier::q_codec;
using courier::quoted_printable;


namespace
{
    constexpr auto NONE = static_cast<std::string::size_type>(codec::line_len_policy_t::NONE);
}


BOOST_AUTO_TEST_CASE(base64_encode_line)
{
    BOOST_TEST(base64::encode_line("hello") == "aGVsbG8=");
    BOOST_TEST(base64::encode_line(std::string("\0user\0pass", 10)) == "AHVzZXIAcGFzcw==");
}

BOOST_AUTO_TEST_CASE(base64_decode_skips_line_breaks)
{
    base64 b64(NONE, NONE);
    BOOST_TEST(b64.decode("aGVs\r\nbG8=") == "hello");
    BOOST_TEST(b64.decode("aGVsbG8") == "hello");
}

BOOST_AUTO_TEST_CASE(base64_decode_rejects_garbage)
{
    base64 b64(NONE, NONE);
    BOOST_CHECK_THROW(b64.decode("aGV!bG8="), codec_error);
    BOOST_CHECK_THROW(b64.decode("aGVsb"), codec_error);
}

BOOST_AUTO_TEST_CASE(quoted_printable_decode)
{
    quoted_printable qp(NONE, NONE);
    BOOST_TEST(qp.decode("caf=C3=A9=\r\nbar") == "caf\xC3\xA9" "bar");
    BOOST_TEST(qp.decode("a=3Db") == "a=b");
    BOOST_TEST(qp.decode("under_score") == "under_score");
}

BOOST_AUTO_TEST_CASE(quoted_printable_q_mode)
{
    quoted_printable qp(NONE, NONE);
    qp.q_codec_mode(true);
    BOOST_TEST(qp.decode("Hello_World=21") == "Hello World!");
    BOOST_CHECK_THROW(qp.decode("bad=ZZ"), codec_error);
}

BOOST_AUTO_TEST_CASE(q_codec_decode_words)
{
    q_codec qc(NONE, NONE);
    BOOST_TEST(qc.check_decode("=?UTF-8?B?w6l0w6k=?=") == "\xC3\xA9t\xC3\xA9");
    BOOST_TEST(qc.check_decode("=?ISO-8859-1?Q?caf=E9?=") == "caf\xC3\xA9");
    BOOST_TEST(qc.check_decode("Hello =?utf-8?q?W=C3=B6rld?=!") == "Hello W\xC3\xB6rld!");
}

BOOST_AUTO_TEST_CASE(q_codec_joins_adjacent_words)
{
    q_codec qc(NONE, NONE);
    BOOST_TEST(qc.check_decode("=?UTF-8?Q?a?= =?UTF-8?Q?b?=") == "ab");
    BOOST_TEST(qc.check_decode("=?UTF-8?Q?a?= x =?UTF-8?Q?b?=") == "a x b");
}

BOOST_AUTO_TEST_CASE(q_codec_keeps_malformed_words)
{
    q_codec qc(NONE, NONE);
    BOOST_TEST(qc.check_decode("=?UTF-8?X?abc?=") == "=?UTF-8?X?abc?=");
    BOOST_TEST(qc.check_decode("plain subject") == "plain subject");
    BOOST_TEST(qc.check_decode("=?broken") == "=?broken");
}

BOOST_AUTO_TEST_CASE(q_codec_encode_base64)
{
    q_codec qc(static_cast<std::string::size_type>(codec::line_len_policy_t::RECOMMENDED),
        static_cast<std::string::size_type>(codec::line_len_policy_t::RECOMMENDED));
    const auto words = qc.encode("\xC3\xA9t\xC3\xA9", codec::CHARSET_UTF8, q_codec::method_t::BASE64);
    BOOST_REQUIRE(words.size() == 1u);
    BOOST_TEST(words.front() == "=?UTF-8?B?w6l0w6k=?=");
}

BOOST_AUTO_TEST_CASE(charset_conversion)
{
    BOOST_TEST(courier::charset::to_utf8("caf\xE9", "ISO-8859-1") == "caf\xC3\xA9");
    BOOST_TEST(courier::charset::to_utf8("\x80", "windows-1252") == "\xE2\x82\xAC");
    BOOST_TEST(courier::charset::to_utf8("plain", "koi8-r") == "plain");
    BOOST_TEST(courier::charset::to_utf8("caf\xC3\xA9", "utf-8*en") == "caf\xC3\xA9");
}

BOOST_AUTO_TEST_CASE(single_byte_cyrillic_and_central_european)
{
    // Russian words in KOI8-R and Windows-1251, Polish in ISO-8859-2
    BOOST_TEST(courier::charset::to_utf8("\xF0\xD2\xC9\xD7\xC5\xD4", "KOI8-R") ==
        "\xD0\x9F\xD1\x80\xD0\xB8\xD0\xB2\xD0\xB5\xD1\x82");
    BOOST_TEST(courier::charset::to_utf8("\xCC\xE8\xF0", "windows-1251") == "\xD0\x9C\xD0\xB8\xD1\x80");
    BOOST_TEST(courier::charset::to_utf8("Zam\xF3wienie \xB1", "iso-8859-2") == "Zam\xC3\xB3wienie \xC4\x85");
}

BOOST_AUTO_TEST_CASE(multi_byte_charsets)
{
    // Japanese in Shift_JIS, Chinese in GB2312
    BOOST_TEST(courier::charset::to_utf8("\x93\xFA\x96\x7B", "Shift_JIS") == "\xE6\x97\xA5\xE6\x9C\xAC");
    BOOST_TEST(courier::charset::to_utf8("\xD6\xD0\xCE\xC4", "GB2312") == "\xE4\xB8\xAD\xE6\x96\x87");
}

BOOST_AUTO_TEST_CASE(unknown_charset_reads_as_utf8)
{
    BOOST_TEST(courier::charset::to_utf8("caf\xC3\xA9\xFF", "x-no-such-charset") == "caf\xC3\xA9");
}

BOOST_AUTO_TEST_CASE(sanitize_drops_malformed_utf8)
{
    BOOST_TEST(courier::charset::sanitize_utf8("a\xFF" "b") == "ab");
    BOOST_TEST(courier::charset::sanitize_utf8("\xC3") == "");
    BOOST_TEST(courier::charset::sanitize_utf8("\xC0\xAF") == "");
    BOOST_TEST(courier::charset::sanitize_utf8("\xE2\x82\xAC") == "\xE2\x82\xAC");
}
