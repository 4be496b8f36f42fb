/*

test_composer.cpp
-----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE composer_test

#include <chrono>
#include <string>
#include <boost/test/unit_test.hpp>
#include <courier/mime/body.hpp>
#include <courier/mime/composer.hpp>
#include <courier/mime/part.hpp>
#include <courier/service/messages.hpp>


using courier::errc;
using courier::outbound_message;
namespace mime = courier::mime;


namespace
{
    outbound_message simple_message()
    {
        outbound_message msg;
        msg.subject = "Status";
        msg.body = "All good.\nSee you.";
        msg.to = {"Alice <alice@example.com>"};
        return msg;
    }
}


BOOST_AUTO_TEST_CASE(envelope_addresses)
{
    BOOST_TEST(mime::envelope_address("Alice <alice@example.com>") == "alice@example.com");
    BOOST_TEST(mime::envelope_address("  bob@example.com ") == "bob@example.com");
    BOOST_TEST(mime::envelope_address("\"Doe, John\" < john@example.com >") == "john@example.com");
}

BOOST_AUTO_TEST_CASE(envelope_recipients_order)
{
    outbound_message msg = simple_message();
    msg.cc = {"carol@example.com"};
    msg.bcc = {"Dave <dave@example.com>"};
    const auto recipients = mime::envelope_recipients(msg);
    BOOST_REQUIRE(recipients.size() == 3u);
    BOOST_TEST(recipients[0] == "alice@example.com");
    BOOST_TEST(recipients[1] == "carol@example.com");
    BOOST_TEST(recipients[2] == "dave@example.com");
}

BOOST_AUTO_TEST_CASE(plain_message_headers)
{
    outbound_message msg = simple_message();
    msg.cc = {"carol@example.com"};
    msg.bcc = {"hidden@example.com"};
    msg.reply_to = "visitor@example.org";

    auto text = mime::compose(msg, "Sender <sender@example.com>");
    BOOST_REQUIRE(text);
    const auto parsed = mime::part::parse(*text);
    BOOST_TEST(parsed.header("From").value_or("") == "Sender <sender@example.com>");
    BOOST_TEST(parsed.header("To").value_or("") == "Alice <alice@example.com>");
    BOOST_TEST(parsed.header("Cc").value_or("") == "carol@example.com");
    BOOST_TEST(parsed.header("Reply-To").value_or("") == "visitor@example.org");
    BOOST_TEST(parsed.header("Subject").value_or("") == "Status");
    BOOST_TEST(parsed.header("MIME-Version").value_or("") == "1.0");
    BOOST_TEST(parsed.header("Message-ID").value_or("").find("@example.com>") != std::string::npos);
    BOOST_TEST(parsed.header("Date").has_value());
    BOOST_TEST(!parsed.header("Bcc").has_value());
    BOOST_TEST(text->find("hidden@example.com") == std::string::npos);
    BOOST_TEST(parsed.media_type() == "text/plain");
    BOOST_TEST(parsed.charset() == "utf-8");
    BOOST_TEST(parsed.transfer_encoding() == "7bit");
    BOOST_TEST(text->find("All good.\r\nSee you.\r\n") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(non_ascii_subject_and_body)
{
    outbound_message msg = simple_message();
    msg.subject = "R\xC3\xA9union";
    msg.body = "Caf\xC3\xA9 \xC3\xA0 10h";

    auto text = mime::compose(msg, "sender@example.com");
    BOOST_REQUIRE(text);
    BOOST_TEST(text->find("Subject: =?UTF-8?B?") != std::string::npos);

    const auto parsed = mime::part::parse(*text);
    BOOST_TEST(parsed.transfer_encoding() == "quoted-printable");
    BOOST_TEST(mime::decode_header_value(parsed.header("Subject")) == "R\xC3\xA9union");
    BOOST_TEST(mime::extract_body(parsed).plain_text == "Caf\xC3\xA9 \xC3\xA0 10h");
}

BOOST_AUTO_TEST_CASE(html_alternative)
{
    outbound_message msg = simple_message();
    msg.html = "<p>All good.</p>";

    auto text = mime::compose(msg, "sender@example.com");
    BOOST_REQUIRE(text);
    const auto parsed = mime::part::parse(*text);
    BOOST_TEST(parsed.media_type() == "multipart/alternative");
    BOOST_REQUIRE(parsed.parts().size() == 2u);
    const auto body = mime::extract_body(parsed);
    BOOST_TEST(body.plain_text == "All good.\r\nSee you.");
    BOOST_REQUIRE(body.html_text.has_value());
    BOOST_TEST(*body.html_text == "<p>All good.</p>\r\n");
}

BOOST_AUTO_TEST_CASE(compose_rejections)
{
    outbound_message msg = simple_message();
    auto no_sender = mime::compose(msg, "  ");
    BOOST_REQUIRE(!no_sender);
    BOOST_TEST((no_sender.error().code == errc::config_missing_sender));

    msg.to.clear();
    auto no_rcpt = mime::compose(msg, "sender@example.com");
    BOOST_REQUIRE(!no_rcpt);
    BOOST_TEST((no_rcpt.error().code == errc::config_missing_recipient));

    msg = simple_message();
    msg.body.clear();
    auto no_body = mime::compose(msg, "sender@example.com");
    BOOST_REQUIRE(!no_body);
    BOOST_TEST((no_body.error().code == errc::config_invalid_value));

    msg = simple_message();
    msg.subject = "hi\r\nBcc: victim@example.com";
    auto injected = mime::compose(msg, "sender@example.com");
    BOOST_REQUIRE(!injected);
    BOOST_TEST((injected.error().code == errc::config_invalid_header));
    BOOST_TEST((injected.error().kind() == courier::failure_kind::configuration));
}

BOOST_AUTO_TEST_CASE(date_header_format)
{
    using namespace std::chrono;
    const sys_days day = year{2026} / March / 2;
    BOOST_TEST(courier::mime::detail_compose::format_date(day + hours{9} + minutes{5} + seconds{7}) ==
        "Mon, 02 Mar 2026 09:05:07 +0000");
    BOOST_TEST(courier::mime::detail_compose::format_date(sys_days{year{1999} / December / 31} + hours{23}) ==
        "Fri, 31 Dec 1999 23:00:00 +0000");
}
