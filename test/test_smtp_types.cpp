/*

test_smtp_types.cpp
-------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE smtp_types_test

#include <string>
#include <boost/test/unit_test.hpp>
#include <courier/smtp/types.hpp>


using courier::smtp::capabilities;
using courier::smtp::dot_stuff;
using courier::smtp::reply;
using courier::smtp::reply_parser;


BOOST_AUTO_TEST_CASE(multiline_reply)
{
    reply_parser parser;
    auto first = parser.feed("250-mx.example.com greets you");
    BOOST_REQUIRE(first);
    BOOST_TEST(!*first);
    auto second = parser.feed("250-PIPELINING");
    BOOST_REQUIRE(second);
    BOOST_TEST(!*second);
    auto last = parser.feed("250 SIZE 10240000");
    BOOST_REQUIRE(last);
    BOOST_TEST(*last);

    const reply rep = parser.take();
    BOOST_TEST(rep.status == 250);
    BOOST_REQUIRE(rep.lines.size() == 3u);
    BOOST_TEST(rep.lines[0] == "mx.example.com greets you");
    BOOST_TEST(rep.lines[2] == "SIZE 10240000");
    BOOST_TEST(rep.is_positive_completion());
    BOOST_TEST(rep.message() == "mx.example.com greets you\nPIPELINING\nSIZE 10240000");
}

BOOST_AUTO_TEST_CASE(bare_code_reply)
{
    reply_parser parser;
    auto done = parser.feed("354");
    BOOST_REQUIRE(done);
    BOOST_TEST(*done);
    const reply rep = parser.take();
    BOOST_TEST(rep.status == 354);
    BOOST_TEST(rep.is_positive_intermediate());
    BOOST_REQUIRE(rep.lines.size() == 1u);
    BOOST_TEST(rep.lines[0].empty());
}

BOOST_AUTO_TEST_CASE(malformed_replies)
{
    reply_parser garbage;
    auto res = garbage.feed("hello");
    BOOST_REQUIRE(!res);
    BOOST_TEST((res.error().code == courier::errc::smtp_bad_reply));

    reply_parser separator;
    BOOST_TEST(!separator.feed("250_OK"));

    reply_parser mixed;
    BOOST_REQUIRE(mixed.feed("250-first"));
    auto inconsistent = mixed.feed("550 second");
    BOOST_REQUIRE(!inconsistent);
    BOOST_TEST((inconsistent.error().code == courier::errc::smtp_bad_reply));
}

BOOST_AUTO_TEST_CASE(reply_classes)
{
    reply rep;
    rep.status = 451;
    BOOST_TEST(rep.is_transient_negative());
    rep.status = 550;
    BOOST_TEST(rep.is_permanent_negative());
    BOOST_TEST(!rep.is_positive_completion());
}

BOOST_AUTO_TEST_CASE(capability_parsing)
{
    reply rep;
    rep.status = 250;
    rep.lines = {"mx.example.com", "STARTTLS", "auth PLAIN login", "AUTH=LOGIN", "SIZE 35882577", "8BITMIME"};
    const auto caps = capabilities::parse(rep);

    BOOST_TEST(caps.supports("starttls"));
    BOOST_TEST(caps.supports("8BITMIME"));
    BOOST_TEST(!caps.supports("mx.example.com"));
    BOOST_TEST(!caps.supports("PIPELINING"));

    const auto* auth = caps.parameters("AUTH");
    BOOST_REQUIRE(auth != nullptr);
    BOOST_REQUIRE(auth->size() == 3u);
    BOOST_TEST((*auth)[0] == "PLAIN");
    BOOST_TEST((*auth)[1] == "LOGIN");
    BOOST_TEST((*auth)[2] == "LOGIN");

    const auto* size = caps.parameters("size");
    BOOST_REQUIRE(size != nullptr);
    BOOST_TEST(size->front() == "35882577");
    BOOST_TEST(caps.parameters("DSN") == nullptr);
}

BOOST_AUTO_TEST_CASE(capabilities_of_helo_reply)
{
    reply rep;
    rep.status = 250;
    rep.lines = {"mx.example.com"};
    BOOST_TEST(capabilities::parse(rep).empty());
}

BOOST_AUTO_TEST_CASE(dot_stuffing)
{
    BOOST_TEST(dot_stuff("Hello\r\n.hidden\r\nBye") == "Hello\r\n..hidden\r\nBye\r\n.\r\n");
    BOOST_TEST(dot_stuff("one\ntwo\n") == "one\r\ntwo\r\n.\r\n");
    BOOST_TEST(dot_stuff(".") == "..\r\n.\r\n");
    BOOST_TEST(dot_stuff("") == ".\r\n");
    BOOST_TEST(dot_stuff("a.b\r\n") == "a.b\r\n.\r\n");
}
