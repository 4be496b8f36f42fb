/*

test_imap_parse.cpp
-------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE imap_parse_test

#include <string>
#include <boost/test/unit_test.hpp>
#include <courier/imap/types.hpp>


namespace imap = courier::imap;


BOOST_AUTO_TEST_CASE(astring_quoting)
{
    auto plain = imap::to_astring("INBOX");
    BOOST_REQUIRE(plain);
    BOOST_TEST(*plain == "\"INBOX\"");

    auto escaped = imap::to_astring("pa\"ss\\word");
    BOOST_REQUIRE(escaped);
    BOOST_TEST(*escaped == "\"pa\\\"ss\\\\word\"");

    auto injected = imap::to_astring("INBOX\r\n2 LOGOUT");
    BOOST_REQUIRE(!injected);
    BOOST_TEST((injected.error().code == courier::errc::config_invalid_value));
}

BOOST_AUTO_TEST_CASE(literal_sizes)
{
    BOOST_TEST(imap::extract_literal_size("* 1 FETCH (RFC822 {342}").value_or(0) == 342u);
    BOOST_TEST(imap::extract_literal_size("* 1 FETCH (RFC822 {12+}").value_or(0) == 12u);
    BOOST_TEST(!imap::extract_literal_size("* 1 FETCH (FLAGS (\\Seen))").has_value());
    BOOST_TEST(!imap::extract_literal_size("* OK {abc}").has_value());
    BOOST_TEST(!imap::extract_literal_size("{}").has_value());
}

BOOST_AUTO_TEST_CASE(search_results)
{
    const auto ids = imap::parse_search_ids("* SEARCH 2 84 882");
    BOOST_REQUIRE(ids.size() == 3u);
    BOOST_TEST(ids[0] == 2u);
    BOOST_TEST(ids[2] == 882u);

    BOOST_TEST(imap::parse_search_ids("* SEARCH").empty());
    BOOST_TEST(imap::parse_search_ids("* 3 EXISTS").empty());
    BOOST_TEST(imap::parse_search_ids("* search 7").size() == 1u);
}

BOOST_AUTO_TEST_CASE(response_assembly)
{
    imap::response resp;
    resp.tag = "4";
    BOOST_TEST(!imap::absorb_line(resp, "* SEARCH 1 2"));
    BOOST_TEST(!imap::absorb_line(resp, "41 OK not ours"));
    BOOST_TEST(imap::absorb_line(resp, "4 NO [TRYCREATE] Mailbox does not exist"));
    BOOST_TEST((resp.st == imap::status::no));
    BOOST_TEST(resp.text == "[TRYCREATE] Mailbox does not exist");
    BOOST_TEST(resp.untagged_lines.size() == 2u);
    BOOST_TEST(resp.tagged_line == "4 NO [TRYCREATE] Mailbox does not exist");
}

BOOST_AUTO_TEST_CASE(status_words)
{
    imap::response resp;
    resp.tag = "1";
    BOOST_TEST(imap::absorb_line(resp, "1 ok done"));
    BOOST_TEST((resp.st == imap::status::ok));

    imap::response odd;
    odd.tag = "2";
    BOOST_TEST(imap::absorb_line(odd, "2 MAYBE"));
    BOOST_TEST((odd.st == imap::status::unknown));
}

BOOST_AUTO_TEST_CASE(store_items)
{
    BOOST_TEST(imap::build_store_item('-', false) == "-FLAGS");
    BOOST_TEST(imap::build_store_item('+', true) == "+FLAGS.SILENT");
    BOOST_TEST(imap::build_store_item('=', false) == "FLAGS");
}
