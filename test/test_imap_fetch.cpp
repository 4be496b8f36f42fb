/*

test_imap_fetch.cpp
-------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Fetching unseen messages through mail_service against a scripted IMAP server.

*/

#define BOOST_TEST_MODULE imap_fetch_test

#include <chrono>
#include <string>
#include <utility>
#include <vector>
#include <boost/test/unit_test.hpp>
#include <courier/service/mail_service.hpp>
#include "fake_server.hpp"


using courier::errc;
using courier::mail_config;
using courier::mail_endpoint;
using courier::mail_service;
using courier::service_options;
using courier_test::fake_server;
using courier_test::fake_session;


namespace
{
    mail_config imap_config(unsigned short port, bool use_ssl = false)
    {
        mail_config config;
        config.smtp_host = "smtp.example.com";
        config.smtp_user = "user@example.com";
        config.smtp_password = "secret";
        config.imap = mail_endpoint{"127.0.0.1", port, use_ssl};
        return config;
    }

    service_options test_options()
    {
        service_options opts;
        opts.tls.verify = courier::net::verify_mode::none;
        opts.timeout = std::chrono::seconds(5);
        return opts;
    }

    std::string message_text(const std::string& subject, const std::string& body)
    {
        return "From: sender@example.com\r\n"
            "To: user@example.com\r\n"
            "Subject: " + subject + "\r\n"
            "Date: Mon, 2 Mar 2026 09:00:00 +0000\r\n"
            "\r\n" + body + "\r\n";
    }

    std::string fetch_reply(unsigned id, const std::string& raw, const std::string& tag)
    {
        return "* " + std::to_string(id) + " FETCH (RFC822 {" + std::to_string(raw.size()) + "}\r\n" + raw +
            ")\r\n" + tag + " OK FETCH completed\r\n";
    }

    void logged_in(fake_session& s)
    {
        s.write("* OK IMAP4rev1 ready\r\n");
        s.read_line();
        s.write("1 OK LOGIN completed\r\n");
    }
}


BOOST_AUTO_TEST_CASE(newest_first_with_seen_flag_restored)
{
    const std::string fifth = message_text("=?UTF-8?Q?Cinqui=C3=A8me?=", "body five");
    const std::string third = message_text("Third", "{not a literal}\r\nbody three");

    fake_server server([&](fake_session& s)
    {
        logged_in(s);
        s.read_line();
        s.write("* 5 EXISTS\r\n* 0 RECENT\r\n2 OK [READ-WRITE] SELECT completed\r\n");
        s.read_line();
        s.write("* SEARCH 1 3 5\r\n3 OK SEARCH completed\r\n");
        s.read_line();
        s.write(fetch_reply(5, fifth, "4"));
        s.read_line();
        s.write("* 5 FETCH (FLAGS ())\r\n5 OK STORE completed\r\n");
        s.read_line();
        s.write(fetch_reply(3, third, "6"));
        s.read_line();
        s.write("7 NO STORE not permitted\r\n");
        s.read_line();
        s.write("8 OK CLOSE completed\r\n");
        s.read_line();
        s.write("* BYE logging out\r\n9 OK LOGOUT completed\r\n");
    });

    mail_service service(imap_config(server.port()), test_options());
    auto res = service.fetch_unseen("INBOX", 2, false);
    server.join();

    BOOST_REQUIRE(res.has_value());
    BOOST_TEST(server.failure().empty());
    BOOST_REQUIRE(res->size() == 2u);
    BOOST_TEST((*res)[0].subject == "Cinqui\xC3\xA8me");
    BOOST_TEST((*res)[0].plain_text == "body five");
    BOOST_TEST((*res)[0].raw == fifth);
    BOOST_TEST((*res)[1].subject == "Third");
    BOOST_TEST((*res)[1].plain_text == "{not a literal}\r\nbody three");
    BOOST_TEST((*res)[1].from == "sender@example.com");
    BOOST_TEST((*res)[1].date == "Mon, 2 Mar 2026 09:00:00 +0000");

    const std::vector<std::string> expected{
        "1 LOGIN \"user@example.com\" \"secret\"",
        "2 SELECT \"INBOX\"",
        "3 SEARCH UNSEEN",
        "4 FETCH 5 (RFC822)",
        "5 STORE 5 -FLAGS (\\Seen)",
        "6 FETCH 3 (RFC822)",
        "7 STORE 3 -FLAGS (\\Seen)",
        "8 CLOSE",
        "9 LOGOUT"};
    BOOST_TEST(server.transcript() == expected, boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(refused_fetch_is_skipped)
{
    const std::string second = message_text("Second", "kept");

    fake_server server([&](fake_session& s)
    {
        logged_in(s);
        s.read_line();
        s.write("2 OK SELECT completed\r\n");
        s.read_line();
        s.write("* SEARCH 2 4\r\n3 OK SEARCH completed\r\n");
        s.read_line();
        s.write("4 NO message has been expunged\r\n");
        s.read_line();
        s.write(fetch_reply(2, second, "5"));
        s.read_line();
        s.write("6 OK CLOSE completed\r\n");
        s.read_line();
        s.write("7 OK LOGOUT completed\r\n");
    });

    mail_service service(imap_config(server.port()), test_options());
    auto res = service.fetch_unseen("Archive", 20, true);
    server.join();

    BOOST_REQUIRE(res.has_value());
    BOOST_REQUIRE(res->size() == 1u);
    BOOST_TEST(res->front().subject == "Second");

    const auto& lines = server.transcript();
    BOOST_REQUIRE(lines.size() == 7u);
    BOOST_TEST(lines[1] == "2 SELECT \"Archive\"");
    BOOST_TEST(lines[3] == "4 FETCH 4 (RFC822)");
    BOOST_TEST(lines[4] == "5 FETCH 2 (RFC822)");
    BOOST_TEST(lines[5] == "6 CLOSE");
}

BOOST_AUTO_TEST_CASE(refused_search_gives_empty_list)
{
    fake_server server([](fake_session& s)
    {
        logged_in(s);
        s.read_line();
        s.write("2 OK SELECT completed\r\n");
        s.read_line();
        s.write("3 BAD SEARCH criteria not supported\r\n");
        s.read_line();
        s.write("4 OK CLOSE completed\r\n");
        s.read_line();
        s.write("5 OK LOGOUT completed\r\n");
    });

    mail_service service(imap_config(server.port()), test_options());
    auto res = service.fetch_unseen();
    server.join();

    BOOST_REQUIRE(res.has_value());
    BOOST_TEST(res->empty());
    BOOST_TEST(server.transcript().size() == 5u);
}

BOOST_AUTO_TEST_CASE(empty_search_fetches_nothing)
{
    fake_server server([](fake_session& s)
    {
        logged_in(s);
        s.read_line();
        s.write("2 OK SELECT completed\r\n");
        s.read_line();
        s.write("* SEARCH\r\n3 OK SEARCH completed\r\n");
        s.read_line();
        s.write("4 OK CLOSE completed\r\n");
        s.read_line();
        s.write("5 OK LOGOUT completed\r\n");
    });

    mail_service service(imap_config(server.port()), test_options());
    auto res = service.fetch_unseen();
    server.join();

    BOOST_REQUIRE(res.has_value());
    BOOST_TEST(res->empty());
    BOOST_TEST(server.transcript()[3] == "4 CLOSE");
}

BOOST_AUTO_TEST_CASE(missing_folder_over_implicit_tls)
{
    fake_server server([](fake_session& s)
    {
        s.start_tls();
        logged_in(s);
        s.read_line();
        s.write("2 NO [NONEXISTENT] Unknown mailbox\r\n");
        s.read_line();
        s.write("* BYE\r\n3 OK LOGOUT completed\r\n");
    });

    mail_service service(imap_config(server.port(), true), test_options());
    auto res = service.fetch_unseen("Nowhere");
    server.join();

    BOOST_REQUIRE(res.has_value());
    BOOST_TEST(res->empty());
    BOOST_TEST(server.failure().empty());
    BOOST_REQUIRE(server.transcript().size() == 3u);
    BOOST_TEST(server.transcript()[2] == "3 LOGOUT");
}

BOOST_AUTO_TEST_CASE(login_failure_propagates)
{
    fake_server server([](fake_session& s)
    {
        s.write("* OK IMAP4rev1 ready\r\n");
        s.read_line();
        s.write("1 NO [AUTHENTICATIONFAILED] Invalid credentials\r\n");
        s.read_line();
        s.write("* BYE\r\n2 OK LOGOUT completed\r\n");
    });

    mail_service service(imap_config(server.port()), test_options());
    auto res = service.fetch_unseen();
    server.join();

    BOOST_REQUIRE(!res.has_value());
    BOOST_TEST((res.error().code == errc::imap_tagged_no));
    BOOST_TEST(res.error().detail.find("secret") == std::string::npos);
    BOOST_REQUIRE(server.transcript().size() == 2u);
    BOOST_TEST(server.transcript()[1] == "2 LOGOUT");
}

BOOST_AUTO_TEST_CASE(configuration_errors)
{
    mail_config config;
    config.smtp_host = "smtp.example.com";
    mail_service no_imap(config, test_options());
    auto missing = no_imap.fetch_unseen();
    BOOST_REQUIRE(!missing);
    BOOST_TEST((missing.error().code == errc::config_missing_host));
    BOOST_TEST((missing.error().kind() == courier::failure_kind::configuration));

    mail_service service(imap_config(1), test_options());
    auto injected = service.fetch_unseen("INBOX\r\nA LOGOUT");
    BOOST_REQUIRE(!injected);
    BOOST_TEST((injected.error().code == errc::config_invalid_value));
}

BOOST_AUTO_TEST_CASE(large_search_answer)
{
    std::string search_line = "* SEARCH";
    for (unsigned id = 1; id <= 3000; ++id)
        search_line += " " + std::to_string(id);
    BOOST_REQUIRE(search_line.size() > courier::net::DEFAULT_MAX_LINE_LENGTH);
    const std::string newest = message_text("Newest", "last one");

    fake_server server([&](fake_session& s)
    {
        logged_in(s);
        s.read_line();
        s.write("* 3000 EXISTS\r\n2 OK SELECT completed\r\n");
        s.read_line();
        s.write(search_line + "\r\n3 OK SEARCH completed\r\n");
        s.read_line();
        s.write(fetch_reply(3000, newest, "4"));
        s.read_line();
        s.write("5 OK CLOSE completed\r\n");
        s.read_line();
        s.write("* BYE logging out\r\n6 OK LOGOUT completed\r\n");
    });

    mail_service service(imap_config(server.port()), test_options());
    auto res = service.fetch_unseen("INBOX", 1, true);
    server.join();

    BOOST_REQUIRE(res.has_value());
    BOOST_TEST(server.failure().empty());
    BOOST_REQUIRE(res->size() == 1u);
    BOOST_TEST(res->front().subject == "Newest");

    const std::vector<std::string> expected{
        "1 LOGIN \"user@example.com\" \"secret\"",
        "2 SELECT \"INBOX\"",
        "3 SEARCH UNSEEN",
        "4 FETCH 3000 (RFC822)",
        "5 CLOSE",
        "6 LOGOUT"};
    BOOST_TEST(server.transcript() == expected, boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(overlong_line_fails_only_its_command)
{
    fake_server server([](fake_session& s)
    {
        s.write("* OK IMAP4rev1 ready\r\n");
        s.read_line();
        s.write("* CAPABILITY " + std::string(200, 'X') + "\r\n1 OK CAPABILITY completed\r\n");
        s.read_line();
        s.write("2 OK NOOP completed\r\n");
    });

    using outcome_t = courier::result<courier::imap::response>;
    courier::asio::io_context context;
    courier::imap::options opts;
    opts.timeout = std::chrono::seconds(5);
    opts.max_line_length = 64;
    courier::imap::client session(context.get_executor(), opts);

    auto future = courier::asio::co_spawn(context,
        [&]() -> courier::awaitable<std::pair<outcome_t, outcome_t>>
        {
            std::pair<outcome_t, outcome_t> out;
            auto connected = co_await session.connect("127.0.0.1", std::to_string(server.port()),
                courier::net::tls_mode::none);
            if (connected)
            {
                auto greeting = co_await session.read_greeting();
                (void)greeting;
            }
            out.first = co_await session.command("CAPABILITY");
            out.second = co_await session.command("NOOP");
            session.close();
            co_return out;
        }, courier::asio::use_future);
    context.run();
    const auto [capability, noop] = future.get();
    server.join();

    BOOST_REQUIRE(!capability.has_value());
    BOOST_TEST((capability.error().code == errc::net_line_too_long));
    BOOST_REQUIRE(noop.has_value());
    BOOST_TEST((noop->st == courier::imap::status::ok));
    const std::vector<std::string> expected{"1 CAPABILITY", "2 NOOP"};
    BOOST_TEST(server.transcript() == expected, boost::test_tools::per_element());
}
