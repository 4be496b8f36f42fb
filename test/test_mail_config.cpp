/*

test_mail_config.cpp
--------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE mail_config_test

#include <cstdlib>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <boost/test/unit_test.hpp>
#include <courier/service/mail_config.hpp>
#include <courier/service/mail_service.hpp>


using courier::errc;
using courier::mail_config;


namespace
{
    mail_config::lookup_fn lookup_from(std::map<std::string, std::string> values)
    {
        return [values = std::move(values)](std::string_view key) -> std::optional<std::string>
        {
            auto it = values.find(std::string(key));
            if (it == values.end())
                return std::nullopt;
            return it->second;
        };
    }
}


BOOST_AUTO_TEST_CASE(defaults)
{
    auto config = mail_config::from_lookup(lookup_from({{"SMTP_HOST", "smtp.example.com"}}));
    BOOST_REQUIRE(config);
    BOOST_TEST(config->smtp_host == "smtp.example.com");
    BOOST_TEST(config->smtp_port == 587);
    BOOST_TEST(config->smtp_use_starttls);
    BOOST_TEST(!config->smtp_user.has_value());
    BOOST_TEST(!config->default_from.has_value());
    BOOST_TEST(!config->imap.has_value());
    BOOST_TEST(!config->pop3.has_value());
    BOOST_TEST(!config->credentials().has_value());
}

BOOST_AUTO_TEST_CASE(full_settings)
{
    auto config = mail_config::from_lookup(lookup_from({
        {"SMTP_HOST", " smtp.example.com "},
        {"SMTP_PORT", "465"},
        {"SMTP_USE_TLS", "no"},
        {"SMTP_USER", "user@example.com"},
        {"SMTP_PASSWORD", "secret"},
        {"SMTP_FROM", "Desk <desk@example.com>"},
        {"IMAP_HOST", "imap.example.com"},
        {"IMAP_SSL", "FALSE"},
        {"IMAP_PORT", "143"},
        {"POP3_HOST", "pop.example.com"},
        {"POP3_SSL", "Yes"}}));
    BOOST_REQUIRE(config);
    BOOST_TEST(config->smtp_host == "smtp.example.com");
    BOOST_TEST(config->smtp_port == 465);
    BOOST_TEST(!config->smtp_use_starttls);
    BOOST_TEST(config->default_from.value_or("") == "Desk <desk@example.com>");

    BOOST_REQUIRE(config->imap.has_value());
    BOOST_TEST(config->imap->host == "imap.example.com");
    BOOST_TEST(config->imap->port == 143);
    BOOST_TEST(!config->imap->use_ssl);

    BOOST_REQUIRE(config->pop3.has_value());
    BOOST_TEST(config->pop3->port == 995);
    BOOST_TEST(config->pop3->use_ssl);

    const auto creds = config->credentials();
    BOOST_REQUIRE(creds.has_value());
    BOOST_TEST(creds->user == "user@example.com");
    BOOST_TEST(creds->password == "secret");
}

BOOST_AUTO_TEST_CASE(flag_parsing)
{
    BOOST_TEST(mail_config::parse_flag(std::string("1"), false));
    BOOST_TEST(mail_config::parse_flag(std::string("TRUE"), false));
    BOOST_TEST(mail_config::parse_flag(std::string("yes"), false));
    BOOST_TEST(!mail_config::parse_flag(std::string("on"), true));
    BOOST_TEST(!mail_config::parse_flag(std::string("0"), true));
    BOOST_TEST(mail_config::parse_flag(std::nullopt, true));
    BOOST_TEST(!mail_config::parse_flag(std::nullopt, false));
}

BOOST_AUTO_TEST_CASE(empty_values_are_absent)
{
    auto config = mail_config::from_lookup(lookup_from({
        {"SMTP_HOST", "smtp.example.com"},
        {"SMTP_USER", "   "},
        {"IMAP_HOST", ""},
        {"SMTP_PORT", ""}}));
    BOOST_REQUIRE(config);
    BOOST_TEST(!config->smtp_user.has_value());
    BOOST_TEST(!config->imap.has_value());
    BOOST_TEST(config->smtp_port == 587);
}

BOOST_AUTO_TEST_CASE(invalid_ports)
{
    for (const char* bad : {"0", "65536", "25x", "-1", "smtp"})
    {
        auto config = mail_config::from_lookup(lookup_from({{"SMTP_HOST", "h"}, {"SMTP_PORT", bad}}));
        BOOST_REQUIRE(!config);
        BOOST_TEST((config.error().code == errc::config_invalid_value));
        BOOST_TEST(config.error().message.find("SMTP_PORT") != std::string::npos);
    }

    auto pop3 = mail_config::from_lookup(lookup_from({{"POP3_HOST", "pop"}, {"POP3_PORT", "99999"}}));
    BOOST_REQUIRE(!pop3);
    BOOST_TEST((pop3.error().code == errc::config_invalid_value));
}

BOOST_AUTO_TEST_CASE(credentials_need_both_values)
{
    mail_config config;
    config.smtp_user = "user";
    BOOST_TEST(!config.credentials().has_value());
    config.smtp_password = "";
    BOOST_TEST(!config.credentials().has_value());
    config.smtp_password = "pw";
    BOOST_TEST(config.credentials().has_value());
}

BOOST_AUTO_TEST_CASE(from_environment)
{
    ::setenv("SMTP_HOST", "env.example.com", 1);
    ::setenv("SMTP_PORT", "2525", 1);
    ::unsetenv("IMAP_HOST");
    auto config = mail_config::from_env();
    ::unsetenv("SMTP_HOST");
    ::unsetenv("SMTP_PORT");
    BOOST_REQUIRE(config);
    BOOST_TEST(config->smtp_host == "env.example.com");
    BOOST_TEST(config->smtp_port == 2525);
    BOOST_TEST(!config->imap.has_value());
}

BOOST_AUTO_TEST_CASE(sender_resolution_order)
{
    mail_config config;
    config.smtp_host = "smtp.example.com";
    config.smtp_user = "user@example.com";
    config.default_from = "desk@example.com";
    courier::mail_service service(config);

    courier::outbound_message msg;
    msg.from = "explicit@example.com";
    BOOST_TEST(service.resolve_from(msg).value_or("") == "explicit@example.com");

    msg.from = " ";
    BOOST_TEST(service.resolve_from(msg).value_or("") == "desk@example.com");

    msg.from.reset();
    BOOST_TEST(service.resolve_from(msg).value_or("") == "desk@example.com");

    mail_config no_default = config;
    no_default.default_from.reset();
    courier::mail_service user_only(no_default);
    BOOST_TEST(user_only.resolve_from(msg).value_or("") == "user@example.com");

    mail_config nothing;
    courier::mail_service bare(nothing);
    BOOST_TEST(!bare.resolve_from(msg).has_value());
}
