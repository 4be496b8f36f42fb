/*

mail_config.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include <boost/algorithm/string/trim.hpp>

#include <courier/detail/ascii.hpp>
#include <courier/detail/result.hpp>

namespace courier
{

/**
Mailbox server address for a fetch protocol.
**/
struct mail_endpoint
{
    std::string host;
    std::uint16_t port = 0;
    bool use_ssl = true;
};

struct login_credentials
{
    std::string user;
    std::string password;
};

/**
Settings of the mail service. Built once, read only afterwards.
**/
struct mail_config
{
    static constexpr std::uint16_t DEFAULT_SMTP_PORT = 587;
    static constexpr std::uint16_t DEFAULT_IMAP_PORT = 993;
    static constexpr std::uint16_t DEFAULT_POP3_PORT = 995;

    std::string smtp_host;
    std::uint16_t smtp_port = DEFAULT_SMTP_PORT;
    /// STARTTLS on a plain connection when true, implicit TLS when false.
    bool smtp_use_starttls = true;
    std::optional<std::string> smtp_user;
    std::optional<std::string> smtp_password;
    std::optional<std::string> default_from;

    /// IMAP fetching is disabled when absent.
    std::optional<mail_endpoint> imap;
    /// POP3 fetching is disabled when absent.
    std::optional<mail_endpoint> pop3;

    /// Returns the value of a key, nullopt when it is not set.
    using lookup_fn = std::function<std::optional<std::string>(std::string_view)>;

    /**
    User and password shared by the three protocols, only when both are non empty.
    **/
    [[nodiscard]] std::optional<login_credentials> credentials() const
    {
        if (!smtp_user.has_value() || smtp_user->empty() || !smtp_password.has_value() || smtp_password->empty())
            return std::nullopt;
        return login_credentials{*smtp_user, *smtp_password};
    }

    /**
    Reading the settings through `lookup`.

    Keys are SMTP_HOST, SMTP_PORT, SMTP_USE_TLS, SMTP_USER, SMTP_PASSWORD, SMTP_FROM, IMAP_HOST, IMAP_PORT,
    IMAP_SSL, POP3_HOST, POP3_PORT and POP3_SSL. Empty values count as absent.

    @return The configuration, or `config_invalid_value` for a port outside 1..65535.
    **/
    [[nodiscard]] static result<mail_config> from_lookup(const lookup_fn& lookup)
    {
        auto get = [&lookup](std::string_view key) -> std::optional<std::string>
        {
            auto value = lookup(key);
            if (!value.has_value())
                return std::nullopt;
            boost::algorithm::trim(*value);
            if (value->empty())
                return std::nullopt;
            return value;
        };

        mail_config config;
        config.smtp_host = get("SMTP_HOST").value_or(std::string());
        COURIER_TRY_ASSIGN(config.smtp_port, parse_port("SMTP_PORT", get("SMTP_PORT"), DEFAULT_SMTP_PORT));
        config.smtp_use_starttls = parse_flag(get("SMTP_USE_TLS"), true);
        config.smtp_user = get("SMTP_USER");
        config.smtp_password = get("SMTP_PASSWORD");
        config.default_from = get("SMTP_FROM");

        if (auto host = get("IMAP_HOST"))
        {
            mail_endpoint endpoint{std::move(*host), DEFAULT_IMAP_PORT, parse_flag(get("IMAP_SSL"), true)};
            COURIER_TRY_ASSIGN(endpoint.port, parse_port("IMAP_PORT", get("IMAP_PORT"), DEFAULT_IMAP_PORT));
            config.imap = std::move(endpoint);
        }
        if (auto host = get("POP3_HOST"))
        {
            mail_endpoint endpoint{std::move(*host), DEFAULT_POP3_PORT, parse_flag(get("POP3_SSL"), true)};
            COURIER_TRY_ASSIGN(endpoint.port, parse_port("POP3_PORT", get("POP3_PORT"), DEFAULT_POP3_PORT));
            config.pop3 = std::move(endpoint);
        }
        return ok(std::move(config));
    }

    /**
    Reading the settings from the process environment.
    **/
    [[nodiscard]] static result<mail_config> from_env()
    {
        return from_lookup([](std::string_view key) -> std::optional<std::string>
        {
            const char* value = std::getenv(std::string(key).c_str());
            if (value == nullptr)
                return std::nullopt;
            return std::string(value);
        });
    }

    /**
    `1`, `true` and `yes` in any case are true, any other value is false.
    **/
    [[nodiscard]] static bool parse_flag(const std::optional<std::string>& value, bool fallback)
    {
        if (!value.has_value())
            return fallback;
        return *value == "1" || detail::iequals_ascii(*value, "true") || detail::iequals_ascii(*value, "yes");
    }

    [[nodiscard]] static result<std::uint16_t> parse_port(std::string_view key,
        const std::optional<std::string>& value, std::uint16_t fallback)
    {
        if (!value.has_value())
            return ok(fallback);

        unsigned long port = 0;
        const char* first = value->data();
        const char* last = first + value->size();
        const auto [ptr, ec] = std::from_chars(first, last, port);
        if (ec != std::errc{} || ptr != last || port == 0 || port > 65535)
        {
            std::string message(key);
            message += " is not a valid port: ";
            message += *value;
            return fail<std::uint16_t>(errc::config_invalid_value, std::move(message));
        }
        return ok(static_cast<std::uint16_t>(port));
    }
};

} // namespace courier
