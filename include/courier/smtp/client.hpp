/*

smtp/client.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <courier/codec/base64.hpp>
#include <courier/detail/asio_decl.hpp>
#include <courier/detail/log.hpp>
#include <courier/detail/result.hpp>
#include <courier/detail/sanitize.hpp>
#include <courier/net/connector.hpp>
#include <courier/net/dialog.hpp>
#include <courier/net/tls_options.hpp>
#include <courier/net/upgradable_stream.hpp>
#include <courier/smtp/error_mapping.hpp>
#include <courier/smtp/types.hpp>

namespace courier::smtp
{

/**
SMTP submission session.

Every member reports failures through `result`, nothing throws. The caller drives the conversation:
connect, greeting, EHLO, optional STARTTLS followed by a second EHLO, optional authentication, then any
number of transactions and QUIT.
**/
class client
{
public:
    using executor_type = any_io_executor;

    explicit client(executor_type executor, options opts = {})
        : executor_(std::move(executor)),
          options_(std::move(opts))
    {
    }

    client(const client&) = delete;
    client& operator=(const client&) = delete;

    ~client()
    {
        close();
    }

    [[nodiscard]] executor_type get_executor() const { return executor_; }

    /**
    Opening the connection, with the TLS handshake right away in implicit mode.

    @param host    Server host name, also used as SNI and for certificate verification.
    @param service Port number or service name.
    @param mode    `implicit` wraps the connection in TLS before the greeting, the other modes leave it plain.
    **/
    awaitable<result_void> connect(std::string host, std::string service, net::tls_mode mode)
    {
        if (state_ != state::disconnected)
            co_return fail_void(errc::smtp_invalid_state, "Connection is already established.");
        COURIER_CO_TRY_VOID(detail::ensure_no_crlf_or_nul(host, "host", errc::config_invalid_value));

        host_ = host;
        service_ = service;
        COURIER_CO_TRY_ASSIGN(net::upgradable_stream stream,
            co_await net::open_stream(executor_, host_, service_, options_.timeout, "smtp"));

        if (mode == net::tls_mode::implicit)
        {
            COURIER_CO_TRY_ASSIGN(ssl::context* context, tls_context());
            COURIER_CO_TRY_VOID(co_await stream.start_tls(*context, host_, options_.tls));
        }

        dialog_.emplace(std::move(stream), net::DEFAULT_MAX_LINE_LENGTH, options_.timeout);
        configure_trace();
        state_ = state::connected;
        COURIER_DEBUG("SMTP connected to " + host_ + ":" + service_ + " tls=" + std::string(net::to_string(mode)));
        co_return ok();
    }

    /**
    Reading the server greeting, anything but 220 is a refusal.
    **/
    awaitable<result<reply>> read_greeting()
    {
        if (state_ != state::connected)
            co_return fail<reply>(errc::smtp_invalid_state, "Greeting requires an established connection.");
        COURIER_CO_TRY_ASSIGN(reply rep, co_await read_reply());
        if (rep.status != 220)
            co_return fail<reply>(rejection(command_kind::greeting, {}, rep, "Connection rejected"));
        state_ = state::greeted;
        co_return ok(std::move(rep));
    }

    /**
    Introducing the client, falling back to HELO when the server does not know EHLO.

    @param domain Client name, `options::helo_name` or the local host name when empty.
    **/
    awaitable<result<reply>> ehlo(std::string domain = {})
    {
        if (state_ != state::greeted && state_ != state::ready)
            co_return fail<reply>(errc::smtp_invalid_state, "EHLO requires a greeting.");
        if (domain.empty())
            domain = options_.helo_name.empty() ? default_hostname() : options_.helo_name;
        COURIER_CO_TRY_VOID(detail::ensure_no_crlf_or_nul(domain, "helo_name", errc::config_invalid_value));

        capabilities_ = capabilities{};
        const std::string line = "EHLO " + domain;
        COURIER_CO_TRY_ASSIGN(reply rep, co_await command(line));
        if (!rep.is_positive_completion())
        {
            if (rep.status != 500 && rep.status != 502 && rep.status != 504)
                co_return fail<reply>(rejection(command_kind::ehlo, line, rep, "EHLO rejected"));

            const std::string helo_line = "HELO " + domain;
            COURIER_CO_TRY_ASSIGN(reply helo_rep, co_await command(helo_line));
            if (!helo_rep.is_positive_completion())
                co_return fail<reply>(rejection(command_kind::helo, helo_line, helo_rep, "HELO rejected"));
            state_ = state::ready;
            co_return ok(std::move(helo_rep));
        }

        capabilities_ = capabilities::parse(rep);
        state_ = state::ready;
        co_return ok(std::move(rep));
    }

    /**
    Upgrading the session with STARTTLS. The capabilities are forgotten and EHLO has to be sent again.
    **/
    awaitable<result_void> start_tls()
    {
        if (state_ != state::ready)
            co_return fail_void(errc::smtp_invalid_state, "STARTTLS requires EHLO.");
        if (dialog_->stream().is_tls())
            co_return fail_void(errc::smtp_invalid_state, "TLS is already active.");

        COURIER_CO_TRY_ASSIGN(reply rep, co_await command("STARTTLS"));
        if (rep.status != 220)
            co_return fail<void>(rejection(command_kind::starttls, "STARTTLS", rep, "STARTTLS rejected"));

        COURIER_CO_TRY_ASSIGN(ssl::context* context, tls_context());
        const std::size_t max_length = dialog_->max_line_length();
        const auto timeout = dialog_->timeout();
        net::upgradable_stream stream = std::move(dialog_->stream());
        dialog_.reset();
        COURIER_CO_TRY_VOID(co_await stream.start_tls(*context, host_, options_.tls));

        dialog_.emplace(std::move(stream), max_length, timeout);
        configure_trace();
        capabilities_ = capabilities{};
        state_ = state::greeted;
        co_return ok();
    }

    /**
    Logging in with AUTH PLAIN when the server offers it, AUTH LOGIN otherwise.
    **/
    awaitable<result_void> authenticate(std::string username, std::string password)
    {
        if (state_ != state::ready)
            co_return fail_void(errc::smtp_invalid_state, "Authentication requires EHLO.");
        COURIER_CO_TRY_VOID(detail::ensure_no_crlf_or_nul(username, "username", errc::config_invalid_value));
        COURIER_CO_TRY_VOID(detail::ensure_no_crlf_or_nul(password, "password", errc::config_invalid_value));

        const auto* methods = capabilities_.parameters("AUTH");
        if (methods == nullptr)
            co_return fail_void(errc::smtp_auth_failed, "Server does not offer authentication.",
                detail::error_detail().add("proto", "smtp").add("host", host_).add("service", service_));

        const bool plain = std::find(methods->begin(), methods->end(), "PLAIN") != methods->end();
        if (plain)
            COURIER_CO_TRY_VOID(co_await authenticate_plain(username, password));
        else
            COURIER_CO_TRY_VOID(co_await authenticate_login(username, password));

        state_ = state::authenticated;
        co_return ok();
    }

    /**
    Running one mail transaction.

    @param from       Envelope sender.
    @param recipients Envelope recipients, each must be accepted.
    @param data       Message text. Dot stuffing and the end of data marker are added here.
    @return           Final reply to the message data.
    **/
    awaitable<result<reply>> send(std::string from, std::vector<std::string> recipients, std::string data)
    {
        if (state_ != state::ready && state_ != state::authenticated)
            co_return fail<reply>(errc::smtp_invalid_state, "Mail transaction requires EHLO.");
        if (recipients.empty())
            co_return fail<reply>(errc::config_missing_recipient, "No recipients.");
        COURIER_CO_TRY_VOID(detail::ensure_no_crlf_or_nul(from, "mail_from"));

        const std::string mail_line = "MAIL FROM:<" + from + ">";
        COURIER_CO_TRY_ASSIGN(reply mail_rep, co_await command(mail_line));
        if (!mail_rep.is_positive_completion())
            co_return fail<reply>(rejection(command_kind::mail_from, mail_line, mail_rep, "Sender rejected"));

        for (const auto& rcpt : recipients)
        {
            COURIER_CO_TRY_VOID(detail::ensure_no_crlf_or_nul(rcpt, "rcpt_to"));
            const std::string rcpt_line = "RCPT TO:<" + rcpt + ">";
            COURIER_CO_TRY_ASSIGN(reply rcpt_rep, co_await command(rcpt_line));
            if (!rcpt_rep.is_positive_completion())
                co_return fail<reply>(rejection(command_kind::rcpt_to, rcpt_line, rcpt_rep, "Recipient rejected"));
        }

        COURIER_CO_TRY_ASSIGN(reply data_rep, co_await command("DATA"));
        if (data_rep.status != 354)
            co_return fail<reply>(rejection(command_kind::data_cmd, "DATA", data_rep, "DATA rejected"));

        COURIER_CO_TRY_VOID(co_await dialog_->write_raw_r(dot_stuff(data)));
        COURIER_CO_TRY_ASSIGN(reply final_rep, co_await read_reply());
        if (!final_rep.is_positive_completion())
            co_return fail<reply>(rejection(command_kind::data_body, {}, final_rep, "Message rejected"));

        COURIER_DEBUG("SMTP message accepted for " + std::to_string(recipients.size()) + " recipient(s)");
        co_return ok(std::move(final_rep));
    }

    /**
    Ending the session politely. The connection is closed whatever the outcome.
    **/
    awaitable<result<reply>> quit()
    {
        if (!dialog_.has_value())
            co_return fail<reply>(errc::smtp_invalid_state, "Connection is not established.");
        auto rep = co_await command("QUIT");
        close();
        if (!rep)
            co_return fail<reply>(std::move(rep).error());
        if (!rep->is_positive_completion())
            co_return fail<reply>(rejection(command_kind::quit, "QUIT", *rep, "QUIT rejected"));
        co_return rep;
    }

    /**
    Dropping the connection without QUIT.
    **/
    void close() noexcept
    {
        if (dialog_.has_value())
            dialog_->stream().close();
        dialog_.reset();
        capabilities_ = capabilities{};
        state_ = state::disconnected;
    }

    [[nodiscard]] bool is_open() const noexcept { return dialog_.has_value(); }

    [[nodiscard]] bool is_tls() const noexcept
    {
        return dialog_.has_value() && dialog_->stream().is_tls();
    }

    [[nodiscard]] const capabilities& server_capabilities() const noexcept { return capabilities_; }

private:
    enum class state
    {
        disconnected,
        connected,
        greeted,
        ready,
        authenticated
    };

    using dialog_type = net::dialog<net::upgradable_stream>;

    result<ssl::context*> tls_context()
    {
        if (!tls_context_.has_value())
        {
            auto context = net::make_client_context(options_.tls);
            if (!context)
                return fail<ssl::context*>(std::move(context).error());
            tls_context_.emplace(std::move(*context));
        }
        return ok(&*tls_context_);
    }

    void configure_trace()
    {
        dialog_->set_trace_protocol("SMTP");
        dialog_->set_trace_redaction(options_.redact_secrets_in_trace);
    }

    [[nodiscard]] error_info rejection(command_kind kind, std::string_view line, const reply& rep,
        std::string_view what) const
    {
        std::string message(what);
        message += ": ";
        message += std::to_string(rep.status);
        if (!rep.lines.empty())
        {
            message += " ";
            message += rep.lines.front();
        }
        return make_error(map_smtp_reply(kind, rep.status), std::move(message),
            make_smtp_detail(host_, service_, kind, line, rep).str());
    }

    awaitable<result<reply>> command(std::string line)
    {
        if (!dialog_.has_value())
            co_return fail<reply>(errc::smtp_invalid_state, "Connection is not established.");
        COURIER_CO_TRY_VOID(co_await dialog_->write_line_r(std::move(line)));
        co_return co_await read_reply();
    }

    awaitable<result<reply>> read_reply()
    {
        if (!dialog_.has_value())
            co_return fail<reply>(errc::smtp_invalid_state, "Connection is not established.");
        reply_parser parser;
        for (;;)
        {
            COURIER_CO_TRY_ASSIGN(std::string line, co_await dialog_->read_line_r());
            COURIER_CO_TRY_ASSIGN(bool done, parser.feed(line));
            if (done)
                co_return ok(parser.take());
        }
    }

    awaitable<result_void> authenticate_plain(const std::string& username, const std::string& password)
    {
        std::string token;
        token.reserve(username.size() + password.size() + 2);
        token.push_back('\0');
        token += username;
        token.push_back('\0');
        token += password;
        const std::string encoded = base64::encode_line(token);

        COURIER_CO_TRY_ASSIGN(reply rep, co_await command("AUTH PLAIN " + encoded));
        if (rep.status == 334)
        {
            COURIER_CO_TRY_ASSIGN(reply second, co_await command(encoded));
            rep = std::move(second);
        }
        if (!rep.is_positive_completion())
            co_return fail<void>(rejection(command_kind::auth, "AUTH PLAIN " + encoded, rep, "Authentication rejected"));
        co_return ok();
    }

    awaitable<result_void> authenticate_login(const std::string& username, const std::string& password)
    {
        COURIER_CO_TRY_ASSIGN(reply rep, co_await command("AUTH LOGIN"));
        if (rep.status != 334)
            co_return fail<void>(rejection(command_kind::auth, "AUTH LOGIN", rep, "Authentication rejected"));

        COURIER_CO_TRY_ASSIGN(reply user_rep, co_await command(base64::encode_line(username)));
        if (user_rep.status != 334)
            co_return fail<void>(rejection(command_kind::auth, "AUTH LOGIN", user_rep, "Username rejected"));

        COURIER_CO_TRY_ASSIGN(reply pass_rep, co_await command(base64::encode_line(password)));
        if (!pass_rep.is_positive_completion())
            co_return fail<void>(rejection(command_kind::auth, "AUTH LOGIN", pass_rep, "Password rejected"));
        co_return ok();
    }

    static std::string default_hostname()
    {
        asio::error_code ec;
        std::string name = ip::host_name(ec);
        return ec || name.empty() ? std::string("localhost") : name;
    }

    executor_type executor_;
    options options_;
    std::optional<ssl::context> tls_context_;
    std::optional<dialog_type> dialog_;
    capabilities capabilities_;
    state state_{state::disconnected};
    std::string host_;
    std::string service_;
};

} // namespace courier::smtp
