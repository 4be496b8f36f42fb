/*

pop3/client.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

#include <courier/detail/append.hpp>
#include <courier/detail/asio_decl.hpp>
#include <courier/detail/log.hpp>
#include <courier/detail/result.hpp>
#include <courier/detail/sanitize.hpp>
#include <courier/net/connector.hpp>
#include <courier/net/dialog.hpp>
#include <courier/net/tls_options.hpp>
#include <courier/net/upgradable_stream.hpp>
#include <courier/pop3/error_mapping.hpp>
#include <courier/pop3/types.hpp>

namespace courier::pop3
{

/**
POP3 session: greeting, USER/PASS, listing and retrieval.
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

    awaitable<result_void> connect(std::string host, std::string service, net::tls_mode mode)
    {
        if (state_ != state::disconnected)
            co_return fail_void(errc::pop3_invalid_state, "Connection is already established.");
        COURIER_CO_TRY_VOID(detail::ensure_no_crlf_or_nul(host, "host", errc::config_invalid_value));
        if (mode == net::tls_mode::starttls)
            co_return fail_void(errc::config_invalid_value, "POP3 sessions use implicit TLS or none.");

        host_ = std::move(host);
        COURIER_CO_TRY_ASSIGN(net::upgradable_stream stream,
            co_await net::open_stream(executor_, host_, service, options_.timeout, "pop3"));
        if (mode == net::tls_mode::implicit)
        {
            COURIER_CO_TRY_ASSIGN(ssl::context* context, tls_context());
            COURIER_CO_TRY_VOID(co_await stream.start_tls(*context, host_, options_.tls));
        }

        dialog_.emplace(std::move(stream), options_.max_line_length, options_.timeout);
        dialog_->set_trace_protocol("POP3");
        dialog_->set_trace_redaction(options_.redact_secrets_in_trace);
        state_ = state::connected;
        COURIER_DEBUG("POP3 connected to " + host_ + ":" + service + " tls=" + std::string(net::to_string(mode)));
        co_return ok();
    }

    awaitable<result<std::string>> read_greeting()
    {
        if (state_ != state::connected)
            co_return fail<std::string>(errc::pop3_invalid_state, "Greeting requires an established connection.");
        COURIER_CO_TRY_ASSIGN(std::string text, co_await read_ok_response("GREETING", "Connection refused.",
            errc::pop3_negative_response));
        state_ = state::authorization;
        co_return ok(std::move(text));
    }

    /**
    USER and PASS. A refusal of either is `pop3_auth_failed`.
    **/
    awaitable<result_void> login(std::string username, std::string password)
    {
        if (state_ != state::authorization)
            co_return fail_void(errc::pop3_invalid_state, "Login requires the greeting.");
        COURIER_CO_TRY_VOID(detail::ensure_no_crlf_or_nul(username, "username", errc::config_invalid_value));
        COURIER_CO_TRY_VOID(detail::ensure_no_crlf_or_nul(password, "password", errc::config_invalid_value));

        COURIER_CO_TRY_VOID(co_await send_command("USER " + username));
        COURIER_CO_TRY_VOID(co_await read_ok_response("USER", "Username rejected.", errc::pop3_auth_failed));
        COURIER_CO_TRY_VOID(co_await send_command("PASS " + password));
        COURIER_CO_TRY_VOID(co_await read_ok_response("PASS", "Password rejected.", errc::pop3_auth_failed));
        state_ = state::transaction;
        co_return ok();
    }

    /**
    Listing every message with its size. The multiline answer ends with a lone dot.
    **/
    awaitable<result<message_list>> list()
    {
        if (!greeted())
            co_return fail<message_list>(errc::pop3_invalid_state, "LIST requires the greeting.");
        COURIER_CO_TRY_VOID(co_await send_command("LIST"));
        COURIER_CO_TRY_VOID(co_await read_ok_response("LIST", "Listing messages failure."));

        message_list messages;
        for (;;)
        {
            COURIER_CO_TRY_ASSIGN(std::string line, co_await dialog_->read_line_r());
            if (line == END_OF_DATA)
                break;
            std::istringstream iss(line);
            unsigned number = 0;
            unsigned long size = 0;
            if (!(iss >> number >> size))
                co_return fail<message_list>(errc::pop3_parse_error, "LIST parse failure.",
                    make_pop3_detail(host_, "LIST", line));
            messages[number] = size;
        }
        co_return ok(std::move(messages));
    }

    /**
    Retrieving one message. Byte stuffing is undone and the lines are joined with CRLF.

    A message with an overlong line is read to its end and reported as `net_line_too_long`, the session stays
    usable for the next command.
    **/
    awaitable<result<std::string>> retr(unsigned message_no)
    {
        if (!greeted())
            co_return fail<std::string>(errc::pop3_invalid_state, "RETR requires the greeting.");
        std::string cmd;
        detail::append_sv(cmd, "RETR ");
        detail::append_uint(cmd, message_no);
        COURIER_CO_TRY_VOID(co_await send_command(cmd));
        COURIER_CO_TRY_VOID(co_await read_ok_response(cmd, "Fetching message failure."));

        std::string message;
        std::optional<error_info> overflow;
        bool first = true;
        for (;;)
        {
            auto next = co_await dialog_->read_line_r();
            if (!next)
            {
                if (next.error().code != errc::net_line_too_long)
                    co_return fail<std::string>(std::move(next).error());
                if (!overflow.has_value())
                    overflow = std::move(next).error();
                continue;
            }
            std::string line = std::move(*next);
            if (line == END_OF_DATA)
                break;
            if (!line.empty() && line.front() == '.')
                line.erase(0, 1);
            if (!first)
                detail::append_crlf(message);
            detail::append_sv(message, line);
            first = false;
        }
        if (overflow.has_value())
        {
            detail::error_detail extra;
            extra.add("command", cmd);
            overflow->detail += extra.str();
            co_return fail<std::string>(std::move(*overflow));
        }
        co_return ok(std::move(message));
    }

    /**
    QUIT, then the connection is dropped whatever the answer.
    **/
    awaitable<result_void> quit()
    {
        if (state_ == state::disconnected)
            co_return fail_void(errc::pop3_invalid_state, "Connection is not established.");
        result_void outcome = co_await send_command("QUIT");
        if (outcome)
        {
            auto answer = co_await read_ok_response("QUIT", "Quit failure.");
            if (!answer)
                outcome = fail<void>(std::move(answer).error());
        }
        close();
        co_return outcome;
    }

    void close() noexcept
    {
        if (dialog_.has_value())
            dialog_->stream().close();
        dialog_.reset();
        state_ = state::disconnected;
    }

    [[nodiscard]] bool is_open() const noexcept { return dialog_.has_value(); }

private:
    enum class state
    {
        disconnected,
        connected,
        authorization,
        transaction
    };

    using dialog_type = net::dialog<net::upgradable_stream>;

    /// Transaction commands are left to the server to refuse when the login did not happen.
    [[nodiscard]] bool greeted() const noexcept
    {
        return state_ == state::authorization || state_ == state::transaction;
    }

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

    awaitable<result_void> send_command(std::string command)
    {
        if (!dialog_.has_value())
            co_return fail_void(errc::pop3_invalid_state, "Connection is not established.");
        co_return co_await dialog_->write_line_r(std::move(command));
    }

    awaitable<result<std::string>> read_ok_response(std::string command, std::string error_message,
        errc negative = errc::pop3_negative_response)
    {
        if (!dialog_.has_value())
            co_return fail<std::string>(errc::pop3_invalid_state, "Connection is not established.");
        COURIER_CO_TRY_ASSIGN(std::string line, co_await dialog_->read_line_r());
        COURIER_CO_TRY_ASSIGN(status_line status, parse_status(line, host_, command));
        if (!status.positive)
            co_return fail<std::string>(negative, std::move(error_message), make_pop3_detail(host_, command, line));
        co_return ok(std::move(status.text));
    }

    executor_type executor_;
    options options_;
    std::optional<ssl::context> tls_context_;
    std::optional<dialog_type> dialog_;
    state state_{state::disconnected};
    std::string host_;
};

} // namespace courier::pop3
