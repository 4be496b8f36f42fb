/*

imap/client.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <courier/detail/append.hpp>
#include <courier/detail/asio_decl.hpp>
#include <courier/detail/log.hpp>
#include <courier/detail/result.hpp>
#include <courier/detail/sanitize.hpp>
#include <courier/imap/error_mapping.hpp>
#include <courier/imap/types.hpp>
#include <courier/net/connector.hpp>
#include <courier/net/dialog.hpp>
#include <courier/net/tls_options.hpp>
#include <courier/net/upgradable_stream.hpp>

namespace courier::imap
{

/**
IMAP4rev1 session limited to what reading a mailbox needs.

Commands are tagged with increasing numbers. A tagged NO or BAD completion is returned as `imap_tagged_no`
or `imap_tagged_bad`, a completion with an unknown status word as `imap_parse_error`.
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
    Opening the connection. Implicit mode runs the TLS handshake before the greeting.
    **/
    awaitable<result_void> connect(std::string host, std::string service, net::tls_mode mode)
    {
        if (dialog_.has_value())
            co_return fail_void(errc::imap_invalid_state, "Connection is already established.");
        COURIER_CO_TRY_VOID(detail::ensure_no_crlf_or_nul(host, "host", errc::config_invalid_value));
        if (mode == net::tls_mode::starttls)
            co_return fail_void(errc::config_invalid_value, "IMAP sessions use implicit TLS or none.");

        host_ = std::move(host);
        COURIER_CO_TRY_ASSIGN(net::upgradable_stream stream,
            co_await net::open_stream(executor_, host_, service, options_.timeout, "imap"));
        if (mode == net::tls_mode::implicit)
        {
            COURIER_CO_TRY_ASSIGN(ssl::context* context, tls_context());
            COURIER_CO_TRY_VOID(co_await stream.start_tls(*context, host_, options_.tls));
        }

        dialog_.emplace(std::move(stream), options_.max_line_length, options_.timeout);
        configure_trace();
        COURIER_DEBUG("IMAP connected to " + host_ + ":" + service + " tls=" + std::string(net::to_string(mode)));
        co_return ok();
    }

    /**
    Reading the untagged greeting. `* OK` and `* PREAUTH` are accepted, `* BYE` is a refusal.
    **/
    awaitable<result<std::string>> read_greeting()
    {
        if (!dialog_.has_value())
            co_return fail<std::string>(errc::imap_invalid_state, "Connection is not established.");
        COURIER_CO_TRY_ASSIGN(std::string line, co_await dialog_->read_line_r());

        auto [star, rest] = detail_imap::split_token(line);
        auto [word, text] = detail_imap::split_token(rest);
        const status st = star == "*" ? detail_imap::parse_status_word(word) : status::unknown;
        if (st == status::ok || st == status::preauth)
            co_return ok(std::string(text));

        detail::error_detail info;
        info.add("proto", "imap").add("host", host_).add("greeting", line);
        if (st == status::bye)
            co_return fail<std::string>(errc::imap_tagged_no, "Server refused the connection.", info);
        co_return fail<std::string>(errc::imap_parse_error, "Unexpected IMAP greeting.", info);
    }

    awaitable<result<response>> login(std::string username, std::string password)
    {
        COURIER_CO_TRY_ASSIGN(std::string user_q, to_astring(username));
        COURIER_CO_TRY_ASSIGN(std::string pass_q, to_astring(password));
        std::string cmd;
        detail::append_sv(cmd, "LOGIN");
        detail::append_space(cmd);
        detail::append_sv(cmd, user_q);
        detail::append_space(cmd);
        detail::append_sv(cmd, pass_q);
        co_return co_await command(std::move(cmd));
    }

    awaitable<result<response>> select(std::string mailbox)
    {
        COURIER_CO_TRY_ASSIGN(std::string mailbox_q, to_astring(mailbox));
        co_return co_await command("SELECT " + mailbox_q);
    }

    /**
    Running SEARCH and collecting the message numbers of every `* SEARCH` line, in server order.
    **/
    awaitable<result<std::vector<std::uint32_t>>> search(std::string criteria)
    {
        COURIER_CO_TRY_VOID(detail::ensure_no_crlf_or_nul(criteria, "criteria", errc::config_invalid_value));
        COURIER_CO_TRY_ASSIGN(response resp, co_await command("SEARCH " + criteria));
        std::vector<std::uint32_t> ids;
        for (const auto& line : resp.untagged_lines)
        {
            const auto parsed = parse_search_ids(line);
            ids.insert(ids.end(), parsed.begin(), parsed.end());
        }
        co_return ok(std::move(ids));
    }

    /**
    Fetching the full message text by sequence number. Fetching RFC822 sets the seen flag on most servers.
    **/
    awaitable<result<std::string>> fetch_rfc822(std::uint32_t id)
    {
        std::string cmd;
        detail::append_sv(cmd, "FETCH ");
        detail::append_uint(cmd, id);
        detail::append_sv(cmd, " (RFC822)");
        COURIER_CO_TRY_ASSIGN(response resp, co_await command(cmd));
        if (resp.literals.empty())
            co_return fail<std::string>(errc::imap_parse_error, "FETCH returned no message literal.",
                make_imap_detail(host_, cmd, resp));
        co_return ok(std::move(resp.literals.front()));
    }

    /**
    Changing flags of one message, for example `store(3, '-', "(\\Seen)")`.
    **/
    awaitable<result<response>> store(std::uint32_t id, char mode, std::string flags)
    {
        COURIER_CO_TRY_VOID(detail::ensure_no_crlf_or_nul(flags, "flags", errc::config_invalid_value));
        std::string cmd;
        detail::append_sv(cmd, "STORE ");
        detail::append_uint(cmd, id);
        detail::append_space(cmd);
        detail::append_sv(cmd, build_store_item(mode, false));
        detail::append_space(cmd);
        detail::append_sv(cmd, flags);
        co_return co_await command(std::move(cmd));
    }

    /// CLOSE, leaving the selected mailbox.
    awaitable<result<response>> close_mailbox()
    {
        co_return co_await command("CLOSE");
    }

    /**
    LOGOUT. The connection is dropped whatever the server answers.
    **/
    awaitable<result<response>> logout()
    {
        auto resp = co_await command("LOGOUT");
        close();
        co_return resp;
    }

    /**
    Sending an arbitrary command and reading up to its tagged completion.
    **/
    awaitable<result<response>> command(std::string cmd)
    {
        if (!dialog_.has_value())
            co_return fail<response>(errc::imap_invalid_state, "Connection is not established.");
        COURIER_CO_TRY_VOID(detail::ensure_no_crlf_or_nul(cmd, "command", errc::config_invalid_value));

        response resp;
        resp.tag = std::to_string(++tag_counter_);
        std::string line = resp.tag;
        detail::append_space(line);
        detail::append_sv(line, cmd);
        COURIER_CO_TRY_VOID(co_await dialog_->write_line_r(std::move(line)));
        COURIER_CO_TRY_VOID(co_await read_until_tag(resp));

        if (resp.st != status::ok)
        {
            std::string message = "IMAP ";
            message += cmd.substr(0, cmd.find(' '));
            message += resp.st == status::no ? " refused: " : resp.st == status::bad ? " rejected: " : " unparsable: ";
            message += resp.text;
            co_return fail<response>(map_imap_status(resp.st), std::move(message), make_imap_detail(host_, cmd, resp));
        }
        co_return ok(std::move(resp));
    }

    /**
    Dropping the connection without LOGOUT.
    **/
    void close() noexcept
    {
        if (dialog_.has_value())
            dialog_->stream().close();
        dialog_.reset();
    }

    [[nodiscard]] bool is_open() const noexcept { return dialog_.has_value(); }

private:
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
        dialog_->set_trace_protocol("IMAP");
        dialog_->set_trace_redaction(options_.redact_secrets_in_trace);
    }

    /**
    Collecting lines up to the tagged completion. An overlong line is dropped and reported once the completion
    has arrived, so the next command starts in sync.
    **/
    awaitable<result_void> read_until_tag(response& resp)
    {
        std::optional<error_info> overflow;
        for (;;)
        {
            auto next = co_await dialog_->read_line_r();
            if (!next)
            {
                if (next.error().code != errc::net_line_too_long)
                    co_return fail<void>(std::move(next).error());
                if (!overflow.has_value())
                    overflow = std::move(next).error();
                continue;
            }
            std::string line = std::move(*next);
            if (const auto size = extract_literal_size(line))
            {
                COURIER_CO_TRY_ASSIGN(std::string literal, co_await dialog_->read_exactly_r(*size));
                resp.literals.push_back(std::move(literal));
            }
            if (absorb_line(resp, line))
            {
                if (overflow.has_value())
                    co_return fail<void>(std::move(*overflow));
                co_return ok();
            }
        }
    }

    executor_type executor_;
    options options_;
    std::optional<ssl::context> tls_context_;
    std::optional<dialog_type> dialog_;
    std::string host_;
    std::uint64_t tag_counter_{0};
};

} // namespace courier::imap
