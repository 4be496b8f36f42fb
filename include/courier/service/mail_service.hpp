/*

mail_service.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <boost/scope_exit.hpp>

#include <courier/detail/ascii.hpp>
#include <courier/detail/asio_decl.hpp>
#include <courier/detail/best_effort.hpp>
#include <courier/detail/log.hpp>
#include <courier/detail/result.hpp>
#include <courier/detail/sanitize.hpp>
#include <courier/imap/client.hpp>
#include <courier/mime/composer.hpp>
#include <courier/net/tls_options.hpp>
#include <courier/pop3/client.hpp>
#include <courier/service/mail_config.hpp>
#include <courier/service/messages.hpp>
#include <courier/smtp/client.hpp>

namespace courier
{

struct service_options
{
    net::tls_options tls;
    /// Bounds the connect and every read or write of a session.
    std::chrono::steady_clock::duration timeout = std::chrono::seconds(30);
    /// Threads of the pool behind send_async.
    std::size_t worker_threads = 1;
    /// EHLO/HELO name, the local host name when empty.
    std::string helo_name;
    bool redact_secrets_in_trace = true;
};

/**
Sending and fetching mail with one immutable configuration.

Every call opens its own session and closes it before returning. The blocking members run their coroutine
on a private `io_context` for the duration of the call, so they must not be called from inside an Asio
handler of a single threaded context.
**/
class mail_service
{
public:
    explicit mail_service(mail_config config, service_options opts = {})
        : config_(std::move(config)),
          options_(std::move(opts)),
          pool_(std::max<std::size_t>(options_.worker_threads, 1))
    {
    }

    mail_service(const mail_service&) = delete;
    mail_service& operator=(const mail_service&) = delete;

    ~mail_service()
    {
        pool_.join();
    }

    [[nodiscard]] const mail_config& config() const noexcept { return config_; }

    [[nodiscard]] const service_options& options() const noexcept { return options_; }

    /**
    Sender of a message: its explicit from, the configured default, then the SMTP user.
    **/
    [[nodiscard]] std::optional<std::string> resolve_from(const outbound_message& msg) const
    {
        for (const auto* candidate : {&msg.from, &config_.default_from, &config_.smtp_user})
            if (candidate->has_value() && !detail::trim_view(**candidate).empty())
                return **candidate;
        return std::nullopt;
    }

    /**
    Submitting a message, blocking until the server accepted or refused it.
    **/
    result_void send(const outbound_message& msg)
    {
        return run_blocking(co_send(msg));
    }

    /**
    Submitting a message on the caller's executor.

    With STARTTLS enabled the sequence is greeting, EHLO, STARTTLS, handshake, EHLO, optional AUTH and the
    mail transaction. Otherwise the connection starts with TLS and the second EHLO is skipped. QUIT is always
    attempted afterwards and its outcome never changes the result.
    **/
    awaitable<result_void> co_send(outbound_message msg)
    {
        if (config_.smtp_host.empty())
            co_return fail_void(errc::config_missing_host, "SMTP host is not configured.");
        const auto from = resolve_from(msg);
        if (!from.has_value())
            co_return fail_void(errc::config_missing_sender, "No sender address could be resolved.");
        COURIER_CO_TRY_ASSIGN(std::string data, mime::compose(msg, *from));
        std::vector<std::string> recipients = mime::envelope_recipients(msg);

        auto executor = co_await asio::this_coro::executor;
        smtp::client session(executor, smtp_options());
        BOOST_SCOPE_EXIT_ALL(&session) { session.close(); };

        auto outcome = co_await submit(session, mime::envelope_address(*from), std::move(recipients), std::move(data));
        if (session.is_open())
            best_effort::from("SMTP QUIT", co_await session.quit());

        if (outcome)
            COURIER_INFO("Mail submitted to " + config_.smtp_host);
        else
            COURIER_ERROR("Mail submission failed: " + describe(outcome.error()));
        co_return outcome;
    }

    /**
    Running the blocking send on the worker pool. The awaiting coroutine resumes on its own executor.
    **/
    awaitable<result_void> send_async(outbound_message msg)
    {
        co_return co_await asio::co_spawn(pool_,
            [this, msg = std::move(msg)]() -> awaitable<result_void>
            {
                co_return send(msg);
            }, asio::use_awaitable);
    }

    /**
    Unseen IMAP messages, newest first.

    @param folder    Mailbox to select.
    @param limit     Maximum number of messages fetched.
    @param mark_seen When false the seen flag set by fetching is cleared again.
    **/
    result<std::vector<inbound_message>> fetch_unseen(std::string folder = "INBOX", std::size_t limit = 20,
        bool mark_seen = false)
    {
        return run_blocking(co_fetch_unseen(std::move(folder), limit, mark_seen));
    }

    awaitable<result<std::vector<inbound_message>>> co_fetch_unseen(std::string folder = "INBOX",
        std::size_t limit = 20, bool mark_seen = false)
    {
        if (!config_.imap.has_value() || config_.imap->host.empty())
            co_return fail<std::vector<inbound_message>>(errc::config_missing_host, "IMAP host is not configured.");
        COURIER_CO_TRY_VOID(detail::ensure_no_crlf_or_nul(folder, "folder", errc::config_invalid_value));

        auto executor = co_await asio::this_coro::executor;
        imap::client session(executor, imap_options());
        BOOST_SCOPE_EXIT_ALL(&session) { session.close(); };

        bool selected = false;
        auto outcome = co_await read_unseen(session, folder, limit, mark_seen, selected);
        if (session.is_open())
        {
            if (selected)
                best_effort::from("IMAP CLOSE", co_await session.close_mailbox());
            best_effort::from("IMAP LOGOUT", co_await session.logout());
        }
        co_return outcome;
    }

    /**
    Latest POP3 messages, highest message number first.
    **/
    result<std::vector<inbound_message>> fetch_pop3(std::size_t limit = 10)
    {
        return run_blocking(co_fetch_pop3(limit));
    }

    awaitable<result<std::vector<inbound_message>>> co_fetch_pop3(std::size_t limit = 10)
    {
        if (!config_.pop3.has_value() || config_.pop3->host.empty())
            co_return fail<std::vector<inbound_message>>(errc::config_missing_host, "POP3 host is not configured.");

        auto executor = co_await asio::this_coro::executor;
        pop3::client session(executor, pop3_options());
        BOOST_SCOPE_EXIT_ALL(&session) { session.close(); };

        auto outcome = co_await read_pop3(session, limit);
        if (session.is_open())
            best_effort::from("POP3 QUIT", co_await session.quit());
        co_return outcome;
    }

private:
    template<typename T>
    static result<T> run_blocking(awaitable<result<T>> task)
    {
        asio::io_context context;
        auto future = asio::co_spawn(context, std::move(task), asio::use_future);
        context.run();
        return future.get();
    }

    [[nodiscard]] smtp::options smtp_options() const
    {
        smtp::options opts;
        opts.tls = options_.tls;
        opts.timeout = options_.timeout;
        opts.helo_name = options_.helo_name;
        opts.redact_secrets_in_trace = options_.redact_secrets_in_trace;
        return opts;
    }

    [[nodiscard]] imap::options imap_options() const
    {
        imap::options opts;
        opts.tls = options_.tls;
        opts.timeout = options_.timeout;
        opts.redact_secrets_in_trace = options_.redact_secrets_in_trace;
        return opts;
    }

    [[nodiscard]] pop3::options pop3_options() const
    {
        pop3::options opts;
        opts.tls = options_.tls;
        opts.timeout = options_.timeout;
        opts.redact_secrets_in_trace = options_.redact_secrets_in_trace;
        return opts;
    }

    static net::tls_mode fetch_mode(const mail_endpoint& endpoint) noexcept
    {
        return endpoint.use_ssl ? net::tls_mode::implicit : net::tls_mode::none;
    }

    awaitable<result_void> submit(smtp::client& session, std::string from, std::vector<std::string> recipients,
        std::string data)
    {
        const bool starttls = config_.smtp_use_starttls;
        COURIER_CO_TRY_VOID(co_await session.connect(config_.smtp_host, std::to_string(config_.smtp_port),
            starttls ? net::tls_mode::starttls : net::tls_mode::implicit));
        COURIER_CO_TRY_VOID(co_await session.read_greeting());
        COURIER_CO_TRY_VOID(co_await session.ehlo());
        if (starttls)
        {
            COURIER_CO_TRY_VOID(co_await session.start_tls());
            COURIER_CO_TRY_VOID(co_await session.ehlo());
        }
        if (const auto creds = config_.credentials())
            COURIER_CO_TRY_VOID(co_await session.authenticate(creds->user, creds->password));
        COURIER_CO_TRY_VOID(co_await session.send(std::move(from), std::move(recipients), std::move(data)));
        co_return ok();
    }

    awaitable<result<std::vector<inbound_message>>> read_unseen(imap::client& session, std::string folder,
        std::size_t limit, bool mark_seen, bool& selected)
    {
        using messages_t = std::vector<inbound_message>;
        const mail_endpoint& endpoint = *config_.imap;
        COURIER_CO_TRY_VOID(co_await session.connect(endpoint.host, std::to_string(endpoint.port), fetch_mode(endpoint)));
        COURIER_CO_TRY_VOID(co_await session.read_greeting());
        if (const auto creds = config_.credentials())
            COURIER_CO_TRY_VOID(co_await session.login(creds->user, creds->password));

        auto selection = co_await session.select(folder);
        if (!selection)
        {
            if (selection.error().code != errc::imap_tagged_no)
                co_return fail<messages_t>(std::move(selection).error());
            COURIER_WARN("IMAP SELECT " + folder + " refused: " + describe(selection.error()));
            co_return ok(messages_t{});
        }
        selected = true;

        auto ids = co_await session.search("UNSEEN");
        if (!ids)
        {
            const errc code = ids.error().code;
            if (code != errc::imap_tagged_no && code != errc::imap_tagged_bad)
                co_return fail<messages_t>(std::move(ids).error());
            COURIER_WARN("IMAP SEARCH UNSEEN refused: " + describe(ids.error()));
            co_return ok(messages_t{});
        }

        std::sort(ids->begin(), ids->end(), std::greater<>());
        if (ids->size() > limit)
            ids->resize(limit);

        messages_t messages;
        for (const std::uint32_t id : *ids)
        {
            auto raw = co_await session.fetch_rfc822(id);
            if (!raw)
            {
                const errc code = raw.error().code;
                if (code != errc::imap_tagged_no && code != errc::imap_tagged_bad && code != errc::imap_parse_error &&
                    code != errc::net_line_too_long)
                    co_return fail<messages_t>(std::move(raw).error());
                COURIER_WARN("IMAP FETCH " + std::to_string(id) + " skipped: " + describe(raw.error()));
                continue;
            }
            messages.push_back(make_inbound_message(std::move(*raw)));
            if (!mark_seen)
                best_effort::from("IMAP STORE -FLAGS \\Seen", co_await session.store(id, '-', "(\\Seen)"));
        }
        COURIER_DEBUG("IMAP fetched " + std::to_string(messages.size()) + " unseen message(s) from " + folder);
        co_return ok(std::move(messages));
    }

    awaitable<result<std::vector<inbound_message>>> read_pop3(pop3::client& session, std::size_t limit)
    {
        using messages_t = std::vector<inbound_message>;
        const mail_endpoint& endpoint = *config_.pop3;
        COURIER_CO_TRY_VOID(co_await session.connect(endpoint.host, std::to_string(endpoint.port), fetch_mode(endpoint)));
        COURIER_CO_TRY_VOID(co_await session.read_greeting());
        if (const auto creds = config_.credentials())
            best_effort::from("POP3 login", co_await session.login(creds->user, creds->password));

        COURIER_CO_TRY_ASSIGN(pop3::message_list listing, co_await session.list());
        std::vector<unsigned> numbers;
        numbers.reserve(listing.size());
        for (const auto& entry : listing)
            numbers.push_back(entry.first);
        std::sort(numbers.begin(), numbers.end(), std::greater<>());
        if (numbers.size() > limit)
            numbers.resize(limit);

        messages_t messages;
        for (const unsigned number : numbers)
        {
            auto raw = co_await session.retr(number);
            if (!raw)
            {
                COURIER_WARN("POP3 RETR " + std::to_string(number) + " skipped: " + describe(raw.error()));
                continue;
            }
            messages.push_back(make_inbound_message(std::move(*raw)));
        }
        COURIER_DEBUG("POP3 fetched " + std::to_string(messages.size()) + " message(s)");
        co_return ok(std::move(messages));
    }

    const mail_config config_;
    const service_options options_;
    asio::thread_pool pool_;
};

} // namespace courier
