/*

dialog.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <courier/detail/asio_decl.hpp>
#include <courier/detail/error_detail.hpp>
#include <courier/detail/log.hpp>
#include <courier/detail/redact.hpp>
#include <courier/detail/result.hpp>
#include <courier/net/error_mapping.hpp>

namespace courier::net
{

/// Longest protocol line accepted by default, RFC 5321 allows 1000 but servers send longer ones.
inline constexpr std::size_t DEFAULT_MAX_LINE_LENGTH = 8192;

inline constexpr std::size_t MAX_ALLOWED_LINE_LENGTH = 1024 * 1024;


/**
Line oriented conversation of a mail session over an Asio stream.

Every read and write is bounded by the dialog timeout: when it expires the socket operations are cancelled and
the call fails with `net_timeout`. Socket failures come back as `error_info`, lines are traced through the
logger with outgoing credentials redacted.
**/
template<typename Stream>
class dialog
{
public:
    using duration = std::chrono::steady_clock::duration;

    dialog(Stream stream, std::size_t max_line_length = DEFAULT_MAX_LINE_LENGTH,
        std::optional<duration> timeout = std::nullopt)
        : stream_(std::move(stream)),
          max_line_length_(std::min(max_line_length, MAX_ALLOWED_LINE_LENGTH)),
          timeout_(timeout)
    {
    }

    /// Protocol name shown in traces and error details.
    void set_trace_protocol(std::string protocol)
    {
        trace_protocol_ = std::move(protocol);
    }

    void set_trace_redaction(bool enabled) noexcept
    {
        redact_secrets_in_trace_ = enabled;
    }

    /**
    Next line without its CRLF or bare LF terminator.

    A line longer than `max_line_length()` is consumed up to its terminator and reported as
    `net_line_too_long`, the following lines stay readable.
    **/
    awaitable<result<std::string>> read_line_r()
    {
        for (;;)
        {
            const std::size_t eol = read_buffer_.find('\n');
            if (eol != std::string::npos)
            {
                const std::size_t length = (eol > 0 && read_buffer_[eol - 1] == '\r') ? eol - 1 : eol;
                if (length > max_line_length_)
                {
                    read_buffer_.erase(0, eol + 1);
                    co_return fail<std::string>(failure(io_stage::read, asio::error::message_size));
                }
                std::string line = read_buffer_.substr(0, length);
                read_buffer_.erase(0, eol + 1);
                trace_line(log::direction::receive, line);
                co_return ok(std::move(line));
            }
            if (read_buffer_.size() > max_line_length_ + 1)
            {
                COURIER_CO_TRY_VOID(co_await skip_line());
                co_return fail<std::string>(failure(io_stage::read, asio::error::message_size));
            }
            COURIER_CO_TRY_VOID(co_await receive_more());
        }
    }

    /**
    Exactly `size` bytes, the content of an IMAP literal.
    **/
    awaitable<result<std::string>> read_exactly_r(std::size_t size)
    {
        while (read_buffer_.size() < size)
            COURIER_CO_TRY_VOID(co_await receive_more());

        std::string data = read_buffer_.substr(0, size);
        read_buffer_.erase(0, size);
        trace_line(log::direction::receive, data);
        co_return ok(std::move(data));
    }

    /**
    Sending one command line, CRLF is appended when missing.
    **/
    awaitable<result_void> write_line_r(std::string line)
    {
        while (!line.empty() && (line.back() == '\n' || line.back() == '\r'))
            line.pop_back();
        line += "\r\n";
        trace_line(log::direction::send, line);
        co_return co_await send_all(std::move(line));
    }

    /// Sending prepared bytes untouched, such as dot stuffed message data.
    awaitable<result_void> write_raw_r(std::string data)
    {
        trace_line(log::direction::send, data);
        co_return co_await send_all(std::move(data));
    }

    [[nodiscard]] Stream& stream() noexcept { return stream_; }
    [[nodiscard]] const Stream& stream() const noexcept { return stream_; }

    void max_line_length(std::size_t value) noexcept { max_line_length_ = std::min(value, MAX_ALLOWED_LINE_LENGTH); }
    [[nodiscard]] std::size_t max_line_length() const noexcept { return max_line_length_; }

    [[nodiscard]] std::optional<duration> timeout() const noexcept { return timeout_; }

private:
    static constexpr std::size_t READ_CHUNK = 4096;

    /// Shared between an operation and its timer, which may outlive it by one handler call.
    struct watchdog
    {
        std::atomic<bool> finished{false};
        std::atomic<bool> expired{false};
    };

    /**
    Running one socket operation under the dialog timeout.

    @param operation Callable starting the operation with the completion token it is given.
    @param ec        Set to the operation error, `timed_out` when the timer cancelled it.
    **/
    template<typename Operation>
    awaitable<std::size_t> guarded(Operation operation, asio::error_code& ec)
    {
        if (!timeout_.has_value())
            co_return co_await operation(asio::redirect_error(asio::use_awaitable, ec));

        auto watch = std::make_shared<watchdog>();
        asio::steady_timer timer(stream_.get_executor(), *timeout_);
        timer.async_wait([this, watch](const asio::error_code& timer_ec)
        {
            if (timer_ec || watch->finished.load())
                return;
            watch->expired.store(true);
            asio::error_code ignored;
            stream_.lowest_layer().cancel(ignored);
        });

        const std::size_t transferred = co_await operation(asio::redirect_error(asio::use_awaitable, ec));
        watch->finished.store(true);
        timer.cancel();
        if (watch->expired.load() && ec == asio::error::operation_aborted)
            ec = asio::error::timed_out;
        co_return transferred;
    }

    awaitable<result_void> receive_more()
    {
        std::array<char, READ_CHUNK> chunk;
        asio::error_code ec;
        const std::size_t received = co_await guarded([this, &chunk](auto token)
        {
            return stream_.async_read_some(asio::buffer(chunk), std::move(token));
        }, ec);
        read_buffer_.append(chunk.data(), received);
        if (ec)
            co_return fail<void>(failure(io_stage::read, ec));
        co_return ok();
    }

    /// Dropping input up to and including the next line feed.
    awaitable<result_void> skip_line()
    {
        for (;;)
        {
            const std::size_t eol = read_buffer_.find('\n');
            if (eol != std::string::npos)
            {
                read_buffer_.erase(0, eol + 1);
                co_return ok();
            }
            read_buffer_.clear();
            COURIER_CO_TRY_VOID(co_await receive_more());
        }
    }

    awaitable<result_void> send_all(std::string data)
    {
        asio::error_code ec;
        co_await guarded([this, &data](auto token)
        {
            return asio::async_write(stream_, asio::buffer(data), std::move(token));
        }, ec);
        if (ec)
            co_return fail<void>(failure(io_stage::write, ec));
        co_return ok();
    }

    [[nodiscard]] error_info failure(io_stage stage, const asio::error_code& ec) const
    {
        detail::error_detail info;
        info.add("proto", trace_protocol_).add("stage", stage_name(stage)).add("error", ec.message());
        return net_error(stage, ec, info.str());
    }

    void trace_line(log::direction dir, std::string_view data) const
    {
        if (!log::logger::instance().is_trace_enabled())
            return;
        if (dir == log::direction::receive)
            COURIER_TRACE_RECV(trace_protocol_, data);
        else if (redact_secrets_in_trace_)
            COURIER_TRACE_SEND(trace_protocol_, detail::redact_line(data));
        else
            COURIER_TRACE_SEND(trace_protocol_, data);
    }

    Stream stream_;
    std::string read_buffer_;
    std::size_t max_line_length_;
    std::optional<duration> timeout_;

    std::string trace_protocol_{"NET"};
    bool redact_secrets_in_trace_{true};
};

} // namespace courier::net
