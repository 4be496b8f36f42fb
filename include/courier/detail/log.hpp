/*

log.hpp
-------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Process wide logger of the library. Records go to a caller supplied sink, or to stderr when none is set.
Protocol lines are traced only when tracing is switched on.

*/

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iostream>
#include <mutex>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>

namespace courier::log
{

enum class level : std::uint8_t
{
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    off = 5
};

/// Whether a traced protocol line was written to or read from the server.
enum class direction : std::uint8_t
{
    send,
    receive
};

[[nodiscard]] constexpr std::string_view to_string(level lvl) noexcept
{
    switch (lvl)
    {
        case level::trace: return "TRACE";
        case level::debug: return "DEBUG";
        case level::info:  return "INFO";
        case level::warn:  return "WARN";
        case level::error: return "ERROR";
        case level::off:   return "OFF";
    }
    return "?";
}

/// One protocol line, e.g. `SMTP >>> EHLO host`.
struct wire_line
{
    std::string protocol;
    direction dir = direction::send;
    std::string text;
};

struct record
{
    level lvl = level::info;
    std::chrono::system_clock::time_point when;
    std::string message;
    std::source_location where;
    /// Set for protocol trace records, `message` is empty then.
    std::optional<wire_line> wire;
};

using sink_t = std::function<void(const record&)>;


/**
Thread safe logger singleton.

The level and the trace switch are atomics, the sink is guarded by a mutex which is also held while a record is
written, so records of concurrent sessions never interleave.
**/
class logger
{
public:
    static logger& instance() noexcept
    {
        static logger inst;
        return inst;
    }

    logger(const logger&) = delete;
    logger& operator=(const logger&) = delete;

    void set_level(level lvl) noexcept
    {
        threshold_.store(static_cast<std::uint8_t>(lvl), std::memory_order_relaxed);
    }

    [[nodiscard]] level get_level() const noexcept
    {
        return static_cast<level>(threshold_.load(std::memory_order_relaxed));
    }

    [[nodiscard]] bool is_enabled(level lvl) const noexcept
    {
        return lvl != level::off && static_cast<std::uint8_t>(lvl) >= threshold_.load(std::memory_order_relaxed);
    }

    /// Replacing the stderr output; an empty function restores it.
    void set_callback(sink_t sink)
    {
        std::lock_guard lock(mutex_);
        sink_ = std::move(sink);
    }

    void clear_callback()
    {
        set_callback(nullptr);
    }

    void set_trace_enabled(bool enabled) noexcept
    {
        tracing_.store(enabled, std::memory_order_relaxed);
    }

    [[nodiscard]] bool is_trace_enabled() const noexcept
    {
        return tracing_.load(std::memory_order_relaxed);
    }

    void log(level lvl, std::string_view message, std::source_location where = std::source_location::current())
    {
        if (!is_enabled(lvl))
            return;

        record rec;
        rec.lvl = lvl;
        rec.when = std::chrono::system_clock::now();
        rec.message = std::string(message);
        rec.where = where;
        emit(rec);
    }

    /**
    Tracing one protocol line. The caller redacts secrets before, this only trims the line ending.
    **/
    void trace_protocol(std::string_view protocol, direction dir, std::string_view text,
        std::source_location where = std::source_location::current())
    {
        if (!is_trace_enabled())
            return;

        while (!text.empty() && (text.back() == '\n' || text.back() == '\r'))
            text.remove_suffix(1);

        record rec;
        rec.lvl = level::trace;
        rec.when = std::chrono::system_clock::now();
        rec.where = where;
        rec.wire = wire_line{std::string(protocol), dir, std::string(text)};
        emit(rec);
    }

private:
    logger() = default;

    static constexpr std::size_t MAX_TRACE_LENGTH = 512;

    void emit(const record& rec)
    {
        std::lock_guard lock(mutex_);
        if (sink_)
            sink_(rec);
        else
            write_stderr(rec);
    }

    static void write_stderr(const record& rec)
    {
        const std::time_t seconds = std::chrono::system_clock::to_time_t(rec.when);
        const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
            rec.when.time_since_epoch()).count() % 1000;
        std::tm local{};
        localtime_r(&seconds, &local);

        char stamp[24];
        std::snprintf(stamp, sizeof(stamp), "%02d:%02d:%02d.%03d", local.tm_hour, local.tm_min, local.tm_sec,
            static_cast<int>(millis));

        if (rec.wire.has_value())
            std::cerr << stamp << ' ' << rec.wire->protocol << (rec.wire->dir == direction::send ? " >>> " : " <<< ")
                << printable(rec.wire->text) << '\n';
        else
            std::cerr << stamp << " courier " << to_string(rec.lvl) << ": " << rec.message << '\n';
    }

    /// Control characters shown as dots, long literals cut.
    static std::string printable(std::string_view text)
    {
        std::string out(text.substr(0, MAX_TRACE_LENGTH));
        for (char& ch : out)
            if (static_cast<unsigned char>(ch) < 0x20 || ch == 0x7f)
                ch = '.';
        if (text.size() > MAX_TRACE_LENGTH)
            out += " [" + std::to_string(text.size() - MAX_TRACE_LENGTH) + " more bytes]";
        return out;
    }

    std::atomic<std::uint8_t> threshold_{static_cast<std::uint8_t>(level::info)};
    std::atomic<bool> tracing_{false};
    std::mutex mutex_;
    sink_t sink_;
};

} // namespace courier::log

#define COURIER_LOG(lvl, msg) \
    ::courier::log::logger::instance().log(lvl, msg, std::source_location::current())

#define COURIER_DEBUG(msg)  COURIER_LOG(::courier::log::level::debug, msg)
#define COURIER_INFO(msg)   COURIER_LOG(::courier::log::level::info, msg)
#define COURIER_WARN(msg)   COURIER_LOG(::courier::log::level::warn, msg)
#define COURIER_ERROR(msg)  COURIER_LOG(::courier::log::level::error, msg)

#define COURIER_TRACE_SEND(protocol, text) \
    ::courier::log::logger::instance().trace_protocol(protocol, ::courier::log::direction::send, text)

#define COURIER_TRACE_RECV(protocol, text) \
    ::courier::log::logger::instance().trace_protocol(protocol, ::courier::log::direction::receive, text)
