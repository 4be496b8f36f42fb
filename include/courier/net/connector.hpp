/*

connector.hpp
-------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

#include <courier/detail/asio_decl.hpp>
#include <courier/detail/log.hpp>
#include <courier/detail/result.hpp>
#include <courier/net/error_mapping.hpp>
#include <courier/net/upgradable_stream.hpp>

namespace courier::net
{

/**
Resolve `host` and connect to the first reachable endpoint.

The timeout bounds resolution and connection together. When it expires the
socket is closed and the result is `net_timeout`.
**/
inline awaitable<result<upgradable_stream>> open_stream(any_io_executor executor, std::string host,
    std::string service, std::chrono::steady_clock::duration timeout, std::string_view proto)
{
    struct connect_state
    {
        bool done{false};
        bool timed_out{false};
    };

    tcp::resolver resolver(executor);
    tcp::socket socket(executor);
    asio::steady_timer timer(executor);
    auto state = std::make_shared<connect_state>();

    timer.expires_after(timeout);
    timer.async_wait([state, &resolver, &socket](asio::error_code ec)
    {
        if (ec || state->done)
            return;
        state->timed_out = true;
        resolver.cancel();
        asio::error_code ignore_ec;
        socket.close(ignore_ec);
    });

    COURIER_DEBUG("Connecting to " + host + ":" + service);

    asio::error_code ec;
    auto endpoints = co_await resolver.async_resolve(host, service, asio::redirect_error(asio::use_awaitable, ec));
    if (ec)
    {
        state->done = true;
        timer.cancel();
        const auto stage_ec = state->timed_out ? asio::error_code(asio::error::timed_out) : ec;
        co_return fail<upgradable_stream>(net_error(io_stage::resolve, stage_ec,
            make_net_detail(proto, host, service, io_stage::resolve).add("error", ec.message()).str()));
    }

    co_await asio::async_connect(socket, endpoints, asio::redirect_error(asio::use_awaitable, ec));
    state->done = true;
    timer.cancel();
    if (state->timed_out)
        ec = asio::error::timed_out;
    if (ec)
    {
        co_return fail<upgradable_stream>(net_error(io_stage::connect, ec,
            make_net_detail(proto, host, service, io_stage::connect).add("error", ec.message()).str()));
    }

    co_return ok(upgradable_stream(std::move(socket)));
}

} // namespace courier::net
