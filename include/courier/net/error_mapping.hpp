/*

error_mapping.hpp
-----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <source_location>
#include <string>
#include <string_view>
#include <system_error>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <courier/detail/asio_decl.hpp>
#include <courier/detail/error_detail.hpp>
#include <courier/detail/result.hpp>

namespace courier::net
{

/// Step of a session's socket I/O, kept in the error detail.
enum class io_stage
{
    resolve,
    connect,
    read,
    write,
    handshake
};

[[nodiscard]] constexpr std::string_view stage_name(io_stage stage) noexcept
{
    switch (stage)
    {
        case io_stage::resolve: return "resolve";
        case io_stage::connect: return "connect";
        case io_stage::read: return "read";
        case io_stage::write: return "write";
        case io_stage::handshake: return "handshake";
    }
    return "?";
}

/// Whether a handshake failed because the peer certificate was not trusted.
[[nodiscard]] inline bool is_certificate_rejection(const asio::error_code& ec) noexcept
{
    return ec.category() == asio::error::get_ssl_category() &&
        ERR_GET_REASON(static_cast<unsigned long>(ec.value())) == SSL_R_CERTIFICATE_VERIFY_FAILED;
}

/**
Library code of an Asio failure. Codes with a meaning of their own win, the stage decides for the rest.
**/
[[nodiscard]] inline errc map_net_error(io_stage stage, const asio::error_code& ec) noexcept
{
    if (ec == asio::error::timed_out)
        return errc::net_timeout;
    if (ec == asio::error::operation_aborted)
        return errc::net_cancelled;
    if (ec == asio::error::eof || ec == asio::ssl::error::stream_truncated)
        return errc::net_eof;
    if (ec == asio::error::message_size)
        return errc::net_line_too_long;
    if (ec == asio::error::connection_refused)
        return errc::net_connection_refused;
    if (ec == asio::error::connection_reset || ec == asio::error::broken_pipe)
        return errc::net_connection_reset;
    if (ec == asio::error::host_not_found || ec == asio::error::host_not_found_try_again)
        return errc::net_resolve_failed;

    switch (stage)
    {
        case io_stage::resolve:
            return errc::net_resolve_failed;
        case io_stage::connect:
            return errc::net_connect_failed;
        case io_stage::handshake:
            return is_certificate_rejection(ec) ? errc::tls_verify_failed : errc::tls_handshake_failed;
        case io_stage::read:
        case io_stage::write:
            break;
    }
    return errc::net_io_failed;
}

/// Where a session was connecting to, the base of every network error detail.
[[nodiscard]] inline detail::error_detail make_net_detail(std::string_view proto, std::string_view host,
    std::string_view service, io_stage stage)
{
    detail::error_detail info;
    info.add("proto", proto).add("host", host).add("service", service).add("stage", stage_name(stage));
    return info;
}

/**
Error of a failed socket or TLS operation, the Asio code kept in `sys`.
**/
[[nodiscard]] inline error_info net_error(io_stage stage, const asio::error_code& ec, std::string detail = {},
    std::source_location where = std::source_location::current())
{
    const errc code = map_net_error(stage, ec);
    std::string message;
    if (code == errc::tls_verify_failed)
        message = "TLS certificate verification failed.";
    else if (code == errc::net_line_too_long)
        message = "Protocol line exceeds the length limit.";
    else if (stage == io_stage::handshake)
        message = "TLS handshake failed.";
    else
    {
        message = "Network ";
        message += stage_name(stage);
        message += " failure.";
    }
    return make_error(code, std::move(message), std::move(detail), std::error_code(ec.value(), ec.category()), where);
}

} // namespace courier::net
