/*

result.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Error handling types using std::expected (C++23).
The public API of courier does not throw: every failure is returned via result<T>.

*/

#pragma once

#include <cstdint>
#include <expected>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include <courier/detail/error_detail.hpp>

namespace courier
{

/// Error codes for courier operations
enum class errc : std::uint16_t
{
    // Configuration errors, raised before any I/O
    config_missing_host = 1,
    config_missing_sender,
    config_missing_recipient,
    config_invalid_value,
    config_invalid_header,

    // Network errors
    net_resolve_failed = 100,
    net_connect_failed,
    net_connection_refused,
    net_connection_reset,
    net_io_failed,
    net_timeout,
    net_eof,
    net_cancelled,
    net_line_too_long,

    // TLS errors
    tls_handshake_failed = 200,
    tls_verify_failed,

    // SMTP errors
    smtp_bad_reply = 300,
    smtp_service_not_available,
    smtp_auth_failed,
    smtp_mail_from_rejected,
    smtp_rejected_recipient,
    smtp_data_rejected,
    smtp_temporary_failure,
    smtp_permanent_failure,
    smtp_invalid_state,

    // IMAP errors
    imap_tagged_no = 400,
    imap_tagged_bad,
    imap_parse_error,
    imap_invalid_state,

    // POP3 errors
    pop3_negative_response = 500,
    pop3_auth_failed,
    pop3_invalid_state,
    pop3_parse_error
};

[[nodiscard]] constexpr std::string_view to_string(errc code) noexcept
{
    switch (code)
    {
        case errc::config_missing_host: return "config_missing_host";
        case errc::config_missing_sender: return "config_missing_sender";
        case errc::config_missing_recipient: return "config_missing_recipient";
        case errc::config_invalid_value: return "config_invalid_value";
        case errc::config_invalid_header: return "config_invalid_header";
        case errc::net_resolve_failed: return "net_resolve_failed";
        case errc::net_connect_failed: return "net_connect_failed";
        case errc::net_connection_refused: return "net_connection_refused";
        case errc::net_connection_reset: return "net_connection_reset";
        case errc::net_io_failed: return "net_io_failed";
        case errc::net_timeout: return "net_timeout";
        case errc::net_eof: return "net_eof";
        case errc::net_cancelled: return "net_cancelled";
        case errc::net_line_too_long: return "net_line_too_long";
        case errc::tls_handshake_failed: return "tls_handshake_failed";
        case errc::tls_verify_failed: return "tls_verify_failed";
        case errc::smtp_bad_reply: return "smtp_bad_reply";
        case errc::smtp_service_not_available: return "smtp_service_not_available";
        case errc::smtp_auth_failed: return "smtp_auth_failed";
        case errc::smtp_mail_from_rejected: return "smtp_mail_from_rejected";
        case errc::smtp_rejected_recipient: return "smtp_rejected_recipient";
        case errc::smtp_data_rejected: return "smtp_data_rejected";
        case errc::smtp_temporary_failure: return "smtp_temporary_failure";
        case errc::smtp_permanent_failure: return "smtp_permanent_failure";
        case errc::smtp_invalid_state: return "smtp_invalid_state";
        case errc::imap_tagged_no: return "imap_tagged_no";
        case errc::imap_tagged_bad: return "imap_tagged_bad";
        case errc::imap_parse_error: return "imap_parse_error";
        case errc::imap_invalid_state: return "imap_invalid_state";
        case errc::pop3_negative_response: return "pop3_negative_response";
        case errc::pop3_auth_failed: return "pop3_auth_failed";
        case errc::pop3_invalid_state: return "pop3_invalid_state";
        case errc::pop3_parse_error: return "pop3_parse_error";
    }
    return "unknown";
}

/// Coarse classification used by callers that only care who is at fault.
enum class failure_kind
{
    configuration,  ///< Missing or invalid settings, detected before any I/O
    transport       ///< Network, TLS, authentication or protocol failure
};

[[nodiscard]] constexpr failure_kind failure_kind_of(errc code) noexcept
{
    return static_cast<std::uint16_t>(code) < 100 ? failure_kind::configuration : failure_kind::transport;
}

struct error_info
{
    errc code{errc::net_io_failed};
    std::string message;
    std::string detail;
    std::error_code sys;
    std::source_location where;

    [[nodiscard]] failure_kind kind() const noexcept
    {
        return failure_kind_of(code);
    }
};

template<typename T>
using result = std::expected<T, error_info>;

using result_void = result<void>;

[[nodiscard]] inline error_info make_error(errc code, std::string message, std::string detail = {},
    std::error_code sys = {}, std::source_location where = std::source_location::current())
{
    return error_info{code, std::move(message), std::move(detail), sys, where};
}

[[nodiscard]] inline result_void ok()
{
    return result_void{};
}

template<typename T>
[[nodiscard]] result<std::decay_t<T>> ok(T&& value)
{
    return result<std::decay_t<T>>(std::forward<T>(value));
}

template<typename T>
[[nodiscard]] result<T> fail(error_info err)
{
    return std::unexpected(std::move(err));
}

template<typename T>
[[nodiscard]] result<T> fail(errc code, std::string message, std::string detail = {},
    std::error_code sys = {}, std::source_location where = std::source_location::current())
{
    return std::unexpected(make_error(code, std::move(message), std::move(detail), sys, where));
}

template<typename T>
[[nodiscard]] result<T> fail(errc code, std::string message, const detail::error_detail& detail,
    std::error_code sys = {}, std::source_location where = std::source_location::current())
{
    return std::unexpected(make_error(code, std::move(message), detail.str(), sys, where));
}

[[nodiscard]] inline result_void fail_void(errc code, std::string message, std::string detail = {},
    std::error_code sys = {}, std::source_location where = std::source_location::current())
{
    return fail<void>(code, std::move(message), std::move(detail), sys, where);
}

[[nodiscard]] inline result_void fail_void(errc code, std::string message, const detail::error_detail& detail,
    std::error_code sys = {}, std::source_location where = std::source_location::current())
{
    return fail<void>(code, std::move(message), detail.str(), sys, where);
}

/// One line summary, used by logs and examples.
[[nodiscard]] inline std::string describe(const error_info& err)
{
    std::string out(to_string(err.code));
    out += ": ";
    out += err.message;
    if (err.sys)
    {
        out += " (";
        out += err.sys.message();
        out += ")";
    }
    return out;
}

} // namespace courier

#define COURIER_DETAIL_CONCAT_INNER(a, b) a##b
#define COURIER_DETAIL_CONCAT(a, b) COURIER_DETAIL_CONCAT_INNER(a, b)
#define COURIER_DETAIL_TMP COURIER_DETAIL_CONCAT(courier_try_, __LINE__)

/// Propagate the error of a result expression out of a regular function.
#define COURIER_TRY(expr)                                                   \
    do                                                                      \
    {                                                                       \
        auto&& courier_try_res = (expr);                                    \
        if (!courier_try_res)                                               \
            return std::unexpected(std::move(courier_try_res).error());     \
    } while (false)

/// Declare or assign `lhs` from a result expression, propagating its error.
#define COURIER_TRY_ASSIGN(lhs, expr)                                       \
    auto COURIER_DETAIL_TMP = (expr);                                       \
    if (!COURIER_DETAIL_TMP)                                                \
        return std::unexpected(std::move(COURIER_DETAIL_TMP).error());      \
    lhs = std::move(*COURIER_DETAIL_TMP)

/// Coroutine flavour of COURIER_TRY; `expr` may contain co_await.
#define COURIER_CO_TRY_VOID(expr)                                           \
    do                                                                      \
    {                                                                       \
        auto courier_try_res = (expr);                                      \
        if (!courier_try_res)                                               \
            co_return std::unexpected(std::move(courier_try_res).error());  \
    } while (false)

/// Coroutine flavour of COURIER_TRY_ASSIGN.
#define COURIER_CO_TRY_ASSIGN(lhs, expr)                                    \
    auto COURIER_DETAIL_TMP = (expr);                                       \
    if (!COURIER_DETAIL_TMP)                                                \
        co_return std::unexpected(std::move(COURIER_DETAIL_TMP).error());   \
    lhs = std::move(*COURIER_DETAIL_TMP)
