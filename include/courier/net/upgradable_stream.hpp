/*

upgradable_stream.hpp
---------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include <boost/asio/ssl/host_name_verification.hpp>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <openssl/x509_vfy.h>

#include <courier/detail/asio_decl.hpp>
#include <courier/detail/error_detail.hpp>
#include <courier/detail/result.hpp>
#include <courier/net/error_mapping.hpp>
#include <courier/net/tls_options.hpp>

namespace courier::net
{

using courier::asio::any_io_executor;
using courier::asio::awaitable;
using courier::asio::tcp;
namespace ssl = courier::asio::ssl;

/**
Stream that starts as plain TCP and can be upgraded to TLS in place.

Used for both STARTTLS (upgrade after the greeting) and implicit TLS
(upgrade right after connect). The dialog above it never changes type.
**/
class upgradable_stream
{
public:
    using ssl_stream = ssl::stream<tcp::socket>;
    using executor_type = any_io_executor;
    using lowest_layer_type = std::remove_reference_t<decltype(std::declval<ssl_stream&>().lowest_layer())>;

    explicit upgradable_stream(tcp::socket socket)
        : stream_(std::move(socket))
    {
    }

    executor_type get_executor()
    {
        return std::visit([](auto& stream) -> executor_type
        {
            return executor_type(stream.get_executor());
        }, stream_);
    }

    lowest_layer_type& lowest_layer()
    {
        return std::visit([](auto& stream) -> lowest_layer_type&
        {
            return stream.lowest_layer();
        }, stream_);
    }

    [[nodiscard]] bool is_tls() const noexcept
    {
        return std::holds_alternative<ssl_stream>(stream_);
    }

    template<typename MutableBufferSequence, typename CompletionToken>
    auto async_read_some(const MutableBufferSequence& buffers, CompletionToken&& token)
    {
        return std::visit([&](auto& stream) -> decltype(auto)
        {
            return stream.async_read_some(buffers, std::forward<CompletionToken>(token));
        }, stream_);
    }

    template<typename ConstBufferSequence, typename CompletionToken>
    auto async_write_some(const ConstBufferSequence& buffers, CompletionToken&& token)
    {
        return std::visit([&](auto& stream) -> decltype(auto)
        {
            return stream.async_write_some(buffers, std::forward<CompletionToken>(token));
        }, stream_);
    }

    /**
    Perform the client handshake over the current connection.

    @param context Client context, must outlive the stream.
    @param sni     Host name sent as SNI and checked against the certificate.
    @param opt     Verification policy.
    **/
    awaitable<result_void> start_tls(ssl::context& context, std::string sni, const tls_options& opt)
    {
        if (is_tls())
            co_return ok();

        auto socket = std::move(std::get<tcp::socket>(stream_));
        stream_.template emplace<ssl_stream>(std::move(socket), context);
        auto& tls_stream = std::get<ssl_stream>(stream_);

        if (!sni.empty())
            SSL_set_tlsext_host_name(tls_stream.native_handle(), sni.c_str());

        if (opt.verify == verify_mode::peer)
        {
            tls_stream.set_verify_mode(ssl::verify_peer);
            if (opt.verify_host)
            {
                if (sni.empty())
                    co_return fail_void(errc::tls_verify_failed, "TLS hostname verification requires a host name.");
                tls_stream.set_verify_callback([verifier = ssl::host_name_verification(sni),
                    allow_self_signed = opt.allow_self_signed](bool preverified, ssl::verify_context& ctx) mutable
                {
                    if (!relax_verify(preverified, ctx, allow_self_signed))
                        return false;
                    return verifier(true, ctx);
                });
            }
            else if (opt.allow_self_signed)
            {
                tls_stream.set_verify_callback([](bool preverified, ssl::verify_context& ctx)
                {
                    return relax_verify(preverified, ctx, true);
                });
            }
        }
        else
            tls_stream.set_verify_mode(ssl::verify_none);

        asio::error_code ec;
        co_await tls_stream.async_handshake(ssl::stream_base::client,
            asio::redirect_error(asio::use_awaitable, ec));
        if (ec)
        {
            detail::error_detail info;
            info.add("sni", sni).add("stage", stage_name(io_stage::handshake)).add("error", ec.message());
            co_return fail<void>(net_error(io_stage::handshake, ec, info.str()));
        }
        co_return ok();
    }

    /**
    Close the transport without a TLS close_notify exchange.
    **/
    void close() noexcept
    {
        asio::error_code ec;
        auto& socket = lowest_layer();
        if (!socket.is_open())
            return;
        socket.shutdown(tcp::socket::shutdown_both, ec);
        socket.close(ec);
    }

private:
    static bool relax_verify(bool preverified, ssl::verify_context& ctx, bool allow_self_signed) noexcept
    {
        if (preverified)
            return true;
        if (!allow_self_signed)
            return false;

        X509_STORE_CTX* store_ctx = ctx.native_handle();
        if (store_ctx == nullptr)
            return false;

        const int err = X509_STORE_CTX_get_error(store_ctx);
        return err == X509_V_ERR_SELF_SIGNED_CERT_IN_CHAIN || err == X509_V_ERR_DEPTH_ZERO_SELF_SIGNED_CERT;
    }

    std::variant<tcp::socket, ssl_stream> stream_;
};

} // namespace courier::net
