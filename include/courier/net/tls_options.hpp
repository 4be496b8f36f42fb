/*

tls_options.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <courier/detail/asio_decl.hpp>
#include <courier/detail/result.hpp>

namespace courier::net
{

/// How a session reaches TLS: never, by upgrading after the greeting, or from the first byte.
enum class tls_mode
{
    none,
    starttls,
    implicit
};

[[nodiscard]] constexpr std::string_view to_string(tls_mode mode) noexcept
{
    switch (mode)
    {
        case tls_mode::none: return "plain";
        case tls_mode::starttls: return "starttls";
        case tls_mode::implicit: return "tls";
    }
    return "?";
}

enum class verify_mode
{
    none,
    peer
};

/**
Client side TLS policy. The defaults give the "default secure context":
system trust store, peer and host name verification, TLS 1.2 or newer.
**/
struct tls_options
{
    verify_mode verify = verify_mode::peer;
    bool verify_host = true;
    std::optional<int> min_tls_version = TLS1_2_VERSION;
    std::string cipher_list;
    bool use_default_verify_paths = true;
    std::vector<std::string> ca_files;
    bool allow_self_signed = false;
};

namespace detail_tls
{
    [[nodiscard]] inline std::string openssl_error_message()
    {
        const unsigned long err = ERR_get_error();
        if (err == 0)
            return {};
        char buffer[256];
        ERR_error_string_n(err, buffer, sizeof(buffer));
        return std::string(buffer);
    }
}

/**
Build a client context configured with the trust store and hardening from `opt`.
**/
[[nodiscard]] inline result<asio::ssl::context> make_client_context(const tls_options& opt)
{
    asio::ssl::context context(asio::ssl::context::tls_client);

    if (opt.use_default_verify_paths)
    {
        if (SSL_CTX_set_default_verify_paths(context.native_handle()) != 1)
            return fail<asio::ssl::context>(errc::tls_verify_failed,
                "TLS default trust store unavailable.", detail_tls::openssl_error_message());
    }
    for (const auto& file : opt.ca_files)
    {
        if (SSL_CTX_load_verify_locations(context.native_handle(), file.c_str(), nullptr) != 1)
            return fail<asio::ssl::context>(errc::tls_verify_failed,
                "TLS CA file could not be loaded.", file);
    }
    if (opt.min_tls_version.has_value())
    {
        if (SSL_CTX_set_min_proto_version(context.native_handle(), opt.min_tls_version.value()) != 1)
            return fail<asio::ssl::context>(errc::tls_handshake_failed,
                "TLS min version configuration failed.", detail_tls::openssl_error_message());
    }
    if (!opt.cipher_list.empty())
    {
        if (SSL_CTX_set_cipher_list(context.native_handle(), opt.cipher_list.c_str()) != 1)
            return fail<asio::ssl::context>(errc::tls_handshake_failed,
                "TLS cipher list configuration failed.", detail_tls::openssl_error_message());
    }
    return ok(std::move(context));
}

} // namespace courier::net
