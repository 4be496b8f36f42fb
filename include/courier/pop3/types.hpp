/*

pop3/types.hpp
--------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <chrono>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <courier/net/dialog.hpp>
#include <courier/net/tls_options.hpp>

namespace courier::pop3
{

/// Message number to size in octets, as listed by LIST.
using message_list = std::map<unsigned, unsigned long>;

/// Status line split into its indicator and the text after it.
struct status_line
{
    bool positive = false;
    std::string text;
};

struct options
{
    net::tls_options tls;
    std::chrono::steady_clock::duration timeout = std::chrono::seconds(30);
    std::size_t max_line_length = net::DEFAULT_MAX_LINE_LENGTH;
    bool redact_secrets_in_trace = true;
};

inline constexpr std::string_view OK_RESPONSE = "+OK";
inline constexpr std::string_view ERR_RESPONSE = "-ERR";
inline constexpr std::string_view END_OF_DATA = ".";

} // namespace courier::pop3
