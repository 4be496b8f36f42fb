/*

example_util.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <cstdlib>
#include <iostream>
#include <courier/detail/result.hpp>
#include <courier/service/messages.hpp>

inline void print_error(const courier::error_info& err)
{
    std::cout << "Error: " << courier::to_string(err.code) << " - " << err.message << "\n";
    std::cout << "Kind: " << (err.kind() == courier::failure_kind::configuration ? "configuration" : "transport") << "\n";
    std::cout << "Detail: " << err.detail << "\n";
    std::cout << "Sys: " << err.sys.message() << "\n";
    std::cout << "Where: " << err.where.file_name() << ":" << err.where.line()
              << " " << err.where.function_name() << "\n";
}

inline void print_message(const courier::inbound_message& msg)
{
    std::cout << "From:    " << msg.from << "\n";
    std::cout << "To:      " << msg.to << "\n";
    std::cout << "Date:    " << msg.date << "\n";
    std::cout << "Subject: " << msg.subject << "\n";
    std::cout << msg.plain_text.substr(0, 200) << "\n";
    if (msg.html_text.has_value())
        std::cout << "(HTML body, " << msg.html_text->size() << " bytes)\n";
    std::cout << "----\n";
}
