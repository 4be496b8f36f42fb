/*

fetch_pop3.cpp
--------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Prints the latest messages of a POP3 mailbox. The server comes from POP3_HOST, POP3_PORT and POP3_SSL, the
login from SMTP_USER and SMTP_PASSWORD. Usage: fetch_pop3 [limit]

*/

#include <cstdlib>
#include <iostream>
#include <courier/service/mail_config.hpp>
#include <courier/service/mail_service.hpp>
#include "example_util.hpp"

int main(int argc, char* argv[])
{
    const std::size_t limit = argc > 1 ? static_cast<std::size_t>(std::strtoul(argv[1], nullptr, 10)) : 10;

    auto config = courier::mail_config::from_env();
    if (!config)
    {
        print_error(config.error());
        return 1;
    }
    courier::mail_service service(std::move(*config));

    auto res = service.fetch_pop3(limit);
    if (!res)
    {
        print_error(res.error());
        return 1;
    }
    for (const auto& msg : *res)
        print_message(msg);
    return 0;
}
