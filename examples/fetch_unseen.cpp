/*

fetch_unseen.cpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Lists the unseen messages of an IMAP folder without marking them as seen. The server comes from IMAP_HOST,
IMAP_PORT and IMAP_SSL, the login from SMTP_USER and SMTP_PASSWORD. Usage: fetch_unseen [folder] [limit]

*/

#include <cstdlib>
#include <iostream>
#include <string>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>
#include <courier/service/mail_config.hpp>
#include <courier/service/mail_service.hpp>
#include "example_util.hpp"

int main(int argc, char* argv[])
{
    const std::string folder = argc > 1 ? argv[1] : "INBOX";
    const std::size_t limit = argc > 2 ? static_cast<std::size_t>(std::strtoul(argv[2], nullptr, 10)) : 20;

    auto config = courier::mail_config::from_env();
    if (!config)
    {
        print_error(config.error());
        return 1;
    }
    courier::mail_service service(std::move(*config));

    // The coroutine flavour, driven by an application owned context.
    boost::asio::io_context io_ctx;
    auto fut = boost::asio::co_spawn(io_ctx, service.co_fetch_unseen(folder, limit, false), boost::asio::use_future);
    io_ctx.run();

    auto res = fut.get();
    if (!res)
    {
        print_error(res.error());
        return 1;
    }
    std::cout << res->size() << " unseen message(s) in " << folder << "\n";
    for (const auto& msg : *res)
        print_message(msg);
    return 0;
}
