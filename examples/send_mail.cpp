/*

send_mail.cpp
-------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Sends one message with the settings of the environment (SMTP_HOST, SMTP_PORT, SMTP_USE_TLS, SMTP_USER,
SMTP_PASSWORD, SMTP_FROM). Usage: send_mail <recipient> [subject]

*/

#include <iostream>
#include <string>
#include <courier/courier.hpp>
#include "example_util.hpp"

int main(int argc, char* argv[])
{
    if (argc < 2)
    {
        std::cerr << "Usage: " << argv[0] << " <recipient> [subject]\n";
        return 2;
    }

    courier::log::logger::instance().set_level(courier::log::level::debug);
    courier::log::logger::instance().set_trace_enabled(true);

    auto config = courier::mail_config::from_env();
    if (!config)
    {
        print_error(config.error());
        return 1;
    }

    courier::mail_service service(std::move(*config));

    courier::outbound_message msg;
    msg.to = {argv[1]};
    msg.subject = argc > 2 ? argv[2] : "Test from courier";
    msg.body = "Hello, World!";
    msg.html = "<p>Hello, <b>World</b>!</p>";

    auto res = service.send(msg);
    if (!res)
    {
        print_error(res.error());
        return 1;
    }
    std::cout << "Email sent successfully!" << std::endl;
    return 0;
}
