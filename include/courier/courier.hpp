/*

courier.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <courier/detail/log.hpp>
#include <courier/detail/result.hpp>

#include <courier/codec/base64.hpp>
#include <courier/codec/charset.hpp>
#include <courier/codec/q_codec.hpp>
#include <courier/codec/quoted_printable.hpp>

#include <courier/mime/body.hpp>
#include <courier/mime/composer.hpp>

#include <courier/net/dialog.hpp>
#include <courier/net/tls_options.hpp>
#include <courier/net/upgradable_stream.hpp>

#include <courier/imap/types.hpp>
#include <courier/imap/client.hpp>
#include <courier/pop3/types.hpp>
#include <courier/pop3/client.hpp>
#include <courier/smtp/types.hpp>
#include <courier/smtp/client.hpp>

// Service layer
#include <courier/service/mail_config.hpp>
#include <courier/service/messages.hpp>
#include <courier/service/mail_service.hpp>
