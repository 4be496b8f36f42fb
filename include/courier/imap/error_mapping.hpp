/*

imap/error_mapping.hpp
----------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <cstdint>
#include <string_view>

#include <courier/detail/error_detail.hpp>
#include <courier/detail/result.hpp>
#include <courier/imap/types.hpp>

namespace courier::imap
{

/// Error code for a completion status other than OK.
[[nodiscard]] constexpr errc map_imap_status(status st) noexcept
{
    switch (st)
    {
        case status::no: return errc::imap_tagged_no;
        case status::bad: return errc::imap_tagged_bad;
        default: return errc::imap_parse_error;
    }
}

[[nodiscard]] inline detail::error_detail make_imap_detail(std::string_view host, std::string_view command,
    const response& resp)
{
    detail::error_detail detail;
    detail.add("proto", "imap");
    detail.add("host", host);
    detail.add("tag", resp.tag);
    detail.add_redacted("command", command);
    detail.add("tagged.line", resp.tagged_line);
    detail.add_int("untagged.count", static_cast<std::uint64_t>(resp.untagged_lines.size()));
    detail.add_int("literals.count", static_cast<std::uint64_t>(resp.literals.size()));
    return detail;
}

} // namespace courier::imap
