/*

imap/types.hpp
--------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <charconv>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <courier/detail/append.hpp>
#include <courier/detail/ascii.hpp>
#include <courier/detail/result.hpp>
#include <courier/detail/sanitize.hpp>
#include <courier/net/dialog.hpp>
#include <courier/net/tls_options.hpp>

namespace courier::imap
{

enum class status
{
    ok,
    no,
    bad,
    preauth,
    bye,
    unknown
};

/**
Everything the server sent for one tagged command.
**/
struct response
{
    std::string tag;
    status st = status::unknown;
    /// Text after the status word of the completion line.
    std::string text;
    std::vector<std::string> untagged_lines;
    std::string tagged_line;
    /// Literal payloads in order of appearance.
    std::vector<std::string> literals;
};

struct options
{
    net::tls_options tls;
    std::chrono::steady_clock::duration timeout = std::chrono::seconds(30);
    /// An untagged SEARCH answer lists every match on a single line.
    std::size_t max_line_length = net::MAX_ALLOWED_LINE_LENGTH;
    bool redact_secrets_in_trace = true;
};

namespace detail_imap
{
    [[nodiscard]] inline std::pair<std::string_view, std::string_view> split_token(std::string_view text)
    {
        while (!text.empty() && text.front() == ' ')
            text.remove_prefix(1);
        const auto pos = text.find(' ');
        if (pos == std::string_view::npos)
            return {text, std::string_view{}};
        std::string_view rest = text.substr(pos + 1);
        while (!rest.empty() && rest.front() == ' ')
            rest.remove_prefix(1);
        return {text.substr(0, pos), rest};
    }

    [[nodiscard]] inline status parse_status_word(std::string_view word)
    {
        if (detail::iequals_ascii(word, "OK"))
            return status::ok;
        if (detail::iequals_ascii(word, "NO"))
            return status::no;
        if (detail::iequals_ascii(word, "BAD"))
            return status::bad;
        if (detail::iequals_ascii(word, "PREAUTH"))
            return status::preauth;
        if (detail::iequals_ascii(word, "BYE"))
            return status::bye;
        return status::unknown;
    }

    [[nodiscard]] inline bool is_tagged_line(std::string_view line, std::string_view tag)
    {
        return !tag.empty() && line.size() > tag.size() && line.substr(0, tag.size()) == tag && line[tag.size()] == ' ';
    }
}

/**
Quoted IMAP string for LOGIN and SELECT arguments.
**/
[[nodiscard]] inline result<std::string> to_astring(std::string_view text)
{
    COURIER_TRY(detail::ensure_no_crlf_or_nul(text, "astring", errc::config_invalid_value));
    std::string out;
    out.reserve(text.size() + 2);
    detail::append_char(out, '"');
    for (char ch : text)
    {
        if (ch == '"' || ch == '\\')
            detail::append_char(out, '\\');
        detail::append_char(out, ch);
    }
    detail::append_char(out, '"');
    return ok(std::move(out));
}

/**
Size announced by a trailing `{n}` or `{n+}` literal marker.
**/
[[nodiscard]] inline std::optional<std::size_t> extract_literal_size(std::string_view line)
{
    if (line.size() < 3 || line.back() != '}')
        return std::nullopt;
    const auto brace = line.rfind('{');
    if (brace == std::string_view::npos)
        return std::nullopt;
    std::string_view inner = line.substr(brace + 1, line.size() - brace - 2);
    if (!inner.empty() && inner.back() == '+')
        inner.remove_suffix(1);
    if (inner.empty())
        return std::nullopt;

    std::size_t value = 0;
    const auto [ptr, ec] = std::from_chars(inner.data(), inner.data() + inner.size(), value);
    if (ec != std::errc{} || ptr != inner.data() + inner.size())
        return std::nullopt;
    return value;
}

/**
Message numbers of a `* SEARCH` line, empty for any other line.
**/
[[nodiscard]] inline std::vector<std::uint32_t> parse_search_ids(std::string_view line)
{
    std::vector<std::uint32_t> ids;
    auto [star, rest] = detail_imap::split_token(line);
    if (star != "*")
        return ids;
    auto [keyword, numbers] = detail_imap::split_token(rest);
    if (!detail::iequals_ascii(keyword, "SEARCH"))
        return ids;

    while (!numbers.empty())
    {
        auto [token, remaining] = detail_imap::split_token(numbers);
        std::uint32_t value = 0;
        const auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
        if (token.empty() || ec != std::errc{} || ptr != token.data() + token.size())
            break;
        ids.push_back(value);
        numbers = remaining;
    }
    return ids;
}

/**
Sorting one received line into the response. Returns true on the tagged completion line.
**/
inline bool absorb_line(response& resp, const std::string& line)
{
    if (detail_imap::is_tagged_line(line, resp.tag))
    {
        auto [word, tail] = detail_imap::split_token(std::string_view(line).substr(resp.tag.size()));
        resp.st = detail_imap::parse_status_word(word);
        resp.text.assign(tail);
        resp.tagged_line = line;
        return true;
    }
    resp.untagged_lines.push_back(line);
    return false;
}

/**
`FLAGS` item of a STORE command: `+FLAGS`, `-FLAGS` or plain `FLAGS`, optionally silent.
**/
[[nodiscard]] inline std::string build_store_item(char mode, bool silent)
{
    std::string item;
    if (mode == '+' || mode == '-')
        detail::append_char(item, mode);
    detail::append_sv(item, silent ? "FLAGS.SILENT" : "FLAGS");
    return item;
}

} // namespace courier::imap
