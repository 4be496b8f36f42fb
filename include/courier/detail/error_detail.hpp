/*

error_detail.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <courier/detail/redact.hpp>

namespace courier::detail
{

/**
Builder of the `detail` block of an error: one `key=value` entry per line.

Line breaks inside a value are turned into spaces, a server reply therefore never adds entries of its own.
**/
class error_detail
{
public:
    error_detail& add(std::string_view key, std::string_view value)
    {
        text_.append(key);
        text_ += '=';
        for (const char ch : value)
            text_ += (ch == '\r' || ch == '\n') ? ' ' : ch;
        text_ += '\n';
        return *this;
    }

    /// A command line with its credentials replaced and its line break dropped.
    error_detail& add_redacted(std::string_view key, std::string_view line)
    {
        std::string clean = redact_line(line);
        while (!clean.empty() && (clean.back() == '\r' || clean.back() == '\n'))
            clean.pop_back();
        return add(key, clean);
    }

    error_detail& add_int(std::string_view key, std::uint64_t value)
    {
        return add(key, std::to_string(value));
    }

    /// Each line under `<prefix><index>`, counting from zero.
    error_detail& add_lines(std::string_view prefix, const std::vector<std::string>& lines)
    {
        std::string key(prefix);
        for (std::size_t i = 0; i < lines.size(); ++i)
        {
            key.resize(prefix.size());
            key += std::to_string(i);
            add(key, lines[i]);
        }
        return *this;
    }

    [[nodiscard]] bool empty() const noexcept { return text_.empty(); }

    [[nodiscard]] const std::string& str() const noexcept { return text_; }

private:
    std::string text_;
};

} // namespace courier::detail
