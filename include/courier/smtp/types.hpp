/*

smtp/types.hpp
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

#include <courier/detail/ascii.hpp>
#include <courier/detail/result.hpp>
#include <courier/net/tls_options.hpp>

namespace courier::smtp
{

struct reply
{
    int status = 0;
    std::vector<std::string> lines;

    [[nodiscard]] bool is_positive_completion() const noexcept { return status / 100 == 2; }
    [[nodiscard]] bool is_positive_intermediate() const noexcept { return status / 100 == 3; }
    [[nodiscard]] bool is_transient_negative() const noexcept { return status / 100 == 4; }
    [[nodiscard]] bool is_permanent_negative() const noexcept { return status / 100 == 5; }

    [[nodiscard]] std::string message() const
    {
        std::string out;
        for (std::size_t i = 0; i < lines.size(); ++i)
        {
            if (i != 0)
                out += "\n";
            out += lines[i];
        }
        return out;
    }
};

/**
Accumulates the lines of one possibly multiline reply (`250-...` continued, `250 ...` last).
**/
class reply_parser
{
public:
    /**
    Feeding the next line.

    @return True when the reply is complete, an `smtp_bad_reply` error when the line is malformed or its code
            differs from the previous lines.
    **/
    [[nodiscard]] result<bool> feed(std::string_view line)
    {
        if (line.size() < 3 || !detail::is_ascii_digit(line[0]) || !detail::is_ascii_digit(line[1]) ||
            !detail::is_ascii_digit(line[2]))
            return fail<bool>(errc::smtp_bad_reply, "Parsing server failure.", std::string(line));

        const int code = (line[0] - '0') * 100 + (line[1] - '0') * 10 + (line[2] - '0');
        bool last = true;
        if (line.size() >= 4)
        {
            if (line[3] == '-')
                last = false;
            else if (line[3] != ' ')
                return fail<bool>(errc::smtp_bad_reply, "Parsing server failure.", std::string(line));
        }

        if (reply_.status == 0)
            reply_.status = code;
        else if (reply_.status != code)
            return fail<bool>(errc::smtp_bad_reply, "Inconsistent reply code.", std::string(line));

        reply_.lines.emplace_back(line.size() > 4 ? line.substr(4) : std::string_view{});
        return ok(last);
    }

    [[nodiscard]] reply take()
    {
        reply out = std::move(reply_);
        reply_ = reply{};
        return out;
    }

private:
    reply reply_;
};

/**
EHLO keywords with their parameters, keys in upper case.
**/
struct capabilities
{
    std::map<std::string, std::vector<std::string>> entries;

    [[nodiscard]] bool empty() const noexcept { return entries.empty(); }

    [[nodiscard]] bool supports(std::string_view capability) const
    {
        return entries.find(detail::to_upper_copy(capability)) != entries.end();
    }

    [[nodiscard]] const std::vector<std::string>* parameters(std::string_view capability) const
    {
        auto it = entries.find(detail::to_upper_copy(capability));
        return it == entries.end() ? nullptr : &it->second;
    }

    /**
    Building from an EHLO reply, the first line is the server greeting and is skipped.
    **/
    static capabilities parse(const reply& rep)
    {
        capabilities caps;
        for (std::size_t i = 1; i < rep.lines.size(); ++i)
        {
            std::vector<std::string> tokens;
            std::string current;
            for (char ch : rep.lines[i])
            {
                if (ch == ' ' || ch == '=')
                {
                    // AUTH=LOGIN is an old spelling of AUTH LOGIN.
                    if (!current.empty())
                        tokens.push_back(std::move(current));
                    current.clear();
                    continue;
                }
                current.push_back(ch);
            }
            if (!current.empty())
                tokens.push_back(std::move(current));
            if (tokens.empty())
                continue;

            auto& slot = caps.entries[detail::to_upper_copy(tokens.front())];
            for (std::size_t t = 1; t < tokens.size(); ++t)
                slot.push_back(detail::to_upper_copy(tokens[t]));
        }
        return caps;
    }
};

struct options
{
    net::tls_options tls;
    /// Bounds the connect and every read or write.
    std::chrono::steady_clock::duration timeout = std::chrono::seconds(30);
    /// Name sent with EHLO/HELO, the local host name when empty.
    std::string helo_name;
    bool redact_secrets_in_trace = true;
};

/**
Transparency for the DATA phase: line ends become CRLF, lines starting with a dot get a second one and the
end of data marker is appended.
**/
[[nodiscard]] inline std::string dot_stuff(std::string_view data)
{
    std::string out;
    out.reserve(data.size() + data.size() / 64 + 5);
    bool line_start = true;
    for (std::size_t i = 0; i < data.size(); ++i)
    {
        const char ch = data[i];
        if (ch == '\r' && i + 1 < data.size() && data[i + 1] == '\n')
            continue;
        if (ch == '\n')
        {
            out += "\r\n";
            line_start = true;
            continue;
        }
        if (line_start && ch == '.')
            out += '.';
        out += ch;
        line_start = false;
    }
    if (!line_start)
        out += "\r\n";
    out += ".\r\n";
    return out;
}

} // namespace courier::smtp
