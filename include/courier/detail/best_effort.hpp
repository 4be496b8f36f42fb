/*

best_effort.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <courier/detail/log.hpp>
#include <courier/detail/result.hpp>

namespace courier
{

/**
Outcome of an optional step such as clearing a seen flag or closing a session.

A failed optional step is logged and kept for inspection, never propagated.
**/
class best_effort
{
public:
    enum class outcome
    {
        succeeded,
        failed_non_fatal
    };

    best_effort() = default;

    template<typename T>
    static best_effort from(std::string_view step, const result<T>& res)
    {
        if (res)
            return best_effort{};

        std::string line(step);
        line += " failed (ignored): ";
        line += describe(res.error());
        COURIER_WARN(line);
        return best_effort{res.error()};
    }

    [[nodiscard]] outcome state() const noexcept
    {
        return error_.has_value() ? outcome::failed_non_fatal : outcome::succeeded;
    }

    [[nodiscard]] bool succeeded() const noexcept
    {
        return !error_.has_value();
    }

    [[nodiscard]] const std::optional<error_info>& error() const noexcept
    {
        return error_;
    }

private:
    explicit best_effort(error_info err)
        : error_(std::move(err))
    {
    }

    std::optional<error_info> error_;
};

} // namespace courier
