// Copyright (c) 2026 INRAE Distributed under the Boost Software License,
// Version 1.0. (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#ifndef ORG_VLEPROJECT_MICROCOSM_2026_SRC_TEXT_HPP
#define ORG_VLEPROJECT_MICROCOSM_2026_SRC_TEXT_HPP

#include <microcosm/macros.hpp>

#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace mcm {

//! Small helpers shared by the configuration, diet and abundance readers.

inline constexpr std::string_view trim(std::string_view str) noexcept
{
    constexpr std::string_view spaces = " \t\r\n";

    const auto b = str.find_first_not_of(spaces);
    if (b == std::string_view::npos)
        return std::string_view{};

    const auto e = str.find_last_not_of(spaces);
    return str.substr(b, e - b + 1u);
}

//! Extract the first line of @a buffer and advance @a buffer after it.
inline constexpr std::string_view next_line(std::string_view& buffer) noexcept
{
    const auto new_line = buffer.find('\n');
    const auto line     = buffer.substr(0, new_line);

    buffer = new_line == std::string_view::npos
               ? std::string_view{}
               : buffer.substr(new_line + 1u);

    return line;
}

//! Extract the next @a separator separated token of @a line and advance @a
//! line after it. The token is trimmed.
inline constexpr std::string_view next_token(std::string_view& line,
                                             const char separator) noexcept
{
    const auto pos   = line.find(separator);
    const auto token = trim(line.substr(0, pos));

    line = pos == std::string_view::npos ? std::string_view{}
                                         : line.substr(pos + 1u);

    return token;
}

inline std::optional<double> to_real(std::string_view str) noexcept
{
    double      out   = 0.0;
    const auto* begin = str.data();
    const auto* end   = str.data() + str.size();

    if (not str.empty() and *begin == '+')
        ++begin;

    if (auto [ptr, ec] = std::from_chars(begin, end, out);
        ec != std::errc{} or ptr != end)
        return std::nullopt;

    return out;
}

inline std::optional<int> to_integer(std::string_view str) noexcept
{
    int         out   = 0;
    const auto* begin = str.data();
    const auto* end   = str.data() + str.size();

    if (auto [ptr, ec] = std::from_chars(begin, end, out);
        ec != std::errc{} or ptr != end)
        return std::nullopt;

    return out;
}

} // namespace mcm

#endif
