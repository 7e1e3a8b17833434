// Copyright (c) 2026 INRAE Distributed under the Boost Software License,
// Version 1.0. (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#ifndef ORG_VLEPROJECT_MICROCOSM_2026_LIB_FORMAT_HPP
#define ORG_VLEPROJECT_MICROCOSM_2026_LIB_FORMAT_HPP

#include <microcosm/macros.hpp>

#include <fmt/format.h>

#include <iterator>
#include <string>
#include <string_view>

#include <cstdio>

namespace mcm {

static inline constexpr const std::string_view log_level_names[] = {
    "emergency", "alert",  "critical", "error",
    "warning",   "notice", "info",     "debug",
};

/// Debug log. Use the underlying @c fmt::print function.
///
///     debug_log("merge level {}\n", 1); /* -> "merge level 1\n"
#ifdef MICROCOSM_ENABLE_DEBUG
template<typename S, typename... Args>
constexpr void debug_log(const S& s, Args&&... args) noexcept
{
    fmt::vprint(stderr, s, fmt::make_format_args(args...));
}
#else
template<typename S, typename... Args>
constexpr void debug_log([[maybe_unused]] const S& s,
                         [[maybe_unused]] Args&&... args) noexcept
{}
#endif

//! Helper function to assign fmtlib format string to a @c std::string
//! object. The previous content of @a str is erased.
//! \param str Output buffer.
//! \param fmt A format string for the fmtlib library.
//! \param args Arguments for the fmtlib library.
template<typename... Args>
void format(std::string&                str,
            fmt::format_string<Args...> fmt,
            Args&&... args)
{
    str.clear();
    fmt::format_to(std::back_inserter(str), fmt, std::forward<Args>(args)...);
}

} // namespace mcm

#endif
