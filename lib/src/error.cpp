// Copyright (c) 2026 INRAE Distributed under the Boost Software License,
// Version 1.0. (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#include <microcosm/error.hpp>

#include <csignal>

namespace mcm {

namespace debug {

void breakpoint() noexcept
{
#if ((defined(__i386__) || defined(__x86_64__)) && defined(__GNUC__) &&        \
     __GNUC__ >= 2)
    __asm__ __volatile__("int $03");
#elif defined(_MSC_VER)
    __debugbreak();
#elif defined(__APPLE__)
    __builtin_trap();
#else
    std::raise(SIGTRAP);
#endif
}

} // namespace debug
} // namespace mcm
