// Copyright (c) 2026 INRAE Distributed under the Boost Software License,
// Version 1.0. (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#ifndef ORG_VLEPROJECT_MICROCOSM_MACROS_2026
#define ORG_VLEPROJECT_MICROCOSM_MACROS_2026

#include <cstddef>
#include <cstdint>
#include <cstdlib>

#include <type_traits>

#if defined(_MSC_VER) && !defined(__clang__)
#define mcm_force_inline_attribute [[msvc::forceinline]]
#else
#define mcm_force_inline_attribute [[gnu::always_inline]]
#endif

namespace mcm {

using i8  = int8_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;
using u8  = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;
using sz  = size_t;
using ssz = ptrdiff_t;
using f64 = double;

//! Flux values, bounds and stoichiometric coefficients.
using real = double;

namespace fatal {

//! @brief A c++ function to replace assert macro.
//!
//! Call @c std::abort if the assertion fail. This function can not be
//! disabled.
template<typename T>
inline constexpr void ensure(T&& assertion) noexcept
{
    if (!static_cast<bool>(assertion))
        std::abort();
}

} // namespace fatal

namespace debug {

#ifdef MICROCOSM_ENABLE_DEBUG
static constexpr bool enable_ensure = true;
#else
static constexpr bool enable_ensure = false;
#endif

//! @brief A c++ function to replace assert macro controlled via constexpr
//! boolean variable @c debug::enable_ensure.
template<typename T>
    requires(::mcm::debug::enable_ensure == true)
inline constexpr void ensure(T&& assertion) noexcept
{
    if (!static_cast<bool>(assertion))
        std::abort();
}

template<typename T>
    requires(::mcm::debug::enable_ensure == false)
mcm_force_inline_attribute constexpr void ensure(
  [[maybe_unused]] T&& assertion) noexcept
{}

//! Add a breakpoint into the code. Use it with @c on_error_callback to stop
//! the application when a @c new_error function is called.
void breakpoint() noexcept;

} // namespace debug

[[noreturn]] inline void unreachable() noexcept
{
#if defined(_MSC_VER) && !defined(__clang__) // MSVC
    __assume(false);
#else // GCC, Clang
    __builtin_unreachable();
#endif
}

template<typename Enum>
    requires(std::is_enum_v<Enum>)
constexpr auto ordinal(Enum e) noexcept
{
    return static_cast<std::underlying_type_t<Enum>>(e);
}

template<typename Enum, typename Integer>
    requires(std::is_enum_v<Enum> and std::is_integral_v<Integer>)
constexpr Enum enum_cast(Integer i) noexcept
{
    return static_cast<Enum>(i);
}

} // namespace mcm

#endif
