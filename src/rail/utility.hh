#pragma once

#include <rail/fwd.hh>
#include <rail/macros.hh>

#include <new>

// =========================================================================================================
// Utility functions used throughout rail-core
// =========================================================================================================
//
// Move semantics:
//   move(value)                 - cast value to rvalue reference for moving
//   forward<T>(value)           - perfect forwarding for template arguments
//
// Object lifetime:
//   new (rail::placement_new, ptr) T(...) - placement new without <new> overload ambiguity
//

namespace rail
{
// =========================================================================================================
// Move semantics
// =========================================================================================================

/// Cast value to rvalue reference to enable move semantics
/// Usage:
///   results.push_back(rail::move(res));
template <class T>
[[nodiscard]] RAIL_FORCE_INLINE constexpr T&& move(T& value) noexcept
{
    return static_cast<T&&>(value);
}

/// Perfect forwarding for template arguments
/// Usage:
///   template <class F>
///   auto lift(F&& f) { return impl::lift_fn<std::decay_t<F>>{rail::forward<F>(f)}; }
template <class T>
[[nodiscard]] RAIL_FORCE_INLINE constexpr T&& forward(T& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] RAIL_FORCE_INLINE constexpr T&& forward(T&& value) noexcept // NOLINT
{
    return static_cast<T&&>(value);
}

// =========================================================================================================
// Object lifetime
// =========================================================================================================

/// Tag for rail's own placement new overload
/// Keeps placement construction independent of user-provided operator new overloads
struct placement_new_t
{
};
constexpr placement_new_t placement_new = {};
} // namespace rail

// placement new for the rail::placement_new tag
[[nodiscard]] RAIL_FORCE_INLINE void* operator new(std::size_t, rail::placement_new_t, void* buffer) noexcept
{
    return buffer;
}
RAIL_FORCE_INLINE void operator delete(void*, rail::placement_new_t, void*) noexcept {}
