#pragma once

#include <cstddef>
#include <cstdint>
#include <source_location>


namespace rail
{

//
// Primitives
//

// Explicitly-sized primitive types, used where the range matters for correctness or layout.
// "int" stays the default integer for small counts and loop counters.

// state tags
using u8 = uint8_t;

// signed size type
using isize = int64_t;

/// Type alias for std::source_location
/// Every failure records the site where it was created
/// Usage:
///   void reject(rail::source_location site = rail::source_location::current());
using source_location = std::source_location;

//
// Errors
//

struct fault;
struct failure;

//
// Two-track results
//

template <class T>
struct success;
template <class T>
struct result;

} // namespace rail
