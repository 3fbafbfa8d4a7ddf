#pragma once

#include <rail/fwd.hh>

#include <string>
#include <string_view>

// =========================================================================================================
// Platform-specific native utilities
// =========================================================================================================
//
// Symbol demangling:
//   demangle_symbol(symbol)          - demangle C++ symbol names to human-readable format
//
// Exception introspection:
//   current_exception_type_name()    - readable type name of the exception currently being handled
//

namespace rail
{
/// Demangle a C++ mangled symbol or type name into a human-readable format.
/// Platform-specific implementation:
///   - MSVC: Uses UnDecorateSymbolName from dbghelp.dll
///   - GCC/Clang: Uses __cxa_demangle from libstdc++/libc++
///   - Other: Returns the input symbol unchanged
///
/// If demangling fails or is unavailable on the platform, returns the original symbol.
///
/// Usage:
///   auto demangled = rail::demangle_symbol("St13runtime_error"); // "std::runtime_error"
[[nodiscard]] std::string demangle_symbol(std::string_view symbol);

/// Returns the demangled type name of the exception currently being handled.
/// Must be called from inside a catch block; works for any thrown type, including non-class types
/// (throw 42 yields "int").
/// Returns "<unknown exception type>" if the platform cannot report it.
[[nodiscard]] std::string current_exception_type_name();

} // namespace rail
