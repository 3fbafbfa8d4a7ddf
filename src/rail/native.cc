#include "native.hh"

#include <rail/macros.hh>

#include <mutex>
#include <typeinfo>


#ifdef RAIL_COMPILER_MSVC
#include <Windows.h>
#include <DbgHelp.h>

#endif

#ifdef RAIL_COMPILER_POSIX
#include <cxxabi.h>

#include <cstdlib>
#endif

std::string rail::demangle_symbol(std::string_view symbol)
{
    // UnDecorateSymbolName (Windows) is documented as single-threaded
    // __cxa_demangle (POSIX) thread-safety is not guaranteed
    static std::mutex demangle_mutex;
    std::lock_guard<std::mutex> lock(demangle_mutex);

    // both APIs expect a null-terminated string
    auto const symbol_nt = std::string(symbol);

#ifdef RAIL_COMPILER_MSVC
    constexpr DWORD buffer_size = 4096;
    char buffer[buffer_size];

    DWORD const length = UnDecorateSymbolName(symbol_nt.c_str(), buffer, buffer_size, UNDNAME_COMPLETE);
    if (length > 0)
        return std::string(buffer, length);

    return symbol_nt;

#elif defined(RAIL_COMPILER_POSIX)
    int status = 0;
    char* demangled = abi::__cxa_demangle(symbol_nt.c_str(), nullptr, nullptr, &status);

    if (status == 0 && demangled != nullptr)
    {
        auto result = std::string(demangled);
        std::free(demangled);
        return result;
    }

    if (demangled != nullptr)
        std::free(demangled);
    return symbol_nt;

#else
    return symbol_nt;
#endif
}

std::string rail::current_exception_type_name()
{
#if defined(RAIL_COMPILER_POSIX) && defined(RAIL_HAS_RTTI)
    if (std::type_info const* type = abi::__cxa_current_exception_type())
        return rail::demangle_symbol(type->name());
#endif

    return "<unknown exception type>";
}
