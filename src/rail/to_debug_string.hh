#pragma once

#include <rail/fwd.hh>

#include <cstddef>
#include <format>
#include <iterator>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

namespace rail
{
struct debug_string_config
{
    // not strict for now
    isize max_length = 100;
};

// Converts a value to a developer-facing debug string.
// Best-effort, non-semantic, and intended only for diagnostics (e.g. result::to_string()).
//
// Strategy (in order):
//   - Pointers: "nullptr" or the address (char pointers as strings)
//   - String-likes: wrap in double quotes "...", escaping quotes, backslashes and control characters
//   - char: wrap in single quotes '...' with escape sequences for control/non-printable chars
//   - For optional-likes, "nullopt" or the contained value
//   - For collections, recursively format elements as [v0, v1, ...] (truncated after max_length)
//   - For tuple-likes, recursively format elements as (v0, v1, ...)
//   - Use std::format if T has an enabled std::formatter
//   - Use v.to_string() if available
//   - Otherwise emit raw memory dump
//
// No stability, completeness, or user-facing guarantees.
template <class T>
[[nodiscard]] std::string to_debug_string(T const& v, debug_string_config const& cfg = {});

//
// Implementation
//

namespace impl
{
// disabled std::formatter specializations are not default constructible
template <class T>
concept has_std_formatter = std::is_default_constructible_v<std::formatter<std::remove_cvref_t<T>, char>>;

template <class T>
bool to_debug_string_append_elem(std::string& s, T const& v, debug_string_config const& cfg)
{
    if (isize(s.size()) >= cfg.max_length)
    {
        s += ", ...";
        return false;
    }

    if (s.size() > 1)
        s += ", ";

    s += rail::to_debug_string(v, cfg);

    return true;
}

template <class T, std::size_t... I>
void to_debug_string_append_tuple(std::string& s, T const& v, debug_string_config const& cfg, std::index_sequence<I...>)
{
    (void)(rail::impl::to_debug_string_append_elem(s, std::get<I>(v), cfg) && ...);
}

inline std::string escape_char(char c)
{
    switch (c)
    {
    case '\0':
        return "\\0";
    case '\n':
        return "\\n";
    case '\r':
        return "\\r";
    case '\t':
        return "\\t";
    case '\v':
        return "\\v";
    case '\f':
        return "\\f";
    case '\b':
        return "\\b";
    case '\a':
        return "\\a";
    case '\\':
        return "\\\\";
    case '\'':
        return "\\'";
    default:
        break;
    }

    if (c < 32 || c == 127) // other control characters
        return std::format("\\x{:02X}", static_cast<unsigned char>(c));

    return std::string(1, c);
}

// double-quoted, escaped like escape_char except that '\'' stays and '"' is escaped
// bytes >= 0x80 are kept so UTF-8 text stays intact
inline std::string quote_string(std::string_view v)
{
    auto s = std::string("\"");
    for (auto const c : v)
    {
        if (c == '"')
            s += "\\\"";
        else if (c == '\'' || static_cast<unsigned char>(c) >= 0x80)
            s += c;
        else
            s += escape_char(c);
    }
    s += '\"';
    return s;
}
} // namespace impl

template <class T>
[[nodiscard]] std::string to_debug_string(T const& v, debug_string_config const& cfg)
{
    if constexpr (std::is_pointer_v<T> || std::is_null_pointer_v<T>)
    {
        if (v == nullptr)
            return "nullptr";

        if constexpr (std::is_convertible_v<T, std::string_view>)
            return impl::quote_string(v);
        else
            return std::format("{}", static_cast<void const*>(v));
    }
    else if constexpr (std::is_convertible_v<T const&, std::string_view>)
    {
        return impl::quote_string(std::string_view(v));
    }
    else if constexpr (std::is_same_v<T, char>)
    {
        return "'" + impl::escape_char(v) + "'";
    }
    else if constexpr (requires {
                           v.has_value();
                           *v;
                       })
    {
        // optional-likes: an absent value is still a printable payload
        if (!v.has_value())
            return "nullopt";
        return rail::to_debug_string(*v, cfg);
    }
    else if constexpr (requires {
                           std::begin(v);
                           std::end(v);
                       })
    {
        auto s = std::string("[");
        for (auto&& e : v)
            if (!impl::to_debug_string_append_elem(s, e, cfg))
                break;
        s += "]";
        return s;
    }
    else if constexpr (requires { std::tuple_size<T>::value; })
    {
        auto s = std::string("(");
        impl::to_debug_string_append_tuple(s, v, cfg, std::make_index_sequence<std::tuple_size<T>::value>{});
        s += ")";
        return s;
    }
    else if constexpr (impl::has_std_formatter<T>)
    {
        return std::format("{}", v);
    }
    else if constexpr (requires { v.to_string(); })
    {
        return std::string(v.to_string());
    }
    else
    {
        auto s = std::string("0x");
        auto const align = alignof(T);
        auto const p_v = reinterpret_cast<unsigned char const*>(&v);
        for (std::size_t i = 0; i < sizeof(T); ++i)
        {
            if (i > 0 && i % align == 0)
                s += "_";
            s += std::format("{:02X}", p_v[i]);
        }
        return s;
    }
}
} // namespace rail
