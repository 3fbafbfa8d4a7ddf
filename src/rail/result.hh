#pragma once

#include <rail/assert.hh>
#include <rail/failure.hh>
#include <rail/fwd.hh>
#include <rail/to_debug_string.hh>
#include <rail/utility.hh>

#include <concepts>
#include <format>
#include <string>
#include <string_view>
#include <type_traits>

/// The success track of a rail::result: carries the computed value.
/// The value may itself mean "nothing" (nullptr, an empty std::optional). It is still a success.
template <class T>
struct rail::success
{
    static_assert(!std::is_reference_v<T>, "success<T&> is not supported, use a pointer or std::reference_wrapper");
    static_assert(!std::is_void_v<T>, "success<void> is not supported, use an empty type such as std::monostate");

    // construction
public:
    /// Wraps the given value; conditionally explicit.
    template <class U = T>
        requires(!std::is_same_v<std::remove_cvref_t<U>, success> && std::is_constructible_v<T, U>)
    explicit(!std::is_convertible_v<U, T>) constexpr success(U&& value) : _value(rail::forward<U>(value)) // NOLINT
    {
    }

    // access
public:
    [[nodiscard]] constexpr T const& get() const& { return _value; }
    [[nodiscard]] constexpr T&& get() && { return rail::move(_value); }

    // members
private:
    T _value;
};

namespace rail
{
/// rail::success("Jim") is a success<char const*>, rail::success(42) a success<int>
template <class T>
success(T) -> success<T>;
} // namespace rail

/// Closed sum type: either a rail::success<T> or a rail::failure, never both, never neither.
///
/// Created only from its two tracks:
///   rail::result<std::string> a = rail::success("Jim");
///   rail::result<std::string> b = rail::failure("bad input");
///
/// Inspection never throws:
///   if (auto const* s = a.as_success()) use(s->get());
///   if (auto const* f = b.as_failure()) log(f->message());
///
/// Results are immutable: there is no way to change the track or payload of an existing result.
/// Whole-value copy/move (and assignment) exist so results can live in containers.
/// The track is stored as an explicit state tag. Branching never inspects the payload,
/// so success(nullptr) is a success like any other.
template <class T>
struct rail::result
{
    static_assert(!std::is_reference_v<T>, "result<T&> is not supported, use a pointer or std::reference_wrapper");
    static_assert(!std::is_void_v<T>, "result<void> is not supported, use an empty type such as std::monostate");

    // types
public:
    using value_type = T;
    using success_type = rail::success<T>;

    // construction
public:
    /// Success track, converting the payload if necessary.
    template <class U>
        requires std::is_constructible_v<T, U const&>
    result(rail::success<U> const& s) : _state(state::success) // NOLINT
    {
        new (rail::placement_new, &_success) success_type(s.get());
    }

    /// Success track, converting the payload if necessary.
    template <class U>
        requires std::is_constructible_v<T, U&&>
    result(rail::success<U>&& s) : _state(state::success) // NOLINT
    {
        new (rail::placement_new, &_success) success_type(rail::move(s).get());
    }

    /// Failure track.
    result(rail::failure f) : _state(state::failure) // NOLINT
    {
        new (rail::placement_new, &_failure) rail::failure(rail::move(f));
    }

    // copy/move/destroy
public:
    result(result const& rhs)
        requires std::is_copy_constructible_v<T>
      : _state(rhs._state)
    {
        if (_state == state::success)
            new (rail::placement_new, &_success) success_type(rhs._success);
        else
            new (rail::placement_new, &_failure) rail::failure(rhs._failure);
    }

    /// rhs stays on its track with a moved-from payload.
    /// noexcept assumes T's move constructor does not throw.
    result(result&& rhs) noexcept
        requires std::is_move_constructible_v<T>
      : _state(rhs._state)
    {
        if (_state == state::success)
            new (rail::placement_new, &_success) success_type(rail::move(rhs._success));
        else
            new (rail::placement_new, &_failure) rail::failure(rail::move(rhs._failure));
    }

    /// Replaces the whole value. A throwing copy of T leaves *this unchanged.
    result& operator=(result const& rhs)
        requires std::is_copy_constructible_v<T>
    {
        if (this != &rhs)
        {
            auto copy = rhs;
            impl_destroy();
            impl_construct_from(rail::move(copy));
        }
        return *this;
    }

    /// Replaces the whole value.
    /// noexcept assumes T's move constructor does not throw.
    result& operator=(result&& rhs) noexcept
        requires std::is_move_constructible_v<T>
    {
        if (this != &rhs)
        {
            impl_destroy();
            impl_construct_from(rail::move(rhs));
        }
        return *this;
    }

    ~result() { impl_destroy(); }

    // inspection
public:
    [[nodiscard]] bool is_success() const { return _state == state::success; }
    [[nodiscard]] bool is_failure() const { return _state == state::failure; }

    /// The success view, or nullptr if this is a failure.
    [[nodiscard]] success_type const* as_success() const { return is_success() ? &_success : nullptr; }

    /// The failure view, or nullptr if this is a success.
    [[nodiscard]] rail::failure const* as_failure() const { return is_failure() ? &_failure : nullptr; }

    /// Precondition: is_success()
    [[nodiscard]] T const& value() const&
    {
        RAIL_ASSERT(is_success(), "value() called on a failure result");
        return _success.get();
    }
    [[nodiscard]] T&& value() &&
    {
        RAIL_ASSERT(is_success(), "value() called on a failure result");
        return rail::move(_success).get();
    }

    /// Precondition: is_failure()
    [[nodiscard]] rail::failure const& error() const&
    {
        RAIL_ASSERT(is_failure(), "error() called on a success result");
        return _failure;
    }
    [[nodiscard]] rail::failure&& error() &&
    {
        RAIL_ASSERT(is_failure(), "error() called on a success result");
        return rail::move(_failure);
    }

    /// The success value, or fallback converted to T for failures.
    template <class U>
    [[nodiscard]] T value_or(U&& fallback) const&
        requires std::is_copy_constructible_v<T> && std::is_constructible_v<T, U&&>
    {
        if (is_success())
            return _success.get();
        return T(rail::forward<U>(fallback));
    }

    // rendering
public:
    /// "Success(<value>)" or "Failure(<message>)", for diagnostics only.
    /// The value is rendered with rail::to_debug_string, so string payloads appear quoted and escaped:
    /// Success("2") holds the string "2", Success(2) the number 2.
    /// The failure message is human-readable text and is inserted as-is, without quotes.
    [[nodiscard]] std::string to_string() const
    {
        if (is_success())
            return "Success(" + rail::to_debug_string(_success.get()) + ")";
        return "Failure(" + _failure.message() + ")";
    }

    // comparison
public:
    /// Equal if both are successes with equal values or both are equal failures.
    [[nodiscard]] friend bool operator==(result const& lhs, result const& rhs)
        requires std::equality_comparable<T>
    {
        if (lhs._state != rhs._state)
            return false;
        if (lhs.is_success())
            return lhs._success.get() == rhs._success.get();
        return lhs._failure == rhs._failure;
    }

    // helper
private:
    void impl_destroy()
    {
        if (_state == state::success)
            _success.~success_type();
        else
            _failure.~failure();
    }

    void impl_construct_from(result&& rhs) noexcept
    {
        _state = rhs._state;
        if (_state == state::success)
            new (rail::placement_new, &_success) success_type(rail::move(rhs._success));
        else
            new (rail::placement_new, &_failure) rail::failure(rail::move(rhs._failure));
    }

    // members
private:
    enum class state : u8
    {
        success,
        failure,
    };

    union
    {
        success_type _success;
        rail::failure _failure;
    };

    state _state;
};

namespace rail
{
template <class T>
[[nodiscard]] std::string to_string(result<T> const& r)
{
    return r.to_string();
}
} // namespace rail

/// Formats like result::to_string(), e.g. std::format("Seeing {} pass by", res)
template <class T>
struct std::formatter<rail::result<T>, char> : std::formatter<std::string_view, char>
{
    auto format(rail::result<T> const& r, std::format_context& ctx) const
    {
        return std::formatter<std::string_view, char>::format(r.to_string(), ctx);
    }
};
