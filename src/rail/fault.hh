#pragma once

#include <rail/assert.hh>
#include <rail/fwd.hh>

#include <exception>
#include <functional>
#include <string>

/// Shared, immutable handle to a caught exception: the cause of a failure that came from a fault
/// rather than from an explicit rejection.
///
/// A fault references the exception object through std::exception_ptr. Copies share the same
/// exception object; the fault never modifies it and does not care about its type hierarchy.
/// Exceptions thrown via std::throw_with_nested expose the exception they wrap as predecessor().
///
/// Usage:
///   try { parse(input); }
///   catch (...) { auto const f = rail::fault::current(); log(f.describe_chain()); }
///
///   if (f.is<std::invalid_argument>())
///       count_invalid_arguments();
///
///   f.visit_as<parse_error>([&](parse_error const& e) { highlight(e.column); });
struct rail::fault
{
    // construction
public:
    /// Default fault is invalid: references no exception.
    /// Only used as the "no cause" state inside rail::failure.
    fault() = default;

    /// Wraps the given exception.
    /// Precondition: exception != nullptr (checked in all builds)
    explicit fault(std::exception_ptr exception);

    /// Captures the exception currently being handled.
    /// Precondition: called from inside a catch block
    [[nodiscard]] static fault current();

    // queries
public:
    [[nodiscard]] bool is_valid() const { return _exception != nullptr; }
    [[nodiscard]] std::exception_ptr const& exception() const { return _exception; }

    /// Human-readable description of this exception only: "<type>: <what()>" for std::exception,
    /// "unknown exception of type <type>" for anything else.
    [[nodiscard]] std::string describe() const;

    /// describe() of this fault followed by one "caused by: ..." line per predecessor.
    [[nodiscard]] std::string describe_chain() const;

    /// True if this exception wraps another one via std::nested_exception.
    [[nodiscard]] bool has_predecessor() const { return predecessor().is_valid(); }

    /// The nested exception, or an invalid fault if there is none.
    [[nodiscard]] fault predecessor() const;

    /// True if the exception's dynamic type is E or derived from E.
    template <class E>
    [[nodiscard]] bool is() const;

    /// Calls f(E const&) with the exception object if is<E>(), returns whether f was called.
    /// The reference is only valid inside f: rethrowing may copy the exception object (MSVC),
    /// so the object must not be retained beyond the call.
    template <class E, class F>
    bool visit_as(F&& f) const;

    /// Throws the referenced exception again.
    [[noreturn]] void rethrow() const;

    /// Two faults are equal if they reference the same exception object.
    [[nodiscard]] friend bool operator==(fault const& lhs, fault const& rhs) { return lhs._exception == rhs._exception; }

    // members
private:
    std::exception_ptr _exception;
};

template <class E>
bool rail::fault::is() const
{
    return visit_as<E>([](E const&) {});
}

template <class E, class F>
bool rail::fault::visit_as(F&& f) const
{
    RAIL_ASSERT(is_valid(), "cannot inspect an invalid fault");

    try
    {
        std::rethrow_exception(_exception);
    }
    catch (E const& e)
    {
        // exceptions of f leave the handler, they are not caught by the catch below
        std::invoke(f, e);
        return true;
    }
    catch (...)
    {
        // not an E: a type test, the stored exception stays untouched
        return false;
    }
}
