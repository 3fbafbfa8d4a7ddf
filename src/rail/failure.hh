#pragma once

#include <rail/fault.hh>
#include <rail/fwd.hh>

#include <format>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

/// The failure track of a rail::result: a diagnostic message plus an optional causing fault.
///
/// Two kinds of failure exist:
///   - explicit rejection: created from a message, has_cause() == false
///       rail::failure("could not get an odd value")
///   - caught fault: created from a rail::fault, the message is the fault's describe()
///       catch (...) { return rail::failure::from_current_exception(); }
///
/// Failures are immutable values. Copies share the cause and the context list.
/// with_context() does not modify a failure, it returns a new one with an additional context line.
/// Every failure records the source location where it was created (site()).
struct rail::failure
{
    // construction
public:
    /// Explicit rejection with the given message.
    /// Precondition: !message.empty() (checked in all builds)
    explicit failure(std::string message, rail::source_location site = rail::source_location::current());

    /// Explicit rejection with the given message.
    /// Precondition: message != nullptr && *message != '\0' (checked in all builds)
    explicit failure(char const* message, rail::source_location site = rail::source_location::current());

    /// Caught fault: message is derived from cause.describe(), cause is retained.
    /// Precondition: cause.is_valid() (checked in all builds)
    explicit failure(rail::fault cause, rail::source_location site = rail::source_location::current());

    /// Caught fault from the exception currently being handled.
    /// Must be called from inside a catch block.
    [[nodiscard]] static failure from_current_exception(rail::source_location site = rail::source_location::current());

    // queries
public:
    /// The diagnostic message, never empty.
    [[nodiscard]] std::string const& message() const { return _message; }

    /// True if this failure originated from a caught fault.
    [[nodiscard]] bool has_cause() const { return _cause.is_valid(); }

    /// The causing fault, or nullptr for explicit rejections.
    [[nodiscard]] rail::fault const* cause() const { return has_cause() ? &_cause : nullptr; }

    /// Where this failure was created.
    [[nodiscard]] rail::source_location site() const { return _site; }

    [[nodiscard]] bool has_context() const { return _context != nullptr; }

    /// Context messages, most recently added first.
    [[nodiscard]] std::vector<std::string> context_messages() const;

    // context
public:
    /// Returns a copy of this failure with one more context line.
    /// Message, cause and site are unchanged.
    [[nodiscard]] failure with_context(std::string message, rail::source_location site = rail::source_location::current()) const;

    // rendering
public:
    /// Multi-line report: message, site, context lines and the chain of causing faults.
    [[nodiscard]] std::string to_string() const;

    /// Equal if message, cause (same exception object) and context list (same list) are equal.
    [[nodiscard]] friend bool operator==(failure const& lhs, failure const& rhs)
    {
        return lhs._message == rhs._message && lhs._cause == rhs._cause && lhs._context == rhs._context;
    }

    // members
private:
    struct context_node;

    std::string _message;
    rail::fault _cause;
    rail::source_location _site;
    std::shared_ptr<context_node const> _context;
};

/// Formats the failure message, e.g. std::format("Boom: {}", f)
template <>
struct std::formatter<rail::failure, char> : std::formatter<std::string_view, char>
{
    auto format(rail::failure const& f, std::format_context& ctx) const
    {
        return std::formatter<std::string_view, char>::format(f.message(), ctx);
    }
};
