#pragma once

#include <rail/fwd.hh>

#include <functional>
#include <string>

namespace rail::impl
{
// Customizable assertion handler system
// NOTE: the handler stack is global state and must be externally synchronized.
//       Pipelines running in parallel never touch it unless an assertion fails.
//
// Usage example:
//   {
//       auto handler = rail::impl::scoped_assertion_handler([](rail::impl::assertion_info const& info) {
//           log_contract_violation(info);
//           throw contract_violation{info.message};
//       });
//
//       auto f = rail::failure(user_supplied_message); // an empty message now throws
//   } // handler is popped here

struct assertion_info
{
    std::string expression;
    std::string message;
    rail::source_location location;
};

// Push a custom assertion handler onto the handler stack
// Handlers may throw to unwind to a recovery point instead of aborting
void push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);

// Pop the topmost assertion handler from the stack
// Prefer scoped_assertion_handler, which also pops when a handler throws
void pop_assertion_handler();

// RAII wrapper for pushing/popping assertion handlers
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);
    ~scoped_assertion_handler();

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler(scoped_assertion_handler&&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler&&) = delete;
};
} // namespace rail::impl
