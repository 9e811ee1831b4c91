#pragma once

#include <odict/macros.hh>
#include <odict/source_location.hh>

#include <functional>
#include <string>

namespace od::impl
{
// Customizable assertion handler stack
// NOTE: global state, must be externally synchronized
//
// Usage:
//   {
//       auto handler = od::impl::scoped_assertion_handler([](od::impl::assertion_info const& info) {
//           report(info);
//           throw contract_violation{info.message};
//       });
//
//       dict.insert_at(pos, key, value); // a failing check unwinds to the caller
//   }

struct assertion_info
{
    std::string expression;
    std::string message;
    od::source_location location;
};

// Push a handler; it receives all assertion failures until popped
// Handlers may throw to unwind to a recovery point instead of aborting
void push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);

// Pop the topmost handler (no-op if the stack is empty)
void pop_assertion_handler();

// RAII push/pop of an assertion handler
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);
    ~scoped_assertion_handler();

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler(scoped_assertion_handler&&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler&&) = delete;
};
} // namespace od::impl
