#pragma once

#include <enum-set/source_location.hh>

#include <functional>
#include <string>

namespace es::impl
{
/// Report of a failed ES_ASSERT / ES_ASSERT_ALWAYS
struct assertion_info
{
    std::string expression;
    std::string message;
    es::source_location location;
};

/// Routes assertion failures to `handler` while alive, nested handlers take precedence
/// A handler that returns still ends in an abort. Throwing unwinds out of the failing enum_set operation
/// before it touched the mask, which is how tests observe broken ordinal mappings.
/// The handler stack is global, sets used from several threads need external synchronization here too.
///
/// Usage:
///   auto handler = es::impl::scoped_assertion_handler([](es::impl::assertion_info const& info)
///                                                     { throw broken_mapping{info.message}; });
///   set.insert(value); // an ordinal >= 32 now throws broken_mapping
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);
    ~scoped_assertion_handler();

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
};
} // namespace es::impl
