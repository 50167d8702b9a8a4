#pragma once

#include <source_location>

namespace es
{
/// Type alias for std::source_location
/// Used by the assertion machinery to report where an invariant broke
/// Usage:
///   void log(es::source_location loc = es::source_location::current()) {
///       std::cout << loc.file_name() << ":" << loc.line();
///   }
using source_location = std::source_location;
} // namespace es
