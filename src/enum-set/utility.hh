#pragma once

// =========================================================================================================
// Utility types for iteration
// =========================================================================================================
//
// Iterator utilities:
//   sentinel                         - lightweight end-of-range sentinel type
//

namespace es
{
// =========================================================================================================
// Iterator utilities
// =========================================================================================================

/// A generic end-of-range sentinel type
/// Used as a lightweight alternative to a full iterator for range end
/// Usage:
///   struct my_range {
///       my_iterator begin() { return ...; }
///       es::sentinel end() const { return {}; }
///   };
///   struct my_iterator {
///       bool operator==(es::sentinel) const { return is_exhausted(); }
///       // ... other iterator operations ...
///   };
struct sentinel
{
};

} // namespace es
