#pragma once

#include <enum-set/fwd.hh>

#include <string>
#include <type_traits>
#include <utility>

namespace es
{
/// Types to_debug_string can render
template <class T>
concept debug_stringable = requires(T const& v) { to_string(v); } || requires(T const& v) { v.to_string(); }
                           || std::is_enum_v<T>;

/// Converts a value to a developer-facing debug string
/// Used by enum_set::to_string for its elements
///
/// Strategy (in order):
///   - to_string(v) found via ADL (ES_ENUM and ES_ORDINAL_MAPPING emit one returning the member name)
///   - v.to_string() (enum_set renders as {a, b, ...})
///   - enums without names: the underlying value
///
/// Usage:
///   es::to_debug_string(damage_kind::fire);             // "fire"
///   es::to_debug_string(http_status_class::success);    // "2", hand-written mapping without names
template <debug_stringable T>
[[nodiscard]] std::string to_debug_string(T const& v)
{
    if constexpr (requires { to_string(v); })
        return std::string(to_string(v));
    else if constexpr (requires { v.to_string(); })
        return std::string(v.to_string());
    else
        return std::to_string(std::to_underlying(v));
}
} // namespace es
