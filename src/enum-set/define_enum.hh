#pragma once

#include <enum-set/assert.hh>
#include <enum-set/fwd.hh>
#include <enum-set/macros.hh>
#include <enum-set/member_list.hh>
#include <enum-set/ordinal_mapping.hh>

#include <array>
#include <string_view>
#include <type_traits>
#include <utility>

// =========================================================================================================
// ES_ENUM - Declare an enum together with its ordinal mapping
//
// Declares `enum class Name : es::u32 { members... }` and generates es::ordinal_mapping<Name>,
// so that es::enum_set<Name> can be used right away.
//
// Eligibility is checked at compile time, before anything is declared:
//   - at most 32 members (one bit per member in the enum_set mask)
//   - members carry no data (plain enumerators only)
//   - no explicit values (ordinals are the declaration positions 0, 1, 2, ...)
//   - members are plain, distinct identifiers
// Each violated rule fails the build with a static_assert naming the rule.
//
// Generated mapping (found via ADL, available as es::ordinal_mapping<Name>):
//   to_ordinal(v)       - declaration position of v, asserts on values that are not listed members
//   from_ordinal(i)     - member at position i, asserts on positions without a member
//   member_count        - number of members
//   members()           - all members in ordinal order
//   name(v)             - spelling of v
// Also emits `std::string_view to_string(Name)` next to the enum, used by debug strings.
//
// Must be used at namespace scope.
//
// Usage:
//   namespace game
//   {
//   ES_ENUM(damage_kind, physical, fire, frost, poison);
//   }
//
//   es::enum_set<game::damage_kind> resist = {game::damage_kind::fire, game::damage_kind::frost};
//
#define ES_ENUM(Name, ...)                         \
    ES_IMPL_VALIDATE_MEMBER_LIST(__VA_ARGS__);     \
    enum class Name : ::es::u32                    \
    {                                              \
        __VA_ARGS__                                \
    };                                             \
    ES_IMPL_EMIT_ORDINAL_MAPPING(Name, ES_STRINGIFY_EXPR(__VA_ARGS__))

// =========================================================================================================
// ES_ORDINAL_MAPPING - Generate the ordinal mapping for an existing enum
//
// Same as ES_ENUM but for an enum that is already declared (scoped or unscoped).
// The member list must repeat all members in declaration order.
// Members missing at the end of the list cannot be detected at compile time: using such a member
// with the mapping fails an ES_ASSERT_ALWAYS.
// In addition to the ES_ENUM checks, this verifies that Name is an enumeration and that the
// n-th listed member has the value n, which rejects enums with explicit values.
//
// Must be used at namespace scope, in the namespace of the enum.
//
// Usage:
//   enum class texture_usage { sampled, storage, color_target, depth_target };
//   ES_ORDINAL_MAPPING(texture_usage, sampled, storage, color_target, depth_target);
//
#define ES_ORDINAL_MAPPING(Name, ...)                                                                       \
    static_assert(std::is_enum_v<Name>, "ES_ORDINAL_MAPPING requires an enumeration type");                \
    ES_IMPL_VALIDATE_MEMBER_LIST(__VA_ARGS__);                                                              \
    static_assert(::es::impl::has_positional_values(                                                        \
                      []                                                                                    \
                      {                                                                                     \
                          using enum Name;                                                                  \
                          return ::es::impl::make_member_array<Name>(__VA_ARGS__);                          \
                      }()),                                                                                 \
                  "ES_ORDINAL_MAPPING requires all members in declaration order and no explicit values");  \
    ES_IMPL_EMIT_ORDINAL_MAPPING(Name, ES_STRINGIFY_EXPR(__VA_ARGS__))

// =========================================================================================================
// Implementation details
// =========================================================================================================

namespace es::impl
{
template <class E, class... Es>
constexpr std::array<E, sizeof...(Es)> make_member_array(Es... values)
{
    static_assert((std::is_same_v<Es, E> && ...), "member list must only name members of the enum");
    return {values...};
}

template <class E, size_t N>
constexpr bool has_positional_values(std::array<E, N> const& members)
{
    for (size_t i = 0; i < N; ++i)
    {
        if (static_cast<i64>(std::to_underlying(members[i])) != static_cast<i64>(i))
            return false;
    }
    return true;
}

/// Conversions shared by all generated mappings
/// Ordinals are declaration positions, so both directions are plain casts
template <class E>
struct generated_ordinal_mapping
{
    // values outside [0, member_count) come from casts or from a member list that stops early
    // and would set a bit no member maps to
    [[nodiscard]] static constexpr u32 to_ordinal_impl(E value, u32 member_count)
    {
        ES_ASSERT_ALWAYS(member_count > 0, "enum without members has no values to map");
        auto const ordinal = static_cast<u32>(value);
        ES_ASSERT_ALWAYS(ordinal < member_count, "value is not a listed member of the enum, check the member list of ES_ORDINAL_MAPPING");
        return ordinal;
    }

    [[nodiscard]] static constexpr E from_ordinal_impl(u32 ordinal, u32 member_count)
    {
        ES_ASSERT(ordinal < member_count, "from_ordinal called with an ordinal no member maps to");
        return static_cast<E>(ordinal);
    }

    template <u32 N>
    [[nodiscard]] static constexpr std::array<E, N> members_impl()
    {
        std::array<E, N> result = {};
        for (u32 i = 0; i < N; ++i)
            result[i] = static_cast<E>(i);
        return result;
    }
};
} // namespace es::impl

#define ES_IMPL_VALIDATE_MEMBER_LIST(...)                                                                        \
    static_assert(::es::impl::member_list_passes(ES_STRINGIFY_EXPR(__VA_ARGS__),                                \
                                                 ::es::member_list_error::too_many_members),                    \
                  "enum_set supports at most 32 members");                                                       \
    static_assert(::es::impl::member_list_passes(ES_STRINGIFY_EXPR(__VA_ARGS__),                                \
                                                 ::es::member_list_error::member_has_data),                     \
                  "members must not carry data, only plain enumerators are eligible");                           \
    static_assert(::es::impl::member_list_passes(ES_STRINGIFY_EXPR(__VA_ARGS__),                                \
                                                 ::es::member_list_error::explicit_discriminant),               \
                  "members must not declare explicit values, ordinals are assigned by declaration position");    \
    static_assert(::es::impl::member_list_passes(ES_STRINGIFY_EXPR(__VA_ARGS__),                                \
                                                 ::es::member_list_error::invalid_member_name),                 \
                  "members must be plain identifiers");                                                          \
    static_assert(::es::impl::member_list_passes(ES_STRINGIFY_EXPR(__VA_ARGS__),                                \
                                                 ::es::member_list_error::duplicate_member),                    \
                  "members must be distinct")

#define ES_IMPL_EMIT_ORDINAL_MAPPING(Name, MemberText)                                                           \
    struct ES_MACRO_JOIN(Name, _ordinal_mapping) : ::es::impl::generated_ordinal_mapping<Name>                  \
    {                                                                                                            \
        static constexpr ::es::member_list member_names = ::es::member_list::parse(MemberText);                  \
        static constexpr ::es::u32 member_count = ::es::u32(member_names.count);                                 \
                                                                                                                 \
        [[nodiscard]] static constexpr ::es::u32 to_ordinal(Name value)                                         \
        {                                                                                                        \
            return to_ordinal_impl(value, member_count);                                                         \
        }                                                                                                        \
        [[nodiscard]] static constexpr Name from_ordinal(::es::u32 ordinal)                                     \
        {                                                                                                        \
            return from_ordinal_impl(ordinal, member_count);                                                     \
        }                                                                                                        \
        [[nodiscard]] static constexpr std::array<Name, member_count> members()                                 \
        {                                                                                                        \
            return members_impl<member_count>();                                                                 \
        }                                                                                                        \
        [[nodiscard]] static constexpr std::string_view name(Name value)                                        \
        {                                                                                                        \
            return member_names.name(::es::isize(to_ordinal(value)));                                            \
        }                                                                                                        \
    };                                                                                                           \
    ES_MACRO_JOIN(Name, _ordinal_mapping) es_ordinal_mapping(Name*);                                             \
    [[maybe_unused]] constexpr std::string_view to_string(Name value)                                            \
    {                                                                                                            \
        return ES_MACRO_JOIN(Name, _ordinal_mapping)::name(value);                                               \
    }                                                                                                            \
    ES_FORCE_SEMICOLON
