#pragma once

#include <enum-set/fwd.hh>

#include <concepts>
#include <initializer_list>
#include <ranges>
#include <type_traits>

// =========================================================================================================
// Ordinal mapping - the capability an enum needs to be stored in an enum_set
// =========================================================================================================
//
// An ordinal mapping converts between the values of an enumeration E and small unsigned integers
// ("ordinals") in [0, 32). enum_set<E> uses the ordinal as the bit index into its 32-bit mask.
//
//   static u32 to_ordinal(E value);     - total, returns the ordinal of value
//   static E   from_ordinal(u32 ord);   - only defined for ordinals returned by to_ordinal
//
// Required invariant: from_ordinal(to_ordinal(e)) == e for every member e.
//
// Providing a mapping:
//   - ES_ENUM / ES_ORDINAL_MAPPING (see <enum-set/define_enum.hh>) generate it, which is the normal way
//   - an explicit specialization of es::ordinal_mapping<E> for hand-written mappings:
//
//       template <>
//       struct es::ordinal_mapping<legacy_flag>
//       {
//           static es::u32 to_ordinal(legacy_flag f) { return es::u32(f) - 100; }
//           static legacy_flag from_ordinal(es::u32 i) { return legacy_flag(i + 100); }
//       };
//
//     Such mappings should be checked with es::verify_ordinal_mapping in a test.
//
// The generated mappings are found via ADL: the generator declares
//   <mapping struct> es_ordinal_mapping(E*);
// next to the enum, and ordinal_mapping<E> derives from the returned type.
//

namespace es
{
/// one bit per ordinal in a u32 mask
inline constexpr u32 max_ordinal_count = 32;

namespace impl
{
template <class E>
concept has_adl_ordinal_mapping = requires(E* e) { es_ordinal_mapping(e); };
} // namespace impl

/// Unspecialized: E has no ordinal mapping
template <class E>
struct ordinal_mapping
{
};

/// Mapping declared next to E via the ADL hook
template <class E>
    requires impl::has_adl_ordinal_mapping<E>
struct ordinal_mapping<E> : decltype(es_ordinal_mapping(static_cast<E*>(nullptr)))
{
};

/// An enumeration that can be stored in an enum_set
template <class E>
concept ordinal_enum = std::is_enum_v<E> && requires(E value, u32 ordinal) {
    { ordinal_mapping<E>::to_ordinal(value) } -> std::same_as<u32>;
    { ordinal_mapping<E>::from_ordinal(ordinal) } -> std::same_as<E>;
};

/// An ordinal_enum whose mapping also knows how many members exist (true for all generated mappings)
template <class E>
concept counted_ordinal_enum = ordinal_enum<E> && requires {
    { ordinal_mapping<E>::member_count } -> std::convertible_to<u32>;
};

template <ordinal_enum E>
[[nodiscard]] constexpr u32 to_ordinal(E value)
{
    return ordinal_mapping<E>::to_ordinal(value);
}

/// Precondition: `ordinal` was returned by to_ordinal for some value of E
template <ordinal_enum E>
[[nodiscard]] constexpr E from_ordinal(u32 ordinal)
{
    return ordinal_mapping<E>::from_ordinal(ordinal);
}

// =========================================================================================================
// Mapping verification
// =========================================================================================================

enum class mapping_check
{
    ok,
    too_many_members,     // more than 32 members were listed
    ordinal_out_of_range, // a member maps to an ordinal >= 32
    duplicate_ordinal,    // two members map to the same ordinal
    roundtrip_mismatch,   // from_ordinal(to_ordinal(e)) != e
};

[[nodiscard]] constexpr char const* to_string(mapping_check c)
{
    switch (c)
    {
    case mapping_check::ok: return "ok";
    case mapping_check::too_many_members: return "too_many_members";
    case mapping_check::ordinal_out_of_range: return "ordinal_out_of_range";
    case mapping_check::duplicate_ordinal: return "duplicate_ordinal";
    case mapping_check::roundtrip_mismatch: return "roundtrip_mismatch";
    }
    return "unknown";
}

/// Checks that an ordinal mapping is a valid bijection over the given members
/// `members` must list every member of E exactly once (order does not matter)
/// Returns the first violated rule, or mapping_check::ok
/// Usage:
///   CHECK(es::verify_ordinal_mapping({legacy_flag::a, legacy_flag::b}) == es::mapping_check::ok);
///   static_assert(es::verify_ordinal_mapping(es::ordinal_mapping<color>::members()) == es::mapping_check::ok);
template <std::ranges::input_range Range>
    requires ordinal_enum<std::ranges::range_value_t<Range>>
[[nodiscard]] constexpr mapping_check verify_ordinal_mapping(Range const& members)
{
    using E = std::ranges::range_value_t<Range>;

    u32 seen = 0;
    isize count = 0;
    for (E const value : members)
    {
        if (++count > isize(max_ordinal_count))
            return mapping_check::too_many_members;

        auto const ordinal = ordinal_mapping<E>::to_ordinal(value);
        if (ordinal >= max_ordinal_count)
            return mapping_check::ordinal_out_of_range;

        auto const bit = u32(1) << ordinal;
        if ((seen & bit) != 0)
            return mapping_check::duplicate_ordinal;
        seen |= bit;

        if (ordinal_mapping<E>::from_ordinal(ordinal) != value)
            return mapping_check::roundtrip_mismatch;
    }
    return mapping_check::ok;
}

template <ordinal_enum E>
[[nodiscard]] constexpr mapping_check verify_ordinal_mapping(std::initializer_list<E> members)
{
    return es::verify_ordinal_mapping<std::initializer_list<E>>(members);
}

} // namespace es
