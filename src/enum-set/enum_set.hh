#pragma once

#include <enum-set/assert.hh>
#include <enum-set/bit.hh>
#include <enum-set/fwd.hh>
#include <enum-set/ordinal_mapping.hh>
#include <enum-set/to_debug_string.hh>
#include <enum-set/utility.hh>

#include <compare>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <ranges>
#include <string>


/// Set of enum members, stored as one bit per member in a single u32 mask.
/// E must have an ordinal mapping (see <enum-set/ordinal_mapping.hh> and ES_ENUM).
///
/// Plain value type: trivially copyable, no allocation, no identity beyond its mask.
/// Equality, ordering and hashing are those of the mask.
/// All operations are O(1), iteration is O(number of elements).
///
/// Invariant: bit i of the mask is only set if i is the ordinal of a member of E.
/// Every mutating operation either sets a bit computed from a member or combines masks of sets
/// that already satisfy the invariant, so it holds by construction.
///
/// Usage:
///   ES_ENUM(permission, read, write, execute);
///
///   es::enum_set<permission> perms = {permission::read};
///   perms.insert(permission::write);
///   if (perms.contains(permission::write)) { ... }
///   for (permission p : perms) { ... } // ascending ordinal order
///
///   auto shared = perms & other_perms;
///   auto text = perms.to_string();      // "{read, write}"
template <class E>
struct es::enum_set
{
    static_assert(ordinal_enum<E>,
                  "enum_set requires an enumeration with an ordinal mapping (declare it with ES_ENUM or "
                  "ES_ORDINAL_MAPPING, or specialize es::ordinal_mapping)");

    using value_type = E;
    using iterator = enum_set_iterator<E>;
    using const_iterator = enum_set_iterator<E>;

    // construction
public:
    /// Empty set
    constexpr enum_set() = default;

    /// Set containing the given members, duplicates are ignored
    constexpr enum_set(std::initializer_list<E> values)
    {
        for (auto const v : values)
            insert(v);
    }

    /// Set containing every element of `values`, duplicates and order are irrelevant
    template <std::ranges::input_range Range>
        requires std::convertible_to<std::ranges::range_reference_t<Range>, E>
    [[nodiscard]] static constexpr enum_set create_from(Range&& values)
    {
        enum_set result;
        result.insert_range(values);
        return result;
    }

    /// Set containing every member of E
    /// Only available for mappings that know their member count (all generated mappings)
    [[nodiscard]] static constexpr enum_set all()
        requires counted_ordinal_enum<E>
    {
        static_assert(ordinal_mapping<E>::member_count <= max_ordinal_count, "enum_set supports at most 32 members");
        return create_from_bits(low_bits_mask<u32>(int(ordinal_mapping<E>::member_count)));
    }

    // queries
public:
    /// Number of members in the set
    [[nodiscard]] constexpr isize size() const { return es::popcount(_bits); }

    [[nodiscard]] constexpr bool empty() const { return _bits == 0; }

    [[nodiscard]] constexpr bool contains(E value) const { return (_bits & bit_of(value)) != 0; }

    /// True if the two sets have no member in common
    [[nodiscard]] constexpr bool is_disjoint(enum_set const& rhs) const { return (_bits & rhs._bits) == 0; }

    /// True if every member of this set is also in rhs
    [[nodiscard]] constexpr bool is_subset(enum_set const& rhs) const { return rhs.is_superset(*this); }

    /// True if every member of rhs is also in this set
    [[nodiscard]] constexpr bool is_superset(enum_set const& rhs) const { return (_bits & rhs._bits) == rhs._bits; }

    /// Raw mask, bit i set iff the member with ordinal i is contained
    [[nodiscard]] constexpr u32 bits() const { return _bits; }

    // modification
public:
    /// Adds value to the set
    /// Returns true if value was not contained before
    constexpr bool insert(E value)
    {
        auto const bit = bit_of(value);
        auto const added = (_bits & bit) == 0;
        _bits |= bit;
        return added;
    }

    /// Removes value from the set
    /// Returns true if value was contained before
    constexpr bool remove(E value)
    {
        auto const bit = bit_of(value);
        auto const removed = (_bits & bit) != 0;
        _bits &= ~bit;
        return removed;
    }

    /// Adds every element of `values`
    template <std::ranges::input_range Range>
        requires std::convertible_to<std::ranges::range_reference_t<Range>, E>
    constexpr void insert_range(Range&& values)
    {
        for (auto&& v : values)
            insert(v);
    }

    constexpr void clear() { _bits = 0; }

    // set algebra
public:
    [[nodiscard]] constexpr enum_set set_union(enum_set const& rhs) const { return create_from_bits(_bits | rhs._bits); }
    [[nodiscard]] constexpr enum_set set_intersection(enum_set const& rhs) const
    {
        return create_from_bits(_bits & rhs._bits);
    }
    [[nodiscard]] constexpr enum_set set_difference(enum_set const& rhs) const
    {
        return create_from_bits(_bits & ~rhs._bits);
    }
    [[nodiscard]] constexpr enum_set set_symmetric_difference(enum_set const& rhs) const
    {
        return create_from_bits(_bits ^ rhs._bits);
    }

    [[nodiscard]] friend constexpr enum_set operator|(enum_set const& lhs, enum_set const& rhs)
    {
        return lhs.set_union(rhs);
    }
    [[nodiscard]] friend constexpr enum_set operator&(enum_set const& lhs, enum_set const& rhs)
    {
        return lhs.set_intersection(rhs);
    }
    [[nodiscard]] friend constexpr enum_set operator-(enum_set const& lhs, enum_set const& rhs)
    {
        return lhs.set_difference(rhs);
    }
    [[nodiscard]] friend constexpr enum_set operator^(enum_set const& lhs, enum_set const& rhs)
    {
        return lhs.set_symmetric_difference(rhs);
    }

    constexpr enum_set& operator|=(enum_set const& rhs)
    {
        _bits |= rhs._bits;
        return *this;
    }
    constexpr enum_set& operator&=(enum_set const& rhs)
    {
        _bits &= rhs._bits;
        return *this;
    }
    constexpr enum_set& operator-=(enum_set const& rhs)
    {
        _bits &= ~rhs._bits;
        return *this;
    }
    constexpr enum_set& operator^=(enum_set const& rhs)
    {
        _bits ^= rhs._bits;
        return *this;
    }

    // comparison
public:
    /// Equal iff the masks are equal, ordered by mask value
    [[nodiscard]] constexpr bool operator==(enum_set const& rhs) const = default;
    [[nodiscard]] constexpr std::strong_ordering operator<=>(enum_set const& rhs) const = default;

    // iteration
public:
    /// Iterates a snapshot of the current members in ascending ordinal order
    /// Later modifications of the set do not affect existing iterators
    [[nodiscard]] constexpr iterator begin() const { return iterator(_bits); }
    [[nodiscard]] constexpr sentinel end() const { return {}; }

    // debug
public:
    /// Renders the set as {a, b, ...} in ascending ordinal order, "{}" when empty
    [[nodiscard]] std::string to_string() const
    {
        std::string s = "{";
        for (auto const v : *this)
        {
            if (s.size() > 1)
                s += ", ";
            s += es::to_debug_string(v);
        }
        s += '}';
        return s;
    }

private:
    [[nodiscard]] static constexpr enum_set create_from_bits(u32 bits)
    {
        enum_set result;
        result._bits = bits;
        return result;
    }

    // an ordinal >= 32 means the mapping is broken, dropping the bit would silently corrupt the set
    [[nodiscard]] ES_FORCE_INLINE static constexpr u32 bit_of(E value)
    {
        auto const ordinal = ordinal_mapping<E>::to_ordinal(value);
        ES_ASSERT_ALWAYS(ordinal < max_ordinal_count, "enum_set supports at most 32 members, the ordinal mapping returned an ordinal >= 32");
        return u32(1) << ordinal;
    }

    u32 _bits = 0;
};

/// Forward iterator over a snapshot of an enum_set mask
/// Holds no reference to the set. Copies continue independently from the same position.
/// The lowest bit of _remaining is always the current element (or _remaining is 0 when exhausted).
template <class E>
struct es::enum_set_iterator
{
    using value_type = E;
    using difference_type = std::ptrdiff_t;
    using iterator_concept = std::forward_iterator_tag;

    // construction
public:
    constexpr enum_set_iterator() = default;

    /// Iterates the members whose bits are set in `bits`
    /// Precondition: every set bit is the ordinal of a member of E
    explicit constexpr enum_set_iterator(u32 bits) : _remaining(bits) { skip_to_next_member(); }

    // access
public:
    [[nodiscard]] constexpr E operator*() const
    {
        ES_ASSERT(_remaining != 0, "dereferencing an exhausted enum_set iterator");
        return ordinal_mapping<E>::from_ordinal(_ordinal);
    }

    /// Exact number of members left, including the current one
    [[nodiscard]] constexpr isize remaining() const { return es::popcount(_remaining); }

    [[nodiscard]] constexpr bool is_exhausted() const { return _remaining == 0; }

    // traversal
public:
    constexpr enum_set_iterator& operator++()
    {
        ES_ASSERT(_remaining != 0, "incrementing an exhausted enum_set iterator");
        _remaining >>= 1;
        ++_ordinal;
        skip_to_next_member();
        return *this;
    }

    constexpr enum_set_iterator operator++(int)
    {
        auto result = *this;
        ++*this;
        return result;
    }

    // comparison
public:
    /// All exhausted iterators are equal, regardless of where they stopped
    [[nodiscard]] constexpr bool operator==(enum_set_iterator const& rhs) const
    {
        return _remaining == rhs._remaining && (_remaining == 0 || _ordinal == rhs._ordinal);
    }
    [[nodiscard]] constexpr bool operator==(sentinel) const { return _remaining == 0; }

private:
    constexpr void skip_to_next_member()
    {
        if (_remaining == 0)
            return;

        auto const zeroes = es::count_trailing_zeroes(_remaining);
        _remaining >>= zeroes;
        _ordinal += u32(zeroes);
    }

    u32 _ordinal = 0;
    u32 _remaining = 0;
};

/// Hashes the mask
template <class E>
struct std::hash<es::enum_set<E>>
{
    [[nodiscard]] std::size_t operator()(es::enum_set<E> const& s) const noexcept { return std::hash<es::u32>{}(s.bits()); }
};
