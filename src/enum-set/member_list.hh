#pragma once

#include <enum-set/assert.hh>
#include <enum-set/char_predicates.hh>
#include <enum-set/fwd.hh>
#include <enum-set/ordinal_mapping.hh>

#include <string_view>

// =========================================================================================================
// Member list parsing for the ordinal mapping generator
// =========================================================================================================
//
// ES_ENUM(color, red, green, blue) stringifies its member list to "red, green, blue".
// member_list::parse splits that text at top-level commas and decides whether the enum is eligible
// for an enum_set, before any code for the mapping is emitted:
//
//   "red, green, blue"        -> ok, 3 members
//   "red, green = 4"          -> explicit_discriminant
//   "red, green(int)"         -> member_has_data
//   "a0, a1, ..., a32"        -> too_many_members
//   "red, 2nd"                -> invalid_member_name
//   "red, green, red"         -> duplicate_member
//   ""                        -> ok, 0 members
//
// A single trailing comma is accepted, as in an enum body.
// The first problem in declaration order is reported.
//

namespace es
{
enum class member_list_error
{
    ok,
    too_many_members,
    member_has_data,
    explicit_discriminant,
    invalid_member_name,
    duplicate_member,
};

[[nodiscard]] constexpr char const* to_string(member_list_error e)
{
    switch (e)
    {
    case member_list_error::ok: return "ok";
    case member_list_error::too_many_members: return "too_many_members";
    case member_list_error::member_has_data: return "member_has_data";
    case member_list_error::explicit_discriminant: return "explicit_discriminant";
    case member_list_error::invalid_member_name: return "invalid_member_name";
    case member_list_error::duplicate_member: return "duplicate_member";
    }
    return "unknown";
}

/// Result of parsing a comma-separated enum member list
/// Literal type: usable as a constexpr static member of generated mappings
struct member_list
{
    // members
public:
    /// member spellings in declaration order, views into the parsed text
    std::string_view names[max_ordinal_count] = {};
    /// number of members that were seen, may exceed max_ordinal_count on error
    isize count = 0;
    member_list_error error = member_list_error::ok;
    /// index of the offending member, -1 if error == ok
    isize error_index = -1;

    // queries
public:
    [[nodiscard]] constexpr bool is_valid() const { return error == member_list_error::ok; }

    /// Spelling of the member with ordinal i
    /// Precondition: is_valid() && 0 <= i < count
    [[nodiscard]] constexpr std::string_view name(isize i) const
    {
        ES_ASSERT(0 <= i && i < count, "member index out of bounds");
        return names[i];
    }

    /// Ordinal of the member spelled `spelling`, -1 if there is none
    [[nodiscard]] constexpr isize index_of(std::string_view spelling) const
    {
        for (isize i = 0; i < count && i < isize(max_ordinal_count); ++i)
            if (names[i] == spelling)
                return i;
        return -1;
    }

    // parsing
public:
    [[nodiscard]] static constexpr member_list parse(std::string_view text)
    {
        member_list result;

        isize start = 0;
        int depth = 0;
        for (isize i = 0; i <= isize(text.size()); ++i)
        {
            auto const at_end = i == isize(text.size());
            if (!at_end)
            {
                auto const c = text[i];
                if (is_bracket_open(c))
                    ++depth;
                else if (is_bracket_close(c) && depth > 0)
                    --depth;

                if (c != ',' || depth > 0)
                    continue;
            }

            auto const piece = trim(text.substr(start, i - start));
            start = i + 1;

            // "A, B," and "" both end in an empty piece that is not a member
            if (at_end && piece.empty())
                break;

            if (!result.add_member(piece))
                return result;
        }

        return result;
    }

private:
    constexpr bool add_member(std::string_view piece)
    {
        auto const index = count++;

        if (count > isize(max_ordinal_count))
            return fail(member_list_error::too_many_members, index);

        if (has_top_level_assignment(piece))
            return fail(member_list_error::explicit_discriminant, index);

        for (auto const c : piece)
            if (is_bracket_open(c))
                return fail(member_list_error::member_has_data, index);

        if (!is_identifier(piece))
            return fail(member_list_error::invalid_member_name, index);

        if (index_of(piece) >= 0)
            return fail(member_list_error::duplicate_member, index);

        names[index] = piece;
        return true;
    }

    constexpr bool fail(member_list_error e, isize index)
    {
        error = e;
        error_index = index;
        return false;
    }

    [[nodiscard]] static constexpr std::string_view trim(std::string_view s)
    {
        while (!s.empty() && is_space(s.front()))
            s.remove_prefix(1);
        while (!s.empty() && is_space(s.back()))
            s.remove_suffix(1);
        return s;
    }

    // '=' outside of brackets, but not part of '==' / '<=' / '>=' / '!='
    [[nodiscard]] static constexpr bool has_top_level_assignment(std::string_view s)
    {
        int depth = 0;
        for (isize i = 0; i < isize(s.size()); ++i)
        {
            auto const c = s[i];
            if (is_bracket_open(c))
                ++depth;
            else if (is_bracket_close(c) && depth > 0)
                --depth;
            else if (c == '=' && depth == 0)
            {
                auto const prev = i > 0 ? s[i - 1] : ' ';
                auto const next = i + 1 < isize(s.size()) ? s[i + 1] : ' ';
                if (prev != '=' && prev != '<' && prev != '>' && prev != '!' && next != '=')
                    return true;
            }
        }
        return false;
    }

    [[nodiscard]] static constexpr bool is_identifier(std::string_view s)
    {
        if (s.empty() || !is_identifier_start(s.front()))
            return false;
        for (auto const c : s)
            if (!is_identifier_char(c))
                return false;
        return true;
    }
};

namespace impl
{
/// true unless parsing `text` reports exactly `e`
/// Lets the generator emit one static_assert with a dedicated message per rule
[[nodiscard]] constexpr bool member_list_passes(std::string_view text, member_list_error e)
{
    return member_list::parse(text).error != e;
}
} // namespace impl

} // namespace es
