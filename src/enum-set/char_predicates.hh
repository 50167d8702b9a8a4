#pragma once

// =========================================================================================================
// Locale independent character predicates on 'char's
// =========================================================================================================
//
// Used by the member list parser, which runs at compile time and therefore cannot use <cctype>.
//
// Character classification:
//   is_space(c)              - whitespace character (space, \f, \t, \n, \r, \v)
//   is_digit(c)              - decimal digit ('0' to '9')
//   is_alphanumeric(c)       - letter or digit ('0'-'9', 'a'-'z', 'A'-'Z')
//   is_identifier_start(c)   - letter or underscore
//   is_identifier_char(c)    - letter, digit or underscore
//   is_bracket_open(c)       - '(', '[', '{' or '<'
//   is_bracket_close(c)      - ')', ']', '}' or '>'
//

namespace es
{
/// Check if a character is whitespace
/// Matches: space, form feed, tab, newline, carriage return, vertical tab
/// Usage:
///   if (es::is_space(' '))  // true
///   if (es::is_space('a'))  // false
[[nodiscard]] constexpr bool is_space(char c)
{
    return c == ' ' || c == '\f' || c == '\t' || c == '\n' || c == '\r' || c == '\v';
}

/// Check if a character is a decimal digit
/// Matches: '0' through '9'
[[nodiscard]] constexpr bool is_digit(char c)
{
    return '0' <= c && c <= '9';
}

/// Check if a character is alphanumeric
/// Matches: '0'-'9', 'a'-'z', 'A'-'Z'
[[nodiscard]] constexpr bool is_alphanumeric(char c)
{
    return ('0' <= c && c <= '9') || ('a' <= c && c <= 'z') || ('A' <= c && c <= 'Z');
}

/// Check if a character may start a C++ identifier
/// Only the basic source character set is accepted
/// Usage:
///   if (es::is_identifier_start('_'))  // true
///   if (es::is_identifier_start('7'))  // false
[[nodiscard]] constexpr bool is_identifier_start(char c)
{
    return c == '_' || (is_alphanumeric(c) && !is_digit(c));
}

/// Check if a character may continue a C++ identifier
[[nodiscard]] constexpr bool is_identifier_char(char c)
{
    return c == '_' || is_alphanumeric(c);
}

[[nodiscard]] constexpr bool is_bracket_open(char c)
{
    return c == '(' || c == '[' || c == '{' || c == '<';
}

[[nodiscard]] constexpr bool is_bracket_close(char c)
{
    return c == ')' || c == ']' || c == '}' || c == '>';
}

} // namespace es
