#pragma once

#include <enum-set/fwd.hh>

#include <bit>
#include <type_traits>

// =========================================================================================================
// Bit manipulation functions
// =========================================================================================================
//
// Bit counting (trailing):
//   count_trailing_zeroes(value)            - count consecutive 0 bits from least significant bit
//
// Population count:
//   popcount(value)                         - count number of 1 bits in unsigned integer
//
// Masks:
//   low_bits_mask<T>(count)                 - value with the lowest `count` bits set
//

namespace es
{
// =========================================================================================================
// Bit counting (trailing)
// =========================================================================================================

/// Counts the number of consecutive 0 bits, starting from the least significant bit
/// Returns the number of trailing zero bits
/// Usage:
///   auto count = es::count_trailing_zeroes(u8(0b01011000));  // 3
///   auto count = es::count_trailing_zeroes(u8(0));           // 8 (all bits are 0)
///   auto count = es::count_trailing_zeroes(u8(1));           // 0
template <class T>
[[nodiscard]] constexpr int count_trailing_zeroes(T value) noexcept
{
    return std::countr_zero(value);
}

// =========================================================================================================
// Population count
// =========================================================================================================

/// Counts the number of 1 bits in an unsigned integer
/// Returns the total number of set bits (Hamming weight)
/// Usage:
///   auto count = es::popcount(u8(0b10110010));  // 4
///   auto count = es::popcount(u8(0));           // 0
///   auto count = es::popcount(u8(0xFF));        // 8
using std::popcount;

// =========================================================================================================
// Masks
// =========================================================================================================

/// Returns a value of unsigned type T with the lowest `count` bits set
/// Unlike `(T(1) << count) - 1`, this is well-defined for count == bit width of T
/// Usage:
///   auto m = es::low_bits_mask<u32>(3);   // 0b111
///   auto m = es::low_bits_mask<u32>(0);   // 0
///   auto m = es::low_bits_mask<u32>(32);  // 0xFFFFFFFF
template <class T>
[[nodiscard]] constexpr T low_bits_mask(int count) noexcept
{
    static_assert(std::is_unsigned_v<T>, "low_bits_mask requires an unsigned type");
    constexpr int width = int(sizeof(T) * 8);
    if (count >= width)
        return T(~T(0));
    if (count <= 0)
        return T(0);
    return T((T(1) << count) - 1);
}

} // namespace es
