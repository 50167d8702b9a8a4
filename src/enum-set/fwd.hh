#pragma once

#include <cstddef>
#include <cstdint>


namespace es
{

//
// Primitives
//

// Explicitly-sized primitive types
// Masks and ordinals are always u32: the set representation is exactly one 32-bit word.
// Sizes and counts are isize, as in the rest of the library.

// signed integers
using i8 = int8_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;

// unsigned integers
using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;

// signed size type
// Subtraction on sizes must not wrap, and popcounts compare naturally against signed loop counters.
using isize = i64;

//
// Ordinal mapping
//

template <class E>
struct ordinal_mapping;

//
// Containers
//

template <class E>
struct enum_set;
template <class E>
struct enum_set_iterator;

} // namespace es
