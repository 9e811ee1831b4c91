#pragma once

#include <cstddef>
#include <cstdint>


namespace od
{

//
// Primitives
//

// Explicitly-sized primitive types
// Positions and sizes throughout odict are signed (isize) so that "size - 1" and
// "not found" (-1) need no special casing.

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

// generic bytes
using byte = std::byte;

// signed size type, also used for positions
using isize = i64;

// pointer
using nullptr_t = std::nullptr_t;

//
// Memory
//

struct memory_resource;
template <class T>
struct allocation;

//
// Views
//

template <class T>
struct span;

//
// Container
//

struct nullopt_t;
template <class T>
struct optional;

template <class A, class B>
struct pair;

template <class T>
struct vector;

template <class K>
struct hash_index;

template <class K, class V>
struct ordered_dictionary;
template <class K, class V>
struct entry_stream;

} // namespace od
