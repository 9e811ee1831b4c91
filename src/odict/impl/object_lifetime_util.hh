#pragma once

#include <odict/fwd.hh>
#include <odict/utility.hh>

#include <type_traits>

namespace od::impl
{
/// Calls destructors on [start, end) in reverse order.
/// Empty ranges and nullptr are valid no-ops.
template <class T>
constexpr void destroy_objects_in_reverse(T* start, T* end)
{
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");

    if constexpr (!std::is_trivially_destructible_v<T>)
    {
        while (end != start)
        {
            --end;
            end->~T();
        }
    }
}

/// Copy-constructs `count` objects from `value` at *dest_end (uninitialized memory).
/// dest_end is advanced after each successful construction, so a throwing copy leaves
/// [original dest_end, dest_end) as the constructed range.
template <class T>
constexpr void fill_create_objects_to(T*& dest_end, isize count, T const& value)
{
    static_assert(std::is_copy_constructible_v<T>, "T must be copy constructible");

    for (isize i = 0; i < count; ++i)
    {
        new (od::placement_new, dest_end) T(value);
        ++dest_end;
    }
}

/// Copy-constructs [src_start, src_end) at *dest_end (uninitialized memory).
/// dest_end is advanced per constructed object. Trivially copyable types use memcpy.
template <class T>
constexpr void copy_create_objects_to(T*& dest_end, T const* src_start, T const* src_end)
{
    static_assert(std::is_copy_constructible_v<T>, "T must be copy constructible");

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        auto const size = src_end - src_start;
        od::memcpy(dest_end, src_start, size * isize(sizeof(T)));
        dest_end += size;
    }
    else
    {
        while (src_start != src_end)
        {
            new (od::placement_new, dest_end) T(*src_start);
            ++dest_end;
            ++src_start;
        }
    }
}

/// Move-constructs [src_start, src_end) at *dest_end (uninitialized memory).
/// Sources stay alive in moved-from state; the caller destroys them.
/// No exception-safety promise for throwing move constructors.
template <class T>
constexpr void move_create_objects_to(T*& dest_end, T* src_start, T* src_end)
{
    static_assert(std::is_move_constructible_v<T>, "T must be move constructible");

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        auto const size = src_end - src_start;
        od::memcpy(dest_end, src_start, size * isize(sizeof(T)));
        dest_end += size;
    }
    else
    {
        while (src_start != src_end)
        {
            new (od::placement_new, dest_end) T(od::move(*src_start));
            ++dest_end;
            ++src_start;
        }
    }
}

/// Move-assigns [src_start, src_end) onto [dest, dest + (src_end - src_start)), front to back.
/// All objects involved are alive; dest <= src_start so overlapping ranges are handled.
/// Used to close the gap left by an erased element.
template <class T>
constexpr void compact_move_objects_backward(T* dest, T* src_start, T* src_end)
{
    static_assert(std::is_move_assignable_v<T>, "T must be move assignable");

    while (src_start != src_end)
    {
        *dest = od::move(*src_start);
        ++dest;
        ++src_start;
    }
}

/// Move-assigns [first, last) onto [first + 1, last + 1), back to front.
/// All objects in [first, last] are alive. Afterwards *first is in moved-from state.
/// Used to open a gap for an inserted element.
template <class T>
constexpr void shift_move_objects_forward(T* first, T* last)
{
    static_assert(std::is_move_assignable_v<T>, "T must be move assignable");

    while (last != first)
    {
        *last = od::move(*(last - 1));
        --last;
    }
}
} // namespace od::impl
