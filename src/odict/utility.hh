#pragma once

#include <odict/assert.hh>
#include <odict/fwd.hh>

#include <cstring>
#include <new>
#include <type_traits>

// =========================================================================================================
// Utility functions used across the odict containers
// =========================================================================================================
//
// Move semantics:
//   move(value)                 - cast value to rvalue reference for moving
//   forward<T>(value)           - perfect forwarding for template arguments
//   exchange(obj, new_val)      - replace obj with new_val and return old value
//
// Comparison:
//   max(a, b) / min(a, b)       - larger / smaller of two values (requires operator<)
//
// Alignment:
//   is_power_of_two(value)      - check if value is a power of 2
//   align_up(value, alignment)  - increment to next aligned boundary (power of 2)
//   is_aligned(value, alignment)- check if aligned at boundary (power of 2)
//
// Object lifetime:
//   placement_new               - tag for non-allocating placement new
//   storage_for<T>              - uninitialized storage with size and alignment of T
//   memcpy(dest, src, bytes)    - byte copy for trivially copyable ranges
//
// Templates and iteration:
//   function_ptr<Signature>     - convert function signature to function pointer type
//   sentinel                    - lightweight end-of-range sentinel type
//

namespace od
{
// =========================================================================================================
// Move semantics
// =========================================================================================================

template <class T>
[[nodiscard]] OD_FORCE_INLINE constexpr T&& move(T& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] OD_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] OD_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>&& value) noexcept // NOLINT
{
    return static_cast<T&&>(value);
}

/// Replace obj with new_val and return obj's previous value
/// Usage:
///   auto p = od::exchange(_data, nullptr); // take ownership, leave source empty
template <class T, class U = T>
[[nodiscard]] OD_FORCE_INLINE constexpr T exchange(T& obj, U&& new_val) // NOLINT
{
    T old_val = static_cast<T&&>(obj);
    obj = od::forward<U>(new_val);
    return old_val;
}

// =========================================================================================================
// Comparison
// =========================================================================================================

/// Returns the larger of two values using operator<
/// When a == b, max returns b
template <class T>
[[nodiscard]] constexpr T const& max(T const& a, T const& b)
{
    return (b < a) ? a : b; // NOLINT(bugprone-return-const-ref-from-parameter)
}

/// Returns the smaller of two values using operator<
/// When a == b, min returns a
template <class T>
[[nodiscard]] constexpr T const& min(T const& a, T const& b)
{
    return (b < a) ? b : a; // NOLINT(bugprone-return-const-ref-from-parameter)
}

// =========================================================================================================
// Alignment (for values or pointers)
// =========================================================================================================

template <class T>
[[nodiscard]] constexpr bool is_power_of_two(T value)
{
    OD_ASSERT(value > 0, "is_power_of_two: value must be positive");
    return (value & (value - 1)) == 0;
}

/// Rounds value up to the next multiple of alignment
/// Precondition: alignment is a power of 2
template <class T>
[[nodiscard]] constexpr T align_up(T value, isize alignment)
{
    OD_ASSERT(alignment > 0 && is_power_of_two(alignment), "align_up: alignment must be a power of 2");
    return (T)(((isize)value + (alignment - 1)) & ~(alignment - 1));
}

template <class T>
[[nodiscard]] constexpr bool is_aligned(T value, isize alignment)
{
    OD_ASSERT(alignment > 0 && is_power_of_two(alignment), "is_aligned: alignment must be a power of 2");
    return 0 == ((isize)value & (alignment - 1));
}

// =========================================================================================================
// Object lifetime
// =========================================================================================================

/// Tag selecting the non-allocating placement new below
/// Usage: new (od::placement_new, ptr) T(args...);
struct placement_new_t
{
};
constexpr placement_new_t placement_new = {};

/// Uninitialized storage for a single T
/// The value member is only alive while the owner says so (see od::optional)
template <class T>
union storage_for
{
    storage_for() {}
    ~storage_for()
        requires std::is_trivially_destructible_v<T>
    = default;
    ~storage_for()
        requires(!std::is_trivially_destructible_v<T>)
    {
    }

    storage_for(storage_for const&)
        requires std::is_trivially_copyable_v<T>
    = default;
    storage_for& operator=(storage_for const&)
        requires std::is_trivially_copyable_v<T>
    = default;

    T value;
};

/// Byte copy, bytes == 0 is a no-op (null pointers allowed then)
inline void memcpy(void* dest, void const* src, isize bytes)
{
    if (bytes > 0)
        std::memcpy(dest, src, size_t(bytes));
}

// =========================================================================================================
// Template metaprogramming utilities
// =========================================================================================================

template <class... E>
constexpr bool always_false_t = false;

namespace impl
{
template <class T>
struct function_ptr_t
{
    static_assert(always_false_t<T>, "function_ptr should only be used with function signatures");
};
template <class R, class... Args>
struct function_ptr_t<R(Args...)>
{
    using type = R (*)(Args...);
};
} // namespace impl

/// Function pointer type from a signature, e.g. function_ptr<void(int)> == void(*)(int)
template <class T>
using function_ptr = typename impl::function_ptr_t<T>::type;

// =========================================================================================================
// Iterator utilities
// =========================================================================================================

/// End marker for single-pass ranges whose end is a state, not a position
struct sentinel
{
};

} // namespace od

/// Non-allocating placement new selected by od::placement_new
[[nodiscard]] inline void* operator new(std::size_t, od::placement_new_t, void* p) noexcept
{
    return p;
}

// never called, required to pair with the placement new above
inline void operator delete(void*, od::placement_new_t, void*) noexcept {}
