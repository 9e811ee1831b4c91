#pragma once

#include <odict/assert.hh>
#include <odict/fwd.hh>

#include <concepts>
#include <initializer_list>
#include <type_traits>

/// Non-owning view over a contiguous sequence of T, similar to std::span.
/// Stores a pointer and runtime size; trivially copyable regardless of T.
/// The viewed data must outlive the span. Spans returned by od::ordered_dictionary
/// are invalidated by the next mutating call on the dictionary.
template <class T>
struct od::span
{
    // construction
public:
    /// Default span is empty: data() == nullptr, size() == 0.
    constexpr span() = default;

    // keep triviality
    constexpr span(span const&) = default;
    constexpr span(span&&) = default;
    constexpr span& operator=(span const&) = default;
    constexpr span& operator=(span&&) = default;
    constexpr ~span() = default;

    /// Creates a span viewing [ptr, ptr+size).
    constexpr explicit span(T* ptr, isize size) : _data(ptr), _size(size)
    {
        OD_ASSERT(size >= 0, "span size must be non-negative");
    }

    /// Creates a span viewing [begin, end).
    constexpr explicit span(T* begin, T* end) : _data(begin), _size(end - begin)
    {
        OD_ASSERT(begin <= end, "invalid pointer range");
    }

    /// Creates a span from an initializer_list, only for const T.
    /// Safe ONLY as an immediate function argument: foo({1, 2, 3}).
    constexpr span(std::initializer_list<std::remove_const_t<T>> init)
        requires std::is_const_v<T>
      : _data(init.begin()), _size(static_cast<isize>(init.size()))
    {
    }

    /// Creates a span from any container providing .data() and .size().
    template <class Container>
        requires requires(Container&& c) {
            { c.data() } -> std::convertible_to<T*>;
            { c.size() } -> std::convertible_to<isize>;
        }
    constexpr explicit span(Container&& c) : _data(c.data()), _size(static_cast<isize>(c.size()))
    {
    }

    // element access
public:
    /// Precondition: 0 <= i < size().
    [[nodiscard]] constexpr T& operator[](isize i) const
    {
        OD_ASSERT(0 <= i && i < _size, "index out of bounds");
        return _data[i];
    }

    /// Precondition: !empty().
    [[nodiscard]] constexpr T& front() const
    {
        OD_ASSERT(_size > 0, "front() called on empty span");
        return _data[0];
    }

    /// Precondition: !empty().
    [[nodiscard]] constexpr T& back() const
    {
        OD_ASSERT(_size > 0, "back() called on empty span");
        return _data[_size - 1];
    }

    /// May be nullptr if the span is empty.
    [[nodiscard]] constexpr T* data() const { return _data; }

    // iterators
public:
    [[nodiscard]] constexpr T* begin() const { return _data; }
    [[nodiscard]] constexpr T* end() const { return _data + _size; }

    // queries
public:
    [[nodiscard]] constexpr isize size() const { return _size; }
    [[nodiscard]] constexpr bool empty() const { return _size == 0; }

    // members
private:
    T* _data = nullptr;
    isize _size = 0;
};
