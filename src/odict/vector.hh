#pragma once

#include <odict/allocation.hh>
#include <odict/assert.hh>


/// Dynamically allocated, contiguous sequence of T with value semantics.
/// Owns its memory through od::allocation<T>.
/// Besides the usual back growth it supports order-preserving positional insert and removal,
/// which is what the key and value sequences of od::ordered_dictionary are made of.
///
/// Capacity is explicit: push/insert grow by doubling when full, reserve(n) allocates exactly n.
/// Any reallocation invalidates pointers, references, iterators and spans.
/// Element moves are expected not to throw.
template <class T>
struct od::vector
{
    // element access
public:
    /// Precondition: 0 <= i < size().
    [[nodiscard]] constexpr T& operator[](isize i)
    {
        OD_ASSERT(0 <= i && i < size(), "index out of bounds");
        return _data.obj_start[i];
    }
    [[nodiscard]] constexpr T const& operator[](isize i) const
    {
        OD_ASSERT(0 <= i && i < size(), "index out of bounds");
        return _data.obj_start[i];
    }

    /// Precondition: !empty().
    [[nodiscard]] constexpr T& front()
    {
        OD_ASSERT(!empty(), "front() called on empty vector");
        return *_data.obj_start;
    }
    [[nodiscard]] constexpr T const& front() const
    {
        OD_ASSERT(!empty(), "front() called on empty vector");
        return *_data.obj_start;
    }

    /// Precondition: !empty().
    [[nodiscard]] constexpr T& back()
    {
        OD_ASSERT(!empty(), "back() called on empty vector");
        return *(_data.obj_end - 1);
    }
    [[nodiscard]] constexpr T const& back() const
    {
        OD_ASSERT(!empty(), "back() called on empty vector");
        return *(_data.obj_end - 1);
    }

    /// May be nullptr if nothing was ever allocated.
    [[nodiscard]] constexpr T* data() { return _data.obj_start; }
    [[nodiscard]] constexpr T const* data() const { return _data.obj_start; }

    // iterators
public:
    [[nodiscard]] constexpr T* begin() { return _data.obj_start; }
    [[nodiscard]] constexpr T* end() { return _data.obj_end; }
    [[nodiscard]] constexpr T const* begin() const { return _data.obj_start; }
    [[nodiscard]] constexpr T const* end() const { return _data.obj_end; }

    // queries
public:
    [[nodiscard]] constexpr isize size() const { return _data.obj_end - _data.obj_start; }
    [[nodiscard]] constexpr bool empty() const { return _data.obj_start == _data.obj_end; }

    /// Elements that can be appended without reallocation.
    [[nodiscard]] constexpr isize capacity_back() const { return _data.capacity_back(); }

    /// Total number of elements storable without reallocation.
    [[nodiscard]] constexpr isize capacity() const { return size() + capacity_back(); }

    /// Resource all allocations of this vector come from (nullptr = default).
    [[nodiscard]] od::memory_resource const* custom_resource() const { return _data.custom_resource; }

    // factories
public:
    /// Empty vector able to hold `capacity` elements without reallocation.
    /// The resource is remembered for all later growth, even when capacity == 0.
    [[nodiscard]] static vector create_with_capacity(isize capacity, od::memory_resource const* resource = nullptr)
    {
        vector v;
        v._data = od::allocation<T>::create_empty(capacity, alignof(T), resource);
        return v;
    }

    /// `size` copies of `value`.
    [[nodiscard]] static vector create_filled(isize size, T const& value, od::memory_resource const* resource = nullptr)
    {
        auto v = vector::create_with_capacity(size, resource);
        impl::fill_create_objects_to(v._data.obj_end, size, value);
        return v;
    }

    /// Deep copy of `source` with exactly source.size() capacity.
    [[nodiscard]] static vector create_copy_of(od::span<T const> source, od::memory_resource const* resource = nullptr)
    {
        vector v;
        v._data = od::allocation<T>::create_copy_of(source, resource);
        return v;
    }

    // capacity
public:
    /// Ensures capacity() >= min_capacity. Reallocates to exactly min_capacity if needed.
    void reserve(isize min_capacity)
    {
        if (min_capacity <= capacity())
            return;

        reallocate_to(min_capacity);
    }

    // appends and inserts
public:
    /// Constructs a new element at the back, doubling the capacity if full.
    /// Arguments may reference elements of this vector.
    /// Amortized O(1).
    template <class... Args>
    T& emplace_back(Args&&... args)
    {
        static_assert(std::is_constructible_v<T, Args&&...>, "emplace_back: T is not constructible from the provided "
                                                             "argument types");

        if (_data.capacity_back() < 1) [[unlikely]]
            return emplace_back_grow(od::forward<Args>(args)...);

        auto const p = new (od::placement_new, _data.obj_end) T(od::forward<Args>(args)...);
        _data.obj_end++; // _after_ so exceptions in T(...) leave state valid
        return *p;
    }

    T& push_back(T const& value) { return emplace_back(value); }
    T& push_back(T&& value) { return emplace_back(od::move(value)); }

    /// Inserts `value` before position `idx`, shifting [idx, size()) up by one.
    /// Precondition: 0 <= idx <= size().
    /// O(n) complexity.
    T& insert_at(isize idx, T value)
    {
        OD_ASSERT(0 <= idx && idx <= size(), "insert position out of bounds");

        if (idx == size())
            return emplace_back(od::move(value));

        // value is owned here, so growing cannot invalidate it
        if (_data.capacity_back() < 1) [[unlikely]]
            reallocate_to(grow_capacity_for(size() + 1));

        // last element moves into fresh storage, the rest is move-assigned one slot up
        new (od::placement_new, _data.obj_end) T(od::move(*(_data.obj_end - 1)));
        _data.obj_end++;
        impl::shift_move_objects_forward(_data.obj_start + idx, _data.obj_end - 2);

        auto& slot = _data.obj_start[idx];
        slot = od::move(value);
        return slot;
    }

    // removals
public:
    /// Removes and returns the element at idx, shifting the following elements down.
    /// Precondition: 0 <= idx < size().
    /// O(n) complexity.
    [[nodiscard("use remove_at() if you don't need the return value")]] T pop_at(isize idx)
    {
        OD_ASSERT(0 <= idx && idx < size(), "index out of bounds");

        auto const p_obj = _data.obj_start + idx;
        auto value = od::move(*p_obj);

        impl::compact_move_objects_backward(p_obj, p_obj + 1, _data.obj_end);

        // last element is now moved-from
        _data.obj_end--;
        _data.obj_end->~T();

        return value;
    }

    /// Removes the element at idx, shifting the following elements down.
    /// Precondition: 0 <= idx < size().
    /// O(n) complexity.
    void remove_at(isize idx)
    {
        OD_ASSERT(0 <= idx && idx < size(), "index out of bounds");

        auto const p_obj = _data.obj_start + idx;
        impl::compact_move_objects_backward(p_obj, p_obj + 1, _data.obj_end);

        _data.obj_end--;
        _data.obj_end->~T();
    }

    /// Destroys all elements, keeps the capacity.
    void clear()
    {
        impl::destroy_objects_in_reverse(_data.obj_start, _data.obj_end);
        _data.obj_end = _data.obj_start;
    }

    // lifecycle
public:
    vector() = default;
    ~vector() = default;

    vector(vector&&) noexcept = default;
    vector& operator=(vector&&) noexcept = default;

    /// Deep copy, tight capacity, same resource.
    vector(vector const& rhs)
        requires std::is_copy_constructible_v<T>
      : _data(od::allocation<T>::create_copy_of(rhs.const_span(), rhs._data.custom_resource))
    {
    }
    vector& operator=(vector const& rhs)
        requires std::is_copy_constructible_v<T>
    {
        if (this != &rhs)
            _data = od::allocation<T>::create_copy_of(rhs.const_span(), rhs._data.custom_resource);
        return *this;
    }

private:
    [[nodiscard]] od::span<T const> const_span() const { return od::span<T const>(_data.obj_start, size()); }

    [[nodiscard]] isize grow_capacity_for(isize min_size) const { return od::max(capacity() * 2, min_size); }

    // moves the live elements into a new allocation of exactly new_capacity elements
    OD_COLD_FUNC void reallocate_to(isize new_capacity)
    {
        OD_ASSERT(new_capacity >= size(), "cannot reallocate below the live size");

        auto new_data = od::allocation<T>::create_empty(new_capacity, alignof(T), _data.custom_resource);
        impl::move_create_objects_to(new_data.obj_end, _data.obj_start, _data.obj_end);

        // destroys the moved-from originals and frees the old block
        _data = od::move(new_data);
    }

    template <class... Args>
    OD_COLD_FUNC T& emplace_back_grow(Args&&... args)
    {
        auto const old_size = size();
        auto new_data = od::allocation<T>::create_empty(grow_capacity_for(old_size + 1), alignof(T), _data.custom_resource);

        // construct first: args may reference elements of the old allocation
        auto const p = new (od::placement_new, new_data.obj_start + old_size) T(od::forward<Args>(args)...);

        impl::move_create_objects_to(new_data.obj_end, _data.obj_start, _data.obj_end);
        new_data.obj_end++; // now includes *p

        _data = od::move(new_data);
        return *p;
    }

    od::allocation<T> _data;
};
