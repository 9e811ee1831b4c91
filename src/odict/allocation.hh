#pragma once

#include <odict/fwd.hh>
#include <odict/impl/object_lifetime_util.hh>
#include <odict/span.hh>
#include <odict/utility.hh>

// od::allocation<T> is the owning "storage + liveness" handle underneath od::vector<T>,
// and through it, underneath every sequence of an od::ordered_dictionary.
//
// It models two things explicitly:
// 1) which bytes are owned (the allocation from an od::memory_resource),
// 2) which objects inside those bytes are currently alive (the live window).
//
// Memory comes from a function-pointer based od::memory_resource stored in the allocation.
// A null resource means "use od::default_memory_resource".
//
// Core invariants:
// - [alloc_start, alloc_end) is the owned byte range (exclusive end).
// - [obj_start, obj_end) is the live object range, always within the allocation.
// - obj_start and obj_end are aligned to alignof(T), even when empty.
// - custom_resource == nullptr implies od::default_memory_resource.

namespace od
{
/// Default memory resource used when allocation::custom_resource == nullptr.
/// Lives in the data segment, so it is valid during static initialization.
extern od::memory_resource const* const default_memory_resource;
} // namespace od

/// Allocator interface for all odict storage.
/// POD struct of function pointers: no virtual dispatch, no non-trivial constructors.
struct od::memory_resource
{
    /// Allocate between `min_bytes` and `max_bytes` with at least `alignment` alignment.
    /// Returns the actual allocated size in [min_bytes, max_bytes], the pointer is stored in `*out_ptr`.
    /// min_bytes == 0 always sets *out_ptr to nullptr and returns 0.
    /// min_bytes > 0 always sets *out_ptr to non-null; failure is fatal or throws.
    od::function_ptr<isize(od::byte** out_ptr, isize min_bytes, isize max_bytes, isize alignment, void* userdata)> allocate_bytes
        = nullptr;

    /// Deallocate a block previously obtained from allocate_bytes with matching bytes and alignment.
    od::function_ptr<void(od::byte* p, isize bytes, isize alignment, void* userdata)> deallocate_bytes = nullptr;

    /// User-defined data for custom allocators, nullptr for stateless ones.
    void* userdata = nullptr;
};

/// Owning allocation handle for a contiguous byte block plus a typed live window inside it.
/// Capacity is implicit: the whole sizeof(T) slots between obj_end and alloc_end.
template <class T>
struct od::allocation
{
    /// First live object, aligned to alignof(T).
    T* obj_start = nullptr;

    /// One past the last live object, aligned to alignof(T).
    T* obj_end = nullptr;

    /// Base pointer returned by the memory resource, passed back on deallocation.
    od::byte* alloc_start = nullptr;

    /// End of the owned bytes (exclusive).
    od::byte* alloc_end = nullptr;

    /// Alignment used for the byte allocation, needed again for deallocation.
    isize alignment = 0;

    /// Resource that owns the bytes, nullptr for the global default.
    od::memory_resource const* custom_resource = nullptr;

    // minimal helper api
public:
    [[nodiscard]] od::memory_resource const& resource() const
    {
        return custom_resource ? *custom_resource : *default_memory_resource;
    }

    /// True iff bytes are owned (alloc_start < alloc_end); the live window may still be empty
    [[nodiscard]] bool is_valid() const { return alloc_start != nullptr; }

    /// Live objects as a span
    /// Note: const correctness is the caller's responsibility
    [[nodiscard]] od::span<T> obj_span() const { return od::span<T>(obj_start, obj_end); }

    [[nodiscard]] isize alloc_size_bytes() const { return alloc_end - alloc_start; }

    /// Number of objects that fit behind obj_end without reallocation
    [[nodiscard]] isize capacity_back() const
    {
        // nullptr - nullptr == 0 is well-defined
        auto const back_bytes = alloc_end - (od::byte const*)obj_end;
        return back_bytes / isize(sizeof(T));
    }

    // factories
public:
    /// Empty allocation with room for `count` objects and no live objects.
    /// count == 0 results in nullptr without calling the resource.
    [[nodiscard]] static allocation create_empty(isize count, isize alignment, memory_resource const* resource)
    {
        OD_ASSERT(count >= 0, "count must be non-negative");
        OD_ASSERT(alignment >= isize(alignof(T)), "alignment must be at least alignof(T)");

        allocation result;
        result.custom_resource = resource;
        result.alignment = alignment;

        auto const bytes = count * isize(sizeof(T));
        if (bytes > 0)
        {
            auto const& res = result.resource();
            auto const actual_bytes = res.allocate_bytes(&result.alloc_start, bytes, bytes, alignment, res.userdata);
            result.alloc_end = result.alloc_start + actual_bytes;
        }

        result.obj_start = (T*)result.alloc_start;
        result.obj_end = result.obj_start;
        return result;
    }

    /// Tight deep copy of `source` (no spare capacity).
    [[nodiscard]] static allocation create_copy_of(span<T const> source, memory_resource const* resource)
    {
        auto result = allocation::create_empty(source.size(), alignof(T), resource);
        impl::copy_create_objects_to(result.obj_end, source.data(), source.data() + source.size());
        return result;
    }

    // lifecycle
public:
    allocation() = default;

    // no implicit copies, containers decide how to copy
    allocation(allocation const&) = delete;
    allocation& operator=(allocation const&) = delete;

    allocation(allocation&& rhs) noexcept
      : obj_start(od::exchange(rhs.obj_start, nullptr)),
        obj_end(od::exchange(rhs.obj_end, nullptr)),
        alloc_start(od::exchange(rhs.alloc_start, nullptr)),
        alloc_end(od::exchange(rhs.alloc_end, nullptr)),
        alignment(od::exchange(rhs.alignment, 0)),
        custom_resource(rhs.custom_resource) // rhs resource stays
    {
    }

    /// Safe even if rhs is nested inside one of the objects destroyed here:
    /// rhs is emptied into a temporary first, then our objects are destroyed.
    allocation& operator=(allocation&& rhs) noexcept
    {
        if (this != &rhs)
        {
            auto rhs_tmp = od::move(rhs);

            release();

            obj_start = od::exchange(rhs_tmp.obj_start, nullptr);
            obj_end = od::exchange(rhs_tmp.obj_end, nullptr);
            alloc_start = od::exchange(rhs_tmp.alloc_start, nullptr);
            alloc_end = od::exchange(rhs_tmp.alloc_end, nullptr);
            alignment = od::exchange(rhs_tmp.alignment, 0);
            custom_resource = rhs_tmp.custom_resource; // rhs resource stays
        }

        return *this;
    }

    ~allocation() { release(); }

private:
    // destroys live objects and returns the bytes, leaves member pointers dangling
    void release()
    {
        impl::destroy_objects_in_reverse(obj_start, obj_end);

        if (alloc_start != nullptr)
        {
            auto const& res = resource();
            res.deallocate_bytes(alloc_start, alloc_end - alloc_start, alignment, res.userdata);
        }
    }
};
