#include "allocation.hh"

#include <odict/assertf.hh>
#include <odict/macros.hh>
#include <odict/utility.hh>

#include <cstdlib>

namespace
{
// The system allocator is stateless, userdata is ignored.

od::isize system_allocate_bytes(od::byte** out_ptr, od::isize min_bytes, od::isize max_bytes, od::isize alignment, void* userdata)
{
    OD_UNUSED(userdata);
    OD_UNUSED(max_bytes);

    OD_ASSERT(out_ptr != nullptr, "out_ptr must not be null");
    OD_ASSERT(alignment > 0 && od::is_power_of_two(alignment), "alignment must be a power of 2");
    OD_ASSERT(0 <= min_bytes && min_bytes <= max_bytes, "must have 0 <= min_bytes <= max_bytes");

    if (min_bytes == 0)
    {
        *out_ptr = nullptr;
        return 0;
    }

    od::byte* p = nullptr;

#ifdef OD_OS_WINDOWS
    p = static_cast<od::byte*>(_aligned_malloc(min_bytes, alignment));
#else
    // posix_memalign has no bytes % alignment == 0 requirement (unlike std::aligned_alloc)
    // but needs alignment >= sizeof(void*)
    void* raw_ptr = nullptr;
    od::isize const effective_alignment = alignment < od::isize(sizeof(void*)) ? od::isize(sizeof(void*)) : alignment;
    int const result = posix_memalign(&raw_ptr, size_t(effective_alignment), size_t(min_bytes));
    p = result == 0 ? static_cast<od::byte*>(raw_ptr) : nullptr;
#endif

    OD_ASSERTF_ALWAYS(p != nullptr, "allocation failed: requested {} bytes with alignment {}", min_bytes, alignment);

    *out_ptr = p;
    return min_bytes;
}

void system_deallocate_bytes(od::byte* p, od::isize bytes, od::isize alignment, void* userdata)
{
    OD_UNUSED(bytes);
    OD_UNUSED(alignment);
    OD_UNUSED(userdata);

    // must match the allocation function of the platform
#ifdef OD_OS_WINDOWS
    _aligned_free(p);
#else
    std::free(p);
#endif
}

/// Stored in the data segment (not on the heap), valid during static initialization.
constinit od::memory_resource const system_memory_resource = {
    .allocate_bytes = system_allocate_bytes,
    .deallocate_bytes = system_deallocate_bytes,
    .userdata = nullptr,
};

} // namespace

constinit od::memory_resource const* const od::default_memory_resource = &system_memory_resource;
