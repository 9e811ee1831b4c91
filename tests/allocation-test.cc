#include <odict/allocation.hh>
#include <odict/span.hh>
#include <odict/utility.hh>

#include <nexus/test.hh>

#include <new>
#include <vector>

namespace
{
// Instrumented type that tracks construction and destruction
struct Tracked
{
    int value = 0;
    static inline int copy_ctor_count = 0;
    static inline int dtor_count = 0;
    static inline std::vector<int>* destruction_order = nullptr;

    static void reset_counters()
    {
        copy_ctor_count = 0;
        dtor_count = 0;
        destruction_order = nullptr;
    }

    explicit Tracked(int v) : value(v) {}
    Tracked(Tracked const& rhs) : value(rhs.value) { ++copy_ctor_count; }
    Tracked& operator=(Tracked const&) = default;

    ~Tracked()
    {
        ++dtor_count;
        if (destruction_order)
            destruction_order->push_back(value);
    }
};

// Resource that records the parameters it was called with
struct RecordingResource : od::memory_resource
{
    od::isize last_min_bytes = -1;
    od::isize last_alignment = -1;
    od::isize last_dealloc_bytes = -1;
    int live_blocks = 0;

    RecordingResource()
    {
        allocate_bytes = [](od::byte** out_ptr, od::isize min_bytes, od::isize, od::isize alignment, void* userdata) -> od::isize
        {
            auto* self = static_cast<RecordingResource*>(userdata);
            self->last_min_bytes = min_bytes;
            self->last_alignment = alignment;
            ++self->live_blocks;
            *out_ptr = static_cast<od::byte*>(::operator new(min_bytes, std::align_val_t(alignment)));
            return min_bytes;
        };

        deallocate_bytes = [](od::byte* p, od::isize bytes, od::isize alignment, void* userdata)
        {
            auto* self = static_cast<RecordingResource*>(userdata);
            self->last_dealloc_bytes = bytes;
            --self->live_blocks;
            ::operator delete(p, std::align_val_t(alignment));
        };

        userdata = this;
    }
};
} // namespace

TEST("allocation - default construction")
{
    od::allocation<int> alloc;

    CHECK(alloc.obj_start == nullptr);
    CHECK(alloc.obj_end == nullptr);
    CHECK(alloc.alloc_start == nullptr);
    CHECK(alloc.alloc_end == nullptr);
    CHECK(alloc.alignment == 0);
    CHECK(alloc.custom_resource == nullptr);
    CHECK(!alloc.is_valid());
    CHECK(alloc.obj_span().size() == 0);
    CHECK(alloc.capacity_back() == 0);
}

TEST("allocation - create_empty")
{
    SECTION("some capacity")
    {
        auto alloc = od::allocation<int>::create_empty(10, alignof(int), nullptr);

        CHECK(alloc.is_valid());
        CHECK(alloc.alloc_size_bytes() == 10 * od::isize(sizeof(int)));
        CHECK(alloc.obj_start == (int*)alloc.alloc_start);
        CHECK(alloc.obj_end == alloc.obj_start);
        CHECK(alloc.capacity_back() == 10);
        CHECK(&alloc.resource() == od::default_memory_resource);
    }

    SECTION("zero size does not allocate")
    {
        RecordingResource res;
        auto alloc = od::allocation<int>::create_empty(0, alignof(int), &res);

        CHECK(!alloc.is_valid());
        CHECK(alloc.obj_start == nullptr);
        CHECK(alloc.custom_resource == &res);
        CHECK(res.last_min_bytes == -1);
    }

    SECTION("over-aligned")
    {
        auto alloc = od::allocation<int>::create_empty(10, 64, nullptr);
        CHECK(alloc.alignment == 64);
        CHECK(od::is_aligned(alloc.alloc_start, 64));
    }
}

TEST("allocation - create_copy_of")
{
    Tracked const source[] = {Tracked(1), Tracked(2), Tracked(3)};
    Tracked::reset_counters();
    {
        auto alloc = od::allocation<Tracked>::create_copy_of(od::span<Tracked const>(source, 3), nullptr);
        CHECK(alloc.obj_span().size() == 3);
        CHECK(alloc.capacity_back() == 0);
        CHECK(alloc.obj_start[2].value == 3);
        CHECK(Tracked::copy_ctor_count == 3);
    }
    CHECK(Tracked::dtor_count == 3);
}

TEST("allocation - destruction order is reverse")
{
    Tracked const source[] = {Tracked(0), Tracked(1), Tracked(2)};
    std::vector<int> order;
    {
        auto alloc = od::allocation<Tracked>::create_copy_of(od::span<Tracked const>(source, 3), nullptr);
        Tracked::destruction_order = &order;
    }
    Tracked::destruction_order = nullptr;

    CHECK(order == std::vector<int>({2, 1, 0}));
}

TEST("allocation - move transfers ownership and keeps the resource")
{
    RecordingResource res;
    {
        auto a = od::allocation<int>::create_empty(4, alignof(int), &res);
        auto const p = a.alloc_start;

        auto b = od::move(a);
        CHECK(b.alloc_start == p);
        CHECK(!a.is_valid());
        CHECK(a.custom_resource == &res);
        CHECK(res.live_blocks == 1);

        auto c = od::allocation<int>::create_empty(8, alignof(int), &res);
        CHECK(res.live_blocks == 2);
        c = od::move(b);
        CHECK(res.live_blocks == 1);
        CHECK(res.last_dealloc_bytes == 8 * od::isize(sizeof(int)));
        CHECK(c.alloc_start == p);
    }
    CHECK(res.live_blocks == 0);
}

TEST("allocation - resource receives requested size and alignment")
{
    RecordingResource res;
    auto alloc = od::allocation<double>::create_empty(3, 32, &res);

    CHECK(res.last_min_bytes == 3 * od::isize(sizeof(double)));
    CHECK(res.last_alignment == 32);
    CHECK(&alloc.resource() == &res);
}
