#include <odict/optional.hh>

#include <nexus/test.hh>

#include <string>

// optional stays trivial
static_assert(std::is_constructible_v<od::optional<int>>);
static_assert(std::is_constructible_v<od::optional<int>, int>);
static_assert(std::is_constructible_v<od::optional<int>, od::nullopt_t>);
static_assert(std::is_trivially_copyable_v<od::optional<int>>);
static_assert(std::is_trivially_destructible_v<od::optional<int>>);
static_assert(!std::is_trivially_copyable_v<od::optional<std::string>>);

namespace
{
// move-only type for testing
struct move_only
{
    int value = 0;

    move_only() = default;
    explicit move_only(int v) : value(v) {}

    move_only(move_only const&) = delete;
    move_only(move_only&& rhs) noexcept : value(rhs.value) { rhs.value = -1; }
    move_only& operator=(move_only const&) = delete;
    move_only& operator=(move_only&& rhs) noexcept
    {
        value = rhs.value;
        rhs.value = -1;
        return *this;
    }
};

// counting type to track special member function calls
struct counting_type
{
    int value = 0;

    static inline int copy_ctor_count = 0;
    static inline int move_ctor_count = 0;
    static inline int dtor_count = 0;

    static void reset_counters()
    {
        copy_ctor_count = 0;
        move_ctor_count = 0;
        dtor_count = 0;
    }

    explicit counting_type(int v) : value(v) {}

    counting_type(counting_type const& rhs) : value(rhs.value) { ++copy_ctor_count; }
    counting_type(counting_type&& rhs) noexcept : value(rhs.value) { ++move_ctor_count; }
    counting_type& operator=(counting_type const&) = default;
    counting_type& operator=(counting_type&&) noexcept = default;

    ~counting_type() { ++dtor_count; }

    friend bool operator==(counting_type const&, counting_type const&) = default;
};
} // namespace

TEST("optional - trivial types")
{
    SECTION("default is empty")
    {
        auto const opt = od::optional<int>();
        CHECK(!opt.has_value());
        CHECK(opt == od::nullopt);
    }

    SECTION("value construction")
    {
        auto const opt = od::optional<int>(42);
        CHECK(opt.has_value());
        CHECK(opt.value() == 42);
        CHECK(opt == 42);
    }

    SECTION("copy")
    {
        auto const a = od::optional<od::isize>(od::isize(7));
        auto const b = a;
        CHECK(b == od::isize(7));
    }

    SECTION("nullopt construction")
    {
        od::optional<int> opt = od::nullopt;
        CHECK(!opt.has_value());
    }
}

TEST("optional - non-trivial types")
{
    SECTION("lifetime is balanced")
    {
        counting_type::reset_counters();
        {
            auto opt = od::optional<counting_type>(counting_type(1));
            auto copy = opt;
            auto moved = od::move(opt);

            CHECK(copy.value().value == 1);
            CHECK(moved.value().value == 1);
            CHECK(!opt.has_value()); // move construction empties the source
        }
        CHECK(counting_type::copy_ctor_count == 1);
        CHECK(counting_type::dtor_count == counting_type::copy_ctor_count + counting_type::move_ctor_count + 1);
    }

    SECTION("assignment between states")
    {
        auto a = od::optional<std::string>();
        auto const b = od::optional<std::string>(std::string("x"));

        a = b;
        CHECK(a == std::string("x"));

        a = od::optional<std::string>();
        CHECK(a == od::nullopt);

        a = od::optional<std::string>(std::string("y"));
        CHECK(a == std::string("y"));
    }
}

TEST("optional - move-only types")
{
    auto opt = od::optional<move_only>(move_only(5));
    auto moved = od::move(opt).value();
    CHECK(moved.value == 5);

    auto other = od::optional<move_only>();
    other = od::move(opt);
    CHECK(other.has_value());
}

TEST("optional - equality operator")
{
    auto const empty = od::optional<int>();
    auto const a = od::optional<int>(42);
    auto const b = od::optional<int>(42);
    auto const c = od::optional<int>(99);

    CHECK(empty == od::optional<int>());
    CHECK(a == b);
    CHECK(a != c);
    CHECK(a != empty);
    CHECK(empty != a);
    CHECK(a != 99);
    CHECK(empty != 42);
}

TEST("optional - value preserves category")
{
    SECTION("const")
    {
        auto const opt = od::optional<std::string>(std::string("hello"));
        auto const& ref = opt.value();
        CHECK(ref == "hello");
    }

    SECTION("mutable")
    {
        auto opt = od::optional<std::string>(std::string("hello"));
        opt.value() += " world";
        CHECK(opt.value() == "hello world");
    }
}
