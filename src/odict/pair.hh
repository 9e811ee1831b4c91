#pragma once

#include <odict/fwd.hh>
#include <odict/utility.hh>

#include <utility>

/// Aggregate pair, the element type of od::entry_stream
/// Supports structured bindings: auto [key, value] = stream.next().value();
template <class A, class B>
struct od::pair
{
    using first_t = A;
    using second_t = B;

    [[nodiscard]] friend constexpr bool operator==(pair const&, pair const&) = default;

    A first;
    B second;

    template <std::size_t I, class P>
    [[nodiscard]] friend constexpr decltype(auto) get(P&& p) noexcept
        requires(std::is_same_v<std::remove_cvref_t<P>, pair> && I < 2)
    {
        if constexpr (I == 0)
            return (od::forward<P>(p).first);
        else
            return (od::forward<P>(p).second);
    }
};

namespace std
{
template <class A, class B>
struct tuple_size<od::pair<A, B>> : std::integral_constant<std::size_t, 2>
{
};

template <std::size_t I, class A, class B>
struct tuple_element<I, od::pair<A, B>>
{
    static_assert(I < 2);
    using type = std::conditional_t<I == 0, A, B>;
};
} // namespace std
