#pragma once

#include <odict/ordered_dictionary.hh>

#include <algorithm>
#include <format>
#include <iterator>
#include <string>

// Text rendering of an ordered_dictionary, one entry per line in positional order:
//
//   {
//   1: a
//   2: b
//   }
//
// An empty dictionary renders as "{\n}".
// Keys and values are rendered with std::format("{}"), so both must be std::formattable.

namespace od
{
template <class K, class V>
    requires std::formattable<K, char> && std::formattable<V, char>
[[nodiscard]] std::string to_string(ordered_dictionary<K, V> const& dict)
{
    std::string result = "{\n";

    auto const keys = dict.keys();
    auto const values = dict.values();
    for (isize i = 0; i < dict.size(); ++i)
        std::format_to(std::back_inserter(result), "{}: {}\n", keys[i], values[i]);

    result += '}';
    return result;
}
} // namespace od

/// Usage: std::format("{}", dict) == od::to_string(dict)
template <class K, class V>
    requires std::formattable<K, char> && std::formattable<V, char>
struct std::formatter<od::ordered_dictionary<K, V>, char>
{
    constexpr auto parse(std::format_parse_context& ctx) { return ctx.begin(); }

    template <class FormatContext>
    auto format(od::ordered_dictionary<K, V> const& dict, FormatContext& ctx) const
    {
        auto const text = od::to_string(dict);
        return std::copy(text.begin(), text.end(), ctx.out());
    }
};
