#pragma once

#include <odict/assertf.hh>
#include <odict/bit.hh>
#include <odict/fwd.hh>
#include <odict/hash_index.hh>
#include <odict/optional.hh>
#include <odict/pair.hh>
#include <odict/span.hh>
#include <odict/utility.hh>
#include <odict/vector.hh>

#include <algorithm>
#include <concepts>
#include <functional>

// =========================================================================================================
// od::ordered_dictionary<K, V>
// =========================================================================================================
//
// A map from unique keys to values that also keeps the entries in a positional order.
//
// Storage is three co-indexed structures that every operation keeps in lockstep:
//   keys    od::vector<K>      keys[p] is the key at position p
//   values  od::vector<V>      values[p] belongs to keys[p]
//   index   od::hash_index<K>  key -> p, resolved through keys
//
// Complexity:
//   get, contains, position_of        O(1) average
//   push_back                         O(1) amortized
//   get_at, keys(), values()          O(1)
//   pop_key, remove_key, insert_at    O(n) (positions after the touched slot shift)
//   sort_by_keys, sort_by_values      O(n log n), stable
//
// Capacity is explicit and shared by all three structures.
// When an entry is added to a full dictionary the capacity becomes 2 (from 0)
// or twice the largest power of two not above the current capacity.
// reserve(n) adds exactly n.
//
// Usage:
//   auto d = od::ordered_dictionary<int, std::string>();
//   d.push_back(1, "a");
//   d.push_back(2, "b");
//   d.get(1);                 // optional("a")
//   d.get_at(1);              // optional("b")
//   d.insert_at(0, 7, "z");   // keys: 7, 1, 2
//   d.sort_by_keys();         // keys: 1, 2, 7
//   for (auto&& [k, v] : od::move(d).into_entries())
//       ...

namespace od
{
/// Key requirements: equality, std::hash, total order (for sort_by_keys), copyable
template <class K>
concept dictionary_key = std::totally_ordered<K> && std::copy_constructible<K> && requires(K const& k) {
    { std::hash<K>{}(k) } -> std::convertible_to<std::size_t>;
};

/// Value requirements: equality, total order (for sort_by_values), copyable
template <class V>
concept dictionary_value = std::totally_ordered<V> && std::copy_constructible<V>;
} // namespace od

template <class K, class V>
struct od::ordered_dictionary
{
    static_assert(od::dictionary_key<K>, "K must be hashable, totally ordered and copy constructible");
    static_assert(od::dictionary_value<V>, "V must be totally ordered and copy constructible");

    using key_t = K;
    using value_t = V;

    // queries
public:
    [[nodiscard]] isize size() const { return _keys.size(); }
    [[nodiscard]] bool empty() const { return _keys.empty(); }

    /// Entries storable without growing; always >= size()
    [[nodiscard]] isize capacity() const { return _keys.capacity(); }

    [[nodiscard]] bool contains(K const& key) const { return _index.find(key, keys()) >= 0; }

    /// Current position of `key`, nullopt if absent
    [[nodiscard]] od::optional<isize> position_of(K const& key) const
    {
        auto const pos = _index.find(key, keys());
        if (pos < 0)
            return od::nullopt;
        return pos;
    }

    /// Resource all storage comes from, nullptr for the default system resource
    [[nodiscard]] od::memory_resource const* resource() const { return _keys.custom_resource(); }

    // lookup
public:
    /// Copy of the value stored for `key`, nullopt if absent.
    /// O(1) average.
    [[nodiscard]] od::optional<V> get(K const& key) const
    {
        auto const pos = _index.find(key, keys());
        if (pos < 0)
            return od::nullopt;
        return od::optional<V>(_values[pos]);
    }

    /// Copy of the value at `position`, nullopt if position is outside [0, size()).
    [[nodiscard]] od::optional<V> get_at(isize position) const
    {
        if (position < 0 || position >= size())
            return od::nullopt;
        return od::optional<V>(_values[position]);
    }

    /// Copy of the value stored for `key`, or `fallback` if absent. Never mutates.
    [[nodiscard]] V get_or(K const& key, V fallback) const
    {
        auto const pos = _index.find(key, keys());
        if (pos < 0)
            return fallback;
        return _values[pos];
    }

    /// Keys in positional order; invalidated by the next mutating call
    [[nodiscard]] od::span<K const> keys() const { return od::span<K const>(_keys.data(), _keys.size()); }

    /// Values in positional order, values()[i] belongs to keys()[i]; invalidated by the next mutating call
    [[nodiscard]] od::span<V const> values() const { return od::span<V const>(_values.data(), _values.size()); }

    // modification
public:
    /// Appends (key, value) as the last entry.
    /// If `key` is already present its value is overwritten in place
    /// and position, size and capacity stay unchanged.
    /// O(1) amortized.
    void push_back(K key, V value)
    {
        if (auto const pos = _index.find(key, keys()); pos >= 0)
        {
            _values[pos] = od::move(value);
            return;
        }

        if (size() == capacity())
            grow_to(next_capacity());

        _index.insert(key, size());
        _keys.push_back(od::move(key));
        _values.push_back(od::move(value));
    }

    /// Inserts (key, value) at `position`; entries at and after it move up by one.
    /// Grows like push_back when full.
    /// Contract (checked in all builds, before any change): 0 <= position <= size(), key not present.
    /// O(n).
    void insert_at(isize position, K key, V value)
    {
        OD_ASSERTF_ALWAYS(0 <= position && position <= size(), "insert position {} out of range [0, {}]", position, size());
        OD_ASSERT_ALWAYS(!contains(key), "key already present, use push_back to overwrite its value");

        if (size() == capacity())
            grow_to(next_capacity());

        _index.shift_positions_from(position, 1);
        _index.insert(key, position);
        _keys.insert_at(position, od::move(key));
        _values.insert_at(position, od::move(value));
    }

    /// Removes the entry for `key` and returns its value, nullopt (and no change) if absent.
    /// Entries after it move down by one. Capacity is kept.
    /// O(n).
    [[nodiscard("use remove_key() if you don't need the value")]] od::optional<V> pop_key(K const& key)
    {
        auto const pos = _index.erase(key, keys());
        if (pos < 0)
            return od::nullopt;

        _keys.remove_at(pos);
        auto value = _values.pop_at(pos);
        _index.shift_positions_from(pos + 1, -1);

        return od::optional<V>(od::move(value));
    }

    /// Removes the entry for `key`. Returns false (and changes nothing) if absent.
    /// O(n).
    bool remove_key(K const& key)
    {
        auto const pos = _index.erase(key, keys());
        if (pos < 0)
            return false;

        _keys.remove_at(pos);
        _values.remove_at(pos);
        _index.shift_positions_from(pos + 1, -1);
        return true;
    }

    /// Increases the capacity by exactly `additional`. Entries are untouched.
    void reserve(isize additional)
    {
        OD_ASSERT(additional >= 0, "reserve amount must be non-negative");
        if (additional > 0)
            grow_to(capacity() + additional);
    }

    // reordering
public:
    /// Reorders entries so keys ascend, values stay paired with their keys.
    void sort_by_keys()
    {
        apply_stable_order([this](isize a, isize b) { return _keys[a] < _keys[b]; });
    }

    /// Reorders entries so values ascend, values stay paired with their keys.
    /// Entries with equal values keep their relative order.
    void sort_by_values()
    {
        apply_stable_order([this](isize a, isize b) { return _values[a] < _values[b]; });
    }

    // consumption
public:
    /// Moves all entries into a one-shot stream in positional order.
    /// The dictionary is left empty with capacity 0.
    [[nodiscard]] od::entry_stream<K, V> into_entries() &&
    {
        _index = od::hash_index<K>();
        return od::entry_stream<K, V>(od::move(_keys), od::move(_values));
    }

    /// Dictionary containing the remaining entries of `entries` in stream order.
    /// Capacity equals the number of entries.
    [[nodiscard]] static ordered_dictionary create_from_entries(od::entry_stream<K, V>&& entries,
                                                                od::memory_resource const* resource = nullptr)
    {
        auto result = ordered_dictionary::create_with_capacity(entries.remaining(), resource);
        for (auto&& [key, value] : entries)
            result.push_back(od::move(key), od::move(value));
        return result;
    }

    // factories
public:
    /// Empty dictionary with exactly `capacity` entries reserved in all structures.
    /// All storage is allocated from `resource` (nullptr = default system resource).
    [[nodiscard]] static ordered_dictionary create_with_capacity(isize capacity, od::memory_resource const* resource = nullptr)
    {
        OD_ASSERT(capacity >= 0, "capacity must be non-negative");

        ordered_dictionary d;
        d._keys = od::vector<K>::create_with_capacity(capacity, resource);
        d._values = od::vector<V>::create_with_capacity(capacity, resource);
        d._index = od::hash_index<K>::create_with_capacity(capacity, resource);
        return d;
    }

    // comparison
public:
    /// Same entries in the same order, capacity is ignored
    [[nodiscard]] friend bool operator==(ordered_dictionary const& lhs, ordered_dictionary const& rhs)
    {
        auto const lk = lhs.keys();
        auto const rk = rhs.keys();
        auto const lv = lhs.values();
        auto const rv = rhs.values();
        return std::equal(lk.begin(), lk.end(), rk.begin(), rk.end()) //
               && std::equal(lv.begin(), lv.end(), rv.begin(), rv.end());
    }

    // lifecycle
public:
    /// Empty dictionary with capacity 0, nothing allocated
    ordered_dictionary() = default;

    /// Deep copy including capacity
    ordered_dictionary(ordered_dictionary const& rhs) : _keys(rhs._keys), _values(rhs._values), _index(rhs._index)
    {
        grow_to(rhs.capacity());
    }
    ordered_dictionary& operator=(ordered_dictionary const& rhs)
    {
        if (this != &rhs)
        {
            auto tmp = ordered_dictionary(rhs);
            *this = od::move(tmp);
        }
        return *this;
    }

    /// rhs is left empty with capacity 0
    ordered_dictionary(ordered_dictionary&&) noexcept = default;
    ordered_dictionary& operator=(ordered_dictionary&&) noexcept = default;

private:
    [[nodiscard]] isize next_capacity() const
    {
        auto const cap = capacity();
        if (cap == 0)
            return 2;
        return 2 * isize(od::bit_floor(u64(cap)));
    }

    // all three structures end with capacity >= new_capacity
    void grow_to(isize new_capacity)
    {
        _keys.reserve(new_capacity);
        _values.reserve(new_capacity);
        _index.reserve(new_capacity);
    }

    // stable-sorts a position permutation with `less`, then moves every entry to its new position
    template <class Less>
    void apply_stable_order(Less&& less)
    {
        if (size() < 2)
            return;

        auto order = od::vector<isize>::create_with_capacity(size(), resource());
        for (isize i = 0; i < size(); ++i)
            order.push_back(i);

        std::stable_sort(order.begin(), order.end(), less);

        auto sorted_keys = od::vector<K>::create_with_capacity(capacity(), resource());
        auto sorted_values = od::vector<V>::create_with_capacity(capacity(), resource());
        for (auto const p : order)
        {
            sorted_keys.push_back(od::move(_keys[p]));
            sorted_values.push_back(od::move(_values[p]));
        }

        _keys = od::move(sorted_keys);
        _values = od::move(sorted_values);
        _index.rebuild(keys());
    }

    od::vector<K> _keys;
    od::vector<V> _values;
    od::hash_index<K> _index;
};

// =========================================================================================================
// od::entry_stream<K, V>
// =========================================================================================================

/// One-shot consuming traversal over the entries of an ordered_dictionary.
/// Produced by `od::move(dict).into_entries()`, yields od::pair<K, V> in positional order.
/// Move-only and not restartable; entries are moved out as they are produced.
///
/// Usage:
///   auto entries = od::move(dict).into_entries();
///   while (auto e = entries.next(); e.has_value())
///       use(e.value().first, e.value().second);
///
///   // or once, with a range-for
///   for (auto&& [key, value] : od::move(dict).into_entries())
///       ...
template <class K, class V>
struct od::entry_stream
{
    using entry_t = od::pair<K, V>;

    struct iterator
    {
        entry_stream* stream = nullptr;
        od::optional<entry_t> current;

        [[nodiscard]] entry_t& operator*() { return current.value(); }

        iterator& operator++()
        {
            current = stream->next();
            return *this;
        }

        [[nodiscard]] bool operator==(od::sentinel) const { return !current.has_value(); }
    };

    // queries
public:
    /// Entries not yet produced
    [[nodiscard]] isize remaining() const { return _keys.size() - _next; }
    [[nodiscard]] bool empty() const { return remaining() == 0; }

    // consumption
public:
    /// Moves out the next entry, nullopt once exhausted
    [[nodiscard]] od::optional<entry_t> next()
    {
        if (_next == _keys.size())
            return od::nullopt;

        auto const i = _next++;
        return od::optional<entry_t>(entry_t{od::move(_keys[i]), od::move(_values[i])});
    }

    /// Starts consuming: the first entry is produced here
    [[nodiscard]] iterator begin() { return iterator{this, next()}; }
    [[nodiscard]] od::sentinel end() const { return {}; }

    // lifecycle
public:
    entry_stream() = default;

    entry_stream(entry_stream&& rhs) noexcept
      : _keys(od::move(rhs._keys)), _values(od::move(rhs._values)), _next(od::exchange(rhs._next, 0))
    {
    }
    entry_stream& operator=(entry_stream&& rhs) noexcept
    {
        _keys = od::move(rhs._keys);
        _values = od::move(rhs._values);
        _next = od::exchange(rhs._next, 0);
        return *this;
    }

    entry_stream(entry_stream const&) = delete;
    entry_stream& operator=(entry_stream const&) = delete;

private:
    entry_stream(od::vector<K>&& keys, od::vector<V>&& values) : _keys(od::move(keys)), _values(od::move(values))
    {
        OD_ASSERT(_keys.size() == _values.size(), "keys and values must be co-indexed");
    }

    friend struct od::ordered_dictionary<K, V>;

    od::vector<K> _keys;
    od::vector<V> _values;
    isize _next = 0;
};
