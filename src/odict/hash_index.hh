#pragma once

#include <odict/assert.hh>
#include <odict/bit.hh>
#include <odict/fwd.hh>
#include <odict/span.hh>
#include <odict/vector.hh>

#include <functional>

// od::hash_index<K> maps keys to positions in an external key sequence.
//
// It never stores keys: each slot holds the key's hash and its position, and key equality is
// resolved by looking at keys[position]. This keeps every key stored exactly once
// (in the owning ordered_dictionary) and makes shifting positions cheap.
//
// Table layout:
// - open addressing, linear probing, power-of-two slot count
// - load factor at most 3/4, so probes always terminate at an empty slot
// - empty slot = position -1
// - deletion by backward shifting, no tombstones
//
// Hash = std::hash<K> followed by a 64-bit finalizer, so weak std::hash implementations
// (identity for integers) still spread over the low bits used for the bucket.

template <class K>
struct od::hash_index
{
    struct slot
    {
        u64 hash = 0;
        isize position = -1;

        [[nodiscard]] constexpr bool is_empty() const { return position < 0; }
    };

    // queries
public:
    /// Number of indexed keys
    [[nodiscard]] isize size() const { return _size; }
    [[nodiscard]] bool empty() const { return _size == 0; }

    /// Number of table slots (0 or a power of two)
    [[nodiscard]] isize slot_count() const { return _slots.size(); }

    /// Number of keys that can be indexed without rehashing
    [[nodiscard]] isize capacity() const { return slot_count() / 4 * 3; }

    [[nodiscard]] od::memory_resource const* custom_resource() const { return _slots.custom_resource(); }

    /// Hash used for bucket selection and slot comparison
    [[nodiscard]] static u64 hash_of(K const& key)
    {
        // murmur3 fmix64
        auto h = u64(std::hash<K>{}(key));
        h ^= h >> 33;
        h *= 0xff51afd7ed558ccdull;
        h ^= h >> 33;
        h *= 0xc4ceb9fe1a85ec53ull;
        h ^= h >> 33;
        return h;
    }

    // lookup
public:
    /// Position of `key` in `keys`, -1 if not indexed.
    /// O(1) average.
    [[nodiscard]] isize find(K const& key, od::span<K const> keys) const
    {
        if (_size == 0)
            return -1;

        auto const h = hash_of(key);
        auto const mask = slot_count() - 1;

        for (auto i = isize(h & u64(mask));; i = (i + 1) & mask)
        {
            auto const& s = _slots[i];
            if (s.is_empty())
                return -1;
            if (s.hash == h && keys[s.position] == key)
                return s.position;
        }
    }

    // modification
public:
    /// Records `key` at `position`. Does not look at the key sequence.
    /// Precondition: key is not indexed yet.
    void insert(K const& key, isize position)
    {
        OD_ASSERT(position >= 0, "position must be non-negative");

        if (_size + 1 > capacity())
            reserve(_size + 1);

        insert_slot({hash_of(key), position});
        ++_size;
    }

    /// Removes `key` and returns the position it was recorded at, -1 if not indexed.
    /// `keys` must still contain the key at its recorded position.
    /// Other recorded positions are not changed; see shift_positions_from.
    isize erase(K const& key, od::span<K const> keys)
    {
        if (_size == 0)
            return -1;

        auto const h = hash_of(key);
        auto const mask = slot_count() - 1;

        auto i = isize(h & u64(mask));
        while (true)
        {
            auto const& s = _slots[i];
            if (s.is_empty())
                return -1;
            if (s.hash == h && keys[s.position] == key)
                break;
            i = (i + 1) & mask;
        }

        auto const position = _slots[i].position;

        // backward shift: pull every following slot of the probe run that may live at the hole
        for (auto j = (i + 1) & mask;; j = (j + 1) & mask)
        {
            auto const& s = _slots[j];
            if (s.is_empty())
                break;

            auto const ideal = isize(s.hash & u64(mask));

            // the entry at j may move to the hole i iff i lies cyclically in [ideal, j)
            auto const dist_hole = (i - ideal) & mask;
            auto const dist_entry = (j - ideal) & mask;
            if (dist_hole < dist_entry)
            {
                _slots[i] = s;
                i = j;
            }
        }

        _slots[i] = slot{};
        --_size;
        return position;
    }

    /// Adds `delta` to every recorded position >= first.
    /// O(slot_count).
    void shift_positions_from(isize first, isize delta)
    {
        if (_size == 0 || delta == 0)
            return;

        for (auto& s : _slots)
            if (s.position >= first)
                s.position += delta;
    }

    /// Drops all keys and indexes keys[i] at position i for every i.
    /// Precondition: keys are pairwise distinct.
    void rebuild(od::span<K const> keys)
    {
        clear();
        reserve(keys.size());

        for (isize i = 0; i < keys.size(); ++i)
            insert_slot({hash_of(keys[i]), i});
        _size = keys.size();
    }

    /// Ensures `count` keys can be indexed without rehashing.
    void reserve(isize count)
    {
        OD_ASSERT(count >= 0, "reserve count must be non-negative");

        if (count <= capacity())
            return;

        // smallest power of two with count <= 3/4 * slots, at least 8
        auto const min_slots = od::max<isize>((count * 4 + 2) / 3, 8);
        rehash(isize(od::bit_ceil(u64(min_slots))));
    }

    /// Removes all keys, keeps the table.
    void clear()
    {
        for (auto& s : _slots)
            s = slot{};
        _size = 0;
    }

    /// True iff exactly keys[0..n) are indexed, each at its own position.
    /// Used in tests.
    [[nodiscard]] bool is_consistent_with(od::span<K const> keys) const
    {
        if (keys.size() != _size)
            return false;

        for (isize i = 0; i < keys.size(); ++i)
            if (find(keys[i], keys) != i)
                return false;

        isize occupied = 0;
        for (auto const& s : _slots)
            if (!s.is_empty())
                ++occupied;
        return occupied == _size;
    }

    // lifecycle
public:
    hash_index() = default;

    /// Empty index able to hold `count` keys without rehashing, allocating from `resource`
    [[nodiscard]] static hash_index create_with_capacity(isize count, od::memory_resource const* resource = nullptr)
    {
        hash_index result;
        result._slots = od::vector<slot>::create_with_capacity(0, resource);
        result.reserve(count);
        return result;
    }

    hash_index(hash_index const&) = default;
    hash_index& operator=(hash_index const&) = default;

    hash_index(hash_index&& rhs) noexcept : _slots(od::move(rhs._slots)), _size(od::exchange(rhs._size, 0)) {}
    hash_index& operator=(hash_index&& rhs) noexcept
    {
        _slots = od::move(rhs._slots);
        _size = od::exchange(rhs._size, 0);
        return *this;
    }

private:
    // places s into the first empty slot of its probe run
    // Precondition: at least one empty slot
    void insert_slot(slot s)
    {
        auto const mask = slot_count() - 1;
        auto i = isize(s.hash & u64(mask));
        while (!_slots[i].is_empty())
            i = (i + 1) & mask;
        _slots[i] = s;
    }

    OD_COLD_FUNC void rehash(isize new_slot_count)
    {
        OD_ASSERT(od::has_single_bit(u64(new_slot_count)), "slot count must be a power of two");

        auto old_slots = od::move(_slots);
        _slots = od::vector<slot>::create_filled(new_slot_count, slot{}, old_slots.custom_resource());

        // stored hashes suffice, keys are not needed
        for (auto const& s : old_slots)
            if (!s.is_empty())
                insert_slot(s);
    }

    od::vector<slot> _slots;
    isize _size = 0;
};
