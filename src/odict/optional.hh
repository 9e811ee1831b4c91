#pragma once

#include <odict/assert.hh>
#include <odict/fwd.hh>
#include <odict/utility.hh>

#include <type_traits>

/// Sentinel type for the "no value" state of od::optional.
/// No default constructor, so optional<T> = {} stays unambiguous.
struct od::nullopt_t
{
    enum class _ctor_tag // NOLINT(readability-identifier-naming)
    {
        tag
    };
    explicit constexpr nullopt_t(_ctor_tag) {}
};

namespace od
{
/// Usage: return od::nullopt; or CHECK(dict.get(k) == od::nullopt);
constexpr nullopt_t nullopt = nullopt_t{nullopt_t::_ctor_tag::tag};
} // namespace od

/// Value of type T or nothing. Returned by every odict lookup that may miss.
/// No operator* or operator->: access goes through value(), which asserts has_value().
/// Trivially copyable when T is trivially copyable.
template <class T>
struct od::optional
{
    // construction
public:
    optional() = default;

    /// Forwarding constructor; explicit if U does not convert implicitly to T.
    template <class U = std::remove_cv_t<T>>
        requires(!std::is_same_v<std::remove_cvref_t<U>, optional> && !std::is_same_v<std::remove_cvref_t<U>, nullopt_t>
                 && std::is_constructible_v<T, U &&>)
    explicit(!std::is_convertible_v<U, T>) constexpr optional(U&& value) : _has_value(true) // NOLINT
    {
        new (od::placement_new, &_storage.value) T(od::forward<U>(value));
    }

    optional(nullopt_t) {}

    // trivial copy/move/destroy
public:
    optional(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;

    ~optional()
        requires std::is_trivially_destructible_v<T>
    = default;

    // non-trivial copy/move/destroy
public:
    /// Afterwards rhs is empty.
    optional(optional&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
        {
            new (od::placement_new, &_storage.value) T(od::move(rhs._storage.value));
            rhs._storage.value.~T();
            rhs._has_value = false;
        }
    }

    optional(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
            new (od::placement_new, &_storage.value) T(rhs._storage.value);
    }

    /// Leaves rhs engaged with a moved-from value (like std::optional).
    optional& operator=(optional&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
    {
        if (rhs._has_value)
        {
            if (_has_value)
                _storage.value = od::move(rhs._storage.value);
            else
                new (od::placement_new, &_storage.value) T(od::move(rhs._storage.value));

            _has_value = true;
        }
        else if (_has_value)
        {
            _storage.value.~T();
            _has_value = false;
        }

        return *this;
    }

    optional& operator=(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T> && std::is_copy_assignable_v<T>)
    {
        if (this != &rhs)
        {
            if (rhs._has_value)
            {
                if (_has_value)
                    _storage.value = rhs._storage.value;
                else
                    new (od::placement_new, &_storage.value) T(rhs._storage.value);

                _has_value = true;
            }
            else if (_has_value)
            {
                _storage.value.~T();
                _has_value = false;
            }
        }

        return *this;
    }

    ~optional()
        requires(!std::is_trivially_destructible_v<T>)
    {
        if (_has_value)
            _storage.value.~T();
    }

    // queries and access
public:
    [[nodiscard]] bool has_value() const { return _has_value; }

    /// Precondition: has_value().
    /// Forwards the value category of the optional (deducing this).
    template <class Self>
    [[nodiscard]] auto&& value(this Self&& self)
    {
        OD_ASSERT(self.has_value(), "attempted to access value of empty optional");
        return static_cast<Self&&>(self)._storage.value;
    }

    // comparison
public:
    /// Both empty, or both engaged with equal values.
    [[nodiscard]] friend bool operator==(optional const& lhs, optional const& rhs)
        requires requires(T v) { bool(v == v); }
    {
        if (lhs._has_value != rhs._has_value)
            return false;
        if (lhs._has_value)
            return lhs._storage.value == rhs._storage.value;
        return true;
    }

    [[nodiscard]] friend bool operator==(optional const& lhs, T const& rhs)
        requires requires(T v) { bool(v == v); }
    {
        return lhs._has_value && lhs._storage.value == rhs;
    }

    [[nodiscard]] friend bool operator==(optional const& lhs, nullopt_t) { return !lhs._has_value; }

    /// Deleted for T != bool so that optional<int> == true does not compile.
    [[nodiscard]] bool operator==(bool) const
        requires(!std::is_same_v<T, bool>)
    = delete;

    // members
private:
    od::storage_for<T> _storage;

    bool _has_value = false;
};
