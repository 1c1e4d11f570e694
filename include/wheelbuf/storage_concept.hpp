/*
===============================================================================
WheelStorage Concept
===============================================================================

Defines the minimal backing-store contract required by wheel_buffer.

A storage type must:

  • Have a fixed length, queried once through std::ranges::size()
  • Support O(1) indexed access through operator[]
  • Yield real (non-proxy, non-const) lvalue references, so slots can be
    both read and overwritten in place

The length is never changed by wheel_buffer. Types such as std::vector are
accepted, but they must not be resized while a buffer holds them.

-------------------------------------------------------------------------------
Ownership Model
-------------------------------------------------------------------------------

The storage type decides ownership:

  - View types (std::span<T>) borrow caller memory. The caller keeps the
    memory alive for the lifetime of the buffer.
  - Container types (std::array<T, N>, std::vector<T>) are moved into the
    buffer and owned by it.

wheel_buffer itself never allocates.

===============================================================================
*/
#pragma once

#include <concepts>
#include <cstddef>
#include <ranges>
#include <type_traits>


namespace wheelbuf {

template<class S>
concept WheelStorage =
    std::ranges::random_access_range<S> &&
    std::ranges::sized_range<const S> &&
    std::is_lvalue_reference_v<std::ranges::range_reference_t<S>> &&
    !std::is_const_v<std::remove_reference_t<std::ranges::range_reference_t<S>>> &&
    requires(S& s, const S& cs, std::size_t i)
{
    { s[i] } -> std::same_as<std::ranges::range_reference_t<S>>;
    { cs[i] } -> std::convertible_to<const std::ranges::range_value_t<S>&>;
};

/// Element type held by a storage type
template<WheelStorage S>
using storage_value_t = std::ranges::range_value_t<S>;

} // namespace wheelbuf
