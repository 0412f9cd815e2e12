////////////////////////////////////////////////////////////////////////////////
/// Capability tiers for ranges of ranges consumed by the psi::seq flattening
/// views.
///
/// Provides:
///   - nested_range               single-pass enumerable outer and inner
///   - forward_nested_range       multi-pass, addressable positions
///   - bidirectional_nested_range positions can also be stepped back
///
/// The views select their interface from these at compile time: members that
/// need a stronger tier are constrained on it rather than checked at runtime.
///
/// Copyright (c) Domagoj Saric.
///
/// Use, modification and distribution is subject to the
/// Boost Software License, Version 1.0.
/// (See accompanying file LICENSE_1_0.txt or copy at
/// http://www.boost.org/LICENSE_1_0.txt)
///
/// For more information, see http://www.boost.org
///
////////////////////////////////////////////////////////////////////////////////
//------------------------------------------------------------------------------
#pragma once

#include <cstddef>
#include <functional>
#include <iterator>
#include <ranges>
#include <type_traits>
//------------------------------------------------------------------------------
namespace psi::seq
{
//------------------------------------------------------------------------------

template <typename R>
using inner_range_t = std::remove_reference_t<std::ranges::range_reference_t<R>>;

/// nested_range: an input range whose elements are themselves input ranges.
/// Enough for single-pass enumeration (composite_iterator, flatten_sequence).
template <typename R>
concept nested_range =
    std::ranges::input_range<R> &&
    std::ranges::input_range<std::ranges::range_reference_t<R>>;

/// forward_nested_range: enough for addressable positions (flatten_index).
///
/// The outer range has to be common (the past-the-end position stores a real
/// outer iterator) and has to hand out its inner ranges by lvalue reference
/// (positions point into them and must outlive any temporary).
template <typename R>
concept forward_nested_range =
    nested_range<R>                                          &&
    std::ranges::forward_range<R>                            &&
    std::ranges::common_range <R>                            &&
    std::is_lvalue_reference_v<std::ranges::range_reference_t<R>> &&
    std::ranges::forward_range<inner_range_t<R>>;

/// bidirectional_nested_range: both levels can be stepped backwards and inner
/// ranges are common (stepping back into a segment starts from its end).
template <typename R>
concept bidirectional_nested_range =
    forward_nested_range<R>                            &&
    std::ranges::bidirectional_range<R>                &&
    std::ranges::bidirectional_range<inner_range_t<R>> &&
    std::ranges::common_range       <inner_range_t<R>>;

template <typename T>
concept std_hashable = requires( T const & value ) {
    { std::hash<T>{}( value ) } -> std::convertible_to<std::size_t>;
};

//------------------------------------------------------------------------------
} // namespace psi::seq
//------------------------------------------------------------------------------
