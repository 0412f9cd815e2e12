////////////////////////////////////////////////////////////////////////////////
/// views::flatten: lazily concatenates the inner ranges of a range of ranges.
///
///   std::vector<std::vector<int>> const segments{ { 0, 1, 2 }, {}, { 8, 9 } };
///   for ( auto const x : segments | psi::seq::views::flatten )
///       ...; // 0 1 2 8 9
///
/// Yields a flatten_collection (addressable, bidirectional when both levels
/// are) for multi-pass bases and a flatten_sequence for single-pass ones.
/// Lvalue bases are referenced, rvalue bases are moved into the view.
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

#include <psi/seq/views/flatten_collection.hpp>
#include <psi/seq/views/flatten_sequence.hpp>
#include <psi/seq/views/nested_range.hpp>

#include <ranges>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::seq
{
//------------------------------------------------------------------------------

namespace views
{
    struct flatten_fn
    {
        template <std::ranges::viewable_range R>
        requires nested_range<std::views::all_t<R>>
        [[ nodiscard ]] constexpr auto operator()( R && range ) const
        {
            using base = std::views::all_t<R>;
            if constexpr ( forward_nested_range<base const> )
                return flatten_collection<base>{ std::views::all( std::forward<R>( range ) ) };
            else
                return flatten_sequence  <base>{ std::views::all( std::forward<R>( range ) ) };
        }

        template <std::ranges::viewable_range R>
        requires nested_range<std::views::all_t<R>>
        [[ nodiscard ]] friend constexpr auto operator|( R && range, flatten_fn const & self ) { return self( std::forward<R>( range ) ); }
    }; // struct flatten_fn

    inline constexpr flatten_fn flatten{};
} // namespace views

//------------------------------------------------------------------------------
} // namespace psi::seq
//------------------------------------------------------------------------------
