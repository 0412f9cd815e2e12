////////////////////////////////////////////////////////////////////////////////
/// Composite position in a flattened range of ranges: an outer position plus,
/// for every position other than the past-the-end one, a position inside the
/// inner range found at the outer position.
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

#include <psi/seq/views/nested_range.hpp>

#include <boost/assert.hpp>
#include <boost/container_hash/hash.hpp>

#include <compare>
#include <cstddef>
#include <functional>
#include <iterator>
#include <optional>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::seq
{
//------------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
// \class flatten_index
//
// Either 'at element' (outer, inner) or 'past the end' (outer == base end, no
// inner position). The two states can only be created through the named
// factories so the inner position is absent exactly for the past-the-end
// index. A default constructed index is singular (assign or compare only).
////////////////////////////////////////////////////////////////////////////////

template <std::forward_iterator OuterIterator, std::forward_iterator InnerIterator>
class flatten_index
{
public:
    using outer_iterator = OuterIterator;
    using inner_iterator = InnerIterator;

    constexpr flatten_index() = default;

    [[ nodiscard ]] static constexpr flatten_index at_element( outer_iterator outer, inner_iterator inner )
        noexcept( std::is_nothrow_move_constructible_v<outer_iterator> && std::is_nothrow_move_constructible_v<inner_iterator> )
    {
        return { std::move( outer ), std::optional<inner_iterator>{ std::move( inner ) } };
    }

    [[ nodiscard ]] static constexpr flatten_index past_end( outer_iterator outer_end )
        noexcept( std::is_nothrow_move_constructible_v<outer_iterator> )
    {
        return { std::move( outer_end ), std::nullopt };
    }

    [[ nodiscard ]] constexpr bool is_past_end() const noexcept { return !inner_.has_value(); }

    [[ nodiscard ]] constexpr outer_iterator const & outer() const noexcept { return outer_; }
    [[ nodiscard ]] constexpr inner_iterator const & inner() const noexcept
    {
        BOOST_ASSERT_MSG( inner_.has_value(), "The past-the-end position has no inner position" );
        return *inner_;
    }

    friend bool operator==( flatten_index const &, flatten_index const & ) = default;

    // lexicographic: outer first, then inner (past-the-end positions only
    // compare equal to each other)
    friend constexpr std::weak_ordering operator<=>( flatten_index const & left, flatten_index const & right )
    requires( std::totally_ordered<outer_iterator> && std::totally_ordered<inner_iterator> )
    {
        if ( left.outer_ != right.outer_ )
            return ( left.outer_ < right.outer_ ) ? std::weak_ordering::less : std::weak_ordering::greater;

        if ( left.inner_ && right.inner_ )
        {
            if ( *left.inner_ == *right.inner_ )
                return std::weak_ordering::equivalent;
            return ( *left.inner_ < *right.inner_ ) ? std::weak_ordering::less : std::weak_ordering::greater;
        }

        BOOST_ASSERT_MSG( !left.inner_ && !right.inner_, "Equal outer positions with mismatched inner positions" );
        return std::weak_ordering::equivalent;
    }

private:
    constexpr flatten_index( outer_iterator && outer, std::optional<inner_iterator> && inner )
        noexcept( std::is_nothrow_move_constructible_v<outer_iterator> && std::is_nothrow_move_constructible_v<inner_iterator> )
        : outer_{ std::move( outer ) }, inner_{ std::move( inner ) } {}

    outer_iterator                outer_{};
    std::optional<inner_iterator> inner_{};
}; // class flatten_index

//------------------------------------------------------------------------------
} // namespace psi::seq
//------------------------------------------------------------------------------

namespace std
{
    template <typename OuterIterator, typename InnerIterator>
    requires( psi::seq::std_hashable<OuterIterator> && psi::seq::std_hashable<InnerIterator> )
    struct hash<psi::seq::flatten_index<OuterIterator, InnerIterator>>
    {
        std::size_t operator()( psi::seq::flatten_index<OuterIterator, InnerIterator> const & position ) const noexcept
        {
            std::size_t seed{ std::hash<OuterIterator>{}( position.outer() ) };
            if ( !position.is_past_end() )
                boost::hash_combine( seed, std::hash<InnerIterator>{}( position.inner() ) );
            return seed;
        }
    }; // struct hash<flatten_index>
} // namespace std
//------------------------------------------------------------------------------
