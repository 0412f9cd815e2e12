////////////////////////////////////////////////////////////////////////////////
/// Addressable flattening view: the concatenation of the inner ranges of a
/// multi-pass range of ranges, with composite positions (flatten_index) that
/// can be compared, advanced, offset and (when both levels are bidirectional)
/// stepped back.
///
/// Performance note: start_index() (and with it begin(), empty(), front()...)
/// and single steps skip empty inner ranges one by one, so they cost
/// O(number of consecutive empty inner ranges) rather than O(1). distance()
/// and offsets walk element by element (inner range sizes are never queried).
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

#include <psi/seq/views/composite_iterator.hpp>
#include <psi/seq/views/flatten_index.hpp>
#include <psi/seq/views/nested_range.hpp>

#include <boost/assert.hpp>
#include <boost/stl_interfaces/iterator_interface.hpp>
#include <boost/stl_interfaces/view_interface.hpp>

#include <algorithm>
#include <cstddef>
#include <functional>
#include <iosfwd>
#include <iterator>
#include <memory>
#include <optional>
#include <ranges>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::seq
{
//------------------------------------------------------------------------------

namespace detail
{
    [[ noreturn, gnu::cold ]] void throw_out_of_range();
    [[ noreturn, gnu::cold ]] void throw_not_bidirectional();
} // namespace detail

////////////////////////////////////////////////////////////////////////////////
// \class flatten_collection
////////////////////////////////////////////////////////////////////////////////

template <std::ranges::view Base>
requires forward_nested_range<Base const>
class flatten_collection
    :
    public boost::stl_interfaces::view_interface<flatten_collection<Base>>
{
public:
    using outer_iterator  = std::ranges::iterator_t<Base const>;
    using inner_range     = inner_range_t<Base const>;
    using inner_iterator  = std::ranges::iterator_t<inner_range>;
    using index           = flatten_index<outer_iterator, inner_iterator>;
    using value_type      = std::ranges::range_value_t    <inner_range>;
    using reference       = std::ranges::range_reference_t<inner_range>;
    using difference_type = std::ptrdiff_t;

    static bool constexpr bidirectional{ bidirectional_nested_range<Base const> };

    class iterator;
    using const_iterator = iterator;

    constexpr flatten_collection() requires std::default_initializable<Base> = default;
    constexpr explicit flatten_collection( Base base ) noexcept( std::is_nothrow_move_constructible_v<Base> ) : base_{ std::move( base ) } {}

    [[ nodiscard ]] constexpr Base const & base() const & noexcept { return base_; }
    [[ nodiscard ]] constexpr Base         base() &&               { return std::move( base_ ); }

    //////////////////////////////////////////////
    // Positions
    //////////////////////////////////////////////

    [[ nodiscard ]] constexpr index start_index() const { return first_element_from( std::ranges::begin( base_ ) ); }
    [[ nodiscard ]] constexpr index end_index  () const { return index::past_end   ( std::ranges::end  ( base_ ) ); }

    [[ nodiscard ]] constexpr index index_after( index const & position ) const
    {
        BOOST_ASSERT_MSG( !position.is_past_end(), "Incrementing the past-the-end position" );
        auto const & outer{ position.outer() };
        inner_range & segment{ *outer };
        auto next_inner{ std::ranges::next( position.inner() ) };
        if ( next_inner != std::ranges::end( segment ) ) [[ likely ]]
            return index::at_element( outer, std::move( next_inner ) );
        return first_element_from( std::ranges::next( outer ) );
    }
    constexpr void form_index_after( index & position ) const { position = index_after( position ); }

    [[ nodiscard ]] constexpr index index_before( index const & position ) const
    requires bidirectional_nested_range<Base const>
    {
        auto const outer_begin{ std::ranges::begin( base_ ) };
        auto       outer      { position.outer() };
        if ( position.is_past_end() )
        {
            BOOST_ASSERT_MSG( outer != outer_begin, "Decrementing the start position" );
            --outer;
        }
        inner_range * segment{ std::addressof( *outer ) };
        auto inner{ position.is_past_end() ? std::ranges::end( *segment ) : position.inner() };
        while ( inner == std::ranges::begin( *segment ) )
        {
            BOOST_ASSERT_MSG( outer != outer_begin, "Decrementing the start position" );
            --outer;
            segment = std::addressof( *outer );
            inner   = std::ranges::end( *segment );
        }
        return index::at_element( std::move( outer ), std::ranges::prev( inner ) );
    }
    constexpr void form_index_before( index & position ) const
    requires bidirectional_nested_range<Base const>
    {
        position = index_before( position );
    }

    [[ nodiscard ]] constexpr difference_type distance( index const & from, index const & to ) const;

    [[ nodiscard ]] constexpr index offset_index( index position, difference_type n ) const
    {
        ensure_steppable( n );
        auto const direction{ n < 0 ? difference_type{ -1 } : difference_type{ 1 } };
        for ( auto remaining{ magnitude( n ) }; remaining != 0; --remaining )
            step( position, direction );
        return position;
    }
    [[ nodiscard ]] constexpr std::optional<index> offset_index( index position, difference_type n, index const & limit ) const;

    // stores the offset position and returns true or, if the limit was hit
    // first, stores the limit and returns false
    constexpr bool form_offset_index( index & position, difference_type const n, index const & limit ) const
    {
        if ( auto advanced{ offset_index( position, n, limit ) } )
        {
            position = *std::move( advanced );
            return true;
        }
        position = limit;
        return false;
    }

    //////////////////////////////////////////////
    // Element access
    //////////////////////////////////////////////

    [[ nodiscard ]] constexpr reference operator[]( index const & position ) const noexcept
    {
        BOOST_ASSERT_MSG( !position.is_past_end(), "Dereferencing the past-the-end position" );
        return *position.inner();
    }

    [[ nodiscard ]] constexpr reference at( index const & position ) const
    {
        if ( position.is_past_end() ) [[ unlikely ]]
            detail::throw_out_of_range();
        return *position.inner();
    }

    //////////////////////////////////////////////
    // Traversal
    //////////////////////////////////////////////

    // segment by segment, without building positions; exceptions thrown by
    // the body are not intercepted
    template <typename Body>
    constexpr void for_each( Body && body ) const
    {
        for ( auto const & segment : base_ )
            std::ranges::for_each( segment, std::ref( body ) );
    }

    [[ nodiscard ]] constexpr auto make_iterator() const
    {
        return composite_iterator<outer_iterator>{ std::ranges::begin( base_ ), std::ranges::end( base_ ) };
    }

    [[ nodiscard ]] constexpr iterator iterator_at( index position ) const noexcept { return { *this, std::move( position ) }; }

    [[ nodiscard ]] constexpr iterator begin() const { return iterator_at( start_index() ); }
    [[ nodiscard ]] constexpr iterator end  () const { return iterator_at( end_index  () ); }

    [[ nodiscard ]] constexpr std::ranges::subrange<iterator> slice( index first, index last ) const
    {
        return { iterator_at( std::move( first ) ), iterator_at( std::move( last ) ) };
    }

    // computing any estimate requires walking every inner range
    [[ nodiscard ]] static constexpr std::size_t underestimated_count() noexcept { return 0; }

    // solely a debugging helper (include flatten_print.hpp); writes to an
    // ostream as GCC 12's libstdc++ has no <print>
    void print( std::ostream & ) const;

private:
    constexpr index first_element_from( outer_iterator outer ) const
    {
        auto const outer_end{ std::ranges::end( base_ ) };
        for ( ; outer != outer_end; ++outer )
        {
            inner_range & segment{ *outer };
            if ( !std::ranges::empty( segment ) )
                return index::at_element( std::move( outer ), std::ranges::begin( segment ) );
        }
        return end_index();
    }

    // checked in all builds: a forward-only view has no way to step back
    static constexpr void ensure_steppable( [[ maybe_unused ]] difference_type const n )
    {
        if constexpr ( !bidirectional )
        {
            if ( n < 0 ) [[ unlikely ]]
                detail::throw_not_bidirectional();
        }
    }

    // -n overflows for the minimum difference_type
    static constexpr std::size_t magnitude( difference_type const n ) noexcept
    {
        return ( n < 0 ) ? std::size_t{ 0 } - static_cast<std::size_t>( n ) : static_cast<std::size_t>( n );
    }

    constexpr void step( index & position, [[ maybe_unused ]] difference_type const direction ) const
    {
        if constexpr ( bidirectional )
        {
            if ( direction < 0 )
            {
                form_index_before( position );
                return;
            }
        }
        form_index_after( position );
    }

    // walks forward from 'from' to 'to' (which must be reachable)
    constexpr difference_type steps_between( index from, index const & to ) const
    {
        auto const past_end{ end_index() };
        difference_type count{ 0 };
        for ( ; from != to; ++count )
        {
            BOOST_ASSERT_MSG( from != past_end, "Position not reachable from the start of the distance range" );
            form_index_after( from );
        }
        return count;
    }

private:
    Base base_{};
}; // class flatten_collection

template <typename R>
flatten_collection( R && ) -> flatten_collection<std::views::all_t<R>>;


template <std::ranges::view Base>
requires forward_nested_range<Base const>
constexpr typename flatten_collection<Base>::difference_type
flatten_collection<Base>::distance( index const & from, index const & to ) const
{
    if constexpr ( std::totally_ordered<index> )
    {
        if ( to < from )
            return -steps_between( to, from );
        return steps_between( from, to );
    }
    else
    {
        // no ordering between positions: look for 'to' ahead of 'from' first
        auto const past_end{ end_index() };
        difference_type count{ 0 };
        for ( auto position{ from }; position != to; ++count )
        {
            if ( position == past_end )
                return -steps_between( to, from );
            form_index_after( position );
        }
        return count;
    }
}

template <std::ranges::view Base>
requires forward_nested_range<Base const>
constexpr std::optional<typename flatten_collection<Base>::index>
flatten_collection<Base>::offset_index( index position, difference_type const n, index const & limit ) const
{
    ensure_steppable( n );
    if constexpr ( std::totally_ordered<index> )
        BOOST_ASSERT_MSG( ( n >= 0 ) ? !( limit < position ) : !( position < limit ), "Offset limit lies in the opposite direction" );

    auto const direction{ n < 0 ? difference_type{ -1 } : difference_type{ 1 } };
    for ( auto remaining{ magnitude( n ) }; remaining != 0; --remaining )
    {
        if ( position == limit )
            return std::nullopt;
        step( position, direction );
    }
    return position;
}

////////////////////////////////////////////////////////////////////////////////
// \class flatten_collection::iterator
////////////////////////////////////////////////////////////////////////////////

template <std::ranges::view Base>
requires forward_nested_range<Base const>
class flatten_collection<Base>::iterator
    :
    public boost::stl_interfaces::iterator_interface
    <
        iterator,
        std::conditional_t<bidirectional, std::bidirectional_iterator_tag, std::forward_iterator_tag>,
        value_type,
        reference,
        std::add_pointer_t<reference>
    >
{
private:
    using impl = boost::stl_interfaces::iterator_interface
    <
        iterator,
        std::conditional_t<bidirectional, std::bidirectional_iterator_tag, std::forward_iterator_tag>,
        value_type,
        reference,
        std::add_pointer_t<reference>
    >;

    friend class flatten_collection;
    constexpr iterator( flatten_collection const & parent, index && position ) noexcept
        : parent_{ &parent }, position_{ std::move( position ) } {}

public:
    constexpr iterator() noexcept = default;

    [[ nodiscard ]] constexpr reference operator*() const noexcept { return ( *parent_ )[ position_ ]; }

    constexpr iterator & operator++() { parent_->form_index_after( position_ ); return *this; }
    constexpr iterator & operator--() requires bidirectional_nested_range<Base const> { parent_->form_index_before( position_ ); return *this; }
    using impl::operator++;
    using impl::operator--;

    friend constexpr bool operator==( iterator const & left, iterator const & right ) noexcept
    {
        BOOST_ASSERT_MSG( left.parent_ == right.parent_, "Comparing iterators from different views" );
        return left.position_ == right.position_;
    }

public: // extensions
    [[ nodiscard ]] constexpr index const & position() const noexcept { return position_; }

private:
    flatten_collection const * parent_  {};
    index                      position_{};
}; // class iterator

//------------------------------------------------------------------------------
} // namespace psi::seq
//------------------------------------------------------------------------------

namespace std::ranges
{
    template <typename Base>
    inline constexpr bool enable_view<psi::seq::flatten_collection<Base>>{ true };
} // namespace std::ranges
//------------------------------------------------------------------------------
