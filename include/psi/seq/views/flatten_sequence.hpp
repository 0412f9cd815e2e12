////////////////////////////////////////////////////////////////////////////////
/// Single-pass flattening view: the concatenation of the inner ranges of an
/// input range of ranges, without positions (see flatten_collection for the
/// addressable version).
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
#include <psi/seq/views/nested_range.hpp>

#include <boost/assert.hpp>
#include <boost/optional/optional.hpp>
#include <boost/stl_interfaces/view_interface.hpp>

#include <cstddef>
#include <iterator>
#include <ranges>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::seq
{
//------------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
// \class flatten_sequence
////////////////////////////////////////////////////////////////////////////////

template <std::ranges::view Base>
requires nested_range<Base>
class flatten_sequence
    :
    public boost::stl_interfaces::view_interface<flatten_sequence<Base>>
{
private:
    template <bool is_const>
    using source_t = composite_iterator
    <
        std::ranges::iterator_t<std::conditional_t<is_const, Base const, Base>>,
        std::ranges::sentinel_t<std::conditional_t<is_const, Base const, Base>>
    >;

    template <bool is_const> class input_iterator;

public:
    using       iterator = input_iterator<false>;
    using const_iterator = input_iterator<true >;

    constexpr flatten_sequence() requires std::default_initializable<Base> = default;
    constexpr explicit flatten_sequence( Base base ) noexcept( std::is_nothrow_move_constructible_v<Base> ) : base_{ std::move( base ) } {}

    [[ nodiscard ]] constexpr Base const & base() const & noexcept { return base_; }
    [[ nodiscard ]] constexpr Base         base() &&               { return std::move( base_ ); }

    // O(1): nothing is pulled from the base before the first next()
    [[ nodiscard ]] constexpr source_t<false> make_iterator()
    {
        return { std::ranges::begin( base_ ), std::ranges::end( base_ ) };
    }
    [[ nodiscard ]] constexpr auto make_iterator() const requires nested_range<Base const>
    {
        return source_t<true>{ std::ranges::begin( base_ ), std::ranges::end( base_ ) };
    }

    // begin() reads ahead up to the first element (past any leading empty
    // inner ranges)
    [[ nodiscard ]] constexpr       iterator begin()                                      { return       iterator{ make_iterator() }; }
    [[ nodiscard ]] constexpr const_iterator begin() const requires nested_range<Base const> { return const_iterator{ make_iterator() }; }

    [[ nodiscard ]] static constexpr std::default_sentinel_t end() noexcept { return std::default_sentinel; }

    // any tighter estimate would have to enumerate the inner ranges
    [[ nodiscard ]] static constexpr std::size_t underestimated_count() noexcept { return 0; }

private:
    Base base_{};
}; // class flatten_sequence

template <typename R>
flatten_sequence( R && ) -> flatten_sequence<std::views::all_t<R>>;

////////////////////////////////////////////////////////////////////////////////
// \class flatten_sequence::input_iterator
//
// Standard input iterator adaptor over composite_iterator: holds one element
// of look-ahead.
////////////////////////////////////////////////////////////////////////////////

template <std::ranges::view Base>
requires nested_range<Base>
template <bool is_const>
class flatten_sequence<Base>::input_iterator
{
private:
    using source  = source_t<is_const>;
    using element = typename source::element;

public:
    using iterator_concept = std::input_iterator_tag;
    using value_type       = std::remove_cvref_t<element>;
    using difference_type  = std::ptrdiff_t;
    using reference        = std::conditional_t<std::is_reference_v<element>, element, element const &>;

    constexpr input_iterator() = default;
    constexpr explicit input_iterator( source && src ) : source_{ std::move( src ) }, current_{ source_.next() } {}

    [[ nodiscard ]] constexpr reference operator*() const noexcept
    {
        BOOST_ASSERT_MSG( current_, "Dereferencing an exhausted iterator" );
        return *current_;
    }

    constexpr input_iterator & operator++()
    {
        BOOST_ASSERT_MSG( current_, "Incrementing an exhausted iterator" );
        current_ = source_.next();
        return *this;
    }
    constexpr void operator++( int ) { ++*this; }

    [[ nodiscard ]] friend constexpr bool operator==( input_iterator const & it, std::default_sentinel_t ) noexcept { return !it.current_; }

private:
    source                   source_ {};
    boost::optional<element> current_{};
}; // class input_iterator

//------------------------------------------------------------------------------
} // namespace psi::seq
//------------------------------------------------------------------------------

namespace std::ranges
{
    template <typename Base>
    inline constexpr bool enable_view<psi::seq::flatten_sequence<Base>>{ true };
} // namespace std::ranges
//------------------------------------------------------------------------------
