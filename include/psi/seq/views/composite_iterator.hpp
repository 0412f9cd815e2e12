////////////////////////////////////////////////////////////////////////////////
/// Pull-style single-pass enumerator over a range of ranges: yields the
/// elements of every inner range in turn, skipping empty ones.
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

#include <boost/optional/optional.hpp>

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

////////////////////////////////////////////////////////////////////////////////
// \class composite_iterator
//
// next() returns the following element or none. Once none has been returned
// the iterator stays exhausted.
//
// Inner ranges handed out by reference (lvalue or rvalue) are walked in place
// and never moved from. Inner ranges produced by value are cached in a
// shared, never modified, copy so that copies of the iterator keep
// independent positions into the same data.
// The outer iterator is advanced only after the inner range taken from it is
// used up (single-pass outer iterators may invalidate it on increment).
//
// Copies are fully independent for multi-pass outer iterators. For
// single-pass ones all copies share the underlying source and only one of
// them may be advanced.
////////////////////////////////////////////////////////////////////////////////

template <std::input_iterator OuterIterator, std::sentinel_for<OuterIterator> OuterSentinel = OuterIterator>
requires std::ranges::input_range<std::iter_reference_t<OuterIterator>>
class composite_iterator
{
private:
    using outer_reference = std::iter_reference_t<OuterIterator>;

    static bool constexpr caches_inner{ !std::is_reference_v<outer_reference> };

public:
    using inner_range    = std::conditional_t<caches_inner, std::remove_cvref_t<outer_reference>, std::remove_reference_t<outer_reference>>;
    using inner_iterator = std::ranges::iterator_t<inner_range>;
    using value_type     = std::iter_value_t    <inner_iterator>;
    using reference      = std::iter_reference_t<inner_iterator>;
    // references into a cached inner range would dangle once the cache moves
    // on: hand out values in that case
    using element        = std::conditional_t<caches_inner && std::is_reference_v<reference>, value_type, reference>;

    constexpr composite_iterator() = default;
    constexpr composite_iterator( OuterIterator outer, OuterSentinel outer_end )
        noexcept( std::is_nothrow_move_constructible_v<OuterIterator> && std::is_nothrow_move_constructible_v<OuterSentinel> )
        : outer_{ std::move( outer ) }, outer_end_{ std::move( outer_end ) } {}

    [[ nodiscard ]] constexpr boost::optional<element> next()
    {
        if ( exhausted_ ) [[ unlikely ]]
            return boost::none;

        for ( ;; )
        {
            if ( inner_ ) [[ likely ]]
            {
                auto & position{ *inner_ };
                if ( position != std::ranges::end( *segment_ ) ) [[ likely ]]
                {
                    boost::optional<element> result{ static_cast<element>( *position ) };
                    ++position;
                    return result;
                }
                inner_.reset();
                ++outer_;
            }

            if ( outer_ == outer_end_ ) [[ unlikely ]]
            {
                exhausted_ = true;
                segment_   = {};
                return boost::none;
            }

            if constexpr ( caches_inner )
            {
                segment_ = std::make_shared<inner_range>( *outer_ );
            }
            else
            {
                auto && segment{ *outer_ };
                segment_ = std::addressof( segment );
            }
            inner_.emplace( std::ranges::begin( *segment_ ) );
        }
    }

    [[ nodiscard ]] constexpr bool exhausted() const noexcept { return exhausted_; }

private:
    using segment_handle = std::conditional_t<caches_inner, std::shared_ptr<inner_range>, inner_range *>;

    OuterIterator                 outer_    {};
#ifdef _MSC_VER
    [[ msvc::no_unique_address ]]
#else
    [[ no_unique_address ]]
#endif
    OuterSentinel                 outer_end_{};
    segment_handle                segment_  {};
    std::optional<inner_iterator> inner_    {};
    bool                          exhausted_{ false };
}; // class composite_iterator

//------------------------------------------------------------------------------
} // namespace psi::seq
//------------------------------------------------------------------------------
