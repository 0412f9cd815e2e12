#include <psi/seq/views/flatten.hpp>
#include <psi/seq/views/flatten_collection.hpp>
#include <psi/seq/views/flatten_print.hpp>

#include <boost/container/slist.hpp>

#include <gtest/gtest.h>

#include <forward_list>
#include <list>
#include <ranges>
#include <sstream>
#include <stdexcept>
#include <string>
#include <tuple>
#include <type_traits>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::seq
{
//------------------------------------------------------------------------------

namespace
{
    using segments = std::vector<std::vector<int>>;

    // walks the view through its positions only
    template <typename View>
    std::vector<int> walk( View const & view )
    {
        std::vector<int> elements;
        for ( auto i{ view.start_index() }; i != view.end_index(); view.form_index_after( i ) )
            elements.push_back( view[ i ] );
        return elements;
    }

    template <typename View>
    auto nth_index( View const & view, std::ptrdiff_t const n ) { return view.offset_index( view.start_index(), n ); }
} // anonymous namespace

TEST( flatten_collection, traversal )
{
    segments const s{ { 1, 2 }, {}, { 3 } };
    flatten_collection const view{ s };

    EXPECT_EQ( walk( view ), ( std::vector{ 1, 2, 3 } ) );
    EXPECT_EQ( std::vector<int>( view.begin(), view.end() ), ( std::vector{ 1, 2, 3 } ) );

    auto source{ view.make_iterator() };
    EXPECT_EQ( *source.next(), 1 );
    EXPECT_EQ( *source.next(), 2 );
    EXPECT_EQ( *source.next(), 3 );
    EXPECT_FALSE( source.next() );

    static_assert( std::ranges::forward_range<decltype( view )> );
    static_assert( std::ranges::common_range <decltype( view )> );
    static_assert( std::ranges::view<std::remove_const_t<decltype( view )>> );
}

TEST( flatten_collection, start_skips_leading_empty_segments )
{
    segments const s{ {}, {}, {}, { 4, 5 } };
    flatten_collection const view{ s };

    auto const start{ view.start_index() };
    ASSERT_FALSE( start.is_past_end() );
    EXPECT_EQ( start.outer(), s.begin() + 3 );
    EXPECT_EQ( start.inner(), s[ 3 ].begin() );
    EXPECT_EQ( view[ start ], 4 );
    EXPECT_EQ( view.front(), 4 );
}

TEST( flatten_collection, empty )
{
    segments const no_segments;
    flatten_collection const none{ no_segments };
    EXPECT_EQ( none.start_index(), none.end_index() );
    EXPECT_TRUE( none.empty() );
    EXPECT_FALSE( none );

    segments const empty_segments( 4 );
    flatten_collection const empty{ empty_segments };
    EXPECT_EQ( empty.start_index(), empty.end_index() );
    EXPECT_EQ( empty.begin(), empty.end() );
    EXPECT_TRUE( walk( empty ).empty() );
}

TEST( flatten_collection, end_index )
{
    segments const s{ { 1 }, { 2 }, {} };
    flatten_collection const view{ s };

    auto const end{ view.end_index() };
    EXPECT_TRUE( end.is_past_end() );
    EXPECT_EQ( end.outer(), s.end() );
    // stepping off the last element skips the trailing empty segment
    EXPECT_EQ( view.index_after( nth_index( view, 1 ) ), end );
}

TEST( flatten_collection, distance )
{
    segments const s{ { 1, 2 }, {}, { 3, 4, 5 }, {} };
    flatten_collection const view{ s };

    auto const start{ view.start_index() };
    auto const end  { view.end_index  () };
    EXPECT_EQ( view.distance( start, end ), 5 );
    EXPECT_EQ( view.distance( end, start ), -5 );
    EXPECT_EQ( view.distance( start, start ), 0 );
    EXPECT_EQ( view.distance( nth_index( view, 1 ), nth_index( view, 3 ) ), 2 );
    EXPECT_EQ( view.distance( nth_index( view, 4 ), nth_index( view, 2 ) ), -2 );

    for ( std::ptrdiff_t n{ 0 }; n <= 5; ++n )
        EXPECT_EQ( view.distance( start, view.offset_index( start, n ) ), n );
}

TEST( flatten_collection, distance_over_unordered_positions )
{
    std::forward_list<std::forward_list<int>> const lists{ { 1 }, {}, { 2, 3 }, { 4 } };
    flatten_collection const view{ lists };
    static_assert( !std::totally_ordered<decltype( view )::index> );

    auto const start{ view.start_index() };
    auto const end  { view.end_index  () };
    EXPECT_EQ( view.distance( start, end ), 4 );
    EXPECT_EQ( view.distance( end, start ), -4 );
    EXPECT_EQ( view.distance( nth_index( view, 3 ), nth_index( view, 1 ) ), -2 );
    EXPECT_EQ( view.distance( nth_index( view, 1 ), nth_index( view, 3 ) ),  2 );
}

TEST( flatten_collection, limited_offset )
{
    segments const s{ { 1, 2 }, {}, { 3 } };
    flatten_collection const view{ s };

    auto const start{ view.start_index() };
    auto const end  { view.end_index  () };

    EXPECT_EQ( view.offset_index( start, 3, end ), end );
    EXPECT_EQ( view.offset_index( start, 4, end ), std::nullopt );
    EXPECT_EQ( view.offset_index( start, 2, end ), nth_index( view, 2 ) );
    EXPECT_EQ( view.offset_index( start, 0, start ), start );

    auto const second{ nth_index( view, 1 ) };
    EXPECT_EQ( view.offset_index( start, 1, second ), second );
    EXPECT_EQ( view.offset_index( start, 2, second ), std::nullopt );

    auto position{ start };
    EXPECT_TRUE ( view.form_offset_index( position, 2, end ) );
    EXPECT_EQ   ( view[ position ], 3 );
    EXPECT_FALSE( view.form_offset_index( position, 5, end ) );
    EXPECT_EQ   ( position, end );
}

TEST( flatten_collection, checked_access )
{
    segments const s{ { 1 }, {} };
    flatten_collection const view{ s };

    EXPECT_EQ( view.at( view.start_index() ), 1 );
    EXPECT_THROW( std::ignore = view.at( view.end_index() ), std::out_of_range );
}

TEST( flatten_collection, for_each )
{
    segments const s{ {}, { 1, 2 }, {}, { 3 }, {} };
    flatten_collection const view{ s };

    std::vector<int> visited;
    view.for_each( [ & ]( int const x ) { visited.push_back( x ); } );
    EXPECT_EQ( visited, ( std::vector{ 1, 2, 3 } ) );

    visited.clear();
    EXPECT_THROW
    (
        view.for_each( [ & ]( int const x ) {
            if ( x == 2 )
                throw std::runtime_error{ "stop" };
            visited.push_back( x );
        } ),
        std::runtime_error
    );
    EXPECT_EQ( visited, ( std::vector{ 1 } ) );
}

TEST( flatten_collection, forward_only_bases )
{
    boost::container::slist<std::vector<int>> const s{ { 1 }, {}, { 2, 3 } };
    flatten_collection const view{ s };
    static_assert( !decltype( view )::bidirectional );
    static_assert(  std::forward_iterator      <decltype( view )::iterator> );
    static_assert( !std::bidirectional_iterator<decltype( view )::iterator> );

    EXPECT_EQ( walk( view ), ( std::vector{ 1, 2, 3 } ) );
    EXPECT_EQ( view.distance( view.start_index(), view.end_index() ), 3 );
    EXPECT_EQ( view[ view.offset_index( view.start_index(), 2 ) ], 3 );

    std::forward_list<std::forward_list<int>> const lists{ {}, { 4 } };
    EXPECT_EQ( walk( flatten_collection{ lists } ), ( std::vector{ 4 } ) );
}

TEST( flatten_collection, iterator_positions )
{
    segments const s{ { 1, 2 }, {}, { 3 } };
    flatten_collection const view{ s };

    auto const second{ nth_index( view, 1 ) };
    auto const it{ view.iterator_at( second ) };
    EXPECT_EQ( *it, 2 );
    EXPECT_EQ( it.position(), second );
    EXPECT_EQ( std::next( it ).position(), nth_index( view, 2 ) );
    EXPECT_EQ( std::next( view.begin(), 3 ), view.end() );
}

TEST( flatten_collection, slice )
{
    segments const s{ { 1, 2 }, {}, { 3, 4 } };
    flatten_collection const view{ s };

    auto const middle{ view.slice( nth_index( view, 1 ), nth_index( view, 3 ) ) };
    EXPECT_EQ( std::vector<int>( middle.begin(), middle.end() ), ( std::vector{ 2, 3 } ) );
    EXPECT_TRUE( view.slice( view.end_index(), view.end_index() ).empty() );
}

TEST( flatten_collection, views_flatten )
{
    segments s{ { 1 }, {}, { 2 } };

    auto const referenced{ s | views::flatten };
    static_assert( std::is_same_v<std::remove_const_t<decltype( referenced )>, flatten_collection<std::ranges::ref_view<segments>>> );
    EXPECT_EQ( walk( referenced ), ( std::vector{ 1, 2 } ) );

    // rvalue bases are owned by the view
    auto const owned{ segments{ { 5, 6 }, {} } | views::flatten };
    EXPECT_EQ( walk( owned ), ( std::vector{ 5, 6 } ) );

    auto const called{ views::flatten( s ) };
    EXPECT_EQ( std::ranges::distance( called ), 2 );

    auto const squares{ s | views::flatten | std::views::transform( []( int const x ) { return x * x; } ) };
    EXPECT_EQ( std::vector<int>( squares.begin(), squares.end() ), ( std::vector{ 1, 4 } ) );
}

TEST( flatten_collection, underestimated_count )
{
    segments const s{ { 1, 2 }, { 3 } };
    EXPECT_EQ( flatten_collection{ s }.underestimated_count(), 0 );
}

TEST( flatten_collection, print )
{
    segments const s{ { 1, 2 }, {}, { 3 } };
    std::ostringstream out;
    flatten_collection{ s }.print( out );
    EXPECT_EQ
    (
        out.str(),
        "Segment 0:\t[1, 2]\n"
        "Segment 1:\t<empty>\n"
        "Segment 2:\t[3]\n"
        "[3 segments w/ 3 elements (1 empty)]\n"
    );

    segments const none;
    std::ostringstream empty_out;
    flatten_collection{ none }.print( empty_out );
    EXPECT_EQ( empty_out.str(), "The view has no segments.\n" );
}

#ifndef NDEBUG
TEST( flatten_collection, precondition_violations )
{
    segments const s{ { 1 } };
    flatten_collection const view{ s };
    EXPECT_DEATH( std::ignore = view[ view.end_index() ], "" );
    EXPECT_DEATH( std::ignore = view.index_after( view.end_index() ), "" );

    // the limit lies behind a forward offset
    segments const three{ { 1, 2 }, {}, { 3 } };
    flatten_collection const ordered{ three };
    EXPECT_DEATH( std::ignore = ordered.offset_index( nth_index( ordered, 2 ), 1, ordered.start_index() ), "" );
}
#endif

TEST( flatten_collection, backward_offset_on_forward_only_base )
{
    std::forward_list<std::forward_list<int>> const lists{ { 1 }, { 2 }, { 3 } };
    flatten_collection const view{ lists };

    auto const start{ view.start_index() };
    EXPECT_THROW( std::ignore = view.offset_index( start, -1 ), std::logic_error );
    EXPECT_THROW( std::ignore = view.offset_index( view.end_index(), -1 ), std::logic_error );
    EXPECT_THROW( std::ignore = view.offset_index( view.offset_index( start, 2 ), -1, start ), std::logic_error );

    auto position{ view.offset_index( start, 1 ) };
    EXPECT_THROW( view.form_offset_index( position, -1, start ), std::logic_error );
    EXPECT_EQ( view[ position ], 2 );
}

//------------------------------------------------------------------------------
} // namespace psi::seq
//------------------------------------------------------------------------------
