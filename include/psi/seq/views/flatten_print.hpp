#pragma once

#include "flatten_collection.hpp"

#include <cstddef>
#include <ostream>
//------------------------------------------------------------------------------
namespace psi::seq
{
//------------------------------------------------------------------------------

template <std::ranges::view Base>
requires forward_nested_range<Base const>
void flatten_collection<Base>::print( std::ostream & out ) const
{
    if ( std::ranges::empty( base_ ) )
    {
        out << "The view has no segments.\n";
        return;
    }

    std::size_t segment_count{ 0 };
    std::size_t empty_count  { 0 };
    std::size_t element_count{ 0 };
    for ( auto const & segment : base_ )
    {
        out << "Segment " << segment_count++ << ":\t";
        if ( std::ranges::empty( segment ) )
        {
            ++empty_count;
            out << "<empty>\n";
            continue;
        }

        out << '[';
        bool first{ true };
        for ( auto const & element : segment )
        {
            if ( !first )
                out << ", ";
            out << element;
            first = false;
            ++element_count;
        }
        out << "]\n";
    }
    out << '[' << segment_count << " segments w/ " << element_count << " elements (" << empty_count << " empty)]\n";
}

//------------------------------------------------------------------------------
} // namespace psi::seq
//------------------------------------------------------------------------------
