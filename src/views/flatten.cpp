////////////////////////////////////////////////////////////////////////////////
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
#include <psi/seq/views/flatten_collection.hpp>

#include <stdexcept>
//------------------------------------------------------------------------------
namespace psi::seq
{
//------------------------------------------------------------------------------

namespace detail
{
    [[ noreturn, gnu::cold ]] void throw_out_of_range() { throw std::out_of_range( "seq::flatten_collection access at the past-the-end position" ); }
    [[ noreturn, gnu::cold ]] void throw_not_bidirectional() { throw std::logic_error( "seq::flatten_collection cannot step backwards over a forward-only base" ); }
} // namespace detail

//------------------------------------------------------------------------------
} // namespace psi::seq
//------------------------------------------------------------------------------
