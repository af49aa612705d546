////////////////////////////////////////////////////////////////////////////////
///
/// \file debug_string.hpp
/// ----------------------
///
/// Solely a debugging helper: renders a collection's values and its indices,
/// e.g.
///   psi::idx::collection{ values: [a, b], indices: [primary, initial (eager), age (lazy)] }
/// Values are listed (in storage order) only if they are fmt formattable.
/// The format is not stable and not meant to be parsed.
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

#include <psi/idx/collection.hpp>

#include <fmt/format.h>

#include <iterator>
#include <string>
#include <string_view>
//------------------------------------------------------------------------------
namespace psi::idx
{
//------------------------------------------------------------------------------

template <typename Value, typename PrimaryKey, typename Hash, typename KeyEqual>
std::string to_debug_string( collection<Value, PrimaryKey, Hash, KeyEqual> const & c )
{
    fmt::memory_buffer out;
    auto inserter{ std::back_inserter( out ) };

    fmt::format_to( inserter, "psi::idx::collection{{ values: " );
    if constexpr ( fmt::is_formattable<Value>::value )
    {
        fmt::format_to( inserter, "[" );
        bool first{ true };
        for ( auto const & value : c )
        {
            if ( !first )
                fmt::format_to( inserter, ", " );
            fmt::format_to( inserter, "{}", value );
            first = false;
        }
        fmt::format_to( inserter, "]" );
    }
    else
    {
        fmt::format_to( inserter, "<{} values>", c.size() );
    }

    fmt::format_to( inserter, ", indices: [primary" );
    for ( auto const & name : c.index_names( index_kind::eager ) )
        fmt::format_to( inserter, ", {} (eager)", name );
    for ( auto const & name : c.index_names( index_kind::lazy ) )
        fmt::format_to( inserter, ", {} (lazy)", name );
    fmt::format_to( inserter, "] }}" );

    return fmt::to_string( out );
}

//------------------------------------------------------------------------------
} // namespace psi::idx
//------------------------------------------------------------------------------

template <typename Value, typename PrimaryKey, typename Hash, typename KeyEqual>
struct fmt::formatter<psi::idx::collection<Value, PrimaryKey, Hash, KeyEqual>> : fmt::formatter<std::string_view>
{
    template <typename FormatContext>
    auto format( psi::idx::collection<Value, PrimaryKey, Hash, KeyEqual> const & c, FormatContext & ctx ) const
    {
        return fmt::formatter<std::string_view>::format( psi::idx::to_debug_string( c ), ctx );
    }
};
//------------------------------------------------------------------------------
