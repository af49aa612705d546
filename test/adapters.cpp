#include "person.hpp"

#include <psi/idx/collection.hpp>
#include <psi/idx/collector.hpp>
#include <psi/idx/debug_string.hpp>

#include <fmt/format.h>

#include <gtest/gtest.h>

#include <algorithm>
#include <iterator>
#include <string>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::idx
{
//------------------------------------------------------------------------------

using namespace test;

namespace
{
    struct opaque
    {
        int id;
        friend bool operator==( opaque const &, opaque const & ) = default;
    };
} // anonymous namespace

//==============================================================================
// collector
//==============================================================================

TEST( collector, back_inserter )
{
    auto const seed{ make_people() };
    std::vector<person> const incoming{ { "Anna", 50 }, { "Carl", 33 } };

    auto builder{ collect_into( seed ) };
    std::ranges::copy( incoming, std::back_inserter( builder ) );
    EXPECT_EQ( builder.size(), 5 );

    auto const result{ std::move( builder ).finish() };
    EXPECT_EQ( result.size(), 5 );
    EXPECT_EQ( result.at( "Carl" ).age, 33 );
    EXPECT_EQ( seed.size(), 3 ); // the seed is never modified
}

TEST( collector, append_range_overwrites_by_primary_key )
{
    auto builder{ collect_into( make_people() ) };
    builder.append_range( std::vector<person>{ { "Bob", 21 }, { "Zed", 1 } } );
    auto const result{ std::move( builder ).finish() };
    EXPECT_EQ( result.size(), 4 );
    EXPECT_EQ( result.at( "Bob" ).age, 21 );
}

TEST( collector, keeps_indices_of_the_seed )
{
    auto seed{ make_people() };
    seed.create_index( "initial", &initial_of );

    auto builder{ collect_into( seed ) };
    builder.push_back( person{ "Anna", 50 } );
    EXPECT_THROW( builder.push_back( person{ "Jack", 30 } ), duplicate_secondary_key );

    auto const result{ std::move( builder ).finish() };
    EXPECT_EQ   ( result.size(), 4 );
    EXPECT_EQ   ( result.at( by( "initial", 'A' ) ).name, "Anna" );
    EXPECT_FALSE( result.fetch( "Jack" ) );
}

TEST( collector, abort )
{
    auto const seed{ make_people() };
    {
        auto builder{ collect_into( seed ) };
        builder.push_back( person{ "Anna", 50 } );
        builder.push_back( person{ "Bob" , 99 } );
    } // dropped without finish()
    EXPECT_EQ   ( seed.size(), 3 );
    EXPECT_FALSE( seed.fetch( "Anna" ) );
    EXPECT_EQ   ( seed.at( "Bob" ), bob );
}

//==============================================================================
// debug rendering
//==============================================================================

TEST( debug_string, values_and_indices )
{
    people c{ { bob }, &name_of };
    c.create_index( "initial", &initial_of )
     .create_index( "age"    , &age_of, index_kind::lazy )
     .create_index( "len"    , []( person const & p ) { return p.name.size(); } );

    EXPECT_EQ
    (
        to_debug_string( c ),
        "psi::idx::collection{ values: [Bob:20], indices: [primary, initial (eager), len (eager), age (lazy)] }"
    );
    EXPECT_EQ( fmt::format( "{}", c ), to_debug_string( c ) );
}

TEST( debug_string, empty )
{
    people const c{ &name_of };
    EXPECT_EQ( to_debug_string( c ), "psi::idx::collection{ values: [], indices: [primary] }" );
}

TEST( debug_string, lists_every_value )
{
    auto const rendered{ to_debug_string( make_people() ) };
    for ( auto const * const expected : { "Bob:20", "Eve:27", "John:45" } )
        EXPECT_NE( rendered.find( expected ), std::string::npos ) << rendered;
}

TEST( debug_string, unformattable_values )
{
    collection<opaque, int> const c{ { opaque{ 1 }, opaque{ 2 } }, []( opaque const & o ) { return o.id; } };
    EXPECT_EQ( to_debug_string( c ), "psi::idx::collection{ values: <2 values>, indices: [primary] }" );
}

//------------------------------------------------------------------------------
} // namespace psi::idx
//------------------------------------------------------------------------------
