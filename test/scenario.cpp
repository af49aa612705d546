#include "person.hpp"

#include <psi/idx/collection.hpp>

#include <gtest/gtest.h>

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
    person rename_to( person p, char const * const name ) { p.name = name; return p; }
} // anonymous namespace

TEST( scenario, people_indexed_by_initial )
{
    people c{ { bob, eve, john }, &name_of };
    EXPECT_EQ( c.at( "Bob" ), bob );

    c.create_index( "initial", &initial_of );
    auto const j{ c.fetch( by( "initial", 'J' ) ) };
    ASSERT_TRUE( j );
    EXPECT_EQ  ( *j, john );

    c.update( "Bob", []( person const & p ) { return rename_to( p, "Steve" ); } );
    EXPECT_EQ   ( c.at( "Steve" ), ( person{ "Steve", 20 } ) );
    EXPECT_FALSE( c.fetch( "Bob" ) );
    EXPECT_EQ   ( c.at( by( "initial", 'S' ) ).name, "Steve" );

    c.drop_index( "initial" );
    EXPECT_FALSE( c.fetch( by( "initial", 'J' ) ) );
    EXPECT_THROW( (void)c.at( by( "initial", 'J' ) ), unknown_index );
}

TEST( scenario, access )
{
    auto c{ make_people() };

    EXPECT_EQ   ( c.at( "Bob" ), bob );
    EXPECT_EQ   ( c.get( "Bob", person{} ), bob );
    ASSERT_TRUE ( c.fetch( "Bob" ) );
    EXPECT_EQ   ( *c.fetch( "Bob" ), bob );
    EXPECT_FALSE( c.fetch( "Absent" ) );
    EXPECT_EQ   ( sorted( c.to_list() ), ( std::vector<person>{ bob, eve, john } ) );

    c.update( "Bob", []( person const & p ) { return rename_to( p, "Steve" ); } );
    EXPECT_EQ   ( c.at( "Steve" ), ( person{ "Steve", 20 } ) );
    EXPECT_FALSE( c.fetch( "Bob" ) );

    c.fast_update( "Eve", []( person p ) { ++p.age; return p; } );
    EXPECT_EQ( c.at( "Eve" ), ( person{ "Eve", 28 } ) );

    auto const johns_age{ c.get_and_update_at( "John", []( person const & p ) {
        return people::update_step<int>{ p.age, rename_to( p, "Frank" ) };
    } ) };
    EXPECT_EQ   ( johns_age, 45 );
    EXPECT_EQ   ( c.at( "Frank" ), ( person{ "Frank", 45 } ) );
    EXPECT_FALSE( c.fetch( "John" ) );

    c.put( person{ "Anna", 50 } );
    EXPECT_EQ  ( c.at( "Anna" ), ( person{ "Anna", 50 } ) );
    EXPECT_TRUE( c.contains( person{ "Anna", 50 } ) );

    EXPECT_EQ( c.size(), 4 );
    EXPECT_EQ( std::distance( c.begin(), c.end() ), 4 );
}

//------------------------------------------------------------------------------
} // namespace psi::idx
//------------------------------------------------------------------------------
