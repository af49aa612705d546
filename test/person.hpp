////////////////////////////////////////////////////////////////////////////////
/// Shared fixture types for the psi::idx unit tests
////////////////////////////////////////////////////////////////////////////////
#pragma once

#include <psi/idx/collection.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::idx::test
{
//------------------------------------------------------------------------------

struct person
{
    std::string name;
    int         age{};

    friend bool operator==( person const &, person const & ) = default;
    friend auto operator<=>( person const &, person const & ) = default;

    friend std::ostream & operator<<( std::ostream & os, person const & p ) { return os << p.name << ':' << p.age; }
};

using people = collection<person, std::string>;

inline std::string name_of   ( person const & p ) { return p.name; }
inline char        initial_of( person const & p ) { return p.name.front(); }
inline int         age_of    ( person const & p ) { return p.age; }

inline person const bob { "Bob" , 20 };
inline person const eve { "Eve" , 27 };
inline person const john{ "John", 45 };

inline people make_people() { return people{ { bob, eve, john }, &name_of }; }

inline std::vector<person> sorted( std::vector<person> values )
{
    std::ranges::sort( values );
    return values;
}

// key function that can be armed to throw, for exception safety tests
struct tripwire
{
    bool * armed;

    int operator()( person const & p ) const
    {
        if ( *armed )
            throw std::runtime_error( "tripwire" );
        return p.age;
    }
};

//------------------------------------------------------------------------------
} // namespace psi::idx::test
//------------------------------------------------------------------------------

template <>
struct fmt::formatter<psi::idx::test::person> : fmt::formatter<std::string_view>
{
    template <typename FormatContext>
    auto format( psi::idx::test::person const & p, FormatContext & ctx ) const
    {
        return fmt::format_to( ctx.out(), "{}:{}", p.name, p.age );
    }
};
//------------------------------------------------------------------------------
