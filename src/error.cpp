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
#include <psi/idx/error.hpp>

#include <boost/core/demangle.hpp>

#include <fmt/format.h>
//------------------------------------------------------------------------------
namespace psi::idx
{
//------------------------------------------------------------------------------

index_already_exists::index_already_exists( std::string_view const index )
    : index_error{ index, fmt::format( "psi::idx: index '{}' already present", index ) } {}

unknown_index::unknown_index( std::string_view const index )
    : index_error{ index, fmt::format( "psi::idx: unknown index '{}'", index ) } {}

duplicate_secondary_key::duplicate_secondary_key( std::string_view const index )
    : index_error{ index, fmt::format( "psi::idx: secondary key already taken by another value in index '{}'", index ) } {}

index_key_type_mismatch::index_key_type_mismatch( std::string_view const index, std::string_view const expected, std::string_view const given )
    : index_error{ index, fmt::format( "psi::idx: index '{}' is keyed by {} (got {})", index, expected, given ) } {}

lazy_index_unsupported::lazy_index_unsupported( std::string_view const index, std::string_view const operation )
    : index_error{ index, fmt::format( "psi::idx: {} is not supported by lazy index '{}'", operation, index ) } {}


namespace detail
{
    [[ noreturn, gnu::cold ]] void throw_key_not_found() { throw key_not_found( "psi::idx: key not found" ); }
    [[ noreturn, gnu::cold ]] void throw_key_not_found( std::string_view const index )
    {
        throw key_not_found( fmt::format( "psi::idx: key not found in index '{}'", index ) );
    }

    [[ noreturn, gnu::cold ]] void throw_index_already_exists   ( std::string_view const index ) { throw index_already_exists   ( index ); }
    [[ noreturn, gnu::cold ]] void throw_unknown_index          ( std::string_view const index ) { throw unknown_index          ( index ); }
    [[ noreturn, gnu::cold ]] void throw_duplicate_secondary_key( std::string_view const index ) { throw duplicate_secondary_key( index ); }

    [[ noreturn, gnu::cold ]] void throw_index_key_type_mismatch( std::string_view const index, char const * const expected_type, char const * const given_type )
    {
        throw index_key_type_mismatch( index, boost::core::demangle( expected_type ), boost::core::demangle( given_type ) );
    }

    [[ noreturn, gnu::cold ]] void throw_lazy_index_unsupported( std::string_view const index, std::string_view const operation )
    {
        throw lazy_index_unsupported( index, operation );
    }
} // namespace detail

//------------------------------------------------------------------------------
} // namespace psi::idx
//------------------------------------------------------------------------------
