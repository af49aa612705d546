////////////////////////////////////////////////////////////////////////////////
///
/// \file error.hpp
/// ---------------
///
/// Exceptions thrown by psi::idx::collection.
///
/// Ordinary key absence is reported through key_not_found (an
/// std::out_of_range, like std::map::at) by the strict accessors only; the
/// non-strict ones report it through boost::optional/default values instead.
/// Index misuse (index_error and its descendants) is never silently tolerated.
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

#include <stdexcept>
#include <string>
#include <string_view>
//------------------------------------------------------------------------------
namespace psi::idx
{
//------------------------------------------------------------------------------

class key_not_found : public std::out_of_range
{
public:
    explicit key_not_found( std::string const & what_arg ) : std::out_of_range{ what_arg } {}
};

class index_error : public std::invalid_argument
{
public:
    std::string const & index_name() const noexcept { return index_; }

protected:
    index_error( std::string_view const index, std::string const & what_arg )
        : std::invalid_argument{ what_arg }, index_{ index } {}

private:
    std::string index_;
}; // class index_error

class index_already_exists final : public index_error
{
public:
    explicit index_already_exists( std::string_view index );
};

class unknown_index final : public index_error
{
public:
    explicit unknown_index( std::string_view index );
};

/// Raised when a value would make an eager index map one secondary key to two
/// different primary keys.
class duplicate_secondary_key final : public index_error
{
public:
    explicit duplicate_secondary_key( std::string_view index );
};

/// A secondary key was given whose type differs from the one produced by the
/// index's key function.
class index_key_type_mismatch final : public index_error
{
public:
    index_key_type_mismatch( std::string_view index, std::string_view expected, std::string_view given );
};

/// Operation requires a materialized index (e.g. primary_key() translation).
class lazy_index_unsupported final : public index_error
{
public:
    lazy_index_unsupported( std::string_view index, std::string_view operation );
};

namespace detail
{
    [[ noreturn, gnu::cold ]] void throw_key_not_found();
    [[ noreturn, gnu::cold ]] void throw_key_not_found          ( std::string_view index );
    [[ noreturn, gnu::cold ]] void throw_index_already_exists   ( std::string_view index );
    [[ noreturn, gnu::cold ]] void throw_unknown_index          ( std::string_view index );
    [[ noreturn, gnu::cold ]] void throw_duplicate_secondary_key( std::string_view index );
    [[ noreturn, gnu::cold ]] void throw_index_key_type_mismatch( std::string_view index, char const * expected_type, char const * given_type );
    [[ noreturn, gnu::cold ]] void throw_lazy_index_unsupported ( std::string_view index, std::string_view operation );
} // namespace detail

//------------------------------------------------------------------------------
} // namespace psi::idx
//------------------------------------------------------------------------------
