////////////////////////////////////////////////////////////////////////////////
///
/// \file full_key.hpp
/// ------------------
///
/// Addressing forms accepted by psi::idx::collection accessors:
///   - a bare primary key (or anything implicitly convertible to one),
///   - primary_key<K>: an explicitly tagged primary key,
///   - secondary_key<K>: an (index name, secondary key) pair, usually created
///     with by( "index", key ),
///   - full_key<PK, SK>: the tagged union of the two above, for callers that
///     decide the addressing form at runtime.
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

#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
//------------------------------------------------------------------------------
namespace psi::idx
{
//------------------------------------------------------------------------------

template <typename Key>
struct primary_key
{
    using key_type = Key;

    Key key;

    friend bool operator==( primary_key const &, primary_key const & ) = default;
}; // struct primary_key

template <typename Key>
struct secondary_key
{
    using key_type = Key;

    std::string index;
    Key         key;

    friend bool operator==( secondary_key const &, secondary_key const & ) = default;
}; // struct secondary_key

template <typename PrimaryKey, typename SecondaryKey>
using full_key = std::variant<primary_key<PrimaryKey>, secondary_key<SecondaryKey>>;


namespace detail
{
    // string literals and string_views are stored and hashed as std::string
    template <typename T>
    using normalized_key_t = std::conditional_t
    <
        std::is_convertible_v<T, std::string_view> && !std::is_same_v<std::remove_cvref_t<T>, std::string>,
        std::string,
        std::remove_cvref_t<T>
    >;

    template <typename T> struct is_primary_key                      : std::false_type {};
    template <typename K> struct is_primary_key  <primary_key  <K>>  : std::true_type  {};
    template <typename T> struct is_secondary_key                    : std::false_type {};
    template <typename K> struct is_secondary_key<secondary_key<K>>  : std::true_type  {};
    template <typename T> struct is_full_key                         : std::false_type {};
    template <typename P, typename S>
    struct is_full_key<std::variant<primary_key<P>, secondary_key<S>>> : std::true_type  {};
} // namespace detail

template <typename Key, typename PrimaryKey>
concept addressing_key =
    std::is_constructible_v<PrimaryKey, Key const &> ||
    detail::is_primary_key  <Key>::value ||
    detail::is_secondary_key<Key>::value ||
    detail::is_full_key     <Key>::value;


template <typename Key>
[[nodiscard]] secondary_key<detail::normalized_key_t<Key>> by( std::string_view const index, Key && key )
{
    return { std::string{ index }, detail::normalized_key_t<Key>( std::forward<Key>( key ) ) };
}

template <typename Key>
[[nodiscard]] primary_key<detail::normalized_key_t<Key>> by_primary( Key && key )
{
    return { detail::normalized_key_t<Key>( std::forward<Key>( key ) ) };
}

//------------------------------------------------------------------------------
} // namespace psi::idx
//------------------------------------------------------------------------------
