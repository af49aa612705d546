////////////////////////////////////////////////////////////////////////////////
///
/// \file collector.hpp
/// -------------------
///
/// Builder that folds a stream of values into a collection through put():
///
///   auto builder{ collect_into( c ) };
///   std::ranges::copy( values, std::back_inserter( builder ) );
///   auto c2{ std::move( builder ).finish() };
///
/// The collector works on its own copy of the seed collection so destroying
/// it without calling finish() discards everything pushed so far and leaves
/// the seed untouched.
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

#include <concepts>
#include <ranges>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::idx
{
//------------------------------------------------------------------------------

template <typename Collection>
class collector
{
public:
    using value_type = typename Collection::value_type;
    using size_type  = typename Collection::size_type;

    explicit collector( Collection const &  seed ) : accumulated_{ seed } {}
    explicit collector( Collection       && seed ) : accumulated_{ std::move( seed ) } {}

    collector( collector const & ) = delete;
    collector( collector && )      = default;

    // also makes std::back_inserter( collector ) an output iterator
    void push_back( value_type value ) { accumulated_.put( std::move( value ) ); }

    template <std::ranges::input_range R>
    requires std::constructible_from<value_type, std::ranges::range_reference_t<R>>
    collector & append_range( R && values )
    {
        for ( auto && value : values )
            push_back( value_type( std::forward<decltype( value )>( value ) ) );
        return *this;
    }

    [[nodiscard]] size_type size() const noexcept { return accumulated_.size(); }

    [[nodiscard]] Collection finish() && { return std::move( accumulated_ ); }

private:
    Collection accumulated_;
}; // class collector

template <typename Value, typename PrimaryKey, typename Hash, typename KeyEqual>
[[nodiscard]] auto collect_into( collection<Value, PrimaryKey, Hash, KeyEqual> const & seed )
{
    return collector<collection<Value, PrimaryKey, Hash, KeyEqual>>{ seed };
}

template <typename Value, typename PrimaryKey, typename Hash, typename KeyEqual>
[[nodiscard]] auto collect_into( collection<Value, PrimaryKey, Hash, KeyEqual> && seed )
{
    return collector<collection<Value, PrimaryKey, Hash, KeyEqual>>{ std::move( seed ) };
}

//------------------------------------------------------------------------------
} // namespace psi::idx
//------------------------------------------------------------------------------
