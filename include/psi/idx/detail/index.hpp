////////////////////////////////////////////////////////////////////////////////
///
/// \file index.hpp
/// ---------------
///
/// Type erased secondary indices.
///
/// Each index has its own secondary key type (deduced from its key function)
/// so the registries in psi::idx::collection store them behind the two
/// abstract bases below and the typed implementations are recovered with
/// dynamic_cast when a lookup supplies a concretely typed key.
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

#include <boost/assert.hpp>
#include <boost/container/static_vector.hpp>
#include <boost/container_hash/hash.hpp>
#include <boost/optional/optional.hpp>
#include <boost/unordered_map.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <typeinfo>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::idx
{
//------------------------------------------------------------------------------

enum class index_kind : std::uint8_t { eager, lazy };

namespace detail
{
//------------------------------------------------------------------------------

// A value being replaced can displace at most two stored values: the one it
// was popped from (update) and the one already occupying its primary key.
inline constexpr std::size_t max_outgoing_values{ 2 };

////////////////////////////////////////////////////////////////////////////////
// \class eager_index_base
//
// Mutations are applied to every eager index with a two-phase protocol driven
// by collection's mutation engine:
//   stage()    - computes the incoming and outgoing secondary keys and checks
//                for collisions; does not touch the map
//   apply()    - installs the incoming entry (may throw)
//   rollback() - undoes apply() (if done) and discards the staged keys
//   finalize() - removes the outgoing entries and discards the staged keys
// so that a failure in any index (or in the primary store) can be undone in
// all of them.
////////////////////////////////////////////////////////////////////////////////

template <typename Value, typename PrimaryKey>
class eager_index_base
{
public:
    virtual ~eager_index_base() = default;

    [[nodiscard]] virtual std::unique_ptr<eager_index_base> clone() const = 0;

    [[nodiscard]] virtual std::type_info const & key_type_info() const noexcept = 0;
    [[nodiscard]] virtual std::size_t            size         () const noexcept = 0;

    // returns false if 'incoming' would collide with a value other than the
    // outgoing ones (nothing is left staged in that case)
    [[nodiscard]] virtual bool stage( Value const * incoming, std::span<Value const * const> outgoing ) = 0;

    virtual void apply   ( PrimaryKey const & incoming_primary ) = 0;
    virtual void rollback() noexcept = 0;
    virtual void finalize() noexcept = 0;

protected:
    eager_index_base() = default;
    eager_index_base( eager_index_base const & ) = default;
    eager_index_base & operator=( eager_index_base const & ) = delete;
}; // class eager_index_base


template <typename Value, typename PrimaryKey, typename SecondaryKey>
class eager_index final : public eager_index_base<Value, PrimaryKey>
{
public:
    using key_type     = SecondaryKey;
    using key_function = std::function<SecondaryKey( Value const & )>;
    using map_type     = boost::unordered_map<SecondaryKey, PrimaryKey, boost::hash<SecondaryKey>>;

    explicit eager_index( key_function fn ) noexcept : fn_{ std::move( fn ) } {}

    eager_index( eager_index const & other ) : eager_index_base<Value, PrimaryKey>{ other }, fn_{ other.fn_ }, map_{ other.map_ }
    {
        BOOST_ASSERT_MSG( !other.staged(), "Copying an index in the middle of an update" );
    }

    // Materializes the index in one pass over the primary store. Returns false
    // (leaving the index in an unspecified state, to be discarded) if two
    // values produce the same secondary key.
    template <typename PrimaryMap>
    [[nodiscard]] bool build( PrimaryMap const & primary )
    {
        map_.reserve( primary.size() );
        for ( auto const & [primary_key, value] : primary )
        {
            if ( !map_.emplace( fn_( value ), primary_key ).second )
                return false;
        }
        return true;
    }

    [[nodiscard]] PrimaryKey const * find( SecondaryKey const & key ) const
    {
        auto const pos{ map_.find( key ) };
        return ( pos != map_.end() ) ? &pos->second : nullptr;
    }

    [[nodiscard]] map_type const & entries() const noexcept { return map_; }

    std::unique_ptr<eager_index_base<Value, PrimaryKey>> clone() const override { return std::make_unique<eager_index>( *this ); }

    std::type_info const & key_type_info() const noexcept override { return typeid( SecondaryKey ); }
    std::size_t            size         () const noexcept override { return map_.size(); }

    bool stage( Value const * const incoming, std::span<Value const * const> const outgoing ) override
    {
        BOOST_ASSERT( !staged() );
        BOOST_ASSERT( outgoing.size() <= max_outgoing_values );
        try
        {
            for ( auto const p_value : outgoing )
                outgoing_.push_back( fn_( *p_value ) );
            if ( incoming )
            {
                incoming_.emplace( fn_( *incoming ) );
                // a taken key is fine only if it is being vacated by one of
                // the outgoing values
                if ( map_.count( *incoming_ ) && !is_outgoing( *incoming_ ) )
                {
                    rollback();
                    return false;
                }
            }
        }
        catch ( ... )
        {
            rollback();
            throw;
        }
        return true;
    }

    void apply( PrimaryKey const & incoming_primary ) override
    {
        BOOST_ASSERT( incoming_ && !inserted_ && !displaced_ );
        auto const pos{ map_.find( *incoming_ ) };
        if ( pos != map_.end() )
        {
            PrimaryKey replacement{ incoming_primary };
            displaced_.emplace( std::move( pos->second ) );
            pos->second = std::move( replacement );
        }
        else
        {
            map_.emplace( *incoming_, incoming_primary );
            inserted_ = true;
        }
    }

    void rollback() noexcept override
    {
        if ( inserted_ )
        {
            map_.erase( *incoming_ );
        }
        else
        if ( displaced_ )
        {
            auto const pos{ map_.find( *incoming_ ) };
            BOOST_ASSERT( pos != map_.end() );
            pos->second = std::move( *displaced_ );
        }
        reset();
    }

    void finalize() noexcept override
    {
        for ( auto const & key : outgoing_ )
        {
            if ( !incoming_ || !( key == *incoming_ ) )
            {
                [[ maybe_unused ]] auto const erased{ map_.erase( key ) };
                BOOST_ASSERT_MSG( erased == 1, "Secondary index out of sync with the primary store" );
            }
        }
        reset();
    }

private:
    bool staged() const noexcept { return incoming_ || !outgoing_.empty(); }

    bool is_outgoing( SecondaryKey const & key ) const noexcept
    {
        for ( auto const & outgoing_key : outgoing_ )
            if ( outgoing_key == key )
                return true;
        return false;
    }

    void reset() noexcept
    {
        incoming_ .reset();
        displaced_.reset();
        outgoing_ .clear();
        inserted_ = false;
    }

private:
    key_function fn_;
    map_type     map_;

    // staged update
    boost::optional<SecondaryKey>                                        incoming_;
    boost::container::static_vector<SecondaryKey, max_outgoing_values>  outgoing_;
    boost::optional<PrimaryKey>                                          displaced_;
    bool                                                                 inserted_{ false };
}; // class eager_index


////////////////////////////////////////////////////////////////////////////////
// \class lazy_index_base
//
// Only the key function is kept; lookups scan the primary store.
////////////////////////////////////////////////////////////////////////////////

template <typename Value>
class lazy_index_base
{
public:
    virtual ~lazy_index_base() = default;

    [[nodiscard]] virtual std::unique_ptr<lazy_index_base> clone() const = 0;

    [[nodiscard]] virtual std::type_info const & key_type_info() const noexcept = 0;

protected:
    lazy_index_base() = default;
    lazy_index_base( lazy_index_base const & ) = default;
    lazy_index_base & operator=( lazy_index_base const & ) = delete;
}; // class lazy_index_base


template <typename Value, typename SecondaryKey>
class lazy_index final : public lazy_index_base<Value>
{
public:
    using key_type     = SecondaryKey;
    using key_function = std::function<SecondaryKey( Value const & )>;

    explicit lazy_index( key_function fn ) noexcept : fn_{ std::move( fn ) } {}

    [[nodiscard]] bool matches( Value const & value, SecondaryKey const & key ) const { return fn_( value ) == key; }

    std::unique_ptr<lazy_index_base<Value>> clone() const override { return std::make_unique<lazy_index>( *this ); }

    std::type_info const & key_type_info() const noexcept override { return typeid( SecondaryKey ); }

private:
    key_function fn_;
}; // class lazy_index

//------------------------------------------------------------------------------
} // namespace detail
//------------------------------------------------------------------------------
} // namespace psi::idx
//------------------------------------------------------------------------------
