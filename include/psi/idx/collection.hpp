////////////////////////////////////////////////////////////////////////////////
///
/// \file collection.hpp
/// --------------------
///
/// psi::idx::collection - a hash map of values keyed by a primary key derived
/// from each value, with any number of named secondary indices declared (and
/// dropped) at runtime.
///
/// Lookup paths:
///   - the primary key (a bare key, or primary_key<K>)
///   - an eager index: a materialized secondary key -> primary key map kept in
///     sync by every mutation (O(1) lookup, O(#indices) extra work per put/pop)
///   - a lazy index: only the key function is stored, lookups scan all values
///     (O(n) lookup, zero maintenance cost)
/// addressed uniformly through by( "index", key ) or full_key<PK, SK>.
///
/// Accessor pairs follow the std::map convention: at(), pop_at(), update(),
/// fast_update() and get_and_update_at() throw (key_not_found/unknown_index)
/// while fetch(), get(), pop() and get_and_update() report absence through
/// boost::optional or a caller supplied default.
///
/// Semantics:
///   - collection is a regular value type: copies are deep and independent,
///     mutations only ever affect the object they are invoked on.
///   - put() is an upsert; update() is an atomic pop + put so it may change
///     primary and secondary keys alike.
///   - eager indices are unique: a mutation or create_index() that would map
///     one secondary key to two values throws duplicate_secondary_key.
///   - every mutation either completes in full or leaves the collection
///     untouched (this includes exceptions thrown by key functions, which are
///     assumed to be pure).
///   - lazy index lookups return the first match in (unspecified) storage
///     order.
///   - iteration order is unspecified.
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

#include <psi/idx/detail/index.hpp>
#include <psi/idx/error.hpp>
#include <psi/idx/full_key.hpp>
#include <psi/idx/log.hpp>

#include <boost/assert.hpp>
#include <boost/container/static_vector.hpp>
#include <boost/container_hash/hash.hpp>
#include <boost/optional/optional.hpp>
#include <boost/stl_interfaces/iterator_interface.hpp>
#include <boost/unordered_map.hpp>

#include <algorithm>
#include <concepts>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <memory>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <variant>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::idx
{
//------------------------------------------------------------------------------

template
<
    typename Value,
    typename PrimaryKey,
    typename Hash     = boost::hash<PrimaryKey>,
    typename KeyEqual = std::equal_to<PrimaryKey>
>
class collection
{
public:
    //--------------------------------------------------------------------------
    // Member types
    //--------------------------------------------------------------------------
    using value_type       = Value;
    using key_type         = PrimaryKey;
    using hasher           = Hash;
    using key_equal        = KeyEqual;
    using size_type        = std::size_t;
    using difference_type  = std::ptrdiff_t;
    using const_reference  = Value const &;
    using map_type         = boost::unordered_map<PrimaryKey, Value, Hash, KeyEqual>;
    using primary_function = std::function<PrimaryKey( Value const & )>;

    /// (result, replacement) returned by get_and_update() callbacks: an empty
    /// replacement removes the value.
    template <typename Result>
    using update_step = std::pair<Result, boost::optional<Value>>;

private:
    using eager_base = detail::eager_index_base<Value, PrimaryKey>;
    using lazy_base  = detail::lazy_index_base <Value>;
    template <typename SecondaryKey> using eager_index = detail::eager_index<Value, PrimaryKey, SecondaryKey>;
    template <typename SecondaryKey> using lazy_index  = detail::lazy_index <Value, SecondaryKey>;

    using eager_registry = boost::unordered_map<std::string, std::unique_ptr<eager_base>>;
    using lazy_registry  = boost::unordered_map<std::string, std::unique_ptr<lazy_base >>;

    using outgoing_values = boost::container::static_vector<Value const *, detail::max_outgoing_values>;

    template <typename Iterator, typename Tag>
    using iter_impl = boost::stl_interfaces::iterator_interface
    <
#   if !BOOST_STL_INTERFACES_USE_DEDUCED_THIS
        Iterator,
#   endif
        Tag,
        Value,
        Value const &,
        Value const *
    >;

public:
    //--------------------------------------------------------------------------
    // Iterator (over values, in storage order)
    //--------------------------------------------------------------------------
    class const_iterator : public iter_impl<const_iterator, std::forward_iterator_tag>
    {
    private:
        using base_type = iter_impl<const_iterator, std::forward_iterator_tag>;

    public:
        const_iterator() = default;

        Value const & operator*() const noexcept { return pos_->second; }

        const_iterator & operator++() noexcept { ++pos_; return *this; }
        using base_type::operator++;

        friend bool operator==( const_iterator const & left, const_iterator const & right ) noexcept { return left.pos_ == right.pos_; }

    private:
        friend class collection;

        explicit const_iterator( typename map_type::const_iterator const pos ) noexcept : pos_{ pos } {}

        typename map_type::const_iterator pos_;
    }; // class const_iterator

    using iterator = const_iterator;

    //--------------------------------------------------------------------------
    // Construction
    //--------------------------------------------------------------------------
    explicit collection( primary_function primary )
        : primary_fn_{ std::move( primary ) }
    {
        BOOST_ASSERT_MSG( primary_fn_, "A primary key function is required" );
    }

    // later values replace earlier ones with the same primary key
    template <std::ranges::input_range R>
    requires std::constructible_from<Value, std::ranges::range_reference_t<R>>
    collection( R && values, primary_function primary )
        : collection( std::move( primary ) )
    {
        if constexpr ( std::ranges::sized_range<R> )
            primary_.reserve( static_cast<size_type>( std::ranges::size( values ) ) );
        for ( auto && value : values )
            put( Value( std::forward<decltype( value )>( value ) ) );
    }

    collection( std::initializer_list<Value> const values, primary_function primary )
        : collection( std::ranges::subrange( values.begin(), values.end() ), std::move( primary ) ) {}

    collection( collection const & other )
        :
        primary_fn_{ other.primary_fn_ },
        primary_   { other.primary_    },
        eager_     { clone_all( other.eager_ ) },
        lazy_      { clone_all( other.lazy_  ) }
    {}

    collection( collection && ) = default;

    collection & operator=( collection const & other )
    {
        collection copy{ other };
        swap( copy );
        return *this;
    }

    collection & operator=( collection && ) = default;

    ~collection() = default;

    //--------------------------------------------------------------------------
    // Iterators & capacity
    //--------------------------------------------------------------------------
    const_iterator begin() const noexcept { return const_iterator{ primary_.begin() }; }
    const_iterator end  () const noexcept { return const_iterator{ primary_.end  () }; }

    [[nodiscard]] bool      empty() const noexcept { return primary_.empty(); }
    [[nodiscard]] size_type size () const noexcept { return primary_.size (); }

    void reserve( size_type const values ) { primary_.reserve( values ); }

    //--------------------------------------------------------------------------
    // Index management
    //--------------------------------------------------------------------------

    /// Adds the index 'name' keyed by key_fn( value ). An eager index is
    /// materialized immediately (O(n)); a lazy one only stores key_fn.
    /// Throws index_already_exists if the name is taken (by an index of
    /// either kind) and duplicate_secondary_key if an eager index would map
    /// one key to more than one of the current values.
    template <typename KeyFunction>
    requires std::invocable<KeyFunction &, Value const &>
    collection & create_index( std::string name, KeyFunction && key_fn, index_kind const kind = index_kind::eager )
    {
        using secondary_key_t = detail::normalized_key_t<std::invoke_result_t<KeyFunction &, Value const &>>;

        if ( has_index( name ) )
            detail::throw_index_already_exists( name );

        std::function<secondary_key_t( Value const & )> fn;
        if constexpr ( std::is_same_v<std::remove_cvref_t<std::invoke_result_t<KeyFunction &, Value const &>>, secondary_key_t> )
            fn = std::forward<KeyFunction>( key_fn );
        else
            fn = [key_fn = std::forward<KeyFunction>( key_fn )]( Value const & value ) { return secondary_key_t( std::invoke( key_fn, value ) ); };

        if ( kind == index_kind::eager )
        {
            auto index{ std::make_unique<eager_index<secondary_key_t>>( std::move( fn ) ) };
            if ( !index->build( primary_ ) )
            {
                logger().debug( "create_index('{}'): secondary key collision among {} values", name, size() );
                detail::throw_duplicate_secondary_key( name );
            }
            logger().debug( "created eager index '{}' ({} entries)", name, index->size() );
            eager_.emplace( std::move( name ), std::move( index ) );
        }
        else
        {
            logger().debug( "created lazy index '{}'", name );
            lazy_.emplace( std::move( name ), std::make_unique<lazy_index<secondary_key_t>>( std::move( fn ) ) );
        }
        return *this;
    }

    collection & drop_index( std::string const & name )
    {
        if ( eager_.erase( name ) )
            logger().debug( "dropped eager index '{}'", name );
        else
        if ( lazy_.erase( name ) )
            logger().debug( "dropped lazy index '{}'", name );
        else
            detail::throw_unknown_index( name );
        return *this;
    }

    [[nodiscard]] bool has_index( std::string const & name ) const { return eager_.count( name ) || lazy_.count( name ); }

    [[nodiscard]] boost::optional<index_kind> kind_of( std::string const & name ) const
    {
        if ( eager_.count( name ) ) return index_kind::eager;
        if ( lazy_ .count( name ) ) return index_kind::lazy;
        return boost::none;
    }

    /// sorted
    [[nodiscard]] std::vector<std::string> index_names( index_kind const kind ) const
    {
        std::vector<std::string> names;
        auto const collect{ [&]( auto const & registry ) {
            names.reserve( registry.size() );
            for ( auto const & entry : registry )
                names.push_back( entry.first );
        } };
        if ( kind == index_kind::eager ) collect( eager_ );
        else                             collect( lazy_  );
        std::ranges::sort( names );
        return names;
    }

    [[nodiscard]] size_type index_count() const noexcept { return eager_.size() + lazy_.size(); }

    //--------------------------------------------------------------------------
    // Lookup
    //--------------------------------------------------------------------------
    template <addressing_key<PrimaryKey> Key>
    [[nodiscard]] boost::optional<Value const &> fetch( Key const & key ) const
    {
        auto const pos{ find_entry( *this, key ) };
        if ( pos == primary_.end() )
            return boost::none;
        return pos->second;
    }

    template <addressing_key<PrimaryKey> Key>
    [[nodiscard]] Value const & at( Key const & key ) const { return find_entry_or_throw( *this, key )->second; }

    template <addressing_key<PrimaryKey> Key>
    [[nodiscard]] Value get( Key const & key, Value default_value ) const
    {
        if ( auto const found{ fetch( key ) } )
            return *found;
        return default_value;
    }

    /// True if an equal value is stored under primary_fn( value ).
    [[nodiscard]] bool contains( Value const & value ) const
    {
        auto const pos{ primary_.find( primary_fn_( value ) ) };
        return ( pos != primary_.end() ) && ( pos->second == value );
    }

    /// Translates a secondary key into a primary key without touching the
    /// value. Only eager indices can do this (lazy_index_unsupported).
    template <typename SecondaryKey>
    [[nodiscard]] boost::optional<PrimaryKey const &> primary_key( secondary_key<SecondaryKey> const & key ) const
    {
        auto const eager{ eager_.find( key.index ) };
        if ( eager == eager_.end() )
        {
            if ( lazy_.count( key.index ) )
                detail::throw_lazy_index_unsupported( key.index, "primary_key()" );
            detail::throw_unknown_index( key.index );
        }
        if ( auto const p_primary{ typed<eager_index<SecondaryKey>>( *eager->second, key.index ).find( key.key ) } )
            return *p_primary;
        return boost::none;
    }

    template <typename SecondaryKey>
    [[nodiscard]] boost::optional<PrimaryKey const &> primary_key( std::string_view const index, SecondaryKey && key ) const
    {
        return primary_key( by( index, std::forward<SecondaryKey>( key ) ) );
    }

    //--------------------------------------------------------------------------
    // Modifiers
    //--------------------------------------------------------------------------

    /// Inserts 'value', replacing (and unindexing) any value stored under the
    /// same primary key.
    collection & put( Value value )
    {
        replace( nullptr, std::move( value ) );
        return *this;
    }

    template <addressing_key<PrimaryKey> Key>
    Value pop_at( Key const & key )
    {
        return remove( find_entry_or_throw( *this, key ) );
    }

    template <addressing_key<PrimaryKey> Key>
    boost::optional<Value> pop( Key const & key )
    {
        auto const pos{ find_entry( *this, key ) };
        if ( pos == primary_.end() )
            return boost::none;
        return remove( pos );
    }

    template <addressing_key<PrimaryKey> Key>
    Value pop( Key const & key, Value default_value )
    {
        auto const pos{ find_entry( *this, key ) };
        if ( pos == primary_.end() )
            return default_value;
        return remove( pos );
    }

    /// Replaces the addressed value with transform( value ). Any key (primary
    /// or secondary) may change.
    template <addressing_key<PrimaryKey> Key, typename Transform>
    requires std::invocable<Transform &, Value const &>
    collection & update( Key const & key, Transform && transform )
    {
        auto const pos{ find_entry_or_throw( *this, key ) };
        Value updated( std::invoke( transform, std::as_const( pos->second ) ) );
        replace( &pos->first, std::move( updated ) );
        return *this;
    }

    /// update() that bypasses index maintenance: 'transform' must not change
    /// any key observed by the primary function or by any index (only the
    /// primary key is verified, and only in debug builds).
    template <addressing_key<PrimaryKey> Key, typename Transform>
    requires std::invocable<Transform &, Value const &>
    collection & fast_update( Key const & key, Transform && transform )
    {
        auto const pos{ find_entry_or_throw( *this, key ) };
        Value updated( std::invoke( transform, std::as_const( pos->second ) ) );
        BOOST_ASSERT_MSG( key_equal{}( primary_fn_( std::as_const( updated ) ), pos->first ), "fast_update() changed the primary key" );
        pos->second = std::move( updated );
        return *this;
    }

    /// fn( value ) -> update_step<R>: the value is replaced (as by update())
    /// or, if the returned replacement is empty, removed. Returns R.
    template <addressing_key<PrimaryKey> Key, typename Function>
    requires std::invocable<Function &, Value const &>
    auto get_and_update_at( Key const & key, Function && fn )
    {
        auto const pos{ find_entry_or_throw( *this, key ) };
        auto step{ std::invoke( fn, std::as_const( pos->second ) ) };
        if ( step.second )
            replace( &pos->first, std::move( *step.second ) );
        else
            remove( pos );
        return std::move( step.first );
    }

    /// As get_and_update_at() but fn receives boost::none for an absent key
    /// (in which case a returned replacement is inserted).
    template <addressing_key<PrimaryKey> Key, typename Function>
    requires std::invocable<Function &, boost::optional<Value const &>>
    auto get_and_update( Key const & key, Function && fn )
    {
        auto const pos{ find_entry( *this, key ) };
        if ( pos == primary_.end() )
        {
            auto step{ std::invoke( fn, boost::optional<Value const &>{} ) };
            if ( step.second )
                put( std::move( *step.second ) );
            return std::move( step.first );
        }

        auto step{ std::invoke( fn, boost::optional<Value const &>{ pos->second } ) };
        if ( step.second )
            replace( &pos->first, std::move( *step.second ) );
        else
            remove( pos );
        return std::move( step.first );
    }

    void swap( collection & other ) noexcept
    {
        using std::swap;
        swap( primary_fn_, other.primary_fn_ );
        swap( primary_   , other.primary_    );
        swap( eager_     , other.eager_      );
        swap( lazy_      , other.lazy_       );
    }

    friend void swap( collection & left, collection & right ) noexcept { left.swap( right ); }

    //--------------------------------------------------------------------------
    // Snapshots
    //--------------------------------------------------------------------------
    [[nodiscard]] std::vector<Value> to_list() const
    {
        std::vector<Value> values;
        values.reserve( size() );
        for ( auto const & entry : primary_ )
            values.push_back( entry.second );
        return values;
    }

    [[nodiscard]] map_type to_map() const { return primary_; }

private:
    //--------------------------------------------------------------------------
    // Key resolution
    //--------------------------------------------------------------------------
    enum class resolve_status : std::uint8_t { found, not_found, unknown_index };

    struct resolution
    {
        PrimaryKey  const * key  { nullptr };
        resolve_status      status{ resolve_status::not_found };
        std::string const * index{ nullptr }; // for diagnostics (null for primary keys)
    };

    // the existence of a bare primary key is left for the store lookup to check
    resolution resolve( PrimaryKey const & key ) const noexcept { return { &key, resolve_status::found, nullptr }; }

    resolution resolve( psi::idx::primary_key<PrimaryKey> const & key ) const noexcept { return resolve( key.key ); }

    template <typename SecondaryKey>
    resolution resolve( secondary_key<SecondaryKey> const & key ) const
    {
        if ( auto const eager{ eager_.find( key.index ) }; eager != eager_.end() )
        {
            auto const p_primary{ typed<eager_index<SecondaryKey>>( *eager->second, key.index ).find( key.key ) };
            return { p_primary, p_primary ? resolve_status::found : resolve_status::not_found, &key.index };
        }

        if ( auto const lazy{ lazy_.find( key.index ) }; lazy != lazy_.end() )
        {
            auto const & index{ typed<lazy_index<SecondaryKey>>( *lazy->second, key.index ) };
            size_type scanned{ 0 };
            for ( auto const & [primary, value] : primary_ )
            {
                ++scanned;
                if ( index.matches( value, key.key ) )
                {
                    logger().trace( "lazy index '{}': match after scanning {}/{} values", key.index, scanned, size() );
                    return { &primary, resolve_status::found, &key.index };
                }
            }
            logger().trace( "lazy index '{}': no match among {} values", key.index, scanned );
            return { nullptr, resolve_status::not_found, &key.index };
        }

        return { nullptr, resolve_status::unknown_index, &key.index };
    }

    template <typename SecondaryKey>
    resolution resolve( full_key<PrimaryKey, SecondaryKey> const & key ) const
    {
        return std::visit( [this]( auto const & alternative ) { return resolve( alternative ); }, key );
    }

    // Keys that are merely convertible into a PrimaryKey are converted here,
    // once, into a temporary that the caller binds to a const reference (for
    // the resolution to point into).
    template <typename Key>
    static decltype( auto ) lookup_form( Key const & key )
    {
        if constexpr
        (
            std::is_same_v<Key, PrimaryKey>    ||
            detail::is_primary_key  <Key>::value ||
            detail::is_secondary_key<Key>::value ||
            detail::is_full_key     <Key>::value
        )
            return ( key );
        else
            return PrimaryKey( key );
    }

    // non-strict: absent and unknown-index both map to end()
    template <typename Self, typename Key>
    static auto find_entry( Self & self, Key const & key )
    {
        auto const & lookup  { lookup_form( key ) };
        auto const   resolved{ self.resolve( lookup ) };
        if ( resolved.status != resolve_status::found )
            return self.primary_.end();
        return self.primary_.find( *resolved.key );
    }

    template <typename Self, typename Key>
    static auto find_entry_or_throw( Self & self, Key const & key )
    {
        auto const & lookup  { lookup_form( key ) };
        auto const   resolved{ self.resolve( lookup ) };
        if ( resolved.status == resolve_status::unknown_index )
            detail::throw_unknown_index( *resolved.index );
        if ( resolved.status == resolve_status::found )
        {
            auto const pos{ self.primary_.find( *resolved.key ) };
            if ( pos != self.primary_.end() )
                return pos;
        }
        if ( resolved.index )
            detail::throw_key_not_found( *resolved.index );
        detail::throw_key_not_found();
    }

    template <typename Index, typename Base>
    static Index const & typed( Base const & index, std::string const & name )
    {
        if ( auto const p_typed{ dynamic_cast<Index const *>( &index ) } )
            return *p_typed;
        detail::throw_index_key_type_mismatch( name, index.key_type_info().name(), typeid( typename Index::key_type ).name() );
    }

    //--------------------------------------------------------------------------
    // Mutation engine
    //--------------------------------------------------------------------------

    // Stores 'incoming' in place of the value under 'vacated_key' (if any) and
    // of the value already stored under primary_fn( incoming ) (if any),
    // moving every eager index along. Strong exception guarantee.
    void replace( PrimaryKey const * const vacated_key, Value incoming )
    {
        auto incoming_key{ primary_fn_( std::as_const( incoming ) ) };

        // node addresses survive a rehash but iterators do not: make sure the
        // emplace below cannot rehash before looking anything up
        primary_.reserve( primary_.size() + 1 );
        auto const end     { primary_.end() };
        auto const vacated { vacated_key ? primary_.find( *vacated_key ) : end };
        auto const occupied{ primary_.find( incoming_key ) };
        BOOST_ASSERT( !vacated_key || vacated != end );

        outgoing_values outgoing;
        if ( vacated != end )
            outgoing.push_back( &vacated->second );
        if ( occupied != end && occupied != vacated )
            outgoing.push_back( &occupied->second );

        stage_all( &incoming, { outgoing.data(), outgoing.size() } );
        apply_all( incoming_key );
        if ( occupied != end )
        {
            try { occupied->second = std::move( incoming ); }
            catch ( ... ) { rollback_all(); throw; }
        }
        else
        {
            try { primary_.emplace( std::move( incoming_key ), std::move( incoming ) ); }
            catch ( ... ) { rollback_all(); throw; }
        }
        finalize_all();

        if ( vacated != end && vacated != occupied )
            primary_.erase( vacated );

        BOOST_ASSERT( indices_in_sync() );
    }

    Value remove( typename map_type::iterator const pos )
    {
        Value const * const outgoing[]{ &pos->second };
        stage_all( nullptr, outgoing );
        auto removed{ [&] {
            try { return Value( std::move( pos->second ) ); }
            catch ( ... ) { rollback_all(); throw; }
        }() };
        primary_.erase( pos );
        finalize_all();
        BOOST_ASSERT( indices_in_sync() );
        return removed;
    }

    void stage_all( Value const * const incoming, std::span<Value const * const> const outgoing )
    {
        auto staged{ eager_.begin() };
        try
        {
            for ( ; staged != eager_.end(); ++staged )
            {
                if ( !staged->second->stage( incoming, outgoing ) )
                {
                    logger().debug( "rejected value: secondary key taken in index '{}'", staged->first );
                    detail::throw_duplicate_secondary_key( staged->first );
                }
            }
        }
        catch ( ... )
        {
            // the failing index has already discarded its own staged state
            for ( auto pos{ eager_.begin() }; pos != staged; ++pos )
                pos->second->rollback();
            throw;
        }
    }

    void apply_all( PrimaryKey const & incoming_key )
    {
        try
        {
            for ( auto & entry : eager_ )
                entry.second->apply( incoming_key );
        }
        catch ( ... )
        {
            rollback_all();
            throw;
        }
    }

    void rollback_all() noexcept { for ( auto & entry : eager_ ) entry.second->rollback(); }
    void finalize_all() noexcept { for ( auto & entry : eager_ ) entry.second->finalize(); }

    bool indices_in_sync() const noexcept
    {
        return std::all_of( eager_.begin(), eager_.end(), [this]( auto const & entry ) { return entry.second->size() == size(); } );
    }

    template <typename Registry>
    static Registry clone_all( Registry const & source )
    {
        Registry copy;
        copy.reserve( source.size() );
        for ( auto const & [name, index] : source )
            copy.emplace( name, index->clone() );
        return copy;
    }

private:
    primary_function primary_fn_;
    map_type         primary_;
    eager_registry   eager_;
    lazy_registry    lazy_;
}; // class collection

//------------------------------------------------------------------------------
} // namespace psi::idx
//------------------------------------------------------------------------------
