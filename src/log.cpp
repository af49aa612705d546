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
#include <psi/idx/log.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <memory>
#include <string>
//------------------------------------------------------------------------------
namespace psi::idx
{
//------------------------------------------------------------------------------

namespace
{
    std::shared_ptr<spdlog::logger> make_logger()
    {
        // the host application may have registered (and configured) its own
        if ( auto existing{ spdlog::get( logger_name ) } )
            return existing;

        auto new_logger{ spdlog::stderr_color_mt( logger_name ) };
        new_logger->set_level( spdlog::level::warn );
        if ( auto const env_levels{ std::getenv( "SPDLOG_LEVEL" ) } )
        {
            if ( auto const level{ detail::parse_log_level( env_levels ) } )
                new_logger->set_level( *level );
        }
        return new_logger;
    }
} // anonymous namespace

spdlog::logger & logger()
{
    static std::shared_ptr<spdlog::logger> const instance{ make_logger() };
    return *instance;
}

void set_log_level( spdlog::level::level_enum const level ) { logger().set_level( level ); }

namespace detail
{
    boost::optional<spdlog::level::level_enum> parse_log_level( std::string_view levels )
    {
        auto const parse{ []( std::string_view const name ) -> boost::optional<spdlog::level::level_enum> {
            auto const level{ spdlog::level::from_str( std::string{ name } ) };
            // from_str() maps unrecognized names to off
            if ( level == spdlog::level::off && name != "off" )
                return boost::none;
            return level;
        } };

        boost::optional<spdlog::level::level_enum> bare;
        boost::optional<spdlog::level::level_enum> named;
        while ( !levels.empty() )
        {
            auto const comma{ levels.find( ',' ) };
            auto const entry{ levels.substr( 0, comma ) };
            levels = ( comma == levels.npos ) ? std::string_view{} : levels.substr( comma + 1 );

            auto const equals{ entry.find( '=' ) };
            if ( equals == entry.npos )
            {
                if ( auto const level{ parse( entry ) } )
                    bare = level;
            }
            else
            if ( entry.substr( 0, equals ) == logger_name )
            {
                if ( auto const level{ parse( entry.substr( equals + 1 ) ) } )
                    named = level;
            }
        }
        return named ? named : bare;
    }
} // namespace detail

//------------------------------------------------------------------------------
} // namespace psi::idx
//------------------------------------------------------------------------------
