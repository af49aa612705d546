#include "person.hpp"

#include <psi/idx/collection.hpp>
#include <psi/idx/log.hpp>

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include <gtest/gtest.h>

#include <memory>
#include <sstream>
#include <string>
#include <string_view>
//------------------------------------------------------------------------------
namespace psi::idx
{
//------------------------------------------------------------------------------

using namespace test;

// must run before anything else in this process touches psi::idx::logger()
TEST( logging, uses_logger_registered_by_host )
{
    static std::ostringstream captured; // outlives the logger
    auto const host_logger{ std::make_shared<spdlog::logger>( logger_name, std::make_shared<spdlog::sinks::ostream_sink_mt>( captured ) ) };
    host_logger->set_pattern( "%l %v" );
    host_logger->set_level( spdlog::level::trace );
    spdlog::register_logger( host_logger );

    ASSERT_EQ( &logger(), host_logger.get() );

    auto c{ make_people() };
    c.create_index( "initial", &initial_of )
     .create_index( "age"    , &age_of, index_kind::lazy );
    (void)c.fetch( by( "age", 45 ) );
    EXPECT_THROW( c.put( person{ "Jack", 30 } ), duplicate_secondary_key );
    c.drop_index( "age" );

    host_logger->flush();
    auto const output{ captured.str() };
    EXPECT_NE( output.find( "debug created eager index 'initial' (3 entries)" ), std::string::npos ) << output;
    EXPECT_NE( output.find( "debug created lazy index 'age'"                  ), std::string::npos ) << output;
    EXPECT_NE( output.find( "trace lazy index 'age': match after scanning"    ), std::string::npos ) << output;
    EXPECT_NE( output.find( "secondary key taken in index 'initial'"          ), std::string::npos ) << output;
    EXPECT_NE( output.find( "debug dropped lazy index 'age'"                  ), std::string::npos ) << output;

    spdlog::drop( logger_name );
}

TEST( logging, set_log_level )
{
    auto const previous{ logger().level() };
    set_log_level( spdlog::level::debug );
    EXPECT_EQ( logger().level(), spdlog::level::debug );
    set_log_level( previous );
    EXPECT_EQ( logger().level(), previous );
}

TEST( logging, environment_levels_apply_to_own_logger_only )
{
    using spdlog::level::level_enum;
    auto const level{ []( std::string_view const levels ) { return detail::parse_log_level( levels ); } };

    EXPECT_TRUE ( level( "debug"                     ) == level_enum::debug );
    EXPECT_TRUE ( level( "warn,psi.idx=trace"        ) == level_enum::trace );
    EXPECT_TRUE ( level( "psi.idx=err,info"          ) == level_enum::err   );
    EXPECT_TRUE ( level( "psi.idx=off"               ) == level_enum::off   );
    EXPECT_TRUE ( level( "psi.idx=nonsense,info"     ) == level_enum::info  );
    EXPECT_FALSE( level( "host=debug,psi.idx.x=info" ) );
    EXPECT_FALSE( level( ""                          ) );
    EXPECT_FALSE( level( "loud"                      ) );
}

//------------------------------------------------------------------------------
} // namespace psi::idx
//------------------------------------------------------------------------------
