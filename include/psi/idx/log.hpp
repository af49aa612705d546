////////////////////////////////////////////////////////////////////////////////
///
/// \file log.hpp
/// -------------
///
/// The library's spdlog logger ("psi.idx"). Created on first use, writes to
/// stderr and starts at the warn level (SPDLOG_LEVEL=psi.idx=debug overrides
/// it) so a default configured collection produces no output. Only the
/// psi.idx entry (or the bare default level) of SPDLOG_LEVEL is applied, other
/// loggers of the host application are left alone.
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

#include <boost/optional/optional.hpp>

#include <spdlog/spdlog.h>

#include <string_view>
//------------------------------------------------------------------------------
namespace psi::idx
{
//------------------------------------------------------------------------------

inline constexpr char logger_name[]{ "psi.idx" };

spdlog::logger & logger();

void set_log_level( spdlog::level::level_enum level );

namespace detail
{
    // level for the psi.idx logger from an SPDLOG_LEVEL style list, e.g.
    // "warn,psi.idx=trace"; a named entry takes precedence over a bare level
    boost::optional<spdlog::level::level_enum> parse_log_level( std::string_view levels );
} // namespace detail

//------------------------------------------------------------------------------
} // namespace psi::idx
//------------------------------------------------------------------------------
