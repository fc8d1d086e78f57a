/*
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#pragma once

#include <atomic>
#include <cstdarg>
#include <syslog.h>

namespace tailor
{

namespace detail
{
inline std::atomic< bool > g_debugLogging { false };
}

/**
 * @brief Switch the LOG_DEBUG channel on or off (--debug)
 */
inline void setDebugLogging( bool enabled ) noexcept
{
  detail::g_debugLogging.store( enabled );
}

[[nodiscard]] inline bool debugLogging() noexcept
{
  return detail::g_debugLogging.load();
}

/**
 * @brief printf-style LOG_DEBUG message, dropped unless debug logging is on
 *
 * Used from the worker loops, which would flood syslog at the default level.
 */
__attribute__(( format( printf, 1, 2 ) ))
inline void tDebug( const char *fmt, ... )
{
  if ( not debugLogging() )
    return;

  va_list args;
  va_start( args, fmt );
  vsyslog( LOG_DEBUG, fmt, args );
  va_end( args );
}

} // namespace tailor
