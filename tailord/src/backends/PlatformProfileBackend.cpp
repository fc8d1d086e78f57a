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

#include "backends/PlatformProfileBackend.hpp"
#include "SysfsNode.hpp"
#include "TailorLog.hpp"

#include <algorithm>
#include <sstream>
#include <syslog.h>

namespace fs = std::filesystem;

PlatformProfileBackend::PlatformProfileBackend( const std::vector< fs::path > &candidates )
{
  for ( const auto &directory : candidates )
  {
    if ( SysfsNode< std::string >( directory / "platform_profile" ).isAvailable() and
         SysfsNode< std::string >( directory / "platform_profile_choices" ).isAvailable() )
    {
      m_directory = directory;
      syslog( LOG_INFO, "[PlatformProfile] Using %s/platform_profile", directory.c_str() );
      return;
    }
  }

  syslog( LOG_INFO, "[PlatformProfile] No platform_profile support available" );
}

std::vector< std::string > PlatformProfileBackend::choices() const
{
  std::vector< std::string > result;
  if ( not m_directory )
    return result;

  const auto line = SysfsNode< std::string >( *m_directory / "platform_profile_choices" ).read();
  if ( not line )
    return result;

  std::istringstream iss( *line );
  std::string choice;
  while ( iss >> choice )
    result.push_back( choice );

  return result;
}

std::optional< std::string > PlatformProfileBackend::currentProfile() const
{
  if ( not m_directory )
    return std::nullopt;

  return SysfsNode< std::string >( *m_directory / "platform_profile" ).read();
}

bool PlatformProfileBackend::setPerformanceProfile( const std::string &name )
{
  if ( not m_directory )
    return false;

  const std::vector< std::string > available = choices();
  if ( std::find( available.begin(), available.end(), name ) == available.end() )
  {
    syslog( LOG_WARNING, "[PlatformProfile] Profile '%s' not available", name.c_str() );
    return false;
  }

  if ( currentProfile() == name )
  {
    tailor::tDebug( "[PlatformProfile] '%s' already set", name.c_str() );
    return true;
  }

  if ( not SysfsNode< std::string >( *m_directory / "platform_profile" ).write( name ) )
  {
    syslog( LOG_ERR, "[PlatformProfile] Failed to set platform profile '%s'", name.c_str() );
    return false;
  }

  syslog( LOG_INFO, "[PlatformProfile] Set platform profile to '%s'", name.c_str() );
  return true;
}
