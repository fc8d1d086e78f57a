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

#include "PidFile.hpp"

#include <cerrno>
#include <fstream>
#include <utility>
#include <signal.h>
#include <syslog.h>

PidFile::PidFile( std::filesystem::path path )
  : m_path( std::move( path ) )
{
}

std::optional< pid_t > PidFile::readPid() const
{
  std::ifstream file( m_path );
  if ( not file.is_open() )
    return std::nullopt;

  pid_t pid = 0;
  file >> pid;
  if ( file.fail() or pid <= 0 )
    return std::nullopt;

  return pid;
}

std::optional< pid_t > PidFile::runningOwner() const
{
  const auto pid = readPid();
  if ( not pid )
    return std::nullopt;

  // EPERM: alive, owned by another user
  if ( ::kill( *pid, 0 ) == 0 or errno == EPERM )
    return pid;

  return std::nullopt;
}

bool PidFile::write( pid_t pid )
{
  std::ofstream file( m_path, std::ios::trunc );
  if ( not file.is_open() )
  {
    syslog( LOG_WARNING, "[PidFile] Failed to write %s", m_path.c_str() );
    return false;
  }

  file << pid << '\n';
  file.flush();
  if ( file.fail() )
  {
    syslog( LOG_WARNING, "[PidFile] Failed to write %s", m_path.c_str() );
    return false;
  }

  syslog( LOG_INFO, "[PidFile] %s written (pid=%d)", m_path.c_str(), static_cast< int >( pid ) );
  return true;
}

void PidFile::remove() noexcept
{
  std::error_code ec;
  std::filesystem::remove( m_path, ec );
  if ( ec )
    syslog( LOG_WARNING, "[PidFile] Failed to remove %s: %s", m_path.c_str(), ec.message().c_str() );
}
