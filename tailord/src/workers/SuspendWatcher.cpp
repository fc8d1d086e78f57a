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

#include "workers/SuspendWatcher.hpp"

#include <string>
#include <syslog.h>

SuspendWatcher::SuspendWatcher( SuspendBroadcast &broadcast,
                                std::unique_ptr< SleepSignalSource > source,
                                int maxAttempts,
                                std::chrono::milliseconds retryDelay )
  : DaemonWorker( std::chrono::milliseconds( 0 ) ),
    m_broadcast( broadcast ),
    m_source( std::move( source ) ),
    m_maxAttempts( maxAttempts < 1 ? 1 : maxAttempts ),
    m_retryDelay( retryDelay )
{
}

SuspendWatcher::~SuspendWatcher()
{
  stop();
}

void SuspendWatcher::onStart()
{
  m_attempts = 0;
}

void SuspendWatcher::onWork()
{
  const int attempt = ++m_attempts;
  syslog( LOG_INFO, "[Suspend] Setting up suspend service (attempt %d of %d)", attempt, m_maxAttempts );

  std::string error;
  const bool interrupted = m_source->listen( [ this ]( bool goingToSleep )
  {
    if ( not m_broadcast.send( goingToSleep ) )
      tailor::tDebug( "[Suspend] No listener for suspend message, dropped" );
  }, error );

  if ( interrupted or not isRunning() )
    return;

  syslog( LOG_ERR, "[Suspend] Failed to wait for suspend: %s", error.c_str() );

  if ( attempt < m_maxAttempts )
  {
    idleFor( m_retryDelay );
    return;
  }

  syslog( LOG_WARNING, "[Suspend] Stopping suspend service after %d errors", m_maxAttempts );
  m_broadcast.close();
  requestStop();
}

void SuspendWatcher::onExit()
{
  m_broadcast.close();
}

void SuspendWatcher::onStopRequested()
{
  m_source->interrupt();
}
