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

#include "suspend/LogindSleepSource.hpp"
#include "TailorLog.hpp"

#include <QDBusConnection>
#include <QDBusError>
#include <QEventLoop>
#include <QTimer>
#include <syslog.h>

namespace
{
// how often the local loop checks for interrupt() and a dropped bus
constexpr int WATCHDOG_INTERVAL_MS = 250;
}

void LogindSleepReceiver::prepareForSleep( bool goingToSleep )
{
  syslog( LOG_WARNING, "[Suspend] Received suspend message (%s)", goingToSleep ? "true" : "false" );

  if ( goingToSleep )
    syslog( LOG_INFO, "[Suspend] Suspended, sleeping until wake up" );
  else
    syslog( LOG_INFO, "[Suspend] Woken up, continue service" );

  if ( m_onEvent )
    m_onEvent( goingToSleep );
}

bool LogindSleepSource::listen( const EventCallback &onEvent, std::string &error )
{
  if ( m_interrupted.load() )
    return true;

  const QString connectionName = QStringLiteral( "tailord-sleep-%1" ).arg( ++m_connectionCounter );
  bool result = false;

  {
    QDBusConnection bus = QDBusConnection::connectToBus( QDBusConnection::SystemBus, connectionName );
    if ( not bus.isConnected() )
    {
      error = "cannot connect to system bus: " + bus.lastError().message().toStdString();
    }
    else
    {
      LogindSleepReceiver receiver( onEvent );

      if ( not bus.connect( LOGIN1_SERVICE, LOGIN1_PATH, LOGIN1_MANAGER_INTERFACE, "PrepareForSleep",
                            &receiver, SLOT( prepareForSleep( bool ) ) ) )
      {
        error = "cannot subscribe to PrepareForSleep: " + bus.lastError().message().toStdString();
      }
      else
      {
        tailor::tDebug( "[Suspend] Subscribed to PrepareForSleep on %s", qPrintable( connectionName ) );

        QEventLoop loop;
        QTimer watchdog;
        watchdog.setInterval( WATCHDOG_INTERVAL_MS );
        QObject::connect( &watchdog, &QTimer::timeout, &loop, [ & ]()
        {
          if ( m_interrupted.load() or not bus.isConnected() )
            loop.quit();
        } );
        watchdog.start();
        loop.exec();
        watchdog.stop();

        bus.disconnect( LOGIN1_SERVICE, LOGIN1_PATH, LOGIN1_MANAGER_INTERFACE, "PrepareForSleep",
                        &receiver, SLOT( prepareForSleep( bool ) ) );

        if ( m_interrupted.load() )
          result = true;
        else
          error = "system bus connection lost";
      }
    }
  }

  QDBusConnection::disconnectFromBus( connectionName );
  return result;
}

void LogindSleepSource::interrupt()
{
  m_interrupted = true;
}
