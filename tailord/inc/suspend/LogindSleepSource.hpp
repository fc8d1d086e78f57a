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

#include "suspend/SleepSignalSource.hpp"
#include <atomic>
#include <utility>
#include <QObject>

/**
 * @brief Receives the logind PrepareForSleep signal on the listening thread
 */
class LogindSleepReceiver : public QObject
{
  Q_OBJECT

public:
  explicit LogindSleepReceiver( SleepSignalSource::EventCallback onEvent, QObject *parent = nullptr )
    : QObject( parent ), m_onEvent( std::move( onEvent ) )
  {
  }

public slots:
  void prepareForSleep( bool goingToSleep );

private:
  SleepSignalSource::EventCallback m_onEvent;
};

/**
 * @brief org.freedesktop.login1.Manager PrepareForSleep over the system bus
 *
 * Every listen() opens its own named system bus connection so a lost
 * connection can be replaced without touching the daemon's main
 * connection, and runs a local event loop until interrupted or the bus
 * goes away.
 */
class LogindSleepSource : public SleepSignalSource
{
public:
  static constexpr const char *LOGIN1_SERVICE = "org.freedesktop.login1";
  static constexpr const char *LOGIN1_PATH = "/org/freedesktop/login1";
  static constexpr const char *LOGIN1_MANAGER_INTERFACE = "org.freedesktop.login1.Manager";

  LogindSleepSource() = default;

  bool listen( const EventCallback &onEvent, std::string &error ) override;
  void interrupt() override;

private:
  std::atomic< bool > m_interrupted { false };
  int m_connectionCounter = 0;
};
