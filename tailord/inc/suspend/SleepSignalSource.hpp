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

#include <functional>
#include <string>

/**
 * @brief Source of PrepareForSleep edges
 *
 * listen() runs on the suspend watcher thread and blocks for as long as the
 * subscription is alive, calling onEvent for every edge.
 */
class SleepSignalSource
{
public:
  using EventCallback = std::function< void( bool goingToSleep ) >;

  virtual ~SleepSignalSource() = default;

  /**
   * @brief Subscribe and deliver events until the subscription ends
   * @param onEvent Called with true before sleep and false after wake-up
   * @param error Receives a description when false is returned
   * @return true if the subscription ended because of interrupt(), false
   *         if it could not be set up or the connection was lost
   */
  virtual bool listen( const EventCallback &onEvent, std::string &error ) = 0;

  /**
   * @brief Make a running or the next listen() call return, from any thread
   */
  virtual void interrupt() = 0;
};
