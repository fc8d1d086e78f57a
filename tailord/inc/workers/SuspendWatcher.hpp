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

#include "DaemonWorker.hpp"
#include "suspend/SuspendBroadcast.hpp"
#include "suspend/SleepSignalSource.hpp"
#include <chrono>
#include <memory>

/**
 * @brief Publishes system sleep transitions to the suspend broadcast
 *
 * Each work cycle is one subscription attempt on the sleep signal source.
 * Failed or dropped subscriptions are retried after a delay; once the
 * attempt budget is used up the broadcast is closed so listeners stop
 * expecting suspend events, and the worker ends.
 */
class SuspendWatcher : public DaemonWorker
{
public:
  static constexpr int DEFAULT_MAX_ATTEMPTS = 3;
  static constexpr std::chrono::milliseconds DEFAULT_RETRY_DELAY { 10000 };

  SuspendWatcher( SuspendBroadcast &broadcast,
                  std::unique_ptr< SleepSignalSource > source,
                  int maxAttempts = DEFAULT_MAX_ATTEMPTS,
                  std::chrono::milliseconds retryDelay = DEFAULT_RETRY_DELAY );

  ~SuspendWatcher() override;

  [[nodiscard]] int attempts() const noexcept { return m_attempts.load(); }

protected:
  void onStart() override;
  void onWork() override;
  void onExit() override;
  void onStopRequested() override;

private:
  SuspendBroadcast &m_broadcast;
  std::unique_ptr< SleepSignalSource > m_source;
  const int m_maxAttempts;
  const std::chrono::milliseconds m_retryDelay;
  std::atomic< int > m_attempts { 0 };
};
