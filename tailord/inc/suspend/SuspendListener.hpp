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

#include "suspend/SuspendBroadcast.hpp"
#include <atomic>

/**
 * @brief Consumer side of the suspend broadcast
 *
 * Hardware loops own one listener each. While the system sleeps the loop
 * is held inside the listener so it does not touch the hardware until the
 * wake-up edge arrives. Once the channel closes the listener is Disabled and
 * suspend is no longer observed.
 */
class SuspendListener
{
public:
  enum class State
  {
    Active,                   // loop is doing its work
    WaitingForSuspendEvent,   // blocked in waitForSuspendCycle()
    SuspendedWaitingForWake,  // system is asleep, waiting for the wake edge
    Disabled                  // channel closed, suspend is ignored
  };

  explicit SuspendListener( SuspendBroadcast::Receiver receiver );

  SuspendListener( const SuspendListener & ) = delete;
  SuspendListener &operator=( const SuspendListener & ) = delete;

  /**
   * @brief Block until one suspend/resume cycle has completed
   *
   * Returns after the wake-up edge, or after a stray wake-up edge. When the
   * channel is closed the listener becomes Disabled and this call parks
   * until the broadcast is shut down.
   */
  void waitForSuspendCycle();

  /**
   * @brief Process queued sleep edges without waiting for new ones
   *
   * A queued going-to-sleep edge blocks the caller until the matching
   * wake-up edge.
   *
   * @return true if the system went through suspend since the last call,
   *         so the caller should re-apply its hardware state
   */
  bool checkSuspend();

  [[nodiscard]] State state() const noexcept { return m_state.load(); }

private:
  SuspendBroadcast::Receiver m_receiver;
  std::atomic< State > m_state { State::Active };

  /**
   * @return false if the channel closed before the wake-up edge
   */
  bool waitForWake();
  void disable();
};

const char *suspendStateToString( SuspendListener::State state ) noexcept;
