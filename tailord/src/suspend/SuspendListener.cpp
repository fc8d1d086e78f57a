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

#include "suspend/SuspendListener.hpp"

#include <utility>
#include <syslog.h>

const char *suspendStateToString( SuspendListener::State state ) noexcept
{
  switch ( state )
  {
    case SuspendListener::State::Active:
      return "active";
    case SuspendListener::State::WaitingForSuspendEvent:
      return "waiting for suspend";
    case SuspendListener::State::SuspendedWaitingForWake:
      return "suspended";
    case SuspendListener::State::Disabled:
      return "disabled";
  }

  return "unknown";
}

SuspendListener::SuspendListener( SuspendBroadcast::Receiver receiver )
  : m_receiver( std::move( receiver ) )
{
}

void SuspendListener::waitForSuspendCycle()
{
  if ( m_state == State::Disabled )
  {
    m_receiver.waitForShutdown();
    return;
  }

  m_state = State::WaitingForSuspendEvent;

  for ( ;; )
  {
    bool goingToSleep = false;
    switch ( m_receiver.recv( goingToSleep ) )
    {
      case SuspendBroadcast::RecvStatus::Ok:
        if ( not goingToSleep )
        {
          syslog( LOG_WARNING, "[Suspend] Wake up message without suspend" );
          m_state = State::Active;
          return;
        }

        syslog( LOG_WARNING, "[Suspend] We are suspended, waiting for wake up" );
        if ( not waitForWake() )
        {
          disable();
          m_receiver.waitForShutdown();
          return;
        }

        m_state = State::Active;
        return;

      case SuspendBroadcast::RecvStatus::Lagged:
        syslog( LOG_WARNING, "[Suspend] Missed %llu suspend message(s)",
                static_cast< unsigned long long >( m_receiver.missed() ) );
        break;

      case SuspendBroadcast::RecvStatus::Empty:
        break;

      case SuspendBroadcast::RecvStatus::Closed:
        disable();
        m_receiver.waitForShutdown();
        return;
    }
  }
}

bool SuspendListener::checkSuspend()
{
  if ( m_state == State::Disabled )
    return false;

  bool resumed = false;

  for ( ;; )
  {
    bool goingToSleep = false;
    switch ( m_receiver.tryRecv( goingToSleep ) )
    {
      case SuspendBroadcast::RecvStatus::Empty:
        m_state = State::Active;
        return resumed;

      case SuspendBroadcast::RecvStatus::Ok:
        if ( not goingToSleep )
        {
          syslog( LOG_WARNING, "[Suspend] Wake up message without suspend" );
          break;
        }

        syslog( LOG_WARNING, "[Suspend] We are suspended, waiting for wake up" );
        if ( not waitForWake() )
        {
          disable();
          return true;
        }

        resumed = true;
        break;

      case SuspendBroadcast::RecvStatus::Lagged:
        syslog( LOG_WARNING, "[Suspend] Missed %llu suspend message(s)",
                static_cast< unsigned long long >( m_receiver.missed() ) );
        break;

      case SuspendBroadcast::RecvStatus::Closed:
        disable();
        return resumed;
    }
  }
}

bool SuspendListener::waitForWake()
{
  m_state = State::SuspendedWaitingForWake;

  for ( ;; )
  {
    bool goingToSleep = false;
    switch ( m_receiver.recv( goingToSleep ) )
    {
      case SuspendBroadcast::RecvStatus::Ok:
        if ( goingToSleep )
        {
          syslog( LOG_WARNING, "[Suspend] Suspend message while already suspended" );
          break;
        }

        syslog( LOG_INFO, "[Suspend] Woken up, continuing" );
        return true;

      case SuspendBroadcast::RecvStatus::Lagged:
        syslog( LOG_ERR, "[Suspend] Error receiving wake-up message: missed %llu message(s)",
                static_cast< unsigned long long >( m_receiver.missed() ) );
        break;

      case SuspendBroadcast::RecvStatus::Empty:
        break;

      case SuspendBroadcast::RecvStatus::Closed:
        return false;
    }
  }
}

void SuspendListener::disable()
{
  if ( m_state.exchange( State::Disabled ) != State::Disabled )
    syslog( LOG_WARNING, "[Suspend] Stop listening for suspend messages" );
}
