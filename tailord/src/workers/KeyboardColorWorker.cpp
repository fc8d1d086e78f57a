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

#include "workers/KeyboardColorWorker.hpp"

#include <syslog.h>

KeyboardColorWorker::KeyboardColorWorker( KeyboardBackend &backend,
                                          std::unique_ptr< SuspendListener > listener,
                                          std::chrono::milliseconds interval )
  : DaemonWorker( interval ),
    m_backend( backend ),
    m_listener( std::move( listener ) ),
    m_profile( defaultKeyboardProfile() ),
    m_profileStart( std::chrono::steady_clock::now() )
{
}

KeyboardColorWorker::~KeyboardColorWorker()
{
  stop();
}

void KeyboardColorWorker::applyKeyboardProfile( const KeyboardProfile &profile )
{
  std::lock_guard< std::mutex > lock( m_mutex );
  m_profile = profile;
  m_override.reset();
  m_profileStart = std::chrono::steady_clock::now();
}

void KeyboardColorWorker::overrideColor( const Color &color )
{
  std::lock_guard< std::mutex > lock( m_mutex );
  m_override = color;
  syslog( LOG_INFO, "[Keyboard] Color overridden to %u %u %u", color.r, color.g, color.b );
}

KeyboardProfile KeyboardColorWorker::keyboardProfile() const
{
  std::lock_guard< std::mutex > lock( m_mutex );
  return m_profile;
}

std::optional< Color > KeyboardColorWorker::colorOverride() const
{
  std::lock_guard< std::mutex > lock( m_mutex );
  return m_override;
}

std::optional< Color > KeyboardColorWorker::appliedColor() const
{
  std::lock_guard< std::mutex > lock( m_mutex );
  return m_appliedColor;
}

void KeyboardColorWorker::onStart()
{
  std::lock_guard< std::mutex > lock( m_mutex );
  m_appliedColor.reset();
}

void KeyboardColorWorker::onWork()
{
  if ( m_listener and m_listener->checkSuspend() )
  {
    syslog( LOG_INFO, "[Keyboard] Resumed from suspend, re-applying color" );
    std::lock_guard< std::mutex > lock( m_mutex );
    m_appliedColor.reset();
  }

  Color color;
  {
    std::lock_guard< std::mutex > lock( m_mutex );
    if ( m_override )
    {
      color = *m_override;
    }
    else
    {
      const auto elapsed = std::chrono::duration_cast< std::chrono::milliseconds >(
        std::chrono::steady_clock::now() - m_profileStart );
      color = keyboardColorAt( m_profile, static_cast< uint64_t >( elapsed.count() ) );
    }

    if ( m_appliedColor == color )
      return;
  }

  if ( not m_backend.setColor( color ) )
  {
    if ( not m_colorErrorLogged )
      syslog( LOG_ERR, "[Keyboard] Failed to set color %u %u %u", color.r, color.g, color.b );
    m_colorErrorLogged = true;
    return;
  }

  m_colorErrorLogged = false;

  std::lock_guard< std::mutex > lock( m_mutex );
  m_appliedColor = color;
}

void KeyboardColorWorker::onExit()
{
  tailor::tDebug( "[Keyboard] Color loop stopped" );
}
