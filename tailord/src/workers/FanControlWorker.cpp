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

#include "workers/FanControlWorker.hpp"

#include <syslog.h>

FanControlWorker::FanControlWorker( FanBackend &backend,
                                    std::unique_ptr< SuspendListener > listener,
                                    std::chrono::milliseconds interval )
  : DaemonWorker( interval ),
    m_backend( backend ),
    m_listener( std::move( listener ) ),
    m_profile( defaultFanProfile() )
{
}

FanControlWorker::~FanControlWorker()
{
  stop();
}

void FanControlWorker::applyFanProfile( const FanProfile &profile )
{
  std::lock_guard< std::mutex > lock( m_mutex );
  m_profile = profile.empty() ? defaultFanProfile() : profile;
  m_override.reset();
}

void FanControlWorker::overrideSpeed( uint8_t percent )
{
  std::lock_guard< std::mutex > lock( m_mutex );
  m_override = percent;
  syslog( LOG_INFO, "[Fan] Speed overridden to %u%%", percent );
}

FanProfile FanControlWorker::fanProfile() const
{
  std::lock_guard< std::mutex > lock( m_mutex );
  return m_profile;
}

std::optional< uint8_t > FanControlWorker::speedOverride() const
{
  std::lock_guard< std::mutex > lock( m_mutex );
  return m_override;
}

void FanControlWorker::onStart()
{
  m_filter.reset();
  m_appliedSpeed = -1;
}

void FanControlWorker::onWork()
{
  if ( m_listener and m_listener->checkSuspend() )
  {
    syslog( LOG_INFO, "[Fan] Resumed from suspend, re-applying fan speed" );
    m_filter.reset();
    m_appliedSpeed = -1;
  }

  FanProfile profile;
  std::optional< uint8_t > speedOverride;
  {
    std::lock_guard< std::mutex > lock( m_mutex );
    profile = m_profile;
    speedOverride = m_override;
  }

  int32_t speed = 0;
  if ( speedOverride )
  {
    speed = *speedOverride;
  }
  else
  {
    int32_t temperature = 0;
    if ( not m_backend.readTemperature( temperature ) )
    {
      if ( not m_temperatureErrorLogged )
        syslog( LOG_ERR, "[Fan] Failed to read temperature" );
      m_temperatureErrorLogged = true;
      return;
    }

    m_temperatureErrorLogged = false;
    m_filter.addValue( temperature );
    speed = fanSpeedForTemperature( profile, m_filter.getFilteredValue() );
    tailor::tDebug( "[Fan] temp %d filtered %d speed %d", temperature, m_filter.getFilteredValue(), speed );
  }

  if ( speed == m_appliedSpeed )
    return;

  if ( m_backend.setSpeedPercent( speed ) )
    m_appliedSpeed = speed;
  else
    syslog( LOG_ERR, "[Fan] Failed to set fan speed to %d%%", speed );
}

void FanControlWorker::onExit()
{
  if ( not m_backend.restoreAutomatic() )
    syslog( LOG_WARNING, "[Fan] Fan left under manual control" );
}
