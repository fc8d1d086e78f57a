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

#include "backends/HwmonFanBackend.hpp"
#include "SysfsNode.hpp"
#include "TailorLog.hpp"

#include <algorithm>
#include <array>
#include <string>
#include <vector>
#include <syslog.h>

namespace fs = std::filesystem;

namespace
{
// hwmon driver names providing the CPU package temperature, in order of preference
constexpr std::array< const char *, 4 > CPU_SENSORS = { "coretemp", "k10temp", "zenpower", "acpitz" };
}

HwmonFanBackend::HwmonFanBackend( fs::path hwmonRoot )
{
  detect( hwmonRoot );
}

void HwmonFanBackend::detect( const fs::path &hwmonRoot )
{
  std::error_code ec;
  if ( not fs::exists( hwmonRoot, ec ) )
  {
    syslog( LOG_WARNING, "[FanBackend] %s does not exist", hwmonRoot.c_str() );
    return;
  }

  std::vector< fs::path > devices;
  for ( const auto &entry : fs::directory_iterator( hwmonRoot, ec ) )
    devices.push_back( entry.path() );
  std::sort( devices.begin(), devices.end() );

  size_t bestSensorRank = CPU_SENSORS.size();
  for ( const auto &device : devices )
  {
    if ( not m_fanDevice and fs::exists( device / "pwm1", ec ) and fs::exists( device / "pwm1_enable", ec ) )
      m_fanDevice = device;

    const std::string name = SysfsNode< std::string >( device / "name" ).read().value_or( "" );
    for ( size_t rank = 0; rank < bestSensorRank; ++rank )
    {
      if ( name == CPU_SENSORS[ rank ] and fs::exists( device / "temp1_input", ec ) )
      {
        m_temperatureInput = device / "temp1_input";
        bestSensorRank = rank;
        break;
      }
    }
  }

  if ( m_fanDevice and not m_temperatureInput and fs::exists( *m_fanDevice / "temp1_input", ec ) )
    m_temperatureInput = *m_fanDevice / "temp1_input";

  if ( m_fanDevice )
    syslog( LOG_INFO, "[FanBackend] Using fan PWM at %s", m_fanDevice->c_str() );
  else
    syslog( LOG_WARNING, "[FanBackend] No PWM controllable fan found" );

  if ( m_temperatureInput )
    syslog( LOG_INFO, "[FanBackend] Using temperature sensor %s", m_temperatureInput->c_str() );
  else
    syslog( LOG_WARNING, "[FanBackend] No CPU temperature sensor found" );
}

bool HwmonFanBackend::isAvailable() const
{
  return m_fanDevice.has_value() and m_temperatureInput.has_value();
}

bool HwmonFanBackend::readTemperature( int32_t &celsius )
{
  if ( not m_temperatureInput )
    return false;

  // millidegree Celsius
  const auto value = SysfsNode< int32_t >( *m_temperatureInput ).read();
  if ( not value )
    return false;

  celsius = *value / 1000;
  return true;
}

bool HwmonFanBackend::setSpeedPercent( int32_t percent )
{
  if ( not m_fanDevice )
    return false;

  if ( not m_manualMode )
  {
    if ( not SysfsNode< int32_t >( *m_fanDevice / "pwm1_enable" ).write( PWM_MODE_MANUAL ) )
    {
      syslog( LOG_ERR, "[FanBackend] Failed to switch %s to manual control", m_fanDevice->c_str() );
      return false;
    }
    m_manualMode = true;
  }

  const int32_t pwm = std::clamp( percent, 0, 100 ) * 255 / 100;
  tailor::tDebug( "[FanBackend] pwm1 = %d (%d%%)", pwm, percent );
  return SysfsNode< int32_t >( *m_fanDevice / "pwm1" ).write( pwm );
}

bool HwmonFanBackend::restoreAutomatic()
{
  if ( not m_fanDevice )
    return false;

  m_manualMode = false;
  if ( not SysfsNode< int32_t >( *m_fanDevice / "pwm1_enable" ).write( PWM_MODE_AUTOMATIC ) )
  {
    syslog( LOG_ERR, "[FanBackend] Failed to restore automatic fan control" );
    return false;
  }

  syslog( LOG_INFO, "[FanBackend] Restored automatic fan control" );
  return true;
}
