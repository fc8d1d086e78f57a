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

#include "backends/LedKeyboardBackend.hpp"
#include "SysfsNode.hpp"

#include <algorithm>
#include <syslog.h>

namespace fs = std::filesystem;

LedKeyboardBackend::LedKeyboardBackend( fs::path ledsRoot )
{
  detect( ledsRoot );
}

void LedKeyboardBackend::detect( const fs::path &ledsRoot )
{
  std::error_code ec;
  if ( not fs::exists( ledsRoot, ec ) )
    return;

  for ( const auto &entry : fs::directory_iterator( ledsRoot, ec ) )
  {
    const std::string name = entry.path().filename().string();
    if ( name.find( "kbd_backlight" ) == std::string::npos )
      continue;

    if ( not fs::exists( entry.path() / "brightness", ec ) )
      continue;

    Zone zone;
    zone.path = entry.path();
    zone.maxBrightness = SysfsNode< int32_t >( zone.path / "max_brightness" ).read().value_or( 255 );
    zone.rgb = fs::exists( zone.path / "multi_intensity", ec );
    m_zones.push_back( zone );
  }

  // zones in name order: rgb:kbd_backlight, rgb:kbd_backlight_1, ...
  std::sort( m_zones.begin(), m_zones.end(),
             []( const Zone &a, const Zone &b ) { return a.path < b.path; } );

  if ( m_zones.empty() )
    syslog( LOG_WARNING, "[KeyboardBackend] No keyboard backlight found" );
  else
    syslog( LOG_INFO, "[KeyboardBackend] Detected %zu keyboard backlight zone(s)", m_zones.size() );
}

bool LedKeyboardBackend::isAvailable() const
{
  return not m_zones.empty();
}

bool LedKeyboardBackend::setColor( const Color &color )
{
  bool ok = not m_zones.empty();

  for ( const auto &zone : m_zones )
  {
    SysfsNode< int32_t > brightness( zone.path / "brightness" );

    if ( zone.rgb )
    {
      SysfsNode< std::vector< int32_t > > intensity( zone.path / "multi_intensity" );
      ok = intensity.write( { color.r, color.g, color.b } ) and ok;
      ok = brightness.write( zone.maxBrightness ) and ok;
    }
    else
    {
      const int32_t level = std::max( { color.r, color.g, color.b } ) * zone.maxBrightness / 255;
      ok = brightness.write( level ) and ok;
    }
  }

  if ( not ok )
    syslog( LOG_ERR, "[KeyboardBackend] Failed to set color %u %u %u", color.r, color.g, color.b );

  return ok;
}
