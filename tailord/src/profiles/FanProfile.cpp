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

#include "profiles/FanProfile.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <nlohmann/json.hpp>

void to_json( nlohmann::json &j, const FanProfilePoint &point )
{
  j = nlohmann::json{ { "temp", point.temp }, { "fan", point.fan } };
}

void from_json( const nlohmann::json &j, FanProfilePoint &point )
{
  const int temp = j.at( "temp" ).get< int >();
  const int fan = j.at( "fan" ).get< int >();

  if ( temp < 0 or temp > 255 )
    throw std::out_of_range( "fan curve temperature out of range" );
  if ( fan < 0 or fan > 100 )
    throw std::out_of_range( "fan curve speed out of range" );

  point.temp = static_cast< uint8_t >( temp );
  point.fan = static_cast< uint8_t >( fan );
}

FanProfile defaultFanProfile()
{
  return {
    { 25, 0 },
    { 40, 20 },
    { 60, 40 },
    { 75, 70 },
    { 90, 100 },
  };
}

uint8_t fanSpeedForTemperature( const FanProfile &profile, int32_t temp )
{
  FanProfile table = profile.empty() ? defaultFanProfile() : profile;
  std::stable_sort( table.begin(), table.end(),
                    []( const FanProfilePoint &a, const FanProfilePoint &b ) { return a.temp < b.temp; } );

  if ( temp <= table.front().temp )
    return table.front().fan;

  for ( size_t i = 1; i < table.size(); ++i )
  {
    const auto &prev = table[ i - 1 ];
    const auto &entry = table[ i ];

    if ( temp > entry.temp )
      continue;

    const int32_t tempDiff = entry.temp - prev.temp;
    if ( tempDiff == 0 )
      return entry.fan;

    const double frac = static_cast< double >( temp - prev.temp ) / static_cast< double >( tempDiff );
    const long speed = std::lround( prev.fan + frac * ( entry.fan - prev.fan ) );
    return static_cast< uint8_t >( std::clamp( speed, 0L, 100L ) );
  }

  // temperature is beyond the table, return last speed
  return table.back().fan;
}
