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

#include "profiles/GlobalProfile.hpp"

#include <nlohmann/json.hpp>

void to_json( nlohmann::json &j, const GlobalProfile &profile )
{
  j = nlohmann::json{
    { "fan", profile.fan },
    { "keyboard", profile.keyboard },
    { "performance_profile", nullptr }
  };

  if ( profile.performanceProfile.has_value() )
    j[ "performance_profile" ] = *profile.performanceProfile;
}

void from_json( const nlohmann::json &j, GlobalProfile &profile )
{
  profile.fan = j.at( "fan" ).get< std::string >();
  profile.keyboard = j.at( "keyboard" ).get< std::string >();
  profile.performanceProfile.reset();

  if ( j.contains( "performance_profile" ) and j[ "performance_profile" ].is_string() )
    profile.performanceProfile = j[ "performance_profile" ].get< std::string >();
}
