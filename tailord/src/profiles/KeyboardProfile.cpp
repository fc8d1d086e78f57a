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

#include "profiles/KeyboardProfile.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace
{

uint8_t colorChannel( const nlohmann::json &j, const char *key )
{
  const int value = j.at( key ).get< int >();
  if ( value < 0 or value > 255 )
    throw std::out_of_range( std::string( "color channel out of range: " ) + key );
  return static_cast< uint8_t >( value );
}

uint8_t blend( uint8_t from, uint8_t to, double frac )
{
  return static_cast< uint8_t >( std::lround( from + frac * ( static_cast< int >( to ) - static_cast< int >( from ) ) ) );
}

} // namespace

void to_json( nlohmann::json &j, const Color &color )
{
  j = nlohmann::json{ { "r", color.r }, { "g", color.g }, { "b", color.b } };
}

void from_json( const nlohmann::json &j, Color &color )
{
  color.r = colorChannel( j, "r" );
  color.g = colorChannel( j, "g" );
  color.b = colorChannel( j, "b" );
}

void to_json( nlohmann::json &j, const ColorPoint &point )
{
  j = nlohmann::json{
    { "color", point.color },
    { "transition", point.transition == ColorTransition::Linear ? "Linear" : "None" },
    { "transition_time", point.transitionTime }
  };
}

void from_json( const nlohmann::json &j, ColorPoint &point )
{
  point.color = j.at( "color" ).get< Color >();

  const auto transition = j.at( "transition" ).get< std::string >();
  if ( transition == "Linear" )
    point.transition = ColorTransition::Linear;
  else if ( transition == "None" )
    point.transition = ColorTransition::None;
  else
    throw std::invalid_argument( "unknown color transition: " + transition );

  point.transitionTime = j.at( "transition_time" ).get< uint32_t >();
}

void to_json( nlohmann::json &j, const KeyboardProfile &profile )
{
  switch ( profile.kind )
  {
    case KeyboardProfile::Kind::None:
      j = "None";
      break;
    case KeyboardProfile::Kind::Single:
      j = nlohmann::json{ { "Single", profile.single } };
      break;
    case KeyboardProfile::Kind::Multiple:
      j = nlohmann::json{ { "Multiple", profile.points } };
      break;
  }
}

void from_json( const nlohmann::json &j, KeyboardProfile &profile )
{
  if ( j.is_string() )
  {
    if ( j.get< std::string >() != "None" )
      throw std::invalid_argument( "unknown keyboard profile: " + j.get< std::string >() );

    profile = KeyboardProfile::off();
    return;
  }

  if ( not j.is_object() or j.size() != 1 )
    throw std::invalid_argument( "keyboard profile must be \"None\" or a single-key object" );

  if ( j.contains( "Single" ) )
  {
    profile = KeyboardProfile::singleColor( j.at( "Single" ).get< Color >() );
  }
  else if ( j.contains( "Multiple" ) )
  {
    profile = KeyboardProfile::sequence( j.at( "Multiple" ).get< std::vector< ColorPoint > >() );
  }
  else
  {
    throw std::invalid_argument( "unknown keyboard profile variant: " + j.begin().key() );
  }
}

KeyboardProfile defaultKeyboardProfile()
{
  return KeyboardProfile::singleColor( Color{ 255, 255, 255 } );
}

bool isAnimated( const KeyboardProfile &profile ) noexcept
{
  return profile.kind == KeyboardProfile::Kind::Multiple and profile.points.size() > 1;
}

Color keyboardColorAt( const KeyboardProfile &profile, uint64_t elapsedMs )
{
  switch ( profile.kind )
  {
    case KeyboardProfile::Kind::None:
      return Color{};
    case KeyboardProfile::Kind::Single:
      return profile.single;
    case KeyboardProfile::Kind::Multiple:
      break;
  }

  const auto &points = profile.points;
  if ( points.empty() )
    return Color{};

  uint64_t cycle = 0;
  for ( const auto &point : points )
    cycle += point.transitionTime;

  if ( points.size() == 1 or cycle == 0 )
    return points.front().color;

  uint64_t offset = elapsedMs % cycle;
  for ( size_t i = 0; i < points.size(); ++i )
  {
    const auto &point = points[ i ];
    if ( offset >= point.transitionTime )
    {
      offset -= point.transitionTime;
      continue;
    }

    if ( point.transition == ColorTransition::None )
      return point.color;

    const auto &next = points[ ( i + 1 ) % points.size() ];
    const double frac = static_cast< double >( offset ) / static_cast< double >( point.transitionTime );
    return Color{ blend( point.color.r, next.color.r, frac ),
                  blend( point.color.g, next.color.g, frac ),
                  blend( point.color.b, next.color.b, frac ) };
  }

  return points.back().color;
}
