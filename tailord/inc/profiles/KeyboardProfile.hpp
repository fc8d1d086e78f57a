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

#include <vector>
#include <cstdint>
#include <nlohmann/json_fwd.hpp>

struct Color
{
  uint8_t r = 0;
  uint8_t g = 0;
  uint8_t b = 0;

  bool operator==( const Color & ) const = default;
};

enum class ColorTransition
{
  None,   // hold the color, then jump to the next one
  Linear  // blend into the next color over the transition time
};

/**
 * @brief One step of a keyboard color sequence
 */
struct ColorPoint
{
  Color color;
  ColorTransition transition = ColorTransition::Linear;
  uint32_t transitionTime = 0;  // milliseconds until the next point

  bool operator==( const ColorPoint & ) const = default;
};

/**
 * @brief Keyboard lighting profile
 *
 * Either lighting off, a single static color, or a looping sequence of
 * color points. Serialized as "None", {"Single": color} or
 * {"Multiple": [points]}.
 */
struct KeyboardProfile
{
  enum class Kind
  {
    None,
    Single,
    Multiple
  };

  Kind kind = Kind::None;
  Color single;
  std::vector< ColorPoint > points;

  bool operator==( const KeyboardProfile & ) const = default;

  static KeyboardProfile off() { return KeyboardProfile(); }

  static KeyboardProfile singleColor( const Color &color )
  {
    KeyboardProfile profile;
    profile.kind = Kind::Single;
    profile.single = color;
    return profile;
  }

  static KeyboardProfile sequence( const std::vector< ColorPoint > &points )
  {
    KeyboardProfile profile;
    profile.kind = Kind::Multiple;
    profile.points = points;
    return profile;
  }
};

void to_json( nlohmann::json &j, const Color &color );
void from_json( const nlohmann::json &j, Color &color );
void to_json( nlohmann::json &j, const ColorPoint &point );
void from_json( const nlohmann::json &j, ColorPoint &point );
void to_json( nlohmann::json &j, const KeyboardProfile &profile );
void from_json( const nlohmann::json &j, KeyboardProfile &profile );

/**
 * @brief Profile used when a keyboard reference dangles
 */
[[nodiscard]] KeyboardProfile defaultKeyboardProfile();

/**
 * @brief Color of a profile at a point in its animation
 *
 * Multiple-color profiles loop: point i is shown at the start of its slot
 * and, for linear transitions, blends into point i+1 (wrapping to the first
 * point) over its transition time.
 *
 * @param profile Keyboard profile
 * @param elapsedMs Milliseconds since the profile was applied
 */
[[nodiscard]] Color keyboardColorAt( const KeyboardProfile &profile, uint64_t elapsedMs );

/**
 * @brief Whether the profile's color changes over time
 */
[[nodiscard]] bool isAnimated( const KeyboardProfile &profile ) noexcept;
