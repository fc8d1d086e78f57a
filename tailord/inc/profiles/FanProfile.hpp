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

/**
 * @brief Fan curve point
 *
 * Represents a single temperature/speed mapping point in a fan curve.
 */
struct FanProfilePoint
{
  uint8_t temp = 0;  // temperature in degrees Celsius
  uint8_t fan = 0;   // fan speed in percent (0-100)

  bool operator==( const FanProfilePoint & ) const = default;
};

/**
 * @brief Fan profile: a curve of points sorted by temperature
 */
using FanProfile = std::vector< FanProfilePoint >;

void to_json( nlohmann::json &j, const FanProfilePoint &point );
void from_json( const nlohmann::json &j, FanProfilePoint &point );

/**
 * @brief Curve used when a profile is empty or a reference dangles
 */
[[nodiscard]] FanProfile defaultFanProfile();

/**
 * @brief Get fan speed for a given temperature
 *
 * Linear interpolation between the two neighbouring points, clamped to the
 * first point below the curve and to the last point above it. Points do not
 * need to be sorted. An empty curve falls back to defaultFanProfile().
 *
 * @param profile Fan curve
 * @param temp Temperature in degrees Celsius
 * @return Fan speed percentage (0-100)
 */
[[nodiscard]] uint8_t fanSpeedForTemperature( const FanProfile &profile, int32_t temp );
