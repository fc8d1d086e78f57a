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

#include <string>
#include <optional>
#include <nlohmann/json_fwd.hpp>

// Name used for the profiles seeded on first start
inline constexpr const char *DEFAULT_PROFILE_NAME = "default";

/**
 * @brief Composite profile referencing a fan and a keyboard profile by name
 */
struct GlobalProfile
{
  std::string fan;
  std::string keyboard;
  std::optional< std::string > performanceProfile;

  bool operator==( const GlobalProfile & ) const = default;
};

void to_json( nlohmann::json &j, const GlobalProfile &profile );
void from_json( const nlohmann::json &j, GlobalProfile &profile );

/**
 * @brief Global profile used when the active profile no longer exists
 */
[[nodiscard]] inline GlobalProfile defaultGlobalProfile()
{
  return GlobalProfile{ DEFAULT_PROFILE_NAME, DEFAULT_PROFILE_NAME, std::nullopt };
}
