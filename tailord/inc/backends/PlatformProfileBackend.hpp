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

#include "HardwareControl.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Firmware performance profile through the platform_profile interface
 *
 * The TUXEDO platform driver is preferred over the generic ACPI one when
 * both are present. Names are checked against platform_profile_choices
 * before they are written.
 */
class PlatformProfileBackend : public PerformanceProfileController
{
public:
  static constexpr const char *TUXEDO_PLATFORM_PROFILE_DIR = "/sys/bus/platform/devices/tuxedo_platform_profile";
  static constexpr const char *ACPI_PLATFORM_PROFILE_DIR = "/sys/firmware/acpi";

  /**
   * @param candidates Directories holding platform_profile and
   *        platform_profile_choices, in order of preference
   */
  explicit PlatformProfileBackend( const std::vector< std::filesystem::path > &candidates = {
                                     TUXEDO_PLATFORM_PROFILE_DIR, ACPI_PLATFORM_PROFILE_DIR } );

  [[nodiscard]] bool isAvailable() const noexcept { return m_directory.has_value(); }

  /**
   * @brief Profile names the firmware offers, empty if unavailable
   */
  [[nodiscard]] std::vector< std::string > choices() const;

  [[nodiscard]] std::optional< std::string > currentProfile() const;

  bool setPerformanceProfile( const std::string &name ) override;

private:
  std::optional< std::filesystem::path > m_directory;
};
