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

/**
 * @brief Fan control through the hwmon PWM interface
 *
 * Uses the first hwmon device exposing pwm1/pwm1_enable for the fan, and
 * temp1_input of the first known CPU sensor (falling back to the fan's own
 * hwmon device) as the curve input.
 */
class HwmonFanBackend : public FanBackend
{
public:
  static constexpr const char *HWMON_ROOT = "/sys/class/hwmon";

  // pwm1_enable modes
  static constexpr int32_t PWM_MODE_MANUAL = 1;
  static constexpr int32_t PWM_MODE_AUTOMATIC = 2;

  explicit HwmonFanBackend( std::filesystem::path hwmonRoot = HWMON_ROOT );

  [[nodiscard]] bool isAvailable() const override;
  bool readTemperature( int32_t &celsius ) override;
  bool setSpeedPercent( int32_t percent ) override;
  bool restoreAutomatic() override;

private:
  std::optional< std::filesystem::path > m_fanDevice;
  std::optional< std::filesystem::path > m_temperatureInput;
  bool m_manualMode = false;

  void detect( const std::filesystem::path &hwmonRoot );
};
