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

#include "profiles/FanProfile.hpp"
#include "profiles/KeyboardProfile.hpp"
#include <cstdint>
#include <string>

/**
 * @brief Receiver of resolved fan settings (implemented by the fan loop)
 */
class FanController
{
public:
  virtual ~FanController() = default;

  /**
   * @brief Follow a curve from now on, dropping any speed override
   */
  virtual void applyFanProfile( const FanProfile &profile ) = 0;

  /**
   * @brief Hold a fixed speed until the next applyFanProfile()
   * @param percent Fan speed 0-100
   */
  virtual void overrideSpeed( uint8_t percent ) = 0;
};

/**
 * @brief Receiver of resolved keyboard settings (implemented by the color loop)
 */
class KeyboardController
{
public:
  virtual ~KeyboardController() = default;

  virtual void applyKeyboardProfile( const KeyboardProfile &profile ) = 0;
  virtual void overrideColor( const Color &color ) = 0;
};

/**
 * @brief Receiver of the performance profile named by a global profile
 */
class PerformanceProfileController
{
public:
  virtual ~PerformanceProfileController() = default;

  /**
   * @param name Firmware profile name, e.g. "balanced" or "performance"
   * @return false if the name is not offered by the firmware or the write failed
   */
  virtual bool setPerformanceProfile( const std::string &name ) = 0;
};

/**
 * @brief Access to the fan hardware
 */
class FanBackend
{
public:
  virtual ~FanBackend() = default;

  [[nodiscard]] virtual bool isAvailable() const = 0;

  /**
   * @brief Read the temperature driving the fan curve
   * @param celsius Receives the temperature in degrees Celsius
   */
  virtual bool readTemperature( int32_t &celsius ) = 0;

  virtual bool setSpeedPercent( int32_t percent ) = 0;

  /**
   * @brief Hand fan control back to the firmware
   */
  virtual bool restoreAutomatic() = 0;
};

/**
 * @brief Access to the keyboard backlight
 */
class KeyboardBackend
{
public:
  virtual ~KeyboardBackend() = default;

  [[nodiscard]] virtual bool isAvailable() const = 0;
  virtual bool setColor( const Color &color ) = 0;
};
