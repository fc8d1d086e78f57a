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
#include <string>
#include <vector>

/**
 * @brief Keyboard backlight through the LED class interface
 *
 * Drives every "*kbd_backlight*" LED. RGB zones take the color through
 * multi_intensity at full brightness; white-only backlights map the
 * brightest channel onto their brightness range.
 */
class LedKeyboardBackend : public KeyboardBackend
{
public:
  static constexpr const char *LEDS_ROOT = "/sys/class/leds";

  explicit LedKeyboardBackend( std::filesystem::path ledsRoot = LEDS_ROOT );

  [[nodiscard]] bool isAvailable() const override;
  bool setColor( const Color &color ) override;

  [[nodiscard]] size_t zoneCount() const noexcept { return m_zones.size(); }

private:
  struct Zone
  {
    std::filesystem::path path;
    int32_t maxBrightness = 255;
    bool rgb = false;
  };

  std::vector< Zone > m_zones;

  void detect( const std::filesystem::path &ledsRoot );
};
