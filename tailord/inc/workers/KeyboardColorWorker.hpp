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

#include "DaemonWorker.hpp"
#include "HardwareControl.hpp"
#include "profiles/KeyboardProfile.hpp"
#include "suspend/SuspendListener.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>

/**
 * @brief Plays the active keyboard profile on the backlight
 *
 * Static profiles are written once; color sequences are stepped every
 * cycle. An override color holds until the next applyKeyboardProfile().
 * The current color is written again after a suspend/resume cycle.
 */
class KeyboardColorWorker : public DaemonWorker, public KeyboardController
{
public:
  static constexpr std::chrono::milliseconds DEFAULT_INTERVAL { 50 };

  KeyboardColorWorker( KeyboardBackend &backend,
                       std::unique_ptr< SuspendListener > listener,
                       std::chrono::milliseconds interval = DEFAULT_INTERVAL );

  ~KeyboardColorWorker() override;

  void applyKeyboardProfile( const KeyboardProfile &profile ) override;
  void overrideColor( const Color &color ) override;

  [[nodiscard]] KeyboardProfile keyboardProfile() const;
  [[nodiscard]] std::optional< Color > colorOverride() const;

  /**
   * @brief Last color written to the backend
   */
  [[nodiscard]] std::optional< Color > appliedColor() const;

protected:
  void onStart() override;
  void onWork() override;
  void onExit() override;

private:
  KeyboardBackend &m_backend;
  std::unique_ptr< SuspendListener > m_listener;

  mutable std::mutex m_mutex;
  KeyboardProfile m_profile;
  std::optional< Color > m_override;
  std::chrono::steady_clock::time_point m_profileStart;
  std::optional< Color > m_appliedColor;
  bool m_colorErrorLogged = false;
};
