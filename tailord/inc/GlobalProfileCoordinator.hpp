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

#include "ProfileStore.hpp"
#include "ProfileStatus.hpp"
#include "SettingsManager.hpp"
#include "TailorSettings.hpp"
#include "HardwareControl.hpp"
#include "profiles/FanProfile.hpp"
#include "profiles/KeyboardProfile.hpp"
#include "profiles/GlobalProfile.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Ties the fan, keyboard and global profile stores together
 *
 * Global profiles reference fan and keyboard profiles by name. Renames of a
 * fan or keyboard profile are routed through here so every referencing
 * global profile is rewritten in the same step, and renames of the active
 * global profile carry the active name along.
 *
 * Locks are always taken in the order fan store, keyboard store, global
 * store, active name.
 */
class GlobalProfileCoordinator
{
public:
  /**
   * @param fanController Receives resolved fan curves, may be null
   * @param keyboardController Receives resolved keyboard profiles, may be null
   * @param performanceController Receives the performance profile name, may be null
   */
  GlobalProfileCoordinator( ProfileStore< FanProfile > &fanStore,
                            ProfileStore< KeyboardProfile > &keyboardStore,
                            ProfileStore< GlobalProfile > &globalStore,
                            SettingsManager &settingsManager,
                            FanController *fanController = nullptr,
                            KeyboardController *keyboardController = nullptr,
                            PerformanceProfileController *performanceController = nullptr );

  GlobalProfileCoordinator( const GlobalProfileCoordinator & ) = delete;
  GlobalProfileCoordinator &operator=( const GlobalProfileCoordinator & ) = delete;

  /**
   * @brief Load all stores and the settings, seeding defaults on first start
   */
  ProfileStatus initialize();

  ProfileStatus addProfile( const std::string &name, const GlobalProfile &profile );
  ProfileStatus getProfile( const std::string &name, GlobalProfile &profile ) const;
  [[nodiscard]] std::vector< std::string > listProfiles() const;
  ProfileStatus removeProfile( const std::string &name );
  ProfileStatus renameProfile( const std::string &from, const std::string &to, std::vector< std::string > &names );
  ProfileStatus copyProfile( const std::string &from, const std::string &to );

  /**
   * @brief Rename a fan profile and every global profile reference to it
   */
  ProfileStatus renameFanProfile( const std::string &from, const std::string &to, std::vector< std::string > &names );

  /**
   * @brief Rename a keyboard profile and every global profile reference to it
   */
  ProfileStatus renameKeyboardProfile( const std::string &from, const std::string &to, std::vector< std::string > &names );

  [[nodiscard]] std::string getActiveProfileName() const;

  /**
   * @brief Make an existing global profile the active one
   */
  ProfileStatus setActiveProfileName( const std::string &name );

  /**
   * @brief Resolve the active global profile and push it to the hardware
   *
   * Dangling references fall back to the built-in defaults. Clears any
   * speed or color override. A performance profile the firmware rejects is
   * logged and does not fail the reload.
   */
  ProfileStatus reload();

  /**
   * @brief Hold the fan at a fixed speed until the next reload()
   */
  ProfileStatus overrideSpeed( uint8_t percent );

  /**
   * @brief Show a fixed keyboard color until the next reload()
   */
  ProfileStatus overrideColor( const Color &color );

  [[nodiscard]] ProfileStore< FanProfile > &fanStore() noexcept { return m_fanStore; }
  [[nodiscard]] ProfileStore< KeyboardProfile > &keyboardStore() noexcept { return m_keyboardStore; }

  [[nodiscard]] TailorSettings settings() const;

private:
  struct ResolvedProfile
  {
    std::string name;
    FanProfile fan;
    KeyboardProfile keyboard;
    std::optional< std::string > performanceProfile;
  };

  ProfileStore< FanProfile > &m_fanStore;
  ProfileStore< KeyboardProfile > &m_keyboardStore;
  ProfileStore< GlobalProfile > &m_globalStore;
  SettingsManager &m_settingsManager;
  FanController *m_fanController;
  KeyboardController *m_keyboardController;
  PerformanceProfileController *m_performanceController;

  mutable std::mutex m_activeMutex;
  TailorSettings m_settings;

  [[nodiscard]] ResolvedProfile resolveActiveProfile() const;
  void seedDefaults();
};
