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

#include "TailorSettings.hpp"
#include "JsonFile.hpp"
#include <filesystem>
#include <optional>
#include <syslog.h>
#include <nlohmann/json.hpp>

class SettingsManager
{
public:
  static constexpr const char *SETTINGS_FILE_NAME = "settings";

  /**
   * @param configDir Directory holding the settings file
   */
  explicit SettingsManager( const std::filesystem::path &configDir )
    : m_file( configDir / SETTINGS_FILE_NAME )
  {
  }

  /**
   * @brief Read settings, recovering from the backup if needed
   * @return Settings, or nullopt if none are stored or they are unreadable
   */
  [[nodiscard]] std::optional< TailorSettings > readSettings() const noexcept
  {
    nlohmann::json j;
    switch ( tailor::readJsonFile( m_file, j ) )
    {
      case tailor::JsonFileState::Missing:
        syslog( LOG_INFO, "[Settings] Settings file not found, using defaults" );
        return std::nullopt;
      case tailor::JsonFileState::Corrupted:
        syslog( LOG_ERR, "[Settings] Settings unreadable, using defaults" );
        return std::nullopt;
      case tailor::JsonFileState::Loaded:
        break;
    }

    return parseSettingsJSON( j );
  }

  [[nodiscard]] bool writeSettings( const TailorSettings &settings ) const noexcept
  {
    nlohmann::json j;
    j[ "activeProfile" ] = settings.activeProfile;
    j[ "fanControlEnabled" ] = settings.fanControlEnabled;
    j[ "keyboardControlEnabled" ] = settings.keyboardControlEnabled;

    if ( not tailor::writeJsonFile( m_file, j ) )
    {
      syslog( LOG_ERR, "[Settings] Failed to write %s", m_file.c_str() );
      return false;
    }

    return true;
  }

  [[nodiscard]] const std::filesystem::path &file() const noexcept { return m_file; }

private:
  std::filesystem::path m_file;

  [[nodiscard]] static std::optional< TailorSettings > parseSettingsJSON( const nlohmann::json &j ) noexcept
  {
    try
    {
      TailorSettings settings;

      if ( j.contains( "activeProfile" ) and j[ "activeProfile" ].is_string() )
        settings.activeProfile = j[ "activeProfile" ].get< std::string >();
      if ( j.contains( "fanControlEnabled" ) )
        settings.fanControlEnabled = j[ "fanControlEnabled" ].get< bool >();
      if ( j.contains( "keyboardControlEnabled" ) )
        settings.keyboardControlEnabled = j[ "keyboardControlEnabled" ].get< bool >();

      return settings;
    }
    catch ( const std::exception &e )
    {
      syslog( LOG_ERR, "[Settings] Exception parsing settings JSON: %s", e.what() );
      return std::nullopt;
    }
  }
};
