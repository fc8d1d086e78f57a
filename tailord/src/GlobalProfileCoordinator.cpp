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

#include "GlobalProfileCoordinator.hpp"
#include "TailorLog.hpp"

#include <syslog.h>

GlobalProfileCoordinator::GlobalProfileCoordinator( ProfileStore< FanProfile > &fanStore,
                                                    ProfileStore< KeyboardProfile > &keyboardStore,
                                                    ProfileStore< GlobalProfile > &globalStore,
                                                    SettingsManager &settingsManager,
                                                    FanController *fanController,
                                                    KeyboardController *keyboardController,
                                                    PerformanceProfileController *performanceController )
  : m_fanStore( fanStore ),
    m_keyboardStore( keyboardStore ),
    m_globalStore( globalStore ),
    m_settingsManager( settingsManager ),
    m_fanController( fanController ),
    m_keyboardController( keyboardController ),
    m_performanceController( performanceController )
{
}

ProfileStatus GlobalProfileCoordinator::initialize()
{
  ProfileStatus result = ProfileStatus::Ok;

  for ( const ProfileStatus status : { m_fanStore.load(), m_keyboardStore.load(), m_globalStore.load() } )
  {
    if ( status != ProfileStatus::Ok )
      result = status;
  }

  if ( result != ProfileStatus::Ok )
    syslog( LOG_ERR, "[Profiles] Some profile stores could not be read, continuing with what was loaded" );

  {
    std::lock_guard< std::mutex > lock( m_activeMutex );
    if ( auto stored = m_settingsManager.readSettings() )
    {
      m_settings = *stored;
    }
    else
    {
      m_settings = TailorSettings();
      if ( not m_settingsManager.writeSettings( m_settings ) )
        result = ProfileStatus::IoError;
    }
  }

  seedDefaults();

  syslog( LOG_INFO, "[Profiles] Active profile is '%s'", getActiveProfileName().c_str() );
  return result;
}

void GlobalProfileCoordinator::seedDefaults()
{
  if ( m_fanStore.listProfiles().empty() )
  {
    syslog( LOG_INFO, "[Profiles] Creating default fan profile" );
    if ( m_fanStore.addProfile( DEFAULT_PROFILE_NAME, defaultFanProfile() ) != ProfileStatus::Ok )
      syslog( LOG_ERR, "[Profiles] Failed to store default fan profile" );
  }

  if ( m_keyboardStore.listProfiles().empty() )
  {
    syslog( LOG_INFO, "[Profiles] Creating default keyboard profile" );
    if ( m_keyboardStore.addProfile( DEFAULT_PROFILE_NAME, defaultKeyboardProfile() ) != ProfileStatus::Ok )
      syslog( LOG_ERR, "[Profiles] Failed to store default keyboard profile" );
  }

  if ( m_globalStore.listProfiles().empty() )
  {
    syslog( LOG_INFO, "[Profiles] Creating default global profile" );
    if ( m_globalStore.addProfile( DEFAULT_PROFILE_NAME, defaultGlobalProfile() ) != ProfileStatus::Ok )
      syslog( LOG_ERR, "[Profiles] Failed to store default global profile" );
  }
}

ProfileStatus GlobalProfileCoordinator::addProfile( const std::string &name, const GlobalProfile &profile )
{
  return m_globalStore.addProfile( name, profile );
}

ProfileStatus GlobalProfileCoordinator::getProfile( const std::string &name, GlobalProfile &profile ) const
{
  return m_globalStore.getProfile( name, profile );
}

std::vector< std::string > GlobalProfileCoordinator::listProfiles() const
{
  return m_globalStore.listProfiles();
}

ProfileStatus GlobalProfileCoordinator::removeProfile( const std::string &name )
{
  const ProfileStatus status = m_globalStore.removeProfile( name );
  if ( status == ProfileStatus::Ok and name == getActiveProfileName() )
    syslog( LOG_WARNING, "[Profiles] Removed the active profile '%s', defaults apply on next reload", name.c_str() );
  return status;
}

ProfileStatus GlobalProfileCoordinator::renameProfile( const std::string &from, const std::string &to,
                                                       std::vector< std::string > &names )
{
  return m_globalStore.renameProfile( from, to, names,
    [ this ]( const std::string &oldName, const std::string &newName )
    {
      std::lock_guard< std::mutex > lock( m_activeMutex );
      if ( m_settings.activeProfile != oldName )
        return ProfileStatus::Ok;

      TailorSettings updated = m_settings;
      updated.activeProfile = newName;
      if ( not m_settingsManager.writeSettings( updated ) )
        return ProfileStatus::IoError;

      m_settings = std::move( updated );
      syslog( LOG_INFO, "[Profiles] Active profile is now '%s'", newName.c_str() );
      return ProfileStatus::Ok;
    } );
}

ProfileStatus GlobalProfileCoordinator::copyProfile( const std::string &from, const std::string &to )
{
  return m_globalStore.copyProfile( from, to );
}

ProfileStatus GlobalProfileCoordinator::renameFanProfile( const std::string &from, const std::string &to,
                                                          std::vector< std::string > &names )
{
  return m_fanStore.renameProfile( from, to, names,
    [ this ]( const std::string &oldName, const std::string &newName )
    {
      return m_globalStore.updateProfiles( [ & ]( const std::string &, GlobalProfile &profile )
      {
        if ( profile.fan != oldName )
          return false;

        profile.fan = newName;
        return true;
      } );
    } );
}

ProfileStatus GlobalProfileCoordinator::renameKeyboardProfile( const std::string &from, const std::string &to,
                                                               std::vector< std::string > &names )
{
  return m_keyboardStore.renameProfile( from, to, names,
    [ this ]( const std::string &oldName, const std::string &newName )
    {
      return m_globalStore.updateProfiles( [ & ]( const std::string &, GlobalProfile &profile )
      {
        if ( profile.keyboard != oldName )
          return false;

        profile.keyboard = newName;
        return true;
      } );
    } );
}

std::string GlobalProfileCoordinator::getActiveProfileName() const
{
  std::lock_guard< std::mutex > lock( m_activeMutex );
  return m_settings.activeProfile;
}

TailorSettings GlobalProfileCoordinator::settings() const
{
  std::lock_guard< std::mutex > lock( m_activeMutex );
  return m_settings;
}

ProfileStatus GlobalProfileCoordinator::setActiveProfileName( const std::string &name )
{
  return m_globalStore.withProfiles( [ & ]( const ProfileStore< GlobalProfile >::ProfileMap &profiles )
  {
    if ( profiles.find( name ) == profiles.end() )
      return ProfileStatus::NotFound;

    std::lock_guard< std::mutex > lock( m_activeMutex );
    TailorSettings updated = m_settings;
    updated.activeProfile = name;
    if ( not m_settingsManager.writeSettings( updated ) )
      return ProfileStatus::IoError;

    m_settings = std::move( updated );
    syslog( LOG_INFO, "[Profiles] Active profile set to '%s'", name.c_str() );
    return ProfileStatus::Ok;
  } );
}

GlobalProfileCoordinator::ResolvedProfile GlobalProfileCoordinator::resolveActiveProfile() const
{
  return m_fanStore.withProfiles( [ & ]( const ProfileStore< FanProfile >::ProfileMap &fans )
  {
    return m_keyboardStore.withProfiles( [ & ]( const ProfileStore< KeyboardProfile >::ProfileMap &keyboards )
    {
      return m_globalStore.withProfiles( [ & ]( const ProfileStore< GlobalProfile >::ProfileMap &globals )
      {
        std::lock_guard< std::mutex > lock( m_activeMutex );

        ResolvedProfile resolved;
        resolved.name = m_settings.activeProfile;

        GlobalProfile global = defaultGlobalProfile();
        if ( auto it = globals.find( resolved.name ); it != globals.end() )
          global = it->second;
        else
          syslog( LOG_WARNING, "[Profiles] Active profile '%s' does not exist, using defaults", resolved.name.c_str() );

        resolved.performanceProfile = global.performanceProfile;

        if ( auto it = fans.find( global.fan ); it != fans.end() )
        {
          resolved.fan = it->second;
        }
        else
        {
          syslog( LOG_WARNING, "[Profiles] Fan profile '%s' does not exist, using default curve", global.fan.c_str() );
          resolved.fan = defaultFanProfile();
        }

        if ( auto it = keyboards.find( global.keyboard ); it != keyboards.end() )
        {
          resolved.keyboard = it->second;
        }
        else
        {
          syslog( LOG_WARNING, "[Profiles] Keyboard profile '%s' does not exist, using default", global.keyboard.c_str() );
          resolved.keyboard = defaultKeyboardProfile();
        }

        return resolved;
      } );
    } );
  } );
}

ProfileStatus GlobalProfileCoordinator::reload()
{
  const ResolvedProfile resolved = resolveActiveProfile();

  if ( m_fanController )
    m_fanController->applyFanProfile( resolved.fan );

  if ( m_keyboardController )
    m_keyboardController->applyKeyboardProfile( resolved.keyboard );

  if ( resolved.performanceProfile )
  {
    if ( not m_performanceController )
      tailor::tDebug( "[Profiles] No platform profile support, ignoring '%s'", resolved.performanceProfile->c_str() );
    else if ( not m_performanceController->setPerformanceProfile( *resolved.performanceProfile ) )
      syslog( LOG_WARNING, "[Profiles] Performance profile '%s' of '%s' was not applied",
              resolved.performanceProfile->c_str(), resolved.name.c_str() );
  }

  syslog( LOG_INFO, "[Profiles] Applied profile '%s'", resolved.name.c_str() );
  return ProfileStatus::Ok;
}

ProfileStatus GlobalProfileCoordinator::overrideSpeed( uint8_t percent )
{
  if ( percent > 100 )
    return ProfileStatus::InvalidArgument;

  if ( not m_fanController )
    return ProfileStatus::IoError;

  m_fanController->overrideSpeed( percent );
  return ProfileStatus::Ok;
}

ProfileStatus GlobalProfileCoordinator::overrideColor( const Color &color )
{
  if ( not m_keyboardController )
    return ProfileStatus::IoError;

  m_keyboardController->overrideColor( color );
  return ProfileStatus::Ok;
}
