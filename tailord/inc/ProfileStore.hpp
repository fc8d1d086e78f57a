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

#include "ProfileStatus.hpp"
#include "JsonFile.hpp"
#include "TailorLog.hpp"
#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <functional>
#include <filesystem>
#include <syslog.h>
#include <nlohmann/json.hpp>

/**
 * @brief Durable named-profile store
 *
 * Maps profile names to payloads of one kind. The payload is opaque to the
 * store; it is only converted with to_json()/from_json() for persistence.
 * Every operation runs under one mutex, so operations on one store are
 * linearizable. Mutations are written to disk before they become visible.
 *
 * On disk a store is a single JSON document {"profiles": {name: payload}}.
 *
 * @tparam T Profile payload type
 */
template< typename T >
class ProfileStore
{
public:
  using ProfileMap = std::map< std::string, T >;

  /**
   * @brief Hook run inside renameProfile() after the new key set has been
   * persisted and before it becomes visible. A non-Ok result aborts the
   * rename and restores the previous file.
   */
  using RenameCascade = std::function< ProfileStatus( const std::string &from, const std::string &to ) >;

  /**
   * @param kind Short name used in log messages ("fan", "keyboard", ...)
   * @param file Backing JSON file
   */
  ProfileStore( std::string kind, std::filesystem::path file )
    : m_kind( std::move( kind ) ),
      m_file( std::move( file ) )
  {
  }

  ProfileStore( const ProfileStore & ) = delete;
  ProfileStore &operator=( const ProfileStore & ) = delete;

  /**
   * @brief Replace the in-memory state with the backing file
   *
   * Entries that do not convert to T are skipped with an error message. The
   * file is then kept as a ".corrupted_<timestamp>" copy, since the next
   * write replaces it with the reduced set.
   * @return Ok, or IoError if the file and its backup are unreadable (the
   *         store is left empty in that case)
   */
  ProfileStatus load()
  {
    std::lock_guard< std::mutex > lock( m_mutex );
    m_profiles.clear();

    nlohmann::json document;
    switch ( tailor::readJsonFile( m_file, document ) )
    {
      case tailor::JsonFileState::Missing:
        syslog( LOG_INFO, "[ProfileStore] No %s profiles stored yet (%s)", m_kind.c_str(), m_file.c_str() );
        return ProfileStatus::Ok;
      case tailor::JsonFileState::Corrupted:
        return ProfileStatus::IoError;
      case tailor::JsonFileState::Loaded:
        break;
    }

    if ( not document.is_object() or not document.contains( "profiles" ) or not document[ "profiles" ].is_object() )
    {
      syslog( LOG_ERR, "[ProfileStore] %s has no \"profiles\" object", m_file.c_str() );
      tailor::keepCorruptedCopy( m_file );
      return ProfileStatus::IoError;
    }

    size_t skipped = 0;
    for ( const auto &[ name, value ] : document[ "profiles" ].items() )
    {
      try
      {
        if ( name.empty() )
        {
          syslog( LOG_ERR, "[ProfileStore] Skipping %s profile with empty name", m_kind.c_str() );
          ++skipped;
          continue;
        }

        m_profiles.emplace( name, value.template get< T >() );
      }
      catch ( const std::exception &e )
      {
        syslog( LOG_ERR, "[ProfileStore] Skipping %s profile '%s': %s", m_kind.c_str(), name.c_str(), e.what() );
        ++skipped;
      }
    }

    if ( skipped > 0 )
      tailor::keepCorruptedCopy( m_file );

    syslog( LOG_INFO, "[ProfileStore] Loaded %zu %s profile(s)", m_profiles.size(), m_kind.c_str() );
    return ProfileStatus::Ok;
  }

  /**
   * @brief Insert or overwrite a profile
   */
  ProfileStatus addProfile( const std::string &name, const T &data )
  {
    if ( name.empty() )
      return ProfileStatus::InvalidArgument;

    std::lock_guard< std::mutex > lock( m_mutex );
    ProfileMap updated = m_profiles;
    updated.insert_or_assign( name, data );

    if ( not persist( updated ) )
      return ProfileStatus::IoError;

    m_profiles = std::move( updated );
    return ProfileStatus::Ok;
  }

  ProfileStatus getProfile( const std::string &name, T &data ) const
  {
    std::lock_guard< std::mutex > lock( m_mutex );
    auto it = m_profiles.find( name );
    if ( it == m_profiles.end() )
      return ProfileStatus::NotFound;

    data = it->second;
    return ProfileStatus::Ok;
  }

  /**
   * @brief Names of all profiles, in byte order
   */
  [[nodiscard]] std::vector< std::string > listProfiles() const
  {
    std::lock_guard< std::mutex > lock( m_mutex );
    return namesOf( m_profiles );
  }

  [[nodiscard]] bool contains( const std::string &name ) const
  {
    std::lock_guard< std::mutex > lock( m_mutex );
    return m_profiles.find( name ) != m_profiles.end();
  }

  ProfileStatus removeProfile( const std::string &name )
  {
    std::lock_guard< std::mutex > lock( m_mutex );
    if ( m_profiles.find( name ) == m_profiles.end() )
      return ProfileStatus::NotFound;

    ProfileMap updated = m_profiles;
    updated.erase( name );

    if ( not persist( updated ) )
      return ProfileStatus::IoError;

    m_profiles = std::move( updated );
    return ProfileStatus::Ok;
  }

  /**
   * @brief Atomically rename a profile
   *
   * @param from Existing name
   * @param to New name, must not exist yet
   * @param names Receives the updated list of names on success
   * @param cascade Optional hook updating other stores in the same step
   */
  ProfileStatus renameProfile( const std::string &from, const std::string &to,
                               std::vector< std::string > &names,
                               const RenameCascade &cascade = {} )
  {
    if ( to.empty() )
      return ProfileStatus::InvalidArgument;

    std::lock_guard< std::mutex > lock( m_mutex );
    auto node = m_profiles.find( from );
    if ( node == m_profiles.end() )
      return ProfileStatus::NotFound;

    if ( m_profiles.find( to ) != m_profiles.end() )
      return ProfileStatus::Conflict;

    ProfileMap updated = m_profiles;
    auto extracted = updated.extract( from );
    extracted.key() = to;
    updated.insert( std::move( extracted ) );

    if ( not persist( updated ) )
      return ProfileStatus::IoError;

    if ( cascade )
    {
      const ProfileStatus cascadeStatus = cascade( from, to );
      if ( cascadeStatus != ProfileStatus::Ok )
      {
        syslog( LOG_ERR, "[ProfileStore] Rename of %s profile '%s' aborted, cascade failed: %s",
                m_kind.c_str(), from.c_str(), profileStatusToString( cascadeStatus ) );
        // the backup already holds the state being restored
        if ( not persist( m_profiles, false ) )
          syslog( LOG_ERR, "[ProfileStore] Failed to restore %s after aborted rename", m_file.c_str() );
        return cascadeStatus;
      }
    }

    m_profiles = std::move( updated );
    names = namesOf( m_profiles );
    syslog( LOG_INFO, "[ProfileStore] Renamed %s profile '%s' to '%s'", m_kind.c_str(), from.c_str(), to.c_str() );
    return ProfileStatus::Ok;
  }

  /**
   * @brief Copy a profile under a new name, overwriting an existing target
   */
  ProfileStatus copyProfile( const std::string &from, const std::string &to )
  {
    if ( to.empty() )
      return ProfileStatus::InvalidArgument;

    std::lock_guard< std::mutex > lock( m_mutex );
    auto source = m_profiles.find( from );
    if ( source == m_profiles.end() )
      return ProfileStatus::NotFound;

    ProfileMap updated = m_profiles;
    updated.insert_or_assign( to, source->second );

    if ( not persist( updated ) )
      return ProfileStatus::IoError;

    m_profiles = std::move( updated );
    return ProfileStatus::Ok;
  }

  /**
   * @brief Modify any number of profiles in one persisted step
   *
   * @param update Called for every profile; returns true if it changed it
   * @return Ok if nothing changed or the changes were persisted
   */
  ProfileStatus updateProfiles( const std::function< bool( const std::string &, T & ) > &update )
  {
    std::lock_guard< std::mutex > lock( m_mutex );
    ProfileMap updated = m_profiles;

    size_t changed = 0;
    for ( auto &[ name, data ] : updated )
    {
      if ( update( name, data ) )
        ++changed;
    }

    if ( changed == 0 )
      return ProfileStatus::Ok;

    if ( not persist( updated ) )
      return ProfileStatus::IoError;

    m_profiles = std::move( updated );
    tailor::tDebug( "[ProfileStore] Updated %zu %s profile(s)", changed, m_kind.c_str() );
    return ProfileStatus::Ok;
  }

  /**
   * @brief Run fn with the profiles while holding the store lock
   *
   * Used to take consistent snapshots across several stores; callers must
   * nest stores in a fixed order.
   */
  template< typename Fn >
  decltype( auto ) withProfiles( Fn &&fn ) const
  {
    std::lock_guard< std::mutex > lock( m_mutex );
    return fn( static_cast< const ProfileMap & >( m_profiles ) );
  }

  [[nodiscard]] const std::string &kind() const noexcept { return m_kind; }

  [[nodiscard]] const std::filesystem::path &file() const noexcept { return m_file; }

private:
  std::string m_kind;
  std::filesystem::path m_file;
  mutable std::mutex m_mutex;
  ProfileMap m_profiles;

  [[nodiscard]] static std::vector< std::string > namesOf( const ProfileMap &profiles )
  {
    std::vector< std::string > names;
    names.reserve( profiles.size() );
    for ( const auto &entry : profiles )
      names.push_back( entry.first );
    return names;
  }

  [[nodiscard]] bool persist( const ProfileMap &profiles, bool rotateBackup = true ) const noexcept
  {
    try
    {
      nlohmann::json document;
      document[ "profiles" ] = nlohmann::json::object();
      for ( const auto &[ name, data ] : profiles )
        document[ "profiles" ][ name ] = data;

      return tailor::writeJsonFile( m_file, document, rotateBackup );
    }
    catch ( const std::exception &e )
    {
      syslog( LOG_ERR, "[ProfileStore] Failed to serialize %s profiles: %s", m_kind.c_str(), e.what() );
      return false;
    }
  }
};
