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
#include <fstream>
#include <filesystem>
#include <sstream>
#include <optional>
#include <ctime>
#include <iomanip>
#include <syslog.h>
#include <nlohmann/json.hpp>

namespace tailor
{

enum class JsonFileState
{
  Loaded,     // file parsed (possibly recovered from backup)
  Missing,    // no file and no backup, caller starts from defaults
  Corrupted   // file and backup unusable
};

namespace detail
{

[[nodiscard]] inline std::optional< nlohmann::json > parseJsonFile( const std::filesystem::path &path ) noexcept
{
  try
  {
    std::ifstream file( path );
    if ( not file )
      return std::nullopt;

    std::string content( ( std::istreambuf_iterator< char >( file ) ),
                         std::istreambuf_iterator< char >() );
    return nlohmann::json::parse( content );
  }
  catch ( const std::exception &e )
  {
    syslog( LOG_ERR, "[JsonFile] Failed to parse %s: %s", path.c_str(), e.what() );
    return std::nullopt;
  }
}

[[nodiscard]] inline std::filesystem::path backupPathFor( const std::filesystem::path &path )
{
  return std::filesystem::path( path.string() + ".backup" );
}

} // namespace detail

/**
 * @brief Copy a file that cannot be used as-is to "<file>.corrupted_<timestamp>"
 * @return false if the copy could not be made
 */
inline bool keepCorruptedCopy( const std::filesystem::path &path ) noexcept
{
  namespace fs = std::filesystem;

  try
  {
    auto now = std::time( nullptr );
    auto tm = *std::localtime( &now );
    std::ostringstream datetimeOss;
    datetimeOss << std::put_time( &tm, "%Y%m%d_%H%M%S" );
    const std::string base = path.string() + ".corrupted_" + datetimeOss.str();

    // never replace an earlier copy taken in the same second
    fs::path corrupted( base );
    for ( int n = 1; fs::exists( corrupted ); ++n )
      corrupted = base + "_" + std::to_string( n );

    std::error_code ec;
    fs::copy_file( path, corrupted, fs::copy_options::none, ec );
    if ( ec )
    {
      syslog( LOG_WARNING, "[JsonFile] Failed to keep corrupted %s: %s", path.c_str(), ec.message().c_str() );
      return false;
    }

    syslog( LOG_WARNING, "[JsonFile] Saved corrupted file as %s", corrupted.c_str() );
    return true;
  }
  catch ( const std::exception &e )
  {
    syslog( LOG_WARNING, "[JsonFile] Failed to keep corrupted %s: %s", path.c_str(), e.what() );
    return false;
  }
}

/**
 * @brief Read a JSON document, falling back to its ".backup" sibling
 *
 * A file that exists but cannot be parsed is copied aside as
 * "<file>.corrupted_<timestamp>" before the backup is tried, so nothing the
 * user wrote is lost when the daemon later rewrites the file.
 *
 * @param path File to read
 * @param out Parsed document when the result is Loaded
 */
[[nodiscard]] inline JsonFileState readJsonFile( const std::filesystem::path &path, nlohmann::json &out ) noexcept
{
  namespace fs = std::filesystem;

  try
  {
    const fs::path backupFile = detail::backupPathFor( path );
    const bool haveFile = fs::exists( path );
    const bool haveBackup = fs::exists( backupFile );

    if ( not haveFile and not haveBackup )
      return JsonFileState::Missing;

    if ( haveFile )
    {
      if ( auto parsed = detail::parseJsonFile( path ) )
      {
        out = std::move( *parsed );
        return JsonFileState::Loaded;
      }

      keepCorruptedCopy( path );
    }

    if ( haveBackup )
    {
      if ( auto parsed = detail::parseJsonFile( backupFile ) )
      {
        syslog( LOG_NOTICE, "[JsonFile] Recovered %s from backup", path.c_str() );

        // the next write backs up the current file, it must not be the broken one
        std::error_code ec;
        fs::copy_file( backupFile, path, fs::copy_options::overwrite_existing, ec );
        if ( ec )
          syslog( LOG_WARNING, "[JsonFile] Failed to restore %s: %s", path.c_str(), ec.message().c_str() );

        out = std::move( *parsed );
        return JsonFileState::Loaded;
      }

      syslog( LOG_ERR, "[JsonFile] Backup of %s is also corrupted", path.c_str() );
    }
    else
    {
      syslog( LOG_ERR, "[JsonFile] No backup available for %s", path.c_str() );
    }
  }
  catch ( const std::exception &e )
  {
    syslog( LOG_ERR, "[JsonFile] Exception reading %s: %s", path.c_str(), e.what() );
  }

  return JsonFileState::Corrupted;
}

/**
 * @brief Durably replace a JSON document
 *
 * The previous file is copied to "<file>.backup", the new content goes to a
 * temporary sibling which is flushed and renamed over the target. Readers
 * therefore see either the old or the new document, never a partial one.
 *
 * @param rotateBackup false leaves the existing backup untouched, used when
 *        the current file is itself being reverted
 */
[[nodiscard]] inline bool writeJsonFile( const std::filesystem::path &path, const nlohmann::json &document,
                                         bool rotateBackup = true ) noexcept
{
  namespace fs = std::filesystem;

  try
  {
    if ( path.has_parent_path() )
      fs::create_directories( path.parent_path() );

    if ( rotateBackup and fs::exists( path ) )
    {
      std::error_code ec;
      fs::copy_file( path, detail::backupPathFor( path ), fs::copy_options::overwrite_existing, ec );
      if ( ec )
        syslog( LOG_WARNING, "[JsonFile] Failed to back up %s: %s", path.c_str(), ec.message().c_str() );
    }

    const fs::path tmpFile( path.string() + ".tmp" );
    {
      std::ofstream file( tmpFile, std::ios::trunc );
      if ( not file )
      {
        syslog( LOG_ERR, "[JsonFile] Failed to create %s", tmpFile.c_str() );
        return false;
      }

      file << document.dump( 2 ) << '\n';
      file.flush();
      if ( not file )
      {
        syslog( LOG_ERR, "[JsonFile] Failed to write %s", tmpFile.c_str() );
        return false;
      }
    }

    fs::permissions( tmpFile,
                     fs::perms::owner_read | fs::perms::owner_write |
                     fs::perms::group_read | fs::perms::others_read );
    fs::rename( tmpFile, path );
    return true;
  }
  catch ( const std::exception &e )
  {
    syslog( LOG_ERR, "[JsonFile] Exception writing %s: %s", path.c_str(), e.what() );
    return false;
  }
}

} // namespace tailor
