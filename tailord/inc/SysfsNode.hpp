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
#include <vector>
#include <fstream>
#include <sstream>
#include <optional>
#include <filesystem>
#include <cstdint>
#include <type_traits>
#include <utility>

/**
 * @brief Typed access to a single sysfs attribute
 *
 * Supported types:
 * - int32_t
 * - std::string (first line, without line ending)
 * - std::vector<int32_t> (delimiter separated, e.g. LED multi_intensity)
 *
 * @tparam T Value type of the attribute
 */
template< typename T >
class SysfsNode
{
public:
  explicit SysfsNode( std::filesystem::path path, char delimiter = ' ' )
    : m_path( std::move( path ) )
    , m_delimiter( delimiter )
  {}

  [[nodiscard]] bool isAvailable() const noexcept
  {
    std::error_code ec;
    return std::filesystem::exists( m_path, ec );
  }

  /**
   * @return Parsed value, or nullopt if the attribute is missing or malformed
   */
  [[nodiscard]] std::optional< T > read() const noexcept
  {
    try
    {
      std::ifstream file( m_path );

      if ( not file.is_open() )
        return std::nullopt;

      return readImpl( file );
    }
    catch ( const std::exception & )
    {
      return std::nullopt;
    }
  }

  bool write( const T &value ) noexcept
  {
    try
    {
      std::ofstream file( m_path );

      if ( not file.is_open() )
        return false;

      writeImpl( file, value );
      file.flush();
      return not file.fail();
    }
    catch ( const std::exception & )
    {
      return false;
    }
  }

  [[nodiscard]] const std::filesystem::path &path() const noexcept { return m_path; }

private:
  std::filesystem::path m_path;
  char m_delimiter;

  [[nodiscard]] std::optional< T > readImpl( std::ifstream &file ) const
    requires std::is_same_v< T, int32_t >
  {
    int32_t value;
    file >> value;

    if ( file.fail() )
      return std::nullopt;

    return value;
  }

  void writeImpl( std::ofstream &file, const T &value ) const
    requires std::is_same_v< T, int32_t >
  {
    file << value;
  }

  [[nodiscard]] std::optional< T > readImpl( std::ifstream &file ) const
    requires std::is_same_v< T, std::string >
  {
    std::string value;
    std::getline( file, value );

    if ( file.fail() )
      return std::nullopt;

    if ( not value.empty() and value.back() == '\r' )
      value.pop_back();

    return value;
  }

  void writeImpl( std::ofstream &file, const T &value ) const
    requires std::is_same_v< T, std::string >
  {
    file << value;
  }

  [[nodiscard]] std::optional< T > readImpl( std::ifstream &file ) const
    requires std::is_same_v< T, std::vector< int32_t > >
  {
    std::string line;
    std::getline( file, line );

    if ( file.fail() or line.empty() )
      return std::nullopt;

    std::vector< int32_t > result;
    std::istringstream iss( line );
    std::string token;

    while ( std::getline( iss, token, m_delimiter ) )
    {
      token.erase( 0, token.find_first_not_of( " \t\n\r" ) );
      token.erase( token.find_last_not_of( " \t\n\r" ) + 1 );

      if ( token.empty() )
        continue;

      result.push_back( std::stoi( token ) );
    }

    return result;
  }

  void writeImpl( std::ofstream &file, const T &value ) const
    requires std::is_same_v< T, std::vector< int32_t > >
  {
    for ( size_t i = 0; i < value.size(); ++i )
    {
      if ( i > 0 )
        file << m_delimiter;

      file << value[ i ];
    }
  }
};
