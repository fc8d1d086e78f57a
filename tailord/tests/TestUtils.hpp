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
#include "suspend/SleepSignalSource.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <stdexcept>
#include <stdlib.h>
#include <deque>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace tailor::test
{

/**
 * @brief Temporary directory removed on destruction
 */
class TempDir
{
public:
  TempDir()
  {
    std::string pattern = ( std::filesystem::temp_directory_path() / "tailord-test-XXXXXX" ).string();
    if ( ::mkdtemp( pattern.data() ) == nullptr )
      throw std::runtime_error( "mkdtemp failed" );
    m_path = pattern;
  }

  ~TempDir()
  {
    std::error_code ec;
    std::filesystem::remove_all( m_path, ec );
  }

  TempDir( const TempDir & ) = delete;
  TempDir &operator=( const TempDir & ) = delete;

  [[nodiscard]] const std::filesystem::path &path() const noexcept { return m_path; }

private:
  std::filesystem::path m_path;
};

/**
 * @brief Poll a condition until it holds or the timeout expires
 */
inline bool waitUntil( const std::function< bool() > &condition,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds( 2000 ) )
{
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while ( std::chrono::steady_clock::now() < deadline )
  {
    if ( condition() )
      return true;
    std::this_thread::sleep_for( std::chrono::milliseconds( 5 ) );
  }
  return condition();
}

class FakeFanBackend : public FanBackend
{
public:
  std::atomic< int32_t > temperature { 50 };
  std::atomic< bool > temperatureReadable { true };
  std::atomic< int32_t > writes { 0 };
  std::atomic< int32_t > lastSpeed { -1 };
  std::atomic< bool > automatic { true };

  [[nodiscard]] bool isAvailable() const override { return true; }

  bool readTemperature( int32_t &celsius ) override
  {
    if ( not temperatureReadable )
      return false;
    celsius = temperature;
    return true;
  }

  bool setSpeedPercent( int32_t percent ) override
  {
    lastSpeed = percent;
    automatic = false;
    ++writes;
    return true;
  }

  bool restoreAutomatic() override
  {
    automatic = true;
    return true;
  }
};

class FakeKeyboardBackend : public KeyboardBackend
{
public:
  [[nodiscard]] bool isAvailable() const override { return true; }

  bool setColor( const Color &color ) override
  {
    std::lock_guard< std::mutex > lock( m_mutex );
    m_colors.push_back( color );
    return true;
  }

  [[nodiscard]] std::vector< Color > colors() const
  {
    std::lock_guard< std::mutex > lock( m_mutex );
    return m_colors;
  }

  [[nodiscard]] size_t writeCount() const
  {
    std::lock_guard< std::mutex > lock( m_mutex );
    return m_colors.size();
  }

private:
  mutable std::mutex m_mutex;
  std::vector< Color > m_colors;
};

class RecordingFanController : public FanController
{
public:
  std::vector< FanProfile > applied;
  std::vector< uint8_t > overrides;

  void applyFanProfile( const FanProfile &profile ) override { applied.push_back( profile ); }
  void overrideSpeed( uint8_t percent ) override { overrides.push_back( percent ); }
};

class RecordingKeyboardController : public KeyboardController
{
public:
  std::vector< KeyboardProfile > applied;
  std::vector< Color > overrides;

  void applyKeyboardProfile( const KeyboardProfile &profile ) override { applied.push_back( profile ); }
  void overrideColor( const Color &color ) override { overrides.push_back( color ); }
};

class RecordingPerformanceController : public PerformanceProfileController
{
public:
  std::vector< std::string > applied;
  bool accept = true;

  bool setPerformanceProfile( const std::string &name ) override
  {
    applied.push_back( name );
    return accept;
  }
};

/**
 * @brief Scripted sleep signal source
 *
 * Each listen() call consumes one scripted attempt. A failing attempt
 * returns false immediately; a succeeding one delivers its events and then
 * blocks until interrupt() or drop().
 */
class FakeSleepSource : public SleepSignalSource
{
public:
  struct Attempt
  {
    bool connect = true;
    std::vector< bool > events;
  };

  explicit FakeSleepSource( std::vector< Attempt > attempts )
    : m_attempts( attempts.begin(), attempts.end() )
  {
  }

  bool listen( const EventCallback &onEvent, std::string &error ) override
  {
    Attempt attempt;
    {
      std::lock_guard< std::mutex > lock( m_mutex );
      ++m_calls;
      if ( m_interrupted )
        return true;

      if ( m_attempts.empty() )
      {
        error = "no more scripted connections";
        return false;
      }

      attempt = m_attempts.front();
      m_attempts.pop_front();
    }

    if ( not attempt.connect )
    {
      error = "connection refused";
      return false;
    }

    for ( const bool event : attempt.events )
      onEvent( event );

    std::unique_lock< std::mutex > lock( m_mutex );
    m_listening = true;
    m_cv.wait( lock, [ this ] { return m_interrupted or m_dropped; } );
    m_listening = false;

    if ( m_interrupted )
      return true;

    m_dropped = false;
    error = "connection dropped";
    return false;
  }

  void interrupt() override
  {
    {
      std::lock_guard< std::mutex > lock( m_mutex );
      m_interrupted = true;
    }
    m_cv.notify_all();
  }

  /**
   * @brief End the current subscription as if the bus went away
   */
  void drop()
  {
    {
      std::lock_guard< std::mutex > lock( m_mutex );
      m_dropped = true;
    }
    m_cv.notify_all();
  }

  [[nodiscard]] int calls() const
  {
    std::lock_guard< std::mutex > lock( m_mutex );
    return m_calls;
  }

  [[nodiscard]] bool listening() const
  {
    std::lock_guard< std::mutex > lock( m_mutex );
    return m_listening;
  }

private:
  mutable std::mutex m_mutex;
  std::condition_variable m_cv;
  std::deque< Attempt > m_attempts;
  int m_calls = 0;
  bool m_interrupted = false;
  bool m_dropped = false;
  bool m_listening = false;
};

} // namespace tailor::test
