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
#include "profiles/FanProfile.hpp"
#include "suspend/SuspendListener.hpp"
#include <chrono>
#include <cmath>
#include <memory>
#include <mutex>
#include <optional>

/**
 * @brief Temperature filter using Exponentially Weighted Moving Average (EWMA)
 *
 * Rising readings are followed quickly (alphaRising 0.5), falling ones are
 * smoothed more (alphaFalling 0.15) so the fan does not drop back early.
 */
class TemperatureFilter
{
public:
  TemperatureFilter()
    : m_value( -1.0 )
    , m_alphaRising( 0.5 )
    , m_alphaFalling( 0.15 )
  {}

  void addValue( int raw )
  {
    if ( m_value < 0.0 )
    {
      m_value = static_cast< double >( raw );
      return;
    }

    const double alpha = ( raw > m_value ) ? m_alphaRising : m_alphaFalling;
    m_value = m_value + alpha * ( static_cast< double >( raw ) - m_value );
  }

  int getFilteredValue() const
  {
    return ( m_value < 0.0 ) ? 0 : static_cast< int >( std::round( m_value ) );
  }

  void reset() { m_value = -1.0; }

private:
  double m_value;
  double m_alphaRising;
  double m_alphaFalling;
};

/**
 * @brief Drives the fan from the active curve
 *
 * Every cycle reads the temperature, filters it, looks the speed up in the
 * curve and writes it when it changed. A speed override replaces the curve
 * until the next applyFanProfile(). After a suspend/resume cycle the speed
 * is written again since firmware usually resets the fan on wake-up.
 * Automatic fan control is restored when the worker stops.
 */
class FanControlWorker : public DaemonWorker, public FanController
{
public:
  static constexpr std::chrono::milliseconds DEFAULT_INTERVAL { 1000 };

  /**
   * @param listener Suspend listener, may be null when suspend is not observed
   */
  FanControlWorker( FanBackend &backend,
                    std::unique_ptr< SuspendListener > listener,
                    std::chrono::milliseconds interval = DEFAULT_INTERVAL );

  ~FanControlWorker() override;

  void applyFanProfile( const FanProfile &profile ) override;
  void overrideSpeed( uint8_t percent ) override;

  [[nodiscard]] FanProfile fanProfile() const;
  [[nodiscard]] std::optional< uint8_t > speedOverride() const;

  /**
   * @brief Last speed written to the backend, -1 if none yet
   */
  [[nodiscard]] int32_t appliedSpeed() const noexcept { return m_appliedSpeed.load(); }

protected:
  void onStart() override;
  void onWork() override;
  void onExit() override;

private:
  FanBackend &m_backend;
  std::unique_ptr< SuspendListener > m_listener;

  mutable std::mutex m_mutex;
  FanProfile m_profile;
  std::optional< uint8_t > m_override;

  TemperatureFilter m_filter;
  std::atomic< int32_t > m_appliedSpeed { -1 };
  bool m_temperatureErrorLogged = false;
};
