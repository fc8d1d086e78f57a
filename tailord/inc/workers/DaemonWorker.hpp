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

#include "../TailorLog.hpp"
#include <chrono>
#include <atomic>
#include <mutex>
#include <condition_variable>
#include <syslog.h>
#include <QThread>
#include <typeinfo>

/**
 * @brief Abstract base class for daemon worker threads
 *
 * Runs onStart() once, then onWork() repeatedly with the configured idle
 * interval in between, then onExit(). The idle interval is interruptible:
 * stop() wakes a sleeping worker immediately instead of waiting for the
 * interval to elapse.
 *
 * Workers are started explicitly with start(); constructing a worker never
 * spawns its thread, because run() dispatches to virtuals of the derived
 * class.
 */
class DaemonWorker : public QThread
{
  Q_OBJECT

public:
  /**
   * @brief Constructor
   * @param timeout Idle duration between work cycles
   */
  explicit DaemonWorker( std::chrono::milliseconds timeout )
    : m_timeout( timeout ), m_isRunning( false )
  {
  }

  /**
   * @brief Virtual destructor
   *
   * Stops the thread. onExit() is not called when the thread stops due to
   * destruction because the derived part is already gone; derived classes
   * that need cleanup call stop() in their own destructor.
   */
  virtual ~DaemonWorker() noexcept
  {
    m_destroying = true;
    stop();
  }

  DaemonWorker( const DaemonWorker & ) = delete;
  DaemonWorker( DaemonWorker && ) = delete;
  DaemonWorker &operator=( const DaemonWorker & ) = delete;
  DaemonWorker &operator=( DaemonWorker && ) = delete;

  /**
   * @brief Gracefully stop the worker thread and wait for it to finish
   */
  void stop()
  {
    if ( m_isRunning.exchange( false ) )
    {
      {
        std::lock_guard< std::mutex > lock( m_idleMutex );
      }
      m_idleCondition.notify_all();
      onStopRequested();
    }

    QThread::wait();
  }

  /**
   * @brief Start the worker thread
   */
  void start()
  {
    if ( m_isRunning.exchange( true ) )
      return;

    QThread::start();
  }

  [[nodiscard]] std::chrono::milliseconds getTimeout() const noexcept
  {
    return m_timeout;
  }

  [[nodiscard]] bool isRunning() const noexcept
  {
    return m_isRunning;
  }

protected:
  void run() override
  {
    try
    {
      tailor::tDebug( "[DEBUG] DaemonWorker: starting %s", typeid( *this ).name() );
      onStart();

      while ( m_isRunning )
      {
        onWork();

        if ( not idleFor( m_timeout ) )
          break;
      }

      tailor::tDebug( "[DEBUG] DaemonWorker: exiting %s", typeid( *this ).name() );
      if ( not m_destroying )
        onExit();
    }
    catch ( const std::exception &e )
    {
      syslog( LOG_ERR, "[Worker] %s terminated by exception: %s", typeid( *this ).name(), e.what() );
    }
  }

  /**
   * @brief Sleep for the given duration unless the worker is stopped
   * @return false if the worker was stopped while (or before) idling
   */
  bool idleFor( std::chrono::milliseconds duration )
  {
    std::unique_lock< std::mutex > lock( m_idleMutex );
    if ( duration.count() > 0 )
      m_idleCondition.wait_for( lock, duration, [ this ] { return not m_isRunning; } );

    return m_isRunning;
  }

  /**
   * @brief Leave the work loop after the current cycle, from inside the worker
   */
  void requestStop() noexcept
  {
    m_isRunning = false;
  }

  /**
   * @brief Called on the stopping thread when stop() is requested
   *
   * Workers that block inside onWork() on something other than idleFor()
   * override this to unblock themselves.
   */
  virtual void onStopRequested() {}

  virtual void onStart() = 0;
  virtual void onWork() = 0;
  virtual void onExit() = 0;

private:
  const std::chrono::milliseconds m_timeout;
  std::atomic< bool > m_isRunning;
  std::atomic< bool > m_destroying { false };
  std::mutex m_idleMutex;
  std::condition_variable m_idleCondition;
};
