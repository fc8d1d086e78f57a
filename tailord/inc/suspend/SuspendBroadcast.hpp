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

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <condition_variable>

/**
 * @brief Fan-out channel for sleep transitions
 *
 * Publishes PrepareForSleep edges (true = going to sleep, false = woke up)
 * to any number of receivers. Events are kept in a bounded ring; every
 * receiver has its own cursor. A receiver that falls further behind than
 * the ring capacity is told once that it lagged and continues at the
 * oldest retained event. Publishing never blocks.
 *
 * Receivers only see events sent after they subscribed.
 */
class SuspendBroadcast
{
  struct State
  {
    explicit State( size_t cap ) : capacity( cap ) {}

    const size_t capacity;
    std::mutex mutex;
    std::condition_variable cv;
    std::deque< bool > events;
    uint64_t headSeq = 0;  // sequence number of events.front()
    uint64_t nextSeq = 0;  // sequence number of the next event sent
    size_t receivers = 0;
    bool closed = false;
    bool shutdown = false;
  };

public:
  static constexpr size_t DEFAULT_CAPACITY = 16;

  enum class RecvStatus
  {
    Ok,      // value holds the next event
    Lagged,  // events were overwritten, cursor moved to the oldest kept one
    Empty,   // tryRecv() only: nothing queued right now
    Closed   // channel closed and drained
  };

  /**
   * @brief Subscription to a SuspendBroadcast
   *
   * May outlive the broadcast object; the channel state is shared.
   */
  class Receiver
  {
  public:
    Receiver() = default;

    Receiver( Receiver &&other ) noexcept
      : m_state( std::move( other.m_state ) ), m_cursor( other.m_cursor ), m_missed( other.m_missed )
    {
    }

    Receiver &operator=( Receiver &&other ) noexcept
    {
      if ( this != &other )
      {
        release();
        m_state = std::move( other.m_state );
        m_cursor = other.m_cursor;
        m_missed = other.m_missed;
      }
      return *this;
    }

    Receiver( const Receiver & ) = delete;
    Receiver &operator=( const Receiver & ) = delete;

    ~Receiver() { release(); }

    [[nodiscard]] bool isValid() const noexcept { return m_state != nullptr; }

    /**
     * @brief Block until an event is available or the channel is closed
     */
    RecvStatus recv( bool &value )
    {
      if ( not m_state )
        return RecvStatus::Closed;

      std::unique_lock< std::mutex > lock( m_state->mutex );
      m_state->cv.wait( lock, [ this ] {
        return m_cursor < m_state->nextSeq or m_state->closed;
      } );
      return take( value );
    }

    /**
     * @brief Take the next event if one is queued, never blocks
     */
    RecvStatus tryRecv( bool &value )
    {
      if ( not m_state )
        return RecvStatus::Closed;

      std::lock_guard< std::mutex > lock( m_state->mutex );
      if ( m_cursor >= m_state->nextSeq and not m_state->closed )
        return RecvStatus::Empty;
      return take( value );
    }

    /**
     * @brief Number of events skipped by the last Lagged result
     */
    [[nodiscard]] uint64_t missed() const noexcept { return m_missed; }

    /**
     * @brief Park the calling thread until the broadcast is shut down
     */
    void waitForShutdown()
    {
      if ( not m_state )
        return;

      std::unique_lock< std::mutex > lock( m_state->mutex );
      m_state->cv.wait( lock, [ this ] { return m_state->shutdown; } );
    }

  private:
    friend class SuspendBroadcast;

    Receiver( std::shared_ptr< State > state, uint64_t cursor )
      : m_state( std::move( state ) ), m_cursor( cursor )
    {
    }

    std::shared_ptr< State > m_state;
    uint64_t m_cursor = 0;
    uint64_t m_missed = 0;

    // caller holds the state mutex
    RecvStatus take( bool &value )
    {
      if ( m_cursor < m_state->headSeq )
      {
        m_missed = m_state->headSeq - m_cursor;
        m_cursor = m_state->headSeq;
        return RecvStatus::Lagged;
      }

      if ( m_cursor < m_state->nextSeq )
      {
        value = m_state->events[ m_cursor - m_state->headSeq ];
        ++m_cursor;
        return RecvStatus::Ok;
      }

      return RecvStatus::Closed;
    }

    void release() noexcept
    {
      if ( not m_state )
        return;

      std::lock_guard< std::mutex > lock( m_state->mutex );
      --m_state->receivers;
      m_state = nullptr;
    }
  };

  explicit SuspendBroadcast( size_t capacity = DEFAULT_CAPACITY )
    : m_state( std::make_shared< State >( capacity == 0 ? 1 : capacity ) )
  {
  }

  SuspendBroadcast( const SuspendBroadcast & ) = delete;
  SuspendBroadcast &operator=( const SuspendBroadcast & ) = delete;

  /**
   * @brief Publish a sleep transition
   * @return false if the event was dropped (no receivers or closed)
   */
  bool send( bool goingToSleep )
  {
    {
      std::lock_guard< std::mutex > lock( m_state->mutex );
      if ( m_state->closed or m_state->receivers == 0 )
        return false;

      m_state->events.push_back( goingToSleep );
      ++m_state->nextSeq;
      if ( m_state->events.size() > m_state->capacity )
      {
        m_state->events.pop_front();
        ++m_state->headSeq;
      }
    }

    m_state->cv.notify_all();
    return true;
  }

  [[nodiscard]] Receiver subscribe()
  {
    std::lock_guard< std::mutex > lock( m_state->mutex );
    ++m_state->receivers;
    return Receiver( m_state, m_state->nextSeq );
  }

  /**
   * @brief No further events; receivers drain what is queued, then get Closed
   */
  void close()
  {
    {
      std::lock_guard< std::mutex > lock( m_state->mutex );
      m_state->closed = true;
    }
    m_state->cv.notify_all();
  }

  /**
   * @brief Close the channel and release receivers parked in waitForShutdown()
   */
  void shutdown()
  {
    {
      std::lock_guard< std::mutex > lock( m_state->mutex );
      m_state->closed = true;
      m_state->shutdown = true;
    }
    m_state->cv.notify_all();
  }

  [[nodiscard]] bool isClosed() const
  {
    std::lock_guard< std::mutex > lock( m_state->mutex );
    return m_state->closed;
  }

  [[nodiscard]] size_t receiverCount() const
  {
    std::lock_guard< std::mutex > lock( m_state->mutex );
    return m_state->receivers;
  }

private:
  std::shared_ptr< State > m_state;
};
