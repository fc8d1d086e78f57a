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

#include "suspend/SuspendListener.hpp"
#include "TestUtils.hpp"

#include <atomic>
#include <future>
#include <gtest/gtest.h>
#include <thread>

using tailor::test::waitUntil;
using State = SuspendListener::State;

TEST( SuspendListenerTest, CheckWithoutEventsReturnsImmediately )
{
  SuspendBroadcast broadcast;
  SuspendListener listener( broadcast.subscribe() );

  EXPECT_FALSE( listener.checkSuspend() );
  EXPECT_EQ( listener.state(), State::Active );
}

TEST( SuspendListenerTest, CheckReportsCompletedCycle )
{
  SuspendBroadcast broadcast;
  SuspendListener listener( broadcast.subscribe() );

  ASSERT_TRUE( broadcast.send( true ) );
  ASSERT_TRUE( broadcast.send( false ) );

  EXPECT_TRUE( listener.checkSuspend() );
  EXPECT_EQ( listener.state(), State::Active );
  EXPECT_FALSE( listener.checkSuspend() );
}

TEST( SuspendListenerTest, CheckBlocksWhileSuspended )
{
  SuspendBroadcast broadcast;
  SuspendListener listener( broadcast.subscribe() );
  ASSERT_TRUE( broadcast.send( true ) );

  auto result = std::async( std::launch::async, [ &listener ] { return listener.checkSuspend(); } );

  ASSERT_TRUE( waitUntil( [ &listener ] { return listener.state() == State::SuspendedWaitingForWake; } ) );
  EXPECT_EQ( result.wait_for( std::chrono::milliseconds( 50 ) ), std::future_status::timeout );

  ASSERT_TRUE( broadcast.send( false ) );
  EXPECT_TRUE( result.get() );
  EXPECT_EQ( listener.state(), State::Active );
}

TEST( SuspendListenerTest, RepeatedSuspendIsIgnoredUntilWake )
{
  SuspendBroadcast broadcast;
  SuspendListener listener( broadcast.subscribe() );

  ASSERT_TRUE( broadcast.send( true ) );
  ASSERT_TRUE( broadcast.send( true ) );
  ASSERT_TRUE( broadcast.send( false ) );

  EXPECT_TRUE( listener.checkSuspend() );
  EXPECT_EQ( listener.state(), State::Active );
}

TEST( SuspendListenerTest, WakeWithoutSuspendIsNotACycle )
{
  SuspendBroadcast broadcast;
  SuspendListener listener( broadcast.subscribe() );

  ASSERT_TRUE( broadcast.send( false ) );
  EXPECT_FALSE( listener.checkSuspend() );
}

TEST( SuspendListenerTest, WaitForCycleReturnsAfterWake )
{
  SuspendBroadcast broadcast;
  SuspendListener listener( broadcast.subscribe() );

  auto done = std::async( std::launch::async, [ &listener ] { listener.waitForSuspendCycle(); } );

  ASSERT_TRUE( waitUntil( [ &listener ] { return listener.state() == State::WaitingForSuspendEvent; } ) );
  ASSERT_TRUE( broadcast.send( true ) );
  ASSERT_TRUE( waitUntil( [ &listener ] { return listener.state() == State::SuspendedWaitingForWake; } ) );
  ASSERT_TRUE( broadcast.send( false ) );

  EXPECT_EQ( done.wait_for( std::chrono::seconds( 2 ) ), std::future_status::ready );
  EXPECT_EQ( listener.state(), State::Active );
}

TEST( SuspendListenerTest, WaitForCycleReturnsOnStrayWake )
{
  SuspendBroadcast broadcast;
  SuspendListener listener( broadcast.subscribe() );
  ASSERT_TRUE( broadcast.send( false ) );

  listener.waitForSuspendCycle();
  EXPECT_EQ( listener.state(), State::Active );
}

TEST( SuspendListenerTest, LaggedEventsAreSkipped )
{
  SuspendBroadcast broadcast( 2 );
  SuspendListener listener( broadcast.subscribe() );

  // overflows the ring, the oldest suspend edge is lost
  ASSERT_TRUE( broadcast.send( true ) );
  ASSERT_TRUE( broadcast.send( true ) );
  ASSERT_TRUE( broadcast.send( true ) );
  ASSERT_TRUE( broadcast.send( false ) );

  EXPECT_TRUE( listener.checkSuspend() );
  EXPECT_EQ( listener.state(), State::Active );
}

TEST( SuspendListenerTest, ClosedChannelDisablesCheck )
{
  SuspendBroadcast broadcast;
  SuspendListener listener( broadcast.subscribe() );
  broadcast.close();

  EXPECT_FALSE( listener.checkSuspend() );
  EXPECT_EQ( listener.state(), State::Disabled );

  // stays disabled and keeps returning immediately
  EXPECT_FALSE( listener.checkSuspend() );
  EXPECT_EQ( listener.state(), State::Disabled );
}

TEST( SuspendListenerTest, ClosedChannelParksWaiterUntilShutdown )
{
  SuspendBroadcast broadcast;
  SuspendListener listener( broadcast.subscribe() );

  auto done = std::async( std::launch::async, [ &listener ] { listener.waitForSuspendCycle(); } );
  ASSERT_TRUE( waitUntil( [ &listener ] { return listener.state() == State::WaitingForSuspendEvent; } ) );

  broadcast.close();
  ASSERT_TRUE( waitUntil( [ &listener ] { return listener.state() == State::Disabled; } ) );
  EXPECT_EQ( done.wait_for( std::chrono::milliseconds( 100 ) ), std::future_status::timeout );

  broadcast.shutdown();
  EXPECT_EQ( done.wait_for( std::chrono::seconds( 2 ) ), std::future_status::ready );
}

TEST( SuspendListenerTest, ShutdownWhileSuspendedReleasesLoop )
{
  SuspendBroadcast broadcast;
  SuspendListener listener( broadcast.subscribe() );
  ASSERT_TRUE( broadcast.send( true ) );

  auto result = std::async( std::launch::async, [ &listener ] { return listener.checkSuspend(); } );
  ASSERT_TRUE( waitUntil( [ &listener ] { return listener.state() == State::SuspendedWaitingForWake; } ) );

  broadcast.shutdown();
  EXPECT_TRUE( result.get() );
  EXPECT_EQ( listener.state(), State::Disabled );
}
