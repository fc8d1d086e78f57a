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

#include "suspend/SuspendBroadcast.hpp"

#include <gtest/gtest.h>
#include <thread>

using RecvStatus = SuspendBroadcast::RecvStatus;

TEST( SuspendBroadcastTest, SendWithoutReceiversIsDropped )
{
  SuspendBroadcast broadcast;
  EXPECT_FALSE( broadcast.send( true ) );

  auto receiver = broadcast.subscribe();
  bool value = false;
  EXPECT_EQ( receiver.tryRecv( value ), RecvStatus::Empty );
}

TEST( SuspendBroadcastTest, EveryReceiverGetsEveryEvent )
{
  SuspendBroadcast broadcast;
  auto first = broadcast.subscribe();
  auto second = broadcast.subscribe();

  EXPECT_TRUE( broadcast.send( true ) );
  EXPECT_TRUE( broadcast.send( false ) );

  for ( auto *receiver : { &first, &second } )
  {
    bool value = false;
    ASSERT_EQ( receiver->tryRecv( value ), RecvStatus::Ok );
    EXPECT_TRUE( value );
    ASSERT_EQ( receiver->tryRecv( value ), RecvStatus::Ok );
    EXPECT_FALSE( value );
    EXPECT_EQ( receiver->tryRecv( value ), RecvStatus::Empty );
  }
}

TEST( SuspendBroadcastTest, LateSubscriberSeesOnlyFutureEvents )
{
  SuspendBroadcast broadcast;
  auto early = broadcast.subscribe();
  ASSERT_TRUE( broadcast.send( true ) );

  auto late = broadcast.subscribe();
  bool value = true;
  EXPECT_EQ( late.tryRecv( value ), RecvStatus::Empty );

  ASSERT_TRUE( broadcast.send( false ) );
  ASSERT_EQ( late.tryRecv( value ), RecvStatus::Ok );
  EXPECT_FALSE( value );
}

TEST( SuspendBroadcastTest, SlowReceiverLagsOnceThenContinues )
{
  SuspendBroadcast broadcast( 4 );
  auto receiver = broadcast.subscribe();

  // 6 events into a ring of 4: the first two are lost
  for ( int i = 0; i < 6; ++i )
    ASSERT_TRUE( broadcast.send( i % 2 == 0 ) );

  bool value = false;
  ASSERT_EQ( receiver.tryRecv( value ), RecvStatus::Lagged );
  EXPECT_EQ( receiver.missed(), 2u );

  int received = 0;
  while ( receiver.tryRecv( value ) == RecvStatus::Ok )
    ++received;
  EXPECT_EQ( received, 4 );
}

TEST( SuspendBroadcastTest, CloseDrainsThenReportsClosed )
{
  SuspendBroadcast broadcast;
  auto receiver = broadcast.subscribe();
  ASSERT_TRUE( broadcast.send( true ) );
  broadcast.close();

  EXPECT_FALSE( broadcast.send( false ) );

  bool value = false;
  ASSERT_EQ( receiver.recv( value ), RecvStatus::Ok );
  EXPECT_TRUE( value );
  EXPECT_EQ( receiver.recv( value ), RecvStatus::Closed );
  EXPECT_EQ( receiver.tryRecv( value ), RecvStatus::Closed );
}

TEST( SuspendBroadcastTest, BlockingRecvWakesOnSend )
{
  SuspendBroadcast broadcast;
  auto receiver = broadcast.subscribe();

  std::thread sender( [ &broadcast ]
  {
    std::this_thread::sleep_for( std::chrono::milliseconds( 20 ) );
    broadcast.send( true );
  } );

  bool value = false;
  EXPECT_EQ( receiver.recv( value ), RecvStatus::Ok );
  EXPECT_TRUE( value );
  sender.join();
}

TEST( SuspendBroadcastTest, ReceiverCountFollowsLifetime )
{
  SuspendBroadcast broadcast;
  {
    auto receiver = broadcast.subscribe();
    auto moved = std::move( receiver );
    EXPECT_EQ( broadcast.receiverCount(), 1u );
  }
  EXPECT_EQ( broadcast.receiverCount(), 0u );
}

TEST( SuspendBroadcastTest, ShutdownReleasesParkedReceiver )
{
  SuspendBroadcast broadcast;
  auto receiver = broadcast.subscribe();

  std::thread parked( [ &receiver ] { receiver.waitForShutdown(); } );
  std::this_thread::sleep_for( std::chrono::milliseconds( 20 ) );
  broadcast.shutdown();
  parked.join();

  EXPECT_TRUE( broadcast.isClosed() );
}
