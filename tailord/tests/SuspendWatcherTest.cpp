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

#include "workers/SuspendWatcher.hpp"
#include "suspend/SuspendListener.hpp"
#include "TestUtils.hpp"

#include <gtest/gtest.h>
#include <memory>
#include <thread>

using tailor::test::FakeSleepSource;
using tailor::test::waitUntil;
using Attempt = FakeSleepSource::Attempt;

namespace
{

constexpr std::chrono::milliseconds SHORT_DELAY { 5 };

struct WatcherFixture
{
  explicit WatcherFixture( std::vector< Attempt > attempts, int maxAttempts = 3,
                           std::chrono::milliseconds retryDelay = SHORT_DELAY )
  {
    auto source = std::make_unique< FakeSleepSource >( std::move( attempts ) );
    sourcePtr = source.get();
    watcher = std::make_unique< SuspendWatcher >( broadcast, std::move( source ), maxAttempts, retryDelay );
  }

  SuspendBroadcast broadcast;
  FakeSleepSource *sourcePtr = nullptr;
  std::unique_ptr< SuspendWatcher > watcher;
};

} // namespace

TEST( SuspendWatcherTest, ForwardsSleepEventsToSubscribers )
{
  WatcherFixture f( { Attempt{ true, { true, false } } } );
  auto receiver = f.broadcast.subscribe();
  f.watcher->start();

  bool value = false;
  ASSERT_EQ( receiver.recv( value ), SuspendBroadcast::RecvStatus::Ok );
  EXPECT_TRUE( value );
  ASSERT_EQ( receiver.recv( value ), SuspendBroadcast::RecvStatus::Ok );
  EXPECT_FALSE( value );

  ASSERT_TRUE( waitUntil( [ &f ] { return f.sourcePtr->listening(); } ) );
  EXPECT_EQ( f.watcher->attempts(), 1 );
  EXPECT_FALSE( f.broadcast.isClosed() );
}

TEST( SuspendWatcherTest, StopInterruptsListen )
{
  WatcherFixture f( { Attempt{ true, {} } } );
  f.watcher->start();
  ASSERT_TRUE( waitUntil( [ &f ] { return f.sourcePtr->listening(); } ) );

  f.watcher->stop();

  EXPECT_FALSE( f.watcher->isRunning() );
  EXPECT_EQ( f.watcher->attempts(), 1 );
  EXPECT_TRUE( f.broadcast.isClosed() );
}

TEST( SuspendWatcherTest, GivesUpAfterMaxAttempts )
{
  WatcherFixture f( { Attempt{ false, {} }, Attempt{ false, {} }, Attempt{ false, {} }, Attempt{ true, {} } } );
  f.watcher->start();

  ASSERT_TRUE( waitUntil( [ &f ] { return f.broadcast.isClosed(); } ) );
  f.watcher->stop();

  EXPECT_EQ( f.watcher->attempts(), 3 );
  EXPECT_EQ( f.sourcePtr->calls(), 3 );
}

TEST( SuspendWatcherTest, DroppedConnectionCountsAsAttempt )
{
  WatcherFixture f( { Attempt{ true, {} }, Attempt{ true, {} } }, 2 );
  f.watcher->start();

  ASSERT_TRUE( waitUntil( [ &f ] { return f.sourcePtr->listening(); } ) );
  f.sourcePtr->drop();
  ASSERT_TRUE( waitUntil( [ &f ] { return f.watcher->attempts() == 2 and f.sourcePtr->listening(); } ) );
  f.sourcePtr->drop();

  ASSERT_TRUE( waitUntil( [ &f ] { return f.broadcast.isClosed(); } ) );
  f.watcher->stop();
  EXPECT_EQ( f.watcher->attempts(), 2 );
}

TEST( SuspendWatcherTest, RecoversWithinAttemptBudget )
{
  WatcherFixture f( { Attempt{ false, {} }, Attempt{ true, { true } } } );
  auto receiver = f.broadcast.subscribe();
  f.watcher->start();

  bool value = false;
  ASSERT_EQ( receiver.recv( value ), SuspendBroadcast::RecvStatus::Ok );
  EXPECT_TRUE( value );
  EXPECT_EQ( f.watcher->attempts(), 2 );
  EXPECT_FALSE( f.broadcast.isClosed() );
}

TEST( SuspendWatcherTest, EventsWithoutSubscribersAreDropped )
{
  WatcherFixture f( { Attempt{ true, { true, false } } } );
  f.watcher->start();
  ASSERT_TRUE( waitUntil( [ &f ] { return f.sourcePtr->listening(); } ) );

  // a late subscriber never sees the earlier edges
  auto receiver = f.broadcast.subscribe();
  bool value = false;
  EXPECT_EQ( receiver.tryRecv( value ), SuspendBroadcast::RecvStatus::Empty );
}

TEST( SuspendWatcherTest, ListenersAreDisabledWhenWatcherGivesUp )
{
  WatcherFixture f( { Attempt{ false, {} } }, 1 );
  SuspendListener listener( f.broadcast.subscribe() );
  f.watcher->start();

  ASSERT_TRUE( waitUntil( [ &f ] { return f.broadcast.isClosed(); } ) );
  EXPECT_FALSE( listener.checkSuspend() );
  EXPECT_EQ( listener.state(), SuspendListener::State::Disabled );
  f.watcher->stop();
}

TEST( SuspendWatcherTest, WaitsRetryDelayBetweenAttempts )
{
  constexpr std::chrono::milliseconds delay { 100 };
  WatcherFixture f( { Attempt{ false, {} }, Attempt{ false, {} }, Attempt{ false, {} } }, 3, delay );

  const auto started = std::chrono::steady_clock::now();
  f.watcher->start();
  ASSERT_TRUE( waitUntil( [ &f ] { return f.broadcast.isClosed(); }, std::chrono::seconds( 5 ) ) );
  const auto elapsed = std::chrono::steady_clock::now() - started;

  // two delays: after the first and second failure, none after the last
  EXPECT_GE( elapsed, delay * 2 );
  EXPECT_EQ( f.watcher->attempts(), 3 );
  f.watcher->stop();
}

TEST( SuspendWatcherTest, StopDuringRetryDelayReturnsPromptly )
{
  constexpr std::chrono::milliseconds delay { 10000 };
  WatcherFixture f( { Attempt{ false, {} }, Attempt{ false, {} } }, 3, delay );
  f.watcher->start();
  ASSERT_TRUE( waitUntil( [ &f ] { return f.sourcePtr->calls() == 1; } ) );
  std::this_thread::sleep_for( std::chrono::milliseconds( 50 ) );

  const auto started = std::chrono::steady_clock::now();
  f.watcher->stop();
  const auto elapsed = std::chrono::steady_clock::now() - started;

  EXPECT_LT( elapsed, std::chrono::seconds( 2 ) );
  EXPECT_EQ( f.sourcePtr->calls(), 1 );
  EXPECT_TRUE( f.broadcast.isClosed() );
}
