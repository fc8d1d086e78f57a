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

#include "workers/FanControlWorker.hpp"
#include "workers/KeyboardColorWorker.hpp"
#include "TestUtils.hpp"

#include <algorithm>
#include <gtest/gtest.h>
#include <thread>

using tailor::test::FakeFanBackend;
using tailor::test::FakeKeyboardBackend;
using tailor::test::waitUntil;

namespace
{

constexpr std::chrono::milliseconds TICK { 10 };

const FanProfile CURVE = { { 40, 20 }, { 60, 40 } };

} // namespace

TEST( TemperatureFilterTest, FirstValueIsTakenAsIs )
{
  TemperatureFilter filter;
  EXPECT_EQ( filter.getFilteredValue(), 0 );

  filter.addValue( 70 );
  EXPECT_EQ( filter.getFilteredValue(), 70 );
}

TEST( TemperatureFilterTest, RisesFasterThanItFalls )
{
  TemperatureFilter rising;
  rising.addValue( 40 );
  rising.addValue( 80 );

  TemperatureFilter falling;
  falling.addValue( 80 );
  falling.addValue( 40 );

  EXPECT_EQ( rising.getFilteredValue(), 60 );
  EXPECT_EQ( falling.getFilteredValue(), 74 );

  falling.reset();
  falling.addValue( 40 );
  EXPECT_EQ( falling.getFilteredValue(), 40 );
}

TEST( FanControlWorkerTest, WritesSpeedFromCurve )
{
  FakeFanBackend backend;
  FanControlWorker worker( backend, nullptr, TICK );
  worker.applyFanProfile( CURVE );
  worker.start();

  ASSERT_TRUE( waitUntil( [ &backend ] { return backend.lastSpeed == 30; } ) );
  EXPECT_EQ( worker.appliedSpeed(), 30 );

  // unchanged speed is not written again
  const int32_t writes = backend.writes;
  std::this_thread::sleep_for( TICK * 5 );
  EXPECT_EQ( backend.writes.load(), writes );
}

TEST( FanControlWorkerTest, EmptyCurveFallsBackToDefault )
{
  FakeFanBackend backend;
  FanControlWorker worker( backend, nullptr, TICK );
  worker.applyFanProfile( FanProfile() );

  EXPECT_EQ( worker.fanProfile(), defaultFanProfile() );
}

TEST( FanControlWorkerTest, OverrideHoldsUntilProfileApplied )
{
  FakeFanBackend backend;
  FanControlWorker worker( backend, nullptr, TICK );
  worker.applyFanProfile( CURVE );
  worker.start();
  ASSERT_TRUE( waitUntil( [ &backend ] { return backend.lastSpeed == 30; } ) );

  worker.overrideSpeed( 85 );
  ASSERT_TRUE( waitUntil( [ &backend ] { return backend.lastSpeed == 85; } ) );

  backend.temperature = 20;
  std::this_thread::sleep_for( TICK * 5 );
  EXPECT_EQ( backend.lastSpeed.load(), 85 );

  worker.applyFanProfile( CURVE );
  EXPECT_FALSE( worker.speedOverride().has_value() );
  ASSERT_TRUE( waitUntil( [ &backend ] { return backend.lastSpeed < 85; } ) );
}

TEST( FanControlWorkerTest, SkipsCycleWhenTemperatureUnreadable )
{
  FakeFanBackend backend;
  backend.temperatureReadable = false;
  FanControlWorker worker( backend, nullptr, TICK );
  worker.start();

  std::this_thread::sleep_for( TICK * 5 );
  EXPECT_EQ( backend.writes.load(), 0 );
  EXPECT_EQ( worker.appliedSpeed(), -1 );

  backend.temperatureReadable = true;
  ASSERT_TRUE( waitUntil( [ &backend ] { return backend.writes == 1; } ) );
}

TEST( FanControlWorkerTest, RestoresAutomaticControlOnStop )
{
  FakeFanBackend backend;
  FanControlWorker worker( backend, nullptr, TICK );
  worker.start();
  ASSERT_TRUE( waitUntil( [ &backend ] { return not backend.automatic; } ) );

  worker.stop();
  EXPECT_TRUE( backend.automatic.load() );
}

TEST( FanControlWorkerTest, RewritesSpeedAfterResume )
{
  FakeFanBackend backend;
  SuspendBroadcast broadcast;
  FanControlWorker worker( backend, std::make_unique< SuspendListener >( broadcast.subscribe() ), TICK );
  worker.applyFanProfile( CURVE );
  worker.start();
  ASSERT_TRUE( waitUntil( [ &backend ] { return backend.writes == 1; } ) );

  ASSERT_TRUE( broadcast.send( true ) );
  ASSERT_TRUE( broadcast.send( false ) );

  ASSERT_TRUE( waitUntil( [ &backend ] { return backend.writes == 2; } ) );
  EXPECT_EQ( backend.lastSpeed.load(), 30 );
}

TEST( FanControlWorkerTest, KeepsRunningWhenSuspendChannelCloses )
{
  FakeFanBackend backend;
  SuspendBroadcast broadcast;
  FanControlWorker worker( backend, std::make_unique< SuspendListener >( broadcast.subscribe() ), TICK );
  worker.applyFanProfile( CURVE );
  worker.start();
  ASSERT_TRUE( waitUntil( [ &backend ] { return backend.lastSpeed == 30; } ) );

  broadcast.close();
  worker.overrideSpeed( 60 );
  ASSERT_TRUE( waitUntil( [ &backend ] { return backend.lastSpeed == 60; } ) );
  EXPECT_TRUE( worker.isRunning() );
}

TEST( KeyboardColorWorkerTest, WritesSingleColorOnce )
{
  FakeKeyboardBackend backend;
  KeyboardColorWorker worker( backend, nullptr, TICK );
  worker.applyKeyboardProfile( KeyboardProfile::singleColor( Color{ 10, 20, 30 } ) );
  worker.start();

  ASSERT_TRUE( waitUntil( [ &backend ] { return backend.writeCount() == 1; } ) );
  std::this_thread::sleep_for( TICK * 5 );

  EXPECT_EQ( backend.writeCount(), 1u );
  EXPECT_EQ( backend.colors().back(), ( Color{ 10, 20, 30 } ) );
  EXPECT_EQ( worker.appliedColor(), ( Color{ 10, 20, 30 } ) );
}

TEST( KeyboardColorWorkerTest, OffProfileWritesBlack )
{
  FakeKeyboardBackend backend;
  KeyboardColorWorker worker( backend, nullptr, TICK );
  worker.applyKeyboardProfile( KeyboardProfile::off() );
  worker.start();

  ASSERT_TRUE( waitUntil( [ &backend ] { return backend.writeCount() == 1; } ) );
  EXPECT_EQ( backend.colors().back(), Color{} );
}

TEST( KeyboardColorWorkerTest, StepsThroughSequence )
{
  const Color red { 255, 0, 0 };
  const Color blue { 0, 0, 255 };

  FakeKeyboardBackend backend;
  KeyboardColorWorker worker( backend, nullptr, TICK );
  worker.applyKeyboardProfile( KeyboardProfile::sequence( {
    ColorPoint{ red, ColorTransition::None, 40 },
    ColorPoint{ blue, ColorTransition::None, 40 } } ) );
  worker.start();

  ASSERT_TRUE( waitUntil( [ &backend, &red, &blue ] {
    const auto colors = backend.colors();
    return std::count( colors.begin(), colors.end(), red ) > 0
       and std::count( colors.begin(), colors.end(), blue ) > 0;
  } ) );
}

TEST( KeyboardColorWorkerTest, OverrideHoldsUntilProfileApplied )
{
  FakeKeyboardBackend backend;
  KeyboardColorWorker worker( backend, nullptr, TICK );
  worker.applyKeyboardProfile( KeyboardProfile::singleColor( Color{ 1, 1, 1 } ) );
  worker.start();
  ASSERT_TRUE( waitUntil( [ &backend ] { return backend.writeCount() == 1; } ) );

  worker.overrideColor( Color{ 200, 100, 0 } );
  ASSERT_TRUE( waitUntil( [ &backend ] { return backend.colors().back() == Color{ 200, 100, 0 }; } ) );

  worker.applyKeyboardProfile( KeyboardProfile::singleColor( Color{ 1, 1, 1 } ) );
  EXPECT_FALSE( worker.colorOverride().has_value() );
  ASSERT_TRUE( waitUntil( [ &backend ] { return backend.colors().back() == Color{ 1, 1, 1 }; } ) );
}

TEST( KeyboardColorWorkerTest, RewritesColorAfterResume )
{
  FakeKeyboardBackend backend;
  SuspendBroadcast broadcast;
  KeyboardColorWorker worker( backend, std::make_unique< SuspendListener >( broadcast.subscribe() ), TICK );
  worker.applyKeyboardProfile( KeyboardProfile::singleColor( Color{ 5, 6, 7 } ) );
  worker.start();
  ASSERT_TRUE( waitUntil( [ &backend ] { return backend.writeCount() == 1; } ) );

  ASSERT_TRUE( broadcast.send( true ) );
  ASSERT_TRUE( broadcast.send( false ) );

  ASSERT_TRUE( waitUntil( [ &backend ] { return backend.writeCount() == 2; } ) );
  EXPECT_EQ( backend.colors().back(), ( Color{ 5, 6, 7 } ) );
}
