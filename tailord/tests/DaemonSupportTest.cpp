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

#include "DaemonOptions.hpp"
#include "PidFile.hpp"
#include "TailorLog.hpp"
#include "TestUtils.hpp"

#include <fstream>
#include <gtest/gtest.h>
#include <sys/wait.h>
#include <unistd.h>

using tailor::test::TempDir;

namespace
{

DaemonOptions parse( const std::vector< std::string > &arguments )
{
  DaemonOptions options;
  std::string error;
  EXPECT_TRUE( parseCommandLine( arguments, options, error ) ) << error;
  return options;
}

} // namespace

TEST( DaemonOptionsTest, DefaultsToRunningWithSystemConfig )
{
  const DaemonOptions options = parse( {} );
  EXPECT_EQ( options.action, DaemonOptions::Action::Run );
  EXPECT_FALSE( options.debug );
  EXPECT_EQ( options.configDir, std::filesystem::path( DaemonOptions::DEFAULT_CONFIG_DIR ) );
}

TEST( DaemonOptionsTest, ReadsDebugAndConfigDir )
{
  const DaemonOptions options = parse( { "--debug", "--start", "--config-dir", "/tmp/tailor" } );
  EXPECT_EQ( options.action, DaemonOptions::Action::Run );
  EXPECT_TRUE( options.debug );
  EXPECT_EQ( options.configDir, std::filesystem::path( "/tmp/tailor" ) );
}

TEST( DaemonOptionsTest, StartDoesNotCancelStop )
{
  EXPECT_EQ( parse( { "--stop", "--start" } ).action, DaemonOptions::Action::Stop );
}

TEST( DaemonOptionsTest, VersionAndHelpEndParsing )
{
  EXPECT_EQ( parse( { "-v", "--bogus" } ).action, DaemonOptions::Action::ShowVersion );
  EXPECT_EQ( parse( { "--debug", "--help", "--bogus" } ).action, DaemonOptions::Action::ShowHelp );
}

TEST( DaemonOptionsTest, RejectsBadArguments )
{
  DaemonOptions options;
  std::string error;

  EXPECT_FALSE( parseCommandLine( { "--frobnicate" }, options, error ) );
  EXPECT_NE( error.find( "--frobnicate" ), std::string::npos );

  error.clear();
  EXPECT_FALSE( parseCommandLine( { "--config-dir" }, options, error ) );
  EXPECT_FALSE( error.empty() );
}

TEST( PidFileTest, WritesAndReadsOwnPid )
{
  TempDir dir;
  PidFile pidFile( dir.path() / "tailord.pid" );

  EXPECT_FALSE( pidFile.readPid().has_value() );
  EXPECT_FALSE( pidFile.runningOwner().has_value() );

  ASSERT_TRUE( pidFile.write( ::getpid() ) );
  EXPECT_EQ( pidFile.readPid(), ::getpid() );
  EXPECT_EQ( pidFile.runningOwner(), ::getpid() );

  pidFile.remove();
  EXPECT_FALSE( std::filesystem::exists( pidFile.path() ) );
  pidFile.remove();
}

TEST( PidFileTest, MalformedContentIsNoPid )
{
  TempDir dir;
  PidFile pidFile( dir.path() / "tailord.pid" );

  std::ofstream( pidFile.path() ) << "not-a-pid\n";
  EXPECT_FALSE( pidFile.readPid().has_value() );

  std::ofstream( pidFile.path() ) << "-4\n";
  EXPECT_FALSE( pidFile.readPid().has_value() );
}

TEST( PidFileTest, ExitedProcessIsNotAnOwner )
{
  TempDir dir;
  PidFile pidFile( dir.path() / "tailord.pid" );

  const pid_t child = ::fork();
  ASSERT_NE( child, -1 );
  if ( child == 0 )
    ::_exit( 0 );

  int status = 0;
  ASSERT_EQ( ::waitpid( child, &status, 0 ), child );

  ASSERT_TRUE( pidFile.write( child ) );
  EXPECT_EQ( pidFile.readPid(), child );
  EXPECT_FALSE( pidFile.runningOwner().has_value() );
}

TEST( PidFileTest, UnwritableLocationFails )
{
  TempDir dir;
  PidFile pidFile( dir.path() / "missing" / "tailord.pid" );
  EXPECT_FALSE( pidFile.write( ::getpid() ) );
}

TEST( TailorLogTest, DebugSwitchIsGlobal )
{
  const bool before = tailor::debugLogging();

  tailor::setDebugLogging( true );
  EXPECT_TRUE( tailor::debugLogging() );
  tailor::tDebug( "[Test] debug logging %s", "enabled" );

  tailor::setDebugLogging( false );
  EXPECT_FALSE( tailor::debugLogging() );

  tailor::setDebugLogging( before );
}
