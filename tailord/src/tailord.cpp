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

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>
#include <fcntl.h>
#include <signal.h>
#include <syslog.h>
#include <unistd.h>

#include <QCoreApplication>
#include <QSocketNotifier>

#include "DaemonOptions.hpp"
#include "PidFile.hpp"
#include "TailorDBusService.hpp"
#include "TailorLog.hpp"

namespace
{

constexpr std::string_view VERSION = "0.2.0";
constexpr std::string_view DAEMON_NAME = "tailord";

// SIGKILL follows once the grace period is over; the fan loop needs it to
// hand the fans back to the firmware
constexpr int STOP_GRACE_POLLS = 50;
constexpr useconds_t STOP_POLL_INTERVAL_US = 100000;

int g_signalWriteFd = -1;

void forwardSignal( int sig )
{
  const char c = static_cast< char >( sig );
  // write is async-signal-safe
  [[maybe_unused]] const ssize_t r = ::write( g_signalWriteFd, &c, 1 );
}

/**
 * @brief Turns SIGTERM, SIGINT and SIGHUP into a readable pipe so the
 *        event loop can quit outside signal context
 */
class SignalPipe
{
public:
  SignalPipe()
  {
    if ( ::pipe2( m_fds, O_CLOEXEC ) == -1 )
    {
      syslog( LOG_ERR, "[Daemon] Failed to create signal pipe: %s", strerror( errno ) );
      m_fds[ 0 ] = m_fds[ 1 ] = -1;
      return;
    }

    g_signalWriteFd = m_fds[ 1 ];

    struct sigaction sa {};
    sa.sa_handler = forwardSignal;
    sigemptyset( &sa.sa_mask );
    sa.sa_flags = SA_RESTART;
    for ( int sig : { SIGTERM, SIGINT, SIGHUP } )
      sigaction( sig, &sa, nullptr );
  }

  ~SignalPipe()
  {
    if ( m_fds[ 0 ] == -1 )
      return;

    struct sigaction sa {};
    sa.sa_handler = SIG_DFL;
    for ( int sig : { SIGTERM, SIGINT, SIGHUP } )
      sigaction( sig, &sa, nullptr );

    g_signalWriteFd = -1;
    ::close( m_fds[ 0 ] );
    ::close( m_fds[ 1 ] );
  }

  SignalPipe( const SignalPipe & ) = delete;
  SignalPipe &operator=( const SignalPipe & ) = delete;

  /// Quit @p app once a signal arrives.
  void attach( QCoreApplication &app )
  {
    if ( m_fds[ 0 ] == -1 )
      return;

    auto *notifier = new QSocketNotifier( m_fds[ 0 ], QSocketNotifier::Read, &app );
    QObject::connect( notifier, &QSocketNotifier::activated, &app, [ &app, notifier ]() {
      char buf[ 64 ];
      while ( ::read( static_cast< int >( notifier->socket() ), buf, sizeof( buf ) ) > 0 ) { }
      syslog( LOG_INFO, "[Daemon] Termination signal received" );
      app.quit();
    } );

    // drained in the handler above
    ::fcntl( m_fds[ 0 ], F_SETFL, ::fcntl( m_fds[ 0 ], F_GETFL ) | O_NONBLOCK );
  }

private:
  int m_fds[ 2 ];
};

bool ensureConfigDirectory( const std::filesystem::path &configDir )
{
  namespace fs = std::filesystem;

  std::error_code ec;
  if ( fs::is_directory( configDir, ec ) )
    return true;

  if ( not fs::create_directories( configDir, ec ) and ec )
  {
    syslog( LOG_ERR, "[Daemon] Cannot create %s: %s", configDir.c_str(), ec.message().c_str() );
    return false;
  }

  fs::permissions( configDir, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                   fs::perms::others_read | fs::perms::others_exec, ec );
  syslog( LOG_INFO, "[Daemon] Created configuration directory %s", configDir.c_str() );
  return true;
}

int runDaemon( const DaemonOptions &options, PidFile &pidFile )
{
  openlog( DAEMON_NAME.data(), LOG_PID | ( options.debug ? LOG_PERROR : 0 ), LOG_DAEMON );
  tailor::setDebugLogging( options.debug );
  syslog( LOG_INFO, "[Daemon] tailord %s starting, profiles in %s", VERSION.data(), options.configDir.c_str() );

  // outlives the application and with it the notifier on the read end
  SignalPipe signalPipe;

  int argc = 1;
  char *argv[] = { const_cast< char * >( DAEMON_NAME.data() ) };
  QCoreApplication app( argc, argv );
  int result = 1;

  if ( ensureConfigDirectory( options.configDir ) )
  {
    try
    {
      TailorDBusService service( options.configDir );
      service.start();

      if ( service.initDBus() )
      {
        pidFile.write( ::getpid() );
        signalPipe.attach( app );
        result = app.exec();
      }
      else
      {
        syslog( LOG_ERR, "[Daemon] Failed to initialize D-Bus service" );
      }

      service.shutdown();
    }
    catch ( const std::exception &e )
    {
      syslog( LOG_ERR, "[Daemon] Failed to initialize daemon: %s", e.what() );
      result = 1;
    }
  }

  pidFile.remove();
  syslog( LOG_INFO, "[Daemon] tailord shutting down" );
  closelog();
  return result;
}

int stopRunningDaemon( PidFile &pidFile )
{
  const auto storedPid = pidFile.readPid();
  if ( not storedPid )
  {
    std::cerr << "No valid PID in " << pidFile.path().string() << ". Daemon may not be running." << std::endl;
    return 1;
  }

  const pid_t pid = *storedPid;
  if ( not pidFile.runningOwner() )
  {
    std::cerr << "Daemon process (PID " << pid << ") is not running." << std::endl;
    pidFile.remove();
    return 1;
  }

  if ( ::kill( pid, SIGTERM ) != 0 )
  {
    std::cerr << "Failed to send SIGTERM to PID " << pid << ": " << strerror( errno ) << std::endl;
    return 1;
  }

  std::cout << "Stopping tailord (PID " << pid << ")..." << std::endl;

  for ( int poll = 0; poll < STOP_GRACE_POLLS; ++poll )
  {
    if ( ::kill( pid, 0 ) != 0 )
    {
      std::cout << "tailord stopped." << std::endl;
      return 0;
    }
    ::usleep( STOP_POLL_INTERVAL_US );
  }

  std::cerr << "tailord did not exit in time, sending SIGKILL." << std::endl;
  ::kill( pid, SIGKILL );
  ::usleep( 2 * STOP_POLL_INTERVAL_US );
  pidFile.remove();
  return 0;
}

void printUsage( std::string_view program )
{
  std::cout << "Usage: " << program << " [OPTIONS]\n"
            << "Options:\n"
            << "  -v, --version        Show version information\n"
            << "  -h, --help           Show this help message\n"
            << "  --debug              Log debug messages, also to stderr\n"
            << "  --start              Run the daemon in the foreground (default)\n"
            << "  --stop               Stop the running daemon\n"
            << "  --config-dir <dir>   Profile and settings directory (default "
            << DaemonOptions::DEFAULT_CONFIG_DIR << ")\n";
}

} // namespace

int main( int argc, char *argv[] )
{
  DaemonOptions options;
  std::string error;
  if ( not parseCommandLine( std::vector< std::string >( argv + 1, argv + argc ), options, error ) )
  {
    std::cerr << error << std::endl;
    printUsage( argv[ 0 ] );
    return 1;
  }

  PidFile pidFile;

  switch ( options.action )
  {
    case DaemonOptions::Action::ShowVersion:
      std::cout << DAEMON_NAME << " version " << VERSION << "\n"
                << "Fan and keyboard profile daemon\n";
      return 0;

    case DaemonOptions::Action::ShowHelp:
      printUsage( argv[ 0 ] );
      return 0;

    case DaemonOptions::Action::Stop:
      return stopRunningDaemon( pidFile );

    case DaemonOptions::Action::Run:
      break;
  }

  // systemd (Type=simple) supervises the foreground process
  if ( const auto owner = pidFile.runningOwner() )
  {
    std::cerr << "tailord is already running (PID " << *owner << ")." << std::endl;
    return 1;
  }

  return runDaemon( options, pidFile );
}
