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

#include "TailorDBusService.hpp"
#include "suspend/LogindSleepSource.hpp"
#include "suspend/SuspendListener.hpp"

#include <QDBusConnection>
#include <QDBusError>
#include <nlohmann/json.hpp>
#include <syslog.h>

namespace
{

QStringList toQStringList( const std::vector< std::string > &names )
{
  QStringList list;
  list.reserve( static_cast< int >( names.size() ) );
  for ( const auto &name : names )
    list.append( QString::fromStdString( name ) );
  return list;
}

template< typename T >
bool parseProfile( TailorDBusObject *object, const QString &json, T &profile )
{
  try
  {
    profile = nlohmann::json::parse( json.toStdString() ).get< T >();
    return true;
  }
  catch ( const std::exception &e )
  {
    syslog( LOG_WARNING, "[DBus] Rejected profile: %s", e.what() );
    if ( object->calledFromDBus() )
      object->sendErrorReply( TailorDBusObject::ERROR_INVALID_ARGUMENT,
                              QStringLiteral( "Invalid profile: %1" ).arg( QString::fromUtf8( e.what() ) ) );
    return false;
  }
}

template< typename T >
QString profileJSON( TailorDBusObject *object, const ProfileStore< T > &store, const QString &name )
{
  T profile;
  if ( not object->replyStatus( store.getProfile( name.toStdString(), profile ), name ) )
    return QString();

  return QString::fromStdString( nlohmann::json( profile ).dump() );
}

} // namespace

// TailorDBusObject

const char *TailorDBusObject::errorName( ProfileStatus status ) noexcept
{
  switch ( status )
  {
    case ProfileStatus::NotFound:
      return ERROR_NOT_FOUND;
    case ProfileStatus::Conflict:
      return ERROR_CONFLICT;
    case ProfileStatus::InvalidArgument:
      return ERROR_INVALID_ARGUMENT;
    case ProfileStatus::Ok:
    case ProfileStatus::IoError:
      break;
  }

  return ERROR_FAILED;
}

bool TailorDBusObject::replyStatus( ProfileStatus status, const QString &subject )
{
  if ( status == ProfileStatus::Ok )
    return true;

  const QString message = QStringLiteral( "%1: %2" ).arg( subject, QString::fromUtf8( profileStatusToString( status ) ) );
  syslog( LOG_INFO, "[DBus] Call failed, %s", qPrintable( message ) );

  if ( calledFromDBus() )
    sendErrorReply( errorName( status ), message );

  return false;
}

// ProfilesDBusAdaptor

ProfilesDBusAdaptor::ProfilesDBusAdaptor( TailorDBusObject *parent, GlobalProfileCoordinator &coordinator )
  : QDBusAbstractAdaptor( parent ),
    m_object( parent ),
    m_coordinator( coordinator )
{
  syslog( LOG_INFO, "[DBus] Registered interface %s", INTERFACE_NAME );
}

void ProfilesDBusAdaptor::AddProfile( const QString &name, const QString &json )
{
  GlobalProfile profile;
  if ( not parseProfile( m_object, json, profile ) )
    return;

  m_object->replyStatus( m_coordinator.addProfile( name.toStdString(), profile ), name );
}

QString ProfilesDBusAdaptor::GetProfile( const QString &name )
{
  GlobalProfile profile;
  if ( not m_object->replyStatus( m_coordinator.getProfile( name.toStdString(), profile ), name ) )
    return QString();

  return QString::fromStdString( nlohmann::json( profile ).dump() );
}

QStringList ProfilesDBusAdaptor::ListProfiles()
{
  return toQStringList( m_coordinator.listProfiles() );
}

void ProfilesDBusAdaptor::RemoveProfile( const QString &name )
{
  m_object->replyStatus( m_coordinator.removeProfile( name.toStdString() ), name );
}

QStringList ProfilesDBusAdaptor::RenameProfile( const QString &from, const QString &to )
{
  std::vector< std::string > names;
  if ( not m_object->replyStatus( m_coordinator.renameProfile( from.toStdString(), to.toStdString(), names ), from ) )
    return QStringList();

  return toQStringList( names );
}

void ProfilesDBusAdaptor::CopyProfile( const QString &from, const QString &to )
{
  m_object->replyStatus( m_coordinator.copyProfile( from.toStdString(), to.toStdString() ), from );
}

QString ProfilesDBusAdaptor::GetActiveProfileName()
{
  return QString::fromStdString( m_coordinator.getActiveProfileName() );
}

void ProfilesDBusAdaptor::SetActiveProfileName( const QString &name )
{
  m_object->replyStatus( m_coordinator.setActiveProfileName( name.toStdString() ), name );
}

void ProfilesDBusAdaptor::Reload()
{
  m_object->replyStatus( m_coordinator.reload(), QStringLiteral( "reload" ) );
}

// FanDBusAdaptor

FanDBusAdaptor::FanDBusAdaptor( TailorDBusObject *parent, GlobalProfileCoordinator &coordinator )
  : QDBusAbstractAdaptor( parent ),
    m_object( parent ),
    m_coordinator( coordinator )
{
  syslog( LOG_INFO, "[DBus] Registered interface %s", INTERFACE_NAME );
}

void FanDBusAdaptor::AddProfile( const QString &name, const QString &json )
{
  FanProfile profile;
  if ( not parseProfile( m_object, json, profile ) )
    return;

  m_object->replyStatus( m_coordinator.fanStore().addProfile( name.toStdString(), profile ), name );
}

QString FanDBusAdaptor::GetProfile( const QString &name )
{
  return profileJSON( m_object, m_coordinator.fanStore(), name );
}

QStringList FanDBusAdaptor::ListProfiles()
{
  return toQStringList( m_coordinator.fanStore().listProfiles() );
}

void FanDBusAdaptor::RemoveProfile( const QString &name )
{
  m_object->replyStatus( m_coordinator.fanStore().removeProfile( name.toStdString() ), name );
}

QStringList FanDBusAdaptor::RenameProfile( const QString &from, const QString &to )
{
  std::vector< std::string > names;
  if ( not m_object->replyStatus( m_coordinator.renameFanProfile( from.toStdString(), to.toStdString(), names ), from ) )
    return QStringList();

  return toQStringList( names );
}

void FanDBusAdaptor::CopyProfile( const QString &from, const QString &to )
{
  m_object->replyStatus( m_coordinator.fanStore().copyProfile( from.toStdString(), to.toStdString() ), from );
}

void FanDBusAdaptor::OverrideSpeed( uchar speed )
{
  m_object->replyStatus( m_coordinator.overrideSpeed( speed ), QStringLiteral( "fan speed %1" ).arg( static_cast< int >( speed ) ) );
}

// KeyboardDBusAdaptor

KeyboardDBusAdaptor::KeyboardDBusAdaptor( TailorDBusObject *parent, GlobalProfileCoordinator &coordinator )
  : QDBusAbstractAdaptor( parent ),
    m_object( parent ),
    m_coordinator( coordinator )
{
  syslog( LOG_INFO, "[DBus] Registered interface %s", INTERFACE_NAME );
}

void KeyboardDBusAdaptor::AddProfile( const QString &name, const QString &json )
{
  KeyboardProfile profile;
  if ( not parseProfile( m_object, json, profile ) )
    return;

  m_object->replyStatus( m_coordinator.keyboardStore().addProfile( name.toStdString(), profile ), name );
}

QString KeyboardDBusAdaptor::GetProfile( const QString &name )
{
  return profileJSON( m_object, m_coordinator.keyboardStore(), name );
}

QStringList KeyboardDBusAdaptor::ListProfiles()
{
  return toQStringList( m_coordinator.keyboardStore().listProfiles() );
}

void KeyboardDBusAdaptor::RemoveProfile( const QString &name )
{
  m_object->replyStatus( m_coordinator.keyboardStore().removeProfile( name.toStdString() ), name );
}

QStringList KeyboardDBusAdaptor::RenameProfile( const QString &from, const QString &to )
{
  std::vector< std::string > names;
  if ( not m_object->replyStatus( m_coordinator.renameKeyboardProfile( from.toStdString(), to.toStdString(), names ), from ) )
    return QStringList();

  return toQStringList( names );
}

void KeyboardDBusAdaptor::CopyProfile( const QString &from, const QString &to )
{
  m_object->replyStatus( m_coordinator.keyboardStore().copyProfile( from.toStdString(), to.toStdString() ), from );
}

void KeyboardDBusAdaptor::OverrideColor( const QString &json )
{
  Color color;
  if ( not parseProfile( m_object, json, color ) )
    return;

  m_object->replyStatus( m_coordinator.overrideColor( color ), QStringLiteral( "keyboard color" ) );
}

// TailorDBusService

TailorDBusService::TailorDBusService( const std::filesystem::path &configDir )
  : m_settingsManager( configDir ),
    m_fanStore( "fan", configDir / "fan_profiles.json" ),
    m_keyboardStore( "keyboard", configDir / "keyboard_profiles.json" ),
    m_globalStore( "global", configDir / "profiles.json" )
{
  const TailorSettings settings = m_settingsManager.readSettings().value_or( TailorSettings() );

  if ( not settings.fanControlEnabled )
    syslog( LOG_INFO, "[Service] Fan control disabled in settings" );
  else if ( not m_fanBackend.isAvailable() )
    syslog( LOG_WARNING, "[Service] No controllable fan, fan control disabled" );
  else
    m_fanControlWorker = std::make_unique< FanControlWorker >(
      m_fanBackend, std::make_unique< SuspendListener >( m_suspendBroadcast.subscribe() ) );

  if ( not settings.keyboardControlEnabled )
    syslog( LOG_INFO, "[Service] Keyboard control disabled in settings" );
  else if ( not m_keyboardBackend.isAvailable() )
    syslog( LOG_WARNING, "[Service] No keyboard backlight, keyboard control disabled" );
  else
    m_keyboardColorWorker = std::make_unique< KeyboardColorWorker >(
      m_keyboardBackend, std::make_unique< SuspendListener >( m_suspendBroadcast.subscribe() ) );

  m_suspendWatcher = std::make_unique< SuspendWatcher >( m_suspendBroadcast, std::make_unique< LogindSleepSource >() );

  m_coordinator = std::make_unique< GlobalProfileCoordinator >(
    m_fanStore, m_keyboardStore, m_globalStore, m_settingsManager,
    m_fanControlWorker.get(), m_keyboardColorWorker.get(),
    m_platformProfileBackend.isAvailable() ? &m_platformProfileBackend : nullptr );
}

TailorDBusService::~TailorDBusService()
{
  shutdown();
}

void TailorDBusService::start()
{
  if ( m_coordinator->initialize() != ProfileStatus::Ok )
    syslog( LOG_WARNING, "[Service] Started with incomplete profile configuration" );

  if ( m_coordinator->reload() != ProfileStatus::Ok )
    syslog( LOG_ERR, "[Service] Failed to apply the active profile" );

  m_suspendWatcher->start();

  if ( m_fanControlWorker )
    m_fanControlWorker->start();

  if ( m_keyboardColorWorker )
    m_keyboardColorWorker->start();

  syslog( LOG_INFO, "[Service] Workers started" );
}

bool TailorDBusService::initDBus()
{
  // Must be called from the main thread so m_dbusObject lives in the main
  // thread's event loop.
  QDBusConnection bus = QDBusConnection::systemBus();
  if ( not bus.isConnected() )
  {
    syslog( LOG_ERR, "[DBus] Failed to connect to system D-Bus" );
    return false;
  }

  m_dbusObject = std::make_unique< TailorDBusObject >();
  new ProfilesDBusAdaptor( m_dbusObject.get(), *m_coordinator );
  new FanDBusAdaptor( m_dbusObject.get(), *m_coordinator );
  new KeyboardDBusAdaptor( m_dbusObject.get(), *m_coordinator );

  if ( not bus.registerObject( OBJECT_PATH, m_dbusObject.get() ) )
  {
    syslog( LOG_ERR, "[DBus] Failed to register D-Bus object at %s: %s",
            OBJECT_PATH, qPrintable( bus.lastError().message() ) );
    m_dbusObject.reset();
    return false;
  }

  if ( not bus.registerService( SERVICE_NAME ) )
  {
    syslog( LOG_ERR, "[DBus] Failed to register D-Bus service name %s: %s",
            SERVICE_NAME, qPrintable( bus.lastError().message() ) );
    bus.unregisterObject( OBJECT_PATH );
    m_dbusObject.reset();
    return false;
  }

  m_registered = true;
  syslog( LOG_INFO, "[DBus] Service registered on %s", SERVICE_NAME );
  return true;
}

void TailorDBusService::shutdown()
{
  if ( m_stopped )
    return;
  m_stopped = true;

  if ( m_registered )
  {
    QDBusConnection bus = QDBusConnection::systemBus();
    if ( not bus.unregisterService( SERVICE_NAME ) )
      syslog( LOG_WARNING, "[DBus] Failed to release %s", SERVICE_NAME );
    bus.unregisterObject( OBJECT_PATH );
    m_registered = false;
  }
  m_dbusObject.reset();

  // releases loops parked in their suspend listener
  m_suspendBroadcast.shutdown();

  if ( m_fanControlWorker )
    m_fanControlWorker->stop();

  if ( m_keyboardColorWorker )
    m_keyboardColorWorker->stop();

  m_suspendWatcher->stop();
  syslog( LOG_INFO, "[Service] Stopped" );
}
