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

#include "GlobalProfileCoordinator.hpp"
#include "ProfileStore.hpp"
#include "SettingsManager.hpp"
#include "backends/HwmonFanBackend.hpp"
#include "backends/LedKeyboardBackend.hpp"
#include "backends/PlatformProfileBackend.hpp"
#include "suspend/SuspendBroadcast.hpp"
#include "workers/SuspendWatcher.hpp"
#include "workers/FanControlWorker.hpp"
#include "workers/KeyboardColorWorker.hpp"
#include <filesystem>
#include <memory>
#include <QObject>
#include <QString>
#include <QStringList>
#include <QDBusAbstractAdaptor>
#include <QDBusContext>

/**
 * @brief Object registered at /com/tux/Tailor
 *
 * Carries the D-Bus call context for the adaptors attached to it, so they
 * can answer with error replies.
 */
class TailorDBusObject : public QObject, public QDBusContext
{
  Q_OBJECT

public:
  static constexpr const char *ERROR_NOT_FOUND = "com.tux.Tailor.Error.NotFound";
  static constexpr const char *ERROR_CONFLICT = "com.tux.Tailor.Error.Conflict";
  static constexpr const char *ERROR_INVALID_ARGUMENT = "com.tux.Tailor.Error.InvalidArgument";
  static constexpr const char *ERROR_FAILED = "com.tux.Tailor.Error.Failed";

  explicit TailorDBusObject( QObject *parent = nullptr ) : QObject( parent ) {}

  /**
   * @brief Turn a failed status into an error reply for the current call
   * @return true if the status was Ok and the call should return normally
   */
  bool replyStatus( ProfileStatus status, const QString &subject );

  /**
   * @brief D-Bus error name for a failed status
   */
  static const char *errorName( ProfileStatus status ) noexcept;
};

/**
 * @brief com.tux.Tailor.Profiles: global profiles and the active profile
 */
class ProfilesDBusAdaptor : public QDBusAbstractAdaptor
{
  Q_OBJECT
  Q_CLASSINFO( "D-Bus Interface", "com.tux.Tailor.Profiles" )

public:
  static constexpr const char *INTERFACE_NAME = "com.tux.Tailor.Profiles";

  ProfilesDBusAdaptor( TailorDBusObject *parent, GlobalProfileCoordinator &coordinator );

public slots:
  void AddProfile( const QString &name, const QString &json );
  QString GetProfile( const QString &name );
  QStringList ListProfiles();
  void RemoveProfile( const QString &name );
  QStringList RenameProfile( const QString &from, const QString &to );
  void CopyProfile( const QString &from, const QString &to );
  QString GetActiveProfileName();
  void SetActiveProfileName( const QString &name );
  void Reload();

private:
  TailorDBusObject *m_object;
  GlobalProfileCoordinator &m_coordinator;
};

/**
 * @brief com.tux.Tailor.Fan: fan curves and speed override
 */
class FanDBusAdaptor : public QDBusAbstractAdaptor
{
  Q_OBJECT
  Q_CLASSINFO( "D-Bus Interface", "com.tux.Tailor.Fan" )

public:
  static constexpr const char *INTERFACE_NAME = "com.tux.Tailor.Fan";

  FanDBusAdaptor( TailorDBusObject *parent, GlobalProfileCoordinator &coordinator );

public slots:
  void AddProfile( const QString &name, const QString &json );
  QString GetProfile( const QString &name );
  QStringList ListProfiles();
  void RemoveProfile( const QString &name );
  QStringList RenameProfile( const QString &from, const QString &to );
  void CopyProfile( const QString &from, const QString &to );
  void OverrideSpeed( uchar speed );

private:
  TailorDBusObject *m_object;
  GlobalProfileCoordinator &m_coordinator;
};

/**
 * @brief com.tux.Tailor.Keyboard: keyboard color profiles and color override
 */
class KeyboardDBusAdaptor : public QDBusAbstractAdaptor
{
  Q_OBJECT
  Q_CLASSINFO( "D-Bus Interface", "com.tux.Tailor.Keyboard" )

public:
  static constexpr const char *INTERFACE_NAME = "com.tux.Tailor.Keyboard";

  KeyboardDBusAdaptor( TailorDBusObject *parent, GlobalProfileCoordinator &coordinator );

public slots:
  void AddProfile( const QString &name, const QString &json );
  QString GetProfile( const QString &name );
  QStringList ListProfiles();
  void RemoveProfile( const QString &name );
  QStringList RenameProfile( const QString &from, const QString &to );
  void CopyProfile( const QString &from, const QString &to );
  void OverrideColor( const QString &json );

private:
  TailorDBusObject *m_object;
  GlobalProfileCoordinator &m_coordinator;
};

/**
 * @brief Owns the daemon's stores, workers and D-Bus registration
 */
class TailorDBusService
{
public:
  static constexpr const char *SERVICE_NAME = "com.tux.Tailor";
  static constexpr const char *OBJECT_PATH = "/com/tux/Tailor";

  /**
   * @param configDir Directory holding the profile stores and settings
   */
  explicit TailorDBusService( const std::filesystem::path &configDir );
  ~TailorDBusService();

  TailorDBusService( const TailorDBusService & ) = delete;
  TailorDBusService( TailorDBusService && ) = delete;
  TailorDBusService &operator=( const TailorDBusService & ) = delete;
  TailorDBusService &operator=( TailorDBusService && ) = delete;

  /**
   * @brief Load the profiles, apply the active one and start the workers
   */
  void start();

  /// Call from the main thread after start() to register the D-Bus service.
  bool initDBus();

  /**
   * @brief Unregister from D-Bus and stop all workers
   */
  void shutdown();

  [[nodiscard]] GlobalProfileCoordinator &coordinator() noexcept { return *m_coordinator; }

private:
  SettingsManager m_settingsManager;
  ProfileStore< FanProfile > m_fanStore;
  ProfileStore< KeyboardProfile > m_keyboardStore;
  ProfileStore< GlobalProfile > m_globalStore;

  HwmonFanBackend m_fanBackend;
  LedKeyboardBackend m_keyboardBackend;
  PlatformProfileBackend m_platformProfileBackend;
  SuspendBroadcast m_suspendBroadcast;

  std::unique_ptr< SuspendWatcher > m_suspendWatcher;
  std::unique_ptr< FanControlWorker > m_fanControlWorker;
  std::unique_ptr< KeyboardColorWorker > m_keyboardColorWorker;
  std::unique_ptr< GlobalProfileCoordinator > m_coordinator;

  // adaptors are children of the object
  std::unique_ptr< TailorDBusObject > m_dbusObject;
  bool m_registered = false;
  bool m_stopped = false;
};
