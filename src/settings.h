// This file is part of sc2remap - See LICENSE.md and README.md
# pragma once

#include "gestures.h"
#include "inputevent.h"
#include "keymap.h"
#include "virtualdevice.h"

#include <QObject>
#include <QStringList>

class QSettings;

/// Read-only daemon configuration from an INI file. Values not present in the file keep
/// their defaults; invalid values are collected in errorMessages().
class Settings : public QObject
{
  Q_OBJECT

public:
  explicit Settings(QObject* parent = nullptr);
  explicit Settings(const QString& configFile, QObject* parent = nullptr);
  ~Settings() override;

  void setDefaults();

  /// (Re)load all values, returns false if the configuration contains errors.
  bool load();

  bool isValid() const { return m_errorMessages.isEmpty(); }
  const QStringList& errorMessages() const { return m_errorMessages; }
  QString fileName() const;

  Key layerKey() const { return m_layerKey; }
  Key defaultTarget() const { return m_defaultTarget; }
  const KeyMap& keyMap() const { return m_keyMap; }
  const GestureConfig& gestureConfig() const { return m_gestureConfig; }
  const VirtualDevice::Options& virtualDeviceOptions() const { return m_deviceOptions; }

private:
  void init();
  Key readKey(const QString& key, Key defaultValue);
  void loadLayer();
  void loadKeyMap();
  void loadMouse();
  void loadDevice();

  QSettings* m_settings = nullptr;
  QStringList m_errorMessages;

  Key m_layerKey = toKey(KEY_CAPSLOCK);
  Key m_defaultTarget = toKey(KEY_6);
  KeyMap m_keyMap;
  GestureConfig m_gestureConfig;
  VirtualDevice::Options m_deviceOptions;
};
