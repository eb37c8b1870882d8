// This file is part of sc2remap - See LICENSE.md and README.md
#include "settings.h"

#include "keynames.h"
#include "logging.h"

#include <QCoreApplication>
#include <QFileInfo>
#include <QSettings>

#include <linux/uinput.h>

LOGGING_CATEGORY(lcSettings, "settings")

namespace {
  // -----------------------------------------------------------------------------------------------
  namespace settings {
    constexpr char layerKey[] = "layer/key";
    constexpr char defaultTarget[] = "layer/defaultTarget";
    constexpr char keymapGroup[] = "keymap";
    constexpr char scrollUp[] = "mouse/scrollUp";
    constexpr char scrollDown[] = "mouse/scrollDown";
    constexpr char chord[] = "mouse/chord";
    constexpr char chordLeft[] = "mouse/chordLeft";
    constexpr char chordRight[] = "mouse/chordRight";
    constexpr char passthrough[] = "mouse/passthrough";
    constexpr char holdGroup[] = "mouse.hold";
    constexpr char commandsGroup[] = "mouse.commands";
    constexpr char deviceName[] = "device/name";
    constexpr char deviceVendorId[] = "device/vendorId";
    constexpr char deviceProductId[] = "device/productId";
  }

  // -----------------------------------------------------------------------------------------------
  // Unquoted INI values containing a comma are read as string lists.
  QString stringValue(const QVariant& v)
  {
    if (v.type() == QVariant::StringList) { return v.toStringList().join(','); }
    return v.toString().trimmed();
  }
} // end anonymous namespace

// -------------------------------------------------------------------------------------------------
Settings::Settings(QObject* parent)
  : QObject(parent)
  , m_settings(new QSettings(QCoreApplication::applicationName(),
                             QCoreApplication::applicationName(), this))
{
  init();
}

// -------------------------------------------------------------------------------------------------
Settings::Settings(const QString& configFile, QObject* parent)
  : QObject(parent)
  , m_settings(new QSettings(configFile, QSettings::NativeFormat, this))
{
  init();
}

// -------------------------------------------------------------------------------------------------
Settings::~Settings()
{
}

// -------------------------------------------------------------------------------------------------
void Settings::init()
{
  const QFileInfo fi(m_settings->fileName());

  if (fi.exists() && !fi.isReadable()) {
    m_errorMessages.push_back(tr("Settings file '%1' not readable.").arg(m_settings->fileName()));
    return;
  }

  load();
}

// -------------------------------------------------------------------------------------------------
QString Settings::fileName() const
{
  return m_settings->fileName();
}

// -------------------------------------------------------------------------------------------------
void Settings::setDefaults()
{
  m_layerKey = toKey(KEY_CAPSLOCK);
  m_defaultTarget = toKey(KEY_6);
  m_keyMap = KeyMap();
  m_gestureConfig = GestureConfig();
  m_deviceOptions = VirtualDevice::Options();
}

// -------------------------------------------------------------------------------------------------
bool Settings::load()
{
  logDebug(lcSettings) << tr("Loading values from config:") << m_settings->fileName();

  m_errorMessages.clear();
  setDefaults();

  if (m_settings->status() != QSettings::NoError) {
    m_errorMessages.push_back(tr("Settings file '%1' cannot be parsed.").arg(m_settings->fileName()));
    return false;
  }

  loadLayer();
  loadKeyMap();
  loadMouse();
  loadDevice();

  for (const auto& msg : m_errorMessages) {
    logError(lcSettings) << msg;
  }
  return isValid();
}

// -------------------------------------------------------------------------------------------------
Key Settings::readKey(const QString& key, Key defaultValue)
{
  if (!m_settings->contains(key)) { return defaultValue; }

  const QString name = stringValue(m_settings->value(key));
  const Key k = KeyName::fromString(name);
  if (k == Key::None) {
    m_errorMessages.push_back(tr("Unknown key name '%1' for '%2'.").arg(name, key));
    return defaultValue;
  }

  logDebug(lcSettings) << QString("%1 = %2").arg(key, KeyName::toString(k));
  return k;
}

// -------------------------------------------------------------------------------------------------
void Settings::loadLayer()
{
  m_layerKey = readKey(::settings::layerKey, m_layerKey);
  if (isModifier(m_layerKey)) {
    m_errorMessages.push_back(tr("Modifier '%1' cannot be the layer key.")
                              .arg(KeyName::toString(m_layerKey)));
  }

  m_defaultTarget = readKey(::settings::defaultTarget, m_defaultTarget);
  if (isModifier(m_defaultTarget)) {
    m_errorMessages.push_back(tr("Modifier '%1' cannot be the default layer target.")
                              .arg(KeyName::toString(m_defaultTarget)));
  }
}

// -------------------------------------------------------------------------------------------------
void Settings::loadKeyMap()
{
  KeyMap::Table table;
  m_settings->beginGroup(::settings::keymapGroup);
  for (const auto& source : m_settings->childKeys())
  {
    const Key from = KeyName::fromString(source);
    const QString targetName = stringValue(m_settings->value(source));
    const Key to = KeyName::fromString(targetName);

    if (from == Key::None || to == Key::None) {
      m_errorMessages.push_back(tr("Invalid keymap entry '%1=%2'.").arg(source, targetName));
      continue;
    }
    if (isModifier(from) || isModifier(to)) {
      m_errorMessages.push_back(tr("Modifiers cannot be remapped: '%1=%2'.").arg(source, targetName));
      continue;
    }
    if (from == m_layerKey) {
      m_errorMessages.push_back(tr("The layer key cannot be remapped: '%1=%2'.").arg(source, targetName));
      continue;
    }
    table[from] = to;
  }
  m_settings->endGroup();

  logDebug(lcSettings) << QString("keymap = %1 entries").arg(table.size());
  m_keyMap = KeyMap(std::move(table));
}

// -------------------------------------------------------------------------------------------------
void Settings::loadMouse()
{
  auto& gc = m_gestureConfig;
  gc.scrollUp = readKey(::settings::scrollUp, gc.scrollUp);
  gc.scrollDown = readKey(::settings::scrollDown, gc.scrollDown);
  gc.chord = m_settings->value(::settings::chord, gc.chord).toBool();
  gc.chordLeft = readKey(::settings::chordLeft, gc.chordLeft);
  gc.chordRight = readKey(::settings::chordRight, gc.chordRight);

  const QString passthrough = stringValue(m_settings->value(::settings::passthrough,
                                                            toString(gc.passthrough, false))).toLower();
  if (passthrough == "drop") {
    gc.passthrough = PassthroughMode::Drop;
  } else if (passthrough == "forward") {
    gc.passthrough = PassthroughMode::Forward;
  } else {
    m_errorMessages.push_back(tr("Invalid mouse passthrough mode '%1' (drop, forward).").arg(passthrough));
  }

  // Button groups, keys are mouse button names
  const auto readButton = [this](const QString& name, const char* group) {
    const Key button = KeyName::fromString(name);
    if (!isMouseButton(button)) {
      m_errorMessages.push_back(tr("'%1' in [%2] is not a mouse button.").arg(name, group));
      return Key::None;
    }
    return button;
  };

  m_settings->beginGroup(::settings::holdGroup);
  for (const auto& name : m_settings->childKeys())
  {
    const Key button = readButton(name, ::settings::holdGroup);
    if (button == Key::None) continue;

    const QString targetName = stringValue(m_settings->value(name));
    const Key target = KeyName::fromString(targetName);
    if (target == Key::None) {
      m_errorMessages.push_back(tr("Unknown key name '%1' for button '%2'.").arg(targetName, name));
      continue;
    }
    gc.holdButtons[button] = target;
  }
  m_settings->endGroup();

  m_settings->beginGroup(::settings::commandsGroup);
  for (const auto& name : m_settings->childKeys())
  {
    const Key button = readButton(name, ::settings::commandsGroup);
    if (button == Key::None) continue;

    const QString command = stringValue(m_settings->value(name));
    if (command.isEmpty()) {
      m_errorMessages.push_back(tr("Empty command for button '%1'.").arg(name));
      continue;
    }
    gc.buttonCommands[button] = command;
  }
  m_settings->endGroup();
}

// -------------------------------------------------------------------------------------------------
void Settings::loadDevice()
{
  auto& opts = m_deviceOptions;
  opts.name = stringValue(m_settings->value(::settings::deviceName, opts.name));
  if (opts.name.isEmpty() || opts.name.toLocal8Bit().size() >= UINPUT_MAX_NAME_SIZE) {
    m_errorMessages.push_back(tr("Invalid virtual device name '%1'.").arg(opts.name));
  }

  const auto readId = [this](const char* key, uint16_t defaultValue) -> uint16_t {
    if (!m_settings->contains(key)) { return defaultValue; }
    bool ok = false;
    const QString value = stringValue(m_settings->value(key));
    const uint16_t id = value.toUShort(&ok, 0);
    if (!ok) {
      m_errorMessages.push_back(tr("Invalid id '%1' for '%2'.").arg(value, key));
      return defaultValue;
    }
    return id;
  };

  opts.vendorId = readId(::settings::deviceVendorId, opts.vendorId);
  opts.productId = readId(::settings::deviceProductId, opts.productId);
}
