// This file is part of sc2remap - See LICENSE.md and README.md
#include "remapdaemon.h"

#include "deviceroles.h"
#include "eventsource.h"
#include "keynames.h"
#include "logging.h"
#include "multiplexer.h"
#include "virtualdevice.h"

#include <QProcess>
#include <QTimer>

LOGGING_CATEGORY(daemon, "daemon")
TRACE_LOGGING_CATEGORY(daemonTrace, "daemon")

namespace {
  constexpr int keyReleasePollMs = 20;
} // end anonymous namespace

// -------------------------------------------------------------------------------------------------
RemapDaemon::RemapDaemon(Options options, std::unique_ptr<RoleResolver> resolver,
                         std::shared_ptr<EventSink> sink, QObject* parent)
  : QObject(parent)
  , m_options(std::move(options))
  , m_resolver(std::move(resolver))
  , m_sink(std::move(sink))
  , m_remap(m_options.keyMap, m_options.layerKey)
  , m_state(m_options.defaultTarget)
  , m_gestures(m_options.gestures)
{
  connect(m_resolver.get(), &RoleResolver::resolved, this, &RemapDaemon::onDevicesResolved);
  connect(m_resolver.get(), &RoleResolver::failed, this, &RemapDaemon::onFatalError);
}

// -------------------------------------------------------------------------------------------------
RemapDaemon::~RemapDaemon() = default;

// -------------------------------------------------------------------------------------------------
void RemapDaemon::start()
{
  logInfo(daemon) << tr("Layer key '%1', initial target '%2', %3 key substitutions.")
                     .arg(KeyName::toString(m_options.layerKey),
                          KeyName::toString(m_options.defaultTarget))
                     .arg(m_options.keyMap.substitutions().size());
  m_resolver->start();
}

// -------------------------------------------------------------------------------------------------
void RemapDaemon::onDevicesResolved(const std::shared_ptr<EventSource>& keyboard,
                                    const std::shared_ptr<EventSource>& mouse)
{
  if (m_failed) { return; }

  m_keyboard = keyboard;
  m_mouse = mouse;
  grabAndRun();
}

// -------------------------------------------------------------------------------------------------
// Grabbing while a key is down would send its release only to us, the system would keep the
// key pressed. Keys are polled until all are released.
void RemapDaemon::grabAndRun()
{
  if (m_failed) { return; }

  Error error;
  // Events read so far were already seen by the system, they must not be emitted again.
  if (!m_keyboard->discardPending(error) || !m_mouse->discardPending(error)) {
    onFatalError(error);
    return;
  }

  if (m_options.grabDevices)
  {
    std::vector<Key> pressed;
    if (!m_keyboard->pressedKeys(pressed, error)) {
      onFatalError(error);
      return;
    }

    if (!pressed.empty())
    {
      if (!m_waitingForRelease) {
        QStringList names;
        for (const auto key : pressed) { names.push_back(KeyName::toString(key)); }
        logInfo(daemon) << tr("Waiting for release of %1 before grabbing '%2'.")
                           .arg(names.join(", "), m_keyboard->path());
        m_waitingForRelease = true;
      }
      QTimer::singleShot(keyReleasePollMs, this, &RemapDaemon::grabAndRun);
      return;
    }
    m_waitingForRelease = false;

    if (!m_keyboard->grab(error)) {
      onFatalError(error);
      return;
    }
    if (m_options.gestures.passthrough == PassthroughMode::Forward && !m_mouse->grab(error)) {
      onFatalError(error);
      return;
    }
  }

  const auto keyboard = std::move(m_keyboard);
  const auto mouse = std::move(m_mouse);
  m_multiplexer = std::make_unique<EventMultiplexer>(keyboard, mouse);
  m_multiplexer->setKeyboardHandler([this](const InputEvent& ie) { return onKeyboardEvent(ie); });
  m_multiplexer->setMouseHandler([this](const InputEvent& ie) { return onMouseEvent(ie); });
  connect(m_multiplexer.get(), &EventMultiplexer::sourceFailed, this, &RemapDaemon::onFatalError);

  logInfo(daemon) << tr("Remapping keyboard '%1' and mouse '%2' (mouse events: %3).")
                     .arg(keyboard->name(), mouse->name(),
                          toString(m_options.gestures.passthrough, false));
  m_multiplexer->start();
  emit running();
}

// -------------------------------------------------------------------------------------------------
bool RemapDaemon::onKeyboardEvent(const InputEvent& ie)
{
  if (m_failed) { return false; }

  m_keyboardOut.clear();
  m_remap.feed(m_state, ie, m_keyboardOut);

  if (ie.isKey()) {
    logDebug(daemonTrace) << m_state << "->" << m_keyboardOut;
  }
  return emitToSink(m_keyboardOut);
}

// -------------------------------------------------------------------------------------------------
bool RemapDaemon::onMouseEvent(const InputEvent& ie)
{
  if (m_failed) { return false; }

  m_mouseOut.clear();
  m_gestures.feed(ie, m_mouseOut);

  if (!m_mouseOut.events.empty() && !ie.isRelative(RelAxis::X) && !ie.isRelative(RelAxis::Y)) {
    logDebug(daemon) << "injecting" << m_mouseOut.events;
  }

  for (const auto& command : m_mouseOut.commands) {
    runCommand(command);
  }
  return emitToSink(m_mouseOut.events);
}

// -------------------------------------------------------------------------------------------------
bool RemapDaemon::emitToSink(const EventSequence& events)
{
  if (events.empty()) { return true; }
  if (m_sink->emitEvents(events)) { return true; }

  onFatalError(Error::fatal(tr("Failed to write %1 events to the virtual device.").arg(events.size())));
  return false;
}

// -------------------------------------------------------------------------------------------------
void RemapDaemon::runCommand(const QString& command)
{
  qint64 pid = 0;
  if (QProcess::startDetached("/bin/sh", {"-c", command}, QString(), &pid)) {
    logInfo(daemon) << tr("Started '%1' (pid %2)").arg(command).arg(pid);
  } else {
    logWarning(daemon) << tr("Failed to start '%1'").arg(command);
  }
}

// -------------------------------------------------------------------------------------------------
void RemapDaemon::onFatalError(const Error& error)
{
  if (m_failed) { return; }
  m_failed = true;

  logError(daemon) << error.toString();
  if (m_multiplexer) { m_multiplexer->stop(); }
  emit fatalError(error);
}
