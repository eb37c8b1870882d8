// This file is part of sc2remap - See LICENSE.md and README.md
#pragma once

#include "error.h"
#include "gestures.h"
#include "remapstate.h"

#include <QObject>

#include <memory>

class EventMultiplexer;
class EventSink;
class EventSource;
class RoleResolver;

/// Runtime core: resolves the device roles, then remaps keyboard events and translates mouse
/// gestures to the event sink. All fatal conditions end up in onFatalError().
class RemapDaemon : public QObject
{
  Q_OBJECT

public:
  struct Options {
    Key layerKey = toKey(KEY_CAPSLOCK);
    Key defaultTarget = toKey(KEY_6);
    KeyMap keyMap;
    GestureConfig gestures;
    bool grabDevices = true; // exclusive access to the keyboard (and the mouse in forward mode)
  };

  RemapDaemon(Options options, std::unique_ptr<RoleResolver> resolver,
              std::shared_ptr<EventSink> sink, QObject* parent = nullptr);
  ~RemapDaemon() override;

  /// Start role identification, the event loop must be running or started afterwards.
  void start();

  bool isRunning() const { return m_multiplexer != nullptr && !m_failed; }
  const RemapState& remapState() const { return m_state; }

signals:
  /// Both devices are resolved and events are processed.
  void running();
  /// The daemon stopped processing events.
  void fatalError(const Error& error);

private:
  void onDevicesResolved(const std::shared_ptr<EventSource>& keyboard,
                         const std::shared_ptr<EventSource>& mouse);
  void grabAndRun();
  void onFatalError(const Error& error);
  bool onKeyboardEvent(const InputEvent& ie);
  bool onMouseEvent(const InputEvent& ie);
  bool emitToSink(const EventSequence& events);
  void runCommand(const QString& command);

  const Options m_options;
  std::unique_ptr<RoleResolver> m_resolver;
  std::shared_ptr<EventSink> m_sink;
  std::shared_ptr<EventSource> m_keyboard;
  std::shared_ptr<EventSource> m_mouse;
  std::unique_ptr<EventMultiplexer> m_multiplexer;

  const RemapStateMachine m_remap;
  RemapState m_state;
  MouseGestureTranslator m_gestures;

  EventSequence m_keyboardOut;
  MouseGestureTranslator::Output m_mouseOut;
  bool m_failed = false;
  bool m_waitingForRelease = false;
};
