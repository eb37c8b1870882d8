// This file is part of sc2remap - See LICENSE.md and README.md
#pragma once

#include "inputevent.h"

#include <QString>
#include <QStringList>

#include <map>
#include <set>

// -------------------------------------------------------------------------------------------------
/// What happens to mouse events that are not translated.
enum class PassthroughMode : uint8_t {
  Drop,    ///< mouse is not grabbed, the system sees the physical events anyway
  Forward, ///< mouse is grabbed, untranslated events are written to the virtual device
};

const char* toString(PassthroughMode pm, bool withClass = true);

// -------------------------------------------------------------------------------------------------
struct GestureConfig
{
  Key scrollUp = toKey(KEY_UP);
  Key scrollDown = toKey(KEY_DOWN);

  bool chord = true; ///< middle + left/right taps chordLeft/chordRight
  Key chordLeft = toKey(KEY_HOME);
  Key chordRight = toKey(KEY_END);

  std::map<Key, Key> holdButtons;        ///< button -> key, forwarded as held key
  std::map<Key, QString> buttonCommands; ///< button -> command started on press

  PassthroughMode passthrough = PassthroughMode::Drop;
};

// -------------------------------------------------------------------------------------------------
/// Translates mouse events to synthesized key events. The state is the middle button
/// (drag scroll / chord), the set of buttons whose press was consumed and whether a held
/// key injection still waits for the mouse's SYN_REPORT.
class MouseGestureTranslator
{
public:
  struct Output {
    EventSequence events;
    QStringList commands; ///< commands to start, in button press order
    void clear() { events.clear(); commands.clear(); }
  };

  explicit MouseGestureTranslator(GestureConfig config);

  /// Process one mouse event and append the results to `out`.
  void feed(const InputEvent& ie, Output& out);

  bool middleHeld() const { return m_middleHeld; }
  const GestureConfig& config() const { return m_config; }

private:
  bool feedButton(const InputEvent& ie, Output& out);
  bool feedWheel(const InputEvent& ie, Output& out);

  const GestureConfig m_config;
  bool m_middleHeld = false;
  std::set<Key> m_consumedButtons; // pressed buttons that are not forwarded
  bool m_syncPending = false;      // held key events emitted without a following SYN_REPORT
};
