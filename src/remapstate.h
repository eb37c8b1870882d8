// This file is part of sc2remap - See LICENSE.md and README.md
#pragma once

#include "inputevent.h"
#include "keymap.h"

// -------------------------------------------------------------------------------------------------
/// Layering state of the keyboard path.
///  - currentKey is set while the layer key is down and its synthetic press of currentKey
///    is not released yet.
///  - held is true while the most recently pressed mapped key is physically down.
///  - nextKey is the mapping target of the most recent press of a mappable key.
struct RemapState
{
  RemapState() = default;
  explicit RemapState(Key defaultTarget) : nextKey(defaultTarget) {}

  Key currentKey = Key::None;
  Key nextKey = Key::None;
  bool held = false;
};

QDebug operator<<(QDebug debug, const RemapState& state);

// -------------------------------------------------------------------------------------------------
/// Transition function of the layer key logic. The machine itself is immutable, the state is
/// passed in by reference so it can be tested without any device.
class RemapStateMachine
{
public:
  RemapStateMachine(KeyMap keyMap, Key layerKey);

  /// Process one keyboard event, updates `state` and appends the output events to `out`.
  void feed(RemapState& state, const InputEvent& ie, EventSequence& out) const;

  Key layerKey() const { return m_layerKey; }
  const KeyMap& keyMap() const { return m_keyMap; }

private:
  void feedLayerKey(RemapState& state, const InputEvent& ie, EventSequence& out) const;
  void feedOtherKey(RemapState& state, const InputEvent& ie, EventSequence& out) const;

  const KeyMap m_keyMap;
  const Key m_layerKey;
};
