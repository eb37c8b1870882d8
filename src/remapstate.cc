// This file is part of sc2remap - See LICENSE.md and README.md
#include "remapstate.h"

#include "keynames.h"

// -------------------------------------------------------------------------------------------------
QDebug operator<<(QDebug debug, const RemapState& state)
{
  QDebugStateSaver saver(debug);
  debug.nospace() << "RemapState(current="
                  << (state.currentKey == Key::None ? QString("-") : KeyName::toString(state.currentKey))
                  << ", next=" << KeyName::toString(state.nextKey)
                  << ", held=" << state.held << ")";
  return debug;
}

// -------------------------------------------------------------------------------------------------
RemapStateMachine::RemapStateMachine(KeyMap keyMap, Key layerKey)
  : m_keyMap(std::move(keyMap))
  , m_layerKey(layerKey)
{}

// -------------------------------------------------------------------------------------------------
void RemapStateMachine::feed(RemapState& state, const InputEvent& ie, EventSequence& out) const
{
  switch (ie.code.eventClass())
  {
  case EventClass::Key:
    if (ie.code.key() == m_layerKey) {
      feedLayerKey(state, ie, out);
    } else {
      feedOtherKey(state, ie, out);
    }
    return;
  case EventClass::Sync:
  case EventClass::Relative:
  case EventClass::Misc:
  case EventClass::Other:
    out.push_back(ie);
    return;
  }
}

// -------------------------------------------------------------------------------------------------
void RemapStateMachine::feedLayerKey(RemapState& state, const InputEvent& ie, EventSequence& out) const
{
  if (ie.isRelease())
  {
    if (state.currentKey != Key::None) {
      // The substituted key gets its own release, not the layer key.
      out.push_back(Events::release(state.currentKey));
      state.currentKey = Key::None;
    } else {
      out.push_back(ie);
    }
    return;
  }

  if (!ie.isPress() && !ie.isRepeat()) {
    out.push_back(ie);
    return;
  }

  state.currentKey = state.nextKey;
  if (ie.isPress() && state.held) {
    // target already down from a direct key press
    out.push_back(Events::release(state.nextKey));
  }
  out.push_back(Events::key(state.nextKey, ie.value));
}

// -------------------------------------------------------------------------------------------------
void RemapStateMachine::feedOtherKey(RemapState& state, const InputEvent& ie, EventSequence& out) const
{
  const Key mapped = m_keyMap.map(ie.code.key());

  if (mapped != Key::None)
  {
    if (ie.isRelease())
    {
      if (mapped == state.nextKey) { state.held = false; }
    }
    else if (ie.isPress() || ie.isRepeat())
    {
      state.nextKey = mapped;
      state.held = true;
      if (state.currentKey == mapped) {
        out.push_back(Events::release(mapped));
      }
    }
  }

  // The physical key always passes through unchanged.
  out.push_back(ie);
}
