// This file is part of sc2remap - See LICENSE.md and README.md
#include "gestures.h"

#include "enum-helper.h"

// -------------------------------------------------------------------------------------------------
const char* toString(PassthroughMode pm, bool withClass)
{
  switch (pm) {
    ENUM_CASE_STRINGIFY3(PassthroughMode, Drop, withClass);
    ENUM_CASE_STRINGIFY3(PassthroughMode, Forward, withClass);
  }
  return withClass ? "PassthroughMode::(unknown)" : "(unknown)";
}

// -------------------------------------------------------------------------------------------------
MouseGestureTranslator::MouseGestureTranslator(GestureConfig config)
  : m_config(std::move(config))
{}

// -------------------------------------------------------------------------------------------------
void MouseGestureTranslator::feed(const InputEvent& ie, Output& out)
{
  bool consumed = false;
  switch (ie.code.eventClass())
  {
  case EventClass::Key:
    consumed = feedButton(ie, out);
    break;
  case EventClass::Relative:
    consumed = feedWheel(ie, out);
    break;
  case EventClass::Sync:
    // Held keys are flushed with the physical report, also when it is not forwarded.
    if (ie.isSyncReport() && m_syncPending) {
      m_syncPending = false;
      if (m_config.passthrough == PassthroughMode::Drop) {
        out.events.push_back(ie);
      }
    }
    break;
  case EventClass::Misc:
  case EventClass::Other:
    break;
  }

  if (!consumed && m_config.passthrough == PassthroughMode::Forward) {
    out.events.push_back(ie);
  }
}

// -------------------------------------------------------------------------------------------------
// Returns true if the button event must not be forwarded.
bool MouseGestureTranslator::feedButton(const InputEvent& ie, Output& out)
{
  const Key button = ie.code.key();

  if (button == toKey(BTN_MIDDLE)) {
    m_middleHeld = !ie.isRelease();
    return false;
  }

  if (ie.isRelease()) {
    const auto hold = m_config.holdButtons.find(button);
    if (hold != m_config.holdButtons.cend()) {
      out.events.push_back(Events::key(hold->second, ie.value));
      m_syncPending = true;
    }
    return m_consumedButtons.erase(button) > 0;
  }

  bool consumed = false;
  if (m_config.chord && m_middleHeld && ie.isPress())
  {
    if (button == toKey(BTN_LEFT)) {
      Events::appendTap(out.events, m_config.chordLeft);
      consumed = true;
    }
    else if (button == toKey(BTN_RIGHT)) {
      Events::appendTap(out.events, m_config.chordRight);
      consumed = true;
    }
  }

  const auto hold = m_config.holdButtons.find(button);
  if (hold != m_config.holdButtons.cend()) {
    // no SYN, mirrors the physical button
    out.events.push_back(Events::key(hold->second, ie.value));
    m_syncPending = true;
    consumed = true;
  }

  const auto cmd = m_config.buttonCommands.find(button);
  if (cmd != m_config.buttonCommands.cend()) {
    if (ie.isPress()) { out.commands.push_back(cmd->second); }
    consumed = true;
  }

  if (consumed) { m_consumedButtons.insert(button); }
  return consumed || m_consumedButtons.count(button) > 0;
}

// -------------------------------------------------------------------------------------------------
// Returns true if the relative event must not be forwarded.
bool MouseGestureTranslator::feedWheel(const InputEvent& ie, Output& out)
{
  // Holding the middle button is drag scrolling, the wheel is left alone.
  if (m_middleHeld) { return false; }

  if (ie.isRelative(RelAxis::Wheel))
  {
    if (ie.value == 1) {
      Events::appendTap(out.events, m_config.scrollUp);
      return true;
    }
    if (ie.value == -1) {
      Events::appendTap(out.events, m_config.scrollDown);
      return true;
    }
    return false;
  }

  // The high resolution wheel reports the same notch, never forward it on its own.
  return ie.isRelative(RelAxis::WheelHiRes);
}
