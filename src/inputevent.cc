// This file is part of sc2remap - See LICENSE.md and README.md
#include "inputevent.h"

#include "enum-helper.h"
#include "keynames.h"

#include <tuple>

// -------------------------------------------------------------------------------------------------
bool isModifier(Key key)
{
  switch (toCode(key)) {
    case KEY_LEFTSHIFT: case KEY_RIGHTSHIFT:
    case KEY_LEFTCTRL: case KEY_RIGHTCTRL:
    case KEY_LEFTALT: case KEY_RIGHTALT:
    case KEY_LEFTMETA: case KEY_RIGHTMETA:
      return true;
  }
  return false;
}

// -------------------------------------------------------------------------------------------------
bool isMouseButton(Key key)
{
  switch (toCode(key)) {
    case BTN_LEFT: case BTN_RIGHT: case BTN_MIDDLE:
    case BTN_SIDE: case BTN_EXTRA:
      return true;
  }
  return false;
}

// -------------------------------------------------------------------------------------------------
const char* toString(EventClass ec, bool withClass)
{
  switch (ec) {
    ENUM_CASE_STRINGIFY3(EventClass, Sync, withClass);
    ENUM_CASE_STRINGIFY3(EventClass, Key, withClass);
    ENUM_CASE_STRINGIFY3(EventClass, Relative, withClass);
    ENUM_CASE_STRINGIFY3(EventClass, Misc, withClass);
    ENUM_CASE_STRINGIFY3(EventClass, Other, withClass);
  }
  return withClass ? "EventClass::(unknown)" : "(unknown)";
}

// -------------------------------------------------------------------------------------------------
EventCode EventCode::fromRaw(uint16_t type, uint16_t code)
{
  switch (type) {
    case EV_SYN: return EventCode(static_cast<SyncCode>(code));
    case EV_KEY: return EventCode(toKey(code));
    case EV_REL: return EventCode(static_cast<RelAxis>(code));
    case EV_MSC: return EventCode(static_cast<MiscCode>(code));
  }

  EventCode other;
  other.m_class = EventClass::Other;
  other.m_otherType = type;
  other.m_code.raw = code;
  return other;
}

// -------------------------------------------------------------------------------------------------
uint16_t EventCode::rawType() const
{
  switch (m_class) {
    case EventClass::Sync: return EV_SYN;
    case EventClass::Key: return EV_KEY;
    case EventClass::Relative: return EV_REL;
    case EventClass::Misc: return EV_MSC;
    case EventClass::Other: return m_otherType;
  }
  return m_otherType;
}

// -------------------------------------------------------------------------------------------------
uint16_t EventCode::rawCode() const
{
  switch (m_class) {
    case EventClass::Sync: return to_integral(m_code.sync);
    case EventClass::Key: return to_integral(m_code.key);
    case EventClass::Relative: return to_integral(m_code.rel);
    case EventClass::Misc: return to_integral(m_code.misc);
    case EventClass::Other: return m_code.raw;
  }
  return m_code.raw;
}

// -------------------------------------------------------------------------------------------------
bool EventCode::operator==(const EventCode& o) const
{
  return std::make_tuple(rawType(), rawCode()) == std::make_tuple(o.rawType(), o.rawCode());
}

// -------------------------------------------------------------------------------------------------
InputEvent::InputEvent(const struct input_event& ie)
  : code(EventCode::fromRaw(ie.type, ie.code)), value(ie.value)
{
  time.tv_sec = ie.input_event_sec;
  time.tv_usec = ie.input_event_usec;
}

// -------------------------------------------------------------------------------------------------
struct input_event InputEvent::toInputEvent() const
{
  struct input_event ie {};
  ie.input_event_sec = time.tv_sec;
  ie.input_event_usec = time.tv_usec;
  ie.type = code.rawType();
  ie.code = code.rawCode();
  ie.value = value;
  return ie;
}

bool InputEvent::operator==(const InputEvent& o) const {
  return code == o.code && value == o.value;
}

bool InputEvent::operator!=(const InputEvent& o) const {
  return !(*this == o);
}

// -------------------------------------------------------------------------------------------------
void Events::appendTap(EventSequence& out, Key k)
{
  out.emplace_back(press(k));
  out.emplace_back(syncReport());
  out.emplace_back(release(k));
  out.emplace_back(syncReport());
}

// -------------------------------------------------------------------------------------------------
QDebug operator<<(QDebug debug, const InputEvent& ie)
{
  QDebugStateSaver saver(debug);
  debug.nospace() << '{' << toString(ie.code.eventClass(), false) << ", ";
  if (ie.isKey()) {
    debug.nospace() << KeyName::toString(ie.code.key());
  } else {
    debug.nospace() << ie.code.rawCode();
  }
  debug.nospace() << ", " << ie.value << '}';
  return debug;
}

// -------------------------------------------------------------------------------------------------
QDebug operator<<(QDebug debug, const EventSequence& es)
{
  QDebugStateSaver saver(debug);
  debug.nospace() << "[";
  for (const auto& e : es) {
    debug.nospace() << e << ',';
  }
  debug.nospace() << "]";
  return debug;
}
