// This file is part of sc2remap - See LICENSE.md and README.md
#pragma once

#include <cstdint>
#include <vector>

#include <QDebug>

#include <linux/input.h>

// REL_WHEEL_HI_RES is only defined in newer linux versions
#ifndef REL_WHEEL_HI_RES
#define REL_WHEEL_HI_RES 0x0b
#endif

// -------------------------------------------------------------------------------------------------
// Strongly typed event codes, one type per event class. The numeric values are the
// codes from linux/input-event-codes.h.
enum class Key : uint16_t {
  None = KEY_RESERVED, // never emitted by a real device
};

enum class RelAxis : uint16_t {
  X = REL_X,
  Y = REL_Y,
  HWheel = REL_HWHEEL,
  Wheel = REL_WHEEL,
  WheelHiRes = REL_WHEEL_HI_RES,
};

enum class SyncCode : uint16_t {
  Report = SYN_REPORT,
  Config = SYN_CONFIG,
  MtReport = SYN_MT_REPORT,
  Dropped = SYN_DROPPED,
};

enum class MiscCode : uint16_t {
  Serial = MSC_SERIAL,
  Scan = MSC_SCAN,
};

constexpr Key toKey(uint16_t code) { return static_cast<Key>(code); }
constexpr uint16_t toCode(Key key) { return static_cast<uint16_t>(key); }

/// True for left/right shift, ctrl, alt and meta.
bool isModifier(Key key);

/// True for mouse button codes (left, right, middle, side, extra).
bool isMouseButton(Key key);

// -------------------------------------------------------------------------------------------------
enum class EventClass : uint8_t {
  Sync,
  Key,
  Relative,
  Misc,
  Other, ///< any other evdev class, carried through verbatim
};

const char* toString(EventClass ec, bool withClass = true);

// -------------------------------------------------------------------------------------------------
/// Tagged union of event class and the class specific code.
class EventCode
{
public:
  EventCode() : m_class(EventClass::Sync) { m_code.sync = SyncCode::Report; }
  EventCode(Key key) : m_class(EventClass::Key) { m_code.key = key; }
  EventCode(RelAxis axis) : m_class(EventClass::Relative) { m_code.rel = axis; }
  EventCode(SyncCode sync) : m_class(EventClass::Sync) { m_code.sync = sync; }
  EventCode(MiscCode misc) : m_class(EventClass::Misc) { m_code.misc = misc; }

  /// Create from a raw evdev type/code pair.
  static EventCode fromRaw(uint16_t type, uint16_t code);

  EventClass eventClass() const { return m_class; }
  bool is(EventClass ec) const { return m_class == ec; }

  // Accessors are only valid for the matching event class.
  Key key() const { return m_code.key; }
  RelAxis relAxis() const { return m_code.rel; }
  SyncCode syncCode() const { return m_code.sync; }
  MiscCode miscCode() const { return m_code.misc; }

  uint16_t rawType() const;
  uint16_t rawCode() const;

  bool operator==(const EventCode& o) const;
  bool operator!=(const EventCode& o) const { return !(*this == o); }

private:
  EventClass m_class;
  uint16_t m_otherType = 0; ///< evdev type, only used for EventClass::Other
  union {
    Key key;
    RelAxis rel;
    SyncCode sync;
    MiscCode misc;
    uint16_t raw;
  } m_code;
};

// -------------------------------------------------------------------------------------------------
/// A single input event as read from or written to an evdev device.
struct InputEvent
{
  InputEvent() = default;
  InputEvent(EventCode code, int32_t value) : code(code), value(value) {}
  InputEvent(const struct input_event& ie);

  struct input_event toInputEvent() const;

  bool isKey() const { return code.is(EventClass::Key); }
  bool isKey(Key k) const { return isKey() && code.key() == k; }
  bool isRelative(RelAxis axis) const { return code.is(EventClass::Relative) && code.relAxis() == axis; }
  bool isSyncReport() const { return code.is(EventClass::Sync) && code.syncCode() == SyncCode::Report; }

  bool isPress() const { return value == 1; }
  bool isRelease() const { return value == 0; }
  bool isRepeat() const { return value == 2; }

  /// Event code and value equality, timestamps are ignored.
  bool operator==(const InputEvent& o) const;
  bool operator!=(const InputEvent& o) const;

  struct timeval time {};
  EventCode code;
  int32_t value = 0;
};

/// A sequence of input events in emission order.
using EventSequence = std::vector<InputEvent>;

// -------------------------------------------------------------------------------------------------
namespace Events
{
  inline InputEvent key(Key k, int32_t value) { return InputEvent(EventCode(k), value); }
  inline InputEvent press(Key k) { return key(k, 1); }
  inline InputEvent release(Key k) { return key(k, 0); }
  inline InputEvent syncReport() { return InputEvent(EventCode(SyncCode::Report), 0); }
  inline InputEvent relative(RelAxis axis, int32_t delta) { return InputEvent(EventCode(axis), delta); }

  /// Append a tap: press, SYN_REPORT, release, SYN_REPORT.
  void appendTap(EventSequence& out, Key k);
}

// -------------------------------------------------------------------------------------------------
QDebug operator<<(QDebug debug, const InputEvent& ie);
QDebug operator<<(QDebug debug, const EventSequence& es);
