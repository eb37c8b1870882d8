// This file is part of sc2remap - See LICENSE.md and README.md
#include "inputevent.h"

#include "testutil.h"

// -------------------------------------------------------------------------------------------------
TEST_CASE("raw event codes are classified", "[inputevent]")
{
  CHECK(EventCode::fromRaw(EV_KEY, KEY_A).eventClass() == EventClass::Key);
  CHECK(EventCode::fromRaw(EV_KEY, KEY_A).key() == toKey(KEY_A));
  CHECK(EventCode::fromRaw(EV_REL, REL_WHEEL).relAxis() == RelAxis::Wheel);
  CHECK(EventCode::fromRaw(EV_SYN, SYN_REPORT).syncCode() == SyncCode::Report);
  CHECK(EventCode::fromRaw(EV_MSC, MSC_SCAN).miscCode() == MiscCode::Scan);

  const auto led = EventCode::fromRaw(EV_LED, LED_NUML);
  CHECK(led.eventClass() == EventClass::Other);
  CHECK(led.rawType() == EV_LED);
  CHECK(led.rawCode() == LED_NUML);
}

// -------------------------------------------------------------------------------------------------
TEST_CASE("input events convert to and from evdev records", "[inputevent]")
{
  struct input_event raw {};
  raw.input_event_sec = 12;
  raw.input_event_usec = 345;
  raw.type = EV_REL;
  raw.code = REL_WHEEL;
  raw.value = -1;

  const InputEvent ie(raw);
  CHECK(ie.isRelative(RelAxis::Wheel));
  CHECK(ie.value == -1);
  CHECK(ie.time.tv_sec == 12);
  CHECK(ie.time.tv_usec == 345);

  const auto back = ie.toInputEvent();
  CHECK(back.type == EV_REL);
  CHECK(back.code == REL_WHEEL);
  CHECK(back.value == -1);
  CHECK(back.input_event_usec == 345);
}

// -------------------------------------------------------------------------------------------------
TEST_CASE("event equality ignores timestamps", "[inputevent]")
{
  InputEvent a = Events::press(toKey(KEY_A));
  InputEvent b = Events::press(toKey(KEY_A));
  b.time.tv_sec = 99;

  CHECK(a == b);
  CHECK(a != Events::release(toKey(KEY_A)));
  CHECK(a != Events::press(toKey(KEY_B)));
  // same numeric code in a different class
  CHECK(EventCode(toKey(REL_WHEEL)) != EventCode(RelAxis::Wheel));
}

// -------------------------------------------------------------------------------------------------
TEST_CASE("a tap is press, sync, release, sync", "[inputevent]")
{
  EventSequence out;
  Events::appendTap(out, toKey(KEY_UP));

  REQUIRE(out.size() == 4);
  CHECK(out[0] == Events::press(toKey(KEY_UP)));
  CHECK(out[1].isSyncReport());
  CHECK(out[2] == Events::release(toKey(KEY_UP)));
  CHECK(out[3].isSyncReport());
}

// -------------------------------------------------------------------------------------------------
TEST_CASE("modifier and mouse button keys", "[inputevent]")
{
  CHECK(isModifier(toKey(KEY_RIGHTMETA)));
  CHECK_FALSE(isModifier(toKey(KEY_CAPSLOCK)));
  CHECK(isMouseButton(toKey(BTN_EXTRA)));
  CHECK_FALSE(isMouseButton(toKey(KEY_A)));
}
