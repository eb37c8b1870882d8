// This file is part of sc2remap - See LICENSE.md and README.md
#include "gestures.h"

#include "testutil.h"

namespace {
  using namespace Events;

  const Key Left = toKey(BTN_LEFT);
  const Key Right = toKey(BTN_RIGHT);
  const Key Middle = toKey(BTN_MIDDLE);
  const Key Side = toKey(BTN_SIDE);
  const Key Extra = toKey(BTN_EXTRA);

  // -----------------------------------------------------------------------------------------------
  MouseGestureTranslator::Output feed(MouseGestureTranslator& t, const EventSequence& in)
  {
    MouseGestureTranslator::Output out;
    for (const auto& ie : in) {
      t.feed(ie, out);
    }
    return out;
  }

  // -----------------------------------------------------------------------------------------------
  EventSequence taps(Key k, int n)
  {
    EventSequence out;
    for (int i = 0; i < n; ++i) { appendTap(out, k); }
    return out;
  }
} // end anonymous namespace

// -------------------------------------------------------------------------------------------------
TEST_CASE("every wheel notch is one complete tap", "[gestures]")
{
  MouseGestureTranslator t{GestureConfig()};

  const int n = GENERATE(1, 2, 7);
  const EventSequence up(n, relative(RelAxis::Wheel, 1));
  CHECK(feed(t, up).events == taps(toKey(KEY_UP), n));

  const EventSequence down(n, relative(RelAxis::Wheel, -1));
  CHECK(feed(t, down).events == taps(toKey(KEY_DOWN), n));
}

// -------------------------------------------------------------------------------------------------
TEST_CASE("other relative events are not translated", "[gestures]")
{
  MouseGestureTranslator t{GestureConfig()};
  const auto out = feed(t, {relative(RelAxis::Wheel, 2), relative(RelAxis::Wheel, -3),
                            relative(RelAxis::X, 1), relative(RelAxis::HWheel, 1), syncReport()});
  CHECK(out.events.empty());
  CHECK(out.commands.isEmpty());
}

// -------------------------------------------------------------------------------------------------
TEST_CASE("configured scroll keys", "[gestures]")
{
  GestureConfig cfg;
  cfg.scrollUp = toKey(KEY_PAGEUP);
  cfg.scrollDown = toKey(KEY_PAGEDOWN);
  MouseGestureTranslator t{cfg};

  auto expected = taps(toKey(KEY_PAGEUP), 1);
  appendTap(expected, toKey(KEY_PAGEDOWN));
  CHECK(feed(t, {relative(RelAxis::Wheel, 1), relative(RelAxis::Wheel, -1)}).events == expected);
}

// -------------------------------------------------------------------------------------------------
TEST_CASE("middle button chord", "[gestures]")
{
  MouseGestureTranslator t{GestureConfig()};

  SECTION("wheel is suppressed while middle is held")
  {
    const auto out = feed(t, {press(Middle), relative(RelAxis::Wheel, 1), relative(RelAxis::Wheel, -1)});
    CHECK(t.middleHeld());
    CHECK(out.events.empty());

    CHECK(feed(t, {release(Middle), relative(RelAxis::Wheel, 1)}).events == taps(toKey(KEY_UP), 1));
    CHECK_FALSE(t.middleHeld());
  }

  SECTION("left and right tap home and end")
  {
    auto expected = taps(toKey(KEY_HOME), 1);
    appendTap(expected, toKey(KEY_END));
    const auto out = feed(t, {press(Middle), press(Left), release(Left), press(Right), release(Right)});
    CHECK(out.events == expected);
  }

  SECTION("releasing middle disarms the chord")
  {
    CHECK(feed(t, {press(Middle), release(Middle), press(Left), release(Left)}).events.empty());
  }
}

// -------------------------------------------------------------------------------------------------
TEST_CASE("chord mode off still suppresses the wheel", "[gestures]")
{
  GestureConfig cfg;
  cfg.chord = false;
  MouseGestureTranslator t{cfg};

  const auto out = feed(t, {press(Middle), press(Left), relative(RelAxis::Wheel, 1),
                            release(Left), release(Middle)});
  CHECK(out.events.empty());
}

// -------------------------------------------------------------------------------------------------
TEST_CASE("held buttons mirror the physical button", "[gestures]")
{
  GestureConfig cfg;
  cfg.holdButtons = {{Side, toKey(KEY_F13)}, {Extra, toKey(KEY_F14)}};
  MouseGestureTranslator t{cfg};

  const auto out = feed(t, {press(Side), press(Extra), release(Side), release(Extra)});
  CHECK(out.events == EventSequence{press(toKey(KEY_F13)), press(toKey(KEY_F14)),
                                    release(toKey(KEY_F13)), release(toKey(KEY_F14))});
}

// -------------------------------------------------------------------------------------------------
TEST_CASE("held buttons are flushed by the mouse report", "[gestures]")
{
  GestureConfig cfg;
  cfg.holdButtons = {{Side, toKey(KEY_F13)}};

  SECTION("drop mode forwards the report after a held key")
  {
    MouseGestureTranslator t{cfg};
    CHECK(feed(t, {press(Side), syncReport()}).events
          == EventSequence{press(toKey(KEY_F13)), syncReport()});
    CHECK(feed(t, {relative(RelAxis::X, 3), syncReport()}).events.empty());
    CHECK(feed(t, {release(Side), syncReport()}).events
          == EventSequence{release(toKey(KEY_F13)), syncReport()});
  }

  SECTION("forward mode emits the report exactly once")
  {
    cfg.passthrough = PassthroughMode::Forward;
    MouseGestureTranslator t{cfg};
    CHECK(feed(t, {press(Side), syncReport()}).events
          == EventSequence{press(toKey(KEY_F13)), syncReport()});
  }
}

// -------------------------------------------------------------------------------------------------
TEST_CASE("button commands start on press only", "[gestures]")
{
  GestureConfig cfg;
  cfg.buttonCommands = {{Side, "notify-send side"}};
  MouseGestureTranslator t{cfg};

  const auto out = feed(t, {press(Side), release(Side), press(Side), release(Side), press(Extra)});
  CHECK(out.commands == QStringList({"notify-send side", "notify-send side"}));
  CHECK(out.events.empty());
}

// -------------------------------------------------------------------------------------------------
TEST_CASE("forward mode passes untranslated events", "[gestures]")
{
  GestureConfig cfg;
  cfg.passthrough = PassthroughMode::Forward;
  cfg.holdButtons = {{Side, toKey(KEY_F13)}};
  MouseGestureTranslator t{cfg};

  SECTION("motion, sync and other buttons")
  {
    const EventSequence in = {relative(RelAxis::X, 5), relative(RelAxis::Y, -2), syncReport(),
                              press(Left), syncReport(), release(Left), syncReport(),
                              relative(RelAxis::Wheel, 3)};
    CHECK(feed(t, in).events == in);
  }

  SECTION("translated wheel notches are consumed")
  {
    const EventSequence in = {relative(RelAxis::WheelHiRes, 120), relative(RelAxis::Wheel, 1), syncReport()};
    auto expected = taps(toKey(KEY_UP), 1);
    expected.push_back(syncReport());
    CHECK(feed(t, in).events == expected);
  }

  SECTION("the wheel is forwarded while middle is held")
  {
    const EventSequence in = {press(Middle), relative(RelAxis::WheelHiRes, 120),
                              relative(RelAxis::Wheel, 1), release(Middle)};
    CHECK(feed(t, in).events == in);
  }

  SECTION("consumed buttons are not forwarded")
  {
    const auto out = feed(t, {press(Side), release(Side)});
    CHECK(out.events == EventSequence{press(toKey(KEY_F13)), release(toKey(KEY_F13))});
  }

  SECTION("chord buttons are consumed including their release")
  {
    auto expected = EventSequence{press(Middle)};
    appendTap(expected, toKey(KEY_HOME));
    expected.push_back(release(Middle));
    CHECK(feed(t, {press(Middle), press(Left), release(Middle), release(Left)}).events == expected);
  }
}

// -------------------------------------------------------------------------------------------------
TEST_CASE("drop mode emits only translated events", "[gestures]")
{
  MouseGestureTranslator t{GestureConfig()};
  const auto out = feed(t, {relative(RelAxis::X, 5), press(Left), release(Left), syncReport()});
  CHECK(out.events.empty());
}
