// This file is part of sc2remap - See LICENSE.md and README.md
#include "remapstate.h"

#include "testutil.h"

namespace {
  const Key L = toKey(KEY_CAPSLOCK);
  const Key R = toKey(KEY_R);
  const Key K1 = toKey(KEY_1);
  const Key K2 = toKey(KEY_2);
  const Key K6 = toKey(KEY_6);
  const Key A = toKey(KEY_A);

  using namespace Events;

  // -----------------------------------------------------------------------------------------------
  struct Fixture
  {
    RemapStateMachine machine{KeyMap({{K1, K6}}), L};
    RemapState state{R};

    EventSequence feed(const EventSequence& in)
    {
      EventSequence out;
      for (const auto& ie : in) {
        machine.feed(state, ie, out);
      }
      return out;
    }
  };

  // -----------------------------------------------------------------------------------------------
  // A key must not be pressed twice in the output without a release in between.
  bool hasDuplicatePress(const EventSequence& out)
  {
    std::map<Key, bool> down;
    for (const auto& ie : out) {
      if (!ie.isKey()) continue;
      if (ie.isPress()) {
        if (down[ie.code.key()]) { return true; }
        down[ie.code.key()] = true;
      }
      else if (ie.isRelease()) {
        down[ie.code.key()] = false;
      }
    }
    return false;
  }
} // end anonymous namespace

// -------------------------------------------------------------------------------------------------
TEST_CASE_METHOD(Fixture, "keys that are not the layer key pass through unchanged", "[remap]")
{
  const EventSequence in = {
    press(A), syncReport(), key(A, 2), syncReport(), release(A), syncReport(),
    press(K1), release(K1),
    press(toKey(KEY_LEFTSHIFT)), release(toKey(KEY_LEFTSHIFT)),
    InputEvent(EventCode(MiscCode::Scan), 0x70004),
  };

  CHECK(feed(in) == in);
}

// -------------------------------------------------------------------------------------------------
TEST_CASE_METHOD(Fixture, "layer press and release emit the default target", "[remap]")
{
  CHECK(feed({press(L), release(L)}) == EventSequence{press(R), release(R)});
  CHECK(state.currentKey == Key::None);
  CHECK_FALSE(state.held);
}

// -------------------------------------------------------------------------------------------------
TEST_CASE_METHOD(Fixture, "layer key autorepeat repeats the target", "[remap]")
{
  CHECK(feed({press(L), key(L, 2), key(L, 2), release(L)})
        == EventSequence{press(R), key(R, 2), key(R, 2), release(R)});
}

// -------------------------------------------------------------------------------------------------
TEST_CASE_METHOD(Fixture, "direct presses update the next target, releases pass raw", "[remap]")
{
  const EventSequence in = {press(L), press(K1), release(K1), release(L)};

  CHECK(feed(in) == EventSequence{press(R), press(K1), release(K1), release(R)});
  CHECK(state.nextKey == K6);
  CHECK_FALSE(state.held);
  CHECK(state.currentKey == Key::None);

  // The next layer press uses the new target
  CHECK(feed({press(L), release(L)}) == EventSequence{press(K6), release(K6)});
}

// -------------------------------------------------------------------------------------------------
TEST_CASE_METHOD(Fixture, "layer release releases the key captured at layer press", "[remap]")
{
  const auto out = feed({press(L), press(K2), release(K2), press(K1), release(K1), release(L)});

  REQUIRE(out.size() == 6);
  CHECK(out.front() == press(R));
  CHECK(out.back() == release(R));
  CHECK(state.nextKey == K6);
}

// -------------------------------------------------------------------------------------------------
TEST_CASE_METHOD(Fixture, "layer press while the target is held releases it first", "[remap]")
{
  CHECK(feed({press(K1)}) == EventSequence{press(K1)});
  CHECK(state.held);
  CHECK(state.nextKey == K6);

  CHECK(feed({press(L)}) == EventSequence{release(K6), press(K6)});
  CHECK(state.currentKey == K6);

  CHECK(feed({release(L), release(K1)}) == EventSequence{release(K6), release(K1)});
  CHECK_FALSE(state.held);
}

// -------------------------------------------------------------------------------------------------
TEST_CASE_METHOD(Fixture, "layer autorepeat does not release a held target", "[remap]")
{
  feed({press(K1)});
  CHECK(feed({key(L, 2)}) == EventSequence{key(K6, 2)});
}

// -------------------------------------------------------------------------------------------------
TEST_CASE_METHOD(Fixture, "direct press of the substituted target releases the layer press", "[remap]")
{
  feed({press(K1), release(K1)});
  REQUIRE(state.nextKey == K6);

  CHECK(feed({press(L)}) == EventSequence{press(K6)});
  CHECK(feed({press(K1)}) == EventSequence{release(K6), press(K1)});
  CHECK(state.held);
  CHECK(state.currentKey == K6);
}

// -------------------------------------------------------------------------------------------------
TEST_CASE_METHOD(Fixture, "modifiers do not change the layer state", "[remap]")
{
  const Key shift = toKey(KEY_LEFTSHIFT);
  const auto out = feed({press(shift), press(L), release(L), release(shift)});

  CHECK(out == EventSequence{press(shift), press(R), release(R), release(shift)});
  CHECK(state.nextKey == R);
  CHECK_FALSE(state.held);
}

// -------------------------------------------------------------------------------------------------
TEST_CASE_METHOD(Fixture, "layer release without a layer press is forwarded", "[remap]")
{
  CHECK(feed({release(L)}) == EventSequence{release(L)});
}

// -------------------------------------------------------------------------------------------------
TEST_CASE_METHOD(Fixture, "non key events have no state effect", "[remap]")
{
  const EventSequence in = {
    syncReport(), Events::relative(RelAxis::X, 3), InputEvent(EventCode::fromRaw(EV_LED, LED_CAPSL), 1)
  };
  CHECK(feed(in) == in);
  CHECK(state.nextKey == R);
  CHECK(state.currentKey == Key::None);
}

// -------------------------------------------------------------------------------------------------
TEST_CASE_METHOD(Fixture, "typing while using the layer key never presses a key twice", "[remap]")
{
  const Key W = toKey(KEY_W);
  const EventSequence in = {
    press(K1), press(L), release(K1), key(L, 2), release(L),
    press(W), release(W), press(L), press(W), release(W), release(L),
    press(L), press(K2), release(L), release(K2),
    press(A), release(A), press(L), press(A), release(A), release(L),
  };
  CHECK_FALSE(hasDuplicatePress(feed(in)));
}
