// This file is part of sc2remap - See LICENSE.md and README.md
#include "keynames.h"

#include "testutil.h"

// -------------------------------------------------------------------------------------------------
TEST_CASE("key names resolve to key codes", "[keynames]")
{
  CHECK(KeyName::fromString("a") == toKey(KEY_A));
  CHECK(KeyName::fromString(" A ") == toKey(KEY_A));
  CHECK(KeyName::fromString("1") == toKey(KEY_1));
  CHECK(KeyName::fromString("f5") == toKey(KEY_F5));
  CHECK(KeyName::fromString("capslock") == toKey(KEY_CAPSLOCK));
  CHECK(KeyName::fromString("leftshift") == toKey(KEY_LEFTSHIFT));
  CHECK(KeyName::fromString("up") == toKey(KEY_UP));
  CHECK(KeyName::fromString("home") == toKey(KEY_HOME));
  CHECK(KeyName::fromString("btn_side") == toKey(BTN_SIDE));
  CHECK(KeyName::fromString("side") == toKey(BTN_SIDE));
  CHECK(KeyName::fromString("extra") == toKey(BTN_EXTRA));
}

// -------------------------------------------------------------------------------------------------
TEST_CASE("numeric key codes are accepted", "[keynames]")
{
  CHECK(KeyName::fromString("30") == toKey(KEY_A));
  CHECK(KeyName::fromString("0x1e") == toKey(KEY_A));
  CHECK(KeyName::fromString("0xffff") == Key::None);
}

// -------------------------------------------------------------------------------------------------
TEST_CASE("unknown key names", "[keynames]")
{
  CHECK(KeyName::fromString("") == Key::None);
  CHECK(KeyName::fromString("nokey") == Key::None);
  CHECK(KeyName::fromString("btn_nothing") == Key::None);
}

// -------------------------------------------------------------------------------------------------
TEST_CASE("key names for key codes", "[keynames]")
{
  CHECK(KeyName::toString(toKey(KEY_A)) == "a");
  CHECK(KeyName::toString(toKey(KEY_CAPSLOCK)) == "capslock");
  CHECK(KeyName::toString(toKey(BTN_SIDE)) == "btn_side");
  CHECK(KeyName::fromString(KeyName::toString(toKey(KEY_F13))) == toKey(KEY_F13));
  CHECK(KeyName::toString(toKey(0x2fe)) == "0x2fe");
}
